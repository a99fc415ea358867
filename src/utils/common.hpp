#pragma once
#include "io/Logger.hpp"
#include "units.hpp"

#include <string>
#include <filesystem>
#include <fstream>
#include <vector>
#include <signal.h>

namespace fs = std::filesystem;

#include <argparse/argparse.hpp>

#define APP_NAME "LineGauge"

#define ANSI_CLEAR_EOL     "\x1b[0K"
#define ANSI_CURSOR_UP_FMT "\x1b[{}A"

extern std::shared_ptr<Logger> logger;
void init_log(std::string log_fname = "");
void register_program_args(argparse::ArgumentParser &parser);
void register_common_args(argparse::ArgumentParser &parser);
void signal_handler(int sig);

// number of lines in a text file, a final line without '\n' counts too
// returns 0 if the file can't be read
uint64_t count_lines_in_file(const fs::path& fname);

bool is_glob(const std::filesystem::path&);
bool is_glob(const std::string&);
std::vector<fs::path> simple_glob_find(const fs::path& pattern);

// expands globs, keeps plain names as is (even if they don't exist)
std::vector<fs::path> expand_file_args(const std::vector<std::string>& args);

// because there's no fnmatch() in mingw
template<typename StringT>
bool simple_glob_match(const StringT& pattern, const StringT& str) {
    using CharT = typename StringT::value_type;
    size_t p = 0, s = 0, star = StringT::npos, match = 0;

    while (s < str.size()) {
        if (p < pattern.size() && (pattern[p] == CharT('?') || pattern[p] == str[s])) {
            ++p; ++s;
        } else if (p < pattern.size() && pattern[p] == CharT('*')) {
            star = p++;
            match = s;
        } else if (star != StringT::npos) {
            p = star + 1;
            s = ++match;
        } else {
            return false;
        }
    }

    while (p < pattern.size() && pattern[p] == CharT('*')) ++p;
    return p == pattern.size();
}
