/**
 * @file common.cpp
 * @brief Implementation of common utilities and global variables.
 *
 * Global logger and argument parser, log initialization, command-line options
 * shared by every command, crash handling with stack traces, glob expansion of
 * file arguments and the line counter used to size progress bars.
 */

#include "common.hpp"
#include "io/Reader.hpp"
#include "dist/version.h"

#include <algorithm>

int verbosity = 0;

std::shared_ptr<Logger> logger = Logger::create_console("linegauge");
argparse::ArgumentParser program("linegauge", APP_VERSION, argparse::default_arguments::help);

// begin stack trace generation on error
#include <backtrace.h>

void backtrace_error_cb(void *, const char *msg, int errnum) {
    logger->critical("Error: {} (Error number: {})", msg, errnum);
}

int backtrace_full_cb(void *, uintptr_t pc, const char *filename, int lineno, const char *function) {
    logger->critical("     {} {}:{} ({})", (void *)pc, filename ? filename : "?", lineno, function ? function : "?");
    return 0;  // Continue processing the backtrace
}

void signal_handler(int sig) {
    logger->critical("Signal {} received, printing backtrace...", sig);

    backtrace_state *state = backtrace_create_state(NULL, 0, backtrace_error_cb, NULL);
    backtrace_full(state, 0, backtrace_full_cb, backtrace_error_cb, NULL);

    exit(1);
}
// end stack trace generation on error

/**
 * @brief Counts lines in a text file.
 *
 * Used to obtain a bar total before the real pass over the file. A failure to
 * read is not an error for the caller: the result only feeds a display, so it
 * degrades to 0 and the bar renders as already complete.
 *
 * @param fname Path to the file.
 * @return Number of '\n' terminated lines, plus one for a trailing partial line.
 */
uint64_t count_lines_in_file(const fs::path& fname){
    try {
        Reader reader(fname);
        std::vector<char> buf(0x10000);
        uint64_t nlines = 0;
        char last = '\n';
        size_t nread;
        while( (nread = reader.read(buf.data(), buf.size())) > 0 ){
            nlines += std::count(buf.begin(), buf.begin() + nread, '\n');
            last = buf[nread - 1];
        }
        if( last != '\n' ){
            nlines++;
        }
        return nlines;
    } catch( const Reader::ReadError& e ){
        logger->debug("count_lines_in_file: {}", e.what());
        return 0;
    }
}

void init_log(std::string log_fname){
    static bool inited = false;
    if( inited ){
        return;
    }

    inited = true;
    if( !log_fname.empty() ){
        // explicit log pathname, can't continue without log
        if( !logger->add_file(log_fname) ){
            logger->critical("explicit log pathname is set, refusing to continue without log");
            exit(1);
        }
    }
    logger->start();
}

void register_common_args(argparse::ArgumentParser &parser) {
    parser.add_argument("-v", "--verbose")
        .help("increase verbosity")
        .action([&](const auto &) { ++verbosity; })
        .append()
        .implicit_value(true)
        .nargs(0);

    parser.add_argument("-q", "--quiet")
        .help("decrease verbosity")
        .action([&](const auto &) { --verbosity; })
        .append()
        .implicit_value(true)
        .nargs(0);

    parser.add_argument("-L", "--log")
        .help("log pathname");
    parser.add_argument("--log-dedup-limit")
        .default_value(100)
        .scan<'i', int>()
        .help("limit duplicate log messages, 0 = no limit");
}

void register_program_args(argparse::ArgumentParser &parser) {
    register_common_args(parser);

    parser.add_argument("--version")
        .action([&](const auto & /*unused*/) {
            fmt::print("{}\n", APP_VERSION);
            exit(0);
        })
        .default_value(false)
        .help("print version information and exit")
        .implicit_value(true)
        .nargs(0);
}

bool is_glob(const std::filesystem::path& path) {
    const std::string s = path.native();
    return s.find('*') != std::string::npos || s.find('?') != std::string::npos;
}

bool is_glob(const std::string& s) {
    return s.find('*') != std::string::npos || s.find('?') != std::string::npos;
}

static void glob_recursive(
    const fs::path& real_path,         // actual path on disk
    const fs::path& logical_path,      // how we want to emit it
    const std::vector<fs::path>& pattern_parts,
    size_t index,
    std::vector<fs::path>& out_matches
) {
    if (index == pattern_parts.size())
        return;

    bool last = (index == pattern_parts.size() - 1);
    const auto& segment = pattern_parts[index];

    if (segment == ".") {
        glob_recursive(real_path, logical_path / ".", pattern_parts, index + 1, out_matches);
        return;
    }

    if (segment == "..") {
        if (logical_path.has_parent_path()) {
            glob_recursive(real_path.parent_path(), logical_path.parent_path(), pattern_parts, index + 1, out_matches);
        } else if (real_path.has_parent_path()) {
            glob_recursive(real_path.parent_path(), logical_path / "..", pattern_parts, index + 1, out_matches);
        }
        return;
    }

    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(real_path, ec)) {
        auto filename = entry.path().filename();
        if (!simple_glob_match(segment.native(), filename.native()))
            continue;

        fs::path next_real = entry.path();
        fs::path next_logical = logical_path / filename;

        if (last) {
            if (entry.is_regular_file() || entry.is_symlink()) {
                out_matches.push_back(next_logical);
            }
        } else {
            if (entry.is_directory()) {
                glob_recursive(next_real, next_logical, pattern_parts, index + 1, out_matches);
            }
        }
    }
}

std::vector<fs::path> simple_glob_find(const fs::path& pattern) {
    std::vector<std::filesystem::path> parts {pattern.begin(), pattern.end()};
    std::vector<fs::path> results;

    // fixed part with no globs
    fs::path base_real = pattern.is_absolute() ? fs::path() : fs::current_path();
    fs::path base_logical;
    size_t start_index = 0;

    for (; start_index < parts.size(); ++start_index) {
        const auto& part = parts[start_index];
        if (is_glob(part))
            break;
        base_real /= part;
        base_logical /= part;
    }

    if (!fs::exists(base_real))
        return results;

    if (fs::is_regular_file(base_real) || fs::is_symlink(base_real)) {
        results.push_back(base_logical);
        return results;
    }

    glob_recursive(base_real, base_logical, parts, start_index, results);
    std::sort(results.begin(), results.end());
    return results;
}

std::vector<fs::path> expand_file_args(const std::vector<std::string>& args) {
    std::vector<fs::path> result;
    for (const auto& arg : args) {
        if (is_glob(arg)) {
            auto matches = simple_glob_find(arg);
            if (matches.empty()) {
                logger->warn("no files match \"{}\"", arg);
            }
            result.insert(result.end(), matches.begin(), matches.end());
        } else {
            result.emplace_back(arg);
        }
    }
    return result;
}
