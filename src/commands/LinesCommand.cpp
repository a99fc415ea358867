/**
 * @file LinesCommand.cpp
 * @brief Implementation of the "lines" command: wc -l with progress.
 *
 * Reads every file once in chunks, counting newlines, with the overall
 * position and the current file drawn by a MultiProgress. Files of unknown
 * size (pipes, character devices) get an indeterminate item line. The summary
 * is printed after the progress display is closed, as text or JSON lines.
 */

#include "LinesCommand.hpp"
#include "io/Reader.hpp"
#include "progress/MultiProgress.hpp"
#include "progress/ProgressArgs.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdio>
#include <iostream>

REGISTER_COMMAND(LinesCommand);

namespace {

struct FileResult {
    fs::path fname;
    uint64_t lines = 0;
    uint64_t bytes = 0;
    bool ok = true;
    std::string error;
};

void count_file(LineGauge::MultiProgress& tracker, FileResult& result, size_t chunk_size) {
    Reader reader(result.fname);
    std::vector<char> buf(chunk_size);
    char last = '\n';
    size_t nread;
    while( (nread = reader.read(buf.data(), buf.size())) > 0 ){
        result.lines += std::count(buf.begin(), buf.begin() + nread, '\n');
        last = buf[nread - 1];
        tracker.update_item_progress(reader.pos());
    }
    if( last != '\n' ){
        result.lines++;
    }
    result.bytes = reader.pos();
}

} // namespace

LinesCommand::LinesCommand(bool reg) : Command(reg, "lines", "count lines in files, showing progress") {
    m_parser.add_argument("files").help("files or glob patterns").nargs(argparse::nargs_pattern::at_least_one);
    m_parser.add_argument("-c", "--chunk-size").help("read buffer size").default_value(std::string("64Kb"));
    m_parser.add_argument("-j", "--json").help("print results as JSON lines").default_value(false).implicit_value(true);
    register_progress_args(m_parser);
}

int LinesCommand::run() {
    const auto files = expand_file_args(m_parser.get<std::vector<std::string>>("files"));
    const size_t chunk_size = human2bytes(m_parser.get<std::string>("--chunk-size"));
    if( chunk_size == 0 ){
        throw std::invalid_argument("--chunk-size must be positive");
    }

    LineGauge::MultiOptions options;
    options.overall = bar_options_from_args(m_parser);
    options.overall.show_rate = false;
    options.overall.unit = "files";
    options.item = options.overall;
    options.item.bar_length = std::max<size_t>(options.overall.bar_length * 3 / 5, 1);
    options.item.show_rate = !m_parser.get<bool>("--no-rate");
    options.item.unit = "bytes";
    if( m_parser.get<bool>("--ascii") ){
        options.frames = LineGauge::SpinnerOptions::ascii_frames();
    }

    std::vector<std::string> names;
    names.reserve(files.size());
    for( const auto& fname : files ){
        names.push_back(fname.string());
    }

    std::vector<FileResult> results;
    {
        LineGauge::MultiProgress tracker(names, "Counting lines", options);
        for( const auto& fname : files ){
            FileResult result;
            result.fname = fname;
            tracker.start_item(fname.string(), Reader::get_size(fname));
            try {
                count_file(tracker, result, chunk_size);
            } catch( const Reader::ReadError& e ){
                logger->error("{}", e.what());
                result.ok = false;
                result.error = e.what();
            }
            tracker.complete_item();
            logger->debug("{}: {} lines, {}", fname, result.lines, bytes2human(result.bytes, " bytes"));
            results.push_back(std::move(result));
        }
    }

    uint64_t total_lines = 0;
    bool all_ok = true;
    for( const auto& r : results ){
        total_lines += r.lines;
        all_ok &= r.ok;
        if( m_parser.get<bool>("--json") ){
            nlohmann::json j = {
                {"file", r.fname.string()},
                {"lines", r.lines},
                {"bytes", r.bytes},
                {"ok", r.ok},
            };
            if( !r.ok ){
                j["error"] = r.error;
            }
            std::cout << j.dump() << "\n";
        } else if( r.ok ){
            fmt::print("{:>10} {}\n", r.lines, r.fname.string());
        } else {
            fmt::print("{:>10} {} ({})\n", "-", r.fname.string(), r.error);
        }
    }
    if( !m_parser.get<bool>("--json") && results.size() > 1 ){
        fmt::print("{:>10} total\n", total_lines);
    }
    std::cout << std::flush;
    fflush(stdout);

    logger->debug("{} files, {} lines, {}", results.size(), total_lines, all_ok ? "no errors" : "with errors");
    return all_ok ? 0 : 1;
}
