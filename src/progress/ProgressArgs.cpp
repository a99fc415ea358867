/**
 * @file ProgressArgs.cpp
 * @brief Command-line options controlling how progress is drawn.
 */

#include "ProgressArgs.hpp"
#include "utils/common.hpp"

void register_progress_args(argparse::ArgumentParser& parser) {
    parser.add_argument("--bar-length")
        .help("bar width in characters")
        .default_value(50)
        .scan<'i', int>();
    parser.add_argument("--interval-ms")
        .help("minimum time between redraws")
        .default_value(100)
        .scan<'i', int>();
    parser.add_argument("--fill")
        .help("character for the completed part of the bar")
        .default_value(std::string("█"));
    parser.add_argument("--empty")
        .help("character for the remaining part of the bar")
        .default_value(std::string("░"));
    parser.add_argument("--ascii")
        .help("ASCII bar and spinner characters")
        .default_value(false).implicit_value(true);
    parser.add_argument("--no-percentage").help("hide percentage").default_value(false).implicit_value(true);
    parser.add_argument("--no-count").help("hide current/total").default_value(false).implicit_value(true);
    parser.add_argument("--no-rate").help("hide processing rate").default_value(false).implicit_value(true);
    parser.add_argument("--no-eta").help("hide estimated time left").default_value(false).implicit_value(true);
    parser.add_argument("--no-progress").help("don't draw progress at all").default_value(false).implicit_value(true);
}

static int positive_arg(const argparse::ArgumentParser& parser, const std::string& name) {
    int value = parser.get<int>(name);
    if (value <= 0) {
        throw std::runtime_error(fmt::format("{} must be positive, got {}", name, value));
    }
    return value;
}

LineGauge::BarOptions bar_options_from_args(const argparse::ArgumentParser& parser) {
    LineGauge::BarOptions options;
    options.bar_length      = static_cast<size_t>(positive_arg(parser, "--bar-length"));
    options.min_interval    = std::chrono::milliseconds(positive_arg(parser, "--interval-ms"));
    options.show_percentage = !parser.get<bool>("--no-percentage");
    options.show_count      = !parser.get<bool>("--no-count");
    options.show_rate       = !parser.get<bool>("--no-rate");
    options.show_eta        = !parser.get<bool>("--no-eta");

    if (parser.get<bool>("--ascii")) {
        options.use_ascii();
    } else {
        options.fill = parser.get<std::string>("--fill");
        options.empty = parser.get<std::string>("--empty");
    }

    if (parser.get<bool>("--no-progress")) {
        OutputSink::console().set_enabled(false);
    }

    logger->debug("bar options: length={} interval={}ms percentage={} count={} rate={} eta={}, stdout is {}",
                  options.bar_length, options.min_interval.count(), options.show_percentage,
                  options.show_count, options.show_rate, options.show_eta,
                  OutputSink::console().is_terminal() ? "a terminal" : "not a terminal");
    return options;
}

LineGauge::SpinnerOptions spinner_options_from_args(const argparse::ArgumentParser& parser) {
    LineGauge::SpinnerOptions options;
    options.interval = std::chrono::milliseconds(positive_arg(parser, "--interval-ms"));
    if (parser.get<bool>("--ascii")) {
        options.frames = LineGauge::SpinnerOptions::ascii_frames();
    }
    return options;
}
