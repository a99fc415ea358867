/**
 * @file BarFormat.cpp
 * @brief Pure formatting of a determinate progress line.
 *
 * Shared by ProgressBar and by both lines of MultiProgress. Nothing here
 * touches a stream or a clock.
 */

#include "BarFormat.hpp"
#include "utils/units.hpp"

#include <spdlog/fmt/fmt.h>

namespace LineGauge {

size_t filled_length(uint64_t current, uint64_t total, size_t bar_length) {
    if (total == 0 || current >= total) {
        return bar_length;
    }
    // integer math, so 37/100 of 50 is exactly 18 and never 18.999...
    const unsigned __int128 scaled = static_cast<unsigned __int128>(current) * bar_length;
    return static_cast<size_t>(scaled / total);
}

double percentage(uint64_t current, uint64_t total) {
    if (total == 0 || current >= total) {
        return 100.0;
    }
    return 100.0 * static_cast<double>(current) / static_cast<double>(total);
}

static std::string repeat(const std::string& s, size_t n) {
    std::string result;
    result.reserve(s.size() * n);
    for (size_t i = 0; i < n; i++) {
        result += s;
    }
    return result;
}

std::string format_bar_line(const BarOptions& options, uint64_t current, uint64_t total,
                            double rate, std::optional<double> eta_seconds) {
    const size_t filled = filled_length(current, total, options.bar_length);

    std::string line = fmt::format("{}: [{}{}]",
        options.description,
        repeat(options.fill, filled),
        repeat(options.empty, options.bar_length - filled));

    if (options.show_percentage) {
        line += fmt::format(" {:6.2f}%", percentage(current, total));
    }
    if (options.show_count) {
        line += fmt::format(" {}/{}", current, total);
    }
    if (options.show_rate) {
        line += fmt::format(" | Rate: {:.2f} {}/sec", rate, options.unit);
    }
    if (options.show_eta && current < total) {
        line += fmt::format(" | ETA: {}", eta2human(eta_seconds));
    }
    return line;
}

} // namespace LineGauge
