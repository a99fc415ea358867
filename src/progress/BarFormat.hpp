#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "RateEstimator.hpp"
#include "RenderThrottle.hpp"

namespace LineGauge {

// display options of a determinate bar
struct BarOptions {
    std::string description = "Progress";
    size_t bar_length = 50;

    bool show_percentage = true;
    bool show_count      = true;
    bool show_rate       = true;
    bool show_eta        = true;

    std::string fill  = "█";
    std::string empty = "░";
    std::string unit  = "items"; // rate suffix: "<unit>/sec"

    std::chrono::milliseconds min_interval = RenderThrottle::DEFAULT_INTERVAL;

    // time source, steady_clock::now() when empty
    std::function<Clock::time_point()> clock;

    Clock::time_point now() const { return clock ? clock() : Clock::now(); }

    void use_ascii() { fill = "#"; empty = "-"; }
};

// floor(current / total * bar_length), full bar for total == 0
size_t filled_length(uint64_t current, uint64_t total, size_t bar_length);

// 0..100, 100 for total == 0
double percentage(uint64_t current, uint64_t total);

// "desc: [████░░░░]  37.00% 37/100 | Rate: 5.00 items/sec | ETA: 12s"
std::string format_bar_line(const BarOptions& options, uint64_t current, uint64_t total,
                            double rate, std::optional<double> eta_seconds);

} // namespace LineGauge
