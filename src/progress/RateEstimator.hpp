#pragma once
#include <chrono>
#include <cstdint>
#include <deque>
#include <optional>

namespace LineGauge {

using Clock = std::chrono::steady_clock;

// Throughput over a trailing window of (timestamp, cumulative count) samples.
// Plain average between the oldest and the newest retained sample, no smoothing.
class RateEstimator {
    public:
    static constexpr size_t DEFAULT_WINDOW = 64;

    explicit RateEstimator(size_t max_samples = DEFAULT_WINDOW);

    void record(uint64_t count, Clock::time_point now);

    // items per second, 0 if the samples span less than MIN_ELAPSED
    double rate(Clock::time_point now) const;

    // seconds left for `remaining` items, nullopt while the rate is 0
    std::optional<double> eta(uint64_t remaining, Clock::time_point now) const;

    void reset() { m_samples.clear(); }
    size_t samples() const { return m_samples.size(); }

    private:
    struct Sample {
        Clock::time_point timestamp;
        uint64_t count;
    };

    static constexpr std::chrono::milliseconds MIN_ELAPSED{1};

    std::deque<Sample> m_samples;
    size_t m_max_samples;
};

} // namespace LineGauge
