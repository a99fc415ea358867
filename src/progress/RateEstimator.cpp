/**
 * @file RateEstimator.cpp
 * @brief Rate and remaining-time estimation for progress lines.
 */

#include "RateEstimator.hpp"

#include <algorithm>

namespace LineGauge {

RateEstimator::RateEstimator(size_t max_samples) : m_max_samples(std::max<size_t>(max_samples, 2)) {
}

/**
 * @brief Appends a sample, dropping the oldest one when the window is full.
 *
 * @param count Cumulative number of processed items.
 * @param now Time the count was observed.
 */
void RateEstimator::record(uint64_t count, Clock::time_point now) {
    if (m_samples.size() >= m_max_samples) {
        m_samples.pop_front();
    }
    m_samples.push_back({now, count});
}

/**
 * @brief Average throughput from the oldest retained sample to the newest.
 *
 * Time after the newest sample does not count, so the rate holds steady
 * between samples.
 *
 * @return Items per second, 0 without samples or when the window spans too little time.
 */
double RateEstimator::rate(Clock::time_point /*now*/) const {
    if (m_samples.empty()) {
        return 0.0;
    }

    const Sample& first = m_samples.front();
    const Sample& last = m_samples.back();
    const auto elapsed = last.timestamp - first.timestamp;
    if (elapsed < MIN_ELAPSED || last.count <= first.count) {
        return 0.0;
    }

    const double seconds = std::chrono::duration<double>(elapsed).count();
    return static_cast<double>(last.count - first.count) / seconds;
}

/**
 * @brief Estimated time to process the remaining items at the current rate.
 *
 * @param remaining Items left to process.
 * @param now Current time.
 * @return Seconds left, 0 if nothing remains, nullopt if the rate is unknown.
 */
std::optional<double> RateEstimator::eta(uint64_t remaining, Clock::time_point now) const {
    if (remaining == 0) {
        return 0.0;
    }
    const double r = rate(now);
    if (r <= 0.0) {
        return std::nullopt;
    }
    return static_cast<double>(remaining) / r;
}

} // namespace LineGauge
