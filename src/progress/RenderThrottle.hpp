#pragma once
#include <chrono>
#include <optional>

#include "RateEstimator.hpp" // Clock

namespace LineGauge {

// Minimum-interval gate for redraws. Callers keep their own last render time.
class RenderThrottle {
    public:
    static constexpr std::chrono::milliseconds DEFAULT_INTERVAL{100};

    explicit RenderThrottle(Clock::duration min_interval = DEFAULT_INTERVAL)
        : m_min_interval(min_interval) {}

    // force: first and final renders are always drawn
    bool should_render(Clock::time_point now, std::optional<Clock::time_point> last_render_time, bool force = false) const {
        if (force || !last_render_time) {
            return true;
        }
        return now - *last_render_time >= m_min_interval;
    }

    Clock::duration interval() const { return m_min_interval; }

    private:
    Clock::duration m_min_interval;
};

} // namespace LineGauge
