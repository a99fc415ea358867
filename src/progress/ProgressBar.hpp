#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

#include "BarFormat.hpp"
#include "RateEstimator.hpp"
#include "RenderThrottle.hpp"
#include "io/OutputSink.hpp"

namespace LineGauge {

// Determinate progress bar against a known total.
//
// Updates are synchronous and cheap: a render happens only when the throttle
// lets it through (or when it is forced: first render, reaching the total,
// close). The destructor closes the bar, so a scoped ProgressBar always leaves
// a finished line and a newline behind, even when the loop body throws.
//
// After close() every mutating call is a no-op.
class ProgressBar {
    public:
    // throws std::invalid_argument on negative total or zero bar length
    explicit ProgressBar(int64_t total, BarOptions options = {}, OutputSink& sink = OutputSink::console());
    ~ProgressBar();

    ProgressBar(const ProgressBar&) = delete;
    ProgressBar& operator=(const ProgressBar&) = delete;

    // current += n, clamped to total; throws std::invalid_argument on negative n
    void update(int64_t n = 1);

    // current = value, clamped into [0, total]
    void set_progress(int64_t value);

    // final render + newline, idempotent
    void close();

    uint64_t current() const;
    uint64_t total() const { return m_total; }
    bool closed() const;
    size_t render_count() const;
    const BarOptions& options() const { return m_options; }

    // line for the current state, without writing it
    std::string line() const;

    private:
    void maybe_render_locked(uint64_t prev, bool force);
    void render_locked(Clock::time_point now, bool final);
    std::string line_locked(Clock::time_point now) const;

    const uint64_t m_total;
    const BarOptions m_options;
    OutputSink& m_sink;
    const RenderThrottle m_throttle;

    mutable std::mutex m_mutex;
    uint64_t m_current = 0;
    bool m_closed = false;
    std::optional<Clock::time_point> m_last_render;
    size_t m_render_count = 0;
    RateEstimator m_rate;
};

} // namespace LineGauge
