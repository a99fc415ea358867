/**
 * @file ProgressBar.cpp
 * @brief Implementation of the determinate progress bar.
 */

#include "ProgressBar.hpp"
#include "utils/common.hpp"

#include <algorithm>
#include <stdexcept>

namespace LineGauge {

static uint64_t checked_total(int64_t total) {
    if (total < 0) {
        throw std::invalid_argument(fmt::format("ProgressBar: negative total {}", total));
    }
    return static_cast<uint64_t>(total);
}

/**
 * @brief Creates a bar. A zero total makes a degenerate bar that is drawn
 * complete right away.
 *
 * @param total Number of items to process.
 * @param options Display options.
 * @param sink Output to draw on.
 * @throws std::invalid_argument If total is negative or bar_length is 0.
 */
ProgressBar::ProgressBar(int64_t total, BarOptions options, OutputSink& sink)
    : m_total(checked_total(total)),
      m_options(std::move(options)),
      m_sink(sink),
      m_throttle(m_options.min_interval)
{
    if (m_options.bar_length == 0) {
        throw std::invalid_argument("ProgressBar: bar_length must be positive");
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    const auto now = m_options.now();
    m_rate.record(0, now);
    if (m_total == 0) {
        render_locked(now, false);
    }
}

ProgressBar::~ProgressBar() {
    close();
}

void ProgressBar::update(int64_t n) {
    if (n < 0) {
        throw std::invalid_argument(fmt::format("ProgressBar: negative increment {}", n));
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_closed) {
        return;
    }

    const uint64_t prev = m_current;
    const uint64_t step = static_cast<uint64_t>(n);
    m_current = (step >= m_total - m_current) ? m_total : m_current + step;
    maybe_render_locked(prev, false);
}

void ProgressBar::set_progress(int64_t value) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_closed) {
        return;
    }

    const uint64_t prev = m_current;
    if (value <= 0) {
        m_current = 0;
    } else {
        m_current = std::min(static_cast<uint64_t>(value), m_total);
    }
    maybe_render_locked(prev, false);
}

/**
 * @brief Draws the final state and moves to a new line.
 *
 * Safe to call any number of times, only the first call writes.
 */
void ProgressBar::close() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_closed) {
        return;
    }

    render_locked(m_options.now(), true);
    m_closed = true;
    m_last_render.reset();
}

uint64_t ProgressBar::current() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_current;
}

bool ProgressBar::closed() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_closed;
}

size_t ProgressBar::render_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_render_count;
}

std::string ProgressBar::line() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return line_locked(m_options.now());
}

// reaching the total is always drawn, otherwise the last frame could be stale
void ProgressBar::maybe_render_locked(uint64_t prev, bool force) {
    const bool reached_total = prev < m_total && m_current == m_total;
    const auto now = m_options.now();
    if (m_throttle.should_render(now, m_last_render, force || reached_total)) {
        render_locked(now, false);
    }
}

void ProgressBar::render_locked(Clock::time_point now, bool final) {
    if (m_sink.spinner_active()) {
        logger->warn_once("a spinner is running on the same output, progress bar is not drawn");
        return;
    }

    m_rate.record(m_current, now);
    m_sink.render_line(line_locked(now), final);
    m_last_render = now;
    m_render_count++;
}

std::string ProgressBar::line_locked(Clock::time_point now) const {
    const uint64_t remaining = m_total - m_current;
    return format_bar_line(m_options, m_current, m_total, m_rate.rate(now), m_rate.eta(remaining, now));
}

} // namespace LineGauge
