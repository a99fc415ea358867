/**
 * @file MultiProgress.cpp
 * @brief Implementation of the multi-item progress tracker.
 */

#include "MultiProgress.hpp"
#include "utils/common.hpp"

#include <algorithm>

namespace LineGauge {

MultiProgress::MultiProgress(std::vector<std::string> items, const std::string& description,
                             MultiOptions options, OutputSink& sink)
    : m_items(std::move(items)),
      m_options(std::move(options)),
      m_sink(sink),
      m_throttle(m_options.overall.min_interval)
{
    if (m_options.overall.bar_length == 0 || m_options.item.bar_length == 0) {
        throw std::invalid_argument("MultiProgress: bar_length must be positive");
    }
    if (m_options.frames.empty()) {
        m_options.frames = SpinnerOptions::ascii_frames();
    }
    m_options.overall.description = description;
    m_overall_rate.record(0, m_options.overall.now());
}

MultiProgress::~MultiProgress() {
    close();
}

/**
 * @brief Makes an item the active one.
 *
 * @param id Item name shown on the second line.
 * @param total_units Size of the item, nullopt if unknown (indeterminate display).
 */
void MultiProgress::start_item(const std::string& id, std::optional<uint64_t> total_units) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_closed) {
        return;
    }

    m_item = ActiveItem{id, 0, total_units, false};
    m_item_rate.reset();
    m_item_rate.record(0, m_options.item.now());
    logger->debug("start_item {} ({}/{}), size {}", id, m_current_index + 1, m_items.size(),
                  total_units ? std::to_string(*total_units) : std::string("unknown"));
    render_locked(true, false);
}

/**
 * @brief Sets the progress of the active item.
 *
 * A total supplied for an item that was started without one is adopted.
 * A total different from an already known one is ignored: the bar keeps its
 * initial scale.
 *
 * @param current_units Units done so far, clamped to the item total.
 * @param total_units Optional item total.
 */
void MultiProgress::update_item_progress(uint64_t current_units, std::optional<uint64_t> total_units) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_closed) {
        return;
    }
    if (!m_item || m_item->complete) {
        logger->debug("update_item_progress without an active item");
        return;
    }

    if (total_units) {
        if (!m_item->total) {
            m_item->total = total_units;
        } else if (*m_item->total != *total_units) {
            logger->debug("item {}: total changed from {} to {}, keeping the first one", m_item->id, *m_item->total, *total_units);
        }
    }

    const uint64_t prev = m_item->current;
    m_item->current = m_item->total ? std::min(current_units, *m_item->total) : current_units;
    const bool reached_total = m_item->total && prev < *m_item->total && m_item->current == *m_item->total;

    render_locked(reached_total, false);
}

/**
 * @brief Marks the active item as done and moves to the next one.
 */
void MultiProgress::complete_item() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_closed) {
        return;
    }

    if (m_item) {
        if (!m_item->total) {
            m_item->total = m_item->current; // size is known now
        }
        m_item->current = *m_item->total;
        m_item->complete = true;
    }
    if (m_current_index < m_items.size()) {
        m_current_index++;
    } else {
        logger->debug("complete_item: all {} items are already complete", m_items.size());
    }
    m_overall_rate.record(m_current_index, m_options.overall.now());
    render_locked(true, false);
}

/**
 * @brief Draws both lines one last time and leaves the cursor below them.
 *
 * Idempotent.
 */
void MultiProgress::close() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_closed) {
        return;
    }
    render_locked(true, true);
    m_closed = true;
}

size_t MultiProgress::current_index() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_current_index;
}

bool MultiProgress::closed() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_closed;
}

bool MultiProgress::item_active() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_item && !m_item->complete;
}

uint64_t MultiProgress::item_current() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_item ? m_item->current : 0;
}

std::optional<uint64_t> MultiProgress::item_total() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_item ? m_item->total : std::nullopt;
}

size_t MultiProgress::render_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_render_count;
}

std::string MultiProgress::aggregate_line() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return aggregate_line_locked(m_options.overall.now());
}

std::string MultiProgress::item_line() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return item_line_locked(m_options.item.now());
}

void MultiProgress::render_locked(bool force, bool final) {
    const auto now = m_options.overall.now();
    if (!m_throttle.should_render(now, m_last_render, force || final)) {
        return;
    }
    if (m_sink.spinner_active()) {
        logger->warn_once("a spinner is running on the same output, progress is not drawn");
        return;
    }

    if (m_item) {
        m_item_rate.record(m_item->current, m_options.item.now());
    }

    std::vector<std::string> lines { aggregate_line_locked(now) };
    // a completed item was already drawn at 100% by complete_item()
    if (m_item && !(final && m_item->complete)) {
        lines.push_back(item_line_locked(m_options.item.now()));
    }
    m_sink.render_block(lines, final);

    m_frame_index = (m_frame_index + 1) % m_options.frames.size();
    m_last_render = final ? std::nullopt : std::optional<Clock::time_point>(now);
    m_render_count++;
}

std::string MultiProgress::aggregate_line_locked(Clock::time_point now) const {
    const uint64_t total = m_items.size();
    const uint64_t done = m_current_index;
    std::string line = format_bar_line(m_options.overall, done, total,
                                       m_overall_rate.rate(now), m_overall_rate.eta(total - done, now));
    line += fmt::format(" | {} of {} {} complete", done, total, m_options.noun);
    return line;
}

std::string MultiProgress::item_line_locked(Clock::time_point now) const {
    if (!m_item) {
        return "";
    }

    BarOptions options = m_options.item;
    options.description = "  ↳ " + m_item->id;

    if (!m_item->total) {
        return fmt::format("{} {} {} {}", options.description, m_options.frames[m_frame_index % m_options.frames.size()],
                           m_item->current, options.unit);
    }

    const uint64_t remaining = *m_item->total - m_item->current;
    return format_bar_line(options, m_item->current, *m_item->total,
                           m_item_rate.rate(now), m_item_rate.eta(remaining, now));
}

} // namespace LineGauge
