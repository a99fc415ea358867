/**
 * @file Spinner.cpp
 * @brief Implementation of the threaded spinner.
 *
 * The animation loop renders while holding m_mutex and re-checks the stop flag
 * under the same lock before every frame. stop() sets the flag under that lock,
 * so once it has the lock no further frame can start; joining the thread then
 * waits out the loop itself.
 */

#include "Spinner.hpp"
#include "utils/common.hpp"

#include <stdexcept>
#include <system_error>

namespace LineGauge {

static SpinnerOptions with_description(const std::string& description) {
    SpinnerOptions options;
    options.description = description;
    return options;
}

Spinner::Spinner(SpinnerOptions options, OutputSink& sink)
    : m_options(std::move(options)),
      m_sink(sink),
      m_throttle(m_options.interval)
{
    if (m_options.frames.empty()) {
        throw std::invalid_argument("Spinner: no animation frames");
    }
    if (m_options.interval.count() <= 0) {
        throw std::invalid_argument("Spinner: interval must be positive");
    }
}

Spinner::Spinner(const std::string& description, OutputSink& sink)
    : Spinner(with_description(description), sink)
{
}

Spinner::~Spinner() {
    stop();
}

/**
 * @brief Starts the animation thread. No-op if already running.
 *
 * If the thread can't be created the spinner stays idle and the failure is
 * logged; the caller's work goes on without a display.
 *
 * @throws std::logic_error If another spinner is running on the same sink.
 */
void Spinner::start() {
    std::lock_guard<std::mutex> control(m_control_mutex);
    if (m_running) {
        return;
    }

    if (!m_sink.try_claim_spinner()) {
        throw std::logic_error("Spinner: another spinner is already running on this output");
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stop_requested = false;
        m_last_render.reset();
    }

    try {
        m_thread = std::thread(&Spinner::spin, this);
    } catch (const std::system_error& e) {
        m_sink.release_spinner();
        logger->warn("Spinner: failed to start animation thread: {}", e.what());
        return;
    }
    m_running = true;
}

/**
 * @brief Stops the animation and clears its line. No-op if idle.
 *
 * Returns only after the animation thread has exited.
 */
void Spinner::stop() {
    std::lock_guard<std::mutex> control(m_control_mutex);
    if (!m_running) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stop_requested = true;
    }
    m_cv.notify_all();
    if (m_thread.joinable()) {
        m_thread.join();
    }
    m_running = false;

    m_sink.clear_line();
    m_sink.release_spinner();
}

size_t Spinner::frame_index() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_frame_index;
}

size_t Spinner::render_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_render_count;
}

std::string Spinner::line(size_t frame_index) const {
    return m_options.description + " " + m_options.frames[frame_index % m_options.frames.size()];
}

void Spinner::spin() {
    std::unique_lock<std::mutex> lock(m_mutex);
    while (!m_stop_requested) {
        const auto now = Clock::now();
        if (m_throttle.should_render(now, m_last_render)) {
            m_sink.render_line(line(m_frame_index));
            m_frame_index = (m_frame_index + 1) % m_options.frames.size();
            m_render_count++;
            m_last_render = now;
        }
        m_cv.wait_until(lock, *m_last_render + m_throttle.interval(), [this] { return m_stop_requested; });
    }
}

} // namespace LineGauge
