#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "RenderThrottle.hpp"
#include "io/OutputSink.hpp"

namespace LineGauge {

struct SpinnerOptions {
    std::string description = "Working";
    std::vector<std::string> frames = unicode_frames();
    std::chrono::milliseconds interval = RenderThrottle::DEFAULT_INTERVAL;

    static std::vector<std::string> unicode_frames() {
        return { "⠋", "⠙", "⠹", "⠸", "⠼", "⠴", "⠦", "⠧", "⠇", "⠏" };
    }
    static std::vector<std::string> ascii_frames() {
        return { "|", "/", "-", "\\" };
    }
};

// Indeterminate indicator animated by its own thread.
//
// idle -> running on start(), running -> idle on stop(). start() while running
// and stop() while idle do nothing. stop() joins the animation thread before
// it clears the line, so nothing is drawn once it returns.
//
// A sink accepts one running spinner at a time: starting a second one on the
// same sink throws std::logic_error.
class Spinner {
    public:
    // throws std::invalid_argument on empty frames or zero interval
    explicit Spinner(SpinnerOptions options = {}, OutputSink& sink = OutputSink::console());
    explicit Spinner(const std::string& description, OutputSink& sink = OutputSink::console());
    ~Spinner();

    Spinner(const Spinner&) = delete;
    Spinner& operator=(const Spinner&) = delete;

    void start();
    void stop();

    bool running() const { return m_running; }
    size_t frame_index() const;
    size_t render_count() const;

    // line for a given frame, without writing it
    std::string line(size_t frame_index) const;

    private:
    void spin();

    const SpinnerOptions m_options;
    OutputSink& m_sink;
    const RenderThrottle m_throttle;

    std::mutex m_control_mutex;          // serializes start()/stop()
    mutable std::mutex m_mutex;          // guards the loop state below
    std::condition_variable m_cv;
    bool m_stop_requested = false;
    size_t m_frame_index = 0;
    size_t m_render_count = 0;
    std::optional<Clock::time_point> m_last_render;

    std::atomic<bool> m_running{false};
    std::thread m_thread;
};

} // namespace LineGauge
