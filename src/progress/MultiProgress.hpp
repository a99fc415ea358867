#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "BarFormat.hpp"
#include "RateEstimator.hpp"
#include "RenderThrottle.hpp"
#include "Spinner.hpp"
#include "io/OutputSink.hpp"

namespace LineGauge {

struct MultiOptions {
    BarOptions overall = overall_defaults();
    BarOptions item = item_defaults();
    std::vector<std::string> frames = SpinnerOptions::unicode_frames(); // items of unknown size
    std::string noun = "files";

    static BarOptions overall_defaults() {
        BarOptions options;
        options.show_rate = false;
        return options;
    }
    static BarOptions item_defaults() {
        BarOptions options;
        options.bar_length = 30;
        options.show_rate = false;
        options.show_eta = false;
        return options;
    }
};

// Progress over an ordered list of items, plus the item in progress.
//
// Two lines: the aggregate bar ("N of M files complete") and the active item,
// redrawn in place on a terminal, reprinted on every throttled tick otherwise.
// An item of unknown size gets a spinner frame and a running count instead of
// a bar. current_index() only moves forward and stops at the number of items.
//
// After close() every mutating call is a no-op; the destructor closes.
class MultiProgress {
    public:
    MultiProgress(std::vector<std::string> items, const std::string& description = "Processing files",
                  MultiOptions options = {}, OutputSink& sink = OutputSink::console());
    ~MultiProgress();

    MultiProgress(const MultiProgress&) = delete;
    MultiProgress& operator=(const MultiProgress&) = delete;

    void start_item(const std::string& id, std::optional<uint64_t> total_units = std::nullopt);
    void update_item_progress(uint64_t current_units, std::optional<uint64_t> total_units = std::nullopt);
    void complete_item();
    void close();

    size_t current_index() const;
    size_t size() const { return m_items.size(); }
    bool closed() const;
    bool item_active() const;
    uint64_t item_current() const;
    std::optional<uint64_t> item_total() const;
    size_t render_count() const;

    std::string aggregate_line() const;
    std::string item_line() const;

    private:
    struct ActiveItem {
        std::string id;
        uint64_t current = 0;
        std::optional<uint64_t> total;
        bool complete = false;
    };

    void render_locked(bool force, bool final);
    std::string aggregate_line_locked(Clock::time_point now) const;
    std::string item_line_locked(Clock::time_point now) const;

    const std::vector<std::string> m_items;
    MultiOptions m_options;
    OutputSink& m_sink;
    const RenderThrottle m_throttle;

    mutable std::mutex m_mutex;
    size_t m_current_index = 0;
    std::optional<ActiveItem> m_item;
    bool m_closed = false;
    std::optional<Clock::time_point> m_last_render;
    size_t m_render_count = 0;
    size_t m_frame_index = 0;
    RateEstimator m_overall_rate;
    RateEstimator m_item_rate;
};

} // namespace LineGauge
