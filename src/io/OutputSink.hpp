#pragma once
#include <atomic>
#include <cstddef>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>

// The one place that writes progress output to a stream.
// Holds the state shared by every indicator drawing on that stream (width of
// the line currently on screen, lines of an in-place block) and serializes
// writers, so two renders never interleave their characters.
//
// A write failure is reported once and turns the sink into a silent no-op;
// it is never propagated to the caller.
class OutputSink {
    public:
    explicit OutputSink(std::ostream& out, bool is_terminal = false);

    OutputSink(const OutputSink&) = delete;
    OutputSink& operator=(const OutputSink&) = delete;

    // std::cout, terminal detection via isatty(STDOUT_FILENO)
    static OutputSink& console();

    // draw a single line over the previous one, then "\r" ("\n" if final)
    void render_line(const std::string& line, bool final = false);

    // draw several lines in place (terminal) or reprint them (anything else)
    void render_block(const std::vector<std::string>& lines, bool final = false);

    // blank out the line currently on screen and return to its start
    void clear_line();

    bool is_terminal() const { return m_is_terminal; }
    bool broken() const { return m_broken; }
    size_t write_count() const;
    size_t last_line_width() const;

    // --no-progress
    void set_enabled(bool enabled) { m_enabled = enabled; }
    bool enabled() const { return m_enabled; }

    // at most one spinner may animate a sink at a time
    bool try_claim_spinner();
    void release_spinner();
    bool spinner_active() const { return m_spinner_active; }

    // number of terminal columns taken by a UTF-8 string (one per code point)
    static size_t display_width(const std::string& s);

    private:
    bool write_locked(const std::string& data);
    void mark_broken(const std::string& reason);

    std::ostream& m_out;
    const bool m_is_terminal;
    mutable std::mutex m_mutex;

    size_t m_last_width = 0;
    size_t m_block_lines = 0;
    size_t m_write_count = 0;

    std::atomic<bool> m_broken{false};
    std::atomic<bool> m_enabled{true};
    std::atomic<bool> m_spinner_active{false};
};
