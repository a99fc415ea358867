/**
 * @file OutputSink.cpp
 * @brief Implementation of the shared progress output stream.
 *
 * Every indicator funnels its output through an OutputSink. The sink keeps the
 * width of the line currently on screen so a shorter line can blank out the
 * leftovers of a longer one, and it owns the lock that makes "pad, write,
 * flush" a single critical section.
 */

#include "OutputSink.hpp"
#include "utils/common.hpp"

#include <algorithm>
#include <iostream>
#include <unistd.h>

OutputSink::OutputSink(std::ostream& out, bool is_terminal)
    : m_out(out), m_is_terminal(is_terminal)
{
}

OutputSink& OutputSink::console() {
    static OutputSink instance(std::cout, isatty(STDOUT_FILENO) == 1);
    return instance;
}

size_t OutputSink::display_width(const std::string& s) {
    size_t width = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) { // skip UTF-8 continuation bytes
            width++;
        }
    }
    return width;
}

/**
 * @brief Draws a line over the one currently on screen.
 *
 * Pads with spaces up to the previous width, then returns the cursor to the
 * start of the line. The final render ends with a newline instead, leaving the
 * line on screen and the cursor on a fresh line.
 *
 * @param line Line content, without control characters.
 * @param final True for the closing render.
 */
void OutputSink::render_line(const std::string& line, bool final) {
    std::lock_guard<std::mutex> lock(m_mutex);

    const size_t width = display_width(line);
    std::string data = line;
    if (width < m_last_width) {
        data.append(m_last_width - width, ' ');
    }
    data += final ? '\n' : '\r';

    if (write_locked(data)) {
        m_last_width = final ? 0 : width;
        m_block_lines = 0;
    }
}

/**
 * @brief Draws a group of lines.
 *
 * On a terminal the block is redrawn in place: each line is cleared to its end
 * and the cursor is moved back to the first line afterwards. Streams that are
 * not terminals cannot do that, so every call prints all lines again.
 *
 * @param lines Lines to draw, top to bottom.
 * @param final True for the closing render, leaves the cursor below the block.
 */
void OutputSink::render_block(const std::vector<std::string>& lines, bool final) {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::string data;
    if (!m_is_terminal) {
        for (const auto& line : lines) {
            data += line;
            data += '\n';
        }
        if (write_locked(data)) {
            m_last_width = 0;
        }
        return;
    }

    // keep the block height stable, a shorter block still has to wipe the old rows
    const size_t nlines = std::max(lines.size(), m_block_lines);
    if (nlines == 0) {
        return;
    }

    data += '\r';
    for (size_t i = 0; i < nlines; i++) {
        if (i < lines.size()) {
            data += lines[i];
        }
        data += ANSI_CLEAR_EOL;
        if (i + 1 < nlines) {
            data += '\n';
        }
    }

    if (final) {
        data += '\n';
    } else {
        data += '\r';
        if (nlines > 1) {
            data += fmt::format(ANSI_CURSOR_UP_FMT, nlines - 1);
        }
    }

    if (write_locked(data)) {
        m_last_width = 0;
        m_block_lines = final ? 0 : nlines;
    }
}

void OutputSink::clear_line() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_last_width == 0) {
        return;
    }

    std::string data = "\r";
    data.append(m_last_width, ' ');
    data += '\r';
    if (write_locked(data)) {
        m_last_width = 0;
    }
}

size_t OutputSink::write_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_write_count;
}

size_t OutputSink::last_line_width() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_last_width;
}

bool OutputSink::try_claim_spinner() {
    bool expected = false;
    return m_spinner_active.compare_exchange_strong(expected, true);
}

void OutputSink::release_spinner() {
    m_spinner_active = false;
}

// caller holds m_mutex
bool OutputSink::write_locked(const std::string& data) {
    if (!m_enabled || m_broken) {
        return false;
    }

    try {
        m_out.write(data.data(), static_cast<std::streamsize>(data.size()));
        m_out.flush();
    } catch (const std::ios_base::failure& e) {
        mark_broken(e.what());
        return false;
    }

    if (!m_out) {
        mark_broken("stream is in a failed state");
        return false;
    }

    m_write_count++;
    return true;
}

void OutputSink::mark_broken(const std::string& reason) {
    m_broken = true;
    logger->warn_once("progress output failed ({}), display disabled", reason);
}
