#include <gtest/gtest.h>
#include "test_utils.hpp"
#include "io/OutputSink.hpp"

#include <sstream>

// streambuf that refuses every write
class FailingBuf : public std::streambuf {
    protected:
    int overflow(int) override { return traits_type::eof(); }
    std::streamsize xsputn(const char*, std::streamsize) override { return 0; }
};

TEST(OutputSink, line_ends_with_cr) {
    std::ostringstream out;
    OutputSink sink(out);
    sink.render_line("abc");
    EXPECT_EQ("abc\r", out.str());
    EXPECT_EQ(3, sink.last_line_width());
}

TEST(OutputSink, shorter_line_is_padded) {
    std::ostringstream out;
    OutputSink sink(out);
    sink.render_line("abcdef");
    sink.render_line("abc");
    EXPECT_EQ("abcdef\rabc   \r", out.str());
    EXPECT_EQ(3, sink.last_line_width());
}

TEST(OutputSink, padding_counts_code_points) {
    std::ostringstream out;
    OutputSink sink(out);
    sink.render_line("[███]");
    sink.render_line("[#]");
    EXPECT_EQ("[███]\r[#]  \r", out.str());
}

TEST(OutputSink, final_line_ends_with_newline) {
    std::ostringstream out;
    OutputSink sink(out);
    sink.render_line("abcdef");
    sink.render_line("done", true);
    EXPECT_EQ("abcdef\rdone  \n", out.str());
    EXPECT_EQ(0, sink.last_line_width());
    EXPECT_EQ(2, sink.write_count());
}

TEST(OutputSink, clear_line) {
    std::ostringstream out;
    OutputSink sink(out);
    sink.clear_line(); // nothing on screen, nothing written
    EXPECT_EQ("", out.str());

    sink.render_line("abc");
    sink.clear_line();
    EXPECT_EQ("abc\r\r   \r", out.str());
    EXPECT_EQ(0, sink.last_line_width());
}

TEST(OutputSink, block_on_stream_reprints) {
    std::ostringstream out;
    OutputSink sink(out);
    sink.render_block({"one", "two"});
    sink.render_block({"one", "three"}, true);
    EXPECT_EQ("one\ntwo\none\nthree\n", out.str());
}

TEST(OutputSink, block_on_terminal_redraws_in_place) {
    std::ostringstream out;
    OutputSink sink(out, true);
    sink.render_block({"a", "b"});
    EXPECT_EQ("\ra" ANSI_CLEAR_EOL "\nb" ANSI_CLEAR_EOL "\r\x1b[1A", out.str());

    out.str("");
    sink.render_block({"a", "c"}, true);
    EXPECT_EQ("\ra" ANSI_CLEAR_EOL "\nc" ANSI_CLEAR_EOL "\n", out.str());
}

TEST(OutputSink, block_on_terminal_keeps_height) {
    std::ostringstream out;
    OutputSink sink(out, true);
    sink.render_block({"a", "b"});
    out.str("");
    sink.render_block({"a"});
    EXPECT_EQ("\ra" ANSI_CLEAR_EOL "\n" ANSI_CLEAR_EOL "\r\x1b[1A", out.str());
}

TEST(OutputSink, disabled) {
    std::ostringstream out;
    OutputSink sink(out);
    sink.set_enabled(false);
    sink.render_line("abc");
    sink.render_block({"a", "b"}, true);
    EXPECT_EQ("", out.str());
    EXPECT_EQ(0, sink.write_count());
}

TEST(OutputSink, failing_stream_degrades) {
    FailingBuf buf;
    std::ostream out(&buf);
    OutputSink sink(out);
    EXPECT_NO_THROW(sink.render_line("abc"));
    EXPECT_TRUE(sink.broken());
    EXPECT_NO_THROW(sink.render_line("abcd", true));
    EXPECT_EQ(0, sink.write_count());
}

TEST(OutputSink, throwing_stream_degrades) {
    FailingBuf buf;
    std::ostream out(&buf);
    out.exceptions(std::ios::badbit | std::ios::failbit);
    OutputSink sink(out);
    EXPECT_NO_THROW(sink.render_line("abc"));
    EXPECT_TRUE(sink.broken());
    EXPECT_EQ(0, sink.write_count());
}

TEST(OutputSink, one_spinner_at_a_time) {
    std::ostringstream out;
    OutputSink sink(out);
    EXPECT_TRUE(sink.try_claim_spinner());
    EXPECT_TRUE(sink.spinner_active());
    EXPECT_FALSE(sink.try_claim_spinner());
    sink.release_spinner();
    EXPECT_FALSE(sink.spinner_active());
    EXPECT_TRUE(sink.try_claim_spinner());
}

TEST(OutputSink, display_width) {
    EXPECT_EQ(0, OutputSink::display_width(""));
    EXPECT_EQ(5, OutputSink::display_width("hello"));
    EXPECT_EQ(4, OutputSink::display_width("↳ ab"));
}
