#include <gtest/gtest.h>
#include "test_utils.hpp"
#include "progress/ProgressBar.hpp"

#include <algorithm>
#include <sstream>
#include <thread>

using namespace LineGauge;
using std::chrono::milliseconds;

class ProgressBarTest : public ::testing::Test {
    protected:
    std::ostringstream out;
    OutputSink sink{out};
    Clock::time_point now = Clock::time_point{} + std::chrono::seconds(1000);

    BarOptions options() {
        BarOptions opts;
        opts.clock = [this] { return now; };
        return opts;
    }

    size_t newlines() const {
        const std::string s = out.str();
        return std::count(s.begin(), s.end(), '\n');
    }
};

TEST_F(ProgressBarTest, update_clamps_to_total) {
    ProgressBar bar(10, options(), sink);
    bar.update(15);
    EXPECT_EQ(10, bar.current());
    bar.update(1);
    EXPECT_EQ(10, bar.current());
}

TEST_F(ProgressBarTest, negative_update_throws) {
    ProgressBar bar(10, options(), sink);
    bar.update(3);
    EXPECT_THROW(bar.update(-1), std::invalid_argument);
    EXPECT_EQ(3, bar.current());
}

TEST_F(ProgressBarTest, set_progress_clamps) {
    ProgressBar bar(10, options(), sink);
    bar.set_progress(50);
    EXPECT_EQ(10, bar.current());
    bar.set_progress(-5);
    EXPECT_EQ(0, bar.current());
    bar.set_progress(4);
    EXPECT_EQ(4, bar.current());
}

TEST_F(ProgressBarTest, close_is_idempotent) {
    ProgressBar bar(10, options(), sink);
    bar.update(5);
    bar.close();
    const size_t writes = sink.write_count();
    bar.close();
    EXPECT_EQ(writes, sink.write_count());
    EXPECT_TRUE(bar.closed());
    EXPECT_EQ(1, newlines());
    EXPECT_EQ('\n', out.str().back());
}

TEST_F(ProgressBarTest, update_after_close_is_ignored) {
    ProgressBar bar(10, options(), sink);
    bar.update(5);
    bar.close();
    const size_t writes = sink.write_count();

    bar.update(2);
    bar.set_progress(9);
    EXPECT_EQ(5, bar.current());
    EXPECT_EQ(writes, sink.write_count());
}

TEST_F(ProgressBarTest, negative_update_after_close_still_throws) {
    ProgressBar bar(10, options(), sink);
    bar.close();
    EXPECT_THROW(bar.update(-1), std::invalid_argument);
}

TEST_F(ProgressBarTest, throttled) {
    ProgressBar bar(100, options(), sink);
    for (int i = 0; i < 5; i++) {
        bar.update(1);
        now += milliseconds(10);
    }
    EXPECT_EQ(1, bar.render_count());
    EXPECT_EQ(5, bar.current());
}

TEST_F(ProgressBarTest, renders_after_interval) {
    ProgressBar bar(100, options(), sink);
    bar.update(1);
    now += milliseconds(100);
    bar.update(1);
    EXPECT_EQ(2, bar.render_count());
}

TEST_F(ProgressBarTest, reaching_total_is_drawn) {
    ProgressBar bar(100, options(), sink);
    bar.update(99);
    now += milliseconds(1);
    bar.update(1);
    EXPECT_EQ(2, bar.render_count());
    EXPECT_THAT(out.str(), HasSubstr("100.00% 100/100"));
}

TEST_F(ProgressBarTest, final_render_shows_final_state) {
    {
        ProgressBar bar(100, options(), sink);
        bar.update(10);
        now += milliseconds(1);
        bar.update(20); // throttled
    }
    const auto lines = split(out.str(), '\n');
    ASSERT_EQ(1, lines.size());
    const auto frames = split(lines[0], '\r');
    EXPECT_THAT(frames.back(), HasSubstr(" 30/100"));
}

TEST_F(ProgressBarTest, destructor_closes) {
    {
        ProgressBar bar(10, options(), sink);
        bar.update(3);
    }
    EXPECT_EQ(1, newlines());
}

TEST_F(ProgressBarTest, zero_total) {
    ProgressBar bar(0, options(), sink);
    EXPECT_EQ(1, bar.render_count());
    EXPECT_THAT(out.str(), HasSubstr("100.00% 0/0"));
    bar.close();
    EXPECT_EQ(1, newlines());
}

TEST_F(ProgressBarTest, bad_arguments) {
    EXPECT_THROW(ProgressBar bar(-1, options(), sink), std::invalid_argument);

    BarOptions opts = options();
    opts.bar_length = 0;
    EXPECT_THROW(ProgressBar bar(10, opts, sink), std::invalid_argument);
}

TEST_F(ProgressBarTest, rate_and_eta) {
    ProgressBar bar(100, options(), sink);
    now += std::chrono::seconds(10);
    bar.update(50);
    EXPECT_THAT(bar.line(), HasSubstr("| Rate: 5.00 items/sec | ETA: 10s"));
}

TEST_F(ProgressBarTest, not_drawn_while_spinner_runs) {
    ASSERT_TRUE(sink.try_claim_spinner());
    ProgressBar bar(10, options(), sink);
    bar.update(1);
    EXPECT_EQ(0, bar.render_count());
    EXPECT_EQ(1, bar.current());
    sink.release_spinner();
}

TEST_F(ProgressBarTest, concurrent_updates) {
    BarOptions opts; // real clock
    ProgressBar bar(4000, opts, sink);
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; t++) {
        threads.emplace_back([&bar] {
            for (int i = 0; i < 1000; i++) {
                bar.update(1);
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_EQ(4000, bar.current());
    bar.close();
    EXPECT_EQ(1, newlines());
}
