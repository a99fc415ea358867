/**
 * @file TestCommand.cpp
 * @brief Implementation of the TestCommand for self-testing.
 *
 * Checks the formatting primitives every progress line depends on: bar fill
 * arithmetic, UTF-8 width accounting and duration formatting. Runs silently
 * before every other command and verbosely when invoked as "test".
 */

#include "TestCommand.hpp"
#include "io/OutputSink.hpp"
#include "progress/BarFormat.hpp"
#include "progress/RateEstimator.hpp"

REGISTER_COMMAND(TestCommand);

TestCommand::TestCommand(bool reg) : Command(reg, TEST_CMD_NAME, "self-test") {
}

template <typename T>
static bool check(const char* what, const T& actual, const T& expected) {
    if( actual != expected ){
        logger->critical("selftest: {}: expected {}, got {}", what, expected, actual);
        return false;
    }
    logger->trace("selftest: {} = {}", what, actual);
    return true;
}

/**
 * @brief Executes the self-tests.
 *
 * @return EXIT_SUCCESS (0) if all tests pass, EXIT_FAILURE (1) if any test fails.
 */
int TestCommand::run() {
    using namespace LineGauge;

    bool ok = true;
    ok &= check<size_t>("filled_length(37, 100, 50)", filled_length(37, 100, 50), 18);
    ok &= check<size_t>("filled_length(0, 0, 50)", filled_length(0, 0, 50), 50);
    ok &= check<size_t>("filled_length(1, 3, 3)", filled_length(1, 3, 3), 1);
    ok &= check<size_t>("display_width(\"█░⠋\")", OutputSink::display_width("█░⠋"), 3);
    ok &= check<std::string>("seconds2human(3725)", seconds2human(3725), "1h2m");
    ok &= check<std::string>("eta2human(unknown)", eta2human(std::nullopt), "?");

    RateEstimator rate;
    const auto t0 = Clock::time_point{};
    rate.record(0, t0);
    rate.record(50, t0 + std::chrono::seconds(10));
    ok &= check<double>("rate(50 in 10s)", rate.rate(t0 + std::chrono::seconds(10)), 5.0);

    if( !ok ){
        return 1;
    }
    logger->trace("selftest: OK");
    return 0;
}
