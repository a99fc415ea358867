/**
 * @file main.cpp
 * @brief Main entry point for LineGauge.
 *
 * Parses the command line, configures logging and runs the selected command.
 * Every command except "test" is preceded by a silent self-test.
 */

#include <argparse/argparse.hpp>

#include <iostream>

#include "utils/common.hpp"
#include "dist/version.h"

#include "commands/TestCommand.hpp"

extern argparse::ArgumentParser program;
extern int verbosity;

/**
 * @brief Main entry point for LineGauge.
 *
 * Handles:
 * - Signal handler registration for crash dumps
 * - Command-line argument parsing
 * - Logging initialization and configuration
 * - Automatic self-testing before command execution
 * - Command execution and error handling
 *
 * @param argc Argument count.
 * @param argv Argument vector.
 * @return EXIT_SUCCESS (0) on success, EXIT_FAILURE (1) on error.
 */
int main(int argc, char*argv[]) {
    signal(SIGSEGV, signal_handler);
    signal(SIGABRT, signal_handler);
    // a closed stdout pipe disables progress output instead of killing us
    signal(SIGPIPE, SIG_IGN);

    register_program_args(program);

    for (const auto& [name, cmd] : Command::registry()) {
        program.add_subparser(cmd->parser());
    }

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& err) {
        std::cerr << err.what() << std::endl;
        std::cerr << program;
        std::exit(1);
    }

    logger->set_arguments(argc, argv);
    logger->set_banner(APP_NAME " " APP_VERSION);
    logger->set_verbosity(verbosity); // should be before logger->add_file() call
    logger->set_dedup_limit(program.get<int>("--log-dedup-limit"));
    if( program.is_used("--log") ){
        init_log(program.get<std::string>("--log"));
    }

    auto& selfTestCmd = Command::registry()[TEST_CMD_NAME];
    for (const auto& [name, cmd] : Command::registry()) {
        if (program.is_subcommand_used(name)) {
            // subcommand options override the global ones
            logger->set_verbosity(verbosity);
            if( cmd->parser().is_used("--log-dedup-limit") ){
                logger->set_dedup_limit(cmd->parser().get<int>("--log-dedup-limit"));
            }

            if( name == TEST_CMD_NAME ){
                // explicit self-test, make it visible
                logger->set_verbosity(9);
            } else {
                // implicit self-test, silent unless something fails
                if( selfTestCmd->run() != 0 ){
                    logger->critical("self-test failed, exiting");
                    exit(1);
                }
            }

            if( cmd->parser().is_used("--log") ){
                init_log(cmd->parser().get<std::string>("--log"));
            }
            init_log();
            // warning: only use if all your loggers are thread-safe ("_mt" loggers)
            spdlog::flush_every(std::chrono::seconds(5));

            const int rc = cmd->run_guarded();
            logger->flush();
            return rc;
        }
    }

    std::cout << program;
    return 0;
}
