/**
 * @file DemoCommand.cpp
 * @brief Implementation of the "demo" command.
 *
 * Walks through every kind of indicator with simulated work: a plain bar, a
 * line-by-line file pass, a spinner, a multi-file run, a wrapped range and a
 * custom-styled bar. --speed scales the simulated work, 0 disables sleeping.
 */

#include "DemoCommand.hpp"
#include "progress/MultiProgress.hpp"
#include "progress/ProgressArgs.hpp"
#include "progress/ProgressBar.hpp"
#include "progress/Spinner.hpp"
#include "progress/progress_range.hpp"

#include <algorithm>
#include <iostream>
#include <numeric>
#include <random>
#include <thread>

REGISTER_COMMAND(DemoCommand);

using namespace LineGauge;

namespace {

class Demo {
    public:
    Demo(BarOptions bar, SpinnerOptions spinner, double speed, std::string file)
        : m_bar(std::move(bar)), m_spinner(std::move(spinner)), m_speed(speed), m_file(std::move(file)) {}

    void basic() {
        say("Basic progress bar: 100 items");
        BarOptions options = m_bar;
        options.description = "Processing items";
        ProgressBar pbar(100, options);
        for( int i = 0; i < 100; i++ ){
            work(20);
            pbar.update(1);
        }
    }

    // precounts lines so the bar has a total, then walks the file
    void file() {
        BarOptions options = m_bar;
        options.description = "Analyzing log file";
        options.unit = "lines";

        if( m_file.empty() ){
            say("File processing: 1000 simulated lines");
            std::uniform_real_distribution<double> chance(0.0, 1.0);
            ProgressBar pbar(1000, options);
            for( int i = 0; i < 1000; i++ ){
                work(1);
                if( chance(m_rng) < 0.05 ){
                    work(10); // an interesting line takes longer
                }
                pbar.update(1);
            }
            return;
        }

        const uint64_t nlines = count_lines_in_file(m_file);
        say(fmt::format("File processing: {} ({} lines)", m_file, nlines));
        std::ifstream f(m_file);
        ProgressBar pbar(static_cast<int64_t>(nlines), options);
        std::string line;
        while( std::getline(f, line) ){
            work(1);
            pbar.update(1);
        }
    }

    void spinner() {
        say("Spinner for tasks of unknown length");
        for( const auto& [what, ms] : { std::pair<const char*, int>{"Connecting to server...", 2000},
                                        std::pair<const char*, int>{"Downloading configuration...", 1500} } ){
            SpinnerOptions options = m_spinner;
            options.description = what;
            Spinner spinner(options);
            spinner.start();
            work(ms);
            spinner.stop();
            fmt::print("{} done\n", what);
        }
    }

    void multi() {
        say("Multi-file processing");
        const std::vector<std::pair<std::string, int>> files = {
            {"system.log", 500}, {"error.log", 200}, {"debug.log", 800}, {"access.log", 1200},
        };
        std::vector<std::string> names;
        for( const auto& f : files ){
            names.push_back(f.first);
        }

        MultiOptions options;
        options.overall = m_bar;
        options.overall.show_rate = false;
        options.item = m_bar;
        options.item.bar_length = 30;
        options.item.show_rate = false;
        options.item.show_eta = false;
        options.frames = m_spinner.frames;

        std::uniform_int_distribution<int> pause(1, 5);
        MultiProgress tracker(names, "Processing log files", options);
        for( const auto& [name, nlines] : files ){
            tracker.start_item(name, nlines);
            for( int i = 0; i < nlines; i++ ){
                work(pause(m_rng));
                tracker.update_item_progress(i + 1, nlines);
            }
            tracker.complete_item();
        }
    }

    void iter() {
        say("Wrapping a range");
        std::vector<int> data(50);
        std::iota(data.begin(), data.end(), 0);

        std::vector<int> results;
        for( int item : progress_bar(data, "Processing data", m_bar) ){
            work(50);
            results.push_back(item * 2);
        }
        fmt::print("Processed {} items\n", results.size());
    }

    void style() {
        say("Custom styling");
        BarOptions options = m_bar;
        options.description = "Custom Style";
        options.fill = "▓";
        options.empty = "▒";
        options.bar_length = 40;
        options.show_rate = false;
        options.show_eta = false;
        ProgressBar pbar(30, options);
        for( int i = 0; i < 30; i++ ){
            work(100);
            pbar.update(1);
        }
    }

    private:
    void say(const std::string& what) {
        fmt::print("\n{}\n", what);
        fflush(stdout);
        std::cout << std::flush;
    }

    void work(int ms) {
        if( m_speed > 0 ){
            std::this_thread::sleep_for(std::chrono::duration<double, std::milli>(ms / m_speed));
        }
    }

    BarOptions m_bar;
    SpinnerOptions m_spinner;
    double m_speed;
    std::string m_file;
    std::mt19937 m_rng{std::random_device{}()};
};

} // namespace

DemoCommand::DemoCommand(bool reg) : Command(reg, "demo", "show every kind of progress indicator") {
    m_parser.add_argument("--only")
        .help("run a single scenario: bar, file, spinner, multi, iter or style");
    m_parser.add_argument("--speed")
        .help("simulated work speed multiplier, 0 = no delays")
        .default_value(1.0)
        .scan<'g', double>();
    m_parser.add_argument("--file")
        .help("text file for the file scenario, instead of simulated lines");
    register_progress_args(m_parser);
}

int DemoCommand::run() {
    const double speed = m_parser.get<double>("--speed");
    if( speed < 0 ){
        throw std::invalid_argument("--speed must not be negative");
    }

    Demo demo(bar_options_from_args(m_parser), spinner_options_from_args(m_parser), speed,
              m_parser.present("--file").value_or(""));

    const std::vector<std::pair<std::string, void (Demo::*)()>> scenarios = {
        {"bar", &Demo::basic},
        {"file", &Demo::file},
        {"spinner", &Demo::spinner},
        {"multi", &Demo::multi},
        {"iter", &Demo::iter},
        {"style", &Demo::style},
    };

    const auto only = m_parser.present("--only");
    if( only && std::none_of(scenarios.begin(), scenarios.end(), [&](const auto& sc) { return sc.first == *only; }) ){
        throw std::invalid_argument("unknown scenario \"" + *only + "\"");
    }
    for( const auto& [name, scenario] : scenarios ){
        if( only && *only != name ){
            continue;
        }
        logger->debug("demo: {}", name);
        (demo.*scenario)();
    }
    return 0;
}
