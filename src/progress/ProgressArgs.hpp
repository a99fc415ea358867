#pragma once
#include <argparse/argparse.hpp>

#include "BarFormat.hpp"
#include "Spinner.hpp"

// --bar-length, --interval-ms, --no-rate etc. for commands that draw progress
void register_progress_args(argparse::ArgumentParser& parser);

// applies --no-progress to the console sink as a side effect
LineGauge::BarOptions bar_options_from_args(const argparse::ArgumentParser& parser);
LineGauge::SpinnerOptions spinner_options_from_args(const argparse::ArgumentParser& parser);
