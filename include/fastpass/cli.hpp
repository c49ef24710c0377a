#ifndef FASTPASS_CLI_HPP
#define FASTPASS_CLI_HPP

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include "fastpass/sweep.hpp"

namespace fastpass {

struct CliOptions {
    SweepConfig sweep;
    std::optional<double> singleFraction;   // --f: one run instead of a sweep
    int fractionSteps = 20;
    double fractionMax = 0.95;
    std::string outdir = ".";
    bool quiet = false;
    bool help = false;
};

void print_usage(std::ostream& out, const char* prog);

// parse errors are reported on err; returns false on bad input
bool parseArgs(int argc, const char* const argv[], CliOptions& opts, std::ostream& err);

// parse, run a single simulation or a sweep, print and write CSVs;
// returns the process exit status (1 on bad arguments or any failure)
int run_cli(int argc, const char* const argv[], std::ostream& out, std::ostream& err);

// "0.5,0.95" -> {0.5, 0.95}; throws std::invalid_argument on a malformed list
std::vector<double> parse_list(const std::string& text);

} // namespace fastpass

#endif // FASTPASS_CLI_HPP
