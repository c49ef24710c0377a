#include "fastpass/cli.hpp"

#include <cstdint>
#include <exception>
#include <ostream>
#include <sstream>
#include <stdexcept>

#include "fastpass/config.hpp"
#include "fastpass/report.hpp"
#include "fastpass/simulation_run.hpp"

using namespace std;

namespace fastpass {

void print_usage(ostream& out, const char* prog) {
    out << "Usage: " << prog << " [options]\n";
    out << "Options:\n";
    out << "  --rates <list>            comma-separated arrival rates (default 0.5,0.95)\n";
    out << "  --mu <double>             service rate mu (default 1.0)\n";
    out << "  --fractions <list>        comma-separated priority fractions\n";
    out << "  --fsteps <int>            evenly spaced fractions 0..fmax (default 20)\n";
    out << "  --fmax <double>           largest fraction for --fsteps (default 0.95)\n";
    out << "  --f <double>              single run at this fraction (needs one rate)\n";
    out << "  --horizonT <double>       simulated minutes per run (default 50000)\n";
    out << "  --warmup <double>         minutes excluded from statistics (default 5000)\n";
    out << "  --seed <int>              base RNG seed (default 42)\n";
    out << "  --reps <int>              replications per grid point (default 1)\n";
    out << "  --threads <int>           worker threads for independent runs (default 1)\n";
    out << "  --threshold <double>      accept if regular < threshold * M/M/1 time (default 2.5)\n";
    out << "  --maxRatio <double>       also require regular/priority <= maxRatio\n";
    out << "  --outdir <dir>            output directory for CSV files (default .)\n";
    out << "  --quiet                   no per-run progress lines\n";
    out << "  --help                    show this help\n";
}

namespace {

// whole token must be consumed: "2.7" is not an int, "1.0abc" is not a double
double parse_double(const string& text) {
    size_t used = 0;
    double v = stod(text, &used);
    if (used != text.size()) throw invalid_argument("trailing characters in '" + text + "'");
    return v;
}

int parse_int(const string& text) {
    size_t used = 0;
    int v = stoi(text, &used);
    if (used != text.size()) throw invalid_argument("trailing characters in '" + text + "'");
    return v;
}

// stoull accepts "-1" and wraps it
uint64_t parse_seed(const string& text) {
    size_t first = text.find_first_not_of(" \t");
    if (first == string::npos || text[first] == '-' || text[first] == '+')
        throw invalid_argument("seed must be a non-negative integer: '" + text + "'");
    size_t used = 0;
    unsigned long long v = stoull(text, &used);
    if (used != text.size()) throw invalid_argument("trailing characters in '" + text + "'");
    return v;
}

} // namespace

vector<double> parse_list(const string& text) {
    vector<double> values;
    stringstream ss(text);
    string item;
    while (getline(ss, item, ',')) {
        values.push_back(parse_double(item));
    }
    if (values.empty()) throw invalid_argument("empty list");
    return values;
}

bool parseArgs(int argc, const char* const argv[], CliOptions& p, ostream& err) {
    bool explicitFractions = false;
    for (int i = 1; i < argc; ++i) {
        string arg = argv[i];
        try {
            if (arg == "--rates" && i+1 < argc) { p.sweep.arrivalRates = parse_list(argv[++i]); continue; }
            if (arg == "--mu" && i+1 < argc) { p.sweep.serviceRate = parse_double(argv[++i]); continue; }
            if (arg == "--fractions" && i+1 < argc) {
                p.sweep.fractions = parse_list(argv[++i]);
                explicitFractions = true;
                continue;
            }
            if (arg == "--fsteps" && i+1 < argc) { p.fractionSteps = parse_int(argv[++i]); continue; }
            if (arg == "--fmax" && i+1 < argc) { p.fractionMax = parse_double(argv[++i]); continue; }
            if (arg == "--f" && i+1 < argc) { p.singleFraction = parse_double(argv[++i]); continue; }
            if (arg == "--horizonT" && i+1 < argc) { p.sweep.horizon = parse_double(argv[++i]); continue; }
            if (arg == "--warmup" && i+1 < argc) { p.sweep.warmup = parse_double(argv[++i]); continue; }
            if (arg == "--seed" && i+1 < argc) { p.sweep.seed = parse_seed(argv[++i]); continue; }
            if (arg == "--reps" && i+1 < argc) { p.sweep.reps = parse_int(argv[++i]); continue; }
            if (arg == "--threads" && i+1 < argc) { p.sweep.threads = parse_int(argv[++i]); continue; }
            if (arg == "--threshold" && i+1 < argc) { p.sweep.policy.mm1Multiple = parse_double(argv[++i]); continue; }
            if (arg == "--maxRatio" && i+1 < argc) { p.sweep.policy.maxRatio = parse_double(argv[++i]); continue; }
            if (arg == "--outdir" && i+1 < argc) { p.outdir = argv[++i]; continue; }
        } catch (const invalid_argument&) {
            err << "Bad value for " << arg << ": " << argv[i] << "\n";
            return false;
        } catch (const out_of_range&) {
            err << "Value out of range for " << arg << ": " << argv[i] << "\n";
            return false;
        }
        if (arg == "--quiet") { p.quiet = true; continue; }
        if (arg == "--help") { p.help = true; continue; }
        err << "Unknown or incomplete option: " << arg << "\n";
        print_usage(err, argv[0]);
        return false;
    }

    // finalize fraction grid
    if (p.singleFraction) {
        if (p.sweep.arrivalRates.size() != 1) {
            err << "--f needs exactly one arrival rate\n";
            return false;
        }
        p.sweep.fractions = {*p.singleFraction};
    } else if (!explicitFractions) {
        if (p.fractionSteps < 1) {
            err << "--fsteps must be at least 1\n";
            return false;
        }
        p.sweep.fractions = linspace(0.0, p.fractionMax, p.fractionSteps);
    }
    return true;
}

int run_cli(int argc, const char* const argv[], ostream& out, ostream& err) {
    CliOptions opts;
    if (!parseArgs(argc, argv, opts, err)) return 1;
    if (opts.help) {
        print_usage(out, argv[0]);
        return 0;
    }

    try {
        if (opts.singleFraction) {
            RunConfig rc = run_config(opts.sweep, 0, 0, 0);
            rc.seed = opts.sweep.seed;
            RunResult r = runSimulation(rc);
            out << "FastPass priority queue: single run\n";
            print_run_summary(out, rc, r);
            return 0;
        }

        const SweepConfig& s = opts.sweep;
        out << "FastPass priority queue sweep\n";
        out << "mu=" << s.serviceRate << " horizonT=" << s.horizon << " warmup=" << s.warmup
            << " reps=" << s.reps << " threads=" << s.threads << " seed=" << s.seed << "\n";

        SweepResult sweep = run_sweep(s, opts.quiet ? nullptr : &out);

        print_sweep_table(out, sweep);
        print_recommendations(out, sweep);

        string out_sweep = opts.outdir + "/sweep.csv";
        string out_runs = opts.outdir + "/runs.csv";
        write_csv_sweep(out_sweep, sweep);
        write_csv_per_run(out_runs, sweep);
        out << "\nWrote: " << out_sweep << " and " << out_runs << "\n";
    } catch (const ConfigurationError& e) {
        err << "Configuration error: " << e.what() << "\n";
        return 1;
    } catch (const runtime_error& e) {
        err << "Error: " << e.what() << "\n";
        return 1;
    } catch (const exception& e) {
        err << "Internal error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}

} // namespace fastpass
