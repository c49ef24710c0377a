#include "fastpass/report.hpp"

#include <cmath>
#include <fstream>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <stdexcept>

using namespace std;

namespace fastpass {

namespace {

// empty CSV field for an undefined value
string csv_field(const optional<double>& v) {
    if (!v) return "";
    ostringstream s;
    s << setprecision(10) << *v;
    return s.str();
}

string csv_field(double v) {
    if (!isfinite(v)) return "";
    ostringstream s;
    s << setprecision(10) << v;
    return s.str();
}

// restores the caller's float format and precision on scope exit
class StreamFormatGuard {
public:
    explicit StreamFormatGuard(ostream& out)
        : out(out), flags(out.flags()), precision(out.precision()) {}
    ~StreamFormatGuard() { restore(); }

    void restore() {
        out.flags(flags);
        out.precision(precision);
    }

    StreamFormatGuard(const StreamFormatGuard&) = delete;
    StreamFormatGuard& operator=(const StreamFormatGuard&) = delete;

private:
    ostream& out;
    ios::fmtflags flags;
    streamsize precision;
};

template <typename Writer>
void write_file(const string& path, Writer write) {
    ofstream f(path);
    if (!f) throw runtime_error("cannot open " + path + " for writing");
    write(f);
    f.close();
    if (!f) throw runtime_error("error while writing " + path);
}

} // namespace

string format_minutes(const optional<double>& minutes, int precision) {
    if (!minutes) return "N/A";
    ostringstream s;
    s << fixed << setprecision(precision) << *minutes;
    return s.str();
}

void print_run_summary(ostream& out, const RunConfig& config, const RunResult& r) {
    StreamFormatGuard guard(out);
    out << "lambda=" << config.arrivalRate << " mu=" << config.serviceRate
        << " f=" << config.priorityFraction << " seed=" << config.seed << "\n";
    out << "horizon=" << config.horizon << " warmup=" << config.warmup << "\n";
    out << "  priority: mean=" << format_minutes(r.meanPriority, 3)
        << " served=" << r.priority.completed << " arrived=" << r.priority.arrived
        << " max=" << fixed << setprecision(3) << r.priority.maxResidence << "\n";
    out << "  regular:  mean=" << format_minutes(r.meanRegular, 3)
        << " served=" << r.regular.completed << " arrived=" << r.regular.arrived
        << " max=" << r.regular.maxResidence << "\n";
    out << "  avgWaiting=" << r.avgWaiting << " util=" << r.utilization
        << " servedTotal=" << r.servedTotal << "\n";
}

void print_recommendations(ostream& out, const SweepResult& sweep) {
    StreamFormatGuard guard(out);
    for (const Recommendation& rec : sweep.recommendations) {
        guard.restore();
        out << "\nResults for lambda=" << rec.arrivalRate << ":\n";
        if (isfinite(rec.mm1Time))
            out << "M/M/1 residence time: " << fixed << setprecision(2) << rec.mm1Time << " minutes\n";
        else
            out << "M/M/1 residence time: unbounded (lambda >= mu)\n";

        if (!rec.cell) {
            out << "No good operating point found under the criteria.\n";
            continue;
        }
        const SweepCell& c = sweep.cells[*rec.cell];
        out << "Recommended FastPass fraction: " << fixed << setprecision(2) << c.fraction << "\n";
        out << "  - FastPass residence time: " << format_minutes(c.priority.mean) << " minutes\n";
        out << "  - Regular residence time: " << format_minutes(c.regular.mean) << " minutes\n";
        out << "  - Regular/FastPass time ratio: " << format_minutes(c.ratio()) << "\n";
    }
}

void print_sweep_table(ostream& out, const SweepResult& sweep) {
    StreamFormatGuard guard(out);
    bool reps = sweep.config.reps > 1;
    for (size_t i = 0; i < sweep.config.arrivalRates.size(); ++i) {
        guard.restore();
        out << "\nlambda=" << sweep.config.arrivalRates[i] << "\n";
        out << setw(6) << "f" << setw(12) << "priority" << (reps ? "   +/-    " : "")
            << setw(12) << "regular" << (reps ? "   +/-    " : "") << setw(10) << "ratio" << "\n";
        for (size_t j = 0; j < sweep.config.fractions.size(); ++j) {
            const SweepCell& c = sweep.at(i, j);
            out << fixed << setprecision(2) << setw(6) << c.fraction
                << setw(12) << format_minutes(c.priority.mean, 3);
            if (reps) out << "  " << setw(8) << format_minutes(c.priority.mean ? optional<double>(c.priority.ci95) : optional<double>(), 3);
            out << setw(12) << format_minutes(c.regular.mean, 3);
            if (reps) out << "  " << setw(8) << format_minutes(c.regular.mean ? optional<double>(c.regular.ci95) : optional<double>(), 3);
            out << setw(10) << format_minutes(c.ratio()) << "\n";
        }
    }
}

void write_csv_sweep(ostream& f, const SweepResult& sweep) {
    f << "lambda,f,priority_mean,priority_ci95,priority_n,regular_mean,regular_ci95,regular_n,ratio,mm1\n";
    for (const SweepCell& c : sweep.cells) {
        f << csv_field(c.arrivalRate) << "," << csv_field(c.fraction) << ","
          << csv_field(c.priority.mean) << "," << (c.priority.mean ? csv_field(c.priority.ci95) : "") << ","
          << c.priority.samples << ","
          << csv_field(c.regular.mean) << "," << (c.regular.mean ? csv_field(c.regular.ci95) : "") << ","
          << c.regular.samples << ","
          << csv_field(c.ratio()) << ","
          << csv_field(mm1_residence_time(c.arrivalRate, sweep.config.serviceRate)) << "\n";
    }
}

void write_csv_sweep(const string& path, const SweepResult& sweep) {
    write_file(path, [&](ostream& f) { write_csv_sweep(f, sweep); });
}

void write_csv_per_run(ostream& f, const SweepResult& sweep) {
    f << "lambda,f,rep,seed,priority_mean,priority_n,priority_arrived,priority_max,"
         "regular_mean,regular_n,regular_arrived,regular_max,served_total,avg_waiting,util\n";
    for (const SweepCell& c : sweep.cells) {
        for (const RunRecord& run : c.runs) {
            const RunResult& r = run.result;
            f << csv_field(c.arrivalRate) << "," << csv_field(c.fraction) << ","
              << run.rep + 1 << "," << run.seed << ","
              << csv_field(r.meanPriority) << "," << r.priority.completed << ","
              << r.priority.arrived << "," << csv_field(r.priority.maxResidence) << ","
              << csv_field(r.meanRegular) << "," << r.regular.completed << ","
              << r.regular.arrived << "," << csv_field(r.regular.maxResidence) << ","
              << r.servedTotal << "," << csv_field(r.avgWaiting) << "," << csv_field(r.utilization) << "\n";
        }
    }
}

void write_csv_per_run(const string& path, const SweepResult& sweep) {
    write_file(path, [&](ostream& f) { write_csv_per_run(f, sweep); });
}

} // namespace fastpass
