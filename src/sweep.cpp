#include "fastpass/sweep.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <exception>
#include <iomanip>
#include <limits>
#include <mutex>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <thread>

#include "fastpass/simulation_run.hpp"

using namespace std;

namespace fastpass {

optional<double> SweepCell::ratio() const {
    if (!priority.mean || !regular.mean || *priority.mean <= 0.0) return nullopt;
    return *regular.mean / *priority.mean;
}

const SweepCell& SweepResult::at(size_t rateIndex, size_t fractionIndex) const {
    return cells.at(rateIndex * config.fractions.size() + fractionIndex);
}

vector<double> linspace(double first, double last, int count) {
    vector<double> v;
    if (count <= 0) return v;
    if (count == 1) return {first};
    v.reserve(count);
    double step = (last - first) / (count - 1);
    for (int i = 0; i < count; ++i) v.push_back(first + step * i);
    v.back() = last;
    return v;
}

SweepConfig normalized(const SweepConfig& config) {
    SweepConfig c = config;
    if (c.fractions.empty()) c.fractions = linspace(0.0, 0.95, 20);
    if (c.arrivalRates.empty()) throw ConfigurationError("at least one arrival rate is required");
    // recommendations are looked up by rate
    for (size_t i = 0; i < c.arrivalRates.size(); ++i)
        for (size_t j = i + 1; j < c.arrivalRates.size(); ++j)
            if (c.arrivalRates[i] == c.arrivalRates[j]) {
                ostringstream msg;
                msg << "arrival rate " << c.arrivalRates[i] << " appears more than once";
                throw ConfigurationError(msg.str());
            }
    if (c.reps < 1) throw ConfigurationError("reps must be at least 1");
    if (c.threads < 1) throw ConfigurationError("threads must be at least 1");
    if (!(c.policy.mm1Multiple > 0.0)) throw ConfigurationError("threshold multiple must be positive");
    if (c.policy.maxRatio && !(*c.policy.maxRatio > 0.0))
        throw ConfigurationError("max ratio must be positive");

    // every grid point must form a valid run
    for (size_t i = 0; i < c.arrivalRates.size(); ++i)
        for (size_t j = 0; j < c.fractions.size(); ++j)
            validate(run_config(c, i, j, 0));
    return c;
}

RunConfig run_config(const SweepConfig& config, size_t rateIndex, size_t fractionIndex, int rep) {
    size_t k = (rateIndex * config.fractions.size() + fractionIndex) * config.reps + rep;
    RunConfig rc;
    rc.arrivalRate = config.arrivalRates.at(rateIndex);
    rc.serviceRate = config.serviceRate;
    rc.priorityFraction = config.fractions.at(fractionIndex);
    rc.horizon = config.horizon;
    rc.warmup = config.warmup;
    rc.seed = config.seed + k + 1ULL; // ensure different seeds
    return rc;
}

// compute mean and sample standard deviation
pair<double, double> mean_and_sd(const vector<double>& v) {
    size_t n = v.size();
    if (n == 0) return {0.0, 0.0};
    double sum = 0.0;
    for (double x : v) sum += x;
    double mean = sum / n;
    double ssum = 0.0;
    for (double x : v) ssum += (x - mean) * (x - mean);
    double sd = (n > 1) ? sqrt(ssum / (n - 1)) : 0.0;
    return {mean, sd};
}

Estimate estimate(const vector<double>& values) {
    Estimate e;
    e.samples = static_cast<int>(values.size());
    if (values.empty()) return e;
    auto [mean, sd] = mean_and_sd(values);
    e.mean = mean;
    e.ci95 = 1.96 * sd / sqrt(static_cast<double>(values.size()));
    return e;
}

bool acceptable(const SweepCell& cell, double serviceRate, const AcceptancePolicy& policy) {
    if (!cell.priority.mean || !cell.regular.mean) return false;
    // no finite M/M/1 reference for an unstable queue
    double threshold = policy.mm1Multiple * mm1_residence_time(cell.arrivalRate, serviceRate);
    if (!isfinite(threshold) || !(*cell.regular.mean < threshold)) return false;
    if (policy.maxRatio) {
        optional<double> r = cell.ratio();
        if (!r || *r > *policy.maxRatio) return false;
    }
    return true;
}

vector<Recommendation> recommend(const vector<SweepCell>& cells, const SweepConfig& config) {
    vector<Recommendation> out;
    for (double rate : config.arrivalRates) {
        Recommendation rec;
        rec.arrivalRate = rate;
        rec.mm1Time = mm1_residence_time(rate, config.serviceRate);
        for (size_t i = 0; i < cells.size(); ++i) {
            const SweepCell& c = cells[i];
            if (c.arrivalRate != rate || !acceptable(c, config.serviceRate, config.policy)) continue;
            if (!rec.cell || c.fraction > cells[*rec.cell].fraction) rec.cell = i;
        }
        out.push_back(rec);
    }
    return out;
}

SweepResult run_sweep(const SweepConfig& input, ostream* log) {
    SweepResult sweep;
    sweep.config = normalized(input);
    const SweepConfig& cfg = sweep.config;

    size_t nRates = cfg.arrivalRates.size();
    size_t nFractions = cfg.fractions.size();
    size_t nRuns = nRates * nFractions * cfg.reps;

    // one slot per run; each worker only writes the slots it claims
    vector<RunRecord> records(nRuns);
    atomic<size_t> nextRun{0};
    mutex logMutex;
    exception_ptr failure;
    mutex failureMutex;

    auto worker = [&]() {
        while (true) {
            size_t k = nextRun.fetch_add(1);
            if (k >= nRuns) break;
            size_t cell = k / cfg.reps;
            int rep = static_cast<int>(k % cfg.reps);
            RunConfig rc = run_config(cfg, cell / nFractions, cell % nFractions, rep);
            try {
                records[k].seed = rc.seed;
                records[k].rep = rep;
                records[k].result = runSimulation(rc);
            } catch (...) {
                lock_guard<mutex> lock(failureMutex);
                if (!failure) failure = current_exception();
                nextRun = nRuns;
                return;
            }
            if (log) {
                ostringstream line;
                line << "Running simulation with lambda=" << rc.arrivalRate
                     << ", f=" << fixed << setprecision(2) << rc.priorityFraction;
                if (cfg.reps > 1) line << ", rep " << rep + 1 << "/" << cfg.reps;
                line << "\n";
                lock_guard<mutex> lock(logMutex);
                *log << line.str();
            }
        }
    };

    int nThreads = static_cast<int>(min<size_t>(cfg.threads, nRuns));
    if (nThreads <= 1) {
        worker();
    } else {
        vector<thread> workers;
        for (int i = 0; i < nThreads; ++i) workers.emplace_back(worker);
        for (auto& w : workers) w.join();
    }
    if (failure) rethrow_exception(failure);

    sweep.cells.reserve(nRates * nFractions);
    for (size_t i = 0; i < nRates; ++i) {
        for (size_t j = 0; j < nFractions; ++j) {
            SweepCell cell;
            cell.arrivalRate = cfg.arrivalRates[i];
            cell.fraction = cfg.fractions[j];
            vector<double> pr, rg;
            for (int r = 0; r < cfg.reps; ++r) {
                const RunRecord& rec = records[(i * nFractions + j) * cfg.reps + r];
                if (rec.result.meanPriority) pr.push_back(*rec.result.meanPriority);
                if (rec.result.meanRegular) rg.push_back(*rec.result.meanRegular);
                cell.runs.push_back(rec);
            }
            cell.priority = estimate(pr);
            cell.regular = estimate(rg);
            sweep.cells.push_back(move(cell));
        }
    }
    sweep.recommendations = recommend(sweep.cells, cfg);
    return sweep;
}

} // namespace fastpass
