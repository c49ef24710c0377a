#ifndef FASTPASS_SWEEP_HPP
#define FASTPASS_SWEEP_HPP

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <utility>
#include <vector>

#include "fastpass/config.hpp"
#include "fastpass/statistics.hpp"

namespace fastpass {

/* -------------------------
Acceptability rule for picking a recommended fraction.
A cell passes when both class means are defined,
regular < mm1Multiple * 1/(mu - lambda), and, if set,
regular / priority <= maxRatio.
------------------------- */
struct AcceptancePolicy {
    double mm1Multiple = 2.5;
    std::optional<double> maxRatio;
};

struct SweepConfig {
    std::vector<double> arrivalRates{0.5, 0.95};
    std::vector<double> fractions;          // empty: linspace(0, 0.95, 20)
    double serviceRate = 1.0;
    double horizon = 50000.0;
    double warmup = 5000.0;
    std::uint64_t seed = 42;
    int reps = 1;
    int threads = 1;
    AcceptancePolicy policy;
};

// mean over replications with a defined value, 95% half-width
struct Estimate {
    std::optional<double> mean;
    double ci95 = 0.0;
    int samples = 0;
};

struct RunRecord {
    std::uint64_t seed = 0;
    int rep = 0;
    RunResult result;
};

struct SweepCell {
    double arrivalRate = 0.0;
    double fraction = 0.0;
    std::vector<RunRecord> runs;
    Estimate priority;
    Estimate regular;

    // regular / priority, empty when either mean is undefined
    std::optional<double> ratio() const;
};

struct Recommendation {
    double arrivalRate = 0.0;
    double mm1Time = 0.0;
    std::optional<std::size_t> cell;    // index into SweepResult::cells
};

struct SweepResult {
    SweepConfig config;
    std::vector<SweepCell> cells;       // row-major: rate, then fraction
    std::vector<Recommendation> recommendations;

    const SweepCell& at(std::size_t rateIndex, std::size_t fractionIndex) const;
};

std::vector<double> linspace(double first, double last, int count);

// throws ConfigurationError; fills in the default fraction grid
SweepConfig normalized(const SweepConfig& config);

// the RunConfig of run number k (row-major over rate, fraction, rep)
RunConfig run_config(const SweepConfig& config, std::size_t rateIndex, std::size_t fractionIndex, int rep);

Estimate estimate(const std::vector<double>& values);

std::pair<double, double> mean_and_sd(const std::vector<double>& v);

bool acceptable(const SweepCell& cell, double serviceRate, const AcceptancePolicy& policy);

// largest acceptable fraction for each arrival rate
std::vector<Recommendation> recommend(const std::vector<SweepCell>& cells, const SweepConfig& config);

// progress lines go to log when non-null
SweepResult run_sweep(const SweepConfig& config, std::ostream* log = nullptr);

} // namespace fastpass

#endif // FASTPASS_SWEEP_HPP
