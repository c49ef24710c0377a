#ifndef FASTPASS_CONFIG_HPP
#define FASTPASS_CONFIG_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace fastpass {

// invalid run or sweep parameters; raised before any event is scheduled
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& what) : std::invalid_argument(what) {}
};

/* -------------------------
Params for one run (minutes, customers per minute)
------------------------- */
struct RunConfig {
    double arrivalRate = 0.5;       // lambda
    double serviceRate = 1.0;       // mu
    double priorityFraction = 0.0;  // f in [0,1)
    double horizon = 50000.0;       // total simulated minutes
    double warmup = 5000.0;         // minutes excluded from statistics
    std::uint64_t seed = 42;
};

// throws ConfigurationError; never clamps
void validate(const RunConfig& config);

// M/M/1 mean residence time 1/(mu - lambda); infinite when lambda >= mu
double mm1_residence_time(double arrivalRate, double serviceRate);

} // namespace fastpass

#endif // FASTPASS_CONFIG_HPP
