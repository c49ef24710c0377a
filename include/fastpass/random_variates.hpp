#ifndef FASTPASS_RANDOM_VARIATES_HPP
#define FASTPASS_RANDOM_VARIATES_HPP

#include <cstdint>
#include <random>

namespace fastpass {

/* -------------------------
RNG wrapper
- one instance per run, never shared between runs
- exponential draws are always strictly positive
------------------------- */
class RandomVariateSource {
public:
    explicit RandomVariateSource(std::uint64_t seed);

    // interarrival duration for arrival rate lambda
    double nextInterarrival(double lambda);

    // service duration for service rate mu
    double nextServiceTime(double mu);

    // one Bernoulli trial: true with probability f
    bool nextIsPriority(double f);

private:
    double exp_sample_rate(double rate);

    std::mt19937_64 gen;
};

} // namespace fastpass

#endif // FASTPASS_RANDOM_VARIATES_HPP
