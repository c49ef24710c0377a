#include "fastpass/random_variates.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

using namespace std;

namespace fastpass {

RandomVariateSource::RandomVariateSource(uint64_t seed)
    : gen(seed) {}

double RandomVariateSource::exp_sample_rate(double rate) {
    if (!(rate > 0.0) || !isfinite(rate))
        throw invalid_argument("exponential rate must be positive and finite, got " + to_string(rate));
    exponential_distribution<double> d(rate);
    double x = d(gen);
    // -log(1 - u) is exactly 0 when u == 0
    while (x <= 0.0) x = d(gen);
    return x;
}

double RandomVariateSource::nextInterarrival(double lambda) {
    return exp_sample_rate(lambda);
}

double RandomVariateSource::nextServiceTime(double mu) {
    return exp_sample_rate(mu);
}

bool RandomVariateSource::nextIsPriority(double f) {
    uniform_real_distribution<double> u(0.0, 1.0);
    return u(gen) < f;
}

} // namespace fastpass
