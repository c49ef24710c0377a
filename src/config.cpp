#include "fastpass/config.hpp"

#include <cmath>
#include <limits>
#include <sstream>

using namespace std;

namespace fastpass {

namespace {

void require_positive(const char* name, double v) {
    if (!isfinite(v) || v <= 0.0) {
        ostringstream msg;
        msg << name << " must be positive and finite, got " << v;
        throw ConfigurationError(msg.str());
    }
}

} // namespace

void validate(const RunConfig& config) {
    require_positive("arrival rate", config.arrivalRate);
    require_positive("service rate", config.serviceRate);
    require_positive("horizon", config.horizon);

    double f = config.priorityFraction;
    if (!(f >= 0.0 && f < 1.0)) {
        ostringstream msg;
        msg << "priority fraction must be in [0,1), got " << f;
        throw ConfigurationError(msg.str());
    }
    if (!isfinite(config.warmup) || config.warmup < 0.0) {
        ostringstream msg;
        msg << "warmup must be non-negative, got " << config.warmup;
        throw ConfigurationError(msg.str());
    }
    if (config.warmup >= config.horizon) {
        ostringstream msg;
        msg << "warmup (" << config.warmup << ") must be shorter than the horizon (" << config.horizon << ")";
        throw ConfigurationError(msg.str());
    }
}

double mm1_residence_time(double arrivalRate, double serviceRate) {
    if (arrivalRate >= serviceRate) return numeric_limits<double>::infinity();
    return 1.0 / (serviceRate - arrivalRate);
}

} // namespace fastpass
