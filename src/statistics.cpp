#include "fastpass/statistics.hpp"

#include <algorithm>
#include <stdexcept>

using namespace std;

namespace fastpass {

optional<double> ClassStats::mean() const {
    if (completed == 0) return nullopt;
    return totalResidence / static_cast<double>(completed);
}

StatisticsCollector::StatisticsCollector(double warmup)
    : warmup(warmup), lastEventTime(warmup), observedUntil(warmup) {}

bool StatisticsCollector::record(const Customer& customer) {
    if (!customer.departed())
        throw logic_error("recording a customer that has not departed");

    ++served;
    if (customer.departureTime <= warmup) return false;

    ClassStats& s = customer.cls == CustomerClass::Priority ? priority : regular;
    double residence = customer.residenceTime();
    s.completed++;
    s.totalResidence += residence;
    s.maxResidence = max(s.maxResidence, residence);
    return true;
}

void StatisticsCollector::countArrival(CustomerClass cls) {
    if (cls == CustomerClass::Priority) priority.arrived++;
    else regular.arrived++;
}

void StatisticsCollector::observe(double now, size_t waiting, bool busy) {
    // only the part of [lastEventTime, now] after warm-up is integrated
    if (now <= lastEventTime) return;
    double dt = now - lastEventTime;
    areaNumWaiting += static_cast<double>(waiting) * dt;
    areaServerBusy += (busy ? 1.0 : 0.0) * dt;
    lastEventTime = now;
    observedUntil = now;
}

void StatisticsCollector::close(double horizon, size_t waiting, bool busy) {
    observe(horizon, waiting, busy);
}

const ClassStats& StatisticsCollector::forClass(CustomerClass cls) const {
    return cls == CustomerClass::Priority ? priority : regular;
}

RunResult StatisticsCollector::snapshot() const {
    RunResult r;
    r.priority = priority;
    r.regular = regular;
    r.meanPriority = priority.mean();
    r.meanRegular = regular.mean();
    r.servedTotal = served;
    double window = observedUntil - warmup;
    r.avgWaiting = (window > 0) ? (areaNumWaiting / window) : 0.0;
    r.utilization = (window > 0) ? (areaServerBusy / window) : 0.0;
    return r;
}

} // namespace fastpass
