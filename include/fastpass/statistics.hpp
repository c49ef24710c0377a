#ifndef FASTPASS_STATISTICS_HPP
#define FASTPASS_STATISTICS_HPP

#include <cstddef>
#include <cstdint>
#include <optional>

#include "fastpass/customer.hpp"

namespace fastpass {

// residence-time tally for one customer class
struct ClassStats {
    std::uint64_t arrived = 0;      // all arrivals, warm-up included
    std::uint64_t completed = 0;    // departures after warm-up
    double totalResidence = 0.0;
    double maxResidence = 0.0;

    // empty when no customer of this class departed after warm-up
    std::optional<double> mean() const;
};

struct RunResult {
    std::optional<double> meanPriority;
    std::optional<double> meanRegular;
    ClassStats priority;
    ClassStats regular;
    std::uint64_t servedTotal = 0;      // departures including warm-up
    std::uint64_t eventsProcessed = 0;
    double avgWaiting = 0.0;            // time-averaged number waiting over (warmup, horizon]
    double utilization = 0.0;           // fraction of (warmup, horizon] the server was busy
};

/* -------------------------
Statistics collector.
Departures at or before the warm-up boundary still count
toward servedTotal but never toward the class tallies.
------------------------- */
class StatisticsCollector {
public:
    explicit StatisticsCollector(double warmup);

    // returns true if the customer counted toward its class average
    bool record(const Customer& customer);

    void countArrival(CustomerClass cls);

    // integrate queue length and server state from the last observation up to now
    void observe(double now, std::size_t waiting, bool busy);

    // extend the integrals to the end of the observation window
    void close(double horizon, std::size_t waiting, bool busy);

    const ClassStats& forClass(CustomerClass cls) const;
    std::uint64_t servedTotal() const { return served; }

    RunResult snapshot() const;

private:
    double warmup;
    ClassStats priority;
    ClassStats regular;
    std::uint64_t served = 0;

    double lastEventTime = 0.0;
    double areaNumWaiting = 0.0;
    double areaServerBusy = 0.0;
    double observedUntil = 0.0;
};

} // namespace fastpass

#endif // FASTPASS_STATISTICS_HPP
