#ifndef FASTPASS_SIMULATION_RUN_HPP
#define FASTPASS_SIMULATION_RUN_HPP

#include <cstdint>
#include <functional>
#include <utility>

#include "fastpass/arrival_process.hpp"
#include "fastpass/config.hpp"
#include "fastpass/customer.hpp"
#include "fastpass/event_clock.hpp"
#include "fastpass/priority_queue.hpp"
#include "fastpass/random_variates.hpp"
#include "fastpass/server.hpp"
#include "fastpass/statistics.hpp"

namespace fastpass {

enum class RunState { Initialized, Running, Completed };

/* -------------------------
One full run for a given (lambda, f) pair.
Owns all mutable state of the run.
------------------------- */
class SimulationRun {
public:
    using EventObserver = std::function<void(const Event&)>;
    using DepartureObserver = std::function<void(const Customer&)>;

    // throws ConfigurationError; schedules the first arrival
    explicit SimulationRun(const RunConfig& config);

    SimulationRun(const SimulationRun&) = delete;
    SimulationRun& operator=(const SimulationRun&) = delete;

    // process the next event if it lies within the horizon;
    // returns false once the run has completed
    bool step();

    RunResult run();

    // valid only once completed
    RunResult result() const;

    void onEvent(EventObserver observer) { eventObserver = std::move(observer); }
    void onDeparture(DepartureObserver observer) { departureObserver = std::move(observer); }

    RunState state() const { return runState; }
    const EventClock& clock() const { return eventClock; }
    const PriorityQueue& queue() const { return waiting; }
    const Server& server() const { return srv; }

private:
    void dispatch(const Event& e);
    void handleArrival(const Event& e);
    void handleDeparture(const Event& e);
    void complete();

    RunConfig cfg;
    RunState runState = RunState::Initialized;
    RandomVariateSource rng;
    EventClock eventClock;
    PriorityQueue waiting;
    Server srv;
    ArrivalProcess arrivals;
    StatisticsCollector stats;
    std::uint64_t eventsProcessed = 0;
    EventObserver eventObserver;
    DepartureObserver departureObserver;
};

RunResult runSimulation(const RunConfig& config);

RunResult runSimulation(double arrivalRate, double serviceRate, double priorityFraction,
                        double horizonMinutes, double warmupMinutes, std::uint64_t seed);

} // namespace fastpass

#endif // FASTPASS_SIMULATION_RUN_HPP
