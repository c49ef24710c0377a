#include "fastpass/simulation_run.hpp"

#include <stdexcept>

using namespace std;

namespace fastpass {

namespace {

const RunConfig& checked(const RunConfig& config) {
    validate(config);
    return config;
}

} // namespace

SimulationRun::SimulationRun(const RunConfig& config)
    : cfg(checked(config)),
      rng(cfg.seed),
      srv(eventClock, waiting, rng, cfg.serviceRate),
      arrivals(eventClock, waiting, rng, cfg.arrivalRate, cfg.priorityFraction),
      stats(cfg.warmup)
{
    arrivals.start();
}

bool SimulationRun::step() {
    if (runState == RunState::Completed)
        throw logic_error("simulation run already completed");

    // the first event past the horizon is left unprocessed
    if (eventClock.empty() || eventClock.peek().time > cfg.horizon) {
        complete();
        return false;
    }

    runState = RunState::Running;
    Event e = eventClock.advance();
    stats.observe(e.time, waiting.size(), srv.busy());
    dispatch(e);
    ++eventsProcessed;
    if (eventObserver) eventObserver(e);
    return true;
}

RunResult SimulationRun::run() {
    while (step()) {}
    return result();
}

RunResult SimulationRun::result() const {
    if (runState != RunState::Completed)
        throw logic_error("simulation run has not completed");
    RunResult r = stats.snapshot();
    r.eventsProcessed = eventsProcessed;
    return r;
}

void SimulationRun::dispatch(const Event& e) {
    if (e.kind == EventKind::Arrival) handleArrival(e);
    else handleDeparture(e);
}

void SimulationRun::handleArrival(const Event& e) {
    const Customer& c = arrivals.handleArrival(e);
    stats.countArrival(c.cls);
    if (!srv.busy()) srv.tryServe();
}

void SimulationRun::handleDeparture(const Event& e) {
    Customer done = srv.release(e);
    stats.record(done);
    if (departureObserver) departureObserver(done);
    // work-conserving: never idle while someone is waiting
    srv.tryServe();
}

void SimulationRun::complete() {
    stats.close(cfg.horizon, waiting.size(), srv.busy());
    runState = RunState::Completed;
}

RunResult runSimulation(const RunConfig& config) {
    SimulationRun sim(config);
    return sim.run();
}

RunResult runSimulation(double arrivalRate, double serviceRate, double priorityFraction,
                        double horizonMinutes, double warmupMinutes, uint64_t seed) {
    RunConfig config;
    config.arrivalRate = arrivalRate;
    config.serviceRate = serviceRate;
    config.priorityFraction = priorityFraction;
    config.horizon = horizonMinutes;
    config.warmup = warmupMinutes;
    config.seed = seed;
    return runSimulation(config);
}

} // namespace fastpass
