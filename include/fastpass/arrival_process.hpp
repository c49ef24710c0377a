#ifndef FASTPASS_ARRIVAL_PROCESS_HPP
#define FASTPASS_ARRIVAL_PROCESS_HPP

#include <cstdint>

#include "fastpass/customer.hpp"
#include "fastpass/event_clock.hpp"
#include "fastpass/priority_queue.hpp"
#include "fastpass/random_variates.hpp"

namespace fastpass {

// Poisson arrivals, each independently classified as priority with probability f.
class ArrivalProcess {
public:
    ArrivalProcess(EventClock& clock, PriorityQueue& queue, RandomVariateSource& rng,
                   double arrivalRate, double priorityFraction);

    // schedule the first arrival
    void start();

    // create, classify and enqueue the arriving customer, then schedule the next arrival
    const Customer& handleArrival(const Event& arrival);

    std::uint64_t arrived() const { return nextId - 1; }

private:
    EventClock& clock;
    PriorityQueue& queue;
    RandomVariateSource& rng;
    double lambda;
    double f;
    CustomerId nextId = 1;
    Customer last;
};

} // namespace fastpass

#endif // FASTPASS_ARRIVAL_PROCESS_HPP
