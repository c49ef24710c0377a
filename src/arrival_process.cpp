#include "fastpass/arrival_process.hpp"

#include <stdexcept>

using namespace std;

namespace fastpass {

ArrivalProcess::ArrivalProcess(EventClock& clock, PriorityQueue& queue, RandomVariateSource& rng,
                               double arrivalRate, double priorityFraction)
    : clock(clock), queue(queue), rng(rng), lambda(arrivalRate), f(priorityFraction) {}

void ArrivalProcess::start() {
    clock.scheduleArrival(clock.now() + rng.nextInterarrival(lambda));
}

const Customer& ArrivalProcess::handleArrival(const Event& arrival) {
    if (arrival.kind != EventKind::Arrival)
        throw logic_error("arrival process handed a non-arrival event");

    double now = clock.now();
    last = Customer{};
    last.id = nextId++;
    last.cls = rng.nextIsPriority(f) ? CustomerClass::Priority : CustomerClass::Regular;
    last.arrivalTime = now;

    queue.enqueue(last);
    clock.scheduleArrival(now + rng.nextInterarrival(lambda));
    return last;
}

} // namespace fastpass
