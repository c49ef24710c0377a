#ifndef FASTPASS_EVENT_CLOCK_HPP
#define FASTPASS_EVENT_CLOCK_HPP

#include <cstddef>
#include <cstdint>
#include <queue>
#include <vector>

#include "fastpass/customer.hpp"

namespace fastpass {

/* -------------------------
Event definitions
------------------------- */
enum class EventKind { Departure, Arrival };

const char* to_string(EventKind kind);

struct Event {
    double time = 0.0;
    EventKind kind = EventKind::Arrival;
    std::uint64_t seq = 0;      // insertion order, assigned by the clock
    CustomerId customerId = 0;  // customer in service for departures, 0 for arrivals
};

// priority_queue is a max-heap: "a < b" means a is processed after b.
// earliest time first, then departures before arrivals, then insertion order
struct EventOrder {
    bool operator()(const Event& a, const Event& b) const {
        if (a.time != b.time) return a.time > b.time;
        if (a.kind != b.kind) return a.kind == EventKind::Arrival;
        return a.seq > b.seq;
    }
};

/* -------------------------
Simulated time and the future event list.
While a run is live there is exactly one pending arrival
and at most one pending departure (single server).
------------------------- */
class EventClock {
public:
    void scheduleArrival(double time);
    void scheduleDeparture(double time, CustomerId customer);

    // remove the earliest pending event and move the clock to its time
    Event advance();

    const Event& peek() const;
    bool empty() const { return fel.empty(); }
    std::size_t pending() const { return fel.size(); }
    bool departurePending() const { return pendingDepartures > 0; }
    bool arrivalPending() const { return pendingArrivals > 0; }
    double now() const { return currentTime; }

private:
    void push(double time, EventKind kind, CustomerId customer);

    std::priority_queue<Event, std::vector<Event>, EventOrder> fel;
    double currentTime = 0.0;
    std::uint64_t nextSeq = 0;
    int pendingArrivals = 0;
    int pendingDepartures = 0;
};

} // namespace fastpass

#endif // FASTPASS_EVENT_CLOCK_HPP
