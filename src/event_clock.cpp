#include "fastpass/event_clock.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>

using namespace std;

namespace fastpass {

const char* to_string(EventKind kind) {
    switch (kind) {
    case EventKind::Departure: return "departure";
    case EventKind::Arrival: return "arrival";
    }
    return "unknown";
}

void EventClock::push(double time, EventKind kind, CustomerId customer) {
    if (!isfinite(time) || time < currentTime) {
        ostringstream msg;
        msg << "cannot schedule " << to_string(kind) << " at t=" << time << " (now=" << currentTime << ")";
        throw logic_error(msg.str());
    }
    fel.push({time, kind, nextSeq++, customer});
}

void EventClock::scheduleArrival(double time) {
    if (pendingArrivals > 0) throw logic_error("an arrival is already pending");
    push(time, EventKind::Arrival, 0);
    ++pendingArrivals;
}

void EventClock::scheduleDeparture(double time, CustomerId customer) {
    if (pendingDepartures > 0) throw logic_error("a departure is already pending (single server)");
    push(time, EventKind::Departure, customer);
    ++pendingDepartures;
}

const Event& EventClock::peek() const {
    if (fel.empty()) throw logic_error("peek on an empty event list");
    return fel.top();
}

Event EventClock::advance() {
    if (fel.empty()) throw logic_error("advance on an empty event list");
    Event e = fel.top();
    fel.pop();
    if (e.kind == EventKind::Arrival) --pendingArrivals;
    else --pendingDepartures;
    currentTime = e.time;
    return e;
}

} // namespace fastpass
