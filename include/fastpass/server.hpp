#ifndef FASTPASS_SERVER_HPP
#define FASTPASS_SERVER_HPP

#include <optional>

#include "fastpass/customer.hpp"
#include "fastpass/event_clock.hpp"
#include "fastpass/priority_queue.hpp"
#include "fastpass/random_variates.hpp"

namespace fastpass {

/* -------------------------
Single non-preemptive server.
Pulls from the waiting line by priority discipline and
schedules the departure of the customer it takes.
------------------------- */
class Server {
public:
    Server(EventClock& clock, PriorityQueue& queue, RandomVariateSource& rng, double serviceRate);

    // begin service on the next waiting customer if idle; returns true if service began
    bool tryServe();

    // complete service for the departure event; the server is idle afterwards
    Customer release(const Event& departure);

    bool busy() const { return current.has_value(); }
    const std::optional<Customer>& currentCustomer() const { return current; }

private:
    EventClock& clock;
    PriorityQueue& queue;
    RandomVariateSource& rng;
    double mu;
    std::optional<Customer> current;
};

} // namespace fastpass

#endif // FASTPASS_SERVER_HPP
