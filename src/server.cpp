#include "fastpass/server.hpp"

#include <sstream>
#include <stdexcept>
#include <utility>

using namespace std;

namespace fastpass {

Server::Server(EventClock& clock, PriorityQueue& queue, RandomVariateSource& rng, double serviceRate)
    : clock(clock), queue(queue), rng(rng), mu(serviceRate) {}

bool Server::tryServe() {
    if (busy()) return false;

    optional<Customer> next = queue.dequeueNext();
    if (!next) return false;

    double now = clock.now();
    next->serviceStartTime = now;
    double serviceTime = rng.nextServiceTime(mu);
    clock.scheduleDeparture(now + serviceTime, next->id);
    current = std::move(next);
    return true;
}

Customer Server::release(const Event& departure) {
    if (departure.kind != EventKind::Departure)
        throw logic_error("server released by a non-departure event");
    if (!current)
        throw logic_error("departure while the server is idle");
    if (current->id != departure.customerId) {
        ostringstream msg;
        msg << "departure for customer " << departure.customerId
            << " but customer " << current->id << " is in service";
        throw logic_error(msg.str());
    }

    Customer done = *current;
    current.reset();
    done.departureTime = clock.now();
    return done;
}

} // namespace fastpass
