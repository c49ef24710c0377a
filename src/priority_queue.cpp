#include "fastpass/priority_queue.hpp"

#include <algorithm>

using namespace std;

namespace fastpass {

void PriorityQueue::enqueue(const Customer& customer) {
    if (customer.cls == CustomerClass::Priority) priorityWaiting.push_back(customer);
    else regularWaiting.push_back(customer);
}

optional<Customer> PriorityQueue::dequeueNext() {
    deque<Customer>* line = nullptr;
    if (!priorityWaiting.empty()) line = &priorityWaiting;
    else if (!regularWaiting.empty()) line = &regularWaiting;
    else return nullopt;

    Customer c = line->front();
    line->pop_front();
    return c;
}

size_t PriorityQueue::size(CustomerClass cls) const {
    return cls == CustomerClass::Priority ? priorityWaiting.size() : regularWaiting.size();
}

bool PriorityQueue::contains(CustomerId id) const {
    auto match = [id](const Customer& c) { return c.id == id; };
    return any_of(priorityWaiting.begin(), priorityWaiting.end(), match)
        || any_of(regularWaiting.begin(), regularWaiting.end(), match);
}

} // namespace fastpass
