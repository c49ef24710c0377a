#ifndef FASTPASS_PRIORITY_QUEUE_HPP
#define FASTPASS_PRIORITY_QUEUE_HPP

#include <cstddef>
#include <deque>
#include <optional>

#include "fastpass/customer.hpp"

namespace fastpass {

/* -------------------------
Waiting line with two FIFO sequences.
Priority head is always served before regular head;
within a class, strict arrival order. Non-preemptive:
customers in service are not held here.
------------------------- */
class PriorityQueue {
public:
    void enqueue(const Customer& customer);
    std::optional<Customer> dequeueNext();

    bool empty() const { return priorityWaiting.empty() && regularWaiting.empty(); }
    std::size_t size() const { return priorityWaiting.size() + regularWaiting.size(); }
    std::size_t size(CustomerClass cls) const;
    bool contains(CustomerId id) const;

private:
    std::deque<Customer> priorityWaiting;
    std::deque<Customer> regularWaiting;
};

} // namespace fastpass

#endif // FASTPASS_PRIORITY_QUEUE_HPP
