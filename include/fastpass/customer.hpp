#ifndef FASTPASS_CUSTOMER_HPP
#define FASTPASS_CUSTOMER_HPP

#include <cstdint>

namespace fastpass {

enum class CustomerClass { Priority, Regular };

const char* to_string(CustomerClass cls);

using CustomerId = std::uint64_t;

struct Customer {
    CustomerId id = 0;                      // 1, 2, 3, ... in arrival order within a run
    CustomerClass cls = CustomerClass::Regular;
    double arrivalTime = 0.0;
    double serviceStartTime = -1.0;         // -1 until service begins
    double departureTime = -1.0;            // -1 until service completes

    bool departed() const { return departureTime >= 0.0; }

    // waiting + service; only meaningful once departed
    double residenceTime() const { return departureTime - arrivalTime; }
};

} // namespace fastpass

#endif // FASTPASS_CUSTOMER_HPP
