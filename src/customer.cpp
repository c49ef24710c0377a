#include "fastpass/customer.hpp"

namespace fastpass {

const char* to_string(CustomerClass cls) {
    switch (cls) {
    case CustomerClass::Priority: return "priority";
    case CustomerClass::Regular: return "regular";
    }
    return "unknown";
}

} // namespace fastpass
