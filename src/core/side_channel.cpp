#include "side_channel.hpp"
#include <sodium.h>

namespace keyward {
namespace side_channel {

bool constant_time_compare(const uint8_t* a, const uint8_t* b, size_t len) {
    if (len == 0) return true;
    return sodium_memcmp(a, b, len) == 0;
}

void secure_zero_memory(void* ptr, size_t len) {
    if (ptr == nullptr || len == 0) return;
    sodium_memzero(ptr, len);
}

void secure_zero_string(std::string& s) {
    // Only size() bytes are reachable; earlier reallocations are out of reach
    if (!s.empty()) {
        sodium_memzero(&s[0], s.size());
    }
    s.clear();
}

} // namespace side_channel
} // namespace keyward
