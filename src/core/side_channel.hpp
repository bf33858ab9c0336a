#ifndef KEYWARD_CORE_SIDE_CHANNEL_HPP
#define KEYWARD_CORE_SIDE_CHANNEL_HPP

#include <cstddef>
#include <cstdint>
#include <string>

namespace keyward {
namespace side_channel {

/**
 * @brief Constant-time comparison to prevent timing attacks
 * @param a First buffer
 * @param b Second buffer
 * @param len Length of buffers
 * @return true if buffers are equal, false otherwise
 * @note Uses libsodium's hardened memcmp (sodium_memcmp)
 */
bool constant_time_compare(const uint8_t* a, const uint8_t* b, size_t len);

/**
 * @brief Constant-time equality of two byte containers
 *
 * Size mismatch returns false without touching the contents.
 */
template <typename A, typename B>
bool constant_time_equal(const A& a, const B& b) {
    if (a.size() != b.size()) return false;
    return constant_time_compare(reinterpret_cast<const uint8_t*>(a.data()),
                                 reinterpret_cast<const uint8_t*>(b.data()),
                                 a.size());
}

/**
 * @brief Memory zeroing the compiler cannot elide
 * @note Uses sodium_memzero
 */
void secure_zero_memory(void* ptr, size_t len);

/**
 * @brief Wipe a std::string holding secret text (passphrase, base64 key)
 */
void secure_zero_string(std::string& s);

/**
 * @brief Zeroes a buffer when leaving scope
 *
 * Holds a reference; the buffer must outlive the guard.
 */
template <typename Container>
class SecureWipe {
public:
    explicit SecureWipe(Container& c) : c_(c) {}
    ~SecureWipe() { secure_zero_memory(c_.data(), c_.size() * sizeof(*c_.data())); }

    SecureWipe(const SecureWipe&) = delete;
    SecureWipe& operator=(const SecureWipe&) = delete;

private:
    Container& c_;
};

} // namespace side_channel
} // namespace keyward

#endif // KEYWARD_CORE_SIDE_CHANNEL_HPP
