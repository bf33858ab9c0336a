#ifndef KEYWARD_CORE_ENCODING_HPP
#define KEYWARD_CORE_ENCODING_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace keyward {

using Bytes = std::vector<uint8_t>;
using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Standard base64 (RFC 4648 alphabet, padded)
 */
std::string base64_encode(const uint8_t* data, size_t len);
std::string base64_encode(const Bytes& data);

/**
 * @brief Decode standard base64
 * @throws KeywardError on malformed input
 */
Bytes base64_decode(const std::string& text);

/**
 * @brief Lowercase hex
 */
std::string hex_encode(const uint8_t* data, size_t len);

/**
 * @throws KeywardError on odd length or non-hex characters
 */
Bytes hex_decode(const std::string& hex);

/**
 * @brief Random RFC 4122 version-4 UUID (lowercase, hyphenated)
 */
std::string uuid_v4();

/**
 * @brief ISO-8601 UTC with millisecond precision, e.g. 2025-03-01T08:15:30.250Z
 */
std::string format_iso8601(Timestamp t);

/**
 * @brief Parse an ISO-8601 timestamp
 *
 * Accepts an optional fractional part and an optional `Z` or `+HH:MM`
 * suffix. A value without suffix is read as UTC.
 * @throws KeywardError on malformed input
 */
Timestamp parse_iso8601(const std::string& text);

/**
 * @brief Milliseconds since the Unix epoch
 */
int64_t to_unix_millis(Timestamp t);

} // namespace keyward

#endif // KEYWARD_CORE_ENCODING_HPP
