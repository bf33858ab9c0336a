#ifndef KEYWARD_CORE_ERRORS_HPP
#define KEYWARD_CORE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace keyward {

/**
 * @brief Base exception for key-custody errors
 *
 * Thrown directly for malformed encodings (base64, hex, timestamps,
 * truncated envelopes, malformed documents).
 */
class KeywardError : public std::runtime_error {
public:
    explicit KeywardError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief AEAD tag mismatch: wrong key or tampered data
 *
 * Nothing of the ciphertext is ever returned when this is thrown.
 */
class AuthenticationError : public KeywardError {
public:
    explicit AuthenticationError(const std::string& message)
        : KeywardError("Authentication failed: " + message) {}
};

/**
 * @brief Record is not in the status the operation requires
 */
class InvalidStateError : public KeywardError {
public:
    explicit InvalidStateError(const std::string& message)
        : KeywardError("Invalid state: " + message) {}
};

/**
 * @brief Caller lacks the UMK (or the authority) for the operation
 */
class NotAuthorizedError : public KeywardError {
public:
    explicit NotAuthorizedError(const std::string& message)
        : KeywardError("Not authorized: " + message) {}
};

/**
 * @brief Operation not available on this runtime (e.g. Argon2id disabled)
 */
class UnsupportedOperationError : public KeywardError {
public:
    explicit UnsupportedOperationError(const std::string& operation)
        : KeywardError("Operation not supported: " + operation) {}
};

/**
 * @brief Device or recovery record absent
 */
class NotFoundError : public KeywardError {
public:
    explicit NotFoundError(const std::string& what)
        : KeywardError("Not found: " + what) {}
};

/**
 * @brief Transient failure reaching the remote store
 *
 * Never to be read as revocation or denial.
 */
class ConnectivityError : public KeywardError {
public:
    explicit ConnectivityError(const std::string& message)
        : KeywardError("Connectivity failure: " + message) {}
};

} // namespace keyward

#endif // KEYWARD_CORE_ERRORS_HPP
