#ifndef KEYWARD_CRYPTO_FILE_ENVELOPE_HPP
#define KEYWARD_CRYPTO_FILE_ENVELOPE_HPP

#include "primitives.hpp"

namespace keyward {
namespace crypto {

/// nonce (24) + tag (16)
constexpr size_t ENVELOPE_OVERHEAD = NONCE_BYTES + TAG_BYTES;

/**
 * @brief Encrypt a file body: output is nonce || ciphertext || tag
 */
Bytes encrypt_bytes(const Bytes& plaintext, const Key& key);

/**
 * @brief Reverse of encrypt_bytes
 * @throws KeywardError if the input is shorter than ENVELOPE_OVERHEAD
 * @throws AuthenticationError on tag mismatch
 */
Bytes decrypt_bytes(const Bytes& envelope, const Key& key);

/**
 * @brief Heuristic: does this buffer look like an envelope?
 *
 * False for anything shorter than ENVELOPE_OVERHEAD and for buffers that
 * start with a known plaintext media signature (JPEG, PNG, GIF, RIFF
 * WebP/WAV, MP3, MP4/M4A). True otherwise. Used to avoid encrypting a file
 * twice; it is not an integrity check.
 */
bool looks_encrypted(const Bytes& data);

/**
 * @brief Envelope size for a plaintext of n bytes
 */
constexpr size_t encrypted_size(size_t plaintext_size) {
    return plaintext_size + ENVELOPE_OVERHEAD;
}

/**
 * @brief Plaintext size for an envelope of n bytes
 * @throws KeywardError if n < ENVELOPE_OVERHEAD
 */
size_t plaintext_size(size_t envelope_size);

} // namespace crypto
} // namespace keyward

#endif // KEYWARD_CRYPTO_FILE_ENVELOPE_HPP
