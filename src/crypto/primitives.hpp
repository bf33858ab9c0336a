#ifndef KEYWARD_CRYPTO_PRIMITIVES_HPP
#define KEYWARD_CRYPTO_PRIMITIVES_HPP

#include "../core/encoding.hpp"
#include "../core/errors.hpp"
#include "../keyward_config.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <string>
#include <vector>
#include <sodium.h>

namespace keyward {
namespace crypto {

constexpr size_t KEY_BYTES = crypto_aead_xchacha20poly1305_ietf_KEYBYTES;     // 32
constexpr size_t NONCE_BYTES = crypto_aead_xchacha20poly1305_ietf_NPUBBYTES;  // 24
constexpr size_t TAG_BYTES = crypto_aead_xchacha20poly1305_ietf_ABYTES;       // 16
constexpr size_t PUBLIC_KEY_BYTES = crypto_box_PUBLICKEYBYTES;
constexpr size_t PRIVATE_KEY_BYTES = crypto_box_SECRETKEYBYTES;
constexpr size_t SALT_BYTES = KEYWARD_SALT_BYTES;
constexpr size_t UMK_BYTES = KEYWARD_UMK_BYTES;

static_assert(UMK_BYTES == KEY_BYTES, "UMK must be usable as an AEAD key");
static_assert(crypto_scalarmult_BYTES == KEY_BYTES, "ECDH output is used as an AEAD key");

using Key = std::array<uint8_t, KEY_BYTES>;
using Nonce = std::array<uint8_t, NONCE_BYTES>;
using PublicKey = std::array<uint8_t, PUBLIC_KEY_BYTES>;
using PrivateKey = std::array<uint8_t, PRIVATE_KEY_BYTES>;

struct X25519KeyPair {
    PublicKey pk{};
    PrivateKey sk{};
};

/**
 * @brief AEAD output: fresh nonce plus ciphertext with the 16-byte tag appended
 */
struct AeadResult {
    Nonce nonce{};
    Bytes ciphertext;  ///< ciphertext || tag
};

/**
 * @brief String wire form: base64(ciphertext || tag) and base64(nonce)
 */
struct SealedString {
    std::string ciphertext;
    std::string nonce;
};

/**
 * @brief Initialise libsodium
 * @throws KeywardError if sodium_init fails
 */
void check_sodium();

/**
 * @brief XChaCha20-Poly1305 encryption under a 256-bit key
 *
 * A 192-bit nonce is drawn from the CSPRNG on every call.
 */
AeadResult aead_encrypt(const Bytes& plaintext, const Key& key);

/**
 * @brief Reverse of aead_encrypt
 * @throws AuthenticationError if the tag does not verify (wrong key or tampering)
 */
Bytes aead_decrypt(const Bytes& ciphertext, const Nonce& nonce, const Key& key);

/**
 * @brief Encrypt UTF-8 text into the base64 string wire form
 */
SealedString seal_string(const std::string& text, const Key& key);

/**
 * @brief Decrypt the base64 string wire form
 * @throws AuthenticationError on tag mismatch
 * @throws KeywardError on malformed base64 or nonce length
 */
std::string open_string(const std::string& ciphertext_b64,
                        const std::string& nonce_b64,
                        const Key& key);

/**
 * @brief Generate an X25519 key pair
 */
X25519KeyPair x25519_generate();

/**
 * @brief Raw X25519 ECDH
 *
 * The 32-byte result is used directly as an AEAD key; no KDF is applied so
 * that wraps stay interoperable with existing device records.
 * @throws AuthenticationError if the peer key is a low-order point
 */
Key x25519_shared_secret(const PrivateKey& private_key, const PublicKey& public_key);

/**
 * @brief Derive the public key belonging to a private key
 */
PublicKey x25519_public_from_private(const PrivateKey& private_key);

Bytes generate_random(size_t n);
Bytes generate_salt();
Key generate_umk();

/**
 * @brief Copy a byte buffer into a fixed-size array
 * @throws KeywardError on size mismatch
 */
template <size_t N>
std::array<uint8_t, N> to_array(const Bytes& bytes, const char* what) {
    if (bytes.size() != N) {
        throw KeywardError(std::string(what) + ": expected " + std::to_string(N) +
                           " bytes, got " + std::to_string(bytes.size()));
    }
    std::array<uint8_t, N> out{};
    std::copy(bytes.begin(), bytes.end(), out.begin());
    return out;
}

} // namespace crypto
} // namespace keyward

#endif // KEYWARD_CRYPTO_PRIMITIVES_HPP
