#ifndef KEYWARD_CRYPTO_KDF_HPP
#define KEYWARD_CRYPTO_KDF_HPP

#include "primitives.hpp"

#include <future>
#include <string>

namespace keyward {
namespace crypto {

/**
 * @brief Passphrase KDFs understood by recovery records
 */
enum class KdfAlgorithm {
    PBKDF2,    ///< PBKDF2-HMAC-SHA256, 310000 iterations (portable default)
    ARGON2ID   ///< Argon2id t=3, m=64 MiB, p=4 (memory-hard, legacy)
};

/**
 * @brief Wire name: "pbkdf2" or "argon2id"
 */
const char* kdf_algorithm_name(KdfAlgorithm alg);

/**
 * @brief Parse a wire name
 *
 * Any name other than "pbkdf2" maps to Argon2id, the algorithm records
 * used before the field existed.
 */
KdfAlgorithm parse_kdf_algorithm(const std::string& name);

/**
 * @brief Algorithm used for newly created recovery keys
 */
constexpr KdfAlgorithm current_default_algorithm() {
    return KdfAlgorithm::PBKDF2;
}

/**
 * @brief Derive a 32-byte key from a passphrase
 * @param allow_memory_hard false on memory-constrained targets
 * @throws UnsupportedOperationError for Argon2id when allow_memory_hard is false
 * @throws KeywardError if the underlying library fails
 *
 * Pure function of (passphrase, salt, algorithm). Argon2id takes noticeable
 * time and 64 MiB; call it through derive_key_async.
 */
Key derive_key_from_passphrase(const std::string& passphrase,
                               const Bytes& salt,
                               KdfAlgorithm algorithm,
                               bool allow_memory_hard = KEYWARD_ALLOW_MEMORY_HARD_KDF);

/**
 * @brief Run derive_key_from_passphrase on a worker thread
 *
 * The support check happens before the thread is started, so an
 * unsupported request throws from the call itself.
 */
std::future<Key> derive_key_async(std::string passphrase,
                                  Bytes salt,
                                  KdfAlgorithm algorithm,
                                  bool allow_memory_hard = KEYWARD_ALLOW_MEMORY_HARD_KDF);

} // namespace crypto
} // namespace keyward

#endif // KEYWARD_CRYPTO_KDF_HPP
