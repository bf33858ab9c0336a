#include "kdf.hpp"
#include "../core/side_channel.hpp"

#include <argon2.h>
#include <openssl/evp.h>

namespace keyward {
namespace crypto {

namespace {

void ensure_supported(KdfAlgorithm algorithm, bool allow_memory_hard) {
    if (algorithm == KdfAlgorithm::ARGON2ID && !allow_memory_hard) {
        throw UnsupportedOperationError(
            "Argon2id is disabled on this device; recover on a different device");
    }
}

Key pbkdf2_sha256(const std::string& passphrase, const Bytes& salt) {
    Key out{};
    if (PKCS5_PBKDF2_HMAC(passphrase.data(), static_cast<int>(passphrase.size()),
                          salt.data(), static_cast<int>(salt.size()),
                          KEYWARD_PBKDF2_ITERATIONS, EVP_sha256(),
                          static_cast<int>(out.size()), out.data()) != 1) {
        throw KeywardError("PBKDF2 failed");
    }
    return out;
}

Key argon2id(const std::string& passphrase, const Bytes& salt) {
    Key out{};
    int rc = argon2id_hash_raw(KEYWARD_ARGON2_T_COST,
                               KEYWARD_ARGON2_M_COST_KIB,
                               KEYWARD_ARGON2_PARALLELISM,
                               passphrase.data(), passphrase.size(),
                               salt.data(), salt.size(),
                               out.data(), out.size());
    if (rc != ARGON2_OK) {
        side_channel::secure_zero_memory(out.data(), out.size());
        throw KeywardError(std::string("Argon2id failed: ") + argon2_error_message(rc));
    }
    return out;
}

} // namespace

const char* kdf_algorithm_name(KdfAlgorithm alg) {
    switch (alg) {
        case KdfAlgorithm::PBKDF2: return "pbkdf2";
        case KdfAlgorithm::ARGON2ID: return "argon2id";
    }
    return "argon2id";
}

KdfAlgorithm parse_kdf_algorithm(const std::string& name) {
    return name == "pbkdf2" ? KdfAlgorithm::PBKDF2 : KdfAlgorithm::ARGON2ID;
}

Key derive_key_from_passphrase(const std::string& passphrase,
                               const Bytes& salt,
                               KdfAlgorithm algorithm,
                               bool allow_memory_hard) {
    ensure_supported(algorithm, allow_memory_hard);
    if (salt.empty()) throw KeywardError("KDF salt must not be empty");

    switch (algorithm) {
        case KdfAlgorithm::PBKDF2: return pbkdf2_sha256(passphrase, salt);
        case KdfAlgorithm::ARGON2ID: return argon2id(passphrase, salt);
    }
    throw KeywardError("unknown KDF algorithm");
}

std::future<Key> derive_key_async(std::string passphrase,
                                  Bytes salt,
                                  KdfAlgorithm algorithm,
                                  bool allow_memory_hard) {
    ensure_supported(algorithm, allow_memory_hard);
    return std::async(std::launch::async,
        [passphrase = std::move(passphrase), salt = std::move(salt), algorithm, allow_memory_hard]() mutable {
            side_channel::SecureWipe<std::string> wipe(passphrase);
            return derive_key_from_passphrase(passphrase, salt, algorithm, allow_memory_hard);
        });
}

} // namespace crypto
} // namespace keyward
