#ifndef KEYWARD_STORAGE_LOCAL_KEY_STORE_HPP
#define KEYWARD_STORAGE_LOCAL_KEY_STORE_HPP

#include "key_value_store.hpp"

#include <memory>
#include <optional>
#include <string>

namespace keyward {
namespace storage {

/**
 * @brief Logical key names in the local secure store
 */
namespace keys {
constexpr const char* DEVICE_PRIVATE_KEY = "e2ee_device_private_key";
constexpr const char* DEVICE_PUBLIC_KEY = "e2ee_device_public_key";
constexpr const char* DEVICE_ID = "e2ee_device_id";
constexpr const char* UMK_CACHE = "e2ee_umk_cache";
constexpr const char* REMEMBER_DEVICE = "e2ee_remember_device";
constexpr const char* DEVICE_STATUS = "e2ee_device_status";
constexpr const char* SIGN_IN_PROGRESS = "e2ee_sign_in_progress";
} // namespace keys

/**
 * @brief Cached device status values ("last known good" fast path)
 */
namespace cached_status {
constexpr const char* APPROVED = "approved";
constexpr const char* PENDING = "pending";
constexpr const char* REVOKED = "revoked";
constexpr const char* NEEDS_RECOVERY = "needs_recovery";
} // namespace cached_status

/**
 * @brief Typed access to this device's secrets and cached trust state
 *
 * Byte values are stored as base64 text.
 */
class LocalKeyStore {
public:
    explicit LocalKeyStore(std::shared_ptr<KeyValueStore> backend);

    void store_device_private_key(const crypto::PrivateKey& key);
    std::optional<crypto::PrivateKey> device_private_key();

    void store_device_public_key(const crypto::PublicKey& key);
    std::optional<crypto::PublicKey> device_public_key();

    void store_device_id(const std::string& id);
    std::optional<std::string> device_id();

    void cache_umk(const crypto::Key& umk);
    std::optional<crypto::Key> cached_umk();
    void clear_cached_umk();

    /// Defaults to true when never set
    void set_remember_device(bool remember);
    bool remember_device();

    void cache_device_status(const std::string& status);
    std::optional<std::string> cached_device_status();
    void clear_device_status();

    /// Set while a sign-in is running; still set at startup means it was interrupted
    void set_sign_in_progress(bool in_progress);
    bool sign_in_interrupted();

    /**
     * @brief Remove every key listed in keys::
     */
    void clear_all();

    /**
     * @brief Private key, public key and device id all present
     */
    bool has_device_keys();

private:
    template <size_t N>
    std::optional<std::array<uint8_t, N>> get_fixed(const char* key);
    template <size_t N>
    void put_fixed(const char* key, const std::array<uint8_t, N>& value);

    std::shared_ptr<KeyValueStore> backend_;
};

} // namespace storage
} // namespace keyward

#endif // KEYWARD_STORAGE_LOCAL_KEY_STORE_HPP
