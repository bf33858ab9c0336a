#include "local_key_store.hpp"
#include "../core/side_channel.hpp"

namespace keyward {
namespace storage {

LocalKeyStore::LocalKeyStore(std::shared_ptr<KeyValueStore> backend)
    : backend_(std::move(backend)) {
    if (!backend_) throw KeywardError("local key store backend cannot be null");
}

template <size_t N>
std::optional<std::array<uint8_t, N>> LocalKeyStore::get_fixed(const char* key) {
    auto text = backend_->get(key);
    if (!text) return std::nullopt;
    auto raw = base64_decode(*text);
    side_channel::secure_zero_string(*text);
    side_channel::SecureWipe<Bytes> wipe(raw);
    return crypto::to_array<N>(raw, key);
}

template <size_t N>
void LocalKeyStore::put_fixed(const char* key, const std::array<uint8_t, N>& value) {
    std::string text = base64_encode(value.data(), value.size());
    backend_->put(key, text);
    side_channel::secure_zero_string(text);
}

void LocalKeyStore::store_device_private_key(const crypto::PrivateKey& key) {
    put_fixed(keys::DEVICE_PRIVATE_KEY, key);
}

std::optional<crypto::PrivateKey> LocalKeyStore::device_private_key() {
    return get_fixed<crypto::PRIVATE_KEY_BYTES>(keys::DEVICE_PRIVATE_KEY);
}

void LocalKeyStore::store_device_public_key(const crypto::PublicKey& key) {
    put_fixed(keys::DEVICE_PUBLIC_KEY, key);
}

std::optional<crypto::PublicKey> LocalKeyStore::device_public_key() {
    return get_fixed<crypto::PUBLIC_KEY_BYTES>(keys::DEVICE_PUBLIC_KEY);
}

void LocalKeyStore::store_device_id(const std::string& id) {
    backend_->put(keys::DEVICE_ID, id);
}

std::optional<std::string> LocalKeyStore::device_id() {
    return backend_->get(keys::DEVICE_ID);
}

void LocalKeyStore::cache_umk(const crypto::Key& umk) {
    put_fixed(keys::UMK_CACHE, umk);
}

std::optional<crypto::Key> LocalKeyStore::cached_umk() {
    return get_fixed<crypto::KEY_BYTES>(keys::UMK_CACHE);
}

void LocalKeyStore::clear_cached_umk() {
    backend_->remove(keys::UMK_CACHE);
}

void LocalKeyStore::set_remember_device(bool remember) {
    backend_->put(keys::REMEMBER_DEVICE, remember ? "true" : "false");
}

bool LocalKeyStore::remember_device() {
    auto value = backend_->get(keys::REMEMBER_DEVICE);
    if (!value) return true;
    return *value == "true" || *value == "TRUE" || *value == "True";
}

void LocalKeyStore::cache_device_status(const std::string& status) {
    backend_->put(keys::DEVICE_STATUS, status);
}

std::optional<std::string> LocalKeyStore::cached_device_status() {
    return backend_->get(keys::DEVICE_STATUS);
}

void LocalKeyStore::clear_device_status() {
    backend_->remove(keys::DEVICE_STATUS);
}

void LocalKeyStore::set_sign_in_progress(bool in_progress) {
    if (in_progress) {
        backend_->put(keys::SIGN_IN_PROGRESS, "true");
    } else {
        backend_->remove(keys::SIGN_IN_PROGRESS);
    }
}

bool LocalKeyStore::sign_in_interrupted() {
    auto value = backend_->get(keys::SIGN_IN_PROGRESS);
    return value && *value == "true";
}

void LocalKeyStore::clear_all() {
    for (const char* key : {keys::DEVICE_PRIVATE_KEY, keys::DEVICE_PUBLIC_KEY, keys::DEVICE_ID,
                            keys::UMK_CACHE, keys::REMEMBER_DEVICE, keys::DEVICE_STATUS,
                            keys::SIGN_IN_PROGRESS}) {
        backend_->remove(key);
    }
}

bool LocalKeyStore::has_device_keys() {
    return backend_->get(keys::DEVICE_PRIVATE_KEY).has_value() &&
           backend_->get(keys::DEVICE_PUBLIC_KEY).has_value() &&
           backend_->get(keys::DEVICE_ID).has_value();
}

} // namespace storage
} // namespace keyward
