#include "key_value_store.hpp"
#include "../crypto/file_envelope.hpp"
#include "../core/side_channel.hpp"

#include <fstream>
#include <iterator>
#include <nlohmann/json.hpp>

namespace keyward {
namespace storage {

// ---- MemoryKeyValueStore ----

void MemoryKeyValueStore::put(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    values_[key] = value;
}

std::optional<std::string> MemoryKeyValueStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = values_.find(key);
    if (it == values_.end()) return std::nullopt;
    return it->second;
}

void MemoryKeyValueStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = values_.find(key);
    if (it == values_.end()) return;
    side_channel::secure_zero_string(it->second);
    values_.erase(it);
}

size_t MemoryKeyValueStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return values_.size();
}

// ---- FileKeyValueStore ----

FileKeyValueStore::FileKeyValueStore(std::filesystem::path path) : path_(std::move(path)) {
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path());
    }
    load();
}

void FileKeyValueStore::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    values_.clear();
    if (!std::filesystem::exists(path_)) return;

    std::ifstream f(path_, std::ios::binary);
    if (!f) throw KeywardError("open failed: " + path_.string());
    std::string text((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    if (text.empty()) return;

    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw KeywardError("secure store corrupted: " + path_.string() + ": " + e.what());
    }
    if (!doc.is_object()) throw KeywardError("secure store corrupted: " + path_.string());

    for (auto it = doc.begin(); it != doc.end(); ++it) {
        if (!it.value().is_string()) continue;
        auto raw = base64_decode(it.value().get<std::string>());
        values_[it.key()] = std::string(raw.begin(), raw.end());
        side_channel::secure_zero_memory(raw.data(), raw.size());
    }
}

void FileKeyValueStore::persist_unlocked() {
    nlohmann::json doc = nlohmann::json::object();
    for (const auto& kv : values_) {
        doc[kv.first] = base64_encode(reinterpret_cast<const uint8_t*>(kv.second.data()),
                                      kv.second.size());
    }
    std::string text = doc.dump();

    std::filesystem::path tmp = path_.string() + ".tmp";
    {
        std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
        if (!f) throw KeywardError("open tmp store failed: " + tmp.string());
        f.write(text.data(), static_cast<std::streamsize>(text.size()));
        f.flush();
        if (!f) throw KeywardError("write tmp store failed: " + tmp.string());
    }
    side_channel::secure_zero_string(text);

    std::error_code ec;
    std::filesystem::permissions(tmp,
        std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
        std::filesystem::perm_options::replace, ec);
    if (ec) throw KeywardError("chmod tmp store failed: " + ec.message());

    std::filesystem::rename(tmp, path_, ec);
    if (ec) {
        std::filesystem::remove(path_, ec);
        std::filesystem::rename(tmp, path_, ec);
        if (ec) throw KeywardError("atomic rename failed: " + ec.message());
    }
}

void FileKeyValueStore::put(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    values_[key] = value;
    persist_unlocked();
}

std::optional<std::string> FileKeyValueStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = values_.find(key);
    if (it == values_.end()) return std::nullopt;
    return it->second;
}

void FileKeyValueStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = values_.find(key);
    if (it == values_.end()) return;
    side_channel::secure_zero_string(it->second);
    values_.erase(it);
    persist_unlocked();
}

// ---- SealedKeyValueStore ----

SealedKeyValueStore::SealedKeyValueStore(std::shared_ptr<KeyValueStore> backend,
                                         const crypto::Key& key)
    : backend_(std::move(backend)), key_(key) {
    if (!backend_) throw KeywardError("sealed store backend cannot be null");
}

SealedKeyValueStore::~SealedKeyValueStore() {
    side_channel::secure_zero_memory(key_.data(), key_.size());
}

std::shared_ptr<SealedKeyValueStore> SealedKeyValueStore::from_hex(
    std::shared_ptr<KeyValueStore> backend, const std::string& key_hex) {
    auto raw = hex_decode(key_hex);
    side_channel::SecureWipe<Bytes> wipe(raw);
    auto key = crypto::to_array<crypto::KEY_BYTES>(raw, "storage key");
    auto store = std::make_shared<SealedKeyValueStore>(std::move(backend), key);
    side_channel::secure_zero_memory(key.data(), key.size());
    return store;
}

void SealedKeyValueStore::put(const std::string& key, const std::string& value) {
    Bytes pt(value.begin(), value.end());
    side_channel::SecureWipe<Bytes> wipe(pt);
    backend_->put(key, base64_encode(crypto::encrypt_bytes(pt, key_)));
}

std::optional<std::string> SealedKeyValueStore::get(const std::string& key) {
    auto stored = backend_->get(key);
    if (!stored) return std::nullopt;
    try {
        auto pt = crypto::decrypt_bytes(base64_decode(*stored), key_);
        std::string value(pt.begin(), pt.end());
        side_channel::secure_zero_memory(pt.data(), pt.size());
        return value;
    } catch (const KeywardError&) {
        // Not sealed under this key; treated as never written
        return std::nullopt;
    }
}

void SealedKeyValueStore::remove(const std::string& key) {
    backend_->remove(key);
}

} // namespace storage
} // namespace keyward
