#ifndef KEYWARD_STORAGE_KEY_VALUE_STORE_HPP
#define KEYWARD_STORAGE_KEY_VALUE_STORE_HPP

#include "../crypto/primitives.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace keyward {
namespace storage {

/**
 * @brief Local secret storage capability
 *
 * Platform keychains, an encrypted file, or an in-memory map. Values are
 * opaque byte strings.
 */
class KeyValueStore {
public:
    virtual ~KeyValueStore() = default;

    virtual void put(const std::string& key, const std::string& value) = 0;
    virtual std::optional<std::string> get(const std::string& key) = 0;
    virtual void remove(const std::string& key) = 0;
};

/**
 * @brief Process-local store (tests, ephemeral sessions)
 */
class MemoryKeyValueStore : public KeyValueStore {
public:
    void put(const std::string& key, const std::string& value) override;
    std::optional<std::string> get(const std::string& key) override;
    void remove(const std::string& key) override;

    size_t size() const;

private:
    std::map<std::string, std::string> values_;
    mutable std::mutex mutex_;
};

/**
 * @brief JSON file store with atomic replace
 *
 * Every mutation rewrites `<path>.tmp` and renames it over `<path>`. The
 * file is created owner read/write only. Pair with SealedKeyValueStore
 * when the file system offers no confidentiality.
 */
class FileKeyValueStore : public KeyValueStore {
public:
    explicit FileKeyValueStore(std::filesystem::path path);

    void put(const std::string& key, const std::string& value) override;
    std::optional<std::string> get(const std::string& key) override;
    void remove(const std::string& key) override;

    const std::filesystem::path& path() const { return path_; }

private:
    void load();
    void persist_unlocked();

    std::filesystem::path path_;
    std::map<std::string, std::string> values_;
    std::mutex mutex_;
};

/**
 * @brief Decorator that AEAD-wraps every value before it reaches the backend
 *
 * Stored form is base64(nonce || ciphertext || tag) under an
 * application-provisioned key. A value that does not open under the key
 * (foreign, stale or corrupted) reads as absent.
 */
class SealedKeyValueStore : public KeyValueStore {
public:
    SealedKeyValueStore(std::shared_ptr<KeyValueStore> backend, const crypto::Key& key);
    ~SealedKeyValueStore() override;

    /**
     * @brief Build from a 64-character hex key
     * @throws KeywardError on a malformed key
     */
    static std::shared_ptr<SealedKeyValueStore> from_hex(std::shared_ptr<KeyValueStore> backend,
                                                         const std::string& key_hex);

    void put(const std::string& key, const std::string& value) override;
    std::optional<std::string> get(const std::string& key) override;
    void remove(const std::string& key) override;

private:
    std::shared_ptr<KeyValueStore> backend_;
    crypto::Key key_{};
};

} // namespace storage
} // namespace keyward

#endif // KEYWARD_STORAGE_KEY_VALUE_STORE_HPP
