#ifndef KEYWARD_REMOTE_DOCUMENT_STORE_HPP
#define KEYWARD_REMOTE_DOCUMENT_STORE_HPP

#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace keyward {
namespace remote {

/// Documents are JSON objects; a null field value in update/merge deletes the field
using Document = nlohmann::json;

/**
 * @brief One document as seen by a reader or a watcher
 */
struct DocumentSnapshot {
    std::string id;                  ///< Last path segment
    std::string path;                ///< Full slash path
    std::optional<Document> data;    ///< Empty when the document does not exist

    bool exists() const { return data.has_value(); }
};

using SnapshotCallback = std::function<void(const DocumentSnapshot&)>;
using QueryCallback = std::function<void(const std::vector<DocumentSnapshot>&)>;

/**
 * @brief Handle for a live watch
 *
 * Move-only. cancel() is idempotent and runs on destruction.
 */
class Subscription {
public:
    Subscription() = default;
    explicit Subscription(std::function<void()> cancel);
    ~Subscription();

    Subscription(Subscription&& other) noexcept;
    Subscription& operator=(Subscription&& other) noexcept;
    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    void cancel();
    bool active() const { return static_cast<bool>(cancel_); }

private:
    std::function<void()> cancel_;
};

/**
 * @brief Group of writes applied atomically by DocumentStore::commit
 */
class WriteBatch {
public:
    enum class OpType { SET, MERGE, UPDATE, REMOVE };

    struct Op {
        OpType type;
        std::string path;
        Document data;
    };

    WriteBatch& set(const std::string& path, const Document& data, bool merge = false);
    WriteBatch& update(const std::string& path, const Document& fields);
    WriteBatch& remove(const std::string& path);

    const std::vector<Op>& ops() const { return ops_; }
    bool empty() const { return ops_.empty(); }
    size_t size() const { return ops_.size(); }

private:
    std::vector<Op> ops_;
};

/**
 * @brief Remote document database holding device and recovery records
 *
 * Every method may throw ConnectivityError. Implementations deliver watch
 * callbacks on any thread, never while holding internal locks, so a
 * callback may call back into the store.
 */
class DocumentStore {
public:
    virtual ~DocumentStore() = default;

    virtual std::optional<Document> get(const std::string& path) = 0;

    /**
     * @brief Create or replace; with merge, overlay top-level fields instead
     */
    virtual void set(const std::string& path, const Document& data, bool merge = false) = 0;

    /**
     * @brief Overlay top-level fields onto an existing document
     * @throws NotFoundError if the document does not exist
     */
    virtual void update(const std::string& path, const Document& fields) = 0;

    /// Removing a missing document is not an error
    virtual void remove(const std::string& path) = 0;

    virtual std::vector<DocumentSnapshot> list(const std::string& collection) = 0;

    /**
     * @brief Documents of a collection whose field equals value
     */
    virtual std::vector<DocumentSnapshot> query(const std::string& collection,
                                                const std::string& field,
                                                const Document& value) = 0;

    /**
     * @brief Apply every op or none
     * @throws NotFoundError if an update targets a missing document
     */
    virtual void commit(const WriteBatch& batch) = 0;

    virtual void remove_collection(const std::string& collection) = 0;

    /**
     * @brief Watch one document
     *
     * The current snapshot is delivered before watch() returns, then one
     * snapshot per change.
     */
    virtual Subscription watch(const std::string& path, SnapshotCallback callback) = 0;

    /**
     * @brief Watch the result set of query(collection, field, value)
     */
    virtual Subscription watch_query(const std::string& collection,
                                     const std::string& field,
                                     const Document& value,
                                     QueryCallback callback) = 0;
};

/**
 * @brief Identity provider seen from the custody services
 */
class AccountProvider {
public:
    virtual ~AccountProvider() = default;

    virtual std::optional<std::string> current_account_id() = 0;
    virtual void sign_out() = 0;
};

/**
 * @brief Fixed account id (tests and the command-line tool)
 */
class StaticAccountProvider : public AccountProvider {
public:
    explicit StaticAccountProvider(std::optional<std::string> account_id);

    std::optional<std::string> current_account_id() override;
    void sign_out() override;

    void sign_in(const std::string& account_id);
    int sign_out_count() const { return sign_out_count_; }

private:
    std::optional<std::string> account_id_;
    int sign_out_count_ = 0;
};

/**
 * @brief Account-scoped paths
 */
namespace paths {
std::string devices(const std::string& account_id);
std::string device(const std::string& account_id, const std::string& device_id);
std::string recovery_key(const std::string& account_id);

/// "a/b/c" -> "a/b"; empty for a top-level path
std::string parent(const std::string& path);
/// "a/b/c" -> "c"
std::string leaf(const std::string& path);
} // namespace paths

/**
 * @brief Overlay fields onto target; null values erase
 */
void merge_fields(Document& target, const Document& fields);

} // namespace remote
} // namespace keyward

#endif // KEYWARD_REMOTE_DOCUMENT_STORE_HPP
