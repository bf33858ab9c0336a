#ifndef KEYWARD_REMOTE_MEMORY_DOCUMENT_STORE_HPP
#define KEYWARD_REMOTE_MEMORY_DOCUMENT_STORE_HPP

#include "document_store.hpp"

#include <filesystem>
#include <memory>

namespace keyward {
namespace remote {

/**
 * @brief Thread-safe in-process DocumentStore
 *
 * Reference implementation for tests and the command-line tool. With a
 * persistence path, the whole database is written as one JSON object after
 * every mutation (tmp file + rename) and reloaded at construction.
 *
 * Watchers receive a snapshot only when what they observe actually
 * changed. A callback racing a cancel() on another thread may still be
 * invoked once.
 */
class MemoryDocumentStore : public DocumentStore {
public:
    MemoryDocumentStore();
    explicit MemoryDocumentStore(std::filesystem::path persist_path);
    ~MemoryDocumentStore() override;

    MemoryDocumentStore(const MemoryDocumentStore&) = delete;
    MemoryDocumentStore& operator=(const MemoryDocumentStore&) = delete;

    std::optional<Document> get(const std::string& path) override;
    void set(const std::string& path, const Document& data, bool merge = false) override;
    void update(const std::string& path, const Document& fields) override;
    void remove(const std::string& path) override;
    std::vector<DocumentSnapshot> list(const std::string& collection) override;
    std::vector<DocumentSnapshot> query(const std::string& collection,
                                        const std::string& field,
                                        const Document& value) override;
    void commit(const WriteBatch& batch) override;
    void remove_collection(const std::string& collection) override;
    Subscription watch(const std::string& path, SnapshotCallback callback) override;
    Subscription watch_query(const std::string& collection,
                             const std::string& field,
                             const Document& value,
                             QueryCallback callback) override;

    /**
     * @brief Simulate losing the network: every call throws ConnectivityError
     */
    void set_online(bool online);
    bool online() const;

    /**
     * @brief Where exceptions thrown by watch callbacks are reported
     *
     * Default: a WARNING line on std::cerr.
     */
    void set_listener_error_handler(std::function<void(const std::string&)> handler);

    size_t watcher_count() const;
    size_t document_count() const;

private:
    struct State;

    std::shared_ptr<State> state_;
};

} // namespace remote
} // namespace keyward

#endif // KEYWARD_REMOTE_MEMORY_DOCUMENT_STORE_HPP
