#include "memory_document_store.hpp"
#include "../core/errors.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <map>
#include <mutex>

namespace keyward {
namespace remote {

namespace {

struct Watcher {
    bool is_query = false;
    std::string path;               ///< Document path, or collection for queries
    std::string field;
    Document value;
    SnapshotCallback on_document;
    QueryCallback on_query;
    std::optional<Document> last_document;
    Document last_result;           ///< [{id, data}] as last delivered
};

using Delivery = std::function<void()>;

bool in_collection(const std::string& path, const std::string& collection) {
    return paths::parent(path) == collection;
}

DocumentSnapshot snapshot_of(const std::map<std::string, Document>& docs, const std::string& path) {
    DocumentSnapshot snap;
    snap.path = path;
    snap.id = paths::leaf(path);
    auto it = docs.find(path);
    if (it != docs.end()) snap.data = it->second;
    return snap;
}

std::vector<DocumentSnapshot> select_documents(const std::map<std::string, Document>& docs,
                                               const std::string& collection,
                                               const std::string* field,
                                               const Document* value) {
    std::vector<DocumentSnapshot> out;
    const std::string prefix = collection + "/";
    for (auto it = docs.lower_bound(prefix); it != docs.end(); ++it) {
        if (it->first.compare(0, prefix.size(), prefix) != 0) break;
        if (!in_collection(it->first, collection)) continue;
        if (field) {
            const Document& doc = it->second;
            if (!doc.is_object() || !doc.contains(*field) || doc.at(*field) != *value) continue;
        }
        out.push_back(DocumentSnapshot{paths::leaf(it->first), it->first, it->second});
    }
    return out;
}

Document fingerprint(const std::vector<DocumentSnapshot>& result) {
    Document fp = Document::array();
    for (const auto& snap : result) {
        fp.push_back(Document{{"id", snap.id}, {"data", snap.data ? *snap.data : Document()}});
    }
    return fp;
}

void apply_op(std::map<std::string, Document>& docs, const WriteBatch::Op& op) {
    switch (op.type) {
        case WriteBatch::OpType::SET:
            if (!op.data.is_object()) throw KeywardError("document must be a JSON object: " + op.path);
            docs[op.path] = op.data;
            break;
        case WriteBatch::OpType::MERGE: {
            if (!op.data.is_object()) throw KeywardError("document fields must be a JSON object: " + op.path);
            Document& doc = docs[op.path];
            merge_fields(doc, op.data);
            break;
        }
        case WriteBatch::OpType::UPDATE: {
            auto it = docs.find(op.path);
            if (it == docs.end()) throw NotFoundError("document " + op.path);
            merge_fields(it->second, op.data);
            break;
        }
        case WriteBatch::OpType::REMOVE:
            docs.erase(op.path);
            break;
    }
}

} // namespace

struct MemoryDocumentStore::State {
    mutable std::mutex mutex;
    std::map<std::string, Document> docs;
    std::map<uint64_t, Watcher> watchers;
    uint64_t next_watcher_id = 1;
    bool online = true;
    std::optional<std::filesystem::path> persist_path;
    std::function<void(const std::string&)> on_listener_error;

    void check_online() const {
        if (!online) throw ConnectivityError("remote store unreachable");
    }

    void load() {
        if (!persist_path || !std::filesystem::exists(*persist_path)) return;
        std::ifstream f(*persist_path, std::ios::binary);
        if (!f) throw KeywardError("open failed: " + persist_path->string());
        std::string text((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        if (text.empty()) return;

        Document root;
        try {
            root = Document::parse(text);
        } catch (const nlohmann::json::parse_error& e) {
            throw KeywardError("document database corrupted: " + persist_path->string() + ": " + e.what());
        }
        if (!root.is_object() || !root.contains("documents") || !root["documents"].is_object()) {
            throw KeywardError("document database corrupted: " + persist_path->string());
        }
        for (auto it = root["documents"].begin(); it != root["documents"].end(); ++it) {
            docs[it.key()] = it.value();
        }
    }

    void persist_unlocked() {
        if (!persist_path) return;
        Document root;
        root["documents"] = Document::object();
        for (const auto& kv : docs) root["documents"][kv.first] = kv.second;
        const std::string text = root.dump(2);

        std::filesystem::path tmp = persist_path->string() + ".tmp";
        {
            std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
            if (!f) throw KeywardError("open tmp database failed: " + tmp.string());
            f.write(text.data(), static_cast<std::streamsize>(text.size()));
            f.flush();
            if (!f) throw KeywardError("write tmp database failed: " + tmp.string());
        }
        std::error_code ec;
        std::filesystem::rename(tmp, *persist_path, ec);
        if (ec) {
            std::filesystem::remove(*persist_path, ec);
            std::filesystem::rename(tmp, *persist_path, ec);
            if (ec) throw KeywardError("atomic rename failed: " + ec.message());
        }
    }

    // Compare every watcher's view with what it last saw
    std::vector<Delivery> collect_unlocked() {
        std::vector<Delivery> out;
        for (auto& kv : watchers) {
            Watcher& w = kv.second;
            if (!w.is_query) {
                DocumentSnapshot snap = snapshot_of(docs, w.path);
                if (snap.data == w.last_document) continue;
                w.last_document = snap.data;
                auto cb = w.on_document;
                out.push_back([cb, snap] { cb(snap); });
            } else {
                auto result = select_documents(docs, w.path, &w.field, &w.value);
                Document fp = fingerprint(result);
                if (fp == w.last_result) continue;
                w.last_result = std::move(fp);
                auto cb = w.on_query;
                out.push_back([cb, result] { cb(result); });
            }
        }
        return out;
    }

    void deliver(const std::vector<Delivery>& deliveries) {
        if (deliveries.empty()) return;
        std::function<void(const std::string&)> report;
        {
            std::lock_guard<std::mutex> lock(mutex);
            report = on_listener_error;
        }
        for (const auto& d : deliveries) {
            try {
                d();
            } catch (const std::exception& e) {
                if (report) {
                    report(e.what());
                } else {
                    std::cerr << "WARNING: document listener failed: " << e.what() << "\n";
                }
            }
        }
    }

    template <typename Mutation>
    void mutate(Mutation&& mutation) {
        std::vector<Delivery> deliveries;
        {
            std::lock_guard<std::mutex> lock(mutex);
            check_online();
            mutation(docs);
            persist_unlocked();
            deliveries = collect_unlocked();
        }
        deliver(deliveries);
    }
};

MemoryDocumentStore::MemoryDocumentStore() : state_(std::make_shared<State>()) {}

MemoryDocumentStore::MemoryDocumentStore(std::filesystem::path persist_path)
    : state_(std::make_shared<State>()) {
    if (persist_path.has_parent_path()) {
        std::filesystem::create_directories(persist_path.parent_path());
    }
    state_->persist_path = std::move(persist_path);
    state_->load();
}

MemoryDocumentStore::~MemoryDocumentStore() = default;

std::optional<Document> MemoryDocumentStore::get(const std::string& path) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->check_online();
    auto it = state_->docs.find(path);
    if (it == state_->docs.end()) return std::nullopt;
    return it->second;
}

void MemoryDocumentStore::set(const std::string& path, const Document& data, bool merge) {
    WriteBatch::Op op{merge ? WriteBatch::OpType::MERGE : WriteBatch::OpType::SET, path, data};
    state_->mutate([&](std::map<std::string, Document>& docs) { apply_op(docs, op); });
}

void MemoryDocumentStore::update(const std::string& path, const Document& fields) {
    WriteBatch::Op op{WriteBatch::OpType::UPDATE, path, fields};
    state_->mutate([&](std::map<std::string, Document>& docs) { apply_op(docs, op); });
}

void MemoryDocumentStore::remove(const std::string& path) {
    state_->mutate([&](std::map<std::string, Document>& docs) { docs.erase(path); });
}

std::vector<DocumentSnapshot> MemoryDocumentStore::list(const std::string& collection) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->check_online();
    return select_documents(state_->docs, collection, nullptr, nullptr);
}

std::vector<DocumentSnapshot> MemoryDocumentStore::query(const std::string& collection,
                                                         const std::string& field,
                                                         const Document& value) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->check_online();
    return select_documents(state_->docs, collection, &field, &value);
}

void MemoryDocumentStore::commit(const WriteBatch& batch) {
    if (batch.empty()) return;
    state_->mutate([&](std::map<std::string, Document>& docs) {
        // Stage on a copy so a failing op leaves nothing applied
        auto staged = docs;
        for (const auto& op : batch.ops()) apply_op(staged, op);
        docs.swap(staged);
    });
}

void MemoryDocumentStore::remove_collection(const std::string& collection) {
    state_->mutate([&](std::map<std::string, Document>& docs) {
        for (auto it = docs.begin(); it != docs.end();) {
            if (in_collection(it->first, collection)) {
                it = docs.erase(it);
            } else {
                ++it;
            }
        }
    });
}

Subscription MemoryDocumentStore::watch(const std::string& path, SnapshotCallback callback) {
    if (!callback) throw KeywardError("watch callback cannot be empty");

    uint64_t id = 0;
    DocumentSnapshot initial;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->check_online();
        id = state_->next_watcher_id++;
        initial = snapshot_of(state_->docs, path);
        Watcher w;
        w.path = path;
        w.on_document = callback;
        w.last_document = initial.data;
        state_->watchers.emplace(id, std::move(w));
    }

    std::weak_ptr<State> weak = state_;
    Subscription sub([weak, id] {
        if (auto s = weak.lock()) {
            std::lock_guard<std::mutex> lock(s->mutex);
            s->watchers.erase(id);
        }
    });
    state_->deliver({[callback, initial] { callback(initial); }});
    return sub;
}

Subscription MemoryDocumentStore::watch_query(const std::string& collection,
                                              const std::string& field,
                                              const Document& value,
                                              QueryCallback callback) {
    if (!callback) throw KeywardError("watch callback cannot be empty");

    uint64_t id = 0;
    std::vector<DocumentSnapshot> initial;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->check_online();
        id = state_->next_watcher_id++;
        initial = select_documents(state_->docs, collection, &field, &value);
        Watcher w;
        w.is_query = true;
        w.path = collection;
        w.field = field;
        w.value = value;
        w.on_query = callback;
        w.last_result = fingerprint(initial);
        state_->watchers.emplace(id, std::move(w));
    }

    std::weak_ptr<State> weak = state_;
    Subscription sub([weak, id] {
        if (auto s = weak.lock()) {
            std::lock_guard<std::mutex> lock(s->mutex);
            s->watchers.erase(id);
        }
    });
    state_->deliver({[callback, initial] { callback(initial); }});
    return sub;
}

void MemoryDocumentStore::set_online(bool online) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->online = online;
}

bool MemoryDocumentStore::online() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->online;
}

void MemoryDocumentStore::set_listener_error_handler(std::function<void(const std::string&)> handler) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->on_listener_error = std::move(handler);
}

size_t MemoryDocumentStore::watcher_count() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->watchers.size();
}

size_t MemoryDocumentStore::document_count() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->docs.size();
}

} // namespace remote
} // namespace keyward
