#include "document_store.hpp"
#include "../core/errors.hpp"

namespace keyward {
namespace remote {

// ---- Subscription ----

Subscription::Subscription(std::function<void()> cancel) : cancel_(std::move(cancel)) {}

Subscription::~Subscription() {
    cancel();
}

Subscription::Subscription(Subscription&& other) noexcept : cancel_(std::move(other.cancel_)) {
    other.cancel_ = nullptr;
}

Subscription& Subscription::operator=(Subscription&& other) noexcept {
    if (this != &other) {
        cancel();
        cancel_ = std::move(other.cancel_);
        other.cancel_ = nullptr;
    }
    return *this;
}

void Subscription::cancel() {
    if (!cancel_) return;
    auto fn = std::move(cancel_);
    cancel_ = nullptr;
    fn();
}

// ---- WriteBatch ----

WriteBatch& WriteBatch::set(const std::string& path, const Document& data, bool merge) {
    ops_.push_back(Op{merge ? OpType::MERGE : OpType::SET, path, data});
    return *this;
}

WriteBatch& WriteBatch::update(const std::string& path, const Document& fields) {
    ops_.push_back(Op{OpType::UPDATE, path, fields});
    return *this;
}

WriteBatch& WriteBatch::remove(const std::string& path) {
    ops_.push_back(Op{OpType::REMOVE, path, nullptr});
    return *this;
}

// ---- StaticAccountProvider ----

StaticAccountProvider::StaticAccountProvider(std::optional<std::string> account_id)
    : account_id_(std::move(account_id)) {}

std::optional<std::string> StaticAccountProvider::current_account_id() {
    return account_id_;
}

void StaticAccountProvider::sign_out() {
    account_id_.reset();
    ++sign_out_count_;
}

void StaticAccountProvider::sign_in(const std::string& account_id) {
    account_id_ = account_id;
}

// ---- paths ----

namespace paths {

std::string devices(const std::string& account_id) {
    return "users/" + account_id + "/devices";
}

std::string device(const std::string& account_id, const std::string& device_id) {
    return devices(account_id) + "/" + device_id;
}

std::string recovery_key(const std::string& account_id) {
    return "users/" + account_id + "/e2ee/recovery_key";
}

std::string parent(const std::string& path) {
    auto pos = path.rfind('/');
    return pos == std::string::npos ? std::string() : path.substr(0, pos);
}

std::string leaf(const std::string& path) {
    auto pos = path.rfind('/');
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

} // namespace paths

void merge_fields(Document& target, const Document& fields) {
    if (!fields.is_object()) throw KeywardError("document fields must be a JSON object");
    if (!target.is_object()) target = Document::object();
    for (auto it = fields.begin(); it != fields.end(); ++it) {
        if (it.value().is_null()) {
            target.erase(it.key());
        } else {
            target[it.key()] = it.value();
        }
    }
}

} // namespace remote
} // namespace keyward
