#include "device_trust_manager.hpp"
#include "../core/errors.hpp"
#include "../core/side_channel.hpp"

#include <algorithm>
#include <cctype>

namespace keyward {
namespace device {

using security::AuditSeverity;
namespace cat = security::category;

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

Timestamp or_latest(const std::optional<Timestamp>& t) {
    return t ? *t : Timestamp::max();
}

// Fields removed when a record goes back to pending
remote::Document pending_reset_fields() {
    return remote::Document{
        {fields::STATUS, device_status_name(DeviceStatus::PENDING)},
        {fields::WRAPPED_UMK, nullptr},
        {fields::WRAPPED_UMK_NONCE, nullptr},
        {fields::APPROVED_AT, nullptr},
        {fields::APPROVED_BY_PUBLIC_KEY, nullptr},
        {fields::REVOKED_AT, nullptr},
    };
}

crypto::PublicKey decode_public_key(const std::string& b64, const char* what) {
    auto raw = base64_decode(b64);
    return crypto::to_array<crypto::PUBLIC_KEY_BYTES>(raw, what);
}

} // namespace

DeviceTrustManager::DeviceTrustManager(std::shared_ptr<remote::DocumentStore> remote,
                                       std::shared_ptr<storage::LocalKeyStore> local,
                                       std::shared_ptr<remote::AccountProvider> accounts,
                                       DeviceIdentity identity,
                                       CustodySettings settings,
                                       std::shared_ptr<security::AuditLogger> audit)
    : remote_(std::move(remote)),
      local_(std::move(local)),
      accounts_(std::move(accounts)),
      identity_(std::move(identity)),
      settings_(std::move(settings)),
      audit_(audit ? std::move(audit) : security::make_default_audit_logger()) {
    if (!remote_ || !local_ || !accounts_) {
        throw KeywardError("device trust manager requires a document store, a local store and an account provider");
    }
    if (settings_.device_name && !settings_.device_name->empty()) {
        identity_.name = *settings_.device_name;
    }
}

DeviceTrustManager::~DeviceTrustManager() {
    dispose();
    std::lock_guard<std::mutex> lock(mutex_);
    if (umk_) side_channel::secure_zero_memory(umk_->data(), umk_->size());
}

// ---- helpers ----

std::string DeviceTrustManager::account_id() {
    auto id = accounts_->current_account_id();
    if (!id || id->empty()) throw NotAuthorizedError("No signed-in account");
    return *id;
}

std::string DeviceTrustManager::devices_path() {
    return remote::paths::devices(account_id());
}

std::string DeviceTrustManager::device_path(const std::string& device_id) {
    return remote::paths::device(account_id(), device_id);
}

std::string DeviceTrustManager::actor() {
    return local_->device_id().value_or("unregistered");
}

std::optional<DeviceRecord> DeviceTrustManager::fetch(const std::string& device_id) {
    auto doc = remote_->get(device_path(device_id));
    if (!doc) return std::nullopt;
    return DeviceRecord::from_document(device_id, *doc);
}

std::vector<DeviceRecord> DeviceTrustManager::parse_records(
    const std::vector<remote::DocumentSnapshot>& snaps) {
    std::vector<DeviceRecord> out;
    out.reserve(snaps.size());
    for (const auto& snap : snaps) {
        if (!snap.data) continue;
        try {
            out.push_back(DeviceRecord::from_document(snap.id, *snap.data));
        } catch (const KeywardError& e) {
            audit_->log_failure(AuditSeverity::WARNING, cat::DEVICE, "PARSE", actor(), snap.id, e);
        }
    }
    return out;
}

std::vector<DeviceRecord> DeviceTrustManager::fetch_all() {
    return parse_records(remote_->list(devices_path()));
}

crypto::Key DeviceTrustManager::require_umk(const char* operation) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!umk_) throw NotAuthorizedError(std::string("cannot ") + operation + ": UMK not available");
    return *umk_;
}

void DeviceTrustManager::require_not_self(const std::string& device_id, const char* operation) {
    auto own = local_->device_id();
    if (own && *own == device_id) {
        throw InvalidStateError(std::string("cannot ") + operation + " the current device");
    }
}

crypto::SealedString DeviceTrustManager::wrap_umk(const crypto::Key& umk,
                                                  const crypto::PrivateKey& own_private,
                                                  const crypto::PublicKey& peer_public) const {
    crypto::Key secret = crypto::x25519_shared_secret(own_private, peer_public);
    side_channel::SecureWipe<crypto::Key> wipe_secret(secret);
    std::string umk_b64 = base64_encode(umk.data(), umk.size());
    auto sealed = crypto::seal_string(umk_b64, secret);
    side_channel::secure_zero_string(umk_b64);
    return sealed;
}

void DeviceTrustManager::unwrap_and_cache(const DeviceRecord& record) {
    if (!record.has_wrapped_umk()) {
        throw InvalidStateError("device " + record.id + " carries no wrapped UMK");
    }
    auto own_private = local_->device_private_key();
    if (!own_private) throw InvalidStateError("local private key not found");
    side_channel::SecureWipe<crypto::PrivateKey> wipe_private(*own_private);

    crypto::PublicKey peer{};
    if (record.approved_by_public_key && !record.approved_by_public_key->empty()) {
        peer = decode_public_key(*record.approved_by_public_key, "approved_by_public_key");
    } else {
        auto own_public = local_->device_public_key();
        if (!own_public) throw InvalidStateError("local public key not found");
        peer = *own_public;
    }

    crypto::Key secret = crypto::x25519_shared_secret(*own_private, peer);
    side_channel::SecureWipe<crypto::Key> wipe_secret(secret);
    std::string umk_b64 = crypto::open_string(*record.wrapped_umk, *record.wrapped_umk_nonce, secret);
    Bytes raw = base64_decode(umk_b64);
    side_channel::secure_zero_string(umk_b64);
    side_channel::SecureWipe<Bytes> wipe_raw(raw);
    crypto::Key umk = crypto::to_array<crypto::UMK_BYTES>(raw, "unwrapped UMK");

    local_->cache_umk(umk);
    set_umk(umk);
    side_channel::secure_zero_memory(umk.data(), umk.size());
    audit_->log(AuditSeverity::INFO, cat::DEVICE, "UNWRAP", record.id, record.id, "SUCCESS",
                record.approved_by_public_key ? "wrapped by approver" : "self-wrapped");
}

void DeviceTrustManager::set_umk(const crypto::Key& umk) {
    UmkCallback cb;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        umk_ = umk;
        cb = on_umk_changed_;
    }
    if (cb) cb(true);
}

void DeviceTrustManager::forget_umk(bool clear_local) {
    bool had = false;
    UmkCallback cb;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        had = umk_.has_value();
        if (umk_) side_channel::secure_zero_memory(umk_->data(), umk_->size());
        umk_.reset();
        cb = on_umk_changed_;
    }
    if (clear_local) local_->clear_cached_umk();
    if (had && cb) cb(false);
}

void DeviceTrustManager::notify_revoked() {
    RevokedCallback cb;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        was_revoked_ = true;
        cb = on_revoked_;
    }
    if (cb) cb();
}

// ---- init ----

bool DeviceTrustManager::load_cached_umk() {
    auto cached = local_->cached_umk();
    if (!cached) return false;
    set_umk(*cached);
    side_channel::secure_zero_memory(cached->data(), cached->size());
    return true;
}

void DeviceTrustManager::init() {
    if (!accounts_->current_account_id()) return;

    load_cached_umk();

    auto device_id = local_->device_id();
    if (!device_id) return;

    auto record = fetch(*device_id);
    if (!record) {
        local_->clear_all();
        forget_umk(false);
        audit_->log(AuditSeverity::WARNING, cat::DEVICE, "INIT", *device_id, *device_id, "MISSING",
                    "device removed from server, local keys cleared");
        return;
    }

    if (record->is_revoked()) {
        forget_umk(true);
        audit_->log(AuditSeverity::WARNING, cat::DEVICE, "INIT", *device_id, *device_id, "REVOKED",
                    "cached UMK cleared");
        return;
    }

    if (record->is_approved() && record->has_wrapped_umk() && !has_umk()) {
        unwrap_and_cache(*record);
    }

    if (record->is_approved()) {
        start_listening_for_current_device();
    }
}

// ---- queries ----

std::optional<std::string> DeviceTrustManager::current_device_id() {
    return local_->device_id();
}

std::optional<DeviceRecord> DeviceTrustManager::current_device_record() {
    auto id = local_->device_id();
    if (!id) return std::nullopt;
    return fetch(*id);
}

bool DeviceTrustManager::is_first_device() {
    if (!accounts_->current_account_id()) return false;
    return remote_->list(devices_path()).empty();
}

bool DeviceTrustManager::has_approved_devices() {
    if (!accounts_->current_account_id()) return false;
    auto records = fetch_all();
    return std::any_of(records.begin(), records.end(),
                       [](const DeviceRecord& r) { return r.is_approved(); });
}

std::optional<DeviceRecord> DeviceTrustManager::primary_device() {
    if (!accounts_->current_account_id()) return std::nullopt;
    std::optional<DeviceRecord> best;
    for (auto& r : fetch_all()) {
        if (!r.is_approved()) continue;
        if (!best || or_latest(r.created_at) < or_latest(best->created_at)) best = std::move(r);
    }
    return best;
}

bool DeviceTrustManager::current_device_matches_primary_name() {
    auto primary = primary_device();
    if (!primary) return false;
    return to_lower(identity_.name) == to_lower(primary->name);
}

bool DeviceTrustManager::is_device_approved() {
    auto r = current_device_record();
    return r && r->is_approved();
}

bool DeviceTrustManager::is_device_pending() {
    auto r = current_device_record();
    return r && r->is_pending();
}

bool DeviceTrustManager::is_device_revoked() {
    auto r = current_device_record();
    return r && r->is_revoked();
}

bool DeviceTrustManager::device_exists_on_server() {
    return current_device_record().has_value();
}

bool DeviceTrustManager::check_current_device_authorization() {
    auto device_id = local_->device_id();
    if (!device_id) return false;

    std::optional<DeviceRecord> record;
    try {
        record = fetch(*device_id);
    } catch (const ConnectivityError& e) {
        // Unreachable store is not a revocation
        audit_->log_failure(AuditSeverity::NOTICE, cat::DEVICE, "CHECK", *device_id, *device_id, e);
        return true;
    }

    if (!record) {
        forget_umk(true);
        audit_->log(AuditSeverity::WARNING, cat::DEVICE, "CHECK", *device_id, *device_id, "MISSING");
        notify_revoked();
        return false;
    }
    if (record->is_revoked()) {
        forget_umk(true);
        audit_->log(AuditSeverity::WARNING, cat::DEVICE, "CHECK", *device_id, *device_id, "REVOKED");
        notify_revoked();
        return false;
    }
    return record->is_approved();
}

bool DeviceTrustManager::try_retrieve_umk() {
    if (has_umk()) return true;

    auto record = current_device_record();
    if (!record || !record->is_approved() || !record->has_wrapped_umk()) return false;

    try {
        unwrap_and_cache(*record);
        return true;
    } catch (const ConnectivityError&) {
        throw;
    } catch (const KeywardError& e) {
        audit_->log_failure(AuditSeverity::ERROR, cat::DEVICE, "UNWRAP", record->id, record->id, e);
        return false;
    }
}

bool DeviceTrustManager::is_master_device() {
    if (!accounts_->current_account_id()) return false;
    auto own = local_->device_id();
    if (!own) return false;

    std::vector<DeviceRecord> approved;
    for (auto& r : fetch_all()) {
        if (r.is_approved()) approved.push_back(std::move(r));
    }
    if (approved.empty()) return true;

    auto anchor = [](const DeviceRecord& r) {
        return r.approved_at ? *r.approved_at : or_latest(r.created_at);
    };
    auto first = std::min_element(approved.begin(), approved.end(),
                                  [&](const DeviceRecord& a, const DeviceRecord& b) {
                                      return anchor(a) < anchor(b);
                                  });
    return first->id == *own;
}

std::vector<DeviceRecord> DeviceTrustManager::devices() {
    auto records = fetch_all();
    const std::string own = local_->device_id().value_or("");
    std::stable_sort(records.begin(), records.end(),
                     [&](const DeviceRecord& a, const DeviceRecord& b) {
                         if (a.id == own) return b.id != own;
                         if (b.id == own) return false;
                         auto ta = a.created_at ? *a.created_at : Timestamp::min();
                         auto tb = b.created_at ? *b.created_at : Timestamp::min();
                         return ta > tb;
                     });
    return records;
}

std::vector<ApprovalRequest> DeviceTrustManager::pending_approvals() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_;
}

std::vector<ApprovalRequest> DeviceTrustManager::refresh_pending_approvals() {
    auto snaps = remote_->query(devices_path(), fields::STATUS,
                                device_status_name(DeviceStatus::PENDING));
    std::vector<ApprovalRequest> requests;
    for (const auto& r : parse_records(snaps)) requests.push_back(ApprovalRequest::from_record(r));

    PendingCallback cb;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_ = requests;
        cb = on_pending_changed_;
    }
    if (cb) cb(requests);
    return requests;
}

// ---- lifecycle ----

std::string DeviceTrustManager::enrol(const crypto::Key& umk, bool recovered) {
    auto keys = crypto::x25519_generate();
    side_channel::SecureWipe<crypto::PrivateKey> wipe_private(keys.sk);
    const std::string device_id = uuid_v4();
    auto sealed = wrap_umk(umk, keys.sk, keys.pk);
    const auto now = std::chrono::system_clock::now();

    DeviceRecord record;
    record.id = device_id;
    record.name = identity_.name;
    record.platform = identity_.platform;
    record.public_key = base64_encode(keys.pk.data(), keys.pk.size());
    record.wrapped_umk = sealed.ciphertext;
    record.wrapped_umk_nonce = sealed.nonce;
    record.status = DeviceStatus::APPROVED;
    record.created_at = now;
    record.approved_at = now;
    record.device_details = identity_.details;
    record.recovered = recovered;

    // Remote first: no local secrets without a server record
    remote_->set(device_path(device_id), record.to_document());

    local_->store_device_private_key(keys.sk);
    local_->store_device_public_key(keys.pk);
    local_->store_device_id(device_id);
    local_->cache_umk(umk);
    set_umk(umk);

    audit_->log(AuditSeverity::SECURITY, cat::DEVICE, recovered ? "ENROL_RECOVERED" : "REGISTER_FIRST",
                device_id, device_id, "SUCCESS", identity_.name);

    start_listening_for_current_device();
    return device_id;
}

std::string DeviceTrustManager::register_first_device() {
    account_id();
    crypto::Key umk = crypto::generate_umk();
    side_channel::SecureWipe<crypto::Key> wipe(umk);
    return enrol(umk, false);
}

std::string DeviceTrustManager::enrol_recovered_device(const crypto::Key& umk) {
    account_id();
    if (auto existing = local_->device_id()) {
        // Our own listeners would read the deletion below as a revocation
        install(&DeviceTrustManager::approval_sub_, remote::Subscription());
        install(&DeviceTrustManager::status_sub_, remote::Subscription());
        try {
            remote_->remove(device_path(*existing));
        } catch (const ConnectivityError&) {
            throw;
        } catch (const KeywardError& e) {
            audit_->log_failure(AuditSeverity::WARNING, cat::DEVICE, "REMOVE_STALE", *existing, *existing, e);
        }
        local_->clear_all();
    }
    clear_revoked_flag();
    return enrol(umk, true);
}

void DeviceTrustManager::register_new_device() {
    account_id();

    if (auto existing = local_->device_id()) {
        auto record = fetch(*existing);
        if (record && record->is_pending()) {
            audit_->log(AuditSeverity::INFO, cat::DEVICE, "REGISTER", *existing, *existing, "REUSED",
                        "already pending");
            listen_for_approval(*existing);
            return;
        }
    }

    const auto now = std::chrono::system_clock::now();

    // A retried registration may have left a pending record behind
    auto same_name = parse_records(remote_->query(devices_path(), fields::NAME, identity_.name));
    auto reusable = std::find_if(same_name.begin(), same_name.end(), [&](const DeviceRecord& r) {
        return r.is_pending() && r.platform == identity_.platform;
    });
    if (reusable != same_name.end()) {
        auto keys = crypto::x25519_generate();
        side_channel::SecureWipe<crypto::PrivateKey> wipe_private(keys.sk);
        remote_->update(device_path(reusable->id), remote::Document{
            {fields::PUBLIC_KEY, base64_encode(keys.pk.data(), keys.pk.size())},
            {fields::CREATED_AT, format_iso8601(now)},
            {fields::DEVICE_DETAILS, identity_.details},
        });
        local_->store_device_private_key(keys.sk);
        local_->store_device_public_key(keys.pk);
        local_->store_device_id(reusable->id);
        audit_->log(AuditSeverity::INFO, cat::DEVICE, "REGISTER", reusable->id, reusable->id, "REUSED",
                    "pending record with same name and platform, key rotated");
        listen_for_approval(reusable->id);
        return;
    }

    auto keys = crypto::x25519_generate();
    side_channel::SecureWipe<crypto::PrivateKey> wipe_private(keys.sk);
    const std::string device_id = uuid_v4();

    DeviceRecord record;
    record.id = device_id;
    record.name = identity_.name;
    record.platform = identity_.platform;
    record.public_key = base64_encode(keys.pk.data(), keys.pk.size());
    record.status = DeviceStatus::PENDING;
    record.created_at = now;
    record.device_details = identity_.details;

    remote_->set(device_path(device_id), record.to_document());

    local_->store_device_private_key(keys.sk);
    local_->store_device_public_key(keys.pk);
    local_->store_device_id(device_id);

    audit_->log(AuditSeverity::INFO, cat::DEVICE, "REGISTER", device_id, device_id, "PENDING",
                identity_.name);
    listen_for_approval(device_id);
}

void DeviceTrustManager::approve_device(const std::string& pending_id) {
    crypto::Key umk = require_umk("approve device");
    side_channel::SecureWipe<crypto::Key> wipe_umk(umk);
    require_not_self(pending_id, "approve");

    auto record = fetch(pending_id);
    if (!record) throw NotFoundError("device " + pending_id);
    if (!record->is_pending()) {
        throw InvalidStateError("device " + pending_id + " is not pending approval (" +
                                device_status_name(record->status) + ")");
    }

    auto own_private = local_->device_private_key();
    if (!own_private) throw InvalidStateError("local private key not found");
    side_channel::SecureWipe<crypto::PrivateKey> wipe_private(*own_private);
    auto own_public = local_->device_public_key();
    if (!own_public) throw InvalidStateError("local public key not found");

    auto peer = decode_public_key(record->public_key, "pending device public key");
    auto sealed = wrap_umk(umk, *own_private, peer);

    remote_->update(device_path(pending_id), remote::Document{
        {fields::WRAPPED_UMK, sealed.ciphertext},
        {fields::WRAPPED_UMK_NONCE, sealed.nonce},
        {fields::STATUS, device_status_name(DeviceStatus::APPROVED)},
        {fields::APPROVED_AT, format_iso8601(std::chrono::system_clock::now())},
        {fields::APPROVED_BY_PUBLIC_KEY, base64_encode(own_public->data(), own_public->size())},
    });

    audit_->log(AuditSeverity::SECURITY, cat::DEVICE, "APPROVE", actor(), pending_id, "SUCCESS",
                record->name);
    refresh_pending_approvals();
}

void DeviceTrustManager::revoke_device(const std::string& device_id) {
    require_umk("revoke device");
    require_not_self(device_id, "revoke");

    remote_->remove(device_path(device_id));
    audit_->log(AuditSeverity::SECURITY, cat::DEVICE, "REVOKE", actor(), device_id, "SUCCESS",
                "record deleted");
    refresh_pending_approvals();
}

void DeviceTrustManager::reset_device_to_pending(const std::string& device_id) {
    require_umk("reset device");
    require_not_self(device_id, "reset");

    remote_->update(device_path(device_id), pending_reset_fields());
    audit_->log(AuditSeverity::SECURITY, cat::DEVICE, "RESET", actor(), device_id, "SUCCESS");
    refresh_pending_approvals();
}

void DeviceTrustManager::request_reapproval() {
    auto device_id = local_->device_id();
    forget_umk(true);

    if (!device_id) {
        register_new_device();
        return;
    }

    if (!fetch(*device_id)) {
        local_->clear_all();
        register_new_device();
        return;
    }

    remote_->update(device_path(*device_id), pending_reset_fields());
    audit_->log(AuditSeverity::NOTICE, cat::DEVICE, "REQUEST_REAPPROVAL", *device_id, *device_id, "PENDING");
    listen_for_approval(*device_id);
}

PrimaryTakeover DeviceTrustManager::set_current_device_as_primary() {
    account_id();
    auto own = local_->device_id();
    if (!own) throw InvalidStateError("current device not registered");

    PrimaryTakeover result;
    remote::WriteBatch batch;
    const std::string revoked_at = format_iso8601(std::chrono::system_clock::now());

    for (const auto& r : fetch_all()) {
        if (r.id == *own) continue;
        if (r.is_approved()) {
            batch.set(device_path(r.id), remote::Document{
                {fields::STATUS, device_status_name(DeviceStatus::REVOKED)},
                {fields::REVOKED_AT, revoked_at},
                {fields::WRAPPED_UMK, nullptr},
                {fields::WRAPPED_UMK_NONCE, nullptr},
                {fields::APPROVED_BY_PUBLIC_KEY, nullptr},
            }, true);
            ++result.revoked;
        } else if (r.is_pending()) {
            batch.remove(device_path(r.id));
            ++result.deleted;
        }
    }

    if (!batch.empty()) remote_->commit(batch);

    audit_->log(AuditSeverity::SECURITY, cat::DEVICE, "SET_PRIMARY", *own, *own, "SUCCESS",
                "revoked " + std::to_string(result.revoked) + ", deleted " +
                    std::to_string(result.deleted));
    return result;
}

size_t DeviceTrustManager::purge_expired_pending(Timestamp now) {
    const std::string path = devices_path();
    const std::string own = local_->device_id().value_or("");
    const auto cutoff = now - settings_.pending_expiry;

    remote::WriteBatch batch;
    for (const auto& snap : remote_->query(path, fields::STATUS,
                                           device_status_name(DeviceStatus::PENDING))) {
        if (snap.id == own || !snap.data) continue;
        std::optional<Timestamp> created;
        auto it = snap.data->find(fields::CREATED_AT);
        if (it != snap.data->end() && it->is_string()) {
            try {
                created = parse_iso8601(it->get<std::string>());
            } catch (const KeywardError&) {
                created.reset();
            }
        }
        if (!created || *created < cutoff) batch.remove(snap.path);
    }

    if (batch.empty()) return 0;
    remote_->commit(batch);
    audit_->log(AuditSeverity::NOTICE, cat::DEVICE, "PURGE_PENDING", actor(), path, "SUCCESS",
                std::to_string(batch.size()) + " expired pending devices deleted");
    return batch.size();
}

// ---- listeners ----

void DeviceTrustManager::install(remote::Subscription DeviceTrustManager::*slot,
                                 remote::Subscription sub) {
    remote::Subscription old;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        old = std::move(this->*slot);
        this->*slot = std::move(sub);
    }
}

void DeviceTrustManager::listen_for_approval(const std::string& device_id) {
    install(&DeviceTrustManager::approval_sub_, remote::Subscription());
    const uint64_t gen = generation_.load();

    auto sub = remote_->watch(device_path(device_id),
        [this, gen, device_id](const remote::DocumentSnapshot& snap) {
            if (gen != generation_.load()) return;

            if (!snap.exists()) {
                audit_->log(AuditSeverity::WARNING, cat::DEVICE, "APPROVAL", device_id, device_id,
                            "DENIED", "pending record deleted");
                local_->clear_all();
                forget_umk(false);
                notify_revoked();
                return;
            }

            DeviceRecord record = DeviceRecord::from_document(snap.id, *snap.data);
            if (record.is_approved() && record.has_wrapped_umk()) {
                if (has_umk()) return;
                try {
                    unwrap_and_cache(record);
                } catch (const KeywardError& e) {
                    audit_->log_failure(AuditSeverity::ERROR, cat::DEVICE, "UNWRAP", device_id, device_id, e);
                    return;
                }
                listen_for_pending_approvals();
            } else if (record.is_revoked()) {
                forget_umk(true);
                audit_->log(AuditSeverity::WARNING, cat::DEVICE, "APPROVAL", device_id, device_id, "REVOKED");
                notify_revoked();
            }
        });
    install(&DeviceTrustManager::approval_sub_, std::move(sub));
}

void DeviceTrustManager::listen_for_current_device_status(const std::string& device_id) {
    install(&DeviceTrustManager::status_sub_, remote::Subscription());
    const uint64_t gen = generation_.load();

    auto sub = remote_->watch(device_path(device_id),
        [this, gen, device_id](const remote::DocumentSnapshot& snap) {
            if (gen != generation_.load()) return;

            bool revoked = !snap.exists();
            if (!revoked) {
                revoked = DeviceRecord::from_document(snap.id, *snap.data).is_revoked();
            }
            if (!revoked) return;

            forget_umk(true);
            audit_->log(AuditSeverity::WARNING, cat::DEVICE, "STATUS", device_id, device_id,
                        snap.exists() ? "REVOKED" : "DELETED");
            notify_revoked();
        });
    install(&DeviceTrustManager::status_sub_, std::move(sub));
}

void DeviceTrustManager::listen_for_pending_approvals() {
    install(&DeviceTrustManager::pending_sub_, remote::Subscription());
    const uint64_t gen = generation_.load();

    auto sub = remote_->watch_query(devices_path(), fields::STATUS,
                                    device_status_name(DeviceStatus::PENDING),
        [this, gen](const std::vector<remote::DocumentSnapshot>& snaps) {
            if (gen != generation_.load()) return;
            handle_pending_snapshot(snaps);
        });
    install(&DeviceTrustManager::pending_sub_, std::move(sub));
}

void DeviceTrustManager::handle_pending_snapshot(const std::vector<remote::DocumentSnapshot>& snaps) {
    std::vector<ApprovalRequest> requests;
    for (const auto& r : parse_records(snaps)) requests.push_back(ApprovalRequest::from_record(r));

    std::vector<ApprovalRequest> fresh;
    PendingCallback on_pending;
    NewRequestCallback on_new;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_ = requests;
        on_pending = on_pending_changed_;
        on_new = on_new_approval_request_;
        for (const auto& req : requests) {
            if (seen_pending_ids_.insert(req.device_id).second) fresh.push_back(req);
        }
    }

    if (on_pending) on_pending(requests);
    if (on_new && !fresh.empty() && is_master_device()) {
        for (const auto& req : fresh) on_new(req);
    }
}

void DeviceTrustManager::start_listening_for_current_device() {
    auto device_id = local_->device_id();
    if (!device_id) return;
    listen_for_current_device_status(*device_id);
    listen_for_pending_approvals();
}

// ---- UMK ----

std::optional<crypto::Key> DeviceTrustManager::umk() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return umk_;
}

bool DeviceTrustManager::has_umk() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return umk_.has_value();
}

void DeviceTrustManager::clear_umk() {
    forget_umk(true);
}

// ---- teardown ----

void DeviceTrustManager::clear_local_data() {
    local_->clear_all();
    forget_umk(false);
    std::lock_guard<std::mutex> lock(mutex_);
    was_revoked_ = false;
    pending_.clear();
    seen_pending_ids_.clear();
}

void DeviceTrustManager::clear_all_devices() {
    const std::string path = devices_path();
    remote_->remove_collection(path);
    audit_->log(AuditSeverity::SECURITY, cat::DEVICE, "CLEAR_ALL", actor(), path, "SUCCESS");
}

void DeviceTrustManager::delete_current_device() {
    if (!accounts_->current_account_id()) return;
    auto device_id = local_->device_id();
    if (!device_id) return;

    try {
        remote_->remove(device_path(*device_id));
        audit_->log(AuditSeverity::NOTICE, cat::DEVICE, "DELETE_SELF", *device_id, *device_id, "SUCCESS");
    } catch (const KeywardError& e) {
        // Sign-out proceeds regardless
        audit_->log_failure(AuditSeverity::WARNING, cat::DEVICE, "DELETE_SELF", *device_id, *device_id, e);
    }
}

void DeviceTrustManager::dispose() {
    ++generation_;
    remote::Subscription status, approval, pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        status = std::move(status_sub_);
        approval = std::move(approval_sub_);
        pending = std::move(pending_sub_);
    }
    status.cancel();
    approval.cancel();
    pending.cancel();
}

bool DeviceTrustManager::was_revoked() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return was_revoked_;
}

void DeviceTrustManager::set_revoked_flag() {
    std::lock_guard<std::mutex> lock(mutex_);
    was_revoked_ = true;
}

void DeviceTrustManager::clear_revoked_flag() {
    std::lock_guard<std::mutex> lock(mutex_);
    was_revoked_ = false;
}

// ---- observers ----

void DeviceTrustManager::set_on_umk_changed(UmkCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_umk_changed_ = std::move(callback);
}

void DeviceTrustManager::set_on_revoked(RevokedCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_revoked_ = std::move(callback);
}

void DeviceTrustManager::set_on_pending_changed(PendingCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_pending_changed_ = std::move(callback);
}

void DeviceTrustManager::set_on_new_approval_request(NewRequestCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_new_approval_request_ = std::move(callback);
}

} // namespace device
} // namespace keyward
