#include "recovery_key_manager.hpp"
#include "../core/errors.hpp"
#include "../core/side_channel.hpp"
#include "../keyward_config.hpp"

#include <vector>

namespace keyward {
namespace recovery {

using security::AuditSeverity;
namespace cat = security::category;

namespace {

std::string required_string(const remote::Document& doc, const char* key) {
    auto it = doc.find(key);
    if (it == doc.end() || !it->is_string()) {
        throw KeywardError(std::string("recovery record: missing ") + key);
    }
    return it->get<std::string>();
}

std::optional<std::string> optional_string(const remote::Document& doc, const char* key) {
    auto it = doc.find(key);
    if (it == doc.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

} // namespace

// ---- RecoveryKeyRecord ----

RecoveryKeyRecord RecoveryKeyRecord::from_document(const remote::Document& doc) {
    if (!doc.is_object()) throw KeywardError("recovery record: document is not an object");

    RecoveryKeyRecord r;
    r.encrypted_umk = required_string(doc, fields::ENCRYPTED_UMK);
    r.nonce = required_string(doc, fields::NONCE);
    r.salt = required_string(doc, fields::SALT);
    r.hint = optional_string(doc, fields::HINT);

    r.created_at = std::chrono::system_clock::now();
    if (auto created = optional_string(doc, fields::CREATED_AT)) {
        r.created_at = parse_iso8601(*created);
    }
    if (auto alg = optional_string(doc, fields::KDF_ALGORITHM)) {
        r.kdf_algorithm = crypto::parse_kdf_algorithm(*alg);
    }
    auto imported = doc.find(fields::IMPORTED);
    r.imported = imported != doc.end() && imported->is_boolean() && imported->get<bool>();
    return r;
}

remote::Document RecoveryKeyRecord::to_document() const {
    remote::Document doc = remote::Document::object();
    doc[fields::ENCRYPTED_UMK] = encrypted_umk;
    doc[fields::NONCE] = nonce;
    doc[fields::SALT] = salt;
    if (hint) doc[fields::HINT] = *hint;
    doc[fields::CREATED_AT] = format_iso8601(created_at);
    if (kdf_algorithm) doc[fields::KDF_ALGORITHM] = crypto::kdf_algorithm_name(*kdf_algorithm);
    if (imported) doc[fields::IMPORTED] = true;
    return doc;
}

std::optional<RecoveryKeyRecord> parse_recovery_export(const std::string& data) {
    remote::Document doc = remote::Document::parse(data, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) return std::nullopt;
    try {
        RecoveryKeyRecord r = RecoveryKeyRecord::from_document(doc);
        if (r.encrypted_umk.empty() || r.nonce.empty() || r.salt.empty()) return std::nullopt;
        // Fields must at least decode; the passphrase check happens on use
        base64_decode(r.encrypted_umk);
        base64_decode(r.nonce);
        base64_decode(r.salt);
        r.hint.reset();
        r.imported = true;
        return r;
    } catch (const KeywardError&) {
        return std::nullopt;
    }
}

// ---- RecoveryKeyManager ----

RecoveryKeyManager::RecoveryKeyManager(std::shared_ptr<remote::DocumentStore> remote,
                                       std::shared_ptr<remote::AccountProvider> accounts,
                                       std::shared_ptr<device::DeviceTrustManager> trust,
                                       CustodySettings settings,
                                       std::shared_ptr<security::AuditLogger> audit)
    : remote_(std::move(remote)),
      accounts_(std::move(accounts)),
      trust_(std::move(trust)),
      settings_(std::move(settings)),
      audit_(audit ? std::move(audit) : security::make_default_audit_logger()) {
    if (!remote_ || !accounts_ || !trust_) {
        throw KeywardError("recovery key manager requires a document store, an account provider and a trust manager");
    }
}

std::string RecoveryKeyManager::account_id() {
    auto id = accounts_->current_account_id();
    if (!id || id->empty()) throw NotAuthorizedError("No signed-in account");
    return *id;
}

std::string RecoveryKeyManager::record_path() {
    return remote::paths::recovery_key(account_id());
}

std::optional<RecoveryKeyRecord> RecoveryKeyManager::record() {
    auto doc = remote_->get(record_path());
    if (!doc) return std::nullopt;
    return RecoveryKeyRecord::from_document(*doc);
}

bool RecoveryKeyManager::has_recovery_key() {
    return remote_->get(record_path()).has_value();
}

std::optional<std::string> RecoveryKeyManager::hint() {
    auto r = record();
    if (!r) return std::nullopt;
    return r->hint;
}

std::optional<crypto::Key> RecoveryKeyManager::open_record(const RecoveryKeyRecord& record,
                                                           const std::string& passphrase) {
    std::vector<crypto::KdfAlgorithm> candidates;
    if (record.kdf_algorithm) {
        candidates.push_back(*record.kdf_algorithm);
    } else {
        candidates = {crypto::KdfAlgorithm::PBKDF2, crypto::KdfAlgorithm::ARGON2ID};
    }

    const Bytes salt = base64_decode(record.salt);
    for (auto alg : candidates) {
        // Argon2id is memory-hard; keep it off the calling thread
        crypto::Key key = crypto::derive_key_async(passphrase, salt, alg,
                                                   settings_.allow_memory_hard_kdf).get();
        side_channel::SecureWipe<crypto::Key> wipe_key(key);
        try {
            std::string umk_b64 = crypto::open_string(record.encrypted_umk, record.nonce, key);
            Bytes raw = base64_decode(umk_b64);
            side_channel::secure_zero_string(umk_b64);
            side_channel::SecureWipe<Bytes> wipe_raw(raw);
            return crypto::to_array<crypto::UMK_BYTES>(raw, "recovered UMK");
        } catch (const AuthenticationError&) {
            continue;
        }
    }
    return std::nullopt;
}

void RecoveryKeyManager::store_wrapped(const crypto::Key& umk,
                                       const std::string& passphrase,
                                       const std::optional<std::string>& hint) {
    const Bytes salt = crypto::generate_salt();
    const auto alg = settings_.default_kdf;
    crypto::Key key = crypto::derive_key_async(passphrase, salt, alg,
                                               settings_.allow_memory_hard_kdf).get();
    side_channel::SecureWipe<crypto::Key> wipe_key(key);

    std::string umk_b64 = base64_encode(umk.data(), umk.size());
    auto sealed = crypto::seal_string(umk_b64, key);
    side_channel::secure_zero_string(umk_b64);

    RecoveryKeyRecord r;
    r.encrypted_umk = sealed.ciphertext;
    r.nonce = sealed.nonce;
    r.salt = base64_encode(salt);
    r.hint = hint;
    r.created_at = std::chrono::system_clock::now();
    r.kdf_algorithm = alg;

    remote_->set(record_path(), r.to_document());
}

void RecoveryKeyManager::create(const std::string& passphrase, const std::optional<std::string>& hint) {
    auto umk = trust_->umk();
    if (!umk) throw NotAuthorizedError("cannot create recovery key: UMK not available");
    side_channel::SecureWipe<crypto::Key> wipe(*umk);

    store_wrapped(*umk, passphrase, hint);
    audit_->log(AuditSeverity::SECURITY, cat::RECOVERY, "CREATE", account_id(),
                trust_->current_device_id().value_or(""), "SUCCESS",
                crypto::kdf_algorithm_name(settings_.default_kdf));
}

bool RecoveryKeyManager::verify(const std::string& passphrase) {
    auto r = record();
    if (!r) return false;

    auto umk = open_record(*r, passphrase);
    if (!umk) {
        audit_->log(AuditSeverity::NOTICE, cat::RECOVERY, "VERIFY", account_id(), "recovery_key", "FAILURE");
        return false;
    }
    side_channel::secure_zero_memory(umk->data(), umk->size());
    return true;
}

void RecoveryKeyManager::require_passphrase(const std::string& passphrase, const char* action) {
    if (verify(passphrase)) return;
    audit_->log(AuditSeverity::WARNING, cat::RECOVERY, action, account_id(), "recovery_key", "DENIED",
                "current passphrase rejected");
    throw AuthenticationError("Current passphrase is incorrect");
}

bool RecoveryKeyManager::recover(const std::string& passphrase, const ProgressCallback& progress) {
    auto report = [&](const char* message) {
        if (progress) progress(message);
    };
    const std::string account = account_id();

    report("Fetching recovery data...");
    auto r = record();
    if (!r) {
        audit_->log(AuditSeverity::NOTICE, cat::RECOVERY, "RECOVER", account, "recovery_key", "NOT_FOUND");
        return false;
    }

    report("Decrypting recovery key...");
    auto umk = open_record(*r, passphrase);
    if (!umk) {
        audit_->log(AuditSeverity::WARNING, cat::RECOVERY, "RECOVER", account, "recovery_key", "DENIED",
                    "wrong passphrase");
        return false;
    }
    side_channel::SecureWipe<crypto::Key> wipe(*umk);

    report("Registering device...");
    const std::string device_id = trust_->enrol_recovered_device(*umk);

    report("Completing setup...");
    audit_->log(AuditSeverity::SECURITY, cat::RECOVERY, "RECOVER", account, device_id, "SUCCESS",
                r->imported ? "imported recovery data" : "");
    return true;
}

std::future<bool> RecoveryKeyManager::recover_async(std::string passphrase, ProgressCallback progress) {
    return std::async(std::launch::async,
                      [this, passphrase = std::move(passphrase), progress = std::move(progress)]() mutable {
                          bool ok = recover(passphrase, progress);
                          side_channel::secure_zero_string(passphrase);
                          return ok;
                      });
}

void RecoveryKeyManager::update(const std::string& current_passphrase,
                                const std::string& new_passphrase,
                                const std::optional<std::string>& hint) {
    require_passphrase(current_passphrase, "UPDATE");

    auto umk = trust_->umk();
    if (!umk) throw NotAuthorizedError("cannot update recovery key: UMK not available");
    side_channel::SecureWipe<crypto::Key> wipe(*umk);

    store_wrapped(*umk, new_passphrase, hint);
    audit_->log(AuditSeverity::SECURITY, cat::RECOVERY, "UPDATE", account_id(), "recovery_key", "SUCCESS");
}

void RecoveryKeyManager::remove(const std::string& current_passphrase) {
    require_passphrase(current_passphrase, "REMOVE");
    remote_->remove(record_path());
    audit_->log(AuditSeverity::SECURITY, cat::RECOVERY, "REMOVE", account_id(), "recovery_key", "SUCCESS");
}

void RecoveryKeyManager::discard() {
    if (!has_recovery_key()) return;
    remote_->remove(record_path());
    audit_->log(AuditSeverity::SECURITY, cat::RECOVERY, "DISCARD", account_id(), "recovery_key", "SUCCESS");
}

std::optional<std::string> RecoveryKeyManager::export_recovery_data() {
    auto r = record();
    if (!r) return std::nullopt;

    nlohmann::ordered_json out;
    out[fields::VERSION] = KEYWARD_RECOVERY_EXPORT_VERSION;
    out[fields::ENCRYPTED_UMK] = r->encrypted_umk;
    out[fields::NONCE] = r->nonce;
    out[fields::SALT] = r->salt;
    out[fields::CREATED_AT] = format_iso8601(r->created_at);
    if (r->kdf_algorithm) out[fields::KDF_ALGORITHM] = crypto::kdf_algorithm_name(*r->kdf_algorithm);

    audit_->log(AuditSeverity::NOTICE, cat::RECOVERY, "EXPORT", account_id(), "recovery_key", "SUCCESS");
    return out.dump();
}

bool RecoveryKeyManager::import_recovery_data(const std::string& data) {
    auto r = parse_recovery_export(data);
    if (!r) {
        audit_->log(AuditSeverity::WARNING, cat::RECOVERY, "IMPORT", account_id(), "recovery_key", "FAILURE",
                    "malformed recovery data");
        return false;
    }
    remote_->set(record_path(), r->to_document());
    audit_->log(AuditSeverity::SECURITY, cat::RECOVERY, "IMPORT", account_id(), "recovery_key", "SUCCESS");
    return true;
}

} // namespace recovery
} // namespace keyward
