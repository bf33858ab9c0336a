#include "custody_service.hpp"
#include "../core/errors.hpp"

namespace keyward {
namespace service {

using security::AuditSeverity;
namespace cat = security::category;
namespace cached = storage::cached_status;

const char* custody_status_name(CustodyStatus status) {
    switch (status) {
        case CustodyStatus::NOT_INITIALIZED: return "not_initialized";
        case CustodyStatus::NOT_SET_UP: return "not_set_up";
        case CustodyStatus::PENDING_APPROVAL: return "pending_approval";
        case CustodyStatus::REVOKED: return "revoked";
        case CustodyStatus::NEEDS_RECOVERY: return "needs_recovery";
        case CustodyStatus::READY: return "ready";
        case CustodyStatus::VERIFYING_IN_BACKGROUND: return "verifying_in_background";
        case CustodyStatus::ERROR: return "error";
        default: return "unknown";
    }
}

CustodyService::CustodyService(std::shared_ptr<storage::LocalKeyStore> local,
                               std::shared_ptr<remote::AccountProvider> accounts,
                               std::shared_ptr<device::DeviceTrustManager> trust,
                               std::shared_ptr<recovery::RecoveryKeyManager> recovery,
                               CustodySettings settings,
                               std::shared_ptr<security::AuditLogger> audit)
    : local_(std::move(local)),
      accounts_(std::move(accounts)),
      trust_(std::move(trust)),
      recovery_(std::move(recovery)),
      settings_(std::move(settings)),
      audit_(audit ? std::move(audit) : security::make_default_audit_logger()) {
    if (!local_ || !accounts_ || !trust_ || !recovery_) {
        throw KeywardError("custody service requires a local store, an account provider, "
                           "a trust manager and a recovery manager");
    }
    poller_.set_error_handler([this](const std::string& message) {
        audit_->log(AuditSeverity::WARNING, cat::SERVICE, "POLL", account_label(), "approval", "FAILURE", message);
    });
    wire_listeners();
}

CustodyService::~CustodyService() {
    poller_.stop();
    if (background_.valid()) background_.wait();
    unwire_listeners();
}

// ---- status ----

void CustodyService::set_status(CustodyStatus status, const std::string& message) {
    StatusCallback cb;
    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        changed = status_ != status;
        status_ = status;
        status_message_ = message;
        cb = on_status_changed_;
    }
    if (changed) {
        audit_->log(status == CustodyStatus::ERROR ? AuditSeverity::ERROR : AuditSeverity::INFO,
                    cat::SERVICE, "STATUS", account_label(), custody_status_name(status), "SUCCESS", message);
    }
    if (cb) cb(status, message);
}

void CustodyService::set_and_cache(CustodyStatus status, const char* cached_value) {
    set_status(status);
    local_->cache_device_status(cached_value);
}

CustodyStatus CustodyService::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

std::string CustodyService::status_message() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_message_;
}

bool CustodyService::is_ready() const {
    auto s = status();
    return s == CustodyStatus::READY || s == CustodyStatus::VERIFYING_IN_BACKGROUND;
}

bool CustodyService::is_available() const {
    return trust_->has_umk();
}

bool CustodyService::needs_recovery_key_setup() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return needs_recovery_key_setup_;
}

void CustodyService::set_needs_recovery_key_setup(bool needed) {
    std::lock_guard<std::mutex> lock(mutex_);
    needs_recovery_key_setup_ = needed;
}

bool CustodyService::is_verifying_in_background() const {
    return status() == CustodyStatus::VERIFYING_IN_BACKGROUND;
}

bool CustodyService::verification_retry_pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return retry_verification_;
}

void CustodyService::set_on_status_changed(StatusCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_status_changed_ = std::move(callback);
}

std::string CustodyService::account_label() const {
    return accounts_->current_account_id().value_or("signed-out");
}

// ---- listeners ----

void CustodyService::wire_listeners() {
    trust_->set_on_umk_changed([this](bool available) {
        if (available && status() == CustodyStatus::PENDING_APPROVAL) {
            set_and_cache(CustodyStatus::READY, cached::APPROVED);
        }
    });
    trust_->set_on_revoked([this]() {
        set_and_cache(CustodyStatus::REVOKED, cached::REVOKED);
        trust_->clear_revoked_flag();
    });
}

void CustodyService::unwire_listeners() {
    trust_->set_on_umk_changed(nullptr);
    trust_->set_on_revoked(nullptr);
}

void CustodyService::sync_poller() {
    if (status() != CustodyStatus::PENDING_APPROVAL) {
        poller_.stop();
        return;
    }
    poller_.start(settings_.approval_poll_interval, [this]() {
        return refresh_status() == CustodyStatus::PENDING_APPROVAL;
    });
}

// ---- initialization ----

bool CustodyService::preload_cached_status() {
    if (!local_->has_device_keys()) return false;
    if (local_->cached_device_status() != std::string(cached::APPROVED)) return false;
    set_status(CustodyStatus::VERIFYING_IN_BACKGROUND, "Verifying encryption...");
    return true;
}

CustodyStatus CustodyService::initialize() {
    if (!accounts_->current_account_id()) {
        set_status(CustodyStatus::ERROR, "No signed-in account");
        return CustodyStatus::ERROR;
    }

    try {
        if (status() == CustodyStatus::VERIFYING_IN_BACKGROUND) {
            trust_->load_cached_umk();
            start_background_verification();
            return status();
        }

        if (local_->sign_in_interrupted()) {
            audit_->log(AuditSeverity::NOTICE, cat::SERVICE, "INITIALIZE", account_label(), "sign_in",
                        "RESUMED", "previous sign-in was interrupted");
            local_->set_sign_in_progress(false);
            local_->clear_device_status();
        }
        local_->set_sign_in_progress(true);

        const bool has_keys = local_->has_device_keys();
        if (has_keys) {
            auto cached_value = local_->cached_device_status();
            if (cached_value == std::string(cached::APPROVED)) {
                set_status(CustodyStatus::VERIFYING_IN_BACKGROUND, "Verifying encryption...");
                trust_->load_cached_umk();
                local_->set_sign_in_progress(false);
                start_background_verification();
                return status();
            }
            if (cached_value == std::string(cached::PENDING)) {
                set_status(CustodyStatus::PENDING_APPROVAL);
            } else if (cached_value == std::string(cached::REVOKED)) {
                set_status(CustodyStatus::REVOKED);
            }
        }

        trust_->init();
        CustodyStatus result = has_keys ? resolve_registered() : resolve_unregistered();

        local_->set_sign_in_progress(false);
        sync_poller();
        return result;
    } catch (const std::exception& e) {
        audit_->log_failure(AuditSeverity::ERROR, cat::SERVICE, "INITIALIZE", account_label(), "custody", e);
        set_status(CustodyStatus::ERROR, e.what());
        return CustodyStatus::ERROR;
    }
}

CustodyStatus CustodyService::resolve_unregistered() {
    if (trust_->is_first_device()) {
        if (!settings_.auto_setup_first_device) {
            set_status(CustodyStatus::NOT_SET_UP);
            return CustodyStatus::NOT_SET_UP;
        }
        setup();
        return status();
    }

    // Nobody can approve, or this is most likely the primary device reinstalled
    if (!trust_->has_approved_devices() || trust_->current_device_matches_primary_name()) {
        set_and_cache(CustodyStatus::NEEDS_RECOVERY, cached::NEEDS_RECOVERY);
        return CustodyStatus::NEEDS_RECOVERY;
    }

    trust_->register_new_device();
    set_and_cache(CustodyStatus::PENDING_APPROVAL, cached::PENDING);
    return status();
}

CustodyStatus CustodyService::resolve_registered() {
    auto record = trust_->current_device_record();
    if (!record) {
        audit_->log(AuditSeverity::WARNING, cat::SERVICE, "INITIALIZE", account_label(), "device",
                    "MISSING", "local keys orphaned, starting over");
        trust_->clear_local_data();
        return resolve_unregistered();
    }

    if (record->is_revoked()) {
        set_and_cache(CustodyStatus::REVOKED, cached::REVOKED);
        trust_->set_revoked_flag();
        return CustodyStatus::REVOKED;
    }

    if (record->is_pending()) {
        // Re-attaches the approval listener to the existing pending record
        trust_->register_new_device();
        set_and_cache(CustodyStatus::PENDING_APPROVAL, cached::PENDING);
        return status();
    }

    if (!record->is_approved()) {
        set_status(CustodyStatus::ERROR, "Device in unknown state");
        return CustodyStatus::ERROR;
    }

    if (!trust_->has_umk() && !trust_->try_retrieve_umk()) {
        set_status(CustodyStatus::ERROR, "Could not unlock the encryption key on this device");
        return CustodyStatus::ERROR;
    }

    set_and_cache(CustodyStatus::READY, cached::APPROVED);
    return CustodyStatus::READY;
}

void CustodyService::setup() {
    trust_->register_first_device();
    set_needs_recovery_key_setup(true);
    set_and_cache(CustodyStatus::READY, cached::APPROVED);
}

// ---- background verification ----

void CustodyService::start_background_verification() {
    if (background_.valid()) background_.wait();
    background_ = std::async(std::launch::async, [this]() { run_background_verification(); });
}

void CustodyService::wait_for_background_verification() {
    if (background_.valid()) background_.get();
}

void CustodyService::run_background_verification() {
    try {
        auto record = trust_->current_device_record();
        if (!record) {
            // Deleted counts as revoked for the key this device held
            trust_->clear_umk();
            set_and_cache(CustodyStatus::NEEDS_RECOVERY, cached::NEEDS_RECOVERY);
            return;
        }
        if (record->is_revoked()) {
            trust_->clear_umk();
            set_and_cache(CustodyStatus::REVOKED, cached::REVOKED);
            trust_->set_revoked_flag();
            return;
        }
        if (!record->is_approved()) {
            set_and_cache(CustodyStatus::NEEDS_RECOVERY, cached::NEEDS_RECOVERY);
            return;
        }
        if (!trust_->has_umk() && !trust_->try_retrieve_umk()) {
            set_status(CustodyStatus::ERROR, "Could not unlock the encryption key on this device");
            return;
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            retry_verification_ = false;
        }
        set_and_cache(CustodyStatus::READY, cached::APPROVED);
        trust_->start_listening_for_current_device();
    } catch (const ConnectivityError& e) {
        // Unreachable is not denied: stay usable and check again later
        {
            std::lock_guard<std::mutex> lock(mutex_);
            retry_verification_ = true;
        }
        audit_->log_failure(AuditSeverity::NOTICE, cat::SERVICE, "VERIFY", account_label(), "device", e);
        set_status(CustodyStatus::READY, "Verification deferred: remote store unreachable");
    } catch (const std::exception& e) {
        audit_->log_failure(AuditSeverity::ERROR, cat::SERVICE, "VERIFY", account_label(), "device", e);
        set_status(CustodyStatus::ERROR, e.what());
    }
}

CustodyStatus CustodyService::verify_now() {
    if (background_.valid()) background_.wait();
    run_background_verification();
    return status();
}

CustodyStatus CustodyService::refresh_status() {
    if (status() != CustodyStatus::PENDING_APPROVAL) return status();
    if (trust_->is_device_approved() && trust_->try_retrieve_umk()) {
        // The UMK listener may have moved the status already
        if (status() != CustodyStatus::READY) set_and_cache(CustodyStatus::READY, cached::APPROVED);
    }
    return status();
}

// ---- user actions ----

bool CustodyService::recover_with_passphrase(const std::string& passphrase, bool make_primary) {
    if (!recovery_->recover(passphrase)) return false;

    if (make_primary) {
        auto takeover = trust_->set_current_device_as_primary();
        audit_->log(AuditSeverity::SECURITY, cat::SERVICE, "RECOVER", account_label(), "devices", "SUCCESS",
                    "primary takeover: revoked " + std::to_string(takeover.revoked) + ", deleted " +
                        std::to_string(takeover.deleted));
    }
    trust_->clear_revoked_flag();
    set_needs_recovery_key_setup(false);
    set_and_cache(CustodyStatus::READY, cached::APPROVED);
    sync_poller();
    return true;
}

void CustodyService::request_reapproval() {
    trust_->request_reapproval();
    trust_->clear_revoked_flag();
    set_and_cache(CustodyStatus::PENDING_APPROVAL, cached::PENDING);
    sync_poller();
}

CustodyStatus CustodyService::start_fresh() {
    poller_.stop();
    if (background_.valid()) background_.wait();

    trust_->dispose();
    trust_->clear_all_devices();
    recovery_->discard();
    trust_->clear_local_data();
    local_->clear_all();
    audit_->log(AuditSeverity::SECURITY, cat::SERVICE, "START_FRESH", account_label(), "devices", "SUCCESS");

    set_status(CustodyStatus::NOT_INITIALIZED);
    return initialize();
}

void CustodyService::sign_out() {
    poller_.stop();
    if (background_.valid()) background_.wait();

    const std::string account = account_label();
    trust_->dispose();
    trust_->delete_current_device();
    trust_->clear_umk();
    trust_->clear_local_data();
    local_->clear_all();
    accounts_->sign_out();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        needs_recovery_key_setup_ = false;
        retry_verification_ = false;
    }
    audit_->log(AuditSeverity::NOTICE, cat::SERVICE, "SIGN_OUT", account, "custody", "SUCCESS");
    set_status(CustodyStatus::NOT_INITIALIZED);
}

} // namespace service
} // namespace keyward
