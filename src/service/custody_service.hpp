#ifndef KEYWARD_SERVICE_CUSTODY_SERVICE_HPP
#define KEYWARD_SERVICE_CUSTODY_SERVICE_HPP

#include "approval_poller.hpp"
#include "../core/settings.hpp"
#include "../device/device_trust_manager.hpp"
#include "../recovery/recovery_key_manager.hpp"
#include "../remote/document_store.hpp"
#include "../security/audit_logger.hpp"
#include "../storage/local_key_store.hpp"

#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>

namespace keyward {
namespace service {

/**
 * @brief Where this device stands in the key-custody lifecycle
 */
enum class CustodyStatus {
    NOT_INITIALIZED,
    NOT_SET_UP,               ///< First device, auto setup disabled
    PENDING_APPROVAL,
    REVOKED,
    NEEDS_RECOVERY,           ///< No device can approve; recover or start fresh
    READY,
    VERIFYING_IN_BACKGROUND,  ///< Usable on cached state while the server is checked
    ERROR
};

/// not_initialized, not_set_up, pending_approval, ...
const char* custody_status_name(CustodyStatus status);

/**
 * @brief Drives a device from sign-in to a usable UMK
 *
 * Owns no key material itself; it sequences the trust manager, the
 * recovery manager and the local store, and publishes a single status.
 * A connectivity failure never downgrades a READY status.
 */
class CustodyService {
public:
    using StatusCallback = std::function<void(CustodyStatus, const std::string&)>;

    CustodyService(std::shared_ptr<storage::LocalKeyStore> local,
                   std::shared_ptr<remote::AccountProvider> accounts,
                   std::shared_ptr<device::DeviceTrustManager> trust,
                   std::shared_ptr<recovery::RecoveryKeyManager> recovery,
                   CustodySettings settings = CustodySettings{},
                   std::shared_ptr<security::AuditLogger> audit = nullptr);
    ~CustodyService();

    CustodyService(const CustodyService&) = delete;
    CustodyService& operator=(const CustodyService&) = delete;

    /**
     * @brief Fast startup: device keys plus a cached "approved" status
     * @return true if the status moved to VERIFYING_IN_BACKGROUND
     */
    bool preload_cached_status();

    /**
     * @brief Resolve this device's status; run once per session
     *
     * Any exception ends in ERROR with its text as the status message.
     */
    CustodyStatus initialize();

    /**
     * @brief Register as the account's first device
     */
    void setup();

    /**
     * @brief While pending, move to READY once approved and the UMK unwraps
     */
    CustodyStatus refresh_status();

    /**
     * @brief Re-run the background check now (e.g. after a connectivity failure)
     */
    CustodyStatus verify_now();

    /**
     * @brief Block until a running background verification finishes
     */
    void wait_for_background_verification();

    /**
     * @brief Recover the UMK with the passphrase and enrol this device
     * @param make_primary also soft-revoke every other device
     * @return false for a wrong passphrase or a missing recovery key
     */
    bool recover_with_passphrase(const std::string& passphrase, bool make_primary = false);

    /**
     * @brief Put this device back into the pending state
     */
    void request_reapproval();

    /**
     * @brief Delete every device record, clear local state and initialize again
     */
    CustodyStatus start_fresh();

    void sign_out();

    CustodyStatus status() const;
    std::string status_message() const;
    bool is_ready() const;
    bool is_available() const;
    bool needs_recovery_key_setup() const;
    void set_needs_recovery_key_setup(bool needed);
    bool is_verifying_in_background() const;

    /// Set when background verification hit a connectivity failure
    bool verification_retry_pending() const;

    void set_on_status_changed(StatusCallback callback);

    std::shared_ptr<device::DeviceTrustManager> trust() const { return trust_; }
    std::shared_ptr<recovery::RecoveryKeyManager> recovery() const { return recovery_; }

private:
    void set_status(CustodyStatus status, const std::string& message = "");
    void set_and_cache(CustodyStatus status, const char* cached);

    CustodyStatus resolve_unregistered();
    CustodyStatus resolve_registered();

    void start_background_verification();
    void run_background_verification();
    void sync_poller();
    void wire_listeners();
    void unwire_listeners();
    std::string account_label() const;

    std::shared_ptr<storage::LocalKeyStore> local_;
    std::shared_ptr<remote::AccountProvider> accounts_;
    std::shared_ptr<device::DeviceTrustManager> trust_;
    std::shared_ptr<recovery::RecoveryKeyManager> recovery_;
    CustodySettings settings_;
    std::shared_ptr<security::AuditLogger> audit_;

    mutable std::mutex mutex_;
    CustodyStatus status_ = CustodyStatus::NOT_INITIALIZED;
    std::string status_message_;
    bool needs_recovery_key_setup_ = false;
    bool retry_verification_ = false;
    StatusCallback on_status_changed_;

    std::future<void> background_;
    ApprovalPoller poller_;
};

} // namespace service
} // namespace keyward

#endif // KEYWARD_SERVICE_CUSTODY_SERVICE_HPP
