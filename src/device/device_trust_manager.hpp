#ifndef KEYWARD_DEVICE_DEVICE_TRUST_MANAGER_HPP
#define KEYWARD_DEVICE_DEVICE_TRUST_MANAGER_HPP

#include "device_identity.hpp"
#include "device_record.hpp"
#include "../core/settings.hpp"
#include "../crypto/primitives.hpp"
#include "../remote/document_store.hpp"
#include "../security/audit_logger.hpp"
#include "../storage/local_key_store.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace keyward {
namespace device {

/**
 * @brief Counts from set_current_device_as_primary
 */
struct PrimaryTakeover {
    size_t revoked = 0;   ///< Other approved devices soft-revoked
    size_t deleted = 0;   ///< Other pending devices deleted
};

/**
 * @brief Registers devices and moves the UMK between them
 *
 * Each device owns an X25519 key pair. An approved device wraps the UMK for
 * a pending device under the raw ECDH secret of (own private key, pending
 * public key) and publishes its own public key next to the wrap; the first
 * device wraps for itself. Only a device holding the UMK may approve,
 * revoke or reset another device, and no device may act on itself.
 *
 * "Only the master device approves" is a policy exposed through
 * is_master_device(); nothing here enforces it. Concurrent approvals or
 * revocations of the same record are not serialized: the last write wins.
 *
 * Callbacks run on whichever thread delivered the store notification and
 * never while the manager's lock is held.
 */
class DeviceTrustManager {
public:
    using UmkCallback = std::function<void(bool available)>;
    using RevokedCallback = std::function<void()>;
    using PendingCallback = std::function<void(const std::vector<ApprovalRequest>&)>;
    using NewRequestCallback = std::function<void(const ApprovalRequest&)>;

    DeviceTrustManager(std::shared_ptr<remote::DocumentStore> remote,
                       std::shared_ptr<storage::LocalKeyStore> local,
                       std::shared_ptr<remote::AccountProvider> accounts,
                       DeviceIdentity identity,
                       CustodySettings settings = CustodySettings{},
                       std::shared_ptr<security::AuditLogger> audit = nullptr);
    ~DeviceTrustManager();

    DeviceTrustManager(const DeviceTrustManager&) = delete;
    DeviceTrustManager& operator=(const DeviceTrustManager&) = delete;

    /**
     * @brief Restore state after sign-in
     *
     * Loads the cached UMK, then reconciles with this device's remote
     * record: missing clears local state, revoked drops the cached UMK,
     * approved unwraps (if needed) and starts the listeners.
     */
    void init();

    /**
     * @brief Load the locally cached UMK without contacting the remote store
     * @return true if a cached UMK was found
     */
    bool load_cached_umk();

    // ---- Queries ----

    std::optional<std::string> current_device_id();
    std::optional<DeviceRecord> current_device_record();
    bool is_first_device();
    bool has_approved_devices();

    /// Approved device with the earliest created_at
    std::optional<DeviceRecord> primary_device();
    bool current_device_matches_primary_name();

    bool is_device_approved();
    bool is_device_pending();
    bool is_device_revoked();
    bool device_exists_on_server();

    /**
     * @brief Re-check this device's record, firing the revoked callback if needed
     * @return false if revoked or missing; true on a connectivity failure
     */
    bool check_current_device_authorization();

    /**
     * @brief Unwrap the UMK if the record is approved and it is not held yet
     */
    bool try_retrieve_umk();

    /**
     * @brief Earliest approved_at (falling back to created_at) among approved devices
     *
     * With no approved devices at all, any registered device counts as master.
     */
    bool is_master_device();

    /// Current device first, then newest first
    std::vector<DeviceRecord> devices();

    /// Last list delivered by the pending listener
    std::vector<ApprovalRequest> pending_approvals() const;
    std::vector<ApprovalRequest> refresh_pending_approvals();

    const DeviceIdentity& identity() const { return identity_; }

    // ---- Lifecycle ----

    /**
     * @brief Create the UMK and register this device as approved
     *
     * The remote record (with a self-wrap) is written before any secret is
     * kept locally.
     * @return new device id
     */
    std::string register_first_device();

    /**
     * @brief Register as pending and listen for approval
     *
     * Reuses this device's pending record, or a pending record with the
     * same name and platform, instead of creating a duplicate.
     */
    void register_new_device();

    /**
     * @throws NotAuthorizedError if this device does not hold the UMK
     * @throws InvalidStateError for self-approval or a non-pending target
     * @throws NotFoundError if the target does not exist
     */
    void approve_device(const std::string& pending_id);

    /**
     * @brief Hard revoke: delete the record
     * @throws NotAuthorizedError without the UMK
     * @throws InvalidStateError when targeting this device
     */
    void revoke_device(const std::string& device_id);

    /**
     * @brief Drop the wrap and return the record to pending
     * @throws NotFoundError if the record does not exist
     */
    void reset_device_to_pending(const std::string& device_id);

    /**
     * @brief Ask to be approved again after revocation
     */
    void request_reapproval();

    /**
     * @brief Soft-revoke every other approved device and delete every other pending one
     *
     * One atomic batch. Revoked records also lose their wrap fields.
     * @throws InvalidStateError if this device is not registered
     */
    PrimaryTakeover set_current_device_as_primary();

    /**
     * @brief Delete other pending records older than pending_expiry or without created_at
     * @return number of records deleted
     */
    size_t purge_expired_pending(Timestamp now = std::chrono::system_clock::now());

    /**
     * @brief Register this device as approved with an existing UMK
     *
     * Deletes this device's previous record (if any) and local state first.
     * Used after passphrase recovery; the record is marked recovered.
     * @return new device id
     */
    std::string enrol_recovered_device(const crypto::Key& umk);

    /**
     * @brief Start the own-status and pending-list listeners
     */
    void start_listening_for_current_device();

    // ---- UMK ----

    std::optional<crypto::Key> umk() const;
    bool has_umk() const;
    void clear_umk();

    // ---- Teardown ----

    void clear_local_data();

    /**
     * @brief Delete every device record of the account (fresh start)
     */
    void clear_all_devices();

    /**
     * @brief Delete this device's record; failures are audited, never thrown
     */
    void delete_current_device();

    /**
     * @brief Cancel every listener; idempotent
     */
    void dispose();

    bool was_revoked() const;
    void set_revoked_flag();
    void clear_revoked_flag();

    // ---- Observers ----

    void set_on_umk_changed(UmkCallback callback);
    void set_on_revoked(RevokedCallback callback);
    void set_on_pending_changed(PendingCallback callback);

    /**
     * @brief Fires once per newly seen pending device, only on the master device
     */
    void set_on_new_approval_request(NewRequestCallback callback);

private:
    std::string account_id();
    std::string devices_path();
    std::string device_path(const std::string& device_id);
    std::string actor();

    std::optional<DeviceRecord> fetch(const std::string& device_id);
    std::vector<DeviceRecord> parse_records(const std::vector<remote::DocumentSnapshot>& snaps);
    std::vector<DeviceRecord> fetch_all();

    std::string enrol(const crypto::Key& umk, bool recovered);
    crypto::Key require_umk(const char* operation) const;
    void require_not_self(const std::string& device_id, const char* operation);

    crypto::SealedString wrap_umk(const crypto::Key& umk,
                                  const crypto::PrivateKey& own_private,
                                  const crypto::PublicKey& peer_public) const;
    void unwrap_and_cache(const DeviceRecord& record);

    void set_umk(const crypto::Key& umk);
    void forget_umk(bool clear_local);
    void notify_revoked();

    void listen_for_approval(const std::string& device_id);
    void listen_for_current_device_status(const std::string& device_id);
    void listen_for_pending_approvals();
    void handle_pending_snapshot(const std::vector<remote::DocumentSnapshot>& snaps);
    void install(remote::Subscription DeviceTrustManager::*slot, remote::Subscription sub);

    std::shared_ptr<remote::DocumentStore> remote_;
    std::shared_ptr<storage::LocalKeyStore> local_;
    std::shared_ptr<remote::AccountProvider> accounts_;
    DeviceIdentity identity_;
    CustodySettings settings_;
    std::shared_ptr<security::AuditLogger> audit_;

    mutable std::mutex mutex_;
    std::optional<crypto::Key> umk_;
    bool was_revoked_ = false;
    std::vector<ApprovalRequest> pending_;
    std::set<std::string> seen_pending_ids_;

    std::atomic<uint64_t> generation_{0};   ///< Bumped by dispose(); stale listener events are dropped
    remote::Subscription status_sub_;
    remote::Subscription approval_sub_;
    remote::Subscription pending_sub_;

    UmkCallback on_umk_changed_;
    RevokedCallback on_revoked_;
    PendingCallback on_pending_changed_;
    NewRequestCallback on_new_approval_request_;
};

} // namespace device
} // namespace keyward

#endif // KEYWARD_DEVICE_DEVICE_TRUST_MANAGER_HPP
