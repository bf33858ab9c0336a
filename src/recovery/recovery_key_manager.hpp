#ifndef KEYWARD_RECOVERY_RECOVERY_KEY_MANAGER_HPP
#define KEYWARD_RECOVERY_RECOVERY_KEY_MANAGER_HPP

#include "../core/settings.hpp"
#include "../crypto/kdf.hpp"
#include "../device/device_trust_manager.hpp"
#include "../remote/document_store.hpp"
#include "../security/audit_logger.hpp"

#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>

namespace keyward {
namespace recovery {

namespace fields {
constexpr const char* ENCRYPTED_UMK = "encrypted_umk";
constexpr const char* NONCE = "nonce";
constexpr const char* SALT = "salt";
constexpr const char* HINT = "hint";
constexpr const char* CREATED_AT = "created_at";
constexpr const char* KDF_ALGORITHM = "kdf_algorithm";
constexpr const char* IMPORTED = "imported";
constexpr const char* VERSION = "version";
} // namespace fields

/**
 * @brief The account's passphrase-wrapped UMK
 *
 * Byte fields are kept in their base64 wire form.
 */
struct RecoveryKeyRecord {
    std::string encrypted_umk;
    std::string nonce;
    std::string salt;
    std::optional<std::string> hint;
    Timestamp created_at{};
    std::optional<crypto::KdfAlgorithm> kdf_algorithm;   ///< Absent on legacy records
    bool imported = false;

    /**
     * @throws KeywardError if a required field is missing or not a string
     */
    static RecoveryKeyRecord from_document(const remote::Document& doc);
    remote::Document to_document() const;
};

/**
 * @brief Progress messages from recover()
 */
using ProgressCallback = std::function<void(const std::string&)>;

/**
 * @brief Creates, checks and uses the passphrase recovery key
 *
 * Knowing the passphrase is sufficient authorization: a successful
 * recover() enrols this device as approved without any other device
 * taking part.
 */
class RecoveryKeyManager {
public:
    RecoveryKeyManager(std::shared_ptr<remote::DocumentStore> remote,
                       std::shared_ptr<remote::AccountProvider> accounts,
                       std::shared_ptr<device::DeviceTrustManager> trust,
                       CustodySettings settings = CustodySettings{},
                       std::shared_ptr<security::AuditLogger> audit = nullptr);

    bool has_recovery_key();
    std::optional<std::string> hint();
    std::optional<RecoveryKeyRecord> record();

    /**
     * @brief Wrap the held UMK under a key derived from the passphrase
     *
     * Replaces any existing recovery key.
     * @throws NotAuthorizedError if the UMK is not held
     */
    void create(const std::string& passphrase, const std::optional<std::string>& hint = std::nullopt);

    /**
     * @return true iff the passphrase opens the stored record; false if there is none
     * @throws UnsupportedOperationError if only Argon2id could open it and it is disabled
     */
    bool verify(const std::string& passphrase);

    /**
     * @brief Unwrap the UMK with the passphrase and enrol this device
     * @return false for a missing record or a wrong passphrase
     * @throws UnsupportedOperationError "use a different device to recover"
     * @throws ConnectivityError if the store cannot be reached
     */
    bool recover(const std::string& passphrase, const ProgressCallback& progress = nullptr);

    /**
     * @brief recover() on a worker thread
     */
    std::future<bool> recover_async(std::string passphrase, ProgressCallback progress = nullptr);

    /**
     * @throws AuthenticationError("Current passphrase is incorrect")
     * @throws NotAuthorizedError if the UMK is not held
     */
    void update(const std::string& current_passphrase,
                const std::string& new_passphrase,
                const std::optional<std::string>& hint = std::nullopt);

    /**
     * @throws AuthenticationError("Current passphrase is incorrect")
     */
    void remove(const std::string& current_passphrase);

    /// Delete the record without a passphrase, for when its UMK generation is gone
    void discard();

    /**
     * @brief Serialize the record for offline backup
     * @return nullopt if there is no recovery key
     */
    std::optional<std::string> export_recovery_data();

    /**
     * @brief Replace the account's record with exported data
     * @return false on malformed input
     */
    bool import_recovery_data(const std::string& data);

private:
    std::string account_id();
    std::string record_path();

    /// Try the record's algorithm, or PBKDF2 then Argon2id for legacy records
    std::optional<crypto::Key> open_record(const RecoveryKeyRecord& record, const std::string& passphrase);
    void store_wrapped(const crypto::Key& umk, const std::string& passphrase,
                       const std::optional<std::string>& hint);
    void require_passphrase(const std::string& passphrase, const char* action);

    std::shared_ptr<remote::DocumentStore> remote_;
    std::shared_ptr<remote::AccountProvider> accounts_;
    std::shared_ptr<device::DeviceTrustManager> trust_;
    CustodySettings settings_;
    std::shared_ptr<security::AuditLogger> audit_;
};

/**
 * @brief Parse exported recovery data without touching any store
 * @return nullopt on malformed input
 */
std::optional<RecoveryKeyRecord> parse_recovery_export(const std::string& data);

} // namespace recovery
} // namespace keyward

#endif // KEYWARD_RECOVERY_RECOVERY_KEY_MANAGER_HPP
