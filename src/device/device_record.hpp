#ifndef KEYWARD_DEVICE_DEVICE_RECORD_HPP
#define KEYWARD_DEVICE_DEVICE_RECORD_HPP

#include "../core/encoding.hpp"
#include "../remote/document_store.hpp"

#include <map>
#include <optional>
#include <string>

namespace keyward {
namespace device {

/**
 * @brief Trust state of a device record
 */
enum class DeviceStatus {
    PENDING,    ///< Registered, waiting for an approved device to wrap the UMK for it
    APPROVED,   ///< Holds a wrapped UMK
    REVOKED     ///< Soft-revoked; record kept, wrap removed
};

const char* device_status_name(DeviceStatus status);

/// Unknown or missing names read as PENDING
DeviceStatus parse_device_status(const std::string& name);

/**
 * @brief Field names of a device document
 */
namespace fields {
constexpr const char* NAME = "name";
constexpr const char* PLATFORM = "platform";
constexpr const char* PUBLIC_KEY = "public_key";
constexpr const char* WRAPPED_UMK = "wrapped_umk";
constexpr const char* WRAPPED_UMK_NONCE = "wrapped_umk_nonce";
constexpr const char* APPROVED_BY_PUBLIC_KEY = "approved_by_public_key";
constexpr const char* STATUS = "status";
constexpr const char* CREATED_AT = "created_at";
constexpr const char* APPROVED_AT = "approved_at";
constexpr const char* REVOKED_AT = "revoked_at";
constexpr const char* DEVICE_DETAILS = "device_details";
constexpr const char* RECOVERED = "recovered";
} // namespace fields

/**
 * @brief One registered device of an account
 *
 * wrapped_umk is present iff status is APPROVED.
 */
struct DeviceRecord {
    std::string id;
    std::string name = "Unknown Device";
    std::string platform = "unknown";
    std::string public_key;                              ///< base64 X25519 public key
    std::optional<std::string> wrapped_umk;              ///< base64(ct || tag)
    std::optional<std::string> wrapped_umk_nonce;        ///< base64 nonce
    std::optional<std::string> approved_by_public_key;   ///< Approver's public key; absent for self-wraps
    DeviceStatus status = DeviceStatus::PENDING;
    std::optional<Timestamp> created_at;                 ///< Absent only on malformed records
    std::optional<Timestamp> approved_at;
    std::optional<Timestamp> revoked_at;
    std::map<std::string, std::string> device_details;   ///< manufacturer, model, os_version, ...
    bool recovered = false;                              ///< Enrolled through a recovery key

    bool is_approved() const { return status == DeviceStatus::APPROVED; }
    bool is_pending() const { return status == DeviceStatus::PENDING; }
    bool is_revoked() const { return status == DeviceStatus::REVOKED; }
    bool has_wrapped_umk() const { return wrapped_umk && wrapped_umk_nonce; }

    /**
     * @brief "manufacturer model", or the device name when neither is known
     */
    std::string description() const;

    /**
     * @throws KeywardError if public_key is missing or the document is not an object
     */
    static DeviceRecord from_document(const std::string& id, const remote::Document& doc);
    remote::Document to_document() const;
};

/**
 * @brief Read-only view of a pending record offered to approvers
 */
struct ApprovalRequest {
    std::string device_id;
    std::string device_name;
    std::string platform;
    std::string public_key;
    std::optional<Timestamp> requested_at;
    std::string description;

    static ApprovalRequest from_record(const DeviceRecord& record);
};

} // namespace device
} // namespace keyward

#endif // KEYWARD_DEVICE_DEVICE_RECORD_HPP
