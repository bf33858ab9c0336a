#ifndef KEYWARD_SECURITY_AUDIT_LOGGER_HPP
#define KEYWARD_SECURITY_AUDIT_LOGGER_HPP

#include <array>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <sodium.h>

namespace keyward {
namespace security {

/**
 * @brief Audit log severity levels (aligned with syslog RFC 5424)
 */
enum class AuditSeverity {
    DEBUG = 7,      ///< Detailed debugging information
    INFO = 6,       ///< Informational messages
    NOTICE = 5,     ///< Normal but significant condition
    WARNING = 4,    ///< Warning conditions
    ERROR = 3,      ///< Error conditions
    CRITICAL = 2,   ///< Critical conditions
    ALERT = 1,      ///< Action must be taken immediately
    EMERGENCY = 0,  ///< System is unusable
    SECURITY = 99   ///< Trust decisions (approve, revoke, recover)
};

const char* severity_to_string(AuditSeverity sev);

/**
 * @throws KeywardError for an unknown name
 */
AuditSeverity severity_from_string(const std::string& name);

/**
 * @brief Audit categories used by the custody services
 */
namespace category {
constexpr const char* DEVICE = "DEVICE";
constexpr const char* RECOVERY = "RECOVERY";
constexpr const char* SERVICE = "SERVICE";
constexpr const char* STORE = "STORE";
} // namespace category

/**
 * @brief Audit record structure
 *
 * Subjects and objects are account or device ids. Key material never
 * appears in a record.
 */
struct AuditRecord {
    uint64_t sequence_number = 0;                         ///< Monotonic sequence number
    std::chrono::system_clock::time_point timestamp;      ///< Event timestamp (UTC)
    AuditSeverity severity = AuditSeverity::INFO;         ///< Severity level

    std::string category;                                 ///< DEVICE, RECOVERY, SERVICE, STORE
    std::string action;                                   ///< e.g. "APPROVE", "RECOVER"
    std::string subject;                                  ///< Acting device or account
    std::string object;                                   ///< Device or record affected
    std::string result;                                   ///< SUCCESS, FAILURE, DENIED

    std::string message;                                  ///< Human-readable message
    std::optional<std::string> error_code;                ///< Exception text on failure

    std::array<uint8_t, 32> previous_hash{};              ///< Previous record hash
    std::array<uint8_t, 32> current_hash{};               ///< Current record hash

    std::optional<std::array<uint8_t, 64>> signature;     ///< Ed25519 signature over current_hash
    std::optional<std::array<uint8_t, 32>> signing_key;   ///< Public key
};

/**
 * @brief Audit logger configuration
 */
struct AuditLoggerConfig {
    std::optional<std::filesystem::path> log_file;         ///< JSON Lines output
    std::optional<std::filesystem::path> chain_file;       ///< Sequence + last hash, restored at startup

    bool enable_signing = false;                           ///< Enable Ed25519 signatures
    std::optional<std::filesystem::path> signing_key_path; ///< Raw 64-byte Ed25519 secret key

    AuditSeverity stderr_threshold = AuditSeverity::WARNING; ///< Echo records at or above this level
    bool echo_to_stderr = true;
};

/**
 * @brief Outcome of verify_log_file
 */
struct ChainVerification {
    bool valid = false;
    uint64_t records_checked = 0;
    std::string failure;    ///< Empty when valid
};

/**
 * @brief Hash-chained audit log for trust decisions
 *
 * Every record is hashed with BLAKE2b-256 over its canonical bytes, which
 * start with the previous record's hash. With signing enabled each hash is
 * also signed with Ed25519. Thread-safe.
 */
class AuditLogger {
public:
    explicit AuditLogger(const AuditLoggerConfig& config = AuditLoggerConfig{});
    ~AuditLogger();

    AuditLogger(const AuditLogger&) = delete;
    AuditLogger& operator=(const AuditLogger&) = delete;

    void log(AuditRecord record);

    void log(AuditSeverity severity,
             const std::string& category,
             const std::string& action,
             const std::string& subject,
             const std::string& object,
             const std::string& result,
             const std::string& message = "");

    /**
     * @brief Log a failed operation, keeping the exception text as error_code
     */
    void log_failure(AuditSeverity severity,
                     const std::string& category,
                     const std::string& action,
                     const std::string& subject,
                     const std::string& object,
                     const std::exception& error);

    void set_on_record_written(std::function<void(const AuditRecord&)> callback);
    void set_on_error(std::function<void(const std::string&)> callback);

    uint64_t get_sequence_number() const;
    std::optional<std::array<uint8_t, 32>> get_last_hash() const;

    /**
     * @brief One JSON object per line, as written to the log file
     */
    static std::string to_json(const AuditRecord& record);

    /**
     * @brief Re-read a log file and check every hash, link and signature
     *
     * The first record's previous hash is taken as the chain anchor, so a
     * log that continues an earlier one still verifies.
     */
    static ChainVerification verify_log_file(const std::filesystem::path& path);

private:
    static std::array<uint8_t, 32> blake2b_hash(const std::vector<uint8_t>& data);
    static std::vector<uint8_t> canonical_bytes(const AuditRecord& record);

    std::array<uint8_t, 64> sign_hash(const std::array<uint8_t, 32>& hash) const;
    void load_chain_state();
    void save_chain_state();
    void write_to_file(const AuditRecord& record);
    void echo(const AuditRecord& record) const;
    void report_error(const std::string& message) const;
    void process_record_unlocked(AuditRecord& record);

    AuditLoggerConfig config_;

    std::array<uint8_t, 32> last_hash_{};
    bool have_last_hash_ = false;
    uint64_t sequence_number_ = 0;

    bool signing_enabled_ = false;
    std::array<uint8_t, crypto_sign_SECRETKEYBYTES> signing_sk_{};
    std::array<uint8_t, crypto_sign_PUBLICKEYBYTES> signing_pk_{};

    mutable std::mutex mutex_;

    std::function<void(const AuditRecord&)> on_record_written_;
    std::function<void(const std::string&)> on_error_;
};

/**
 * @brief Logger used when a service is constructed without one
 *
 * No file output; warnings and above go to stderr.
 */
std::shared_ptr<AuditLogger> make_default_audit_logger();

} // namespace security
} // namespace keyward

#endif // KEYWARD_SECURITY_AUDIT_LOGGER_HPP
