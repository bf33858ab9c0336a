#ifndef KEYWARD_CORE_SETTINGS_HPP
#define KEYWARD_CORE_SETTINGS_HPP

#include "../keyward_config.hpp"
#include "../crypto/kdf.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace keyward {

/**
 * @brief Runtime configuration shared by the custody services
 */
struct CustodySettings {
    bool allow_memory_hard_kdf = KEYWARD_ALLOW_MEMORY_HARD_KDF;             ///< Argon2id permitted on this device
    crypto::KdfAlgorithm default_kdf = crypto::current_default_algorithm(); ///< KDF for new recovery keys
    bool auto_setup_first_device = KEYWARD_AUTO_SETUP_FIRST_DEVICE;         ///< Register first device in initialize()

    std::chrono::milliseconds approval_poll_interval{KEYWARD_APPROVAL_POLL_INTERVAL_MS}; ///< Poll while pending
    std::chrono::hours pending_expiry{KEYWARD_PENDING_EXPIRY_HOURS};       ///< Age at which pending records are purged

    std::optional<std::filesystem::path> audit_log_file;                    ///< JSON Lines audit log
    std::optional<std::filesystem::path> audit_chain_file;                  ///< Audit chain state
    std::optional<std::filesystem::path> audit_signing_key;                 ///< Ed25519 secret key; signs audit records
    std::optional<std::string> device_name;                                 ///< Override detected device name
    std::optional<std::string> storage_key_hex;                             ///< 64 hex chars; seals local values
    std::optional<std::filesystem::path> state_dir;                         ///< CLI local state directory

    /**
     * @brief Overlay KEYWARD_* environment variables onto base
     * @throws KeywardError on malformed values
     */
    static CustodySettings from_environment(CustodySettings base = CustodySettings{});
};

} // namespace keyward

#endif // KEYWARD_CORE_SETTINGS_HPP
