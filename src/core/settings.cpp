#include "settings.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace keyward {

namespace {

std::optional<std::string> env(const char* name) {
    const char* value = std::getenv(name);
    if (!value || std::string(value).empty()) return std::nullopt;
    return std::string(value);
}

bool parse_flag(const char* name, const std::string& value) {
    std::string v = value;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw KeywardError(std::string(name) + ": expected a boolean, got '" + value + "'");
}

long long parse_positive(const char* name, const std::string& value) {
    try {
        size_t used = 0;
        long long n = std::stoll(value, &used);
        if (used != value.size() || n <= 0) throw std::invalid_argument(value);
        return n;
    } catch (const std::logic_error&) {
        throw KeywardError(std::string(name) + ": expected a positive integer, got '" + value + "'");
    }
}

} // namespace

CustodySettings CustodySettings::from_environment(CustodySettings base) {
    if (auto v = env("KEYWARD_ALLOW_ARGON2")) {
        base.allow_memory_hard_kdf = parse_flag("KEYWARD_ALLOW_ARGON2", *v);
    }
    if (auto v = env("KEYWARD_DEFAULT_KDF")) {
        if (*v != "pbkdf2" && *v != "argon2id") {
            throw KeywardError("KEYWARD_DEFAULT_KDF: expected pbkdf2 or argon2id, got '" + *v + "'");
        }
        base.default_kdf = crypto::parse_kdf_algorithm(*v);
    }
    if (auto v = env("KEYWARD_AUTO_SETUP")) {
        base.auto_setup_first_device = parse_flag("KEYWARD_AUTO_SETUP", *v);
    }
    if (auto v = env("KEYWARD_POLL_INTERVAL_MS")) {
        base.approval_poll_interval = std::chrono::milliseconds(
            parse_positive("KEYWARD_POLL_INTERVAL_MS", *v));
    }
    if (auto v = env("KEYWARD_PENDING_EXPIRY_HOURS")) {
        base.pending_expiry = std::chrono::hours(
            parse_positive("KEYWARD_PENDING_EXPIRY_HOURS", *v));
    }
    if (auto v = env("KEYWARD_AUDIT_LOG")) base.audit_log_file = std::filesystem::path(*v);
    if (auto v = env("KEYWARD_AUDIT_CHAIN")) base.audit_chain_file = std::filesystem::path(*v);
    if (auto v = env("KEYWARD_AUDIT_SIGNING_KEY")) base.audit_signing_key = std::filesystem::path(*v);
    if (auto v = env("KEYWARD_DEVICE_NAME")) base.device_name = *v;
    if (auto v = env("KEYWARD_STORAGE_KEY")) {
        if (v->size() != 2 * crypto::KEY_BYTES) {
            throw KeywardError("KEYWARD_STORAGE_KEY: expected 64 hex characters");
        }
        base.storage_key_hex = *v;
    }
    if (auto v = env("KEYWARD_STATE_DIR")) base.state_dir = std::filesystem::path(*v);

    if (base.default_kdf == crypto::KdfAlgorithm::ARGON2ID && !base.allow_memory_hard_kdf) {
        throw KeywardError("default KDF argon2id requires KEYWARD_ALLOW_ARGON2");
    }
    return base;
}

} // namespace keyward
