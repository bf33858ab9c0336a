/**
 * @file test_support.hpp
 * @brief Shared fixtures: temporary directories and simulated devices
 *
 * A TestDevice is one installation: its own local store and identity,
 * sharing the remote document store and account with other devices.
 */

#ifndef KEYWARD_TESTS_TEST_SUPPORT_HPP
#define KEYWARD_TESTS_TEST_SUPPORT_HPP

#include "../src/core/encoding.hpp"
#include "../src/core/settings.hpp"
#include "../src/device/device_trust_manager.hpp"
#include "../src/recovery/recovery_key_manager.hpp"
#include "../src/remote/memory_document_store.hpp"
#include "../src/security/audit_logger.hpp"
#include "../src/service/custody_service.hpp"
#include "../src/storage/local_key_store.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace keyward {
namespace test {

constexpr const char* ACCOUNT = "account-1";

class TempDir {
public:
    TempDir() : path_(std::filesystem::temp_directory_path() / ("keyward-test-" + uuid_v4())) {
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::filesystem::path operator/(const std::string& name) const { return path_ / name; }

private:
    std::filesystem::path path_;
};

inline std::shared_ptr<security::AuditLogger> quiet_audit() {
    security::AuditLoggerConfig config;
    config.echo_to_stderr = false;
    return std::make_shared<security::AuditLogger>(config);
}

inline CustodySettings fast_settings() {
    CustodySettings s;
    s.approval_poll_interval = std::chrono::milliseconds(20);
    s.allow_memory_hard_kdf = true;
    s.default_kdf = crypto::KdfAlgorithm::PBKDF2;
    return s;
}

/// Poll until pred() holds or the timeout passes
inline bool eventually(const std::function<bool()>& pred,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

struct TestDevice {
    std::string name;
    std::string platform;
    std::shared_ptr<remote::MemoryDocumentStore> remote;
    std::shared_ptr<storage::MemoryKeyValueStore> kv;
    std::shared_ptr<storage::LocalKeyStore> local;
    std::shared_ptr<remote::StaticAccountProvider> accounts;
    std::shared_ptr<security::AuditLogger> audit;
    CustodySettings settings;
    std::shared_ptr<device::DeviceTrustManager> trust;
    std::shared_ptr<recovery::RecoveryKeyManager> recovery;

    TestDevice(std::shared_ptr<remote::MemoryDocumentStore> store,
               std::string device_name,
               std::string device_platform = "linux",
               CustodySettings custom = fast_settings())
        : name(std::move(device_name)),
          platform(std::move(device_platform)),
          remote(std::move(store)),
          kv(std::make_shared<storage::MemoryKeyValueStore>()),
          local(std::make_shared<storage::LocalKeyStore>(kv)),
          accounts(std::make_shared<remote::StaticAccountProvider>(std::string(ACCOUNT))),
          audit(quiet_audit()),
          settings(std::move(custom)) {
        build();
    }

    ~TestDevice() {
        if (trust) trust->dispose();
    }

    TestDevice(const TestDevice&) = delete;
    TestDevice& operator=(const TestDevice&) = delete;

    /// Fresh managers over the same local store, as after an app restart
    void restart() {
        if (trust) trust->dispose();
        build();
    }

    std::unique_ptr<service::CustodyService> make_service() {
        return std::make_unique<service::CustodyService>(local, accounts, trust, recovery, settings, audit);
    }

    std::string id() { return local->device_id().value_or(""); }

private:
    void build() {
        device::DeviceIdentity identity{name, platform, {{"model", "Test Rig"}}};
        trust = std::make_shared<device::DeviceTrustManager>(remote, local, accounts, identity, settings, audit);
        recovery = std::make_shared<recovery::RecoveryKeyManager>(remote, accounts, trust, settings, audit);
    }
};

} // namespace test
} // namespace keyward

#endif // KEYWARD_TESTS_TEST_SUPPORT_HPP
