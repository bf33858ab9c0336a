/**
 * @file test_custody_service.cpp
 * @brief Custody lifecycle tests
 *
 * Tests:
 * - First device setup, with and without automatic setup
 * - Pending approval resolved by another device
 * - Optimistic startup and background verification, online and offline
 * - Revocation, recovery, re-approval, start fresh and sign out
 */

#include <catch2/catch_test_macros.hpp>
#include "../test_support.hpp"
#include <sodium.h>

#include <algorithm>
#include <mutex>
#include <vector>

using namespace keyward;
using namespace keyward::service;
using keyward::test::TestDevice;

namespace {

const char* const PASSPHRASE = "horse-battery-123";

class StatusRecorder {
public:
    void attach(CustodyService& service) {
        service.set_on_status_changed([this](CustodyStatus s, const std::string&) {
            std::lock_guard<std::mutex> lock(mutex_);
            seen_.push_back(s);
        });
    }
    std::vector<CustodyStatus> seen() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return seen_;
    }
    bool saw(CustodyStatus s) const {
        auto all = seen();
        return std::find(all.begin(), all.end(), s) != all.end();
    }

private:
    mutable std::mutex mutex_;
    std::vector<CustodyStatus> seen_;
};

} // namespace

TEST_CASE("Custody Status Names", "[service][status]") {
    REQUIRE(std::string(custody_status_name(CustodyStatus::NOT_INITIALIZED)) == "not_initialized");
    REQUIRE(std::string(custody_status_name(CustodyStatus::PENDING_APPROVAL)) == "pending_approval");
    REQUIRE(std::string(custody_status_name(CustodyStatus::VERIFYING_IN_BACKGROUND)) ==
            "verifying_in_background");
    REQUIRE(std::string(custody_status_name(CustodyStatus::ERROR)) == "error");
}

TEST_CASE("First Device Setup", "[service][setup]") {
    if (sodium_init() < 0) {
        FAIL("Failed to initialize libsodium");
    }

    auto store = std::make_shared<remote::MemoryDocumentStore>();

    SECTION("Automatic setup") {
        TestDevice laptop(store, "Laptop");
        auto service = laptop.make_service();
        StatusRecorder recorder;
        recorder.attach(*service);

        REQUIRE(service->initialize() == CustodyStatus::READY);
        REQUIRE(service->is_ready());
        REQUIRE(service->is_available());
        REQUIRE(service->needs_recovery_key_setup());
        REQUIRE(laptop.local->cached_device_status() == std::optional<std::string>("approved"));
        REQUIRE_FALSE(laptop.local->sign_in_interrupted());
        REQUIRE(recorder.saw(CustodyStatus::READY));
    }

    SECTION("Manual setup") {
        CustodySettings settings = test::fast_settings();
        settings.auto_setup_first_device = false;
        TestDevice laptop(store, "Laptop", "linux", settings);
        auto service = laptop.make_service();

        REQUIRE(service->initialize() == CustodyStatus::NOT_SET_UP);
        REQUIRE_FALSE(service->is_available());
        REQUIRE(store->list(remote::paths::devices(test::ACCOUNT)).empty());

        service->setup();
        REQUIRE(service->status() == CustodyStatus::READY);
        REQUIRE(service->is_available());
    }

    SECTION("No signed-in account") {
        TestDevice laptop(store, "Laptop");
        laptop.accounts->sign_out();
        auto service = laptop.make_service();
        REQUIRE(service->initialize() == CustodyStatus::ERROR);
        REQUIRE(service->status_message() == "No signed-in account");
    }

    SECTION("Outage during first sign-in is an error") {
        TestDevice laptop(store, "Laptop");
        store->set_online(false);
        auto service = laptop.make_service();
        REQUIRE(service->initialize() == CustodyStatus::ERROR);
        REQUIRE_FALSE(service->status_message().empty());
    }
}

TEST_CASE("Second Device Approval", "[service][approval]") {
    if (sodium_init() < 0) {
        FAIL("Failed to initialize libsodium");
    }

    auto store = std::make_shared<remote::MemoryDocumentStore>();
    TestDevice laptop(store, "Laptop");
    auto primary = laptop.make_service();
    REQUIRE(primary->initialize() == CustodyStatus::READY);

    TestDevice phone(store, "Phone", "android");
    auto service = phone.make_service();
    REQUIRE(service->initialize() == CustodyStatus::PENDING_APPROVAL);
    REQUIRE_FALSE(service->is_available());
    REQUIRE(phone.local->cached_device_status() == std::optional<std::string>("pending"));

    SECTION("Approval from the primary unlocks the device") {
        laptop.trust->approve_device(phone.id());
        REQUIRE(test::eventually([&] { return service->status() == CustodyStatus::READY; }));
        REQUIRE(phone.trust->umk() == laptop.trust->umk());
        REQUIRE(phone.local->cached_device_status() == std::optional<std::string>("approved"));
    }

    SECTION("Poller picks up an approval the listener missed") {
        phone.trust->dispose();
        laptop.trust->approve_device(phone.id());
        REQUIRE(test::eventually([&] { return service->status() == CustodyStatus::READY; }));
        REQUIRE(service->is_available());
    }

    SECTION("Refresh while still pending changes nothing") {
        REQUIRE(service->refresh_status() == CustodyStatus::PENDING_APPROVAL);
    }

    SECTION("Restart while pending stays pending on the same record") {
        const std::string id = phone.id();
        service.reset();
        phone.restart();
        service = phone.make_service();
        REQUIRE(service->initialize() == CustodyStatus::PENDING_APPROVAL);
        REQUIRE(phone.id() == id);
        REQUIRE(store->list(remote::paths::devices(test::ACCOUNT)).size() == 2);
    }
}

TEST_CASE("Optimistic Startup", "[service][verify]") {
    if (sodium_init() < 0) {
        FAIL("Failed to initialize libsodium");
    }

    auto store = std::make_shared<remote::MemoryDocumentStore>();
    TestDevice laptop(store, "Laptop");
    {
        auto first = laptop.make_service();
        REQUIRE(first->initialize() == CustodyStatus::READY);
    }
    const auto umk = laptop.trust->umk();
    laptop.restart();
    auto service = laptop.make_service();

    SECTION("Cached approval verifies in the background") {
        REQUIRE(service->preload_cached_status());
        REQUIRE(service->is_verifying_in_background());
        REQUIRE(service->is_ready());

        service->initialize();
        REQUIRE(service->is_available());
        service->wait_for_background_verification();
        REQUIRE(service->status() == CustodyStatus::READY);
        REQUIRE_FALSE(service->verification_retry_pending());
    }

    SECTION("Offline verification keeps the device usable") {
        store->set_online(false);
        service->initialize();
        service->wait_for_background_verification();

        REQUIRE(service->status() == CustodyStatus::READY);
        REQUIRE(service->verification_retry_pending());
        REQUIRE(laptop.trust->umk() == umk);

        store->set_online(true);
        REQUIRE(service->verify_now() == CustodyStatus::READY);
        REQUIRE_FALSE(service->verification_retry_pending());
    }

    SECTION("Deleted record needs recovery") {
        store->remove(remote::paths::device(test::ACCOUNT, laptop.id()));
        service->initialize();
        service->wait_for_background_verification();
        REQUIRE(service->status() == CustodyStatus::NEEDS_RECOVERY);
        REQUIRE_FALSE(service->is_available());
        REQUIRE_FALSE(laptop.trust->has_umk());
        REQUIRE_FALSE(laptop.local->cached_umk().has_value());
    }

    SECTION("Interrupted sign-in skips the cached status") {
        laptop.local->set_sign_in_progress(true);
        REQUIRE(service->initialize() == CustodyStatus::READY);
        REQUIRE_FALSE(laptop.local->sign_in_interrupted());
    }

    SECTION("Without device keys nothing is preloaded") {
        TestDevice fresh(store, "Fresh");
        auto other = fresh.make_service();
        REQUIRE_FALSE(other->preload_cached_status());
        REQUIRE(other->status() == CustodyStatus::NOT_INITIALIZED);
    }
}

TEST_CASE("Revocation", "[service][revoke]") {
    if (sodium_init() < 0) {
        FAIL("Failed to initialize libsodium");
    }

    auto store = std::make_shared<remote::MemoryDocumentStore>();
    TestDevice laptop(store, "Laptop");
    auto primary = laptop.make_service();
    REQUIRE(primary->initialize() == CustodyStatus::READY);

    TestDevice phone(store, "Phone", "android");
    auto service = phone.make_service();
    REQUIRE(service->initialize() == CustodyStatus::PENDING_APPROVAL);
    laptop.trust->approve_device(phone.id());
    REQUIRE(test::eventually([&] { return service->status() == CustodyStatus::READY; }));

    SECTION("Revoking a running device locks it") {
        laptop.trust->revoke_device(phone.id());
        REQUIRE(test::eventually([&] { return service->status() == CustodyStatus::REVOKED; }));
        REQUIRE_FALSE(service->is_available());
        REQUIRE(phone.local->cached_device_status() == std::optional<std::string>("revoked"));
    }

    SECTION("Revoked at startup") {
        service.reset();
        phone.restart();
        auto takeover = laptop.trust->set_current_device_as_primary();
        REQUIRE(takeover.revoked == 1);

        service = phone.make_service();
        service->initialize();
        service->wait_for_background_verification();
        REQUIRE(service->status() == CustodyStatus::REVOKED);
        REQUIRE(phone.trust->was_revoked());
        REQUIRE_FALSE(service->is_available());
        REQUIRE_FALSE(phone.trust->has_umk());
        REQUIRE_FALSE(phone.local->cached_umk().has_value());
    }

    SECTION("Re-approval after revocation") {
        laptop.trust->revoke_device(phone.id());
        REQUIRE(test::eventually([&] { return service->status() == CustodyStatus::REVOKED; }));

        service->request_reapproval();
        REQUIRE(service->status() == CustodyStatus::PENDING_APPROVAL);
        REQUIRE(phone.trust->is_device_pending());

        laptop.trust->approve_device(phone.id());
        REQUIRE(test::eventually([&] { return service->status() == CustodyStatus::READY; }));
        REQUIRE(service->is_available());
    }
}

TEST_CASE("Recovery From The Service", "[service][recovery]") {
    if (sodium_init() < 0) {
        FAIL("Failed to initialize libsodium");
    }

    auto store = std::make_shared<remote::MemoryDocumentStore>();
    TestDevice laptop(store, "Laptop");
    auto primary = laptop.make_service();
    REQUIRE(primary->initialize() == CustodyStatus::READY);
    laptop.recovery->create(PASSPHRASE);
    primary->set_needs_recovery_key_setup(false);

    SECTION("Reinstalled primary needs recovery") {
        TestDevice reinstall(store, "Laptop");
        auto service = reinstall.make_service();
        REQUIRE(service->initialize() == CustodyStatus::NEEDS_RECOVERY);
        REQUIRE(reinstall.local->cached_device_status() == std::optional<std::string>("needs_recovery"));

        SECTION("Wrong passphrase") {
            REQUIRE_FALSE(service->recover_with_passphrase("wrong"));
            REQUIRE(service->status() == CustodyStatus::NEEDS_RECOVERY);
        }

        SECTION("Right passphrase") {
            REQUIRE(service->recover_with_passphrase(PASSPHRASE));
            REQUIRE(service->status() == CustodyStatus::READY);
            REQUIRE_FALSE(service->needs_recovery_key_setup());
            REQUIRE(reinstall.trust->umk() == laptop.trust->umk());
            REQUIRE(primary->status() == CustodyStatus::READY);
        }

        SECTION("Taking over as primary revokes the others") {
            REQUIRE(service->recover_with_passphrase(PASSPHRASE, true));
            REQUIRE(service->status() == CustodyStatus::READY);
            REQUIRE(test::eventually([&] { return primary->status() == CustodyStatus::REVOKED; }));
            REQUIRE(reinstall.trust->is_master_device());
        }
    }

    SECTION("Only pending devices left") {
        auto other = std::make_shared<remote::MemoryDocumentStore>();
        other->set(remote::paths::device(test::ACCOUNT, "stale"),
                   remote::Document{{"name", "Old Phone"}, {"public_key", "cGs="}, {"status", "pending"}});
        TestDevice tablet(other, "Tablet", "ios");
        auto service = tablet.make_service();
        REQUIRE(service->initialize() == CustodyStatus::NEEDS_RECOVERY);
    }
}

TEST_CASE("Start Fresh And Sign Out", "[service][reset]") {
    if (sodium_init() < 0) {
        FAIL("Failed to initialize libsodium");
    }

    auto store = std::make_shared<remote::MemoryDocumentStore>();
    TestDevice laptop(store, "Laptop");
    auto primary = laptop.make_service();
    REQUIRE(primary->initialize() == CustodyStatus::READY);

    TestDevice phone(store, "Phone", "android");
    auto service = phone.make_service();
    REQUIRE(service->initialize() == CustodyStatus::PENDING_APPROVAL);

    SECTION("Start fresh makes this the only device") {
        const auto old_umk = laptop.trust->umk();
        StatusRecorder recorder;
        recorder.attach(*service);

        REQUIRE(service->start_fresh() == CustodyStatus::READY);
        auto devices = store->list(remote::paths::devices(test::ACCOUNT));
        REQUIRE(devices.size() == 1);
        REQUIRE(devices.front().id == phone.id());
        REQUIRE(phone.trust->is_master_device());
        REQUIRE(phone.trust->umk() != old_umk);
        REQUIRE(service->needs_recovery_key_setup());
        REQUIRE_FALSE(recorder.saw(CustodyStatus::REVOKED));
    }

    SECTION("Start fresh drops the recovery key for the old UMK") {
        laptop.recovery->create("horse-battery-123");
        REQUIRE(phone.recovery->has_recovery_key());

        REQUIRE(service->start_fresh() == CustodyStatus::READY);
        REQUIRE_FALSE(phone.recovery->has_recovery_key());

        TestDevice tablet(store, "Tablet");
        REQUIRE_FALSE(tablet.recovery->recover("horse-battery-123"));
        REQUIRE_FALSE(tablet.trust->has_umk());
        REQUIRE(store->list(remote::paths::devices(test::ACCOUNT)).size() == 1);
    }

    SECTION("Sign out removes this device") {
        const std::string id = phone.id();
        service->sign_out();
        REQUIRE(service->status() == CustodyStatus::NOT_INITIALIZED);
        REQUIRE_FALSE(store->get(remote::paths::device(test::ACCOUNT, id)).has_value());
        REQUIRE_FALSE(phone.local->has_device_keys());
        REQUIRE_FALSE(phone.trust->has_umk());
        REQUIRE(phone.accounts->sign_out_count() == 1);
        REQUIRE_FALSE(phone.accounts->current_account_id().has_value());
        REQUIRE(primary->status() == CustodyStatus::READY);
    }
}
