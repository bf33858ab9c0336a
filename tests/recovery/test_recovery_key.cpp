/**
 * @file test_recovery_key.cpp
 * @brief Passphrase recovery key tests
 *
 * Tests:
 * - Create, verify and recover with progress reporting
 * - Legacy Argon2id records without a kdf_algorithm field
 * - Argon2id refusal on devices that disallow it
 * - Passphrase-gated update and removal
 * - Export and import of recovery data
 */

#include <catch2/catch_test_macros.hpp>
#include "../test_support.hpp"
#include "../../src/crypto/kdf.hpp"
#include <nlohmann/json.hpp>
#include <sodium.h>

using namespace keyward;
using namespace keyward::recovery;
using keyward::test::TestDevice;

namespace {

const char* const PASSPHRASE = "horse-battery-123";

// Record as written before kdf_algorithm existed: Argon2id, no algorithm field
remote::Document legacy_argon2_record(const crypto::Key& umk, const std::string& passphrase) {
    Bytes salt = crypto::generate_salt();
    crypto::Key key = crypto::derive_key_from_passphrase(passphrase, salt, crypto::KdfAlgorithm::ARGON2ID, true);
    auto sealed = crypto::seal_string(base64_encode(umk.data(), umk.size()), key);
    return remote::Document{
        {"encrypted_umk", sealed.ciphertext},
        {"nonce", sealed.nonce},
        {"salt", base64_encode(salt)},
        {"hint", "old phone"},
        {"created_at", "2024-01-10T12:00:00.000Z"},
    };
}

} // namespace

TEST_CASE("Recovery Key Creation", "[recovery][create]") {
    if (sodium_init() < 0) {
        FAIL("Failed to initialize libsodium");
    }

    auto store = std::make_shared<remote::MemoryDocumentStore>();
    TestDevice laptop(store, "Laptop");

    SECTION("Creating requires the UMK") {
        REQUIRE_THROWS_AS(laptop.recovery->create(PASSPHRASE), NotAuthorizedError);
    }

    laptop.trust->register_first_device();
    REQUIRE_FALSE(laptop.recovery->has_recovery_key());
    REQUIRE_FALSE(laptop.recovery->verify(PASSPHRASE));

    laptop.recovery->create(PASSPHRASE, std::string("the usual"));

    SECTION("Record is stored with the default KDF") {
        REQUIRE(laptop.recovery->has_recovery_key());
        REQUIRE(laptop.recovery->hint() == std::optional<std::string>("the usual"));
        auto r = laptop.recovery->record();
        REQUIRE(r.has_value());
        REQUIRE(r->kdf_algorithm == std::optional<crypto::KdfAlgorithm>(crypto::KdfAlgorithm::PBKDF2));
        REQUIRE(base64_decode(r->salt).size() == crypto::SALT_BYTES);
        REQUIRE(base64_decode(r->nonce).size() == crypto::NONCE_BYTES);
        REQUIRE_FALSE(r->imported);
    }

    SECTION("Verify accepts only the right passphrase") {
        REQUIRE(laptop.recovery->verify(PASSPHRASE));
        REQUIRE_FALSE(laptop.recovery->verify("horse-battery-124"));
    }

    SECTION("The record never contains the UMK in the clear") {
        auto umk = laptop.trust->umk();
        auto doc = store->get(remote::paths::recovery_key(test::ACCOUNT));
        REQUIRE(doc->dump().find(base64_encode(umk->data(), umk->size())) == std::string::npos);
    }
}

TEST_CASE("Recovery On A New Device", "[recovery][recover]") {
    if (sodium_init() < 0) {
        FAIL("Failed to initialize libsodium");
    }

    auto store = std::make_shared<remote::MemoryDocumentStore>();
    TestDevice laptop(store, "Laptop");
    laptop.trust->register_first_device();
    laptop.recovery->create(PASSPHRASE);
    const auto umk = laptop.trust->umk();

    TestDevice replacement(store, "Replacement");

    SECTION("Right passphrase enrols the device with the same UMK") {
        std::vector<std::string> steps;
        REQUIRE(replacement.recovery->recover(PASSPHRASE, [&](const std::string& s) { steps.push_back(s); }));

        REQUIRE(replacement.trust->umk() == umk);
        REQUIRE(replacement.trust->is_device_approved());
        auto doc = store->get(remote::paths::device(test::ACCOUNT, replacement.id()));
        REQUIRE(doc->at("recovered") == true);
        REQUIRE(steps == std::vector<std::string>{
            "Fetching recovery data...", "Decrypting recovery key...",
            "Registering device...", "Completing setup..."});
    }

    SECTION("Wrong passphrase changes nothing") {
        REQUIRE_FALSE(replacement.recovery->recover("wrong"));
        REQUIRE_FALSE(replacement.trust->has_umk());
        REQUIRE_FALSE(replacement.local->has_device_keys());
        REQUIRE(store->list(remote::paths::devices(test::ACCOUNT)).size() == 1);
    }

    SECTION("A pending device replaces its own record") {
        replacement.trust->register_new_device();
        const std::string pending_id = replacement.id();
        REQUIRE(replacement.recovery->recover(PASSPHRASE));
        REQUIRE(replacement.id() != pending_id);
        REQUIRE_FALSE(store->get(remote::paths::device(test::ACCOUNT, pending_id)).has_value());
        REQUIRE(store->list(remote::paths::devices(test::ACCOUNT)).size() == 2);
    }

    SECTION("Async recovery") {
        auto result = replacement.recovery->recover_async(PASSPHRASE);
        REQUIRE(result.get());
        REQUIRE(replacement.trust->umk() == umk);
    }

    SECTION("No recovery key") {
        auto empty = std::make_shared<remote::MemoryDocumentStore>();
        TestDevice lonely(empty, "Lonely");
        REQUIRE_FALSE(lonely.recovery->recover(PASSPHRASE));
    }

    SECTION("Outage propagates") {
        store->set_online(false);
        REQUIRE_THROWS_AS(replacement.recovery->recover(PASSPHRASE), ConnectivityError);
    }
}

TEST_CASE("Legacy Argon2id Recovery Records", "[recovery][argon2]") {
    if (sodium_init() < 0) {
        FAIL("Failed to initialize libsodium");
    }

    auto store = std::make_shared<remote::MemoryDocumentStore>();
    const crypto::Key umk = crypto::generate_umk();
    store->set(remote::paths::recovery_key(test::ACCOUNT), legacy_argon2_record(umk, PASSPHRASE));

    SECTION("Falls back to Argon2id when no algorithm is recorded") {
        TestDevice device(store, "Desktop");
        auto r = device.recovery->record();
        REQUIRE_FALSE(r->kdf_algorithm.has_value());
        REQUIRE(device.recovery->verify(PASSPHRASE));
        REQUIRE(device.recovery->recover(PASSPHRASE));
        REQUIRE(device.trust->umk() == umk);
    }

    SECTION("Devices without Argon2id cannot open it") {
        CustodySettings settings = test::fast_settings();
        settings.allow_memory_hard_kdf = false;
        TestDevice device(store, "Phone", "ios", settings);
        REQUIRE_THROWS_AS(device.recovery->recover(PASSPHRASE), UnsupportedOperationError);
        REQUIRE_FALSE(device.trust->has_umk());
    }

    SECTION("Updating rewrites it with the current default") {
        TestDevice device(store, "Desktop");
        REQUIRE(device.recovery->recover(PASSPHRASE));
        device.recovery->update(PASSPHRASE, "new-passphrase-456");
        auto r = device.recovery->record();
        REQUIRE(r->kdf_algorithm == std::optional<crypto::KdfAlgorithm>(crypto::KdfAlgorithm::PBKDF2));
        REQUIRE_FALSE(device.recovery->verify(PASSPHRASE));
        REQUIRE(device.recovery->verify("new-passphrase-456"));
    }
}

TEST_CASE("Recovery Key Update and Removal", "[recovery][update]") {
    if (sodium_init() < 0) {
        FAIL("Failed to initialize libsodium");
    }

    auto store = std::make_shared<remote::MemoryDocumentStore>();
    TestDevice laptop(store, "Laptop");
    laptop.trust->register_first_device();
    laptop.recovery->create(PASSPHRASE, std::string("old hint"));

    SECTION("Update with the current passphrase") {
        laptop.recovery->update(PASSPHRASE, "new-passphrase-456", std::string("new hint"));
        REQUIRE(laptop.recovery->verify("new-passphrase-456"));
        REQUIRE_FALSE(laptop.recovery->verify(PASSPHRASE));
        REQUIRE(laptop.recovery->hint() == std::optional<std::string>("new hint"));
    }

    SECTION("Update with a wrong passphrase is refused") {
        REQUIRE_THROWS_AS(laptop.recovery->update("wrong", "new-passphrase-456"), AuthenticationError);
        REQUIRE(laptop.recovery->verify(PASSPHRASE));
    }

    SECTION("Remove requires the passphrase") {
        REQUIRE_THROWS_AS(laptop.recovery->remove("wrong"), AuthenticationError);
        REQUIRE(laptop.recovery->has_recovery_key());
        laptop.recovery->remove(PASSPHRASE);
        REQUIRE_FALSE(laptop.recovery->has_recovery_key());
        REQUIRE_FALSE(laptop.recovery->hint().has_value());
    }
}

TEST_CASE("Recovery Data Export and Import", "[recovery][export]") {
    if (sodium_init() < 0) {
        FAIL("Failed to initialize libsodium");
    }

    auto store = std::make_shared<remote::MemoryDocumentStore>();
    TestDevice laptop(store, "Laptop");

    REQUIRE_FALSE(laptop.recovery->export_recovery_data().has_value());

    laptop.trust->register_first_device();
    laptop.recovery->create(PASSPHRASE, std::string("secret hint"));
    auto exported = laptop.recovery->export_recovery_data();
    REQUIRE(exported.has_value());

    SECTION("Export carries the wrap but not the hint") {
        auto doc = nlohmann::json::parse(*exported);
        REQUIRE(doc.at("version") == 1);
        REQUIRE(doc.at("kdf_algorithm") == "pbkdf2");
        REQUIRE(doc.contains("encrypted_umk"));
        REQUIRE(doc.contains("nonce"));
        REQUIRE(doc.contains("salt"));
        REQUIRE(doc.contains("created_at"));
        REQUIRE_FALSE(doc.contains("hint"));
    }

    SECTION("Import into another account's store recovers the UMK") {
        auto other = std::make_shared<remote::MemoryDocumentStore>();
        TestDevice fresh(other, "Fresh");
        REQUIRE(fresh.recovery->import_recovery_data(*exported));

        auto r = fresh.recovery->record();
        REQUIRE(r->imported);
        REQUIRE_FALSE(r->hint.has_value());

        REQUIRE(fresh.recovery->recover(PASSPHRASE));
        REQUIRE(fresh.trust->umk() == laptop.trust->umk());
    }

    SECTION("Malformed data is rejected") {
        REQUIRE_FALSE(laptop.recovery->import_recovery_data("not json"));
        REQUIRE_FALSE(laptop.recovery->import_recovery_data("[1,2,3]"));
        REQUIRE_FALSE(laptop.recovery->import_recovery_data(R"({"encrypted_umk":"abc"})"));
        REQUIRE_FALSE(laptop.recovery->import_recovery_data(
            R"({"encrypted_umk":"!!","nonce":"AAAA","salt":"AAAA"})"));
        REQUIRE(laptop.recovery->verify(PASSPHRASE));
    }

    SECTION("Parser defaults") {
        auto r = parse_recovery_export(R"({"encrypted_umk":"AAAA","nonce":"AAAA","salt":"AAAA","hint":"x"})");
        REQUIRE(r.has_value());
        REQUIRE(r->imported);
        REQUIRE_FALSE(r->hint.has_value());
        REQUIRE_FALSE(r->kdf_algorithm.has_value());
    }
}
