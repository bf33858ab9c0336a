/**
 * @file test_key_value_store.cpp
 * @brief Local secure storage tests
 *
 * Tests:
 * - In-memory and file-backed key/value stores
 * - Sealed store (values encrypted at rest)
 * - LocalKeyStore typed accessors and clear_all
 */

#include <catch2/catch_test_macros.hpp>
#include "../test_support.hpp"
#include "../../src/storage/key_value_store.hpp"
#include "../../src/storage/local_key_store.hpp"
#include <fstream>
#include <sodium.h>

using namespace keyward;
using namespace keyward::storage;

TEST_CASE("Memory Key Value Store", "[storage][kv]") {
    MemoryKeyValueStore store;

    REQUIRE_FALSE(store.get("a").has_value());
    store.put("a", "1");
    store.put("a", "2");
    REQUIRE(store.get("a") == std::optional<std::string>("2"));
    REQUIRE(store.size() == 1);

    store.remove("a");
    store.remove("a");
    REQUIRE_FALSE(store.get("a").has_value());
    REQUIRE(store.size() == 0);
}

TEST_CASE("File Key Value Store", "[storage][kv][file]") {
    if (sodium_init() < 0) {
        FAIL("Failed to initialize libsodium");
    }

    test::TempDir dir;
    auto path = dir / "nested" / "local.json";

    SECTION("Values survive reopening") {
        {
            FileKeyValueStore store(path);
            store.put("binary", std::string("\x00\x01\xFF", 3));
            store.put("text", "hello");
            store.remove("text");
        }
        FileKeyValueStore reopened(path);
        REQUIRE(reopened.get("binary") == std::optional<std::string>(std::string("\x00\x01\xFF", 3)));
        REQUIRE_FALSE(reopened.get("text").has_value());
    }

    SECTION("File is owner-only") {
        FileKeyValueStore store(path);
        store.put("k", "v");
        auto perms = std::filesystem::status(path).permissions();
        REQUIRE((perms & std::filesystem::perms::group_all) == std::filesystem::perms::none);
        REQUIRE((perms & std::filesystem::perms::others_all) == std::filesystem::perms::none);
    }

    SECTION("Corrupted file is reported") {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream(path) << "{not json";
        REQUIRE_THROWS_AS(FileKeyValueStore(path), KeywardError);
    }
}

TEST_CASE("Sealed Key Value Store", "[storage][kv][sealed]") {
    if (sodium_init() < 0) {
        FAIL("Failed to initialize libsodium");
    }

    auto backend = std::make_shared<MemoryKeyValueStore>();
    crypto::Key key = crypto::generate_umk();
    SealedKeyValueStore sealed(backend, key);

    SECTION("Backend never sees the plaintext") {
        sealed.put("secret", "plaintext value");
        auto raw = backend->get("secret");
        REQUIRE(raw.has_value());
        REQUIRE(raw->find("plaintext") == std::string::npos);
        REQUIRE(sealed.get("secret") == std::optional<std::string>("plaintext value"));
    }

    SECTION("A different key reads nothing") {
        sealed.put("secret", "value");
        SealedKeyValueStore other(backend, crypto::generate_umk());
        REQUIRE_FALSE(other.get("secret").has_value());
    }

    SECTION("Hex key constructor") {
        std::string hex = hex_encode(key.data(), key.size());
        auto from_hex = SealedKeyValueStore::from_hex(backend, hex);
        sealed.put("k", "v");
        REQUIRE(from_hex->get("k") == std::optional<std::string>("v"));
        REQUIRE_THROWS_AS(SealedKeyValueStore::from_hex(backend, "abcd"), KeywardError);
    }

    SECTION("Null backend is rejected") {
        REQUIRE_THROWS_AS(SealedKeyValueStore(nullptr, key), KeywardError);
    }
}

TEST_CASE("Local Key Store", "[storage][local]") {
    if (sodium_init() < 0) {
        FAIL("Failed to initialize libsodium");
    }

    auto backend = std::make_shared<MemoryKeyValueStore>();
    LocalKeyStore local(backend);

    SECTION("Device keys") {
        REQUIRE_FALSE(local.has_device_keys());
        auto kp = crypto::x25519_generate();
        local.store_device_private_key(kp.sk);
        local.store_device_public_key(kp.pk);
        REQUIRE_FALSE(local.has_device_keys());
        local.store_device_id("device-1");
        REQUIRE(local.has_device_keys());
        REQUIRE(local.device_private_key() == std::optional<crypto::PrivateKey>(kp.sk));
        REQUIRE(local.device_public_key() == std::optional<crypto::PublicKey>(kp.pk));
        REQUIRE(local.device_id() == std::optional<std::string>("device-1"));
    }

    SECTION("UMK cache") {
        crypto::Key umk = crypto::generate_umk();
        local.cache_umk(umk);
        REQUIRE(local.cached_umk() == std::optional<crypto::Key>(umk));
        local.clear_cached_umk();
        REQUIRE_FALSE(local.cached_umk().has_value());
    }

    SECTION("Wrong-length value is rejected") {
        backend->put(keys::UMK_CACHE, base64_encode(Bytes(5, 1)));
        REQUIRE_THROWS_AS(local.cached_umk(), KeywardError);
    }

    SECTION("Flags and cached status") {
        REQUIRE(local.remember_device());
        local.set_remember_device(false);
        REQUIRE_FALSE(local.remember_device());

        REQUIRE_FALSE(local.cached_device_status().has_value());
        local.cache_device_status(cached_status::PENDING);
        REQUIRE(local.cached_device_status() == std::optional<std::string>("pending"));
        local.clear_device_status();
        REQUIRE_FALSE(local.cached_device_status().has_value());

        REQUIRE_FALSE(local.sign_in_interrupted());
        local.set_sign_in_progress(true);
        REQUIRE(local.sign_in_interrupted());
        local.set_sign_in_progress(false);
        REQUIRE_FALSE(local.sign_in_interrupted());
    }

    SECTION("clear_all removes every key") {
        auto kp = crypto::x25519_generate();
        local.store_device_private_key(kp.sk);
        local.store_device_public_key(kp.pk);
        local.store_device_id("device-1");
        local.cache_umk(crypto::generate_umk());
        local.cache_device_status(cached_status::APPROVED);
        local.set_sign_in_progress(true);

        local.clear_all();
        REQUIRE(backend->size() == 0);
    }
}
