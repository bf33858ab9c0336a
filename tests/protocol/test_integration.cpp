/**
 * @file test_integration.cpp
 * @brief End-to-end key custody integration tests
 *
 * Tests:
 * - AEAD round trip and tamper detection over many sizes and keys
 * - KDF determinism and salt separation
 * - X25519 agreement symmetry
 * - Device approval and revocation across two installations
 * - Passphrase recovery onto a new installation
 * - Legacy Argon2id recovery records
 * - File envelope round trip and media detection
 * - A note written on one device and read on another
 */

#include <catch2/catch_test_macros.hpp>
#include "../test_support.hpp"
#include "../../src/crypto/file_envelope.hpp"
#include "../../src/crypto/kdf.hpp"
#include "../../src/payload/note_cipher.hpp"
#include <sodium.h>

#include <vector>

using namespace keyward;
using keyward::test::TestDevice;

namespace {

const char* const PASSPHRASE = "horse-battery-123";

const std::vector<size_t> SIZES = {0, 1, 15, 16, 17, 64, 1000, 65536};

} // namespace

TEST_CASE("AEAD Properties", "[integration][aead]") {
    if (sodium_init() < 0) {
        FAIL("Failed to initialize libsodium");
    }

    for (size_t size : SIZES) {
        crypto::Key key = crypto::generate_umk();
        Bytes plaintext = crypto::generate_random(size);
        auto sealed = crypto::aead_encrypt(plaintext, key);
        REQUIRE(sealed.ciphertext.size() == size + crypto::TAG_BYTES);
        REQUIRE(crypto::aead_decrypt(sealed.ciphertext, sealed.nonce, key) == plaintext);

        // Every bit of a short message, a sample of bits of a long one
        const size_t step = sealed.ciphertext.size() > 64 ? sealed.ciphertext.size() / 32 : 1;
        for (size_t i = 0; i < sealed.ciphertext.size(); i += step) {
            for (int bit = 0; bit < 8; bit += (step == 1 ? 1 : 3)) {
                Bytes tampered = sealed.ciphertext;
                tampered[i] ^= static_cast<uint8_t>(1u << bit);
                REQUIRE_THROWS_AS(crypto::aead_decrypt(tampered, sealed.nonce, key), AuthenticationError);
            }
        }

        crypto::Nonce other_nonce = sealed.nonce;
        other_nonce[0] ^= 0x80;
        REQUIRE_THROWS_AS(crypto::aead_decrypt(sealed.ciphertext, other_nonce, key), AuthenticationError);
        REQUIRE_THROWS_AS(crypto::aead_decrypt(sealed.ciphertext, sealed.nonce, crypto::generate_umk()),
                          AuthenticationError);
    }
}

TEST_CASE("KDF Properties", "[integration][kdf]") {
    if (sodium_init() < 0) {
        FAIL("Failed to initialize libsodium");
    }

    Bytes salt = crypto::generate_salt();
    Bytes other_salt = crypto::generate_salt();

    SECTION("PBKDF2") {
        auto a = crypto::derive_key_from_passphrase(PASSPHRASE, salt, crypto::KdfAlgorithm::PBKDF2);
        auto b = crypto::derive_key_from_passphrase(PASSPHRASE, salt, crypto::KdfAlgorithm::PBKDF2);
        auto c = crypto::derive_key_from_passphrase(PASSPHRASE, other_salt, crypto::KdfAlgorithm::PBKDF2);
        REQUIRE(a == b);
        REQUIRE(a != c);
    }

    SECTION("Argon2id") {
        auto a = crypto::derive_key_from_passphrase(PASSPHRASE, salt, crypto::KdfAlgorithm::ARGON2ID, true);
        auto b = crypto::derive_key_from_passphrase(PASSPHRASE, salt, crypto::KdfAlgorithm::ARGON2ID, true);
        auto c = crypto::derive_key_from_passphrase(PASSPHRASE, other_salt, crypto::KdfAlgorithm::ARGON2ID, true);
        REQUIRE(a == b);
        REQUIRE(a != c);
        REQUIRE(a != crypto::derive_key_from_passphrase(PASSPHRASE, salt, crypto::KdfAlgorithm::PBKDF2));
    }
}

TEST_CASE("X25519 Agreement", "[integration][x25519]") {
    if (sodium_init() < 0) {
        FAIL("Failed to initialize libsodium");
    }

    for (int i = 0; i < 16; ++i) {
        auto a = crypto::x25519_generate();
        auto b = crypto::x25519_generate();
        REQUIRE(crypto::x25519_shared_secret(a.sk, b.pk) == crypto::x25519_shared_secret(b.sk, a.pk));
        REQUIRE(crypto::x25519_public_from_private(a.sk) == a.pk);
    }
}

TEST_CASE("Device Approval End To End", "[integration][device]") {
    if (sodium_init() < 0) {
        FAIL("Failed to initialize libsodium");
    }

    auto store = std::make_shared<remote::MemoryDocumentStore>();
    TestDevice a(store, "Device A");
    a.trust->register_first_device();
    const auto u1 = a.trust->umk();
    REQUIRE(u1.has_value());
    REQUIRE(a.trust->is_device_approved());

    TestDevice b(store, "Device B");
    b.trust->register_new_device();
    REQUIRE(b.trust->is_device_pending());
    REQUIRE_FALSE(b.trust->has_umk());

    a.trust->approve_device(b.id());
    REQUIRE(test::eventually([&] { return b.trust->has_umk(); }));
    REQUIRE(b.trust->umk() == u1);

    // A fresh installation state with B's keys but no cached UMK
    b.restart();
    b.trust->clear_umk();
    REQUIRE(b.trust->try_retrieve_umk());
    REQUIRE(b.trust->umk() == u1);

    SECTION("Revoked record no longer unwraps") {
        b.restart();
        b.trust->clear_umk();
        a.trust->set_current_device_as_primary();

        auto record = b.trust->current_device_record();
        REQUIRE(record->is_revoked());
        REQUIRE_FALSE(record->has_wrapped_umk());
        REQUIRE_FALSE(b.trust->try_retrieve_umk());
        REQUIRE_FALSE(b.trust->has_umk());
    }

    SECTION("Deleted record no longer unwraps") {
        b.restart();
        b.trust->clear_umk();
        a.trust->revoke_device(b.id());
        REQUIRE_FALSE(b.trust->try_retrieve_umk());
        REQUIRE_FALSE(b.trust->has_umk());
    }
}

TEST_CASE("Recovery End To End", "[integration][recovery]") {
    if (sodium_init() < 0) {
        FAIL("Failed to initialize libsodium");
    }

    auto store = std::make_shared<remote::MemoryDocumentStore>();
    TestDevice a(store, "Device A");
    a.trust->register_first_device();
    const auto u1 = a.trust->umk();

    a.recovery->create(PASSPHRASE);
    REQUIRE(a.recovery->verify(PASSPHRASE));
    REQUIRE_FALSE(a.recovery->verify("wrong"));

    TestDevice c(store, "Device C");
    REQUIRE(c.recovery->recover(PASSPHRASE));
    REQUIRE(c.trust->umk() == u1);
    REQUIRE(c.trust->is_device_approved());
    REQUIRE(store->list(remote::paths::devices(test::ACCOUNT)).size() == 2);
}

TEST_CASE("Legacy KDF Fallback End To End", "[integration][recovery]") {
    if (sodium_init() < 0) {
        FAIL("Failed to initialize libsodium");
    }

    auto store = std::make_shared<remote::MemoryDocumentStore>();
    const crypto::Key u1 = crypto::generate_umk();

    Bytes salt = crypto::generate_salt();
    crypto::Key wrap_key = crypto::derive_key_from_passphrase(PASSPHRASE, salt, crypto::KdfAlgorithm::ARGON2ID, true);
    auto sealed = crypto::seal_string(base64_encode(u1.data(), u1.size()), wrap_key);
    store->set(remote::paths::recovery_key(test::ACCOUNT), remote::Document{
        {"encrypted_umk", sealed.ciphertext},
        {"nonce", sealed.nonce},
        {"salt", base64_encode(salt)},
        {"created_at", "2024-06-01T00:00:00Z"},
    });

    // PBKDF2 alone cannot open it
    crypto::Key pbkdf2_key = crypto::derive_key_from_passphrase(PASSPHRASE, salt, crypto::KdfAlgorithm::PBKDF2);
    REQUIRE_THROWS_AS(crypto::open_string(sealed.ciphertext, sealed.nonce, pbkdf2_key), AuthenticationError);

    TestDevice d(store, "Device D");
    REQUIRE(d.recovery->verify(PASSPHRASE));
    REQUIRE(d.recovery->recover(PASSPHRASE));
    REQUIRE(d.trust->umk() == std::optional<crypto::Key>(u1));
}

TEST_CASE("File Envelope End To End", "[integration][file]") {
    if (sodium_init() < 0) {
        FAIL("Failed to initialize libsodium");
    }

    crypto::Key key = crypto::generate_umk();
    for (size_t size : SIZES) {
        Bytes data = crypto::generate_random(size);
        Bytes envelope = crypto::encrypt_bytes(data, key);
        REQUIRE(envelope.size() == crypto::encrypted_size(size));
        REQUIRE(crypto::decrypt_bytes(envelope, key) == data);
    }

    Bytes png = {0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A};
    png.resize(200, 0x00);
    REQUIRE_FALSE(crypto::looks_encrypted(png));
    REQUIRE(crypto::looks_encrypted(crypto::encrypt_bytes(png, key)));
}

TEST_CASE("Note Shared Between Devices", "[integration][payload]") {
    if (sodium_init() < 0) {
        FAIL("Failed to initialize libsodium");
    }

    auto store = std::make_shared<remote::MemoryDocumentStore>();
    TestDevice a(store, "Device A");
    auto service_a = a.make_service();
    REQUIRE(service_a->initialize() == service::CustodyStatus::READY);

    TestDevice b(store, "Device B");
    auto service_b = b.make_service();
    REQUIRE(service_b->initialize() == service::CustodyStatus::PENDING_APPROVAL);

    payload::NoteCipher writer([&] { return a.trust->umk(); });
    payload::NoteCipher reader([&] { return b.trust->umk(); });

    const std::string note_path = "users/" + std::string(test::ACCOUNT) + "/notes/n1";
    store->set(note_path, writer.prepare_for_upload(remote::Document{
        {"title", "Shared"}, {"content", "hello from A"}, {"plain_text", "hello from A"}}));

    auto locked = reader.process_download(*store->get(note_path));
    REQUIRE(locked.at("title") == payload::LOCKED_TITLE);

    a.trust->approve_device(b.id());
    REQUIRE(test::eventually([&] { return service_b->status() == service::CustodyStatus::READY; }));

    auto opened = reader.process_download(*store->get(note_path));
    REQUIRE(opened.at("title") == "Shared");
    REQUIRE(opened.at("content") == "hello from A");
}
