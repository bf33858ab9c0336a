#include "primitives.hpp"
#include "../core/side_channel.hpp"

namespace keyward {
namespace crypto {

void check_sodium() {
    if (sodium_init() < 0) throw KeywardError("sodium_init failed");
}

AeadResult aead_encrypt(const Bytes& plaintext, const Key& key) {
    AeadResult out;
    randombytes_buf(out.nonce.data(), out.nonce.size());

    out.ciphertext.resize(plaintext.size() + TAG_BYTES);
    unsigned long long ct_len = 0;
    if (crypto_aead_xchacha20poly1305_ietf_encrypt(
            out.ciphertext.data(), &ct_len,
            plaintext.data(), plaintext.size(),
            nullptr, 0,
            nullptr,
            out.nonce.data(), key.data()) != 0) {
        throw KeywardError("aead encrypt failed");
    }
    out.ciphertext.resize(static_cast<size_t>(ct_len));
    return out;
}

Bytes aead_decrypt(const Bytes& ciphertext, const Nonce& nonce, const Key& key) {
    if (ciphertext.size() < TAG_BYTES) {
        throw AuthenticationError("ciphertext shorter than tag");
    }
    Bytes pt(ciphertext.size() - TAG_BYTES);
    unsigned long long pt_len = 0;
    if (crypto_aead_xchacha20poly1305_ietf_decrypt(
            pt.data(), &pt_len,
            nullptr,
            ciphertext.data(), ciphertext.size(),
            nullptr, 0,
            nonce.data(), key.data()) != 0) {
        side_channel::secure_zero_memory(pt.data(), pt.size());
        throw AuthenticationError("aead tag mismatch");
    }
    pt.resize(static_cast<size_t>(pt_len));
    return pt;
}

SealedString seal_string(const std::string& text, const Key& key) {
    Bytes pt(text.begin(), text.end());
    side_channel::SecureWipe<Bytes> wipe(pt);
    auto sealed = aead_encrypt(pt, key);
    return SealedString{base64_encode(sealed.ciphertext),
                        base64_encode(sealed.nonce.data(), sealed.nonce.size())};
}

std::string open_string(const std::string& ciphertext_b64,
                        const std::string& nonce_b64,
                        const Key& key) {
    auto nonce = to_array<NONCE_BYTES>(base64_decode(nonce_b64), "nonce");
    auto pt = aead_decrypt(base64_decode(ciphertext_b64), nonce, key);
    std::string text(pt.begin(), pt.end());
    side_channel::secure_zero_memory(pt.data(), pt.size());
    return text;
}

X25519KeyPair x25519_generate() {
    X25519KeyPair kp;
    if (crypto_box_keypair(kp.pk.data(), kp.sk.data()) != 0) {
        throw KeywardError("X25519 keypair generation failed");
    }
    return kp;
}

Key x25519_shared_secret(const PrivateKey& private_key, const PublicKey& public_key) {
    Key shared{};
    if (crypto_scalarmult(shared.data(), private_key.data(), public_key.data()) != 0) {
        side_channel::secure_zero_memory(shared.data(), shared.size());
        throw AuthenticationError("X25519 key agreement rejected peer key");
    }
    return shared;
}

PublicKey x25519_public_from_private(const PrivateKey& private_key) {
    PublicKey pk{};
    if (crypto_scalarmult_base(pk.data(), private_key.data()) != 0) {
        throw KeywardError("X25519 public key derivation failed");
    }
    return pk;
}

Bytes generate_random(size_t n) {
    Bytes out(n);
    if (n > 0) randombytes_buf(out.data(), out.size());
    return out;
}

Bytes generate_salt() {
    return generate_random(SALT_BYTES);
}

Key generate_umk() {
    Key umk{};
    randombytes_buf(umk.data(), umk.size());
    return umk;
}

} // namespace crypto
} // namespace keyward
