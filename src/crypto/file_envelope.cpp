#include "file_envelope.hpp"

#include <cstring>

namespace keyward {
namespace crypto {

namespace {

struct MagicSignature {
    size_t offset;
    const uint8_t* bytes;
    size_t len;
};

const uint8_t JPEG_MAGIC[] = {0xFF, 0xD8, 0xFF};
const uint8_t PNG_MAGIC[] = {0x89, 0x50, 0x4E, 0x47};
const uint8_t GIF_MAGIC[] = {0x47, 0x49, 0x46, 0x38};
const uint8_t RIFF_MAGIC[] = {0x52, 0x49, 0x46, 0x46};  // WebP, WAV
const uint8_t MP3_FRAME_MAGIC[] = {0xFF, 0xFB};
const uint8_t ID3_MAGIC[] = {0x49, 0x44, 0x33};
const uint8_t FTYP_MAGIC[] = {0x66, 0x74, 0x79, 0x70};  // MP4, M4A at offset 4

const MagicSignature SIGNATURES[] = {
    {0, JPEG_MAGIC, sizeof(JPEG_MAGIC)},
    {0, PNG_MAGIC, sizeof(PNG_MAGIC)},
    {0, GIF_MAGIC, sizeof(GIF_MAGIC)},
    {0, RIFF_MAGIC, sizeof(RIFF_MAGIC)},
    {0, MP3_FRAME_MAGIC, sizeof(MP3_FRAME_MAGIC)},
    {0, ID3_MAGIC, sizeof(ID3_MAGIC)},
    {4, FTYP_MAGIC, sizeof(FTYP_MAGIC)},
};

bool matches(const Bytes& data, const MagicSignature& sig) {
    return data.size() >= sig.offset + sig.len &&
           std::memcmp(data.data() + sig.offset, sig.bytes, sig.len) == 0;
}

} // namespace

Bytes encrypt_bytes(const Bytes& plaintext, const Key& key) {
    auto sealed = aead_encrypt(plaintext, key);
    Bytes out;
    out.reserve(NONCE_BYTES + sealed.ciphertext.size());
    out.insert(out.end(), sealed.nonce.begin(), sealed.nonce.end());
    out.insert(out.end(), sealed.ciphertext.begin(), sealed.ciphertext.end());
    return out;
}

Bytes decrypt_bytes(const Bytes& envelope, const Key& key) {
    if (envelope.size() < ENVELOPE_OVERHEAD) {
        throw KeywardError("encrypted data too short");
    }
    Nonce nonce{};
    std::memcpy(nonce.data(), envelope.data(), NONCE_BYTES);
    Bytes ct(envelope.begin() + NONCE_BYTES, envelope.end());
    return aead_decrypt(ct, nonce, key);
}

bool looks_encrypted(const Bytes& data) {
    if (data.size() < ENVELOPE_OVERHEAD) return false;
    for (const auto& sig : SIGNATURES) {
        if (matches(data, sig)) return false;
    }
    return true;
}

size_t plaintext_size(size_t envelope_size) {
    if (envelope_size < ENVELOPE_OVERHEAD) {
        throw KeywardError("encrypted data too short");
    }
    return envelope_size - ENVELOPE_OVERHEAD;
}

} // namespace crypto
} // namespace keyward
