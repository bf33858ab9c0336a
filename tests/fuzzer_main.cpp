#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <stdexcept>
#include <cstring>
#include <algorithm>
#include <string>

// Include the CLI translation unit but exclude its main function
#define KEYWARD_FUZZER_BUILD
#include "../keyward.cpp"

using namespace keyward;

namespace {

crypto::Key fuzz_key() {
    crypto::Key key{};
    for (size_t i = 0; i < key.size(); ++i) key[i] = static_cast<uint8_t>(i * 7 + 1);
    return key;
}

} // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    try {
        crypto::check_sodium();

        Bytes input(data, data + size);
        const std::string text(reinterpret_cast<const char*>(data), size);
        const crypto::Key key = fuzz_key();

        // Envelope parsing: arbitrary bytes must be rejected, never accepted
        crypto::looks_encrypted(input);
        try {
            crypto::decrypt_bytes(input, key);
            if (size < crypto::encrypted_size(0)) {
                // Shorter than nonce + tag can never open
                __builtin_trap();
            }
        } catch (const KeywardError&) {
            // Expected for malformed or forged input
        }

        // A sealed copy of the input must open to the same bytes
        Bytes sealed = crypto::encrypt_bytes(input, key);
        if (crypto::decrypt_bytes(sealed, key) != input) {
            __builtin_trap();
        }

        // Recovery import never throws; a parsed record always has its wrap fields
        auto record = recovery::parse_recovery_export(text);
        if (record && (record->encrypted_umk.empty() || record->nonce.empty() || record->salt.empty())) {
            __builtin_trap();
        }

        // Preview extraction accepts any body and never exceeds 500 characters plus "..."
        auto preview = payload::extract_preview(text);
        if (preview && preview->size() > 500 * 4 + 3) {
            __builtin_trap();
        }

        // Payload documents from arbitrary JSON
        try {
            auto doc = nlohmann::json::parse(text);
            if (payload::is_encrypted(doc)) {
                payload::NoteCipher cipher([key] { return std::optional<crypto::Key>(key); });
                cipher.process_download(doc);
            }
        } catch (const nlohmann::json::exception&) {
            // Expected for malformed input
        } catch (const KeywardError&) {
            // Expected for malformed payload fields
        }

    } catch (const std::exception&) {
        // Catch any unexpected exceptions
    }

    return 0;
}
