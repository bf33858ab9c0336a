#ifndef KEYWARD_PAYLOAD_NOTE_CIPHER_HPP
#define KEYWARD_PAYLOAD_NOTE_CIPHER_HPP

#include "../crypto/primitives.hpp"
#include "../remote/document_store.hpp"

#include <functional>
#include <optional>
#include <string>

namespace keyward {
namespace payload {

namespace fields {
constexpr const char* CIPHERTEXT = "e2ee_ciphertext";
constexpr const char* NONCE = "e2ee_nonce";
constexpr const char* TITLE_CIPHERTEXT = "e2ee_title_ciphertext";
constexpr const char* TITLE_NONCE = "e2ee_title_nonce";
constexpr const char* VERSION = "e2ee_version";
constexpr const char* ENABLED = "e2ee_enabled";

constexpr const char* TITLE = "title";
constexpr const char* CONTENT = "content";
constexpr const char* PLAIN_TEXT = "plain_text";
} // namespace fields

constexpr const char* LOCKED_TITLE = "[Encrypted Note]";
constexpr const char* LOCKED_PREVIEW = "This note is encrypted. Please authorize this device to view it.";
constexpr const char* FAILED_TITLE = "[Decryption Failed]";
constexpr const char* FAILED_PREVIEW = "Failed to decrypt this note.";

/**
 * @brief Encrypted note fields as stored remotely
 */
struct EncryptedPayload {
    std::string ciphertext;                        ///< base64, {"content","title"} JSON
    std::string nonce;
    std::optional<std::string> title_ciphertext;   ///< Title alone, when non-empty
    std::optional<std::string> title_nonce;
    int version = 1;

    /**
     * @throws KeywardError if ciphertext or nonce is missing
     */
    static EncryptedPayload from_document(const remote::Document& doc);

    /// Only the e2ee_* fields
    remote::Document to_document() const;
};

enum class DecryptState {
    DECRYPTED,
    LOCKED,    ///< No UMK on this device
    FAILED     ///< Wrong key, tampering or a malformed payload
};

struct DecryptedPayload {
    DecryptState state = DecryptState::FAILED;
    std::optional<std::string> title;
    std::optional<std::string> body;
    std::optional<std::string> preview;
};

/**
 * @brief True if the document carries e2ee_ciphertext and e2ee_nonce
 */
bool is_encrypted(const remote::Document& doc);

/**
 * @brief Canonical plaintext: {"content": body|null, "title": title|null}
 */
std::string encode_payload(const std::optional<std::string>& title,
                           const std::optional<std::string>& body);

/**
 * @brief Plain-text preview of a rich-text body
 *
 * A body holding a JSON array of ops yields the concatenated string
 * "insert" values, trimmed and cut to 500 code points plus "...". Any other
 * body is returned unchanged. An empty body has no preview.
 */
std::optional<std::string> extract_preview(const std::optional<std::string>& body);

/**
 * @brief Encrypts note payloads under the UMK
 *
 * The key source is consulted on every call, so the cipher follows the
 * UMK as it becomes available or is cleared.
 */
class NoteCipher {
public:
    using KeySource = std::function<std::optional<crypto::Key>()>;

    explicit NoteCipher(KeySource key_source);

    bool is_available() const;

    /**
     * @throws NotAuthorizedError if no UMK is available
     */
    EncryptedPayload encrypt(const std::optional<std::string>& title,
                             const std::optional<std::string>& body) const;

    /**
     * @brief Never throws for a locked device or a bad payload; see DecryptState
     */
    DecryptedPayload decrypt(const EncryptedPayload& payload) const;

    /**
     * @brief Replace title, content and plain_text with the encrypted fields
     *
     * Without a UMK the note is returned unchanged.
     */
    remote::Document prepare_for_upload(const remote::Document& note) const;

    /**
     * @brief Fill title, content and plain_text from an encrypted document
     *
     * Unencrypted documents pass through. Locked and failed notes get
     * placeholder text.
     */
    remote::Document process_download(const remote::Document& doc) const;

private:
    KeySource key_source_;
};

} // namespace payload
} // namespace keyward

#endif // KEYWARD_PAYLOAD_NOTE_CIPHER_HPP
