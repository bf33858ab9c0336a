#include "note_cipher.hpp"
#include "../core/errors.hpp"
#include "../core/side_channel.hpp"
#include "../keyward_config.hpp"

namespace keyward {
namespace payload {

namespace {

std::optional<std::string> optional_string(const remote::Document& doc, const char* key) {
    auto it = doc.find(key);
    if (it == doc.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

remote::Document nullable(const std::optional<std::string>& value) {
    return value ? remote::Document(*value) : remote::Document(nullptr);
}

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n\f\v";
    auto first = s.find_first_not_of(ws);
    if (first == std::string::npos) return {};
    auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

// Byte offset of the n-th UTF-8 code point, or npos if the text is shorter
size_t utf8_offset(const std::string& s, size_t n) {
    size_t count = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        if ((static_cast<unsigned char>(s[i]) & 0xC0) == 0x80) continue;
        if (count == n) return i;
        ++count;
    }
    return std::string::npos;
}

} // namespace

EncryptedPayload EncryptedPayload::from_document(const remote::Document& doc) {
    EncryptedPayload p;
    auto ct = optional_string(doc, fields::CIPHERTEXT);
    auto nonce = optional_string(doc, fields::NONCE);
    if (!ct || !nonce) throw KeywardError("payload: missing e2ee_ciphertext or e2ee_nonce");
    p.ciphertext = *ct;
    p.nonce = *nonce;
    p.title_ciphertext = optional_string(doc, fields::TITLE_CIPHERTEXT);
    p.title_nonce = optional_string(doc, fields::TITLE_NONCE);
    auto version = doc.find(fields::VERSION);
    if (version != doc.end() && version->is_number_integer()) p.version = version->get<int>();
    return p;
}

remote::Document EncryptedPayload::to_document() const {
    remote::Document doc = remote::Document::object();
    doc[fields::CIPHERTEXT] = ciphertext;
    doc[fields::NONCE] = nonce;
    if (title_ciphertext && title_nonce) {
        doc[fields::TITLE_CIPHERTEXT] = *title_ciphertext;
        doc[fields::TITLE_NONCE] = *title_nonce;
    }
    doc[fields::VERSION] = version;
    return doc;
}

bool is_encrypted(const remote::Document& doc) {
    if (!doc.is_object()) return false;
    return optional_string(doc, fields::CIPHERTEXT).has_value() &&
           optional_string(doc, fields::NONCE).has_value();
}

std::string encode_payload(const std::optional<std::string>& title,
                           const std::optional<std::string>& body) {
    // nlohmann::json keeps object keys sorted
    remote::Document doc = remote::Document::object();
    doc[fields::TITLE] = nullable(title);
    doc[fields::CONTENT] = nullable(body);
    return doc.dump();
}

std::optional<std::string> extract_preview(const std::optional<std::string>& body) {
    if (!body || body->empty()) return std::nullopt;

    remote::Document ops = remote::Document::parse(*body, nullptr, false);
    if (ops.is_discarded() || !ops.is_array()) return body;

    std::string text;
    for (const auto& op : ops) {
        if (!op.is_object()) continue;
        auto insert = op.find("insert");
        if (insert != op.end() && insert->is_string()) text += insert->get<std::string>();
    }
    text = trim(text);

    size_t cut = utf8_offset(text, KEYWARD_PREVIEW_MAX_CHARS);
    if (cut != std::string::npos) text = text.substr(0, cut) + "...";
    return text;
}

NoteCipher::NoteCipher(KeySource key_source)
    : key_source_(std::move(key_source)) {
    if (!key_source_) throw KeywardError("note cipher requires a key source");
}

bool NoteCipher::is_available() const {
    return key_source_().has_value();
}

EncryptedPayload NoteCipher::encrypt(const std::optional<std::string>& title,
                                     const std::optional<std::string>& body) const {
    auto umk = key_source_();
    if (!umk) throw NotAuthorizedError("cannot encrypt note: UMK not available");
    side_channel::SecureWipe<crypto::Key> wipe(*umk);

    EncryptedPayload out;
    auto sealed = crypto::seal_string(encode_payload(title, body), *umk);
    out.ciphertext = sealed.ciphertext;
    out.nonce = sealed.nonce;

    if (title && !title->empty()) {
        auto sealed_title = crypto::seal_string(*title, *umk);
        out.title_ciphertext = sealed_title.ciphertext;
        out.title_nonce = sealed_title.nonce;
    }
    out.version = KEYWARD_PAYLOAD_VERSION;
    return out;
}

DecryptedPayload NoteCipher::decrypt(const EncryptedPayload& payload) const {
    DecryptedPayload out;
    auto umk = key_source_();
    if (!umk) {
        out.state = DecryptState::LOCKED;
        out.title = LOCKED_TITLE;
        out.preview = LOCKED_PREVIEW;
        return out;
    }
    side_channel::SecureWipe<crypto::Key> wipe(*umk);

    try {
        std::string json = crypto::open_string(payload.ciphertext, payload.nonce, *umk);
        remote::Document doc = remote::Document::parse(json, nullptr, false);
        if (doc.is_discarded() || !doc.is_object()) {
            throw KeywardError("payload: decrypted data is not a JSON object");
        }
        out.title = optional_string(doc, fields::TITLE);
        out.body = optional_string(doc, fields::CONTENT);
        out.preview = extract_preview(out.body);
        out.state = DecryptState::DECRYPTED;
    } catch (const KeywardError&) {
        out = DecryptedPayload{};
        out.state = DecryptState::FAILED;
        out.title = FAILED_TITLE;
        out.preview = FAILED_PREVIEW;
    }
    return out;
}

remote::Document NoteCipher::prepare_for_upload(const remote::Document& note) const {
    if (!note.is_object()) throw KeywardError("note: document is not an object");
    if (!is_available()) return note;

    auto encrypted = encrypt(optional_string(note, fields::TITLE), optional_string(note, fields::CONTENT));

    remote::Document out = note;
    out.erase(fields::TITLE);
    out.erase(fields::CONTENT);
    out.erase(fields::PLAIN_TEXT);
    out.update(encrypted.to_document());
    out[fields::ENABLED] = true;
    return out;
}

remote::Document NoteCipher::process_download(const remote::Document& doc) const {
    if (!is_encrypted(doc)) return doc;

    auto decrypted = decrypt(EncryptedPayload::from_document(doc));
    remote::Document out = doc;
    out[fields::TITLE] = nullable(decrypted.title);
    out[fields::CONTENT] = nullable(decrypted.body);
    out[fields::PLAIN_TEXT] = nullable(decrypted.preview);
    return out;
}

} // namespace payload
} // namespace keyward
