#include "audit_logger.hpp"
#include "../core/encoding.hpp"
#include "../core/errors.hpp"
#include "../core/side_channel.hpp"

#include <algorithm>
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <nlohmann/json.hpp>

namespace keyward {
namespace security {

const char* severity_to_string(AuditSeverity sev) {
    switch (sev) {
        case AuditSeverity::DEBUG: return "DEBUG";
        case AuditSeverity::INFO: return "INFO";
        case AuditSeverity::NOTICE: return "NOTICE";
        case AuditSeverity::WARNING: return "WARNING";
        case AuditSeverity::ERROR: return "ERROR";
        case AuditSeverity::CRITICAL: return "CRITICAL";
        case AuditSeverity::ALERT: return "ALERT";
        case AuditSeverity::EMERGENCY: return "EMERGENCY";
        case AuditSeverity::SECURITY: return "SECURITY";
        default: return "UNKNOWN";
    }
}

AuditSeverity severity_from_string(const std::string& name) {
    for (auto sev : {AuditSeverity::DEBUG, AuditSeverity::INFO, AuditSeverity::NOTICE,
                     AuditSeverity::WARNING, AuditSeverity::ERROR, AuditSeverity::CRITICAL,
                     AuditSeverity::ALERT, AuditSeverity::EMERGENCY, AuditSeverity::SECURITY}) {
        if (name == severity_to_string(sev)) return sev;
    }
    throw KeywardError("unknown audit severity: " + name);
}

AuditLogger::AuditLogger(const AuditLoggerConfig& config) : config_(config) {
    load_chain_state();

    if (config_.enable_signing && config_.signing_key_path) {
        if (!std::filesystem::exists(*config_.signing_key_path)) {
            throw KeywardError("audit signing key not found: " + config_.signing_key_path->string());
        }
        std::ifstream f(*config_.signing_key_path, std::ios::binary);
        std::vector<uint8_t> key_bytes((std::istreambuf_iterator<char>(f)),
                                       std::istreambuf_iterator<char>());
        side_channel::SecureWipe<std::vector<uint8_t>> wipe(key_bytes);
        if (key_bytes.size() != crypto_sign_SECRETKEYBYTES) {
            throw KeywardError("audit signing key must be " +
                               std::to_string(crypto_sign_SECRETKEYBYTES) + " bytes");
        }
        std::memcpy(signing_sk_.data(), key_bytes.data(), signing_sk_.size());
        if (crypto_sign_ed25519_sk_to_pk(signing_pk_.data(), signing_sk_.data()) != 0) {
            throw KeywardError("audit signing key is invalid");
        }
        signing_enabled_ = true;
    }
}

AuditLogger::~AuditLogger() {
    side_channel::secure_zero_memory(signing_sk_.data(), signing_sk_.size());
}

std::array<uint8_t, 32> AuditLogger::blake2b_hash(const std::vector<uint8_t>& data) {
    std::array<uint8_t, 32> hash;
    if (crypto_generichash(hash.data(), hash.size(), data.data(), data.size(), nullptr, 0) != 0) {
        throw KeywardError("BLAKE2b hash failed");
    }
    return hash;
}

std::vector<uint8_t> AuditLogger::canonical_bytes(const AuditRecord& record) {
    std::vector<uint8_t> out(record.previous_hash.begin(), record.previous_hash.end());
    out.reserve(512);

    auto put_le64 = [&out](uint64_t v) {
        for (int shift = 0; shift < 64; shift += 8) out.push_back(static_cast<uint8_t>(v >> shift));
    };
    auto put_field = [&out](const std::string& field) {
        out.insert(out.end(), field.begin(), field.end());
        out.push_back(0);
    };

    put_le64(record.sequence_number);
    put_le64(static_cast<uint64_t>(to_unix_millis(record.timestamp)));
    out.push_back(static_cast<uint8_t>(record.severity));
    out.push_back(0);

    for (const std::string* field : {&record.category, &record.action, &record.subject,
                                     &record.object, &record.result, &record.message}) {
        put_field(*field);
    }
    if (record.error_code) put_field(*record.error_code);
    return out;
}

std::array<uint8_t, 64> AuditLogger::sign_hash(const std::array<uint8_t, 32>& hash) const {
    std::array<uint8_t, 64> signature;
    unsigned long long sig_len = 0;
    if (crypto_sign_detached(signature.data(), &sig_len, hash.data(), hash.size(),
                             signing_sk_.data()) != 0) {
        throw KeywardError("Signature generation failed");
    }
    return signature;
}

std::string AuditLogger::to_json(const AuditRecord& record) {
    nlohmann::ordered_json j;
    j["seq"] = record.sequence_number;
    j["ts"] = format_iso8601(record.timestamp);
    j["sev"] = severity_to_string(record.severity);
    j["cat"] = record.category;
    j["act"] = record.action;
    j["sub"] = record.subject;
    j["obj"] = record.object;
    j["res"] = record.result;
    j["msg"] = record.message;
    j["prev"] = hex_encode(record.previous_hash.data(), record.previous_hash.size());
    j["hash"] = hex_encode(record.current_hash.data(), record.current_hash.size());
    if (record.signature && record.signing_key) {
        j["sig"] = hex_encode(record.signature->data(), record.signature->size());
        j["pub"] = hex_encode(record.signing_key->data(), record.signing_key->size());
    }
    if (record.error_code) j["err"] = *record.error_code;
    return j.dump();
}

void AuditLogger::report_error(const std::string& message) const {
    if (on_error_) {
        on_error_(message);
    } else {
        std::cerr << "WARNING: audit: " << message << "\n";
    }
}

// Chain state file: {"seq": <n>, "hash": "<64 hex>"}
void AuditLogger::load_chain_state() {
    if (!config_.chain_file || !std::filesystem::exists(*config_.chain_file)) return;

    try {
        std::ifstream in(*config_.chain_file);
        auto state = nlohmann::json::parse(in);
        auto hash = hex_decode(state.at("hash").get<std::string>());
        if (hash.size() != last_hash_.size()) throw KeywardError("bad hash length");
        sequence_number_ = state.at("seq").get<uint64_t>();
        std::copy(hash.begin(), hash.end(), last_hash_.begin());
        have_last_hash_ = true;
    } catch (const nlohmann::json::exception& e) {
        report_error("chain state unreadable, starting a new chain: " + std::string(e.what()));
    } catch (const KeywardError& e) {
        report_error("chain state unreadable, starting a new chain: " + std::string(e.what()));
    }
}

void AuditLogger::save_chain_state() {
    if (!config_.chain_file) return;

    nlohmann::ordered_json state;
    state["seq"] = sequence_number_;
    state["hash"] = hex_encode(last_hash_.data(), last_hash_.size());

    std::ofstream out(*config_.chain_file, std::ios::trunc);
    if (!(out << state.dump() << '\n')) {
        report_error("cannot write chain state " + config_.chain_file->string());
    }
}

void AuditLogger::write_to_file(const AuditRecord& record) {
    if (!config_.log_file) return;

    if (config_.log_file->has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(config_.log_file->parent_path(), ec);
    }

    std::ofstream f(*config_.log_file, std::ios::app);
    if (!f) {
        report_error("Failed to open log file " + config_.log_file->string());
        return;
    }
    f << to_json(record) << '\n';
}

void AuditLogger::echo(const AuditRecord& record) const {
    if (!config_.echo_to_stderr) return;
    // SECURITY ranks as NOTICE for echo purposes
    auto rank = [](AuditSeverity s) {
        return s == AuditSeverity::SECURITY ? static_cast<int>(AuditSeverity::NOTICE)
                                            : static_cast<int>(s);
    };
    if (rank(record.severity) > rank(config_.stderr_threshold)) return;

    std::cerr << severity_to_string(record.severity) << ": " << record.category << " "
              << record.action;
    if (!record.object.empty()) std::cerr << " " << record.object;
    std::cerr << " " << record.result;
    if (!record.message.empty()) std::cerr << ": " << record.message;
    if (record.error_code) std::cerr << " (" << *record.error_code << ")";
    std::cerr << "\n";
}

void AuditLogger::process_record_unlocked(AuditRecord& record) {
    record.sequence_number = ++sequence_number_;

    if (record.timestamp.time_since_epoch().count() == 0) {
        record.timestamp = std::chrono::system_clock::now();
    }
    // The log file keeps millisecond precision
    record.timestamp = std::chrono::time_point_cast<std::chrono::milliseconds>(record.timestamp);

    record.previous_hash = have_last_hash_ ? last_hash_ : std::array<uint8_t, 32>{};
    record.current_hash = blake2b_hash(canonical_bytes(record));

    if (signing_enabled_) {
        record.signature = sign_hash(record.current_hash);
        record.signing_key = signing_pk_;
    }

    last_hash_ = record.current_hash;
    have_last_hash_ = true;
    save_chain_state();

    write_to_file(record);
    echo(record);

    if (on_record_written_) {
        on_record_written_(record);
    }
}

void AuditLogger::log(AuditRecord record) {
    std::lock_guard<std::mutex> lock(mutex_);
    process_record_unlocked(record);
}

void AuditLogger::log(AuditSeverity severity,
                      const std::string& category,
                      const std::string& action,
                      const std::string& subject,
                      const std::string& object,
                      const std::string& result,
                      const std::string& message) {
    AuditRecord record;
    record.severity = severity;
    record.category = category;
    record.action = action;
    record.subject = subject;
    record.object = object;
    record.result = result;
    record.message = message;
    log(std::move(record));
}

void AuditLogger::log_failure(AuditSeverity severity,
                              const std::string& category,
                              const std::string& action,
                              const std::string& subject,
                              const std::string& object,
                              const std::exception& error) {
    AuditRecord record;
    record.severity = severity;
    record.category = category;
    record.action = action;
    record.subject = subject;
    record.object = object;
    record.result = "FAILURE";
    record.error_code = error.what();
    log(std::move(record));
}

void AuditLogger::set_on_record_written(std::function<void(const AuditRecord&)> callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_record_written_ = std::move(callback);
}

void AuditLogger::set_on_error(std::function<void(const std::string&)> callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_error_ = std::move(callback);
}

uint64_t AuditLogger::get_sequence_number() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sequence_number_;
}

std::optional<std::array<uint8_t, 32>> AuditLogger::get_last_hash() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (have_last_hash_) {
        return last_hash_;
    }
    return std::nullopt;
}

namespace {

template <size_t N>
std::array<uint8_t, N> hex_field(const nlohmann::json& j, const char* name) {
    auto raw = hex_decode(j.at(name).get<std::string>());
    if (raw.size() != N) throw KeywardError(std::string("bad length for ") + name);
    std::array<uint8_t, N> out{};
    std::copy(raw.begin(), raw.end(), out.begin());
    return out;
}

} // namespace

ChainVerification AuditLogger::verify_log_file(const std::filesystem::path& path) {
    ChainVerification result;
    std::ifstream f(path);
    if (!f) {
        result.failure = "cannot open " + path.string();
        return result;
    }

    std::optional<std::array<uint8_t, 32>> expected_prev;
    std::optional<uint64_t> expected_seq;
    std::string line;
    uint64_t line_no = 0;

    while (std::getline(f, line)) {
        ++line_no;
        if (line.empty()) continue;
        const std::string where = "line " + std::to_string(line_no) + ": ";

        AuditRecord record;
        std::array<uint8_t, 32> stored_hash{};
        try {
            auto j = nlohmann::json::parse(line);
            record.sequence_number = j.at("seq").get<uint64_t>();
            record.timestamp = parse_iso8601(j.at("ts").get<std::string>());
            record.severity = severity_from_string(j.at("sev").get<std::string>());
            record.category = j.at("cat").get<std::string>();
            record.action = j.at("act").get<std::string>();
            record.subject = j.at("sub").get<std::string>();
            record.object = j.at("obj").get<std::string>();
            record.result = j.at("res").get<std::string>();
            record.message = j.at("msg").get<std::string>();
            if (j.contains("err")) record.error_code = j.at("err").get<std::string>();
            record.previous_hash = hex_field<32>(j, "prev");
            stored_hash = hex_field<32>(j, "hash");
            if (j.contains("sig")) {
                record.signature = hex_field<64>(j, "sig");
                record.signing_key = hex_field<32>(j, "pub");
            }
        } catch (const nlohmann::json::exception& e) {
            result.failure = where + "malformed record: " + e.what();
            return result;
        } catch (const KeywardError& e) {
            result.failure = where + "malformed record: " + e.what();
            return result;
        }

        if (expected_seq && record.sequence_number != *expected_seq) {
            result.failure = where + "sequence gap";
            return result;
        }
        if (expected_prev &&
            !side_channel::constant_time_equal(record.previous_hash, *expected_prev)) {
            result.failure = where + "chain link broken";
            return result;
        }

        auto computed = blake2b_hash(canonical_bytes(record));
        if (!side_channel::constant_time_equal(computed, stored_hash)) {
            result.failure = where + "hash mismatch";
            return result;
        }
        if (record.signature &&
            crypto_sign_verify_detached(record.signature->data(), computed.data(),
                                        computed.size(), record.signing_key->data()) != 0) {
            result.failure = where + "bad signature";
            return result;
        }

        expected_prev = stored_hash;
        expected_seq = record.sequence_number + 1;
        ++result.records_checked;
    }

    result.valid = true;
    return result;
}

std::shared_ptr<AuditLogger> make_default_audit_logger() {
    return std::make_shared<AuditLogger>();
}

} // namespace security
} // namespace keyward
