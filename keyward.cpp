/**
 * @file keyward.cpp
 * @brief Command-line front end for the key-custody services
 *
 * Each state directory plays one device; devices of the same account
 * share a document store snapshot file. Run `keyward help` for the
 * command list.
 */

#include "src/keyward_cli.hpp"
#include "src/core/errors.hpp"
#include "src/core/side_channel.hpp"
#include "src/crypto/file_envelope.hpp"
#include "src/crypto/kdf.hpp"
#include "src/device/device_identity.hpp"
#include "src/payload/note_cipher.hpp"
#include "src/remote/memory_document_store.hpp"
#include "src/service/custody_service.hpp"
#include "src/storage/key_value_store.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>

namespace keyward {
namespace cli {

namespace {

const std::set<std::string> VALUE_OPTIONS = {
    "--state", "--remote", "--account", "--passphrase", "--new-passphrase", "--hint", "--in", "--out",
};
const std::set<std::string> SWITCH_OPTIONS = {"--make-primary", "--force"};

/**
 * @brief Everything one invocation needs, wired for one device
 */
struct Session {
    CustodySettings settings;
    std::shared_ptr<security::AuditLogger> audit;
    std::shared_ptr<remote::MemoryDocumentStore> remote;
    std::shared_ptr<storage::LocalKeyStore> local;
    std::shared_ptr<remote::StaticAccountProvider> accounts;
    std::shared_ptr<device::DeviceTrustManager> trust;
    std::shared_ptr<recovery::RecoveryKeyManager> recovery;
    std::unique_ptr<service::CustodyService> service;
};

std::unique_ptr<Session> open_session(const Options& opts, const CustodySettings& settings, std::ostream& out) {
    auto s = std::make_unique<Session>();
    s->settings = settings;

    security::AuditLoggerConfig audit_config;
    audit_config.log_file = settings.audit_log_file;
    audit_config.chain_file = settings.audit_chain_file;
    if (settings.audit_signing_key) {
        audit_config.enable_signing = true;
        audit_config.signing_key_path = settings.audit_signing_key;
    }
    s->audit = std::make_shared<security::AuditLogger>(audit_config);

    std::filesystem::create_directories(opts.state_dir);
    s->remote = std::make_shared<remote::MemoryDocumentStore>(opts.remote_file);

    std::shared_ptr<storage::KeyValueStore> backend =
        std::make_shared<storage::FileKeyValueStore>(opts.state_dir / "local.json");
    if (settings.storage_key_hex) {
        backend = storage::SealedKeyValueStore::from_hex(backend, *settings.storage_key_hex);
    }
    s->local = std::make_shared<storage::LocalKeyStore>(backend);
    s->accounts = std::make_shared<remote::StaticAccountProvider>(opts.account);

    s->trust = std::make_shared<device::DeviceTrustManager>(
        s->remote, s->local, s->accounts, device::detect_local_device(settings.device_name), settings, s->audit);
    s->recovery = std::make_shared<recovery::RecoveryKeyManager>(
        s->remote, s->accounts, s->trust, settings, s->audit);
    s->service = std::make_unique<service::CustodyService>(
        s->local, s->accounts, s->trust, s->recovery, settings, s->audit);

    s->trust->set_on_new_approval_request([&out](const device::ApprovalRequest& req) {
        out << "New approval request: " << req.device_name << " (" << req.device_id << ")\n";
    });
    return s;
}

// Runs initialize() and waits for any optimistic verification to settle
service::CustodyStatus bring_up(Session& s) {
    s.service->preload_cached_status();
    s.service->initialize();
    s.service->wait_for_background_verification();
    return s.service->status();
}

void print_status(Session& s, std::ostream& out) {
    out << "status:        " << service::custody_status_name(s.service->status()) << "\n";
    auto message = s.service->status_message();
    if (!message.empty()) out << "message:       " << message << "\n";
    out << "account:       " << s.accounts->current_account_id().value_or("-") << "\n";
    out << "device id:     " << s.trust->current_device_id().value_or("-") << "\n";
    out << "device name:   " << s.trust->identity().name << " (" << s.trust->identity().platform << ")\n";
    if (s.trust->current_device_id()) {
        std::string registered;
        try {
            registered = s.trust->device_exists_on_server() ? "yes" : "no";
        } catch (const ConnectivityError&) {
            registered = "unknown";
        }
        out << "registered:    " << registered << "\n";
    }
    out << "UMK held:      " << (s.service->is_available() ? "yes" : "no") << "\n";
    if (s.service->verification_retry_pending()) {
        out << "verification:  deferred, remote store unreachable\n";
    }
    if (s.accounts->current_account_id()) {
        out << "recovery key:  " << (s.recovery->has_recovery_key() ? "set" : "not set") << "\n";
    }
}

void print_devices(Session& s, std::ostream& out) {
    const std::string own = s.trust->current_device_id().value_or("");
    for (const auto& d : s.trust->devices()) {
        out << d.id << "  " << device::device_status_name(d.status) << "  " << d.name
            << " [" << d.platform << "]";
        if (d.id == own) out << "  (this device)";
        if (d.recovered) out << "  (recovered)";
        out << "\n";
        out << "    " << d.description();
        if (d.created_at) out << ", created " << format_iso8601(*d.created_at);
        if (d.approved_at) out << ", approved " << format_iso8601(*d.approved_at);
        if (d.revoked_at) out << ", revoked " << format_iso8601(*d.revoked_at);
        out << "\n";
    }
}

crypto::Key require_umk(Session& s) {
    auto umk = s.trust->umk();
    if (!umk) {
        throw NotAuthorizedError("this device does not hold the UMK (status: " +
                                 std::string(service::custody_status_name(s.service->status())) + ")");
    }
    return *umk;
}

void self_test(std::ostream& out) {
    out << "Running keyward self-tests...\n";

    out << "  Testing AEAD...\n";
    crypto::Key key = crypto::generate_umk();
    Bytes message = {'k', 'e', 'y', 'w', 'a', 'r', 'd'};
    auto sealed = crypto::aead_encrypt(message, key);
    if (crypto::aead_decrypt(sealed.ciphertext, sealed.nonce, key) != message) {
        throw KeywardError("AEAD round trip failed");
    }
    sealed.ciphertext[0] ^= 0x01;
    bool rejected = false;
    try {
        crypto::aead_decrypt(sealed.ciphertext, sealed.nonce, key);
    } catch (const AuthenticationError&) {
        rejected = true;
    }
    if (!rejected) throw KeywardError("AEAD accepted a tampered ciphertext");

    out << "  Testing X25519...\n";
    auto a = crypto::x25519_generate();
    auto b = crypto::x25519_generate();
    if (crypto::x25519_shared_secret(a.sk, b.pk) != crypto::x25519_shared_secret(b.sk, a.pk)) {
        throw KeywardError("ECDH shared secrets differ");
    }

    out << "  Testing PBKDF2...\n";
    Bytes salt = crypto::generate_salt();
    if (crypto::derive_key_from_passphrase("self-test", salt, crypto::KdfAlgorithm::PBKDF2) !=
        crypto::derive_key_from_passphrase("self-test", salt, crypto::KdfAlgorithm::PBKDF2)) {
        throw KeywardError("PBKDF2 is not deterministic");
    }

    out << "  Testing file envelope...\n";
    Bytes body = crypto::generate_random(1024);
    if (crypto::decrypt_bytes(crypto::encrypt_bytes(body, key), key) != body) {
        throw KeywardError("file envelope round trip failed");
    }

    out << "  Testing note payload...\n";
    payload::NoteCipher cipher([&key]() { return std::optional<crypto::Key>(key); });
    auto note = cipher.decrypt(cipher.encrypt(std::string("title"), std::string("body")));
    if (note.state != payload::DecryptState::DECRYPTED || note.body != std::string("body")) {
        throw KeywardError("note payload round trip failed");
    }

    out << "All tests passed!\n";
}

int dispatch(const Options& opts, const CustodySettings& settings, std::ostream& out) {
    const std::string& cmd = opts.command;

    if (cmd == "help") {
        usage(out);
        return 0;
    }
    if (cmd == "self-test") {
        self_test(out);
        return 0;
    }
    if (cmd == "inspect") {
        if (opts.positional.size() != 1) throw KeywardError("inspect takes exactly one file");
        Bytes data = read_all(opts.positional[0]);
        out << "size:            " << data.size() << " bytes\n";
        bool encrypted = crypto::looks_encrypted(data);
        out << "looks encrypted: " << (encrypted ? "yes" : "no") << "\n";
        if (encrypted) out << "plaintext size:  " << crypto::plaintext_size(data.size()) << " bytes\n";
        return 0;
    }

    auto session = open_session(opts, settings, out);
    Session& s = *session;

    if (cmd == "sign-out") {
        s.service->sign_out();
        out << "Signed out; this device's record and local keys were removed.\n";
        return 0;
    }
    if (cmd == "start-fresh") {
        s.service->start_fresh();
        s.service->wait_for_background_verification();
        print_status(s, out);
        return 0;
    }

    if (cmd == "setup") {
        if (bring_up(s) == service::CustodyStatus::NOT_SET_UP) s.service->setup();
        print_status(s, out);
        return 0;
    }

    bring_up(s);

    if (cmd == "status") {
        print_status(s, out);
        return 0;
    }
    if (cmd == "devices") {
        print_devices(s, out);
        return 0;
    }
    if (cmd == "pending") {
        auto pending = s.trust->refresh_pending_approvals();
        if (pending.empty()) out << "No pending devices.\n";
        for (const auto& req : pending) {
            out << req.device_id << "  " << req.device_name << " [" << req.platform << "]  "
                << req.description;
            if (req.requested_at) out << ", requested " << format_iso8601(*req.requested_at);
            out << "\n";
        }
        if (!pending.empty() && !s.trust->is_master_device()) {
            out << "Note: approvals are normally made from the primary device.\n";
        }
        return 0;
    }
    if (cmd == "approve" || cmd == "revoke" || cmd == "reset") {
        if (opts.positional.size() != 1) throw KeywardError(cmd + " takes exactly one device id");
        const std::string& id = opts.positional[0];
        if (cmd == "approve") {
            s.trust->approve_device(id);
            out << "Approved " << id << "\n";
        } else if (cmd == "revoke") {
            s.trust->revoke_device(id);
            out << "Revoked " << id << "\n";
        } else {
            s.trust->reset_device_to_pending(id);
            out << "Reset " << id << " to pending\n";
        }
        return 0;
    }
    if (cmd == "request-reapproval") {
        s.service->request_reapproval();
        print_status(s, out);
        return 0;
    }
    if (cmd == "make-primary") {
        require_umk(s);
        auto takeover = s.trust->set_current_device_as_primary();
        out << "Revoked " << takeover.revoked << " device(s), deleted " << takeover.deleted
            << " pending request(s).\n";
        return 0;
    }
    if (cmd == "purge-pending") {
        out << "Deleted " << s.trust->purge_expired_pending() << " expired pending device(s).\n";
        return 0;
    }

    if (cmd == "recovery-create") {
        s.recovery->create(opts.require("--passphrase"), opts.value("--hint"));
        s.service->set_needs_recovery_key_setup(false);
        out << "Recovery key created.\n";
        return 0;
    }
    if (cmd == "recovery-verify") {
        bool ok = s.recovery->verify(opts.require("--passphrase"));
        out << (ok ? "Passphrase is correct.\n" : "Passphrase is incorrect.\n");
        return ok ? 0 : 1;
    }
    if (cmd == "recovery-recover") {
        bool ok = s.service->recover_with_passphrase(opts.require("--passphrase"), opts.has("--make-primary"));
        if (!ok) {
            out << "Recovery failed: wrong passphrase or no recovery key.\n";
            return 1;
        }
        print_status(s, out);
        return 0;
    }
    if (cmd == "recovery-update") {
        s.recovery->update(opts.require("--passphrase"), opts.require("--new-passphrase"), opts.value("--hint"));
        out << "Recovery key updated.\n";
        return 0;
    }
    if (cmd == "recovery-remove") {
        s.recovery->remove(opts.require("--passphrase"));
        out << "Recovery key removed.\n";
        return 0;
    }
    if (cmd == "recovery-export") {
        auto data = s.recovery->export_recovery_data();
        if (!data) throw NotFoundError("recovery key");
        write_all(opts.require("--out"), Bytes(data->begin(), data->end()));
        out << "Recovery data written to " << opts.require("--out") << "\n";
        return 0;
    }
    if (cmd == "recovery-import") {
        Bytes raw = read_all(opts.require("--in"));
        if (!s.recovery->import_recovery_data(std::string(raw.begin(), raw.end()))) {
            throw KeywardError("malformed recovery data");
        }
        out << "Recovery data imported.\n";
        return 0;
    }

    if (cmd == "encrypt-file" || cmd == "decrypt-file") {
        crypto::Key umk = require_umk(s);
        side_channel::SecureWipe<crypto::Key> wipe(umk);
        Bytes input = read_all(opts.require("--in"));
        Bytes output;
        if (cmd == "encrypt-file") {
            if (crypto::looks_encrypted(input) && !opts.has("--force")) {
                throw InvalidStateError("input already looks encrypted (use --force to encrypt anyway)");
            }
            output = crypto::encrypt_bytes(input, umk);
        } else {
            output = crypto::decrypt_bytes(input, umk);
        }
        write_all(opts.require("--out"), output);
        out << "Wrote " << output.size() << " bytes to " << opts.require("--out") << "\n";
        return 0;
    }

    throw KeywardError("unknown command: " + cmd);
}

} // namespace

std::optional<std::string> Options::value(const std::string& name) const {
    auto it = values.find(name);
    if (it == values.end()) return std::nullopt;
    return it->second;
}

std::string Options::require(const std::string& name) const {
    auto v = value(name);
    if (!v) throw KeywardError("missing required option " + name);
    return *v;
}

Options parse_arguments(int argc, const char* const* argv, const CustodySettings& settings) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a.rfind("--", 0) == 0) {
            if (SWITCH_OPTIONS.count(a)) {
                opts.switches.insert(a);
            } else if (VALUE_OPTIONS.count(a)) {
                if (i + 1 >= argc) throw KeywardError("missing value for " + a);
                opts.values[a] = argv[++i];
            } else {
                throw KeywardError("unknown option: " + a);
            }
        } else if (opts.command.empty()) {
            opts.command = a;
        } else {
            opts.positional.push_back(a);
        }
    }
    if (opts.command.empty()) throw KeywardError("no command given");

    if (auto state = opts.value("--state")) {
        opts.state_dir = *state;
    } else if (settings.state_dir) {
        opts.state_dir = *settings.state_dir;
    } else {
        const char* home = std::getenv("HOME");
        opts.state_dir = std::filesystem::path(home ? home : ".") / ".keyward";
    }

    auto remote_file = opts.value("--remote");
    opts.remote_file = remote_file ? std::filesystem::path(*remote_file) : opts.state_dir / "remote.json";

    if (auto account = opts.value("--account")) {
        opts.account = *account;
    } else {
        const char* env = std::getenv("KEYWARD_ACCOUNT");
        opts.account = (env && *env) ? env : "local";
    }
    return opts;
}

void usage(std::ostream& out) {
    out <<
R"(keyward )" KEYWARD_VERSION_STRING R"( - end-to-end key custody

Usage: keyward [--state <dir>] [--remote <file>] [--account <id>] <command>

Device trust:
  status                        Initialize this device and show its status
  setup                         Register as the account's first device
  devices                       List the account's devices
  pending                       List devices waiting for approval
  approve <id>                  Wrap the UMK for a pending device
  revoke <id>                   Delete another device's record
  reset <id>                    Return another device to pending
  request-reapproval            Ask to be approved again
  make-primary                  Revoke every other device
  purge-pending                 Delete expired pending requests

Recovery key:
  recovery-create --passphrase <p> [--hint <h>]
  recovery-verify --passphrase <p>
  recovery-recover --passphrase <p> [--make-primary]
  recovery-update --passphrase <old> --new-passphrase <new> [--hint <h>]
  recovery-remove --passphrase <p>
  recovery-export --out <file>
  recovery-import --in <file>

Files:
  encrypt-file --in <file> --out <file> [--force]
  decrypt-file --in <file> --out <file>
  inspect <file>

Session:
  start-fresh                   Delete every device record and set up again
  sign-out                      Remove this device and its local keys
  self-test                     Check the crypto building blocks

Environment: KEYWARD_STATE_DIR, KEYWARD_ACCOUNT, KEYWARD_DEVICE_NAME, KEYWARD_STORAGE_KEY,
KEYWARD_DEFAULT_KDF, KEYWARD_ALLOW_ARGON2, KEYWARD_AUDIT_LOG, KEYWARD_AUDIT_CHAIN,
KEYWARD_AUDIT_SIGNING_KEY.
)";
}

int run(int argc, const char* const* argv, std::ostream& out, std::ostream& err) {
    try {
        crypto::check_sodium();
        if (argc < 2) {
            usage(out);
            return 1;
        }
        CustodySettings settings = CustodySettings::from_environment();
        Options opts = parse_arguments(argc, argv, settings);
        return dispatch(opts, settings, out);
    } catch (const std::exception& e) {
        err << "ERROR: " << e.what() << "\n";
        return 1;
    }
}

std::vector<uint8_t> read_all(const std::filesystem::path& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) throw KeywardError("open failed: " + path.string());
    f.seekg(0, std::ios::end);
    std::streamsize n = f.tellg();
    if (n < 0) n = 0;
    f.seekg(0, std::ios::beg);
    std::vector<uint8_t> buf(static_cast<size_t>(n));
    if (n > 0) f.read(reinterpret_cast<char*>(buf.data()), n);
    return buf;
}

void write_all(const std::filesystem::path& path, const std::vector<uint8_t>& data) {
    std::ofstream f(path, std::ios::binary);
    if (!f) throw KeywardError("open failed: " + path.string());
    f.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!f) throw KeywardError("write failed: " + path.string());
}

} // namespace cli
} // namespace keyward

#if !defined(KEYWARD_UNIT_TEST) && !defined(KEYWARD_FUZZER_BUILD)
int main(int argc, char** argv) {
    return keyward::cli::run(argc, argv, std::cout, std::cerr);
}
#endif
