/*
 * Primus C++ - Sandbox Vault and Journal Implementation
 */
#include <primus/sandbox/journal.hpp>
#include <primus/core/mode_controller.hpp>
#include <primus/memory/store.hpp>
#include <primus/core/json.hpp>
#include <primus/core/utils.hpp>
#include <openssl/sha.h>
#include <openssl/crypto.h>
#include <fstream>

namespace primus {

// ============================================================================
// SandboxVault
// ============================================================================

SandboxVault::SandboxVault(int iterations)
    : iterations_(iterations > 0 ? iterations : DEFAULT_ITERATIONS)
    , store_(nullptr) {}

void SandboxVault::attach_store(MemoryStore* store) {
    std::lock_guard<std::mutex> lock(mutex_);
    store_ = store;
    if (!store_) return;

    std::string salt;
    if (from_hex(store_->get_meta("sandbox.salt"), salt) && !salt.empty()) {
        salt_ = salt;
        verifier_ = store_->get_meta("sandbox.verifier");
    }
}

std::string SandboxVault::last_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

bool SandboxVault::has_passphrase() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !verifier_.empty();
}

std::string SandboxVault::verifier_for(const std::string& key) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(key.data()), key.size(), digest);
    return to_hex(std::string(reinterpret_cast<const char*>(digest), SHA256_DIGEST_LENGTH));
}

bool SandboxVault::derive(const std::string& passphrase, const std::string& salt, std::string& key) const {
    return AesGcmCipher::derive_key(passphrase, salt, iterations_, key);
}

bool SandboxVault::verify(const std::string& passphrase) const {
    std::string salt, verifier;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        salt = salt_;
        verifier = verifier_;
    }
    if (verifier.empty()) return false;

    std::string key;
    if (!derive(passphrase, salt, key)) return false;

    const std::string candidate = verifier_for(key);
    return candidate.size() == verifier.size() &&
           CRYPTO_memcmp(candidate.data(), verifier.data(), verifier.size()) == 0;
}

bool SandboxVault::set_passphrase(const std::string& current, const std::string& next) {
    if (next.empty()) {
        std::lock_guard<std::mutex> lock(mutex_);
        last_error_ = "passphrase must not be empty";
        return false;
    }
    if (has_passphrase() && !verify(current)) {
        std::lock_guard<std::mutex> lock(mutex_);
        last_error_ = "current passphrase rejected";
        return false;
    }

    std::string salt = random_bytes(AesGcmCipher::SALT_SIZE);
    std::string key;
    if (salt.size() != AesGcmCipher::SALT_SIZE || !derive(next, salt, key)) {
        std::lock_guard<std::mutex> lock(mutex_);
        last_error_ = "key derivation failed";
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    salt_ = salt;
    verifier_ = verifier_for(key);
    if (store_ && !(store_->set_meta("sandbox.salt", to_hex(salt_)) &&
                    store_->set_meta("sandbox.verifier", verifier_))) {
        last_error_ = "failed to persist vault: " + store_->last_error();
        return false;
    }
    return true;
}

std::shared_ptr<Cipher> SandboxVault::derive_cipher(const std::string& passphrase) const {
    if (!verify(passphrase)) {
        std::lock_guard<std::mutex> lock(mutex_);
        last_error_ = "sandbox passphrase rejected";
        return std::shared_ptr<Cipher>();
    }

    std::string salt;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        salt = salt_;
    }
    std::string key;
    if (!derive(passphrase, salt, key)) {
        return std::shared_ptr<Cipher>();
    }
    return std::make_shared<AesGcmCipher>(key);
}

// ============================================================================
// SandboxJournal
// ============================================================================

SandboxJournal::SandboxJournal(const ModeController& modes)
    : modes_(modes) {}

void SandboxJournal::set_path(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    path_ = path;
}

void SandboxJournal::set_cipher(std::shared_ptr<Cipher> cipher) {
    std::lock_guard<std::mutex> lock(mutex_);
    cipher_ = cipher;
}

std::string SandboxJournal::last_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

void SandboxJournal::set_error(const std::string& error) {
    last_error_ = error;
}

bool SandboxJournal::ensure_open() {
    if (modes_.current_mode() != Mode::SANDBOX) {
        set_error("the journal is only available in sandbox mode");
        return false;
    }
    if (!cipher_) {
        set_error("the journal is locked");
        return false;
    }
    return true;
}

bool SandboxJournal::load_lines(std::vector<std::string>& lines) {
    if (path_.empty()) {
        lines = memory_lines_;
        return true;
    }

    std::ifstream in(path_.c_str());
    if (!in) {
        // Nothing written yet
        lines.clear();
        return true;
    }
    std::string line;
    while (std::getline(in, line)) {
        if (!trim(line).empty()) lines.push_back(line);
    }
    return true;
}

bool SandboxJournal::store_lines(const std::vector<std::string>& lines) {
    if (path_.empty()) {
        memory_lines_ = lines;
        return true;
    }

    if (!create_parent_directory(path_)) {
        set_error("cannot create journal directory");
        return false;
    }
    std::ofstream out(path_.c_str(), std::ios::trunc);
    if (!out) {
        set_error("cannot write journal");
        return false;
    }
    for (size_t i = 0; i < lines.size(); ++i) {
        out << lines[i] << "\n";
    }
    return static_cast<bool>(out);
}

bool SandboxJournal::decode_line(const std::string& line, JournalEntry& out) const {
    Json outer = Json::parse(line, nullptr, false);
    if (outer.is_discarded() || !outer.is_object() || !outer.contains("sealed") ||
        !outer["sealed"].is_string()) {
        return false;
    }

    std::string sealed, plain;
    if (!base64_decode(outer["sealed"].get<std::string>(), sealed) || !cipher_->open(sealed, plain)) {
        return false;
    }

    Json entry = Json::parse(plain, nullptr, false);
    if (entry.is_discarded() || !entry.is_object()) return false;

    out.entry_id = entry.value("entry_id", "");
    out.timestamp = entry.value("timestamp", "");
    out.mode = entry.value("mode", "user");
    out.text = entry.value("text", "");
    return !out.entry_id.empty();
}

bool SandboxJournal::add_entry(const std::string& text, const std::string& mode, JournalEntry& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ensure_open()) return false;
    if (mode != "root" && mode != "user") {
        set_error("journal mode must be root or user");
        return false;
    }

    JournalEntry entry;
    entry.entry_id = generate_uuid();
    entry.timestamp = format_timestamp(current_timestamp());
    entry.mode = mode;
    entry.text = text;
    if (entry.entry_id.empty()) {
        set_error("failed to generate entry id");
        return false;
    }

    Json payload;
    payload["entry_id"] = entry.entry_id;
    payload["timestamp"] = entry.timestamp;
    payload["mode"] = entry.mode;
    payload["text"] = entry.text;

    std::string sealed;
    if (!cipher_->seal(payload.dump(), sealed)) {
        set_error("failed to seal journal entry");
        return false;
    }

    Json line;
    line["sealed"] = base64_encode(sealed);

    std::vector<std::string> lines;
    if (!load_lines(lines)) return false;
    lines.push_back(line.dump());
    if (!store_lines(lines)) return false;

    out = entry;
    return true;
}

bool SandboxJournal::list_entries(size_t limit, std::vector<JournalEntry>& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ensure_open()) return false;

    std::vector<std::string> lines;
    if (!load_lines(lines)) return false;

    size_t start = (limit > 0 && lines.size() > limit) ? lines.size() - limit : 0;
    for (size_t i = start; i < lines.size(); ++i) {
        JournalEntry entry;
        if (!decode_line(lines[i], entry)) continue;   // written under another key
        entry.text.clear();
        out.push_back(entry);
    }
    return true;
}

bool SandboxJournal::read_entry(const std::string& entry_id, JournalEntry& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ensure_open()) return false;

    std::vector<std::string> lines;
    if (!load_lines(lines)) return false;

    for (size_t i = 0; i < lines.size(); ++i) {
        JournalEntry entry;
        if (decode_line(lines[i], entry) && entry.entry_id == entry_id) {
            out = entry;
            return true;
        }
    }
    set_error("no journal entry " + entry_id);
    return false;
}

bool SandboxJournal::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ensure_open()) return false;

    std::vector<std::string> lines;
    if (!load_lines(lines)) return false;

    std::string latest_mode = "root";
    for (size_t i = lines.size(); i > 0; --i) {
        JournalEntry entry;
        if (decode_line(lines[i - 1], entry)) {
            latest_mode = entry.mode;
            break;
        }
    }
    if (latest_mode != "root") {
        set_error("the journal can only be cleared in root mode");
        return false;
    }
    return store_lines(std::vector<std::string>());
}

} // namespace primus
