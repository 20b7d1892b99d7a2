/*
 * Primus C++ - Sandbox Vault and Journal (Captain's Log)
 *
 * The vault holds the salt and verifier of the optional sandbox passphrase
 * and derives the sandbox cipher from it. The journal is an encrypted
 * JSON-lines log that only opens while the process is in sandbox mode.
 * Neither ever writes to the audit log or the logger.
 */
#ifndef primus_SANDBOX_JOURNAL_HPP
#define primus_SANDBOX_JOURNAL_HPP

#include <primus/sandbox/cipher.hpp>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace primus {

class MemoryStore;
class ModeController;

class SandboxVault {
public:
    static constexpr int DEFAULT_ITERATIONS = 200000;

    explicit SandboxVault(int iterations = DEFAULT_ITERATIONS);

    // Loads salt and verifier from the store's meta table (not owned)
    void attach_store(MemoryStore* store);

    bool has_passphrase() const;

    // Sets the first passphrase, or replaces it when `current` verifies
    bool set_passphrase(const std::string& current, const std::string& next);
    bool verify(const std::string& passphrase) const;

    // Null when the passphrase does not verify
    std::shared_ptr<Cipher> derive_cipher(const std::string& passphrase) const;

    std::string last_error() const;

private:
    bool derive(const std::string& passphrase, const std::string& salt, std::string& key) const;
    static std::string verifier_for(const std::string& key);

    int iterations_;
    MemoryStore* store_;
    mutable std::mutex mutex_;
    std::string salt_;
    std::string verifier_;     // hex SHA-256 of the derived key
    mutable std::string last_error_;
};

struct JournalEntry {
    std::string entry_id;
    std::string timestamp;     // ISO 8601
    std::string mode;          // "root" or "user"
    std::string text;          // empty in listings
};

class SandboxJournal {
public:
    explicit SandboxJournal(const ModeController& modes);

    // Empty path keeps the journal in memory
    void set_path(const std::string& path);
    void set_cipher(std::shared_ptr<Cipher> cipher);

    bool add_entry(const std::string& text, const std::string& mode, JournalEntry& out);

    // Newest last; at most `limit` entries (0 = all)
    bool list_entries(size_t limit, std::vector<JournalEntry>& out);
    bool read_entry(const std::string& entry_id, JournalEntry& out);

    // Only allowed when the latest entry was made in root mode
    bool clear();

    std::string last_error() const;

private:
    bool ensure_open();
    bool load_lines(std::vector<std::string>& lines);
    bool store_lines(const std::vector<std::string>& lines);
    bool decode_line(const std::string& line, JournalEntry& out) const;
    void set_error(const std::string& error);

    const ModeController& modes_;
    mutable std::mutex mutex_;
    std::string path_;
    std::shared_ptr<Cipher> cipher_;
    std::vector<std::string> memory_lines_;
    std::string last_error_;
};

} // namespace primus

#endif // primus_SANDBOX_JOURNAL_HPP
