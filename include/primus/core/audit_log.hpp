/*
 * Primus C++ - Audit Log
 *
 * Append-only record of enforcement decisions. Suppression follows the
 * sandbox mode exactly: nothing is recorded while in SANDBOX, and nothing
 * about a sandbox session is recorded afterwards.
 */
#ifndef primus_CORE_AUDIT_LOG_HPP
#define primus_CORE_AUDIT_LOG_HPP

#include <primus/core/types.hpp>
#include <deque>
#include <mutex>
#include <vector>

namespace primus {

class MemoryStore;
class ModeController;

class AuditLog {
public:
    AuditLog();

    // Persist records through `store` (not owned) and reload the most
    // recent `reload_limit` ones. With a store attached only that many
    // records stay in memory; older ones are read back from the store.
    void attach_store(MemoryStore* store, size_t reload_limit = 1000);

    // Ties suppression to the controller's SANDBOX state
    void bind(ModeController& modes);

    // Assigns seq and timestamp. False (nothing recorded) while suppressed
    // or when the record was made in SANDBOX mode.
    bool append(AuditRecord record);

    bool suppressed() const;

    // Last `n` records, oldest first
    std::vector<AuditRecord> tail(size_t n) const;
    // Records held in memory
    size_t size() const;

private:
    void set_suppressed(bool suppressed);

    mutable std::mutex mutex_;
    std::deque<AuditRecord> records_;
    bool suppressed_;
    int64_t next_seq_;
    MemoryStore* store_;
    size_t reload_limit_;
};

} // namespace primus

#endif // primus_CORE_AUDIT_LOG_HPP
