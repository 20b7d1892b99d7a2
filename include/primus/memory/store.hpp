/*
 * Primus C++ - Memory SQLite Store
 *
 * Durable backing for partition contents, the audit trail and a small
 * key/value meta table (sandbox vault salt and verifier).
 *
 *   partitions(owner, class, data, updated_at)
 *   audit_log(seq, timestamp, actor_id, action, decision, reason, mode)
 *   meta(key, value)
 *
 * Sandbox-private partitions only ever reach this store sealed.
 */
#ifndef primus_MEMORY_STORE_HPP
#define primus_MEMORY_STORE_HPP

#include <primus/core/types.hpp>
#include <string>
#include <vector>
#include <mutex>
#include <sqlite3.h>

namespace primus {

class MemoryStore {
public:
    MemoryStore();
    ~MemoryStore();

    // ":memory:" opens a private in-memory database
    bool open(const std::string& db_path);
    void close();
    bool is_open() const;

    // Partitions
    bool put_partition(const PartitionId& id, const std::string& data);
    // False when the partition has no stored row (or on error, see last_error)
    bool get_partition(const PartitionId& id, std::string& out);

    // Audit trail
    bool append_audit(const AuditRecord& record);
    // Most recent `limit` records, oldest first
    std::vector<AuditRecord> load_audit(size_t limit);
    int64_t max_audit_seq();

    // Meta
    bool set_meta(const std::string& key, const std::string& value);
    std::string get_meta(const std::string& key, const std::string& def = "");

    std::string last_error() const;

private:
    MemoryStore(const MemoryStore&);
    MemoryStore& operator=(const MemoryStore&);

    bool init_tables();
    bool exec_sql(const std::string& sql);
    void set_error_from_db();

    sqlite3* db_;
    mutable std::mutex mutex_;
    std::string last_error_;
};

} // namespace primus

#endif // primus_MEMORY_STORE_HPP
