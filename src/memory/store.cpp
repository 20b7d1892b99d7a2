/*
 * Primus C++ - Memory Store Implementation
 *
 * SQLite storage backend for partitions and the audit trail.
 */
#include <primus/memory/store.hpp>
#include <primus/core/logger.hpp>
#include <primus/core/utils.hpp>
#include <sqlite3.h>

namespace primus {

namespace {

std::string column_text(sqlite3_stmt* stmt, int col) {
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? std::string(text) : std::string();
}

std::string column_blob(sqlite3_stmt* stmt, int col) {
    const void* blob = sqlite3_column_blob(stmt, col);
    int size = sqlite3_column_bytes(stmt, col);
    if (!blob || size <= 0) return std::string();
    return std::string(static_cast<const char*>(blob), static_cast<size_t>(size));
}

} // anonymous namespace

MemoryStore::MemoryStore() : db_(nullptr) {}

MemoryStore::~MemoryStore() {
    close();
}

bool MemoryStore::open(const std::string& db_path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }

    if (db_path != ":memory:" && !create_parent_directory(db_path)) {
        last_error_ = "failed to create parent directory for " + db_path;
        LOG_ERROR("[MemoryStore] Failed to create parent directory for '%s'", db_path.c_str());
        return false;
    }

    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        last_error_ = db_ ? sqlite3_errmsg(db_) : "sqlite3_open failed";
        LOG_ERROR("[MemoryStore] Failed to open database '%s': %s",
                  db_path.c_str(), last_error_.c_str());
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    // Enable WAL mode for better concurrent access
    exec_sql("PRAGMA journal_mode=WAL");
    exec_sql("PRAGMA synchronous=NORMAL");
    exec_sql("PRAGMA busy_timeout=5000");

    if (!init_tables()) {
        LOG_ERROR("[MemoryStore] Failed to initialize tables");
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    LOG_INFO("[MemoryStore] Database opened: %s", db_path.c_str());
    return true;
}

void MemoryStore::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool MemoryStore::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_ != nullptr;
}

std::string MemoryStore::last_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

void MemoryStore::set_error_from_db() {
    last_error_ = db_ ? sqlite3_errmsg(db_) : "database not open";
}

bool MemoryStore::exec_sql(const std::string& sql) {
    if (!db_) return false;

    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);

    if (rc != SQLITE_OK) {
        last_error_ = err_msg ? err_msg : "unknown";
        LOG_ERROR("[MemoryStore] SQL error: %s\n  Query: %s", last_error_.c_str(), sql.c_str());
        if (err_msg) sqlite3_free(err_msg);
        return false;
    }
    return true;
}

bool MemoryStore::init_tables() {
    return exec_sql(
        "CREATE TABLE IF NOT EXISTS partitions ("
        "  owner TEXT NOT NULL,"
        "  class TEXT NOT NULL,"
        "  data BLOB NOT NULL,"
        "  updated_at INTEGER NOT NULL,"
        "  PRIMARY KEY (owner, class)"
        ")") &&
    exec_sql(
        "CREATE TABLE IF NOT EXISTS audit_log ("
        "  seq INTEGER PRIMARY KEY,"
        "  timestamp INTEGER NOT NULL,"
        "  actor_id TEXT NOT NULL,"
        "  action TEXT NOT NULL,"
        "  decision TEXT NOT NULL,"
        "  reason TEXT NOT NULL,"
        "  mode TEXT NOT NULL"
        ")") &&
    exec_sql(
        "CREATE TABLE IF NOT EXISTS meta ("
        "  key TEXT PRIMARY KEY,"
        "  value TEXT NOT NULL"
        ")");
}

// ============================================================================
// Partitions
// ============================================================================

bool MemoryStore::put_partition(const PartitionId& id, const std::string& data) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        last_error_ = "database not open";
        return false;
    }

    const char* sql =
        "INSERT INTO partitions (owner, class, data, updated_at) VALUES (?, ?, ?, ?) "
        "ON CONFLICT(owner, class) DO UPDATE SET data = excluded.data, updated_at = excluded.updated_at";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db();
        return false;
    }

    sqlite3_bind_text(stmt, 1, id.owner.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, to_string(id.klass), -1, SQLITE_TRANSIENT);
    sqlite3_bind_blob(stmt, 3, data.data(), static_cast<int>(data.size()), SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 4, current_timestamp_ms());

    int rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) set_error_from_db();
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE;
}

bool MemoryStore::get_partition(const PartitionId& id, std::string& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        last_error_ = "database not open";
        return false;
    }

    const char* sql = "SELECT data FROM partitions WHERE owner = ? AND class = ?";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db();
        return false;
    }

    sqlite3_bind_text(stmt, 1, id.owner.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, to_string(id.klass), -1, SQLITE_TRANSIENT);

    bool found = false;
    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        out = column_blob(stmt, 0);
        found = true;
    } else if (rc != SQLITE_DONE) {
        set_error_from_db();
    }
    sqlite3_finalize(stmt);
    return found;
}

// ============================================================================
// Audit trail
// ============================================================================

bool MemoryStore::append_audit(const AuditRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        last_error_ = "database not open";
        return false;
    }

    const char* sql =
        "INSERT INTO audit_log (seq, timestamp, actor_id, action, decision, reason, mode) "
        "VALUES (?, ?, ?, ?, ?, ?, ?)";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db();
        return false;
    }

    sqlite3_bind_int64(stmt, 1, record.seq);
    sqlite3_bind_int64(stmt, 2, record.timestamp);
    sqlite3_bind_text(stmt, 3, record.actor_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, to_string(record.action), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 5, to_string(record.decision), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 6, record.reason.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 7, to_string(record.mode), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) set_error_from_db();
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE;
}

std::vector<AuditRecord> MemoryStore::load_audit(size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<AuditRecord> records;
    if (!db_) return records;

    const char* sql =
        "SELECT seq, timestamp, actor_id, action, decision, reason, mode FROM "
        "(SELECT * FROM audit_log ORDER BY seq DESC LIMIT ?) ORDER BY seq ASC";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db();
        return records;
    }
    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(limit));

    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        AuditRecord r;
        r.seq = sqlite3_column_int64(stmt, 0);
        r.timestamp = sqlite3_column_int64(stmt, 1);
        r.actor_id = column_text(stmt, 2);
        r.reason = column_text(stmt, 5);
        if (!parse_action_kind(column_text(stmt, 3), r.action) ||
            !parse_decision_kind(column_text(stmt, 4), r.decision) ||
            !parse_mode(column_text(stmt, 6), r.mode)) {
            LOG_WARN("[MemoryStore] Skipping unreadable audit record %lld",
                     static_cast<long long>(r.seq));
            continue;
        }
        records.push_back(r);
    }
    if (rc != SQLITE_DONE) set_error_from_db();
    sqlite3_finalize(stmt);
    return records;
}

int64_t MemoryStore::max_audit_seq() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return 0;

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT COALESCE(MAX(seq), 0) FROM audit_log", -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db();
        return 0;
    }
    int64_t seq = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        seq = sqlite3_column_int64(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return seq;
}

// ============================================================================
// Meta
// ============================================================================

bool MemoryStore::set_meta(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        last_error_ = "database not open";
        return false;
    }

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "INSERT OR REPLACE INTO meta (key, value) VALUES (?, ?)",
                           -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db();
        return false;
    }
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, value.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) set_error_from_db();
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE;
}

std::string MemoryStore::get_meta(const std::string& key, const std::string& def) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return def;

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT value FROM meta WHERE key = ?", -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db();
        return def;
    }
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);

    std::string value = def;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        value = column_text(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return value;
}

} // namespace primus
