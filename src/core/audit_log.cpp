/*
 * Primus C++ - Audit Log Implementation
 */
#include <primus/core/audit_log.hpp>
#include <primus/core/mode_controller.hpp>
#include <primus/memory/store.hpp>
#include <primus/core/logger.hpp>
#include <primus/core/utils.hpp>

namespace primus {

AuditLog::AuditLog()
    : suppressed_(false)
    , next_seq_(1)
    , store_(nullptr)
    , reload_limit_(0) {}

void AuditLog::attach_store(MemoryStore* store, size_t reload_limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    store_ = store;
    reload_limit_ = reload_limit;
    if (!store_) return;

    std::vector<AuditRecord> loaded = store_->load_audit(reload_limit);
    records_.assign(loaded.begin(), loaded.end());
    next_seq_ = store_->max_audit_seq() + 1;
    LOG_DEBUG("[AuditLog] Reloaded %zu records, next seq %lld",
              records_.size(), static_cast<long long>(next_seq_));
}

void AuditLog::bind(ModeController& modes) {
    set_suppressed(modes.audit_suppressed());
    modes.add_listener([this](Mode, Mode to) {
        set_suppressed(to == Mode::SANDBOX);
    });
}

void AuditLog::set_suppressed(bool suppressed) {
    std::lock_guard<std::mutex> lock(mutex_);
    suppressed_ = suppressed;
}

bool AuditLog::suppressed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return suppressed_;
}

bool AuditLog::append(AuditRecord record) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (suppressed_ || record.mode == Mode::SANDBOX) {
        return false;
    }

    record.seq = next_seq_++;
    if (record.timestamp == 0) {
        record.timestamp = current_timestamp_ms();
    }

    if (store_ && !store_->append_audit(record)) {
        LOG_ERROR("[AuditLog] Failed to persist record %lld: %s",
                  static_cast<long long>(record.seq), store_->last_error().c_str());
    }
    records_.push_back(record);
    if (store_) {
        while (records_.size() > reload_limit_) records_.pop_front();
    }
    return true;
}

std::vector<AuditRecord> AuditLog::tail(size_t n) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (n > records_.size() && store_) {
        return store_->load_audit(n);
    }
    if (n >= records_.size()) {
        return std::vector<AuditRecord>(records_.begin(), records_.end());
    }
    return std::vector<AuditRecord>(records_.end() - static_cast<std::ptrdiff_t>(n), records_.end());
}

size_t AuditLog::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

} // namespace primus
