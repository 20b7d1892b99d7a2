/*
 * Primus C++ - Memory Partition Store Implementation
 */
#include <primus/memory/partition_store.hpp>
#include <primus/memory/store.hpp>
#include <primus/sandbox/cipher.hpp>
#include <primus/core/utils.hpp>

namespace primus {

// ============================================================================
// TokenAuthority
// ============================================================================

TokenAuthority::TokenAuthority(int64_t ttl_ms)
    : ttl_ms_(ttl_ms > 0 ? ttl_ms : DEFAULT_TTL_MS) {}

void TokenAuthority::prune_expired_locked(int64_t now) {
    std::map<std::string, Grant>::iterator it = grants_.begin();
    while (it != grants_.end()) {
        if (now - it->second.issued_at >= ttl_ms_) {
            it = grants_.erase(it);
        } else {
            ++it;
        }
    }
}

AccessToken TokenAuthority::issue(const std::string& actor_id, const PartitionId& partition, TokenOp op) {
    AccessToken token;
    token.value = to_hex(random_bytes(16));
    if (token.value.empty()) {
        return token;
    }

    Grant grant;
    grant.actor_id = actor_id;
    grant.partition = partition;
    grant.op = op;
    grant.issued_at = current_timestamp_ms();

    std::lock_guard<std::mutex> lock(mutex_);
    prune_expired_locked(grant.issued_at);
    grants_[token.value] = grant;
    return token;
}

bool TokenAuthority::redeem(const AccessToken& token, const PartitionId& partition, TokenOp op) {
    if (token.empty()) return false;

    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, Grant>::iterator it = grants_.find(token.value);
    if (it == grants_.end()) return false;
    if (current_timestamp_ms() - it->second.issued_at >= ttl_ms_) {
        grants_.erase(it);
        return false;
    }
    if (it->second.partition != partition || it->second.op != op) {
        return false;
    }
    grants_.erase(it);
    return true;
}

bool TokenAuthority::revoke(const AccessToken& token) {
    if (token.empty()) return false;
    std::lock_guard<std::mutex> lock(mutex_);
    return grants_.erase(token.value) > 0;
}

size_t TokenAuthority::revoke_actor(const std::string& actor_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = 0;
    std::map<std::string, Grant>::iterator it = grants_.begin();
    while (it != grants_.end()) {
        if (it->second.actor_id == actor_id) {
            it = grants_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

size_t TokenAuthority::revoke_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = grants_.size();
    grants_.clear();
    return removed;
}

size_t TokenAuthority::outstanding() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return grants_.size();
}

// ============================================================================
// PartitionStore
// ============================================================================

PartitionStore::PartitionStore(TokenAuthority& tokens)
    : tokens_(tokens)
    , backend_(nullptr) {}

void PartitionStore::attach_backend(MemoryStore* backend) {
    std::lock_guard<std::mutex> lock(mutex_);
    backend_ = backend;
}

void PartitionStore::set_sealing_cipher(std::shared_ptr<const Cipher> cipher) {
    std::vector<std::pair<PartitionId, std::shared_ptr<Partition> > > sealed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cipher_ = cipher;
        std::map<PartitionId, std::shared_ptr<Partition> >::const_iterator it;
        for (it = partitions_.begin(); it != partitions_.end(); ++it) {
            if (it->first.klass == PartitionClass::SANDBOX_PRIVATE) {
                sealed.push_back(*it);
            }
        }
    }

    for (size_t i = 0; i < sealed.size(); ++i) {
        std::lock_guard<std::mutex> plock(sealed[i].second->lock);
        if (!sealed[i].second->loaded) {
            load_locked(sealed[i].first, *sealed[i].second);
        }
    }
}

void PartitionStore::load_locked(const PartitionId& id, Partition& p) {
    MemoryStore* backend;
    std::shared_ptr<const Cipher> cipher;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        backend = backend_;
        cipher = cipher_;
    }

    if (!backend) {
        p.loaded = true;
        return;
    }

    const bool sealed = id.klass == PartitionClass::SANDBOX_PRIVATE;
    if (sealed && !cipher) {
        // Stays unloaded until the sandbox key is available
        return;
    }

    std::string stored;
    if (!backend->get_partition(id, stored)) {
        p.loaded = true;
        return;
    }

    if (sealed) {
        std::string plain;
        if (!cipher->open(stored, plain)) {
            p.corrupted = true;
            p.loaded = true;
            return;
        }
        stored.swap(plain);
    }

    // Writes made before the key arrived come after the stored content
    p.data = stored + p.data;
    p.loaded = true;
}

bool PartitionStore::persist_locked(const PartitionId& id, const std::string& data) {
    MemoryStore* backend;
    std::shared_ptr<const Cipher> cipher;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        backend = backend_;
        cipher = cipher_;
    }

    if (!backend) return true;

    if (id.klass == PartitionClass::SANDBOX_PRIVATE) {
        if (!cipher) return true;
        std::string sealed;
        if (!cipher->seal(data, sealed)) return false;
        return backend->put_partition(id, sealed);
    }
    return backend->put_partition(id, data);
}

bool PartitionStore::create(const PartitionId& id) {
    std::shared_ptr<Partition> p;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (partitions_.count(id)) return true;
        p = std::make_shared<Partition>();
        partitions_[id] = p;
    }

    std::lock_guard<std::mutex> plock(p->lock);
    load_locked(id, *p);
    return true;
}

bool PartitionStore::exists(const PartitionId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return partitions_.count(id) > 0;
}

std::vector<PartitionId> PartitionStore::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PartitionId> ids;
    std::map<PartitionId, std::shared_ptr<Partition> >::const_iterator it;
    for (it = partitions_.begin(); it != partitions_.end(); ++it) {
        ids.push_back(it->first);
    }
    return ids;
}

std::shared_ptr<PartitionStore::Partition> PartitionStore::find(const PartitionId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<PartitionId, std::shared_ptr<Partition> >::const_iterator it = partitions_.find(id);
    if (it == partitions_.end()) return std::shared_ptr<Partition>();
    return it->second;
}

StoreStatus PartitionStore::read(const PartitionId& id, const AccessToken& token, std::string& out) {
    std::shared_ptr<Partition> p = find(id);
    if (!p) return StoreStatus::PARTITION_NOT_FOUND;

    std::lock_guard<std::mutex> plock(p->lock);
    if (!tokens_.redeem(token, id, TokenOp::READ)) {
        return StoreStatus::TOKEN_INVALID;
    }
    if (!p->loaded) load_locked(id, *p);
    if (p->corrupted) {
        return StoreStatus::CORRUPTED;
    }
    out = p->data;
    return StoreStatus::OK;
}

StoreStatus PartitionStore::write(const PartitionId& id, const AccessToken& token, const std::string& bytes) {
    return mutate(id, token, bytes, false);
}

StoreStatus PartitionStore::append(const PartitionId& id, const AccessToken& token, const std::string& bytes) {
    return mutate(id, token, bytes, true);
}

StoreStatus PartitionStore::mutate(const PartitionId& id, const AccessToken& token,
                                   const std::string& bytes, bool append) {
    std::shared_ptr<Partition> p = find(id);
    if (!p) return StoreStatus::PARTITION_NOT_FOUND;

    std::lock_guard<std::mutex> plock(p->lock);
    if (!tokens_.redeem(token, id, TokenOp::WRITE)) {
        return StoreStatus::TOKEN_INVALID;
    }
    if (!p->loaded) load_locked(id, *p);
    if (p->corrupted) {
        return StoreStatus::CORRUPTED;
    }

    std::string next = append ? p->data + bytes : bytes;
    if (!persist_locked(id, next)) {
        // Content is left as it was
        return StoreStatus::CORRUPTED;
    }
    p->data.swap(next);
    ++p->version;
    return StoreStatus::OK;
}

uint64_t PartitionStore::version(const PartitionId& id) const {
    std::shared_ptr<Partition> p = find(id);
    if (!p) return 0;
    std::lock_guard<std::mutex> plock(p->lock);
    return p->version;
}

} // namespace primus
