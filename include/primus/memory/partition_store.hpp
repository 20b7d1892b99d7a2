/*
 * Primus C++ - Memory Partition Store
 *
 * In-memory partition contents, optionally backed by the SQLite store.
 * Every read, write and append presents a single-use AccessToken issued
 * by the TokenAuthority after an Allow decision. The store itself does no
 * policy evaluation.
 */
#ifndef primus_MEMORY_PARTITION_STORE_HPP
#define primus_MEMORY_PARTITION_STORE_HPP

#include <primus/core/types.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace primus {

class Cipher;
class MemoryStore;

enum class TokenOp {
    READ = 0,
    WRITE = 1      // write and append
};

// Unredeemed tokens expire after `ttl_ms`
class TokenAuthority {
public:
    static constexpr int64_t DEFAULT_TTL_MS = 30000;

    explicit TokenAuthority(int64_t ttl_ms = DEFAULT_TTL_MS);

    AccessToken issue(const std::string& actor_id, const PartitionId& partition, TokenOp op);

    // Consumes the token. True only if it was issued for this partition
    // and operation, has not expired and has not been redeemed before.
    bool redeem(const AccessToken& token, const PartitionId& partition, TokenOp op);

    bool revoke(const AccessToken& token);

    // Drops every unredeemed token held by an actor
    size_t revoke_actor(const std::string& actor_id);
    size_t revoke_all();

    size_t outstanding() const;

private:
    struct Grant {
        std::string actor_id;
        PartitionId partition;
        TokenOp op;
        int64_t issued_at;
    };

    void prune_expired_locked(int64_t now);

    int64_t ttl_ms_;

    mutable std::mutex mutex_;
    std::map<std::string, Grant> grants_;
};

class PartitionStore {
public:
    explicit PartitionStore(TokenAuthority& tokens);

    // Persist partitions through `backend` (not owned, may be null)
    void attach_backend(MemoryStore* backend);

    // Key used to seal sandbox-private partitions at rest. Sealed rows that
    // were not loaded yet are opened now; rows that fail to open mark the
    // partition corrupted. Without a cipher sandbox-private data stays in memory.
    void set_sealing_cipher(std::shared_ptr<const Cipher> cipher);

    // Creates an empty partition (idempotent). Existing backend content is
    // loaded. Called on actor registration, never by actors.
    bool create(const PartitionId& id);
    bool exists(const PartitionId& id) const;
    std::vector<PartitionId> list() const;

    StoreStatus read(const PartitionId& id, const AccessToken& token, std::string& out);
    StoreStatus write(const PartitionId& id, const AccessToken& token, const std::string& bytes);
    StoreStatus append(const PartitionId& id, const AccessToken& token, const std::string& bytes);

    // Number of successful mutations since creation
    uint64_t version(const PartitionId& id) const;

private:
    struct Partition {
        std::mutex lock;
        std::string data;
        uint64_t version;
        bool loaded;       // content reflects the backend row (if any)
        bool corrupted;

        Partition() : version(0), loaded(false), corrupted(false) {}
    };

    std::shared_ptr<Partition> find(const PartitionId& id) const;

    // Both expect the partition lock to be held
    void load_locked(const PartitionId& id, Partition& p);
    bool persist_locked(const PartitionId& id, const std::string& data);

    StoreStatus mutate(const PartitionId& id, const AccessToken& token,
                       const std::string& bytes, bool append);

    TokenAuthority& tokens_;
    mutable std::mutex mutex_;       // guards the map and the backend/cipher pointers
    std::map<PartitionId, std::shared_ptr<Partition> > partitions_;
    MemoryStore* backend_;
    std::shared_ptr<const Cipher> cipher_;
};

} // namespace primus

#endif // primus_MEMORY_PARTITION_STORE_HPP
