/*
 * Primus C++ - Actor Registry
 *
 * Tracks every actor that can request actions: one Primus, its Agents,
 * SubChats derived from either, and the single Sandbox actor. Also holds
 * the explicit cross-partition read grants issued by the user, which may
 * carry an expiry.
 */
#ifndef primus_CORE_ACTOR_REGISTRY_HPP
#define primus_CORE_ACTOR_REGISTRY_HPP

#include <primus/core/types.hpp>
#include <map>
#include <string>
#include <vector>
#include <shared_mutex>

namespace primus {

class Actor {
public:
    Actor() : kind_(ActorKind::SUBCHAT), created_at_(0), private_(false) {}

    const std::string& id() const { return id_; }
    ActorKind kind() const { return kind_; }
    const std::string& parent_id() const { return parent_id_; }

    // Owner of the personality document this actor speaks with. For a
    // SubChat this is fixed to its parent's reference at creation.
    const std::string& personality_ref() const { return personality_ref_; }

    int64_t created_at() const { return created_at_; }
    const CapabilityGrant& runtime_grant() const { return runtime_grant_; }

    bool is_kind(ActorKind k) const { return kind_ == k; }

    // Private SubChats are closed to cross-subchat access; other actors
    // read them only through an explicit grant
    bool is_private() const { return private_; }

private:
    friend class ActorRegistry;

    Actor(const std::string& id, ActorKind kind, const std::string& parent,
          const std::string& personality_ref, int64_t created_at, const CapabilityGrant& grant)
        : id_(id), kind_(kind), parent_id_(parent), personality_ref_(personality_ref)
        , created_at_(created_at), runtime_grant_(grant), private_(false) {}

    std::string id_;
    ActorKind kind_;
    std::string parent_id_;
    std::string personality_ref_;
    int64_t created_at_;
    CapabilityGrant runtime_grant_;
    bool private_;
};

class ActorRegistry {
public:
    static const char* const SANDBOX_ACTOR_ID;

    ActorRegistry();

    // Registration. Each returns false (with last_error) when the id is
    // taken or the parent is missing / of the wrong kind.
    bool register_primus(const std::string& id);
    bool register_agent(const std::string& id);
    bool open_subchat(const std::string& id, const std::string& parent_id, bool is_private = false);

    // Removes an Agent or SubChat together with the read grants it holds
    // and the grants other actors hold on its partitions.
    // Primus and the Sandbox actor cannot be removed.
    bool remove(const std::string& id);

    bool get(const std::string& id, Actor& out) const;
    bool exists(const std::string& id) const;
    std::string primus_id() const;
    std::vector<Actor> list() const;

    // Intersects the actor's runtime grant with `requested`
    bool narrow_grant(const std::string& id, const CapabilityGrant& requested);

    // `expires_at` is unix ms; 0 keeps the grant until it is revoked
    bool grant_read(const std::string& grantee, const PartitionId& partition, int64_t expires_at = 0);
    bool revoke_read(const std::string& grantee, const PartitionId& partition);
    bool has_read_grant(const std::string& grantee, const PartitionId& partition) const;
    // Grants still in force
    std::vector<PartitionId> read_grants(const std::string& grantee) const;

    // Partitions created for an actor when it registers
    static std::vector<PartitionId> owned_partitions(const Actor& actor);

    std::string last_error() const;

private:
    bool insert(const Actor& actor);
    void set_error(const std::string& error) const;

    mutable std::shared_mutex mutex_;
    std::map<std::string, Actor> actors_;
    std::map<std::string, std::map<PartitionId, int64_t> > read_grants_;   // grantee -> partition -> expiry
    std::string primus_id_;
    mutable std::string last_error_;
};

} // namespace primus

#endif // primus_CORE_ACTOR_REGISTRY_HPP
