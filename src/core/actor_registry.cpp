/*
 * Primus C++ - Actor Registry Implementation
 */
#include <primus/core/actor_registry.hpp>
#include <primus/core/capability_registry.hpp>
#include <primus/core/logger.hpp>
#include <primus/core/utils.hpp>
#include <mutex>

namespace primus {

const char* const ActorRegistry::SANDBOX_ACTOR_ID = "sandbox";

ActorRegistry::ActorRegistry() {
    // The Sandbox actor exists for the whole process lifetime, without a parent
    Actor sandbox(SANDBOX_ACTOR_ID, ActorKind::SANDBOX, "", SANDBOX_ACTOR_ID,
                  current_timestamp_ms(), CapabilityRegistry::capabilities_for(ActorKind::SANDBOX));
    actors_[sandbox.id()] = sandbox;
}

void ActorRegistry::set_error(const std::string& error) const {
    last_error_ = error;
}

std::string ActorRegistry::last_error() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return last_error_;
}

bool ActorRegistry::insert(const Actor& actor) {
    if (actor.id().empty()) {
        set_error("actor id must not be empty");
        return false;
    }
    if (actor.id().find('/') != std::string::npos) {
        set_error("actor id must not contain '/'");
        return false;
    }
    if (actors_.count(actor.id())) {
        set_error("actor already registered: " + actor.id());
        return false;
    }
    actors_[actor.id()] = actor;
    LOG_DEBUG("[ActorRegistry] Registered %s '%s' (parent='%s')",
              to_string(actor.kind()), actor.id().c_str(), actor.parent_id().c_str());
    return true;
}

bool ActorRegistry::register_primus(const std::string& id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (!primus_id_.empty()) {
        set_error("primus already registered as " + primus_id_);
        return false;
    }
    Actor primus(id, ActorKind::PRIMUS, "", id, current_timestamp_ms(),
                 CapabilityRegistry::capabilities_for(ActorKind::PRIMUS));
    if (!insert(primus)) return false;
    primus_id_ = id;
    return true;
}

bool ActorRegistry::register_agent(const std::string& id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (primus_id_.empty()) {
        set_error("agents need a registered primus");
        return false;
    }
    Actor agent(id, ActorKind::AGENT, primus_id_, id, current_timestamp_ms(),
                CapabilityRegistry::capabilities_for(ActorKind::AGENT));
    return insert(agent);
}

bool ActorRegistry::open_subchat(const std::string& id, const std::string& parent_id, bool is_private) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    std::map<std::string, Actor>::const_iterator parent = actors_.find(parent_id);
    if (parent == actors_.end()) {
        set_error("unknown parent: " + parent_id);
        return false;
    }
    if (!parent->second.is_kind(ActorKind::PRIMUS) && !parent->second.is_kind(ActorKind::AGENT)) {
        set_error("subchats derive from primus or an agent, not " +
                  std::string(to_string(parent->second.kind())));
        return false;
    }
    // Read-only alias of the parent's personality
    Actor subchat(id, ActorKind::SUBCHAT, parent_id, parent->second.personality_ref(),
                  current_timestamp_ms(), CapabilityRegistry::capabilities_for(ActorKind::SUBCHAT));
    subchat.private_ = is_private;
    return insert(subchat);
}

bool ActorRegistry::remove(const std::string& id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    std::map<std::string, Actor>::iterator it = actors_.find(id);
    if (it == actors_.end()) {
        set_error("unknown actor: " + id);
        return false;
    }
    if (it->second.is_kind(ActorKind::PRIMUS) || it->second.is_kind(ActorKind::SANDBOX)) {
        set_error("cannot remove " + std::string(to_string(it->second.kind())));
        return false;
    }
    actors_.erase(it);
    read_grants_.erase(id);

    std::map<std::string, std::map<PartitionId, int64_t> >::iterator g;
    for (g = read_grants_.begin(); g != read_grants_.end(); ++g) {
        std::map<PartitionId, int64_t>::iterator p = g->second.begin();
        while (p != g->second.end()) {
            if (p->first.owner == id) {
                p = g->second.erase(p);
            } else {
                ++p;
            }
        }
    }
    return true;
}

bool ActorRegistry::get(const std::string& id, Actor& out) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::map<std::string, Actor>::const_iterator it = actors_.find(id);
    if (it == actors_.end()) return false;
    out = it->second;
    return true;
}

bool ActorRegistry::exists(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return actors_.count(id) > 0;
}

std::string ActorRegistry::primus_id() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return primus_id_;
}

std::vector<Actor> ActorRegistry::list() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<Actor> out;
    for (std::map<std::string, Actor>::const_iterator it = actors_.begin(); it != actors_.end(); ++it) {
        out.push_back(it->second);
    }
    return out;
}

bool ActorRegistry::narrow_grant(const std::string& id, const CapabilityGrant& requested) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    std::map<std::string, Actor>::iterator it = actors_.find(id);
    if (it == actors_.end()) {
        set_error("unknown actor: " + id);
        return false;
    }
    it->second.runtime_grant_ = CapabilityRegistry::intersect(it->second.runtime_grant_, requested);
    return true;
}

bool ActorRegistry::grant_read(const std::string& grantee, const PartitionId& partition, int64_t expires_at) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (!actors_.count(grantee)) {
        set_error("unknown actor: " + grantee);
        return false;
    }
    read_grants_[grantee][partition] = expires_at;
    return true;
}

bool ActorRegistry::revoke_read(const std::string& grantee, const PartitionId& partition) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    std::map<std::string, std::map<PartitionId, int64_t> >::iterator it = read_grants_.find(grantee);
    if (it == read_grants_.end() || it->second.erase(partition) == 0) {
        set_error(grantee + " holds no read grant on " + partition.to_string());
        return false;
    }
    return true;
}

bool ActorRegistry::has_read_grant(const std::string& grantee, const PartitionId& partition) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::map<std::string, std::map<PartitionId, int64_t> >::const_iterator it = read_grants_.find(grantee);
    if (it == read_grants_.end()) return false;
    std::map<PartitionId, int64_t>::const_iterator p = it->second.find(partition);
    if (p == it->second.end()) return false;
    return p->second == 0 || current_timestamp_ms() < p->second;
}

std::vector<PartitionId> ActorRegistry::read_grants(const std::string& grantee) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<PartitionId> out;
    std::map<std::string, std::map<PartitionId, int64_t> >::const_iterator it = read_grants_.find(grantee);
    if (it == read_grants_.end()) return out;

    const int64_t now = current_timestamp_ms();
    for (std::map<PartitionId, int64_t>::const_iterator p = it->second.begin(); p != it->second.end(); ++p) {
        if (p->second == 0 || now < p->second) out.push_back(p->first);
    }
    return out;
}

std::vector<PartitionId> ActorRegistry::owned_partitions(const Actor& actor) {
    std::vector<PartitionId> out;
    switch (actor.kind()) {
        case ActorKind::PRIMUS:
            out.push_back(PartitionId(actor.id(), PartitionClass::GLOBAL));
            out.push_back(PartitionId(actor.id(), PartitionClass::PERSONALITY));
            out.push_back(PartitionId(actor.id(), PartitionClass::SYSTEM));
            break;
        case ActorKind::AGENT:
            out.push_back(PartitionId(actor.id(), PartitionClass::AGENT_PRIVATE));
            out.push_back(PartitionId(actor.id(), PartitionClass::PERSONALITY));
            break;
        case ActorKind::SUBCHAT:
            out.push_back(PartitionId(actor.id(), PartitionClass::SUBCHAT));
            break;
        case ActorKind::SANDBOX:
            out.push_back(PartitionId(actor.id(), PartitionClass::SANDBOX_PRIVATE));
            break;
    }
    return out;
}

} // namespace primus
