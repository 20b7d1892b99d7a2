/*
 * Primus C++ - Permission Enforcer Implementation
 */
#include <primus/core/enforcer.hpp>
#include <primus/core/capability_registry.hpp>

namespace primus {

namespace {

bool needs_target(ActionKind kind) {
    switch (kind) {
        case ActionKind::MEMORY_READ:
        case ActionKind::MEMORY_WRITE:
        case ActionKind::MEMORY_APPEND:
        case ActionKind::PERSONALITY_WRITE:
        case ActionKind::SETTINGS_WRITE:
        case ActionKind::SHARE_SUBSET:
            return true;
        default:
            return false;
    }
}

} // anonymous namespace

PermissionEnforcer::PermissionEnforcer(const ActorRegistry& actors, const CollaborationTable& collaborations)
    : actors_(actors)
    , collaborations_(collaborations) {}

CapabilityGrant PermissionEnforcer::effective_grant(const Actor& actor, Mode mode) const {
    CapabilityGrant grant = CapabilityRegistry::resolve(actor.kind(), actor.runtime_grant());
    if (mode == Mode::SANDBOX) {
        grant.internet_access = InternetAccess::OFF;
    }
    return grant;
}

Decision PermissionEnforcer::evaluate(const Action& action, const EvaluationContext& ctx) const {
    Actor actor;
    if (!actors_.get(action.actor_id, actor)) {
        return Decision::deny("unknown actor: " + action.actor_id);
    }

    if (actor.is_kind(ActorKind::SANDBOX) && ctx.mode != Mode::SANDBOX) {
        return Decision::deny("sandbox actor is inactive outside sandbox mode");
    }

    if (needs_target(action.kind) && !action.has_target) {
        return Decision::deny(std::string(to_string(action.kind)) + " needs a target partition");
    }

    // Sealed regardless of actor or grant
    if (action.has_target && action.target.klass == PartitionClass::SANDBOX_PRIVATE &&
        !(ctx.mode == Mode::SANDBOX && actor.is_kind(ActorKind::SANDBOX))) {
        return Decision::deny("sandbox-private partitions are sealed outside sandbox mode");
    }

    if (ctx.approval_outstanding && !ctx.user_approved) {
        return Decision::deny(std::string("awaiting approval of an earlier ") + to_string(action.kind));
    }

    const CapabilityGrant grant = effective_grant(actor, ctx.mode);

    switch (action.kind) {
        case ActionKind::CHAT_TURN:
            return Decision::allow();

        case ActionKind::MEMORY_READ:
            return check_read(actor, grant, action.target);

        case ActionKind::MEMORY_WRITE:
        case ActionKind::MEMORY_APPEND:
            return check_write(actor, grant, action.target);

        case ActionKind::PERSONALITY_WRITE:
        case ActionKind::SETTINGS_WRITE:
            return check_protected_write(actor, grant, action, ctx);

        case ActionKind::INTERNET_CALL:
            return check_internet(grant, ctx);

        case ActionKind::AGENT_MESSAGE:
        case ActionKind::COLLABORATION_OPEN:
        case ActionKind::COLLABORATION_JOIN:
        case ActionKind::SHARE_SUBSET:
        case ActionKind::READ_SHARED:
            return check_agent(actor, grant, action, ctx);

        case ActionKind::GRANT_READ:
            return Decision::deny("read grants are issued by the user, not by actors");
    }
    return Decision::deny("unsupported action");
}

Decision PermissionEnforcer::check_read(const Actor& actor, const CapabilityGrant& grant,
                                        const PartitionId& target) const {
    if (target.owner == actor.id()) {
        return Decision::allow("own partition");
    }

    switch (target.klass) {
        case PartitionClass::GLOBAL:
            return Decision::allow("global partition");

        case PartitionClass::PERSONALITY:
            if (target.owner == actor.personality_ref() ||
                actor.is_kind(ActorKind::PRIMUS) || actor.is_kind(ActorKind::SANDBOX)) {
                return Decision::allow("personality reference");
            }
            break;

        case PartitionClass::SYSTEM:
            if (actor.is_kind(ActorKind::PRIMUS) || actor.is_kind(ActorKind::SANDBOX)) {
                return Decision::allow("system settings");
            }
            break;

        case PartitionClass::SUBCHAT: {
            Actor owner;
            if (actors_.get(target.owner, owner) && owner.is_private()) {
                if (actors_.has_read_grant(actor.id(), target)) {
                    return Decision::allow("explicit read grant");
                }
                return Decision::deny(target.owner + " is a private subchat; reading it needs a grant "
                                      "unlocked with its passphrase");
            }
            if (grant.subchat_cross_access) {
                return Decision::allow("cross-subchat access");
            }
            break;
        }

        case PartitionClass::AGENT_PRIVATE:
            if (actor.is_kind(ActorKind::AGENT)) {
                return Decision::deny("agent-private memory of " + target.owner +
                                      " is never readable by another agent; use share_subset");
            }
            break;

        case PartitionClass::SANDBOX_PRIVATE:
            break;
    }

    if (actors_.has_read_grant(actor.id(), target)) {
        return Decision::allow("explicit read grant");
    }
    return Decision::deny("reading " + target.to_string() + " requires an explicit grant");
}

Decision PermissionEnforcer::check_write(const Actor& actor, const CapabilityGrant& grant,
                                         const PartitionId& target) const {
    if (grant.rag_write_scope == RagWriteScope::NONE) {
        return Decision::deny("memory writes are disabled for " + actor.id());
    }
    if (target.klass == PartitionClass::PERSONALITY || target.klass == PartitionClass::SYSTEM) {
        return Decision::deny(target.to_string() + " is only writable through a protected edit");
    }
    if (target.owner != actor.id()) {
        return Decision::deny("writes are restricted to the actor's own partitions");
    }
    return Decision::allow("own partition");
}

Decision PermissionEnforcer::check_protected_write(const Actor& actor, const CapabilityGrant& grant,
                                                   const Action& action, const EvaluationContext& ctx) const {
    const bool personality = action.kind == ActionKind::PERSONALITY_WRITE;
    const PartitionClass expected = personality ? PartitionClass::PERSONALITY : PartitionClass::SYSTEM;
    const std::string primus = actors_.primus_id();

    if (action.target.klass != expected) {
        return Decision::deny(std::string(to_string(action.kind)) + " must target a " + to_string(expected) + " partition");
    }
    if (!grant.personality_write) {
        return Decision::deny(std::string(to_string(actor.kind())) + " may not modify personality or settings");
    }

    if (actor.is_kind(ActorKind::SANDBOX)) {
        if (action.target.owner != primus) {
            return Decision::deny("sandbox edits apply to the primus personality and settings only");
        }
        if (!ctx.sandbox_elevated) {
            return Decision::deny("sandbox session was not confirmed for elevated writes");
        }
        return Decision::allow("staged until sandbox exit");
    }

    if (!actor.is_kind(ActorKind::PRIMUS)) {
        return Decision::deny(std::string(to_string(actor.kind())) + " may not modify personality or settings");
    }
    if (action.target.owner != actor.id()) {
        return Decision::deny("primus may only edit its own personality and settings");
    }
    if (ctx.user_approved) {
        return Decision::allow("confirmed by user");
    }
    return Decision::require_approval(personality ? "personality change needs user confirmation"
                                                  : "settings change needs user confirmation");
}

Decision PermissionEnforcer::check_internet(const CapabilityGrant& grant, const EvaluationContext& ctx) const {
    if (ctx.mode == Mode::SANDBOX) {
        return Decision::deny("sandbox mode is offline");
    }
    switch (grant.internet_access) {
        case InternetAccess::OFF:
            return Decision::deny("internet access is off");
        case InternetAccess::PER_CALL:
            if (ctx.user_approved) return Decision::allow("confirmed by user");
            if (ctx.call_approved) return Decision::allow("approved call");
            return Decision::require_approval("internet call needs user approval");
        case InternetAccess::TEMPORARY_SESSION:
            if (ctx.user_approved || ctx.session_confirmed) return Decision::allow("session confirmed");
            return Decision::require_approval("first internet call of the session needs user approval");
    }
    return Decision::deny("internet access is off");
}

Decision PermissionEnforcer::check_agent(const Actor& actor, const CapabilityGrant& grant,
                                         const Action& action, const EvaluationContext& ctx) const {
    if (ctx.mode == Mode::SANDBOX) {
        return Decision::deny("agent communication is disabled in sandbox mode");
    }
    if (!actor.is_kind(ActorKind::AGENT)) {
        return Decision::deny(std::string(to_string(actor.kind())) + " cannot take part in agent collaboration");
    }
    if (!grant.agent_to_agent) {
        return Decision::deny("agent-to-agent communication not granted to " + actor.id());
    }

    Actor peer;
    if (!actors_.get(action.peer_id, peer) || !peer.is_kind(ActorKind::AGENT)) {
        return Decision::deny("unknown partner agent: " + action.peer_id);
    }

    Decision d;
    switch (action.kind) {
        case ActionKind::AGENT_MESSAGE:
            return collaborations_.check_message(actor.id(), peer.id());

        case ActionKind::COLLABORATION_OPEN:
            d = collaborations_.check_open(actor.id(), peer.id());
            break;

        case ActionKind::COLLABORATION_JOIN:
            d = collaborations_.check_join(actor.id(), peer.id());
            break;

        case ActionKind::SHARE_SUBSET:
            if (action.target.owner != actor.id() || action.target.klass != PartitionClass::AGENT_PRIVATE) {
                return Decision::deny("only subsets of the agent's own private partition can be shared");
            }
            if (action.payload.empty()) {
                return Decision::deny("nothing to share");
            }
            return collaborations_.check_shared_access(actor.id(), peer.id());

        case ActionKind::READ_SHARED:
            return collaborations_.check_shared_access(actor.id(), peer.id());

        default:
            return Decision::deny("unsupported agent action");
    }

    if (!d.allowed()) return d;
    if (ctx.user_approved) return Decision::allow("confirmed by user");
    return Decision::require_approval("agent collaboration needs user approval");
}

} // namespace primus
