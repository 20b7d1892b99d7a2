/*
 * Primus C++ - Permission Enforcer
 *
 * Pure decision function over (actor, action, target partition, mode).
 * All deny rules run before any approval rule, so conflicts resolve to the
 * more restrictive outcome.
 */
#ifndef primus_CORE_ENFORCER_HPP
#define primus_CORE_ENFORCER_HPP

#include <primus/core/types.hpp>
#include <primus/core/actor_registry.hpp>
#include <primus/core/collaboration.hpp>

namespace primus {

// Mode-dependent facts the guard observes before each evaluation
struct EvaluationContext {
    Mode mode;
    bool session_confirmed;      // actor confirmed this action kind earlier in the session
    bool approval_outstanding;   // actor already waits on an approval of this kind
    bool sandbox_elevated;       // user confirmed elevated writes on sandbox entry
    bool user_approved;          // replay of a pending approval the user accepted
    bool call_approved;          // an approved per-call internet call is unspent

    EvaluationContext()
        : mode(Mode::NORMAL)
        , session_confirmed(false)
        , approval_outstanding(false)
        , sandbox_elevated(false)
        , user_approved(false)
        , call_approved(false) {}

    explicit EvaluationContext(Mode m)
        : mode(m)
        , session_confirmed(false)
        , approval_outstanding(false)
        , sandbox_elevated(false)
        , user_approved(false)
        , call_approved(false) {}
};

class PermissionEnforcer {
public:
    PermissionEnforcer(const ActorRegistry& actors, const CollaborationTable& collaborations);

    Decision evaluate(const Action& action, const EvaluationContext& ctx) const;

    // Template intersected with the runtime grant; SANDBOX forces internet off
    CapabilityGrant effective_grant(const Actor& actor, Mode mode) const;

private:
    Decision check_read(const Actor& actor, const CapabilityGrant& grant, const PartitionId& target) const;
    Decision check_write(const Actor& actor, const CapabilityGrant& grant, const PartitionId& target) const;
    Decision check_protected_write(const Actor& actor, const CapabilityGrant& grant,
                                   const Action& action, const EvaluationContext& ctx) const;
    Decision check_internet(const CapabilityGrant& grant, const EvaluationContext& ctx) const;
    Decision check_agent(const Actor& actor, const CapabilityGrant& grant,
                         const Action& action, const EvaluationContext& ctx) const;

    const ActorRegistry& actors_;
    const CollaborationTable& collaborations_;
};

} // namespace primus

#endif // primus_CORE_ENFORCER_HPP
