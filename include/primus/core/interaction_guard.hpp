/*
 * Primus C++ - Interaction Guard
 *
 * Single entry point for actor-initiated actions. Evaluates with the
 * enforcer against the current mode, registers approvals with the mode
 * controller, issues single-use store tokens on Allow, and records every
 * decision in the audit log (suppressed in sandbox mode).
 *
 * Only replay_approved() evaluates an action as accepted by the user; an
 * actor cannot mark its own request as approved. Tokens and approved calls
 * do not survive a transition into or out of sandbox mode.
 */
#ifndef primus_CORE_INTERACTION_GUARD_HPP
#define primus_CORE_INTERACTION_GUARD_HPP

#include <primus/core/types.hpp>
#include <primus/core/actor_registry.hpp>
#include <primus/core/enforcer.hpp>
#include <primus/core/mode_controller.hpp>
#include <primus/core/audit_log.hpp>
#include <primus/memory/partition_store.hpp>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <utility>

namespace primus {

// Applies an allowed action that does not touch the partition store directly
typedef std::function<ActionResult(const Action&, const Decision&)> EffectHandler;

class InteractionGuard {
public:
    // Decision attempts before giving up on a mode that keeps changing
    static constexpr int MAX_DECISION_ATTEMPTS = 4;

    InteractionGuard(const ActorRegistry& actors, const PermissionEnforcer& enforcer,
                     ModeController& modes, AuditLog& audit,
                     PartitionStore& store, TokenAuthority& tokens);

    Decision authorize(const Action& action);

    // Runs an authorized action. Non-Allow decisions are returned as is.
    ActionResult execute(const Action& action, const Decision& decision);

    ActionResult submit(const Action& action);

    // Resolves a pending approval and runs its action as accepted by the
    // user. An approved per-call internet call is held for the next call
    // the actor makes to the same endpoint.
    ActionResult replay_approved(const std::string& approval_id, PendingApproval& out);

    void set_effect_handler(ActionKind kind, EffectHandler handler);

    bool session_confirmed(const std::string& actor_id, ActionKind kind) const;
    size_t approved_calls(const std::string& actor_id) const;

    // Drops tokens and session confirmations of a closed actor
    void forget_actor(const std::string& actor_id);

private:
    typedef std::pair<std::string, ActionKind> SessionKey;
    typedef std::pair<std::string, std::string> CallKey;     // actor, endpoint

    Decision decide(const Action& action, bool user_approved);
    void on_transition(Mode from, Mode to);
    bool has_call_credit(const CallKey& key) const;
    bool take_call_credit(const CallKey& key);

    bool is_staged_edit(const Action& action, Mode mode) const;
    void record(const Action& action, const Decision& decision, Mode mode);
    ActionResult store_failure(const Decision& decision, StoreStatus status);
    void confirm_session(const std::string& actor_id, ActionKind kind);

    const ActorRegistry& actors_;
    const PermissionEnforcer& enforcer_;
    ModeController& modes_;
    AuditLog& audit_;
    PartitionStore& store_;
    TokenAuthority& tokens_;

    mutable std::mutex mutex_;
    std::set<SessionKey> confirmations_;
    std::multiset<CallKey> call_credits_;
    std::map<ActionKind, EffectHandler> handlers_;
};

} // namespace primus

#endif // primus_CORE_INTERACTION_GUARD_HPP
