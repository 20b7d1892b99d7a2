/*
 * Primus C++ - Mode Controller
 *
 * Single authority for the process-wide mode:
 *
 *   NORMAL <-> APPROVAL_PENDING     approval requested / last one resolved
 *   NORMAL <-> SANDBOX              explicit entry / exit
 *
 * SANDBOX cannot be entered while approvals are outstanding, and no
 * approval can be requested while in SANDBOX. Edits staged by the Sandbox
 * actor are turned into pending approvals (attributed to Primus) on exit.
 * All transitions happen under one lock; listeners run inside it.
 */
#ifndef primus_CORE_MODE_CONTROLLER_HPP
#define primus_CORE_MODE_CONTROLLER_HPP

#include <primus/core/types.hpp>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace primus {

enum class ApprovalOrigin {
    REQUEST = 0,       // an actor asked for a gated action
    SANDBOX_EXIT = 1   // an edit staged during a sandbox session
};

const char* to_string(ApprovalOrigin origin);

struct PendingApproval {
    std::string id;
    Action action;
    ApprovalOrigin origin;
    std::string reason;
    int64_t created_at;

    PendingApproval() : origin(ApprovalOrigin::REQUEST), created_at(0) {}
};

typedef std::function<void(Mode from, Mode to)> TransitionListener;

class ModeController {
public:
    ModeController();

    Mode current_mode() const;

    // True exactly while the mode is SANDBOX
    bool audit_suppressed() const;

    // Whether the current sandbox session was entered with elevated writes
    bool sandbox_elevated() const;

    // Listeners must not call back into the controller
    void add_listener(TransitionListener listener);

    // Registers a pending approval. STALE when the mode differs from
    // `observed`, REJECTED in SANDBOX.
    TransitionResult request_approval(const Action& action, Mode observed,
                                      const std::string& reason, std::string& out_id);

    // Removes the approval (approved or rejected alike). The mode returns to
    // NORMAL once nothing is left pending.
    TransitionResult resolve(const std::string& approval_id, PendingApproval& out);

    // Discards an actor's pending approvals without applying them
    size_t cancel_for_actor(const std::string& actor_id);

    bool has_pending(const std::string& actor_id, ActionKind kind) const;
    std::vector<PendingApproval> pending() const;
    size_t pending_count() const;

    TransitionResult enter_sandbox(bool elevated_writes);

    // Staged edits become pending approvals attributed to `primus_id`
    TransitionResult exit_sandbox(const std::string& primus_id, std::vector<std::string>& out_approval_ids);

    // Holds a Sandbox-actor edit until exit. False outside SANDBOX.
    bool stage_sandbox_edit(const Action& action);
    std::vector<Action> staged_edits() const;

private:
    void transition_locked(Mode to);
    std::string add_pending_locked(const Action& action, ApprovalOrigin origin, const std::string& reason);

    mutable std::mutex mutex_;
    Mode mode_;
    bool sandbox_elevated_;
    std::vector<PendingApproval> pending_;    // in request order
    std::vector<Action> staged_;
    std::vector<TransitionListener> listeners_;
};

} // namespace primus

#endif // primus_CORE_MODE_CONTROLLER_HPP
