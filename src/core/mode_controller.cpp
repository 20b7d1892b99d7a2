/*
 * Primus C++ - Mode Controller Implementation
 */
#include <primus/core/mode_controller.hpp>
#include <primus/core/logger.hpp>
#include <primus/core/utils.hpp>

namespace primus {

const char* to_string(ApprovalOrigin origin) {
    switch (origin) {
        case ApprovalOrigin::REQUEST:      return "request";
        case ApprovalOrigin::SANDBOX_EXIT: return "sandbox-exit";
    }
    return "unknown";
}

ModeController::ModeController()
    : mode_(Mode::NORMAL)
    , sandbox_elevated_(false) {}

Mode ModeController::current_mode() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return mode_;
}

bool ModeController::audit_suppressed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return mode_ == Mode::SANDBOX;
}

bool ModeController::sandbox_elevated() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return mode_ == Mode::SANDBOX && sandbox_elevated_;
}

void ModeController::add_listener(TransitionListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.push_back(listener);
}

void ModeController::transition_locked(Mode to) {
    if (mode_ == to) return;
    Mode from = mode_;
    mode_ = to;
    for (size_t i = 0; i < listeners_.size(); ++i) {
        listeners_[i](from, to);
    }
}

std::string ModeController::add_pending_locked(const Action& action, ApprovalOrigin origin,
                                               const std::string& reason) {
    PendingApproval p;
    p.id = generate_uuid();
    p.action = action;
    p.origin = origin;
    p.reason = reason;
    p.created_at = current_timestamp_ms();
    pending_.push_back(p);
    return p.id;
}

TransitionResult ModeController::request_approval(const Action& action, Mode observed,
                                                  const std::string& reason, std::string& out_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (mode_ != observed) {
        return TransitionResult(TransitionStatus::STALE,
            std::string("mode changed from ") + to_string(observed) + " to " + to_string(mode_));
    }
    if (mode_ == Mode::SANDBOX) {
        return TransitionResult(TransitionStatus::REJECTED, "approvals cannot be requested in sandbox mode");
    }

    out_id = add_pending_locked(action, ApprovalOrigin::REQUEST, reason);
    if (out_id.empty()) {
        pending_.pop_back();
        return TransitionResult(TransitionStatus::REJECTED, "failed to generate approval id");
    }
    transition_locked(Mode::APPROVAL_PENDING);
    return TransitionResult();
}

TransitionResult ModeController::resolve(const std::string& approval_id, PendingApproval& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PendingApproval>::iterator it;
    for (it = pending_.begin(); it != pending_.end(); ++it) {
        if (it->id == approval_id) break;
    }
    if (it == pending_.end()) {
        return TransitionResult(TransitionStatus::REJECTED, "unknown approval: " + approval_id);
    }

    out = *it;
    pending_.erase(it);
    if (pending_.empty() && mode_ == Mode::APPROVAL_PENDING) {
        transition_locked(Mode::NORMAL);
    }
    return TransitionResult();
}

size_t ModeController::cancel_for_actor(const std::string& actor_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = 0;
    std::vector<PendingApproval>::iterator it = pending_.begin();
    while (it != pending_.end()) {
        if (it->action.actor_id == actor_id) {
            it = pending_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    if (removed > 0 && pending_.empty() && mode_ == Mode::APPROVAL_PENDING) {
        transition_locked(Mode::NORMAL);
    }
    return removed;
}

bool ModeController::has_pending(const std::string& actor_id, ActionKind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (size_t i = 0; i < pending_.size(); ++i) {
        if (pending_[i].action.actor_id == actor_id && pending_[i].action.kind == kind) {
            return true;
        }
    }
    return false;
}

std::vector<PendingApproval> ModeController::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_;
}

size_t ModeController::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

TransitionResult ModeController::enter_sandbox(bool elevated_writes) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (mode_ == Mode::SANDBOX) {
        return TransitionResult(TransitionStatus::REJECTED, "already in sandbox mode");
    }
    if (mode_ == Mode::APPROVAL_PENDING || !pending_.empty()) {
        return TransitionResult(TransitionStatus::REJECTED,
                                "cannot enter sandbox while approvals are pending");
    }

    sandbox_elevated_ = elevated_writes;
    staged_.clear();
    transition_locked(Mode::SANDBOX);
    return TransitionResult();
}

TransitionResult ModeController::exit_sandbox(const std::string& primus_id,
                                              std::vector<std::string>& out_approval_ids) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (mode_ != Mode::SANDBOX) {
        return TransitionResult(TransitionStatus::REJECTED, "not in sandbox mode");
    }

    std::vector<Action> staged;
    staged.swap(staged_);
    sandbox_elevated_ = false;
    transition_locked(Mode::NORMAL);

    for (size_t i = 0; i < staged.size(); ++i) {
        Action action = staged[i];
        action.actor_id = primus_id;
        std::string id = add_pending_locked(action, ApprovalOrigin::SANDBOX_EXIT,
                                            std::string("sandbox edit held for confirmation: ") +
                                            to_string(action.kind));
        if (id.empty()) {
            pending_.pop_back();
            LOG_ERROR("[ModeController] Dropped staged %s: no approval id", to_string(action.kind));
            continue;
        }
        out_approval_ids.push_back(id);
    }
    if (!pending_.empty()) {
        transition_locked(Mode::APPROVAL_PENDING);
    }
    return TransitionResult();
}

bool ModeController::stage_sandbox_edit(const Action& action) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (mode_ != Mode::SANDBOX) return false;
    staged_.push_back(action);
    return true;
}

std::vector<Action> ModeController::staged_edits() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return staged_;
}

} // namespace primus
