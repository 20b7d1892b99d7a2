/*
 * Primus C++ - Interaction Guard Implementation
 */
#include <primus/core/interaction_guard.hpp>
#include <primus/core/logger.hpp>

namespace primus {

namespace {

// Store operation backing an action kind; false for kinds without one
bool store_op_for(const Action& action, TokenOp& op) {
    switch (action.kind) {
        case ActionKind::MEMORY_READ:
        case ActionKind::SHARE_SUBSET:
            op = TokenOp::READ;
            return true;
        case ActionKind::MEMORY_WRITE:
        case ActionKind::MEMORY_APPEND:
        case ActionKind::PERSONALITY_WRITE:
        case ActionKind::SETTINGS_WRITE:
            op = TokenOp::WRITE;
            return true;
        default:
            return false;
    }
}

} // anonymous namespace

InteractionGuard::InteractionGuard(const ActorRegistry& actors, const PermissionEnforcer& enforcer,
                                   ModeController& modes, AuditLog& audit,
                                   PartitionStore& store, TokenAuthority& tokens)
    : actors_(actors)
    , enforcer_(enforcer)
    , modes_(modes)
    , audit_(audit)
    , store_(store)
    , tokens_(tokens) {
    InteractionGuard* self = this;
    modes_.add_listener([self](Mode from, Mode to) { self->on_transition(from, to); });
}

void InteractionGuard::on_transition(Mode from, Mode to) {
    if (from != Mode::SANDBOX && to != Mode::SANDBOX) return;

    // Runs under the mode lock; neither call reaches back into the controller
    tokens_.revoke_all();
    std::lock_guard<std::mutex> lock(mutex_);
    call_credits_.clear();
}

void InteractionGuard::set_effect_handler(ActionKind kind, EffectHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_[kind] = handler;
}

bool InteractionGuard::session_confirmed(const std::string& actor_id, ActionKind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return confirmations_.count(SessionKey(actor_id, kind)) > 0;
}

void InteractionGuard::confirm_session(const std::string& actor_id, ActionKind kind) {
    std::lock_guard<std::mutex> lock(mutex_);
    confirmations_.insert(SessionKey(actor_id, kind));
}

size_t InteractionGuard::approved_calls(const std::string& actor_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = 0;
    for (std::multiset<CallKey>::const_iterator it = call_credits_.begin(); it != call_credits_.end(); ++it) {
        if (it->first == actor_id) ++n;
    }
    return n;
}

bool InteractionGuard::has_call_credit(const CallKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return call_credits_.count(key) > 0;
}

bool InteractionGuard::take_call_credit(const CallKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::multiset<CallKey>::iterator it = call_credits_.find(key);
    if (it == call_credits_.end()) return false;
    call_credits_.erase(it);
    return true;
}

void InteractionGuard::forget_actor(const std::string& actor_id) {
    tokens_.revoke_actor(actor_id);
    std::lock_guard<std::mutex> lock(mutex_);
    std::set<SessionKey>::iterator it = confirmations_.begin();
    while (it != confirmations_.end()) {
        if (it->first == actor_id) {
            it = confirmations_.erase(it);
        } else {
            ++it;
        }
    }
    std::multiset<CallKey>::iterator c = call_credits_.begin();
    while (c != call_credits_.end()) {
        if (c->first == actor_id) {
            c = call_credits_.erase(c);
        } else {
            ++c;
        }
    }
}

bool InteractionGuard::is_staged_edit(const Action& action, Mode mode) const {
    if (mode != Mode::SANDBOX) return false;
    if (action.kind != ActionKind::PERSONALITY_WRITE && action.kind != ActionKind::SETTINGS_WRITE) {
        return false;
    }
    Actor actor;
    return actors_.get(action.actor_id, actor) && actor.is_kind(ActorKind::SANDBOX);
}

void InteractionGuard::record(const Action& action, const Decision& decision, Mode mode) {
    AuditRecord r;
    r.actor_id = action.actor_id;
    r.action = action.kind;
    r.decision = decision.kind;
    r.reason = decision.reason;
    r.mode = mode;
    if (audit_.append(r)) {
        LOG_DEBUG("[Guard] %s %s -> %s (%s)", action.actor_id.c_str(), to_string(action.kind),
                  to_string(decision.kind), decision.reason.c_str());
    }
}

Decision InteractionGuard::authorize(const Action& action) {
    return decide(action, false);
}

ActionResult InteractionGuard::replay_approved(const std::string& approval_id, PendingApproval& out) {
    TransitionResult t = modes_.resolve(approval_id, out);
    if (!t.ok()) {
        return ActionResult::failed(Decision::deny(t.reason), t.reason);
    }

    Decision d = decide(out.action, true);
    if (d.allowed() && out.action.kind == ActionKind::INTERNET_CALL) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            call_credits_.insert(CallKey(out.action.actor_id, out.action.payload));
        }
        return ActionResult::from(d, "internet call approved; send the request again");
    }
    return execute(out.action, d);
}

Decision InteractionGuard::decide(const Action& action, bool user_approved) {
    Mode mode = Mode::NORMAL;
    const CallKey call(action.actor_id, action.payload);

    for (int attempt = 0; attempt < MAX_DECISION_ATTEMPTS; ++attempt) {
        mode = modes_.current_mode();

        EvaluationContext ctx(mode);
        ctx.session_confirmed = session_confirmed(action.actor_id, action.kind);
        ctx.approval_outstanding = modes_.has_pending(action.actor_id, action.kind);
        ctx.sandbox_elevated = modes_.sandbox_elevated();
        ctx.user_approved = user_approved;
        ctx.call_approved = !user_approved && action.kind == ActionKind::INTERNET_CALL &&
                            has_call_credit(call);

        Decision d = enforcer_.evaluate(action, ctx);

        if (d.needs_approval()) {
            if (mode == Mode::SANDBOX) {
                d = Decision::deny("approvals are unavailable in sandbox mode: " + d.reason);
            } else {
                std::string approval_id;
                TransitionResult t = modes_.request_approval(action, mode, d.reason, approval_id);
                if (t.status == TransitionStatus::STALE) continue;
                if (!t.ok()) {
                    d = Decision::deny(t.reason);
                } else {
                    d.approval_id = approval_id;
                }
            }
        } else if (d.allowed()) {
            TokenOp op;
            if (is_staged_edit(action, mode)) {
                // Sandbox exited between evaluation and staging
                if (!modes_.stage_sandbox_edit(action)) continue;
            } else {
                if (store_op_for(action, op)) {
                    d.token = tokens_.issue(action.actor_id, action.target, op);
                    if (d.token.empty()) {
                        d = Decision::deny("failed to issue access token");
                    }
                }
                // An Allow decided under a mode that has since changed is re-evaluated
                if (d.allowed() && modes_.current_mode() != mode) {
                    tokens_.revoke(d.token);
                    continue;
                }
                if (d.allowed() && ctx.call_approved && !take_call_credit(call)) {
                    tokens_.revoke(d.token);
                    continue;
                }
            }
            if (d.allowed() && user_approved && action.kind == ActionKind::INTERNET_CALL) {
                confirm_session(action.actor_id, action.kind);
            }
        }

        record(action, d, mode);
        return d;
    }

    Decision d = Decision::deny("mode kept changing during evaluation; retry");
    record(action, d, mode);
    return d;
}

ActionResult InteractionGuard::store_failure(const Decision& decision, StoreStatus status) {
    // Store integrity errors are not logged while the sandbox is active
    if (!modes_.audit_suppressed()) {
        LOG_ERROR("[Guard] Store operation failed: %s", to_string(status));
    }
    return ActionResult::failed(decision, std::string("action failed: ") + to_string(status));
}

ActionResult InteractionGuard::execute(const Action& action, const Decision& decision) {
    if (!decision.allowed()) {
        return ActionResult::from(decision);
    }

    StoreStatus status = StoreStatus::OK;
    std::string data;

    switch (action.kind) {
        case ActionKind::MEMORY_READ:
            status = store_.read(action.target, decision.token, data);
            break;

        case ActionKind::MEMORY_WRITE:
            status = store_.write(action.target, decision.token, action.payload);
            break;

        case ActionKind::MEMORY_APPEND:
            status = store_.append(action.target, decision.token, action.payload);
            break;

        case ActionKind::PERSONALITY_WRITE:
        case ActionKind::SETTINGS_WRITE:
            if (decision.token.empty()) {
                // Staged by the sandbox, nothing is applied yet
                return ActionResult::from(decision, "staged");
            }
            status = store_.write(action.target, decision.token, action.payload);
            break;

        default: {
            EffectHandler handler;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                std::map<ActionKind, EffectHandler>::const_iterator it = handlers_.find(action.kind);
                if (it != handlers_.end()) handler = it->second;
            }
            if (handler) return handler(action, decision);
            return ActionResult::from(decision);
        }
    }

    if (status != StoreStatus::OK) {
        return store_failure(decision, status);
    }
    return ActionResult::from(decision, data);
}

ActionResult InteractionGuard::submit(const Action& action) {
    Decision d = authorize(action);
    return execute(action, d);
}

} // namespace primus
