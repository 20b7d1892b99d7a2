/*
 * Primus C++ - Agent Communication Guard Implementation
 */
#include <primus/core/agent_comm_guard.hpp>
#include <primus/core/logger.hpp>
#include <primus/core/utils.hpp>

namespace primus {

AgentCommunicationGuard::AgentCommunicationGuard(InteractionGuard& guard, CollaborationTable& table,
                                                 PartitionStore& store)
    : guard_(guard)
    , table_(table)
    , store_(store) {}

void AgentCommunicationGuard::install() {
    AgentCommunicationGuard* self = this;

    guard_.set_effect_handler(ActionKind::COLLABORATION_OPEN,
        [self](const Action& a, const Decision& d) -> ActionResult { return self->apply_open(a, d); });
    guard_.set_effect_handler(ActionKind::COLLABORATION_JOIN,
        [self](const Action& a, const Decision& d) -> ActionResult { return self->apply_join(a, d); });
    guard_.set_effect_handler(ActionKind::AGENT_MESSAGE,
        [self](const Action& a, const Decision& d) -> ActionResult { return self->apply_message(a, d); });
    guard_.set_effect_handler(ActionKind::SHARE_SUBSET,
        [self](const Action& a, const Decision& d) -> ActionResult { return self->apply_share(a, d); });
    guard_.set_effect_handler(ActionKind::READ_SHARED,
        [self](const Action& a, const Decision& d) -> ActionResult { return self->apply_read_shared(a, d); });
}

// ============================================================================
// Requests
// ============================================================================

ActionResult AgentCommunicationGuard::open_collaboration(const std::string& initiator, const std::string& partner) {
    return guard_.submit(Action::with_peer(initiator, ActionKind::COLLABORATION_OPEN, partner));
}

ActionResult AgentCommunicationGuard::join_collaboration(const std::string& agent, const std::string& member) {
    return guard_.submit(Action::with_peer(agent, ActionKind::COLLABORATION_JOIN, member));
}

bool AgentCommunicationGuard::leave_collaboration(const std::string& agent) {
    return table_.leave(agent);
}

ActionResult AgentCommunicationGuard::send_message(const std::string& sender, const std::string& receiver,
                                                   const std::string& text) {
    return guard_.submit(Action::with_peer(sender, ActionKind::AGENT_MESSAGE, receiver, text));
}

ActionResult AgentCommunicationGuard::share_subset(const std::string& owner, const std::string& partner,
                                                   const std::string& subset) {
    Action action = Action::on_partition(owner, ActionKind::SHARE_SUBSET,
                                         PartitionId(owner, PartitionClass::AGENT_PRIVATE), subset);
    action.peer_id = partner;
    return guard_.submit(action);
}

ActionResult AgentCommunicationGuard::read_shared(const std::string& reader, const std::string& partner) {
    return guard_.submit(Action::with_peer(reader, ActionKind::READ_SHARED, partner));
}

std::vector<AgentMessage> AgentCommunicationGuard::take_messages(const std::string& agent) {
    std::lock_guard<std::mutex> lock(inbox_mutex_);
    std::vector<AgentMessage> out;
    std::map<std::string, std::vector<AgentMessage> >::iterator it = inboxes_.find(agent);
    if (it != inboxes_.end()) {
        out.swap(it->second);
        inboxes_.erase(it);
    }
    return out;
}

void AgentCommunicationGuard::forget_agent(const std::string& agent) {
    table_.leave(agent);
    std::lock_guard<std::mutex> lock(inbox_mutex_);
    inboxes_.erase(agent);
}

// ============================================================================
// Effects
// ============================================================================

ActionResult AgentCommunicationGuard::apply_open(const Action& action, const Decision& decision) {
    std::string group_id;
    if (!table_.form(action.actor_id, action.peer_id, group_id)) {
        return ActionResult::failed(decision, "collaboration state changed; request again");
    }
    LOG_INFO("[AgentComm] Collaboration %s opened: %s + %s",
             group_id.c_str(), action.actor_id.c_str(), action.peer_id.c_str());
    return ActionResult::from(decision, group_id);
}

ActionResult AgentCommunicationGuard::apply_join(const Action& action, const Decision& decision) {
    if (!table_.join(action.actor_id, action.peer_id)) {
        return ActionResult::failed(decision, "collaboration state changed; request again");
    }
    return ActionResult::from(decision);
}

ActionResult AgentCommunicationGuard::apply_message(const Action& action, const Decision& decision) {
    AgentMessage msg;
    msg.sender = action.actor_id;
    msg.receiver = action.peer_id;
    msg.text = action.payload;
    msg.sent_at = current_timestamp_ms();

    std::lock_guard<std::mutex> lock(inbox_mutex_);
    inboxes_[msg.receiver].push_back(msg);
    return ActionResult::from(decision);
}

ActionResult AgentCommunicationGuard::apply_share(const Action& action, const Decision& decision) {
    std::string content;
    StoreStatus status = store_.read(action.target, decision.token, content);
    if (status != StoreStatus::OK) {
        return ActionResult::failed(decision, std::string("action failed: ") + to_string(status));
    }
    if (content.find(action.payload) == std::string::npos) {
        return ActionResult::failed(decision, "shared text must come from the agent's own partition");
    }
    switch (table_.add_shared(action.actor_id, action.payload, content)) {
        case ShareStatus::SHARED:
            break;
        case ShareStatus::NO_COLLABORATION:
            return ActionResult::failed(decision, "collaboration ended before sharing");
        case ShareStatus::WHOLE_PARTITION:
            return ActionResult::failed(decision, "sharing a whole private partition is not allowed");
    }
    return ActionResult::from(decision);
}

ActionResult AgentCommunicationGuard::apply_read_shared(const Action& action, const Decision& decision) {
    std::vector<std::string> shared = table_.shared_from(action.peer_id, action.actor_id);
    return ActionResult::from(decision, join(shared, "\n"));
}

} // namespace primus
