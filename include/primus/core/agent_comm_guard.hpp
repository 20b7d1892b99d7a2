/*
 * Primus C++ - Agent Communication Guard
 *
 * Agent-to-agent messaging and collaboration on top of the interaction
 * guard. Partners exchange messages and explicitly shared subsets of their
 * private partitions, never the partitions themselves.
 */
#ifndef primus_CORE_AGENT_COMM_GUARD_HPP
#define primus_CORE_AGENT_COMM_GUARD_HPP

#include <primus/core/interaction_guard.hpp>
#include <primus/core/collaboration.hpp>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace primus {

struct AgentMessage {
    std::string sender;
    std::string receiver;
    std::string text;
    int64_t sent_at;

    AgentMessage() : sent_at(0) {}
};

class AgentCommunicationGuard {
public:
    AgentCommunicationGuard(InteractionGuard& guard, CollaborationTable& table, PartitionStore& store);

    // Registers the collaboration effects on the interaction guard
    void install();

    ActionResult open_collaboration(const std::string& initiator, const std::string& partner);
    ActionResult join_collaboration(const std::string& agent, const std::string& member);
    bool leave_collaboration(const std::string& agent);

    ActionResult send_message(const std::string& sender, const std::string& receiver, const std::string& text);

    // `subset` must be a strict part of the owner's private partition
    ActionResult share_subset(const std::string& owner, const std::string& partner, const std::string& subset);
    ActionResult read_shared(const std::string& reader, const std::string& partner);

    std::vector<AgentMessage> take_messages(const std::string& agent);

    // Leaves the group and drops the inbox of a retired agent
    void forget_agent(const std::string& agent);

private:
    ActionResult apply_open(const Action& action, const Decision& decision);
    ActionResult apply_join(const Action& action, const Decision& decision);
    ActionResult apply_message(const Action& action, const Decision& decision);
    ActionResult apply_share(const Action& action, const Decision& decision);
    ActionResult apply_read_shared(const Action& action, const Decision& decision);

    InteractionGuard& guard_;
    CollaborationTable& table_;
    PartitionStore& store_;

    std::mutex inbox_mutex_;
    std::map<std::string, std::vector<AgentMessage> > inboxes_;
};

} // namespace primus

#endif // primus_CORE_AGENT_COMM_GUARD_HPP
