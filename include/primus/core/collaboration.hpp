/*
 * Primus C++ - Collaboration Table
 *
 * Active agent-to-agent collaboration groups. A group holds at most two
 * agents and an agent belongs to at most one group. Partners never see each
 * other's private partitions; they only see subsets explicitly shared into
 * the group.
 */
#ifndef primus_CORE_COLLABORATION_HPP
#define primus_CORE_COLLABORATION_HPP

#include <primus/core/types.hpp>
#include <map>
#include <set>
#include <string>
#include <vector>
#include <mutex>

namespace primus {

enum class ShareStatus {
    SHARED = 0,
    NO_COLLABORATION,
    WHOLE_PARTITION    // together with earlier shares it would expose everything
};

struct CollaborationGroup {
    std::string id;
    std::vector<std::string> members;
    std::map<std::string, std::vector<std::string> > shared;   // owner -> shared subsets
    int64_t formed_at;

    CollaborationGroup() : formed_at(0) {}
};

class CollaborationTable {
public:
    static constexpr size_t MAX_MEMBERS = 2;

    CollaborationTable();

    // Pairs that may never collaborate or exchange messages (either direction)
    void set_blocked(const std::map<std::string, std::set<std::string> >& blocked);
    bool is_blocked(const std::string& a, const std::string& b) const;
    std::vector<std::string> blocked_for(const std::string& agent) const;

    // ---- Read-only policy checks ----
    Decision check_open(const std::string& initiator, const std::string& partner) const;
    Decision check_join(const std::string& agent, const std::string& member) const;
    Decision check_message(const std::string& sender, const std::string& receiver) const;
    Decision check_shared_access(const std::string& agent, const std::string& partner) const;

    // ---- Mutations, applied after an Allow decision ----
    // Each re-validates under the lock and fails if the table changed.
    bool form(const std::string& initiator, const std::string& partner, std::string& group_id);
    bool join(const std::string& agent, const std::string& member);
    // Dissolves the agent's group
    bool leave(const std::string& agent);
    // `content` is the owner's partition as read for this share. Shares are
    // refused once they would cover every non-blank character of it.
    ShareStatus add_shared(const std::string& owner, const std::string& subset, const std::string& content);

    // Subsets `owner` shared into the group it has with `reader`
    std::vector<std::string> shared_from(const std::string& owner, const std::string& reader) const;

    bool group_of(const std::string& agent, CollaborationGroup& out) const;
    size_t group_count() const;

private:
    Decision check_open_locked(const std::string& initiator, const std::string& partner) const;
    Decision check_join_locked(const std::string& agent, const std::string& member) const;
    bool same_group_locked(const std::string& a, const std::string& b) const;
    bool blocked_locked(const std::string& a, const std::string& b) const;

    mutable std::mutex mutex_;
    std::map<std::string, CollaborationGroup> groups_;
    std::map<std::string, std::string> membership_;      // agent -> group id
    std::map<std::string, std::set<std::string> > blocked_;
};

} // namespace primus

#endif // primus_CORE_COLLABORATION_HPP
