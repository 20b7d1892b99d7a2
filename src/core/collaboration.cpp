/*
 * Primus C++ - Collaboration Table Implementation
 */
#include <primus/core/collaboration.hpp>
#include <primus/core/utils.hpp>
#include <cctype>

namespace primus {

namespace {

bool covers_content(const std::string& content, const std::vector<std::string>& pieces) {
    std::vector<bool> covered(content.size(), false);
    for (size_t i = 0; i < pieces.size(); ++i) {
        if (pieces[i].empty()) continue;
        size_t pos = content.find(pieces[i]);
        while (pos != std::string::npos) {
            for (size_t k = pos; k < pos + pieces[i].size(); ++k) covered[k] = true;
            pos = content.find(pieces[i], pos + 1);
        }
    }
    for (size_t k = 0; k < content.size(); ++k) {
        if (!covered[k] && !std::isspace(static_cast<unsigned char>(content[k]))) return false;
    }
    return true;
}

} // anonymous namespace

CollaborationTable::CollaborationTable() {}

void CollaborationTable::set_blocked(const std::map<std::string, std::set<std::string> >& blocked) {
    std::lock_guard<std::mutex> lock(mutex_);
    blocked_ = blocked;
}

bool CollaborationTable::blocked_locked(const std::string& a, const std::string& b) const {
    std::map<std::string, std::set<std::string> >::const_iterator it = blocked_.find(a);
    if (it != blocked_.end() && it->second.count(b)) return true;
    it = blocked_.find(b);
    return it != blocked_.end() && it->second.count(a) > 0;
}

bool CollaborationTable::is_blocked(const std::string& a, const std::string& b) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return blocked_locked(a, b);
}

std::vector<std::string> CollaborationTable::blocked_for(const std::string& agent) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    std::map<std::string, std::set<std::string> >::const_iterator it = blocked_.find(agent);
    if (it != blocked_.end()) out.assign(it->second.begin(), it->second.end());
    return out;
}

bool CollaborationTable::same_group_locked(const std::string& a, const std::string& b) const {
    std::map<std::string, std::string>::const_iterator ga = membership_.find(a);
    std::map<std::string, std::string>::const_iterator gb = membership_.find(b);
    return ga != membership_.end() && gb != membership_.end() && ga->second == gb->second;
}

Decision CollaborationTable::check_open_locked(const std::string& initiator, const std::string& partner) const {
    if (initiator == partner) {
        return Decision::deny("an agent cannot collaborate with itself");
    }
    if (blocked_locked(initiator, partner)) {
        return Decision::deny("collaboration between " + initiator + " and " + partner + " is blocked");
    }
    if (membership_.count(initiator)) {
        return Decision::deny(initiator + " is already in a collaboration");
    }
    if (membership_.count(partner)) {
        return Decision::deny(partner + " is already in a collaboration");
    }
    return Decision::allow();
}

Decision CollaborationTable::check_join_locked(const std::string& agent, const std::string& member) const {
    std::map<std::string, std::string>::const_iterator it = membership_.find(member);
    if (it == membership_.end()) {
        return Decision::deny(member + " is not in a collaboration");
    }
    if (membership_.count(agent)) {
        return Decision::deny(agent + " is already in a collaboration");
    }
    const CollaborationGroup& group = groups_.find(it->second)->second;
    if (group.members.size() >= MAX_MEMBERS) {
        return Decision::deny("collaboration limit reached: a session holds at most two agents");
    }
    for (size_t i = 0; i < group.members.size(); ++i) {
        if (blocked_locked(agent, group.members[i])) {
            return Decision::deny("collaboration between " + agent + " and " + group.members[i] + " is blocked");
        }
    }
    return Decision::allow();
}

Decision CollaborationTable::check_open(const std::string& initiator, const std::string& partner) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return check_open_locked(initiator, partner);
}

Decision CollaborationTable::check_join(const std::string& agent, const std::string& member) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return check_join_locked(agent, member);
}

Decision CollaborationTable::check_message(const std::string& sender, const std::string& receiver) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (blocked_locked(sender, receiver)) {
        return Decision::deny("messaging between " + sender + " and " + receiver + " is blocked");
    }
    if (!same_group_locked(sender, receiver)) {
        return Decision::deny("no authorized collaboration between " + sender + " and " + receiver);
    }
    return Decision::allow();
}

Decision CollaborationTable::check_shared_access(const std::string& agent, const std::string& partner) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!same_group_locked(agent, partner)) {
        return Decision::deny("no authorized collaboration between " + agent + " and " + partner);
    }
    return Decision::allow();
}

bool CollaborationTable::form(const std::string& initiator, const std::string& partner, std::string& group_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!check_open_locked(initiator, partner).allowed()) return false;

    CollaborationGroup group;
    group.id = generate_uuid();
    group.members.push_back(initiator);
    group.members.push_back(partner);
    group.formed_at = current_timestamp_ms();

    groups_[group.id] = group;
    membership_[initiator] = group.id;
    membership_[partner] = group.id;
    group_id = group.id;
    return true;
}

bool CollaborationTable::join(const std::string& agent, const std::string& member) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!check_join_locked(agent, member).allowed()) return false;

    const std::string group_id = membership_[member];
    groups_[group_id].members.push_back(agent);
    membership_[agent] = group_id;
    return true;
}

bool CollaborationTable::leave(const std::string& agent) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, std::string>::iterator it = membership_.find(agent);
    if (it == membership_.end()) return false;

    std::map<std::string, CollaborationGroup>::iterator g = groups_.find(it->second);
    membership_.erase(it);
    if (g == groups_.end()) return true;

    // A collaboration needs two agents; the remaining partner is released
    const std::vector<std::string>& members = g->second.members;
    for (size_t i = 0; i < members.size(); ++i) {
        membership_.erase(members[i]);
    }
    groups_.erase(g);
    return true;
}

ShareStatus CollaborationTable::add_shared(const std::string& owner, const std::string& subset,
                                           const std::string& content) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, std::string>::const_iterator it = membership_.find(owner);
    if (it == membership_.end()) return ShareStatus::NO_COLLABORATION;

    std::vector<std::string>& shared = groups_[it->second].shared[owner];
    std::vector<std::string> pieces(shared);
    pieces.push_back(subset);
    if (covers_content(content, pieces)) return ShareStatus::WHOLE_PARTITION;

    shared.push_back(subset);
    return ShareStatus::SHARED;
}

std::vector<std::string> CollaborationTable::shared_from(const std::string& owner, const std::string& reader) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    if (!same_group_locked(owner, reader)) return out;

    const CollaborationGroup& group = groups_.find(membership_.find(owner)->second)->second;
    std::map<std::string, std::vector<std::string> >::const_iterator s = group.shared.find(owner);
    if (s != group.shared.end()) out = s->second;
    return out;
}

bool CollaborationTable::group_of(const std::string& agent, CollaborationGroup& out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, std::string>::const_iterator it = membership_.find(agent);
    if (it == membership_.end()) return false;
    out = groups_.find(it->second)->second;
    return true;
}

size_t CollaborationTable::group_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return groups_.size();
}

} // namespace primus
