/*
 * Primus C++ - Core Policy Types (string forms)
 */
#include <primus/core/types.hpp>

namespace primus {

namespace {

const char* const ACTOR_KIND_NAMES[] = { "primus", "agent", "subchat", "sandbox" };
const char* const INTERNET_ACCESS_NAMES[] = { "off", "per-call", "temporary-session" };
const char* const RAG_SCOPE_NAMES[] = { "none", "own-partition" };
const char* const PARTITION_CLASS_NAMES[] = {
    "global", "agent-private", "subchat", "sandbox-private", "personality", "system"
};
const char* const MODE_NAMES[] = { "normal", "approval-pending", "sandbox" };
const char* const ACTION_KIND_NAMES[] = {
    "chat_turn", "memory_read", "memory_write", "memory_append", "personality_write",
    "settings_write", "internet_call", "agent_message", "collaboration_open",
    "collaboration_join", "share_subset", "read_shared", "grant_read"
};
const char* const DECISION_KIND_NAMES[] = { "allow", "deny", "require_approval" };
const char* const STORE_STATUS_NAMES[] = {
    "ok", "partition_not_found", "token_invalid", "corrupted"
};
const char* const TRANSITION_STATUS_NAMES[] = { "ok", "transition_rejected", "stale" };

template<typename E, size_t N>
const char* name_of(E value, const char* const (&names)[N]) {
    size_t idx = static_cast<size_t>(value);
    return idx < N ? names[idx] : "unknown";
}

template<typename E, size_t N>
bool parse_name(const std::string& s, const char* const (&names)[N], E& out) {
    for (size_t i = 0; i < N; ++i) {
        if (s == names[i]) {
            out = static_cast<E>(i);
            return true;
        }
    }
    return false;
}

} // anonymous namespace

std::string PartitionId::to_string() const {
    return owner + "/" + primus::to_string(klass);
}

const char* to_string(ActorKind kind) { return name_of(kind, ACTOR_KIND_NAMES); }
const char* to_string(InternetAccess access) { return name_of(access, INTERNET_ACCESS_NAMES); }
const char* to_string(RagWriteScope scope) { return name_of(scope, RAG_SCOPE_NAMES); }
const char* to_string(PartitionClass klass) { return name_of(klass, PARTITION_CLASS_NAMES); }
const char* to_string(Mode mode) { return name_of(mode, MODE_NAMES); }
const char* to_string(ActionKind kind) { return name_of(kind, ACTION_KIND_NAMES); }
const char* to_string(DecisionKind kind) { return name_of(kind, DECISION_KIND_NAMES); }
const char* to_string(StoreStatus status) { return name_of(status, STORE_STATUS_NAMES); }
const char* to_string(TransitionStatus status) { return name_of(status, TRANSITION_STATUS_NAMES); }

bool parse_actor_kind(const std::string& s, ActorKind& out) {
    return parse_name(s, ACTOR_KIND_NAMES, out);
}

bool parse_internet_access(const std::string& s, InternetAccess& out) {
    return parse_name(s, INTERNET_ACCESS_NAMES, out);
}

bool parse_rag_write_scope(const std::string& s, RagWriteScope& out) {
    return parse_name(s, RAG_SCOPE_NAMES, out);
}

bool parse_partition_class(const std::string& s, PartitionClass& out) {
    return parse_name(s, PARTITION_CLASS_NAMES, out);
}

bool parse_mode(const std::string& s, Mode& out) {
    return parse_name(s, MODE_NAMES, out);
}

bool parse_action_kind(const std::string& s, ActionKind& out) {
    return parse_name(s, ACTION_KIND_NAMES, out);
}

bool parse_decision_kind(const std::string& s, DecisionKind& out) {
    return parse_name(s, DECISION_KIND_NAMES, out);
}

bool parse_partition_id(const std::string& s, PartitionId& out) {
    size_t slash = s.rfind('/');
    if (slash == std::string::npos || slash == 0 || slash + 1 >= s.size()) {
        return false;
    }
    PartitionClass klass;
    if (!parse_partition_class(s.substr(slash + 1), klass)) {
        return false;
    }
    out = PartitionId(s.substr(0, slash), klass);
    return true;
}

} // namespace primus
