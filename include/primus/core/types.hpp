/*
 * Primus C++ - Core Policy Types
 *
 * Closed sets of actor kinds, partition classes, action kinds and decision
 * outcomes shared by every policy component. Each enum has a string form
 * used by the audit log, the SQLite store and the front end.
 */
#ifndef primus_CORE_TYPES_HPP
#define primus_CORE_TYPES_HPP

#include <string>
#include <cstdint>

namespace primus {

// ============================================================================
// Actors and grants
// ============================================================================

enum class ActorKind {
    PRIMUS = 0,
    AGENT = 1,
    SUBCHAT = 2,
    SANDBOX = 3
};

// Ordered from most to least restrictive
enum class InternetAccess {
    OFF = 0,
    PER_CALL = 1,
    TEMPORARY_SESSION = 2
};

enum class RagWriteScope {
    NONE = 0,
    OWN_PARTITION = 1
};

struct CapabilityGrant {
    InternetAccess internet_access;
    bool agent_to_agent;
    bool subchat_cross_access;
    bool personality_write;
    RagWriteScope rag_write_scope;

    // Default is the empty grant
    CapabilityGrant()
        : internet_access(InternetAccess::OFF)
        , agent_to_agent(false)
        , subchat_cross_access(false)
        , personality_write(false)
        , rag_write_scope(RagWriteScope::NONE) {}

    CapabilityGrant(InternetAccess internet, bool a2a, bool cross, bool personality, RagWriteScope rag)
        : internet_access(internet)
        , agent_to_agent(a2a)
        , subchat_cross_access(cross)
        , personality_write(personality)
        , rag_write_scope(rag) {}

    bool operator==(const CapabilityGrant& o) const {
        return internet_access == o.internet_access && agent_to_agent == o.agent_to_agent &&
               subchat_cross_access == o.subchat_cross_access &&
               personality_write == o.personality_write && rag_write_scope == o.rag_write_scope;
    }
    bool operator!=(const CapabilityGrant& o) const { return !(*this == o); }
};

// ============================================================================
// Partitions
// ============================================================================

enum class PartitionClass {
    GLOBAL = 0,
    AGENT_PRIVATE = 1,
    SUBCHAT = 2,
    SANDBOX_PRIVATE = 3,
    PERSONALITY = 4,     // personality document of a Primus or Agent
    SYSTEM = 5           // Primus system settings
};

struct PartitionId {
    std::string owner;
    PartitionClass klass;

    PartitionId() : klass(PartitionClass::GLOBAL) {}
    PartitionId(const std::string& o, PartitionClass k) : owner(o), klass(k) {}

    // "owner/class", e.g. "primus/global"
    std::string to_string() const;

    bool operator==(const PartitionId& o) const { return owner == o.owner && klass == o.klass; }
    bool operator!=(const PartitionId& o) const { return !(*this == o); }
    bool operator<(const PartitionId& o) const {
        if (owner != o.owner) return owner < o.owner;
        return static_cast<int>(klass) < static_cast<int>(o.klass);
    }
};

// ============================================================================
// Modes
// ============================================================================

enum class Mode {
    NORMAL = 0,
    APPROVAL_PENDING = 1,
    SANDBOX = 2
};

// ============================================================================
// Actions and decisions
// ============================================================================

enum class ActionKind {
    CHAT_TURN = 0,
    MEMORY_READ,
    MEMORY_WRITE,          // replace partition content
    MEMORY_APPEND,         // append to partition content (session history)
    PERSONALITY_WRITE,
    SETTINGS_WRITE,
    INTERNET_CALL,
    AGENT_MESSAGE,
    COLLABORATION_OPEN,
    COLLABORATION_JOIN,
    SHARE_SUBSET,
    READ_SHARED,
    GRANT_READ
};

struct Action {
    std::string actor_id;
    ActionKind kind;
    bool has_target;
    PartitionId target;
    std::string peer_id;    // agent messages, collaboration, shared reads
    std::string payload;

    Action() : kind(ActionKind::CHAT_TURN), has_target(false) {}

    static Action simple(const std::string& actor, ActionKind kind,
                         const std::string& payload = "") {
        Action a;
        a.actor_id = actor;
        a.kind = kind;
        a.payload = payload;
        return a;
    }

    static Action on_partition(const std::string& actor, ActionKind kind,
                               const PartitionId& target, const std::string& payload = "") {
        Action a = simple(actor, kind, payload);
        a.has_target = true;
        a.target = target;
        return a;
    }

    static Action with_peer(const std::string& actor, ActionKind kind,
                            const std::string& peer, const std::string& payload = "") {
        Action a = simple(actor, kind, payload);
        a.peer_id = peer;
        return a;
    }
};

// Opaque single-use capability for one store operation
struct AccessToken {
    std::string value;

    bool empty() const { return value.empty(); }
};

enum class DecisionKind {
    ALLOW = 0,
    DENY = 1,
    REQUIRE_APPROVAL = 2
};

struct Decision {
    DecisionKind kind;
    std::string reason;
    std::string approval_id;   // set for REQUIRE_APPROVAL
    AccessToken token;         // set for ALLOW decisions that touch the store

    Decision() : kind(DecisionKind::DENY) {}

    static Decision allow(const std::string& reason = "allowed") {
        Decision d;
        d.kind = DecisionKind::ALLOW;
        d.reason = reason;
        return d;
    }

    static Decision deny(const std::string& reason) {
        Decision d;
        d.kind = DecisionKind::DENY;
        d.reason = reason;
        return d;
    }

    static Decision require_approval(const std::string& reason) {
        Decision d;
        d.kind = DecisionKind::REQUIRE_APPROVAL;
        d.reason = reason;
        return d;
    }

    bool allowed() const { return kind == DecisionKind::ALLOW; }
    bool denied() const { return kind == DecisionKind::DENY; }
    bool needs_approval() const { return kind == DecisionKind::REQUIRE_APPROVAL; }
};

// ============================================================================
// Outcomes
// ============================================================================

enum class StoreStatus {
    OK = 0,
    PARTITION_NOT_FOUND,
    TOKEN_INVALID,
    CORRUPTED
};

enum class TransitionStatus {
    OK = 0,
    REJECTED,     // the requested state change is not permitted now
    STALE         // the mode changed since the caller observed it
};

struct TransitionResult {
    TransitionStatus status;
    std::string reason;

    TransitionResult() : status(TransitionStatus::OK) {}
    TransitionResult(TransitionStatus s, const std::string& r) : status(s), reason(r) {}

    bool ok() const { return status == TransitionStatus::OK; }
};

struct ActionResult {
    Decision decision;
    bool ok;
    std::string data;
    std::string error;

    ActionResult() : ok(false) {}

    static ActionResult from(const Decision& d, const std::string& data = "") {
        ActionResult r;
        r.decision = d;
        r.ok = d.allowed();
        r.data = data;
        if (!r.ok) r.error = d.reason;
        return r;
    }

    static ActionResult failed(const Decision& d, const std::string& error) {
        ActionResult r;
        r.decision = d;
        r.ok = false;
        r.error = error;
        return r;
    }
};

struct AuditRecord {
    int64_t seq;
    int64_t timestamp;       // unix ms
    std::string actor_id;
    ActionKind action;
    DecisionKind decision;
    std::string reason;
    Mode mode;

    AuditRecord()
        : seq(0), timestamp(0), action(ActionKind::CHAT_TURN)
        , decision(DecisionKind::DENY), mode(Mode::NORMAL) {}
};

// ============================================================================
// String forms
// ============================================================================

const char* to_string(ActorKind kind);
const char* to_string(InternetAccess access);
const char* to_string(RagWriteScope scope);
const char* to_string(PartitionClass klass);
const char* to_string(Mode mode);
const char* to_string(ActionKind kind);
const char* to_string(DecisionKind kind);
const char* to_string(StoreStatus status);
const char* to_string(TransitionStatus status);

bool parse_actor_kind(const std::string& s, ActorKind& out);
bool parse_internet_access(const std::string& s, InternetAccess& out);
bool parse_rag_write_scope(const std::string& s, RagWriteScope& out);
bool parse_partition_class(const std::string& s, PartitionClass& out);
bool parse_mode(const std::string& s, Mode& out);
bool parse_action_kind(const std::string& s, ActionKind& out);
bool parse_decision_kind(const std::string& s, DecisionKind& out);

// Parses "owner/class"
bool parse_partition_id(const std::string& s, PartitionId& out);

} // namespace primus

#endif // primus_CORE_TYPES_HPP
