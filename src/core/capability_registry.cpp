/*
 * Primus C++ - Capability Registry Implementation
 */
#include <primus/core/capability_registry.hpp>
#include <stdexcept>

namespace primus {

namespace {

// The first approved call opens a session for Primus
const CapabilityGrant PRIMUS_TEMPLATE(
    InternetAccess::TEMPORARY_SESSION, true, true, true, RagWriteScope::OWN_PARTITION);

const CapabilityGrant AGENT_TEMPLATE(
    InternetAccess::PER_CALL, true, false, false, RagWriteScope::OWN_PARTITION);

const CapabilityGrant SUBCHAT_TEMPLATE(
    InternetAccess::PER_CALL, false, false, false, RagWriteScope::OWN_PARTITION);

// Offline; personality edits are staged and confirmed on exit
const CapabilityGrant SANDBOX_TEMPLATE(
    InternetAccess::OFF, false, false, true, RagWriteScope::OWN_PARTITION);

InternetAccess min_access(InternetAccess a, InternetAccess b) {
    return static_cast<int>(a) < static_cast<int>(b) ? a : b;
}

} // anonymous namespace

const CapabilityGrant& CapabilityRegistry::capabilities_for(ActorKind kind) {
    switch (kind) {
        case ActorKind::PRIMUS: return PRIMUS_TEMPLATE;
        case ActorKind::AGENT: return AGENT_TEMPLATE;
        case ActorKind::SUBCHAT: return SUBCHAT_TEMPLATE;
        case ActorKind::SANDBOX: return SANDBOX_TEMPLATE;
    }
    throw std::invalid_argument("unknown actor kind " + std::to_string(static_cast<int>(kind)));
}

CapabilityGrant CapabilityRegistry::intersect(const CapabilityGrant& a, const CapabilityGrant& b) {
    CapabilityGrant g;
    g.internet_access = min_access(a.internet_access, b.internet_access);
    g.agent_to_agent = a.agent_to_agent && b.agent_to_agent;
    g.subchat_cross_access = a.subchat_cross_access && b.subchat_cross_access;
    g.personality_write = a.personality_write && b.personality_write;
    g.rag_write_scope = (a.rag_write_scope == RagWriteScope::NONE ||
                         b.rag_write_scope == RagWriteScope::NONE)
        ? RagWriteScope::NONE : RagWriteScope::OWN_PARTITION;
    return g;
}

bool CapabilityRegistry::is_subset(const CapabilityGrant& inner, const CapabilityGrant& outer,
                                   bool compare_rag_scope) {
    if (static_cast<int>(inner.internet_access) > static_cast<int>(outer.internet_access)) return false;
    if (inner.agent_to_agent && !outer.agent_to_agent) return false;
    if (inner.subchat_cross_access && !outer.subchat_cross_access) return false;
    if (inner.personality_write && !outer.personality_write) return false;
    if (compare_rag_scope &&
        static_cast<int>(inner.rag_write_scope) > static_cast<int>(outer.rag_write_scope)) {
        return false;
    }
    return true;
}

CapabilityGrant CapabilityRegistry::resolve(ActorKind kind, const CapabilityGrant& runtime) {
    CapabilityGrant g = intersect(capabilities_for(kind), runtime);
    if (kind == ActorKind::SUBCHAT) {
        g.personality_write = false;
    }
    return g;
}

CapabilityGrant CapabilityRegistry::narrow_from_json(const CapabilityGrant& base, const Json& j) {
    if (!j.is_object()) return base;

    // Start from the full base and clear what the JSON turns off
    CapabilityGrant requested = base;
    if (j.contains("internet_access") && j["internet_access"].is_string()) {
        InternetAccess access;
        if (parse_internet_access(j["internet_access"].get<std::string>(), access)) {
            requested.internet_access = access;
        }
    }
    if (j.contains("agent_to_agent") && j["agent_to_agent"].is_boolean()) {
        requested.agent_to_agent = j["agent_to_agent"].get<bool>();
    }
    if (j.contains("subchat_cross_access") && j["subchat_cross_access"].is_boolean()) {
        requested.subchat_cross_access = j["subchat_cross_access"].get<bool>();
    }
    if (j.contains("personality_write") && j["personality_write"].is_boolean()) {
        requested.personality_write = j["personality_write"].get<bool>();
    }
    if (j.contains("rag_write_scope") && j["rag_write_scope"].is_string()) {
        RagWriteScope scope;
        if (parse_rag_write_scope(j["rag_write_scope"].get<std::string>(), scope)) {
            requested.rag_write_scope = scope;
        }
    }
    return intersect(base, requested);
}

Json CapabilityRegistry::to_json(const CapabilityGrant& grant) {
    Json j;
    j["internet_access"] = to_string(grant.internet_access);
    j["agent_to_agent"] = grant.agent_to_agent;
    j["subchat_cross_access"] = grant.subchat_cross_access;
    j["personality_write"] = grant.personality_write;
    j["rag_write_scope"] = to_string(grant.rag_write_scope);
    return j;
}

} // namespace primus
