/*
 * Primus C++ - Capability Registry
 *
 * Static permission templates per actor kind. The table is closed over the
 * four actor kinds; runtime grants can only narrow a template.
 *
 *   kind     internet   a2a   subchat-x  personality  rag-write
 *   primus   per-call   yes   yes        yes          own
 *   agent    per-call   yes   no         no           own
 *   subchat  per-call   no    no         no           own
 *   sandbox  off        no    no         yes          own
 */
#ifndef primus_CORE_CAPABILITY_REGISTRY_HPP
#define primus_CORE_CAPABILITY_REGISTRY_HPP

#include <primus/core/types.hpp>
#include <primus/core/json.hpp>

namespace primus {

class CapabilityRegistry {
public:
    // Template for an actor kind. Throws std::invalid_argument for a value
    // outside the four kinds.
    static const CapabilityGrant& capabilities_for(ActorKind kind);

    // Field-wise most restrictive combination of two grants
    static CapabilityGrant intersect(const CapabilityGrant& a, const CapabilityGrant& b);

    // True when every permission in `inner` is also present in `outer`.
    // rag_write_scope is compared only when `compare_rag_scope` is set.
    static bool is_subset(const CapabilityGrant& inner, const CapabilityGrant& outer,
                          bool compare_rag_scope = true);

    // Effective grant: template intersected with the runtime grant.
    // A SubChat never ends up with personality_write.
    static CapabilityGrant resolve(ActorKind kind, const CapabilityGrant& runtime);

    // Apply a JSON narrowing object ({"internet_access": "off", ...}) on top
    // of `base`. Fields can only remove permissions; unknown values are ignored.
    static CapabilityGrant narrow_from_json(const CapabilityGrant& base, const Json& j);

    static Json to_json(const CapabilityGrant& grant);
};

} // namespace primus

#endif // primus_CORE_CAPABILITY_REGISTRY_HPP
