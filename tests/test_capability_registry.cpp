#include <gtest/gtest.h>
#include <primus/core/capability_registry.hpp>
#include <primus/core/actor_registry.hpp>
#include <stdexcept>

using namespace primus;

namespace {

std::vector<CapabilityGrant> all_grants() {
    std::vector<CapabilityGrant> grants;
    const InternetAccess access[] = {InternetAccess::OFF, InternetAccess::PER_CALL,
                                     InternetAccess::TEMPORARY_SESSION};
    const RagWriteScope scopes[] = {RagWriteScope::NONE, RagWriteScope::OWN_PARTITION};
    for (int a = 0; a < 3; ++a) {
        for (int bits = 0; bits < 8; ++bits) {
            for (int s = 0; s < 2; ++s) {
                grants.push_back(CapabilityGrant(access[a], bits & 1, (bits & 2) != 0,
                                                 (bits & 4) != 0, scopes[s]));
            }
        }
    }
    return grants;
}

} // namespace

TEST(CapabilityRegistryTest, TemplatesPerKind) {
    const CapabilityGrant& primus = CapabilityRegistry::capabilities_for(ActorKind::PRIMUS);
    EXPECT_EQ(primus.internet_access, InternetAccess::TEMPORARY_SESSION);
    EXPECT_EQ(CapabilityRegistry::capabilities_for(ActorKind::AGENT).internet_access, InternetAccess::PER_CALL);
    EXPECT_TRUE(primus.agent_to_agent);
    EXPECT_TRUE(primus.personality_write);

    const CapabilityGrant& sandbox = CapabilityRegistry::capabilities_for(ActorKind::SANDBOX);
    EXPECT_EQ(sandbox.internet_access, InternetAccess::OFF);
    EXPECT_FALSE(sandbox.agent_to_agent);

    EXPECT_FALSE(CapabilityRegistry::capabilities_for(ActorKind::SUBCHAT).personality_write);
    EXPECT_FALSE(CapabilityRegistry::capabilities_for(ActorKind::AGENT).personality_write);
}

TEST(CapabilityRegistryTest, UnknownKindThrows) {
    EXPECT_THROW(CapabilityRegistry::capabilities_for(static_cast<ActorKind>(42)), std::invalid_argument);
}

TEST(CapabilityRegistryTest, AgentAndSubChatAreSubsetsOfPrimus) {
    const CapabilityGrant& primus = CapabilityRegistry::capabilities_for(ActorKind::PRIMUS);
    EXPECT_TRUE(CapabilityRegistry::is_subset(
        CapabilityRegistry::capabilities_for(ActorKind::AGENT), primus, false));
    EXPECT_TRUE(CapabilityRegistry::is_subset(
        CapabilityRegistry::capabilities_for(ActorKind::SUBCHAT), primus, false));
}

TEST(CapabilityRegistryTest, SubChatNeverGetsPersonalityWrite) {
    std::vector<CapabilityGrant> grants = all_grants();
    for (size_t i = 0; i < grants.size(); ++i) {
        EXPECT_FALSE(CapabilityRegistry::resolve(ActorKind::SUBCHAT, grants[i]).personality_write);
    }
}

TEST(CapabilityRegistryTest, ResolveNeverWidensTemplate) {
    std::vector<CapabilityGrant> grants = all_grants();
    const ActorKind kinds[] = {ActorKind::PRIMUS, ActorKind::AGENT, ActorKind::SUBCHAT, ActorKind::SANDBOX};
    for (int k = 0; k < 4; ++k) {
        for (size_t i = 0; i < grants.size(); ++i) {
            CapabilityGrant effective = CapabilityRegistry::resolve(kinds[k], grants[i]);
            EXPECT_TRUE(CapabilityRegistry::is_subset(effective, CapabilityRegistry::capabilities_for(kinds[k])));
            EXPECT_TRUE(CapabilityRegistry::is_subset(effective, grants[i]));
        }
    }
}

TEST(CapabilityRegistryTest, NarrowFromJsonOnlyRemoves) {
    const CapabilityGrant& agent = CapabilityRegistry::capabilities_for(ActorKind::AGENT);

    Json j = {{"internet_access", "off"}, {"agent_to_agent", false}, {"personality_write", true}};
    CapabilityGrant narrowed = CapabilityRegistry::narrow_from_json(agent, j);
    EXPECT_EQ(narrowed.internet_access, InternetAccess::OFF);
    EXPECT_FALSE(narrowed.agent_to_agent);
    EXPECT_FALSE(narrowed.personality_write);

    Json widen = {{"internet_access", "temporary-session"}};
    EXPECT_EQ(CapabilityRegistry::narrow_from_json(agent, widen).internet_access, InternetAccess::PER_CALL);
}

TEST(ActorRegistryTest, SubChatAliasesParentPersonality) {
    ActorRegistry actors;
    ASSERT_TRUE(actors.register_primus("primus"));
    ASSERT_TRUE(actors.register_agent("coder"));
    ASSERT_TRUE(actors.open_subchat("sc1", "coder"));

    Actor sc;
    ASSERT_TRUE(actors.get("sc1", sc));
    EXPECT_EQ(sc.kind(), ActorKind::SUBCHAT);
    EXPECT_EQ(sc.parent_id(), "coder");
    EXPECT_EQ(sc.personality_ref(), "coder");
}

TEST(ActorRegistryTest, RegistrationRules) {
    ActorRegistry actors;
    EXPECT_FALSE(actors.register_agent("early"));
    ASSERT_TRUE(actors.register_primus("primus"));
    EXPECT_FALSE(actors.register_primus("other"));
    EXPECT_FALSE(actors.register_agent("primus"));
    EXPECT_FALSE(actors.register_agent("a/b"));
    EXPECT_FALSE(actors.open_subchat("sc", "sandbox"));
    EXPECT_FALSE(actors.remove("primus"));
    EXPECT_FALSE(actors.remove(ActorRegistry::SANDBOX_ACTOR_ID));
    EXPECT_TRUE(actors.exists(ActorRegistry::SANDBOX_ACTOR_ID));
}

TEST(ActorRegistryTest, NarrowGrantIntersects) {
    ActorRegistry actors;
    ASSERT_TRUE(actors.register_primus("primus"));
    ASSERT_TRUE(actors.register_agent("coder"));

    CapabilityGrant off;   // empty grant
    ASSERT_TRUE(actors.narrow_grant("coder", off));
    CapabilityGrant wide(InternetAccess::TEMPORARY_SESSION, true, true, true, RagWriteScope::OWN_PARTITION);
    ASSERT_TRUE(actors.narrow_grant("coder", wide));

    Actor coder;
    ASSERT_TRUE(actors.get("coder", coder));
    EXPECT_EQ(coder.runtime_grant(), CapabilityGrant());
}
