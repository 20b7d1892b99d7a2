#include <gtest/gtest.h>
#include <primus/core/runtime.hpp>
#include <primus/core/logger.hpp>

using namespace primus;

class AgentCommTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().set_quiet(true);
        Config config;
        ASSERT_TRUE(config.load_string(
            "{\"agents\": [\"coder\", \"writer\", \"critic\", \"rival\"],"
            " \"policy\": {\"blocked_agents\": {\"rival\": [\"coder\"]}}}"));
        ASSERT_TRUE(rt.init(config));
    }

    void TearDown() override {
        Logger::instance().set_quiet(false);
    }

    // Opens coder <-> writer through the approval flow
    void form_pair() {
        ActionResult r = rt.agents().open_collaboration("coder", "writer");
        ASSERT_TRUE(r.decision.needs_approval());
        ActionResult applied = rt.approve(r.decision.approval_id);
        ASSERT_TRUE(applied.ok) << applied.error;
        EXPECT_FALSE(applied.data.empty());
    }

    Runtime rt;
};

TEST_F(AgentCommTest, MessagingNeedsCollaboration) {
    ActionResult r = rt.agents().send_message("coder", "writer", "hello");
    EXPECT_TRUE(r.decision.denied());
    EXPECT_TRUE(rt.agents().take_messages("writer").empty());

    form_pair();
    ASSERT_TRUE(rt.agents().send_message("coder", "writer", "hello").ok);

    std::vector<AgentMessage> inbox = rt.agents().take_messages("writer");
    ASSERT_EQ(inbox.size(), 1u);
    EXPECT_EQ(inbox[0].sender, "coder");
    EXPECT_EQ(inbox[0].text, "hello");
    EXPECT_TRUE(rt.agents().take_messages("writer").empty());
}

TEST_F(AgentCommTest, ThirdAgentCannotJoin) {
    form_pair();

    ActionResult r = rt.agents().join_collaboration("critic", "coder");
    ASSERT_TRUE(r.decision.denied());
    EXPECT_NE(r.decision.reason.find("collaboration limit"), std::string::npos);
    EXPECT_TRUE(rt.pending_approvals().empty());
    EXPECT_TRUE(rt.agents().send_message("critic", "coder", "let me in").decision.denied());
}

TEST_F(AgentCommTest, BlockedPairDenied) {
    EXPECT_TRUE(rt.agents().open_collaboration("coder", "rival").decision.denied());
    EXPECT_TRUE(rt.agents().open_collaboration("rival", "coder").decision.denied());
    EXPECT_EQ(rt.current_mode(), Mode::NORMAL);
}

TEST_F(AgentCommTest, OnlyAgentsCollaborate) {
    ASSERT_TRUE(rt.open_subchat("sc1", "primus"));
    EXPECT_TRUE(rt.agents().open_collaboration("sc1", "coder").decision.denied());
    EXPECT_TRUE(rt.agents().open_collaboration("primus", "coder").decision.denied());
    EXPECT_TRUE(rt.agents().open_collaboration("coder", "sc1").decision.denied());
}

TEST_F(AgentCommTest, SharedSubsetInsteadOfPartition) {
    const PartitionId coder_private("coder", PartitionClass::AGENT_PRIVATE);
    ASSERT_TRUE(rt.submit(Action::on_partition("coder", ActionKind::MEMORY_WRITE, coder_private,
                                               "api plan; secret draft")).ok);
    form_pair();

    // Partners never read each other's partitions directly
    EXPECT_TRUE(rt.authorize(Action::on_partition("writer", ActionKind::MEMORY_READ, coder_private)).denied());

    EXPECT_FALSE(rt.agents().share_subset("coder", "writer", "api plan; secret draft").ok);
    EXPECT_FALSE(rt.agents().share_subset("coder", "writer", "not in memory").ok);
    ASSERT_TRUE(rt.agents().share_subset("coder", "writer", "api plan").ok);

    ActionResult shared = rt.agents().read_shared("writer", "coder");
    ASSERT_TRUE(shared.ok) << shared.error;
    EXPECT_EQ(shared.data, "api plan");

    EXPECT_TRUE(rt.agents().read_shared("critic", "coder").decision.denied());
}

TEST_F(AgentCommTest, PiecewiseSharingCannotRebuildPartition) {
    const PartitionId coder_private("coder", PartitionClass::AGENT_PRIVATE);
    ASSERT_TRUE(rt.submit(Action::on_partition("coder", ActionKind::MEMORY_WRITE, coder_private, "abcdef")).ok);
    form_pair();

    ASSERT_TRUE(rt.agents().share_subset("coder", "writer", "abc").ok);
    ActionResult rest = rt.agents().share_subset("coder", "writer", "def");
    EXPECT_FALSE(rest.ok);
    EXPECT_NE(rest.error.find("whole private partition"), std::string::npos);

    ActionResult shared = rt.agents().read_shared("writer", "coder");
    ASSERT_TRUE(shared.ok) << shared.error;
    EXPECT_EQ(shared.data, "abc");

    // Overlapping pieces count once
    EXPECT_TRUE(rt.agents().share_subset("coder", "writer", "cd").ok);
    EXPECT_FALSE(rt.agents().share_subset("coder", "writer", "ef").ok);
}

TEST_F(AgentCommTest, LeavingEndsSharing) {
    ASSERT_TRUE(rt.submit(Action::on_partition("coder", ActionKind::MEMORY_WRITE,
                                               PartitionId("coder", PartitionClass::AGENT_PRIVATE), "a b")).ok);
    form_pair();
    ASSERT_TRUE(rt.agents().share_subset("coder", "writer", "a").ok);

    ASSERT_TRUE(rt.agents().leave_collaboration("coder"));
    EXPECT_TRUE(rt.agents().read_shared("writer", "coder").decision.denied());
    EXPECT_TRUE(rt.agents().send_message("writer", "coder", "?").decision.denied());
}

TEST_F(AgentCommTest, RetiredAgentLeavesGroup) {
    form_pair();
    ASSERT_TRUE(rt.close_actor("writer"));
    EXPECT_TRUE(rt.agents().send_message("coder", "writer", "hi").decision.denied());

    // coder is free for a new partner
    ActionResult r = rt.agents().open_collaboration("coder", "critic");
    EXPECT_TRUE(r.decision.needs_approval());
}

TEST_F(AgentCommTest, NoCollaborationInSandbox) {
    ASSERT_TRUE(rt.enter_sandbox("", false).ok());
    ActionResult r = rt.agents().open_collaboration("coder", "writer");
    EXPECT_TRUE(r.decision.denied());
    EXPECT_EQ(rt.current_mode(), Mode::SANDBOX);
}
