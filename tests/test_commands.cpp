#include <gtest/gtest.h>
#include <primus/core/commands.hpp>
#include <primus/core/logger.hpp>

using namespace primus;

namespace {

class EchoBackend : public InferenceBackend {
public:
    std::string backend_id() const override { return "echo"; }
    bool is_local() const override { return true; }
    bool complete(const std::string& prompt, const ContextBundle& context, std::string& out) override {
        out = "echo: " + prompt + " (" + std::to_string(context.snippets.size()) + " snippets)";
        return true;
    }
};

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

// Approval id printed after "/approve "
std::string approval_id_of(const std::string& reply) {
    const std::string marker = "/approve ";
    size_t pos = reply.find(marker);
    if (pos == std::string::npos) return "";
    pos += marker.size();
    size_t end = reply.find_first_of(" \n", pos);
    return reply.substr(pos, end == std::string::npos ? std::string::npos : end - pos);
}

} // namespace

class CommandsTest : public ::testing::Test {
protected:
    CommandsTest() : dispatcher(rt, &backend) {}

    void SetUp() override {
        Logger::instance().set_quiet(true);
        Config config;
        ASSERT_TRUE(config.load_string("{\"sandbox\": {\"kdf_iterations\": 1000}, \"agents\": [\"coder\"]}"));
        ASSERT_TRUE(rt.init(config));
        register_core_commands(dispatcher);
    }

    void TearDown() override {
        Logger::instance().set_quiet(false);
    }

    Runtime rt;
    EchoBackend backend;
    CommandDispatcher dispatcher;
};

TEST_F(CommandsTest, HelpAndUnknown) {
    std::string help = dispatcher.dispatch("/help");
    EXPECT_TRUE(contains(help, "/sandbox"));
    EXPECT_TRUE(contains(help, "/approve"));
    EXPECT_TRUE(contains(dispatcher.dispatch("/nope"), "Unknown command"));
    EXPECT_EQ(dispatcher.dispatch("   "), "");
}

TEST_F(CommandsTest, PersonalityApprovalFlow) {
    std::string reply = dispatcher.dispatch("/personality warm and brief");
    ASSERT_TRUE(contains(reply, "Approval required:"));
    const std::string id = approval_id_of(reply);
    ASSERT_FALSE(id.empty());

    EXPECT_EQ(dispatcher.dispatch("/mode"), "Mode: approval-pending (1 pending)");
    EXPECT_TRUE(contains(dispatcher.dispatch("/pending"), id));
    EXPECT_TRUE(contains(dispatcher.dispatch("/sandbox enter"), "Transition rejected:"));

    EXPECT_TRUE(contains(dispatcher.dispatch("/approve " + id), "Approved."));
    EXPECT_EQ(dispatcher.dispatch("/mode"), "Mode: normal");
    EXPECT_TRUE(contains(dispatcher.dispatch("/approve " + id), "Not applied:"));
}

TEST_F(CommandsTest, RejectDiscards) {
    const std::string id = approval_id_of(dispatcher.dispatch("/settings verbose"));
    ASSERT_FALSE(id.empty());
    EXPECT_EQ(dispatcher.dispatch("/reject " + id), "Rejected.");
    EXPECT_TRUE(contains(dispatcher.dispatch("/reject " + id), "Error:"));
    EXPECT_EQ(dispatcher.dispatch("/pending"), "No pending approvals.");
}

TEST_F(CommandsTest, SandboxSessionWithJournal) {
    EXPECT_TRUE(contains(dispatcher.dispatch("/journal list"), "Error:"));
    EXPECT_TRUE(contains(dispatcher.dispatch("/sandbox enter --elevated"), "Sandbox entered"));
    EXPECT_EQ(dispatcher.dispatch("/mode"), "Mode: sandbox");

    EXPECT_TRUE(contains(dispatcher.dispatch("/journal add --root first thoughts"), "recorded"));
    EXPECT_TRUE(contains(dispatcher.dispatch("/journal list"), "root"));
    EXPECT_EQ(dispatcher.dispatch("/personality playful"), "staged");

    std::string exit = dispatcher.dispatch("/sandbox exit");
    ASSERT_TRUE(contains(exit, "1 edit(s) need confirmation"));
    const std::string id = approval_id_of(exit);
    EXPECT_TRUE(contains(dispatcher.dispatch("/approve " + id), "Approved."));
    EXPECT_TRUE(contains(dispatcher.dispatch("/journal list"), "Error:"));
}

TEST_F(CommandsTest, AuditHidesSandboxActivity) {
    dispatcher.dispatch("/remember the sky is blue");
    const std::string before = dispatcher.dispatch("/audit 100");
    ASSERT_TRUE(contains(before, "memory_append -> allow"));

    dispatcher.dispatch("/sandbox enter");
    dispatcher.dispatch("/remember hidden");
    dispatcher.dispatch("/sandbox exit");
    EXPECT_EQ(dispatcher.dispatch("/audit 100"), before);
}

TEST_F(CommandsTest, ChatUsesBackend) {
    dispatcher.dispatch("/remember launch is friday");
    EXPECT_EQ(dispatcher.dispatch("when is launch?"), "echo: when is launch? (2 snippets)");

    CommandDispatcher offline(rt, nullptr);
    EXPECT_EQ(offline.dispatch("hello"), "No inference backend configured.");
}

TEST_F(CommandsTest, ActorsAndGrants) {
    EXPECT_TRUE(contains(dispatcher.dispatch("/subchat open sc1"), "opened under primus"));
    EXPECT_TRUE(contains(dispatcher.dispatch("/actors"), "sc1  subchat  parent=primus"));
    EXPECT_TRUE(contains(dispatcher.dispatch("/partitions"), "sc1/subchat"));
    EXPECT_TRUE(contains(dispatcher.dispatch("/grants sc1"), "\"kind\": \"subchat\""));
    EXPECT_TRUE(contains(dispatcher.dispatch("/grant sc1 coder/agent-private"), "Granted"));
    EXPECT_TRUE(contains(dispatcher.dispatch("/grants sc1"), "coder/agent-private"));
    EXPECT_TRUE(contains(dispatcher.dispatch("/revoke sc1 coder/agent-private"), "Revoked"));
    EXPECT_TRUE(contains(dispatcher.dispatch("/revoke sc1 coder/agent-private"), "Error:"));
    EXPECT_TRUE(contains(dispatcher.dispatch("/grant sc1 sandbox/sandbox-private"), "Error:"));
    EXPECT_TRUE(contains(dispatcher.dispatch("/grant sc1 bogus"), "Usage:"));
    EXPECT_TRUE(contains(dispatcher.dispatch("/subchat close sc1"), "closed"));
    EXPECT_TRUE(contains(dispatcher.dispatch("/agent close primus"), "Error:"));
    EXPECT_TRUE(contains(dispatcher.dispatch("/agent add writer"), "registered"));
}

TEST_F(CommandsTest, PrivateSubChatAndTimedGrant) {
    EXPECT_TRUE(contains(dispatcher.dispatch("/subchat open diary primus --private abc"), "Error:"));
    EXPECT_TRUE(contains(dispatcher.dispatch("/subchat open diary primus --private secret1"),
                         "Private subchat diary opened under primus."));
    EXPECT_TRUE(contains(dispatcher.dispatch("/grants diary"), "\"private\": true"));

    EXPECT_TRUE(contains(dispatcher.dispatch("/grant primus diary/subchat"), "passphrase rejected"));
    EXPECT_TRUE(contains(dispatcher.dispatch("/grant primus diary/subchat --ttl soon"), "Usage:"));
    EXPECT_TRUE(contains(dispatcher.dispatch("/grant primus diary/subchat --passphrase secret1 --ttl 60"),
                         "Granted primus read access to diary/subchat for 60s."));
    EXPECT_TRUE(contains(dispatcher.dispatch("/grants primus"), "diary/subchat"));
}
