#include <gtest/gtest.h>
#include <primus/core/mode_controller.hpp>
#include <primus/core/audit_log.hpp>
#include <atomic>
#include <thread>
#include <utility>
#include <vector>

using namespace primus;

class ModeControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        modes.add_listener([this](Mode from, Mode to) {
            transitions.push_back(std::make_pair(from, to));
        });
    }

    // Every observed edge must be Normal<->ApprovalPending or Normal<->Sandbox
    void expect_valid_graph() const {
        for (size_t i = 0; i < transitions.size(); ++i) {
            const Mode from = transitions[i].first;
            const Mode to = transitions[i].second;
            EXPECT_TRUE(from == Mode::NORMAL || to == Mode::NORMAL)
                << to_string(from) << " -> " << to_string(to);
            EXPECT_NE(from, to);
        }
    }

    Action personality_edit(const std::string& actor) {
        return Action::on_partition(actor, ActionKind::PERSONALITY_WRITE,
                                    PartitionId("primus", PartitionClass::PERSONALITY), "x");
    }

    ModeController modes;
    std::vector<std::pair<Mode, Mode> > transitions;
};

TEST_F(ModeControllerTest, ApprovalRoundTrip) {
    std::string id;
    ASSERT_TRUE(modes.request_approval(personality_edit("primus"), Mode::NORMAL, "confirm", id).ok());
    EXPECT_EQ(modes.current_mode(), Mode::APPROVAL_PENDING);
    EXPECT_TRUE(modes.has_pending("primus", ActionKind::PERSONALITY_WRITE));

    PendingApproval p;
    ASSERT_TRUE(modes.resolve(id, p).ok());
    EXPECT_EQ(p.action.actor_id, "primus");
    EXPECT_EQ(modes.current_mode(), Mode::NORMAL);
    EXPECT_FALSE(modes.resolve(id, p).ok());
    expect_valid_graph();
}

TEST_F(ModeControllerTest, StaleObservationIsReported) {
    std::string id;
    TransitionResult t = modes.request_approval(personality_edit("primus"), Mode::APPROVAL_PENDING, "x", id);
    EXPECT_EQ(t.status, TransitionStatus::STALE);
    EXPECT_EQ(modes.pending_count(), 0u);
}

TEST_F(ModeControllerTest, SandboxEntryRejectedWhilePending) {
    std::string id;
    ASSERT_TRUE(modes.request_approval(personality_edit("primus"), Mode::NORMAL, "x", id).ok());

    TransitionResult t = modes.enter_sandbox(false);
    EXPECT_EQ(t.status, TransitionStatus::REJECTED);
    EXPECT_EQ(modes.current_mode(), Mode::APPROVAL_PENDING);
    expect_valid_graph();
}

TEST_F(ModeControllerTest, NoApprovalInsideSandbox) {
    ASSERT_TRUE(modes.enter_sandbox(false).ok());
    EXPECT_TRUE(modes.audit_suppressed());

    std::string id;
    EXPECT_EQ(modes.request_approval(personality_edit("primus"), Mode::SANDBOX, "x", id).status,
              TransitionStatus::REJECTED);
    EXPECT_EQ(modes.current_mode(), Mode::SANDBOX);
    EXPECT_EQ(modes.enter_sandbox(false).status, TransitionStatus::REJECTED);
}

TEST_F(ModeControllerTest, StagedEditsBecomePendingOnExit) {
    ASSERT_TRUE(modes.enter_sandbox(true).ok());
    EXPECT_TRUE(modes.sandbox_elevated());
    ASSERT_TRUE(modes.stage_sandbox_edit(personality_edit("sandbox")));
    ASSERT_EQ(modes.staged_edits().size(), 1u);
    EXPECT_EQ(modes.staged_edits()[0].actor_id, "sandbox");

    std::vector<std::string> ids;
    ASSERT_TRUE(modes.exit_sandbox("primus", ids).ok());
    ASSERT_EQ(ids.size(), 1u);
    EXPECT_TRUE(modes.staged_edits().empty());
    EXPECT_EQ(modes.current_mode(), Mode::APPROVAL_PENDING);
    EXPECT_FALSE(modes.sandbox_elevated());

    std::vector<PendingApproval> pending = modes.pending();
    ASSERT_EQ(pending.size(), 1u);
    EXPECT_EQ(pending[0].action.actor_id, "primus");
    EXPECT_EQ(pending[0].origin, ApprovalOrigin::SANDBOX_EXIT);
    EXPECT_EQ(pending[0].action.kind, ActionKind::PERSONALITY_WRITE);

    // Passes through Normal, never Sandbox -> ApprovalPending
    ASSERT_EQ(transitions.size(), 3u);
    EXPECT_EQ(transitions[1], std::make_pair(Mode::SANDBOX, Mode::NORMAL));
    EXPECT_EQ(transitions[2], std::make_pair(Mode::NORMAL, Mode::APPROVAL_PENDING));
    expect_valid_graph();
}

TEST_F(ModeControllerTest, StagingOutsideSandboxFails) {
    EXPECT_FALSE(modes.stage_sandbox_edit(personality_edit("sandbox")));
    std::vector<std::string> ids;
    EXPECT_EQ(modes.exit_sandbox("primus", ids).status, TransitionStatus::REJECTED);
}

TEST_F(ModeControllerTest, CancelForActorDiscardsWithoutApplying) {
    std::string a, b;
    ASSERT_TRUE(modes.request_approval(Action::simple("sc1", ActionKind::INTERNET_CALL), Mode::NORMAL, "x", a).ok());
    ASSERT_TRUE(modes.request_approval(Action::simple("coder", ActionKind::INTERNET_CALL),
                                       Mode::APPROVAL_PENDING, "x", b).ok());

    EXPECT_EQ(modes.cancel_for_actor("sc1"), 1u);
    EXPECT_EQ(modes.current_mode(), Mode::APPROVAL_PENDING);
    EXPECT_EQ(modes.cancel_for_actor("coder"), 1u);
    EXPECT_EQ(modes.current_mode(), Mode::NORMAL);
    expect_valid_graph();
}

TEST_F(ModeControllerTest, ConcurrentSandboxAndApprovalRequests) {
    std::atomic<int> approvals(0);
    std::atomic<int> entries(0);
    std::vector<std::thread> threads;

    for (int i = 0; i < 8; ++i) {
        threads.push_back(std::thread([this, i, &approvals, &entries]() {
            if (i % 2 == 0) {
                if (modes.enter_sandbox(false).ok()) ++entries;
            } else {
                std::string id;
                Mode observed = modes.current_mode();
                if (modes.request_approval(Action::simple("a" + std::to_string(i), ActionKind::INTERNET_CALL),
                                           observed, "x", id).ok()) {
                    ++approvals;
                }
            }
        }));
    }
    for (size_t i = 0; i < threads.size(); ++i) threads[i].join();

    // Either the sandbox won or approvals did, never both
    EXPECT_FALSE(entries.load() > 0 && approvals.load() > 0);
    EXPECT_LE(entries.load(), 1);
    expect_valid_graph();
}

TEST(AuditLogTest, SuppressedForWholeSandboxSession) {
    ModeController modes;
    AuditLog audit;
    audit.bind(modes);

    AuditRecord r;
    r.actor_id = "primus";
    EXPECT_TRUE(audit.append(r));
    EXPECT_EQ(audit.size(), 1u);

    ASSERT_TRUE(modes.enter_sandbox(false).ok());
    EXPECT_TRUE(audit.suppressed());
    EXPECT_FALSE(audit.append(r));
    EXPECT_EQ(audit.size(), 1u);

    std::vector<std::string> ids;
    ASSERT_TRUE(modes.exit_sandbox("primus", ids).ok());
    EXPECT_FALSE(audit.suppressed());

    // Records stamped with sandbox mode are never accepted
    r.mode = Mode::SANDBOX;
    EXPECT_FALSE(audit.append(r));
    r.mode = Mode::NORMAL;
    EXPECT_TRUE(audit.append(r));

    std::vector<AuditRecord> tail = audit.tail(10);
    ASSERT_EQ(tail.size(), 2u);
    EXPECT_LT(tail[0].seq, tail[1].seq);
    EXPECT_EQ(audit.tail(1)[0].seq, tail[1].seq);
}
