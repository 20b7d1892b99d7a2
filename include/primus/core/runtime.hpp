/*
 * Primus C++ - Runtime
 *
 * Owns the policy core and wires it together:
 *
 *   InteractionGuard -> PermissionEnforcer -> CapabilityRegistry
 *          |                    |
 *          |               ActorRegistry / CollaborationTable
 *          v
 *   ModeController, AuditLog, PartitionStore (+ MemoryStore, Cipher)
 *
 * Front ends and agent runtimes talk to this class only.
 */
#ifndef primus_CORE_RUNTIME_HPP
#define primus_CORE_RUNTIME_HPP

#include <primus/core/types.hpp>
#include <primus/core/config.hpp>
#include <primus/core/actor_registry.hpp>
#include <primus/core/collaboration.hpp>
#include <primus/core/mode_controller.hpp>
#include <primus/core/audit_log.hpp>
#include <primus/core/enforcer.hpp>
#include <primus/core/interaction_guard.hpp>
#include <primus/core/agent_comm_guard.hpp>
#include <primus/core/inference.hpp>
#include <primus/memory/store.hpp>
#include <primus/memory/partition_store.hpp>
#include <primus/sandbox/journal.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace primus {

class Runtime {
public:
    Runtime();
    ~Runtime();

    // Opens persistence, registers Primus and the configured agents and
    // applies policy. False with last_error() on failure.
    bool init(const Config& config);
    void shutdown();

    const std::string& primus_id() const { return primus_id_; }

    // ---- Actors ----
    bool register_agent(const std::string& id);
    // A non-empty passphrase makes the SubChat private: other actors read it
    // only through a grant unlocked with that passphrase.
    bool open_subchat(const std::string& id, const std::string& parent_id,
                      const std::string& passphrase = "");

    // Discards pending approvals, tokens and collaboration membership
    bool close_actor(const std::string& id);

    // ---- Policy entry points ----
    Decision authorize(const Action& action);
    ActionResult submit(const Action& action);
    Mode current_mode() const;
    std::vector<AuditRecord> audit_tail(size_t n) const;

    // ---- Approvals ----
    std::vector<PendingApproval> pending_approvals() const;
    // Replays the action through the guard as accepted by the user
    ActionResult approve(const std::string& approval_id);
    // Discards the action
    bool reject(const std::string& approval_id);

    // ---- Sandbox ----
    TransitionResult enter_sandbox(const std::string& passphrase, bool elevated_writes);
    TransitionResult exit_sandbox(std::vector<std::string>& staged_approval_ids);
    bool set_sandbox_passphrase(const std::string& current, const std::string& next);
    bool sandbox_locked() const;

    // ---- User-issued read grants ----
    // `ttl_ms` > 0 makes the grant temporary. Grants on a private SubChat
    // need its passphrase.
    bool grant_read(const std::string& grantee, const PartitionId& partition,
                    int64_t ttl_ms = 0, const std::string& passphrase = "");
    bool revoke_read(const std::string& grantee, const PartitionId& partition);

    // ---- Inference ----
    ActionResult chat_turn(const std::string& actor_id, const std::string& prompt,
                           const std::vector<PartitionId>& partitions, InferenceBackend& backend);

    Json permission_report(const std::string& actor_id) const;

    ActorRegistry& actors() { return actors_; }
    AgentCommunicationGuard& agents() { return comm_; }
    SandboxJournal& journal() { return journal_; }
    ModeController& modes() { return modes_; }
    AuditLog& audit() { return audit_; }
    PartitionStore& store() { return store_; }
    InteractionGuard& guard() { return guard_; }
    TokenAuthority& tokens() { return tokens_; }

    std::string last_error() const { return last_error_; }

private:
    Runtime(const Runtime&);
    Runtime& operator=(const Runtime&);

    static constexpr size_t MIN_SUBCHAT_PASSPHRASE = 6;

    bool setup_actor(const std::string& id);
    std::shared_ptr<SandboxVault> subchat_lock(const std::string& id) const;
    void load_blocked_agents(const Json& blocked);
    bool quiet() const { return modes_.audit_suppressed(); }

    Config config_;
    std::string primus_id_;
    std::string last_error_;

    MemoryStore db_;
    ActorRegistry actors_;
    CollaborationTable collaborations_;
    ModeController modes_;
    AuditLog audit_;
    TokenAuthority tokens_;
    PartitionStore store_;
    PermissionEnforcer enforcer_;
    InteractionGuard guard_;
    AgentCommunicationGuard comm_;
    SandboxJournal journal_;
    std::unique_ptr<SandboxVault> vault_;
    int kdf_iterations_;
    mutable std::mutex locks_mutex_;
    std::map<std::string, std::shared_ptr<SandboxVault> > subchat_locks_;   // private SubChats
    std::shared_ptr<Cipher> session_cipher_;
    Redactor redactor_;
};

} // namespace primus

#endif // primus_CORE_RUNTIME_HPP
