/*
 * Primus C++ - Runtime Implementation
 */
#include <primus/core/runtime.hpp>
#include <primus/core/capability_registry.hpp>
#include <primus/core/logger.hpp>
#include <primus/core/utils.hpp>
#include <map>
#include <set>

namespace primus {

Runtime::Runtime()
    : store_(tokens_)
    , enforcer_(actors_, collaborations_)
    , guard_(actors_, enforcer_, modes_, audit_, store_, tokens_)
    , comm_(guard_, collaborations_, store_)
    , journal_(modes_)
    , vault_(new SandboxVault())
    , kdf_iterations_(SandboxVault::DEFAULT_ITERATIONS) {
    audit_.bind(modes_);
    comm_.install();

    modes_.add_listener([](Mode from, Mode to) {
        LOG_INFO("[Mode] %s -> %s", to_string(from), to_string(to));
    });
}

Runtime::~Runtime() {
    shutdown();
}

bool Runtime::init(const Config& config) {
    config_ = config;
    primus_id_ = config_.get_string("primus.id", "primus");

    const std::string db_path = config_.get_string("memory.db_path", "");
    if (!db_path.empty()) {
        if (!db_.open(db_path)) {
            last_error_ = "cannot open memory database: " + db_.last_error();
            return false;
        }
        store_.attach_backend(&db_);
        if (config_.get_bool("audit.persist", true)) {
            int64_t limit = config_.get_int("audit.memory_limit", 1000);
            audit_.attach_store(&db_, limit > 0 ? static_cast<size_t>(limit) : 1);
        }
    }

    kdf_iterations_ = static_cast<int>(config_.get_int("sandbox.kdf_iterations", SandboxVault::DEFAULT_ITERATIONS));
    vault_.reset(new SandboxVault(kdf_iterations_));
    if (db_.is_open()) {
        vault_->attach_store(&db_);
    }
    journal_.set_path(config_.get_string("sandbox.journal_path", ""));

    // Without a vault passphrase the journal lives for this process only
    session_cipher_ = std::make_shared<AesGcmCipher>(random_bytes(AesGcmCipher::KEY_SIZE));

    redactor_.add_default_rules();
    redactor_.load(config_.get_json("redaction.patterns"));

    load_blocked_agents(config_.get_json("policy.blocked_agents"));

    if (!actors_.register_primus(primus_id_)) {
        last_error_ = actors_.last_error();
        return false;
    }
    if (!setup_actor(primus_id_) || !setup_actor(ActorRegistry::SANDBOX_ACTOR_ID)) {
        return false;
    }

    Json agents = config_.get_json("agents");
    if (agents.is_array()) {
        for (size_t i = 0; i < agents.size(); ++i) {
            if (!agents[i].is_string()) continue;
            if (!register_agent(agents[i].get<std::string>())) {
                LOG_WARN("[Runtime] Skipping agent from config: %s", last_error_.c_str());
            }
        }
    }

    LOG_INFO("[Runtime] Initialized (primus='%s', persistence=%s)",
             primus_id_.c_str(), db_.is_open() ? "sqlite" : "memory");
    return true;
}

void Runtime::shutdown() {
    if (db_.is_open()) {
        db_.close();
    }
}

void Runtime::load_blocked_agents(const Json& blocked) {
    if (!blocked.is_object()) return;

    std::map<std::string, std::set<std::string> > pairs;
    for (Json::const_iterator it = blocked.begin(); it != blocked.end(); ++it) {
        const Json& peers = it.value();
        if (!peers.is_array()) continue;
        for (size_t i = 0; i < peers.size(); ++i) {
            if (peers[i].is_string()) {
                pairs[it.key()].insert(peers[i].get<std::string>());
            }
        }
    }
    collaborations_.set_blocked(pairs);
}

bool Runtime::setup_actor(const std::string& id) {
    Actor actor;
    if (!actors_.get(id, actor)) {
        last_error_ = "unknown actor: " + id;
        return false;
    }

    std::vector<PartitionId> owned = ActorRegistry::owned_partitions(actor);
    for (size_t i = 0; i < owned.size(); ++i) {
        store_.create(owned[i]);
    }

    Json grants = config_.get_json("policy.grants");
    if (grants.is_object() && grants.contains(id)) {
        CapabilityGrant narrowed = CapabilityRegistry::narrow_from_json(actor.runtime_grant(), grants[id]);
        actors_.narrow_grant(id, narrowed);
        LOG_DEBUG("[Runtime] Narrowed grant for '%s'", id.c_str());
    }
    return true;
}

// ============================================================================
// Actors
// ============================================================================

bool Runtime::register_agent(const std::string& id) {
    if (!actors_.register_agent(id)) {
        last_error_ = actors_.last_error();
        return false;
    }
    return setup_actor(id);
}

bool Runtime::open_subchat(const std::string& id, const std::string& parent_id,
                           const std::string& passphrase) {
    std::shared_ptr<SandboxVault> lock;
    if (!passphrase.empty()) {
        if (passphrase.size() < MIN_SUBCHAT_PASSPHRASE) {
            last_error_ = "private subchat passphrase needs at least 6 characters";
            return false;
        }
        lock = std::make_shared<SandboxVault>(kdf_iterations_);
        if (!lock->set_passphrase("", passphrase)) {
            last_error_ = lock->last_error();
            return false;
        }
    }

    if (!actors_.open_subchat(id, parent_id, static_cast<bool>(lock))) {
        last_error_ = actors_.last_error();
        return false;
    }
    if (lock) {
        std::lock_guard<std::mutex> guard(locks_mutex_);
        subchat_locks_[id] = lock;
    }
    return setup_actor(id);
}

std::shared_ptr<SandboxVault> Runtime::subchat_lock(const std::string& id) const {
    std::lock_guard<std::mutex> guard(locks_mutex_);
    std::map<std::string, std::shared_ptr<SandboxVault> >::const_iterator it = subchat_locks_.find(id);
    if (it == subchat_locks_.end()) return std::shared_ptr<SandboxVault>();
    return it->second;
}

bool Runtime::close_actor(const std::string& id) {
    Actor actor;
    if (!actors_.get(id, actor)) {
        last_error_ = "unknown actor: " + id;
        return false;
    }
    if (actor.is_kind(ActorKind::PRIMUS) || actor.is_kind(ActorKind::SANDBOX)) {
        last_error_ = std::string("cannot close ") + to_string(actor.kind());
        return false;
    }

    size_t cancelled = modes_.cancel_for_actor(id);
    comm_.forget_agent(id);
    guard_.forget_actor(id);
    if (!actors_.remove(id)) {
        last_error_ = actors_.last_error();
        return false;
    }
    {
        std::lock_guard<std::mutex> guard(locks_mutex_);
        subchat_locks_.erase(id);
    }
    if (!quiet()) {
        LOG_INFO("[Runtime] Closed %s '%s' (%zu pending approvals discarded)",
                 to_string(actor.kind()), id.c_str(), cancelled);
    }
    return true;
}

// ============================================================================
// Policy entry points
// ============================================================================

Decision Runtime::authorize(const Action& action) {
    return guard_.authorize(action);
}

ActionResult Runtime::submit(const Action& action) {
    return guard_.submit(action);
}

Mode Runtime::current_mode() const {
    return modes_.current_mode();
}

std::vector<AuditRecord> Runtime::audit_tail(size_t n) const {
    return audit_.tail(n);
}

// ============================================================================
// Approvals
// ============================================================================

std::vector<PendingApproval> Runtime::pending_approvals() const {
    return modes_.pending();
}

ActionResult Runtime::approve(const std::string& approval_id) {
    PendingApproval pending;
    ActionResult result = guard_.replay_approved(approval_id, pending);
    if (pending.id.empty()) {
        return result;
    }

    const Action& action = pending.action;
    if (!quiet()) {
        LOG_INFO("[Runtime] Approval %s for %s %s: %s", approval_id.c_str(), action.actor_id.c_str(),
                 to_string(action.kind), result.ok ? "applied" : result.error.c_str());
    }
    return result;
}

bool Runtime::reject(const std::string& approval_id) {
    PendingApproval pending;
    TransitionResult t = modes_.resolve(approval_id, pending);
    if (!t.ok()) {
        last_error_ = t.reason;
        return false;
    }
    if (!quiet()) {
        LOG_INFO("[Runtime] Approval %s rejected; %s %s discarded", approval_id.c_str(),
                 pending.action.actor_id.c_str(), to_string(pending.action.kind));
    }
    return true;
}

// ============================================================================
// Sandbox
// ============================================================================

TransitionResult Runtime::enter_sandbox(const std::string& passphrase, bool elevated_writes) {
    std::shared_ptr<Cipher> cipher = session_cipher_;
    const bool vaulted = vault_->has_passphrase();
    if (vaulted) {
        // Derived before taking the transition lock
        cipher = vault_->derive_cipher(passphrase);
        if (!cipher) {
            return TransitionResult(TransitionStatus::REJECTED, vault_->last_error());
        }
    }

    TransitionResult t = modes_.enter_sandbox(elevated_writes);
    if (!t.ok()) {
        LOG_WARN("[Runtime] Sandbox entry rejected: %s", t.reason.c_str());
        return t;
    }

    journal_.set_cipher(cipher);
    if (vaulted) {
        store_.set_sealing_cipher(cipher);
    }
    return t;
}

TransitionResult Runtime::exit_sandbox(std::vector<std::string>& staged_approval_ids) {
    TransitionResult t = modes_.exit_sandbox(primus_id_, staged_approval_ids);
    if (!t.ok()) return t;

    journal_.set_cipher(std::shared_ptr<Cipher>());
    if (!staged_approval_ids.empty()) {
        LOG_INFO("[Runtime] %zu sandbox edits held for confirmation", staged_approval_ids.size());
    }
    return t;
}

bool Runtime::set_sandbox_passphrase(const std::string& current, const std::string& next) {
    if (!vault_->set_passphrase(current, next)) {
        last_error_ = vault_->last_error();
        return false;
    }
    return true;
}

bool Runtime::sandbox_locked() const {
    return vault_->has_passphrase();
}

// ============================================================================
// Read grants
// ============================================================================

bool Runtime::grant_read(const std::string& grantee, const PartitionId& partition,
                         int64_t ttl_ms, const std::string& passphrase) {
    if (partition.klass == PartitionClass::SANDBOX_PRIVATE) {
        last_error_ = "sandbox-private partitions cannot be granted";
        return false;
    }
    if (!store_.exists(partition)) {
        last_error_ = "unknown partition: " + partition.to_string();
        return false;
    }
    if (partition.klass == PartitionClass::SUBCHAT) {
        std::shared_ptr<SandboxVault> lock = subchat_lock(partition.owner);
        if (lock && !lock->verify(passphrase)) {
            last_error_ = partition.owner + " is private; passphrase rejected";
            return false;
        }
    }

    const int64_t expires_at = ttl_ms > 0 ? current_timestamp_ms() + ttl_ms : 0;
    if (!actors_.grant_read(grantee, partition, expires_at)) {
        last_error_ = actors_.last_error();
        return false;
    }

    AuditRecord r;
    r.actor_id = grantee;
    r.action = ActionKind::GRANT_READ;
    r.decision = DecisionKind::ALLOW;
    r.reason = "user granted read of " + partition.to_string();
    if (expires_at > 0) {
        r.reason += " until " + format_timestamp(expires_at / 1000);
    }
    r.mode = modes_.current_mode();
    audit_.append(r);
    return true;
}

bool Runtime::revoke_read(const std::string& grantee, const PartitionId& partition) {
    if (!actors_.revoke_read(grantee, partition)) {
        last_error_ = actors_.last_error();
        return false;
    }
    return true;
}

// ============================================================================
// Inference
// ============================================================================

ActionResult Runtime::chat_turn(const std::string& actor_id, const std::string& prompt,
                                const std::vector<PartitionId>& partitions, InferenceBackend& backend) {
    Decision turn = guard_.authorize(Action::simple(actor_id, ActionKind::CHAT_TURN));
    if (!turn.allowed()) {
        return ActionResult::from(turn);
    }

    // A remote backend is an internet call like any other
    const bool remote = !backend.is_local();
    if (remote) {
        Decision net = guard_.authorize(Action::simple(actor_id, ActionKind::INTERNET_CALL, backend.backend_id()));
        if (!net.allowed()) {
            return ActionResult::from(net);
        }
    }

    ContextBundle bundle;
    for (size_t i = 0; i < partitions.size(); ++i) {
        ActionResult r = guard_.submit(Action::on_partition(actor_id, ActionKind::MEMORY_READ, partitions[i]));
        if (r.ok) {
            ContextSnippet snippet;
            snippet.partition = partitions[i];
            snippet.text = r.data;
            bundle.snippets.push_back(snippet);
        } else {
            bundle.withheld.push_back(partitions[i]);
        }
    }
    if (remote) {
        redactor_.apply(bundle);
    }

    std::string reply;
    if (!backend.complete(prompt, bundle, reply)) {
        return ActionResult::failed(turn, "inference failed on " + backend.backend_id());
    }

    Actor actor;
    if (actors_.get(actor_id, actor) && actor.is_kind(ActorKind::SUBCHAT)) {
        ActionResult history = guard_.submit(Action::on_partition(
            actor_id, ActionKind::MEMORY_APPEND, PartitionId(actor_id, PartitionClass::SUBCHAT),
            "user: " + prompt + "\nassistant: " + reply + "\n"));
        if (!history.ok && !quiet()) {
            LOG_WARN("[Runtime] Session history not recorded for '%s': %s",
                     actor_id.c_str(), history.error.c_str());
        }
    }
    return ActionResult::from(turn, reply);
}

// ============================================================================
// Reporting
// ============================================================================

Json Runtime::permission_report(const std::string& actor_id) const {
    Json report;
    Actor actor;
    if (!actors_.get(actor_id, actor)) {
        report["error"] = "unknown actor: " + actor_id;
        return report;
    }

    const Mode mode = modes_.current_mode();
    report["actor"] = actor.id();
    report["kind"] = to_string(actor.kind());
    report["parent"] = actor.parent_id();
    report["personality_ref"] = actor.personality_ref();
    report["private"] = actor.is_private();
    report["mode"] = to_string(mode);
    report["grant"] = CapabilityRegistry::to_json(enforcer_.effective_grant(actor, mode));

    Json reads = Json::array();
    std::vector<PartitionId> granted = actors_.read_grants(actor_id);
    for (size_t i = 0; i < granted.size(); ++i) {
        reads.push_back(granted[i].to_string());
    }
    report["read_grants"] = reads;

    Json blocked = Json::array();
    std::vector<std::string> peers = collaborations_.blocked_for(actor_id);
    for (size_t i = 0; i < peers.size(); ++i) {
        blocked.push_back(peers[i]);
    }
    report["blocked_agents"] = blocked;

    CollaborationGroup group;
    if (collaborations_.group_of(actor_id, group)) {
        report["collaboration"] = {{"id", group.id}, {"members", group.members}};
    } else {
        report["collaboration"] = nullptr;
    }

    Json pending = Json::array();
    std::vector<PendingApproval> all = modes_.pending();
    for (size_t i = 0; i < all.size(); ++i) {
        if (all[i].action.actor_id != actor_id) continue;
        pending.push_back({{"id", all[i].id},
                           {"kind", to_string(all[i].action.kind)},
                           {"origin", to_string(all[i].origin)}});
    }
    report["pending"] = pending;
    return report;
}

} // namespace primus
