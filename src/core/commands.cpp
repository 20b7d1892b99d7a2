/*
 * Primus C++ - Front-end Commands Implementation
 */
#include <primus/core/commands.hpp>
#include <primus/core/logger.hpp>
#include <primus/core/utils.hpp>
#include <cstdlib>
#include <sstream>

namespace primus {

namespace {

// First word and the remainder of a command's arguments
void split_first(const std::string& args, std::string& head, std::string& rest) {
    std::string s = trim(args);
    size_t pos = s.find(' ');
    if (pos == std::string::npos) {
        head = s;
        rest.clear();
    } else {
        head = s.substr(0, pos);
        rest = trim(s.substr(pos + 1));
    }
}

std::string format_approval(const PendingApproval& p) {
    std::ostringstream oss;
    oss << p.id << "  " << p.action.actor_id << "  " << to_string(p.action.kind)
        << "  (" << to_string(p.origin) << ") " << p.reason;
    return oss.str();
}

// Protected edit routed to the actor that may make it in the current mode
std::string protected_edit(CommandContext& ctx, ActionKind kind, PartitionClass klass, const std::string& text) {
    if (text.empty()) {
        return "Usage: " + std::string(kind == ActionKind::PERSONALITY_WRITE ? "/personality" : "/settings") + " <text>";
    }
    Runtime& rt = ctx.runtime;
    const std::string actor = rt.current_mode() == Mode::SANDBOX ? std::string(ActorRegistry::SANDBOX_ACTOR_ID)
                                                                 : rt.primus_id();
    Action action = Action::on_partition(actor, kind, PartitionId(rt.primus_id(), klass), text);
    return render_result(rt.submit(action));
}

} // anonymous namespace

// ============================================================================
// Rendering
// ============================================================================

std::string render_decision(const Decision& decision) {
    switch (decision.kind) {
        case DecisionKind::ALLOW:
            return "Allowed: " + decision.reason;
        case DecisionKind::DENY:
            return "Denied: " + decision.reason;
        case DecisionKind::REQUIRE_APPROVAL:
            return "Approval required: " + decision.reason +
                   "\n  /approve " + decision.approval_id + "  or  /reject " + decision.approval_id;
    }
    return "Denied: " + decision.reason;
}

std::string render_result(const ActionResult& result) {
    if (!result.decision.allowed()) {
        return render_decision(result.decision);
    }
    if (!result.ok) {
        return "Error: " + result.error;
    }
    if (!result.data.empty()) {
        return result.data;
    }
    return render_decision(result.decision);
}

// ============================================================================
// CommandDispatcher
// ============================================================================

CommandDispatcher::CommandDispatcher(Runtime& runtime, InferenceBackend* backend)
    : context_(runtime, backend) {}

void CommandDispatcher::register_commands(const std::vector<CommandDef>& cmds) {
    for (size_t i = 0; i < cmds.size(); ++i) {
        commands_[cmds[i].name] = cmds[i];
    }
}

std::string CommandDispatcher::dispatch(const std::string& line) {
    std::string text = trim(line);
    if (text.empty()) return "";

    if (text[0] != '/') {
        return commands::chat(context_, text);
    }

    std::string name, args;
    split_first(text, name, args);

    if (name == "/help") {
        std::ostringstream oss;
        oss << "Commands:\n";
        for (std::map<std::string, CommandDef>::const_iterator it = commands_.begin();
             it != commands_.end(); ++it) {
            oss << it->first << " - " << it->second.description << "\n";
        }
        oss << "\nAny other line is a chat turn.";
        return oss.str();
    }

    std::map<std::string, CommandDef>::const_iterator it = commands_.find(name);
    if (it == commands_.end()) {
        return "Unknown command: " + name + " (try /help)";
    }
    return it->second.handler(context_, args);
}

void register_core_commands(CommandDispatcher& dispatcher) {
    std::vector<CommandDef> cmds;
    cmds.push_back(CommandDef("/mode", "Show the current mode", commands::cmd_mode));
    cmds.push_back(CommandDef("/pending", "List pending approvals", commands::cmd_pending));
    cmds.push_back(CommandDef("/approve", "Approve a pending action: /approve <id>", commands::cmd_approve));
    cmds.push_back(CommandDef("/reject", "Reject a pending action: /reject <id>", commands::cmd_reject));
    cmds.push_back(CommandDef("/sandbox", "enter [passphrase] [--elevated] | exit | passphrase <new> [current]",
                              commands::cmd_sandbox));
    cmds.push_back(CommandDef("/audit", "Show the last audit records: /audit [n]", commands::cmd_audit));
    cmds.push_back(CommandDef("/actors", "List registered actors", commands::cmd_actors));
    cmds.push_back(CommandDef("/partitions", "List memory partitions", commands::cmd_partitions));
    cmds.push_back(CommandDef("/grants", "Permission report: /grants [actor]", commands::cmd_grants));
    cmds.push_back(CommandDef("/grant", "Grant a read: /grant <actor> <owner/class> [--ttl <s>] [--passphrase <p>]",
                              commands::cmd_grant));
    cmds.push_back(CommandDef("/revoke", "Revoke a read: /revoke <actor> <owner/class>", commands::cmd_revoke));
    cmds.push_back(CommandDef("/journal", "add [--root] <text> | list [n] | read <id> | clear", commands::cmd_journal));
    cmds.push_back(CommandDef("/personality", "Edit the Primus personality", commands::cmd_personality));
    cmds.push_back(CommandDef("/settings", "Edit the Primus system settings", commands::cmd_settings));
    cmds.push_back(CommandDef("/remember", "Append a note to global memory", commands::cmd_remember));
    cmds.push_back(CommandDef("/agent", "add <id> | close <id>", commands::cmd_agent));
    cmds.push_back(CommandDef("/subchat", "open <id> [parent] [--private <passphrase>] | close <id>",
                              commands::cmd_subchat));

    dispatcher.register_commands(cmds);
    LOG_DEBUG("Core commands registered: %zu", cmds.size());
}

// ============================================================================
// Command Implementations
// ============================================================================

namespace commands {

std::string cmd_mode(CommandContext& ctx, const std::string& /*args*/) {
    std::string out = std::string("Mode: ") + to_string(ctx.runtime.current_mode());
    size_t pending = ctx.runtime.pending_approvals().size();
    if (pending > 0) {
        out += " (" + std::to_string(pending) + " pending)";
    }
    return out;
}

std::string cmd_pending(CommandContext& ctx, const std::string& /*args*/) {
    std::vector<PendingApproval> pending = ctx.runtime.pending_approvals();
    if (pending.empty()) return "No pending approvals.";

    std::ostringstream oss;
    oss << "Pending approvals:\n";
    for (size_t i = 0; i < pending.size(); ++i) {
        oss << "  " << format_approval(pending[i]) << "\n";
    }
    return oss.str();
}

std::string cmd_approve(CommandContext& ctx, const std::string& args) {
    std::string id = trim(args);
    if (id.empty()) return "Usage: /approve <id>";
    ActionResult r = ctx.runtime.approve(id);
    return r.ok ? "Approved. " + render_result(r) : "Not applied: " + r.error;
}

std::string cmd_reject(CommandContext& ctx, const std::string& args) {
    std::string id = trim(args);
    if (id.empty()) return "Usage: /reject <id>";
    if (!ctx.runtime.reject(id)) return "Error: " + ctx.runtime.last_error();
    return "Rejected.";
}

std::string cmd_sandbox(CommandContext& ctx, const std::string& args) {
    std::vector<std::string> words = split_words(args);
    if (words.empty()) return "Usage: /sandbox enter [passphrase] [--elevated] | exit | passphrase <new> [current]";

    if (words[0] == "enter") {
        std::string passphrase;
        bool elevated = false;
        for (size_t i = 1; i < words.size(); ++i) {
            if (words[i] == "--elevated") elevated = true;
            else passphrase = words[i];
        }
        TransitionResult t = ctx.runtime.enter_sandbox(passphrase, elevated);
        if (!t.ok()) return std::string("Transition rejected: ") + t.reason;
        return elevated ? "Sandbox entered (offline, unlogged, elevated writes confirmed)."
                        : "Sandbox entered (offline, unlogged).";
    }

    if (words[0] == "exit") {
        std::vector<std::string> staged;
        TransitionResult t = ctx.runtime.exit_sandbox(staged);
        if (!t.ok()) return std::string("Transition rejected: ") + t.reason;
        if (staged.empty()) return "Sandbox exited.";
        std::ostringstream oss;
        oss << "Sandbox exited. " << staged.size() << " edit(s) need confirmation:\n";
        for (size_t i = 0; i < staged.size(); ++i) {
            oss << "  /approve " << staged[i] << "\n";
        }
        return oss.str();
    }

    if (words[0] == "passphrase") {
        if (words.size() < 2) return "Usage: /sandbox passphrase <new> [current]";
        std::string current = words.size() > 2 ? words[2] : "";
        if (!ctx.runtime.set_sandbox_passphrase(current, words[1])) {
            return "Error: " + ctx.runtime.last_error();
        }
        return "Sandbox passphrase set.";
    }

    return "Unknown sandbox command: " + words[0];
}

std::string cmd_audit(CommandContext& ctx, const std::string& args) {
    size_t n = 20;
    std::string a = trim(args);
    if (!a.empty()) {
        long v = std::strtol(a.c_str(), nullptr, 10);
        if (v > 0) n = static_cast<size_t>(v);
    }

    std::vector<AuditRecord> records = ctx.runtime.audit_tail(n);
    if (records.empty()) return "Audit log is empty.";

    std::ostringstream oss;
    for (size_t i = 0; i < records.size(); ++i) {
        const AuditRecord& r = records[i];
        oss << "#" << r.seq << " " << format_timestamp(r.timestamp / 1000) << " "
            << r.actor_id << " " << to_string(r.action) << " -> " << to_string(r.decision)
            << " [" << to_string(r.mode) << "] " << r.reason << "\n";
    }
    return oss.str();
}

std::string cmd_actors(CommandContext& ctx, const std::string& /*args*/) {
    std::vector<Actor> actors = ctx.runtime.actors().list();
    std::ostringstream oss;
    for (size_t i = 0; i < actors.size(); ++i) {
        oss << actors[i].id() << "  " << to_string(actors[i].kind());
        if (!actors[i].parent_id().empty()) oss << "  parent=" << actors[i].parent_id();
        oss << "\n";
    }
    return oss.str();
}

std::string cmd_partitions(CommandContext& ctx, const std::string& /*args*/) {
    std::vector<PartitionId> ids = ctx.runtime.store().list();
    std::ostringstream oss;
    for (size_t i = 0; i < ids.size(); ++i) {
        oss << ids[i].to_string() << "\n";
    }
    return oss.str();
}

std::string cmd_grants(CommandContext& ctx, const std::string& args) {
    std::string actor = trim(args);
    if (actor.empty()) actor = ctx.runtime.primus_id();
    return ctx.runtime.permission_report(actor).dump(2);
}

std::string cmd_grant(CommandContext& ctx, const std::string& args) {
    const std::string usage = "Usage: /grant <actor> <owner/class> [--ttl <seconds>] [--passphrase <p>]";
    std::vector<std::string> words = split_words(args);
    PartitionId partition;
    if (words.size() < 2 || !parse_partition_id(words[1], partition)) {
        return usage;
    }

    int64_t ttl_seconds = 0;
    std::string passphrase;
    for (size_t i = 2; i < words.size(); i += 2) {
        if (i + 1 >= words.size()) return usage;
        if (words[i] == "--ttl") {
            char* end = nullptr;
            ttl_seconds = std::strtoll(words[i + 1].c_str(), &end, 10);
            if (*end != '\0' || ttl_seconds <= 0) return usage;
        } else if (words[i] == "--passphrase") {
            passphrase = words[i + 1];
        } else {
            return usage;
        }
    }

    if (!ctx.runtime.grant_read(words[0], partition, ttl_seconds * 1000, passphrase)) {
        return "Error: " + ctx.runtime.last_error();
    }
    std::string reply = "Granted " + words[0] + " read access to " + partition.to_string();
    if (ttl_seconds > 0) reply += " for " + std::to_string(ttl_seconds) + "s";
    return reply + ".";
}

std::string cmd_revoke(CommandContext& ctx, const std::string& args) {
    std::vector<std::string> words = split_words(args);
    PartitionId partition;
    if (words.size() != 2 || !parse_partition_id(words[1], partition)) {
        return "Usage: /revoke <actor> <owner/class>";
    }
    if (!ctx.runtime.revoke_read(words[0], partition)) {
        return "Error: " + ctx.runtime.last_error();
    }
    return "Revoked " + words[0] + " read access to " + partition.to_string() + ".";
}

std::string cmd_journal(CommandContext& ctx, const std::string& args) {
    std::string sub, rest;
    split_first(args, sub, rest);
    SandboxJournal& journal = ctx.runtime.journal();

    if (sub == "add") {
        std::string mode = "user";
        if (starts_with(rest, "--root")) {
            mode = "root";
            rest = trim(rest.substr(6));
        }
        if (rest.empty()) return "Usage: /journal add [--root] <text>";
        JournalEntry entry;
        if (!journal.add_entry(rest, mode, entry)) return "Error: " + journal.last_error();
        return "Entry " + entry.entry_id + " recorded.";
    }

    if (sub == "list") {
        size_t limit = 0;
        if (!rest.empty()) {
            long v = std::strtol(rest.c_str(), nullptr, 10);
            if (v > 0) limit = static_cast<size_t>(v);
        }
        std::vector<JournalEntry> entries;
        if (!journal.list_entries(limit, entries)) return "Error: " + journal.last_error();
        if (entries.empty()) return "Journal is empty.";
        std::ostringstream oss;
        for (size_t i = 0; i < entries.size(); ++i) {
            oss << entries[i].entry_id << "  " << entries[i].timestamp << "  " << entries[i].mode << "\n";
        }
        return oss.str();
    }

    if (sub == "read") {
        JournalEntry entry;
        if (!journal.read_entry(rest, entry)) return "Error: " + journal.last_error();
        return entry.timestamp + " (" + entry.mode + ")\n" + entry.text;
    }

    if (sub == "clear") {
        if (!journal.clear()) return "Error: " + journal.last_error();
        return "Journal cleared.";
    }

    return "Usage: /journal add [--root] <text> | list [n] | read <id> | clear";
}

std::string cmd_personality(CommandContext& ctx, const std::string& args) {
    return protected_edit(ctx, ActionKind::PERSONALITY_WRITE, PartitionClass::PERSONALITY, trim(args));
}

std::string cmd_settings(CommandContext& ctx, const std::string& args) {
    return protected_edit(ctx, ActionKind::SETTINGS_WRITE, PartitionClass::SYSTEM, trim(args));
}

std::string cmd_remember(CommandContext& ctx, const std::string& args) {
    std::string text = trim(args);
    if (text.empty()) return "Usage: /remember <text>";
    Runtime& rt = ctx.runtime;
    return render_result(rt.submit(Action::on_partition(
        rt.primus_id(), ActionKind::MEMORY_APPEND, PartitionId(rt.primus_id(), PartitionClass::GLOBAL), text + "\n")));
}

std::string cmd_agent(CommandContext& ctx, const std::string& args) {
    std::vector<std::string> words = split_words(args);
    if (words.size() != 2) return "Usage: /agent add <id> | close <id>";

    if (words[0] == "add") {
        if (!ctx.runtime.register_agent(words[1])) return "Error: " + ctx.runtime.last_error();
        return "Agent " + words[1] + " registered.";
    }
    if (words[0] == "close") {
        if (!ctx.runtime.close_actor(words[1])) return "Error: " + ctx.runtime.last_error();
        return "Agent " + words[1] + " closed.";
    }
    return "Usage: /agent add <id> | close <id>";
}

std::string cmd_subchat(CommandContext& ctx, const std::string& args) {
    const std::string usage = "Usage: /subchat open <id> [parent] [--private <passphrase>] | close <id>";
    std::vector<std::string> words = split_words(args);
    if (words.size() < 2) return usage;

    if (words[0] == "open") {
        std::string parent = ctx.runtime.primus_id();
        std::string passphrase;
        size_t i = 2;
        if (i < words.size() && words[i] != "--private") parent = words[i++];
        if (i < words.size()) {
            if (words[i] != "--private" || i + 2 != words.size()) return usage;
            passphrase = words[i + 1];
        }
        if (!ctx.runtime.open_subchat(words[1], parent, passphrase)) return "Error: " + ctx.runtime.last_error();
        return std::string(passphrase.empty() ? "SubChat " : "Private subchat ") + words[1] +
               " opened under " + parent + ".";
    }
    if (words[0] == "close") {
        if (!ctx.runtime.close_actor(words[1])) return "Error: " + ctx.runtime.last_error();
        return "SubChat " + words[1] + " closed.";
    }
    return usage;
}

std::string chat(CommandContext& ctx, const std::string& text) {
    if (!ctx.backend) {
        return "No inference backend configured.";
    }
    Runtime& rt = ctx.runtime;
    std::vector<PartitionId> context;
    context.push_back(PartitionId(rt.primus_id(), PartitionClass::PERSONALITY));
    context.push_back(PartitionId(rt.primus_id(), PartitionClass::GLOBAL));
    return render_result(rt.chat_turn(rt.primus_id(), text, context, *ctx.backend));
}

} // namespace commands

} // namespace primus
