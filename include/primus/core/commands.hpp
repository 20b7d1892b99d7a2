/*
 * Primus C++ - Front-end Commands
 *
 * Line-oriented adapter between a CLI and the runtime. Slash commands map
 * to runtime calls; any other line is a chat turn for Primus. Decisions are
 * rendered verbatim, including approval prompts.
 */
#ifndef primus_CORE_COMMANDS_HPP
#define primus_CORE_COMMANDS_HPP

#include <primus/core/types.hpp>
#include <primus/core/runtime.hpp>
#include <primus/core/inference.hpp>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace primus {

struct CommandContext {
    Runtime& runtime;
    InferenceBackend* backend;    // null when no backend is configured

    CommandContext(Runtime& r, InferenceBackend* b) : runtime(r), backend(b) {}
};

typedef std::function<std::string(CommandContext&, const std::string& args)> CommandHandler;

struct CommandDef {
    std::string name;
    std::string description;
    CommandHandler handler;

    CommandDef() {}
    CommandDef(const std::string& n, const std::string& d, CommandHandler h)
        : name(n), description(d), handler(h) {}
};

class CommandDispatcher {
public:
    CommandDispatcher(Runtime& runtime, InferenceBackend* backend);

    void register_commands(const std::vector<CommandDef>& cmds);
    const std::map<std::string, CommandDef>& commands() const { return commands_; }

    std::string dispatch(const std::string& line);

private:
    CommandContext context_;
    std::map<std::string, CommandDef> commands_;
};

std::string render_decision(const Decision& decision);
std::string render_result(const ActionResult& result);

namespace commands {
    std::string cmd_mode(CommandContext& ctx, const std::string& args);
    std::string cmd_pending(CommandContext& ctx, const std::string& args);
    std::string cmd_approve(CommandContext& ctx, const std::string& args);
    std::string cmd_reject(CommandContext& ctx, const std::string& args);
    std::string cmd_sandbox(CommandContext& ctx, const std::string& args);
    std::string cmd_audit(CommandContext& ctx, const std::string& args);
    std::string cmd_actors(CommandContext& ctx, const std::string& args);
    std::string cmd_partitions(CommandContext& ctx, const std::string& args);
    std::string cmd_grants(CommandContext& ctx, const std::string& args);
    std::string cmd_grant(CommandContext& ctx, const std::string& args);
    std::string cmd_revoke(CommandContext& ctx, const std::string& args);
    std::string cmd_journal(CommandContext& ctx, const std::string& args);
    std::string cmd_personality(CommandContext& ctx, const std::string& args);
    std::string cmd_settings(CommandContext& ctx, const std::string& args);
    std::string cmd_remember(CommandContext& ctx, const std::string& args);
    std::string cmd_agent(CommandContext& ctx, const std::string& args);
    std::string cmd_subchat(CommandContext& ctx, const std::string& args);
    std::string chat(CommandContext& ctx, const std::string& text);
}

// Register /mode, /pending, /approve, /reject, /sandbox, /audit, /actors,
// /partitions, /grants, /grant, /revoke, /journal, /personality, /settings,
// /remember, /agent, /subchat
void register_core_commands(CommandDispatcher& dispatcher);

} // namespace primus

#endif // primus_CORE_COMMANDS_HPP
