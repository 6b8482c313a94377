#include "shell/commands.hpp"
#include "shell/Router.hpp"
#include "shell/argsHelpers.hpp"
#include "agent/Client.hpp"
#include "agent/Server.hpp"
#include "agent/daemon.hpp"
#include "config/ConfigRegistry.hpp"
#include "error/ShrineError.hpp"

#include <fmt/format.h>

using namespace shrine::shell;
using namespace shrine::agent;
using shrine::config::ConfigRegistry;

namespace {

std::optional<std::chrono::seconds> ttlArg(const CommandCall& call) {
    const auto raw = optVal(call, "ttl");
    if (!raw) return std::nullopt;
    const auto secs = parseUInt(*raw);
    if (!secs || *secs == 0)
        throw shrine::error::InvalidArgumentError(fmt::format("--ttl must be a positive number of seconds, got '{}'", *raw));
    return std::chrono::seconds(*secs);
}

std::chrono::seconds ttlOrDefault(const CommandCall& call) {
    return ttlArg(call).value_or(ConfigRegistry::get().agent.session_ttl);
}

template <typename F>
auto withRunningAgent(const std::filesystem::path& file, F&& fn) {
    const auto client = Client::forShrine(file);
    try {
        return fn(client);
    } catch (const AgentUnavailable& e) {
        throw shrine::error::NotFoundError(fmt::format("No agent running for {} ({})", file.string(), e.what()));
    }
}

CommandResult agent_start(const CommandCall& call) {
    const auto pid = startDetached(shrineFileFor(call), ttlOrDefault(call));
    return ok(fmt::format("Agent started (pid {})\n", pid));
}

CommandResult agent_serve(const CommandCall& call) {
    return {serve(shrineFileFor(call), ttlOrDefault(call)), "", ""};
}

CommandResult agent_stop(const CommandCall& call) {
    withRunningAgent(shrineFileFor(call), [](const Client& c) { c.stop(); return 0; });
    return ok("Agent stopped\n");
}

CommandResult agent_status(const CommandCall& call) {
    const auto client = Client::forShrine(shrineFileFor(call));
    if (!client.reachable()) return ok("state:         stopped\n");

    const auto st = client.status();
    std::string out = fmt::format("{:<15}{}\n{:<15}{}\n{:<15}{}\n", "state:", st.state, "pid:", st.pid,
                                  "shrine:", st.shrine);
    if (st.state == "unlocked") out += fmt::format("{:<15}{}s\n", "expires in:", st.seconds_left);
    return ok(std::move(out));
}

CommandResult agent_lock(const CommandCall& call) {
    withRunningAgent(shrineFileFor(call), [](const Client& c) { c.lock(); return 0; });
    return ok("");
}

CommandResult agent_unlock(const CommandCall& call) {
    const auto file = shrineFileFor(call);
    const auto ttl = ttlArg(call);
    auto password = passwordFor(call);
    withRunningAgent(file, [&](const Client& c) { c.unlock(password.get().view(), ttl); return 0; });
    return ok("");
}

CommandResult handle_agent(const CommandCall& call) {
    const auto& sub = requirePositional(call, 0, "start|serve|stop|status|lock|unlock");
    if (sub == "start") return agent_start(call);
    if (sub == "serve") return agent_serve(call);
    if (sub == "stop") return agent_stop(call);
    if (sub == "status") return agent_status(call);
    if (sub == "lock") return agent_lock(call);
    if (sub == "unlock") return agent_unlock(call);
    return invalid(fmt::format("agent: unknown subcommand '{}'", sub));
}

}

void shrine::shell::registerAgentCommands(const std::shared_ptr<Router>& r) {
    r->registerCommand({"agent", "agent start|serve|stop|status|lock|unlock [--ttl <s>]",
                        "Manage the key-caching agent for this shrine", {}},
                       handle_agent);
}
