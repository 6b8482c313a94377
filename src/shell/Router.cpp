#include "shell/Router.hpp"
#include "shell/Token.hpp"
#include "shell/Parser.hpp"
#include "shell/argsHelpers.hpp"
#include "error/ShrineError.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>
#include <cctype>

using namespace shrine::shell;
using namespace shrine::error;

void Router::registerCommand(CommandUsage usage, CommandHandler handler) {
    const std::string key = normalize(usage.name);

    for (const auto& alias : usage.aliases) {
        if (aliasMap_.contains(alias) && aliasMap_.at(alias) != key) {
            log::Registry::shell()->warn("[Router] Alias '{}' already mapped to '{}'; skipping duplicate for '{}'",
                                         alias, aliasMap_.at(alias), key);
            continue;
        }
        aliasMap_[alias] = key;
    }

    if (usage.description.empty()) usage.description = "No description provided.";
    commands_[key] = CommandInfo{std::move(usage), std::move(handler)};
}

std::string Router::canonicalFor(const std::string& nameOrAlias) const {
    const std::string n = normalize(nameOrAlias);
    if (commands_.contains(n)) return n;
    if (aliasMap_.contains(n)) return aliasMap_.at(n);
    return n;
}

CommandResult Router::execute(const std::vector<std::string>& args, const Environment& env) const {
    return dispatch(parseTokens(tokenizeArgs(args)), env);
}

CommandResult Router::dispatch(CommandCall call, const Environment& env) const {
    call.env = &env;

    if (call.name.empty() || call.name == "help" || hasFlag(call, "help") || hasFlag(call, "h"))
        return ok(help());

    const auto canonical = canonicalFor(call.name);
    if (!commands_.contains(canonical))
        return invalid(fmt::format("Unknown command: {}\n\n{}", call.name, help()));

    log::Registry::shell()->debug("[Router] Executing command: '{}'", canonical);

    try {
        return commands_.at(canonical).handler(call);
    } catch (const ShrineError& e) {
        log::Registry::shell()->debug("[Router] '{}' failed: {}", canonical, e.what());
        return {e.exitCode(), "", fmt::format("Error ({}): {}\n", to_string(e.code()), e.what())};
    } catch (const std::exception& e) {
        log::Registry::shell()->error("[Router] '{}' failed: {}", canonical, e.what());
        return {exitCodeFor(Code::Generic), "", fmt::format("Error: {}\n", e.what())};
    }
}

std::string Router::help() const {
    std::string out = "Usage: shrine [--password <pw>] [--path <dir>] <command> [args]\n\nCommands:\n";
    for (const auto& [name, info] : commands_)
        out += fmt::format("  {:<44} {}\n", info.usage.synopsis, info.usage.description);
    return out;
}

std::string Router::normalize(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (const unsigned char c : s) out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}
