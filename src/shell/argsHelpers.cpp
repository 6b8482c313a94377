#include "shell/argsHelpers.hpp"
#include "error/ShrineError.hpp"
#include "store/Repository.hpp"

#include <fmt/format.h>
#include <charconv>
#include <cstdlib>

namespace shrine::shell {

CommandResult invalid(std::string msg) {
    if (!msg.empty() && msg.back() != '\n') msg.push_back('\n');
    return {error::exitCodeFor(error::Code::InvalidArgument), "", std::move(msg)};
}

CommandResult ok(std::string out) {
    return {0, std::move(out), ""};
}

CommandResult okWithWarnings(std::string out, const std::vector<std::string>& warnings) {
    CommandResult res = ok(std::move(out));
    for (const auto& w : warnings) res.stderr_text += fmt::format("warning: {}\n", w);
    return res;
}

std::optional<std::string> optVal(const CommandCall& c, const std::vector<std::string>& keys) {
    for (const auto& key : keys)
        if (auto v = optVal(c, key)) return v;
    return std::nullopt;
}

std::optional<std::string> optVal(const CommandCall& c, const std::string& key) {
    for (const auto& [k, v] : c.options) {
        if (k != key) continue;
        if (!v) throw error::InvalidArgumentError(fmt::format("--{} requires a value", key));
        return v;
    }
    return std::nullopt;
}

bool hasFlag(const CommandCall& c, const std::string& key) {
    for (const auto& [k, v] : c.options)
        if (k == key) return true;
    return false;
}

std::optional<unsigned int> parseUInt(const std::string& s) {
    unsigned int value = 0;
    const auto* end = s.data() + s.size();
    const auto [ptr, ec] = std::from_chars(s.data(), end, value);
    if (ec != std::errc() || ptr != end || s.empty()) return std::nullopt;
    return value;
}

const std::string& requirePositional(const CommandCall& c, const size_t idx, const std::string& what) {
    if (idx >= c.positionals.size())
        throw error::InvalidArgumentError(fmt::format("{}: missing <{}>", c.name, what));
    return c.positionals[idx];
}

std::filesystem::path shrineFileFor(const CommandCall& c) {
    std::filesystem::path folder;
    if (const auto p = optVal(c, {"path", "folder", "f"})) folder = *p;
    else if (const char* env = std::getenv("SHRINE_PATH"); env && *env) folder = env;
    else folder = std::filesystem::current_path();
    return store::Repository::fileIn(folder);
}

dispatch::Prompter prompterFor(const CommandCall& c) {
    if (c.env && c.env->prompter) return c.env->prompter;
    return dispatch::promptHidden;
}

dispatch::PasswordSource passwordFor(const CommandCall& c) {
    return dispatch::PasswordSource(optVal(c, std::vector<std::string>{"password", "p"}), prompterFor(c));
}

}
