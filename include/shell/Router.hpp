#pragma once

#include "shell/types.hpp"

#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace shrine::shell {

class Router {
public:
    void registerCommand(CommandUsage usage, CommandHandler handler);

    // argv without the program name
    CommandResult execute(const std::vector<std::string>& args, const Environment& env) const;

    [[nodiscard]] std::string help() const;

private:
    std::map<std::string, CommandInfo> commands_;
    std::unordered_map<std::string, std::string> aliasMap_; // alias -> canonical

    CommandResult dispatch(CommandCall call, const Environment& env) const;
    [[nodiscard]] std::string canonicalFor(const std::string& nameOrAlias) const;

    static std::string normalize(const std::string& s);
};

}
