#pragma once

#include "dispatch/PasswordSource.hpp"

#include <functional>
#include <istream>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace shrine::shell {

struct FlagKV {
    std::string key;
    std::optional<std::string> value;
};

// Process seams a command may touch besides the shrine itself
struct Environment {
    std::istream* in = nullptr;         // --stdin source
    dispatch::Prompter prompter;        // empty: prompt on /dev/tty
    bool stdoutIsTty = false;
    bool useAgent = true;
};

struct CommandCall {
    std::string name;
    std::vector<FlagKV> options;
    std::vector<std::string> positionals;
    const Environment* env = nullptr;
};

struct CommandResult {
    int exit_code = 0;                 // 0 = success
    std::string stdout_text;           // CLI stdout
    std::string stderr_text;           // CLI stderr
};

using CommandHandler = std::function<CommandResult(const CommandCall&)>;

struct CommandUsage {
    std::string name;
    std::string synopsis;
    std::string description;
    std::unordered_set<std::string> aliases;
};

struct CommandInfo {
    CommandUsage usage;
    CommandHandler handler;
};

}
