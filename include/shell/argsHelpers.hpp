#pragma once

#include "shell/types.hpp"
#include "dispatch/PasswordSource.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace shrine::shell {

CommandResult invalid(std::string msg);
CommandResult ok(std::string out);

// Success, with git warnings reported on stderr
CommandResult okWithWarnings(std::string out, const std::vector<std::string>& warnings);

std::optional<std::string> optVal(const CommandCall& c, const std::vector<std::string>& keys);
std::optional<std::string> optVal(const CommandCall& c, const std::string& key);

bool hasFlag(const CommandCall& c, const std::string& key);

std::optional<unsigned int> parseUInt(const std::string& s);

// Positional at idx, or an InvalidArgumentError naming what is missing
const std::string& requirePositional(const CommandCall& c, size_t idx, const std::string& what);

// --path/--folder/-f, else $SHRINE_PATH, else the working directory; joined with the file name
std::filesystem::path shrineFileFor(const CommandCall& c);

// --password/-p, prompting through the environment when absent
dispatch::PasswordSource passwordFor(const CommandCall& c);

dispatch::Prompter prompterFor(const CommandCall& c);

}
