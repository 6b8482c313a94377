#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace shrine::util {

using EnvPair = std::pair<std::string, std::string>;

// KEY=VALUE lines. Blank lines and lines starting with '#' are skipped, the first
// '#' in a value not preceded by '\' starts a comment, "\#" is a literal '#', and
// one pair of surrounding quotes is removed. A line without '=' or with an empty
// key throws InvalidArgumentError naming its 1-based line number.
std::vector<EnvPair> parseDotenv(std::string_view content);

std::string_view trim(std::string_view s);

}
