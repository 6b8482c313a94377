#pragma once

#include <string_view>

namespace shrine::types {

// Non-empty, '/'-delimited, no empty segment
[[nodiscard]] bool isValidSecretPath(std::string_view path);

// Throws InvalidArgumentError naming the offending path
void validateSecretPath(std::string_view path);

}
