#include "types/SecretPath.hpp"
#include "error/ShrineError.hpp"

#include <fmt/core.h>

namespace shrine::types {

bool isValidSecretPath(const std::string_view path) {
    if (path.empty() || path.front() == '/' || path.back() == '/') return false;
    return path.find("//") == std::string_view::npos;
}

void validateSecretPath(const std::string_view path) {
    if (!isValidSecretPath(path))
        throw error::InvalidArgumentError(fmt::format("Invalid secret path '{}'", path));
}

}
