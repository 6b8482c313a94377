#pragma once

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

namespace shrine::util {

std::vector<uint8_t> readFileToVector(const std::filesystem::path& path);
std::string readFileToString(const std::filesystem::path& path);

// mkstemp in the target's directory (mode 0600), fsync, rename over the target,
// fsync the directory. The target is untouched unless the rename happens.
void writeFileAtomic(const std::filesystem::path& target, std::span<const uint8_t> bytes);

// "<user>@<host>", used for secret metadata and commit authorship
std::string currentIdentity();
std::string currentUser();

}
