#pragma once

#include "types/ShrineConfig.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace shrine::git {

enum class ChangeKind { Initialize, Update };

std::string commitMessage(ChangeKind kind);

// Records shrine writes in a git repository rooted at the shrine's folder, driven by
// the git.* options of the shrine config. Uses the git executable.
class Adapter {
public:
    explicit Adapter(std::filesystem::path shrineFile);

    // Never throws for git failures; each one comes back as a warning line
    [[nodiscard]] std::vector<std::string> record(ChangeKind kind, const types::ShrineConfig& config) const;


private:
    std::filesystem::path file_;
    std::filesystem::path dir_;

    void run(const std::vector<std::string>& args) const;
    void ensureRepository() const;
};

}
