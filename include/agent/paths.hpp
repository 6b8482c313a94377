#pragma once

#include <filesystem>

namespace shrine::agent {

// agent.runtime_dir, else $XDG_RUNTIME_DIR/shrine, else /tmp/shrine-<uid>
std::filesystem::path runtimeDir();

// One endpoint per shrine location: <runtime_dir>/agent-<tag(abs path)>.sock
std::filesystem::path socketPathFor(const std::filesystem::path& shrineFile);

// Creates the directory with mode 0700; IoError if it belongs to someone else
void ensureRuntimeDir(const std::filesystem::path& dir);

}
