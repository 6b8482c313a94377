#pragma once

#include <chrono>
#include <filesystem>
#include <sys/types.h>

namespace shrine::agent {

// Forks a detached agent (setsid, stdio on /dev/null) and waits until its socket
// answers. Returns the child's pid; IoError if it never comes up.
pid_t startDetached(const std::filesystem::path& shrineFile, std::chrono::seconds ttl,
                    std::chrono::milliseconds waitFor = std::chrono::seconds(5));

}
