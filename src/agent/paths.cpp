#include "agent/paths.hpp"
#include "config/ConfigRegistry.hpp"
#include "crypto/hash.hpp"
#include "error/ShrineError.hpp"

#include <fmt/core.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace shrine::agent {

fs::path runtimeDir() {
    if (const auto& configured = config::ConfigRegistry::get().agent.runtime_dir; !configured.empty())
        return configured;
    if (const char* xdg = std::getenv("XDG_RUNTIME_DIR"); xdg && *xdg) return fs::path(xdg) / "shrine";
    return fs::path(fmt::format("/tmp/shrine-{}", ::getuid()));
}

fs::path socketPathFor(const fs::path& shrineFile) {
    std::error_code ec;
    auto abs = fs::weakly_canonical(fs::absolute(shrineFile), ec);
    if (ec) abs = fs::absolute(shrineFile);
    return runtimeDir() / fmt::format("agent-{}.sock", crypto::hash::tag("shrine/agent-socket/v1", abs.string(), 16));
}

void ensureRuntimeDir(const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) throw error::IoError(fmt::format("Cannot create runtime dir {}: {}", dir.string(), ec.message()));

    struct stat st{};
    if (::stat(dir.c_str(), &st) != 0)
        throw error::IoError(fmt::format("Cannot stat runtime dir {}: {}", dir.string(), std::strerror(errno)));
    if (st.st_uid != ::getuid())
        throw error::IoError(fmt::format("Runtime dir {} is not owned by the current user", dir.string()));
    if (::chmod(dir.c_str(), 0700) != 0)
        throw error::IoError(fmt::format("Cannot chmod runtime dir {}: {}", dir.string(), std::strerror(errno)));
}

}
