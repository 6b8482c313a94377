#include "agent/daemon.hpp"
#include "agent/Client.hpp"
#include "agent/Server.hpp"
#include "error/ShrineError.hpp"
#include "log/Registry.hpp"

#include <fmt/core.h>
#include <fcntl.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace shrine::agent {

namespace {

void detachStdio() {
    const int devnull = ::open("/dev/null", O_RDWR);
    if (devnull < 0) return;
    dup2(devnull, STDIN_FILENO);
    dup2(devnull, STDOUT_FILENO);
    dup2(devnull, STDERR_FILENO);
    if (devnull > STDERR_FILENO) ::close(devnull);
}

}

pid_t startDetached(const std::filesystem::path& shrineFile, const std::chrono::seconds ttl,
                    const std::chrono::milliseconds waitFor) {
    const auto client = Client::forShrine(shrineFile);
    if (client.reachable())
        throw error::AlreadyExistsError(fmt::format("An agent is already running for {}", shrineFile.string()));

    const pid_t pid = fork();
    if (pid < 0) throw error::IoError("Failed to fork agent process");

    if (pid == 0) {
        setsid();
        detachStdio();
        int code = 1;
        try {
            code = serve(shrineFile, ttl);
        } catch (const std::exception& e) {
            log::Registry::agent()->error("[daemon] Agent exited: {}", e.what());
        }
        _exit(code);
    }

    const auto deadline = std::chrono::steady_clock::now() + waitFor;
    while (std::chrono::steady_clock::now() < deadline) {
        if (client.reachable()) {
            log::Registry::agent()->info("[daemon] Agent {} started for {}", pid, shrineFile.string());
            return pid;
        }

        int status = 0;
        if (waitpid(pid, &status, WNOHANG) == pid)
            throw error::IoError(fmt::format("Agent exited during startup (status {})", WEXITSTATUS(status)));

        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    throw error::IoError(fmt::format("Agent did not come up within {} ms", waitFor.count()));
}

}
