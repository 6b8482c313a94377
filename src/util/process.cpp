#include "util/process.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <stdexcept>
#include <sys/wait.h>
#include <unistd.h>

namespace shrine::util {

ProcessResult runProcess(const std::vector<std::string>& argv, const std::filesystem::path& cwd) {
    if (argv.empty()) throw std::invalid_argument("runProcess: empty argv");

    int pipefd[2];
    if (pipe2(pipefd, O_CLOEXEC) == -1) throw std::runtime_error("Failed to create pipe for child output");

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    const pid_t pid = fork();
    if (pid < 0) {
        close(pipefd[0]);
        close(pipefd[1]);
        throw std::runtime_error("Failed to fork child process");
    }

    if (pid == 0) {
        // Child: stdout+stderr into the pipe, stdin from /dev/null
        dup2(pipefd[1], STDOUT_FILENO);
        dup2(pipefd[1], STDERR_FILENO);
        if (const int devnull = open("/dev/null", O_RDONLY); devnull >= 0) dup2(devnull, STDIN_FILENO);
        if (chdir(cwd.c_str()) != 0) _exit(126);
        execvp(args[0], args.data());
        _exit(127); // exec failed
    }

    close(pipefd[1]);

    ProcessResult result;
    char buf[4096];
    for (;;) {
        const ssize_t n = read(pipefd[0], buf, sizeof(buf));
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;
        result.output.append(buf, static_cast<size_t>(n));
    }
    close(pipefd[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) throw std::runtime_error(std::string("waitpid failed: ") + std::strerror(errno));
    }

    result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status);
    return result;
}

}
