#include "dispatch/PasswordSource.hpp"
#include "error/ShrineError.hpp"

#include <fmt/core.h>
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <termios.h>
#include <unistd.h>

namespace shrine::dispatch {

crypto::SecretBytes promptHidden(const std::string_view prompt) {
    const int fd = ::open("/dev/tty", O_RDWR | O_CLOEXEC);
    if (fd < 0) throw error::IoError("No terminal to prompt for a password; pass --password");

    termios saved{};
    const bool isTty = tcgetattr(fd, &saved) == 0;
    if (isTty) {
        termios noEcho = saved;
        noEcho.c_lflag &= ~ECHO;
        tcsetattr(fd, TCSANOW, &noEcho);
    }

    (void)!::write(fd, prompt.data(), prompt.size());

    crypto::SecretBytes line(4096);
    size_t len = 0;
    char c = 0;
    bool ok = true;
    while (len < line.size()) {
        const ssize_t r = ::read(fd, &c, 1);
        if (r < 0 && errno == EINTR) continue;
        if (r <= 0) { ok = len > 0; break; }
        if (c == '\n') break;
        line.data()[len++] = static_cast<uint8_t>(c);
    }
    if (len > 0 && line.data()[len - 1] == '\r') --len;

    if (isTty) tcsetattr(fd, TCSANOW, &saved);
    (void)!::write(fd, "\n", 1);
    ::close(fd);

    if (!ok) throw error::IoError("Failed to read password from terminal");
    return {line.data(), len};
}

PasswordSource::PasswordSource(std::optional<std::string> given, Prompter prompter)
    : prompter_(std::move(prompter)) {
    if (given) {
        value_.emplace(std::string_view(*given));
        std::fill(given->begin(), given->end(), '\0');
    }
}

const crypto::SecretBytes& PasswordSource::get() {
    if (!value_) value_.emplace(prompter_("Password: "));
    return *value_;
}

crypto::SecretBytes PasswordSource::promptNew(const std::string_view what) {
    auto first = prompter_(fmt::format("{}: ", what));
    const auto second = prompter_(fmt::format("Confirm {}: ", what));
    if (!(first == second)) throw error::InvalidArgumentError("Passwords do not match");
    return first;
}

}
