#include "store/FileLock.hpp"
#include "error/ShrineError.hpp"
#include "log/Registry.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace shrine::store {

FileLock::FileLock(std::filesystem::path p) : path_(std::move(p)) {
    fd_ = ::open(path_.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0600);
    if (fd_ < 0) throw error::IoError("FileLock: open failed for " + path_.string() + ": " + std::strerror(errno));

    int rc;
    do rc = flock(fd_, LOCK_EX);
    while (rc != 0 && errno == EINTR);

    if (rc != 0) {
        const std::string reason = std::strerror(errno);
        ::close(fd_);
        fd_ = -1;
        throw error::IoError("FileLock: flock failed for " + path_.string() + ": " + reason);
    }

    log::Registry::store()->debug("[FileLock] Acquired {}", path_.string());
}

FileLock::~FileLock() {
    if (fd_ >= 0) {
        flock(fd_, LOCK_UN);
        ::close(fd_);
    }
}

std::filesystem::path FileLock::sidecarFor(const std::filesystem::path& shrinePath) {
    auto lock = shrinePath;
    lock += ".lock";
    return lock;
}

}
