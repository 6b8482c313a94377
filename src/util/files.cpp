#include "util/files.hpp"
#include "error/ShrineError.hpp"
#include "log/Registry.hpp"

#include <fmt/core.h>
#include <cerrno>
#include <climits>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <pwd.h>
#include <sys/stat.h>
#include <unistd.h>

namespace shrine::util {

namespace {

std::string errnoMessage(const std::string& what, const std::filesystem::path& path) {
    return fmt::format("{} '{}': {}", what, path.string(), std::strerror(errno));
}

bool writeAll(const int fd, const uint8_t* p, size_t n) {
    while (n) {
        const ssize_t w = ::write(fd, p, n);
        if (w < 0 && errno == EINTR) continue;
        if (w <= 0) return false;
        p += w;
        n -= static_cast<size_t>(w);
    }
    return true;
}

std::ifstream openAtEnd(const std::filesystem::path& path) {
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) throw error::IoError("Not a regular file: " + path.string());

    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in) throw error::IoError("Failed to open file: " + path.string());
    return in;
}

}

std::vector<uint8_t> readFileToVector(const std::filesystem::path& path) {
    auto in = openAtEnd(path);

    const std::streamsize size = in.tellg();
    if (size < 0) throw error::IoError("Failed to read file: " + path.string());
    in.seekg(0, std::ios::beg);

    std::vector<uint8_t> buffer(size);
    if (!in.read(reinterpret_cast<char*>(buffer.data()), size))
        throw error::IoError("Failed to read file: " + path.string());

    return buffer;
}

std::string readFileToString(const std::filesystem::path& path) {
    auto in = openAtEnd(path);

    const std::streamsize size = in.tellg();
    if (size < 0) throw error::IoError("Failed to read file: " + path.string());
    in.seekg(0, std::ios::beg);

    std::string buffer(size, '\0');
    if (!in.read(buffer.data(), size))
        throw error::IoError("Failed to read file: " + path.string());

    return buffer;
}

void writeFileAtomic(const std::filesystem::path& target, const std::span<const uint8_t> bytes) {
    const auto dir = target.has_parent_path() ? target.parent_path() : std::filesystem::path(".");
    std::string tmpl = (dir / ("." + target.filename().string() + ".XXXXXX")).string();

    const int fd = ::mkstemp(tmpl.data());
    if (fd < 0) throw error::IoError(errnoMessage("Failed to create temp file in", dir));

    const std::filesystem::path tmp = tmpl;
    auto fail = [&](const std::string& what) {
        const auto msg = errnoMessage(what, tmp);
        ::close(fd);
        ::unlink(tmp.c_str());
        throw error::IoError(msg);
    };

    if (::fchmod(fd, 0600) != 0) fail("Failed to chmod");
    if (!writeAll(fd, bytes.data(), bytes.size())) fail("Failed to write");
    if (::fsync(fd) != 0) fail("Failed to fsync");

    if (::close(fd) != 0) {
        const auto msg = errnoMessage("Failed to close", tmp);
        ::unlink(tmp.c_str());
        throw error::IoError(msg);
    }

    if (::rename(tmp.c_str(), target.c_str()) != 0) {
        const auto msg = errnoMessage("Failed to rename temp file over", target);
        ::unlink(tmp.c_str());
        throw error::IoError(msg);
    }

    // Make the rename itself durable
    const int dfd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dfd >= 0) {
        if (::fsync(dfd) != 0)
            log::Registry::store()->warn("[files] fsync of directory {} failed: {}", dir.string(), std::strerror(errno));
        ::close(dfd);
    }
}

std::string currentUser() {
    if (const passwd* pw = getpwuid(::getuid()); pw && pw->pw_name) return pw->pw_name;
    if (const char* u = std::getenv("USER"); u && *u) return u;
    return std::to_string(::getuid());
}

std::string currentIdentity() {
    char host[HOST_NAME_MAX + 1] = {};
    if (::gethostname(host, sizeof(host)) != 0) std::snprintf(host, sizeof(host), "localhost");
    return fmt::format("{}@{}", currentUser(), host);
}

}
