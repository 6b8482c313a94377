#pragma once

#include <filesystem>

namespace shrine::store {

// Exclusive advisory flock on a sidecar file, held for the lifetime of the object
class FileLock {
public:
    explicit FileLock(std::filesystem::path p);
    ~FileLock();
    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

    static std::filesystem::path sidecarFor(const std::filesystem::path& shrinePath);

private:
    std::filesystem::path path_;
    int fd_{-1};
};

}
