#pragma once

#include "store/Repository.hpp"
#include "types/Secret.hpp"

#include <nlohmann/json.hpp>
#include <chrono>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace shrine::agent {

// No agent behind the socket (absent, refused, or hung up mid-exchange)
class AgentUnavailable final : public std::runtime_error {
public:
    explicit AgentUnavailable(const std::string& message) : std::runtime_error(message) {}
};

struct Status {
    long pid{0};
    std::string state;
    long seconds_left{0};
    std::string shrine;
};

// One connection per request. Error replies are rethrown as the matching ShrineError.
class Client {
public:
    explicit Client(std::filesystem::path socketPath);

    [[nodiscard]] static Client forShrine(const std::filesystem::path& shrineFile);

    [[nodiscard]] bool reachable() const;

    void unlock(std::string_view password, std::optional<std::chrono::seconds> ttl = std::nullopt) const;
    [[nodiscard]] types::Secret get(const std::string& path) const;
    std::vector<std::string> set(const std::string& path, const crypto::SecretBytes& value, types::Mode mode) const;
    std::vector<std::string> remove(const std::string& path) const;
    [[nodiscard]] store::ListResult list(const std::optional<std::string>& pattern) const;
    void lock() const;
    [[nodiscard]] Status status() const;
    void stop() const;

    [[nodiscard]] const std::filesystem::path& socketPath() const { return socketPath_; }

private:
    std::filesystem::path socketPath_;

    [[nodiscard]] nlohmann::json request(const nlohmann::json& req) const;
};

}
