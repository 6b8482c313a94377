#pragma once

#include "agent/Client.hpp"
#include "dispatch/PasswordSource.hpp"
#include "store/Repository.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace shrine::dispatch {

// Key comes from the password, derived in this process
struct ColdPath {
    std::filesystem::path file;
};

// Key stays inside a reachable agent, which runs the operation itself
struct WarmPath {
    agent::Client client;
};

using Access = std::variant<ColdPath, WarmPath>;

// Routes secret operations to the agent when one answers for this shrine, and to
// the repository otherwise. A warm attempt that finds no agent or an expired
// session is retried cold with identical results.
class Dispatcher {
public:
    Dispatcher(std::filesystem::path shrineFile, PasswordSource& password, bool useAgent = true);

    [[nodiscard]] Access select() const;

    types::Secret get(const std::string& path);
    std::vector<std::string> set(const std::string& path, crypto::SecretBytes value, types::Mode mode);
    std::vector<std::string> remove(const std::string& path);
    store::ListResult list(const std::optional<std::string>& pattern);

    [[nodiscard]] const std::filesystem::path& file() const { return file_; }

private:
    std::filesystem::path file_;
    PasswordSource& password_;
    bool useAgent_;

    template <typename Warm, typename Cold>
    auto route(const char* op, Warm&& warm, Cold&& cold);

    // Hands the now-known password to a locked agent so the next call is warm
    void primeAgent(const agent::Client& client);
};

}
