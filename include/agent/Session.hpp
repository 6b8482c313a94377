#pragma once

#include "crypto/KeyDerivation.hpp"

#include <chrono>
#include <filesystem>
#include <string>

namespace shrine::agent {

enum class State { Locked, Unlocking, Unlocked };

std::string to_string(State state);

// The one cached key of an agent. Expiry is absolute and fixed at unlock.
struct Session {
    using Clock = std::chrono::steady_clock;

    crypto::DerivedKey key;
    std::filesystem::path shrine_path;
    Clock::time_point expires_at;

    [[nodiscard]] bool expired(Clock::time_point now = Clock::now()) const { return now >= expires_at; }

    [[nodiscard]] std::chrono::seconds remaining(Clock::time_point now = Clock::now()) const {
        if (expired(now)) return std::chrono::seconds{0};
        return std::chrono::ceil<std::chrono::seconds>(expires_at - now);
    }
};

}
