#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>

namespace shrine::config {

// https://cheatsheetseries.owasp.org/cheatsheets/Password_Storage_Cheat_Sheet.html#pbkdf2
constexpr static uint32_t DEFAULT_KDF_ITERATIONS = 600'000;
constexpr static unsigned int DEFAULT_SESSION_TTL_SECONDS = 15 * 60;

struct CryptoConfig {
    uint32_t kdf_iterations = DEFAULT_KDF_ITERATIONS;
};

struct AgentConfig {
    std::chrono::seconds session_ttl = std::chrono::seconds(DEFAULT_SESSION_TTL_SECONDS);
    std::string runtime_dir;  // empty: $XDG_RUNTIME_DIR/shrine, then /tmp/shrine-<uid>
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum shrine = spdlog::level::info;
    spdlog::level::level_enum crypto = spdlog::level::warn;  // failed unlocks only
    spdlog::level::level_enum store  = spdlog::level::info;
    spdlog::level::level_enum git    = spdlog::level::info;
    spdlog::level::level_enum agent  = spdlog::level::info;
    spdlog::level::level_enum shell  = spdlog::level::warn;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::warn;  // stdout belongs to command output
    spdlog::level::level_enum file_log_level = spdlog::level::info;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir;  // empty: $XDG_STATE_HOME/shrine, then ~/.local/state/shrine
    bool file_logging = true;
    LogLevelsConfig levels;
};

struct Config {
    CryptoConfig crypto;
    AgentConfig agent;
    LoggingConfig logging;
};

std::filesystem::path defaultConfigPath();
std::filesystem::path defaultLogDir();

// Missing file yields the defaults above
Config loadConfig(const std::filesystem::path& path);

}
