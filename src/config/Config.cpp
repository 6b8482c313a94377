#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <cstdlib>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace shrine::config {

namespace {

std::filesystem::path envPath(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') return {};
    return {value};
}

std::filesystem::path homeDir() {
    if (auto home = envPath("HOME"); !home.empty()) return home;
    return std::filesystem::temp_directory_path();
}

}

std::filesystem::path defaultConfigPath() {
    if (auto explicitPath = envPath("SHRINE_CONFIG"); !explicitPath.empty()) return explicitPath;
    if (auto xdg = envPath("XDG_CONFIG_HOME"); !xdg.empty()) return xdg / "shrine" / "config.yaml";
    return homeDir() / ".config" / "shrine" / "config.yaml";
}

std::filesystem::path defaultLogDir() {
    if (auto xdg = envPath("XDG_STATE_HOME"); !xdg.empty()) return xdg / "shrine";
    return homeDir() / ".local" / "state" / "shrine";
}

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        cfg.logging.log_dir = defaultLogDir();
        return cfg;
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to parse config file " + path.string() + ": " + e.what());
    }

    if (auto node = root["crypto"]) YAML::convert<CryptoConfig>::decode(node, cfg.crypto);
    if (auto node = root["agent"]) YAML::convert<AgentConfig>::decode(node, cfg.agent);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    if (cfg.logging.log_dir.empty()) cfg.logging.log_dir = defaultLogDir();
    return cfg;
}

}
