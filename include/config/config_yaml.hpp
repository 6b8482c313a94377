#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace shrine::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<CryptoConfig> {
    static Node encode(const CryptoConfig& rhs) {
        Node node;
        node["kdf_iterations"] = rhs.kdf_iterations;
        return node;
    }

    static bool decode(const Node& node, CryptoConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.kdf_iterations = node["kdf_iterations"].as<uint32_t>(DEFAULT_KDF_ITERATIONS);
        if (rhs.kdf_iterations == 0) rhs.kdf_iterations = 1;
        return true;
    }
};

template<>
struct convert<AgentConfig> {
    static Node encode(const AgentConfig& rhs) {
        Node node;
        node["session_ttl_seconds"] = static_cast<unsigned int>(rhs.session_ttl.count());
        node["runtime_dir"] = rhs.runtime_dir;
        return node;
    }

    static bool decode(const Node& node, AgentConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.session_ttl = std::chrono::seconds(node["session_ttl_seconds"].as<unsigned int>(DEFAULT_SESSION_TTL_SECONDS));
        rhs.runtime_dir = node["runtime_dir"].as<std::string>("");
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["shrine"] = to_std_string(spdlog::level::to_string_view(rhs.shrine));
        node["crypto"] = to_std_string(spdlog::level::to_string_view(rhs.crypto));
        node["store"]  = to_std_string(spdlog::level::to_string_view(rhs.store));
        node["git"]    = to_std_string(spdlog::level::to_string_view(rhs.git));
        node["agent"]  = to_std_string(spdlog::level::to_string_view(rhs.agent));
        node["shell"]  = to_std_string(spdlog::level::to_string_view(rhs.shell));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.shrine = spdlog::level::from_str(node["shrine"].as<std::string>("info"));
        rhs.crypto = spdlog::level::from_str(node["crypto"].as<std::string>("warn"));
        rhs.store  = spdlog::level::from_str(node["store"].as<std::string>("info"));
        rhs.git    = spdlog::level::from_str(node["git"].as<std::string>("info"));
        rhs.agent  = spdlog::level::from_str(node["agent"].as<std::string>("info"));
        rhs.shell  = spdlog::level::from_str(node["shell"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystems"] = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console"].as<std::string>("warn"));
        rhs.file_log_level = spdlog::level::from_str(node["file"].as<std::string>("info"));
        if (node["subsystems"]) rhs.subsystem_levels = node["subsystems"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["file_logging"] = rhs.file_logging;
        node["levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("");
        rhs.file_logging = node["file_logging"].as<bool>(true);
        if (node["levels"]) rhs.levels = node["levels"].as<LogLevelsConfig>();
        return true;
    }
};

}
