#include "log/Registry.hpp"
#include "config/ConfigRegistry.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>

#include <filesystem>
#include <vector>

namespace shrine::log {

std::vector<spdlog::sink_ptr> Registry::fileSinks(const std::filesystem::path& logDir, spdlog::sink_ptr& auditSink) {
    namespace fs = std::filesystem;

    std::error_code ec;
    if (!fs::exists(logDir, ec)) fs::create_directories(logDir, ec);
    if (ec) {
        spdlog::warn("[Registry] Cannot create log dir {}: {}; file logging disabled", logDir.string(), ec.message());
        return {};
    }

    try {
        const auto rotatingSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            (logDir / "shrine.log").string(), main_max_bytes_, main_max_files_);
        rotatingSink->set_pattern(LOG_FORMAT);
        auditSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>((logDir / "audit.log").string(), true);
        return {rotatingSink};
    } catch (const spdlog::spdlog_ex& e) {
        spdlog::warn("[Registry] Cannot open log files in {}: {}; file logging disabled", logDir.string(), e.what());
        auditSink.reset();
        return {};
    }
}

void Registry::init() {
    if (initialized_) {
        spdlog::warn("[Registry] Already initialized, ignoring second init()");
        return;
    }

    const auto& cnf = config::ConfigRegistry::get().logging;

    const auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    consoleSink->set_level(cnf.levels.console_log_level);
    consoleSink->set_color_mode(spdlog::color_mode::automatic);
    consoleSink->set_pattern(LOG_FORMAT);

    std::vector<spdlog::sink_ptr> sinks{consoleSink};
    spdlog::sink_ptr auditSink;
    if (cnf.file_logging) {
        for (auto& sink : fileSinks(cnf.log_dir, auditSink)) {
            sink->set_level(cnf.levels.file_log_level);
            sinks.push_back(sink);
        }
    }

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cnf.levels.subsystem_levels;

    makeLogger("shrine", sub_levels.shrine);
    makeLogger("crypto", sub_levels.crypto);
    makeLogger("store", sub_levels.store);
    makeLogger("git", sub_levels.git);
    makeLogger("agent", sub_levels.agent);
    makeLogger("shell", sub_levels.shell);

    // Audit logger (special: append-only file sink, no rotation, never on the console)
    {
        if (!auditSink) auditSink = std::make_shared<spdlog::sinks::null_sink_mt>();
        const auto logger = std::make_shared<spdlog::logger>("audit", auditSink);
        logger->set_level(spdlog::level::info);
        logger->flush_on(spdlog::level::info);
        spdlog::register_logger(logger);
    }

    initialized_ = true;
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[Registry] Registry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[Registry] Logger not found: " + name);
    }
    return logger;
}

}
