#pragma once

#include <memory>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/sink.h>
#include <filesystem>

namespace shrine::log {

class Registry {
public:
    // Initialize all loggers with sinks/levels from ConfigRegistry.
    static void init();

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> shrine() { return get("shrine"); }
    static std::shared_ptr<spdlog::logger> crypto() { return get("crypto"); }
    static std::shared_ptr<spdlog::logger> store()  { return get("store"); }
    static std::shared_ptr<spdlog::logger> git()    { return get("git"); }
    static std::shared_ptr<spdlog::logger> agent()  { return get("agent"); }
    static std::shared_ptr<spdlog::logger> shell()  { return get("shell"); }
    static std::shared_ptr<spdlog::logger> audit()  { return get("audit"); }


private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;

    static constexpr size_t main_max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static constexpr size_t main_max_files_ = 5;

    static std::vector<spdlog::sink_ptr> fileSinks(const std::filesystem::path& logDir,
                                                   spdlog::sink_ptr& auditSink);
};

}
