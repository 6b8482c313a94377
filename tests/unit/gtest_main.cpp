#include <gtest/gtest.h>
#include <filesystem>
#include <iostream>
#include <unistd.h>

#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"

namespace fs = std::filesystem;

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    try {
        // Short runtime dir: unix socket paths are limited to 108 bytes
        const fs::path runtime = fs::path("/tmp") / ("shrine-test-" + std::to_string(::getpid()));

        shrine::config::Config cfg;
        cfg.crypto.kdf_iterations = 1000;
        cfg.agent.runtime_dir = runtime.string();
        cfg.logging.file_logging = false;
        cfg.logging.levels.console_log_level = spdlog::level::off;

        shrine::config::ConfigRegistry::init(cfg);
        shrine::log::Registry::init();

        const int rc = RUN_ALL_TESTS();
        std::error_code ec;
        fs::remove_all(runtime, ec);
        return rc;
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize shrine test environment: " << e.what() << std::endl;
        return 1;
    }
}
