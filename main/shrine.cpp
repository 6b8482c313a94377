#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"
#include "shell/Router.hpp"
#include "shell/commands.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <unistd.h>
#include <vector>

using namespace shrine;

int main(const int argc, char** argv) {
    try {
        config::ConfigRegistry::init();
        log::Registry::init();
    } catch (const std::exception& e) {
        std::cerr << "shrine: failed to initialize: " << e.what() << '\n';
        return EXIT_FAILURE;
    }

    const auto router = std::make_shared<shell::Router>();
    shell::registerAllCommands(router);

    shell::Environment env;
    env.in = &std::cin;
    env.stdoutIsTty = ::isatty(STDOUT_FILENO) == 1;
    if (const char* noAgent = std::getenv("SHRINE_NO_AGENT"); noAgent && *noAgent) env.useAgent = false;

    const std::vector<std::string> args(argv + 1, argv + argc);
    const auto res = router->execute(args, env);

    std::cout.write(res.stdout_text.data(), static_cast<std::streamsize>(res.stdout_text.size()));
    std::cout.flush();
    std::cerr << res.stderr_text;
    return res.exit_code;
}
