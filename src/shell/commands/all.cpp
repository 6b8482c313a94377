#include "shell/commands.hpp"

namespace shrine::shell {

void registerAllCommands(const std::shared_ptr<Router>& r) {
    registerShrineCommands(r);
    registerSecretCommands(r);
    registerAgentCommands(r);
}

}
