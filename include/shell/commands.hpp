#pragma once

#include <memory>

namespace shrine::shell {

class Router;

void registerSecretCommands(const std::shared_ptr<Router>& r);
void registerShrineCommands(const std::shared_ptr<Router>& r);
void registerAgentCommands(const std::shared_ptr<Router>& r);

void registerAllCommands(const std::shared_ptr<Router>& r);

}
