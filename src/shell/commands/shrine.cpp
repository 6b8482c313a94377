#include "shell/commands.hpp"
#include "shell/Router.hpp"
#include "shell/argsHelpers.hpp"
#include "agent/Client.hpp"
#include "error/ShrineError.hpp"
#include "log/Registry.hpp"
#include "store/Repository.hpp"

#include <boost/uuid/uuid_io.hpp>
#include <fmt/format.h>

using namespace shrine::shell;
using namespace shrine::store;
using shrine::crypto::SecretBytes;

namespace {

SecretBytes newPassword(const CommandCall& call, const std::string& flag, const std::string& what) {
    if (const auto given = optVal(call, flag)) return SecretBytes(std::string_view(*given));
    return passwordFor(call).promptNew(what);
}

CommandResult handle_init(const CommandCall& call) {
    const auto file = shrineFileFor(call);

    InitOptions opts;
    opts.force = hasFlag(call, "force");
    opts.git = hasFlag(call, "git");
    if (const auto format = optVal(call, "format")) opts.serialization = serialization_from_string(*format);

    auto password = passwordFor(call);
    const auto pw = password.known() ? password.get() : password.promptNew("Password");

    return okWithWarnings("", Repository::init(file, pw.view(), opts));
}

CommandResult handle_convert(const CommandCall& call) {
    const auto file = shrineFileFor(call);
    auto password = passwordFor(call);
    auto repo = Repository::open(file, password.get().view(), OpenMode::Write);

    const auto next = newPassword(call, "new-password", "New password");
    const auto warnings = repo.convert(next.view());

    // The agent's key belongs to the old password now
    const auto client = shrine::agent::Client::forShrine(file);
    try {
        client.lock();
    } catch (const shrine::agent::AgentUnavailable& e) {
        shrine::log::Registry::agent()->debug("[convert] No agent to lock: {}", e.what());
    }

    return okWithWarnings("", warnings);
}

CommandResult handle_info(const CommandCall& call) {
    const auto file = shrineFileFor(call);
    const auto header = Repository::readHeader(file);

    const std::vector<std::pair<std::string, std::string>> fields{
        {"version", std::to_string(header.version)},
        {"uuid", boost::uuids::to_string(header.uuid)},
        {"serialization", to_string(header.serialization)},
        {"encryption", "aes-256-gcm"},
        {"kdf", "pbkdf2-hmac-sha256"},
        {"iterations", std::to_string(header.iterations)},
    };

    if (const auto field = optVal(call, "field")) {
        for (const auto& [k, v] : fields)
            if (k == *field) return ok(v + "\n");
        return invalid(fmt::format("Unknown field '{}'", *field));
    }

    std::string out = fmt::format("{:<15}{}\n", "file:", file.string());
    for (const auto& [k, v] : fields) out += fmt::format("{:<15}{}\n", k + ":", v);
    return ok(std::move(out));
}

CommandResult handle_config(const CommandCall& call) {
    const auto& sub = requirePositional(call, 0, "get|set");
    const auto& key = requirePositional(call, 1, "key");
    auto password = passwordFor(call);

    if (sub == "get") {
        const auto repo = Repository::open(shrineFileFor(call), password.get().view(), OpenMode::Read);
        const auto value = repo.configGet(key);
        if (!value) throw shrine::error::NotFoundError(fmt::format("Config key '{}' not set", key));
        return ok(*value + "\n");
    }

    if (sub == "set") {
        const auto& value = requirePositional(call, 2, "value");
        auto repo = Repository::open(shrineFileFor(call), password.get().view(), OpenMode::Write);
        repo.configSet(key, value);
        return okWithWarnings("", repo.persist());
    }

    return invalid(fmt::format("config: unknown subcommand '{}' (expected get or set)", sub));
}

}

void shrine::shell::registerShrineCommands(const std::shared_ptr<Router>& r) {
    r->registerCommand({"init", "init [--force] [--git] [--format bson|msgpack]",
                        "Create an empty shrine in the target folder", {}},
                       handle_init);

    r->registerCommand({"convert", "convert [--new-password <pw>]",
                        "Re-encrypt the shrine under a new password", {}},
                       handle_convert);

    r->registerCommand({"info", "info [--field <name>]", "Show the shrine header", {}}, handle_info);

    r->registerCommand({"config", "config get <key> | config set <key> <value>",
                        "Read or change settings stored inside the shrine", {}},
                       handle_config);
}
