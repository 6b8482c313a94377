#include "shell/commands.hpp"
#include "shell/Router.hpp"
#include "shell/argsHelpers.hpp"
#include "dispatch/Dispatcher.hpp"
#include "crypto/hash.hpp"
#include "error/ShrineError.hpp"
#include "store/Repository.hpp"
#include "types/SecretPath.hpp"
#include "util/dotenv.hpp"
#include "util/files.hpp"
#include "util/timestamp.hpp"

#include <fmt/format.h>
#include <algorithm>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <span>

using namespace shrine::shell;
using namespace shrine::dispatch;
using namespace shrine::types;
using shrine::crypto::SecretBytes;

namespace {

bool useAgent(const CommandCall& call) {
    return !call.env || call.env->useAgent;
}

std::optional<std::string> patternArg(const CommandCall& call) {
    if (call.positionals.empty()) return std::nullopt;
    return call.positionals.front();
}

SecretBytes readAll(std::istream& in) {
    std::vector<uint8_t> bytes{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    if (in.bad()) throw shrine::error::IoError("Failed to read standard input");
    return SecretBytes(std::move(bytes));
}

CommandResult handle_set(const CommandCall& call) {
    const auto& path = requirePositional(call, 0, "path");
    validateSecretPath(path);

    SecretBytes value;
    Mode mode = Mode::Text;

    if (hasFlag(call, "stdin")) {
        value = readAll(call.env && call.env->in ? *call.env->in : std::cin);
        mode = Mode::Binary;
    } else if (call.positionals.size() > 1) {
        value = SecretBytes(std::string_view(call.positionals[1]));
    } else {
        value = prompterFor(call)("Value: ");
    }

    auto password = passwordFor(call);
    Dispatcher dispatcher(shrineFileFor(call), password, useAgent(call));
    return okWithWarnings("", dispatcher.set(path, std::move(value), mode));
}

CommandResult handle_get(const CommandCall& call) {
    const auto& path = requirePositional(call, 0, "path");
    const auto encoding = optVal(call, std::vector<std::string>{"encoding", "e"}).value_or("auto");
    if (encoding != "auto" && encoding != "raw" && encoding != "base64")
        return invalid(fmt::format("Unknown encoding '{}' (expected auto, raw or base64)", encoding));

    auto password = passwordFor(call);
    Dispatcher dispatcher(shrineFileFor(call), password, useAgent(call));
    const auto secret = dispatcher.get(path);

    const bool asBase64 = encoding == "base64" ||
        (encoding == "auto" && secret.mode == Mode::Binary && call.env && call.env->stdoutIsTty);

    const std::span bytes(secret.value.data(), secret.value.size());
    if (asBase64) return ok(shrine::crypto::hash::base64Encode(bytes) + "\n");
    return ok(std::string(secret.value.view()));
}

CommandResult handle_rm(const CommandCall& call) {
    const auto& path = requirePositional(call, 0, "path");
    auto password = passwordFor(call);
    Dispatcher dispatcher(shrineFileFor(call), password, useAgent(call));
    return okWithWarnings("", dispatcher.remove(path));
}

std::string renderListing(const shrine::store::ListResult& res) {
    size_t cw = 0, uw = 0;
    for (const auto& e : res.entries) {
        cw = std::max(cw, e.created_by.size());
        uw = std::max(uw, e.updated_by.value_or("").size());
    }

    std::string out = fmt::format("total {}\n", res.count());
    for (const auto& e : res.entries) {
        const auto udate = e.updated_at ? shrine::util::dateString(*e.updated_at) : "";
        const auto utime = e.updated_at ? shrine::util::timeString(*e.updated_at) : "";
        out += fmt::format("{} {:<{}} {} {} {:<{}} {:<10} {:<5} {}\n",
                           short_name(e.mode),
                           e.created_by, cw,
                           shrine::util::dateString(e.created_at),
                           shrine::util::timeString(e.created_at),
                           e.updated_by.value_or(""), uw,
                           udate, utime,
                           e.path);
    }
    return out;
}

CommandResult handle_ls(const CommandCall& call) {
    auto password = passwordFor(call);
    Dispatcher dispatcher(shrineFileFor(call), password, useAgent(call));
    return ok(renderListing(dispatcher.list(patternArg(call))));
}

CommandResult handle_dump(const CommandCall& call) {
    auto password = passwordFor(call);
    const auto repo = shrine::store::Repository::open(shrineFileFor(call), password.get().view(),
                                                      shrine::store::OpenMode::Read);

    std::string out;
    for (const auto& e : repo.list(patternArg(call)).entries)
        out += fmt::format("{}={}\n", e.path, repo.get(e.path).value.view());
    return ok(std::move(out));
}

CommandResult handle_import(const CommandCall& call) {
    const std::filesystem::path source = requirePositional(call, 0, "file");
    if (!std::filesystem::exists(source))
        throw shrine::error::NotFoundError(fmt::format("Import file {} not found", source.string()));

    const auto entries = shrine::util::parseDotenv(shrine::util::readFileToString(source));
    const auto prefix = optVal(call, "prefix").value_or("");

    auto password = passwordFor(call);
    auto repo = shrine::store::Repository::open(shrineFileFor(call), password.get().view(),
                                                shrine::store::OpenMode::Write);
    repo.importEntries(entries, prefix);
    return okWithWarnings("", repo.persist());
}

}

void shrine::shell::registerSecretCommands(const std::shared_ptr<Router>& r) {
    r->registerCommand({"set", "set <path> [<value>] [--stdin]",
                        "Store a secret; prompts for the value when omitted, --stdin stores binary", {}},
                       handle_set);

    r->registerCommand({"get", "get <path> [--encoding auto|raw|base64]",
                        "Print a secret value", {}},
                       handle_get);

    r->registerCommand({"rm", "rm <path>", "Remove a secret", {"remove", "del"}}, handle_rm);

    r->registerCommand({"ls", "ls [pattern]", "List secrets, optionally filtered by a regex", {"list"}},
                       handle_ls);

    r->registerCommand({"dump", "dump [pattern]", "Print secrets as KEY=VALUE lines", {}}, handle_dump);

    r->registerCommand({"import", "import <file> [--prefix <p>]",
                        "Import KEY=VALUE lines from a dotenv-style file", {}},
                       handle_import);
}
