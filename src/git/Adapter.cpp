#include "git/Adapter.hpp"
#include "error/ShrineError.hpp"
#include "log/Registry.hpp"
#include "util/files.hpp"
#include "util/process.hpp"

#include <fmt/format.h>

namespace shrine::git {

std::string commitMessage(const ChangeKind kind) {
    return kind == ChangeKind::Initialize ? "Initialize shrine" : "Update shrine";
}

Adapter::Adapter(std::filesystem::path shrineFile)
    : file_(std::move(shrineFile)),
      dir_(file_.has_parent_path() ? file_.parent_path() : std::filesystem::path(".")) {}

void Adapter::run(const std::vector<std::string>& args) const {
    std::vector<std::string> argv{"git"};
    argv.insert(argv.end(), args.begin(), args.end());

    log::Registry::git()->debug("[Adapter] Running git {} in {}", fmt::join(args, " "), dir_.string());

    const auto res = util::runProcess(argv, dir_);
    if (res.exit_code == 127) throw error::GitError("git executable not found");
    if (res.exit_code != 0) {
        auto out = res.output;
        while (!out.empty() && (out.back() == '\n' || out.back() == '\r')) out.pop_back();
        throw error::GitError(fmt::format("git {} failed ({}): {}", args.front(), res.exit_code, out));
    }
}

void Adapter::ensureRepository() const {
    std::error_code ec;
    if (std::filesystem::exists(dir_ / ".git", ec)) return;

    log::Registry::git()->info("[Adapter] Initializing git repository in {}", dir_.string());
    run({"init", "--quiet"});
}

std::vector<std::string> Adapter::record(const ChangeKind kind, const types::ShrineConfig& config) const {
    if (!config.gitEnabled()) return {};

    std::vector<std::string> warnings;
    try {
        ensureRepository();

        const auto name = file_.filename().string();
        run({"add", "--", name});

        if (config.commitAuto()) {
            const auto user = util::currentUser();
            const auto message = commitMessage(kind);
            run({"-c", "user.name=" + user, "-c", "user.email=" + util::currentIdentity(),
                 "commit", "--quiet", "-m", message, "--", name});
            log::Registry::git()->info("[Adapter] Committed '{}'", message);
        }

        if (config.pushAuto()) {
            run({"push", "--quiet"});
            log::Registry::git()->info("[Adapter] Pushed");
        }
    } catch (const error::GitError& e) {
        log::Registry::git()->info("[Adapter] Recorded as warning: {}", e.what());
        warnings.emplace_back(e.what());
    } catch (const std::runtime_error& e) {
        log::Registry::git()->info("[Adapter] Recorded as warning: {}", e.what());
        warnings.emplace_back(fmt::format("git: {}", e.what()));
    }

    return warnings;
}

}
