#include "dispatch/Dispatcher.hpp"
#include "error/ShrineError.hpp"
#include "log/Registry.hpp"

namespace shrine::dispatch {

namespace {

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

}

Dispatcher::Dispatcher(std::filesystem::path shrineFile, PasswordSource& password, const bool useAgent)
    : file_(std::move(shrineFile)), password_(password), useAgent_(useAgent) {}

Access Dispatcher::select() const {
    if (useAgent_) {
        auto client = agent::Client::forShrine(file_);
        if (client.reachable()) return WarmPath{std::move(client)};
    }
    return ColdPath{file_};
}

template <typename Warm, typename Cold>
auto Dispatcher::route(const char* op, Warm&& warm, Cold&& cold) {
    return std::visit(overloaded{
        [&](const WarmPath& w) {
            try {
                return warm(w.client);
            } catch (const agent::AgentUnavailable& e) {
                log::Registry::shrine()->debug("[Dispatcher] {}: agent unavailable ({}), using password", op, e.what());
            } catch (const error::SessionExpiredError& e) {
                log::Registry::shrine()->debug("[Dispatcher] {}: {}, using password", op, e.what());
            }
            auto result = cold(ColdPath{file_});
            primeAgent(w.client);
            return result;
        },
        [&](const ColdPath& c) { return cold(c); }
    }, select());
}

void Dispatcher::primeAgent(const agent::Client& client) {
    try {
        client.unlock(password_.get().view());
    } catch (const agent::AgentUnavailable& e) {
        log::Registry::shrine()->debug("[Dispatcher] Could not unlock agent: {}", e.what());
    } catch (const error::ShrineError& e) {
        log::Registry::shrine()->debug("[Dispatcher] Could not unlock agent: {}", e.what());
    }
}

types::Secret Dispatcher::get(const std::string& path) {
    return route("get",
        [&](const agent::Client& client) { return client.get(path); },
        [&](const ColdPath& c) {
            const auto repo = store::Repository::open(c.file, password_.get().view(), store::OpenMode::Read);
            return repo.get(path);
        });
}

std::vector<std::string> Dispatcher::set(const std::string& path, crypto::SecretBytes value, const types::Mode mode) {
    return route("set",
        [&](const agent::Client& client) { return client.set(path, value, mode); },
        [&](const ColdPath& c) {
            auto repo = store::Repository::open(c.file, password_.get().view(), store::OpenMode::Write);
            repo.set(path, value, mode);
            return repo.persist();
        });
}

std::vector<std::string> Dispatcher::remove(const std::string& path) {
    return route("rm",
        [&](const agent::Client& client) { return client.remove(path); },
        [&](const ColdPath& c) {
            auto repo = store::Repository::open(c.file, password_.get().view(), store::OpenMode::Write);
            repo.remove(path);
            return repo.persist();
        });
}

store::ListResult Dispatcher::list(const std::optional<std::string>& pattern) {
    return route("ls",
        [&](const agent::Client& client) { return client.list(pattern); },
        [&](const ColdPath& c) {
            const auto repo = store::Repository::open(c.file, password_.get().view(), store::OpenMode::Read);
            return repo.list(pattern);
        });
}

}
