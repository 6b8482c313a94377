#include "agent/Server.hpp"
#include "agent/paths.hpp"
#include "agent/protocol.hpp"
#include "crypto/KeyDerivation.hpp"
#include "crypto/hash.hpp"
#include "error/ShrineError.hpp"
#include "log/Registry.hpp"
#include "store/Repository.hpp"
#include "store/StoreCodec.hpp"
#include "util/files.hpp"

#include <fmt/core.h>
#include <array>
#include <csignal>
#include <functional>
#include <limits>
#include <optional>
#include <sys/socket.h>
#include <sys/stat.h>
#include <unistd.h>

using nlohmann::json;
namespace fs = std::filesystem;

namespace shrine::agent {

namespace {

struct Peer {
    uid_t uid;
    pid_t pid;
};

std::optional<Peer> peercred(const int fd) {
    ucred c{};
    socklen_t len = sizeof(c);
    if (getsockopt(fd, SOL_SOCKET, SO_PEERCRED, &c, &len) != 0) return std::nullopt;
    return Peer{c.uid, c.pid};
}

// A connectable socket means another agent already owns this shrine
bool socketIsLive(const fs::path& path) {
    asio::io_context probe;
    local::socket s(probe);
    boost::system::error_code ec;
    s.connect(local::endpoint(path.string()), ec);
    return !ec;
}

}

class Server::Connection : public std::enable_shared_from_this<Connection> {
public:
    Connection(std::shared_ptr<Server> server, local::socket socket)
        : server_(std::move(server)), socket_(std::move(socket)) {}

    void start() { readHeader(); }

private:
    std::shared_ptr<Server> server_;
    local::socket socket_;
    std::array<uint8_t, FRAME_HEADER_SIZE> header_{};
    std::string body_;
    std::string out_;

    void readHeader() {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(header_), [self](const boost::system::error_code& ec, size_t) {
            if (ec) return; // peer went away
            const auto len = decodeLength(self->header_);
            if (len > MAX_FRAME_SIZE) {
                self->writeReply(errorReply(error::Code::InvalidArgument, "request too large"), false);
                return;
            }
            self->body_.assign(len, '\0');
            self->readBody();
        });
    }

    void readBody() {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(body_), [self](const boost::system::error_code& ec, size_t) {
            if (ec) return;
            json reply;
            try {
                reply = self->server_->handle(json::parse(self->body_));
            } catch (const json::parse_error& e) {
                reply = errorReply(error::Code::InvalidArgument, std::string("malformed request: ") + e.what());
            }
            wipeString(self->body_);
            self->writeReply(reply, true);
        });
    }

    void writeReply(const json& reply, const bool keepReading) {
        out_ = encodeFrame(reply);
        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(out_), [self, keepReading](const boost::system::error_code& ec, size_t) {
            wipeString(self->out_);
            if (ec || !keepReading || self->server_->stopped_) {
                boost::system::error_code ignored;
                self->socket_.shutdown(local::socket::shutdown_both, ignored);
                self->socket_.close(ignored);
                return;
            }
            self->readHeader();
        });
    }
};

Server::Server(asio::io_context& ioc, fs::path shrineFile, fs::path socketPath, const std::chrono::seconds defaultTtl)
    : ioc_(ioc),
      acceptor_(ioc),
      timer_(ioc),
      signals_(ioc),
      shrineFile_(std::move(shrineFile)),
      socketPath_(std::move(socketPath)),
      defaultTtl_(defaultTtl) {}

Server::~Server() { stop(); }

void Server::start() {
    ensureRuntimeDir(socketPath_.parent_path());

    std::error_code fsEc;
    if (fs::exists(socketPath_, fsEc)) {
        if (socketIsLive(socketPath_))
            throw error::AlreadyExistsError(fmt::format("An agent is already listening on {}", socketPath_.string()));
        log::Registry::agent()->info("[Server] Removing stale socket {}", socketPath_.string());
        ::unlink(socketPath_.c_str());
    }

    // Owner-only from the moment the socket exists
    const mode_t oldMask = ::umask(0177);
    boost::system::error_code ec;
    acceptor_.open(local(), ec);
    if (!ec) acceptor_.bind(local::endpoint(socketPath_.string()), ec);
    ::umask(oldMask);
    if (!ec) acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) throw error::IoError(fmt::format("Cannot listen on {}: {}", socketPath_.string(), ec.message()));

    if (::chmod(socketPath_.c_str(), 0600) != 0)
        throw error::IoError(fmt::format("Cannot chmod socket {}", socketPath_.string()));

    signals_.add(SIGINT);
    signals_.add(SIGTERM);
    auto self = shared_from_this();
    signals_.async_wait([self](const boost::system::error_code& sigEc, const int signo) {
        if (sigEc) return;
        log::Registry::agent()->info("[Server] Caught signal {}, shutting down", signo);
        self->stop();
    });

    log::Registry::agent()->info("[Server] Agent for {} listening on {}", shrineFile_.string(), socketPath_.string());
    doAccept();
}

void Server::doAccept() {
    auto self = shared_from_this();
    acceptor_.async_accept([self](const boost::system::error_code& ec, local::socket socket) {
        if (ec == asio::error::operation_aborted || self->stopped_) return; // shutting down

        if (ec) {
            log::Registry::agent()->debug("[Server] accept error: {}", ec.message());
        } else if (const auto peer = peercred(socket.native_handle()); !peer || peer->uid != ::geteuid()) {
            log::Registry::agent()->warn("[Server] Rejected connection from UID {} (PID {})",
                                         peer ? static_cast<long>(peer->uid) : -1L,
                                         peer ? static_cast<long>(peer->pid) : -1L);
            boost::system::error_code ignored;
            socket.close(ignored);
        } else {
            std::make_shared<Connection>(self, std::move(socket))->start();
        }

        self->doAccept();
    });
}

void Server::armTimer() {
    timer_.expires_at(session_->expires_at);
    auto self = shared_from_this();
    timer_.async_wait([self](const boost::system::error_code& ec) {
        if (ec == asio::error::operation_aborted) return;
        if (self->session_ && self->session_->expired()) self->endSession("ttl elapsed");
    });
}

void Server::endSession(const std::string_view reason) {
    timer_.cancel();
    state_ = State::Locked;
    if (!session_) return;

    session_->key.key.wipe();
    session_.reset();

    log::Registry::agent()->info("[Server] Session ended: {}", reason);
    log::Registry::audit()->info("agent lock {} ({})", shrineFile_.string(), reason);
}

void Server::stop() {
    if (stopped_) return;
    stopped_ = true;

    endSession("agent shutdown");

    boost::system::error_code ec;
    acceptor_.close(ec);
    signals_.cancel(ec);

    std::error_code fsEc;
    fs::remove(socketPath_, fsEc);

    log::Registry::agent()->info("[Server] Stopped");
}

const Session& Server::requireSession() {
    if (!session_) throw error::SessionExpiredError();
    if (session_->expired()) {
        endSession("ttl elapsed");
        throw error::SessionExpiredError();
    }
    return *session_;
}

json Server::handle(json request) {
    const auto name = request.value("op", std::string{});
    try {
        if (name == op::UNLOCK) return onUnlock(request);
        if (name == op::GET) return onGet(request);
        if (name == op::SET) return onSet(request);
        if (name == op::RM) return onRm(request);
        if (name == op::LIST) return onList(request);
        if (name == op::LOCK) return onLock();
        if (name == op::STATUS) return onStatus();
        if (name == op::STOP) return onStop();
        throw error::InvalidArgumentError(fmt::format("Unknown agent operation '{}'", name));
    } catch (const error::ShrineError& e) {
        log::Registry::agent()->debug("[Server] {} failed: {}", name, e.what());
        return errorReply(e.code(), e.what());
    } catch (const json::exception& e) {
        return errorReply(error::Code::InvalidArgument, fmt::format("Malformed {} request: {}", name, e.what()));
    } catch (const std::exception& e) {
        log::Registry::agent()->error("[Server] {} failed: {}", name, e.what());
        return errorReply(error::Code::Generic, e.what());
    }
}

namespace {

constexpr int64_t MAX_TTL_SECONDS = std::numeric_limits<unsigned int>::max();

// A key that no longer opens the file (re-keyed elsewhere) is as good as expired
template <typename Fn>
auto withSessionRepo(const Session& session, const store::OpenMode mode, Fn&& fn, const std::function<void()>& onStale) {
    std::optional<store::Repository> repo;
    try {
        repo.emplace(store::Repository::open(session.shrine_path, session.key, mode));
    } catch (const error::IntegrityError&) {
        onStale();
        throw error::SessionExpiredError("agent key no longer matches the shrine; unlock again");
    }
    return fn(*repo);
}

}

json Server::onUnlock(json& req) {
    auto& password = req.at("password").get_ref<std::string&>();

    auto ttl = defaultTtl_;
    if (req.contains("ttl") && !req["ttl"].is_null()) ttl = std::chrono::seconds(req["ttl"].get<int64_t>());
    if (ttl.count() <= 0 || ttl.count() > MAX_TTL_SECONDS) {
        wipeString(password);
        throw error::InvalidArgumentError(fmt::format("Session TTL must be between 1 and {} seconds", MAX_TTL_SECONDS));
    }

    endSession("unlock requested");
    state_ = State::Unlocking;

    try {
        const auto blob = util::readFileToVector(shrineFile_);
        const auto header = store::Header::parse(blob);
        auto key = store::deriveKey(password, header);
        wipeString(password);

        (void)store::verify(key.key, blob);

        session_.emplace(Session{std::move(key), shrineFile_, Session::Clock::now() + ttl});
        state_ = State::Unlocked;
        armTimer();
    } catch (const std::exception& e) {
        wipeString(password);
        state_ = State::Locked;
        log::Registry::crypto()->warn("[Server] Unlock of {} failed: {}", shrineFile_.string(), e.what());
        throw;
    }

    log::Registry::agent()->info("[Server] Unlocked {} for {}s", shrineFile_.string(), ttl.count());
    log::Registry::audit()->info("agent unlock {}", shrineFile_.string());
    return okReply({{"ttl", ttl.count()}});
}

json Server::onGet(json& req) {
    const auto path = req.at("path").get<std::string>();
    const auto& session = requireSession();
    return withSessionRepo(session, store::OpenMode::Read, [&](const store::Repository& repo) {
        return okReply(secretToJson(repo.get(path)));
    }, [this] { endSession("shrine was re-keyed"); });
}

json Server::onSet(json& req) {
    const auto path = req.at("path").get<std::string>();
    auto& encoded = req.at("value").get_ref<std::string&>();
    auto value = crypto::hash::base64Decode(encoded);
    wipeString(encoded);

    const auto modeName = req.value("mode", std::string("text"));
    if (modeName != "text" && modeName != "binary")
        throw error::InvalidArgumentError(fmt::format("Unknown secret mode '{}'", modeName));
    const auto mode = types::mode_from_string(modeName);

    const auto& session = requireSession();
    return withSessionRepo(session, store::OpenMode::Write, [&](store::Repository& repo) {
        repo.set(path, std::move(value), mode);
        return okReply({{"warnings", repo.persist()}});
    }, [this] { endSession("shrine was re-keyed"); });
}

json Server::onRm(json& req) {
    const auto path = req.at("path").get<std::string>();
    const auto& session = requireSession();
    return withSessionRepo(session, store::OpenMode::Write, [&](store::Repository& repo) {
        repo.remove(path);
        return okReply({{"warnings", repo.persist()}});
    }, [this] { endSession("shrine was re-keyed"); });
}

json Server::onList(json& req) {
    std::optional<std::string> pattern;
    if (req.contains("pattern") && !req["pattern"].is_null()) pattern = req["pattern"].get<std::string>();

    const auto& session = requireSession();
    return withSessionRepo(session, store::OpenMode::Read, [&](const store::Repository& repo) {
        return okReply(listToJson(repo.list(pattern)));
    }, [this] { endSession("shrine was re-keyed"); });
}

json Server::onLock() {
    endSession("lock requested");
    return okReply();
}

json Server::onStatus() {
    if (session_ && session_->expired()) endSession("ttl elapsed");
    return okReply({
        {"pid", static_cast<int64_t>(::getpid())},
        {"state", to_string(state_)},
        {"seconds_left", session_ ? session_->remaining().count() : 0},
        {"shrine", shrineFile_.string()}
    });
}

json Server::onStop() {
    // Posted so the reply is still written
    auto self = shared_from_this();
    asio::post(ioc_, [self] { self->stop(); });
    return okReply();
}

int serve(const fs::path& shrineFile, const std::chrono::seconds ttl) {
    asio::io_context ioc;
    const auto server = std::make_shared<Server>(ioc, shrineFile, socketPathFor(shrineFile), ttl);
    server->start();
    ioc.run();
    server->stop();
    return 0;
}

}
