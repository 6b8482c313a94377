#pragma once

#include "agent/Session.hpp"

#include <utility>  // boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>
#include <nlohmann/json.hpp>
#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>

namespace shrine::agent {

namespace asio = boost::asio;
using local = asio::local::stream_protocol;

// Key-caching daemon for one shrine file. Single-threaded: connections, the TTL
// timer and termination signals all run on one io_context, one request at a time.
class Server : public std::enable_shared_from_this<Server> {
public:
    Server(asio::io_context& ioc, std::filesystem::path shrineFile, std::filesystem::path socketPath,
           std::chrono::seconds defaultTtl);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    // Binds the socket (0600) and starts accepting; the caller runs the io_context
    void start();

    // Clears the session, closes the listener and unlinks the socket
    void stop();

    // Serves one decoded request; errors come back as error replies. Secret-bearing
    // fields of the request are wiped once consumed.
    nlohmann::json handle(nlohmann::json request);

    [[nodiscard]] State state() const noexcept { return state_; }
    [[nodiscard]] const std::filesystem::path& socketPath() const noexcept { return socketPath_; }

private:
    class Connection;

    asio::io_context& ioc_;
    local::acceptor acceptor_;
    asio::steady_timer timer_;
    asio::signal_set signals_;

    std::filesystem::path shrineFile_;
    std::filesystem::path socketPath_;
    std::chrono::seconds defaultTtl_;

    State state_{State::Locked};
    std::optional<Session> session_;
    bool stopped_{false};

    void doAccept();
    void armTimer();

    // The only place a session is torn down: expiry, lock, stop and shutdown all land here
    void endSession(std::string_view reason);

    const Session& requireSession();

    nlohmann::json onUnlock(nlohmann::json& req);
    nlohmann::json onGet(nlohmann::json& req);
    nlohmann::json onSet(nlohmann::json& req);
    nlohmann::json onRm(nlohmann::json& req);
    nlohmann::json onList(nlohmann::json& req);
    nlohmann::json onLock();
    nlohmann::json onStatus();
    nlohmann::json onStop();
};

// Runs an agent for shrineFile in the foreground until stopped or signalled
int serve(const std::filesystem::path& shrineFile, std::chrono::seconds ttl);

}
