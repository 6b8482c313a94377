#include "agent/Client.hpp"
#include "agent/paths.hpp"
#include "agent/protocol.hpp"
#include "crypto/hash.hpp"
#include "log/Registry.hpp"

#include <fmt/core.h>
#include <array>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

using nlohmann::json;

namespace shrine::agent {

namespace {

bool readn(const int fd, void* buf, size_t n) {
    auto* p = static_cast<unsigned char*>(buf);
    while (n) {
        const ssize_t r = ::read(fd, p, n);
        if (r < 0 && errno == EINTR) continue;
        if (r <= 0) return false;
        p += r;
        n -= r;
    }
    return true;
}

bool writen(const int fd, const void* buf, size_t n) {
    auto* p = static_cast<const unsigned char*>(buf);
    while (n) {
        const ssize_t w = ::send(fd, p, n, MSG_NOSIGNAL);
        if (w < 0 && errno == EINTR) continue;
        if (w <= 0) return false;
        p += w;
        n -= w;
    }
    return true;
}

class Fd {
public:
    explicit Fd(const int fd) : fd_(fd) {}
    ~Fd() { if (fd_ >= 0) ::close(fd_); }
    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;
    [[nodiscard]] int get() const { return fd_; }

private:
    int fd_;
};

int connectTo(const std::filesystem::path& path) {
    const int s = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (s < 0) throw AgentUnavailable(fmt::format("socket(): {}", std::strerror(errno)));

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (path.string().size() >= sizeof(addr.sun_path)) {
        ::close(s);
        throw AgentUnavailable("agent socket path too long: " + path.string());
    }
    std::snprintf(addr.sun_path, sizeof(addr.sun_path), "%s", path.c_str());

    if (::connect(s, reinterpret_cast<sockaddr*>(&addr),
                  sizeof(sa_family_t) + std::strlen(addr.sun_path) + 1) != 0) {
        const std::string reason = std::strerror(errno);
        ::close(s);
        throw AgentUnavailable(fmt::format("connect {}: {}", path.string(), reason));
    }
    return s;
}

std::vector<std::string> warningsOf(const json& reply) {
    if (!reply.contains("data")) return {};
    return reply["data"].value("warnings", std::vector<std::string>{});
}

}

Client::Client(std::filesystem::path socketPath) : socketPath_(std::move(socketPath)) {}

Client Client::forShrine(const std::filesystem::path& shrineFile) { return Client(socketPathFor(shrineFile)); }

bool Client::reachable() const {
    std::error_code ec;
    if (!std::filesystem::exists(socketPath_, ec)) return false;
    try {
        const Fd fd(connectTo(socketPath_));
        return fd.get() >= 0;
    } catch (const AgentUnavailable& e) {
        log::Registry::agent()->debug("[Client] {}", e.what());
        return false;
    }
}

json Client::request(const json& req) const {
    std::error_code ec;
    if (!std::filesystem::exists(socketPath_, ec)) throw AgentUnavailable("no agent socket at " + socketPath_.string());

    const Fd fd(connectTo(socketPath_));

    auto frame = encodeFrame(req);
    const bool sent = writen(fd.get(), frame.data(), frame.size());
    wipeString(frame);
    if (!sent) throw AgentUnavailable("agent closed the connection");

    std::array<uint8_t, FRAME_HEADER_SIZE> header{};
    if (!readn(fd.get(), header.data(), header.size())) throw AgentUnavailable("agent closed the connection");

    const auto len = decodeLength(header);
    if (len > MAX_FRAME_SIZE) throw std::runtime_error("agent reply exceeds 1 MiB");

    std::string body(len, '\0');
    if (!readn(fd.get(), body.data(), len)) throw AgentUnavailable("agent closed the connection");

    auto reply = json::parse(body);
    wipeString(body);
    throwIfError(reply);
    return reply;
}

void Client::unlock(const std::string_view password, const std::optional<std::chrono::seconds> ttl) const {
    json req{{"op", op::UNLOCK}, {"password", std::string(password)}};
    if (ttl) req["ttl"] = ttl->count();
    try {
        (void)request(req);
    } catch (const std::exception&) {
        wipeString(req["password"].get_ref<std::string&>());
        throw;
    }
    wipeString(req["password"].get_ref<std::string&>());
}

types::Secret Client::get(const std::string& path) const {
    const auto reply = request({{"op", op::GET}, {"path", path}});
    return secretFromJson(reply.at("data"));
}

std::vector<std::string> Client::set(const std::string& path, const crypto::SecretBytes& value, const types::Mode mode) const {
    json req{
        {"op", op::SET},
        {"path", path},
        {"value", crypto::hash::base64Encode({value.data(), value.size()})},
        {"mode", types::to_string(mode)}
    };
    json reply;
    try {
        reply = request(req);
    } catch (const std::exception&) {
        wipeString(req["value"].get_ref<std::string&>());
        throw;
    }
    wipeString(req["value"].get_ref<std::string&>());
    return warningsOf(reply);
}

std::vector<std::string> Client::remove(const std::string& path) const {
    return warningsOf(request({{"op", op::RM}, {"path", path}}));
}

store::ListResult Client::list(const std::optional<std::string>& pattern) const {
    json req{{"op", op::LIST}};
    if (pattern) req["pattern"] = *pattern;
    return listFromJson(request(req).at("data"));
}

void Client::lock() const { (void)request({{"op", op::LOCK}}); }

Status Client::status() const {
    const auto data = request({{"op", op::STATUS}}).at("data");
    return {
        data.value("pid", 0L),
        data.value("state", std::string("locked")),
        data.value("seconds_left", 0L),
        data.value("shrine", std::string{})
    };
}

void Client::stop() const { (void)request({{"op", op::STOP}}); }

}
