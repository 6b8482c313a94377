#include <gtest/gtest.h>
#include "agent/Client.hpp"
#include "agent/Server.hpp"
#include "agent/paths.hpp"
#include "agent/protocol.hpp"
#include "crypto/hash.hpp"
#include "store/Repository.hpp"
#include "util/files.hpp"
#include "TempDir.hpp"

#include <limits>
#include <sys/stat.h>
#include <thread>

using namespace shrine::agent;
using namespace shrine::store;
using nlohmann::json;
using shrine::crypto::SecretBytes;
using shrine::test::TempDir;
using shrine::types::Mode;

namespace {

std::string b64(const std::string& s) {
    return shrine::crypto::hash::base64Encode(
        std::span(reinterpret_cast<const uint8_t*>(s.data()), s.size()));
}

}

class AgentServerTest : public ::testing::Test {
protected:
    TempDir dir;
    asio::io_context ioc;
    std::shared_ptr<Server> server;

    void SetUp() override {
        (void)Repository::init(dir.shrineFile(), "password", {});
        auto repo = Repository::open(dir.shrineFile(), "password", OpenMode::Write);
        repo.set("secret", SecretBytes(std::string_view("password123")), Mode::Text);
        (void)repo.persist();

        server = std::make_shared<Server>(ioc, dir.shrineFile(), socketPathFor(dir.shrineFile()),
                                          std::chrono::seconds(60));
    }

    void TearDown() override {
        server->stop();
        ioc.restart();
        ioc.run(); // drain aborted handlers holding the server
    }

    json unlock(const std::string& password, std::optional<int64_t> ttl = std::nullopt) {
        json req{{"op", op::UNLOCK}, {"password", password}};
        if (ttl) req["ttl"] = *ttl;
        return server->handle(req);
    }

    static std::string errorOf(const json& reply) {
        return reply.at("ok").get<bool>() ? "" : reply.at("error").get<std::string>();
    }
};

TEST_F(AgentServerTest, LockedAgentAnswersSessionExpired) {
    EXPECT_EQ(server->state(), State::Locked);
    EXPECT_EQ(errorOf(server->handle({{"op", op::GET}, {"path", "secret"}})), "SessionExpired");
    EXPECT_EQ(server->handle({{"op", op::STATUS}})["data"]["state"], "locked");
}

TEST_F(AgentServerTest, WrongPasswordLeavesAgentLocked) {
    EXPECT_EQ(errorOf(unlock("wrong")), "BadPassword");
    EXPECT_EQ(server->state(), State::Locked);
}

TEST_F(AgentServerTest, UnlockedSessionServesOperations) {
    ASSERT_TRUE(unlock("password")["ok"].get<bool>());
    EXPECT_EQ(server->state(), State::Unlocked);

    const auto got = server->handle({{"op", op::GET}, {"path", "secret"}});
    ASSERT_TRUE(got["ok"].get<bool>());
    EXPECT_EQ(secretFromJson(got["data"]).value.view(), "password123");

    const auto set = server->handle({{"op", op::SET}, {"path", "api/token"}, {"value", b64("t0k")}, {"mode", "text"}});
    ASSERT_TRUE(set["ok"].get<bool>());

    const auto listed = listFromJson(server->handle({{"op", op::LIST}, {"pattern", "^api/"}})["data"]);
    EXPECT_EQ(listed.count(), 1u);

    EXPECT_EQ(errorOf(server->handle({{"op", op::GET}, {"path", "missing"}})), "NotFound");

    ASSERT_TRUE(server->handle({{"op", op::RM}, {"path", "api/token"}})["ok"].get<bool>());
    const auto repo = Repository::open(dir.shrineFile(), "password", OpenMode::Read);
    EXPECT_EQ(repo.list(std::nullopt).count(), 1u);
}

TEST_F(AgentServerTest, LockEndsSession) {
    ASSERT_TRUE(unlock("password")["ok"].get<bool>());
    ASSERT_TRUE(server->handle({{"op", op::LOCK}})["ok"].get<bool>());
    EXPECT_EQ(server->state(), State::Locked);
    EXPECT_EQ(errorOf(server->handle({{"op", op::GET}, {"path", "secret"}})), "SessionExpired");
}

TEST_F(AgentServerTest, SessionExpiresAtFixedDeadline) {
    ASSERT_TRUE(unlock("password", 1)["ok"].get<bool>());
    EXPECT_TRUE(server->handle({{"op", op::GET}, {"path", "secret"}})["ok"].get<bool>());

    std::this_thread::sleep_for(std::chrono::milliseconds(1200));
    EXPECT_EQ(errorOf(server->handle({{"op", op::GET}, {"path", "secret"}})), "SessionExpired");
    EXPECT_EQ(server->state(), State::Locked);
}

TEST_F(AgentServerTest, NonPositiveTtlIsRejected) {
    EXPECT_EQ(errorOf(unlock("password", 0)), "InvalidArgument");
    EXPECT_EQ(server->state(), State::Locked);
}

TEST_F(AgentServerTest, OversizedTtlIsRejected) {
    EXPECT_EQ(errorOf(unlock("password", 1'000'000'000'000)), "InvalidArgument");
    EXPECT_EQ(server->state(), State::Locked);

    EXPECT_EQ(errorOf(unlock("password", int64_t{std::numeric_limits<unsigned int>::max()} + 1)), "InvalidArgument");
    EXPECT_TRUE(unlock("password", std::numeric_limits<unsigned int>::max())["ok"].get<bool>());
    EXPECT_EQ(server->state(), State::Unlocked);
}

TEST_F(AgentServerTest, UnknownSecretModeIsInvalidArgument) {
    ASSERT_TRUE(unlock("password")["ok"].get<bool>());
    const auto set = server->handle({{"op", op::SET}, {"path", "api/token"}, {"value", b64("t0k")}, {"mode", "weird"}});
    EXPECT_EQ(errorOf(set), "InvalidArgument");

    const auto repo = Repository::open(dir.shrineFile(), "password", OpenMode::Read);
    EXPECT_EQ(repo.list(std::nullopt).count(), 1u);
}

TEST_F(AgentServerTest, CorruptedIterationCountIsBadPassword) {
    auto blob = shrine::util::readFileToVector(dir.shrineFile());
    blob[25] = 0x80; // top byte of the big-endian iteration count
    shrine::util::writeFileAtomic(dir.shrineFile(), blob);

    EXPECT_EQ(errorOf(unlock("password")), "BadPassword");
    EXPECT_EQ(server->state(), State::Locked);
}

TEST_F(AgentServerTest, ReKeyedShrineExpiresSession) {
    ASSERT_TRUE(unlock("password")["ok"].get<bool>());
    {
        auto repo = Repository::open(dir.shrineFile(), "password", OpenMode::Write);
        (void)repo.convert("password2");
    }
    EXPECT_EQ(errorOf(server->handle({{"op", op::GET}, {"path", "secret"}})), "SessionExpired");
    EXPECT_EQ(server->state(), State::Locked);
}

TEST_F(AgentServerTest, UnknownOperationIsInvalidArgument) {
    EXPECT_EQ(errorOf(server->handle({{"op", "explode"}})), "InvalidArgument");
}

TEST_F(AgentServerTest, ClientTalksOverOwnerOnlySocket) {
    server->start();
    std::thread loop([this] { ioc.run(); });

    struct stat st{};
    ASSERT_EQ(::stat(server->socketPath().c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0600u);

    const auto client = Client::forShrine(dir.shrineFile());
    EXPECT_TRUE(client.reachable());
    EXPECT_THROW((void)client.get("secret"), shrine::error::SessionExpiredError);

    client.unlock("password");
    EXPECT_EQ(client.get("secret").value.view(), "password123");
    EXPECT_TRUE(client.set("bin", SecretBytes(std::string_view("\x01\x02")), Mode::Binary).empty());
    EXPECT_EQ(client.get("bin").mode, Mode::Binary);
    EXPECT_EQ(client.list(std::nullopt).count(), 2u);

    const auto st2 = client.status();
    EXPECT_EQ(st2.state, "unlocked");
    EXPECT_GT(st2.seconds_left, 0);

    client.stop();
    loop.join();

    EXPECT_FALSE(std::filesystem::exists(server->socketPath()));
    EXPECT_THROW(client.lock(), AgentUnavailable);
}

TEST(AgentProtocolTest, FrameLengthIsBigEndian) {
    const auto frame = encodeFrame(json{{"op", "status"}});
    std::array<uint8_t, FRAME_HEADER_SIZE> header{};
    std::copy_n(frame.begin(), FRAME_HEADER_SIZE, header.begin());
    EXPECT_EQ(decodeLength(header), frame.size() - FRAME_HEADER_SIZE);
    EXPECT_EQ(header[0], 0);
}

TEST(AgentPathsTest, SocketPathIsStablePerShrine) {
    const auto a = socketPathFor("/tmp/x/shrine");
    EXPECT_EQ(a, socketPathFor("/tmp/x/shrine"));
    EXPECT_NE(a, socketPathFor("/tmp/y/shrine"));
    EXPECT_EQ(a.parent_path(), runtimeDir());
    EXPECT_EQ(a.extension(), ".sock");
}
