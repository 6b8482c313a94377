#include <gtest/gtest.h>
#include "dispatch/Dispatcher.hpp"
#include "agent/Server.hpp"
#include "agent/paths.hpp"
#include "error/ShrineError.hpp"
#include "TempDir.hpp"

#include <stdexcept>
#include <thread>

using namespace shrine::dispatch;
using namespace shrine::store;
using shrine::crypto::SecretBytes;
using shrine::test::TempDir;
using shrine::types::Mode;

namespace {

SecretBytes noPrompt(std::string_view) {
    throw std::runtime_error("unexpected password prompt");
}

}

class DispatcherTest : public ::testing::Test {
protected:
    TempDir dir;

    void SetUp() override {
        (void)Repository::init(dir.shrineFile(), "password", {});
    }
};

TEST_F(DispatcherTest, ColdPathWithoutAgent) {
    PasswordSource password(std::string("password"), noPrompt);
    Dispatcher d(dir.shrineFile(), password);

    EXPECT_TRUE(std::holds_alternative<ColdPath>(d.select()));
    EXPECT_TRUE(d.set("secret", SecretBytes(std::string_view("password123")), Mode::Text).empty());
    EXPECT_EQ(d.get("secret").value.view(), "password123");
    EXPECT_EQ(d.list(std::nullopt).count(), 1u);
    EXPECT_TRUE(d.remove("secret").empty());
    EXPECT_EQ(d.list(std::nullopt).count(), 0u);
}

TEST_F(DispatcherTest, PromptsOnceWhenPasswordMissing) {
    int prompts = 0;
    PasswordSource password(std::nullopt, [&](std::string_view) {
        ++prompts;
        return SecretBytes(std::string_view("password"));
    });
    Dispatcher d(dir.shrineFile(), password, false);

    (void)d.set("a", SecretBytes(std::string_view("1")), Mode::Text);
    (void)d.set("b", SecretBytes(std::string_view("2")), Mode::Text);
    EXPECT_EQ(prompts, 1);
}

TEST_F(DispatcherTest, WrongPasswordSurfacesAsIntegrityError) {
    PasswordSource password(std::string("nope"), noPrompt);
    Dispatcher d(dir.shrineFile(), password, false);
    EXPECT_THROW((void)d.list(std::nullopt), shrine::error::IntegrityError);
}

TEST_F(DispatcherTest, LockedAgentFallsBackThenServesWarm) {
    shrine::agent::asio::io_context ioc;
    const auto server = std::make_shared<shrine::agent::Server>(
        ioc, dir.shrineFile(), shrine::agent::socketPathFor(dir.shrineFile()), std::chrono::seconds(60));
    server->start();
    std::thread loop([&] { ioc.run(); });

    {
        PasswordSource password(std::string("password"), noPrompt);
        Dispatcher d(dir.shrineFile(), password);
        ASSERT_TRUE(std::holds_alternative<WarmPath>(d.select()));
        (void)d.set("secret", SecretBytes(std::string_view("password123")), Mode::Text);
    }

    // The fallback handed the password to the agent; no prompt is needed now
    {
        PasswordSource password(std::nullopt, noPrompt);
        Dispatcher d(dir.shrineFile(), password);
        EXPECT_EQ(d.get("secret").value.view(), "password123");
        EXPECT_EQ(d.list(std::nullopt).count(), 1u);
    }

    shrine::agent::Client::forShrine(dir.shrineFile()).stop();
    loop.join();
}

TEST(PasswordSourceTest, PromptNewRequiresMatchingAnswers) {
    int n = 0;
    PasswordSource mismatched(std::nullopt, [&](std::string_view) {
        return SecretBytes(std::string_view(n++ == 0 ? "one" : "two"));
    });
    EXPECT_THROW((void)mismatched.promptNew("Password"), shrine::error::InvalidArgumentError);

    PasswordSource matched(std::nullopt, [](std::string_view) { return SecretBytes(std::string_view("same")); });
    EXPECT_EQ(matched.promptNew("Password").view(), "same");
}
