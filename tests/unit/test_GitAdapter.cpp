#include <gtest/gtest.h>
#include "git/Adapter.hpp"
#include "store/Repository.hpp"
#include "util/process.hpp"
#include "TempDir.hpp"

#include <sstream>

using namespace shrine::store;
using shrine::crypto::SecretBytes;
using shrine::test::TempDir;
using shrine::types::Mode;

class GitAdapterTest : public ::testing::Test {
protected:
    TempDir dir;

    void SetUp() override {
        if (shrine::util::runProcess({"git", "--version"}, dir.path()).exit_code != 0)
            GTEST_SKIP() << "git executable not available";
    }

    std::vector<std::string> commitSubjects() const {
        const auto res = shrine::util::runProcess({"git", "log", "--format=%s"}, dir.path());
        std::vector<std::string> out;
        if (res.exit_code != 0) return out;
        std::istringstream in(res.output);
        for (std::string line; std::getline(in, line);)
            if (!line.empty()) out.push_back(line);
        return out;
    }

    void set(const std::string& path, const std::string& value) {
        auto repo = Repository::open(dir.shrineFile(), "password", OpenMode::Write);
        repo.set(path, SecretBytes(std::string_view(value)), Mode::Text);
        EXPECT_TRUE(repo.persist().empty());
    }
};

TEST_F(GitAdapterTest, CommitsFollowTheShrineLifecycle) {
    InitOptions opts;
    opts.git = true;
    EXPECT_TRUE(Repository::init(dir.shrineFile(), "password", opts).empty());
    EXPECT_TRUE(std::filesystem::exists(dir.path() / ".git"));
    EXPECT_EQ(commitSubjects(), (std::vector<std::string>{"Initialize shrine"}));

    set("secret", "password123");
    EXPECT_EQ(commitSubjects(), (std::vector<std::string>{"Update shrine", "Initialize shrine"}));

    {
        auto repo = Repository::open(dir.shrineFile(), "password", OpenMode::Write);
        repo.configSet("git.commit.auto", "false");
        (void)repo.persist();
    }
    set("other", "value");
    EXPECT_EQ(commitSubjects().size(), 2u);
}

TEST_F(GitAdapterTest, DisabledGitLeavesFolderAlone) {
    (void)Repository::init(dir.shrineFile(), "password", {});
    set("secret", "v");
    EXPECT_FALSE(std::filesystem::exists(dir.path() / ".git"));
}

TEST_F(GitAdapterTest, PushFailureIsOnlyAWarning) {
    InitOptions opts;
    opts.git = true;
    (void)Repository::init(dir.shrineFile(), "password", opts);

    auto repo = Repository::open(dir.shrineFile(), "password", OpenMode::Write);
    repo.configSet("git.push.auto", "true");
    const auto warnings = repo.persist();   // no remote configured
    EXPECT_FALSE(warnings.empty());
    EXPECT_EQ(commitSubjects().front(), "Update shrine");
}

TEST(GitCommitMessageTest, Messages) {
    EXPECT_EQ(shrine::git::commitMessage(shrine::git::ChangeKind::Initialize), "Initialize shrine");
    EXPECT_EQ(shrine::git::commitMessage(shrine::git::ChangeKind::Update), "Update shrine");
}
