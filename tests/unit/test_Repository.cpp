#include <gtest/gtest.h>
#include "store/Repository.hpp"
#include "error/ShrineError.hpp"
#include "util/files.hpp"
#include "TempDir.hpp"

#include <csignal>
#include <set>
#include <sys/resource.h>
#include <sys/stat.h>
#include <unistd.h>

using namespace shrine::store;
using namespace shrine::types;
using shrine::crypto::SecretBytes;
using shrine::test::TempDir;

class RepositoryTest : public ::testing::Test {
protected:
    TempDir dir;
    std::filesystem::path file;

    void SetUp() override {
        file = dir.shrineFile();
        (void)Repository::init(file, "password", {});
    }

    void put(const std::string& path, const std::string& value) {
        auto repo = Repository::open(file, "password", OpenMode::Write);
        repo.set(path, SecretBytes(std::string_view(value)), Mode::Text);
        (void)repo.persist();
    }

    std::string read(const std::string& path, const std::string& password = "password") const {
        const auto repo = Repository::open(file, password, OpenMode::Read);
        return std::string(repo.get(path).value.view());
    }

    static std::set<std::string> paths(const ListResult& res) {
        std::set<std::string> out;
        for (const auto& e : res.entries) out.insert(e.path);
        return out;
    }
};

TEST_F(RepositoryTest, InitWritesEmptyShrine) {
    const auto repo = Repository::open(file, "password", OpenMode::Read);
    EXPECT_EQ(repo.list(std::nullopt).count(), 0u);
    EXPECT_EQ(repo.header().iterations, 1000u);
    EXPECT_FALSE(repo.config().gitEnabled());
}

TEST_F(RepositoryTest, InitRefusesToOverwriteWithoutForce) {
    put("a", "1");
    EXPECT_THROW((void)Repository::init(file, "other", {}), shrine::error::AlreadyExistsError);

    InitOptions opts;
    opts.force = true;
    (void)Repository::init(file, "other", opts);
    const auto repo = Repository::open(file, "other", OpenMode::Read);
    EXPECT_EQ(repo.list(std::nullopt).count(), 0u);
}

TEST_F(RepositoryTest, OpenMissingShrineIsNotFound) {
    EXPECT_THROW((void)Repository::open(dir.path() / "nope" / "shrine", "password", OpenMode::Read),
                 shrine::error::NotFoundError);
}

TEST_F(RepositoryTest, WrongPasswordIsIntegrityError) {
    EXPECT_THROW((void)Repository::open(file, "wrong", OpenMode::Read), shrine::error::IntegrityError);
}

TEST_F(RepositoryTest, SetGetOverwriteRemove) {
    put("db/password", "hunter2");
    EXPECT_EQ(read("db/password"), "hunter2");

    put("db/password", "hunter3");
    {
        const auto repo = Repository::open(file, "password", OpenMode::Read);
        const auto& s = repo.get("db/password");
        EXPECT_EQ(s.value.view(), "hunter3");
        EXPECT_TRUE(s.updated_by.has_value());
        EXPECT_TRUE(s.updated_at.has_value());
    }

    auto repo = Repository::open(file, "password", OpenMode::Write);
    repo.remove("db/password");
    (void)repo.persist();
    EXPECT_THROW((void)read("db/password"), shrine::error::NotFoundError);
}

TEST_F(RepositoryTest, MissingKeysAndBadPathsAreRejected) {
    auto repo = Repository::open(file, "password", OpenMode::Write);
    EXPECT_THROW((void)repo.get("absent"), shrine::error::NotFoundError);
    EXPECT_THROW(repo.remove("absent"), shrine::error::NotFoundError);
    EXPECT_THROW(repo.set("", SecretBytes(std::string_view("v")), Mode::Text), shrine::error::InvalidArgumentError);
    EXPECT_THROW(repo.set("/lead", SecretBytes(std::string_view("v")), Mode::Text), shrine::error::InvalidArgumentError);
    EXPECT_THROW(repo.set("a//b", SecretBytes(std::string_view("v")), Mode::Text), shrine::error::InvalidArgumentError);
}

TEST_F(RepositoryTest, ListFiltersByRegexAndCountsMatches) {
    put("app/db/user", "u");
    put("app/db/pass", "p");
    put("web/token", "t");

    const auto repo = Repository::open(file, "password", OpenMode::Read);
    const auto all = repo.list(std::nullopt);
    EXPECT_EQ(all.count(), 3u);
    EXPECT_EQ(all.entries.front().path, "app/db/pass");

    const auto db = repo.list(std::string("^app/db/"));
    EXPECT_EQ(db.count(), 2u);
    EXPECT_EQ(paths(db), (std::set<std::string>{"app/db/user", "app/db/pass"}));

    EXPECT_EQ(repo.list(std::string("nothing-here")).count(), 0u);
    EXPECT_THROW((void)repo.list(std::string("([")), shrine::error::InvalidArgumentError);
}

TEST_F(RepositoryTest, ConvertReKeysWithoutChangingContent) {
    put("secret", "password123");

    {
        auto repo = Repository::open(file, "password", OpenMode::Write);
        (void)repo.convert("password2");
    }

    EXPECT_EQ(read("secret", "password2"), "password123");
    EXPECT_THROW((void)read("secret", "password"), shrine::error::IntegrityError);
}

TEST_F(RepositoryTest, CachedKeyMustMatchHeader) {
    const auto key = Repository::open(file, "password", OpenMode::Read).key();
    EXPECT_NO_THROW((void)Repository::open(file, key, OpenMode::Read));

    {
        auto repo = Repository::open(file, "password", OpenMode::Write);
        (void)repo.convert("password");
    }
    EXPECT_THROW((void)Repository::open(file, key, OpenMode::Read), shrine::error::IntegrityError);
}

TEST_F(RepositoryTest, PersistDetectsConcurrentModification) {
    auto repo = Repository::open(file, "password", OpenMode::Write);

    // Another writer replaced the file after we loaded it
    TempDir other;
    (void)Repository::init(other.shrineFile(), "password", {});
    shrine::util::writeFileAtomic(file, shrine::util::readFileToVector(other.shrineFile()));

    repo.set("k", SecretBytes(std::string_view("v")), Mode::Text);
    EXPECT_THROW((void)repo.persist(), shrine::error::ConcurrentModificationError);
}

TEST_F(RepositoryTest, ReadOnlyRepositoryCannotPersist) {
    auto repo = Repository::open(file, "password", OpenMode::Read);
    EXPECT_THROW(repo.set("k", SecretBytes(std::string_view("v")), Mode::Text), std::logic_error);
}

TEST_F(RepositoryTest, ImportIsIdempotentForSameInput) {
    const std::vector<shrine::util::EnvPair> entries{{"key1", "val1"}, {"key2", "val2=="}};

    for (int i = 0; i < 2; ++i) {
        auto repo = Repository::open(file, "password", OpenMode::Write);
        EXPECT_EQ(repo.importEntries(entries, "env/"), 2u);
        (void)repo.persist();
    }

    const auto repo = Repository::open(file, "password", OpenMode::Read);
    EXPECT_EQ(repo.list(std::nullopt).count(), 2u);
    EXPECT_EQ(repo.get("env/key2").value.view(), "val2==");
}

TEST_F(RepositoryTest, ImportValidatesEverythingBeforeWriting) {
    auto repo = Repository::open(file, "password", OpenMode::Write);
    const std::vector<shrine::util::EnvPair> entries{{"good", "1"}, {"bad//key", "2"}};
    EXPECT_THROW((void)repo.importEntries(entries, ""), shrine::error::InvalidArgumentError);
    EXPECT_EQ(repo.list(std::nullopt).count(), 0u);
}

TEST_F(RepositoryTest, ConfigValuesPersist) {
    {
        auto repo = Repository::open(file, "password", OpenMode::Write);
        repo.configSet("git.push.auto", "true");
        EXPECT_THROW(repo.configSet("git.push.auto", "yes"), shrine::error::InvalidArgumentError);
        (void)repo.persist();
    }
    const auto repo = Repository::open(file, "password", OpenMode::Read);
    EXPECT_EQ(repo.configGet("git.push.auto"), std::optional<std::string>("true"));
    EXPECT_FALSE(repo.configGet("unset.key").has_value());
}

TEST_F(RepositoryTest, CorruptedIterationCountOnDiskIsIntegrityError) {
    auto blob = shrine::util::readFileToVector(file);
    blob[25] = 0x80;
    shrine::util::writeFileAtomic(file, blob);
    EXPECT_THROW((void)Repository::open(file, "password", OpenMode::Read), shrine::error::IntegrityError);
}

TEST_F(RepositoryTest, DirectoryInPlaceOfShrineIsIoError) {
    TempDir other;
    std::filesystem::create_directory(other.shrineFile());
    EXPECT_THROW((void)shrine::util::readFileToVector(other.shrineFile()), shrine::error::IoError);
    EXPECT_THROW((void)shrine::util::readFileToString(other.shrineFile()), shrine::error::IoError);
    EXPECT_THROW((void)Repository::open(other.shrineFile(), "password", OpenMode::Read), shrine::error::IoError);
}

class FailedWriteTest : public RepositoryTest {
protected:
    void SetUp() override {
        RepositoryTest::SetUp();
        put("secret", "password123");
        original = shrine::util::readFileToVector(file);
    }

    std::vector<uint8_t> original;

    // Leftovers of writeFileAtomic look like ".shrine.XXXXXX"
    std::vector<std::string> tempFiles() const {
        std::vector<std::string> out;
        for (const auto& e : std::filesystem::directory_iterator(dir.path()))
            if (e.path().filename().string().starts_with(".shrine.")) out.push_back(e.path().filename().string());
        return out;
    }

    void expectOriginalIntact() const {
        EXPECT_EQ(shrine::util::readFileToVector(file), original);
        EXPECT_EQ(read("secret"), "password123");
        EXPECT_THROW((void)read("added"), shrine::error::NotFoundError);
        EXPECT_TRUE(tempFiles().empty());
    }
};

TEST_F(FailedWriteTest, ReadOnlyFolderLeavesShrineUntouched) {
    if (::geteuid() == 0) GTEST_SKIP() << "root ignores directory permissions";

    {
        auto repo = Repository::open(file, "password", OpenMode::Write);
        repo.set("added", SecretBytes(std::string_view("v")), Mode::Text);
        ::chmod(dir.path().c_str(), 0500);
        EXPECT_THROW((void)repo.persist(), shrine::error::IoError);
        ::chmod(dir.path().c_str(), 0700);
    }
    {
        auto repo = Repository::open(file, "password", OpenMode::Write);
        ::chmod(dir.path().c_str(), 0500);
        EXPECT_THROW((void)repo.convert("password2"), shrine::error::IoError);
        ::chmod(dir.path().c_str(), 0700);
    }

    expectOriginalIntact();
    EXPECT_THROW((void)read("secret", "password2"), shrine::error::IntegrityError);
}

TEST_F(FailedWriteTest, ShortWriteLeavesShrineUntouched) {
    // RLIMIT_FSIZE binds root too; writes past it fail with EFBIG
    const auto prevHandler = std::signal(SIGXFSZ, SIG_IGN);
    rlimit prev{};
    ASSERT_EQ(::getrlimit(RLIMIT_FSIZE, &prev), 0);
    rlimit small = prev;
    small.rlim_cur = 16;

    {
        auto repo = Repository::open(file, "password", OpenMode::Write);
        repo.set("added", SecretBytes(std::string_view("v")), Mode::Text);
        ASSERT_EQ(::setrlimit(RLIMIT_FSIZE, &small), 0);
        EXPECT_THROW((void)repo.persist(), shrine::error::IoError);
        ::setrlimit(RLIMIT_FSIZE, &prev);
    }
    {
        auto repo = Repository::open(file, "password", OpenMode::Write);
        ASSERT_EQ(::setrlimit(RLIMIT_FSIZE, &small), 0);
        EXPECT_THROW((void)repo.convert("password2"), shrine::error::IoError);
        ::setrlimit(RLIMIT_FSIZE, &prev);
    }
    std::signal(SIGXFSZ, prevHandler);

    expectOriginalIntact();
    EXPECT_THROW((void)read("secret", "password2"), shrine::error::IntegrityError);
}
