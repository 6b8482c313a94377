#pragma once

#include "crypto/KeyDerivation.hpp"
#include "git/Adapter.hpp"
#include "store/FileLock.hpp"
#include "store/ShrineFile.hpp"
#include "store/StoreCodec.hpp"
#include "util/dotenv.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace shrine::store {

enum class OpenMode { Read, Write };

struct InitOptions {
    bool force = false;
    bool git = false;
    Serialization serialization = Serialization::Bson;
    std::optional<uint32_t> iterations;     // defaults to crypto.kdf_iterations
};

struct ListEntry {
    std::string path;
    types::Mode mode{types::Mode::Text};
    std::string created_by;
    std::time_t created_at{0};
    std::optional<std::string> updated_by;
    std::optional<std::time_t> updated_at;
};

struct ListResult {
    std::vector<ListEntry> entries;     // sorted by path

    [[nodiscard]] size_t count() const { return entries.size(); }
};

// One load -> mutate -> persist cycle over a shrine file. Write mode holds the
// sidecar lock from open() until destruction.
class Repository {
public:
    static constexpr const char* FILE_NAME = "shrine";

    static std::filesystem::path fileIn(const std::filesystem::path& folder);

    // Writes an empty shrine and returns git warnings. AlreadyExists unless opts.force.
    static std::vector<std::string> init(const std::filesystem::path& file, std::string_view password,
                                         const InitOptions& opts);

    static Repository open(const std::filesystem::path& file, std::string_view password, OpenMode mode);

    // Opens with a cached key; IntegrityError if the key does not belong to the file
    static Repository open(const std::filesystem::path& file, const crypto::DerivedKey& key, OpenMode mode);

    // Header only, no password needed
    static Header readHeader(const std::filesystem::path& file);

    Repository(Repository&&) noexcept = default;
    Repository& operator=(Repository&&) noexcept = default;
    ~Repository();

    [[nodiscard]] const types::Secret& get(const std::string& path) const;
    void set(const std::string& path, crypto::SecretBytes value, types::Mode mode);
    void remove(const std::string& path);
    [[nodiscard]] ListResult list(const std::optional<std::string>& pattern) const;

    // Returns the number of imported keys
    size_t importEntries(const std::vector<util::EnvPair>& entries, const std::string& prefix);

    [[nodiscard]] std::optional<std::string> configGet(const std::string& key) const;
    void configSet(const std::string& key, const std::string& value);

    // New salt and key from newPassword, then persist. The old file stays valid
    // until the rename.
    std::vector<std::string> convert(std::string_view newPassword);

    // Atomic replace followed by the git record; returns git warnings
    std::vector<std::string> persist();

    [[nodiscard]] const Header& header() const { return header_; }
    [[nodiscard]] const crypto::DerivedKey& key() const { return key_; }
    [[nodiscard]] const types::ShrineConfig& config() const { return payload_.config; }
    [[nodiscard]] const types::SecretStore& secrets() const { return payload_.secrets; }
    [[nodiscard]] const std::filesystem::path& file() const { return file_; }

private:
    std::filesystem::path file_;
    OpenMode mode_;
    std::unique_ptr<FileLock> lock_;
    Header header_;
    crypto::DerivedKey key_;
    Payload payload_;
    std::string fingerprint_;
    git::ChangeKind pendingKind_{git::ChangeKind::Update};

    Repository(std::filesystem::path file, OpenMode mode, std::unique_ptr<FileLock> lock);

    void load(const std::vector<uint8_t>& blob);
    [[nodiscard]] std::string currentFingerprint() const;
    void requireWritable(std::string_view op) const;
};

}
