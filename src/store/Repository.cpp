#include "store/Repository.hpp"
#include "config/ConfigRegistry.hpp"
#include "crypto/hash.hpp"
#include "error/ShrineError.hpp"
#include "log/Registry.hpp"
#include "types/SecretPath.hpp"
#include "util/files.hpp"

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <fmt/core.h>
#include <regex>

namespace fs = std::filesystem;

namespace shrine::store {

namespace {

uint32_t configuredIterations() {
    return config::ConfigRegistry::get().crypto.kdf_iterations;
}

std::vector<uint8_t> readShrine(const fs::path& file) {
    std::error_code ec;
    if (!fs::exists(file, ec)) throw error::NotFoundError(fmt::format("No shrine at {}", file.string()));
    return util::readFileToVector(file);
}

}

fs::path Repository::fileIn(const fs::path& folder) { return folder / FILE_NAME; }

Repository::Repository(fs::path file, const OpenMode mode, std::unique_ptr<FileLock> lock)
    : file_(std::move(file)), mode_(mode), lock_(std::move(lock)) {}

Repository::~Repository() = default;

std::vector<std::string> Repository::init(const fs::path& file, const std::string_view password, const InitOptions& opts) {
    auto lock = std::make_unique<FileLock>(FileLock::sidecarFor(file));

    std::error_code ec;
    const bool exists = fs::exists(file, ec);
    if (exists && !opts.force)
        throw error::AlreadyExistsError(fmt::format("Shrine already exists at {} (use --force to overwrite)", file.string()));

    Repository repo(file, OpenMode::Write, std::move(lock));
    repo.fingerprint_ = repo.currentFingerprint();

    repo.key_ = crypto::derive(password, crypto::generateSalt(), opts.iterations.value_or(configuredIterations()));
    repo.header_.uuid = boost::uuids::random_generator()();
    repo.header_.serialization = opts.serialization;
    if (opts.git) repo.payload_.config.seedGitDefaults();
    repo.pendingKind_ = git::ChangeKind::Initialize;

    log::Registry::store()->info("[Repository] Initializing shrine {} at {}",
                                 boost::uuids::to_string(repo.header_.uuid), file.string());
    log::Registry::audit()->info("init {}", file.string());

    return repo.persist();
}

Repository Repository::open(const fs::path& file, const std::string_view password, const OpenMode mode) {
    auto lock = mode == OpenMode::Write ? std::make_unique<FileLock>(FileLock::sidecarFor(file)) : nullptr;

    Repository repo(file, mode, std::move(lock));
    const auto blob = readShrine(file);
    repo.header_ = Header::parse(blob);
    repo.key_ = deriveKey(password, repo.header_);
    repo.load(blob);
    return repo;
}

Repository Repository::open(const fs::path& file, const crypto::DerivedKey& key, const OpenMode mode) {
    auto lock = mode == OpenMode::Write ? std::make_unique<FileLock>(FileLock::sidecarFor(file)) : nullptr;

    Repository repo(file, mode, std::move(lock));
    const auto blob = readShrine(file);
    repo.header_ = Header::parse(blob);
    if (!key.matches(repo.header_.salt, repo.header_.iterations)) throw error::IntegrityError();
    repo.key_ = key;
    repo.load(blob);
    return repo;
}

Header Repository::readHeader(const fs::path& file) {
    return Header::parse(readShrine(file));
}

void Repository::load(const std::vector<uint8_t>& blob) {
    payload_ = decode(blob, key_.key);
    fingerprint_ = crypto::hash::blake2b(blob);
    log::Registry::store()->debug("[Repository] Loaded {} secrets from {}", payload_.secrets.size(), file_.string());
}

std::string Repository::currentFingerprint() const {
    std::error_code ec;
    if (!fs::exists(file_, ec)) return {};
    return crypto::hash::blake2b(util::readFileToVector(file_));
}

void Repository::requireWritable(const std::string_view op) const {
    if (mode_ != OpenMode::Write)
        throw std::logic_error(fmt::format("[Repository] {} on a shrine opened read-only", op));
}

const types::Secret& Repository::get(const std::string& path) const {
    types::validateSecretPath(path);
    const auto it = payload_.secrets.find(path);
    if (it == payload_.secrets.end()) throw error::NotFoundError(fmt::format("Key '{}' not found", path));
    return it->second;
}

void Repository::set(const std::string& path, crypto::SecretBytes value, const types::Mode mode) {
    requireWritable("set");
    types::validateSecretPath(path);

    if (const auto it = payload_.secrets.find(path); it != payload_.secrets.end())
        it->second.overwrite(std::move(value), mode, util::currentIdentity());
    else
        payload_.secrets.emplace(path, types::Secret(std::move(value), mode, util::currentIdentity()));

    log::Registry::audit()->info("set {} in {}", path, file_.string());
}

void Repository::remove(const std::string& path) {
    requireWritable("remove");
    types::validateSecretPath(path);

    if (payload_.secrets.erase(path) == 0) throw error::NotFoundError(fmt::format("Key '{}' not found", path));
    log::Registry::audit()->info("rm {} in {}", path, file_.string());
}

ListResult Repository::list(const std::optional<std::string>& pattern) const {
    std::optional<std::regex> rx;
    if (pattern) {
        try {
            rx.emplace(*pattern, std::regex::ECMAScript);
        } catch (const std::regex_error& e) {
            throw error::InvalidArgumentError(fmt::format("Invalid pattern '{}': {}", *pattern, e.what()));
        }
    }

    ListResult out;
    for (const auto& [path, secret] : payload_.secrets) {
        if (rx && !std::regex_search(path, *rx)) continue;
        out.entries.push_back({path, secret.mode, secret.created_by, secret.created_at,
                               secret.updated_by, secret.updated_at});
    }
    return out;
}

size_t Repository::importEntries(const std::vector<util::EnvPair>& entries, const std::string& prefix) {
    requireWritable("import");

    for (const auto& [key, value] : entries) types::validateSecretPath(prefix + key);
    for (const auto& [key, value] : entries) set(prefix + key, crypto::SecretBytes(value), types::Mode::Text);

    log::Registry::store()->info("[Repository] Imported {} keys with prefix '{}'", entries.size(), prefix);
    return entries.size();
}

std::optional<std::string> Repository::configGet(const std::string& key) const {
    return payload_.config.get(key);
}

void Repository::configSet(const std::string& key, const std::string& value) {
    requireWritable("config set");
    payload_.config.set(key, value);
    log::Registry::audit()->info("config set {}={} in {}", key, value, file_.string());
}

std::vector<std::string> Repository::convert(const std::string_view newPassword) {
    requireWritable("convert");
    key_ = crypto::derive(newPassword, crypto::generateSalt(), configuredIterations());
    log::Registry::audit()->info("convert {}", file_.string());
    return persist();
}

std::vector<std::string> Repository::persist() {
    requireWritable("persist");

    if (currentFingerprint() != fingerprint_)
        throw error::ConcurrentModificationError(
            fmt::format("{} changed since it was loaded; aborting write", file_.string()));

    const auto blob = encode(payload_, header_, key_);
    util::writeFileAtomic(file_, blob);

    header_ = Header::parse(blob);
    fingerprint_ = crypto::hash::blake2b(blob);

    log::Registry::store()->info("[Repository] Persisted {} secrets to {}", payload_.secrets.size(), file_.string());

    const auto kind = pendingKind_;
    pendingKind_ = git::ChangeKind::Update;
    return git::Adapter(file_).record(kind, payload_.config);
}

}
