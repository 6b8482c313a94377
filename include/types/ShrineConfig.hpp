#pragma once

#include <nlohmann/json_fwd.hpp>
#include <map>
#include <optional>
#include <string>

namespace shrine::types {

// Options persisted inside the encrypted payload, next to the secrets
struct ShrineConfig {
    static constexpr const char* GIT_ENABLED = "git.enabled";
    static constexpr const char* GIT_COMMIT_AUTO = "git.commit.auto";
    static constexpr const char* GIT_PUSH_AUTO = "git.push.auto";

    std::map<std::string, std::string> values;

    [[nodiscard]] std::optional<std::string> get(const std::string& key) const;

    // Known boolean keys only accept "true" or "false"
    void set(const std::string& key, const std::string& value);

    [[nodiscard]] bool flag(const std::string& key, bool fallback = false) const;

    [[nodiscard]] bool gitEnabled() const { return flag(GIT_ENABLED); }
    [[nodiscard]] bool commitAuto() const { return flag(GIT_COMMIT_AUTO, true); }
    [[nodiscard]] bool pushAuto() const { return flag(GIT_PUSH_AUTO); }

    void seedGitDefaults();

    bool operator==(const ShrineConfig&) const = default;
};

void to_json(nlohmann::json& j, const ShrineConfig& c);
void from_json(const nlohmann::json& j, ShrineConfig& c);

}
