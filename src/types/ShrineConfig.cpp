#include "types/ShrineConfig.hpp"
#include "error/ShrineError.hpp"

#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <array>
#include <algorithm>

namespace shrine::types {

namespace {

bool isBooleanKey(const std::string& key) {
    static constexpr std::array keys = {
        ShrineConfig::GIT_ENABLED, ShrineConfig::GIT_COMMIT_AUTO, ShrineConfig::GIT_PUSH_AUTO
    };
    return std::ranges::any_of(keys, [&](const char* k) { return key == k; });
}

}

std::optional<std::string> ShrineConfig::get(const std::string& key) const {
    const auto it = values.find(key);
    if (it == values.end()) return std::nullopt;
    return it->second;
}

void ShrineConfig::set(const std::string& key, const std::string& value) {
    if (key.empty()) throw error::InvalidArgumentError("Config key must not be empty");
    if (isBooleanKey(key) && value != "true" && value != "false")
        throw error::InvalidArgumentError(fmt::format("Config key '{}' expects true or false, got '{}'", key, value));
    values[key] = value;
}

bool ShrineConfig::flag(const std::string& key, const bool fallback) const {
    const auto v = get(key);
    return v ? *v == "true" : fallback;
}

void ShrineConfig::seedGitDefaults() {
    values[GIT_ENABLED] = "true";
    values[GIT_COMMIT_AUTO] = "true";
    values[GIT_PUSH_AUTO] = "false";
}

void to_json(nlohmann::json& j, const ShrineConfig& c) {
    j = nlohmann::json::object();
    for (const auto& [k, v] : c.values) j[k] = v;
}

void from_json(const nlohmann::json& j, ShrineConfig& c) {
    c.values.clear();
    for (const auto& [k, v] : j.items()) c.values[k] = v.get<std::string>();
}

}
