#include "types/Secret.hpp"
#include "error/ShrineError.hpp"

#include <nlohmann/json.hpp>
#include <unordered_map>
#include <vector>

namespace shrine::types {

std::string to_string(const Mode mode) {
    switch (mode) {
        case Mode::Text: return "text";
        case Mode::Binary: return "binary";
        default: throw std::invalid_argument("Unknown Mode enum value");
    }
}

Mode mode_from_string(const std::string& str) {
    static const std::unordered_map<std::string, Mode> mapping = {
        {"text", Mode::Text}, {"binary", Mode::Binary}
    };
    const auto it = mapping.find(str);
    if (it != mapping.end()) return it->second;
    throw error::FormatError("Invalid secret mode: " + str);
}

std::string short_name(const Mode mode) { return mode == Mode::Binary ? "bin" : "txt"; }

Secret::Secret(crypto::SecretBytes value, const Mode mode, std::string author)
    : value(std::move(value)), mode(mode), created_by(std::move(author)) {}

void Secret::overwrite(crypto::SecretBytes newValue, const Mode newMode, std::string author) {
    value = std::move(newValue);
    mode = newMode;
    updated_by = std::move(author);
    updated_at = std::time(nullptr);
}

void to_json(nlohmann::json& j, const Secret& s) {
    j = {
        {"value", nlohmann::json::binary(std::vector<uint8_t>(s.value.data(), s.value.data() + s.value.size()))},
        {"mode", to_string(s.mode)},
        {"created_by", s.created_by},
        {"created_at", static_cast<int64_t>(s.created_at)}
    };
    if (s.updated_by) j["updated_by"] = *s.updated_by;
    if (s.updated_at) j["updated_at"] = static_cast<int64_t>(*s.updated_at);
}

void from_json(const nlohmann::json& j, Secret& s) {
    const auto& value = j.at("value");
    if (!value.is_binary()) throw error::FormatError("Secret value is not a binary field");

    const auto& bin = value.get_binary();
    s.value = crypto::SecretBytes(bin.data(), bin.size());
    s.mode = mode_from_string(j.at("mode").get<std::string>());
    s.created_by = j.at("created_by").get<std::string>();
    s.created_at = static_cast<std::time_t>(j.at("created_at").get<int64_t>());

    if (j.contains("updated_by")) s.updated_by = j.at("updated_by").get<std::string>();
    else s.updated_by.reset();

    if (j.contains("updated_at")) s.updated_at = static_cast<std::time_t>(j.at("updated_at").get<int64_t>());
    else s.updated_at.reset();
}

}
