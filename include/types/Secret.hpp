#pragma once

#include "crypto/SecretBytes.hpp"

#include <nlohmann/json_fwd.hpp>
#include <ctime>
#include <map>
#include <optional>
#include <string>

namespace shrine::types {

enum class Mode { Text, Binary };

std::string to_string(Mode mode);
Mode mode_from_string(const std::string& str);

// Short form used in listings
std::string short_name(Mode mode);

struct Secret {
    crypto::SecretBytes value;
    Mode mode{Mode::Text};
    std::string created_by;
    std::time_t created_at{std::time(nullptr)};
    std::optional<std::string> updated_by;
    std::optional<std::time_t> updated_at;

    Secret() = default;
    Secret(crypto::SecretBytes value, Mode mode, std::string author);

    // Replaces value and mode, keeps the creation fields
    void overwrite(crypto::SecretBytes newValue, Mode newMode, std::string author);
};

using SecretStore = std::map<std::string, Secret>;

// Value travels as a json binary; callers wipe the json once serialized
void to_json(nlohmann::json& j, const Secret& s);
void from_json(const nlohmann::json& j, Secret& s);

}
