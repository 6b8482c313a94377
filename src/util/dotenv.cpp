#include "util/dotenv.hpp"
#include "error/ShrineError.hpp"

#include <fmt/core.h>

namespace shrine::util {

namespace {

std::string stripComment(const std::string_view raw) {
    std::string out;
    out.reserve(raw.size());
    for (size_t i = 0; i < raw.size(); ++i) {
        if (raw[i] == '\\' && i + 1 < raw.size() && raw[i + 1] == '#') {
            out.push_back('#');
            ++i;
            continue;
        }
        if (raw[i] == '#') break;
        out.push_back(raw[i]);
    }
    return std::string(trim(out));
}

std::string unquote(std::string v) {
    if (v.size() >= 2 && (v.front() == '"' || v.front() == '\'') && v.back() == v.front())
        return v.substr(1, v.size() - 2);
    return v;
}

}

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t' || s.front() == '\r')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) s.remove_suffix(1);
    return s;
}

std::vector<EnvPair> parseDotenv(const std::string_view content) {
    std::vector<EnvPair> out;
    size_t lineNo = 0;
    size_t pos = 0;

    while (pos <= content.size()) {
        const auto nl = content.find('\n', pos);
        const auto end = nl == std::string_view::npos ? content.size() : nl;
        const auto line = trim(content.substr(pos, end - pos));
        ++lineNo;
        pos = end + 1;

        if (line.empty() || line.front() == '#') continue;

        const auto eq = line.find('=');
        if (eq == std::string_view::npos)
            throw error::InvalidArgumentError(fmt::format("line {}: expected KEY=VALUE", lineNo));

        const auto key = trim(line.substr(0, eq));
        if (key.empty()) throw error::InvalidArgumentError(fmt::format("line {}: empty key", lineNo));

        out.emplace_back(std::string(key), unquote(stripComment(line.substr(eq + 1))));
    }

    return out;
}

}
