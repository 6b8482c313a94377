#include "agent/protocol.hpp"
#include "crypto/hash.hpp"

#include <arpa/inet.h>
#include <sodium.h>
#include <cstring>

using nlohmann::json;

namespace shrine::agent {

std::string encodeFrame(const json& body) {
    const auto s = body.dump();
    if (s.size() > MAX_FRAME_SIZE) throw std::length_error("agent frame exceeds 1 MiB");

    const uint32_t len = htonl(static_cast<uint32_t>(s.size()));
    std::string out(FRAME_HEADER_SIZE, '\0');
    std::memcpy(out.data(), &len, FRAME_HEADER_SIZE);
    out += s;
    return out;
}

uint32_t decodeLength(const std::array<uint8_t, FRAME_HEADER_SIZE>& header) {
    uint32_t be = 0;
    std::memcpy(&be, header.data(), FRAME_HEADER_SIZE);
    return ntohl(be);
}

json okReply(json data) {
    json reply{{"ok", true}};
    if (!data.empty()) reply["data"] = std::move(data);
    return reply;
}

json errorReply(const error::Code code, const std::string& message) {
    return {{"ok", false}, {"error", error::to_string(code)}, {"message", message}};
}

void throwIfError(const json& reply) {
    if (reply.value("ok", false)) return;
    const auto name = reply.value("error", std::string("Error"));
    const auto message = reply.value("message", std::string("agent request failed"));
    error::raise(error::code_from_string(name), message);
}

json secretToJson(const types::Secret& secret) {
    json j{
        {"value", crypto::hash::base64Encode({secret.value.data(), secret.value.size()})},
        {"mode", types::to_string(secret.mode)},
        {"created_by", secret.created_by},
        {"created_at", static_cast<int64_t>(secret.created_at)}
    };
    if (secret.updated_by) j["updated_by"] = *secret.updated_by;
    if (secret.updated_at) j["updated_at"] = static_cast<int64_t>(*secret.updated_at);
    return j;
}

types::Secret secretFromJson(const json& j) {
    types::Secret s;
    s.value = crypto::hash::base64Decode(j.at("value").get_ref<const std::string&>());
    s.mode = types::mode_from_string(j.at("mode").get<std::string>());
    s.created_by = j.value("created_by", std::string{});
    s.created_at = static_cast<std::time_t>(j.value("created_at", int64_t{0}));
    if (j.contains("updated_by")) s.updated_by = j.at("updated_by").get<std::string>();
    if (j.contains("updated_at")) s.updated_at = static_cast<std::time_t>(j.at("updated_at").get<int64_t>());
    return s;
}

json listToJson(const store::ListResult& list) {
    json entries = json::array();
    for (const auto& e : list.entries) {
        json entry{
            {"path", e.path},
            {"mode", types::to_string(e.mode)},
            {"created_by", e.created_by},
            {"created_at", static_cast<int64_t>(e.created_at)}
        };
        if (e.updated_by) entry["updated_by"] = *e.updated_by;
        if (e.updated_at) entry["updated_at"] = static_cast<int64_t>(*e.updated_at);
        entries.push_back(std::move(entry));
    }
    return {{"entries", std::move(entries)}, {"count", list.count()}};
}

store::ListResult listFromJson(const json& j) {
    store::ListResult out;
    for (const auto& e : j.at("entries")) {
        store::ListEntry entry;
        entry.path = e.at("path").get<std::string>();
        entry.mode = types::mode_from_string(e.at("mode").get<std::string>());
        entry.created_by = e.value("created_by", std::string{});
        entry.created_at = static_cast<std::time_t>(e.value("created_at", int64_t{0}));
        if (e.contains("updated_by")) entry.updated_by = e.at("updated_by").get<std::string>();
        if (e.contains("updated_at")) entry.updated_at = static_cast<std::time_t>(e.at("updated_at").get<int64_t>());
        out.entries.push_back(std::move(entry));
    }
    return out;
}

void wipeString(std::string& s) {
    if (!s.empty()) sodium_memzero(s.data(), s.size());
    s.clear();
}

}
