#pragma once

#include "error/ShrineError.hpp"
#include "store/Repository.hpp"
#include "types/Secret.hpp"

#include <nlohmann/json.hpp>
#include <array>
#include <cstdint>
#include <string>

namespace shrine::agent {

// Frames are a 4-byte big-endian length followed by a JSON body
constexpr uint32_t MAX_FRAME_SIZE = 1u << 20; // 1 MiB cap
constexpr size_t FRAME_HEADER_SIZE = 4;

namespace op {
constexpr const char* UNLOCK = "unlock";
constexpr const char* GET = "get";
constexpr const char* SET = "set";
constexpr const char* RM = "rm";
constexpr const char* LIST = "list";
constexpr const char* LOCK = "lock";
constexpr const char* STATUS = "status";
constexpr const char* STOP = "stop";
}

std::string encodeFrame(const nlohmann::json& body);
uint32_t decodeLength(const std::array<uint8_t, FRAME_HEADER_SIZE>& header);

nlohmann::json okReply(nlohmann::json data = nlohmann::json::object());
nlohmann::json errorReply(error::Code code, const std::string& message);

// Rethrows the typed ShrineError carried by an error reply
void throwIfError(const nlohmann::json& reply);

// Secret values travel base64 encoded
nlohmann::json secretToJson(const types::Secret& secret);
types::Secret secretFromJson(const nlohmann::json& j);

nlohmann::json listToJson(const store::ListResult& list);
store::ListResult listFromJson(const nlohmann::json& j);

// Overwrites string contents that carried secret material
void wipeString(std::string& s);

}
