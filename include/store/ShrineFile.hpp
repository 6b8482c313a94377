#pragma once

#include "crypto/KeyDerivation.hpp"
#include "crypto/encrypt.hpp"

#include <boost/uuid/uuid.hpp>
#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace shrine::store {

constexpr std::string_view MAGIC = "shrine";
constexpr uint8_t FORMAT_VERSION = 1;

// magic(6) version(1) uuid(16) serialization(1) kdf(1) iterations(4) salt(16) nonce(12)
constexpr size_t HEADER_SIZE = 57;

enum class Serialization : uint8_t {
    Bson = 0,
    MessagePack = 1
};

std::string to_string(Serialization s);
Serialization serialization_from_string(const std::string& str);

// Fixed-size prefix of a shrine file; its serialized bytes are the AEAD associated data
struct Header {
    uint8_t version{FORMAT_VERSION};
    boost::uuids::uuid uuid{};
    Serialization serialization{Serialization::Bson};
    crypto::Kdf kdf{crypto::Kdf::Pbkdf2HmacSha256};
    uint32_t iterations{0};
    crypto::Salt salt{};
    crypto::Nonce nonce{};

    [[nodiscard]] std::array<uint8_t, HEADER_SIZE> serialize() const;

    // Throws FormatError on bad magic, truncation, unknown ids or unsupported version
    static Header parse(std::span<const uint8_t> blob);
};

}
