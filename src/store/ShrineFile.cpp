#include "store/ShrineFile.hpp"
#include "error/ShrineError.hpp"

#include <fmt/core.h>
#include <algorithm>

namespace shrine::store {

namespace {

constexpr size_t OFF_VERSION = 6;
constexpr size_t OFF_UUID = 7;
constexpr size_t OFF_SERIALIZATION = 23;
constexpr size_t OFF_KDF = 24;
constexpr size_t OFF_ITERATIONS = 25;
constexpr size_t OFF_SALT = 29;
constexpr size_t OFF_NONCE = 45;

static_assert(OFF_NONCE + crypto::AES_IV_SIZE == HEADER_SIZE);

}

std::string to_string(const Serialization s) {
    switch (s) {
        case Serialization::Bson: return "bson";
        case Serialization::MessagePack: return "msgpack";
        default: throw std::invalid_argument("Unknown Serialization enum value");
    }
}

Serialization serialization_from_string(const std::string& str) {
    if (str == "bson") return Serialization::Bson;
    if (str == "msgpack" || str == "messagepack") return Serialization::MessagePack;
    throw error::InvalidArgumentError(fmt::format("Unknown serialization format '{}' (expected bson or msgpack)", str));
}

std::array<uint8_t, HEADER_SIZE> Header::serialize() const {
    std::array<uint8_t, HEADER_SIZE> out{};
    std::ranges::copy(MAGIC, out.begin());
    out[OFF_VERSION] = version;
    std::copy(uuid.begin(), uuid.end(), out.begin() + OFF_UUID);
    out[OFF_SERIALIZATION] = static_cast<uint8_t>(serialization);
    out[OFF_KDF] = static_cast<uint8_t>(kdf);
    out[OFF_ITERATIONS]     = static_cast<uint8_t>(iterations >> 24);
    out[OFF_ITERATIONS + 1] = static_cast<uint8_t>(iterations >> 16);
    out[OFF_ITERATIONS + 2] = static_cast<uint8_t>(iterations >> 8);
    out[OFF_ITERATIONS + 3] = static_cast<uint8_t>(iterations);
    std::ranges::copy(salt, out.begin() + OFF_SALT);
    std::ranges::copy(nonce, out.begin() + OFF_NONCE);
    return out;
}

Header Header::parse(const std::span<const uint8_t> blob) {
    if (blob.size() < MAGIC.size() || !std::equal(MAGIC.begin(), MAGIC.end(), blob.begin()))
        throw error::FormatError("Not a shrine file (bad magic)");

    if (blob.size() < OFF_VERSION + 1) throw error::FormatError("Truncated shrine header");

    Header h;
    h.version = blob[OFF_VERSION];
    if (h.version != FORMAT_VERSION)
        throw error::FormatError(fmt::format("Unsupported shrine format version {}", h.version));

    if (blob.size() < HEADER_SIZE) throw error::FormatError("Truncated shrine header");

    std::copy_n(blob.begin() + OFF_UUID, h.uuid.size(), h.uuid.begin());

    switch (blob[OFF_SERIALIZATION]) {
        case 0: h.serialization = Serialization::Bson; break;
        case 1: h.serialization = Serialization::MessagePack; break;
        default: throw error::FormatError(fmt::format("Unknown serialization id {}", blob[OFF_SERIALIZATION]));
    }

    if (blob[OFF_KDF] != static_cast<uint8_t>(crypto::Kdf::Pbkdf2HmacSha256))
        throw error::FormatError(fmt::format("Unknown key derivation id {}", blob[OFF_KDF]));
    h.kdf = crypto::Kdf::Pbkdf2HmacSha256;

    h.iterations = static_cast<uint32_t>(blob[OFF_ITERATIONS]) << 24 |
                   static_cast<uint32_t>(blob[OFF_ITERATIONS + 1]) << 16 |
                   static_cast<uint32_t>(blob[OFF_ITERATIONS + 2]) << 8 |
                   static_cast<uint32_t>(blob[OFF_ITERATIONS + 3]);
    // unauthenticated until the key is derived; out of range counts as tampering
    if (h.iterations == 0 || h.iterations > crypto::MAX_ITERATIONS) throw error::IntegrityError();

    std::copy_n(blob.begin() + OFF_SALT, h.salt.size(), h.salt.begin());
    std::copy_n(blob.begin() + OFF_NONCE, h.nonce.size(), h.nonce.begin());
    return h;
}

}
