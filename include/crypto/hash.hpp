#pragma once

#include "crypto/SecretBytes.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace shrine::crypto::hash {

// Hex BLAKE2b-256 digest; used as the on-disk version fingerprint of a shrine file
std::string blake2b(std::span<const uint8_t> bytes);

// Short Crockford base32 tag of a BLAKE2b digest, domain-separated by ctx
std::string tag(std::string_view ctx, std::string_view token, size_t chars);

// Standard base64 with padding (libsodium variant ORIGINAL)
std::string base64Encode(std::span<const uint8_t> bytes);

// Throws InvalidArgumentError on malformed input
SecretBytes base64Decode(std::string_view text);

}
