#pragma once

#include "store/ShrineFile.hpp"
#include "types/Secret.hpp"
#include "types/ShrineConfig.hpp"

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace shrine::store {

// Decrypted content of a shrine file
struct Payload {
    types::SecretStore secrets;
    types::ShrineConfig config;
};

// Serializes the payload, encrypts it under a fresh nonce and prefixes the header.
// The header's kdf parameters are taken from the key.
std::vector<uint8_t> encode(const Payload& payload, Header header, const crypto::DerivedKey& key);

// Throws FormatError on a malformed or unsupported container, IntegrityError on any
// authentication failure.
Payload decode(std::span<const uint8_t> blob, const crypto::SecretBytes& key);

// Derives the key described by an existing header. Any derivation failure is
// reported as IntegrityError.
crypto::DerivedKey deriveKey(std::string_view password, const Header& header);

// Authenticated decryption without deserializing; a failure raises IntegrityError
bool verify(const crypto::SecretBytes& key, std::span<const uint8_t> blob);

}
