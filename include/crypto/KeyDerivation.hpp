#pragma once

#include "crypto/SecretBytes.hpp"

#include <array>
#include <cstdint>
#include <string_view>

namespace shrine::crypto {

constexpr size_t KEY_SIZE  = 32;   // AES-256
constexpr size_t SALT_SIZE = 16;

// Upper bound on the PBKDF2 work factor, ten times the default
constexpr uint32_t MAX_ITERATIONS = 6'000'000;

using Salt = std::array<uint8_t, SALT_SIZE>;

enum class Kdf : uint8_t {
    Pbkdf2HmacSha256 = 1
};

// A key together with the parameters it was derived with; the parameters are
// what lets a cached key be matched against a file header.
struct DerivedKey {
    SecretBytes key;
    Salt salt{};
    uint32_t iterations{0};

    [[nodiscard]] bool matches(const Salt& otherSalt, uint32_t otherIterations) const {
        return salt == otherSalt && iterations == otherIterations;
    }
};

void ensureSodium();

Salt generateSalt();

// PBKDF2-HMAC-SHA256, deterministic for a given (password, salt, iterations).
// Throws InvalidArgumentError when iterations is outside [1, MAX_ITERATIONS].
DerivedKey derive(std::string_view password, const Salt& salt, uint32_t iterations);

}
