#pragma once

#include "crypto/SecretBytes.hpp"

#include <array>
#include <cstdint>
#include <span>
#include <vector>

namespace shrine::crypto {

constexpr size_t AES_KEY_SIZE = 32;      // 256-bit
constexpr size_t AES_IV_SIZE  = 12;      // GCM standard nonce
constexpr size_t AES_TAG_SIZE = 16;      // GCM auth tag

using Nonce = std::array<uint8_t, AES_IV_SIZE>;

Nonce generateNonce();

// Returns ciphertext with the tag appended
std::vector<uint8_t> encrypt_aes256_gcm(
    const SecretBytes& plaintext,
    const SecretBytes& key,
    const Nonce& iv,
    std::span<const uint8_t> aad);

// Throws IntegrityError on any authentication failure
SecretBytes decrypt_aes256_gcm(
    std::span<const uint8_t> ciphertext_with_tag,
    const SecretBytes& key,
    const Nonce& iv,
    std::span<const uint8_t> aad);

}
