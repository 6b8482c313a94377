#include "crypto/hash.hpp"
#include "crypto/KeyDerivation.hpp"
#include "error/ShrineError.hpp"

#include <sodium.h>
#include <array>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace shrine::crypto::hash {

namespace {

constexpr char kBase32Crockford[] = "0123456789abcdefghjkmnpqrstvwxyz";

std::string b32_crockford_encode(const uint8_t* data, const size_t len) {
    std::string out;
    out.reserve((len * 8 + 4) / 5);

    uint32_t buffer = 0;
    int bits = 0;

    for (size_t i = 0; i < len; ++i) {
        buffer = (buffer << 8) | data[i];
        bits += 8;
        while (bits >= 5) {
            bits -= 5;
            out.push_back(kBase32Crockford[(buffer >> bits) & 0x1F]);
        }
    }

    if (bits > 0) out.push_back(kBase32Crockford[(buffer << (5 - bits)) & 0x1F]);
    return out;
}

}

std::string blake2b(const std::span<const uint8_t> bytes) {
    ensureSodium();

    constexpr size_t hash_len = crypto_generichash_BYTES;
    unsigned char hash[hash_len];

    if (crypto_generichash(hash, hash_len, bytes.data(), bytes.size(), nullptr, 0) != 0)
        throw std::runtime_error("blake2b failed");

    std::ostringstream result;
    for (size_t i = 0; i < hash_len; ++i)
        result << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);

    return result.str();
}

std::string tag(const std::string_view ctx, const std::string_view token, const size_t chars) {
    ensureSodium();

    std::array<uint8_t, 16> digest{};

    crypto_generichash_state st;
    if (crypto_generichash_init(&st, nullptr, 0, digest.size()) != 0)
        throw std::runtime_error("blake2 init failed");

    // domain separation
    crypto_generichash_update(&st, reinterpret_cast<const unsigned char*>(ctx.data()), ctx.size());
    crypto_generichash_update(&st, reinterpret_cast<const unsigned char*>(token.data()), token.size());
    crypto_generichash_final(&st, digest.data(), digest.size());

    auto enc = b32_crockford_encode(digest.data(), digest.size());
    if (enc.size() > chars) enc.resize(chars);
    return enc;
}

std::string base64Encode(const std::span<const uint8_t> bytes) {
    ensureSodium();

    constexpr int variant = sodium_base64_VARIANT_ORIGINAL;
    std::string out(sodium_base64_ENCODED_LEN(bytes.size(), variant), '\0');
    sodium_bin2base64(out.data(), out.size(), bytes.data(), bytes.size(), variant);
    out.resize(out.size() - 1); // trailing NUL
    return out;
}

SecretBytes base64Decode(const std::string_view text) {
    ensureSodium();

    SecretBytes out(text.size() / 4 * 3 + 3);
    size_t len = 0;
    if (sodium_base642bin(out.data(), out.size(), text.data(), text.size(),
                          nullptr, &len, nullptr, sodium_base64_VARIANT_ORIGINAL) != 0)
        throw error::InvalidArgumentError("invalid base64 input");

    return {out.data(), len};
}

}
