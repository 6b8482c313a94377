#include "crypto/KeyDerivation.hpp"
#include "error/ShrineError.hpp"
#include "log/Registry.hpp"

#include <openssl/evp.h>
#include <fmt/core.h>
#include <sodium.h>
#include <stdexcept>

namespace shrine::crypto {

void ensureSodium() {
    if (sodium_init() < 0) throw std::runtime_error("libsodium failed to initialize");
}

Salt generateSalt() {
    ensureSodium();
    Salt salt{};
    randombytes_buf(salt.data(), salt.size());
    return salt;
}

DerivedKey derive(const std::string_view password, const Salt& salt, const uint32_t iterations) {
    if (iterations == 0 || iterations > MAX_ITERATIONS)
        throw error::InvalidArgumentError(
            fmt::format("PBKDF2 iteration count must be between 1 and {}, got {}", MAX_ITERATIONS, iterations));

    DerivedKey out{SecretBytes(KEY_SIZE), salt, iterations};

    if (PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()),
                          salt.data(), static_cast<int>(salt.size()),
                          static_cast<int>(iterations), EVP_sha256(),
                          static_cast<int>(KEY_SIZE), out.key.data()) != 1)
        throw std::runtime_error("PBKDF2 key derivation failed");

    log::Registry::crypto()->debug("[KeyDerivation] Derived key with {} iterations", iterations);
    return out;
}

}
