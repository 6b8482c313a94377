#include "crypto/encrypt.hpp"
#include "crypto/KeyDerivation.hpp"
#include "error/ShrineError.hpp"

#include <memory>
#include <sodium.h>
#include <stdexcept>
#include <openssl/evp.h>

namespace shrine::crypto {

namespace {

struct CipherDeleter {
    void operator()(EVP_CIPHER* c) const { EVP_CIPHER_free(c); }
};

struct CtxDeleter {
    void operator()(EVP_CIPHER_CTX* c) const { EVP_CIPHER_CTX_free(c); }
};

using CipherPtr = std::unique_ptr<EVP_CIPHER, CipherDeleter>;
using CtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CtxDeleter>;

std::pair<CipherPtr, CtxPtr> makeCipher() {
    CipherPtr cipher(EVP_CIPHER_fetch(nullptr, "AES-256-GCM", nullptr));
    if (!cipher) throw std::runtime_error("EVP_CIPHER_fetch AES-256-GCM failed");

    CtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) throw std::runtime_error("Failed to allocate cipher ctx");

    return {std::move(cipher), std::move(ctx)};
}

}

Nonce generateNonce() {
    ensureSodium();
    Nonce iv{};
    randombytes_buf(iv.data(), iv.size());
    return iv;
}

std::vector<uint8_t> encrypt_aes256_gcm(
    const SecretBytes& plaintext,
    const SecretBytes& key,
    const Nonce& iv,
    const std::span<const uint8_t> aad)
{
    if (key.size() != AES_KEY_SIZE)
        throw std::invalid_argument("Invalid AES-256 key size");

    const auto [cipher, ctx] = makeCipher();

    if (EVP_EncryptInit_ex2(ctx.get(), cipher.get(), key.data(), iv.data(), nullptr) <= 0)
        throw std::runtime_error("EncryptInit failed");

    int len = 0, outlen = 0;

    if (!aad.empty() &&
        EVP_EncryptUpdate(ctx.get(), nullptr, &len, aad.data(), static_cast<int>(aad.size())) <= 0)
        throw std::runtime_error("EncryptUpdate (AAD) failed");

    std::vector<uint8_t> ciphertext(plaintext.size() + AES_TAG_SIZE);

    if (EVP_EncryptUpdate(ctx.get(), ciphertext.data(), &len, plaintext.data(), static_cast<int>(plaintext.size())) <= 0)
        throw std::runtime_error("EncryptUpdate failed");
    outlen = len;

    if (EVP_EncryptFinal_ex(ctx.get(), ciphertext.data() + len, &len) <= 0)
        throw std::runtime_error("EncryptFinal failed");
    outlen += len;

    // Append authentication tag
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, AES_TAG_SIZE, ciphertext.data() + outlen) <= 0)
        throw std::runtime_error("GetTag failed");
    outlen += AES_TAG_SIZE;

    ciphertext.resize(outlen);
    return ciphertext;
}

SecretBytes decrypt_aes256_gcm(
    const std::span<const uint8_t> ciphertext_with_tag,
    const SecretBytes& key,
    const Nonce& iv,
    const std::span<const uint8_t> aad)
{
    if (key.size() != AES_KEY_SIZE)
        throw std::invalid_argument("Invalid AES-256 key size");

    if (ciphertext_with_tag.size() < AES_TAG_SIZE)
        throw error::IntegrityError();

    // Split into ciphertext and tag
    const size_t ciphertext_len = ciphertext_with_tag.size() - AES_TAG_SIZE;
    std::array<uint8_t, AES_TAG_SIZE> tag{};
    std::copy_n(ciphertext_with_tag.data() + ciphertext_len, AES_TAG_SIZE, tag.begin());

    const auto [cipher, ctx] = makeCipher();

    if (EVP_DecryptInit_ex2(ctx.get(), cipher.get(), key.data(), iv.data(), nullptr) <= 0)
        throw std::runtime_error("DecryptInit failed");

    int len = 0, outlen = 0;

    if (!aad.empty() &&
        EVP_DecryptUpdate(ctx.get(), nullptr, &len, aad.data(), static_cast<int>(aad.size())) <= 0)
        throw error::IntegrityError();

    SecretBytes plaintext(ciphertext_len);

    if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &len,
                          ciphertext_with_tag.data(), static_cast<int>(ciphertext_len)) <= 0)
        throw error::IntegrityError();
    outlen = len;

    // Set expected authentication tag
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, AES_TAG_SIZE, tag.data()) <= 0)
        throw error::IntegrityError();

    // Auth check happens here
    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + outlen, &len) <= 0)
        throw error::IntegrityError();
    outlen += len;

    if (static_cast<size_t>(outlen) != plaintext.size()) throw error::IntegrityError();
    return plaintext;
}

}
