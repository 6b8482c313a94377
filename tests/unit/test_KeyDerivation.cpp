#include <gtest/gtest.h>
#include "crypto/KeyDerivation.hpp"
#include "crypto/encrypt.hpp"
#include "crypto/hash.hpp"
#include "error/ShrineError.hpp"

#include <string>
#include <vector>

using namespace shrine::crypto;

TEST(KeyDerivationTest, DeterministicForSameInputs) {
    const auto salt = generateSalt();
    const auto a = derive("password", salt, 1000);
    const auto b = derive("password", salt, 1000);
    EXPECT_EQ(a.key.size(), KEY_SIZE);
    EXPECT_TRUE(a.key == b.key);
    EXPECT_TRUE(a.matches(salt, 1000));
}

TEST(KeyDerivationTest, SaltPasswordAndIterationsAllMatter) {
    const auto salt = generateSalt();
    const auto base = derive("password", salt, 1000);
    EXPECT_FALSE(base.key == derive("password2", salt, 1000).key);
    EXPECT_FALSE(base.key == derive("password", generateSalt(), 1000).key);
    EXPECT_FALSE(base.key == derive("password", salt, 1001).key);
    EXPECT_FALSE(base.matches(salt, 1001));
}

TEST(KeyDerivationTest, EmptyPasswordStillDerives) {
    const auto k = derive("", generateSalt(), 1000);
    EXPECT_EQ(k.key.size(), KEY_SIZE);
}

TEST(AesGcmTest, DecryptsWhatItEncrypts) {
    const auto key = derive("pw", generateSalt(), 1000).key;
    const auto iv = generateNonce();
    const std::vector<uint8_t> aad{1, 2, 3};
    const SecretBytes plain(std::string_view("hello shrine"));

    const auto ct = encrypt_aes256_gcm(plain, key, iv, aad);
    EXPECT_EQ(ct.size(), plain.size() + AES_TAG_SIZE);
    EXPECT_TRUE(decrypt_aes256_gcm(ct, key, iv, aad) == plain);
}

TEST(AesGcmTest, AnyTamperingFailsWithIntegrityError) {
    const auto key = derive("pw", generateSalt(), 1000).key;
    const auto other = derive("other", generateSalt(), 1000).key;
    const auto iv = generateNonce();
    const std::vector<uint8_t> aad{9, 9};
    const auto ct = encrypt_aes256_gcm(SecretBytes(std::string_view("data")), key, iv, aad);

    EXPECT_THROW(decrypt_aes256_gcm(ct, other, iv, aad), shrine::error::IntegrityError);

    auto flipped = ct;
    flipped[0] ^= 0x01;
    EXPECT_THROW(decrypt_aes256_gcm(flipped, key, iv, aad), shrine::error::IntegrityError);

    const std::vector<uint8_t> otherAad{9, 8};
    EXPECT_THROW(decrypt_aes256_gcm(ct, key, iv, otherAad), shrine::error::IntegrityError);

    const std::vector<uint8_t> tooShort(ct.begin(), ct.begin() + 4);
    EXPECT_THROW(decrypt_aes256_gcm(tooShort, key, iv, aad), shrine::error::IntegrityError);
}

TEST(HashTest, TagIsStableAndDomainSeparated) {
    const auto a = hash::tag("ctx/a", "/home/u/shrine", 16);
    EXPECT_EQ(a.size(), 16u);
    EXPECT_EQ(a, hash::tag("ctx/a", "/home/u/shrine", 16));
    EXPECT_NE(a, hash::tag("ctx/b", "/home/u/shrine", 16));
    EXPECT_EQ(a.find_first_not_of("0123456789ABCDEFGHJKMNPQRSTVWXYZ"), std::string::npos);
}

TEST(HashTest, Base64) {
    const std::vector<uint8_t> bytes{0x00, 0xff, 0x10, 'a'};
    const auto enc = hash::base64Encode(bytes);
    EXPECT_EQ(enc, "AP8QYQ==");
    const auto dec = hash::base64Decode(enc);
    EXPECT_EQ(std::vector<uint8_t>(dec.data(), dec.data() + dec.size()), bytes);
    EXPECT_THROW(hash::base64Decode("not base64!"), shrine::error::InvalidArgumentError);
}
