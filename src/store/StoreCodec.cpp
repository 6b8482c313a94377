#include "store/StoreCodec.hpp"
#include "crypto/encrypt.hpp"
#include "error/ShrineError.hpp"
#include "log/Registry.hpp"

#include <nlohmann/json.hpp>
#include <sodium.h>

using nlohmann::json;

namespace shrine::store {

namespace {

void wipe(json& j) {
    if (j.is_binary()) {
        auto& bin = j.get_binary();
        if (!bin.empty()) sodium_memzero(bin.data(), bin.size());
    } else if (j.is_structured()) {
        for (auto& child : j) wipe(child);
    }
}

crypto::SecretBytes serialize(const Payload& payload, const Serialization format) {
    json secrets = json::object();
    for (const auto& [path, secret] : payload.secrets) secrets[path] = secret;

    json doc = {{"secrets", std::move(secrets)}, {"config", payload.config}};

    std::vector<uint8_t> bytes;
    switch (format) {
        case Serialization::Bson: bytes = json::to_bson(doc); break;
        case Serialization::MessagePack: bytes = json::to_msgpack(doc); break;
    }

    wipe(doc);
    return crypto::SecretBytes(std::move(bytes));
}

Payload deserialize(const crypto::SecretBytes& plaintext, const Serialization format) {
    json doc;
    try {
        switch (format) {
            case Serialization::Bson:
                doc = json::from_bson(plaintext.data(), plaintext.data() + plaintext.size());
                break;
            case Serialization::MessagePack:
                doc = json::from_msgpack(plaintext.data(), plaintext.data() + plaintext.size());
                break;
        }

        Payload out;
        for (const auto& [path, value] : doc.at("secrets").items()) out.secrets[path] = value.get<types::Secret>();
        if (doc.contains("config")) out.config = doc.at("config").get<types::ShrineConfig>();

        wipe(doc);
        return out;
    } catch (const json::exception& e) {
        wipe(doc);
        throw error::FormatError(std::string("Malformed shrine payload: ") + e.what());
    }
}

crypto::SecretBytes decryptBody(const Header& header, const std::span<const uint8_t> blob, const crypto::SecretBytes& key) {
    if (blob.size() < HEADER_SIZE + crypto::AES_TAG_SIZE) throw error::FormatError("Truncated shrine file");
    return crypto::decrypt_aes256_gcm(blob.subspan(HEADER_SIZE), key, header.nonce, blob.first(HEADER_SIZE));
}

}

std::vector<uint8_t> encode(const Payload& payload, Header header, const crypto::DerivedKey& key) {
    header.version = FORMAT_VERSION;
    header.kdf = crypto::Kdf::Pbkdf2HmacSha256;
    header.iterations = key.iterations;
    header.salt = key.salt;
    header.nonce = crypto::generateNonce();

    const auto aad = header.serialize();
    const auto plaintext = serialize(payload, header.serialization);
    const auto ciphertext = crypto::encrypt_aes256_gcm(plaintext, key.key, header.nonce, aad);

    std::vector<uint8_t> blob;
    blob.reserve(aad.size() + ciphertext.size());
    blob.insert(blob.end(), aad.begin(), aad.end());
    blob.insert(blob.end(), ciphertext.begin(), ciphertext.end());

    log::Registry::store()->debug("[StoreCodec] Encoded {} secrets into {} bytes ({})",
                                  payload.secrets.size(), blob.size(), to_string(header.serialization));
    return blob;
}

Payload decode(const std::span<const uint8_t> blob, const crypto::SecretBytes& key) {
    const auto header = Header::parse(blob);
    const auto plaintext = decryptBody(header, blob, key);
    return deserialize(plaintext, header.serialization);
}

crypto::DerivedKey deriveKey(const std::string_view password, const Header& header) {
    try {
        return crypto::derive(password, header.salt, header.iterations);
    } catch (const std::exception& e) {
        log::Registry::store()->debug("[StoreCodec] Key derivation from header failed: {}", e.what());
        throw error::IntegrityError();
    }
}

bool verify(const crypto::SecretBytes& key, const std::span<const uint8_t> blob) {
    const auto header = Header::parse(blob);
    (void)decryptBody(header, blob, key);
    return true;
}

}
