#include "crypto/SecretBytes.hpp"

#include <sodium.h>

namespace shrine::crypto {

SecretBytes::SecretBytes(const size_t size) : bytes_(size, 0) {}

SecretBytes::SecretBytes(const uint8_t* data, const size_t size) : bytes_(data, data + size) {}

SecretBytes::SecretBytes(const std::string_view text)
    : bytes_(reinterpret_cast<const uint8_t*>(text.data()),
             reinterpret_cast<const uint8_t*>(text.data()) + text.size()) {}

SecretBytes::SecretBytes(std::vector<uint8_t>&& bytes) noexcept : bytes_(std::move(bytes)) {}

SecretBytes::SecretBytes(const SecretBytes& other) : bytes_(other.bytes_) {}

SecretBytes& SecretBytes::operator=(const SecretBytes& other) {
    if (this != &other) {
        wipe();
        bytes_ = other.bytes_;
    }
    return *this;
}

SecretBytes::SecretBytes(SecretBytes&& other) noexcept : bytes_(std::move(other.bytes_)) {
    other.bytes_.clear();
}

SecretBytes& SecretBytes::operator=(SecretBytes&& other) noexcept {
    if (this != &other) {
        wipe();
        bytes_ = std::move(other.bytes_);
        other.bytes_.clear();
    }
    return *this;
}

SecretBytes::~SecretBytes() { wipe(); }

bool SecretBytes::operator==(const SecretBytes& other) const {
    if (bytes_.size() != other.bytes_.size()) return false;
    if (bytes_.empty()) return true;
    return sodium_memcmp(bytes_.data(), other.bytes_.data(), bytes_.size()) == 0;
}

void SecretBytes::wipe() noexcept {
    if (!bytes_.empty()) sodium_memzero(bytes_.data(), bytes_.size());
    bytes_.clear();
}

}
