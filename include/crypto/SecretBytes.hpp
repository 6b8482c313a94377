#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace shrine::crypto {

// Byte buffer for key material and secret values. The storage is sized once and
// never grows, and it is overwritten with sodium_memzero on release or reassignment.
class SecretBytes {
public:
    SecretBytes() = default;
    explicit SecretBytes(size_t size);
    SecretBytes(const uint8_t* data, size_t size);
    explicit SecretBytes(std::string_view text);
    explicit SecretBytes(std::vector<uint8_t>&& bytes) noexcept;

    SecretBytes(const SecretBytes& other);
    SecretBytes& operator=(const SecretBytes& other);
    SecretBytes(SecretBytes&& other) noexcept;
    SecretBytes& operator=(SecretBytes&& other) noexcept;

    ~SecretBytes();

    [[nodiscard]] uint8_t* data() { return bytes_.data(); }
    [[nodiscard]] const uint8_t* data() const { return bytes_.data(); }
    [[nodiscard]] size_t size() const { return bytes_.size(); }
    [[nodiscard]] bool empty() const { return bytes_.empty(); }

    [[nodiscard]] std::string_view view() const {
        return {reinterpret_cast<const char*>(bytes_.data()), bytes_.size()};
    }

    // Constant time when sizes match
    bool operator==(const SecretBytes& other) const;

    void wipe() noexcept;

private:
    std::vector<uint8_t> bytes_;
};

}
