#pragma once

#include "crypto/SecretBytes.hpp"

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace shrine::dispatch {

using Prompter = std::function<crypto::SecretBytes(std::string_view prompt)>;

// Reads a line from /dev/tty with echo off; IoError when there is no terminal
crypto::SecretBytes promptHidden(std::string_view prompt);

// The password for one CLI invocation: --password if given, otherwise prompted
// once on first use and kept for the rest of the invocation.
class PasswordSource {
public:
    explicit PasswordSource(std::optional<std::string> given, Prompter prompter = promptHidden);

    const crypto::SecretBytes& get();

    [[nodiscard]] bool known() const { return value_.has_value(); }

    // Asks twice and requires both answers to match
    crypto::SecretBytes promptNew(std::string_view what);

private:
    std::optional<crypto::SecretBytes> value_;
    Prompter prompter_;
};

}
