#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace shrine::error {

enum class Code {
    Generic,
    Integrity,              // wrong password or corrupted container, never told apart
    Format,
    NotFound,
    AlreadyExists,
    ConcurrentModification,
    Io,
    Git,
    SessionExpired,
    InvalidArgument
};

// Stable names, used on the agent wire and in CLI messages
std::string_view to_string(Code code);
Code code_from_string(std::string_view name);

int exitCodeFor(Code code);

class ShrineError : public std::runtime_error {
public:
    ShrineError(Code code, const std::string& message);

    [[nodiscard]] Code code() const noexcept { return code_; }
    [[nodiscard]] int exitCode() const noexcept { return exitCodeFor(code_); }

private:
    Code code_;
};

class IntegrityError final : public ShrineError {
public:
    explicit IntegrityError(const std::string& message = "invalid password or corrupted shrine")
        : ShrineError(Code::Integrity, message) {}
};

class FormatError final : public ShrineError {
public:
    explicit FormatError(const std::string& message) : ShrineError(Code::Format, message) {}
};

class NotFoundError final : public ShrineError {
public:
    explicit NotFoundError(const std::string& message) : ShrineError(Code::NotFound, message) {}
};

class AlreadyExistsError final : public ShrineError {
public:
    explicit AlreadyExistsError(const std::string& message) : ShrineError(Code::AlreadyExists, message) {}
};

class ConcurrentModificationError final : public ShrineError {
public:
    explicit ConcurrentModificationError(const std::string& message)
        : ShrineError(Code::ConcurrentModification, message) {}
};

class IoError final : public ShrineError {
public:
    explicit IoError(const std::string& message) : ShrineError(Code::Io, message) {}
};

class GitError final : public ShrineError {
public:
    explicit GitError(const std::string& message) : ShrineError(Code::Git, message) {}
};

class SessionExpiredError final : public ShrineError {
public:
    explicit SessionExpiredError(const std::string& message = "agent session expired or locked")
        : ShrineError(Code::SessionExpired, message) {}
};

class InvalidArgumentError final : public ShrineError {
public:
    explicit InvalidArgumentError(const std::string& message) : ShrineError(Code::InvalidArgument, message) {}
};

// Rebuilds the typed exception for a code received from the agent
[[noreturn]] void raise(Code code, const std::string& message);

}
