#include "error/ShrineError.hpp"

#include <unordered_map>

namespace shrine::error {

std::string_view to_string(const Code code) {
    switch (code) {
        case Code::Integrity: return "BadPassword";
        case Code::Format: return "FormatError";
        case Code::NotFound: return "NotFound";
        case Code::AlreadyExists: return "AlreadyExists";
        case Code::ConcurrentModification: return "ConcurrentModification";
        case Code::Io: return "IoError";
        case Code::Git: return "GitError";
        case Code::SessionExpired: return "SessionExpired";
        case Code::InvalidArgument: return "InvalidArgument";
        case Code::Generic:
        default: return "Error";
    }
}

Code code_from_string(const std::string_view name) {
    static const std::unordered_map<std::string_view, Code> mapping = {
        {"BadPassword", Code::Integrity},
        {"IntegrityError", Code::Integrity},
        {"FormatError", Code::Format},
        {"NotFound", Code::NotFound},
        {"AlreadyExists", Code::AlreadyExists},
        {"ConcurrentModification", Code::ConcurrentModification},
        {"IoError", Code::Io},
        {"GitError", Code::Git},
        {"SessionExpired", Code::SessionExpired},
        {"InvalidArgument", Code::InvalidArgument},
    };
    const auto it = mapping.find(name);
    return it != mapping.end() ? it->second : Code::Generic;
}

int exitCodeFor(const Code code) {
    switch (code) {
        case Code::Integrity: return 2;
        case Code::Format: return 3;
        case Code::NotFound: return 4;
        case Code::AlreadyExists: return 5;
        case Code::ConcurrentModification: return 6;
        case Code::Io: return 7;
        case Code::SessionExpired: return 8;
        case Code::InvalidArgument: return 9;
        case Code::Git: return 0; // warning only
        case Code::Generic:
        default: return 1;
    }
}

ShrineError::ShrineError(const Code code, const std::string& message)
    : std::runtime_error(message), code_(code) {}

void raise(const Code code, const std::string& message) {
    switch (code) {
        case Code::Integrity: throw IntegrityError(message);
        case Code::Format: throw FormatError(message);
        case Code::NotFound: throw NotFoundError(message);
        case Code::AlreadyExists: throw AlreadyExistsError(message);
        case Code::ConcurrentModification: throw ConcurrentModificationError(message);
        case Code::Io: throw IoError(message);
        case Code::Git: throw GitError(message);
        case Code::SessionExpired: throw SessionExpiredError(message);
        case Code::InvalidArgument: throw InvalidArgumentError(message);
        case Code::Generic:
        default: throw ShrineError(Code::Generic, message);
    }
}

}
