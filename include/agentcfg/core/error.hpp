#pragma once

#include <string>

namespace agentcfg {

enum class ErrorKind {
    Failure,
    Usage,
    Validation,
    Conflict,
    Filesystem
};

/**
 * @brief Structured failure carried by Result
 *
 * The kind decides the process exit code; the message is meant for the
 * operator and already names the offending path where there is one.
 */
struct Error {
    ErrorKind kind = ErrorKind::Failure;
    std::string message;
};

namespace exit_codes {
constexpr int kSuccess = 0;
constexpr int kFailure = 1;
constexpr int kUsage = 2;
constexpr int kValidation = 3;
constexpr int kConflict = 4;
constexpr int kFilesystem = 5;
} // namespace exit_codes

inline int exit_code(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Usage: return exit_codes::kUsage;
        case ErrorKind::Validation: return exit_codes::kValidation;
        case ErrorKind::Conflict: return exit_codes::kConflict;
        case ErrorKind::Filesystem: return exit_codes::kFilesystem;
        default: return exit_codes::kFailure;
    }
}

inline const char* error_kind_name(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Usage: return "usage";
        case ErrorKind::Validation: return "validation";
        case ErrorKind::Conflict: return "conflict";
        case ErrorKind::Filesystem: return "filesystem";
        default: return "failure";
    }
}

inline Error validation_error(std::string message) {
    return Error{ErrorKind::Validation, std::move(message)};
}

inline Error conflict_error(std::string message) {
    return Error{ErrorKind::Conflict, std::move(message)};
}

inline Error filesystem_error(std::string message) {
    return Error{ErrorKind::Filesystem, std::move(message)};
}

} // namespace agentcfg
