#pragma once

#include <string>

namespace labsync {

/**
 * @brief Failure categories surfaced by the engine
 *
 * Scan-level kinds (InvalidFolderStructure, IdentityNotFound,
 * IdentityAmbiguous) abort the current scan pass. Transfer-level kinds
 * (Transport, Http, Protocol, LocalIo) are contained to a single upload task
 * and count against its retry budget. Canceled is not a failure.
 */
enum class ErrorKind {
    InvalidFolderStructure,
    IdentityNotFound,
    IdentityAmbiguous,
    Transport,
    Http,
    Integrity,
    Canceled,
    Configuration,
    LocalIo,
    Protocol
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidFolderStructure: return "InvalidFolderStructure";
        case ErrorKind::IdentityNotFound: return "IdentityNotFound";
        case ErrorKind::IdentityAmbiguous: return "IdentityAmbiguous";
        case ErrorKind::Transport: return "Transport";
        case ErrorKind::Http: return "Http";
        case ErrorKind::Integrity: return "Integrity";
        case ErrorKind::Canceled: return "Canceled";
        case ErrorKind::Configuration: return "Configuration";
        case ErrorKind::LocalIo: return "LocalIo";
        case ErrorKind::Protocol: return "Protocol";
    }
    return "Unknown";
}

struct Error {
    ErrorKind kind = ErrorKind::Protocol;
    std::string message;
    int status_code = 0; ///< HTTP status or remote shell exit code, when known

    Error() = default;
    Error(ErrorKind k, std::string msg, int code = 0)
        : kind(k), message(std::move(msg)), status_code(code) {}

    bool is(ErrorKind k) const noexcept { return kind == k; }

    /// Whether an upload task may be retried after this error.
    bool is_retryable() const noexcept {
        return kind == ErrorKind::Transport || kind == ErrorKind::Http ||
               kind == ErrorKind::LocalIo;
    }

    std::string describe() const {
        std::string text = std::string(error_kind_name(kind)) + ": " + message;
        if (status_code != 0) {
            text += " (code " + std::to_string(status_code) + ")";
        }
        return text;
    }
};

} // namespace labsync
