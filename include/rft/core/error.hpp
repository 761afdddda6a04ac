#pragma once

#include <string>

namespace rft {

enum class ErrorKind {
    SourceNotFound,
    CommandTooLong,
    RemoteScriptFailed,
    Transport,
    LocalIo,
    InvalidConfig
};

/**
 * @brief Failure reported by any stage of a transfer
 *
 * exit_code and stderr_text are only meaningful for RemoteScriptFailed.
 */
struct Error {
    ErrorKind kind = ErrorKind::Transport;
    std::string message;
    int exit_code = 0;
    std::string stderr_text; ///< Decoded (plain text) stderr of the remote script

    Error() = default;
    Error(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}
    Error(ErrorKind k, std::string msg, int code, std::string err)
        : kind(k), message(std::move(msg)), exit_code(code), stderr_text(std::move(err)) {}
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::SourceNotFound: return "SourceNotFound";
        case ErrorKind::CommandTooLong: return "CommandTooLong";
        case ErrorKind::RemoteScriptFailed: return "RemoteScriptFailed";
        case ErrorKind::Transport: return "TransportError";
        case ErrorKind::LocalIo: return "LocalIoError";
        case ErrorKind::InvalidConfig: return "InvalidConfig";
    }
    return "Unknown";
}

} // namespace rft
