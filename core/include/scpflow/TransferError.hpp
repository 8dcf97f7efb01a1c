// Typed error reported by the transfer engine layers.
// Session primitives report plain strings; the engine wraps them here.
#pragma once
#include <string>

namespace scpflow {

enum class ErrorKind {
    None,
    Connect,              // a hop of the chain could not be established
    Transport,            // channel/SFTP/exec level failure
    Decompression,        // remote gunzip failed or timed out
    VerificationMismatch, // digests differ after a transfer
    Cancelled,
    LocalIo,
    InvalidArgument
};

inline const char *errorKindName(ErrorKind k) {
    switch (k) {
    case ErrorKind::None:
        return "none";
    case ErrorKind::Connect:
        return "connect";
    case ErrorKind::Transport:
        return "transport";
    case ErrorKind::Decompression:
        return "decompression";
    case ErrorKind::VerificationMismatch:
        return "verification_mismatch";
    case ErrorKind::Cancelled:
        return "cancelled";
    case ErrorKind::LocalIo:
        return "local_io";
    case ErrorKind::InvalidArgument:
        return "invalid_argument";
    }
    return "unknown";
}

struct TransferError {
    ErrorKind kind = ErrorKind::None;
    std::string message;
    int hop_index = -1;   // Connect: failing hop (0 = first jump or target)
    int exit_status = 0;  // Decompression/Transport from a remote command
    std::string stderr_text;

    bool ok() const { return kind == ErrorKind::None; }

    void clear() { *this = TransferError{}; }

    void set(ErrorKind k, std::string msg) {
        kind = k;
        message = std::move(msg);
    }

    // Human readable single line used for task errors and logs.
    std::string describe() const {
        std::string out = std::string(errorKindName(kind)) + ": " + message;
        if (kind == ErrorKind::Connect && hop_index >= 0)
            out += " (hop " + std::to_string(hop_index) + ")";
        if (exit_status != 0)
            out += " [exit " + std::to_string(exit_status) + "]";
        if (!stderr_text.empty())
            out += " stderr: " + stderr_text;
        return out;
    }
};

} // namespace scpflow
