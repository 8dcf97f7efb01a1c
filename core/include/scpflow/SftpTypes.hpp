// Basic types shared by the session backends and the transfer engine.
// Keep these structures plain so they can be copied across threads.
#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace scpflow {

// known_hosts validation policy for the server key.
enum class KnownHostsPolicy {
    Strict,    // Requires an exact match in known_hosts.
    AcceptNew, // TOFU: accept and store new hosts; reject changed keys.
    Off        // No verification (not recommended).
};

// Metadata of a remote or local entry.
// Listings fill `name` with the base name; tree snapshots use the path
// relative to the snapshot root.
struct FileInfo {
    std::string name;
    bool is_dir = false;
    std::uint64_t size = 0;
    std::int64_t mtime_ms = 0; // epoch milliseconds
    std::uint32_t mode = 0;    // POSIX bits (permissions/type)

    bool operator==(const FileInfo& o) const {
        return name == o.name && is_dir == o.is_dir && size == o.size &&
               mtime_ms == o.mtime_ms;
    }
    bool operator!=(const FileInfo& o) const { return !(*this == o); }
};

// One SSH endpoint with its resolved authentication material.
// With neither password nor private key the backend tries ssh-agent.
struct HopIdentity {
    std::string host;
    std::uint16_t port = 22;
    std::string username;

    std::optional<std::string> password;
    std::optional<std::string> private_key_path;
    std::optional<std::string> private_key_passphrase;

    std::optional<std::string> known_hosts_path; // default: ~/.ssh/known_hosts
    KnownHostsPolicy known_hosts_policy = KnownHostsPolicy::Strict;

    // "user@host:port"
    std::string label() const {
        return username + "@" + host + ":" + std::to_string(port);
    }
};

// Target host reached through zero or more jump hosts, in connection order.
// Two identities with the same hop chain share pooled sessions.
struct HostIdentity {
    HopIdentity target;
    std::vector<HopIdentity> jumps;

    // Canonical pooling key: every hop label joined by '>' ending in target.
    std::string key() const {
        std::string k;
        for (const auto& j : jumps) {
            k += j.label();
            k += '>';
        }
        k += target.label();
        return k;
    }

    std::size_t hopCount() const { return jumps.size() + 1; }

    // Hop at position i of the chain (jumps first, target last).
    const HopIdentity& hop(std::size_t i) const {
        return i < jumps.size() ? jumps[i] : target;
    }
};

enum class TransferDirection { Upload, Download };

inline const char *directionName(TransferDirection d) {
    return d == TransferDirection::Upload ? "upload" : "download";
}

// Byte range for partial transfers.
struct ByteRange {
    std::uint64_t offset = 0;
    std::uint64_t length = 0;
};

// Result of a remote command.
struct ExecResult {
    int exit_status = -1;
    std::string stdout_text;
    std::string stderr_text;
    bool timed_out = false;
};

// Connection-level tunables applied by session backends.
struct ConnectSettings {
    // Transport compression negotiated on every session (zlib).
    bool compression = true;
    std::chrono::milliseconds handshake_timeout{20000};
    int keepalive_interval_sec = 30;
};

using ProgressFn = std::function<void(std::uint64_t /*done*/,
                                      std::uint64_t /*total*/)>;
using CancelFn = std::function<bool()>;

} // namespace scpflow
