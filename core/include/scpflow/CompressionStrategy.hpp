// File-level gzip compression for large text uploads.
// Session-level transport compression is a connection property
// (ConnectSettings::compression) and always requested.
#pragma once
#include "RemoteSession.hpp"
#include "TransferError.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace scpflow {

std::vector<std::string> defaultCompressibleExtensions();

struct CompressionSettings {
    bool file_level_enabled = true;
    std::uint64_t threshold = 50ull * 1024 * 1024;
    int level = 6;
    std::vector<std::string> extensions = defaultCompressibleExtensions();
    std::chrono::milliseconds decompress_timeout = std::chrono::minutes(5);

    bool validate(std::string& err) const;
};

// gzip (RFC 1952) helpers over in-memory buffers.
bool gzipBytes(const std::string& in, std::string& out, int level,
               std::string& err);
bool gunzipBytes(const std::string& in, std::string& out, std::string& err);

class CompressionStrategy {
public:
    explicit CompressionStrategy(CompressionSettings settings = {});

    const CompressionSettings& settings() const { return settings_; }

    // Uploads only: size >= threshold and a compressible extension.
    bool isEligible(const std::string& localPath, std::uint64_t size) const;

    // Streams `localPath` through gzip into a fresh temporary artifact.
    bool compressFile(const std::string& localPath, std::string& artifactPath,
                      TransferError& err, const CancelFn& shouldCancel = {}) const;

    // True when the remote has gunzip. err is set only when the check itself
    // could not run.
    bool remoteCanDecompress(RemoteSession& session, TransferError& err) const;

    // Runs `gunzip -f` on the uploaded artifact, replacing it with the
    // original file name.
    bool decompressRemote(RemoteSession& session, const std::string& remoteGz,
                          TransferError& err,
                          const CancelFn& shouldCancel = {}) const;

    static std::string compressedName(const std::string& remotePath) {
        return remotePath + ".gz";
    }

private:
    CompressionSettings settings_;
};

} // namespace scpflow
