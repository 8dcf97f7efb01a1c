// Post-transfer integrity check: local digest (OpenSSL EVP, streamed) against
// a digest computed on the remote host over the exec channel.
#pragma once
#include "RemoteSession.hpp"
#include "TransferError.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace scpflow {

enum class DigestAlgorithm { Md5, Sha256 };

inline const char *digestAlgorithmName(DigestAlgorithm a) {
    return a == DigestAlgorithm::Md5 ? "md5" : "sha256";
}

struct VerifySettings {
    bool enabled = false;
    DigestAlgorithm algorithm = DigestAlgorithm::Sha256;
    // Files smaller than this are not verified.
    std::uint64_t threshold = 10ull * 1024 * 1024;
    std::chrono::milliseconds command_timeout = std::chrono::minutes(5);
};

// Lower-case hex digest of an in-memory buffer.
bool digestBytes(DigestAlgorithm algo, const std::string& data,
                 std::string& hex, std::string& err);

// Lower-case hex digest of a file, read in fixed-size blocks.
bool digestFile(DigestAlgorithm algo, const std::string& path,
                std::string& hex, std::string& err,
                const CancelFn& shouldCancel = {});

// Shell command printing "<digest>  <path>", or CHECKSUM_TOOL_NOT_FOUND when
// no digest tool is installed. An unreadable file exits nonzero.
std::string remoteDigestCommand(DigestAlgorithm algo,
                                const std::string& remotePath);

class IntegrityVerifier {
public:
    explicit IntegrityVerifier(VerifySettings settings = {});

    const VerifySettings& settings() const { return settings_; }

    bool shouldVerify(std::uint64_t size) const;

    bool remoteDigest(RemoteSession& session, const std::string& remotePath,
                      std::string& hex, TransferError& err,
                      const CancelFn& shouldCancel = {}) const;

    // True when the digests match or verification does not apply (disabled
    // or below threshold). A mismatch fails with VerificationMismatch; any
    // other failure uses Transport or LocalIo.
    bool verify(TransferDirection direction, const std::string& localPath,
                const std::string& remotePath, RemoteSession& session,
                TransferError& err, const CancelFn& shouldCancel = {}) const;

private:
    VerifySettings settings_;
};

} // namespace scpflow
