// Digest computation with OpenSSL EVP and remote digest parsing.
#include "scpflow/IntegrityVerifier.hpp"
#include "scpflow/Log.hpp"
#include "scpflow/PathUtils.hpp"
#include "scpflow/RuntimeLogging.hpp"

#include <openssl/err.h>
#include <openssl/evp.h>

#include <cctype>
#include <cstdio>
#include <memory>
#include <system_error>
#include <filesystem>
#include <vector>

namespace scpflow {

namespace {

constexpr const char *kToolMissing = "CHECKSUM_TOOL_NOT_FOUND";

using EvpCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&::EVP_MD_CTX_free)>;

const EVP_MD *evpFor(DigestAlgorithm algo) {
    return algo == DigestAlgorithm::Md5 ? ::EVP_md5() : ::EVP_sha256();
}

std::string lastOpenSslError(const char *fn) {
    const unsigned long code = ::ERR_get_error();
    char buf[256] = {};
    if (code != 0)
        ::ERR_error_string_n(code, buf, sizeof(buf));
    return std::string(fn) + " failed" + (code ? std::string(": ") + buf : "");
}

std::string toHex(const unsigned char *md, unsigned int len) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (unsigned int i = 0; i < len; ++i) {
        out += digits[md[i] >> 4];
        out += digits[md[i] & 0x0f];
    }
    return out;
}

bool initDigest(DigestAlgorithm algo, EvpCtxPtr& ctx, std::string& err) {
    ctx.reset(::EVP_MD_CTX_new());
    if (!ctx) {
        err = lastOpenSslError("EVP_MD_CTX_new");
        return false;
    }
    if (::EVP_DigestInit_ex(ctx.get(), evpFor(algo), nullptr) != 1) {
        err = lastOpenSslError("EVP_DigestInit_ex");
        return false;
    }
    return true;
}

bool finishDigest(EvpCtxPtr& ctx, std::string& hex, std::string& err) {
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (::EVP_DigestFinal_ex(ctx.get(), md, &len) != 1) {
        err = lastOpenSslError("EVP_DigestFinal_ex");
        return false;
    }
    hex = toHex(md, len);
    return true;
}

std::string lowered(std::string s) {
    for (char& c : s)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

std::string trimmed(const std::string& s) {
    const auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos)
        return {};
    const auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

} // namespace

bool digestBytes(DigestAlgorithm algo, const std::string& data,
                 std::string& hex, std::string& err) {
    EvpCtxPtr ctx(nullptr, &::EVP_MD_CTX_free);
    if (!initDigest(algo, ctx, err))
        return false;
    if (::EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        err = lastOpenSslError("EVP_DigestUpdate");
        return false;
    }
    return finishDigest(ctx, hex, err);
}

bool digestFile(DigestAlgorithm algo, const std::string& path,
                std::string& hex, std::string& err,
                const CancelFn& shouldCancel) {
    FILE *f = std::fopen(path.c_str(), "rb");
    if (!f) {
        err = "Could not open file for hashing";
        return false;
    }
    EvpCtxPtr ctx(nullptr, &::EVP_MD_CTX_free);
    if (!initDigest(algo, ctx, err)) {
        std::fclose(f);
        return false;
    }
    std::vector<char> buf(64 * 1024);
    for (;;) {
        if (shouldCancel && shouldCancel()) {
            std::fclose(f);
            err = "Cancelled by user";
            return false;
        }
        const std::size_t n = std::fread(buf.data(), 1, buf.size(), f);
        if (n > 0 && ::EVP_DigestUpdate(ctx.get(), buf.data(), n) != 1) {
            std::fclose(f);
            err = lastOpenSslError("EVP_DigestUpdate");
            return false;
        }
        if (n < buf.size()) {
            if (std::ferror(f)) {
                std::fclose(f);
                err = "Local read failed while hashing";
                return false;
            }
            break;
        }
    }
    std::fclose(f);
    return finishDigest(ctx, hex, err);
}

std::string remoteDigestCommand(DigestAlgorithm algo,
                                const std::string& remotePath) {
    const std::string q = shellQuote(remotePath);
    // The tool is located first so a missing file is not mistaken for a
    // missing tool.
    if (algo == DigestAlgorithm::Md5) {
        return "if command -v md5sum >/dev/null 2>&1; then md5sum " + q +
               "; elif command -v md5 >/dev/null 2>&1; then md5 -q " + q +
               "; else echo " + kToolMissing + "; fi";
    }
    return "if command -v sha256sum >/dev/null 2>&1; then sha256sum " + q +
           "; elif command -v shasum >/dev/null 2>&1; then shasum -a 256 " + q +
           "; else echo " + kToolMissing + "; fi";
}

IntegrityVerifier::IntegrityVerifier(VerifySettings settings)
    : settings_(settings) {}

bool IntegrityVerifier::shouldVerify(std::uint64_t size) const {
    return settings_.enabled && size >= settings_.threshold;
}

bool IntegrityVerifier::remoteDigest(RemoteSession& session,
                                     const std::string& remotePath,
                                     std::string& hex, TransferError& err,
                                     const CancelFn& shouldCancel) const {
    ExecResult res;
    std::string e;
    if (!session.exec(remoteDigestCommand(settings_.algorithm, remotePath), res,
                      e, settings_.command_timeout, shouldCancel)) {
        if (shouldCancel && shouldCancel())
            err.set(ErrorKind::Cancelled, "Cancelled by user");
        else
            err.set(ErrorKind::Transport,
                    res.timed_out ? "Remote checksum timed out"
                                  : "Remote checksum could not run: " + e);
        return false;
    }
    const std::string text = res.stdout_text;
    if (text.find(kToolMissing) != std::string::npos) {
        err.set(ErrorKind::Transport,
                std::string("Remote host has no ") +
                    (settings_.algorithm == DigestAlgorithm::Md5
                         ? "md5sum/md5"
                         : "sha256sum/shasum") +
                    " tool");
        return false;
    }
    // First whitespace-separated field is the digest.
    const auto begin = text.find_first_not_of(" \t\r\n");
    const auto end = begin == std::string::npos
                         ? std::string::npos
                         : text.find_first_of(" \t\r\n", begin);
    if (res.exit_status != 0 || begin == std::string::npos) {
        const std::string why = trimmed(res.stderr_text);
        err.set(ErrorKind::Transport,
                why.empty() ? "Remote checksum failed"
                            : "Remote checksum failed: " + why);
        err.exit_status = res.exit_status;
        err.stderr_text = res.stderr_text;
        return false;
    }
    hex = lowered(text.substr(begin, end == std::string::npos
                                         ? std::string::npos
                                         : end - begin));
    return true;
}

bool IntegrityVerifier::verify(TransferDirection direction,
                               const std::string& localPath,
                               const std::string& remotePath,
                               RemoteSession& session, TransferError& err,
                               const CancelFn& shouldCancel) const {
    if (!settings_.enabled)
        return true;
    std::error_code ec;
    const auto size = std::filesystem::file_size(localPath, ec);
    if (ec) {
        err.set(ErrorKind::LocalIo, "Could not stat local file: " + ec.message());
        return false;
    }
    if (!shouldVerify(size))
        return true;

    std::string localHex;
    std::string e;
    if (!digestFile(settings_.algorithm, localPath, localHex, e, shouldCancel)) {
        if (shouldCancel && shouldCancel())
            err.set(ErrorKind::Cancelled, "Cancelled by user");
        else
            err.set(ErrorKind::LocalIo, e);
        return false;
    }
    std::string remoteHex;
    if (!remoteDigest(session, remotePath, remoteHex, err, shouldCancel))
        return false;

    if (lowered(localHex) != remoteHex) {
        err.set(ErrorKind::VerificationMismatch,
                std::string(digestAlgorithmName(settings_.algorithm)) +
                    " mismatch after " + directionName(direction) +
                    ": local " + localHex + ", remote " + remoteHex);
        SCPFLOW_LOGW("integrity mismatch for %s",
                     redactedPath(remotePath).c_str());
        return false;
    }
    SCPFLOW_LOGD("%s verified (%s)", redactedPath(remotePath).c_str(),
                 digestAlgorithmName(settings_.algorithm));
    return true;
}

} // namespace scpflow
