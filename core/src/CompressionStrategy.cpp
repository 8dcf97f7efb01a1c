// gzip artifacts with zlib and remote decompression over the exec channel.
#include "scpflow/CompressionStrategy.hpp"
#include "scpflow/Log.hpp"
#include "scpflow/PathUtils.hpp"
#include "scpflow/RuntimeLogging.hpp"

#include <zlib.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

namespace scpflow {

namespace {

constexpr std::size_t kIoBlock = 64 * 1024;

std::string zlibError(const char *what, int rc) {
    return std::string(what) + " failed (zlib " + std::to_string(rc) + ")";
}

std::string uniqueArtifactPath(const std::string& localPath) {
    static std::atomic<unsigned> seq{0};
    const auto stamp =
        std::chrono::steady_clock::now().time_since_epoch().count();
    std::error_code ec;
    fs::path dir = fs::temp_directory_path(ec);
    if (ec)
        dir = fs::path(localPath).parent_path();
    return (dir / ("scpflow-" + std::to_string(stamp) + "-" +
                   std::to_string(seq++) + "-" +
                   fs::path(localPath).filename().string() + ".gz"))
        .string();
}

} // namespace

std::vector<std::string> defaultCompressibleExtensions() {
    return {".txt", ".log",  ".json", ".xml",  ".csv", ".md",  ".yaml",
            ".yml", ".js",   ".ts",   ".jsx",  ".tsx", ".css", ".scss",
            ".sass", ".less", ".html", ".htm", ".sql", ".sh",  ".bash",
            ".py",  ".java", ".c",    ".cpp",  ".h"};
}

bool CompressionSettings::validate(std::string& err) const {
    if (level < 1 || level > 9) {
        err = "Compression level must be between 1 and 9";
        return false;
    }
    if (decompress_timeout.count() <= 0) {
        err = "Decompression timeout must be positive";
        return false;
    }
    return true;
}

bool gzipBytes(const std::string& in, std::string& out, int level,
               std::string& err) {
    z_stream zs{};
    int rc = ::deflateInit2(&zs, level, Z_DEFLATED, MAX_WBITS + 16, 8,
                            Z_DEFAULT_STRATEGY);
    if (rc != Z_OK) {
        err = zlibError("deflateInit2", rc);
        return false;
    }
    out.clear();
    zs.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(in.data()));
    zs.avail_in = static_cast<uInt>(in.size());
    std::vector<char> buf(kIoBlock);
    do {
        zs.next_out = reinterpret_cast<Bytef *>(buf.data());
        zs.avail_out = static_cast<uInt>(buf.size());
        rc = ::deflate(&zs, Z_FINISH);
        if (rc == Z_STREAM_ERROR) {
            ::deflateEnd(&zs);
            err = zlibError("deflate", rc);
            return false;
        }
        out.append(buf.data(), buf.size() - zs.avail_out);
    } while (rc != Z_STREAM_END);
    ::deflateEnd(&zs);
    return true;
}

bool gunzipBytes(const std::string& in, std::string& out, std::string& err) {
    z_stream zs{};
    int rc = ::inflateInit2(&zs, MAX_WBITS + 16);
    if (rc != Z_OK) {
        err = zlibError("inflateInit2", rc);
        return false;
    }
    out.clear();
    zs.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(in.data()));
    zs.avail_in = static_cast<uInt>(in.size());
    std::vector<char> buf(kIoBlock);
    do {
        zs.next_out = reinterpret_cast<Bytef *>(buf.data());
        zs.avail_out = static_cast<uInt>(buf.size());
        rc = ::inflate(&zs, Z_NO_FLUSH);
        if (rc != Z_OK && rc != Z_STREAM_END) {
            ::inflateEnd(&zs);
            err = zlibError("inflate", rc);
            return false;
        }
        out.append(buf.data(), buf.size() - zs.avail_out);
        if (rc == Z_OK && zs.avail_in == 0 && zs.avail_out != 0) {
            ::inflateEnd(&zs);
            err = "Truncated gzip stream";
            return false;
        }
    } while (rc != Z_STREAM_END);
    ::inflateEnd(&zs);
    return true;
}

CompressionStrategy::CompressionStrategy(CompressionSettings settings)
    : settings_(std::move(settings)) {}

bool CompressionStrategy::isEligible(const std::string& localPath,
                                     std::uint64_t size) const {
    if (!settings_.file_level_enabled || size < settings_.threshold)
        return false;
    const std::string ext = lowerExtension(localPath);
    if (ext.empty())
        return false;
    return std::find(settings_.extensions.begin(), settings_.extensions.end(),
                     ext) != settings_.extensions.end();
}

bool CompressionStrategy::compressFile(const std::string& localPath,
                                       std::string& artifactPath,
                                       TransferError& err,
                                       const CancelFn& shouldCancel) const {
    FILE *in = std::fopen(localPath.c_str(), "rb");
    if (!in) {
        err.set(ErrorKind::LocalIo, "Could not open file for compression: " +
                                        localPath);
        return false;
    }
    artifactPath = uniqueArtifactPath(localPath);
    FILE *out = std::fopen(artifactPath.c_str(), "wb");
    if (!out) {
        std::fclose(in);
        err.set(ErrorKind::LocalIo, "Could not create compressed artifact");
        return false;
    }

    z_stream zs{};
    int rc = ::deflateInit2(&zs, settings_.level, Z_DEFLATED, MAX_WBITS + 16,
                            8, Z_DEFAULT_STRATEGY);
    if (rc != Z_OK) {
        std::fclose(in);
        std::fclose(out);
        std::remove(artifactPath.c_str());
        err.set(ErrorKind::LocalIo, zlibError("deflateInit2", rc));
        return false;
    }

    auto fail = [&](ErrorKind kind, const std::string& msg) {
        ::deflateEnd(&zs);
        std::fclose(in);
        std::fclose(out);
        std::remove(artifactPath.c_str());
        err.set(kind, msg);
        return false;
    };

    std::vector<char> inBuf(kIoBlock);
    std::vector<char> outBuf(kIoBlock);
    bool eof = false;
    while (!eof) {
        if (shouldCancel && shouldCancel())
            return fail(ErrorKind::Cancelled, "Cancelled by user");
        const std::size_t n = std::fread(inBuf.data(), 1, inBuf.size(), in);
        if (n < inBuf.size()) {
            if (std::ferror(in))
                return fail(ErrorKind::LocalIo, "Local read failed");
            eof = true;
        }
        zs.next_in = reinterpret_cast<Bytef *>(inBuf.data());
        zs.avail_in = static_cast<uInt>(n);
        do {
            zs.next_out = reinterpret_cast<Bytef *>(outBuf.data());
            zs.avail_out = static_cast<uInt>(outBuf.size());
            rc = ::deflate(&zs, eof ? Z_FINISH : Z_NO_FLUSH);
            if (rc == Z_STREAM_ERROR)
                return fail(ErrorKind::LocalIo, zlibError("deflate", rc));
            const std::size_t have = outBuf.size() - zs.avail_out;
            if (have > 0 && std::fwrite(outBuf.data(), 1, have, out) != have)
                return fail(ErrorKind::LocalIo, "Writing compressed artifact failed");
        } while (zs.avail_out == 0);
    }
    ::deflateEnd(&zs);
    std::fclose(in);
    if (std::fclose(out) != 0) {
        std::remove(artifactPath.c_str());
        err.set(ErrorKind::LocalIo, "Closing compressed artifact failed");
        return false;
    }
    SCPFLOW_LOGD("compressed %s into %s", redactedPath(localPath).c_str(),
                 redactedPath(artifactPath).c_str());
    return true;
}

bool CompressionStrategy::remoteCanDecompress(RemoteSession& session,
                                              TransferError& err) const {
    ExecResult res;
    std::string e;
    if (!session.exec("command -v gunzip", res, e, std::chrono::seconds(30))) {
        err.set(ErrorKind::Transport, "Could not check for gunzip: " + e);
        return false;
    }
    const bool found = res.exit_status == 0 &&
                       res.stdout_text.find_first_not_of(" \t\r\n") !=
                           std::string::npos;
    if (!found)
        SCPFLOW_LOGI("remote has no gunzip; uploading uncompressed");
    return found;
}

bool CompressionStrategy::decompressRemote(RemoteSession& session,
                                           const std::string& remoteGz,
                                           TransferError& err,
                                           const CancelFn& shouldCancel) const {
    ExecResult res;
    std::string e;
    const std::string cmd = "gunzip -f " + shellQuote(remoteGz);
    if (!session.exec(cmd, res, e, settings_.decompress_timeout, shouldCancel)) {
        if (shouldCancel && shouldCancel()) {
            err.set(ErrorKind::Cancelled, "Cancelled by user");
            return false;
        }
        err.set(ErrorKind::Decompression,
                res.timed_out ? "Remote decompression timed out"
                              : "Remote decompression could not run: " + e);
        return false;
    }
    if (res.exit_status != 0) {
        err.set(ErrorKind::Decompression, "Remote decompression failed");
        err.exit_status = res.exit_status;
        err.stderr_text = res.stderr_text;
        return false;
    }
    return true;
}

} // namespace scpflow
