// libssh2 backend: TCP socket, SSH session per hop, SFTP channel and exec
// channels on the target. Jump hosts are chained through direct-tcpip
// channels relayed to a local socket pair.
#pragma once
#include "RemoteSession.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

// Forward declarations of the internal libssh2 types
struct _LIBSSH2_SESSION;
struct _LIBSSH2_SFTP;
struct _LIBSSH2_CHANNEL;

namespace scpflow {

class Libssh2Session : public RemoteSession {
public:
    explicit Libssh2Session(ConnectSettings settings = {});
    ~Libssh2Session() override;

    Libssh2Session(const Libssh2Session&) = delete;
    Libssh2Session& operator=(const Libssh2Session&) = delete;

    static SessionFactory factory(ConnectSettings settings = {});

    bool connect(const HostIdentity& id, TransferError& err) override;
    void disconnect() override;
    bool isConnected() const override { return connected_; }

    bool list(const std::string& remote_path, std::vector<FileInfo>& out,
              std::string& err) override;
    bool stat(const std::string& remote_path, FileInfo& info,
              std::string& err) override;
    bool exists(const std::string& remote_path, bool& isDir,
                std::string& err) override;

    bool get(const std::string& remote, const std::string& local,
             std::string& err, ProgressFn progress = {},
             CancelFn shouldCancel = {},
             std::optional<ByteRange> range = std::nullopt,
             bool resume = false) override;
    bool put(const std::string& local, const std::string& remote,
             std::string& err, ProgressFn progress = {},
             CancelFn shouldCancel = {},
             std::optional<ByteRange> range = std::nullopt,
             bool resume = false) override;

    bool truncate(const std::string& remote_path, std::uint64_t size,
                  std::string& err) override;
    bool setTimes(const std::string& remote_path, std::uint64_t atime,
                  std::uint64_t mtime, std::string& err) override;
    bool setPermissions(const std::string& remote_path, std::uint32_t mode,
                        std::string& err) override;
    bool mkdir(const std::string& remote_dir, std::string& err,
               unsigned int mode = 0755) override;
    bool removeFile(const std::string& remote_path, std::string& err) override;
    bool removeDir(const std::string& remote_dir, std::string& err) override;
    bool rename(const std::string& from, const std::string& to,
                std::string& err, bool overwrite = false) override;
    bool exec(const std::string& command, ExecResult& out, std::string& err,
              std::chrono::milliseconds timeout = std::chrono::minutes(5),
              CancelFn shouldCancel = {}) override;
    void interrupt() override { interrupted_ = true; }

private:
    // One SSH session of the chain. For every hop after the first, `sock` is
    // one end of a socket pair; the relay thread pumps the other end through
    // a direct-tcpip channel opened on the previous hop.
    struct Hop {
        int sock = -1;
        _LIBSSH2_SESSION *session = nullptr;

        _LIBSSH2_CHANNEL *tunnel = nullptr; // on the previous hop's session
        int relayFd = -1;
        std::unique_ptr<std::atomic<bool>> stopRelay;
        std::thread relay;
    };

    bool tcpConnect(const std::string& host, std::uint16_t port, int& sock,
                    std::string& err);
    bool openTunnel(Hop& carrier, Hop& next, const HopIdentity& target,
                    std::string& err);
    bool handshakeAuth(Hop& hop, const HopIdentity& id, std::string& err);
    void closeHop(Hop& hop);
    bool ready(std::string& err) const;
    bool stopRequested(const CancelFn& shouldCancel) const;
    bool waitSocket(int timeoutMs);

    ConnectSettings settings_;
    std::vector<Hop> hops_;
    _LIBSSH2_SESSION *session_ = nullptr; // target hop
    _LIBSSH2_SFTP *sftp_ = nullptr;
    int sock_ = -1; // socket of the target hop
    bool connected_ = false;
    std::atomic<bool> interrupted_{false};
};

} // namespace scpflow
