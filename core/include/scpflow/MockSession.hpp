// In-memory RemoteSession used by the tests. Every MockSession created from
// the same MockRemoteFs sees the same files, like sessions on one server.
#pragma once
#include "RemoteSession.hpp"

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace scpflow {

class MockRemoteFs {
public:
    struct Node {
        bool is_dir = false;
        std::string data;
        std::int64_t mtime_ms = 0;
        std::uint32_t mode = 0644;
    };

    // Returns true when it handled the command and filled `out`.
    using ExecHandler =
        std::function<bool(const std::string& command, ExecResult& out)>;

    MockRemoteFs();

    // Content setup (parent directories are created implicitly).
    void putFile(const std::string& path, const std::string& data,
                 std::int64_t mtime_ms = 0);
    void makeDir(const std::string& path);
    bool readFile(const std::string& path, std::string& out) const;
    bool hasFile(const std::string& path) const;
    bool hasDir(const std::string& path) const;
    std::int64_t mtimeOf(const std::string& path) const;
    std::uint32_t modeOf(const std::string& path) const;
    void setMode(const std::string& path, std::uint32_t mode);

    // Failure injection.
    void failConnectAtHop(int hop) { failHop_ = hop; }
    void failListing(const std::string& path);
    void failNextPuts(int n) { failPuts_ = n; }
    void failNextGets(int n) { failGets_ = n; }
    void setGunzipAvailable(bool v) { gunzipAvailable_ = v; }
    void setChecksumToolsAvailable(bool v) { checksumTools_ = v; }
    void setExecHandler(ExecHandler h);
    // Sleep applied after every transferred block (slow links in tests).
    void setBlockDelay(std::chrono::milliseconds d) { blockDelayMs_ = d.count(); }
    void setBlockSize(std::size_t n) { blockSize_ = n; }
    // Rewrites the stored bytes of a file without changing its size.
    void corruptFile(const std::string& path);

    // Counters for assertions.
    int connects() const { return connects_.load(); }
    int liveSessions() const { return live_.load(); }
    int peakInflightTransfers() const { return peakInflight_.load(); }
    int putCalls() const { return putCalls_.load(); }
    std::vector<ByteRange> rangePuts() const;
    std::vector<ByteRange> rangeGets() const;
    std::vector<std::string> commands() const;
    std::vector<std::string> listingOrder() const;

private:
    friend class MockSession;

    static std::string normalize(const std::string& path);
    void ensureParents(const std::string& path);

    mutable std::mutex mtx_;
    std::map<std::string, Node> nodes_;
    std::set<std::string> failingListings_;
    ExecHandler execHandler_;
    std::vector<ByteRange> rangePuts_;
    std::vector<ByteRange> rangeGets_;
    std::vector<std::string> commands_;
    std::vector<std::string> listed_;

    std::atomic<int> failHop_{-1};
    std::atomic<int> failPuts_{0};
    std::atomic<int> failGets_{0};
    std::atomic<bool> gunzipAvailable_{true};
    std::atomic<bool> checksumTools_{true};
    std::atomic<long long> blockDelayMs_{0};
    std::atomic<std::size_t> blockSize_{64 * 1024};

    std::atomic<int> connects_{0};
    std::atomic<int> live_{0};
    std::atomic<int> inflight_{0};
    std::atomic<int> peakInflight_{0};
    std::atomic<int> putCalls_{0};
};

class MockSession : public RemoteSession {
public:
    explicit MockSession(std::shared_ptr<MockRemoteFs> fs);
    ~MockSession() override;

    static SessionFactory factory(std::shared_ptr<MockRemoteFs> fs);

    bool connect(const HostIdentity& id, TransferError& err) override;
    void disconnect() override;
    bool isConnected() const override { return connected_ && !broken_; }

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

    // Simulates a dropped transport: later calls fail with a channel error.
    void breakTransport() { broken_ = true; }

private:
    bool ready(std::string& err) const;
    bool stopRequested(const CancelFn& shouldCancel);
    void pace();
    bool emulateCommand(const std::string& command, ExecResult& out);

    std::shared_ptr<MockRemoteFs> fs_;
    bool connected_ = false;
    std::atomic<bool> interrupted_{false};
    std::atomic<bool> broken_{false};
};

} // namespace scpflow
