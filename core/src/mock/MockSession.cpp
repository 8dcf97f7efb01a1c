// In-memory backend: shared filesystem map, scripted failures and a small
// emulation of the remote commands the engine runs (gunzip, checksums).
#include "scpflow/MockSession.hpp"
#include "scpflow/CompressionStrategy.hpp"
#include "scpflow/IntegrityVerifier.hpp"
#include "scpflow/PathUtils.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <thread>

#include <sys/types.h>

namespace scpflow {

namespace {

// Extracts the first single-quoted shell argument ('a'\''b' -> a'b).
std::string firstQuotedArg(const std::string& cmd) {
    const auto start = cmd.find('\'');
    if (start == std::string::npos)
        return {};
    std::string out;
    std::size_t i = start + 1;
    while (i < cmd.size()) {
        if (cmd[i] != '\'') {
            out += cmd[i++];
            continue;
        }
        if (cmd.compare(i, 4, "'\\''") == 0) {
            out += '\'';
            i += 4;
            continue;
        }
        break;
    }
    return out;
}

bool startsWith(const std::string& s, const char *prefix) {
    return s.rfind(prefix, 0) == 0;
}

struct InflightGuard {
    std::atomic<int>& inflight;
    explicit InflightGuard(std::atomic<int>& counter, std::atomic<int>& peak)
        : inflight(counter) {
        const int now = ++inflight;
        int prev = peak.load();
        while (now > prev && !peak.compare_exchange_weak(prev, now)) {
        }
    }
    ~InflightGuard() { --inflight; }
};

bool consumeFailure(std::atomic<int>& budget) {
    int cur = budget.load();
    while (cur > 0) {
        if (budget.compare_exchange_weak(cur, cur - 1))
            return true;
    }
    return false;
}

} // namespace

// ---------------------------------------------------------------- MockRemoteFs

MockRemoteFs::MockRemoteFs() {
    Node root;
    root.is_dir = true;
    root.mode = 0755;
    nodes_["/"] = root;
}

std::string MockRemoteFs::normalize(const std::string& path) {
    if (path.empty())
        return "/";
    std::string p = path.front() == '/' ? path : "/" + path;
    while (p.size() > 1 && p.back() == '/')
        p.pop_back();
    return p;
}

void MockRemoteFs::ensureParents(const std::string& path) {
    std::string parent = remoteParent(path);
    while (!parent.empty() && nodes_.find(parent) == nodes_.end()) {
        Node dir;
        dir.is_dir = true;
        dir.mode = 0755;
        nodes_[parent] = dir;
        parent = remoteParent(parent);
    }
}

void MockRemoteFs::putFile(const std::string& path, const std::string& data,
                           std::int64_t mtime_ms) {
    const std::string p = normalize(path);
    std::lock_guard<std::mutex> lk(mtx_);
    ensureParents(p);
    Node n;
    n.data = data;
    n.mtime_ms = mtime_ms;
    nodes_[p] = std::move(n);
}

void MockRemoteFs::makeDir(const std::string& path) {
    const std::string p = normalize(path);
    std::lock_guard<std::mutex> lk(mtx_);
    ensureParents(p);
    Node n;
    n.is_dir = true;
    n.mode = 0755;
    nodes_[p] = n;
}

bool MockRemoteFs::readFile(const std::string& path, std::string& out) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = nodes_.find(normalize(path));
    if (it == nodes_.end() || it->second.is_dir)
        return false;
    out = it->second.data;
    return true;
}

bool MockRemoteFs::hasFile(const std::string& path) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = nodes_.find(normalize(path));
    return it != nodes_.end() && !it->second.is_dir;
}

bool MockRemoteFs::hasDir(const std::string& path) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = nodes_.find(normalize(path));
    return it != nodes_.end() && it->second.is_dir;
}

std::int64_t MockRemoteFs::mtimeOf(const std::string& path) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = nodes_.find(normalize(path));
    return it == nodes_.end() ? 0 : it->second.mtime_ms;
}

std::uint32_t MockRemoteFs::modeOf(const std::string& path) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = nodes_.find(normalize(path));
    return it == nodes_.end() ? 0 : it->second.mode;
}

void MockRemoteFs::setMode(const std::string& path, std::uint32_t mode) {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = nodes_.find(normalize(path));
    if (it != nodes_.end())
        it->second.mode = mode;
}

void MockRemoteFs::failListing(const std::string& path) {
    std::lock_guard<std::mutex> lk(mtx_);
    failingListings_.insert(normalize(path));
}

void MockRemoteFs::setExecHandler(ExecHandler h) {
    std::lock_guard<std::mutex> lk(mtx_);
    execHandler_ = std::move(h);
}

void MockRemoteFs::corruptFile(const std::string& path) {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = nodes_.find(normalize(path));
    if (it == nodes_.end() || it->second.data.empty())
        return;
    it->second.data[0] = static_cast<char>(it->second.data[0] ^ 0x5a);
}

std::vector<ByteRange> MockRemoteFs::rangePuts() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return rangePuts_;
}

std::vector<ByteRange> MockRemoteFs::rangeGets() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return rangeGets_;
}

std::vector<std::string> MockRemoteFs::commands() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return commands_;
}

std::vector<std::string> MockRemoteFs::listingOrder() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return listed_;
}

// ----------------------------------------------------------------- MockSession

MockSession::MockSession(std::shared_ptr<MockRemoteFs> fs)
    : fs_(std::move(fs)) {}

MockSession::~MockSession() { disconnect(); }

SessionFactory MockSession::factory(std::shared_ptr<MockRemoteFs> fs) {
    return [fs]() -> std::unique_ptr<RemoteSession> {
        return std::make_unique<MockSession>(fs);
    };
}

bool MockSession::connect(const HostIdentity& id, TransferError& err) {
    if (connected_) {
        err.set(ErrorKind::Connect, "Already connected");
        return false;
    }
    for (std::size_t i = 0; i < id.hopCount(); ++i) {
        const HopIdentity& hop = id.hop(i);
        if (hop.host.empty() || hop.username.empty()) {
            err.set(ErrorKind::Connect, "Host and username are required");
            err.hop_index = static_cast<int>(i);
            return false;
        }
        if (fs_->failHop_.load() == static_cast<int>(i)) {
            err.set(ErrorKind::Connect, "Could not reach " + hop.host);
            err.hop_index = static_cast<int>(i);
            return false;
        }
    }
    connected_ = true;
    broken_ = false;
    ++fs_->connects_;
    ++fs_->live_;
    return true;
}

void MockSession::disconnect() {
    if (!connected_)
        return;
    connected_ = false;
    --fs_->live_;
}

bool MockSession::ready(std::string& err) const {
    if (!connected_) {
        err = "Not connected";
        return false;
    }
    if (broken_) {
        err = "Channel closed by peer";
        return false;
    }
    return true;
}

bool MockSession::stopRequested(const CancelFn& shouldCancel) {
    if (interrupted_.exchange(false))
        return true;
    return shouldCancel && shouldCancel();
}

void MockSession::pace() {
    const long long ms = fs_->blockDelayMs_.load();
    if (ms > 0)
        std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

bool MockSession::list(const std::string& remote_path,
                       std::vector<FileInfo>& out, std::string& err) {
    if (!ready(err))
        return false;
    const std::string dir = MockRemoteFs::normalize(remote_path);
    std::lock_guard<std::mutex> lk(fs_->mtx_);
    fs_->listed_.push_back(dir);
    if (fs_->failingListings_.count(dir)) {
        err = "Permission denied: " + dir;
        return false;
    }
    auto self = fs_->nodes_.find(dir);
    if (self == fs_->nodes_.end() || !self->second.is_dir) {
        err = "No such directory: " + dir;
        return false;
    }
    out.clear();
    const std::string prefix = dir == "/" ? "/" : dir + "/";
    for (auto it = fs_->nodes_.lower_bound(prefix);
         it != fs_->nodes_.end() && startsWith(it->first, prefix.c_str());
         ++it) {
        const std::string rest = it->first.substr(prefix.size());
        if (rest.empty() || rest.find('/') != std::string::npos)
            continue;
        FileInfo fi;
        fi.name = rest;
        fi.is_dir = it->second.is_dir;
        fi.size = it->second.is_dir ? 0 : it->second.data.size();
        fi.mtime_ms = it->second.mtime_ms;
        fi.mode = it->second.mode;
        out.push_back(std::move(fi));
    }
    return true;
}

bool MockSession::stat(const std::string& remote_path, FileInfo& info,
                       std::string& err) {
    if (!ready(err))
        return false;
    const std::string p = MockRemoteFs::normalize(remote_path);
    std::lock_guard<std::mutex> lk(fs_->mtx_);
    auto it = fs_->nodes_.find(p);
    if (it == fs_->nodes_.end()) {
        err.clear();
        return false;
    }
    info.name = remoteBaseName(p);
    info.is_dir = it->second.is_dir;
    info.size = it->second.is_dir ? 0 : it->second.data.size();
    info.mtime_ms = it->second.mtime_ms;
    info.mode = it->second.mode;
    return true;
}

bool MockSession::exists(const std::string& remote_path, bool& isDir,
                         std::string& err) {
    isDir = false;
    FileInfo fi;
    if (!stat(remote_path, fi, err))
        return false;
    isDir = fi.is_dir;
    return true;
}

bool MockSession::get(const std::string& remote, const std::string& local,
                      std::string& err, ProgressFn progress,
                      CancelFn shouldCancel, std::optional<ByteRange> range,
                      bool resume) {
    if (!ready(err))
        return false;
    interrupted_ = false;
    InflightGuard guard(fs_->inflight_, fs_->peakInflight_);
    if (consumeFailure(fs_->failGets_)) {
        broken_ = true;
        err = "Remote read failed";
        return false;
    }
    std::string data;
    if (!fs_->readFile(remote, data)) {
        err = "Could not open remote file for reading";
        return false;
    }
    std::uint64_t begin = 0;
    std::uint64_t end = data.size();
    FILE *lf = nullptr;
    if (range) {
        begin = range->offset;
        end = std::min<std::uint64_t>(data.size(), range->offset + range->length);
        {
            std::lock_guard<std::mutex> lk(fs_->mtx_);
            fs_->rangeGets_.push_back(*range);
        }
        lf = std::fopen(local.c_str(), "r+b");
        if (!lf && errno == ENOENT)
            lf = std::fopen(local.c_str(), "w+b");
        if (!lf) {
            err = "Could not open local file for writing";
            return false;
        }
        if (::fseeko(lf, static_cast<off_t>(begin), SEEK_SET) != 0) {
            std::fclose(lf);
            err = "Could not seek local file";
            return false;
        }
    } else if (resume) {
        lf = std::fopen(local.c_str(), "ab");
        if (lf) {
            const off_t cur = ::ftello(lf);
            if (cur > 0 && static_cast<std::uint64_t>(cur) < end)
                begin = static_cast<std::uint64_t>(cur);
        }
    }
    if (!lf)
        lf = std::fopen(local.c_str(), "wb");
    if (!lf) {
        err = "Could not open local file for writing";
        return false;
    }

    const std::size_t block = fs_->blockSize_.load();
    const std::uint64_t total = end - begin;
    std::uint64_t done = 0;
    while (begin + done < end) {
        if (stopRequested(shouldCancel)) {
            std::fclose(lf);
            err = "Cancelled by user";
            return false;
        }
        const std::size_t n = static_cast<std::size_t>(
            std::min<std::uint64_t>(block, end - begin - done));
        if (std::fwrite(data.data() + begin + done, 1, n, lf) != n) {
            std::fclose(lf);
            err = "Local write failed";
            return false;
        }
        done += n;
        if (progress)
            progress(done, total);
        pace();
    }
    std::fclose(lf);
    return true;
}

bool MockSession::put(const std::string& local, const std::string& remote,
                      std::string& err, ProgressFn progress,
                      CancelFn shouldCancel, std::optional<ByteRange> range,
                      bool resume) {
    if (!ready(err))
        return false;
    interrupted_ = false;
    InflightGuard guard(fs_->inflight_, fs_->peakInflight_);
    ++fs_->putCalls_;
    if (consumeFailure(fs_->failPuts_)) {
        broken_ = true;
        err = "Remote write failed";
        return false;
    }
    FILE *lf = std::fopen(local.c_str(), "rb");
    if (!lf) {
        err = "Could not open local file for reading";
        return false;
    }
    ::fseeko(lf, 0, SEEK_END);
    const off_t fsz = ::ftello(lf);
    const std::uint64_t fileSize = fsz > 0 ? static_cast<std::uint64_t>(fsz) : 0;

    const std::string p = MockRemoteFs::normalize(remote);
    std::uint64_t begin = 0;
    std::uint64_t end = fileSize;
    {
        std::lock_guard<std::mutex> lk(fs_->mtx_);
        auto parent = fs_->nodes_.find(remoteParent(p));
        if (parent == fs_->nodes_.end() || !parent->second.is_dir) {
            std::fclose(lf);
            err = "Could not open remote file for writing";
            return false;
        }
        MockRemoteFs::Node& node = fs_->nodes_[p];
        if (range) {
            begin = range->offset;
            end = std::min<std::uint64_t>(fileSize, range->offset + range->length);
            fs_->rangePuts_.push_back(*range);
        } else if (resume && node.data.size() < fileSize) {
            begin = node.data.size();
        } else {
            node.data.clear();
        }
    }
    ::fseeko(lf, static_cast<off_t>(begin), SEEK_SET);

    const std::size_t block = fs_->blockSize_.load();
    std::vector<char> buf(block);
    const std::uint64_t total = end - begin;
    std::uint64_t done = 0;
    while (begin + done < end) {
        if (stopRequested(shouldCancel)) {
            std::fclose(lf);
            err = "Cancelled by user";
            return false;
        }
        const std::size_t want = static_cast<std::size_t>(
            std::min<std::uint64_t>(block, end - begin - done));
        const std::size_t n = std::fread(buf.data(), 1, want, lf);
        if (n != want) {
            std::fclose(lf);
            err = "Local read failed";
            return false;
        }
        {
            std::lock_guard<std::mutex> lk(fs_->mtx_);
            std::string& dst = fs_->nodes_[p].data;
            const std::uint64_t at = begin + done;
            if (dst.size() < at + n)
                dst.resize(static_cast<std::size_t>(at + n), '\0');
            std::copy(buf.data(), buf.data() + n,
                      dst.begin() + static_cast<std::ptrdiff_t>(at));
        }
        done += n;
        if (progress)
            progress(done, total);
        pace();
    }
    std::fclose(lf);
    return true;
}

bool MockSession::truncate(const std::string& remote_path, std::uint64_t size,
                           std::string& err) {
    if (!ready(err))
        return false;
    const std::string p = MockRemoteFs::normalize(remote_path);
    std::lock_guard<std::mutex> lk(fs_->mtx_);
    auto parent = fs_->nodes_.find(remoteParent(p));
    if (parent == fs_->nodes_.end() || !parent->second.is_dir) {
        err = "Parent directory does not exist";
        return false;
    }
    fs_->nodes_[p].data.resize(static_cast<std::size_t>(size), '\0');
    return true;
}

bool MockSession::setTimes(const std::string& remote_path, std::uint64_t,
                           std::uint64_t mtime, std::string& err) {
    if (!ready(err))
        return false;
    std::lock_guard<std::mutex> lk(fs_->mtx_);
    auto it = fs_->nodes_.find(MockRemoteFs::normalize(remote_path));
    if (it == fs_->nodes_.end()) {
        err = "No such file";
        return false;
    }
    it->second.mtime_ms = static_cast<std::int64_t>(mtime) * 1000;
    return true;
}

bool MockSession::setPermissions(const std::string& remote_path,
                                 std::uint32_t mode, std::string& err) {
    if (!ready(err))
        return false;
    std::lock_guard<std::mutex> lk(fs_->mtx_);
    auto it = fs_->nodes_.find(MockRemoteFs::normalize(remote_path));
    if (it == fs_->nodes_.end()) {
        err = "No such file";
        return false;
    }
    it->second.mode = mode & 0777;
    return true;
}

bool MockSession::mkdir(const std::string& remote_dir, std::string& err,
                        unsigned int mode) {
    if (!ready(err))
        return false;
    const std::string p = MockRemoteFs::normalize(remote_dir);
    std::lock_guard<std::mutex> lk(fs_->mtx_);
    if (fs_->nodes_.count(p)) {
        err = "Already exists: " + p;
        return false;
    }
    if (!fs_->nodes_.count(remoteParent(p))) {
        err = "Parent directory does not exist";
        return false;
    }
    MockRemoteFs::Node n;
    n.is_dir = true;
    n.mode = mode;
    fs_->nodes_[p] = n;
    return true;
}

bool MockSession::removeFile(const std::string& remote_path,
                             std::string& err) {
    if (!ready(err))
        return false;
    std::lock_guard<std::mutex> lk(fs_->mtx_);
    auto it = fs_->nodes_.find(MockRemoteFs::normalize(remote_path));
    if (it == fs_->nodes_.end() || it->second.is_dir) {
        err = "No such file";
        return false;
    }
    fs_->nodes_.erase(it);
    return true;
}

bool MockSession::removeDir(const std::string& remote_dir, std::string& err) {
    if (!ready(err))
        return false;
    const std::string p = MockRemoteFs::normalize(remote_dir);
    std::lock_guard<std::mutex> lk(fs_->mtx_);
    auto it = fs_->nodes_.find(p);
    if (it == fs_->nodes_.end() || !it->second.is_dir) {
        err = "No such directory";
        return false;
    }
    auto next = std::next(it);
    if (next != fs_->nodes_.end() && startsWith(next->first, (p + "/").c_str())) {
        err = "Directory not empty";
        return false;
    }
    fs_->nodes_.erase(it);
    return true;
}

bool MockSession::rename(const std::string& from, const std::string& to,
                         std::string& err, bool overwrite) {
    if (!ready(err))
        return false;
    const std::string src = MockRemoteFs::normalize(from);
    const std::string dst = MockRemoteFs::normalize(to);
    std::lock_guard<std::mutex> lk(fs_->mtx_);
    auto it = fs_->nodes_.find(src);
    if (it == fs_->nodes_.end() || it->second.is_dir) {
        err = "No such file";
        return false;
    }
    if (fs_->nodes_.count(dst) && !overwrite) {
        err = "Destination exists";
        return false;
    }
    fs_->nodes_[dst] = it->second;
    fs_->nodes_.erase(src);
    return true;
}

bool MockSession::exec(const std::string& command, ExecResult& out,
                       std::string& err, std::chrono::milliseconds,
                       CancelFn shouldCancel) {
    if (!ready(err))
        return false;
    interrupted_ = false;
    if (stopRequested(shouldCancel)) {
        err = "Cancelled by user";
        return false;
    }
    MockRemoteFs::ExecHandler handler;
    {
        std::lock_guard<std::mutex> lk(fs_->mtx_);
        fs_->commands_.push_back(command);
        handler = fs_->execHandler_;
    }
    out = ExecResult{};
    if (!(handler && handler(command, out)) && !emulateCommand(command, out)) {
        out.exit_status = 127;
        out.stderr_text = "sh: command not found";
    }
    if (out.timed_out) {
        err = "Remote command timed out";
        return false;
    }
    return true;
}

bool MockSession::emulateCommand(const std::string& command, ExecResult& out) {
    if (startsWith(command, "command -v gunzip") ||
        startsWith(command, "which gunzip")) {
        out.exit_status = fs_->gunzipAvailable_ ? 0 : 1;
        out.stdout_text = fs_->gunzipAvailable_ ? "/usr/bin/gunzip\n" : "";
        return true;
    }
    if (startsWith(command, "gunzip -f ")) {
        if (!fs_->gunzipAvailable_) {
            out.exit_status = 127;
            out.stderr_text = "sh: gunzip: not found";
            return true;
        }
        const std::string gz = MockRemoteFs::normalize(firstQuotedArg(command));
        std::string packed;
        if (!fs_->readFile(gz, packed)) {
            out.exit_status = 1;
            out.stderr_text = "gzip: " + gz + ": No such file or directory";
            return true;
        }
        std::string plain;
        std::string zerr;
        if (!gunzipBytes(packed, plain, zerr)) {
            out.exit_status = 1;
            out.stderr_text = "gzip: " + gz + ": not in gzip format";
            return true;
        }
        const std::string target = gz.size() > 3 && gz.compare(gz.size() - 3, 3, ".gz") == 0
                                       ? gz.substr(0, gz.size() - 3)
                                       : gz;
        std::lock_guard<std::mutex> lk(fs_->mtx_);
        fs_->nodes_.erase(gz);
        MockRemoteFs::Node n;
        n.data = std::move(plain);
        fs_->nodes_[target] = std::move(n);
        out.exit_status = 0;
        return true;
    }
    const bool sha = startsWith(command, "if command -v sha256sum ");
    const bool md5 = startsWith(command, "if command -v md5sum ");
    if (sha || md5) {
        out.exit_status = 0;
        if (!fs_->checksumTools_) {
            out.stdout_text = "CHECKSUM_TOOL_NOT_FOUND\n";
            return true;
        }
        const std::string path = firstQuotedArg(command);
        std::string data;
        if (!fs_->readFile(path, data)) {
            out.exit_status = 1;
            out.stderr_text = std::string(sha ? "sha256sum: " : "md5sum: ") +
                              path + ": No such file or directory\n";
            return true;
        }
        std::string hex;
        std::string derr;
        if (!digestBytes(sha ? DigestAlgorithm::Sha256 : DigestAlgorithm::Md5,
                         data, hex, derr)) {
            out.exit_status = 1;
            out.stderr_text = derr;
            return true;
        }
        out.stdout_text = hex + "  " + path + "\n";
        return true;
    }
    return false;
}

} // namespace scpflow
