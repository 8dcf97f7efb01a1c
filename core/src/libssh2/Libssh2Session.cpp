// libssh2 backend: TCP socket, SSH session and SFTP channel per hop chain.
// Includes keepalive, known_hosts validation, transport compression, ranged
// transfers and an exec channel with timeout.
#include "scpflow/Libssh2Session.hpp"
#include "scpflow/Log.hpp"
#include "scpflow/RuntimeLogging.hpp"

#include <libssh2.h>
#include <libssh2_sftp.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// POSIX sockets
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace scpflow {

namespace {

constexpr std::size_t kIoBlock = 64 * 1024;

std::once_flag g_libssh2_once;
int g_libssh2_init_rc = 0;

bool ensureLibssh2(std::string& err) {
    std::call_once(g_libssh2_once, [] { g_libssh2_init_rc = libssh2_init(0); });
    if (g_libssh2_init_rc != 0) {
        err = "libssh2_init failed (" + std::to_string(g_libssh2_init_rc) + ")";
        return false;
    }
    return true;
}

std::string lastSessionError(LIBSSH2_SESSION *s) {
    char *msg = nullptr;
    int len = 0;
    (void)libssh2_session_last_error(s, &msg, &len, 0);
    return (msg && len > 0) ? std::string(msg, static_cast<std::size_t>(len))
                            : std::string();
}

// Keyboard-interactive context: answers username and password prompts.
struct KbdIntCtx {
    const char *user;
    const char *pass;
};

char *dupResponse(const char *s, std::size_t len) {
    char *buf = static_cast<char *>(std::malloc(len + 1));
    if (!buf)
        return nullptr;
    std::memcpy(buf, s, len);
    buf[len] = '\0';
    return buf;
}

// Sends the username when the prompt mentions "user" or "name", otherwise the
// password.
void kbintPasswordCallback(const char *, int, const char *, int, int num_prompts,
                           const LIBSSH2_USERAUTH_KBDINT_PROMPT *prompts,
                           LIBSSH2_USERAUTH_KBDINT_RESPONSE *responses,
                           void **abstract) {
    if (!abstract || !*abstract)
        return;
    const KbdIntCtx *ctx = static_cast<const KbdIntCtx *>(*abstract);
    for (int i = 0; i < num_prompts; ++i) {
        std::string prompt =
            (prompts && prompts[i].text)
                ? std::string(reinterpret_cast<const char *>(prompts[i].text),
                              prompts[i].length)
                : std::string();
        for (auto& c : prompt)
            if (c >= 'A' && c <= 'Z')
                c = static_cast<char>(c - 'A' + 'a');
        const bool wantUser = prompt.find("user") != std::string::npos ||
                              prompt.find("name") != std::string::npos;
        const char *ans = wantUser ? ctx->user : ctx->pass;
        const std::size_t alen = ans ? std::strlen(ans) : 0;
        responses[i].text = alen ? dupResponse(ans, alen) : nullptr;
        responses[i].length =
            responses[i].text ? static_cast<unsigned int>(alen) : 0;
    }
}

int knownHostKeyAlg(int keytype) {
    switch (keytype) {
    case LIBSSH2_HOSTKEY_TYPE_RSA:
        return LIBSSH2_KNOWNHOST_KEY_SSHRSA;
    case LIBSSH2_HOSTKEY_TYPE_DSS:
        return LIBSSH2_KNOWNHOST_KEY_SSHDSS;
#ifdef LIBSSH2_KNOWNHOST_KEY_ECDSA_256
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_256:
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_256;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_384:
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_384;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_521:
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_521;
#endif
#ifdef LIBSSH2_KNOWNHOST_KEY_ED25519
    case LIBSSH2_HOSTKEY_TYPE_ED25519:
        return LIBSSH2_KNOWNHOST_KEY_ED25519;
#endif
    default:
        return 0;
    }
}

bool verifyHostKey(LIBSSH2_SESSION *session, const HopIdentity& id,
                   std::string& err) {
    if (id.known_hosts_policy == KnownHostsPolicy::Off)
        return true;
    LIBSSH2_KNOWNHOSTS *nh = libssh2_knownhost_init(session);
    if (!nh) {
        err = "Could not initialize known_hosts";
        return false;
    }

    std::string khPath;
    if (id.known_hosts_path.has_value()) {
        khPath = *id.known_hosts_path;
    } else {
        const char *home = std::getenv("HOME");
        if (home)
            khPath = std::string(home) + "/.ssh/known_hosts";
    }
    const bool khLoaded =
        !khPath.empty() && libssh2_knownhost_readfile(
                               nh, khPath.c_str(),
                               LIBSSH2_KNOWNHOST_FILE_OPENSSH) >= 0;
    if (!khLoaded && id.known_hosts_policy == KnownHostsPolicy::Strict) {
        libssh2_knownhost_free(nh);
        err = "known_hosts missing or unreadable (strict policy)";
        return false;
    }

    std::size_t keylen = 0;
    int keytype = 0;
    const char *hostkey = libssh2_session_hostkey(session, &keylen, &keytype);
    if (!hostkey || keylen == 0) {
        libssh2_knownhost_free(nh);
        err = "Could not read the server host key";
        return false;
    }
    const int alg = knownHostKeyAlg(keytype);
    struct libssh2_knownhost *host = nullptr;
    int check = libssh2_knownhost_checkp(
        nh, id.host.c_str(), id.port, hostkey, keylen,
        LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg, &host);
    if (check != LIBSSH2_KNOWNHOST_CHECK_MATCH)
        check = libssh2_knownhost_checkp(
            nh, id.host.c_str(), id.port, hostkey, keylen,
            LIBSSH2_KNOWNHOST_TYPE_SHA1 | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg,
            &host);

    if (check == LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        libssh2_knownhost_free(nh);
        return true;
    }
    if (id.known_hosts_policy == KnownHostsPolicy::AcceptNew &&
        check == LIBSSH2_KNOWNHOST_CHECK_NOTFOUND) {
        if (khPath.empty()) {
            libssh2_knownhost_free(nh);
            err = "known_hosts path is not defined";
            return false;
        }
        const int rc = libssh2_knownhost_addc(
            nh, id.host.c_str(), nullptr, hostkey, keylen, nullptr, 0,
            LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg,
            nullptr);
        if (rc != 0 || libssh2_knownhost_writefile(
                           nh, khPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) != 0) {
            libssh2_knownhost_free(nh);
            err = "Could not add host to known_hosts";
            return false;
        }
        libssh2_knownhost_free(nh);
        const std::string who =
            sensitiveLoggingEnabled() ? " for " + id.host : std::string();
        SCPFLOW_LOGI("added host key to known_hosts%s", who.c_str());
        return true;
    }
    libssh2_knownhost_free(nh);
    // AcceptNew still rejects a changed key.
    if (check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH)
        err = "Host key does not match known_hosts";
    else if (check == LIBSSH2_KNOWNHOST_CHECK_NOTFOUND)
        err = "Host not found in known_hosts";
    else
        err = "known_hosts check failed";
    return false;
}

bool agentAuth(LIBSSH2_SESSION *session, const std::string& user) {
    bool authed = false;
    LIBSSH2_AGENT *agent = libssh2_agent_init(session);
    if (agent && libssh2_agent_connect(agent) == 0 &&
        libssh2_agent_list_identities(agent) == 0) {
        struct libssh2_agent_publickey *identity = nullptr;
        struct libssh2_agent_publickey *prev = nullptr;
        int tries = 0;
        const int kMaxAgentTries = 3;
        while (tries < kMaxAgentTries &&
               libssh2_agent_get_identity(agent, &identity, prev) == 0) {
            prev = identity;
            ++tries;
            if (libssh2_agent_userauth(agent, user.c_str(), identity) == 0) {
                authed = true;
                break;
            }
        }
    }
    if (agent) {
        libssh2_agent_disconnect(agent);
        libssh2_agent_free(agent);
    }
    return authed;
}

// Pumps bytes between a direct-tcpip channel and one end of a socket pair
// until either side closes or `stop` is set. The carrier session must be in
// non-blocking mode and is used by this thread only.
void relayLoop(LIBSSH2_SESSION *carrier, int carrierSock,
               LIBSSH2_CHANNEL *channel, int fd, std::atomic<bool> *stop,
               int keepaliveSec) {
    std::vector<char> buf(kIoBlock);
    std::string toChannel;
    std::string toSocket;
    auto lastKeepalive = std::chrono::steady_clock::now();
    while (!stop->load()) {
        bool moved = false;
        if (toChannel.empty()) {
            const ssize_t n = ::recv(fd, buf.data(), buf.size(), 0);
            if (n > 0) {
                toChannel.assign(buf.data(), static_cast<std::size_t>(n));
            } else if (n == 0 || (errno != EAGAIN && errno != EWOULDBLOCK)) {
                break;
            }
        }
        if (!toChannel.empty()) {
            const ssize_t w =
                libssh2_channel_write(channel, toChannel.data(), toChannel.size());
            if (w > 0) {
                toChannel.erase(0, static_cast<std::size_t>(w));
                moved = true;
            } else if (w != LIBSSH2_ERROR_EAGAIN) {
                break;
            }
        }
        if (toSocket.empty()) {
            const ssize_t n = libssh2_channel_read(channel, buf.data(), buf.size());
            if (n > 0) {
                toSocket.assign(buf.data(), static_cast<std::size_t>(n));
            } else if (n == 0 ? libssh2_channel_eof(channel) != 0
                              : n != LIBSSH2_ERROR_EAGAIN) {
                break;
            }
        }
        if (!toSocket.empty()) {
            const ssize_t w =
                ::send(fd, toSocket.data(), toSocket.size(), MSG_NOSIGNAL);
            if (w > 0) {
                toSocket.erase(0, static_cast<std::size_t>(w));
                moved = true;
            } else if (errno != EAGAIN && errno != EWOULDBLOCK) {
                break;
            }
        }
        if (keepaliveSec > 0) {
            const auto now = std::chrono::steady_clock::now();
            if (now - lastKeepalive > std::chrono::seconds(keepaliveSec)) {
                int next = 0;
                (void)libssh2_keepalive_send(carrier, &next);
                lastKeepalive = now;
            }
        }
        if (moved)
            continue;
        struct pollfd pfds[2];
        pfds[0].fd = fd;
        pfds[0].events = static_cast<short>(
            (toChannel.empty() ? POLLIN : 0) | (toSocket.empty() ? 0 : POLLOUT));
        pfds[0].revents = 0;
        pfds[1].fd = carrierSock;
        const int dir = libssh2_session_block_directions(carrier);
        pfds[1].events = static_cast<short>(
            POLLIN | ((dir & LIBSSH2_SESSION_BLOCK_OUTBOUND) ? POLLOUT : 0));
        pfds[1].revents = 0;
        (void)::poll(pfds, 2, 50);
    }
    ::shutdown(fd, SHUT_RDWR);
}

void setTcpKeepalive(int s) {
    int opt = 1;
    ::setsockopt(s, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));
#ifdef __APPLE__
    int idle = 60;
    ::setsockopt(s, IPPROTO_TCP, TCP_KEEPALIVE, &idle, sizeof(idle));
#elif defined(__linux__)
    int idle = 60, intvl = 10, cnt = 3;
    ::setsockopt(s, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
    ::setsockopt(s, IPPROTO_TCP, TCP_KEEPINTVL, &intvl, sizeof(intvl));
    ::setsockopt(s, IPPROTO_TCP, TCP_KEEPCNT, &cnt, sizeof(cnt));
#endif
}

bool isMissing(LIBSSH2_SFTP *sftp) {
    const unsigned long e = libssh2_sftp_last_error(sftp);
    return e == LIBSSH2_FX_NO_SUCH_FILE || e == LIBSSH2_FX_FAILURE;
}

FileInfo fromAttrs(const LIBSSH2_SFTP_ATTRIBUTES& a) {
    FileInfo fi;
    fi.is_dir = (a.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS)
                    ? ((a.permissions & LIBSSH2_SFTP_S_IFMT) == LIBSSH2_SFTP_S_IFDIR)
                    : false;
    fi.size = (a.flags & LIBSSH2_SFTP_ATTR_SIZE)
                  ? static_cast<std::uint64_t>(a.filesize)
                  : 0;
    fi.mtime_ms = (a.flags & LIBSSH2_SFTP_ATTR_ACMODTIME)
                      ? static_cast<std::int64_t>(a.mtime) * 1000
                      : 0;
    fi.mode = (a.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS)
                  ? static_cast<std::uint32_t>(a.permissions)
                  : 0;
    return fi;
}

// Opens `local` for writing at a range offset without truncating it.
FILE *openForRangeWrite(const std::string& local) {
    FILE *f = std::fopen(local.c_str(), "r+b");
    if (!f && errno == ENOENT)
        f = std::fopen(local.c_str(), "w+b");
    return f;
}

} // namespace

Libssh2Session::Libssh2Session(ConnectSettings settings) : settings_(settings) {}

Libssh2Session::~Libssh2Session() { disconnect(); }

SessionFactory Libssh2Session::factory(ConnectSettings settings) {
    return [settings]() -> std::unique_ptr<RemoteSession> {
        return std::make_unique<Libssh2Session>(settings);
    };
}

bool Libssh2Session::tcpConnect(const std::string& host, std::uint16_t port,
                                int& sock, std::string& err) {
    struct addrinfo hints {};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    char portStr[16];
    std::snprintf(portStr, sizeof(portStr), "%u", static_cast<unsigned>(port));

    struct addrinfo *res = nullptr;
    const int gai = ::getaddrinfo(host.c_str(), portStr, &hints, &res);
    if (gai != 0) {
        err = std::string("getaddrinfo: ") + gai_strerror(gai);
        return false;
    }
    for (auto rp = res; rp != nullptr; rp = rp->ai_next) {
        int s = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (s == -1)
            continue;
        // No SO_RCVTIMEO/SO_SNDTIMEO here: they interfere with userauth on
        // some servers. libssh2_session_set_timeout bounds blocking calls.
        setTcpKeepalive(s);
        if (::connect(s, rp->ai_addr, rp->ai_addrlen) == 0) {
            sock = s;
            ::freeaddrinfo(res);
            return true;
        }
        ::close(s);
    }
    ::freeaddrinfo(res);
    err = "Could not connect to " + host + ":" + portStr;
    return false;
}

bool Libssh2Session::openTunnel(Hop& carrier, Hop& next,
                                const HopIdentity& target, std::string& err) {
    LIBSSH2_CHANNEL *ch = libssh2_channel_direct_tcpip_ex(
        carrier.session, target.host.c_str(), target.port, "127.0.0.1", 22);
    if (!ch) {
        err = "direct-tcpip to " + target.host + " refused: " +
              lastSessionError(carrier.session);
        return false;
    }
    int pair[2] = {-1, -1};
    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, pair) != 0) {
        libssh2_channel_free(ch);
        err = std::string("socketpair: ") + std::strerror(errno);
        return false;
    }
    const int flags = ::fcntl(pair[1], F_GETFL, 0);
    ::fcntl(pair[1], F_SETFL, flags | O_NONBLOCK);

    // From here on only the relay thread touches the carrier session.
    libssh2_session_set_blocking(carrier.session, 0);
    next.sock = pair[0];
    next.tunnel = ch;
    next.relayFd = pair[1];
    next.stopRelay = std::make_unique<std::atomic<bool>>(false);
    next.relay = std::thread(relayLoop, carrier.session, carrier.sock, ch,
                             pair[1], next.stopRelay.get(),
                             settings_.keepalive_interval_sec);
    return true;
}

bool Libssh2Session::handshakeAuth(Hop& hop, const HopIdentity& id,
                                   std::string& err) {
    hop.session = libssh2_session_init();
    if (!hop.session) {
        err = "libssh2_session_init failed";
        return false;
    }
    // Compression must be requested before the handshake negotiates it.
    if (settings_.compression)
        libssh2_session_flag(hop.session, LIBSSH2_FLAG_COMPRESS, 1);

    if (libssh2_session_handshake(hop.session, hop.sock) != 0) {
        err = "SSH handshake failed: " + lastSessionError(hop.session);
        return false;
    }
    // Blocking mode with a bounded timeout avoids EAGAIN during auth.
    libssh2_session_set_blocking(hop.session, 1);
    libssh2_session_set_timeout(
        hop.session, static_cast<long>(settings_.handshake_timeout.count()));
    if (settings_.keepalive_interval_sec > 0)
        libssh2_keepalive_config(hop.session, 1,
                                 static_cast<unsigned>(
                                     settings_.keepalive_interval_sec));

    if (!verifyHostKey(hop.session, id, err))
        return false;

    // Authentication: explicit key first, then password with
    // keyboard-interactive fallback, then ssh-agent.
    if (id.private_key_path.has_value()) {
        const char *passphrase = id.private_key_passphrase
                                     ? id.private_key_passphrase->c_str()
                                     : nullptr;
        if (libssh2_userauth_publickey_fromfile(hop.session, id.username.c_str(),
                                                nullptr,
                                                id.private_key_path->c_str(),
                                                passphrase) != 0) {
            err = "Public key authentication failed: " +
                  lastSessionError(hop.session);
            return false;
        }
        return true;
    }

    std::string authlist;
    auto fetchMethods = [&] {
        if (!authlist.empty())
            return;
        char *methods = libssh2_userauth_list(
            hop.session, id.username.c_str(),
            static_cast<unsigned>(id.username.size()));
        authlist = methods ? std::string(methods) : std::string();
    };
    auto hasMethod = [&](const char *m) {
        return authlist.find(m) != std::string::npos;
    };

    if (id.password.has_value()) {
        const int rcPw = libssh2_userauth_password(
            hop.session, id.username.c_str(), id.password->c_str());
        if (rcPw == 0)
            return true;
        // The server closed after the password attempt; nothing else will work.
        if (rcPw == LIBSSH2_ERROR_SOCKET_DISCONNECT ||
            rcPw == LIBSSH2_ERROR_SOCKET_SEND ||
            rcPw == LIBSSH2_ERROR_SOCKET_RECV) {
            err = "Server closed the connection after the password attempt";
            return false;
        }
        fetchMethods();
        if (hasMethod("keyboard-interactive")) {
            KbdIntCtx ctx{id.username.c_str(), id.password->c_str()};
            void **abs = libssh2_session_abstract(hop.session);
            if (abs)
                *abs = &ctx;
            const int rcKbd = libssh2_userauth_keyboard_interactive(
                hop.session, id.username.c_str(), kbintPasswordCallback);
            if (abs)
                *abs = nullptr;
            if (rcKbd == 0)
                return true;
        }
    }
    fetchMethods();
    if (hasMethod("publickey") && agentAuth(hop.session, id.username))
        return true;
    err = id.password.has_value()
              ? "Password/keyboard-interactive authentication failed"
              : "No usable credentials: key, agent or password";
    if (!authlist.empty())
        err += " (methods: " + authlist + ")";
    const std::string last = lastSessionError(hop.session);
    if (!last.empty())
        err += ": " + last;
    return false;
}

bool Libssh2Session::connect(const HostIdentity& id, TransferError& err) {
    if (connected_) {
        err.set(ErrorKind::InvalidArgument, "Already connected");
        return false;
    }
    std::string e;
    if (!ensureLibssh2(e)) {
        err.set(ErrorKind::Connect, e);
        return false;
    }
    hops_.clear();
    hops_.reserve(id.hopCount());
    for (std::size_t i = 0; i < id.hopCount(); ++i) {
        const HopIdentity& hop = id.hop(i);
        hops_.emplace_back();
        Hop& cur = hops_.back();
        const bool ok = i == 0 ? tcpConnect(hop.host, hop.port, cur.sock, e)
                               : openTunnel(hops_[i - 1], cur, hop, e);
        if (!ok || !handshakeAuth(cur, hop, e)) {
            const std::string who =
                sensitiveLoggingEnabled() ? " (" + hop.label() + ")" : "";
            SCPFLOW_LOGW("hop %zu%s failed: %s", i, who.c_str(), e.c_str());
            err.set(ErrorKind::Connect, e);
            err.hop_index = static_cast<int>(i);
            disconnect();
            return false;
        }
    }
    session_ = hops_.back().session;
    sock_ = hops_.back().sock;
    sftp_ = libssh2_sftp_init(session_);
    if (!sftp_) {
        err.set(ErrorKind::Connect,
                "Could not start SFTP: " + lastSessionError(session_));
        err.hop_index = static_cast<int>(id.hopCount() - 1);
        disconnect();
        return false;
    }
    connected_ = true;
    SCPFLOW_LOGI("connected to %s over %zu hop(s)", redactedIdentity(id.key()).c_str(),
                 id.hopCount());
    return true;
}

void Libssh2Session::closeHop(Hop& hop) {
    if (hop.session) {
        libssh2_session_disconnect(hop.session, "bye");
        libssh2_session_free(hop.session);
        hop.session = nullptr;
    }
    if (hop.stopRelay)
        hop.stopRelay->store(true);
    if (hop.relay.joinable())
        hop.relay.join();
    if (hop.tunnel) {
        libssh2_channel_free(hop.tunnel);
        hop.tunnel = nullptr;
    }
    if (hop.relayFd != -1) {
        ::close(hop.relayFd);
        hop.relayFd = -1;
    }
    if (hop.sock != -1) {
        ::close(hop.sock);
        hop.sock = -1;
    }
}

void Libssh2Session::disconnect() {
    if (sftp_) {
        libssh2_sftp_shutdown(sftp_);
        sftp_ = nullptr;
    }
    // Tear down from the target back to the first hop: every tunnel lives on
    // the session before it.
    for (auto it = hops_.rbegin(); it != hops_.rend(); ++it)
        closeHop(*it);
    hops_.clear();
    session_ = nullptr;
    sock_ = -1;
    connected_ = false;
}

bool Libssh2Session::ready(std::string& err) const {
    if (!connected_ || !sftp_) {
        err = "Not connected";
        return false;
    }
    return true;
}

bool Libssh2Session::stopRequested(const CancelFn& shouldCancel) const {
    return interrupted_.load() || (shouldCancel && shouldCancel());
}

bool Libssh2Session::waitSocket(int timeoutMs) {
    struct pollfd pfd {};
    pfd.fd = sock_;
    const int dir = libssh2_session_block_directions(session_);
    pfd.events = static_cast<short>(
        ((dir & LIBSSH2_SESSION_BLOCK_INBOUND) ? POLLIN : 0) |
        ((dir & LIBSSH2_SESSION_BLOCK_OUTBOUND) ? POLLOUT : 0));
    if (pfd.events == 0)
        pfd.events = POLLIN;
    return ::poll(&pfd, 1, timeoutMs) >= 0;
}

bool Libssh2Session::list(const std::string& remote_path,
                          std::vector<FileInfo>& out, std::string& err) {
    if (!ready(err))
        return false;
    const std::string path = remote_path.empty() ? "/" : remote_path;
    LIBSSH2_SFTP_HANDLE *dir = libssh2_sftp_opendir(sftp_, path.c_str());
    if (!dir) {
        err = "sftp_opendir failed for: " + path;
        return false;
    }
    out.clear();
    out.reserve(64);
    char filename[512];
    char longentry[1024];
    LIBSSH2_SFTP_ATTRIBUTES attrs;
    while (true) {
        std::memset(&attrs, 0, sizeof(attrs));
        const int rc = libssh2_sftp_readdir_ex(dir, filename, sizeof(filename),
                                               longentry, sizeof(longentry),
                                               &attrs);
        if (rc > 0) {
            FileInfo fi = fromAttrs(attrs);
            fi.name = std::string(filename, static_cast<std::size_t>(rc));
            if (fi.name == "." || fi.name == "..")
                continue;
            out.push_back(std::move(fi));
        } else if (rc == 0) {
            break;
        } else {
            err = "sftp_readdir_ex failed for: " + path;
            libssh2_sftp_closedir(dir);
            return false;
        }
    }
    libssh2_sftp_closedir(dir);
    return true;
}

bool Libssh2Session::stat(const std::string& remote_path, FileInfo& info,
                          std::string& err) {
    if (!ready(err))
        return false;
    LIBSSH2_SFTP_ATTRIBUTES st{};
    if (libssh2_sftp_stat_ex(sftp_, remote_path.c_str(),
                             static_cast<unsigned>(remote_path.size()),
                             LIBSSH2_SFTP_STAT, &st) != 0) {
        if (isMissing(sftp_)) {
            err.clear();
            return false;
        }
        err = "Remote stat failed";
        return false;
    }
    info = fromAttrs(st);
    const auto slash = remote_path.find_last_of('/');
    info.name = slash == std::string::npos ? remote_path
                                           : remote_path.substr(slash + 1);
    return true;
}

bool Libssh2Session::exists(const std::string& remote_path, bool& isDir,
                            std::string& err) {
    isDir = false;
    FileInfo fi;
    if (!stat(remote_path, fi, err))
        return false;
    isDir = fi.is_dir;
    return true;
}

bool Libssh2Session::get(const std::string& remote, const std::string& local,
                         std::string& err, ProgressFn progress,
                         CancelFn shouldCancel, std::optional<ByteRange> range,
                         bool resume) {
    if (!ready(err))
        return false;
    interrupted_ = false;

    LIBSSH2_SFTP_ATTRIBUTES st{};
    if (libssh2_sftp_stat_ex(sftp_, remote.c_str(),
                             static_cast<unsigned>(remote.size()),
                             LIBSSH2_SFTP_STAT, &st) != 0) {
        err = "Could not stat remote file";
        return false;
    }
    const std::uint64_t size = (st.flags & LIBSSH2_SFTP_ATTR_SIZE)
                                   ? static_cast<std::uint64_t>(st.filesize)
                                   : 0;
    LIBSSH2_SFTP_HANDLE *rh = libssh2_sftp_open_ex(
        sftp_, remote.c_str(), static_cast<unsigned>(remote.size()),
        LIBSSH2_FXF_READ, 0, LIBSSH2_SFTP_OPENFILE);
    if (!rh) {
        err = "Could not open remote file for reading";
        return false;
    }

    std::uint64_t begin = 0;
    std::uint64_t end = size;
    FILE *lf = nullptr;
    if (range) {
        begin = range->offset;
        end = std::min<std::uint64_t>(size, range->offset + range->length);
        lf = openForRangeWrite(local);
        if (lf && ::fseeko(lf, static_cast<off_t>(begin), SEEK_SET) != 0) {
            std::fclose(lf);
            libssh2_sftp_close(rh);
            err = "Could not seek local file";
            return false;
        }
    } else if (resume) {
        lf = std::fopen(local.c_str(), "ab");
        if (lf) {
            const off_t cur = ::ftello(lf);
            if (cur > 0 && static_cast<std::uint64_t>(cur) < size)
                begin = static_cast<std::uint64_t>(cur);
        }
    }
    if (!lf && !range)
        lf = std::fopen(local.c_str(), "wb");
    if (!lf) {
        libssh2_sftp_close(rh);
        err = "Could not open local file for writing";
        return false;
    }
    if (begin > 0)
        libssh2_sftp_seek64(rh, static_cast<libssh2_uint64_t>(begin));

    std::vector<char> buf(kIoBlock);
    const std::uint64_t total = end - begin;
    std::uint64_t done = 0;
    while (done < total) {
        if (stopRequested(shouldCancel)) {
            err = "Cancelled by user";
            std::fclose(lf);
            libssh2_sftp_close(rh);
            return false;
        }
        const std::size_t want = static_cast<std::size_t>(
            std::min<std::uint64_t>(buf.size(), total - done));
        const ssize_t n = libssh2_sftp_read(rh, buf.data(), want);
        if (n > 0) {
            if (std::fwrite(buf.data(), 1, static_cast<std::size_t>(n), lf) !=
                static_cast<std::size_t>(n)) {
                err = "Local write failed";
                std::fclose(lf);
                libssh2_sftp_close(rh);
                return false;
            }
            done += static_cast<std::uint64_t>(n);
            if (progress)
                progress(done, total);
        } else if (n == 0) {
            break;
        } else {
            err = "Remote read failed";
            std::fclose(lf);
            libssh2_sftp_close(rh);
            return false;
        }
    }
    const bool closed = std::fclose(lf) == 0;
    libssh2_sftp_close(rh);
    if (!closed) {
        err = "Local write failed";
        return false;
    }
    if (done < total) {
        err = "Remote file ended early";
        return false;
    }
    return true;
}

bool Libssh2Session::put(const std::string& local, const std::string& remote,
                         std::string& err, ProgressFn progress,
                         CancelFn shouldCancel, std::optional<ByteRange> range,
                         bool resume) {
    if (!ready(err))
        return false;
    interrupted_ = false;

    FILE *lf = std::fopen(local.c_str(), "rb");
    if (!lf) {
        err = "Could not open local file for reading";
        return false;
    }
    ::fseeko(lf, 0, SEEK_END);
    const off_t fsz = ::ftello(lf);
    const std::uint64_t fileSize = fsz > 0 ? static_cast<std::uint64_t>(fsz) : 0;

    std::uint64_t begin = 0;
    std::uint64_t end = fileSize;
    unsigned long flags = LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT;
    if (range) {
        begin = range->offset;
        end = std::min<std::uint64_t>(fileSize, range->offset + range->length);
    } else if (resume) {
        LIBSSH2_SFTP_ATTRIBUTES stR{};
        if (libssh2_sftp_stat_ex(sftp_, remote.c_str(),
                                 static_cast<unsigned>(remote.size()),
                                 LIBSSH2_SFTP_STAT, &stR) == 0 &&
            (stR.flags & LIBSSH2_SFTP_ATTR_SIZE) && stR.filesize < fileSize)
            begin = static_cast<std::uint64_t>(stR.filesize);
    } else {
        flags |= LIBSSH2_FXF_TRUNC;
    }
    LIBSSH2_SFTP_HANDLE *wh = libssh2_sftp_open_ex(
        sftp_, remote.c_str(), static_cast<unsigned>(remote.size()), flags,
        0644, LIBSSH2_SFTP_OPENFILE);
    if (!wh) {
        std::fclose(lf);
        err = "Could not open remote file for writing";
        return false;
    }
    if (begin > 0) {
        libssh2_sftp_seek64(wh, static_cast<libssh2_uint64_t>(begin));
    }
    if (::fseeko(lf, static_cast<off_t>(begin), SEEK_SET) != 0) {
        err = "Could not seek local file";
        libssh2_sftp_close(wh);
        std::fclose(lf);
        return false;
    }

    std::vector<char> buf(kIoBlock);
    const std::uint64_t total = end - begin;
    std::uint64_t done = 0;
    while (done < total) {
        const std::size_t want = static_cast<std::size_t>(
            std::min<std::uint64_t>(buf.size(), total - done));
        const std::size_t n = std::fread(buf.data(), 1, want, lf);
        if (n == 0) {
            err = std::ferror(lf) ? "Local read failed" : "Local file shrank";
            libssh2_sftp_close(wh);
            std::fclose(lf);
            return false;
        }
        const char *p = buf.data();
        std::size_t remain = n;
        while (remain > 0) {
            if (stopRequested(shouldCancel)) {
                err = "Cancelled by user";
                libssh2_sftp_close(wh);
                std::fclose(lf);
                return false;
            }
            const ssize_t w = libssh2_sftp_write(wh, p, remain);
            if (w < 0) {
                err = "Remote write failed";
                libssh2_sftp_close(wh);
                std::fclose(lf);
                return false;
            }
            remain -= static_cast<std::size_t>(w);
            p += w;
            done += static_cast<std::uint64_t>(w);
            if (progress)
                progress(done, total);
        }
    }
    const int rc = libssh2_sftp_close(wh);
    std::fclose(lf);
    if (rc != 0) {
        err = "Closing remote file failed";
        return false;
    }
    return true;
}

bool Libssh2Session::truncate(const std::string& remote_path,
                              std::uint64_t size, std::string& err) {
    if (!ready(err))
        return false;
    LIBSSH2_SFTP_HANDLE *h = libssh2_sftp_open_ex(
        sftp_, remote_path.c_str(), static_cast<unsigned>(remote_path.size()),
        LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT, 0644, LIBSSH2_SFTP_OPENFILE);
    if (!h) {
        err = "Could not open remote file for writing";
        return false;
    }
    LIBSSH2_SFTP_ATTRIBUTES a{};
    a.flags = LIBSSH2_SFTP_ATTR_SIZE;
    a.filesize = static_cast<libssh2_uint64_t>(size);
    const int rc = libssh2_sftp_fsetstat(h, &a);
    libssh2_sftp_close(h);
    if (rc != 0) {
        err = "Remote truncate failed";
        return false;
    }
    return true;
}

bool Libssh2Session::setTimes(const std::string& remote_path,
                              std::uint64_t atime, std::uint64_t mtime,
                              std::string& err) {
    if (!ready(err))
        return false;
    LIBSSH2_SFTP_ATTRIBUTES a{};
    a.flags = LIBSSH2_SFTP_ATTR_ACMODTIME;
    a.atime = static_cast<unsigned long>(atime);
    a.mtime = static_cast<unsigned long>(mtime);
    if (libssh2_sftp_stat_ex(sftp_, remote_path.c_str(),
                             static_cast<unsigned>(remote_path.size()),
                             LIBSSH2_SFTP_SETSTAT, &a) != 0) {
        err = "Remote setTimes failed";
        return false;
    }
    return true;
}

bool Libssh2Session::setPermissions(const std::string& remote_path,
                                    std::uint32_t mode, std::string& err) {
    if (!ready(err))
        return false;
    LIBSSH2_SFTP_ATTRIBUTES a{};
    a.flags = LIBSSH2_SFTP_ATTR_PERMISSIONS;
    a.permissions = static_cast<unsigned long>(mode & 0777);
    if (libssh2_sftp_stat_ex(sftp_, remote_path.c_str(),
                             static_cast<unsigned>(remote_path.size()),
                             LIBSSH2_SFTP_SETSTAT, &a) != 0) {
        err = "Remote setPermissions failed";
        return false;
    }
    return true;
}

bool Libssh2Session::mkdir(const std::string& remote_dir, std::string& err,
                           unsigned int mode) {
    if (!ready(err))
        return false;
    if (libssh2_sftp_mkdir(sftp_, remote_dir.c_str(), static_cast<long>(mode)) !=
        0) {
        err = "sftp_mkdir failed for: " + remote_dir;
        return false;
    }
    return true;
}

bool Libssh2Session::removeFile(const std::string& remote_path,
                                std::string& err) {
    if (!ready(err))
        return false;
    if (libssh2_sftp_unlink(sftp_, remote_path.c_str()) != 0) {
        err = "sftp_unlink failed for: " + remote_path;
        return false;
    }
    return true;
}

bool Libssh2Session::removeDir(const std::string& remote_dir,
                               std::string& err) {
    if (!ready(err))
        return false;
    if (libssh2_sftp_rmdir(sftp_, remote_dir.c_str()) != 0) {
        err = "sftp_rmdir failed (directory not empty?)";
        return false;
    }
    return true;
}

bool Libssh2Session::rename(const std::string& from, const std::string& to,
                            std::string& err, bool overwrite) {
    if (!ready(err))
        return false;
    long flags = LIBSSH2_SFTP_RENAME_ATOMIC | LIBSSH2_SFTP_RENAME_NATIVE;
    if (overwrite)
        flags |= LIBSSH2_SFTP_RENAME_OVERWRITE;
    if (libssh2_sftp_rename_ex(sftp_, from.c_str(),
                               static_cast<unsigned>(from.size()), to.c_str(),
                               static_cast<unsigned>(to.size()), flags) != 0) {
        err = "sftp_rename_ex failed";
        return false;
    }
    return true;
}

// Runs the command in non-blocking mode so the deadline and the cancel
// callback are honoured while it runs.
bool Libssh2Session::exec(const std::string& command, ExecResult& out,
                          std::string& err, std::chrono::milliseconds timeout,
                          CancelFn shouldCancel) {
    if (!ready(err))
        return false;
    interrupted_ = false;
    out = ExecResult{};
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    auto expired = [&] { return std::chrono::steady_clock::now() >= deadline; };

    libssh2_session_set_blocking(session_, 0);
    struct BlockingRestore {
        LIBSSH2_SESSION *s;
        ~BlockingRestore() { libssh2_session_set_blocking(s, 1); }
    } restore{session_};

    LIBSSH2_CHANNEL *ch = nullptr;
    while (!(ch = libssh2_channel_open_session(session_))) {
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
            err = "Could not open exec channel: " + lastSessionError(session_);
            return false;
        }
        if (expired() || stopRequested(shouldCancel)) {
            err = expired() ? "Remote command timed out" : "Cancelled by user";
            out.timed_out = expired();
            return false;
        }
        waitSocket(100);
    }
    struct ChannelFree {
        LIBSSH2_CHANNEL *ch;
        ~ChannelFree() { libssh2_channel_free(ch); }
    } freeChannel{ch};

    int rc;
    while ((rc = libssh2_channel_exec(ch, command.c_str())) ==
           LIBSSH2_ERROR_EAGAIN) {
        if (expired() || stopRequested(shouldCancel)) {
            err = expired() ? "Remote command timed out" : "Cancelled by user";
            out.timed_out = expired();
            return false;
        }
        waitSocket(100);
    }
    if (rc != 0) {
        err = "Could not run remote command: " + lastSessionError(session_);
        return false;
    }

    std::vector<char> buf(16 * 1024);
    for (;;) {
        bool moved = false;
        ssize_t n = libssh2_channel_read(ch, buf.data(), buf.size());
        if (n > 0) {
            out.stdout_text.append(buf.data(), static_cast<std::size_t>(n));
            moved = true;
        } else if (n < 0 && n != LIBSSH2_ERROR_EAGAIN) {
            err = "Reading command output failed: " + lastSessionError(session_);
            return false;
        }
        n = libssh2_channel_read_stderr(ch, buf.data(), buf.size());
        if (n > 0) {
            out.stderr_text.append(buf.data(), static_cast<std::size_t>(n));
            moved = true;
        } else if (n < 0 && n != LIBSSH2_ERROR_EAGAIN) {
            err = "Reading command errors failed: " + lastSessionError(session_);
            return false;
        }
        if (libssh2_channel_eof(ch))
            break;
        if (expired()) {
            out.timed_out = true;
            err = "Remote command timed out after " +
                  std::to_string(timeout.count()) + " ms";
            return false;
        }
        if (stopRequested(shouldCancel)) {
            err = "Cancelled by user";
            return false;
        }
        if (!moved)
            waitSocket(100);
    }
    while ((rc = libssh2_channel_close(ch)) == LIBSSH2_ERROR_EAGAIN) {
        if (expired())
            break;
        waitSocket(100);
    }
    out.exit_status = libssh2_channel_get_exit_status(ch);
    return true;
}

} // namespace scpflow
