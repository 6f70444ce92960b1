// libssh2 backend: manages TCP socket, SSH session, and SFTP channel.
// Includes keepalive, known_hosts validation and timeout classification.
#include "openxfer/Libssh2SftpClient.hpp"
#include "openxfer/Log.hpp"
#include <libssh2.h>
#include <libssh2_sftp.h>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// POSIX sockets
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace openxfer {

namespace {

std::once_flag g_libssh2_once;

// Context for keyboard-interactive: answer prompts with username/password.
struct KbdIntCtx {
    const char* user;
    const char* pass;
    const KbdIntPromptsCB* cb; // optional: caller-provided prompt handler
};

char* dupResponse(const std::string& s, unsigned int& len) {
    len = 0;
    if (s.empty()) return nullptr;
    char* buf = static_cast<char*>(std::malloc(s.size() + 1));
    if (!buf) return nullptr;
    std::memcpy(buf, s.data(), s.size());
    buf[s.size()] = '\0';
    len = (unsigned int)s.size();
    return buf;
}

bool promptWantsUser(const char* prompt) {
    std::string p = prompt ? prompt : "";
    for (auto& c : p) c = (char)std::tolower((unsigned char)c);
    return p.find("user") != std::string::npos || p.find("name") != std::string::npos;
}

void kbint_callback(const char* name, int name_len,
                    const char* instruction, int instruction_len,
                    int num_prompts,
                    const LIBSSH2_USERAUTH_KBDINT_PROMPT* prompts,
                    LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                    void** abstract) {
    if (!abstract || !*abstract) return;
    const KbdIntCtx* ctx = static_cast<const KbdIntCtx*>(*abstract);

    std::vector<std::string> texts;
    for (int i = 0; i < num_prompts; ++i) {
        const char* pt = (prompts && prompts[i].text) ? reinterpret_cast<const char*>(prompts[i].text) : "";
        texts.emplace_back(pt);
    }

    // Give the caller a chance to answer (OTP/2FA), else fall back to user/password.
    std::vector<std::string> answers;
    bool answered = false;
    if (ctx->cb && *(ctx->cb) && num_prompts > 0) {
        std::string nm = (name && name_len > 0) ? std::string(name, (size_t)name_len) : std::string();
        std::string ins = (instruction && instruction_len > 0) ? std::string(instruction, (size_t)instruction_len) : std::string();
        answered = (*(ctx->cb))(nm, ins, texts, answers) && (int)answers.size() >= num_prompts;
    }
    for (int i = 0; i < num_prompts; ++i) {
        std::string a;
        if (answered) a = answers[(size_t)i];
        else if (promptWantsUser(texts[(size_t)i].c_str())) a = ctx->user ? ctx->user : "";
        else a = ctx->pass ? ctx->pass : "";
        responses[i].text = dupResponse(a, responses[i].length);
    }
}

std::string sessionLastError(LIBSSH2_SESSION* s) {
    if (!s) return {};
    char* msg = nullptr;
    int len = 0;
    (void)libssh2_session_last_error(s, &msg, &len, 0);
    return (msg && len > 0) ? std::string(msg, (size_t)len) : std::string();
}

int knownHostAlgorithm(int keytype) {
    switch (keytype) {
        case LIBSSH2_HOSTKEY_TYPE_RSA: return LIBSSH2_KNOWNHOST_KEY_SSHRSA;
        case LIBSSH2_HOSTKEY_TYPE_DSS: return LIBSSH2_KNOWNHOST_KEY_SSHDSS;
#ifdef LIBSSH2_KNOWNHOST_KEY_ECDSA_256
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_256: return LIBSSH2_KNOWNHOST_KEY_ECDSA_256;
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_384: return LIBSSH2_KNOWNHOST_KEY_ECDSA_384;
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_521: return LIBSSH2_KNOWNHOST_KEY_ECDSA_521;
#endif
#ifdef LIBSSH2_KNOWNHOST_KEY_ED25519
        case LIBSSH2_HOSTKEY_TYPE_ED25519: return LIBSSH2_KNOWNHOST_KEY_ED25519;
#endif
        default: return 0;
    }
}

const char* hostKeyName(int keytype) {
    switch (keytype) {
        case LIBSSH2_HOSTKEY_TYPE_RSA: return "RSA";
        case LIBSSH2_HOSTKEY_TYPE_DSS: return "DSA";
#ifdef LIBSSH2_KNOWNHOST_KEY_ECDSA_256
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_256: return "ECDSA-256";
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_384: return "ECDSA-384";
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_521: return "ECDSA-521";
#endif
#ifdef LIBSSH2_KNOWNHOST_KEY_ED25519
        case LIBSSH2_HOSTKEY_TYPE_ED25519: return "ED25519";
#endif
        default: return "UNKNOWN";
    }
}

std::string fingerprintSha256(LIBSSH2_SESSION* s) {
    const unsigned char* h = (const unsigned char*)libssh2_hostkey_hash(s, LIBSSH2_HOSTKEY_HASH_SHA256);
    if (!h) return {};
    std::string out = "SHA256:";
    char b[4];
    for (int i = 0; i < 32; ++i) {
        if (i) out += ':';
        std::snprintf(b, sizeof(b), "%02X", (unsigned)h[i]);
        out += b;
    }
    return out;
}

} // namespace

Libssh2SftpClient::Libssh2SftpClient() {
    std::call_once(g_libssh2_once, [] {
        if (libssh2_init(0) != 0) LOGE("libssh2_init failed");
    });
}

Libssh2SftpClient::~Libssh2SftpClient() {
    disconnect();
}

void Libssh2SftpClient::setTuning(const IoTuning& tuning) {
    tuning_ = tuning;
    if (session_) libssh2_session_set_timeout(session_, (long)tuning_.timeout.count());
}

bool Libssh2SftpClient::requireConnected(ClientError& err) const {
    if (connected_ && sftp_) return true;
    err.set(ErrorKind::NetworkError, "Not connected");
    return false;
}

void Libssh2SftpClient::sftpError(const std::string& what, ClientError& err) const {
    const int rc = session_ ? libssh2_session_last_errno(session_) : 0;
    if (rc == LIBSSH2_ERROR_TIMEOUT) {
        err.set(ErrorKind::NetworkError, what + ": timed out", true);
        return;
    }
    if (rc != LIBSSH2_ERROR_SFTP_PROTOCOL) {
        const std::string detail = sessionLastError(session_);
        err.set(ErrorKind::NetworkError, what + (detail.empty() ? std::string() : ": " + detail));
        return;
    }
    const unsigned long fx = sftp_ ? libssh2_sftp_last_error(sftp_) : 0;
    switch (fx) {
        case LIBSSH2_FX_NO_SUCH_FILE:
        case LIBSSH2_FX_NO_SUCH_PATH:
            err.set(ErrorKind::FileNotFound, what + ": no such file");
            break;
        case LIBSSH2_FX_PERMISSION_DENIED:
        case LIBSSH2_FX_WRITE_PROTECT:
            err.set(ErrorKind::PermissionDenied, what + ": permission denied");
            break;
        case LIBSSH2_FX_FILE_ALREADY_EXISTS:
            err.set(ErrorKind::FileExists, what + ": already exists");
            break;
        case LIBSSH2_FX_NO_SPACE_ON_FILESYSTEM:
        case LIBSSH2_FX_QUOTA_EXCEEDED:
            err.set(ErrorKind::StorageFull, what + ": no space left");
            break;
        case LIBSSH2_FX_DIR_NOT_EMPTY:
            err.set(ErrorKind::InvalidOperation, what + ": directory not empty");
            break;
        case LIBSSH2_FX_NO_CONNECTION:
        case LIBSSH2_FX_CONNECTION_LOST:
            err.set(ErrorKind::NetworkError, what + ": connection lost");
            break;
        default:
            err.set(ErrorKind::Unknown, what + ": SFTP status " + std::to_string(fx));
            break;
    }
}

bool Libssh2SftpClient::tcpConnect(const std::string& host, uint16_t port, ClientError& err) {
    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    char portStr[16];
    std::snprintf(portStr, sizeof(portStr), "%u", static_cast<unsigned>(port));

    struct addrinfo* res = nullptr;
    int gai = getaddrinfo(host.c_str(), portStr, &hints, &res);
    if (gai != 0) {
        err.set(ErrorKind::NetworkError, std::string("getaddrinfo: ") + gai_strerror(gai));
        return false;
    }

    for (auto rp = res; rp != nullptr; rp = rp->ai_next) {
        int s = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (s == -1) continue;
        // Timeouts are left to libssh2_session_set_timeout; only keepalive here.
        int opt = 1;
        ::setsockopt(s, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));
#if defined(__linux__)
        int idle = 60, intvl = 10, cnt = 3;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPINTVL, &intvl, sizeof(intvl));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPCNT, &cnt, sizeof(cnt));
#endif
        if (::connect(s, rp->ai_addr, rp->ai_addrlen) == 0) {
            sock_ = s;
            freeaddrinfo(res);
            return true;
        }
        const int e = errno;
        ::close(s);
        if (e == ETIMEDOUT) {
            freeaddrinfo(res);
            err.set(ErrorKind::NetworkError, "Connection to " + host + " timed out", true);
            return false;
        }
    }
    freeaddrinfo(res);
    err.set(ErrorKind::NetworkError, "Could not connect to " + host + ":" + portStr);
    return false;
}

bool Libssh2SftpClient::verifyHostKey(const ConnectionDescriptor& opt, ClientError& err) {
    if (opt.known_hosts_policy == KnownHostsPolicy::Off) return true;

    LIBSSH2_KNOWNHOSTS* nh = libssh2_knownhost_init(session_);
    if (!nh) {
        err.set(ErrorKind::Unknown, "Could not initialize known_hosts");
        return false;
    }

    std::string khPath;
    if (opt.known_hosts_path.has_value()) {
        khPath = *opt.known_hosts_path;
    } else if (const char* home = std::getenv("HOME")) {
        khPath = std::string(home) + "/.ssh/known_hosts";
    }
    const bool khLoaded = !khPath.empty() &&
        libssh2_knownhost_readfile(nh, khPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) >= 0;
    if (!khLoaded && opt.known_hosts_policy == KnownHostsPolicy::Strict) {
        libssh2_knownhost_free(nh);
        err.set(ErrorKind::PermissionDenied, "known_hosts missing or unreadable (strict policy)");
        return false;
    }

    size_t keylen = 0;
    int keytype = 0;
    const char* hostkey = libssh2_session_hostkey(session_, &keylen, &keytype);
    if (!hostkey || keylen == 0) {
        libssh2_knownhost_free(nh);
        err.set(ErrorKind::NetworkError, "Could not read the server host key");
        return false;
    }

    const int alg = knownHostAlgorithm(keytype);
    struct libssh2_knownhost* host = nullptr;
    int check = libssh2_knownhost_checkp(nh, opt.host.c_str(), opt.port, hostkey, keylen,
                                         LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg, &host);
    if (check != LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        check = libssh2_knownhost_checkp(nh, opt.host.c_str(), opt.port, hostkey, keylen,
                                         LIBSSH2_KNOWNHOST_TYPE_SHA1 | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg, &host);
    }

    if (check == LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        libssh2_knownhost_free(nh);
        return true;
    }

    if (opt.known_hosts_policy == KnownHostsPolicy::AcceptNew && check == LIBSSH2_KNOWNHOST_CHECK_NOTFOUND) {
        // TOFU: ask for confirmation when a callback is available
        const bool confirmed = opt.hostkey_confirm_cb &&
            opt.hostkey_confirm_cb(opt.host, opt.port, hostKeyName(keytype), fingerprintSha256(session_));
        if (!confirmed) {
            libssh2_knownhost_free(nh);
            err.set(ErrorKind::PermissionDenied, "Unknown host: fingerprint not confirmed");
            return false;
        }
        if (khPath.empty() ||
            libssh2_knownhost_addc(nh, opt.host.c_str(), nullptr, hostkey, keylen, nullptr, 0,
                                   LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg, nullptr) != 0 ||
            libssh2_knownhost_writefile(nh, khPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) != 0) {
            libssh2_knownhost_free(nh);
            err.set(ErrorKind::PermissionDenied, "Could not record host in known_hosts");
            return false;
        }
        libssh2_knownhost_free(nh);
        return true;
    }

    libssh2_knownhost_free(nh);
    if (opt.known_hosts_policy == KnownHostsPolicy::Strict) {
        err.set(ErrorKind::PermissionDenied,
                check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH ? "Host key does not match known_hosts"
                                                          : "Host not present in known_hosts");
        return false;
    }
    return true;
}

bool Libssh2SftpClient::tryAgentAuth(const std::string& user) {
    bool authed = false;
    LIBSSH2_AGENT* agent = libssh2_agent_init(session_);
    if (agent && libssh2_agent_connect(agent) == 0 && libssh2_agent_list_identities(agent) == 0) {
        struct libssh2_agent_publickey* identity = nullptr;
        struct libssh2_agent_publickey* prev = nullptr;
        const int kMaxAgentTries = 3;
        for (int tries = 0; tries < kMaxAgentTries && libssh2_agent_get_identity(agent, &identity, prev) == 0; ++tries) {
            prev = identity;
            int rc;
            while ((rc = libssh2_agent_userauth(agent, user.c_str(), identity)) == LIBSSH2_ERROR_EAGAIN)
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            if (rc == 0) {
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

// Order: explicit private key, then password (with keyboard-interactive
// fallback), then ssh-agent.
bool Libssh2SftpClient::authenticate(const ConnectionDescriptor& opt, ClientError& err) {
    if (opt.private_key_path.has_value()) {
        const char* passphrase = opt.private_key_passphrase ? opt.private_key_passphrase->c_str() : nullptr;
        if (libssh2_userauth_publickey_fromfile(session_, opt.username.c_str(), nullptr,
                                                opt.private_key_path->c_str(), passphrase) != 0) {
            err.set(ErrorKind::PermissionDenied, "Public key authentication failed: " + sessionLastError(session_));
            return false;
        }
        return true;
    }

    auto authList = [&]() {
        char* methods = libssh2_userauth_list(session_, opt.username.c_str(), (unsigned)opt.username.size());
        return methods ? std::string(methods) : std::string();
    };

    if (opt.password.has_value()) {
        int rc;
        while ((rc = libssh2_userauth_password(session_, opt.username.c_str(), opt.password->c_str())) == LIBSSH2_ERROR_EAGAIN)
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        if (rc == 0) return true;
        if (rc == LIBSSH2_ERROR_SOCKET_DISCONNECT || rc == LIBSSH2_ERROR_SOCKET_SEND || rc == LIBSSH2_ERROR_SOCKET_RECV) {
            err.set(ErrorKind::NetworkError, "Server closed the connection after the password attempt");
            return false;
        }
        if (rc == LIBSSH2_ERROR_TIMEOUT) {
            err.set(ErrorKind::NetworkError, "Password authentication timed out", true);
            return false;
        }
        const std::string methods = authList();
        if (methods.find("keyboard-interactive") != std::string::npos) {
            KbdIntCtx ctx{opt.username.c_str(), opt.password->c_str(), &opt.keyboard_interactive_cb};
            void** abs = libssh2_session_abstract(session_);
            if (abs) *abs = &ctx;
            while ((rc = libssh2_userauth_keyboard_interactive(session_, opt.username.c_str(), kbint_callback)) == LIBSSH2_ERROR_EAGAIN)
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            if (abs) *abs = nullptr;
            if (rc == 0) return true;
        }
        if (methods.find("publickey") != std::string::npos && tryAgentAuth(opt.username)) return true;
        err.set(ErrorKind::PermissionDenied,
                "Password authentication failed" + (methods.empty() ? std::string() : " (methods: " + methods + ")"));
        return false;
    }

    if (authList().find("publickey") != std::string::npos && tryAgentAuth(opt.username)) return true;
    err.set(ErrorKind::PermissionDenied, "No credentials: key, agent and password unavailable");
    return false;
}

bool Libssh2SftpClient::sshHandshakeAuth(const ConnectionDescriptor& opt, ClientError& err) {
    session_ = libssh2_session_init();
    if (!session_) {
        err.set(ErrorKind::Unknown, "libssh2_session_init failed");
        return false;
    }
    libssh2_session_set_blocking(session_, 1);
    libssh2_session_set_timeout(session_, (long)tuning_.timeout.count());

    if (libssh2_session_handshake(session_, sock_) != 0) {
        if (libssh2_session_last_errno(session_) == LIBSSH2_ERROR_TIMEOUT)
            err.set(ErrorKind::NetworkError, "SSH handshake timed out", true);
        else
            err.set(ErrorKind::NetworkError, "SSH handshake failed: " + sessionLastError(session_));
        return false;
    }

    // SSH keepalive every 30s if the peer allows it
    libssh2_keepalive_config(session_, 1, 30);

    if (!verifyHostKey(opt, err)) return false;
    if (!authenticate(opt, err)) return false;

    sftp_ = libssh2_sftp_init(session_);
    if (!sftp_) {
        sftpError("Could not start the SFTP subsystem", err);
        return false;
    }
    return true;
}

bool Libssh2SftpClient::connect(const ConnectionDescriptor& opt, ClientError& err) {
    if (connected_) {
        err.set(ErrorKind::InvalidOperation, "Already connected");
        return false;
    }
    if (!tcpConnect(opt.host, opt.port, err)) return false;
    if (!sshHandshakeAuth(opt, err)) {
        disconnect();
        return false;
    }
    connected_ = true;
    LOGI("sftp: connected to %s:%u as %s", opt.host.c_str(), (unsigned)opt.port, opt.username.c_str());
    return true;
}

void Libssh2SftpClient::disconnect() {
    if (sftp_) {
        libssh2_sftp_shutdown(sftp_);
        sftp_ = nullptr;
    }
    if (session_) {
        libssh2_session_disconnect(session_, "bye");
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ != -1) {
        ::close(sock_);
        sock_ = -1;
    }
    connected_ = false;
}

// Download a remote file to local. Reports progress and supports cooperative cancellation.
bool Libssh2SftpClient::get(const std::string& remote,
                            const std::string& local,
                            ClientError& err,
                            ByteProgressCB progress,
                            CancelCB shouldCancel) {
    if (!requireConnected(err)) return false;

    LIBSSH2_SFTP_ATTRIBUTES st{};
    if (libssh2_sftp_stat_ex(sftp_, remote.c_str(), (unsigned)remote.size(), LIBSSH2_SFTP_STAT, &st) != 0) {
        sftpError("stat " + remote, err);
        return false;
    }
    const std::size_t total = (st.flags & LIBSSH2_SFTP_ATTR_SIZE) ? (std::size_t)st.filesize : 0;

    LIBSSH2_SFTP_HANDLE* rh = libssh2_sftp_open_ex(sftp_, remote.c_str(), (unsigned)remote.size(),
                                                   LIBSSH2_FXF_READ, 0, LIBSSH2_SFTP_OPENFILE);
    if (!rh) {
        sftpError("open " + remote, err);
        return false;
    }

    FILE* lf = std::fopen(local.c_str(), "wb");
    if (!lf) {
        libssh2_sftp_close(rh);
        err = ClientError::fromErrno(errno, "open " + local);
        return false;
    }

    std::vector<char> buf(tuning_.chunkSize ? tuning_.chunkSize : 64 * 1024);
    std::size_t done = 0;
    bool ok = true;
    while (true) {
        if (shouldCancel && shouldCancel()) {
            err.set(ErrorKind::Cancelled, "Cancelled by user");
            ok = false;
            break;
        }
        ssize_t n = libssh2_sftp_read(rh, buf.data(), buf.size());
        if (n > 0) {
            if (std::fwrite(buf.data(), 1, (size_t)n, lf) != (size_t)n) {
                err = ClientError::fromErrno(errno, "write " + local);
                ok = false;
                break;
            }
            done += (std::size_t)n;
            if (progress) progress(done, total);
        } else if (n == 0) {
            break; // EOF
        } else {
            sftpError("read " + remote, err);
            ok = false;
            break;
        }
    }

    if (std::fclose(lf) != 0 && ok) {
        err = ClientError::fromErrno(errno, "close " + local);
        ok = false;
    }
    libssh2_sftp_close(rh);
    return ok;
}

// Upload a local file to remote (create/truncate). Reports progress and supports cancellation.
bool Libssh2SftpClient::put(const std::string& local,
                            const std::string& remote,
                            ClientError& err,
                            ByteProgressCB progress,
                            CancelCB shouldCancel) {
    if (!requireConnected(err)) return false;

    FILE* lf = std::fopen(local.c_str(), "rb");
    if (!lf) {
        err = ClientError::fromErrno(errno, "open " + local);
        return false;
    }
    std::fseek(lf, 0, SEEK_END);
    long fsz = std::ftell(lf);
    std::fseek(lf, 0, SEEK_SET);
    const std::size_t total = fsz > 0 ? (std::size_t)fsz : 0;

    LIBSSH2_SFTP_HANDLE* wh = libssh2_sftp_open_ex(sftp_, remote.c_str(), (unsigned)remote.size(),
                                                   LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC,
                                                   0644, LIBSSH2_SFTP_OPENFILE);
    if (!wh) {
        std::fclose(lf);
        sftpError("open " + remote + " for writing", err);
        return false;
    }

    std::vector<char> buf(tuning_.chunkSize ? tuning_.chunkSize : 64 * 1024);
    std::size_t done = 0;
    bool ok = true;
    while (ok) {
        size_t n = std::fread(buf.data(), 1, buf.size(), lf);
        if (n == 0) {
            if (std::ferror(lf)) {
                err = ClientError::fromErrno(errno, "read " + local);
                ok = false;
            }
            break; // EOF
        }
        char* p = buf.data();
        size_t remain = n;
        while (remain > 0) {
            if (shouldCancel && shouldCancel()) {
                err.set(ErrorKind::Cancelled, "Cancelled by user");
                ok = false;
                break;
            }
            ssize_t w = libssh2_sftp_write(wh, p, remain);
            if (w < 0) {
                sftpError("write " + remote, err);
                ok = false;
                break;
            }
            remain -= (size_t)w;
            p += w;
            done += (size_t)w;
            if (progress) progress(done, total);
        }
    }

    libssh2_sftp_close(wh);
    std::fclose(lf);
    return ok;
}

// Lightweight existence check using sftp_stat.
bool Libssh2SftpClient::exists(const std::string& remote_path,
                               bool& isDir,
                               ClientError& err) {
    isDir = false;
    FileInfo info;
    if (!stat(remote_path, info, err)) return false;
    isDir = info.is_dir;
    return true;
}

// Detailed remote metadata. Returns false with an empty err if the path does not exist.
bool Libssh2SftpClient::stat(const std::string& remote_path,
                             FileInfo& info,
                             ClientError& err) {
    if (!requireConnected(err)) return false;

    LIBSSH2_SFTP_ATTRIBUTES st{};
    int rc = libssh2_sftp_stat_ex(sftp_, remote_path.c_str(), (unsigned)remote_path.size(), LIBSSH2_SFTP_STAT, &st);
    if (rc != 0) {
        if (rc == LIBSSH2_ERROR_SFTP_PROTOCOL) {
            const unsigned long fx = libssh2_sftp_last_error(sftp_);
            if (fx == LIBSSH2_FX_NO_SUCH_FILE || fx == LIBSSH2_FX_NO_SUCH_PATH || fx == LIBSSH2_FX_FAILURE) {
                err.clear();
                return false; // does not exist
            }
        }
        sftpError("stat " + remote_path, err);
        return false;
    }
    auto slash = remote_path.find_last_of('/');
    info.name = slash == std::string::npos ? remote_path : remote_path.substr(slash + 1);
    info.is_dir = (st.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS)
                      ? ((st.permissions & LIBSSH2_SFTP_S_IFMT) == LIBSSH2_SFTP_S_IFDIR)
                      : false;
    info.size = (st.flags & LIBSSH2_SFTP_ATTR_SIZE) ? (std::uint64_t)st.filesize : 0;
    info.mtime = (st.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) ? (std::uint64_t)st.mtime : 0;
    info.mode = (st.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) ? (std::uint32_t)st.permissions : 0;
    return true;
}

bool Libssh2SftpClient::mkdir(const std::string& remote_dir,
                              ClientError& err,
                              unsigned int mode) {
    if (!requireConnected(err)) return false;
    if (libssh2_sftp_mkdir(sftp_, remote_dir.c_str(), mode) != 0) {
        sftpError("mkdir " + remote_dir, err);
        return false;
    }
    return true;
}

bool Libssh2SftpClient::removeFile(const std::string& remote_path,
                                   ClientError& err) {
    if (!requireConnected(err)) return false;
    if (libssh2_sftp_unlink(sftp_, remote_path.c_str()) != 0) {
        sftpError("unlink " + remote_path, err);
        return false;
    }
    return true;
}

bool Libssh2SftpClient::removeDir(const std::string& remote_dir,
                                  ClientError& err) {
    if (!requireConnected(err)) return false;
    if (libssh2_sftp_rmdir(sftp_, remote_dir.c_str()) != 0) {
        sftpError("rmdir " + remote_dir, err);
        return false;
    }
    return true;
}

bool Libssh2SftpClient::rename(const std::string& from,
                               const std::string& to,
                               ClientError& err,
                               bool overwrite) {
    if (!requireConnected(err)) return false;
    long flags = LIBSSH2_SFTP_RENAME_ATOMIC | LIBSSH2_SFTP_RENAME_NATIVE;
    if (overwrite) flags |= LIBSSH2_SFTP_RENAME_OVERWRITE;
    if (libssh2_sftp_rename_ex(sftp_, from.c_str(), (unsigned)from.size(),
                               to.c_str(), (unsigned)to.size(), flags) != 0) {
        sftpError("rename " + from + " -> " + to, err);
        return false;
    }
    return true;
}

std::unique_ptr<RemoteClient> Libssh2SftpClient::newConnectionLike(const ConnectionDescriptor& opt,
                                                                   ClientError& err) {
    auto ptr = std::make_unique<Libssh2SftpClient>();
    ptr->setTuning(tuning_);
    if (!ptr->connect(opt, err)) return nullptr;
    return ptr;
}

} // namespace openxfer
