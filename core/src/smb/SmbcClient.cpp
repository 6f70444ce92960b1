// libsmbclient backend. Each client owns its own SMBCCTX so pooled
// connections never share library state.
#include "openxfer/SmbcClient.hpp"
#include "openxfer/Log.hpp"
#include <libsmbclient.h>

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <vector>

namespace openxfer {

namespace {

void copyField(char* dst, int len, const std::string& src) {
    if (!dst || len <= 0) return;
    std::snprintf(dst, (size_t)len, "%s", src.c_str());
}

void authCallback(SMBCCTX* c,
                  const char* /*server*/, const char* /*share*/,
                  char* workgroup, int wglen,
                  char* username, int unlen,
                  char* password, int pwlen) {
    auto* self = static_cast<SmbcClient*>(smbc_getOptionUserData(c));
    if (!self) return;
    const ConnectionDescriptor& d = self->descriptor();
    if (d.workgroup) copyField(workgroup, wglen, *d.workgroup);
    copyField(username, unlen, d.username.empty() ? std::string("guest") : d.username);
    copyField(password, pwlen, d.password.value_or(std::string()));
}

// libsmbclient decodes %XX in URLs; escape everything outside the unreserved set.
std::string encodePath(const std::string& p) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    for (unsigned char c : p) {
        if (std::isalnum(c) || c == '/' || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back((char)c);
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0xF]);
        }
    }
    return out;
}

std::string baseName(const std::string& p) {
    auto pos = p.find_last_of('/');
    return pos == std::string::npos ? p : p.substr(pos + 1);
}

} // namespace

SmbcClient::~SmbcClient() {
    disconnect();
}

void SmbcClient::setTuning(const IoTuning& tuning) {
    tuning_ = tuning;
    if (ctx_) smbc_setTimeout(ctx_, (int)tuning_.timeout.count());
}

bool SmbcClient::requireConnected(ClientError& err) const {
    if (connected_ && ctx_) return true;
    err.set(ErrorKind::NetworkError, "Not connected");
    return false;
}

std::string SmbcClient::url(const std::string& path) const {
    std::string p = path.empty() ? std::string("/") : path;
    if (p.front() != '/') p.insert(p.begin(), '/');
    return "smb://" + opt_.host + encodePath(p);
}

bool SmbcClient::connect(const ConnectionDescriptor& opt, ClientError& err) {
    if (connected_) {
        err.set(ErrorKind::InvalidOperation, "Already connected");
        return false;
    }
    opt_ = opt;
    ctx_ = smbc_new_context();
    if (!ctx_) {
        err = ClientError::fromErrno(errno, "smbc_new_context");
        return false;
    }
    smbc_setOptionUserData(ctx_, this);
    smbc_setFunctionAuthDataWithContext(ctx_, authCallback);
    smbc_setTimeout(ctx_, (int)tuning_.timeout.count());
    if (opt.port != 0) smbc_setPort(ctx_, opt.port);
    if (!smbc_init_context(ctx_)) {
        err = ClientError::fromErrno(errno, "smbc_init_context");
        smbc_free_context(ctx_, 1);
        ctx_ = nullptr;
        return false;
    }

    // Probe the server so credentials and reachability fail here, not mid-transfer.
    struct stat st{};
    const std::string probe = "smb://" + opt_.host + "/";
    auto statFn = smbc_getFunctionStat(ctx_);
    const int rc = statFn(ctx_, probe.c_str(), &st);
    const int e = errno;
    if (rc != 0 && e != ENOENT && e != EINVAL) {
        err = ClientError::fromErrno(e, "connect to " + opt_.host);
        smbc_free_context(ctx_, 1);
        ctx_ = nullptr;
        return false;
    }
    connected_ = true;
    LOGI("smb: connected to %s:%u", opt.host.c_str(), (unsigned)opt.port);
    return true;
}

void SmbcClient::disconnect() {
    if (ctx_) {
        smbc_free_context(ctx_, 1);
        ctx_ = nullptr;
    }
    connected_ = false;
}

bool SmbcClient::get(const std::string& remote,
                     const std::string& local,
                     ClientError& err,
                     ByteProgressCB progress,
                     CancelCB shouldCancel) {
    if (!requireConnected(err)) return false;

    FileInfo info;
    if (!stat(remote, info, err)) {
        if (err.empty()) err.set(ErrorKind::FileNotFound, "open " + remote + ": no such file");
        return false;
    }

    const std::string u = url(remote);
    SMBCFILE* rf = smbc_getFunctionOpen(ctx_)(ctx_, u.c_str(), O_RDONLY, 0);
    if (!rf) {
        err = ClientError::fromErrno(errno, "open " + remote);
        return false;
    }
    FILE* lf = std::fopen(local.c_str(), "wb");
    if (!lf) {
        err = ClientError::fromErrno(errno, "open " + local);
        smbc_getFunctionClose(ctx_)(ctx_, rf);
        return false;
    }

    auto readFn = smbc_getFunctionRead(ctx_);
    std::vector<char> buf(tuning_.chunkSize ? tuning_.chunkSize : 64 * 1024);
    std::size_t done = 0;
    bool ok = true;
    while (true) {
        if (shouldCancel && shouldCancel()) {
            err.set(ErrorKind::Cancelled, "Cancelled by user");
            ok = false;
            break;
        }
        ssize_t n = readFn(ctx_, rf, buf.data(), buf.size());
        if (n > 0) {
            if (std::fwrite(buf.data(), 1, (size_t)n, lf) != (size_t)n) {
                err = ClientError::fromErrno(errno, "write " + local);
                ok = false;
                break;
            }
            done += (std::size_t)n;
            if (progress) progress(done, (std::size_t)info.size);
        } else if (n == 0) {
            break;
        } else {
            err = ClientError::fromErrno(errno, "read " + remote);
            ok = false;
            break;
        }
    }
    if (std::fclose(lf) != 0 && ok) {
        err = ClientError::fromErrno(errno, "close " + local);
        ok = false;
    }
    smbc_getFunctionClose(ctx_)(ctx_, rf);
    return ok;
}

bool SmbcClient::put(const std::string& local,
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

    const std::string u = url(remote);
    SMBCFILE* wf = smbc_getFunctionOpen(ctx_)(ctx_, u.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (!wf) {
        err = ClientError::fromErrno(errno, "open " + remote + " for writing");
        std::fclose(lf);
        return false;
    }

    auto writeFn = smbc_getFunctionWrite(ctx_);
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
            break;
        }
        const char* p = buf.data();
        size_t remain = n;
        while (remain > 0) {
            if (shouldCancel && shouldCancel()) {
                err.set(ErrorKind::Cancelled, "Cancelled by user");
                ok = false;
                break;
            }
            ssize_t w = writeFn(ctx_, wf, p, remain);
            if (w < 0) {
                err = ClientError::fromErrno(errno, "write " + remote);
                ok = false;
                break;
            }
            remain -= (size_t)w;
            p += w;
            done += (size_t)w;
            if (progress) progress(done, total);
        }
    }

    if (smbc_getFunctionClose(ctx_)(ctx_, wf) != 0 && ok) {
        err = ClientError::fromErrno(errno, "close " + remote);
        ok = false;
    }
    std::fclose(lf);
    return ok;
}

bool SmbcClient::exists(const std::string& remote_path,
                        bool& isDir,
                        ClientError& err) {
    isDir = false;
    FileInfo info;
    if (!stat(remote_path, info, err)) return false;
    isDir = info.is_dir;
    return true;
}

bool SmbcClient::stat(const std::string& remote_path,
                      FileInfo& info,
                      ClientError& err) {
    if (!requireConnected(err)) return false;
    struct stat st{};
    const std::string u = url(remote_path);
    if (smbc_getFunctionStat(ctx_)(ctx_, u.c_str(), &st) != 0) {
        if (errno == ENOENT || errno == ENOTDIR) {
            err.clear();
            return false;
        }
        err = ClientError::fromErrno(errno, "stat " + remote_path);
        return false;
    }
    info = FileInfo{};
    info.name = baseName(remote_path);
    info.is_dir = S_ISDIR(st.st_mode);
    info.size = (std::uint64_t)st.st_size;
    info.mtime = (std::uint64_t)st.st_mtime;
    info.mode = (std::uint32_t)st.st_mode;
    return true;
}

bool SmbcClient::mkdir(const std::string& remote_dir,
                       ClientError& err,
                       unsigned int mode) {
    if (!requireConnected(err)) return false;
    const std::string u = url(remote_dir);
    if (smbc_getFunctionMkdir(ctx_)(ctx_, u.c_str(), (mode_t)mode) != 0) {
        err = ClientError::fromErrno(errno, "mkdir " + remote_dir);
        return false;
    }
    return true;
}

bool SmbcClient::removeFile(const std::string& remote_path,
                            ClientError& err) {
    if (!requireConnected(err)) return false;
    const std::string u = url(remote_path);
    if (smbc_getFunctionUnlink(ctx_)(ctx_, u.c_str()) != 0) {
        err = ClientError::fromErrno(errno, "unlink " + remote_path);
        return false;
    }
    return true;
}

bool SmbcClient::removeDir(const std::string& remote_dir,
                           ClientError& err) {
    if (!requireConnected(err)) return false;
    const std::string u = url(remote_dir);
    if (smbc_getFunctionRmdir(ctx_)(ctx_, u.c_str()) != 0) {
        err = ClientError::fromErrno(errno, "rmdir " + remote_dir);
        return false;
    }
    return true;
}

bool SmbcClient::rename(const std::string& from,
                        const std::string& to,
                        ClientError& err,
                        bool overwrite) {
    if (!requireConnected(err)) return false;
    if (!overwrite) {
        bool isDir = false;
        if (exists(to, isDir, err)) {
            err.set(ErrorKind::FileExists, "rename " + from + " -> " + to + ": target exists");
            return false;
        }
        if (!err.empty()) return false;
    }
    const std::string uf = url(from);
    const std::string ut = url(to);
    if (smbc_getFunctionRename(ctx_)(ctx_, uf.c_str(), ctx_, ut.c_str()) != 0) {
        err = ClientError::fromErrno(errno, "rename " + from + " -> " + to);
        return false;
    }
    return true;
}

std::unique_ptr<RemoteClient> SmbcClient::newConnectionLike(const ConnectionDescriptor& opt,
                                                            ClientError& err) {
    auto ptr = std::make_unique<SmbcClient>();
    ptr->setTuning(tuning_);
    if (!ptr->connect(opt, err)) return nullptr;
    return ptr;
}

} // namespace openxfer
