#include "openxfer/RemoteStrategy.hpp"
#include "openxfer/Log.hpp"
#include "openxfer/Progress.hpp"
#include "strategy/StrategySupport.hpp"

namespace openxfer {

namespace {

const std::string* localOf(const TransferPath& p) {
    const auto* l = std::get_if<LocalPath>(&p);
    return l ? &l->path : nullptr;
}

std::string baseName(const std::string& p) {
    auto pos = p.find_last_of('/');
    return pos == std::string::npos ? p : p.substr(pos + 1);
}

void dropPartial(const std::string& local) {
    ClientError err;
    if (!strategy::removeLocal(local, err)) LOGW("Cannot remove partial download %s: %s", local.c_str(), err.message.c_str());
}

void reportDone(const ProgressCB& cb, std::uint64_t size) {
    if (!cb) return;
    TransferProgress p;
    p.bytesTransferred = size;
    p.totalBytes = size;
    p.fraction = 1.0;
    cb(p);
}

} // namespace

RemoteStrategy::RemoteStrategy(Protocol protocol,
                               std::shared_ptr<AdmissionController> admission,
                               std::shared_ptr<ConnectionPool> pool,
                               std::shared_ptr<TempFileManager> staging)
    : protocol_(protocol), admission_(std::move(admission)), pool_(std::move(pool)), staging_(std::move(staging)) {}

bool RemoteStrategy::targetOf(const TransferPath& p, Target& out) const {
    if (protocolOf(p) != protocol_) return false;
    std::visit(overloaded{
                   [&](const SmbPath& s) {
                       out.host = s.host;
                       out.port = s.port;
                       // libsmbclient addresses /share/dir/file below smb://host.
                       out.clientPath = "/" + s.share + (s.remotePath == "/" ? std::string() : s.remotePath);
                   },
                   [&](const SftpPath& s) {
                       out.host = s.host;
                       out.port = s.port;
                       out.user = s.user;
                       out.clientPath = s.remotePath;
                   },
                   [&](const FtpPath& s) {
                       out.host = s.host;
                       out.port = s.port;
                       out.clientPath = s.remotePath;
                   },
                   [](const LocalPath&) {},
                   [](const CloudPath&) {},
               },
               p);
    out.key = endpointKey(p);
    out.uri = toUri(p);
    return true;
}

bool RemoteStrategy::sameItem(const Target& a, const Target& b) {
    return a.key == b.key && a.user == b.user && a.clientPath == b.clientPath;
}

TransferResult RemoteStrategy::copyOntoItself(const Target& t) {
    return TransferResult::failure(ErrorKind::FileExists, "Source and destination are the same: " + t.uri);
}

TransferResult RemoteStrategy::notMine(const TransferPath& p) const {
    return TransferResult::failure(ErrorKind::InvalidOperation,
                                   std::string("Not a ") + protocolName(protocol_) + " path: " + toUri(p));
}

std::string RemoteStrategy::parentPath(const std::string& p) {
    auto pos = p.find_last_of('/');
    if (pos == std::string::npos || pos == 0) return "/";
    return p.substr(0, pos);
}

bool RemoteStrategy::ensureRemoteDirs(RemoteClient& c, const std::string& dir, ClientError& err) {
    if (dir.empty() || dir == "/") return true;
    bool isDir = false;
    if (c.exists(dir, isDir, err)) {
        if (isDir) return true;
        err.set(ErrorKind::FileExists, "Not a directory: " + dir);
        return false;
    }
    if (!err.empty()) return false;
    if (!ensureRemoteDirs(c, parentPath(dir), err)) return false;
    if (c.mkdir(dir, err)) return true;
    // Lost a race against another transfer creating the same folder.
    if (err.kind == ErrorKind::FileExists) {
        err.clear();
        return true;
    }
    return false;
}

TransferResult RemoteStrategy::run(const Target& t,
                                   const OperationControl& ctl,
                                   const std::string& what,
                                   const ClientOp& op) {
    return strategy::guarded(what, [&]() -> TransferResult {
        return admission_->withThrottle(
            protocol_, t.key, ctl.highPriority,
            [&]() -> TransferResult {
                if (ctl.cancelled()) return strategy::cancelled(what);
                ClientError err;
                ConnectionPool::Lease lease = pool_->acquire(protocol_, t.host, t.port, t.user, admission_->ioTuning(t.key), err);
                if (!lease) return TransferResult::fromClient(err, what);
                TransferResult r = op(lease.client());
                // A connection that saw a network error is not reused.
                if (r.is(ErrorKind::NetworkError)) lease.discard();
                return r;
            },
            ctl.shouldCancel);
    });
}

TransferResult RemoteStrategy::download(const Target& src,
                                        const std::string& local,
                                        bool overwrite,
                                        const ProgressCB& onProgress,
                                        const OperationControl& ctl) {
    const std::string what = "download " + src.uri;
    if (!overwrite && strategy::localExists(local))
        return TransferResult::failure(ErrorKind::FileExists, "Destination exists: " + local);
    ClientError perr;
    if (!strategy::ensureLocalParent(local, perr)) return TransferResult::fromClient(perr, what);

    return run(src, ctl, what, [&](RemoteClient& c) -> TransferResult {
        FileInfo info;
        ClientError err;
        if (!c.stat(src.clientPath, info, err)) {
            if (err.empty()) return TransferResult::failure(ErrorKind::FileNotFound, "Source not found: " + src.uri);
            return TransferResult::fromClient(err, what);
        }
        if (info.is_dir)
            return TransferResult::failure(ErrorKind::InvalidOperation, "Folder transfer is not supported: " + src.uri);
        ProgressThrottle progress(onProgress);
        if (!c.get(src.clientPath, local, err, progress.byteCallback(), ctl.shouldCancel)) {
            dropPartial(local);
            return TransferResult::fromClient(err, what);
        }
        progress.finish(info.size);
        return TransferResult::success(local);
    });
}

TransferResult RemoteStrategy::upload(const std::string& local,
                                      const Target& dst,
                                      bool overwrite,
                                      const ProgressCB& onProgress,
                                      const OperationControl& ctl) {
    const std::string what = "upload " + dst.uri;
    if (!strategy::localExists(local)) return TransferResult::failure(ErrorKind::FileNotFound, "Source not found: " + local);
    if (strategy::localIsDir(local))
        return TransferResult::failure(ErrorKind::InvalidOperation, "Folder transfer is not supported: " + local);

    return run(dst, ctl, what, [&](RemoteClient& c) -> TransferResult {
        ClientError err;
        bool isDir = false;
        if (c.exists(dst.clientPath, isDir, err)) {
            if (!overwrite || isDir) return TransferResult::failure(ErrorKind::FileExists, "Destination exists: " + dst.uri);
        } else if (!err.empty()) {
            return TransferResult::fromClient(err, what);
        }
        if (!ensureRemoteDirs(c, parentPath(dst.clientPath), err)) return TransferResult::fromClient(err, what);
        ProgressThrottle progress(onProgress);
        if (!c.put(local, dst.clientPath, err, progress.byteCallback(), ctl.shouldCancel))
            return TransferResult::fromClient(err, what);
        progress.finish(strategy::localSize(local));
        return TransferResult::success(dst.uri);
    });
}

TransferResult RemoteStrategy::copyBetween(const Target& src,
                                           const Target& dst,
                                           bool overwrite,
                                           const ProgressCB& onProgress,
                                           const OperationControl& ctl) {
    StagedFile staged(*staging_, protocolName(protocol_), "_" + baseName(src.clientPath));
    if (!staged.ok()) return TransferResult::fromClient(staged.error(), "copy " + src.uri);
    TransferResult down = download(src, staged.path(), true, sliceProgress(onProgress, 0.0, 0.5), ctl);
    if (!down) return down;
    return upload(staged.path(), dst, overwrite, sliceProgress(onProgress, 0.5, 1.0), ctl);
}

TransferResult RemoteStrategy::copy(const TransferPath& srcPath,
                                    const TransferPath& dstPath,
                                    bool overwrite,
                                    const ProgressCB& onProgress,
                                    const OperationControl& ctl) {
    Target src, dst;
    const bool srcMine = targetOf(srcPath, src);
    const bool dstMine = targetOf(dstPath, dst);
    const std::string* srcLocal = localOf(srcPath);
    const std::string* dstLocal = localOf(dstPath);

    if (srcMine && dstLocal) return download(src, *dstLocal, overwrite, onProgress, ctl);
    if (srcLocal && dstMine) return upload(*srcLocal, dst, overwrite, onProgress, ctl);
    if (!srcMine || !dstMine)
        return TransferResult::failure(ErrorKind::InvalidOperation,
                                       "Cannot copy " + toUri(srcPath) + " to " + toUri(dstPath) + " over " +
                                           protocolName(protocol_));

    if (sameItem(src, dst)) return copyOntoItself(src);
    if (!overwrite && exists(dstPath, ctl))
        return TransferResult::failure(ErrorKind::FileExists, "Destination exists: " + dst.uri);

    if (sameEndpoint(srcPath, dstPath) && src.user == dst.user && pool_->supportsServerCopy(protocol_)) {
        TransferResult r = run(src, ctl, "copy " + src.uri, [&](RemoteClient& c) -> TransferResult {
            ClientError err;
            bool isDir = false;
            if (c.exists(dst.clientPath, isDir, err)) {
                if (!overwrite || isDir) return TransferResult::failure(ErrorKind::FileExists, "Destination exists: " + dst.uri);
                if (!c.removeFile(dst.clientPath, err)) return TransferResult::fromClient(err, "copy " + src.uri);
            } else if (!err.empty()) {
                return TransferResult::fromClient(err, "copy " + src.uri);
            }
            if (!ensureRemoteDirs(c, parentPath(dst.clientPath), err) || !c.copyRemote(src.clientPath, dst.clientPath, err))
                return TransferResult::fromClient(err, "copy " + src.uri);
            return TransferResult::success(dst.uri);
        });
        if (r) reportDone(onProgress, 0);
        return r;
    }
    return copyBetween(src, dst, overwrite, onProgress, ctl);
}

TransferResult RemoteStrategy::removeTarget(const Target& t, const OperationControl& ctl) {
    return run(t, ctl, "delete " + t.uri, [&](RemoteClient& c) -> TransferResult {
        FileInfo info;
        ClientError err;
        if (!c.stat(t.clientPath, info, err)) {
            if (err.empty()) return TransferResult::failure(ErrorKind::FileNotFound, "Not found: " + t.uri);
            return TransferResult::fromClient(err, "delete " + t.uri);
        }
        const bool ok = info.is_dir ? c.removeDir(t.clientPath, err) : c.removeFile(t.clientPath, err);
        if (!ok) return TransferResult::fromClient(err, "delete " + t.uri);
        return TransferResult::success(t.uri);
    });
}

TransferResult RemoteStrategy::move(const TransferPath& srcPath,
                                    const TransferPath& dstPath,
                                    bool overwrite,
                                    const ProgressCB& onProgress,
                                    const OperationControl& ctl) {
    Target src, dst;
    const bool srcMine = targetOf(srcPath, src);
    const bool dstMine = targetOf(dstPath, dst);

    if (srcMine && dstMine && sameItem(src, dst)) return copyOntoItself(src);
    if (srcMine && dstMine && sameEndpoint(srcPath, dstPath) && src.user == dst.user) {
        TransferResult r = run(src, ctl, "move " + src.uri, [&](RemoteClient& c) -> TransferResult {
            ClientError err;
            bool isDir = false;
            if (!overwrite && c.exists(dst.clientPath, isDir, err))
                return TransferResult::failure(ErrorKind::FileExists, "Destination exists: " + dst.uri);
            if (!err.empty()) return TransferResult::fromClient(err, "move " + src.uri);
            if (!ensureRemoteDirs(c, parentPath(dst.clientPath), err) ||
                !c.rename(src.clientPath, dst.clientPath, err, overwrite))
                return TransferResult::fromClient(err, "move " + src.uri);
            return TransferResult::success(dst.uri);
        });
        if (r) {
            reportDone(onProgress, 0);
            return r;
        }
        if (!r.is(ErrorKind::InvalidOperation) && !r.is(ErrorKind::Unknown)) return r;
        LOGI("rename %s failed (%s), falling back to copy+delete", src.uri.c_str(), r.error().message.c_str());
    }

    TransferResult copied = copy(srcPath, dstPath, overwrite, onProgress, ctl);
    if (!copied) return copied;

    if (const std::string* local = localOf(srcPath)) {
        ClientError err;
        if (!strategy::removeLocal(*local, err))
            return TransferResult::fromClient(err, "Copied, but could not delete source " + *local);
        return copied;
    }
    TransferResult removed = removeTarget(src, ctl);
    if (!removed)
        return TransferResult::failure(removed.error().kind, "Copied, but could not delete source: " + removed.error().message,
                                       removed.error().cause, removed.error().timedOut);
    return copied;
}

TransferResult RemoteStrategy::remove(const TransferPath& path, bool, const OperationControl& ctl) {
    Target t;
    if (!targetOf(path, t)) return notMine(path);
    return removeTarget(t, ctl);
}

bool RemoteStrategy::exists(const TransferPath& path, const OperationControl& ctl) {
    Target t;
    if (!targetOf(path, t)) return false;
    bool found = false;
    TransferResult r = run(t, ctl, "exists " + t.uri, [&](RemoteClient& c) -> TransferResult {
        ClientError err;
        bool isDir = false;
        found = c.exists(t.clientPath, isDir, err);
        if (!found && !err.empty()) return TransferResult::fromClient(err, "exists " + t.uri);
        return TransferResult::success(t.uri);
    });
    if (!r) LOGW("%s", r.error().message.c_str());
    return found;
}

TransferResult RemoteStrategy::rename(const TransferPath& path, const std::string& newName, const OperationControl& ctl) {
    Target t;
    if (!targetOf(path, t)) return notMine(path);
    if (!strategy::isValidName(newName)) return strategy::invalidName(newName);
    const std::string parent = parentPath(t.clientPath);
    const std::string to = (parent == "/" ? std::string() : parent) + "/" + newName;
    const std::string finalUri = toUri(withFileName(path, newName));

    return run(t, ctl, "rename " + t.uri, [&](RemoteClient& c) -> TransferResult {
        ClientError err;
        bool isDir = false;
        if (c.exists(to, isDir, err)) return TransferResult::failure(ErrorKind::FileExists, "Already exists: " + finalUri);
        if (!err.empty()) return TransferResult::fromClient(err, "rename " + t.uri);
        if (!c.rename(t.clientPath, to, err, false)) return TransferResult::fromClient(err, "rename " + t.uri);
        return TransferResult::success(finalUri);
    });
}

TransferResult RemoteStrategy::createDirectory(const TransferPath& path, const OperationControl& ctl) {
    Target t;
    if (!targetOf(path, t)) return notMine(path);
    return run(t, ctl, "mkdir " + t.uri, [&](RemoteClient& c) -> TransferResult {
        ClientError err;
        if (!ensureRemoteDirs(c, t.clientPath, err)) return TransferResult::fromClient(err, "mkdir " + t.uri);
        return TransferResult::success(t.uri);
    });
}

TransferResult RemoteStrategy::getInfo(const TransferPath& path, FileInfo& out, const OperationControl& ctl) {
    Target t;
    if (!targetOf(path, t)) return notMine(path);
    return run(t, ctl, "info " + t.uri, [&](RemoteClient& c) -> TransferResult {
        ClientError err;
        if (!c.stat(t.clientPath, out, err)) {
            if (err.empty()) return TransferResult::failure(ErrorKind::FileNotFound, "Not found: " + t.uri);
            return TransferResult::fromClient(err, "info " + t.uri);
        }
        return TransferResult::success(t.uri);
    });
}

} // namespace openxfer
