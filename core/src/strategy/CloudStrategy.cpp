#include "openxfer/CloudStrategy.hpp"
#include "openxfer/Log.hpp"
#include "openxfer/Progress.hpp"
#include "strategy/StrategySupport.hpp"

#include <algorithm>
#include <cctype>

namespace openxfer {

namespace {

const std::string* localOf(const TransferPath& p) {
    const auto* l = std::get_if<LocalPath>(&p);
    return l ? &l->path : nullptr;
}

std::string lastSegment(const std::string& s) {
    auto pos = s.find_last_of('/');
    return pos == std::string::npos ? s : s.substr(pos + 1);
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return (char)std::tolower(c); });
    return s;
}

void reportDone(const ProgressCB& cb, std::uint64_t size) {
    if (!cb) return;
    TransferProgress p;
    p.bytesTransferred = size;
    p.totalBytes = size;
    p.fraction = 1.0;
    cb(p);
}

TransferResult notFound(const std::string& uri) {
    return TransferResult::failure(ErrorKind::FileNotFound, "Not found: " + uri);
}

TransferResult ontoItself(const std::string& uri) {
    return TransferResult::failure(ErrorKind::FileExists, "Source and destination are the same: " + uri);
}

} // namespace

CloudStrategy::CloudStrategy(std::shared_ptr<AdmissionController> admission,
                             std::shared_ptr<CredentialsProvider> credentials,
                             std::shared_ptr<TempFileManager> staging)
    : admission_(std::move(admission)), credentials_(std::move(credentials)), staging_(std::move(staging)) {}

void CloudStrategy::registerClient(std::shared_ptr<CloudStorageClient> client) {
    std::lock_guard<std::mutex> lk(mtx_);
    clients_[client->provider()] = std::move(client);
}

std::shared_ptr<CloudStorageClient> CloudStrategy::clientFor(CloudProvider provider) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = clients_.find(provider);
    return it == clients_.end() ? nullptr : it->second;
}

CloudStrategy::Located CloudStrategy::locate(const CloudPath& p, const CloudStorageClient& c) const {
    Located l;
    l.provider = p.provider;
    l.uri = toUri(p);
    const auto segs = p.segments();
    const auto split = splitParentAndName(p);
    l.name = segs.empty() ? std::string() : segs.back();
    l.hasParent = split.second.has_value();
    if (p.provider == CloudProvider::Dropbox) {
        std::string joined;
        for (const auto& s : segs) joined += "/" + s;
        l.ref = joined;
        l.parentRef = l.hasParent ? split.first : c.rootRef();
    } else {
        // Id-addressed: the item is its last segment, the folder the one before.
        l.ref = segs.empty() ? c.rootRef() : segs.back();
        l.parentRef = l.hasParent ? lastSegment(split.first) : c.rootRef();
    }
    return l;
}

bool CloudStrategy::ensureAuthenticated(CloudStorageClient& c, ClientError& err) const {
    if (c.isAuthenticated()) return true;
    std::optional<std::string> token;
    if (credentials_) token = credentials_->cloudToken(c.provider());
    if (!token || token->empty()) {
        err.set(ErrorKind::AuthenticationRequired, std::string("Sign in to ") + cloudProviderName(c.provider()) + " first");
        return false;
    }
    LOGD("Restored %s token", cloudProviderName(c.provider()));
    c.setAccessToken(*token);
    return true;
}

TransferResult CloudStrategy::run(CloudProvider provider,
                                  const OperationControl& ctl,
                                  const std::string& what,
                                  const CloudOp& op) {
    std::shared_ptr<CloudStorageClient> c = clientFor(provider);
    if (!c)
        return TransferResult::failure(ErrorKind::InvalidOperation,
                                       std::string("No client for ") + cloudProviderName(provider));
    ClientError err;
    if (!ensureAuthenticated(*c, err)) return TransferResult::fromClient(err, what);

    std::string account;
    if (credentials_) account = credentials_->cloudAccount(provider).value_or(std::string());
    const std::string key = cloudEndpointKey(provider, account);
    c->setTuning(admission_->ioTuning(key));
    return strategy::guarded(what, [&]() -> TransferResult {
        return admission_->withThrottle(
            Protocol::Cloud, key, ctl.highPriority,
            [&]() -> TransferResult {
                if (ctl.cancelled()) return strategy::cancelled(what);
                return op(*c);
            },
            ctl.shouldCancel);
    });
}

std::string CloudStrategy::refOf(const CloudStorageClient& c, const CloudFile& f) {
    if (c.provider() != CloudProvider::Dropbox) return f.id;
    return f.path == "/" ? std::string() : f.path;
}

bool CloudStrategy::findChild(CloudStorageClient& c,
                              const std::string& parentRef,
                              const std::string& name,
                              CloudFile& out,
                              ClientError& err) {
    if (c.provider() == CloudProvider::Dropbox) {
        const std::string path = (parentRef.empty() || parentRef == "/" ? std::string() : parentRef) + "/" + name;
        return c.getFileMetadata(path, out, err);
    }
    std::vector<CloudFile> children;
    if (!c.listFiles(parentRef, children, err)) return false;
    for (const auto& f : children) {
        if (f.name == name) {
            out = f;
            return true;
        }
    }
    return false;
}

bool CloudStrategy::findItem(CloudStorageClient& c, const Located& l, CloudFile& out, ClientError& err) {
    if (c.getFileMetadata(l.ref, out, err)) return true;
    if (!err.empty() || c.provider() == CloudProvider::Dropbox || l.name.empty()) return false;
    // The last segment was a name, not an id.
    return findChild(c, l.parentRef, l.name, out, err);
}

TransferResult CloudStrategy::download(const CloudPath& src,
                                       const std::string& local,
                                       bool overwrite,
                                       const ProgressCB& onProgress,
                                       const OperationControl& ctl) {
    const std::string what = "download " + toUri(src);
    if (!overwrite && strategy::localExists(local))
        return TransferResult::failure(ErrorKind::FileExists, "Destination exists: " + local);
    ClientError perr;
    if (!strategy::ensureLocalParent(local, perr)) return TransferResult::fromClient(perr, what);

    return run(src.provider, ctl, what, [&](CloudStorageClient& c) -> TransferResult {
        const Located l = locate(src, c);
        CloudFile f;
        ClientError err;
        if (!findItem(c, l, f, err)) return err.empty() ? notFound(l.uri) : TransferResult::fromClient(err, what);
        if (f.isFolder)
            return TransferResult::failure(ErrorKind::InvalidOperation, "Folder transfer is not supported: " + l.uri);
        ProgressThrottle progress(onProgress);
        if (!c.downloadFile(refOf(c, f), local, err, progress.byteCallback(), ctl.shouldCancel)) {
            ClientError rmErr;
            if (strategy::localExists(local) && !strategy::removeLocal(local, rmErr))
                LOGW("Cannot remove partial download %s: %s", local.c_str(), rmErr.message.c_str());
            return TransferResult::fromClient(err, what);
        }
        progress.finish(f.size);
        return TransferResult::success(local);
    });
}

TransferResult CloudStrategy::upload(const std::string& local,
                                     const CloudPath& dst,
                                     bool overwrite,
                                     const ProgressCB& onProgress,
                                     const OperationControl& ctl) {
    const std::string what = "upload " + toUri(dst);
    if (!strategy::localExists(local)) return TransferResult::failure(ErrorKind::FileNotFound, "Source not found: " + local);
    if (strategy::localIsDir(local))
        return TransferResult::failure(ErrorKind::InvalidOperation, "Folder transfer is not supported: " + local);

    return run(dst.provider, ctl, what, [&](CloudStorageClient& c) -> TransferResult {
        const Located l = locate(dst, c);
        if (l.name.empty()) return TransferResult::failure(ErrorKind::InvalidInput, "Destination needs a file name: " + l.uri);
        CloudFile out;
        ClientError err;
        ProgressThrottle progress(onProgress);
        if (!c.uploadFile(local, l.name, guessMimeType(l.name), l.parentRef, overwrite, out, err,
                          progress.byteCallback(), ctl.shouldCancel))
            return TransferResult::fromClient(err, what);
        progress.finish(strategy::localSize(local));
        return TransferResult::success(l.uri);
    });
}

TransferResult CloudStrategy::sameProviderCopy(const CloudPath& src,
                                               const CloudPath& dst,
                                               bool overwrite,
                                               const ProgressCB& onProgress,
                                               const OperationControl& ctl) {
    const std::string what = "copy " + toUri(src);
    return run(src.provider, ctl, what, [&](CloudStorageClient& c) -> TransferResult {
        const Located from = locate(src, c);
        const Located to = locate(dst, c);
        if (to.name.empty()) return TransferResult::failure(ErrorKind::InvalidInput, "Destination needs a name: " + to.uri);
        CloudFile f;
        ClientError err;
        if (!findItem(c, from, f, err)) return err.empty() ? notFound(from.uri) : TransferResult::fromClient(err, what);

        CloudFile existing;
        if (findChild(c, to.parentRef, to.name, existing, err)) {
            if (refOf(c, existing) == refOf(c, f)) return ontoItself(to.uri);
            if (!overwrite) return TransferResult::failure(ErrorKind::FileExists, "Destination exists: " + to.uri);
            if (!c.deleteFile(refOf(c, existing), err)) return TransferResult::fromClient(err, what);
        } else if (!err.empty()) {
            return TransferResult::fromClient(err, what);
        }

        CloudFile created;
        if (!c.copyFile(refOf(c, f), to.parentRef, to.name, created, err)) return TransferResult::fromClient(err, what);
        reportDone(onProgress, f.size);
        return TransferResult::success(to.uri);
    });
}

TransferResult CloudStrategy::sameProviderMove(const CloudPath& src,
                                               const CloudPath& dst,
                                               bool overwrite,
                                               const ProgressCB& onProgress,
                                               const OperationControl& ctl) {
    const std::string what = "move " + toUri(src);
    return run(src.provider, ctl, what, [&](CloudStorageClient& c) -> TransferResult {
        const Located from = locate(src, c);
        const Located to = locate(dst, c);
        if (to.name.empty()) return TransferResult::failure(ErrorKind::InvalidInput, "Destination needs a name: " + to.uri);
        CloudFile f;
        ClientError err;
        if (!findItem(c, from, f, err)) return err.empty() ? notFound(from.uri) : TransferResult::fromClient(err, what);
        std::string ref = refOf(c, f);

        CloudFile existing;
        if (findChild(c, to.parentRef, to.name, existing, err)) {
            if (refOf(c, existing) == ref) return ontoItself(to.uri);
            if (!overwrite) return TransferResult::failure(ErrorKind::FileExists, "Destination exists: " + to.uri);
            if (!c.deleteFile(refOf(c, existing), err)) return TransferResult::fromClient(err, what);
        } else if (!err.empty()) {
            return TransferResult::fromClient(err, what);
        }

        // Current parent: the path's dirname on Dropbox, "<parent>/<id>" elsewhere.
        std::string currentParent;
        const auto slash = f.path.find_last_of('/');
        if (slash != std::string::npos) currentParent = f.path.substr(0, slash);
        const bool sameParent = c.provider() == CloudProvider::Dropbox
                                    ? lower(currentParent) == lower(to.parentRef)
                                    : currentParent == to.parentRef;

        CloudFile moved = f;
        if (!sameParent) {
            if (!c.moveFile(ref, to.parentRef, moved, err)) return TransferResult::fromClient(err, what);
            ref = refOf(c, moved);
        }
        if (moved.name != to.name) {
            if (!c.renameFile(ref, to.name, moved, err)) return TransferResult::fromClient(err, what);
        }
        reportDone(onProgress, f.size);
        return TransferResult::success(to.uri);
    });
}

TransferResult CloudStrategy::copy(const TransferPath& srcPath,
                                   const TransferPath& dstPath,
                                   bool overwrite,
                                   const ProgressCB& onProgress,
                                   const OperationControl& ctl) {
    const auto* src = std::get_if<CloudPath>(&srcPath);
    const auto* dst = std::get_if<CloudPath>(&dstPath);
    if (src && dst) {
        if (src->provider == dst->provider) return sameProviderCopy(*src, *dst, overwrite, onProgress, ctl);
        if (!overwrite && exists(dstPath, ctl))
            return TransferResult::failure(ErrorKind::FileExists, "Destination exists: " + toUri(dstPath));
        StagedFile staged(*staging_, cloudProviderName(src->provider), "_" + fileName(srcPath));
        if (!staged.ok()) return TransferResult::fromClient(staged.error(), "copy " + toUri(srcPath));
        TransferResult down = download(*src, staged.path(), true, sliceProgress(onProgress, 0.0, 0.5), ctl);
        if (!down) return down;
        return upload(staged.path(), *dst, overwrite, sliceProgress(onProgress, 0.5, 1.0), ctl);
    }
    if (src) {
        if (const std::string* local = localOf(dstPath)) return download(*src, *local, overwrite, onProgress, ctl);
    } else if (dst) {
        if (const std::string* local = localOf(srcPath)) return upload(*local, *dst, overwrite, onProgress, ctl);
    }
    return TransferResult::failure(ErrorKind::InvalidOperation,
                                   "Cannot copy " + toUri(srcPath) + " to " + toUri(dstPath) + " over cloud");
}

TransferResult CloudStrategy::move(const TransferPath& srcPath,
                                   const TransferPath& dstPath,
                                   bool overwrite,
                                   const ProgressCB& onProgress,
                                   const OperationControl& ctl) {
    const auto* src = std::get_if<CloudPath>(&srcPath);
    const auto* dst = std::get_if<CloudPath>(&dstPath);
    if (src && dst && src->provider == dst->provider) return sameProviderMove(*src, *dst, overwrite, onProgress, ctl);

    TransferResult copied = copy(srcPath, dstPath, overwrite, onProgress, ctl);
    if (!copied) return copied;
    if (const std::string* local = localOf(srcPath)) {
        ClientError err;
        if (!strategy::removeLocal(*local, err))
            return TransferResult::fromClient(err, "Copied, but could not delete source " + *local);
        return copied;
    }
    TransferResult removed = removeItem(*src, true, ctl);
    if (!removed)
        return TransferResult::failure(removed.error().kind, "Copied, but could not delete source: " + removed.error().message,
                                       removed.error().cause, removed.error().timedOut);
    return copied;
}

TransferResult CloudStrategy::removeItem(const CloudPath& path, bool permanent, const OperationControl& ctl) {
    const std::string what = "delete " + toUri(path);
    return run(path.provider, ctl, what, [&](CloudStorageClient& c) -> TransferResult {
        const Located l = locate(path, c);
        if (l.name.empty()) return TransferResult::failure(ErrorKind::InvalidOperation, "Cannot delete the root folder");
        CloudFile f;
        ClientError err;
        if (!findItem(c, l, f, err)) return err.empty() ? notFound(l.uri) : TransferResult::fromClient(err, what);
        const bool ok = permanent ? c.deleteFile(refOf(c, f), err) : c.trashFile(refOf(c, f), err);
        if (!ok) return TransferResult::fromClient(err, what);
        return TransferResult::success(l.uri);
    });
}

TransferResult CloudStrategy::remove(const TransferPath& path, bool permanent, const OperationControl& ctl) {
    const auto* p = std::get_if<CloudPath>(&path);
    if (!p) return TransferResult::failure(ErrorKind::InvalidOperation, "Not a cloud path: " + toUri(path));
    return removeItem(*p, permanent, ctl);
}

bool CloudStrategy::exists(const TransferPath& path, const OperationControl& ctl) {
    const auto* p = std::get_if<CloudPath>(&path);
    if (!p) return false;
    bool found = false;
    TransferResult r = run(p->provider, ctl, "exists " + toUri(path), [&](CloudStorageClient& c) -> TransferResult {
        const Located l = locate(*p, c);
        ClientError err;
        CloudFile f;
        if (l.hasParent) {
            found = c.fileExists(l.name, l.parentRef, err);
            // Id-addressed paths end in an id rather than a name.
            if (!found && c.provider() != CloudProvider::Dropbox) {
                if (!err.empty()) LOGD("exists %s: %s, trying metadata", l.uri.c_str(), err.message.c_str());
                err.clear();
                found = c.getFileMetadata(l.ref, f, err);
            }
        } else {
            found = c.getFileMetadata(l.ref, f, err);
            if (!found && err.empty() && c.provider() != CloudProvider::Dropbox && !l.name.empty())
                found = c.fileExists(l.name, l.parentRef, err);
        }
        if (!found && !err.empty()) return TransferResult::fromClient(err, "exists " + l.uri);
        return TransferResult::success(l.uri);
    });
    if (!r) LOGW("%s", r.error().message.c_str());
    return found;
}

TransferResult CloudStrategy::rename(const TransferPath& path, const std::string& newName, const OperationControl& ctl) {
    const auto* p = std::get_if<CloudPath>(&path);
    if (!p) return TransferResult::failure(ErrorKind::InvalidOperation, "Not a cloud path: " + toUri(path));
    if (!strategy::isValidName(newName)) return strategy::invalidName(newName);

    const std::string what = "rename " + toUri(path);
    return run(p->provider, ctl, what, [&](CloudStorageClient& c) -> TransferResult {
        const Located l = locate(*p, c);
        if (l.name.empty()) return TransferResult::failure(ErrorKind::InvalidOperation, "Cannot rename the root folder");
        CloudFile f;
        ClientError err;
        if (!findItem(c, l, f, err)) return err.empty() ? notFound(l.uri) : TransferResult::fromClient(err, what);

        std::string parentRef = l.parentRef;
        const auto slash = f.path.find_last_of('/');
        if (!l.hasParent && slash != std::string::npos && slash > 0) parentRef = f.path.substr(0, slash);
        CloudFile sibling;
        if (findChild(c, parentRef, newName, sibling, err))
            return TransferResult::failure(ErrorKind::FileExists, "Already exists: " + newName);
        if (!err.empty()) return TransferResult::fromClient(err, what);

        CloudFile renamed;
        if (!c.renameFile(refOf(c, f), newName, renamed, err)) return TransferResult::fromClient(err, what);
        // Id-addressed paths keep their id.
        return TransferResult::success(c.provider() == CloudProvider::Dropbox ? toUri(withFileName(path, newName))
                                                                              : l.uri);
    });
}

TransferResult CloudStrategy::createDirectory(const TransferPath& path, const OperationControl& ctl) {
    const auto* p = std::get_if<CloudPath>(&path);
    if (!p) return TransferResult::failure(ErrorKind::InvalidOperation, "Not a cloud path: " + toUri(path));

    const std::string what = "mkdir " + toUri(path);
    return run(p->provider, ctl, what, [&](CloudStorageClient& c) -> TransferResult {
        const Located l = locate(*p, c);
        ClientError err;
        CloudFile f;
        // Ensures one folder level; true when it exists as a folder afterwards.
        auto ensureFolder = [&](const std::string& parentRef, const std::string& name, CloudFile& out) -> bool {
            if (findChild(c, parentRef, name, out, err)) {
                if (out.isFolder) return true;
                err.set(ErrorKind::FileExists, "A file with this name exists: " + name);
                return false;
            }
            if (!err.empty()) return false;
            if (c.createFolder(name, parentRef, out, err)) return true;
            if (err.kind != ErrorKind::FileExists) return false;
            err.clear();
            return findChild(c, parentRef, name, out, err) && out.isFolder;
        };

        if (l.name.empty()) return TransferResult::success(l.uri);
        if (c.provider() == CloudProvider::Dropbox) {
            std::string cur = c.rootRef();
            for (const auto& seg : p->segments()) {
                if (!ensureFolder(cur, seg, f)) return TransferResult::fromClient(err, what);
                cur += "/" + seg;
            }
            return TransferResult::success(l.uri);
        }
        if (c.getFileMetadata(l.ref, f, err)) {
            if (f.isFolder) return TransferResult::success(l.uri);
            return TransferResult::failure(ErrorKind::FileExists, "A file with this name exists: " + l.uri);
        }
        if (!err.empty()) return TransferResult::fromClient(err, what);
        if (!ensureFolder(l.parentRef, l.name, f)) return TransferResult::fromClient(err, what);
        return TransferResult::success(l.uri);
    });
}

TransferResult CloudStrategy::getInfo(const TransferPath& path, FileInfo& out, const OperationControl& ctl) {
    const auto* p = std::get_if<CloudPath>(&path);
    if (!p) return TransferResult::failure(ErrorKind::InvalidOperation, "Not a cloud path: " + toUri(path));

    const std::string what = "info " + toUri(path);
    return run(p->provider, ctl, what, [&](CloudStorageClient& c) -> TransferResult {
        const Located l = locate(*p, c);
        CloudFile f;
        ClientError err;
        if (!findItem(c, l, f, err)) return err.empty() ? notFound(l.uri) : TransferResult::fromClient(err, what);
        out = FileInfo{};
        out.name = f.name;
        out.is_dir = f.isFolder;
        out.size = f.size;
        out.mtime = f.modified;
        out.id = f.id;
        return TransferResult::success(l.uri);
    });
}

} // namespace openxfer
