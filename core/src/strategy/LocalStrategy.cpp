#include "openxfer/LocalStrategy.hpp"
#include "openxfer/Log.hpp"
#include "openxfer/Progress.hpp"
#include "strategy/StrategySupport.hpp"

#include <cerrno>
#include <cstdio>
#include <filesystem>
#include <sys/stat.h>
#include <vector>

namespace fs = std::filesystem;

namespace openxfer {

namespace {

const std::string* localOf(const TransferPath& p) {
    const auto* l = std::get_if<LocalPath>(&p);
    return l ? &l->path : nullptr;
}

TransferResult notLocal(const TransferPath& p) {
    return TransferResult::failure(ErrorKind::InvalidOperation, "Not a local path: " + toUri(p));
}

TransferResult fromEc(const std::error_code& ec, const std::string& what) {
    return TransferResult::fromClient(ClientError::fromErrno(ec.value(), what), what);
}

// Hard links and differently spelled paths count as the same file.
bool sameFile(const std::string& a, const std::string& b) {
    std::error_code ec;
    return fs::equivalent(a, b, ec) && !ec;
}

TransferResult ontoItself(const std::string& p) {
    return TransferResult::failure(ErrorKind::FileExists, "Source and destination are the same: " + p);
}

TransferResult copyTree(const std::string& src, const std::string& dst, bool overwrite) {
    std::error_code ec;
    auto opts = fs::copy_options::recursive;
    if (overwrite) opts |= fs::copy_options::overwrite_existing;
    fs::copy(src, dst, opts, ec);
    if (ec) return fromEc(ec, "copy " + src);
    return TransferResult::success(dst);
}

} // namespace

LocalStrategy::LocalStrategy(std::shared_ptr<TrashManager> trash) : trash_(std::move(trash)) {}

TransferResult LocalStrategy::copyFile(const std::string& src,
                                       const std::string& dst,
                                       const ProgressCB& onProgress,
                                       const CancelCB& shouldCancel) {
    FILE* in = std::fopen(src.c_str(), "rb");
    if (!in) return TransferResult::fromClient(ClientError::fromErrno(errno, "open " + src), "copy " + src);
    FILE* out = std::fopen(dst.c_str(), "wb");
    if (!out) {
        const int e = errno;
        std::fclose(in);
        return TransferResult::fromClient(ClientError::fromErrno(e, "open " + dst), "copy " + src);
    }

    const std::uint64_t total = strategy::localSize(src);
    ProgressThrottle progress(onProgress);
    std::vector<char> buf(kCopyBufferSize);
    std::uint64_t done = 0;
    ClientError err;
    bool wasCancelled = false;
    for (;;) {
        if (shouldCancel && shouldCancel()) {
            wasCancelled = true;
            break;
        }
        const size_t n = std::fread(buf.data(), 1, buf.size(), in);
        if (n == 0) {
            if (std::ferror(in)) err = ClientError::fromErrno(errno, "read " + src);
            break;
        }
        if (std::fwrite(buf.data(), 1, n, out) != n) {
            err = ClientError::fromErrno(errno, "write " + dst);
            break;
        }
        done += n;
        progress.report(done, total);
    }
    std::fclose(in);
    if (std::fclose(out) != 0 && err.empty() && !wasCancelled) err = ClientError::fromErrno(errno, "close " + dst);

    if (wasCancelled || !err.empty()) {
        std::error_code ec;
        fs::remove(dst, ec);
        if (wasCancelled) return strategy::cancelled("copy " + src);
        return TransferResult::fromClient(err, "copy " + src);
    }
    progress.finish(total);
    return TransferResult::success(dst);
}

TransferResult LocalStrategy::copy(const TransferPath& srcPath,
                                   const TransferPath& dstPath,
                                   bool overwrite,
                                   const ProgressCB& onProgress,
                                   const OperationControl& ctl) {
    const std::string* src = localOf(srcPath);
    const std::string* dst = localOf(dstPath);
    if (!src) return notLocal(srcPath);
    if (!dst) return notLocal(dstPath);

    return strategy::guarded("copy " + *src, [&]() -> TransferResult {
        if (!strategy::localExists(*src))
            return TransferResult::failure(ErrorKind::FileNotFound, "Source not found: " + *src);
        if (sameFile(*src, *dst)) return ontoItself(*src);
        if (!overwrite && strategy::localExists(*dst))
            return TransferResult::failure(ErrorKind::FileExists, "Destination exists: " + *dst);
        ClientError err;
        if (!strategy::ensureLocalParent(*dst, err)) return TransferResult::fromClient(err, "copy " + *src);
        if (strategy::localIsDir(*src)) return copyTree(*src, *dst, overwrite);
        return copyFile(*src, *dst, onProgress, ctl.shouldCancel);
    });
}

TransferResult LocalStrategy::move(const TransferPath& srcPath,
                                   const TransferPath& dstPath,
                                   bool overwrite,
                                   const ProgressCB& onProgress,
                                   const OperationControl& ctl) {
    const std::string* src = localOf(srcPath);
    const std::string* dst = localOf(dstPath);
    if (!src) return notLocal(srcPath);
    if (!dst) return notLocal(dstPath);

    return strategy::guarded("move " + *src, [&]() -> TransferResult {
        if (!strategy::localExists(*src))
            return TransferResult::failure(ErrorKind::FileNotFound, "Source not found: " + *src);
        if (sameFile(*src, *dst)) return ontoItself(*src);
        if (!overwrite && strategy::localExists(*dst))
            return TransferResult::failure(ErrorKind::FileExists, "Destination exists: " + *dst);
        ClientError err;
        if (!strategy::ensureLocalParent(*dst, err)) return TransferResult::fromClient(err, "move " + *src);

        const std::uint64_t size = strategy::localSize(*src);
        std::error_code ec;
        fs::rename(*src, *dst, ec);
        if (!ec) {
            if (onProgress) {
                TransferProgress p;
                p.bytesTransferred = size;
                p.totalBytes = size;
                p.fraction = 1.0;
                onProgress(p);
            }
            return TransferResult::success(*dst);
        }

        LOGI("rename %s -> %s failed (%s), falling back to copy+delete", src->c_str(), dst->c_str(),
             ec.message().c_str());
        TransferResult copied = strategy::localIsDir(*src) ? copyTree(*src, *dst, overwrite)
                                                           : copyFile(*src, *dst, onProgress, ctl.shouldCancel);
        if (!copied) return copied;
        if (!strategy::removeLocal(*src, err)) return TransferResult::fromClient(err, "move " + *src);
        return TransferResult::success(*dst);
    });
}

TransferResult LocalStrategy::remove(const TransferPath& target, bool permanent, const OperationControl&) {
    const std::string* path = localOf(target);
    if (!path) return notLocal(target);

    return strategy::guarded("delete " + *path, [&]() -> TransferResult {
        if (!strategy::localExists(*path))
            return TransferResult::failure(ErrorKind::FileNotFound, "Not found: " + *path);
        if (!permanent && trash_) {
            TrashedFile trashed;
            ClientError err;
            if (trash_->moveToTrash(*path, trashed, err)) return TransferResult::success(trashed.trashPath);
            LOGW("Soft delete of %s failed (%s), deleting permanently", path->c_str(), err.message.c_str());
        }
        ClientError err;
        if (!strategy::removeLocal(*path, err)) return TransferResult::fromClient(err, "delete " + *path);
        return TransferResult::success(*path);
    });
}

bool LocalStrategy::exists(const TransferPath& target, const OperationControl&) {
    const std::string* path = localOf(target);
    return path && strategy::localExists(*path);
}

TransferResult LocalStrategy::rename(const TransferPath& target, const std::string& newName, const OperationControl&) {
    const std::string* path = localOf(target);
    if (!path) return notLocal(target);
    if (!strategy::isValidName(newName)) return strategy::invalidName(newName);

    return strategy::guarded("rename " + *path, [&]() -> TransferResult {
        if (!strategy::localExists(*path))
            return TransferResult::failure(ErrorKind::FileNotFound, "Not found: " + *path);
        const std::string to = (fs::path(*path).parent_path() / newName).string();
        if (strategy::localExists(to)) return TransferResult::failure(ErrorKind::FileExists, "Already exists: " + to);
        std::error_code ec;
        fs::rename(*path, to, ec);
        if (ec) return fromEc(ec, "rename " + *path);
        return TransferResult::success(to);
    });
}

TransferResult LocalStrategy::createDirectory(const TransferPath& target, const OperationControl&) {
    const std::string* path = localOf(target);
    if (!path) return notLocal(target);

    return strategy::guarded("mkdir " + *path, [&]() -> TransferResult {
        if (strategy::localExists(*path)) {
            if (strategy::localIsDir(*path)) return TransferResult::success(*path);
            return TransferResult::failure(ErrorKind::FileExists, "A file with this name exists: " + *path);
        }
        std::error_code ec;
        fs::create_directories(*path, ec);
        if (ec) return fromEc(ec, "mkdir " + *path);
        return TransferResult::success(*path);
    });
}

TransferResult LocalStrategy::getInfo(const TransferPath& target, FileInfo& out, const OperationControl&) {
    const std::string* path = localOf(target);
    if (!path) return notLocal(target);

    struct stat st {};
    if (::stat(path->c_str(), &st) != 0)
        return TransferResult::fromClient(ClientError::fromErrno(errno, "stat " + *path), "info " + *path);
    out = FileInfo{};
    out.name = fs::path(*path).filename().string();
    out.is_dir = S_ISDIR(st.st_mode);
    out.size = out.is_dir ? 0 : (std::uint64_t)st.st_size;
    out.mtime = (std::uint64_t)st.st_mtime;
    out.mode = (std::uint32_t)st.st_mode;
    return TransferResult::success(*path);
}

} // namespace openxfer
