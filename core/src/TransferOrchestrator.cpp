#include "openxfer/TransferOrchestrator.hpp"
#include "openxfer/Log.hpp"
#include "openxfer/PathResolver.hpp"
#include "openxfer/Progress.hpp"

#include <type_traits>

namespace openxfer {

namespace {

TransferResult unparsable(const std::string& raw, const std::string& err) {
    return TransferResult::failure(ErrorKind::InvalidInput, "Invalid path \"" + raw + "\": " + err);
}

} // namespace

TransferOrchestrator::TransferOrchestrator(std::shared_ptr<TempFileManager> staging) : staging_(std::move(staging)) {}

void TransferOrchestrator::setStrategy(Protocol protocol, std::shared_ptr<OperationStrategy> strategy) {
    strategies_[protocol] = std::move(strategy);
}

OperationStrategy* TransferOrchestrator::strategyFor(Protocol protocol) const {
    auto it = strategies_.find(protocol);
    return it == strategies_.end() ? nullptr : it->second.get();
}

TransferOrchestrator::Route TransferOrchestrator::route(const TransferPath& src, const TransferPath& dst) const {
    auto direct = [this](const TransferPath& p) { return Route{strategyFor(p), nullptr, nullptr}; };
    return std::visit(
        overloaded{
            [&](const LocalPath&, const LocalPath&) { return direct(src); },
            // Uploads and downloads belong to the remote side.
            [&](const LocalPath&, const auto&) { return direct(dst); },
            [&](const auto&, const LocalPath&) { return direct(src); },
            [&](const auto& s, const auto& d) {
                if constexpr (std::is_same_v<std::decay_t<decltype(s)>, std::decay_t<decltype(d)>>)
                    return direct(src);
                else
                    return Route{nullptr, strategyFor(src), strategyFor(dst)};
            },
        },
        src, dst);
}

TransferResult TransferOrchestrator::transfer(const TransferPath& src,
                                              const TransferPath& dst,
                                              bool overwrite,
                                              bool deleteSource,
                                              const ProgressCB& onProgress,
                                              const OperationControl& ctl) {
    const Route r = route(src, dst);
    OperationStrategy* target = r.direct ? r.direct : r.to;
    if (!target || (!r.direct && !r.from))
        return TransferResult::failure(ErrorKind::InvalidOperation,
                                       "No backend for " + toUri(src) + " -> " + toUri(dst));

    // Backends also catch aliases of the same item (hard links, ids).
    if (toUri(src) == toUri(dst))
        return TransferResult::failure(ErrorKind::FileExists, "Source and destination are the same: " + toUri(src));

    // One pre-check for every backend, before anything is touched.
    if (!overwrite && target->exists(dst, ctl))
        return TransferResult::failure(ErrorKind::FileExists, "Destination exists: " + toUri(dst));

    if (r.direct)
        return deleteSource ? r.direct->move(src, dst, overwrite, onProgress, ctl)
                            : r.direct->copy(src, dst, overwrite, onProgress, ctl);
    return bridge(*r.from, *r.to, src, dst, overwrite, deleteSource, onProgress, ctl);
}

TransferResult TransferOrchestrator::bridge(OperationStrategy& from,
                                            OperationStrategy& to,
                                            const TransferPath& src,
                                            const TransferPath& dst,
                                            bool overwrite,
                                            bool deleteSource,
                                            const ProgressCB& onProgress,
                                            const OperationControl& ctl) {
    StagedFile staged(*staging_, "bridge", "_" + fileName(src));
    if (!staged.ok()) return TransferResult::fromClient(staged.error(), "stage " + toUri(src));
    const TransferPath local = LocalPath{staged.path()};
    LOGD("bridge %s -> %s via %s", toUri(src).c_str(), toUri(dst).c_str(), staged.path().c_str());

    TransferResult down = from.copy(src, local, true, sliceProgress(onProgress, 0.0, 0.5), ctl);
    if (!down) return down;
    TransferResult up = to.copy(local, dst, overwrite, sliceProgress(onProgress, 0.5, 1.0), ctl);
    if (!up) return up;

    if (deleteSource) {
        // Only after the upload landed.
        TransferResult removed = from.remove(src, true, ctl);
        if (!removed) {
            const TransferError& e = removed.error();
            return TransferResult::failure(e.kind, "Copied, but could not delete source: " + e.message, e.cause,
                                           e.timedOut);
        }
    }
    return TransferResult::success(toUri(dst));
}

TransferResult TransferOrchestrator::copy(const TransferPath& src, const TransferPath& dst, bool overwrite,
                                          const ProgressCB& onProgress, const OperationControl& ctl) {
    return transfer(src, dst, overwrite, false, onProgress, ctl);
}

TransferResult TransferOrchestrator::move(const TransferPath& src, const TransferPath& dst, bool overwrite,
                                          const ProgressCB& onProgress, const OperationControl& ctl) {
    return transfer(src, dst, overwrite, true, onProgress, ctl);
}

TransferResult TransferOrchestrator::remove(const TransferPath& path, bool permanent, const OperationControl& ctl) {
    OperationStrategy* s = strategyFor(path);
    if (!s) return TransferResult::failure(ErrorKind::InvalidOperation, "No backend for " + toUri(path));
    return s->remove(path, permanent, ctl);
}

bool TransferOrchestrator::exists(const TransferPath& path, const OperationControl& ctl) {
    OperationStrategy* s = strategyFor(path);
    return s && s->exists(path, ctl);
}

TransferResult TransferOrchestrator::rename(const TransferPath& path, const std::string& newName,
                                            const OperationControl& ctl) {
    OperationStrategy* s = strategyFor(path);
    if (!s) return TransferResult::failure(ErrorKind::InvalidOperation, "No backend for " + toUri(path));
    return s->rename(path, newName, ctl);
}

TransferResult TransferOrchestrator::createDirectory(const TransferPath& path, const OperationControl& ctl) {
    OperationStrategy* s = strategyFor(path);
    if (!s) return TransferResult::failure(ErrorKind::InvalidOperation, "No backend for " + toUri(path));
    return s->createDirectory(path, ctl);
}

TransferResult TransferOrchestrator::getInfo(const TransferPath& path, FileInfo& out, const OperationControl& ctl) {
    OperationStrategy* s = strategyFor(path);
    if (!s) return TransferResult::failure(ErrorKind::InvalidOperation, "No backend for " + toUri(path));
    return s->getInfo(path, out, ctl);
}

TransferResult TransferOrchestrator::copy(const std::string& src, const std::string& dst, bool overwrite,
                                          const ProgressCB& onProgress, const OperationControl& ctl) {
    std::string err;
    auto s = PathResolver::resolve(src, err);
    if (!s) return unparsable(src, err);
    auto d = PathResolver::resolve(dst, err);
    if (!d) return unparsable(dst, err);
    return copy(*s, *d, overwrite, onProgress, ctl);
}

TransferResult TransferOrchestrator::move(const std::string& src, const std::string& dst, bool overwrite,
                                          const ProgressCB& onProgress, const OperationControl& ctl) {
    std::string err;
    auto s = PathResolver::resolve(src, err);
    if (!s) return unparsable(src, err);
    auto d = PathResolver::resolve(dst, err);
    if (!d) return unparsable(dst, err);
    return move(*s, *d, overwrite, onProgress, ctl);
}

TransferResult TransferOrchestrator::remove(const std::string& path, bool permanent, const OperationControl& ctl) {
    std::string err;
    auto p = PathResolver::resolve(path, err);
    if (!p) return unparsable(path, err);
    return remove(*p, permanent, ctl);
}

bool TransferOrchestrator::exists(const std::string& path, const OperationControl& ctl) {
    std::string err;
    auto p = PathResolver::resolve(path, err);
    if (!p) {
        LOGW("exists: invalid path \"%s\": %s", path.c_str(), err.c_str());
        return false;
    }
    return exists(*p, ctl);
}

TransferResult TransferOrchestrator::rename(const std::string& path, const std::string& newName,
                                            const OperationControl& ctl) {
    std::string err;
    auto p = PathResolver::resolve(path, err);
    if (!p) return unparsable(path, err);
    return rename(*p, newName, ctl);
}

TransferResult TransferOrchestrator::createDirectory(const std::string& path, const OperationControl& ctl) {
    std::string err;
    auto p = PathResolver::resolve(path, err);
    if (!p) return unparsable(path, err);
    return createDirectory(*p, ctl);
}

TransferResult TransferOrchestrator::getInfo(const std::string& path, FileInfo& out, const OperationControl& ctl) {
    std::string err;
    auto p = PathResolver::resolve(path, err);
    if (!p) return unparsable(path, err);
    return getInfo(*p, out, ctl);
}

} // namespace openxfer
