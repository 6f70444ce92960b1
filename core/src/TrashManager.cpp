#include "openxfer/TrashManager.hpp"
#include "openxfer/Log.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace fs = std::filesystem;

namespace openxfer {

namespace {

using sys_clock = std::chrono::system_clock;

std::int64_t toEpochMs(sys_clock::time_point t) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

// "<epochMs>_<name>" -> (epochMs, name). False for foreign entries.
bool parseEntry(const std::string& entry, std::int64_t& ms, std::string& name) {
    const auto us = entry.find('_');
    if (us == std::string::npos || us == 0 || us > 18 || us + 1 == entry.size()) return false;
    for (std::size_t i = 0; i < us; ++i)
        if (!std::isdigit((unsigned char)entry[i])) return false;
    ms = std::stoll(entry.substr(0, us));
    name = entry.substr(us + 1);
    return true;
}

ClientError fromEc(const std::error_code& ec, const std::string& what) {
    return ClientError::fromErrno(ec.value(), what);
}

} // namespace

TrashManager::TrashManager(std::chrono::milliseconds maxAge) : maxAge_(maxAge) {}

std::string TrashManager::trashDirFor(const std::string& path) {
    return (fs::path(path).parent_path() / kTrashDirName).string();
}

bool TrashManager::moveToTrash(const std::string& path, TrashedFile& out, ClientError& err) {
    std::error_code ec;
    const fs::path src(path);
    if (!fs::exists(fs::symlink_status(src, ec))) {
        err.set(ErrorKind::FileNotFound, "Not found: " + path);
        return false;
    }
    const fs::path trashDir = trashDirFor(path);
    fs::create_directories(trashDir, ec);
    if (ec) {
        err = fromEc(ec, "create " + trashDir.string());
        return false;
    }

    auto now = sys_clock::now();
    std::int64_t ms = toEpochMs(now);
    fs::path target = trashDir / (std::to_string(ms) + "_" + src.filename().string());
    // Two deletions of the same name within one millisecond.
    while (fs::exists(target, ec)) target = trashDir / (std::to_string(++ms) + "_" + src.filename().string());

    fs::rename(src, target, ec);
    if (ec) {
        err = fromEc(ec, "move to trash " + path);
        return false;
    }

    out.originalPath = path;
    out.trashPath = target.string();
    out.deletedAt = now;
    std::lock_guard<std::mutex> lk(mtx_);
    history_.push_front(out);
    while (history_.size() > kMaxHistory) history_.pop_back();
    return true;
}

bool TrashManager::restoreFromTrash(const TrashedFile& item, std::string& restoredTo, ClientError& err) {
    std::error_code ec;
    if (!fs::exists(fs::symlink_status(item.trashPath, ec))) {
        err.set(ErrorKind::FileNotFound, "No longer in trash: " + item.trashPath);
        forget(item.trashPath);
        return false;
    }

    fs::path target(item.originalPath);
    if (fs::exists(fs::symlink_status(target, ec))) {
        const fs::path dir = target.parent_path();
        const std::string stem = target.stem().string();
        const std::string ext = target.extension().string();
        target = dir / (stem + "_restored" + ext);
        for (int n = 1; fs::exists(fs::symlink_status(target, ec)); ++n)
            target = dir / (stem + "_restored_" + std::to_string(n) + ext);
    }
    fs::create_directories(target.parent_path(), ec);
    ec.clear();
    fs::rename(item.trashPath, target, ec);
    if (ec) {
        err = fromEc(ec, "restore " + item.originalPath);
        return false;
    }
    restoredTo = target.string();
    forget(item.trashPath);
    return true;
}

std::vector<TrashedFile> TrashManager::recentlyDeleted() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return std::vector<TrashedFile>(history_.begin(), history_.end());
}

std::optional<TrashedFile> TrashManager::lastDeleted() const {
    std::lock_guard<std::mutex> lk(mtx_);
    if (history_.empty()) return std::nullopt;
    return history_.front();
}

void TrashManager::clearUndoHistory() {
    std::lock_guard<std::mutex> lk(mtx_);
    history_.clear();
}

void TrashManager::forget(const std::string& trashPath) {
    std::lock_guard<std::mutex> lk(mtx_);
    history_.erase(std::remove_if(history_.begin(), history_.end(),
                                  [&](const TrashedFile& t) { return t.trashPath == trashPath; }),
                   history_.end());
}

int TrashManager::cleanupOldTrash(const std::string& root) {
    const fs::path trashDir = fs::path(root) / kTrashDirName;
    std::error_code ec;
    if (!fs::is_directory(trashDir, ec)) return 0;
    const std::int64_t cutoff = toEpochMs(sys_clock::now()) - maxAge_.count();
    int removed = 0;
    for (fs::directory_iterator it(trashDir, ec), end; !ec && it != end; it.increment(ec)) {
        std::int64_t ms = 0;
        std::string name;
        if (!parseEntry(it->path().filename().string(), ms, name) || ms > cutoff) continue;
        std::error_code rec;
        if (fs::remove_all(it->path(), rec) > 0 && !rec) {
            forget(it->path().string());
            ++removed;
        } else if (rec) {
            LOGW("Cannot purge %s: %s", it->path().c_str(), rec.message().c_str());
        }
    }
    if (removed > 0) LOGI("Purged %d expired trash entries in %s", removed, trashDir.c_str());
    return removed;
}

std::vector<TrashedFile> TrashManager::trashContents(const std::string& root) const {
    std::vector<TrashedFile> out;
    const fs::path trashDir = fs::path(root) / kTrashDirName;
    std::error_code ec;
    if (!fs::is_directory(trashDir, ec)) return out;
    for (fs::directory_iterator it(trashDir, ec), end; !ec && it != end; it.increment(ec)) {
        std::int64_t ms = 0;
        std::string name;
        if (!parseEntry(it->path().filename().string(), ms, name)) continue;
        TrashedFile t;
        t.originalPath = (fs::path(root) / name).string();
        t.trashPath = it->path().string();
        t.deletedAt = sys_clock::time_point(std::chrono::milliseconds(ms));
        out.push_back(t);
    }
    std::sort(out.begin(), out.end(), [](const TrashedFile& a, const TrashedFile& b) { return a.deletedAt > b.deletedAt; });
    return out;
}

int TrashManager::emptyTrash(const std::string& root) {
    const fs::path trashDir = fs::path(root) / kTrashDirName;
    std::error_code ec;
    int removed = 0;
    if (fs::is_directory(trashDir, ec)) {
        for (fs::directory_iterator it(trashDir, ec), end; !ec && it != end; it.increment(ec)) ++removed;
        fs::remove_all(trashDir, ec);
        if (ec) LOGW("Cannot empty %s: %s", trashDir.c_str(), ec.message().c_str());
    }
    clearUndoHistory();
    return removed;
}

} // namespace openxfer
