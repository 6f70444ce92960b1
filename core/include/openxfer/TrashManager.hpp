// Soft delete for local files. Items move to <parent>/.trash/<epochMs>_<name>
// and can be restored until the retention period expires.
#pragma once
#include "TransferTypes.hpp"
#include <chrono>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace openxfer {

struct TrashedFile {
    std::string originalPath;
    std::string trashPath;
    std::chrono::system_clock::time_point deletedAt;
};

class TrashManager {
public:
    static constexpr const char* kTrashDirName = ".trash";
    static constexpr std::size_t kMaxHistory = 50;

    explicit TrashManager(std::chrono::milliseconds maxAge = std::chrono::hours(24 * 7));

    bool moveToTrash(const std::string& path, TrashedFile& out, ClientError& err);

    // Restores to the original path, or to <base>_restored[_N]<.ext> when that
    // path is taken.
    bool restoreFromTrash(const TrashedFile& item, std::string& restoredTo, ClientError& err);

    // Newest first.
    std::vector<TrashedFile> recentlyDeleted() const;
    std::optional<TrashedFile> lastDeleted() const;
    void clearUndoHistory();

    // Operations on <root>/.trash.
    int cleanupOldTrash(const std::string& root);
    std::vector<TrashedFile> trashContents(const std::string& root) const;
    int emptyTrash(const std::string& root);

    static std::string trashDirFor(const std::string& path);

private:
    void forget(const std::string& trashPath);

    std::chrono::milliseconds maxAge_;
    mutable std::mutex mtx_;
    std::deque<TrashedFile> history_;
};

} // namespace openxfer
