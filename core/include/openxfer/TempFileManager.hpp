// Staging area for bridged transfers. Temp files live in one directory and are
// named temp_<random>_<prefix><suffix>; StagedFile removes its file when it
// goes out of scope.
#pragma once
#include "TransferTypes.hpp"
#include <chrono>
#include <cstdint>
#include <mutex>
#include <set>
#include <string>

namespace openxfer {

struct StagingConfig {
    std::string directory; // empty: <system temp>/openxfer
    std::chrono::milliseconds maxTempAge = std::chrono::hours(24);
};

class TempFileManager {
public:
    explicit TempFileManager(StagingConfig cfg = {});
    ~TempFileManager();
    TempFileManager(const TempFileManager&) = delete;
    TempFileManager& operator=(const TempFileManager&) = delete;

    const std::string& directory() const { return dir_; }

    // Creates an empty, tracked file. `prefix` and `suffix` are sanitized.
    bool createTempFile(const std::string& prefix,
                        const std::string& suffix,
                        std::string& outPath,
                        ClientError& err);

    // Deletes one tracked or stray temp file. False if nothing was removed.
    bool cleanup(const std::string& path);
    void cleanupAll();
    // Removes temp_* files older than `age` (default: the configured max age).
    int cleanupOlderThan(std::chrono::milliseconds age);
    int cleanupOlderThan() { return cleanupOlderThan(cfg_.maxTempAge); }

    std::size_t activeCount() const;
    bool hasAvailableSpace(std::uintmax_t bytes) const;

private:
    StagingConfig cfg_;
    std::string dir_;
    mutable std::mutex mtx_;
    std::set<std::string> active_;
};

// RAII handle on one staged file.
class StagedFile {
public:
    StagedFile(TempFileManager& mgr, const std::string& prefix, const std::string& suffix);
    ~StagedFile();
    StagedFile(const StagedFile&) = delete;
    StagedFile& operator=(const StagedFile&) = delete;

    bool ok() const { return !path_.empty(); }
    const std::string& path() const { return path_; }
    const ClientError& error() const { return err_; }

private:
    TempFileManager& mgr_;
    std::string path_;
    ClientError err_;
};

} // namespace openxfer
