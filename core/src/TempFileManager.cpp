#include "openxfer/TempFileManager.hpp"
#include "openxfer/Log.hpp"

#include <cerrno>
#include <cstdio>
#include <filesystem>
#include <random>

namespace fs = std::filesystem;

namespace openxfer {

namespace {

constexpr const char* kTempPrefix = "temp_";
constexpr int kCreateAttempts = 8;

std::string sanitize(const std::string& s) {
    std::string out = s;
    for (char& c : out)
        if (c == '/' || c == '\\' || c == ':') c = '_';
    return out;
}

std::string randomToken() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", (unsigned long long)rng());
    return buf;
}

} // namespace

TempFileManager::TempFileManager(StagingConfig cfg) : cfg_(std::move(cfg)) {
    if (cfg_.directory.empty()) {
        std::error_code ec;
        fs::path base = fs::temp_directory_path(ec);
        if (ec) base = "/tmp";
        dir_ = (base / "openxfer").string();
    } else {
        dir_ = cfg_.directory;
    }
}

TempFileManager::~TempFileManager() {
    cleanupAll();
}

bool TempFileManager::createTempFile(const std::string& prefix,
                                     const std::string& suffix,
                                     std::string& outPath,
                                     ClientError& err) {
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) {
        err.set(ErrorKind::PermissionDenied, "Cannot create staging directory " + dir_ + ": " + ec.message());
        return false;
    }
    for (int attempt = 0; attempt < kCreateAttempts; ++attempt) {
        const std::string path =
            (fs::path(dir_) / (kTempPrefix + randomToken() + "_" + sanitize(prefix) + sanitize(suffix))).string();
        // "x": fail instead of reusing a file another process created.
        FILE* f = std::fopen(path.c_str(), "wbx");
        if (!f) {
            if (errno == EEXIST) continue;
            err = ClientError::fromErrno(errno, "create " + path);
            return false;
        }
        std::fclose(f);
        {
            std::lock_guard<std::mutex> lk(mtx_);
            active_.insert(path);
        }
        outPath = path;
        return true;
    }
    err.set(ErrorKind::Unknown, "Cannot allocate a unique temp file in " + dir_);
    return false;
}

bool TempFileManager::cleanup(const std::string& path) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        active_.erase(path);
    }
    std::error_code ec;
    const bool removed = fs::remove(path, ec);
    if (ec) LOGW("Failed to remove temp file %s: %s", path.c_str(), ec.message().c_str());
    return removed;
}

void TempFileManager::cleanupAll() {
    std::set<std::string> paths;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        paths.swap(active_);
    }
    for (const auto& p : paths) {
        std::error_code ec;
        fs::remove(p, ec);
        if (ec) LOGW("Failed to remove temp file %s: %s", p.c_str(), ec.message().c_str());
    }
}

int TempFileManager::cleanupOlderThan(std::chrono::milliseconds age) {
    std::error_code ec;
    if (!fs::is_directory(dir_, ec)) return 0;
    const auto cutoff = fs::file_time_type::clock::now() - age;
    int removed = 0;
    for (fs::directory_iterator it(dir_, ec), end; !ec && it != end; it.increment(ec)) {
        const std::string name = it->path().filename().string();
        if (name.rfind(kTempPrefix, 0) != 0) continue;
        std::error_code tec;
        const auto mtime = fs::last_write_time(it->path(), tec);
        if (tec || mtime > cutoff) continue;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            active_.erase(it->path().string());
        }
        if (fs::remove(it->path(), tec)) ++removed;
    }
    if (removed > 0) LOGI("Removed %d stale temp files from %s", removed, dir_.c_str());
    return removed;
}

std::size_t TempFileManager::activeCount() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return active_.size();
}

bool TempFileManager::hasAvailableSpace(std::uintmax_t bytes) const {
    std::error_code ec;
    fs::path probe = dir_;
    if (!fs::exists(probe, ec)) probe = probe.parent_path();
    const fs::space_info info = fs::space(probe, ec);
    if (ec) return false;
    return info.available >= bytes;
}

StagedFile::StagedFile(TempFileManager& mgr, const std::string& prefix, const std::string& suffix) : mgr_(mgr) {
    std::string path;
    if (mgr_.createTempFile(prefix, suffix, path, err_)) path_ = path;
}

StagedFile::~StagedFile() {
    if (!path_.empty()) mgr_.cleanup(path_);
}

} // namespace openxfer
