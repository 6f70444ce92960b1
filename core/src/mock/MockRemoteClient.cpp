// Mock implementation: a map of file contents plus a set of directories,
// guarded by the shared server's mutex.
#include "openxfer/MockRemoteClient.hpp"
#include <algorithm>
#include <cerrno>
#include <fstream>
#include <sstream>

namespace openxfer {

namespace {

std::string parentDir(const std::string& p) {
    auto pos = p.find_last_of('/');
    if (pos == std::string::npos || pos == 0) return "/";
    return p.substr(0, pos);
}

std::string baseName(const std::string& p) {
    auto pos = p.find_last_of('/');
    return pos == std::string::npos ? p : p.substr(pos + 1);
}

bool isUnder(const std::string& path, const std::string& dir) {
    return path.size() > dir.size() && path.compare(0, dir.size(), dir) == 0 && path[dir.size()] == '/';
}

} // namespace

MockRemoteClient::Server::Server() {
    dirs_.insert("/");
}

void MockRemoteClient::Server::addFile(const std::string& path, const std::string& content) {
    std::lock_guard<std::mutex> lk(mtx_);
    // Implicit parents, like a pre-populated server.
    for (std::string d = parentDir(path); d != "/"; d = parentDir(d)) dirs_.insert(d);
    files_[path] = content;
}

void MockRemoteClient::Server::addDir(const std::string& path) {
    std::lock_guard<std::mutex> lk(mtx_);
    for (std::string d = path; d != "/"; d = parentDir(d)) dirs_.insert(d);
}

bool MockRemoteClient::Server::hasFile(const std::string& path) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return files_.count(path) > 0;
}

bool MockRemoteClient::Server::hasDir(const std::string& path) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return dirs_.count(path) > 0;
}

std::string MockRemoteClient::Server::content(const std::string& path) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = files_.find(path);
    return it == files_.end() ? std::string() : it->second;
}

void MockRemoteClient::Server::failNext(const std::string& op, ErrorKind kind, bool timedOut, int times) {
    std::lock_guard<std::mutex> lk(mtx_);
    failures_.push_back(Failure{op, kind, timedOut, times});
}

void MockRemoteClient::Server::setServerCopy(bool enabled) {
    std::lock_guard<std::mutex> lk(mtx_);
    serverCopy_ = enabled;
}

bool MockRemoteClient::Server::serverCopy() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return serverCopy_;
}

int MockRemoteClient::Server::connectCount() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return connects_;
}

std::vector<std::string> MockRemoteClient::Server::operations() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return ops_;
}

// Caller holds mtx_.
bool MockRemoteClient::Server::takeFailure(const std::string& op, const std::string& path, ClientError& err) {
    for (auto it = failures_.begin(); it != failures_.end(); ++it) {
        if (it->op != op) continue;
        err.set(it->kind, op + " " + path + ": injected " + errorKindName(it->kind) +
                (it->timedOut ? " (timeout)" : ""), it->timedOut);
        if (--it->remaining <= 0) failures_.erase(it);
        return true;
    }
    return false;
}

void MockRemoteClient::Server::record(const std::string& entry) {
    ops_.push_back(entry);
}

MockRemoteClient::MockRemoteClient(Protocol protocol, std::shared_ptr<Server> server)
    : protocol_(protocol), server_(std::move(server)) {}

bool MockRemoteClient::requireConnected(ClientError& err) const {
    if (connected_) return true;
    err.set(ErrorKind::NetworkError, "Not connected");
    return false;
}

bool MockRemoteClient::connect(const ConnectionDescriptor& opt, ClientError& err) {
    if (opt.host.empty()) {
        err.set(ErrorKind::InvalidInput, "Host is required");
        return false;
    }
    std::lock_guard<std::mutex> lk(server_->mtx_);
    if (server_->takeFailure("connect", opt.host, err)) return false;
    ++server_->connects_;
    connected_ = true;
    lastOpt_ = opt;
    return true;
}

bool MockRemoteClient::get(const std::string& remote,
                           const std::string& local,
                           ClientError& err,
                           ByteProgressCB progress,
                           CancelCB shouldCancel) {
    if (!requireConnected(err)) return false;
    std::string data;
    {
        std::lock_guard<std::mutex> lk(server_->mtx_);
        server_->record("get " + remote);
        if (server_->takeFailure("get", remote, err)) return false;
        auto it = server_->files_.find(remote);
        if (it == server_->files_.end()) {
            err.set(ErrorKind::FileNotFound, "get " + remote + ": no such file");
            return false;
        }
        data = it->second;
    }

    std::ofstream out(local, std::ios::binary | std::ios::trunc);
    if (!out) {
        err = ClientError::fromErrno(errno, "open " + local);
        return false;
    }
    const std::size_t chunk = tuning_.chunkSize ? tuning_.chunkSize : 64 * 1024;
    std::size_t done = 0;
    do {
        if (shouldCancel && shouldCancel()) {
            err.set(ErrorKind::Cancelled, "Cancelled by user");
            return false;
        }
        const std::size_t n = std::min(chunk, data.size() - done);
        out.write(data.data() + done, (std::streamsize)n);
        done += n;
        if (progress) progress(done, data.size());
    } while (done < data.size());
    out.close();
    if (!out) {
        err.set(ErrorKind::Unknown, "write " + local + " failed");
        return false;
    }
    return true;
}

bool MockRemoteClient::put(const std::string& local,
                           const std::string& remote,
                           ClientError& err,
                           ByteProgressCB progress,
                           CancelCB shouldCancel) {
    if (!requireConnected(err)) return false;
    std::ifstream in(local, std::ios::binary);
    if (!in) {
        err = ClientError::fromErrno(errno, "open " + local);
        return false;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    const std::string data = ss.str();

    if (shouldCancel && shouldCancel()) {
        err.set(ErrorKind::Cancelled, "Cancelled by user");
        return false;
    }
    std::lock_guard<std::mutex> lk(server_->mtx_);
    server_->record("put " + remote);
    if (server_->takeFailure("put", remote, err)) return false;
    if (!server_->dirs_.count(parentDir(remote))) {
        err.set(ErrorKind::FileNotFound, "put " + remote + ": parent directory missing");
        return false;
    }
    if (server_->dirs_.count(remote)) {
        err.set(ErrorKind::InvalidOperation, "put " + remote + ": is a directory");
        return false;
    }
    server_->files_[remote] = data;
    if (progress) progress(data.size(), data.size());
    return true;
}

bool MockRemoteClient::exists(const std::string& remote_path,
                              bool& isDir,
                              ClientError& err) {
    isDir = false;
    FileInfo info;
    if (!stat(remote_path, info, err)) return false;
    isDir = info.is_dir;
    return true;
}

bool MockRemoteClient::stat(const std::string& remote_path,
                            FileInfo& info,
                            ClientError& err) {
    if (!requireConnected(err)) return false;
    std::lock_guard<std::mutex> lk(server_->mtx_);
    if (server_->takeFailure("stat", remote_path, err)) return false;
    info = FileInfo{};
    info.name = baseName(remote_path);
    if (server_->dirs_.count(remote_path)) {
        info.is_dir = true;
        info.mode = 040755;
        return true;
    }
    auto it = server_->files_.find(remote_path);
    if (it == server_->files_.end()) {
        err.clear();
        return false;
    }
    info.size = it->second.size();
    info.mode = 0100644;
    return true;
}

bool MockRemoteClient::mkdir(const std::string& remote_dir,
                             ClientError& err,
                             unsigned int mode) {
    (void)mode;
    if (!requireConnected(err)) return false;
    std::lock_guard<std::mutex> lk(server_->mtx_);
    server_->record("mkdir " + remote_dir);
    if (server_->takeFailure("mkdir", remote_dir, err)) return false;
    if (server_->dirs_.count(remote_dir) || server_->files_.count(remote_dir)) {
        err.set(ErrorKind::FileExists, "mkdir " + remote_dir + ": already exists");
        return false;
    }
    if (!server_->dirs_.count(parentDir(remote_dir))) {
        err.set(ErrorKind::FileNotFound, "mkdir " + remote_dir + ": parent directory missing");
        return false;
    }
    server_->dirs_.insert(remote_dir);
    return true;
}

bool MockRemoteClient::removeFile(const std::string& remote_path,
                                  ClientError& err) {
    if (!requireConnected(err)) return false;
    std::lock_guard<std::mutex> lk(server_->mtx_);
    server_->record("removeFile " + remote_path);
    if (server_->takeFailure("removeFile", remote_path, err)) return false;
    if (!server_->files_.erase(remote_path)) {
        err.set(ErrorKind::FileNotFound, "unlink " + remote_path + ": no such file");
        return false;
    }
    return true;
}

bool MockRemoteClient::removeDir(const std::string& remote_dir,
                                 ClientError& err) {
    if (!requireConnected(err)) return false;
    std::lock_guard<std::mutex> lk(server_->mtx_);
    server_->record("removeDir " + remote_dir);
    if (server_->takeFailure("removeDir", remote_dir, err)) return false;
    if (!server_->dirs_.count(remote_dir)) {
        err.set(ErrorKind::FileNotFound, "rmdir " + remote_dir + ": no such directory");
        return false;
    }
    for (const auto& f : server_->files_) {
        if (isUnder(f.first, remote_dir)) {
            err.set(ErrorKind::InvalidOperation, "rmdir " + remote_dir + ": directory not empty");
            return false;
        }
    }
    for (const auto& d : server_->dirs_) {
        if (isUnder(d, remote_dir)) {
            err.set(ErrorKind::InvalidOperation, "rmdir " + remote_dir + ": directory not empty");
            return false;
        }
    }
    server_->dirs_.erase(remote_dir);
    return true;
}

bool MockRemoteClient::rename(const std::string& from,
                              const std::string& to,
                              ClientError& err,
                              bool overwrite) {
    if (!requireConnected(err)) return false;
    std::lock_guard<std::mutex> lk(server_->mtx_);
    server_->record("rename " + from + " " + to);
    if (server_->takeFailure("rename", from, err)) return false;
    const bool srcFile = server_->files_.count(from) > 0;
    const bool srcDir = server_->dirs_.count(from) > 0;
    if (!srcFile && !srcDir) {
        err.set(ErrorKind::FileNotFound, "rename " + from + ": no such file");
        return false;
    }
    if (!server_->dirs_.count(parentDir(to))) {
        err.set(ErrorKind::FileNotFound, "rename " + from + " -> " + to + ": target directory missing");
        return false;
    }
    const bool targetExists = server_->files_.count(to) || server_->dirs_.count(to);
    if (targetExists && (!overwrite || srcDir)) {
        err.set(ErrorKind::FileExists, "rename " + from + " -> " + to + ": target exists");
        return false;
    }
    if (srcFile) {
        server_->files_[to] = server_->files_[from];
        server_->files_.erase(from);
        return true;
    }
    // Directory: move the subtree.
    std::map<std::string, std::string> movedFiles;
    for (auto it = server_->files_.begin(); it != server_->files_.end();) {
        if (isUnder(it->first, from)) {
            movedFiles[to + it->first.substr(from.size())] = it->second;
            it = server_->files_.erase(it);
        } else {
            ++it;
        }
    }
    std::set<std::string> movedDirs;
    for (auto it = server_->dirs_.begin(); it != server_->dirs_.end();) {
        if (*it == from || isUnder(*it, from)) {
            movedDirs.insert(to + it->substr(from.size()));
            it = server_->dirs_.erase(it);
        } else {
            ++it;
        }
    }
    server_->files_.insert(movedFiles.begin(), movedFiles.end());
    server_->dirs_.insert(movedDirs.begin(), movedDirs.end());
    return true;
}

bool MockRemoteClient::copyRemote(const std::string& from,
                                  const std::string& to,
                                  ClientError& err) {
    if (!requireConnected(err)) return false;
    if (!server_->serverCopy()) return RemoteClient::copyRemote(from, to, err);
    std::lock_guard<std::mutex> lk(server_->mtx_);
    server_->record("copyRemote " + from + " " + to);
    if (server_->takeFailure("copyRemote", from, err)) return false;
    auto it = server_->files_.find(from);
    if (it == server_->files_.end()) {
        err.set(ErrorKind::FileNotFound, "copy " + from + ": no such file");
        return false;
    }
    if (!server_->dirs_.count(parentDir(to))) {
        err.set(ErrorKind::FileNotFound, "copy " + from + " -> " + to + ": target directory missing");
        return false;
    }
    server_->files_[to] = it->second;
    return true;
}

std::unique_ptr<RemoteClient> MockRemoteClient::newConnectionLike(const ConnectionDescriptor& opt,
                                                                  ClientError& err) {
    auto p = std::make_unique<MockRemoteClient>(protocol_, server_);
    p->setTuning(tuning_);
    if (!p->connect(opt, err)) return nullptr;
    return p;
}

} // namespace openxfer
