#include "openxfer/MockCloudClient.hpp"
#include <cerrno>
#include <fstream>
#include <iterator>
#include <sstream>

namespace openxfer {

namespace {

const char* kRootId = "root";

bool readAll(const std::string& path, std::string& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return false;
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return true;
}

} // namespace

MockCloudClient::MockCloudClient(CloudProvider provider) : provider_(provider) {
    Item root;
    root.id = kRootId;
    root.folder = true;
    items_[root.id] = root;
}

std::string MockCloudClient::rootRef() const {
    return provider_ == CloudProvider::Dropbox ? std::string() : std::string(kRootId);
}

void MockCloudClient::setAccessToken(const std::string& token) {
    std::lock_guard<std::mutex> lk(mtx_);
    token_ = token;
    ++tokenUpdates_;
}

bool MockCloudClient::isAuthenticated() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return !token_.empty();
}

void MockCloudClient::setTuning(const IoTuning&) {}

int MockCloudClient::tokenUpdates() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return tokenUpdates_;
}

void MockCloudClient::failNext(const std::string& op, ErrorKind kind, bool timedOut, int times) {
    std::lock_guard<std::mutex> lk(mtx_);
    failures_.push_back(Failure{op, kind, timedOut, times});
}

std::vector<std::string> MockCloudClient::operations() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return ops_;
}

std::size_t MockCloudClient::itemCount() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return items_.size() - 1;
}

bool MockCloudClient::begin(const std::string& op, const std::string& subject, ClientError& err) {
    ops_.push_back(op + " " + subject);
    if (token_.empty()) {
        err.set(ErrorKind::AuthenticationRequired, op + " " + subject + ": not signed in");
        return false;
    }
    for (auto it = failures_.begin(); it != failures_.end(); ++it) {
        if (it->op != op) continue;
        err.set(it->kind, op + " " + subject + ": injected " + errorKindName(it->kind), it->timedOut);
        if (--it->remaining <= 0) failures_.erase(it);
        return false;
    }
    return true;
}

const MockCloudClient::Item* MockCloudClient::child(const std::string& parentId, const std::string& name) const {
    for (const auto& kv : items_) {
        const Item& it = kv.second;
        if (it.parent == parentId && it.name == name && !it.trashed && it.id != kRootId) return &it;
    }
    return nullptr;
}

const MockCloudClient::Item* MockCloudClient::find(const std::string& ref) const {
    if (provider_ == CloudProvider::Dropbox) {
        const Item* cur = &items_.at(kRootId);
        std::istringstream in(ref);
        std::string seg;
        while (std::getline(in, seg, '/')) {
            if (seg.empty()) continue;
            cur = child(cur->id, seg);
            if (!cur) return nullptr;
        }
        return cur;
    }
    auto it = items_.find(ref.empty() ? std::string(kRootId) : ref);
    if (it == items_.end() || it->second.trashed) return nullptr;
    return &it->second;
}

MockCloudClient::Item* MockCloudClient::find(const std::string& ref) {
    return const_cast<Item*>(static_cast<const MockCloudClient*>(this)->find(ref));
}

std::string MockCloudClient::refOf(const Item& it) const {
    if (provider_ != CloudProvider::Dropbox) return it.id;
    std::string path;
    for (const Item* cur = &it; cur->id != kRootId; cur = &items_.at(cur->parent)) path = "/" + cur->name + path;
    return path;
}

CloudFile MockCloudClient::describe(const Item& it) const {
    CloudFile f;
    f.id = it.id;
    f.name = it.name;
    f.path = provider_ == CloudProvider::Dropbox ? refOf(it) : it.parent + "/" + it.id;
    f.isFolder = it.folder;
    f.size = it.content.size();
    f.mimeType = it.mimeType;
    return f;
}

MockCloudClient::Item& MockCloudClient::insert(const std::string& parentId, const std::string& name, bool folder) {
    Item it;
    it.id = (provider_ == CloudProvider::Dropbox ? "id:" : "item") + std::to_string(nextId_++);
    it.name = name;
    it.parent = parentId;
    it.folder = folder;
    if (!folder) it.mimeType = guessMimeType(name);
    return items_[it.id] = it;
}

void MockCloudClient::eraseTree(const std::string& id) {
    std::vector<std::string> children;
    for (const auto& kv : items_)
        if (kv.second.parent == id && kv.first != kRootId) children.push_back(kv.first);
    for (const auto& c : children) eraseTree(c);
    items_.erase(id);
}

void MockCloudClient::copyTree(const Item& from, const std::string& parentId, const std::string& name, Item*& created) {
    Item& copy = insert(parentId, name, from.folder);
    copy.content = from.content;
    copy.mimeType = from.mimeType;
    created = &copy;
    const std::string copyId = copy.id;
    std::vector<Item> children;
    for (const auto& kv : items_)
        if (kv.second.parent == from.id && !kv.second.trashed && kv.first != kRootId) children.push_back(kv.second);
    for (const auto& c : children) {
        Item* ignored = nullptr;
        copyTree(c, copyId, c.name, ignored);
    }
}

std::string MockCloudClient::addFolder(const std::string& parentRef, const std::string& name) {
    std::lock_guard<std::mutex> lk(mtx_);
    const Item* parent = find(parentRef);
    if (!parent || !parent->folder) return {};
    return refOf(insert(parent->id, name, true));
}

std::string MockCloudClient::addFile(const std::string& parentRef, const std::string& name, const std::string& content) {
    std::lock_guard<std::mutex> lk(mtx_);
    const Item* parent = find(parentRef);
    if (!parent || !parent->folder) return {};
    Item& it = insert(parent->id, name, false);
    it.content = content;
    return refOf(it);
}

std::string MockCloudClient::childRef(const std::string& parentRef, const std::string& name) const {
    std::lock_guard<std::mutex> lk(mtx_);
    const Item* parent = find(parentRef);
    const Item* c = parent ? child(parent->id, name) : nullptr;
    return c ? refOf(*c) : std::string();
}

std::string MockCloudClient::content(const std::string& ref) const {
    std::lock_guard<std::mutex> lk(mtx_);
    const Item* it = find(ref);
    return it ? it->content : std::string();
}

bool MockCloudClient::isTrashed(const std::string& ref) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = items_.find(ref);
    return it != items_.end() && it->second.trashed;
}

bool MockCloudClient::getFileMetadata(const std::string& ref, CloudFile& out, ClientError& err) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!begin("metadata", ref, err)) return false;
    const Item* it = find(ref);
    if (!it) return false;
    out = describe(*it);
    return true;
}

bool MockCloudClient::listFiles(const std::string& folderRef, std::vector<CloudFile>& out, ClientError& err) {
    std::lock_guard<std::mutex> lk(mtx_);
    out.clear();
    if (!begin("list", folderRef, err)) return false;
    const Item* dir = find(folderRef);
    if (!dir || !dir->folder) {
        err.set(ErrorKind::FileNotFound, "list " + folderRef + ": no such folder");
        return false;
    }
    for (const auto& kv : items_)
        if (kv.second.parent == dir->id && !kv.second.trashed && kv.first != kRootId) out.push_back(describe(kv.second));
    return true;
}

bool MockCloudClient::downloadFile(const std::string& ref,
                                   const std::string& localPath,
                                   ClientError& err,
                                   ByteProgressCB progress,
                                   CancelCB shouldCancel) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!begin("download", ref, err)) return false;
    const Item* it = find(ref);
    if (!it || it->folder) {
        err.set(ErrorKind::FileNotFound, "download " + ref + ": no such file");
        return false;
    }
    if (shouldCancel && shouldCancel()) {
        err.set(ErrorKind::Cancelled, "download " + ref + ": cancelled");
        return false;
    }
    std::ofstream out(localPath, std::ios::binary | std::ios::trunc);
    if (!out) {
        err = ClientError::fromErrno(errno, "open " + localPath);
        return false;
    }
    out.write(it->content.data(), (std::streamsize)it->content.size());
    out.close();
    if (progress) progress(it->content.size(), it->content.size());
    return true;
}

bool MockCloudClient::uploadFile(const std::string& localPath,
                                 const std::string& fileName,
                                 const std::string& mimeType,
                                 const std::string& parentRef,
                                 bool overwrite,
                                 CloudFile& out,
                                 ClientError& err,
                                 ByteProgressCB progress,
                                 CancelCB shouldCancel) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!begin("upload", fileName, err)) return false;
    const Item* parent = find(parentRef);
    if (!parent || !parent->folder) {
        err.set(ErrorKind::FileNotFound, "upload " + fileName + ": no such folder " + parentRef);
        return false;
    }
    std::string data;
    if (!readAll(localPath, data)) {
        err = ClientError::fromErrno(errno, "open " + localPath);
        return false;
    }
    if (shouldCancel && shouldCancel()) {
        err.set(ErrorKind::Cancelled, "upload " + fileName + ": cancelled");
        return false;
    }
    const Item* existing = child(parent->id, fileName);
    Item* target = nullptr;
    if (existing) {
        if (!overwrite || existing->folder) {
            err.set(ErrorKind::FileExists, "upload " + fileName + ": already exists");
            return false;
        }
        target = &items_[existing->id];
    } else {
        target = &insert(parent->id, fileName, false);
    }
    target->content = data;
    target->mimeType = mimeType;
    if (progress) progress(data.size(), data.size());
    out = describe(*target);
    return true;
}

bool MockCloudClient::createFolder(const std::string& name, const std::string& parentRef, CloudFile& out, ClientError& err) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!begin("createFolder", name, err)) return false;
    const Item* parent = find(parentRef);
    if (!parent || !parent->folder) {
        err.set(ErrorKind::FileNotFound, "create folder " + name + ": no such folder " + parentRef);
        return false;
    }
    if (child(parent->id, name)) {
        err.set(ErrorKind::FileExists, "create folder " + name + ": already exists");
        return false;
    }
    out = describe(insert(parent->id, name, true));
    return true;
}

bool MockCloudClient::deleteFile(const std::string& ref, ClientError& err) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!begin("delete", ref, err)) return false;
    const Item* it = find(ref);
    if (!it || it->id == kRootId) {
        err.set(ErrorKind::FileNotFound, "delete " + ref + ": not found");
        return false;
    }
    eraseTree(it->id);
    return true;
}

bool MockCloudClient::trashFile(const std::string& ref, ClientError& err) {
    // Only Google Drive has a trash.
    if (provider_ != CloudProvider::GoogleDrive) return deleteFile(ref, err);
    std::lock_guard<std::mutex> lk(mtx_);
    if (!begin("trash", ref, err)) return false;
    Item* it = find(ref);
    if (!it || it->id == kRootId) {
        err.set(ErrorKind::FileNotFound, "trash " + ref + ": not found");
        return false;
    }
    it->trashed = true;
    return true;
}

bool MockCloudClient::renameFile(const std::string& ref, const std::string& newName, CloudFile& out, ClientError& err) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!begin("rename", ref, err)) return false;
    Item* it = find(ref);
    if (!it || it->id == kRootId) {
        err.set(ErrorKind::FileNotFound, "rename " + ref + ": not found");
        return false;
    }
    if (child(it->parent, newName)) {
        err.set(ErrorKind::FileExists, "rename " + ref + ": " + newName + " already exists");
        return false;
    }
    it->name = newName;
    out = describe(*it);
    return true;
}

bool MockCloudClient::moveFile(const std::string& ref, const std::string& newParentRef, CloudFile& out, ClientError& err) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!begin("move", ref, err)) return false;
    Item* it = find(ref);
    const Item* parent = find(newParentRef);
    if (!it || it->id == kRootId || !parent || !parent->folder) {
        err.set(ErrorKind::FileNotFound, "move " + ref + ": not found");
        return false;
    }
    if (child(parent->id, it->name)) {
        err.set(ErrorKind::FileExists, "move " + ref + ": target exists");
        return false;
    }
    it->parent = parent->id;
    out = describe(*it);
    return true;
}

bool MockCloudClient::copyFile(const std::string& ref,
                               const std::string& newParentRef,
                               const std::string& newName,
                               CloudFile& out,
                               ClientError& err) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!begin("copy", ref, err)) return false;
    const Item* it = find(ref);
    const Item* parent = find(newParentRef);
    if (!it || it->id == kRootId || !parent || !parent->folder) {
        err.set(ErrorKind::FileNotFound, "copy " + ref + ": not found");
        return false;
    }
    const std::string name = newName.empty() ? it->name : newName;
    if (child(parent->id, name)) {
        err.set(ErrorKind::FileExists, "copy " + ref + ": target exists");
        return false;
    }
    const Item source = *it;
    Item* created = nullptr;
    copyTree(source, parent->id, name, created);
    out = describe(*created);
    return true;
}

bool MockCloudClient::fileExists(const std::string& name, const std::string& parentRef, ClientError& err) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!begin("exists", name, err)) return false;
    const Item* parent = find(parentRef);
    return parent && child(parent->id, name) != nullptr;
}

} // namespace openxfer
