// Dropbox API v2. RPC endpoints take JSON bodies; content endpoints take their
// argument in the Dropbox-API-Arg header and stream the file as the body.
#include "openxfer/DropboxClient.hpp"
#include <cstdio>

namespace openxfer {

namespace {

const char* kApi = "https://api.dropboxapi.com/2";
const char* kContent = "https://content.dropboxapi.com/2";

std::string join(const std::string& parent, const std::string& name) {
    if (parent.empty() || parent == "/") return "/" + name;
    return parent + "/" + name;
}

std::string baseName(const std::string& p) {
    auto pos = p.find_last_of('/');
    return pos == std::string::npos ? p : p.substr(pos + 1);
}

std::string parentOfPath(const std::string& p) {
    auto pos = p.find_last_of('/');
    if (pos == std::string::npos || pos == 0) return "";
    return p.substr(0, pos);
}

CloudFile fromMetadata(const Json::Value& v, bool folderHint = false) {
    CloudFile f;
    f.id = v["id"].asString();
    f.name = v["name"].asString();
    f.path = v["path_display"].asString();
    f.isFolder = folderHint || v[".tag"].asString() == "folder";
    f.size = v["size"].asUInt64();
    return f;
}

// HTTP headers must stay ASCII: re-encode UTF-8 sequences as \uXXXX escapes.
std::string asciiJson(const std::string& s) {
    std::string out;
    for (std::size_t i = 0; i < s.size();) {
        const unsigned char c = (unsigned char)s[i];
        if (c < 0x80) {
            out.push_back((char)c);
            ++i;
            continue;
        }
        unsigned cp = 0;
        int extra = 0;
        if ((c & 0xE0) == 0xC0) { cp = c & 0x1F; extra = 1; }
        else if ((c & 0xF0) == 0xE0) { cp = c & 0x0F; extra = 2; }
        else { cp = c & 0x07; extra = 3; }
        ++i;
        for (int k = 0; k < extra && i < s.size(); ++k, ++i) cp = (cp << 6) | ((unsigned char)s[i] & 0x3F);
        char buf[16];
        if (cp >= 0x10000) {
            cp -= 0x10000;
            std::snprintf(buf, sizeof(buf), "\\u%04x\\u%04x", 0xD800 + (cp >> 10), 0xDC00 + (cp & 0x3FF));
        } else {
            std::snprintf(buf, sizeof(buf), "\\u%04x", cp);
        }
        out += buf;
    }
    return out;
}

} // namespace

void DropboxClient::httpError(long status, const std::string& body, const std::string& what, ClientError& err) const {
    RestCloudClient::httpError(status, body, what, err);
    if (status != 409) return;
    const std::string& m = err.message;
    if (m.find("not_found") != std::string::npos) err.kind = ErrorKind::FileNotFound;
    else if (m.find("conflict") != std::string::npos) err.kind = ErrorKind::FileExists;
    else if (m.find("insufficient_space") != std::string::npos) err.kind = ErrorKind::StorageFull;
    else if (m.find("no_write_permission") != std::string::npos) err.kind = ErrorKind::PermissionDenied;
    else if (m.find("malformed_path") != std::string::npos || m.find("disallowed_name") != std::string::npos)
        err.kind = ErrorKind::InvalidInput;
    else err.kind = ErrorKind::InvalidOperation;
}

bool DropboxClient::rpc(const std::string& endpoint, const Json::Value& arg, Json::Value& out,
                        const std::string& what, ClientError& err) {
    HttpRequest req;
    req.method = "POST";
    req.url = std::string(kApi) + endpoint;
    req.body = toJson(arg);
    req.headers = {"Content-Type: application/json"};
    HttpResponse resp;
    if (!send(req, resp, what, err)) return false;
    return parseJson(resp.body, out, err);
}

bool DropboxClient::getFileMetadata(const std::string& ref, CloudFile& out, ClientError& err) {
    if (ref.empty() || ref == "/") {
        // The API has no metadata for the root itself.
        out = CloudFile{};
        out.isFolder = true;
        out.path = "/";
        return true;
    }
    Json::Value arg;
    arg["path"] = ref;
    Json::Value v;
    if (!rpc("/files/get_metadata", arg, v, "metadata " + ref, err)) {
        if (err.kind == ErrorKind::FileNotFound) err.clear();
        return false;
    }
    out = fromMetadata(v);
    out.modified = parseIsoTime(v["server_modified"].asString());
    return true;
}

bool DropboxClient::listFiles(const std::string& folderRef, std::vector<CloudFile>& out, ClientError& err) {
    out.clear();
    Json::Value arg;
    arg["path"] = folderRef == "/" ? std::string() : folderRef;
    arg["limit"] = 2000;
    Json::Value v;
    if (!rpc("/files/list_folder", arg, v, "list " + folderRef, err)) return false;
    while (true) {
        for (const auto& e : v["entries"]) {
            CloudFile f = fromMetadata(e);
            f.modified = parseIsoTime(e["server_modified"].asString());
            out.push_back(f);
        }
        if (!v["has_more"].asBool()) break;
        Json::Value next;
        next["cursor"] = v["cursor"].asString();
        if (!rpc("/files/list_folder/continue", next, v, "list " + folderRef, err)) return false;
    }
    return true;
}

bool DropboxClient::fileExists(const std::string& name, const std::string& parentRef, ClientError& err) {
    CloudFile f;
    return getFileMetadata(join(parentRef, name), f, err);
}

bool DropboxClient::downloadFile(const std::string& ref,
                                 const std::string& localPath,
                                 ClientError& err,
                                 ByteProgressCB progress,
                                 CancelCB shouldCancel) {
    Json::Value arg;
    arg["path"] = ref;
    HttpRequest req;
    req.method = "POST";
    req.url = std::string(kContent) + "/files/download";
    // Empty Content-Type: content endpoints reject form encodings.
    req.headers = {"Dropbox-API-Arg: " + asciiJson(toJson(arg)), "Content-Type:"};
    req.downloadTo = localPath;
    req.progress = std::move(progress);
    req.shouldCancel = std::move(shouldCancel);
    HttpResponse resp;
    return send(req, resp, "download " + ref, err);
}

// Single-request upload; Dropbox caps these at 150 MB.
bool DropboxClient::uploadFile(const std::string& localPath,
                               const std::string& fileName,
                               const std::string& mimeType,
                               const std::string& parentRef,
                               bool overwrite,
                               CloudFile& out,
                               ClientError& err,
                               ByteProgressCB progress,
                               CancelCB shouldCancel) {
    (void)mimeType;
    Json::Value arg;
    arg["path"] = join(parentRef, fileName);
    arg["mode"] = overwrite ? "overwrite" : "add";
    arg["autorename"] = false;
    arg["mute"] = true;
    HttpRequest req;
    req.method = "POST";
    req.url = std::string(kContent) + "/files/upload";
    req.headers = {"Dropbox-API-Arg: " + asciiJson(toJson(arg)), "Content-Type: application/octet-stream"};
    req.uploadFrom = localPath;
    req.progress = std::move(progress);
    req.shouldCancel = std::move(shouldCancel);
    HttpResponse resp;
    if (!send(req, resp, "upload " + fileName, err)) return false;
    Json::Value v;
    if (!parseJson(resp.body, v, err)) return false;
    out = fromMetadata(v);
    out.modified = parseIsoTime(v["server_modified"].asString());
    return true;
}

bool DropboxClient::createFolder(const std::string& name, const std::string& parentRef, CloudFile& out, ClientError& err) {
    Json::Value arg;
    arg["path"] = join(parentRef, name);
    arg["autorename"] = false;
    Json::Value v;
    if (!rpc("/files/create_folder_v2", arg, v, "create folder " + name, err)) return false;
    out = fromMetadata(v["metadata"], true);
    return true;
}

bool DropboxClient::deleteFile(const std::string& ref, ClientError& err) {
    Json::Value arg;
    arg["path"] = ref;
    Json::Value v;
    return rpc("/files/delete_v2", arg, v, "delete " + ref, err);
}

bool DropboxClient::relocate(const std::string& endpoint, const std::string& from, const std::string& to,
                             CloudFile& out, const std::string& what, ClientError& err) {
    Json::Value arg;
    arg["from_path"] = from;
    arg["to_path"] = to;
    arg["autorename"] = false;
    Json::Value v;
    if (!rpc(endpoint, arg, v, what, err)) return false;
    const Json::Value& meta = v["metadata"];
    out = fromMetadata(meta);
    out.modified = parseIsoTime(meta["server_modified"].asString());
    return true;
}

bool DropboxClient::renameFile(const std::string& ref, const std::string& newName, CloudFile& out, ClientError& err) {
    return relocate("/files/move_v2", ref, join(parentOfPath(ref), newName), out, "rename " + ref, err);
}

bool DropboxClient::moveFile(const std::string& ref, const std::string& newParentRef, CloudFile& out, ClientError& err) {
    return relocate("/files/move_v2", ref, join(newParentRef, baseName(ref)), out, "move " + ref, err);
}

bool DropboxClient::copyFile(const std::string& ref,
                             const std::string& newParentRef,
                             const std::string& newName,
                             CloudFile& out,
                             ClientError& err) {
    const std::string name = newName.empty() ? baseName(ref) : newName;
    return relocate("/files/copy_v2", ref, join(newParentRef, name), out, "copy " + ref, err);
}

} // namespace openxfer
