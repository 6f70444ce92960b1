// Google Drive v3 over plain HTTPS. Uploads use the resumable protocol:
// one JSON request opens a session, one PUT streams the file.
#include "openxfer/GoogleDriveClient.hpp"
#include <cstdlib>

namespace openxfer {

namespace {

const char* kApi = "https://www.googleapis.com/drive/v3";
const char* kUpload = "https://www.googleapis.com/upload/drive/v3";
const char* kFields = "id,name,mimeType,size,modifiedTime,parents,trashed";
const char* kFolderMime = "application/vnd.google-apps.folder";

CloudFile fromJson(const Json::Value& v) {
    CloudFile f;
    f.id = v["id"].asString();
    f.name = v["name"].asString();
    f.mimeType = v["mimeType"].asString();
    f.isFolder = f.mimeType == kFolderMime;
    // Drive reports sizes as decimal strings.
    const std::string size = v["size"].asString();
    f.size = size.empty() ? 0 : std::strtoull(size.c_str(), nullptr, 10);
    const Json::Value& parents = v["parents"];
    f.path = (parents.isArray() && !parents.empty()) ? parents[0].asString() + "/" + f.id : f.id;
    return f;
}

// Query-language string literal: backslash and quote escaped.
std::string quoteLiteral(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\\' || c == '\'') out.push_back('\\');
        out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

} // namespace

bool GoogleDriveClient::parseFile(const std::string& body, CloudFile& out, ClientError& err) const {
    Json::Value v;
    if (!parseJson(body, v, err)) return false;
    out = fromJson(v);
    out.modified = parseIsoTime(v["modifiedTime"].asString());
    return true;
}

bool GoogleDriveClient::getFileMetadata(const std::string& ref, CloudFile& out, ClientError& err) {
    HttpRequest req;
    req.url = std::string(kApi) + "/files/" + urlEscape(ref) + "?supportsAllDrives=true&fields=" + kFields;
    HttpResponse resp;
    if (!send(req, resp, "metadata " + ref, err)) {
        if (err.kind == ErrorKind::FileNotFound) err.clear();
        return false;
    }
    Json::Value v;
    if (!parseJson(resp.body, v, err)) return false;
    if (v["trashed"].asBool()) {
        err.clear();
        return false;
    }
    out = fromJson(v);
    out.modified = parseIsoTime(v["modifiedTime"].asString());
    return true;
}

bool GoogleDriveClient::listFiles(const std::string& folderRef, std::vector<CloudFile>& out, ClientError& err) {
    out.clear();
    const std::string q = quoteLiteral(folderRef.empty() ? rootRef() : folderRef) + " in parents and trashed = false";
    std::string pageToken;
    do {
        HttpRequest req;
        req.url = std::string(kApi) + "/files?pageSize=1000&q=" + urlEscape(q) +
                  "&fields=" + urlEscape(std::string("nextPageToken,files(") + kFields + ")");
        if (!pageToken.empty()) req.url += "&pageToken=" + urlEscape(pageToken);
        HttpResponse resp;
        if (!send(req, resp, "list " + folderRef, err)) return false;
        Json::Value v;
        if (!parseJson(resp.body, v, err)) return false;
        for (const auto& f : v["files"]) {
            CloudFile cf = fromJson(f);
            cf.modified = parseIsoTime(f["modifiedTime"].asString());
            out.push_back(cf);
        }
        pageToken = v["nextPageToken"].asString();
    } while (!pageToken.empty());
    return true;
}

bool GoogleDriveClient::findChild(const std::string& name, const std::string& parentRef, CloudFile& out, ClientError& err) {
    const std::string q = "name = " + quoteLiteral(name) + " and " +
                          quoteLiteral(parentRef.empty() ? rootRef() : parentRef) +
                          " in parents and trashed = false";
    HttpRequest req;
    req.url = std::string(kApi) + "/files?pageSize=1&q=" + urlEscape(q) +
              "&fields=" + urlEscape(std::string("files(") + kFields + ")");
    HttpResponse resp;
    if (!send(req, resp, "lookup " + name, err)) return false;
    Json::Value v;
    if (!parseJson(resp.body, v, err)) return false;
    const Json::Value& files = v["files"];
    if (!files.isArray() || files.empty()) {
        err.clear();
        return false;
    }
    out = fromJson(files[0]);
    return true;
}

bool GoogleDriveClient::fileExists(const std::string& name, const std::string& parentRef, ClientError& err) {
    CloudFile f;
    return findChild(name, parentRef, f, err);
}

bool GoogleDriveClient::downloadFile(const std::string& ref,
                                     const std::string& localPath,
                                     ClientError& err,
                                     ByteProgressCB progress,
                                     CancelCB shouldCancel) {
    HttpRequest req;
    req.url = std::string(kApi) + "/files/" + urlEscape(ref) + "?alt=media&supportsAllDrives=true";
    req.downloadTo = localPath;
    req.progress = std::move(progress);
    req.shouldCancel = std::move(shouldCancel);
    HttpResponse resp;
    return send(req, resp, "download " + ref, err);
}

bool GoogleDriveClient::uploadFile(const std::string& localPath,
                                   const std::string& fileName,
                                   const std::string& mimeType,
                                   const std::string& parentRef,
                                   bool overwrite,
                                   CloudFile& out,
                                   ClientError& err,
                                   ByteProgressCB progress,
                                   CancelCB shouldCancel) {
    // Drive allows duplicate names, so conflicts are resolved here.
    CloudFile existing;
    const bool found = findChild(fileName, parentRef, existing, err);
    if (!found && !err.empty()) return false;
    if (found && !overwrite) {
        err.set(ErrorKind::FileExists, "upload " + fileName + ": already exists");
        return false;
    }

    HttpRequest open;
    Json::Value meta;
    if (found) {
        open.method = "PATCH";
        open.url = std::string(kUpload) + "/files/" + urlEscape(existing.id) + "?uploadType=resumable";
        meta = Json::Value(Json::objectValue);
    } else {
        open.method = "POST";
        open.url = std::string(kUpload) + "/files?uploadType=resumable";
        meta["name"] = fileName;
        meta["parents"].append(parentRef.empty() ? rootRef() : parentRef);
    }
    meta["mimeType"] = mimeType;
    open.body = toJson(meta);
    open.headers = {"Content-Type: application/json; charset=UTF-8", "X-Upload-Content-Type: " + mimeType};
    HttpResponse session;
    if (!send(open, session, "upload " + fileName, err)) return false;
    auto loc = session.headers.find("location");
    if (loc == session.headers.end() || loc->second.empty()) {
        err.set(ErrorKind::Unknown, "upload " + fileName + ": no resumable session URL");
        return false;
    }

    HttpRequest put;
    put.method = "PUT";
    put.url = loc->second + "&fields=" + urlEscape(kFields);
    put.uploadFrom = localPath;
    put.headers = {"Content-Type: " + mimeType};
    put.progress = std::move(progress);
    put.shouldCancel = std::move(shouldCancel);
    HttpResponse resp;
    if (!send(put, resp, "upload " + fileName, err)) return false;
    return parseFile(resp.body, out, err);
}

bool GoogleDriveClient::createFolder(const std::string& name, const std::string& parentRef, CloudFile& out, ClientError& err) {
    Json::Value meta;
    meta["name"] = name;
    meta["mimeType"] = kFolderMime;
    meta["parents"].append(parentRef.empty() ? rootRef() : parentRef);
    HttpRequest req;
    req.method = "POST";
    req.url = std::string(kApi) + "/files?fields=" + urlEscape(kFields);
    req.body = toJson(meta);
    req.headers = {"Content-Type: application/json; charset=UTF-8"};
    HttpResponse resp;
    if (!send(req, resp, "create folder " + name, err)) return false;
    return parseFile(resp.body, out, err);
}

bool GoogleDriveClient::deleteFile(const std::string& ref, ClientError& err) {
    HttpRequest req;
    req.method = "DELETE";
    req.url = std::string(kApi) + "/files/" + urlEscape(ref) + "?supportsAllDrives=true";
    HttpResponse resp;
    return send(req, resp, "delete " + ref, err);
}

bool GoogleDriveClient::trashFile(const std::string& ref, ClientError& err) {
    Json::Value meta;
    meta["trashed"] = true;
    HttpRequest req;
    req.method = "PATCH";
    req.url = std::string(kApi) + "/files/" + urlEscape(ref) + "?supportsAllDrives=true";
    req.body = toJson(meta);
    req.headers = {"Content-Type: application/json; charset=UTF-8"};
    HttpResponse resp;
    return send(req, resp, "trash " + ref, err);
}

bool GoogleDriveClient::renameFile(const std::string& ref, const std::string& newName, CloudFile& out, ClientError& err) {
    Json::Value meta;
    meta["name"] = newName;
    HttpRequest req;
    req.method = "PATCH";
    req.url = std::string(kApi) + "/files/" + urlEscape(ref) + "?fields=" + urlEscape(kFields);
    req.body = toJson(meta);
    req.headers = {"Content-Type: application/json; charset=UTF-8"};
    HttpResponse resp;
    if (!send(req, resp, "rename " + ref, err)) return false;
    return parseFile(resp.body, out, err);
}

bool GoogleDriveClient::moveFile(const std::string& ref, const std::string& newParentRef, CloudFile& out, ClientError& err) {
    // Moving replaces the parent set, which has to be read first.
    HttpRequest get;
    get.url = std::string(kApi) + "/files/" + urlEscape(ref) + "?fields=parents";
    HttpResponse current;
    if (!send(get, current, "move " + ref, err)) return false;
    Json::Value v;
    if (!parseJson(current.body, v, err)) return false;
    std::string removeParents;
    for (const auto& p : v["parents"]) {
        if (!removeParents.empty()) removeParents += ",";
        removeParents += p.asString();
    }

    HttpRequest req;
    req.method = "PATCH";
    req.url = std::string(kApi) + "/files/" + urlEscape(ref) +
              "?addParents=" + urlEscape(newParentRef.empty() ? rootRef() : newParentRef) +
              "&removeParents=" + urlEscape(removeParents) +
              "&fields=" + urlEscape(kFields);
    req.body = "{}";
    req.headers = {"Content-Type: application/json; charset=UTF-8"};
    HttpResponse resp;
    if (!send(req, resp, "move " + ref, err)) return false;
    return parseFile(resp.body, out, err);
}

bool GoogleDriveClient::copyFile(const std::string& ref,
                                 const std::string& newParentRef,
                                 const std::string& newName,
                                 CloudFile& out,
                                 ClientError& err) {
    Json::Value meta;
    if (!newName.empty()) meta["name"] = newName;
    meta["parents"].append(newParentRef.empty() ? rootRef() : newParentRef);
    HttpRequest req;
    req.method = "POST";
    req.url = std::string(kApi) + "/files/" + urlEscape(ref) + "/copy?fields=" + urlEscape(kFields);
    req.body = toJson(meta);
    req.headers = {"Content-Type: application/json; charset=UTF-8"};
    HttpResponse resp;
    if (!send(req, resp, "copy " + ref, err)) return false;
    return parseFile(resp.body, out, err);
}

} // namespace openxfer
