#include "openxfer/OneDriveClient.hpp"
#include "openxfer/Log.hpp"
#include <thread>

namespace openxfer {

namespace {

const char* kDrive = "https://graph.microsoft.com/v1.0/me/drive";
const char* kSelect = "id,name,size,lastModifiedDateTime,folder,file,parentReference";
// Monitor polls before a server-side copy is reported as timed out.
constexpr int kMaxCopyPolls = 240;

CloudFile fromItem(const Json::Value& v) {
    CloudFile f;
    f.id = v["id"].asString();
    f.name = v["name"].asString();
    f.isFolder = v.isMember("folder");
    f.size = v["size"].asUInt64();
    f.mimeType = v["file"]["mimeType"].asString();
    const std::string parent = v["parentReference"]["id"].asString();
    f.path = parent.empty() ? f.id : parent + "/" + f.id;
    return f;
}

} // namespace

std::string OneDriveClient::itemUrl(const std::string& ref) const {
    if (ref.empty() || ref == "root") return std::string(kDrive) + "/root";
    return std::string(kDrive) + "/items/" + urlEscape(ref);
}

bool OneDriveClient::parseItem(const std::string& body, CloudFile& out, ClientError& err) const {
    Json::Value v;
    if (!parseJson(body, v, err)) return false;
    out = fromItem(v);
    out.modified = parseIsoTime(v["lastModifiedDateTime"].asString());
    return true;
}

bool OneDriveClient::getFileMetadata(const std::string& ref, CloudFile& out, ClientError& err) {
    HttpRequest req;
    req.url = itemUrl(ref) + "?$select=" + kSelect;
    HttpResponse resp;
    if (!send(req, resp, "metadata " + ref, err)) {
        if (err.kind == ErrorKind::FileNotFound) err.clear();
        return false;
    }
    return parseItem(resp.body, out, err);
}

bool OneDriveClient::listFiles(const std::string& folderRef, std::vector<CloudFile>& out, ClientError& err) {
    out.clear();
    std::string url = itemUrl(folderRef) + "/children?$top=1000&$select=" + kSelect;
    while (!url.empty()) {
        HttpRequest req;
        req.url = url;
        HttpResponse resp;
        if (!send(req, resp, "list " + folderRef, err)) return false;
        Json::Value v;
        if (!parseJson(resp.body, v, err)) return false;
        for (const auto& item : v["value"]) {
            CloudFile f = fromItem(item);
            f.modified = parseIsoTime(item["lastModifiedDateTime"].asString());
            out.push_back(f);
        }
        url = v["@odata.nextLink"].asString();
    }
    return true;
}

bool OneDriveClient::fileExists(const std::string& name, const std::string& parentRef, ClientError& err) {
    HttpRequest req;
    req.url = itemUrl(parentRef) + ":/" + urlEscape(name) + "?$select=id";
    HttpResponse resp;
    if (send(req, resp, "lookup " + name, err)) return true;
    if (err.kind == ErrorKind::FileNotFound) err.clear();
    return false;
}

bool OneDriveClient::downloadFile(const std::string& ref,
                                  const std::string& localPath,
                                  ClientError& err,
                                  ByteProgressCB progress,
                                  CancelCB shouldCancel) {
    HttpRequest req;
    req.url = itemUrl(ref) + "/content";
    req.downloadTo = localPath;
    req.progress = std::move(progress);
    req.shouldCancel = std::move(shouldCancel);
    HttpResponse resp;
    return send(req, resp, "download " + ref, err);
}

// Simple upload; Graph limits it to 250 MB.
bool OneDriveClient::uploadFile(const std::string& localPath,
                                const std::string& fileName,
                                const std::string& mimeType,
                                const std::string& parentRef,
                                bool overwrite,
                                CloudFile& out,
                                ClientError& err,
                                ByteProgressCB progress,
                                CancelCB shouldCancel) {
    HttpRequest req;
    req.method = "PUT";
    req.url = itemUrl(parentRef) + ":/" + urlEscape(fileName) + ":/content?@microsoft.graph.conflictBehavior=" +
              (overwrite ? "replace" : "fail");
    req.uploadFrom = localPath;
    req.headers = {"Content-Type: " + mimeType};
    req.progress = std::move(progress);
    req.shouldCancel = std::move(shouldCancel);
    HttpResponse resp;
    if (!send(req, resp, "upload " + fileName, err)) return false;
    return parseItem(resp.body, out, err);
}

bool OneDriveClient::createFolder(const std::string& name, const std::string& parentRef, CloudFile& out, ClientError& err) {
    Json::Value body;
    body["name"] = name;
    body["folder"] = Json::Value(Json::objectValue);
    body["@microsoft.graph.conflictBehavior"] = "fail";
    HttpRequest req;
    req.method = "POST";
    req.url = itemUrl(parentRef) + "/children";
    req.body = toJson(body);
    req.headers = {"Content-Type: application/json"};
    HttpResponse resp;
    if (!send(req, resp, "create folder " + name, err)) return false;
    return parseItem(resp.body, out, err);
}

bool OneDriveClient::deleteFile(const std::string& ref, ClientError& err) {
    HttpRequest req;
    req.method = "DELETE";
    req.url = itemUrl(ref);
    HttpResponse resp;
    return send(req, resp, "delete " + ref, err);
}

bool OneDriveClient::renameFile(const std::string& ref, const std::string& newName, CloudFile& out, ClientError& err) {
    Json::Value body;
    body["name"] = newName;
    HttpRequest req;
    req.method = "PATCH";
    req.url = itemUrl(ref);
    req.body = toJson(body);
    req.headers = {"Content-Type: application/json"};
    HttpResponse resp;
    if (!send(req, resp, "rename " + ref, err)) return false;
    return parseItem(resp.body, out, err);
}

bool OneDriveClient::folderReference(const std::string& folderRef, Json::Value& out, ClientError& err) {
    HttpRequest req;
    req.url = itemUrl(folderRef) + "?$select=id,parentReference";
    HttpResponse resp;
    if (!send(req, resp, "folder " + folderRef, err)) return false;
    Json::Value v;
    if (!parseJson(resp.body, v, err)) return false;
    out = Json::Value(Json::objectValue);
    out["id"] = v["id"].asString();
    const std::string driveId = v["parentReference"]["driveId"].asString();
    if (!driveId.empty()) out["driveId"] = driveId;
    return true;
}

bool OneDriveClient::moveFile(const std::string& ref, const std::string& newParentRef, CloudFile& out, ClientError& err) {
    // "root" is an alias the PATCH body does not accept; resolve the real id.
    Json::Value parent;
    if (!folderReference(newParentRef, parent, err)) return false;
    Json::Value body;
    body["parentReference"]["id"] = parent["id"];
    HttpRequest req;
    req.method = "PATCH";
    req.url = itemUrl(ref);
    req.body = toJson(body);
    req.headers = {"Content-Type: application/json"};
    HttpResponse resp;
    if (!send(req, resp, "move " + ref, err)) return false;
    return parseItem(resp.body, out, err);
}

bool OneDriveClient::copyFile(const std::string& ref,
                              const std::string& newParentRef,
                              const std::string& newName,
                              CloudFile& out,
                              ClientError& err) {
    Json::Value parent;
    if (!folderReference(newParentRef, parent, err)) return false;
    Json::Value body;
    body["parentReference"] = parent;
    if (!newName.empty()) body["name"] = newName;
    HttpRequest req;
    req.method = "POST";
    req.url = itemUrl(ref) + "/copy";
    req.body = toJson(body);
    req.headers = {"Content-Type: application/json"};
    HttpResponse accepted;
    if (!send(req, accepted, "copy " + ref, err)) return false;
    auto loc = accepted.headers.find("location");
    if (loc == accepted.headers.end() || loc->second.empty()) {
        err.set(ErrorKind::Unknown, "copy " + ref + ": no monitor URL");
        return false;
    }

    // The monitor URL is pre-authenticated and rejects bearer tokens.
    for (int i = 0; i < kMaxCopyPolls; ++i) {
        HttpRequest poll;
        poll.url = loc->second;
        poll.authorize = false;
        HttpResponse status;
        if (!send(poll, status, "copy " + ref, err)) return false;
        Json::Value v;
        if (!parseJson(status.body, v, err)) return false;
        const std::string state = v["status"].asString();
        if (state == "completed") {
            const std::string id = v["resourceId"].asString();
            if (!getFileMetadata(id, out, err)) {
                if (err.empty()) err.set(ErrorKind::Unknown, "copy " + ref + ": copied item not found");
                return false;
            }
            return true;
        }
        if (state == "failed") {
            err.set(ErrorKind::Unknown, "copy " + ref + ": " + v["error"]["message"].asString());
            return false;
        }
        LOGD("copy %s: %s (%.0f%%)", ref.c_str(), state.c_str(), v["percentageComplete"].asDouble());
        std::this_thread::sleep_for(pollInterval_);
    }
    err.set(ErrorKind::NetworkError, "copy " + ref + ": still running on the server", true);
    return false;
}

} // namespace openxfer
