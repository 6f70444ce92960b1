// In-memory cloud provider for tests and offline runs. Dropbox mocks address
// items by path, the others by generated ids, matching the real clients.
#pragma once
#include "CloudStorageClient.hpp"
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace openxfer {

class MockCloudClient : public CloudStorageClient {
public:
    explicit MockCloudClient(CloudProvider provider = CloudProvider::GoogleDrive);

    // Test setup. Both return the new item's reference.
    std::string addFolder(const std::string& parentRef, const std::string& name);
    std::string addFile(const std::string& parentRef, const std::string& name, const std::string& content);

    // Reference of the named, non-trashed child, or "" when absent.
    std::string childRef(const std::string& parentRef, const std::string& name) const;
    std::string content(const std::string& ref) const;
    bool isTrashed(const std::string& ref) const;
    std::size_t itemCount() const;

    // Next `times` calls of `op` ("metadata", "list", "download", "upload",
    // "createFolder", "delete", "trash", "rename", "move", "copy", "exists")
    // fail with kind.
    void failNext(const std::string& op, ErrorKind kind, bool timedOut = false, int times = 1);
    // Operations seen so far, e.g. "upload a.jpg".
    std::vector<std::string> operations() const;
    int tokenUpdates() const;

    CloudProvider provider() const override { return provider_; }
    void setAccessToken(const std::string& token) override;
    bool isAuthenticated() const override;
    void setTuning(const IoTuning& tuning) override;
    std::string rootRef() const override;

    bool getFileMetadata(const std::string& ref, CloudFile& out, ClientError& err) override;
    bool listFiles(const std::string& folderRef, std::vector<CloudFile>& out, ClientError& err) override;
    bool downloadFile(const std::string& ref,
                      const std::string& localPath,
                      ClientError& err,
                      ByteProgressCB progress = {},
                      CancelCB shouldCancel = {}) override;
    bool uploadFile(const std::string& localPath,
                    const std::string& fileName,
                    const std::string& mimeType,
                    const std::string& parentRef,
                    bool overwrite,
                    CloudFile& out,
                    ClientError& err,
                    ByteProgressCB progress = {},
                    CancelCB shouldCancel = {}) override;
    bool createFolder(const std::string& name, const std::string& parentRef, CloudFile& out, ClientError& err) override;
    bool deleteFile(const std::string& ref, ClientError& err) override;
    bool trashFile(const std::string& ref, ClientError& err) override;
    bool renameFile(const std::string& ref, const std::string& newName, CloudFile& out, ClientError& err) override;
    bool moveFile(const std::string& ref, const std::string& newParentRef, CloudFile& out, ClientError& err) override;
    bool copyFile(const std::string& ref,
                  const std::string& newParentRef,
                  const std::string& newName,
                  CloudFile& out,
                  ClientError& err) override;
    bool fileExists(const std::string& name, const std::string& parentRef, ClientError& err) override;

private:
    struct Item {
        std::string id;
        std::string name;
        std::string parent; // internal id
        bool folder = false;
        bool trashed = false;
        std::string content;
        std::string mimeType;
    };
    struct Failure {
        std::string op;
        ErrorKind kind;
        bool timedOut;
        int remaining;
    };

    // All private helpers expect mtx_ to be held.
    bool begin(const std::string& op, const std::string& subject, ClientError& err);
    const Item* find(const std::string& ref) const;
    Item* find(const std::string& ref);
    const Item* child(const std::string& parentId, const std::string& name) const;
    std::string refOf(const Item& it) const;
    CloudFile describe(const Item& it) const;
    Item& insert(const std::string& parentId, const std::string& name, bool folder);
    void eraseTree(const std::string& id);
    void copyTree(const Item& from, const std::string& parentId, const std::string& name, Item*& created);

    CloudProvider provider_;
    mutable std::mutex mtx_;
    std::map<std::string, Item> items_; // by internal id
    std::vector<Failure> failures_;
    std::vector<std::string> ops_;
    std::string token_;
    int tokenUpdates_ = 0;
    int nextId_ = 1;
};

} // namespace openxfer
