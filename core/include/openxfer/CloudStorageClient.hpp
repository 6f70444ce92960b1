// Abstract interface to one cloud storage provider. Items are addressed by a
// provider reference: a file id (Google Drive, OneDrive) or an absolute path
// (Dropbox). Same bool + ClientError convention as RemoteClient.
#pragma once
#include "TransferPath.hpp"
#include "TransferTypes.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace openxfer {

struct CloudFile {
    std::string id;
    std::string name;
    std::string path;      // provider path when it has one, else parent/id
    bool isFolder = false;
    std::uint64_t size = 0;
    std::uint64_t modified = 0; // epoch seconds
    std::string mimeType;
};

class CloudStorageClient {
public:
    virtual ~CloudStorageClient() = default;

    virtual CloudProvider provider() const = 0;

    // Installs an OAuth bearer token. An empty token signs out.
    virtual void setAccessToken(const std::string& token) = 0;
    virtual bool isAuthenticated() const = 0;
    virtual void setTuning(const IoTuning& tuning) = 0;

    // Root folder reference for this provider ("root" or "").
    virtual std::string rootRef() const = 0;

    // Returns false with an empty err when the item does not exist.
    virtual bool getFileMetadata(const std::string& ref, CloudFile& out, ClientError& err) = 0;

    virtual bool listFiles(const std::string& folderRef,
                           std::vector<CloudFile>& out,
                           ClientError& err) = 0;

    virtual bool downloadFile(const std::string& ref,
                              const std::string& localPath,
                              ClientError& err,
                              ByteProgressCB progress = {},
                              CancelCB shouldCancel = {}) = 0;

    // With overwrite, an existing child of the same name gets new content;
    // without it the provider reports a conflict.
    virtual bool uploadFile(const std::string& localPath,
                            const std::string& fileName,
                            const std::string& mimeType,
                            const std::string& parentRef,
                            bool overwrite,
                            CloudFile& out,
                            ClientError& err,
                            ByteProgressCB progress = {},
                            CancelCB shouldCancel = {}) = 0;

    virtual bool createFolder(const std::string& name,
                              const std::string& parentRef,
                              CloudFile& out,
                              ClientError& err) = 0;

    virtual bool deleteFile(const std::string& ref, ClientError& err) = 0;

    // Recoverable delete where the provider has a trash; plain delete otherwise.
    virtual bool trashFile(const std::string& ref, ClientError& err) { return deleteFile(ref, err); }

    virtual bool renameFile(const std::string& ref,
                            const std::string& newName,
                            CloudFile& out,
                            ClientError& err) = 0;

    virtual bool moveFile(const std::string& ref,
                          const std::string& newParentRef,
                          CloudFile& out,
                          ClientError& err) = 0;

    virtual bool copyFile(const std::string& ref,
                          const std::string& newParentRef,
                          const std::string& newName,
                          CloudFile& out,
                          ClientError& err) = 0;

    // Returns false with an empty err when no child of parentRef has that name.
    virtual bool fileExists(const std::string& name,
                            const std::string& parentRef,
                            ClientError& err) = 0;
};

// Content type from the file extension; "application/octet-stream" when unknown.
std::string guessMimeType(const std::string& fileName);

} // namespace openxfer
