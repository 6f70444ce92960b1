// Google Drive v3 REST client. Items are addressed by file id; "root" is the
// My Drive root folder.
#pragma once
#include "RestCloudClient.hpp"

namespace openxfer {

class GoogleDriveClient : public RestCloudClient {
public:
    CloudProvider provider() const override { return CloudProvider::GoogleDrive; }
    std::string rootRef() const override { return "root"; }

    bool getFileMetadata(const std::string& ref, CloudFile& out, ClientError& err) override;
    bool listFiles(const std::string& folderRef, std::vector<CloudFile>& out, ClientError& err) override;
    bool downloadFile(const std::string& ref,
                      const std::string& localPath,
                      ClientError& err,
                      ByteProgressCB progress,
                      CancelCB shouldCancel) override;
    bool uploadFile(const std::string& localPath,
                    const std::string& fileName,
                    const std::string& mimeType,
                    const std::string& parentRef,
                    bool overwrite,
                    CloudFile& out,
                    ClientError& err,
                    ByteProgressCB progress,
                    CancelCB shouldCancel) override;
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
    // First non-trashed child of parentRef named `name`.
    bool findChild(const std::string& name, const std::string& parentRef, CloudFile& out, ClientError& err);
    bool parseFile(const std::string& body, CloudFile& out, ClientError& err) const;
};

} // namespace openxfer
