// OneDrive client over Microsoft Graph (me/drive). Items are addressed by
// item id; "root" is the drive root.
#pragma once
#include "RestCloudClient.hpp"
#include <chrono>

namespace openxfer {

class OneDriveClient : public RestCloudClient {
public:
    CloudProvider provider() const override { return CloudProvider::OneDrive; }
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
    bool renameFile(const std::string& ref, const std::string& newName, CloudFile& out, ClientError& err) override;
    bool moveFile(const std::string& ref, const std::string& newParentRef, CloudFile& out, ClientError& err) override;
    // Graph copies asynchronously; this waits on the monitor URL.
    bool copyFile(const std::string& ref,
                  const std::string& newParentRef,
                  const std::string& newName,
                  CloudFile& out,
                  ClientError& err) override;
    bool fileExists(const std::string& name, const std::string& parentRef, ClientError& err) override;

    void setCopyPollInterval(std::chrono::milliseconds interval) { pollInterval_ = interval; }

private:
    std::string itemUrl(const std::string& ref) const;
    bool parseItem(const std::string& body, CloudFile& out, ClientError& err) const;
    // {"driveId", "id"} of a folder, as Graph wants it in parentReference.
    bool folderReference(const std::string& folderRef, Json::Value& out, ClientError& err);

    std::chrono::milliseconds pollInterval_{500};
};

} // namespace openxfer
