// Dropbox API v2 client. Items are addressed by absolute path ("/dir/file");
// the root folder is "".
#pragma once
#include "RestCloudClient.hpp"

namespace openxfer {

class DropboxClient : public RestCloudClient {
public:
    CloudProvider provider() const override { return CloudProvider::Dropbox; }
    std::string rootRef() const override { return ""; }

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
    bool copyFile(const std::string& ref,
                  const std::string& newParentRef,
                  const std::string& newName,
                  CloudFile& out,
                  ClientError& err) override;
    bool fileExists(const std::string& name, const std::string& parentRef, ClientError& err) override;

protected:
    // 409 replies carry the reason in error_summary ("path/not_found/...").
    void httpError(long status, const std::string& body, const std::string& what, ClientError& err) const override;

private:
    bool rpc(const std::string& endpoint, const Json::Value& arg, Json::Value& out,
             const std::string& what, ClientError& err);
    bool relocate(const std::string& endpoint, const std::string& from, const std::string& to,
                  CloudFile& out, const std::string& what, ClientError& err);
};

} // namespace openxfer
