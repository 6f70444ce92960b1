// RemoteClient implementation for FTP over libcurl.
// One easy handle per client keeps the control connection alive between calls.
#pragma once
#include "RemoteClient.hpp"
#include <string>
#include <vector>

namespace openxfer {

class CurlFtpClient : public RemoteClient {
public:
    CurlFtpClient();
    ~CurlFtpClient() override;

    Protocol protocol() const override { return Protocol::Ftp; }

    bool connect(const ConnectionDescriptor& opt, ClientError& err) override;
    void disconnect() override;
    bool isConnected() const override { return connected_; }
    void setTuning(const IoTuning& tuning) override { tuning_ = tuning; }

    bool get(const std::string& remote,
             const std::string& local,
             ClientError& err,
             ByteProgressCB progress,
             CancelCB shouldCancel) override;

    bool put(const std::string& local,
             const std::string& remote,
             ClientError& err,
             ByteProgressCB progress,
             CancelCB shouldCancel) override;

    bool exists(const std::string& remote_path,
                bool& isDir,
                ClientError& err) override;

    bool stat(const std::string& remote_path,
              FileInfo& info,
              ClientError& err) override;

    bool mkdir(const std::string& remote_dir,
               ClientError& err,
               unsigned int mode = 0755) override;

    bool removeFile(const std::string& remote_path,
                    ClientError& err) override;

    bool removeDir(const std::string& remote_dir,
                   ClientError& err) override;

    bool rename(const std::string& from,
                const std::string& to,
                ClientError& err,
                bool overwrite = false) override;

    std::unique_ptr<RemoteClient> newConnectionLike(const ConnectionDescriptor& opt,
                                                    ClientError& err) override;

private:
    bool connected_ = false;
    void* curl_ = nullptr; // CURL*
    ConnectionDescriptor opt_;
    IoTuning tuning_{};

    // Resets the handle and applies URL, credentials and timeouts.
    bool prepare(const std::string& remotePath, bool asDirectory, ClientError& err);
    // Runs raw FTP commands (MKD, DELE, RMD, RNFR/RNTO) on the control connection.
    bool quote(const std::vector<std::string>& commands, const std::string& what, ClientError& err);
    bool requireConnected(ClientError& err) const;
};

} // namespace openxfer
