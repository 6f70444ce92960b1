// RemoteClient implementation for SMB/CIFS using libsmbclient's context API.
// Paths are "/share/dir/file"; the host and port come from the descriptor.
#pragma once
#include "RemoteClient.hpp"
#include <string>

// Forward declaration of the libsmbclient context type
struct _SMBCCTX;

namespace openxfer {

class SmbcClient : public RemoteClient {
public:
    SmbcClient() = default;
    ~SmbcClient() override;

    Protocol protocol() const override { return Protocol::Smb; }

    bool connect(const ConnectionDescriptor& opt, ClientError& err) override;
    void disconnect() override;
    bool isConnected() const override { return connected_; }
    void setTuning(const IoTuning& tuning) override;

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

    // Credentials handed to libsmbclient's auth callback.
    const ConnectionDescriptor& descriptor() const { return opt_; }

private:
    bool connected_ = false;
    _SMBCCTX* ctx_ = nullptr;
    ConnectionDescriptor opt_;
    IoTuning tuning_{};

    std::string url(const std::string& path) const;
    bool requireConnected(ClientError& err) const;
};

} // namespace openxfer
