// RemoteClient implementation using libssh2 for SSH/SFTP.
// Encapsulates the SSH session, SFTP channel, and TCP socket.
#pragma once
#include "RemoteClient.hpp"
#include <string>

// Forward declarations of libssh2 internal types (with leading underscore)
struct _LIBSSH2_SESSION;
struct _LIBSSH2_SFTP;

namespace openxfer {

class Libssh2SftpClient : public RemoteClient {
public:
    Libssh2SftpClient();
    ~Libssh2SftpClient() override;

    Protocol protocol() const override { return Protocol::Sftp; }

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

private:
    bool connected_ = false;
    int  sock_ = -1;
    _LIBSSH2_SESSION* session_ = nullptr;
    _LIBSSH2_SFTP*    sftp_    = nullptr;
    IoTuning tuning_{};

    // TCP connection + SSH handshake and authentication.
    bool tcpConnect(const std::string& host, uint16_t port, ClientError& err);
    bool verifyHostKey(const ConnectionDescriptor& opt, ClientError& err);
    bool authenticate(const ConnectionDescriptor& opt, ClientError& err);
    bool sshHandshakeAuth(const ConnectionDescriptor& opt, ClientError& err);
    bool tryAgentAuth(const std::string& user);
    // Fill err from the session/SFTP error state after a failed call.
    void sftpError(const std::string& what, ClientError& err) const;
    bool requireConnected(ClientError& err) const;
};

} // namespace openxfer
