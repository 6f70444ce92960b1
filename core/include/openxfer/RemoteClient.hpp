// Abstract interface for one connection to a remote file server (SFTP, FTP,
// SMB). Concrete backends (libssh2, libcurl, libsmbclient) follow this API so
// the strategies stay decoupled from them. Instances are not thread-safe;
// concurrency comes from separate connections (see ConnectionPool).
#pragma once
#include "TransferTypes.hpp"
#include <functional>
#include <memory>
#include <string>

namespace openxfer {

class RemoteClient {
public:
    virtual ~RemoteClient() = default;

    virtual Protocol protocol() const = 0;

    // Connect and disconnect
    virtual bool connect(const ConnectionDescriptor& opt, ClientError& err) = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    // Timeout and chunk size for the next operations.
    virtual void setTuning(const IoTuning& tuning) = 0;

    // Download a remote file to local (create/truncate).
    virtual bool get(const std::string& remote,
                     const std::string& local,
                     ClientError& err,
                     ByteProgressCB progress = {},
                     CancelCB shouldCancel = {}) = 0;

    // Upload a local file to remote (create/truncate).
    virtual bool put(const std::string& local,
                     const std::string& remote,
                     ClientError& err,
                     ByteProgressCB progress = {},
                     CancelCB shouldCancel = {}) = 0;

    // Check existence (leave err empty if "does not exist")
    virtual bool exists(const std::string& remote_path,
                        bool& isDir,
                        ClientError& err) = 0;

    // Detailed metadata (stat). Returns true if it exists.
    virtual bool stat(const std::string& remote_path,
                      FileInfo& info,
                      ClientError& err) = 0;

    // Remote file/folder operations
    virtual bool mkdir(const std::string& remote_dir,
                       ClientError& err,
                       unsigned int mode = 0755) = 0;

    virtual bool removeFile(const std::string& remote_path,
                            ClientError& err) = 0;

    virtual bool removeDir(const std::string& remote_dir,
                           ClientError& err) = 0;

    virtual bool rename(const std::string& from,
                        const std::string& to,
                        ClientError& err,
                        bool overwrite = false) = 0;

    // Server-side copy within the same connection, when the protocol has one.
    virtual bool supportsServerCopy() const { return false; }
    virtual bool copyRemote(const std::string& from,
                            const std::string& to,
                            ClientError& err) {
        (void)from; (void)to;
        err.set(ErrorKind::InvalidOperation, "Server-side copy not supported");
        return false;
    }

    // Create a new connection of the same type with the given options.
    virtual std::unique_ptr<RemoteClient> newConnectionLike(const ConnectionDescriptor& opt,
                                                            ClientError& err) = 0;
};

} // namespace openxfer
