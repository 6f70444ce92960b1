// Simulated remote client for tests and offline runs. Clients created through
// newConnectionLike share one in-memory filesystem, so a pool of mocks behaves
// like several connections to the same server.
#pragma once
#include "RemoteClient.hpp"
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace openxfer {

class MockRemoteClient : public RemoteClient {
public:
    // Server-side state shared by every connection to the mock endpoint.
    class Server {
    public:
        Server();

        void addFile(const std::string& path, const std::string& content);
        void addDir(const std::string& path);
        bool hasFile(const std::string& path) const;
        bool hasDir(const std::string& path) const;
        std::string content(const std::string& path) const;

        // Next `times` calls of `op` ("connect", "get", "put", "stat", "mkdir",
        // "removeFile", "removeDir", "rename", "copyRemote") fail with kind.
        void failNext(const std::string& op, ErrorKind kind, bool timedOut = false, int times = 1);
        void setServerCopy(bool enabled);
        bool serverCopy() const;

        int connectCount() const;
        // Operations seen so far, e.g. "put /a/b.txt".
        std::vector<std::string> operations() const;

    private:
        friend class MockRemoteClient;
        struct Failure {
            std::string op;
            ErrorKind kind;
            bool timedOut;
            int remaining;
        };
        bool takeFailure(const std::string& op, const std::string& path, ClientError& err);
        void record(const std::string& entry);

        mutable std::mutex mtx_;
        std::map<std::string, std::string> files_;
        std::set<std::string> dirs_;
        std::vector<Failure> failures_;
        std::vector<std::string> ops_;
        bool serverCopy_ = false;
        int connects_ = 0;
    };

    explicit MockRemoteClient(Protocol protocol = Protocol::Sftp,
                              std::shared_ptr<Server> server = std::make_shared<Server>());

    std::shared_ptr<Server> server() const { return server_; }
    const ConnectionDescriptor& lastDescriptor() const { return lastOpt_; }
    const IoTuning& tuning() const { return tuning_; }

    Protocol protocol() const override { return protocol_; }
    bool connect(const ConnectionDescriptor& opt, ClientError& err) override;
    void disconnect() override { connected_ = false; }
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

    bool supportsServerCopy() const override { return server_->serverCopy(); }
    bool copyRemote(const std::string& from,
                    const std::string& to,
                    ClientError& err) override;

    std::unique_ptr<RemoteClient> newConnectionLike(const ConnectionDescriptor& opt,
                                                    ClientError& err) override;

private:
    bool requireConnected(ClientError& err) const;

    Protocol protocol_;
    std::shared_ptr<Server> server_;
    bool connected_ = false;
    ConnectionDescriptor lastOpt_{};
    IoTuning tuning_{};
};

} // namespace openxfer
