// Shared strategy for SMB, SFTP and FTP. One instance per protocol; each
// operation borrows a pooled RemoteClient and runs under the admission
// controller for the endpoint it touches.
#pragma once
#include "AdmissionController.hpp"
#include "ConnectionPool.hpp"
#include "OperationStrategy.hpp"
#include "TempFileManager.hpp"
#include <functional>
#include <memory>

namespace openxfer {

class RemoteStrategy : public OperationStrategy {
public:
    RemoteStrategy(Protocol protocol,
                   std::shared_ptr<AdmissionController> admission,
                   std::shared_ptr<ConnectionPool> pool,
                   std::shared_ptr<TempFileManager> staging);

    Protocol protocol() const { return protocol_; }

    TransferResult copy(const TransferPath& src,
                        const TransferPath& dst,
                        bool overwrite,
                        const ProgressCB& onProgress,
                        const OperationControl& ctl) override;
    TransferResult move(const TransferPath& src,
                        const TransferPath& dst,
                        bool overwrite,
                        const ProgressCB& onProgress,
                        const OperationControl& ctl) override;
    // Always permanent: remote servers have no trash.
    TransferResult remove(const TransferPath& path, bool permanent, const OperationControl& ctl) override;
    bool exists(const TransferPath& path, const OperationControl& ctl) override;
    TransferResult rename(const TransferPath& path, const std::string& newName, const OperationControl& ctl) override;
    TransferResult createDirectory(const TransferPath& path, const OperationControl& ctl) override;
    TransferResult getInfo(const TransferPath& path, FileInfo& out, const OperationControl& ctl) override;

private:
    // Where a path lives from the client's point of view.
    struct Target {
        std::string host;
        std::uint16_t port = 0;
        std::string user;
        std::string clientPath; // path handed to the RemoteClient
        std::string key;        // EndpointKey
        std::string uri;
    };
    using ClientOp = std::function<TransferResult(RemoteClient&)>;

    bool targetOf(const TransferPath& p, Target& out) const;
    TransferResult notMine(const TransferPath& p) const;
    static bool sameItem(const Target& a, const Target& b);
    static TransferResult copyOntoItself(const Target& t);

    // One throttled unit of work on one pooled connection.
    TransferResult run(const Target& t, const OperationControl& ctl, const std::string& what, const ClientOp& op);

    TransferResult download(const Target& src, const std::string& local, bool overwrite,
                            const ProgressCB& onProgress, const OperationControl& ctl);
    TransferResult upload(const std::string& local, const Target& dst, bool overwrite,
                          const ProgressCB& onProgress, const OperationControl& ctl);
    TransferResult copyBetween(const Target& src, const Target& dst, bool overwrite,
                               const ProgressCB& onProgress, const OperationControl& ctl);
    TransferResult removeTarget(const Target& t, const OperationControl& ctl);

    static bool ensureRemoteDirs(RemoteClient& c, const std::string& dir, ClientError& err);
    static std::string parentPath(const std::string& p);

    Protocol protocol_;
    std::shared_ptr<AdmissionController> admission_;
    std::shared_ptr<ConnectionPool> pool_;
    std::shared_ptr<TempFileManager> staging_;
};

} // namespace openxfer
