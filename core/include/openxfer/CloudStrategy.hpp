// Cloud strategy over one CloudStorageClient per provider. Tokens are restored
// lazily from the CredentialsProvider before each call; every call runs under
// the provider's throttle, keyed by provider and signed-in account.
#pragma once
#include "AdmissionController.hpp"
#include "CloudStorageClient.hpp"
#include "Credentials.hpp"
#include "OperationStrategy.hpp"
#include "TempFileManager.hpp"
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace openxfer {

class CloudStrategy : public OperationStrategy {
public:
    CloudStrategy(std::shared_ptr<AdmissionController> admission,
                  std::shared_ptr<CredentialsProvider> credentials,
                  std::shared_ptr<TempFileManager> staging);

    void registerClient(std::shared_ptr<CloudStorageClient> client);

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
    // Google Drive trashes unless permanent; the other providers delete.
    TransferResult remove(const TransferPath& path, bool permanent, const OperationControl& ctl) override;
    bool exists(const TransferPath& path, const OperationControl& ctl) override;
    TransferResult rename(const TransferPath& path, const std::string& newName, const OperationControl& ctl) override;
    TransferResult createDirectory(const TransferPath& path, const OperationControl& ctl) override;
    TransferResult getInfo(const TransferPath& path, FileInfo& out, const OperationControl& ctl) override;

private:
    // Provider references derived from a CloudPath.
    struct Located {
        CloudProvider provider = CloudProvider::GoogleDrive;
        std::string ref;       // the item itself (id or path)
        std::string parentRef; // folder that holds it
        std::string name;      // last segment, "" for the root
        bool hasParent = false;
        std::string uri;
    };
    using CloudOp = std::function<TransferResult(CloudStorageClient&)>;

    Located locate(const CloudPath& p, const CloudStorageClient& c) const;
    std::shared_ptr<CloudStorageClient> clientFor(CloudProvider provider) const;

    TransferResult run(CloudProvider provider, const OperationControl& ctl, const std::string& what, const CloudOp& op);
    bool ensureAuthenticated(CloudStorageClient& c, ClientError& err) const;

    // Item lookup: by reference first, then by name under the parent.
    static bool findItem(CloudStorageClient& c, const Located& l, CloudFile& out, ClientError& err);
    static bool findChild(CloudStorageClient& c, const std::string& parentRef, const std::string& name,
                          CloudFile& out, ClientError& err);
    static std::string refOf(const CloudStorageClient& c, const CloudFile& f);

    TransferResult download(const CloudPath& src, const std::string& local, bool overwrite,
                            const ProgressCB& onProgress, const OperationControl& ctl);
    TransferResult upload(const std::string& local, const CloudPath& dst, bool overwrite,
                          const ProgressCB& onProgress, const OperationControl& ctl);
    TransferResult sameProviderCopy(const CloudPath& src, const CloudPath& dst, bool overwrite,
                                    const ProgressCB& onProgress, const OperationControl& ctl);
    TransferResult sameProviderMove(const CloudPath& src, const CloudPath& dst, bool overwrite,
                                    const ProgressCB& onProgress, const OperationControl& ctl);
    TransferResult removeItem(const CloudPath& path, bool permanent, const OperationControl& ctl);

    std::shared_ptr<AdmissionController> admission_;
    std::shared_ptr<CredentialsProvider> credentials_;
    std::shared_ptr<TempFileManager> staging_;
    mutable std::mutex mtx_;
    std::map<CloudProvider, std::shared_ptr<CloudStorageClient>> clients_;
};

} // namespace openxfer
