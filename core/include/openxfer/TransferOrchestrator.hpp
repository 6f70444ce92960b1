// Entry point of the transfer core. Routes each call to the strategy that owns
// the path, or bridges two strategies through a staged local file.
#pragma once
#include "OperationStrategy.hpp"
#include "TempFileManager.hpp"
#include <map>
#include <memory>
#include <string>

namespace openxfer {

class TransferOrchestrator {
public:
    explicit TransferOrchestrator(std::shared_ptr<TempFileManager> staging);

    // Strategy owning paths of `protocol`.
    void setStrategy(Protocol protocol, std::shared_ptr<OperationStrategy> strategy);

    TransferResult copy(const TransferPath& src, const TransferPath& dst, bool overwrite,
                        const ProgressCB& onProgress = {}, const OperationControl& ctl = {});
    TransferResult move(const TransferPath& src, const TransferPath& dst, bool overwrite,
                        const ProgressCB& onProgress = {}, const OperationControl& ctl = {});
    TransferResult remove(const TransferPath& path, bool permanent = false, const OperationControl& ctl = {});
    bool exists(const TransferPath& path, const OperationControl& ctl = {});
    TransferResult rename(const TransferPath& path, const std::string& newName, const OperationControl& ctl = {});
    TransferResult createDirectory(const TransferPath& path, const OperationControl& ctl = {});
    TransferResult getInfo(const TransferPath& path, FileInfo& out, const OperationControl& ctl = {});

    // Same operations on raw path strings; unparsable input is InvalidInput.
    TransferResult copy(const std::string& src, const std::string& dst, bool overwrite,
                        const ProgressCB& onProgress = {}, const OperationControl& ctl = {});
    TransferResult move(const std::string& src, const std::string& dst, bool overwrite,
                        const ProgressCB& onProgress = {}, const OperationControl& ctl = {});
    TransferResult remove(const std::string& path, bool permanent = false, const OperationControl& ctl = {});
    bool exists(const std::string& path, const OperationControl& ctl = {});
    TransferResult rename(const std::string& path, const std::string& newName, const OperationControl& ctl = {});
    TransferResult createDirectory(const std::string& path, const OperationControl& ctl = {});
    TransferResult getInfo(const std::string& path, FileInfo& out, const OperationControl& ctl = {});

private:
    // Either one strategy handles the pair, or `from` and `to` are bridged.
    struct Route {
        OperationStrategy* direct = nullptr;
        OperationStrategy* from = nullptr;
        OperationStrategy* to = nullptr;
    };

    Route route(const TransferPath& src, const TransferPath& dst) const;
    OperationStrategy* strategyFor(Protocol protocol) const;
    OperationStrategy* strategyFor(const TransferPath& p) const { return strategyFor(protocolOf(p)); }
    TransferResult transfer(const TransferPath& src, const TransferPath& dst, bool overwrite, bool deleteSource,
                            const ProgressCB& onProgress, const OperationControl& ctl);
    TransferResult bridge(OperationStrategy& from, OperationStrategy& to,
                          const TransferPath& src, const TransferPath& dst, bool overwrite, bool deleteSource,
                          const ProgressCB& onProgress, const OperationControl& ctl);

    std::shared_ptr<TempFileManager> staging_;
    std::map<Protocol, std::shared_ptr<OperationStrategy>> strategies_;
};

} // namespace openxfer
