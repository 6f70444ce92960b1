// Local filesystem backend. Runs inline (no throttling); deletes go through
// the TrashManager unless permanent.
#pragma once
#include "OperationStrategy.hpp"
#include "TrashManager.hpp"
#include <memory>

namespace openxfer {

class LocalStrategy : public OperationStrategy {
public:
    static constexpr std::size_t kCopyBufferSize = 8 * 1024;

    explicit LocalStrategy(std::shared_ptr<TrashManager> trash);

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
    TransferResult remove(const TransferPath& path, bool permanent, const OperationControl& ctl) override;
    bool exists(const TransferPath& path, const OperationControl& ctl) override;
    TransferResult rename(const TransferPath& path, const std::string& newName, const OperationControl& ctl) override;
    TransferResult createDirectory(const TransferPath& path, const OperationControl& ctl) override;
    TransferResult getInfo(const TransferPath& path, FileInfo& out, const OperationControl& ctl) override;

    // Streams src into dst; removes dst again when cancelled or failed.
    static TransferResult copyFile(const std::string& src,
                                   const std::string& dst,
                                   const ProgressCB& onProgress,
                                   const CancelCB& shouldCancel);

private:
    std::shared_ptr<TrashManager> trash_;
};

} // namespace openxfer
