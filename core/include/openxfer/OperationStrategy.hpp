// Uniform operation contract implemented once per backend family. Strategies
// never throw: every failure comes back as a TransferResult.
#pragma once
#include "TransferPath.hpp"
#include "TransferResult.hpp"
#include "TransferTypes.hpp"
#include <string>

namespace openxfer {

class OperationStrategy {
public:
    virtual ~OperationStrategy() = default;

    virtual TransferResult copy(const TransferPath& src,
                                const TransferPath& dst,
                                bool overwrite,
                                const ProgressCB& onProgress,
                                const OperationControl& ctl) = 0;

    virtual TransferResult move(const TransferPath& src,
                                const TransferPath& dst,
                                bool overwrite,
                                const ProgressCB& onProgress,
                                const OperationControl& ctl) = 0;

    // "delete". Backends without a trash ignore `permanent`.
    virtual TransferResult remove(const TransferPath& path, bool permanent, const OperationControl& ctl) = 0;

    // False also when the backend could not be asked; the reason is logged.
    virtual bool exists(const TransferPath& path, const OperationControl& ctl) = 0;

    virtual TransferResult rename(const TransferPath& path, const std::string& newName, const OperationControl& ctl) = 0;

    // Creates missing parents; an existing directory is not an error.
    virtual TransferResult createDirectory(const TransferPath& path, const OperationControl& ctl) = 0;

    virtual TransferResult getInfo(const TransferPath& path, FileInfo& out, const OperationControl& ctl) = 0;
};

} // namespace openxfer
