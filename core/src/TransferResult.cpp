#include "openxfer/TransferResult.hpp"

namespace openxfer {

TransferResult TransferResult::success(std::string finalPath) {
    return TransferResult(TransferSuccess{std::move(finalPath)});
}

TransferResult TransferResult::failure(ErrorKind kind,
                                       std::string message,
                                       std::string cause,
                                       bool timedOut) {
    TransferError e;
    e.kind = kind;
    e.message = std::move(message);
    e.cause = std::move(cause);
    e.timedOut = timedOut && kind == ErrorKind::NetworkError;
    return TransferResult(std::move(e));
}

TransferResult TransferResult::fromClient(const ClientError& err, const std::string& context) {
    if (err.empty()) return failure(ErrorKind::Unknown, context);
    return failure(err.kind, context + ": " + err.message, err.message, err.timedOut);
}

std::string describeTransferError(const std::string& name,
                                  const std::string& source,
                                  const std::string& destination,
                                  const TransferResult& result) {
    std::string out = name;
    out += "\n  From: " + source;
    out += "\n  To: " + destination;
    out += "\n  Error: ";
    out += result.ok() ? std::string("none") : result.error().message;
    return out;
}

std::string describeDeleteError(const std::string& name,
                                const std::string& path,
                                const TransferResult& result) {
    std::string out = name;
    out += "\n  Path: " + path;
    out += "\n  Error: ";
    out += result.ok() ? std::string("none") : result.error().message;
    return out;
}

} // namespace openxfer
