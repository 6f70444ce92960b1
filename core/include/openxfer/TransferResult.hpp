// Result of a strategy or orchestrator operation: either the final path of the
// affected item or a typed error. Expected failures travel as values.
#pragma once
#include "TransferTypes.hpp"
#include <string>
#include <variant>

namespace openxfer {

struct TransferSuccess {
    std::string finalPath;
};

struct TransferError {
    ErrorKind kind = ErrorKind::Unknown;
    std::string message;
    std::string cause;     // backend diagnostic, kept for logs
    bool timedOut = false; // NetworkError caused by a stall
};

class TransferResult {
public:
    static TransferResult success(std::string finalPath);
    static TransferResult failure(ErrorKind kind,
                                  std::string message,
                                  std::string cause = {},
                                  bool timedOut = false);
    // Wrap a client error; `context` becomes the message, the client text the cause.
    static TransferResult fromClient(const ClientError& err, const std::string& context);

    bool ok() const { return std::holds_alternative<TransferSuccess>(value_); }
    explicit operator bool() const { return ok(); }

    // Precondition: ok()
    const std::string& finalPath() const { return std::get<TransferSuccess>(value_).finalPath; }
    // Precondition: !ok()
    const TransferError& error() const { return std::get<TransferError>(value_); }

    bool is(ErrorKind kind) const { return !ok() && error().kind == kind; }

private:
    explicit TransferResult(std::variant<TransferSuccess, TransferError> v) : value_(std::move(v)) {}
    std::variant<TransferSuccess, TransferError> value_;
};

// User-facing descriptions, one field per line.
std::string describeTransferError(const std::string& name,
                                  const std::string& source,
                                  const std::string& destination,
                                  const TransferResult& result);
std::string describeDeleteError(const std::string& name,
                                const std::string& path,
                                const TransferResult& result);

} // namespace openxfer
