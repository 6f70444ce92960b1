// Helpers shared by the strategy implementations.
#pragma once
#include "openxfer/TransferResult.hpp"
#include "openxfer/TransferTypes.hpp"
#include <cstdint>
#include <exception>
#include <string>

namespace openxfer {
namespace strategy {

// Non-blank and free of path separators.
bool isValidName(const std::string& name);

TransferResult invalidName(const std::string& name);
TransferResult cancelled(const std::string& what);

// Runs fn() and turns escaping exceptions into results.
template <typename Fn>
TransferResult guarded(const std::string& what, Fn&& fn) {
    try {
        return fn();
    } catch (const CancelledError& ex) {
        return TransferResult::failure(ErrorKind::Cancelled, what + ": cancelled", ex.what());
    } catch (const TimeoutError& ex) {
        return TransferResult::failure(ErrorKind::NetworkError, what + ": timed out", ex.what(), true);
    } catch (const std::exception& ex) {
        return TransferResult::failure(ErrorKind::Unknown, what + ": " + ex.what(), ex.what());
    }
}

// Local filesystem primitives used on the local side of uploads and downloads.
bool localExists(const std::string& path);
bool localIsDir(const std::string& path);
std::uint64_t localSize(const std::string& path);
bool ensureLocalParent(const std::string& path, ClientError& err);
bool removeLocal(const std::string& path, ClientError& err);

} // namespace strategy
} // namespace openxfer
