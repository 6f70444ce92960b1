#include "strategy/StrategySupport.hpp"
#include <filesystem>

namespace fs = std::filesystem;

namespace openxfer {
namespace strategy {

bool isValidName(const std::string& name) {
    if (name.find_first_not_of(" \t\r\n") == std::string::npos) return false;
    return name.find('/') == std::string::npos && name.find('\\') == std::string::npos;
}

TransferResult invalidName(const std::string& name) {
    return TransferResult::failure(ErrorKind::InvalidInput, "Invalid name: \"" + name + "\"");
}

TransferResult cancelled(const std::string& what) {
    return TransferResult::failure(ErrorKind::Cancelled, what + ": cancelled");
}

bool localExists(const std::string& path) {
    std::error_code ec;
    return fs::exists(fs::symlink_status(path, ec));
}

bool localIsDir(const std::string& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

std::uint64_t localSize(const std::string& path) {
    std::error_code ec;
    const auto size = fs::file_size(path, ec);
    return ec ? 0 : (std::uint64_t)size;
}

bool ensureLocalParent(const std::string& path, ClientError& err) {
    const fs::path parent = fs::path(path).parent_path();
    if (parent.empty()) return true;
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
        err = ClientError::fromErrno(ec.value(), "create " + parent.string());
        return false;
    }
    return true;
}

bool removeLocal(const std::string& path, ClientError& err) {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        err = ClientError::fromErrno(ec.value(), "delete " + path);
        return false;
    }
    return true;
}

} // namespace strategy
} // namespace openxfer
