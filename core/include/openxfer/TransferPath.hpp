// Typed location of a file on one of the supported backends.
// Produced by PathResolver; immutable value objects.
#pragma once
#include "TransferTypes.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace openxfer {

enum class CloudProvider { GoogleDrive, Dropbox, OneDrive };

const char* cloudProviderName(CloudProvider p); // canonical alias, e.g. "dropbox"
std::optional<CloudProvider> cloudProviderFromAlias(const std::string& alias);

struct LocalPath {
    std::string path; // absolute
};

struct SmbPath {
    std::string host;
    std::uint16_t port = 445;
    std::string share;
    std::string remotePath; // "/dir/file" inside the share
};

struct SftpPath {
    std::string host;
    std::uint16_t port = 22;
    std::string user;       // may be empty: taken from credentials
    std::string remotePath; // absolute
};

struct FtpPath {
    std::string host;
    std::uint16_t port = 21;
    std::string remotePath; // absolute
};

struct CloudPath {
    CloudProvider provider = CloudProvider::GoogleDrive;
    std::string idOrPath;   // path after the provider, without leading slash

    std::vector<std::string> segments() const;
};

using TransferPath = std::variant<LocalPath, SmbPath, SftpPath, FtpPath, CloudPath>;

// Helper for exhaustive std::visit with lambdas.
template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

Protocol protocolOf(const TransferPath& p);

// Key of the shared throttling state: "scheme://host:port", "cloud://<provider>"
// or "local".
std::string endpointKey(const TransferPath& p);
// "cloud://<provider>", tagged "#<account>" when the account is known.
std::string cloudEndpointKey(CloudProvider provider, const std::string& account);

// Canonical URI form, e.g. "sftp://user@host:22/dir/file".
std::string toUri(const TransferPath& p);

// Last path segment ("" for roots).
std::string fileName(const TransferPath& p);

// Same location with the last segment replaced (rename target).
TransferPath withFileName(const TransferPath& p, const std::string& name);

// Parent location, or nullopt for roots.
std::optional<TransferPath> parentOf(const TransferPath& p);

// Same endpoint and, for SMB, the same share: server-side rename/copy applies.
bool sameEndpoint(const TransferPath& a, const TransferPath& b);

// Cloud parent locator and item name. With fewer than two segments the parent
// is empty and the name is absent. Dropbox parents are "/"-prefixed paths.
std::pair<std::string, std::optional<std::string>> splitParentAndName(const CloudPath& p);

} // namespace openxfer
