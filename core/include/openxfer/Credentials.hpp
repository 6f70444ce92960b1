// Credential lookup consumed by the strategies. Implementations live outside
// the core (e.g. the CLI's SecretStore); the core never persists secrets.
#pragma once
#include "TransferPath.hpp"
#include "TransferTypes.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>

namespace openxfer {

class CredentialsProvider {
public:
    virtual ~CredentialsProvider() = default;

    virtual std::optional<ConnectionDescriptor> lookup(Protocol protocol,
                                                       const std::string& host,
                                                       std::uint16_t port) const = 0;

    // OAuth bearer token for a cloud provider.
    virtual std::optional<std::string> cloudToken(CloudProvider provider) const = 0;

    // Signed-in account for the provider, used to tag its endpoint key.
    virtual std::optional<std::string> cloudAccount(CloudProvider) const { return std::nullopt; }
};

// Map-backed provider, filled programmatically.
class InMemoryCredentials : public CredentialsProvider {
public:
    void add(const ConnectionDescriptor& d);
    void setCloudToken(CloudProvider provider, const std::string& token);
    void removeCloudToken(CloudProvider provider);
    void setCloudAccount(CloudProvider provider, const std::string& account);

    std::optional<ConnectionDescriptor> lookup(Protocol protocol,
                                               const std::string& host,
                                               std::uint16_t port) const override;
    std::optional<std::string> cloudToken(CloudProvider provider) const override;
    std::optional<std::string> cloudAccount(CloudProvider provider) const override;

private:
    using Key = std::tuple<Protocol, std::string, std::uint16_t>;
    mutable std::mutex mtx_;
    std::map<Key, ConnectionDescriptor> descriptors_;
    std::map<CloudProvider, std::string> tokens_;
    std::map<CloudProvider, std::string> accounts_;
};

} // namespace openxfer
