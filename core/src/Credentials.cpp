#include "openxfer/Credentials.hpp"

namespace openxfer {

void InMemoryCredentials::add(const ConnectionDescriptor& d) {
    std::lock_guard<std::mutex> lk(mtx_);
    descriptors_[Key{d.protocol, d.host, d.port}] = d;
}

void InMemoryCredentials::setCloudToken(CloudProvider provider, const std::string& token) {
    std::lock_guard<std::mutex> lk(mtx_);
    tokens_[provider] = token;
}

void InMemoryCredentials::removeCloudToken(CloudProvider provider) {
    std::lock_guard<std::mutex> lk(mtx_);
    tokens_.erase(provider);
}

void InMemoryCredentials::setCloudAccount(CloudProvider provider, const std::string& account) {
    std::lock_guard<std::mutex> lk(mtx_);
    accounts_[provider] = account;
}

std::optional<ConnectionDescriptor> InMemoryCredentials::lookup(Protocol protocol,
                                                                const std::string& host,
                                                                std::uint16_t port) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = descriptors_.find(Key{protocol, host, port});
    if (it == descriptors_.end()) return std::nullopt;
    return it->second;
}

std::optional<std::string> InMemoryCredentials::cloudToken(CloudProvider provider) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = tokens_.find(provider);
    if (it == tokens_.end() || it->second.empty()) return std::nullopt;
    return it->second;
}

std::optional<std::string> InMemoryCredentials::cloudAccount(CloudProvider provider) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = accounts_.find(provider);
    if (it == accounts_.end() || it->second.empty()) return std::nullopt;
    return it->second;
}

} // namespace openxfer
