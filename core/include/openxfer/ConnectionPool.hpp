// Per-endpoint pool of connected RemoteClients. New connections are cloned
// from a registered prototype with newConnectionLike(), so the pool works the
// same for libssh2, libcurl, libsmbclient and mock backends.
#pragma once
#include "Credentials.hpp"
#include "RemoteClient.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace openxfer {

class ConnectionPool {
public:
    // Exclusive use of one pooled client. Returned to the pool on destruction
    // unless discard() was called (e.g. after a network error).
    class Lease {
    public:
        Lease() = default;
        Lease(Lease&& other) noexcept;
        Lease& operator=(Lease&& other) noexcept;
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        ~Lease();

        explicit operator bool() const { return client_ != nullptr; }
        RemoteClient* operator->() const { return client_.get(); }
        RemoteClient& client() const { return *client_; }

        void discard();

    private:
        friend class ConnectionPool;
        Lease(ConnectionPool* pool, std::string key, std::unique_ptr<RemoteClient> client);
        void release();

        ConnectionPool* pool_ = nullptr;
        std::string key_;
        std::unique_ptr<RemoteClient> client_;
    };

    explicit ConnectionPool(std::shared_ptr<CredentialsProvider> credentials,
                            std::size_t maxIdlePerEndpoint = 4);
    ~ConnectionPool();
    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    // Unconnected client used as the factory for `protocol`.
    void registerPrototype(Protocol protocol, std::shared_ptr<RemoteClient> prototype);
    // Whether the protocol's backend can copy on the server. False when no
    // prototype is registered.
    bool supportsServerCopy(Protocol protocol) const;

    // Idle connection for the endpoint, or a new one. An empty lease means
    // failure and err says why.
    Lease acquire(Protocol protocol,
                  const std::string& host,
                  std::uint16_t port,
                  const std::string& user,
                  const IoTuning& tuning,
                  ClientError& err);

    // Credentials lookup with a fallback to {protocol, host, port, user}.
    ConnectionDescriptor describe(Protocol protocol,
                                  const std::string& host,
                                  std::uint16_t port,
                                  const std::string& user) const;

    std::size_t idleCount() const;
    // Disconnects and drops all idle connections.
    void clear();

private:
    void giveBack(const std::string& key, std::unique_ptr<RemoteClient> client);

    std::shared_ptr<CredentialsProvider> credentials_;
    std::size_t maxIdle_;
    mutable std::mutex mtx_;
    std::map<Protocol, std::shared_ptr<RemoteClient>> prototypes_;
    std::map<std::string, std::vector<std::unique_ptr<RemoteClient>>> idle_;
};

} // namespace openxfer
