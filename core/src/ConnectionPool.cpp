#include "openxfer/ConnectionPool.hpp"
#include "openxfer/Log.hpp"

namespace openxfer {

ConnectionPool::Lease::Lease(ConnectionPool* pool, std::string key, std::unique_ptr<RemoteClient> client)
    : pool_(pool), key_(std::move(key)), client_(std::move(client)) {}

ConnectionPool::Lease::Lease(Lease&& other) noexcept
    : pool_(other.pool_), key_(std::move(other.key_)), client_(std::move(other.client_)) {
    other.pool_ = nullptr;
}

ConnectionPool::Lease& ConnectionPool::Lease::operator=(Lease&& other) noexcept {
    if (this != &other) {
        release();
        pool_ = other.pool_;
        key_ = std::move(other.key_);
        client_ = std::move(other.client_);
        other.pool_ = nullptr;
    }
    return *this;
}

ConnectionPool::Lease::~Lease() {
    release();
}

void ConnectionPool::Lease::discard() {
    if (client_) client_->disconnect();
    client_.reset();
}

void ConnectionPool::Lease::release() {
    if (pool_ && client_) pool_->giveBack(key_, std::move(client_));
    client_.reset();
    pool_ = nullptr;
}

ConnectionPool::ConnectionPool(std::shared_ptr<CredentialsProvider> credentials,
                               std::size_t maxIdlePerEndpoint)
    : credentials_(std::move(credentials)), maxIdle_(maxIdlePerEndpoint) {}

ConnectionPool::~ConnectionPool() {
    clear();
}

void ConnectionPool::registerPrototype(Protocol protocol, std::shared_ptr<RemoteClient> prototype) {
    std::lock_guard<std::mutex> lk(mtx_);
    prototypes_[protocol] = std::move(prototype);
}

bool ConnectionPool::supportsServerCopy(Protocol protocol) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = prototypes_.find(protocol);
    return it != prototypes_.end() && it->second->supportsServerCopy();
}

ConnectionDescriptor ConnectionPool::describe(Protocol protocol,
                                              const std::string& host,
                                              std::uint16_t port,
                                              const std::string& user) const {
    ConnectionDescriptor d;
    if (credentials_) {
        if (auto found = credentials_->lookup(protocol, host, port)) d = *found;
    }
    d.protocol = protocol;
    d.host = host;
    d.port = port;
    // A user in the path wins over the stored one.
    if (!user.empty()) d.username = user;
    return d;
}

ConnectionPool::Lease ConnectionPool::acquire(Protocol protocol,
                                              const std::string& host,
                                              std::uint16_t port,
                                              const std::string& user,
                                              const IoTuning& tuning,
                                              ClientError& err) {
    const std::string key = std::string(protocolName(protocol)) + "://" +
                            (user.empty() ? std::string() : user + "@") +
                            host + ":" + std::to_string(port);
    std::shared_ptr<RemoteClient> prototype;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto& idle = idle_[key];
        while (!idle.empty()) {
            std::unique_ptr<RemoteClient> c = std::move(idle.back());
            idle.pop_back();
            if (c && c->isConnected()) {
                c->setTuning(tuning);
                return Lease(this, key, std::move(c));
            }
        }
        auto it = prototypes_.find(protocol);
        if (it != prototypes_.end()) prototype = it->second;
    }
    if (!prototype) {
        err.set(ErrorKind::InvalidOperation, std::string("No client registered for ") + protocolName(protocol));
        return Lease();
    }

    const ConnectionDescriptor d = describe(protocol, host, port, user);
    std::unique_ptr<RemoteClient> c = prototype->newConnectionLike(d, err);
    if (!c) {
        if (err.empty()) err.set(ErrorKind::NetworkError, "Could not connect to " + key);
        LOGW("pool: connect to %s failed: %s", key.c_str(), err.message.c_str());
        return Lease();
    }
    c->setTuning(tuning);
    LOGD("pool: new connection to %s", key.c_str());
    return Lease(this, key, std::move(c));
}

void ConnectionPool::giveBack(const std::string& key, std::unique_ptr<RemoteClient> client) {
    if (!client || !client->isConnected()) return;
    std::lock_guard<std::mutex> lk(mtx_);
    auto& idle = idle_[key];
    if (idle.size() >= maxIdle_) {
        client->disconnect();
        return;
    }
    idle.push_back(std::move(client));
}

std::size_t ConnectionPool::idleCount() const {
    std::lock_guard<std::mutex> lk(mtx_);
    std::size_t n = 0;
    for (const auto& kv : idle_) n += kv.second.size();
    return n;
}

void ConnectionPool::clear() {
    std::lock_guard<std::mutex> lk(mtx_);
    for (auto& kv : idle_) {
        for (auto& c : kv.second) {
            if (c) c->disconnect();
        }
    }
    idle_.clear();
}

} // namespace openxfer
