#include "openxfer/ConnectionPool.hpp"
#include "openxfer/MockRemoteClient.hpp"
#include <gtest/gtest.h>

using namespace openxfer;

class ConnectionPoolTest : public ::testing::Test {
protected:
    void SetUp() override {
        creds = std::make_shared<InMemoryCredentials>();
        ConnectionDescriptor d;
        d.protocol = Protocol::Sftp;
        d.host = "h";
        d.port = 22;
        d.username = "stored";
        d.password = std::string("secret");
        creds->add(d);
        proto = std::make_shared<MockRemoteClient>(Protocol::Sftp);
        pool = std::make_shared<ConnectionPool>(creds, 2);
        pool->registerPrototype(Protocol::Sftp, proto);
    }

    std::shared_ptr<InMemoryCredentials> creds;
    std::shared_ptr<MockRemoteClient> proto;
    std::shared_ptr<ConnectionPool> pool;
};

TEST_F(ConnectionPoolTest, ReusesIdleConnections) {
    ClientError err;
    {
        auto lease = pool->acquire(Protocol::Sftp, "h", 22, "", IoTuning{}, err);
        ASSERT_TRUE(lease) << err.message;
        EXPECT_TRUE(lease->isConnected());
    }
    EXPECT_EQ(pool->idleCount(), 1u);
    {
        auto lease = pool->acquire(Protocol::Sftp, "h", 22, "", IoTuning{}, err);
        ASSERT_TRUE(lease);
    }
    EXPECT_EQ(proto->server()->connectCount(), 1);
}

TEST_F(ConnectionPoolTest, DescriptorComesFromCredentials) {
    ClientError err;
    auto lease = pool->acquire(Protocol::Sftp, "h", 22, "", IoTuning{}, err);
    ASSERT_TRUE(lease);
    const auto& d = static_cast<MockRemoteClient&>(lease.client()).lastDescriptor();
    EXPECT_EQ(d.username, "stored");
    ASSERT_TRUE(d.password.has_value());
    EXPECT_EQ(*d.password, "secret");

    const ConnectionDescriptor other = pool->describe(Protocol::Sftp, "h", 22, "alice");
    EXPECT_EQ(other.username, "alice");
    EXPECT_EQ(pool->describe(Protocol::Sftp, "elsewhere", 22, "").username, "");
}

TEST_F(ConnectionPoolTest, DiscardedLeaseIsNotPooled) {
    ClientError err;
    {
        auto lease = pool->acquire(Protocol::Sftp, "h", 22, "", IoTuning{}, err);
        ASSERT_TRUE(lease);
        lease.discard();
    }
    EXPECT_EQ(pool->idleCount(), 0u);
}

TEST_F(ConnectionPoolTest, IdleConnectionsAreCapped) {
    ClientError err;
    {
        auto a = pool->acquire(Protocol::Sftp, "h", 22, "", IoTuning{}, err);
        auto b = pool->acquire(Protocol::Sftp, "h", 22, "", IoTuning{}, err);
        auto c = pool->acquire(Protocol::Sftp, "h", 22, "", IoTuning{}, err);
        ASSERT_TRUE(a && b && c);
    }
    EXPECT_EQ(pool->idleCount(), 2u);
    pool->clear();
    EXPECT_EQ(pool->idleCount(), 0u);
}

TEST_F(ConnectionPoolTest, ConnectFailureReportsError) {
    proto->server()->failNext("connect", ErrorKind::AuthenticationRequired);
    ClientError err;
    auto lease = pool->acquire(Protocol::Sftp, "h", 22, "", IoTuning{}, err);
    EXPECT_FALSE(lease);
    EXPECT_EQ(err.kind, ErrorKind::AuthenticationRequired);
}

TEST_F(ConnectionPoolTest, UnregisteredProtocol) {
    ClientError err;
    auto lease = pool->acquire(Protocol::Ftp, "h", 21, "", IoTuning{}, err);
    EXPECT_FALSE(lease);
    EXPECT_EQ(err.kind, ErrorKind::InvalidOperation);
}

TEST_F(ConnectionPoolTest, TuningIsPushedIntoClients) {
    IoTuning t;
    t.chunkSize = 4096;
    ClientError err;
    auto lease = pool->acquire(Protocol::Sftp, "h", 22, "", t, err);
    ASSERT_TRUE(lease);
    EXPECT_EQ(static_cast<MockRemoteClient&>(lease.client()).tuning().chunkSize, 4096u);
}
