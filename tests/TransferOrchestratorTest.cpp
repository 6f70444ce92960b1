#include "openxfer/CloudStrategy.hpp"
#include "openxfer/LocalStrategy.hpp"
#include "openxfer/MockCloudClient.hpp"
#include "openxfer/MockRemoteClient.hpp"
#include "openxfer/RemoteStrategy.hpp"
#include "openxfer/TransferOrchestrator.hpp"
#include "TestUtil.hpp"
#include <gtest/gtest.h>

using namespace openxfer;

class TransferOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto admission = std::make_shared<AdmissionController>();
        auto creds = std::make_shared<InMemoryCredentials>();
        creds->setCloudToken(CloudProvider::Dropbox, "token");
        auto pool = std::make_shared<ConnectionPool>(creds);
        pool->registerPrototype(Protocol::Sftp, std::make_shared<MockRemoteClient>(Protocol::Sftp, sftpServer));
        pool->registerPrototype(Protocol::Ftp, std::make_shared<MockRemoteClient>(Protocol::Ftp, ftpServer));

        auto cloud = std::make_shared<CloudStrategy>(admission, creds, staging);
        cloud->registerClient(dropbox);

        orchestrator.setStrategy(Protocol::Local, std::make_shared<LocalStrategy>(std::make_shared<TrashManager>()));
        orchestrator.setStrategy(Protocol::Sftp, std::make_shared<RemoteStrategy>(Protocol::Sftp, admission, pool, staging));
        orchestrator.setStrategy(Protocol::Ftp, std::make_shared<RemoteStrategy>(Protocol::Ftp, admission, pool, staging));
        orchestrator.setStrategy(Protocol::Cloud, cloud);
    }

    int stagedFiles() const { return test::countFiles(staging->directory()); }

    test::TempDir dir;
    std::shared_ptr<TempFileManager> staging = std::make_shared<TempFileManager>(StagingConfig{dir.file("staging")});
    std::shared_ptr<MockRemoteClient::Server> sftpServer = std::make_shared<MockRemoteClient::Server>();
    std::shared_ptr<MockRemoteClient::Server> ftpServer = std::make_shared<MockRemoteClient::Server>();
    std::shared_ptr<MockCloudClient> dropbox = std::make_shared<MockCloudClient>(CloudProvider::Dropbox);
    TransferOrchestrator orchestrator{staging};
};

TEST_F(TransferOrchestratorTest, MovesFromSftpToCloudThroughStaging) {
    sftpServer->addFile("/a.jpg", "photo");
    dropbox->addFolder("", "folder");
    double last = 0;
    auto r = orchestrator.move("sftp://h/a.jpg", "cloud://dropbox/folder/a.jpg", false,
                               [&](const TransferProgress& p) { last = p.fraction; });
    ASSERT_TRUE(r.ok()) << r.error().message;
    EXPECT_EQ(dropbox->content("/folder/a.jpg"), "photo");
    EXPECT_FALSE(sftpServer->hasFile("/a.jpg"));
    EXPECT_DOUBLE_EQ(last, 1.0);
    EXPECT_EQ(stagedFiles(), 0);
    EXPECT_EQ(staging->activeCount(), 0u);
}

TEST_F(TransferOrchestratorTest, FailedUploadKeepsSourceAndCleansStaging) {
    sftpServer->addFile("/a.jpg", "photo");
    dropbox->addFolder("", "folder");
    dropbox->failNext("upload", ErrorKind::PermissionDenied);
    auto r = orchestrator.move("sftp://h/a.jpg", "cloud://dropbox/folder/a.jpg", false);
    EXPECT_TRUE(r.is(ErrorKind::PermissionDenied));
    EXPECT_TRUE(sftpServer->hasFile("/a.jpg"));
    EXPECT_TRUE(dropbox->childRef("/folder", "a.jpg").empty());
    EXPECT_EQ(stagedFiles(), 0);
}

TEST_F(TransferOrchestratorTest, FailedDownloadCleansStaging) {
    sftpServer->addFile("/a.jpg", "photo");
    sftpServer->failNext("get", ErrorKind::NetworkError);
    auto r = orchestrator.copy("sftp://h/a.jpg", "ftp://f/in/a.jpg", false);
    EXPECT_TRUE(r.is(ErrorKind::NetworkError));
    EXPECT_FALSE(ftpServer->hasFile("/in/a.jpg"));
    EXPECT_EQ(stagedFiles(), 0);
}

TEST_F(TransferOrchestratorTest, BridgesBetweenRemoteProtocols) {
    sftpServer->addFile("/logs/app.log", "log");
    ASSERT_TRUE(orchestrator.copy("sftp://h/logs/app.log", "ftp://f/backup/app.log", false).ok());
    EXPECT_EQ(ftpServer->content("/backup/app.log"), "log");
    EXPECT_TRUE(sftpServer->hasFile("/logs/app.log"));
}

TEST_F(TransferOrchestratorTest, ExistingDestinationIsRefused) {
    sftpServer->addFile("/a.txt", "new");
    dropbox->addFile("", "a.txt", "old");
    auto r = orchestrator.copy("sftp://h/a.txt", "cloud://dropbox/a.txt", false);
    EXPECT_TRUE(r.is(ErrorKind::FileExists));
    EXPECT_EQ(dropbox->content("/a.txt"), "old");
    EXPECT_TRUE(sftpServer->operations().empty());
    EXPECT_EQ(stagedFiles(), 0);

    ASSERT_TRUE(orchestrator.copy("sftp://h/a.txt", "cloud://dropbox/a.txt", true).ok());
    EXPECT_EQ(dropbox->content("/a.txt"), "new");
}

TEST_F(TransferOrchestratorTest, CopyOntoItselfIsRefused) {
    test::writeFile(dir.file("a.jpg"), "jpeg");
    EXPECT_TRUE(orchestrator.copy(dir.file("a.jpg"), dir.file("a.jpg"), true).is(ErrorKind::FileExists));
    EXPECT_EQ(test::readFile(dir.file("a.jpg")), "jpeg");

    sftpServer->addFile("/a.jpg", "jpeg");
    EXPECT_TRUE(orchestrator.move("sftp://h/a.jpg", "sftp://h:22/a.jpg", true).is(ErrorKind::FileExists));
    EXPECT_TRUE(sftpServer->hasFile("/a.jpg"));
    EXPECT_TRUE(sftpServer->operations().empty());
}

TEST_F(TransferOrchestratorTest, LocalOperationsRouteToTheLocalBackend) {
    test::writeFile(dir.file("a.txt"), "a");
    ASSERT_TRUE(orchestrator.copy(dir.file("a.txt"), dir.file("b.txt"), false).ok());
    EXPECT_EQ(test::readFile(dir.file("b.txt")), "a");
    EXPECT_TRUE(orchestrator.exists(dir.file("b.txt")));

    auto r = orchestrator.remove(dir.file("b.txt"));
    ASSERT_TRUE(r.ok());
    EXPECT_FALSE(test::fileExists(dir.file("b.txt")));
    EXPECT_TRUE(test::fileExists(r.finalPath()));

    ASSERT_TRUE(orchestrator.rename(dir.file("a.txt"), "c.txt").ok());
    ASSERT_TRUE(orchestrator.createDirectory(dir.file("new/dir")).ok());
    FileInfo info;
    ASSERT_TRUE(orchestrator.getInfo(dir.file("c.txt"), info).ok());
    EXPECT_EQ(info.size, 1u);
}

TEST_F(TransferOrchestratorTest, UploadsAndDownloadsGoToTheRemoteSide) {
    test::writeFile(dir.file("up.txt"), "up");
    ASSERT_TRUE(orchestrator.move(dir.file("up.txt"), "sftp://h/inbox/up.txt", false).ok());
    EXPECT_EQ(sftpServer->content("/inbox/up.txt"), "up");
    EXPECT_FALSE(test::fileExists(dir.file("up.txt")));

    ASSERT_TRUE(orchestrator.copy("sftp://h/inbox/up.txt", dir.file("down.txt"), false).ok());
    EXPECT_EQ(test::readFile(dir.file("down.txt")), "up");
    EXPECT_EQ(stagedFiles(), 0);
}

TEST_F(TransferOrchestratorTest, RejectsUnparsableAndUnroutablePaths) {
    EXPECT_TRUE(orchestrator.copy("cloud://box/x", dir.file("x"), false).is(ErrorKind::InvalidInput));
    EXPECT_TRUE(orchestrator.remove("smb://host").is(ErrorKind::InvalidInput));
    EXPECT_FALSE(orchestrator.exists(""));
    // No SMB strategy is registered here.
    EXPECT_TRUE(orchestrator.remove("smb://nas/share/f").is(ErrorKind::InvalidOperation));
}
