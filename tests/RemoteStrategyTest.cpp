#include "openxfer/MockRemoteClient.hpp"
#include "openxfer/PathResolver.hpp"
#include "openxfer/RemoteStrategy.hpp"
#include "TestUtil.hpp"
#include <gtest/gtest.h>
#include <algorithm>

using namespace openxfer;

namespace {

TransferPath resolved(const std::string& raw) {
    std::string err;
    auto p = PathResolver::resolve(raw, err);
    if (!p) ADD_FAILURE() << raw << ": " << err;
    return p ? *p : TransferPath{LocalPath{}};
}

bool sawOperation(const MockRemoteClient::Server& s, const std::string& prefix) {
    const auto ops = s.operations();
    return std::any_of(ops.begin(), ops.end(), [&](const std::string& op) { return op.rfind(prefix, 0) == 0; });
}

} // namespace

class RemoteStrategyTest : public ::testing::Test {
protected:
    void SetUp() override {
        StagingConfig cfg;
        cfg.directory = dir.file("staging");
        staging = std::make_shared<TempFileManager>(cfg);
        admission = std::make_shared<AdmissionController>();
        pool = std::make_shared<ConnectionPool>(std::make_shared<InMemoryCredentials>());
        pool->registerPrototype(Protocol::Sftp, std::make_shared<MockRemoteClient>(Protocol::Sftp, server));
        pool->registerPrototype(Protocol::Smb, std::make_shared<MockRemoteClient>(Protocol::Smb, server));
        sftp = std::make_unique<RemoteStrategy>(Protocol::Sftp, admission, pool, staging);
        smb = std::make_unique<RemoteStrategy>(Protocol::Smb, admission, pool, staging);
    }

    test::TempDir dir;
    std::shared_ptr<MockRemoteClient::Server> server = std::make_shared<MockRemoteClient::Server>();
    std::shared_ptr<TempFileManager> staging;
    std::shared_ptr<AdmissionController> admission;
    std::shared_ptr<ConnectionPool> pool;
    std::unique_ptr<RemoteStrategy> sftp;
    std::unique_ptr<RemoteStrategy> smb;
    OperationControl ctl;
};

TEST_F(RemoteStrategyTest, UploadCreatesMissingFolders) {
    test::writeFile(dir.file("a.jpg"), "jpeg");
    double last = 0;
    auto r = sftp->copy(LocalPath{dir.file("a.jpg")}, resolved("sftp://h/photos/2024/a.jpg"), false,
                        [&](const TransferProgress& p) { last = p.fraction; }, ctl);
    ASSERT_TRUE(r.ok()) << r.error().message;
    EXPECT_EQ(server->content("/photos/2024/a.jpg"), "jpeg");
    EXPECT_TRUE(server->hasDir("/photos"));
    EXPECT_DOUBLE_EQ(last, 1.0);
    EXPECT_TRUE(test::fileExists(dir.file("a.jpg")));
}

TEST_F(RemoteStrategyTest, UploadRespectsOverwrite) {
    server->addFile("/a.txt", "remote");
    test::writeFile(dir.file("a.txt"), "local");
    auto r = sftp->copy(LocalPath{dir.file("a.txt")}, resolved("sftp://h/a.txt"), false, {}, ctl);
    EXPECT_TRUE(r.is(ErrorKind::FileExists));
    EXPECT_EQ(server->content("/a.txt"), "remote");
    ASSERT_TRUE(sftp->copy(LocalPath{dir.file("a.txt")}, resolved("sftp://h/a.txt"), true, {}, ctl).ok());
    EXPECT_EQ(server->content("/a.txt"), "local");
}

TEST_F(RemoteStrategyTest, DownloadAndMissingSource) {
    server->addFile("/docs/r.pdf", "pdf");
    auto r = sftp->copy(resolved("sftp://h/docs/r.pdf"), LocalPath{dir.file("out/r.pdf")}, false, {}, ctl);
    ASSERT_TRUE(r.ok()) << r.error().message;
    EXPECT_EQ(test::readFile(dir.file("out/r.pdf")), "pdf");

    r = sftp->copy(resolved("sftp://h/docs/none.pdf"), LocalPath{dir.file("none.pdf")}, false, {}, ctl);
    EXPECT_TRUE(r.is(ErrorKind::FileNotFound));
    EXPECT_FALSE(test::fileExists(dir.file("none.pdf")));
}

TEST_F(RemoteStrategyTest, FolderTransferIsRejected) {
    server->addDir("/folder");
    auto r = sftp->copy(resolved("sftp://h/folder"), LocalPath{dir.file("folder")}, false, {}, ctl);
    EXPECT_TRUE(r.is(ErrorKind::InvalidOperation));
}

TEST_F(RemoteStrategyTest, SameServerCopyUsesServerSideCopyWhenAvailable) {
    server->addFile("/a.txt", "data");
    server->setServerCopy(true);
    ASSERT_TRUE(sftp->copy(resolved("sftp://h/a.txt"), resolved("sftp://h/b/a.txt"), false, {}, ctl).ok());
    EXPECT_EQ(server->content("/b/a.txt"), "data");
    EXPECT_TRUE(sawOperation(*server, "copyRemote /a.txt /b/a.txt"));
    EXPECT_FALSE(sawOperation(*server, "get "));
}

TEST_F(RemoteStrategyTest, SameServerCopyStagesWithoutServerCopy) {
    server->addFile("/a.txt", "data");
    ASSERT_TRUE(sftp->copy(resolved("sftp://h/a.txt"), resolved("sftp://h/c.txt"), false, {}, ctl).ok());
    EXPECT_EQ(server->content("/c.txt"), "data");
    EXPECT_TRUE(server->hasFile("/a.txt"));
    EXPECT_TRUE(sawOperation(*server, "get /a.txt"));
    EXPECT_TRUE(sawOperation(*server, "put /c.txt"));
    EXPECT_EQ(staging->activeCount(), 0u);
    EXPECT_EQ(test::countFiles(staging->directory()), 0);
}

TEST_F(RemoteStrategyTest, StagedCopyTakesNoExtraPermit) {
    server->addFile("/a.txt", "data");
    ASSERT_TRUE(sftp->copy(resolved("sftp://h/a.txt"), resolved("sftp://h/c.txt"), true, {}, ctl).ok());
    auto snap = admission->snapshot("sftp://h:22");
    ASSERT_TRUE(snap.has_value());
    // One download and one upload.
    EXPECT_EQ(snap->consecutiveSuccesses, 2);
}

TEST_F(RemoteStrategyTest, CopyOntoItselfKeepsTheFile) {
    server->addFile("/a.jpg", "jpeg");
    for (bool serverCopy : {true, false}) {
        server->setServerCopy(serverCopy);
        EXPECT_TRUE(sftp->copy(resolved("sftp://h/a.jpg"), resolved("sftp://h:22/a.jpg"), true, {}, ctl).is(ErrorKind::FileExists));
        EXPECT_TRUE(sftp->move(resolved("sftp://h/a.jpg"), resolved("sftp://h/a.jpg"), true, {}, ctl).is(ErrorKind::FileExists));
        EXPECT_EQ(server->content("/a.jpg"), "jpeg");
    }
    EXPECT_FALSE(sawOperation(*server, "remove"));
}

TEST_F(RemoteStrategyTest, SameServerMoveRenames) {
    server->addFile("/in/a.txt", "x");
    int updates = 0;
    auto r = sftp->move(resolved("sftp://h/in/a.txt"), resolved("sftp://h/out/a.txt"), false,
                        [&](const TransferProgress&) { ++updates; }, ctl);
    ASSERT_TRUE(r.ok()) << r.error().message;
    EXPECT_FALSE(server->hasFile("/in/a.txt"));
    EXPECT_EQ(server->content("/out/a.txt"), "x");
    EXPECT_TRUE(sawOperation(*server, "rename /in/a.txt /out/a.txt"));
    EXPECT_EQ(updates, 1);
}

TEST_F(RemoteStrategyTest, MoveUploadDeletesLocalSource) {
    test::writeFile(dir.file("up.txt"), "u");
    ASSERT_TRUE(sftp->move(LocalPath{dir.file("up.txt")}, resolved("sftp://h/up.txt"), false, {}, ctl).ok());
    EXPECT_FALSE(test::fileExists(dir.file("up.txt")));
    EXPECT_EQ(server->content("/up.txt"), "u");
}

TEST_F(RemoteStrategyTest, FailedUploadKeepsSource) {
    test::writeFile(dir.file("up.txt"), "u");
    server->failNext("put", ErrorKind::PermissionDenied);
    auto r = sftp->move(LocalPath{dir.file("up.txt")}, resolved("sftp://h/up.txt"), false, {}, ctl);
    EXPECT_TRUE(r.is(ErrorKind::PermissionDenied));
    EXPECT_TRUE(test::fileExists(dir.file("up.txt")));
}

TEST_F(RemoteStrategyTest, RemoveIsPermanent) {
    server->addFile("/old.log", "l");
    ASSERT_TRUE(sftp->remove(resolved("sftp://h/old.log"), false, ctl).ok());
    EXPECT_FALSE(server->hasFile("/old.log"));
    EXPECT_TRUE(sftp->remove(resolved("sftp://h/old.log"), false, ctl).is(ErrorKind::FileNotFound));
}

TEST_F(RemoteStrategyTest, RenameExistsInfoAndMkdir) {
    server->addFile("/d/a.txt", "abc");
    server->addFile("/d/taken.txt", "t");
    auto r = sftp->rename(resolved("sftp://h/d/a.txt"), "b.txt", ctl);
    ASSERT_TRUE(r.ok()) << r.error().message;
    EXPECT_EQ(r.finalPath(), "sftp://h:22/d/b.txt");
    EXPECT_TRUE(sftp->rename(resolved("sftp://h/d/b.txt"), "taken.txt", ctl).is(ErrorKind::FileExists));

    EXPECT_TRUE(sftp->exists(resolved("sftp://h/d/b.txt"), ctl));
    EXPECT_FALSE(sftp->exists(resolved("sftp://h/d/a.txt"), ctl));

    FileInfo info;
    ASSERT_TRUE(sftp->getInfo(resolved("sftp://h/d/b.txt"), info, ctl).ok());
    EXPECT_EQ(info.size, 3u);
    EXPECT_TRUE(sftp->getInfo(resolved("sftp://h/nope"), info, ctl).is(ErrorKind::FileNotFound));

    ASSERT_TRUE(sftp->createDirectory(resolved("sftp://h/x/y/z"), ctl).ok());
    EXPECT_TRUE(server->hasDir("/x/y/z"));
    EXPECT_TRUE(sftp->createDirectory(resolved("sftp://h/x/y/z"), ctl).ok());
}

TEST_F(RemoteStrategyTest, SmbPathsIncludeTheShare) {
    test::writeFile(dir.file("s.txt"), "s");
    ASSERT_TRUE(smb->copy(LocalPath{dir.file("s.txt")}, resolved("smb://nas/media/s.txt"), false, {}, ctl).ok());
    EXPECT_EQ(server->content("/media/s.txt"), "s");
}

TEST_F(RemoteStrategyTest, RepeatedTimeoutsDegradeTheEndpoint) {
    server->addFile("/big.iso", "iso");
    server->failNext("get", ErrorKind::NetworkError, true, 3);
    for (int i = 0; i < 3; ++i) {
        auto r = sftp->copy(resolved("sftp://h/big.iso"), LocalPath{dir.file("big.iso")}, true, {}, ctl);
        ASSERT_TRUE(r.is(ErrorKind::NetworkError));
        EXPECT_TRUE(r.error().timedOut);
    }
    EXPECT_TRUE(admission->isDegraded("sftp://h:22"));
    EXPECT_EQ(admission->currentLimit("sftp://h:22"), 2);
    EXPECT_FALSE(test::fileExists(dir.file("big.iso")));
    EXPECT_TRUE(sftp->copy(resolved("sftp://h/big.iso"), LocalPath{dir.file("big.iso")}, true, {}, ctl).ok());
}

TEST_F(RemoteStrategyTest, CancelledBeforeStart) {
    server->addFile("/a.txt", "a");
    OperationControl stop;
    stop.shouldCancel = [] { return true; };
    auto r = sftp->copy(resolved("sftp://h/a.txt"), LocalPath{dir.file("a.txt")}, false, {}, stop);
    EXPECT_TRUE(r.is(ErrorKind::Cancelled));
    EXPECT_FALSE(test::fileExists(dir.file("a.txt")));
}

TEST_F(RemoteStrategyTest, RejectsOtherProtocols) {
    EXPECT_TRUE(sftp->remove(resolved("ftp://h/a"), true, ctl).is(ErrorKind::InvalidOperation));
    EXPECT_TRUE(sftp->copy(resolved("ftp://h/a"), resolved("sftp://h/a"), false, {}, ctl).is(ErrorKind::InvalidOperation));
}
