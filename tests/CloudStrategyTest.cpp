#include "openxfer/CloudStrategy.hpp"
#include "openxfer/MockCloudClient.hpp"
#include "TestUtil.hpp"
#include <gtest/gtest.h>
#include <algorithm>

using namespace openxfer;

namespace {

CloudPath cloud(CloudProvider provider, const std::string& idOrPath) {
    CloudPath p;
    p.provider = provider;
    p.idOrPath = idOrPath;
    return p;
}

bool sawOperation(const MockCloudClient& c, const std::string& prefix) {
    const auto ops = c.operations();
    return std::any_of(ops.begin(), ops.end(), [&](const std::string& op) { return op.rfind(prefix, 0) == 0; });
}

} // namespace

class CloudStrategyTest : public ::testing::Test {
protected:
    void SetUp() override {
        creds->setCloudToken(CloudProvider::GoogleDrive, "drive-token");
        creds->setCloudToken(CloudProvider::Dropbox, "dropbox-token");
        drive->setAccessToken("drive-token");
        dropbox->setAccessToken("dropbox-token");
        strategy.registerClient(drive);
        strategy.registerClient(dropbox);
    }

    test::TempDir dir;
    std::shared_ptr<TempFileManager> staging = std::make_shared<TempFileManager>(StagingConfig{dir.file("staging")});
    std::shared_ptr<InMemoryCredentials> creds = std::make_shared<InMemoryCredentials>();
    std::shared_ptr<AdmissionController> admission = std::make_shared<AdmissionController>();
    std::shared_ptr<MockCloudClient> drive = std::make_shared<MockCloudClient>(CloudProvider::GoogleDrive);
    std::shared_ptr<MockCloudClient> dropbox = std::make_shared<MockCloudClient>(CloudProvider::Dropbox);
    CloudStrategy strategy{admission, creds, staging};
    OperationControl ctl;
};

TEST_F(CloudStrategyTest, MissingTokenRequiresSignIn) {
    auto onedrive = std::make_shared<MockCloudClient>(CloudProvider::OneDrive);
    strategy.registerClient(onedrive);
    test::writeFile(dir.file("a.txt"), "a");
    auto r = strategy.copy(LocalPath{dir.file("a.txt")}, cloud(CloudProvider::OneDrive, "a.txt"), false, {}, ctl);
    EXPECT_TRUE(r.is(ErrorKind::AuthenticationRequired));
    EXPECT_TRUE(onedrive->operations().empty());
}

TEST_F(CloudStrategyTest, TokenIsRestoredLazily) {
    drive->setAccessToken("");
    const int before = drive->tokenUpdates();
    test::writeFile(dir.file("a.txt"), "a");
    ASSERT_TRUE(strategy.copy(LocalPath{dir.file("a.txt")}, cloud(CloudProvider::GoogleDrive, "a.txt"), false, {}, ctl).ok());
    EXPECT_TRUE(drive->isAuthenticated());
    EXPECT_EQ(drive->tokenUpdates(), before + 1);
    ASSERT_TRUE(strategy.exists(cloud(CloudProvider::GoogleDrive, "a.txt"), ctl));
    EXPECT_EQ(drive->tokenUpdates(), before + 1);
}

TEST_F(CloudStrategyTest, UnregisteredProvider) {
    auto r = strategy.remove(cloud(CloudProvider::OneDrive, "x"), true, ctl);
    EXPECT_TRUE(r.is(ErrorKind::InvalidOperation));
}

TEST_F(CloudStrategyTest, UploadIntoFolderAndDownloadBack) {
    const std::string folder = drive->addFolder("root", "Photos");
    test::writeFile(dir.file("a.jpg"), "jpeg bytes");
    double last = 0;
    auto r = strategy.copy(LocalPath{dir.file("a.jpg")}, cloud(CloudProvider::GoogleDrive, folder + "/a.jpg"), false,
                           [&](const TransferProgress& p) { last = p.fraction; }, ctl);
    ASSERT_TRUE(r.ok()) << r.error().message;
    EXPECT_DOUBLE_EQ(last, 1.0);
    const std::string id = drive->childRef(folder, "a.jpg");
    ASSERT_FALSE(id.empty());
    EXPECT_EQ(drive->content(id), "jpeg bytes");
    EXPECT_TRUE(sawOperation(*drive, "upload a.jpg"));

    // By id, and by name under the folder.
    ASSERT_TRUE(strategy.copy(cloud(CloudProvider::GoogleDrive, folder + "/" + id), LocalPath{dir.file("by-id.jpg")},
                              false, {}, ctl).ok());
    EXPECT_EQ(test::readFile(dir.file("by-id.jpg")), "jpeg bytes");
    ASSERT_TRUE(strategy.copy(cloud(CloudProvider::GoogleDrive, folder + "/a.jpg"), LocalPath{dir.file("by-name.jpg")},
                              false, {}, ctl).ok());
    EXPECT_EQ(test::readFile(dir.file("by-name.jpg")), "jpeg bytes");
}

TEST_F(CloudStrategyTest, UploadConflictWithoutOverwrite) {
    drive->addFile("root", "a.txt", "old");
    test::writeFile(dir.file("a.txt"), "new");
    auto r = strategy.copy(LocalPath{dir.file("a.txt")}, cloud(CloudProvider::GoogleDrive, "a.txt"), false, {}, ctl);
    EXPECT_TRUE(r.is(ErrorKind::FileExists));
    EXPECT_EQ(drive->content(drive->childRef("root", "a.txt")), "old");
    ASSERT_TRUE(strategy.copy(LocalPath{dir.file("a.txt")}, cloud(CloudProvider::GoogleDrive, "a.txt"), true, {}, ctl).ok());
    EXPECT_EQ(drive->content(drive->childRef("root", "a.txt")), "new");
}

TEST_F(CloudStrategyTest, DownloadMissingAndFolder) {
    auto r = strategy.copy(cloud(CloudProvider::GoogleDrive, "nope.txt"), LocalPath{dir.file("nope.txt")}, false, {}, ctl);
    EXPECT_TRUE(r.is(ErrorKind::FileNotFound));
    const std::string folder = drive->addFolder("root", "Docs");
    r = strategy.copy(cloud(CloudProvider::GoogleDrive, folder), LocalPath{dir.file("Docs")}, false, {}, ctl);
    EXPECT_TRUE(r.is(ErrorKind::InvalidOperation));
}

TEST_F(CloudStrategyTest, DropboxAddressesByPath) {
    dropbox->addFolder("", "folder");
    test::writeFile(dir.file("a.jpg"), "jpg");
    ASSERT_TRUE(strategy.copy(LocalPath{dir.file("a.jpg")}, cloud(CloudProvider::Dropbox, "folder/a.jpg"), false, {}, ctl).ok());
    EXPECT_EQ(dropbox->content("/folder/a.jpg"), "jpg");
    EXPECT_TRUE(strategy.exists(cloud(CloudProvider::Dropbox, "folder/a.jpg"), ctl));
    EXPECT_FALSE(strategy.exists(cloud(CloudProvider::Dropbox, "folder/b.jpg"), ctl));

    auto r = strategy.rename(cloud(CloudProvider::Dropbox, "folder/a.jpg"), "b.jpg", ctl);
    ASSERT_TRUE(r.ok()) << r.error().message;
    EXPECT_EQ(dropbox->content("/folder/b.jpg"), "jpg");
}

TEST_F(CloudStrategyTest, SameProviderCopyAndMoveStayServerSide) {
    const std::string src = drive->addFolder("root", "src");
    const std::string dst = drive->addFolder("root", "dst");
    const std::string id = drive->addFile(src, "r.pdf", "pdf");

    ASSERT_TRUE(strategy.copy(cloud(CloudProvider::GoogleDrive, src + "/" + id),
                              cloud(CloudProvider::GoogleDrive, dst + "/copy.pdf"), false, {}, ctl).ok());
    EXPECT_EQ(drive->content(drive->childRef(dst, "copy.pdf")), "pdf");
    EXPECT_TRUE(sawOperation(*drive, "copy " + id));
    EXPECT_FALSE(sawOperation(*drive, "download"));

    int updates = 0;
    ASSERT_TRUE(strategy.move(cloud(CloudProvider::GoogleDrive, src + "/" + id),
                              cloud(CloudProvider::GoogleDrive, dst + "/moved.pdf"), false,
                              [&](const TransferProgress&) { ++updates; }, ctl).ok());
    EXPECT_TRUE(drive->childRef(src, "r.pdf").empty());
    EXPECT_EQ(drive->childRef(dst, "moved.pdf"), id);
    EXPECT_EQ(updates, 1);

    auto r = strategy.copy(cloud(CloudProvider::GoogleDrive, dst + "/" + id),
                           cloud(CloudProvider::GoogleDrive, dst + "/copy.pdf"), false, {}, ctl);
    EXPECT_TRUE(r.is(ErrorKind::FileExists));
}

TEST_F(CloudStrategyTest, CopyOntoItselfKeepsTheItem) {
    dropbox->addFile("", "a.jpg", "jpeg");
    auto r = strategy.copy(cloud(CloudProvider::Dropbox, "a.jpg"), cloud(CloudProvider::Dropbox, "a.jpg"), true, {}, ctl);
    EXPECT_TRUE(r.is(ErrorKind::FileExists));
    EXPECT_EQ(dropbox->content("/a.jpg"), "jpeg");

    // The same Drive file addressed by id and by name.
    const std::string id = drive->addFile("root", "a.jpg", "jpeg");
    r = strategy.copy(cloud(CloudProvider::GoogleDrive, id), cloud(CloudProvider::GoogleDrive, "a.jpg"), true, {}, ctl);
    EXPECT_TRUE(r.is(ErrorKind::FileExists));
    r = strategy.move(cloud(CloudProvider::GoogleDrive, id), cloud(CloudProvider::GoogleDrive, "a.jpg"), true, {}, ctl);
    EXPECT_TRUE(r.is(ErrorKind::FileExists));
    EXPECT_EQ(drive->content(id), "jpeg");
    EXPECT_FALSE(sawOperation(*drive, "delete"));
    EXPECT_FALSE(sawOperation(*dropbox, "delete"));
}

TEST_F(CloudStrategyTest, DriveTrashesUnlessPermanent) {
    const std::string a = drive->addFile("root", "a.txt", "a");
    const std::string b = drive->addFile("root", "b.txt", "b");
    ASSERT_TRUE(strategy.remove(cloud(CloudProvider::GoogleDrive, a), false, ctl).ok());
    EXPECT_TRUE(drive->isTrashed(a));
    ASSERT_TRUE(strategy.remove(cloud(CloudProvider::GoogleDrive, b), true, ctl).ok());
    EXPECT_FALSE(drive->isTrashed(b));
    EXPECT_TRUE(drive->content(b).empty());
    EXPECT_EQ(drive->itemCount(), 1u);
    EXPECT_TRUE(strategy.remove(cloud(CloudProvider::GoogleDrive, b), true, ctl).is(ErrorKind::FileNotFound));
}

TEST_F(CloudStrategyTest, DropboxDeletesEvenWithoutPermanent) {
    dropbox->addFile("", "x.txt", "x");
    ASSERT_TRUE(strategy.remove(cloud(CloudProvider::Dropbox, "x.txt"), false, ctl).ok());
    EXPECT_EQ(dropbox->itemCount(), 0u);
}

TEST_F(CloudStrategyTest, CreateDirectoryAndInfo) {
    ASSERT_TRUE(strategy.createDirectory(cloud(CloudProvider::Dropbox, "a/b/c"), ctl).ok());
    EXPECT_FALSE(dropbox->childRef("/a/b", "c").empty());
    EXPECT_TRUE(strategy.createDirectory(cloud(CloudProvider::Dropbox, "a/b/c"), ctl).ok());

    ASSERT_TRUE(strategy.createDirectory(cloud(CloudProvider::GoogleDrive, "Reports"), ctl).ok());
    const std::string folder = drive->childRef("root", "Reports");
    ASSERT_FALSE(folder.empty());
    EXPECT_TRUE(strategy.createDirectory(cloud(CloudProvider::GoogleDrive, "Reports"), ctl).ok());

    FileInfo info;
    ASSERT_TRUE(strategy.getInfo(cloud(CloudProvider::GoogleDrive, folder), info, ctl).ok());
    EXPECT_TRUE(info.is_dir);
    EXPECT_EQ(info.name, "Reports");
    EXPECT_EQ(info.id, folder);
}

TEST_F(CloudStrategyTest, CrossProviderCopyIsStaged) {
    drive->addFile("root", "doc.txt", "drive data");
    ASSERT_TRUE(strategy.copy(cloud(CloudProvider::GoogleDrive, "doc.txt"), cloud(CloudProvider::Dropbox, "doc.txt"),
                              false, {}, ctl).ok());
    EXPECT_EQ(dropbox->content("/doc.txt"), "drive data");
    EXPECT_FALSE(drive->childRef("root", "doc.txt").empty());
    EXPECT_EQ(staging->activeCount(), 0u);
    EXPECT_EQ(test::countFiles(staging->directory()), 0);
}

TEST_F(CloudStrategyTest, TimeoutsCountAgainstTheProvider) {
    test::writeFile(dir.file("a.txt"), "a");
    drive->failNext("upload", ErrorKind::NetworkError, true, 3);
    for (int i = 0; i < 3; ++i) {
        auto r = strategy.copy(LocalPath{dir.file("a.txt")}, cloud(CloudProvider::GoogleDrive, "a.txt"), true, {}, ctl);
        EXPECT_TRUE(r.is(ErrorKind::NetworkError));
    }
    EXPECT_TRUE(admission->isDegraded("cloud://google_drive"));
}

TEST_F(CloudStrategyTest, ThrottleKeyCarriesTheAccount) {
    creds->setCloudAccount(CloudProvider::Dropbox, "alice@example.com");
    test::writeFile(dir.file("a.txt"), "a");
    dropbox->failNext("upload", ErrorKind::NetworkError, true, 3);
    for (int i = 0; i < 3; ++i)
        strategy.copy(LocalPath{dir.file("a.txt")}, cloud(CloudProvider::Dropbox, "a.txt"), true, {}, ctl);
    EXPECT_TRUE(admission->isDegraded("cloud://dropbox#alice@example.com"));
    EXPECT_FALSE(admission->snapshot("cloud://dropbox").has_value());
}
