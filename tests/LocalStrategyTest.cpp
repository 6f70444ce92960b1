#include "openxfer/LocalStrategy.hpp"
#include "TestUtil.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <vector>

using namespace openxfer;

class LocalStrategyTest : public ::testing::Test {
protected:
    TransferPath at(const std::string& rel) const { return LocalPath{dir.file(rel)}; }

    test::TempDir dir;
    std::shared_ptr<TrashManager> trash = std::make_shared<TrashManager>();
    LocalStrategy local{trash};
    OperationControl ctl;
};

TEST_F(LocalStrategyTest, CopyCreatesParentsAndReportsProgress) {
    test::writeFile(dir.file("src/a.txt"), std::string(20000, 'a'));
    double last = 0;
    auto r = local.copy(at("src/a.txt"), at("out/nested/a.txt"), false,
                        [&](const TransferProgress& p) { last = p.fraction; }, ctl);
    ASSERT_TRUE(r.ok()) << r.error().message;
    EXPECT_EQ(r.finalPath(), dir.file("out/nested/a.txt"));
    EXPECT_EQ(test::readFile(dir.file("out/nested/a.txt")), std::string(20000, 'a'));
    EXPECT_TRUE(test::fileExists(dir.file("src/a.txt")));
    EXPECT_DOUBLE_EQ(last, 1.0);
}

TEST_F(LocalStrategyTest, RefusesToOverwriteUnlessAsked) {
    test::writeFile(dir.file("a.txt"), "new");
    test::writeFile(dir.file("b.txt"), "old");
    auto r = local.copy(at("a.txt"), at("b.txt"), false, {}, ctl);
    EXPECT_TRUE(r.is(ErrorKind::FileExists));
    EXPECT_EQ(test::readFile(dir.file("b.txt")), "old");
    EXPECT_EQ(test::readFile(dir.file("a.txt")), "new");

    r = local.move(at("a.txt"), at("b.txt"), false, {}, ctl);
    EXPECT_TRUE(r.is(ErrorKind::FileExists));
    EXPECT_TRUE(test::fileExists(dir.file("a.txt")));

    r = local.copy(at("a.txt"), at("b.txt"), true, {}, ctl);
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(test::readFile(dir.file("b.txt")), "new");
}

TEST_F(LocalStrategyTest, CopyOntoItselfKeepsTheFile) {
    test::writeFile(dir.file("a.jpg"), "jpeg");
    EXPECT_TRUE(local.copy(at("a.jpg"), at("a.jpg"), true, {}, ctl).is(ErrorKind::FileExists));
    EXPECT_TRUE(local.move(at("a.jpg"), at("a.jpg"), true, {}, ctl).is(ErrorKind::FileExists));
    EXPECT_EQ(test::readFile(dir.file("a.jpg")), "jpeg");

    std::filesystem::create_hard_link(dir.file("a.jpg"), dir.file("link.jpg"));
    EXPECT_TRUE(local.copy(at("a.jpg"), at("link.jpg"), true, {}, ctl).is(ErrorKind::FileExists));
    EXPECT_EQ(test::readFile(dir.file("a.jpg")), "jpeg");
}

TEST_F(LocalStrategyTest, MissingSource) {
    auto r = local.copy(at("nope"), at("x"), false, {}, ctl);
    EXPECT_TRUE(r.is(ErrorKind::FileNotFound));
}

TEST_F(LocalStrategyTest, SameVolumeMoveReportsOnce) {
    test::writeFile(dir.file("a.txt"), "12345");
    std::vector<TransferProgress> updates;
    auto r = local.move(at("a.txt"), at("moved/b.txt"), false,
                        [&](const TransferProgress& p) { updates.push_back(p); }, ctl);
    ASSERT_TRUE(r.ok()) << r.error().message;
    EXPECT_FALSE(test::fileExists(dir.file("a.txt")));
    EXPECT_EQ(test::readFile(dir.file("moved/b.txt")), "12345");
    ASSERT_EQ(updates.size(), 1u);
    EXPECT_DOUBLE_EQ(updates[0].fraction, 1.0);
    EXPECT_EQ(updates[0].totalBytes, 5u);
}

TEST_F(LocalStrategyTest, CancelledCopyLeavesNoPartialFile) {
    test::writeFile(dir.file("a.txt"), std::string(100000, 'x'));
    OperationControl stop;
    stop.shouldCancel = [] { return true; };
    auto r = local.copy(at("a.txt"), at("b.txt"), false, {}, stop);
    EXPECT_TRUE(r.is(ErrorKind::Cancelled));
    EXPECT_FALSE(test::fileExists(dir.file("b.txt")));
    EXPECT_TRUE(test::fileExists(dir.file("a.txt")));
}

TEST_F(LocalStrategyTest, CopiesFoldersRecursively) {
    test::writeFile(dir.file("tree/one.txt"), "1");
    test::writeFile(dir.file("tree/sub/two.txt"), "2");
    auto r = local.copy(at("tree"), at("copy"), false, {}, ctl);
    ASSERT_TRUE(r.ok()) << r.error().message;
    EXPECT_EQ(test::readFile(dir.file("copy/sub/two.txt")), "2");
}

TEST_F(LocalStrategyTest, SoftDeleteGoesToTrash) {
    test::writeFile(dir.file("doc.txt"), "keep me");
    auto r = local.remove(at("doc.txt"), false, ctl);
    ASSERT_TRUE(r.ok());
    EXPECT_FALSE(test::fileExists(dir.file("doc.txt")));
    EXPECT_EQ(test::readFile(r.finalPath()), "keep me");
    EXPECT_EQ(trash->recentlyDeleted().size(), 1u);

    test::writeFile(dir.file("gone.txt"), "x");
    r = local.remove(at("gone.txt"), true, ctl);
    ASSERT_TRUE(r.ok());
    EXPECT_FALSE(test::fileExists(dir.file("gone.txt")));
    EXPECT_EQ(test::countFiles(TrashManager::trashDirFor(dir.file("gone.txt"))), 1);

    EXPECT_TRUE(local.remove(at("gone.txt"), true, ctl).is(ErrorKind::FileNotFound));
}

TEST_F(LocalStrategyTest, RenameStaysInPlace) {
    test::writeFile(dir.file("a.txt"), "a");
    test::writeFile(dir.file("taken.txt"), "t");
    auto r = local.rename(at("a.txt"), "b.txt", ctl);
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.finalPath(), dir.file("b.txt"));
    EXPECT_TRUE(local.rename(at("b.txt"), "taken.txt", ctl).is(ErrorKind::FileExists));
    EXPECT_TRUE(local.rename(at("b.txt"), "x/y", ctl).is(ErrorKind::InvalidInput));
}

TEST_F(LocalStrategyTest, DirectoriesAndInfo) {
    ASSERT_TRUE(local.createDirectory(at("d/e/f"), ctl).ok());
    EXPECT_TRUE(local.createDirectory(at("d/e/f"), ctl).ok());
    EXPECT_TRUE(local.exists(at("d/e/f"), ctl));

    test::writeFile(dir.file("d/file.bin"), "abc");
    EXPECT_TRUE(local.createDirectory(at("d/file.bin"), ctl).is(ErrorKind::FileExists));

    FileInfo info;
    ASSERT_TRUE(local.getInfo(at("d/file.bin"), info, ctl).ok());
    EXPECT_EQ(info.name, "file.bin");
    EXPECT_FALSE(info.is_dir);
    EXPECT_EQ(info.size, 3u);
    ASSERT_TRUE(local.getInfo(at("d/e"), info, ctl).ok());
    EXPECT_TRUE(info.is_dir);
    EXPECT_TRUE(local.getInfo(at("missing"), info, ctl).is(ErrorKind::FileNotFound));
}

TEST_F(LocalStrategyTest, RejectsForeignPaths) {
    SftpPath remote;
    remote.host = "h";
    remote.remotePath = "/a";
    EXPECT_TRUE(local.copy(remote, at("a"), false, {}, ctl).is(ErrorKind::InvalidOperation));
    EXPECT_FALSE(local.exists(remote, ctl));
}
