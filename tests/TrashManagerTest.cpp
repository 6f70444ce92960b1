#include "openxfer/TrashManager.hpp"
#include "TestUtil.hpp"
#include <gtest/gtest.h>
#include <filesystem>

using namespace openxfer;
namespace fs = std::filesystem;

TEST(TrashManager, MoveAndRestore) {
    test::TempDir dir;
    const std::string file = dir.file("notes.txt");
    test::writeFile(file, "hello");
    TrashManager trash;

    TrashedFile item;
    ClientError err;
    ASSERT_TRUE(trash.moveToTrash(file, item, err)) << err.message;
    EXPECT_FALSE(test::fileExists(file));
    EXPECT_TRUE(test::fileExists(item.trashPath));
    EXPECT_EQ(fs::path(item.trashPath).parent_path().string(), TrashManager::trashDirFor(file));
    EXPECT_EQ(item.originalPath, file);
    ASSERT_TRUE(trash.lastDeleted().has_value());
    EXPECT_EQ(trash.lastDeleted()->trashPath, item.trashPath);

    std::string restored;
    ASSERT_TRUE(trash.restoreFromTrash(item, restored, err)) << err.message;
    EXPECT_EQ(restored, file);
    EXPECT_EQ(test::readFile(file), "hello");
    EXPECT_TRUE(trash.recentlyDeleted().empty());
}

TEST(TrashManager, RestoreAvoidsOverwriting) {
    test::TempDir dir;
    const std::string file = dir.file("a.txt");
    TrashManager trash;
    ClientError err;

    test::writeFile(file, "first");
    TrashedFile one;
    ASSERT_TRUE(trash.moveToTrash(file, one, err));
    test::writeFile(file, "second");
    TrashedFile two;
    ASSERT_TRUE(trash.moveToTrash(file, two, err));
    EXPECT_NE(one.trashPath, two.trashPath);
    test::writeFile(file, "current");

    std::string r1, r2;
    ASSERT_TRUE(trash.restoreFromTrash(one, r1, err));
    ASSERT_TRUE(trash.restoreFromTrash(two, r2, err));
    EXPECT_EQ(r1, dir.file("a_restored.txt"));
    EXPECT_EQ(r2, dir.file("a_restored_1.txt"));
    EXPECT_EQ(test::readFile(file), "current");
    EXPECT_EQ(test::readFile(r1), "first");
    EXPECT_EQ(test::readFile(r2), "second");
}

TEST(TrashManager, MissingItems) {
    test::TempDir dir;
    TrashManager trash;
    TrashedFile item;
    ClientError err;
    EXPECT_FALSE(trash.moveToTrash(dir.file("nope"), item, err));
    EXPECT_EQ(err.kind, ErrorKind::FileNotFound);

    item.originalPath = dir.file("x");
    item.trashPath = dir.file(".trash/1_x");
    std::string restored;
    err.clear();
    EXPECT_FALSE(trash.restoreFromTrash(item, restored, err));
    EXPECT_EQ(err.kind, ErrorKind::FileNotFound);
}

TEST(TrashManager, HistoryIsNewestFirstAndCapped) {
    test::TempDir dir;
    TrashManager trash;
    ClientError err;
    for (std::size_t i = 0; i < TrashManager::kMaxHistory + 5; ++i) {
        const std::string f = dir.file("f" + std::to_string(i));
        test::writeFile(f, "x");
        TrashedFile item;
        ASSERT_TRUE(trash.moveToTrash(f, item, err));
    }
    const auto history = trash.recentlyDeleted();
    ASSERT_EQ(history.size(), TrashManager::kMaxHistory);
    EXPECT_EQ(history.front().originalPath, dir.file("f" + std::to_string(TrashManager::kMaxHistory + 4)));
    trash.clearUndoHistory();
    EXPECT_FALSE(trash.lastDeleted().has_value());
}

TEST(TrashManager, ContentsCleanupAndEmpty) {
    test::TempDir dir;
    TrashManager trash(std::chrono::hours(24));
    // An entry from 1970 and one foreign file that is not ours to purge.
    test::writeFile(dir.file(".trash/1000_ancient.txt"), "old");
    test::writeFile(dir.file(".trash/README"), "foreign");
    test::writeFile(dir.file("recent.txt"), "new");
    TrashedFile item;
    ClientError err;
    ASSERT_TRUE(trash.moveToTrash(dir.file("recent.txt"), item, err));

    auto contents = trash.trashContents(dir.path());
    ASSERT_EQ(contents.size(), 2u);
    EXPECT_EQ(contents[0].originalPath, dir.file("recent.txt"));
    EXPECT_EQ(contents[1].originalPath, dir.file("ancient.txt"));

    EXPECT_EQ(trash.cleanupOldTrash(dir.path()), 1);
    EXPECT_FALSE(test::fileExists(dir.file(".trash/1000_ancient.txt")));
    EXPECT_TRUE(test::fileExists(item.trashPath));

    EXPECT_EQ(trash.emptyTrash(dir.path()), 2);
    EXPECT_FALSE(test::fileExists(dir.file(".trash")));
    EXPECT_TRUE(trash.recentlyDeleted().empty());
}
