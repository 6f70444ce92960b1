#include "openxfer/TempFileManager.hpp"
#include "TestUtil.hpp"
#include <gtest/gtest.h>
#include <cstdint>
#include <filesystem>

using namespace openxfer;
namespace fs = std::filesystem;

namespace {

StagingConfig configFor(const test::TempDir& dir) {
    StagingConfig cfg;
    cfg.directory = dir.file("staging");
    return cfg;
}

} // namespace

TEST(TempFileManager, CreatesNamedAndTrackedFiles) {
    test::TempDir dir;
    TempFileManager mgr(configFor(dir));
    std::string path;
    ClientError err;
    ASSERT_TRUE(mgr.createTempFile("bridge", "_a:b/c.txt", path, err)) << err.message;
    EXPECT_TRUE(test::fileExists(path));
    const std::string name = fs::path(path).filename().string();
    EXPECT_EQ(name.rfind("temp_", 0), 0u);
    EXPECT_NE(name.find("_bridge_a_b_c.txt"), std::string::npos);
    EXPECT_EQ(fs::path(path).parent_path().string(), mgr.directory());
    EXPECT_EQ(mgr.activeCount(), 1u);

    EXPECT_TRUE(mgr.cleanup(path));
    EXPECT_FALSE(test::fileExists(path));
    EXPECT_EQ(mgr.activeCount(), 0u);
    EXPECT_FALSE(mgr.cleanup(path));
}

TEST(TempFileManager, NamesAreUnique) {
    test::TempDir dir;
    TempFileManager mgr(configFor(dir));
    std::string a, b;
    ClientError err;
    ASSERT_TRUE(mgr.createTempFile("x", ".bin", a, err));
    ASSERT_TRUE(mgr.createTempFile("x", ".bin", b, err));
    EXPECT_NE(a, b);
}

TEST(TempFileManager, DestructorRemovesActiveFiles) {
    test::TempDir dir;
    std::string path;
    {
        TempFileManager mgr(configFor(dir));
        ClientError err;
        ASSERT_TRUE(mgr.createTempFile("x", "", path, err));
    }
    EXPECT_FALSE(test::fileExists(path));
}

TEST(TempFileManager, CleanupOlderThanRemovesOnlyStaleTempFiles) {
    test::TempDir dir;
    TempFileManager mgr(configFor(dir));
    std::string stale, fresh;
    ClientError err;
    ASSERT_TRUE(mgr.createTempFile("old", "", stale, err));
    ASSERT_TRUE(mgr.createTempFile("new", "", fresh, err));
    fs::last_write_time(stale, fs::file_time_type::clock::now() - std::chrono::hours(48));
    test::writeFile(mgr.directory() + "/keep.txt", "not ours");

    EXPECT_EQ(mgr.cleanupOlderThan(), 1);
    EXPECT_FALSE(test::fileExists(stale));
    EXPECT_TRUE(test::fileExists(fresh));
    EXPECT_TRUE(test::fileExists(mgr.directory() + "/keep.txt"));
    EXPECT_EQ(mgr.activeCount(), 1u);
}

TEST(TempFileManager, StagedFileIsRemovedOnScopeExit) {
    test::TempDir dir;
    TempFileManager mgr(configFor(dir));
    std::string path;
    {
        StagedFile staged(mgr, "bridge", "_photo.jpg");
        ASSERT_TRUE(staged.ok()) << staged.error().message;
        path = staged.path();
        test::writeFile(path, "payload");
        EXPECT_EQ(mgr.activeCount(), 1u);
    }
    EXPECT_FALSE(test::fileExists(path));
    EXPECT_EQ(mgr.activeCount(), 0u);
}

TEST(TempFileManager, ReportsUnusableDirectory) {
    test::TempDir dir;
    test::writeFile(dir.file("blocker"), "x");
    StagingConfig cfg;
    cfg.directory = dir.file("blocker/sub");
    TempFileManager mgr(cfg);
    StagedFile staged(mgr, "bridge", "");
    EXPECT_FALSE(staged.ok());
    EXPECT_FALSE(staged.error().empty());
}

TEST(TempFileManager, AvailableSpace) {
    test::TempDir dir;
    TempFileManager mgr(configFor(dir));
    EXPECT_TRUE(mgr.hasAvailableSpace(1));
    EXPECT_FALSE(mgr.hasAvailableSpace(UINTMAX_MAX));
}
