#include "openxfer/PathResolver.hpp"
#include <gtest/gtest.h>

using namespace openxfer;

namespace {

TransferPath resolveOk(const std::string& raw) {
    std::string err;
    auto p = PathResolver::resolve(raw, err);
    EXPECT_TRUE(p.has_value()) << raw << ": " << err;
    return p ? *p : TransferPath(LocalPath{});
}

} // namespace

TEST(PathResolver, NormalizeRepairsConcatenatedUris) {
    EXPECT_EQ(PathResolver::normalize("smb:/host/share//dir\\file.txt"), "smb://host/share/dir/file.txt");
    EXPECT_EQ(PathResolver::normalize("  SFTP:///host//a  "), "sftp://host/a");
    EXPECT_EQ(PathResolver::normalize("file:///tmp/x"), "/tmp/x");
    EXPECT_EQ(PathResolver::normalize("cloud:/dropbox/a"), "cloud://dropbox/a");
}

TEST(PathResolver, NormalizeIsIdempotent) {
    const char* inputs[] = {"smb:/h//s\\d", "sftp://u@h:2222//x/", "/a//b/", "cloud:///google_drive//id", "ftp:\\\\h\\p"};
    for (const char* raw : inputs) {
        const std::string once = PathResolver::normalize(raw);
        EXPECT_EQ(PathResolver::normalize(once), once) << raw;
    }
}

TEST(PathResolver, ParsesSmbWithDefaultPort) {
    const TransferPath p = resolveOk("smb://10.0.0.5/media/photos/a.jpg");
    const auto& s = std::get<SmbPath>(p);
    EXPECT_EQ(s.host, "10.0.0.5");
    EXPECT_EQ(s.port, 445);
    EXPECT_EQ(s.share, "media");
    EXPECT_EQ(s.remotePath, "/photos/a.jpg");
    EXPECT_EQ(endpointKey(p), "smb://10.0.0.5:445");
}

TEST(PathResolver, ParsesSftpUserAndPort) {
    const TransferPath p = resolveOk("sftp://alice@Example.org:2222/home/alice/");
    const auto& s = std::get<SftpPath>(p);
    EXPECT_EQ(s.user, "alice");
    EXPECT_EQ(s.host, "example.org");
    EXPECT_EQ(s.port, 2222);
    EXPECT_EQ(s.remotePath, "/home/alice");
    EXPECT_EQ(toUri(p), "sftp://alice@example.org:2222/home/alice");
}

TEST(PathResolver, ParsesCloudAliases) {
    const TransferPath p = resolveOk("cloud://GoogleDrive/abc123");
    const auto& c = std::get<CloudPath>(p);
    EXPECT_EQ(c.provider, CloudProvider::GoogleDrive);
    EXPECT_EQ(c.idOrPath, "abc123");
    EXPECT_EQ(endpointKey(p), "cloud://google_drive");

    const auto& d = std::get<CloudPath>(resolveOk("cloud:/dropbox/folder/a.jpg"));
    EXPECT_EQ(d.provider, CloudProvider::Dropbox);
    const auto split = splitParentAndName(d);
    EXPECT_EQ(split.first, "/folder");
    ASSERT_TRUE(split.second.has_value());
    EXPECT_EQ(*split.second, "a.jpg");
}

TEST(PathResolver, LocalPathsAreAbsoluteAndClean) {
    const auto& l = std::get<LocalPath>(resolveOk("/tmp//x/./y/"));
    EXPECT_EQ(l.path, "/tmp/x/y");
    EXPECT_EQ(endpointKey(TransferPath(l)), "local");
}

TEST(PathResolver, RejectsMalformedInput) {
    std::string err;
    EXPECT_FALSE(PathResolver::resolve("", err));
    EXPECT_FALSE(err.empty());
    EXPECT_FALSE(PathResolver::resolve("smb://host", err));      // no share
    EXPECT_FALSE(PathResolver::resolve("sftp://h:99999/x", err)); // bad port
    EXPECT_FALSE(PathResolver::resolve("cloud://box/x", err));    // unknown provider
    EXPECT_FALSE(PathResolver::resolve("cloud://dropbox", err));  // no item
}

TEST(TransferPath, ParentAndFileName) {
    const TransferPath p = resolveOk("ftp://h/pub/dir/f.bin");
    EXPECT_EQ(fileName(p), "f.bin");
    auto parent = parentOf(p);
    ASSERT_TRUE(parent.has_value());
    EXPECT_EQ(std::get<FtpPath>(*parent).remotePath, "/pub/dir");
    EXPECT_EQ(std::get<FtpPath>(withFileName(p, "g.bin")).remotePath, "/pub/dir/g.bin");
    EXPECT_FALSE(parentOf(resolveOk("ftp://h/")).has_value());
}

TEST(TransferPath, SameEndpointComparesShares) {
    const TransferPath a = resolveOk("smb://h/s1/a");
    const TransferPath b = resolveOk("smb://h/s1/b");
    const TransferPath c = resolveOk("smb://h/s2/a");
    EXPECT_TRUE(sameEndpoint(a, b));
    EXPECT_FALSE(sameEndpoint(a, c));
    EXPECT_FALSE(sameEndpoint(a, resolveOk("sftp://h/s1/a")));
}

TEST(TransferPath, CloudEndpointKeyTagsTheAccount) {
    EXPECT_EQ(endpointKey(resolveOk("cloud://google/abc")), "cloud://google_drive");
    EXPECT_EQ(cloudEndpointKey(CloudProvider::GoogleDrive, ""), "cloud://google_drive");
    EXPECT_EQ(cloudEndpointKey(CloudProvider::OneDrive, "bob"), "cloud://onedrive#bob");
}
