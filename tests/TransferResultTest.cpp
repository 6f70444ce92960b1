#include "openxfer/TransferResult.hpp"
#include <gtest/gtest.h>
#include <cerrno>

using namespace openxfer;

TEST(TransferResult, SuccessCarriesFinalPath) {
    TransferResult r = TransferResult::success("/tmp/out.txt");
    ASSERT_TRUE(r.ok());
    EXPECT_TRUE(static_cast<bool>(r));
    EXPECT_EQ(r.finalPath(), "/tmp/out.txt");
    EXPECT_FALSE(r.is(ErrorKind::Unknown));
}

TEST(TransferResult, TimedOutOnlyForNetworkErrors) {
    EXPECT_TRUE(TransferResult::failure(ErrorKind::NetworkError, "stall", {}, true).error().timedOut);
    EXPECT_FALSE(TransferResult::failure(ErrorKind::FileNotFound, "gone", {}, true).error().timedOut);
}

TEST(TransferResult, FromClientKeepsKindAndCause) {
    ClientError err;
    err.set(ErrorKind::PermissionDenied, "open /x: denied");
    TransferResult r = TransferResult::fromClient(err, "upload sftp://h:22/x");
    ASSERT_TRUE(r.is(ErrorKind::PermissionDenied));
    EXPECT_EQ(r.error().cause, "open /x: denied");
    EXPECT_NE(r.error().message.find("upload sftp://h:22/x"), std::string::npos);
}

TEST(TransferResult, FromEmptyClientErrorIsUnknown) {
    TransferResult r = TransferResult::fromClient(ClientError{}, "mkdir");
    EXPECT_TRUE(r.is(ErrorKind::Unknown));
}

TEST(ClientError, ErrnoMapping) {
    EXPECT_EQ(ClientError::fromErrno(ENOENT, "x").kind, ErrorKind::FileNotFound);
    EXPECT_EQ(ClientError::fromErrno(EEXIST, "x").kind, ErrorKind::FileExists);
    EXPECT_EQ(ClientError::fromErrno(EACCES, "x").kind, ErrorKind::PermissionDenied);
    EXPECT_EQ(ClientError::fromErrno(ENOSPC, "x").kind, ErrorKind::StorageFull);
    const ClientError t = ClientError::fromErrno(ETIMEDOUT, "x");
    EXPECT_EQ(t.kind, ErrorKind::NetworkError);
    EXPECT_TRUE(t.timedOut);
}

TEST(TransferResult, DescribeTransferErrorListsEndpoints) {
    TransferResult r = TransferResult::failure(ErrorKind::FileExists, "Destination exists: /b");
    const std::string text = describeTransferError("a.txt", "/a", "/b", r);
    EXPECT_NE(text.find("From: /a"), std::string::npos);
    EXPECT_NE(text.find("To: /b"), std::string::npos);
    EXPECT_NE(text.find("Destination exists"), std::string::npos);
}
