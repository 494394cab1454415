#include <gtest/gtest.h>

#include "reel/result.hpp"

namespace reel {
namespace {

TEST(OperationResultTest, FailureCarriesKindAndMessage) {
    const OperationResult result = OperationResult::fail(FailureKind::SizeLimit, "too big", {{"bytes", 9}});
    EXPECT_FALSE(result.success());

    const QJsonObject json = result.toJson();
    EXPECT_FALSE(json.value("success").toBool());
    EXPECT_EQ(json.value("error").toString(), "too big");
    EXPECT_EQ(json.value("failure").toString(), "size_limit");
    EXPECT_EQ(json.value("bytes").toInt(), 9);
}

TEST(OperationResultTest, SuccessMergesDetailsWithoutErrorFields) {
    const QJsonObject json = OperationResult::ok({{"path", "/tmp/a.zip"}}).toJson();
    EXPECT_TRUE(json.value("success").toBool());
    EXPECT_EQ(json.value("path").toString(), "/tmp/a.zip");
    EXPECT_FALSE(json.contains("error"));
    EXPECT_FALSE(json.contains("failure"));
}

TEST(OperationResultTest, FailureKindNamesAreStable) {
    EXPECT_EQ(failureKindName(FailureKind::None), "none");
    EXPECT_EQ(failureKindName(FailureKind::HttpStatus), "http_status");
    EXPECT_EQ(failureKindName(FailureKind::InvalidArchive), "invalid_archive");
    EXPECT_EQ(failureKindName(FailureKind::Cancelled), "cancelled");
}

}  // namespace
}  // namespace reel
