#include "fetchkit/errors.hpp"
#include "fetchkit/http_client.hpp"
#include "support/fake_http_client.hpp"

#include <string>

#include <gtest/gtest.h>

namespace fetchkit::test {

namespace {
const std::string kUrl = "https://downloads.example.com/runtime-21.zip";
} // namespace

class TransferSizeTest : public ::testing::Test {
protected:
    FakeHttpClient client_;
};

TEST_F(TransferSizeTest, KnownSizeSkipsHeadRequest) {
    EXPECT_EQ(resolveTransferSize(client_, "https://unknown.example.com/a.zip", 4096), 4096u);
}

TEST_F(TransferSizeTest, UsesReportedContentLength) {
    client_.serve(kUrl, makeBody(1500));
    EXPECT_EQ(resolveTransferSize(client_, kUrl, std::nullopt), 1500u);
}

TEST_F(TransferSizeTest, MissingContentLengthIsInvalidArgument) {
    client_.serve(kUrl, makeBody(1500));
    client_.setHideContentLength(true);
    try {
        (void)resolveTransferSize(client_, kUrl, std::nullopt);
        FAIL() << "expected TransferError";
    } catch (const TransferError& ex) {
        EXPECT_EQ(ex.code(), ErrorCode::InvalidArgument);
        EXPECT_NE(std::string{ex.what()}.find("--size"), std::string::npos);
    }
}

TEST_F(TransferSizeTest, ZeroContentLengthIsInvalidArgument) {
    client_.serve(kUrl, "");
    try {
        (void)resolveTransferSize(client_, kUrl, std::nullopt);
        FAIL() << "expected TransferError";
    } catch (const TransferError& ex) {
        EXPECT_EQ(ex.code(), ErrorCode::InvalidArgument);
    }
}

TEST_F(TransferSizeTest, UnreachableServerKeepsNetworkError) {
    try {
        (void)resolveTransferSize(client_, kUrl, std::nullopt);
        FAIL() << "expected TransferError";
    } catch (const TransferError& ex) {
        EXPECT_EQ(ex.code(), ErrorCode::NetworkError);
    }
}

} // namespace fetchkit::test
