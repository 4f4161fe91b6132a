/**
 * @file test_error.cpp
 * @brief Unit tests for the error model
 */

#include <clipsync/error.h>
#include <gtest/gtest.h>

using namespace clipsync;

namespace {

Result<int> parse_positive(int value) {
  CLIPSYNC_REQUIRE(value > 0, ErrorCode::InvalidArgument, "not positive");
  return value;
}

Result<void> chain(int value) {
  CLIPSYNC_TRY(parse_positive(value));
  return Result<void>::ok();
}

} // namespace

TEST(ErrorTest, ResultHoldsValue) {
  Result<int> result = 42;
  EXPECT_TRUE(result.is_ok());
  EXPECT_TRUE(static_cast<bool>(result));
  EXPECT_EQ(result.value(), 42);
  EXPECT_EQ(result.value_or(7), 42);
  EXPECT_EQ(result.to_optional(), std::optional<int>(42));
}

TEST(ErrorTest, ResultHoldsError) {
  Result<int> result = Error(ErrorCode::PeerNotFound, "gone");
  EXPECT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::PeerNotFound);
  EXPECT_EQ(result.value_or(7), 7);
  EXPECT_FALSE(result.to_optional().has_value());
}

TEST(ErrorTest, VoidResult) {
  auto ok = Result<void>::ok();
  EXPECT_TRUE(ok.is_ok());

  Result<void> failed(ErrorCode::Timeout, "slow");
  EXPECT_TRUE(failed.is_error());
  EXPECT_EQ(failed.error().message, "slow");
}

TEST(ErrorTest, TryAndRequireMacros) {
  EXPECT_TRUE(chain(3).is_ok());

  auto failed = chain(-1);
  ASSERT_TRUE(failed.is_error());
  EXPECT_EQ(failed.error().code, ErrorCode::InvalidArgument);
  EXPECT_EQ(failed.error().message, "not positive");
}

TEST(ErrorTest, ToStringIncludesNameMessageAndDetails) {
  Error err(ErrorCode::FrameError, "bad frame", "peer 10.0.0.2");
  std::string text = err.to_string();
  EXPECT_NE(text.find("FrameError"), std::string::npos);
  EXPECT_NE(text.find("bad frame"), std::string::npos);
  EXPECT_NE(text.find("10.0.0.2"), std::string::npos);
}

TEST(ErrorTest, CodeNames) {
  EXPECT_STREQ(error_code_name(ErrorCode::Success), "Success");
  EXPECT_STREQ(error_code_name(ErrorCode::DiscoveryParseError),
               "DiscoveryParseError");
  EXPECT_STREQ(error_code_name(ErrorCode::ClipboardAccessError),
               "ClipboardAccessError");
  EXPECT_STRNE(error_code_description(ErrorCode::ConnectionLost), "");
}

TEST(ErrorTest, Recoverability) {
  EXPECT_TRUE(is_recoverable(ErrorCode::ConnectionLost));
  EXPECT_TRUE(is_recoverable(ErrorCode::ClipboardAccessError));
  EXPECT_TRUE(is_recoverable(ErrorCode::DiscoveryParseError));
  EXPECT_FALSE(is_recoverable(ErrorCode::BindFailed));
  EXPECT_FALSE(is_recoverable(ErrorCode::ConfigError));
}
