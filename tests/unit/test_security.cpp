/**
 * @file test_security.cpp
 * @brief Unit tests for the security module
 */

#include <clipsync/security.h>
#include <gtest/gtest.h>

using namespace clipsync;

class SecurityTest : public ::testing::Test {
protected:
  void SetUp() override { ASSERT_TRUE(security_init().is_ok()); }
};

// ============================================================================
// Hashing
// ============================================================================

TEST_F(SecurityTest, HashIsDeterministic) {
  Bytes data = {'c', 'l', 'i', 'p'};

  auto first = hash(data);
  auto second = hash(data);
  ASSERT_TRUE(first.is_ok());
  ASSERT_TRUE(second.is_ok());
  EXPECT_EQ(first.value(), second.value());
  EXPECT_EQ(hash_to_hex(first.value()).size(), HASH_SIZE * 2);
}

TEST_F(SecurityTest, HashDiffersForDifferentInput) {
  auto a = hash(Bytes{'a'});
  auto b = hash(Bytes{'b'});
  ASSERT_TRUE(a.is_ok());
  ASSERT_TRUE(b.is_ok());
  EXPECT_NE(a.value(), b.value());
}

TEST_F(SecurityTest, ContentHashTracksText) {
  auto hello = hash_content(TextContent{"hello"});
  auto hello_again = hash_content(TextContent{"hello"});
  auto world = hash_content(TextContent{"world"});
  ASSERT_TRUE(hello.is_ok());
  ASSERT_TRUE(hello_again.is_ok());
  ASSERT_TRUE(world.is_ok());

  EXPECT_EQ(hello.value(), hello_again.value());
  EXPECT_NE(hello.value(), world.value());
}

TEST_F(SecurityTest, ContentHashSeparatesKinds) {
  ImageContent image;
  image.bytes = {'h', 'i'};

  auto as_text = hash_content(TextContent{"hi"});
  auto as_image = hash_content(image);
  ASSERT_TRUE(as_text.is_ok());
  ASSERT_TRUE(as_image.is_ok());
  EXPECT_NE(as_text.value(), as_image.value());
}

TEST_F(SecurityTest, ContentHashIncludesImageDimensions) {
  ImageContent a;
  a.width = 2;
  a.height = 8;
  a.bytes = {1, 2, 3};

  ImageContent b = a;
  b.width = 8;
  b.height = 2;

  EXPECT_NE(hash_content(a).value(), hash_content(b).value());
}

// ============================================================================
// Random
// ============================================================================

TEST_F(SecurityTest, RandomBytesHaveRequestedLength) {
  auto bytes = random_bytes(32);
  EXPECT_EQ(bytes.size(), 32u);
  EXPECT_NE(random_bytes(32), bytes);
}
