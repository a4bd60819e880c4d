#include <gtest/gtest.h>
#include <vector>
#include "store/path_scheme.hpp"

using namespace golink::store;

namespace {

std::vector<std::string> segments(const std::filesystem::path& path) {
  std::vector<std::string> parts;
  for (const auto& part : path) {
    parts.push_back(part.string());
  }
  return parts;
}

} // namespace

TEST(PathSchemeTest, DefaultLengthShardsTwoLevels) {
  auto path = file_location("sha256", 5, "abcde");
  EXPECT_EQ(path, std::filesystem::path("sha256/l5/ab/cd/abcde"));
  EXPECT_EQ(segments(path), (std::vector<std::string>{"sha256", "l5", "ab", "cd", "abcde"}));
}

TEST(PathSchemeTest, ShortLengthsHaveNoShards) {
  EXPECT_EQ(file_location("sha256", 1, "a"), std::filesystem::path("sha256/l1/a"));
  EXPECT_EQ(file_location("sha256", 2, "ab"), std::filesystem::path("sha256/l2/ab"));
}

TEST(PathSchemeTest, ShardsStopBeforeLastTwoCharacters) {
  EXPECT_EQ(file_location("md5", 3, "abc"), std::filesystem::path("md5/l3/ab/abc"));
  EXPECT_EQ(file_location("md5", 4, "abcd"), std::filesystem::path("md5/l4/ab/abcd"));
  EXPECT_EQ(file_location("md5", 6, "abcdef"), std::filesystem::path("md5/l6/ab/cd/abcdef"));
  EXPECT_EQ(file_location("md5", 7, "abcdefg"), std::filesystem::path("md5/l7/ab/cd/ef/abcdefg"));
}

TEST(PathSchemeTest, IsDeterministic) {
  EXPECT_EQ(file_location("sha1", 8, "0123abcd"), file_location("sha1", 8, "0123abcd"));
  EXPECT_NE(file_location("sha1", 8, "0123abcd"), file_location("sha256", 8, "0123abcd"));
}

TEST(PathSchemeTest, ShortDigestDoesNotThrow) {
  std::filesystem::path path;
  ASSERT_NO_THROW(path = file_location("sha256", 5, "ab"));
  EXPECT_EQ(path.filename(), std::filesystem::path("ab"));
}
