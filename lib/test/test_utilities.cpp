#include "Lib.h"
#include "Utilities.h"
#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <limits>

namespace bz {
namespace utl {

// SHA-256 tests
TEST(Sha256Test, EmptyStringProducesKnownHash) {
  std::string hash = sha256("");
  EXPECT_EQ(hash, "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(Sha256Test, HelloWorldProducesKnownHash) {
  std::string hash = sha256("hello world");
  EXPECT_EQ(hash, "b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde9");
}

TEST(Sha256Test, OutputIsHexadecimal64Characters) {
  std::string hash = sha256("test");
  EXPECT_EQ(hash.size(), 64u);
  for (char c : hash) {
    EXPECT_TRUE((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'));
  }
}

TEST(HexTest, EncodesEachByteAsTwoLowercaseDigits) {
  EXPECT_EQ(hexEncode(""), "");
  EXPECT_EQ(hexEncode(std::string("\x00\xff\x1a", 3)), "00ff1a");
}

TEST(HexTest, JsonSafeStringKeepsPrintableText) {
  EXPECT_EQ(toJsonSafeString("lamp x2"), "lamp x2");
  EXPECT_EQ(toJsonSafeString(std::string("a\nb")), "0x610a62");
}

// Integer helpers
TEST(SafeAddTest, AddsWithinRange) {
  int64_t out = 0;
  EXPECT_TRUE(safeAdd(40, 2, out));
  EXPECT_EQ(out, 42);
  EXPECT_TRUE(safeAdd(std::numeric_limits<int64_t>::max(), 0, out));
  EXPECT_EQ(out, std::numeric_limits<int64_t>::max());
}

TEST(SafeAddTest, RejectsOverflowAndNegatives) {
  int64_t out = 7;
  EXPECT_FALSE(safeAdd(std::numeric_limits<int64_t>::max(), 1, out));
  EXPECT_FALSE(safeAdd(-1, 5, out));
  EXPECT_FALSE(safeAdd(5, -1, out));
  EXPECT_EQ(out, 7);
}

TEST(JoinTest, JoinsWithDelimiter) {
  EXPECT_EQ(join({}, ","), "");
  EXPECT_EQ(join({"a"}, ","), "a");
  EXPECT_EQ(join({"a", "b", "c"}, ", "), "a, b, c");
}

// JSON helpers
TEST(JsonTest, ParseJsonRequestRequiresType) {
  auto ok = parseJsonRequest(R"({"type":"get","id":"x"})");
  ASSERT_TRUE(ok.isOk());
  EXPECT_EQ(ok.value()["type"], "get");

  auto missing = parseJsonRequest(R"({"id":"x"})");
  ASSERT_TRUE(missing.isError());
  EXPECT_EQ(missing.error().code, 2);

  auto notObject = parseJsonRequest("[1,2]");
  ASSERT_TRUE(notObject.isError());
  EXPECT_EQ(notObject.error().code, 2);

  auto garbage = parseJsonRequest("{not json");
  ASSERT_TRUE(garbage.isError());
  EXPECT_EQ(garbage.error().code, 1);
}

TEST(JsonTest, LoadJsonFileReportsMissingAndMalformedFiles) {
  auto missing = loadJsonFile("definitely_missing_bazaar.json");
  ASSERT_TRUE(missing.isError());
  EXPECT_EQ(missing.error().code, 1);

  const std::string path = "bazaar_utilities_test.json";
  {
    std::ofstream out(path);
    out << "{\"rating\": ";
  }
  auto malformed = loadJsonFile(path);
  ASSERT_TRUE(malformed.isError());
  EXPECT_EQ(malformed.error().code, 3);

  {
    std::ofstream out(path);
    out << R"({"rating": {"min": 0}})";
  }
  auto good = loadJsonFile(path);
  ASSERT_TRUE(good.isOk());
  EXPECT_EQ(good.value()["rating"]["min"], 0);
  std::remove(path.c_str());
}

TEST(TimeTest, CurrentTimeIsMonotonicEnough) {
  int64_t first = getCurrentTimeMs();
  int64_t second = getCurrentTimeMs();
  EXPECT_GT(first, 0);
  EXPECT_GE(second, first);
}

}  // namespace utl

TEST(LibTest, BuildInfoNamesLibraryAndVersion) {
  EXPECT_EQ(Lib::getName(), "bazaar");
  EXPECT_EQ(Lib::getVersion(), "0.3.0");
  auto info = Lib::getBuildInfo();
  EXPECT_EQ(info["name"], Lib::getName());
  EXPECT_EQ(info["version"], Lib::getVersion());
  EXPECT_FALSE(info["sodium"].get<std::string>().empty());
}

}  // namespace bz
