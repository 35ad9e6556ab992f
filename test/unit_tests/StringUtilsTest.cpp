#include "TestHeaders.hpp"

using namespace tg;

TEST_CASE("split keeps empty middle fields", "[StringUtils]") {
  auto parts = split("a,,b", ',');

  REQUIRE(parts.size() == 3);
  REQUIRE(parts[0] == "a");
  REQUIRE(parts[1] == "");
  REQUIRE(parts[2] == "b");
}

TEST_CASE("split of an empty string is empty", "[StringUtils]") {
  REQUIRE(split("", ',').empty());
}

TEST_CASE("trim strips surrounding whitespace only", "[StringUtils]") {
  REQUIRE(trim("  hello world \r\n") == "hello world");
  REQUIRE(trim("\t") == "");
  REQUIRE(trim("") == "");
  REQUIRE(trim("x") == "x");
}

TEST_CASE("startsWith", "[StringUtils]") {
  REQUIRE(startsWith("sandbox-main", "sandbox-"));
  REQUIRE(startsWith("abc", ""));
  REQUIRE_FALSE(startsWith("sand", "sandbox-"));
  REQUIRE_FALSE(startsWith("xsandbox-", "sandbox-"));
}

TEST_CASE("splitList trims and drops empty entries", "[StringUtils]") {
  auto entries =
      splitList(" http://localhost:3000, ,https://example.com ,,");

  REQUIRE(entries.size() == 2);
  REQUIRE(entries[0] == "http://localhost:3000");
  REQUIRE(entries[1] == "https://example.com");
  REQUIRE(splitList("").empty());
}

TEST_CASE("GetTempDirectory ends with a slash", "[StringUtils]") {
  string dir = GetTempDirectory();

  REQUIRE_FALSE(dir.empty());
  REQUIRE(dir.back() == '/');
}
