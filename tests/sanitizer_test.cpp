#include <catch2/catch.hpp>

#include "sanitizer.hpp"
#include <string>

namespace {

bool only_allowed(const std::string &s) {
  for (char ch : s) {
    unsigned char c = static_cast<unsigned char>(ch);
    bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
              (c >= '0' && c <= '9') || c == ' ' || c == '\t' ||
              c == '\n' || c == '\v' || c == '\f' || c == '\r' ||
              c == '.' || c == ',' || c == '!' || c == '?' || c == '-';
    if (!ok)
      return false;
  }
  return true;
}

std::string every_byte() {
  std::string s;
  for (int c = 0; c < 256; ++c)
    s.push_back(static_cast<char>(c));
  return s;
}

}

TEST_CASE("sanitize strips symbols from log lines", "[sanitizer]") {
  REQUIRE(sanitize("") == "");
  REQUIRE(sanitize("###") == "");
  REQUIRE(sanitize("Log@123: failed!") == "Log123 failed!");
  REQUIRE(sanitize("rm -rf /tmp/*; echo $HOME") == "rm -rf tmp echo HOME");
  REQUIRE(sanitize("<speak><break time=\"3s\"/></speak>") ==
          "speakbreak time3sspeak");
}

TEST_CASE("sanitize keeps prose untouched", "[sanitizer]") {
  const std::string prose = "Access granted. User admin, session 42 - ok?\n"
                            "Retry!\tDone.";
  REQUIRE(sanitize(prose) == prose);
}

TEST_CASE("sanitize drops underscores and non-ASCII bytes", "[sanitizer]") {
  REQUIRE(sanitize("user_id") == "userid");
  REQUIRE(sanitize("caf\xc3\xa9 ok") == "caf ok");
}

TEST_CASE("sanitize output only holds allowed characters", "[sanitizer]") {
  auto input = GENERATE(std::string("Log@123: failed!"),
                        std::string("{\"ts\":1700000000,\"msg\":\"a|b\"}"),
                        std::string("0x7ffe`$(id)`&&|;"), every_byte());

  std::string once = sanitize(input);
  CHECK(only_allowed(once));
  CHECK(sanitize(once) == once);
}

TEST_CASE("sanitize of all bytes keeps exactly the allowed set", "[sanitizer]") {
  std::string kept = sanitize(every_byte());
  REQUIRE(kept.size() == 26 + 26 + 10 + 6 + 5);
}

TEST_CASE("trim removes surrounding whitespace only", "[sanitizer]") {
  REQUIRE(trim("") == "");
  REQUIRE(trim("   ") == "");
  REQUIRE(trim("\t\r\n") == "");
  REQUIRE(trim("  a b  ") == "a b");
  REQUIRE(trim("x") == "x");
}
