#include <catch2/catch_test_macros.hpp>
#include "zia/utils.hpp"

#include <set>
#include <string>

using namespace zia;

namespace {

bool utf8(const std::string& s) {
  return is_valid_utf8(reinterpret_cast<const uint8_t*>(s.data()), s.size());
}

}  // namespace

TEST_CASE("UTF-8 - ASCII and empty", "[utils]") {
  REQUIRE(utf8(""));
  REQUIRE(utf8("going away"));
}

TEST_CASE("UTF-8 - multi-byte sequences", "[utils]") {
  REQUIRE(utf8("\xC3\xA9"));              // U+00E9
  REQUIRE(utf8("\xE2\x82\xAC"));          // U+20AC
  REQUIRE(utf8("\xF0\x9F\x98\x80"));      // U+1F600
  REQUIRE(utf8("caf\xC3\xA9 \xE2\x82\xAC"));
  REQUIRE(utf8("\xF4\x8F\xBF\xBF"));      // U+10FFFF
}

TEST_CASE("UTF-8 - malformed sequences", "[utils]") {
  REQUIRE_FALSE(utf8("\xC3\x28"));        // bad continuation
  REQUIRE_FALSE(utf8("\x80"));            // stray continuation
  REQUIRE_FALSE(utf8("\xE2\x82"));        // truncated
  REQUIRE_FALSE(utf8("\xF8\x88\x80\x80\x80"));
  REQUIRE_FALSE(utf8("\xFF"));
}

TEST_CASE("UTF-8 - overlong, surrogate and out of range", "[utils]") {
  REQUIRE_FALSE(utf8("\xC0\xAF"));        // overlong '/'
  REQUIRE_FALSE(utf8("\xE0\x80\xAF"));
  REQUIRE_FALSE(utf8("\xED\xA0\x80"));    // U+D800
  REQUIRE_FALSE(utf8("\xF4\x90\x80\x80"));  // U+110000
}

TEST_CASE("random_u32 varies between calls", "[utils]") {
  std::set<uint32_t> seen;
  for (int i = 0; i < 16; ++i) {
    seen.insert(random_u32());
  }
  REQUIRE(seen.size() > 1);
}
