#include <catch2/catch.hpp>
#include <string>
#include "names.hpp"

using namespace partbuf;

TEST_CASE("is_valid_name accepts identifier-like names") {
  REQUIRE(is_valid_name("validName"));
  REQUIRE(is_valid_name("valid_name"));
  REQUIRE(is_valid_name("valid123"));
  REQUIRE(is_valid_name("_underscore"));
  REQUIRE(is_valid_name("$dollar"));
  REQUIRE(is_valid_name("a"));
  REQUIRE(is_valid_name("  padded  ")); // trimmed first
}

TEST_CASE("is_valid_name rejects bad characters and leading digits") {
  REQUIRE_FALSE(is_valid_name(""));
  REQUIRE_FALSE(is_valid_name("   "));
  REQUIRE_FALSE(is_valid_name("123invalid"));
  REQUIRE_FALSE(is_valid_name("invalid-name"));
  REQUIRE_FALSE(is_valid_name("invalid.name"));
  REQUIRE_FALSE(is_valid_name("invalid name"));
  REQUIRE_FALSE(is_valid_name("invalid@name"));
  REQUIRE_FALSE(is_valid_name("invalid/name"));
}

TEST_CASE("is_valid_name enforces the length limit") {
  REQUIRE(is_valid_name(std::string(255, 'a')));
  REQUIRE_FALSE(is_valid_name(std::string(256, 'a')));
}

TEST_CASE("forbidden names are rejected") {
  for (const char *n : {"name", "schema", "size", "isTag", "maxEntities", "get", "set",
                        "deleteProperty", "constructor", "__proto__", "toString", "valueOf"}) {
    REQUIRE(is_forbidden_name(n));
    REQUIRE(matches_name_pattern(n));
    REQUIRE_FALSE(is_valid_name(n));
  }
  REQUIRE_FALSE(is_forbidden_name("position"));
}
