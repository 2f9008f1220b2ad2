#include <catch2/catch.hpp>
#include "align.hpp"

using namespace partbuf;

TEST_CASE("is_pow2 accepts powers of two only") {
  REQUIRE(is_pow2(1));
  REQUIRE(is_pow2(8));
  REQUIRE(is_pow2(1ull << 40));
  REQUIRE_FALSE(is_pow2(0));
  REQUIRE_FALSE(is_pow2(6));
  REQUIRE_FALSE(is_pow2(12));
}

TEST_CASE("align_up rounds to the next multiple") {
  REQUIRE(align_up(0, 8) == 0);
  REQUIRE(align_up(1, 8) == 8);
  REQUIRE(align_up(8, 8) == 8);
  REQUIRE(align_up(9, 8) == 16);
  REQUIRE(align_up(130, 64) == 192);
  REQUIRE(align_up(0xffffffffull, 8) == 0x100000000ull); // no 32-bit wrap
}

TEST_CASE("element_alignment never drops below the minimum") {
  REQUIRE(element_alignment(1) == MIN_ALIGNMENT);
  REQUIRE(element_alignment(2) == MIN_ALIGNMENT);
  REQUIRE(element_alignment(4) == MIN_ALIGNMENT);
  REQUIRE(element_alignment(8) == 8);
  REQUIRE(element_alignment(16) == 16);
}
