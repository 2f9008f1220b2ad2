#include <catch2/catch.hpp>
#include <cstdint>
#include <random>
#include <unordered_map>
#include "hash.hpp"

using namespace partbuf;

TEST_CASE("KeySlotMap agrees with std::unordered_map under random ops") {
  std::mt19937_64 rng(12345);
  KeySlotMap hm;
  std::unordered_map<std::uint64_t, std::uint32_t> m;
  std::uniform_int_distribution<int> op(0, 2); // 0:insert,1:erase,2:find
  for (int i = 0; i < 50000; ++i) {
    auto k = rng() & ((1ull << 12) - 1); // collide a lot
    int o = op(rng);
    if (o == 0) {
      auto s = static_cast<std::uint32_t>(k * 3);
      bool fresh = hm.insert(k, s);
      REQUIRE(fresh == (m.find(k) == m.end()));
      m[k] = s;
    } else if (o == 1) {
      REQUIRE(hm.erase(k) == (m.erase(k) == 1));
    } else {
      auto r = hm.find(k);
      auto it = m.find(k);
      REQUIRE(r.has_value() == (it != m.end()));
      if (r) REQUIRE(*r == it->second);
    }
    REQUIRE(hm.size() == m.size());
  }
}

TEST_CASE("KeySlotMap insert/erase churn does not grow the table") {
  KeySlotMap hm(16);
  const auto cap = hm.capacity();
  for (std::uint64_t k = 0; k < 100000; ++k) {
    REQUIRE(hm.insert(k, 1));
    REQUIRE(hm.erase(k));
  }
  REQUIRE(hm.empty());
  REQUIRE(hm.capacity() == cap);
  REQUIRE_FALSE(hm.find(99999).has_value());
}

TEST_CASE("KeySlotMap clear keeps capacity and forgets keys") {
  KeySlotMap hm;
  for (std::uint64_t k = 0; k < 1000; ++k) hm.insert(k, static_cast<std::uint32_t>(k));
  const auto cap = hm.capacity();
  hm.clear();
  REQUIRE(hm.size() == 0);
  REQUIRE(hm.capacity() == cap);
  REQUIRE_FALSE(hm.contains(10));
  int visited = 0;
  hm.for_each([&](std::uint64_t, std::uint32_t) { ++visited; });
  REQUIRE(visited == 0);
}
