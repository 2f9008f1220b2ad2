#include <catch2/catch.hpp>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <random>
#include <unordered_map>
#include "errors.hpp"
#include "sparse_index.hpp"

using namespace partbuf;
using ET = ElementType;

namespace {
struct Store {
  alignas(8) std::byte bytes[1024] = {};
  ColumnView column(std::uint32_t length, ET type = ET::Int32) { return ColumnView(bytes, 0, length, type); }
};

bool all_zero(const ColumnView &v) {
  for (std::uint32_t i = 0; i < v.length(); ++i)
    if (v.get(i) != 0) return false;
  return true;
}
}

TEST_CASE("full index rejects new keys until one is erased") {
  Store st;
  HashedSparseIndex idx(st.column(2));
  REQUIRE(idx.set(1, 10));
  REQUIRE(idx.set(2, 20));
  REQUIRE_FALSE(idx.set(3, 30));
  REQUIRE_FALSE(idx.get(3).has_value());
  REQUIRE(idx.full());

  REQUIRE(idx.erase(1));
  REQUIRE_FALSE(idx.get(1).has_value());
  REQUIRE(idx.set(3, 30));
  REQUIRE(idx.get(3) == 30.0);
  REQUIRE(idx.get(2) == 20.0);
}

TEST_CASE("values land in the lowest free dense slots") {
  Store st;
  auto dense = st.column(4);
  HashedSparseIndex idx(dense);
  REQUIRE(idx.set(10, 42));
  REQUIRE(idx.set(20, 84));
  REQUIRE(dense.get(0) == 42);
  REQUIRE(dense.get(1) == 84);
  REQUIRE(idx.size() == 2);
}

TEST_CASE("setting a present key overwrites in place") {
  Store st;
  HashedSparseIndex idx(st.column(2));
  REQUIRE(idx.set(5, 1));
  REQUIRE(idx.set(5, 2));
  REQUIRE(idx.size() == 1);
  REQUIRE(idx.get(5) == 2.0);
  REQUIRE(idx.set(6, 3)); // second slot still free
}

TEST_CASE("bad keys are reported, not thrown") {
  Store st;
  auto dense = st.column(4);
  HashedSparseIndex idx(dense);
  REQUIRE_FALSE(idx.set(-2, 42));
  REQUIRE_FALSE(idx.get(-2).has_value());
  REQUIRE_FALSE(idx.erase(-2));
  REQUIRE_FALSE(idx.erase(999));
  REQUIRE_FALSE(idx.set(SparseIndex::MAX_SAFE_KEY + 1, 1));
  REQUIRE(idx.set(SparseIndex::MAX_SAFE_KEY, 1));
  REQUIRE(dense.get(1) == 0);
}

TEST_CASE("erase zeroes the freed slot") {
  Store st;
  auto dense = st.column(4);
  HashedSparseIndex idx(dense);
  REQUIRE(idx.set(7, 99));
  REQUIRE(idx.erase(7));
  REQUIRE(all_zero(dense));
  REQUIRE(idx.empty());
}

TEST_CASE("erasing the reserved key disposes the index") {
  Store st;
  auto dense = st.column(4);
  HashedSparseIndex idx(dense);
  REQUIRE(idx.set(10, 42));
  REQUIRE(idx.set(20, 84));
  REQUIRE(idx.erase(SparseIndex::DISPOSE_KEY));
  REQUIRE(all_zero(dense));
  REQUIRE_FALSE(idx.get(10).has_value());
  REQUIRE_FALSE(idx.get(20).has_value());
  REQUIRE(idx.size() == 0);

  // still usable afterwards, and dispose is idempotent
  idx.dispose();
  for (SparseIndex::Key k = 100; k < 104; ++k) REQUIRE(idx.set(k, 1));
  REQUIRE_FALSE(idx.set(200, 1));
}

TEST_CASE("zero-length columns cannot be indexed") {
  Store st;
  REQUIRE_THROWS_AS(HashedSparseIndex(st.column(0)), ValidationError);
  REQUIRE_THROWS_AS(BoundedSparseIndex(st.column(0), 10), ValidationError);
}

TEST_CASE("bounded index accepts keys up to max_key only") {
  Store st;
  BoundedSparseIndex idx(st.column(10, ET::Float32), 1000);
  REQUIRE(idx.bounded());
  REQUIRE(idx.set(100, 1.5));
  REQUIRE(idx.set(500, 3.5));
  REQUIRE(idx.set(1000, 5.5));
  REQUIRE(idx.get(1000) == 5.5);
  REQUIRE_FALSE(idx.set(1001, 6.5));
  REQUIRE_FALSE(idx.get(1001).has_value());
  REQUIRE_FALSE(idx.contains(1001));

  REQUIRE(idx.erase(100));
  REQUIRE_FALSE(idx.get(100).has_value());
  REQUIRE(idx.set(750, 7.5));
  REQUIRE(idx.get(750) == 7.5);
}

TEST_CASE("bounded index validates max_key") {
  Store st;
  REQUIRE_THROWS_AS(BoundedSparseIndex(st.column(4), -1), ValidationError);
  REQUIRE_THROWS_AS(BoundedSparseIndex(st.column(4), BoundedSparseIndex::MAX_BOUNDED_KEY + 1),
                    ValidationError);
  REQUIRE_NOTHROW(BoundedSparseIndex(st.column(4), 0));
}

TEST_CASE("bounded dispose forgets every key") {
  Store st;
  auto dense = st.column(3);
  BoundedSparseIndex idx(dense, 50);
  REQUIRE(idx.set(0, 1));
  REQUIRE(idx.set(25, 2));
  REQUIRE(idx.set(50, 3));
  idx.dispose();
  for (SparseIndex::Key k = 0; k <= 50; ++k) REQUIRE_FALSE(idx.contains(k));
  REQUIRE(all_zero(dense));
  REQUIRE(idx.set(49, 4));
}

TEST_CASE("make_sparse_index picks the mode from max_key") {
  Store st;
  auto hashed = make_sparse_index(st.column(4));
  auto bounded = make_sparse_index(ColumnView(st.bytes, 64, 4, ET::Int32), 99);
  REQUIRE_FALSE(hashed->bounded());
  REQUIRE(bounded->bounded());
  REQUIRE(hashed->capacity() == 4);
  REQUIRE(bounded->capacity() == 4);
}

TEST_CASE("for_each visits every present key once") {
  Store st;
  for (bool bounded : {false, true}) {
    auto idx = make_sparse_index(st.column(8), bounded ? std::optional<SparseIndex::Key>(100) : std::nullopt);
    idx->set(3, 30);
    idx->set(7, 70);
    idx->set(42, 420);
    idx->erase(7);
    std::map<SparseIndex::Key, double> seen;
    idx->for_each([&](SparseIndex::Key k, double v) { seen[k] = v; });
    REQUIRE(seen == std::map<SparseIndex::Key, double>{{3, 30}, {42, 420}});
    idx->dispose();
  }
}

TEST_CASE("both modes agree with a reference map under random churn") {
  std::mt19937_64 rng(4242);
  for (bool bounded : {false, true}) {
    Store st;
    auto dense = st.column(32, ET::Float64);
    auto idx = make_sparse_index(dense, bounded ? std::optional<SparseIndex::Key>(255) : std::nullopt);
    std::unordered_map<SparseIndex::Key, double> ref;
    std::uniform_int_distribution<int> op(0, 3);
    std::uniform_int_distribution<SparseIndex::Key> key(0, 255);
    for (int i = 0; i < 20000; ++i) {
      auto k = key(rng);
      switch (op(rng)) {
      case 0:
      case 1: {
        double v = static_cast<double>(i);
        bool ok = idx->set(k, v);
        bool expect = ref.count(k) || ref.size() < 32;
        REQUIRE(ok == expect);
        if (ok) ref[k] = v;
        break;
      }
      case 2:
        REQUIRE(idx->erase(k) == (ref.erase(k) == 1));
        break;
      default: {
        auto got = idx->get(k);
        auto it = ref.find(k);
        REQUIRE(got.has_value() == (it != ref.end()));
        if (got) REQUIRE(*got == it->second);
      }
      }
      REQUIRE(idx->size() == ref.size());
    }
  }
}
