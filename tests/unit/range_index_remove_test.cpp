#include <catch2/catch_test_macros.hpp>

#include <limits>
#include <string>
#include <vector>

#include "rangevec/range_index.hpp"

using rangevec::RangeIndex;

namespace {

RangeIndex<std::string> three_pairs() {
  RangeIndex<std::string> h(100);
  REQUIRE(h.insert("hello", 8, 2).has_value());
  REQUIRE(h.insert("hello", 10, 2).has_value());
  REQUIRE(h.insert("hello", 12, 2).has_value());
  REQUIRE(h.size() == 3);
  return h;
}

} // namespace

TEST_CASE("remove from the start and the middle of an entry", "[range_index][remove]") {
  auto h = three_pairs();

  auto e = h.remove(10);
  REQUIRE(e.has_value());
  REQUIRE(e->value == "hello");
  REQUIRE(e->start == 10);
  REQUIRE(e->size == 2);
  REQUIRE(h.size() == 2);
  REQUIRE(h.get(10) == nullptr);
  REQUIRE(h.get(11) == nullptr);

  REQUIRE(h.insert("hello", 10, 2).has_value());
  REQUIRE(h.size() == 3);

  e = h.remove(11);
  REQUIRE(e.has_value());
  REQUIRE(e->start == 10);
  REQUIRE(e->size == 2);
  REQUIRE(h.size() == 2);

  // Nothing left at 11.
  REQUIRE_FALSE(h.remove(11).has_value());
  REQUIRE(h.size() == 2);

  e = h.remove(13);
  REQUIRE(e.has_value());
  REQUIRE(e->start == 12);
  REQUIRE(h.size() == 1);

  REQUIRE(h.remove(8).has_value());
  REQUIRE(h.empty());
  REQUIRE(h.get(8) == nullptr);
  REQUIRE(h.get(9) == nullptr);
}

TEST_CASE("remove hands the value back and frees the span", "[range_index][remove]") {
  RangeIndex<std::string> h(10);
  REQUIRE(h.insert("c", 0, 3).has_value());
  auto e = h.remove(1);
  REQUIRE(e.has_value());
  REQUIRE(e->value == "c");
  REQUIRE(h.get(0) == nullptr);
  REQUIRE(h.insert("d", 1, 2).has_value());
}

TEST_CASE("remove in a gap or past max_size is absence", "[range_index][remove]") {
  RangeIndex<std::string> h(10);
  REQUIRE(h.insert("a", 2, 2).has_value());
  REQUIRE_FALSE(h.remove(0).has_value());
  REQUIRE_FALSE(h.remove(4).has_value());
  REQUIRE_FALSE(h.remove(10).has_value());
  REQUIRE(h.size() == 1);
}

TEST_CASE("remove_range removes touched entries in order", "[range_index][remove]") {
  SECTION("window aligned with the first two entries") {
    auto h = three_pairs();
    auto removed = h.remove_range(8, 4);
    REQUIRE(h.size() == 1);
    REQUIRE(removed.size() == 2);
    REQUIRE(removed[0].start == 8);
    REQUIRE(removed[0].size == 2);
    REQUIRE(removed[1].start == 10);
    REQUIRE(removed[1].value == "hello");
    REQUIRE(h.get_exact(12) != nullptr);
  }
  SECTION("window starting inside the first entry") {
    auto h = three_pairs();
    auto removed = h.remove_range(9, 2);
    REQUIRE(h.size() == 1);
    REQUIRE(removed.size() == 2);
    REQUIRE(removed[0].start == 8);
    REQUIRE(removed[1].start == 10);
  }
  SECTION("window much larger than the index") {
    auto h = three_pairs();
    auto removed = h.remove_range(0, 1000);
    REQUIRE(h.empty());
    REQUIRE(removed.size() == 3);
    REQUIRE(removed[2].start == 12);
  }
  SECTION("window length that would wrap past SIZE_MAX") {
    auto h = three_pairs();
    auto removed = h.remove_range(5, std::numeric_limits<std::size_t>::max());
    REQUIRE(h.empty());
    REQUIRE(removed.size() == 3);
    REQUIRE(removed[0].start == 8);
    REQUIRE(removed[2].start == 12);

    auto g = three_pairs();
    REQUIRE(g.remove_range(11, std::numeric_limits<std::size_t>::max() - 3).size() == 2);
    REQUIRE(g.get_exact(8) != nullptr);
  }
  SECTION("window in a gap or of zero length") {
    auto h = three_pairs();
    REQUIRE(h.remove_range(0, 8).empty());
    REQUIRE(h.remove_range(14, 50).empty());
    REQUIRE(h.remove_range(10, 0).empty());
    REQUIRE(h.size() == 3);
  }
}
