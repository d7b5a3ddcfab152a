#include "uidgen/core/unique_id.h"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <sstream>
#include <vector>

using uidgen::core::UniqueId;

TEST_CASE("UniqueId orders by timestamp first", "[unique_id][ordering]") {
  CHECK(UniqueId{10, 20, 30} < UniqueId{12, 1, 2});
  CHECK(UniqueId{12, 1, 2} > UniqueId{10, 20, 30});
}

TEST_CASE("UniqueId tiebreaks equal timestamps on node address", "[unique_id][ordering]") {
  CHECK(UniqueId{10, 20, 30} < UniqueId{10, 21, 2});
}

TEST_CASE("UniqueId tiebreaks equal timestamp and node on sequence", "[unique_id][ordering]") {
  CHECK(UniqueId{10, 20, 30} < UniqueId{10, 20, 31});
}

TEST_CASE("UniqueId uses field-by-field equality", "[unique_id][equality]") {
  CHECK(UniqueId{10, 20, 30} == UniqueId{10, 20, 30});
  CHECK(UniqueId{10, 20, 30} != UniqueId{10, 20, 31});
  CHECK(UniqueId{10, 20, 30} != UniqueId{10, 21, 30});
  CHECK(UniqueId{10, 20, 30} != UniqueId{11, 20, 30});
}

TEST_CASE("compare returns sign of the three-field ordering", "[unique_id][ordering]") {
  CHECK(uidgen::core::compare(UniqueId{10, 20, 30}, UniqueId{12, 1, 2}) < 0);
  CHECK(uidgen::core::compare(UniqueId{12, 1, 2}, UniqueId{10, 20, 30}) > 0);
  CHECK(uidgen::core::compare(UniqueId{10, 20, 30}, UniqueId{10, 20, 30}) == 0);
}

TEST_CASE("Distinct field tuples never compare equal", "[unique_id][ordering]") {
  const std::vector<UniqueId> ids = {
      {1, 1, 1}, {1, 1, 2}, {1, 2, 1}, {2, 1, 1}, {-1, 1, 1}, {1, -1, 1},
  };
  for (std::size_t i = 0; i < ids.size(); ++i) {
    for (std::size_t j = 0; j < ids.size(); ++j) {
      CHECK((uidgen::core::compare(ids[i], ids[j]) == 0) == (i == j));
    }
  }
}

TEST_CASE("Sorting ids sorts by time, then node, then sequence", "[unique_id][ordering]") {
  std::vector<UniqueId> ids = {{12, 1, 2}, {10, 21, 2}, {10, 20, 31}, {10, 20, 30}};
  std::sort(ids.begin(), ids.end());

  const std::vector<UniqueId> expected = {{10, 20, 30}, {10, 20, 31}, {10, 21, 2}, {12, 1, 2}};
  CHECK(ids == expected);
}

TEST_CASE("String representation is dashes separating integers", "[unique_id][format]") {
  CHECK(UniqueId{1, 2, 3}.to_string() == "1-2-3");

  SECTION("No padding on large values") {
    CHECK(UniqueId{17000000000000000, 42, 0}.to_string() == "17000000000000000-42-0");
  }

  SECTION("Negative fields keep their sign") {
    CHECK(UniqueId{5, -7, 0}.to_string() == "5--7-0");
    CHECK(UniqueId{-5, 7, 1}.to_string() == "-5-7-1");
  }

  SECTION("Stream insertion uses the canonical form") {
    std::ostringstream oss;
    oss << UniqueId{1, 2, 3};
    CHECK(oss.str() == "1-2-3");
  }
}

TEST_CASE("Default-constructed UniqueId is all zeros", "[unique_id]") {
  constexpr UniqueId id;
  STATIC_CHECK(id.timestamp() == 0);
  STATIC_CHECK(id.node_address() == 0);
  STATIC_CHECK(id.sequence() == 0);
}
