#include "group_packing.hpp"

#include <catch2/catch_test_macros.hpp>

#include <vector>

using fixdec::detail::floor_div;
using fixdec::detail::group_weight;
using fixdec::detail::leading_pad;
using fixdec::detail::pack_groups;

namespace {

  std::vector<uint32_t>
  groups_of(const fixdec::detail::packed_groups& p) {
    return {p.groups.begin(), p.groups.begin() + p.ndigits};
  }

} // namespace

TEST_CASE("floor_div rounds toward negative infinity", "[group_packing]") {
  STATIC_REQUIRE(floor_div(17, 9) == 1);
  STATIC_REQUIRE(floor_div(18, 9) == 2);
  STATIC_REQUIRE(floor_div(0, 9) == 0);
  STATIC_REQUIRE(floor_div(-1, 9) == -1);
  STATIC_REQUIRE(floor_div(-9, 9) == -1);
  STATIC_REQUIRE(floor_div(-10, 9) == -2);
  STATIC_REQUIRE(floor_div(-18, 9) == -2);
  STATIC_REQUIRE(floor_div(-19, 9) == -3);
}

TEST_CASE("group_weight of a decimal exponent", "[group_packing]") {
  SECTION("units through 10^8 are group 0") {
    for (int w = 0; w <= 8; ++w) {
      CHECK(group_weight(w) == 0);
    }
  }
  CHECK(group_weight(9) == 1);
  CHECK(group_weight(17) == 1);
  CHECK(group_weight(18) == 2);
  SECTION("10^-1 through 10^-9 are group -1") {
    for (int w = -9; w <= -1; ++w) {
      CHECK(group_weight(w) == -1);
    }
  }
  CHECK(group_weight(-10) == -2);
  CHECK(group_weight(-1000) == -112);
  CHECK(group_weight(1034) == 114);
}

TEST_CASE("leading_pad aligns to group boundaries", "[group_packing]") {
  CHECK(leading_pad(0) == 8);
  CHECK(leading_pad(8) == 0);
  CHECK(leading_pad(9) == 8);
  CHECK(leading_pad(-1) == 0);
  CHECK(leading_pad(-9) == 8);
  CHECK(leading_pad(-10) == 0);
  SECTION("always within one group") {
    for (int w = -100; w <= 100; ++w) {
      INFO(w);
      int pad = leading_pad(w);
      CHECK(pad >= 0);
      CHECK(pad < fixdec::detail::group_digits);
    }
  }
}

TEST_CASE("pack_groups", "[group_packing]") {
  SECTION("single group integer") {
    auto p = pack_groups("123", "", 2);
    CHECK(p.weight == 0);
    CHECK(groups_of(p) == std::vector<uint32_t>{123});
  }
  SECTION("integer spanning two groups") {
    auto p = pack_groups("1234567890", "", 9);
    CHECK(p.weight == 1);
    CHECK(groups_of(p) == std::vector<uint32_t>{1, 234567890});
  }
  SECTION("integral and fractional digits") {
    auto p = pack_groups("1234", "56", 3);
    CHECK(p.weight == 0);
    CHECK(groups_of(p) == std::vector<uint32_t>{1234, 560000000});
  }
  SECTION("fraction only") {
    auto p = pack_groups("", "25", -1);
    CHECK(p.weight == -1);
    CHECK(groups_of(p) == std::vector<uint32_t>{250000000});
  }
  SECTION("trailing zero groups are trimmed without moving the weight") {
    auto p = pack_groups("1", "", 27);
    CHECK(p.weight == 3);
    CHECK(groups_of(p) == std::vector<uint32_t>{1});
  }
  SECTION("leading zero groups are trimmed and lower the weight") {
    auto p = pack_groups("", "0000000000000000001", -1);
    CHECK(p.weight == -3);
    CHECK(groups_of(p) == std::vector<uint32_t>{100000000});
  }
  SECTION("interior zero groups are kept") {
    auto p = pack_groups("1000000000000000001", "", 18);
    CHECK(p.weight == 2);
    CHECK(groups_of(p) == std::vector<uint32_t>{1, 0, 1});
  }
  SECTION("full precision fits the group array") {
    auto p = pack_groups("123456789012345678", "901234567890123456", 17);
    CHECK(p.weight == 1);
    CHECK(groups_of(p) == std::vector<uint32_t>{123456789, 12345678,
                                                901234567, 890123456});
    auto q = pack_groups("1", "23456789012345678901234567890123456", 0);
    CHECK(q.ndigits == 5);
    CHECK(groups_of(q) == std::vector<uint32_t>{1, 234567890, 123456789,
                                                12345678, 901234560});
  }
  SECTION("unused groups stay zero") {
    auto p = pack_groups("", "0000000001", -1);
    CHECK(p.ndigits == 1);
    CHECK(p.groups[1] == 0);
  }
}
