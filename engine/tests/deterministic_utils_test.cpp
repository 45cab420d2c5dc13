#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <cmath>
#include <limits>
#include <vector>

#include "utils/deterministic_utils.h"

using namespace slotbox;
using Catch::Approx;

TEST_CASE("Aggregate statistics", "[utils][stats]") {
  SECTION("sum and mean") {
    REQUIRE(utils::Sum({1, 2, 3, 4}) == 10.0);
    REQUIRE(utils::Mean({1, 2, 3, 4}) == 2.5);
  }

  SECTION("empty inputs") {
    REQUIRE(utils::Sum({}) == 0.0);
    REQUIRE(utils::Mean({}) == 0.0);
    REQUIRE(utils::Median({}) == 0.0);
    REQUIRE(utils::Stdev({}) == 0.0);
    REQUIRE(utils::Quantile({}, 0.5) == 0.0);
  }

  SECTION("median of odd and even counts") {
    REQUIRE(utils::Median({3, 1, 2}) == 2.0);
    REQUIRE(utils::Median({4, 1, 3, 2}) == 2.5);
  }

  SECTION("population standard deviation") {
    REQUIRE(utils::Stdev({2, 4, 4, 4, 5, 5, 7, 9}) == Approx(2.0));
    REQUIRE(utils::Stdev({5}) == 0.0);
  }

  SECTION("sum is a left-to-right reduce") {
    std::vector<double> values = {0.1, 0.2, 0.3};
    double expected = 0.0;
    for (double v : values) expected += v;
    REQUIRE(utils::Sum(values) == expected);
  }
}

TEST_CASE("Quantile interpolation", "[utils][quantile]") {
  std::vector<double> values = {4, 1, 3, 2};

  REQUIRE(utils::Quantile(values, 0.0) == 1.0);
  REQUIRE(utils::Quantile(values, 1.0) == 4.0);
  REQUIRE(utils::Quantile(values, 0.5) == 2.5);
  REQUIRE(utils::Quantile(values, 0.25) == Approx(1.75));

  SECTION("q is clamped") {
    REQUIRE(utils::Quantile(values, -3.0) == 1.0);
    REQUIRE(utils::Quantile(values, 7.0) == 4.0);
  }

  SECTION("single element for any q") {
    REQUIRE(utils::Quantile({9}, 0.9) == 9.0);
  }

  SECTION("NaN q") {
    REQUIRE(std::isnan(utils::Quantile(values, std::nan(""))));
  }
}

TEST_CASE("Min and max", "[utils][minmax]") {
  REQUIRE(utils::Min({3, -1, 2}) == -1.0);
  REQUIRE(utils::Max({3, -1, 2}) == 3.0);
  REQUIRE(utils::Min({}) == std::numeric_limits<double>::infinity());
  REQUIRE(utils::Max({}) == -std::numeric_limits<double>::infinity());
  REQUIRE(std::isnan(utils::Max({1, std::nan(""), 3})));
}

TEST_CASE("Scalar helpers", "[utils][math]") {
  REQUIRE(utils::Clamp(5, 0, 3) == 3.0);
  REQUIRE(utils::Clamp(-5, 0, 3) == 0.0);
  REQUIRE(utils::Clamp(1, 0, 3) == 1.0);
  REQUIRE(utils::Scale(5, 0, 10, 0, 100) == Approx(50.0));
  REQUIRE(utils::Log1p(0) == 0.0);
  REQUIRE(utils::Exp(0) == 1.0);
}

TEST_CASE("Fixed clock and date parsing", "[utils][time]") {
  REQUIRE(utils::Now() == kFixedNowMs);
  REQUIRE(utils::Now() == utils::Now());

  REQUIRE(utils::ParseUtc("1970-01-01") == 0.0);
  REQUIRE(utils::ParseUtc("2024-01-01") == 1704067200000.0);
  REQUIRE(utils::ParseUtc("2024-02-29") == 1709164800000.0);

  SECTION("invalid dates are NaN") {
    REQUIRE(std::isnan(utils::ParseUtc("2023-02-29")));
    REQUIRE(std::isnan(utils::ParseUtc("2024-13-01")));
    REQUIRE(std::isnan(utils::ParseUtc("2024/01/01")));
    REQUIRE(std::isnan(utils::ParseUtc("")));
  }
}

TEST_CASE("Rolling window ranges", "[utils][rolling]") {
  auto ranges = utils::RollingWindows(4, 2);
  REQUIRE(ranges.size() == 4);
  REQUIRE(ranges[0] == std::make_pair<size_t, size_t>(0, 1));
  REQUIRE(ranges[1] == std::make_pair<size_t, size_t>(0, 2));
  REQUIRE(ranges[2] == std::make_pair<size_t, size_t>(1, 3));
  REQUIRE(ranges[3] == std::make_pair<size_t, size_t>(2, 4));

  SECTION("zero window gives empty ranges") {
    for (const auto& [start, end] : utils::RollingWindows(3, 0)) {
      REQUIRE(start == end);
    }
  }
}

TEST_CASE("SeededRandom replays", "[utils][random]") {
  SeededRandom a;
  SeededRandom b;
  REQUIRE(a.Next() == Approx(206659.0 / 233280.0));
  b.Next();
  for (int i = 0; i < 100; ++i) {
    double v = a.Next();
    REQUIRE(v == b.Next());
    REQUIRE(v >= 0.0);
    REQUIRE(v < 1.0);
  }
}
