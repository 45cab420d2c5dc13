#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace slotbox {

/**
 * Fixed instant returned by utils.now(): 2025-09-13T12:00:00Z in epoch ms.
 */
constexpr double kFixedNowMs = 1757764800000.0;

/**
 * Deterministic statistics/math/time catalog backing the sandbox `utils`
 * namespace. Every function is pure: no wall clock, no platform entropy.
 *
 * Sums are accumulated left to right so results are bit-identical to a
 * sequential reduce over the same input.
 */
namespace utils {

// Empty input -> 0
double Sum(const std::vector<double>& values);
double Mean(const std::vector<double>& values);
double Median(const std::vector<double>& values);

// Population standard deviation: sqrt(mean((v - mean)^2)). Empty -> 0.
double Stdev(const std::vector<double>& values);

/**
 * Quantile with linear interpolation between order statistics.
 * q is clamped to [0, 1]. A single element is returned for any q,
 * an empty sequence yields 0.
 */
double Quantile(const std::vector<double>& values, double q);

// Empty -> +Infinity / -Infinity (same as Math.min() / Math.max())
double Min(const std::vector<double>& values);
double Max(const std::vector<double>& values);

double Clamp(double value, double lo, double hi);
double Scale(double value, double in_min, double in_max, double out_min, double out_max);
double Log1p(double x);
double Exp(double x);

double Now();

/**
 * Parse "YYYY-MM-DD" to epoch milliseconds at UTC midnight.
 * Returns NaN when the string is not a valid calendar date.
 */
double ParseUtc(const std::string& date);

/**
 * Index ranges [start, end) of the trailing windows used by utils.rolling:
 * window i covers max(0, i - window + 1) .. i. A zero window yields empty ranges.
 */
std::vector<std::pair<size_t, size_t>> RollingWindows(size_t count, size_t window);

}  // namespace utils

/**
 * Linear-congruential generator behind utils.random().
 *
 * s = (s * 9301 + 49297) mod 233280, output s / 233280.
 * Not cryptographically secure. One instance per execution, always starting
 * from the fixed seed, so sequences replay identically.
 */
class SeededRandom {
 public:
  static constexpr uint32_t kSeed = 42;

  SeededRandom() = default;

  double Next();

 private:
  uint64_t state_ = kSeed;
};

}  // namespace slotbox
