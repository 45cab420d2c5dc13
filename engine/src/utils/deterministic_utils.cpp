#include "utils/deterministic_utils.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace slotbox {

namespace {

std::vector<double> Sorted(const std::vector<double>& values) {
  std::vector<double> sorted = values;
  // NaN sorts last so the comparator stays a strict weak ordering
  std::sort(sorted.begin(), sorted.end(), [](double a, double b) {
    if (std::isnan(a)) return false;
    if (std::isnan(b)) return true;
    return a < b;
  });
  return sorted;
}

bool IsLeapYear(int64_t year) {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int DaysInMonth(int64_t year, int month) {
  static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month == 2 && IsLeapYear(year)) {
    return 29;
  }
  return kDays[month - 1];
}

// Days since 1970-01-01 for a proleptic Gregorian date (Hinnant's algorithm)
int64_t DaysFromCivil(int64_t y, int m, int d) {
  y -= m <= 2 ? 1 : 0;
  const int64_t era = (y >= 0 ? y : y - 399) / 400;
  const int64_t yoe = y - era * 400;
  const int64_t doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + doe - 719468;
}

bool ParseDigits(const std::string& s, size_t pos, size_t len, int64_t* out) {
  int64_t value = 0;
  for (size_t i = pos; i < pos + len; ++i) {
    if (s[i] < '0' || s[i] > '9') {
      return false;
    }
    value = value * 10 + (s[i] - '0');
  }
  *out = value;
  return true;
}

}  // namespace

namespace utils {

double Sum(const std::vector<double>& values) {
  double total = 0.0;
  for (double v : values) {
    total += v;
  }
  return total;
}

double Mean(const std::vector<double>& values) {
  if (values.empty()) {
    return 0.0;
  }
  return Sum(values) / static_cast<double>(values.size());
}

double Median(const std::vector<double>& values) {
  if (values.empty()) {
    return 0.0;
  }
  std::vector<double> sorted = Sorted(values);
  size_t mid = sorted.size() / 2;
  if (sorted.size() % 2 == 1) {
    return sorted[mid];
  }
  return (sorted[mid - 1] + sorted[mid]) / 2.0;
}

double Stdev(const std::vector<double>& values) {
  if (values.empty()) {
    return 0.0;
  }
  double m = Mean(values);
  std::vector<double> squared;
  squared.reserve(values.size());
  for (double v : values) {
    squared.push_back((v - m) * (v - m));
  }
  return std::sqrt(Mean(squared));
}

double Quantile(const std::vector<double>& values, double q) {
  if (values.empty()) {
    return 0.0;
  }
  if (values.size() == 1) {
    return values[0];
  }
  if (std::isnan(q)) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  q = std::clamp(q, 0.0, 1.0);

  std::vector<double> sorted = Sorted(values);
  double index = q * static_cast<double>(sorted.size() - 1);
  size_t lower = static_cast<size_t>(std::floor(index));
  size_t upper = static_cast<size_t>(std::ceil(index));
  double weight = index - std::floor(index);
  return sorted[lower] * (1.0 - weight) + sorted[upper] * weight;
}

double Min(const std::vector<double>& values) {
  double result = std::numeric_limits<double>::infinity();
  for (double v : values) {
    if (std::isnan(v)) {
      return v;
    }
    result = std::min(result, v);
  }
  return result;
}

double Max(const std::vector<double>& values) {
  double result = -std::numeric_limits<double>::infinity();
  for (double v : values) {
    if (std::isnan(v)) {
      return v;
    }
    result = std::max(result, v);
  }
  return result;
}

double Clamp(double value, double lo, double hi) {
  // Math.max(lo, Math.min(hi, value)); no lo <= hi precondition
  return std::max(lo, std::min(hi, value));
}

double Scale(double value, double in_min, double in_max, double out_min, double out_max) {
  return ((value - in_min) / (in_max - in_min)) * (out_max - out_min) + out_min;
}

double Log1p(double x) {
  return std::log1p(x);
}

double Exp(double x) {
  return std::exp(x);
}

double Now() {
  return kFixedNowMs;
}

double ParseUtc(const std::string& date) {
  const double kInvalid = std::numeric_limits<double>::quiet_NaN();
  if (date.size() != 10 || date[4] != '-' || date[7] != '-') {
    return kInvalid;
  }
  int64_t year = 0;
  int64_t month = 0;
  int64_t day = 0;
  if (!ParseDigits(date, 0, 4, &year) || !ParseDigits(date, 5, 2, &month) ||
      !ParseDigits(date, 8, 2, &day)) {
    return kInvalid;
  }
  if (month < 1 || month > 12 || day < 1 || day > DaysInMonth(year, static_cast<int>(month))) {
    return kInvalid;
  }
  int64_t days = DaysFromCivil(year, static_cast<int>(month), static_cast<int>(day));
  return static_cast<double>(days) * 86400000.0;
}

std::vector<std::pair<size_t, size_t>> RollingWindows(size_t count, size_t window) {
  std::vector<std::pair<size_t, size_t>> ranges;
  ranges.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    size_t start = i + 1 > window ? i + 1 - window : 0;
    ranges.emplace_back(start, i + 1);
  }
  return ranges;
}

}  // namespace utils

double SeededRandom::Next() {
  state_ = (state_ * 9301 + 49297) % 233280;
  return static_cast<double>(state_) / 233280.0;
}

}  // namespace slotbox
