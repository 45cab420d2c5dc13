#include "output/output_validator.h"

#include <algorithm>
#include <cctype>
#include <string>
#include <utility>

#include <fmt/format.h>

namespace slotbox {

std::string JsTypeOf(const nlohmann::json& value) {
  if (value.is_boolean()) {
    return "boolean";
  }
  if (value.is_number()) {
    return "number";
  }
  if (value.is_string()) {
    return "string";
  }
  // null, arrays, objects
  return "object";
}

namespace {

// Own properties of an array are its indices and `length`
bool HasProperty(const nlohmann::json& value, const std::string& key) {
  if (value.is_object()) {
    return value.contains(key);
  }
  if (key == "length") {
    return true;
  }
  bool digits = std::all_of(key.begin(), key.end(),
                            [](unsigned char c) { return std::isdigit(c) != 0; });
  if (key.empty() || key.size() > 10 || !digits || (key.size() > 1 && key[0] == '0')) {
    return false;
  }
  return std::stoull(key) < value.size();
}

}  // namespace

ValidationReport ValidateOutput(const nlohmann::json& value, const std::optional<Schema>& schema) {
  ValidationReport report;
  if (!schema) {
    return report;
  }

  auto fail = [&report](const char* rule_id, std::string message) {
    report.ok = false;
    report.violations.push_back(Violation{rule_id, std::move(message)});
  };

  if (schema->type) {
    std::string actual = JsTypeOf(value);
    if (actual != *schema->type) {
      fail("output-type", fmt::format("Expected output type {}, got {}", *schema->type, actual));
    }
  }

  if (!schema->properties.empty() && (value.is_object() || value.is_array())) {
    for (const auto& [key, spec] : schema->properties) {
      if (!spec.optional && !HasProperty(value, key)) {
        fail("output-missing-property", fmt::format("Missing required output property: {}", key));
      }
    }
  }

  if (value.is_array()) {
    int64_t max_length = kMaxOutputArrayLength;
    if (schema->max_array_length) {
      max_length = std::min(max_length, *schema->max_array_length);
    }
    int64_t length = static_cast<int64_t>(value.size());
    if (length > max_length) {
      fail("output-array-too-long",
           fmt::format("Output array too large ({} items, max {})", length, max_length));
    }
  }

  int64_t max_bytes = kMaxOutputBytes;
  if (schema->max_bytes) {
    max_bytes = std::min(max_bytes, *schema->max_bytes);
  }
  // Invalid UTF-8 cannot come out of the engine; replace rather than throw
  int64_t size = static_cast<int64_t>(
      value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace).size());
  if (size > max_bytes) {
    fail("output-too-large", fmt::format("Output size too large ({} bytes, max {})", size, max_bytes));
  }

  return report;
}

SlotResult CheckOutput(SlotResult result, const std::optional<Schema>& schema) {
  if (!result.Ok()) {
    return result;
  }
  // The ceilings hold even when the caller declared no shape
  std::optional<Schema> effective = schema ? schema : std::optional<Schema>(Schema{});
  ValidationReport report = ValidateOutput(result.AsSuccess().data, effective);
  if (report.ok) {
    return result;
  }
  return SlotResult::Failure(ErrorKind::kOutputValidationError, report.Summary(), Phase::kOutput);
}

}  // namespace slotbox
