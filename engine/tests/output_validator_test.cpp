#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <string>

#include <nlohmann/json.hpp>

#include "output/output_validator.h"

using namespace slotbox;
using Catch::Matchers::ContainsSubstring;
using json = nlohmann::json;

namespace {

Schema ObjectSchema(std::initializer_list<std::pair<const char*, bool>> props) {
  Schema schema;
  schema.type = "object";
  for (const auto& [name, optional] : props) {
    schema.properties[name] = PropertySpec{optional};
  }
  return schema;
}

}  // namespace

TEST_CASE("JsTypeOf", "[output][typeof]") {
  REQUIRE(JsTypeOf(json(1)) == "number");
  REQUIRE(JsTypeOf(json(1.5)) == "number");
  REQUIRE(JsTypeOf(json("s")) == "string");
  REQUIRE(JsTypeOf(json(true)) == "boolean");
  REQUIRE(JsTypeOf(json(nullptr)) == "object");
  REQUIRE(JsTypeOf(json::array()) == "object");
  REQUIRE(JsTypeOf(json::object()) == "object");
}

TEST_CASE("ValidateOutput without schema", "[output][schema]") {
  REQUIRE(ValidateOutput(json(5), std::nullopt).ok);
}

TEST_CASE("ValidateOutput type and properties", "[output][schema]") {
  SECTION("matching type") {
    Schema schema;
    schema.type = "number";
    REQUIRE(ValidateOutput(json(5), schema).ok);
  }

  SECTION("type mismatch") {
    Schema schema;
    schema.type = "number";
    auto report = ValidateOutput(json("five"), schema);
    REQUIRE_FALSE(report.ok);
    REQUIRE(report.violations.size() == 1);
    REQUIRE(report.violations[0].message == "Expected output type number, got string");
  }

  SECTION("required properties") {
    Schema schema = ObjectSchema({{"total", false}, {"label", false}, {"note", true}});
    REQUIRE(ValidateOutput(json{{"total", 1}, {"label", "x"}}, schema).ok);

    auto report = ValidateOutput(json{{"total", 1}}, schema);
    REQUIRE_FALSE(report.ok);
    REQUIRE(report.violations.size() == 1);
    REQUIRE(report.violations[0].message == "Missing required output property: label");
  }

  SECTION("required properties on arrays") {
    Schema schema = ObjectSchema({{"0", false}, {"length", false}});
    REQUIRE(ValidateOutput(json::array({7}), schema).ok);

    auto empty = ValidateOutput(json::array(), schema);
    REQUIRE(empty.violations.size() == 1);
    REQUIRE(empty.violations[0].message == "Missing required output property: 0");

    Schema named = ObjectSchema({{"total", false}, {"1", false}});
    auto report = ValidateOutput(json{1, 2}, named);
    REQUIRE(report.violations.size() == 1);
    REQUIRE(report.violations[0].message == "Missing required output property: total");
  }

  SECTION("every failed check is listed") {
    Schema schema = ObjectSchema({{"a", false}, {"b", false}});
    auto report = ValidateOutput(json::object(), schema);
    REQUIRE(report.violations.size() == 2);
    REQUIRE(report.Summary() ==
            "Missing required output property: a; Missing required output property: b");
  }
}

TEST_CASE("ValidateOutput size ceilings", "[output][limits]") {
  Schema empty;

  SECTION("2 MiB string is too large") {
    json big = std::string(2 * 1024 * 1024, 'x');
    auto report = ValidateOutput(big, empty);
    REQUIRE_FALSE(report.ok);
    REQUIRE_THAT(report.violations[0].message, ContainsSubstring("Output size too large"));
  }

  SECTION("50,001 element array is too long") {
    json arr = json::array();
    for (int i = 0; i < 50001; ++i) arr.push_back(0);
    auto report = ValidateOutput(arr, empty);
    REQUIRE_FALSE(report.ok);
    REQUIRE(report.violations.size() == 1);
    REQUIRE(report.violations[0].message == "Output array too large (50001 items, max 50000)");
  }

  SECTION("50,000 elements is fine") {
    json arr = json::array();
    for (int i = 0; i < 50000; ++i) arr.push_back(0);
    REQUIRE(ValidateOutput(arr, empty).ok);
  }

  SECTION("schema may only tighten") {
    Schema tight;
    tight.max_bytes = 4;
    tight.max_array_length = 2;
    auto report = ValidateOutput(json{1, 2, 3}, tight);
    REQUIRE(report.violations.size() == 2);

    Schema loose;
    loose.max_array_length = 100000;
    json arr = json::array();
    for (int i = 0; i < 50001; ++i) arr.push_back(0);
    REQUIRE_FALSE(ValidateOutput(arr, loose).ok);
  }
}

TEST_CASE("CheckOutput folds into the result", "[output][pipeline]") {
  SECTION("success passes through") {
    auto result = CheckOutput(SlotResult::Success(json(5), 1.0), std::nullopt);
    REQUIRE(result.Ok());
    REQUIRE(result.AsSuccess().data == 5);
  }

  SECTION("failures pass through untouched") {
    auto failure = SlotResult::Failure(ErrorKind::kExecutionError, "boom", Phase::kExecution);
    auto result = CheckOutput(failure, std::nullopt);
    REQUIRE(result.AsFailure().code == ErrorKind::kExecutionError);
  }

  SECTION("ceilings apply without a schema") {
    auto result =
        CheckOutput(SlotResult::Success(json(std::string(2 * 1024 * 1024, 'x')), 1.0), std::nullopt);
    REQUIRE_FALSE(result.Ok());
    REQUIRE(result.AsFailure().code == ErrorKind::kOutputValidationError);
    REQUIRE(result.AsFailure().phase == Phase::kOutput);
  }

  SECTION("schema violation") {
    Schema schema = ObjectSchema({{"total", false}});
    auto result = CheckOutput(SlotResult::Success(json::object(), 1.0), schema);
    REQUIRE(result.AsFailure().message == "Missing required output property: total");
  }
}
