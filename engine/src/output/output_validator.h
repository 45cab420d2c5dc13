#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "protocol/messages.h"

namespace slotbox {

// Hard ceilings; a schema may only lower them
constexpr int64_t kMaxOutputBytes = 1024 * 1024;
constexpr int64_t kMaxOutputArrayLength = 50000;

/**
 * JavaScript `typeof` of a JSON value ("object" for null, arrays and objects).
 */
std::string JsTypeOf(const nlohmann::json& value);

/**
 * Check a slot's return value against the caller's schema.
 *
 * No schema => ok. Otherwise every check runs and every failure is listed:
 * - typeof match                      (rule "output-type")
 * - non-optional properties present   (rule "output-missing-property";
 *   objects and arrays, where indices and `length` count)
 * - serialized size within ceiling    (rule "output-too-large")
 * - array length within ceiling       (rule "output-array-too-long")
 */
ValidationReport ValidateOutput(const nlohmann::json& value, const std::optional<Schema>& schema);

/**
 * ValidateOutput folded into the pipeline result: Success passes through,
 * a failed report becomes Failure{OUTPUT_VALIDATION_ERROR, phase output}.
 * Without a schema the size and array-length ceilings still apply.
 */
SlotResult CheckOutput(SlotResult result, const std::optional<Schema>& schema);

}  // namespace slotbox
