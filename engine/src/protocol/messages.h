#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace slotbox {

constexpr int64_t kDefaultTimeoutMs = 1000;
// Upper bound on any timeoutMs (24 h); keeps deadline arithmetic in range
constexpr int64_t kMaxTimeoutMs = 24 * 60 * 60 * 1000;

/**
 * Stable error codes callers branch on.
 */
enum class ErrorKind {
  kValidationError,
  kExecutionError,
  kExecutionTimeout,
  kOutputValidationError,
  kWorkerError
};

/**
 * Pipeline phase a failure belongs to.
 */
enum class Phase {
  kValidation,
  kExecution,
  kOutput
};

std::string_view ErrorKindToString(ErrorKind kind);
std::optional<ErrorKind> ParseErrorKind(std::string_view s);

std::string_view PhaseToString(Phase phase);
std::optional<Phase> ParsePhase(std::string_view s);

/**
 * A single failed check, produced by either the code or the output validator.
 * line/column are 1-based; 0 when the rule has no source position.
 */
struct Violation {
  std::string rule_id;
  std::string message;
  int line = 0;
  int column = 0;
};

struct ValidationReport {
  bool ok = true;
  std::vector<Violation> violations;

  // Messages joined with "; " for Failure.message
  std::string Summary() const;
};

/**
 * Declared expectation for one output property.
 */
struct PropertySpec {
  bool optional = false;
};

/**
 * Caller-declared output shape. Describes a shape, not a type system.
 * max_bytes / max_array_length can only tighten the hard ceilings.
 */
struct Schema {
  std::optional<std::string> type;
  std::map<std::string, PropertySpec> properties;
  std::optional<int64_t> max_bytes;
  std::optional<int64_t> max_array_length;
};

struct SlotRequest {
  std::string slot_id;
  std::string code;
  nlohmann::json input;
  nlohmann::json params;
  std::optional<Schema> output_schema;
  int64_t timeout_ms = kDefaultTimeoutMs;
};

struct SlotSuccess {
  nlohmann::json data;
  double exec_time_ms = 0.0;
};

struct SlotFailure {
  ErrorKind code = ErrorKind::kWorkerError;
  std::string message;
  Phase phase = Phase::kExecution;
};

/**
 * Discriminated result of one slot call. Exactly one is produced per request.
 */
struct SlotResult {
  std::variant<SlotSuccess, SlotFailure> value;

  static SlotResult Success(nlohmann::json data, double exec_time_ms);
  static SlotResult Failure(ErrorKind code, std::string message, Phase phase);

  bool Ok() const { return std::holds_alternative<SlotSuccess>(value); }

  // Throws std::bad_variant_access when called on the other alternative
  const SlotSuccess& AsSuccess() const { return std::get<SlotSuccess>(value); }
  const SlotFailure& AsFailure() const { return std::get<SlotFailure>(value); }
};

/**
 * Per-call options for Dispatcher::RunSlot.
 * timeout_ms of 0 means "use the configured default"; otherwise it must be
 * in [1, kMaxTimeoutMs].
 */
struct RunOptions {
  int64_t timeout_ms = 0;
  std::optional<Schema> output_schema;
};

// Envelope codecs. Parse* return false and fill error_out on malformed input.

nlohmann::json SchemaToJson(const Schema& schema);
bool ParseSchema(const nlohmann::json& j, Schema& out, std::string* error_out = nullptr);

nlohmann::json RequestToJson(const SlotRequest& request);
bool ParseRequest(const nlohmann::json& j, SlotRequest& out, std::string* error_out = nullptr,
                  int64_t default_timeout_ms = kDefaultTimeoutMs);

nlohmann::json ResultToJson(const SlotResult& result);
bool ParseResult(const nlohmann::json& j, SlotResult& out, std::string* error_out = nullptr);

}  // namespace slotbox
