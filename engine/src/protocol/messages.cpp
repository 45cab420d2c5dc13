#include "protocol/messages.h"

#include <utility>

#include <fmt/format.h>

namespace slotbox {

std::string_view ErrorKindToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kValidationError:
      return "VALIDATION_ERROR";
    case ErrorKind::kExecutionError:
      return "EXECUTION_ERROR";
    case ErrorKind::kExecutionTimeout:
      return "EXECUTION_TIMEOUT";
    case ErrorKind::kOutputValidationError:
      return "OUTPUT_VALIDATION_ERROR";
    case ErrorKind::kWorkerError:
      return "WORKER_ERROR";
  }
  return "WORKER_ERROR";
}

std::optional<ErrorKind> ParseErrorKind(std::string_view s) {
  if (s == "VALIDATION_ERROR") return ErrorKind::kValidationError;
  if (s == "EXECUTION_ERROR") return ErrorKind::kExecutionError;
  if (s == "EXECUTION_TIMEOUT") return ErrorKind::kExecutionTimeout;
  if (s == "OUTPUT_VALIDATION_ERROR") return ErrorKind::kOutputValidationError;
  if (s == "WORKER_ERROR") return ErrorKind::kWorkerError;
  return std::nullopt;
}

std::string_view PhaseToString(Phase phase) {
  switch (phase) {
    case Phase::kValidation:
      return "validation";
    case Phase::kExecution:
      return "execution";
    case Phase::kOutput:
      return "output";
  }
  return "execution";
}

std::optional<Phase> ParsePhase(std::string_view s) {
  if (s == "validation") return Phase::kValidation;
  if (s == "execution") return Phase::kExecution;
  if (s == "output") return Phase::kOutput;
  return std::nullopt;
}

std::string ValidationReport::Summary() const {
  std::string summary;
  for (const auto& violation : violations) {
    if (!summary.empty()) {
      summary += "; ";
    }
    summary += violation.message;
  }
  return summary;
}

SlotResult SlotResult::Success(nlohmann::json data, double exec_time_ms) {
  return SlotResult{SlotSuccess{std::move(data), exec_time_ms}};
}

SlotResult SlotResult::Failure(ErrorKind code, std::string message, Phase phase) {
  return SlotResult{SlotFailure{code, std::move(message), phase}};
}

nlohmann::json SchemaToJson(const Schema& schema) {
  nlohmann::json j = nlohmann::json::object();
  if (schema.type) {
    j["type"] = *schema.type;
  }
  if (!schema.properties.empty()) {
    nlohmann::json props = nlohmann::json::object();
    for (const auto& [key, spec] : schema.properties) {
      nlohmann::json prop = nlohmann::json::object();
      if (spec.optional) {
        prop["optional"] = true;
      }
      props[key] = prop;
    }
    j["properties"] = props;
  }
  if (schema.max_bytes) {
    j["maxBytes"] = *schema.max_bytes;
  }
  if (schema.max_array_length) {
    j["maxArrayLength"] = *schema.max_array_length;
  }
  return j;
}

bool ParseSchema(const nlohmann::json& j, Schema& out, std::string* error_out) {
  if (!j.is_object()) {
    if (error_out) *error_out = "outputSchema must be an object";
    return false;
  }

  Schema schema;
  if (j.contains("type")) {
    if (!j["type"].is_string()) {
      if (error_out) *error_out = "outputSchema.type must be a string";
      return false;
    }
    schema.type = j["type"].get<std::string>();
  }

  if (j.contains("properties")) {
    const auto& props = j["properties"];
    if (!props.is_object()) {
      if (error_out) *error_out = "outputSchema.properties must be an object";
      return false;
    }
    for (const auto& [key, def] : props.items()) {
      PropertySpec spec;
      if (def.is_object() && def.contains("optional")) {
        if (!def["optional"].is_boolean()) {
          if (error_out) {
            *error_out = fmt::format("outputSchema.properties.{}.optional must be a boolean", key);
          }
          return false;
        }
        spec.optional = def["optional"].get<bool>();
      }
      schema.properties[key] = spec;
    }
  }

  for (const char* key : {"maxBytes", "maxArrayLength"}) {
    if (!j.contains(key)) {
      continue;
    }
    if (!j[key].is_number_integer() || j[key].get<int64_t>() < 0) {
      if (error_out) *error_out = fmt::format("outputSchema.{} must be a non-negative integer", key);
      return false;
    }
    int64_t value = j[key].get<int64_t>();
    if (std::string_view(key) == "maxBytes") {
      schema.max_bytes = value;
    } else {
      schema.max_array_length = value;
    }
  }

  out = std::move(schema);
  return true;
}

nlohmann::json RequestToJson(const SlotRequest& request) {
  nlohmann::json j;
  j["slotId"] = request.slot_id;
  j["code"] = request.code;
  j["input"] = request.input;
  j["params"] = request.params;
  if (request.output_schema) {
    j["outputSchema"] = SchemaToJson(*request.output_schema);
  }
  j["timeoutMs"] = request.timeout_ms;
  return j;
}

bool ParseRequest(const nlohmann::json& j, SlotRequest& out, std::string* error_out,
                  int64_t default_timeout_ms) {
  if (!j.is_object()) {
    if (error_out) *error_out = "Request envelope must be an object";
    return false;
  }
  if (!j.contains("slotId") || !j["slotId"].is_string()) {
    if (error_out) *error_out = "Request envelope requires string 'slotId'";
    return false;
  }
  if (!j.contains("code") || !j["code"].is_string()) {
    if (error_out) *error_out = "Request envelope requires string 'code'";
    return false;
  }

  SlotRequest request;
  request.slot_id = j["slotId"].get<std::string>();
  request.code = j["code"].get<std::string>();
  request.input = j.value("input", nlohmann::json());
  request.params = j.value("params", nlohmann::json::object());
  request.timeout_ms = default_timeout_ms;

  if (j.contains("timeoutMs") && !j["timeoutMs"].is_null()) {
    const auto& timeout = j["timeoutMs"];
    // Unsigned values past int64 range wrap negative and are rejected too
    if (!timeout.is_number_integer() || timeout.get<int64_t>() <= 0 ||
        timeout.get<int64_t>() > kMaxTimeoutMs) {
      if (error_out) {
        *error_out = fmt::format("timeoutMs must be an integer in [1, {}]", kMaxTimeoutMs);
      }
      return false;
    }
    request.timeout_ms = timeout.get<int64_t>();
  }

  if (j.contains("outputSchema") && !j["outputSchema"].is_null()) {
    Schema schema;
    if (!ParseSchema(j["outputSchema"], schema, error_out)) {
      return false;
    }
    request.output_schema = std::move(schema);
  }

  out = std::move(request);
  return true;
}

nlohmann::json ResultToJson(const SlotResult& result) {
  nlohmann::json j;
  if (result.Ok()) {
    const auto& success = result.AsSuccess();
    j["ok"] = true;
    j["data"] = success.data;
    j["execTimeMs"] = success.exec_time_ms;
    return j;
  }
  const auto& failure = result.AsFailure();
  j["ok"] = false;
  j["error"] = {
      {"code", std::string(ErrorKindToString(failure.code))},
      {"message", failure.message},
      {"phase", std::string(PhaseToString(failure.phase))},
  };
  return j;
}

bool ParseResult(const nlohmann::json& j, SlotResult& out, std::string* error_out) {
  if (!j.is_object() || !j.contains("ok") || !j["ok"].is_boolean()) {
    if (error_out) *error_out = "Response envelope requires boolean 'ok'";
    return false;
  }

  if (j["ok"].get<bool>()) {
    double exec_time_ms = 0.0;
    if (j.contains("execTimeMs") && j["execTimeMs"].is_number()) {
      exec_time_ms = j["execTimeMs"].get<double>();
    }
    out = SlotResult::Success(j.value("data", nlohmann::json()), exec_time_ms);
    return true;
  }

  if (!j.contains("error") || !j["error"].is_object()) {
    if (error_out) *error_out = "Failure envelope requires 'error' object";
    return false;
  }
  try {
    const auto& error = j["error"];
    auto code = ParseErrorKind(error.value("code", ""));
    auto phase = ParsePhase(error.value("phase", ""));
    if (!code || !phase) {
      if (error_out) *error_out = "Failure envelope has unknown error code or phase";
      return false;
    }
    out = SlotResult::Failure(*code, error.value("message", ""), *phase);
    return true;
  } catch (const std::exception& e) {
    if (error_out) *error_out = std::string("Malformed failure envelope: ") + e.what();
    return false;
  }
}

}  // namespace slotbox
