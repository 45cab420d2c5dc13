#include "config/sandbox_config.h"

#include <fstream>
#include <sstream>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "protocol/messages.h"

namespace slotbox {

namespace {

// Reads an integer field that must be >= min_value when present
bool ReadInt(const nlohmann::json& j, const char* key, int64_t min_value, int64_t* out,
             std::string* error_out) {
  if (!j.contains(key)) {
    return true;
  }
  const auto& value = j[key];
  if (!value.is_number_integer()) {
    if (error_out) *error_out = fmt::format("'{}' must be an integer", key);
    return false;
  }
  int64_t v = value.get<int64_t>();
  if (v < min_value) {
    if (error_out) *error_out = fmt::format("'{}' must be >= {} (got {})", key, min_value, v);
    return false;
  }
  *out = v;
  return true;
}

}  // namespace

SandboxConfig SandboxConfig::Default() {
  return SandboxConfig{};
}

bool SandboxConfig::LoadFromJson(const std::string& json_str, SandboxConfig& out,
                                 std::string* error_out) {
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(json_str);
  } catch (const std::exception& e) {
    if (error_out) *error_out = std::string("JSON parse error: ") + e.what();
    return false;
  }
  if (!j.is_object()) {
    if (error_out) *error_out = "Sandbox config must be a JSON object";
    return false;
  }

  SandboxConfig config = Default();
  int64_t lanes = config.lanes;
  if (!ReadInt(j, "lanes", 1, &lanes, error_out) ||
      !ReadInt(j, "default_timeout_ms", 1, &config.default_timeout_ms, error_out) ||
      !ReadInt(j, "dispatch_grace_ms", 0, &config.dispatch_grace_ms, error_out) ||
      !ReadInt(j, "memory_limit_bytes", 0, &config.memory_limit_bytes, error_out) ||
      !ReadInt(j, "stack_limit_bytes", 0, &config.stack_limit_bytes, error_out) ||
      !ReadInt(j, "worker_address_space_bytes", 0, &config.worker_address_space_bytes,
               error_out) ||
      !ReadInt(j, "worker_cpu_seconds", 0, &config.worker_cpu_seconds, error_out) ||
      !ReadInt(j, "max_frame_bytes", 1, &config.max_frame_bytes, error_out)) {
    return false;
  }
  if (config.default_timeout_ms > kMaxTimeoutMs || config.dispatch_grace_ms > kMaxTimeoutMs) {
    if (error_out) {
      *error_out = fmt::format("'default_timeout_ms' and 'dispatch_grace_ms' must be <= {}",
                               kMaxTimeoutMs);
    }
    return false;
  }
  if (lanes > 64) {
    if (error_out) *error_out = fmt::format("'lanes' must be <= 64 (got {})", lanes);
    return false;
  }
  config.lanes = static_cast<int>(lanes);

  if (j.contains("trace")) {
    if (!j["trace"].is_boolean()) {
      if (error_out) *error_out = "'trace' must be a boolean";
      return false;
    }
    config.trace = j["trace"].get<bool>();
  }

  out = config;
  return true;
}

bool SandboxConfig::LoadFromFile(const std::string& path, SandboxConfig& out,
                                 std::string* error_out) {
  std::ifstream file(path);
  if (!file.is_open()) {
    if (error_out) *error_out = "Failed to open sandbox config: " + path;
    return false;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return LoadFromJson(buffer.str(), out, error_out);
}

}  // namespace slotbox
