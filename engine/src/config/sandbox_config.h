#pragma once

#include <cstdint>
#include <string>

namespace slotbox {

/**
 * Engine-side settings for the slot sandbox.
 *
 * Every field has a working default; a config file only needs the keys it
 * overrides. A value of 0 for the rlimit fields means "no limit".
 */
struct SandboxConfig {
  // Number of dispatcher lanes (one worker process each)
  int lanes = 1;

  // Used when a request does not carry timeoutMs
  int64_t default_timeout_ms = 1000;

  // Caller-side watchdog margin on top of timeoutMs
  int64_t dispatch_grace_ms = 50;

  // QuickJS heap and native stack caps per worker runtime (0 = unlimited)
  int64_t memory_limit_bytes = 64 * 1024 * 1024;
  int64_t stack_limit_bytes = 1024 * 1024;

  // setrlimit caps applied in the forked worker
  int64_t worker_address_space_bytes = 0;
  int64_t worker_cpu_seconds = 0;

  // Largest frame accepted from a worker
  int64_t max_frame_bytes = 8 * 1024 * 1024;

  // Tracer events for the dispatcher built from this config; Tracer::SetEnabled
  // stays the process-wide switch
  bool trace = true;

  // Parse from JSON string
  static bool LoadFromJson(const std::string& json_str, SandboxConfig& out,
                           std::string* error_out = nullptr);

  // Parse from JSON file
  static bool LoadFromFile(const std::string& path, SandboxConfig& out,
                           std::string* error_out = nullptr);

  // Default config (used if no config file provided)
  static SandboxConfig Default();
};

}  // namespace slotbox
