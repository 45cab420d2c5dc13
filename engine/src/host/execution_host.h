#pragma once

#include <memory>

#include "config/sandbox_config.h"
#include "protocol/messages.h"

namespace slotbox {

/**
 * ExecutionHost runs slot code in an embedded QuickJS engine.
 *
 * Each Execute call gets a fresh context on a long-lived runtime:
 * - realm hardened before user code runs (no eval/Function/Date/Atomics/
 *   SharedArrayBuffer/WebAssembly globals, function-family `constructor`
 *   properties locked to undefined, Math replaced by a frozen copy without
 *   random)
 * - code compiled as the body of a strict function (input, params, utils),
 *   nested in a scope that shadows every forbidden global with undefined
 * - input and params passed as fresh copies, utils bound to the
 *   deterministic catalog with a per-call random stream
 * - interrupt handler enforces the request's timeoutMs
 * - heap and native stack capped by config
 *
 * Runs inside the worker process. Script faults come back as Failure;
 * host faults (runtime/context creation) throw std::runtime_error.
 * Not thread-safe: one host per thread.
 */
class ExecutionHost {
 public:
  explicit ExecutionHost(const SandboxConfig& config = SandboxConfig::Default());
  ~ExecutionHost();

  ExecutionHost(const ExecutionHost&) = delete;
  ExecutionHost& operator=(const ExecutionHost&) = delete;

  // Runs request.code; Success carries the JSON-serialized return value
  SlotResult Execute(const SlotRequest& request);

 private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace slotbox
