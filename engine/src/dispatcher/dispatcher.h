#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "config/sandbox_config.h"
#include "protocol/messages.h"

namespace slotbox {

class SlotWorker;

/**
 * Counters over the dispatcher's lifetime.
 */
struct DispatcherStats {
  uint64_t calls = 0;
  uint64_t succeeded = 0;
  uint64_t validation_errors = 0;
  uint64_t execution_errors = 0;
  uint64_t timeouts = 0;
  uint64_t output_errors = 0;
  uint64_t worker_errors = 0;
  // Calls answered by the watchdog before their lane could
  uint64_t watchdog_expirations = 0;
  uint64_t workers_spawned = 0;
  uint64_t workers_discarded = 0;
};

/**
 * Dispatcher - single entry point for running slots.
 *
 * Calls queue FIFO and are picked up by a fixed pool of lanes. Each lane is
 * a thread owning at most one worker process, created lazily and reused
 * until a timeout or worker fault discards it. A lane runs one call at a
 * time, so a worker never has more than one call in flight.
 *
 * When a lane picks up a call it arms a watchdog deadline of
 * timeoutMs + dispatch_grace_ms. Whichever of the lane and the watchdog
 * resolves first wins; the future is resolved exactly once.
 *
 * Thread-safe. Futures never throw: every fault is a Failure value.
 */
class Dispatcher {
 public:
  explicit Dispatcher(const SandboxConfig& config = SandboxConfig::Default());
  ~Dispatcher();

  Dispatcher(const Dispatcher&) = delete;
  Dispatcher& operator=(const Dispatcher&) = delete;

  /**
   * Queue one slot call.
   * options.timeout_ms of 0 uses config.default_timeout_ms.
   */
  std::future<SlotResult> RunSlot(const std::string& slot_id,
                                  const std::string& code,
                                  nlohmann::json input,
                                  nlohmann::json params,
                                  const RunOptions& options = RunOptions());

  // Same as RunSlot with a prebuilt request; timeout_ms of 0 uses the default
  std::future<SlotResult> Submit(SlotRequest request);

  DispatcherStats Stats() const;

  const SandboxConfig& Config() const { return config_; }

 private:
  using Clock = std::chrono::steady_clock;

  struct PendingCall;
  struct Lane;

  void LaneLoop(Lane* lane);
  void Process(Lane* lane, const std::shared_ptr<PendingCall>& call);
  SlotResult Execute(Lane* lane, const PendingCall& call, Clock::time_point deadline);
  bool EnsureWorker(Lane* lane, std::string* error_out);
  void DiscardWorker(Lane* lane, const std::string& reason);

  // Resolves the call if nobody did yet; records stats and the trace line
  bool Finish(const std::shared_ptr<PendingCall>& call, SlotResult result, int lane);

  void Arm(const std::shared_ptr<PendingCall>& call, Lane* lane, Clock::time_point deadline);
  void Disarm(uint64_t request_id);
  void WatchdogLoop();
  void Expire(const std::shared_ptr<PendingCall>& call, Lane* lane);

  SandboxConfig config_;
  std::atomic<uint64_t> next_request_id_{1};

  // Call queue
  std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
  std::deque<std::shared_ptr<PendingCall>> queue_;
  bool stopping_ = false;

  std::vector<std::unique_ptr<Lane>> lanes_;

  // Watchdog
  struct Armed {
    std::shared_ptr<PendingCall> call;
    Lane* lane;
  };
  std::mutex watch_mutex_;
  std::condition_variable watch_cv_;
  std::multimap<Clock::time_point, Armed> armed_;
  bool watch_stopping_ = false;
  std::thread watchdog_;

  mutable std::mutex stats_mutex_;
  DispatcherStats stats_;
};

}  // namespace slotbox
