#pragma once

#include <sys/types.h>

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

#include "config/sandbox_config.h"
#include "protocol/messages.h"

namespace slotbox {

/**
 * Parent-side handle of one forked worker process.
 *
 * The child runs an ExecutionHost in a loop: it reads a request frame,
 * executes, applies the output ceilings and answers with a response frame
 * carrying the same requestId. It never logs and exits when the channel
 * closes.
 *
 * Run() is called from one thread at a time (the owning lane). Kill() may
 * be called concurrently from any thread; it only delivers SIGKILL. Reaping
 * happens in Reap() or the destructor.
 *
 * A worker that was killed, crashed or produced a bad frame is Broken() and
 * must not be reused.
 */
class SlotWorker {
 public:
  using Clock = std::chrono::steady_clock;

  explicit SlotWorker(const SandboxConfig& config);
  ~SlotWorker();

  SlotWorker(const SlotWorker&) = delete;
  SlotWorker& operator=(const SlotWorker&) = delete;

  /**
   * Fork the child. Returns false with error_out on failure.
   */
  bool Start(std::string* error_out = nullptr);

  /**
   * Send one request and wait for its response until deadline.
   * Responses for other request ids are discarded. Past the deadline the
   * child is killed and EXECUTION_TIMEOUT is returned. Transport faults
   * come back as WORKER_ERROR.
   */
  SlotResult Run(uint64_t request_id, const SlotRequest& request, Clock::time_point deadline);

  // SIGKILL the child if it has not been reaped yet
  void Kill();

  // Kill and wait for the child; returns a description of how it ended
  std::string Reap();

  bool Alive() const;
  bool Broken() const { return broken_; }
  pid_t Pid() const;

 private:
  SandboxConfig config_;
  int fd_ = -1;
  bool broken_ = false;

  mutable std::mutex pid_mutex_;
  pid_t pid_ = -1;
  bool reaped_ = true;
};

}  // namespace slotbox
