#include "dispatcher/dispatcher.h"

#include <algorithm>
#include <exception>
#include <utility>

#include <fmt/format.h>

#include "logging/trace.h"
#include "validator/code_validator.h"
#include "worker/slot_worker.h"

namespace slotbox {

/**
 * One queued call. Shared between the queue, a lane and the watchdog;
 * the promise is fulfilled by whichever resolves first.
 */
struct Dispatcher::PendingCall {
  uint64_t request_id = 0;
  SlotRequest request;
  std::promise<SlotResult> promise;
  std::atomic<bool> resolved{false};
  Clock::time_point picked_up;

  bool Resolve(SlotResult result) {
    bool expected = false;
    if (!resolved.compare_exchange_strong(expected, true)) {
      return false;
    }
    promise.set_value(std::move(result));
    return true;
  }
};

struct Dispatcher::Lane {
  int index = 0;
  std::thread thread;

  // Guards worker and active_request against the watchdog
  std::mutex mutex;
  std::unique_ptr<SlotWorker> worker;
  uint64_t active_request = 0;
};

namespace {

SlotResult ShutdownFailure() {
  return SlotResult::Failure(ErrorKind::kWorkerError, "Dispatcher is shutting down",
                             Phase::kExecution);
}

bool DiscardsWorker(const SlotResult& result) {
  if (result.Ok()) return false;
  ErrorKind code = result.AsFailure().code;
  return code == ErrorKind::kExecutionTimeout || code == ErrorKind::kWorkerError;
}

}  // namespace

Dispatcher::Dispatcher(const SandboxConfig& config) : config_(config) {
  int lane_count = std::max(1, config_.lanes);
  for (int i = 0; i < lane_count; ++i) {
    auto lane = std::make_unique<Lane>();
    lane->index = i;
    lanes_.push_back(std::move(lane));
  }
  watchdog_ = std::thread(&Dispatcher::WatchdogLoop, this);
  for (auto& lane : lanes_) {
    lane->thread = std::thread(&Dispatcher::LaneLoop, this, lane.get());
  }
}

Dispatcher::~Dispatcher() {
  std::deque<std::shared_ptr<PendingCall>> abandoned;
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    stopping_ = true;
    abandoned.swap(queue_);
  }
  queue_cv_.notify_all();
  for (auto& call : abandoned) {
    Finish(call, ShutdownFailure(), -1);
  }

  // In-flight calls see their worker die and come back as WORKER_ERROR
  for (auto& lane : lanes_) {
    std::lock_guard<std::mutex> lock(lane->mutex);
    if (lane->worker) lane->worker->Kill();
  }
  for (auto& lane : lanes_) {
    if (lane->thread.joinable()) lane->thread.join();
  }

  {
    std::lock_guard<std::mutex> lock(watch_mutex_);
    watch_stopping_ = true;
  }
  watch_cv_.notify_all();
  if (watchdog_.joinable()) watchdog_.join();

  for (auto& lane : lanes_) {
    if (lane->worker) {
      DiscardWorker(lane.get(), "shutdown");
    }
  }
}

std::future<SlotResult> Dispatcher::RunSlot(const std::string& slot_id,
                                            const std::string& code,
                                            nlohmann::json input,
                                            nlohmann::json params,
                                            const RunOptions& options) {
  SlotRequest request;
  request.slot_id = slot_id;
  request.code = code;
  request.input = std::move(input);
  request.params = std::move(params);
  request.output_schema = options.output_schema;
  request.timeout_ms = options.timeout_ms;
  return Submit(std::move(request));
}

std::future<SlotResult> Dispatcher::Submit(SlotRequest request) {
  auto call = std::make_shared<PendingCall>();
  call->request_id = next_request_id_.fetch_add(1);
  if (request.timeout_ms == 0) {
    request.timeout_ms = config_.default_timeout_ms;
  }
  call->request = std::move(request);
  std::future<SlotResult> future = call->promise.get_future();

  {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    ++stats_.calls;
  }

  if (call->request.timeout_ms < 1 || call->request.timeout_ms > kMaxTimeoutMs) {
    Finish(call,
           SlotResult::Failure(ErrorKind::kValidationError,
                               fmt::format("timeoutMs must be an integer in [1, {}], got {}",
                                           kMaxTimeoutMs, call->request.timeout_ms),
                               Phase::kValidation),
           -1);
    return future;
  }

  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (!stopping_) {
      queue_.push_back(call);
      queue_cv_.notify_one();
      return future;
    }
  }
  Finish(call, ShutdownFailure(), -1);
  return future;
}

DispatcherStats Dispatcher::Stats() const {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  return stats_;
}

void Dispatcher::LaneLoop(Lane* lane) {
  while (true) {
    std::shared_ptr<PendingCall> call;
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      queue_cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
      if (stopping_) return;
      call = std::move(queue_.front());
      queue_.pop_front();
    }
    Process(lane, call);
  }
}

void Dispatcher::Process(Lane* lane, const std::shared_ptr<PendingCall>& call) {
  call->picked_up = Clock::now();
  if (config_.trace) {
    Tracer::LogSlotStart(call->request.slot_id, call->request_id, lane->index);
  }

  Clock::time_point deadline =
      call->picked_up + std::chrono::milliseconds(call->request.timeout_ms);
  {
    std::lock_guard<std::mutex> lock(lane->mutex);
    lane->active_request = call->request_id;
  }
  Arm(call, lane,
      deadline + std::chrono::milliseconds(std::min(config_.dispatch_grace_ms, kMaxTimeoutMs)));

  SlotResult result;
  try {
    result = Execute(lane, *call, deadline);
  } catch (const std::exception& e) {
    result = SlotResult::Failure(ErrorKind::kWorkerError, fmt::format("Lane fault: {}", e.what()),
                                 Phase::kExecution);
  }

  Disarm(call->request_id);
  {
    std::lock_guard<std::mutex> lock(lane->mutex);
    lane->active_request = 0;
  }

  bool discard = DiscardsWorker(result);
  // Lost the race: the watchdog already answered and killed the worker
  bool delivered = Finish(call, std::move(result), lane->index);
  if (!delivered) {
    discard = true;
  }

  bool broken = false;
  {
    std::lock_guard<std::mutex> lock(lane->mutex);
    broken = lane->worker && lane->worker->Broken();
  }
  if (discard || broken) {
    DiscardWorker(lane, delivered ? "fault" : "watchdog");
  }
}

SlotResult Dispatcher::Execute(Lane* lane, const PendingCall& call, Clock::time_point deadline) {
  ValidationReport report = CodeValidator::Validate(call.request.code);
  if (!report.ok) {
    return SlotResult::Failure(ErrorKind::kValidationError, report.Summary(), Phase::kValidation);
  }
  // The watchdog answered while validation ran; nothing is sent to a worker
  if (call.resolved.load()) {
    return SlotResult::Failure(ErrorKind::kExecutionTimeout, "Execution timeout",
                               Phase::kExecution);
  }

  std::string error;
  if (!EnsureWorker(lane, &error)) {
    return SlotResult::Failure(ErrorKind::kWorkerError,
                               fmt::format("Failed to start worker: {}", error),
                               Phase::kExecution);
  }
  // Only this lane thread swaps the handle, so it stays valid without the lock
  SlotWorker* worker = nullptr;
  {
    std::lock_guard<std::mutex> lock(lane->mutex);
    worker = lane->worker.get();
  }
  return worker->Run(call.request_id, call.request, deadline);
}

bool Dispatcher::EnsureWorker(Lane* lane, std::string* error_out) {
  {
    std::lock_guard<std::mutex> lock(lane->mutex);
    if (lane->worker && lane->worker->Alive() && !lane->worker->Broken()) {
      return true;
    }
  }
  if (lane->worker) {
    DiscardWorker(lane, "not reusable");
  }

  auto worker = std::make_unique<SlotWorker>(config_);
  if (!worker->Start(error_out)) {
    return false;
  }
  if (config_.trace) {
    Tracer::LogWorkerEvent("spawn", lane->index, static_cast<int>(worker->Pid()));
  }
  {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    ++stats_.workers_spawned;
  }
  std::lock_guard<std::mutex> lock(lane->mutex);
  lane->worker = std::move(worker);
  return true;
}

void Dispatcher::DiscardWorker(Lane* lane, const std::string& reason) {
  std::unique_ptr<SlotWorker> worker;
  {
    std::lock_guard<std::mutex> lock(lane->mutex);
    worker.swap(lane->worker);
  }
  if (!worker) return;

  int pid = static_cast<int>(worker->Pid());
  std::string ended = worker->Reap();
  if (config_.trace) {
    Tracer::LogWorkerEvent("discard", lane->index, pid, fmt::format("{}, {}", reason, ended));
  }
  std::lock_guard<std::mutex> lock(stats_mutex_);
  ++stats_.workers_discarded;
}

bool Dispatcher::Finish(const std::shared_ptr<PendingCall>& call, SlotResult result, int lane) {
  bool ok = result.Ok();
  ErrorKind code = ok ? ErrorKind::kWorkerError : result.AsFailure().code;
  Phase phase = ok ? Phase::kExecution : result.AsFailure().phase;

  if (!call->Resolve(std::move(result))) {
    return false;
  }

  {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    if (ok) {
      ++stats_.succeeded;
    } else {
      switch (code) {
        case ErrorKind::kValidationError: ++stats_.validation_errors; break;
        case ErrorKind::kExecutionError: ++stats_.execution_errors; break;
        case ErrorKind::kExecutionTimeout: ++stats_.timeouts; break;
        case ErrorKind::kOutputValidationError: ++stats_.output_errors; break;
        case ErrorKind::kWorkerError: ++stats_.worker_errors; break;
      }
    }
  }

  double duration_ms = 0.0;
  if (call->picked_up != Clock::time_point()) {
    duration_ms =
        std::chrono::duration<double, std::milli>(Clock::now() - call->picked_up).count();
  }
  if (config_.trace) {
    Tracer::LogSlotEnd(call->request.slot_id, call->request_id, lane, duration_ms,
                       ok ? "" : std::string(ErrorKindToString(code)),
                       ok ? "" : std::string(PhaseToString(phase)));
  }
  return true;
}

// ---------------------------------------------------------------------------
// Watchdog
// ---------------------------------------------------------------------------

void Dispatcher::Arm(const std::shared_ptr<PendingCall>& call, Lane* lane,
                     Clock::time_point deadline) {
  {
    std::lock_guard<std::mutex> lock(watch_mutex_);
    armed_.emplace(deadline, Armed{call, lane});
  }
  watch_cv_.notify_all();
}

void Dispatcher::Disarm(uint64_t request_id) {
  std::lock_guard<std::mutex> lock(watch_mutex_);
  for (auto it = armed_.begin(); it != armed_.end(); ++it) {
    if (it->second.call->request_id == request_id) {
      armed_.erase(it);
      return;
    }
  }
}

void Dispatcher::WatchdogLoop() {
  std::unique_lock<std::mutex> lock(watch_mutex_);
  while (!watch_stopping_) {
    if (armed_.empty()) {
      watch_cv_.wait(lock);
      continue;
    }
    auto next = armed_.begin();
    if (Clock::now() < next->first) {
      watch_cv_.wait_until(lock, next->first);
      continue;
    }
    Armed expired = std::move(next->second);
    armed_.erase(next);
    lock.unlock();
    Expire(expired.call, expired.lane);
    lock.lock();
  }
}

void Dispatcher::Expire(const std::shared_ptr<PendingCall>& call, Lane* lane) {
  bool resolved = Finish(
      call,
      SlotResult::Failure(ErrorKind::kExecutionTimeout, "Execution timeout", Phase::kExecution),
      lane->index);
  if (!resolved) return;
  {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    ++stats_.watchdog_expirations;
  }

  std::lock_guard<std::mutex> lock(lane->mutex);
  if (lane->active_request == call->request_id && lane->worker) {
    if (config_.trace) {
      Tracer::LogWorkerEvent("kill", lane->index, static_cast<int>(lane->worker->Pid()),
                             "watchdog deadline");
    }
    lane->worker->Kill();
  }
}

}  // namespace slotbox
