#include "worker/slot_worker.h"

#include <fcntl.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <exception>
#include <set>
#include <stdexcept>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "host/execution_host.h"
#include "output/output_validator.h"
#include "worker/frame_io.h"

namespace slotbox {

namespace {

constexpr int kExitChannelError = 1;
constexpr int kExitSetupError = 2;
constexpr int kExitHostError = 3;

// Serializes socketpair + fork so no child inherits another worker's child end
std::mutex& SpawnMutex() {
  static std::mutex mutex;
  return mutex;
}

// Parent ends of live workers, guarded by SpawnMutex. fork without exec keeps
// them open in every later child despite FD_CLOEXEC, so children close them.
std::set<int>& ParentChannels() {
  static std::set<int> fds;
  return fds;
}

bool ApplyLimit(int resource, int64_t value) {
  if (value <= 0) return true;
  rlimit limit{static_cast<rlim_t>(value), static_cast<rlim_t>(value)};
  return setrlimit(resource, &limit) == 0;
}

SlotResult WorkerFailure(std::string message) {
  return SlotResult::Failure(ErrorKind::kWorkerError, std::move(message), Phase::kExecution);
}

std::string DescribeStatus(int status) {
  if (WIFSIGNALED(status)) {
    return fmt::format("killed by signal {}", WTERMSIG(status));
  }
  if (WIFEXITED(status)) {
    return fmt::format("exited with code {}", WEXITSTATUS(status));
  }
  return "ended";
}

// Child side. Never returns and never touches parent-side locks.
[[noreturn]] void ChildMain(int fd, const SandboxConfig& config) {
  if (!ApplyLimit(RLIMIT_AS, config.worker_address_space_bytes) ||
      !ApplyLimit(RLIMIT_CPU, config.worker_cpu_seconds)) {
    _exit(kExitSetupError);
  }

  int exit_code = 0;
  try {
    ExecutionHost host(config);
    std::string payload;
    while (true) {
      FrameStatus status =
          ReadFrame(fd, &payload, static_cast<size_t>(config.max_frame_bytes), std::nullopt);
      if (status == FrameStatus::kEof) break;
      if (status != FrameStatus::kOk) {
        exit_code = kExitChannelError;
        break;
      }

      nlohmann::json frame = nlohmann::json::parse(payload, nullptr, false);
      if (frame.is_discarded() || !frame.is_object() || !frame.contains("requestId") ||
          !frame["requestId"].is_number_unsigned()) {
        exit_code = kExitChannelError;
        break;
      }
      uint64_t request_id = frame["requestId"].get<uint64_t>();

      SlotRequest request;
      std::string error;
      SlotResult result;
      if (!ParseRequest(frame, request, &error, config.default_timeout_ms)) {
        result = WorkerFailure("Malformed request: " + error);
      } else {
        try {
          result = CheckOutput(host.Execute(request), request.output_schema);
        } catch (const std::runtime_error& e) {
          result = WorkerFailure(e.what());
        }
      }

      nlohmann::json response = ResultToJson(result);
      response["requestId"] = request_id;
      std::string encoded =
          response.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
      if (WriteFrame(fd, encoded) != FrameStatus::kOk) {
        exit_code = kExitChannelError;
        break;
      }
    }
  } catch (const std::exception&) {
    exit_code = kExitHostError;
  }
  close(fd);
  _exit(exit_code);
}

}  // namespace

SlotWorker::SlotWorker(const SandboxConfig& config) : config_(config) {}

SlotWorker::~SlotWorker() {
  Reap();
}

bool SlotWorker::Start(std::string* error_out) {
  if (Alive()) {
    return true;
  }

  std::lock_guard<std::mutex> spawn_lock(SpawnMutex());
  int fds[2];
  if (socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == -1) {
    if (error_out) *error_out = fmt::format("socketpair: {}", std::strerror(errno));
    return false;
  }
  if (fcntl(fds[0], F_SETFD, FD_CLOEXEC) == -1 || fcntl(fds[1], F_SETFD, FD_CLOEXEC) == -1) {
    if (error_out) *error_out = fmt::format("fcntl: {}", std::strerror(errno));
    close(fds[0]);
    close(fds[1]);
    return false;
  }

  pid_t pid = fork();
  if (pid == -1) {
    if (error_out) *error_out = fmt::format("fork: {}", std::strerror(errno));
    close(fds[0]);
    close(fds[1]);
    return false;
  }
  if (pid == 0) {
    close(fds[0]);
    for (int inherited : ParentChannels()) {
      close(inherited);
    }
    ChildMain(fds[1], config_);
  }

  close(fds[1]);
  fd_ = fds[0];
  ParentChannels().insert(fd_);
  broken_ = false;
  std::lock_guard<std::mutex> lock(pid_mutex_);
  pid_ = pid;
  reaped_ = false;
  return true;
}

SlotResult SlotWorker::Run(uint64_t request_id, const SlotRequest& request,
                           Clock::time_point deadline) {
  if (!Alive() || broken_) {
    return WorkerFailure("Worker is not running");
  }

  nlohmann::json frame = RequestToJson(request);
  frame["requestId"] = request_id;
  std::string payload = frame.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  if (payload.size() > static_cast<size_t>(config_.max_frame_bytes)) {
    return WorkerFailure(fmt::format("Request frame of {} bytes exceeds the {} byte limit",
                                     payload.size(), config_.max_frame_bytes));
  }

  std::string error;
  if (WriteFrame(fd_, payload, &error) != FrameStatus::kOk) {
    broken_ = true;
    return WorkerFailure("Worker unreachable: " + error);
  }

  while (true) {
    FrameStatus status =
        ReadFrame(fd_, &payload, static_cast<size_t>(config_.max_frame_bytes), deadline, &error);
    switch (status) {
      case FrameStatus::kOk:
        break;
      case FrameStatus::kTimeout:
        broken_ = true;
        Kill();
        return SlotResult::Failure(ErrorKind::kExecutionTimeout, "Execution timeout",
                                   Phase::kExecution);
      case FrameStatus::kEof:
        broken_ = true;
        return WorkerFailure("Worker exited unexpectedly (" + Reap() + ")");
      case FrameStatus::kTooLarge:
        broken_ = true;
        Kill();
        return WorkerFailure("Response too large: " + error);
      case FrameStatus::kError:
        broken_ = true;
        Kill();
        return WorkerFailure("Worker channel failed: " + error);
    }

    nlohmann::json response = nlohmann::json::parse(payload, nullptr, false);
    if (response.is_discarded() || !response.is_object() || !response.contains("requestId") ||
        !response["requestId"].is_number_unsigned()) {
      broken_ = true;
      Kill();
      return WorkerFailure("Malformed response frame");
    }
    // Late answer to an earlier request
    if (response["requestId"].get<uint64_t>() != request_id) {
      continue;
    }

    SlotResult result;
    if (!ParseResult(response, result, &error)) {
      broken_ = true;
      Kill();
      return WorkerFailure("Malformed response: " + error);
    }
    return result;
  }
}

void SlotWorker::Kill() {
  std::lock_guard<std::mutex> lock(pid_mutex_);
  if (pid_ > 0 && !reaped_) {
    kill(pid_, SIGKILL);
  }
}

std::string SlotWorker::Reap() {
  if (fd_ >= 0) {
    std::lock_guard<std::mutex> spawn_lock(SpawnMutex());
    ParentChannels().erase(fd_);
    close(fd_);
    fd_ = -1;
  }
  broken_ = true;

  std::lock_guard<std::mutex> lock(pid_mutex_);
  if (pid_ <= 0 || reaped_) {
    return "not running";
  }
  kill(pid_, SIGKILL);
  int status = 0;
  pid_t rc;
  do {
    rc = waitpid(pid_, &status, 0);
  } while (rc == -1 && errno == EINTR);
  reaped_ = true;
  return rc == pid_ ? DescribeStatus(status) : "already reaped";
}

bool SlotWorker::Alive() const {
  std::lock_guard<std::mutex> lock(pid_mutex_);
  return pid_ > 0 && !reaped_;
}

pid_t SlotWorker::Pid() const {
  std::lock_guard<std::mutex> lock(pid_mutex_);
  return pid_;
}

}  // namespace slotbox
