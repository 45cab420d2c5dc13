#include "worker/frame_io.h"

#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstring>

#include <fmt/format.h>

namespace slotbox {

namespace {

using Clock = std::chrono::steady_clock;

constexpr int64_t kMaxPollMs = 60 * 60 * 1000;

void SetError(std::string* error_out, const std::string& message) {
  if (error_out) *error_out = message;
}

FrameStatus SendAll(int fd, const char* data, size_t size, std::string* error_out) {
  while (size > 0) {
    ssize_t n = send(fd, data, size, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) continue;
      SetError(error_out, fmt::format("send: {}", std::strerror(errno)));
      return FrameStatus::kError;
    }
    data += n;
    size -= static_cast<size_t>(n);
  }
  return FrameStatus::kOk;
}

// Waits for readability; kOk when data (or EOF) is ready
FrameStatus WaitReadable(int fd, const std::optional<Clock::time_point>& deadline,
                         std::string* error_out) {
  while (true) {
    int timeout_ms = -1;
    if (deadline) {
      auto remaining =
          std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - Clock::now()).count();
      if (remaining <= 0) return FrameStatus::kTimeout;
      // Round up so the poll never wakes just short of the deadline; a cut-short
      // wait just loops
      timeout_ms = static_cast<int>(std::min<int64_t>(remaining, kMaxPollMs)) + 1;
    }
    pollfd pfd{fd, POLLIN, 0};
    int rc = poll(&pfd, 1, timeout_ms);
    if (rc < 0) {
      if (errno == EINTR) continue;
      SetError(error_out, fmt::format("poll: {}", std::strerror(errno)));
      return FrameStatus::kError;
    }
    if (rc > 0) return FrameStatus::kOk;
  }
}

FrameStatus RecvAll(int fd, char* data, size_t size,
                    const std::optional<Clock::time_point>& deadline, std::string* error_out) {
  while (size > 0) {
    FrameStatus ready = WaitReadable(fd, deadline, error_out);
    if (ready != FrameStatus::kOk) return ready;
    ssize_t n = read(fd, data, size);
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN) continue;
      SetError(error_out, fmt::format("read: {}", std::strerror(errno)));
      return FrameStatus::kError;
    }
    if (n == 0) {
      SetError(error_out, "peer closed the channel");
      return FrameStatus::kEof;
    }
    data += n;
    size -= static_cast<size_t>(n);
  }
  return FrameStatus::kOk;
}

}  // namespace

FrameStatus WriteFrame(int fd, const std::string& payload, std::string* error_out) {
  if (payload.size() > UINT32_MAX) {
    SetError(error_out, "frame payload exceeds 4 GiB");
    return FrameStatus::kTooLarge;
  }
  uint32_t len = static_cast<uint32_t>(payload.size());
  char header[kFrameHeaderBytes] = {
      static_cast<char>((len >> 24) & 0xFF), static_cast<char>((len >> 16) & 0xFF),
      static_cast<char>((len >> 8) & 0xFF), static_cast<char>(len & 0xFF)};
  FrameStatus status = SendAll(fd, header, sizeof(header), error_out);
  if (status != FrameStatus::kOk) return status;
  return SendAll(fd, payload.data(), payload.size(), error_out);
}

FrameStatus ReadFrame(int fd, std::string* payload, size_t max_bytes,
                      std::optional<std::chrono::steady_clock::time_point> deadline,
                      std::string* error_out) {
  unsigned char header[kFrameHeaderBytes];
  FrameStatus status =
      RecvAll(fd, reinterpret_cast<char*>(header), sizeof(header), deadline, error_out);
  if (status != FrameStatus::kOk) return status;

  size_t len = (static_cast<size_t>(header[0]) << 24) | (static_cast<size_t>(header[1]) << 16) |
               (static_cast<size_t>(header[2]) << 8) | static_cast<size_t>(header[3]);
  if (len > max_bytes) {
    SetError(error_out, fmt::format("frame of {} bytes exceeds the {} byte limit", len, max_bytes));
    return FrameStatus::kTooLarge;
  }
  payload->assign(len, '\0');
  if (len == 0) return FrameStatus::kOk;
  return RecvAll(fd, &(*payload)[0], len, deadline, error_out);
}

}  // namespace slotbox
