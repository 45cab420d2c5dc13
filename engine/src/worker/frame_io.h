#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace slotbox {

/**
 * Length-prefixed frames over a stream socket: a 4-byte big-endian payload
 * length followed by that many bytes of UTF-8 JSON.
 */
enum class FrameStatus {
  kOk,
  kEof,       // peer closed before a complete frame
  kTimeout,   // deadline passed
  kTooLarge,  // announced length above the ceiling
  kError
};

constexpr size_t kFrameHeaderBytes = 4;

// Never raises SIGPIPE; a closed peer is reported as kError
FrameStatus WriteFrame(int fd, const std::string& payload, std::string* error_out = nullptr);

// Blocks until a whole frame arrives, or until deadline when one is given
FrameStatus ReadFrame(int fd, std::string* payload, size_t max_bytes,
                      std::optional<std::chrono::steady_clock::time_point> deadline,
                      std::string* error_out = nullptr);

}  // namespace slotbox
