#pragma once

#include <atomic>
#include <cstdint>
#include <string>

namespace slotbox {

/**
 * Tracer - structured logging for slot execution.
 *
 * One JSON object per line on stdout. Safe to call from any lane thread.
 * Never called from inside a worker process.
 */
class Tracer {
 public:
  /**
   * Log a call picked up by a lane.
   */
  static void LogSlotStart(const std::string& slot_id, uint64_t request_id, int lane);

  /**
   * Log a resolved call.
   * @param error_code Empty on success
   * @param phase Empty on success
   */
  static void LogSlotEnd(const std::string& slot_id,
                         uint64_t request_id,
                         int lane,
                         double duration_ms,
                         const std::string& error_code = "",
                         const std::string& phase = "");

  /**
   * Log a worker lifecycle event ("spawn", "kill", "discard", "exit").
   */
  static void LogWorkerEvent(const std::string& event, int lane, int pid,
                             const std::string& reason = "");

  /**
   * Enable/disable tracing output for the whole process.
   */
  static void SetEnabled(bool enabled);

  /**
   * Check if tracing is enabled.
   */
  static bool IsEnabled();

 private:
  static void Emit(const std::string& line);

  static std::atomic<bool> enabled_;
};

}  // namespace slotbox
