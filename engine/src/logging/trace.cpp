#include "logging/trace.h"

#include <iostream>
#include <mutex>

#include <nlohmann/json.hpp>

namespace slotbox {

std::atomic<bool> Tracer::enabled_{true};

namespace {

std::mutex& OutputMutex() {
  static std::mutex mutex;
  return mutex;
}

}  // namespace

void Tracer::Emit(const std::string& line) {
  std::lock_guard<std::mutex> lock(OutputMutex());
  std::cout << line << std::endl;
}

void Tracer::LogSlotStart(const std::string& slot_id, uint64_t request_id, int lane) {
  if (!enabled_) return;

  nlohmann::json log;
  log["event"] = "slot_start";
  log["slot_id"] = slot_id;
  log["request_id"] = request_id;
  log["lane"] = lane;

  Emit(log.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

void Tracer::LogSlotEnd(const std::string& slot_id,
                        uint64_t request_id,
                        int lane,
                        double duration_ms,
                        const std::string& error_code,
                        const std::string& phase) {
  if (!enabled_) return;

  nlohmann::json log;
  log["event"] = "slot_end";
  log["slot_id"] = slot_id;
  log["request_id"] = request_id;
  log["lane"] = lane;
  log["duration_ms"] = duration_ms;
  log["ok"] = error_code.empty();

  if (!error_code.empty()) {
    log["error"] = error_code;
    log["phase"] = phase;
  }

  Emit(log.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

void Tracer::LogWorkerEvent(const std::string& event, int lane, int pid,
                            const std::string& reason) {
  if (!enabled_) return;

  nlohmann::json log;
  log["event"] = "worker_" + event;
  log["lane"] = lane;
  log["pid"] = pid;

  if (!reason.empty()) {
    log["reason"] = reason;
  }

  Emit(log.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

void Tracer::SetEnabled(bool enabled) {
  enabled_ = enabled;
}

bool Tracer::IsEnabled() {
  return enabled_;
}

}  // namespace slotbox
