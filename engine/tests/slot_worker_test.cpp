#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <signal.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <filesystem>
#include <set>
#include <string>
#include <system_error>
#include <thread>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "worker/frame_io.h"
#include "worker/slot_worker.h"

using namespace slotbox;
using Catch::Matchers::ContainsSubstring;
using json = nlohmann::json;
using Clock = std::chrono::steady_clock;

namespace {

SlotRequest MakeRequest(const std::string& code, int64_t timeout_ms = 1000) {
  SlotRequest request;
  request.slot_id = "test";
  request.code = code;
  request.input = json{{"values", {2, 4, 6, 8}}};
  request.params = json::object();
  request.timeout_ms = timeout_ms;
  return request;
}

Clock::time_point In(int ms) {
  return Clock::now() + std::chrono::milliseconds(ms);
}

// "socket:[inode]" targets of the descriptors above stdio in `dir`
std::set<std::string> SocketLinks(const std::string& dir) {
  std::set<std::string> links;
  for (const auto& entry : std::filesystem::directory_iterator(dir)) {
    if (std::stoi(entry.path().filename().string()) <= 2) continue;
    std::error_code ec;
    std::string target = std::filesystem::read_symlink(entry.path(), ec).string();
    if (!ec && target.rfind("socket:", 0) == 0) links.insert(target);
  }
  return links;
}

// Connected pair closed on scope exit
struct SocketPair {
  int fds[2] = {-1, -1};
  SocketPair() { REQUIRE(socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0); }
  ~SocketPair() {
    for (int fd : fds) {
      if (fd >= 0) close(fd);
    }
  }
};

}  // namespace

TEST_CASE("Frame round trip", "[worker][frames]") {
  SocketPair pair;
  std::string payload;

  REQUIRE(WriteFrame(pair.fds[0], R"({"a":1})") == FrameStatus::kOk);
  REQUIRE(ReadFrame(pair.fds[1], &payload, 1024, In(1000)) == FrameStatus::kOk);
  REQUIRE(payload == R"({"a":1})");

  SECTION("length prefix is big-endian") {
    REQUIRE(WriteFrame(pair.fds[0], std::string(258, 'x')) == FrameStatus::kOk);
    unsigned char header[4];
    REQUIRE(read(pair.fds[1], header, 4) == 4);
    REQUIRE(header[0] == 0);
    REQUIRE(header[1] == 0);
    REQUIRE(header[2] == 1);
    REQUIRE(header[3] == 2);
  }

  SECTION("empty payload") {
    REQUIRE(WriteFrame(pair.fds[0], "") == FrameStatus::kOk);
    REQUIRE(ReadFrame(pair.fds[1], &payload, 1024, In(1000)) == FrameStatus::kOk);
    REQUIRE(payload.empty());
  }
}

TEST_CASE("Frame read failures", "[worker][frames]") {
  SocketPair pair;
  std::string payload;
  std::string error;

  SECTION("ceiling") {
    REQUIRE(WriteFrame(pair.fds[0], std::string(100, 'x')) == FrameStatus::kOk);
    REQUIRE(ReadFrame(pair.fds[1], &payload, 10, In(1000), &error) == FrameStatus::kTooLarge);
    REQUIRE_THAT(error, ContainsSubstring("exceeds"));
  }

  SECTION("deadline") {
    auto start = Clock::now();
    REQUIRE(ReadFrame(pair.fds[1], &payload, 10, In(30)) == FrameStatus::kTimeout);
    REQUIRE(Clock::now() - start >= std::chrono::milliseconds(30));
  }

  SECTION("peer closed") {
    close(pair.fds[0]);
    pair.fds[0] = -1;
    REQUIRE(ReadFrame(pair.fds[1], &payload, 10, In(1000)) == FrameStatus::kEof);
  }

  SECTION("writing to a closed peer does not raise SIGPIPE") {
    close(pair.fds[1]);
    pair.fds[1] = -1;
    REQUIRE(WriteFrame(pair.fds[0], "x", &error) == FrameStatus::kError);
  }
}

TEST_CASE("SlotWorker runs requests", "[worker][run]") {
  SlotWorker worker(SandboxConfig::Default());
  std::string error;
  REQUIRE(worker.Start(&error));
  REQUIRE(worker.Alive());
  pid_t pid = worker.Pid();
  REQUIRE(pid > 0);

  auto result = worker.Run(1, MakeRequest("return utils.mean(input.values);"), In(1000));
  REQUIRE(result.Ok());
  REQUIRE(result.AsSuccess().data == 5);

  SECTION("the same process serves the next call") {
    auto next = worker.Run(2, MakeRequest("return input.values.length;"), In(1000));
    REQUIRE(next.AsSuccess().data == 4);
    REQUIRE(worker.Pid() == pid);
  }

  SECTION("execution errors keep the worker") {
    auto failed = worker.Run(2, MakeRequest("throw new Error('nope');"), In(1000));
    REQUIRE(failed.AsFailure().code == ErrorKind::kExecutionError);
    REQUIRE_FALSE(worker.Broken());
    REQUIRE(worker.Run(3, MakeRequest("return 1;"), In(1000)).Ok());
  }

  SECTION("huge error messages still fit in a frame") {
    auto failed = worker.Run(2, MakeRequest("throw new Error('x'.repeat(9e6));"), In(5000));
    REQUIRE(failed.AsFailure().code == ErrorKind::kExecutionError);
    REQUIRE_FALSE(worker.Broken());
    REQUIRE(worker.Run(3, MakeRequest("return 1;"), In(1000)).Ok());
  }

  SECTION("output ceilings are applied in the worker") {
    auto big = worker.Run(2, MakeRequest("return 'x'.repeat(2 * 1024 * 1024);"), In(2000));
    REQUIRE(big.AsFailure().code == ErrorKind::kOutputValidationError);
    REQUIRE(big.AsFailure().phase == Phase::kOutput);
  }

  SECTION("schema violations") {
    SlotRequest request = MakeRequest("return { a: 1 };");
    Schema schema;
    schema.type = "object";
    schema.properties["b"] = PropertySpec{};
    request.output_schema = schema;
    auto failed = worker.Run(2, request, In(1000));
    REQUIRE(failed.AsFailure().message == "Missing required output property: b");
  }
}

TEST_CASE("SlotWorker children hold only their own channel", "[worker][fds]") {
  SlotWorker first(SandboxConfig::Default());
  SlotWorker second(SandboxConfig::Default());
  std::string error;
  REQUIRE(first.Start(&error));
  REQUIRE(second.Start(&error));
  // Answering a call means the child is past its startup
  REQUIRE(second.Run(1, MakeRequest("return 1;"), In(1000)).Ok());

  std::set<std::string> ours = SocketLinks("/proc/self/fd");
  std::set<std::string> theirs = SocketLinks(fmt::format("/proc/{}/fd", second.Pid()));
  REQUIRE_FALSE(ours.empty());
  REQUIRE_FALSE(theirs.empty());
  for (const auto& link : theirs) {
    INFO(link);
    REQUIRE(ours.count(link) == 0);
  }

  SECTION("a dead worker is noticed while another is alive") {
    kill(first.Pid(), SIGKILL);
    auto result = first.Run(2, MakeRequest("return 1;"), In(2000));
    REQUIRE(result.AsFailure().code == ErrorKind::kWorkerError);
    REQUIRE(second.Run(2, MakeRequest("return 2;"), In(1000)).Ok());
  }
}

TEST_CASE("SlotWorker is killed at the deadline", "[worker][timeout]") {
  SlotWorker worker(SandboxConfig::Default());
  REQUIRE(worker.Start());

  auto start = Clock::now();
  auto result = worker.Run(1, MakeRequest("while (true) {}", 10000), In(50));
  auto elapsed = Clock::now() - start;

  REQUIRE(result.AsFailure().code == ErrorKind::kExecutionTimeout);
  REQUIRE(elapsed < std::chrono::milliseconds(500));
  REQUIRE(worker.Broken());
  REQUIRE_THAT(worker.Reap(), ContainsSubstring("signal 9"));
  REQUIRE_FALSE(worker.Alive());

  auto after = worker.Run(2, MakeRequest("return 1;"), In(1000));
  REQUIRE(after.AsFailure().code == ErrorKind::kWorkerError);
}

TEST_CASE("SlotWorker reports worker faults", "[worker][faults]") {
  SECTION("kill from another thread") {
    SlotWorker worker(SandboxConfig::Default());
    REQUIRE(worker.Start());
    std::thread killer([&worker] {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
      worker.Kill();
    });
    auto result = worker.Run(1, MakeRequest("while (true) {}", 10000), In(5000));
    killer.join();
    REQUIRE(result.AsFailure().code == ErrorKind::kWorkerError);
    REQUIRE_THAT(result.AsFailure().message, ContainsSubstring("exited unexpectedly"));
  }

  SECTION("CPU rlimit ends the child") {
    SandboxConfig config;
    config.worker_cpu_seconds = 1;
    SlotWorker worker(config);
    REQUIRE(worker.Start());
    auto result = worker.Run(1, MakeRequest("while (true) {}", 10000), In(5000));
    REQUIRE(result.AsFailure().code == ErrorKind::kWorkerError);
    REQUIRE(worker.Broken());
  }

  SECTION("oversized request frame") {
    SandboxConfig config;
    config.max_frame_bytes = 64;
    SlotWorker worker(config);
    REQUIRE(worker.Start());
    auto result = worker.Run(1, MakeRequest(std::string(200, ' ') + "return 1;"), In(1000));
    REQUIRE(result.AsFailure().code == ErrorKind::kWorkerError);
    REQUIRE_THAT(result.AsFailure().message, ContainsSubstring("Request frame"));
  }

  SECTION("not started") {
    SlotWorker worker(SandboxConfig::Default());
    auto result = worker.Run(1, MakeRequest("return 1;"), In(1000));
    REQUIRE(result.AsFailure().code == ErrorKind::kWorkerError);
  }
}
