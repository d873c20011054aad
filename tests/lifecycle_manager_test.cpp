#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "warden/backends/restricted_process_backend.hpp"
#include "warden/core/errors.hpp"
#include "warden/core/lifecycle_manager.hpp"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <signal.h>

namespace {

using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::Not;
using ::testing::Optional;

using namespace warden::core;
using warden::backends::Backend;
using warden::backends::BackendSet;
using warden::backends::LaunchCallbacks;
using warden::backends::LaunchHandle;
using warden::backends::RestrictedProcessBackend;
using warden::backends::TerminationOptions;

using namespace std::chrono_literals;

// Registered as the container backend; launches nothing
class FakeBackend : public Backend {
 public:
  IsolationKind kind() const override { return IsolationKind::CONTAINER; }

  LaunchHandle Launch(const Policy&, const std::string& command, LaunchCallbacks) override {
    ++launches;
    if (launch_delay.count() > 0) {
      std::this_thread::sleep_for(launch_delay);
    }
    if (!failure.empty()) {
      throw SandboxError(ErrorKind::LAUNCH_FAILURE, failure);
    }
    LaunchHandle handle;
    handle.reference = "fake-" + std::to_string(launches.load());
    handle.notes.push_back("Fake launch of '" + command + "'");
    return handle;
  }

  void Terminate(const LaunchHandle&, const TerminationOptions&) override {
    ++terminations;
    if (terminate_delay.count() > 0) {
      std::this_thread::sleep_for(terminate_delay);
    }
    if (fail_termination) {
      throw SandboxError(ErrorKind::TERMINATION_FAILURE, "handle is stuck");
    }
  }

  std::atomic<int> launches{0};
  std::atomic<int> terminations{0};
  std::chrono::milliseconds launch_delay{0};
  std::chrono::milliseconds terminate_delay{0};
  std::string failure;
  bool fail_termination{false};
};

class LifecycleManagerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    config_.termination_grace = 500ms;
    fake_ = std::make_shared<FakeBackend>();
  }

  LifecycleManager& manager() {
    if (!manager_) {
      BackendSet backends;
      backends.Register(std::make_shared<RestrictedProcessBackend>(config_.restricted_settings));
      backends.Register(fake_);
      manager_ = std::make_unique<LifecycleManager>(config_, std::move(backends));
    }
    return *manager_;
  }

  static Policy Restricted(std::optional<int> timeout = std::nullopt) {
    Policy policy;
    policy.isolation_kind = IsolationKind::RESTRICTED_PROCESS;
    policy.timeout_seconds = timeout;
    return policy;
  }

  static Policy Fake() {
    Policy policy;
    policy.isolation_kind = IsolationKind::CONTAINER;
    return policy;
  }

  // Polls until the launch has stored a handle
  bool WaitForHandle(const std::string& id) {
    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (std::chrono::steady_clock::now() < deadline) {
      if (manager().Get(id).handle) {
        return true;
      }
      std::this_thread::sleep_for(10ms);
    }
    return false;
  }

  int CountLines(const std::string& id, const std::string& needle) {
    auto lines = manager().GetLogs(id, 100000);
    return static_cast<int>(std::count_if(lines.begin(), lines.end(),
                                          [&needle](const std::string& line) {
                                            return line.find(needle) != std::string::npos;
                                          }));
  }

  ServiceConfig config_;
  std::shared_ptr<FakeBackend> fake_;
  std::unique_ptr<LifecycleManager> manager_;
};

TEST_F(LifecycleManagerTest, CreateUsesDefaultPolicy) {
  auto sandbox = manager().Create("build-job");
  EXPECT_EQ(sandbox.status, SandboxStatus::PENDING);
  EXPECT_EQ(sandbox.name, "build-job");
  EXPECT_EQ(sandbox.policy, config_.default_policy);
  EXPECT_EQ(sandbox.attempt, 0u);
  EXPECT_FALSE(sandbox.started_at.has_value());
  EXPECT_FALSE(sandbox.handle.has_value());
  EXPECT_EQ(manager().Get(sandbox.id).id, sandbox.id);
}

TEST_F(LifecycleManagerTest, CreateRejectsBadInput) {
  try {
    manager().Create("   ");
    FAIL() << "empty name accepted";
  } catch (const SandboxError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::INVALID_INPUT);
  }

  Policy bad = Restricted();
  bad.max_memory_mb = 0;
  EXPECT_THROW(manager().Create("x", bad), SandboxError);
  EXPECT_TRUE(manager().List().empty());
}

TEST_F(LifecycleManagerTest, UnknownIdIsNotFound) {
  auto expect_not_found = [](auto&& call) {
    try {
      call();
      ADD_FAILURE() << "expected NOT_FOUND";
    } catch (const SandboxError& e) {
      EXPECT_EQ(e.kind(), ErrorKind::NOT_FOUND);
    }
  };
  expect_not_found([&] { manager().Get("missing"); });
  expect_not_found([&] { manager().Start("missing", "true"); });
  expect_not_found([&] { manager().Stop("missing"); });
  expect_not_found([&] { manager().Delete("missing"); });
  expect_not_found([&] { manager().GetLogs("missing"); });
  expect_not_found([&] { manager().UpdateNetworkPolicy("missing", std::nullopt, std::nullopt); });
  expect_not_found([&] { manager().WaitUntilSettled("missing", 10ms); });
}

TEST_F(LifecycleManagerTest, RunsCommandToCompletion) {
  auto id = manager().Create("echo", Restricted()).id;
  manager().Start(id, "echo hello; echo warning >&2");

  auto running = manager().Get(id);
  EXPECT_EQ(running.status, SandboxStatus::RUNNING);
  EXPECT_EQ(running.attempt, 1u);
  EXPECT_TRUE(running.started_at.has_value());
  EXPECT_EQ(running.command, "echo hello; echo warning >&2");

  ASSERT_TRUE(manager().WaitUntilSettled(id, 10s));
  auto done = manager().Get(id);
  EXPECT_EQ(done.status, SandboxStatus::STOPPED);
  EXPECT_THAT(done.exit_code, Optional(0));
  ASSERT_TRUE(done.stopped_at.has_value());
  EXPECT_GE(*done.stopped_at, *done.started_at);
  EXPECT_GT(done.pid.value_or(0), 0);

  auto logs = manager().GetLogs(id);
  ASSERT_FALSE(logs.empty());
  EXPECT_THAT(logs.front(), HasSubstr("Sandbox starting..."));
  EXPECT_EQ(CountLines(id, "] [stdout] hello"), 1);
  EXPECT_EQ(CountLines(id, "] [stderr] warning"), 1);
  EXPECT_EQ(CountLines(id, "Process started with PID: "), 1);
  EXPECT_EQ(CountLines(id, "Process exited with code: 0"), 1);
}

TEST_F(LifecycleManagerTest, NonZeroExitStillStops) {
  auto id = manager().Create("fail", Restricted()).id;
  manager().Start(id, "exit 7");
  ASSERT_TRUE(manager().WaitUntilSettled(id, 10s));
  auto done = manager().Get(id);
  EXPECT_EQ(done.status, SandboxStatus::STOPPED);
  EXPECT_THAT(done.exit_code, Optional(7));
}

TEST_F(LifecycleManagerTest, StartWhileRunningIsRejected) {
  auto id = manager().Create("busy", Restricted()).id;
  manager().Start(id, "sleep 30");
  try {
    manager().Start(id, "true");
    FAIL() << "second start accepted";
  } catch (const SandboxError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::ALREADY_RUNNING);
  }
  manager().Stop(id);
}

TEST_F(LifecycleManagerTest, StopTerminatesProcess) {
  auto id = manager().Create("sleeper", Restricted()).id;
  manager().Start(id, "sleep 30");
  ASSERT_TRUE(WaitForHandle(id));
  int pid = *manager().Get(id).pid;

  manager().Stop(id);
  auto stopped = manager().Get(id);
  EXPECT_EQ(stopped.status, SandboxStatus::STOPPED);
  EXPECT_TRUE(stopped.stopped_at.has_value());
  EXPECT_EQ(CountLines(id, "Process " + std::to_string(pid) + " terminated"), 1);
  EXPECT_EQ(CountLines(id, "Sandbox stopped"), 1);

  ASSERT_TRUE(manager().WaitUntilSettled(id, 10s));
  auto settled = manager().Get(id);
  EXPECT_EQ(settled.status, SandboxStatus::STOPPED);
  EXPECT_THAT(settled.exit_code, Optional(128 + SIGTERM));
  EXPECT_EQ(CountLines(id, "killed by signal 15"), 1);
}

TEST_F(LifecycleManagerTest, TimeoutStopsSandbox) {
  auto id = manager().Create("slow", Restricted(1)).id;
  auto start = std::chrono::steady_clock::now();
  manager().Start(id, "sleep 30");

  ASSERT_TRUE(manager().WaitUntilSettled(id, 10s));
  EXPECT_GE(std::chrono::steady_clock::now() - start, 900ms);
  EXPECT_EQ(manager().Get(id).status, SandboxStatus::STOPPED);
  EXPECT_EQ(CountLines(id, "Sandbox timed out after 1 seconds"), 1);
  EXPECT_EQ(CountLines(id, "Sandbox stopped"), 1);
}

TEST_F(LifecycleManagerTest, ExitBeforeTimeoutCancelsWatchdog) {
  auto id = manager().Create("quick", Restricted(1)).id;
  manager().Start(id, "true");
  ASSERT_TRUE(manager().WaitUntilSettled(id, 10s));
  std::this_thread::sleep_for(1500ms);
  EXPECT_EQ(CountLines(id, "timed out"), 0);
  EXPECT_EQ(CountLines(id, "Sandbox stopped"), 0);
}

TEST_F(LifecycleManagerTest, LaunchFailureMarksFailed) {
  fake_->failure = "image not found";
  auto id = manager().Create("broken", Fake()).id;
  manager().Start(id, "true");

  ASSERT_TRUE(manager().WaitUntilSettled(id, 5s));
  auto failed = manager().Get(id);
  EXPECT_EQ(failed.status, SandboxStatus::FAILED);
  EXPECT_TRUE(failed.stopped_at.has_value());
  EXPECT_FALSE(failed.exit_code.has_value());
  EXPECT_FALSE(failed.handle.has_value());
  EXPECT_EQ(CountLines(id, "Failed to start: image not found"), 1);

  // A failed sandbox can be started again
  fake_->failure.clear();
  manager().Start(id, "true");
  EXPECT_EQ(manager().Get(id).status, SandboxStatus::RUNNING);
  ASSERT_TRUE(WaitForHandle(id));
  manager().Stop(id);
}

TEST_F(LifecycleManagerTest, StopDuringLaunchTerminatesLateHandle) {
  fake_->launch_delay = 300ms;
  auto id = manager().Create("racy", Fake()).id;
  manager().Start(id, "true");
  manager().Stop(id);

  auto stopped = manager().Get(id);
  EXPECT_EQ(stopped.status, SandboxStatus::STOPPED);
  EXPECT_FALSE(stopped.handle.has_value());

  // Settles only once the late handle has been terminated
  ASSERT_TRUE(manager().WaitUntilSettled(id, 5s));
  EXPECT_EQ(fake_->terminations.load(), 1);
  EXPECT_EQ(manager().Get(id).status, SandboxStatus::STOPPED);
  EXPECT_FALSE(manager().Get(id).handle.has_value());
  EXPECT_EQ(CountLines(id, "Process 0 terminated"), 1);
  EXPECT_EQ(CountLines(id, "Process started with PID"), 0);
}

TEST_F(LifecycleManagerTest, HandleWithoutProcessStaysRunningUntilStopped) {
  auto id = manager().Create("detached", Fake()).id;
  manager().Start(id, "serve");
  ASSERT_TRUE(WaitForHandle(id));

  auto running = manager().Get(id);
  EXPECT_EQ(running.status, SandboxStatus::RUNNING);
  EXPECT_THAT(running.handle, Optional(std::string("fake-1 (pid 0)")));
  EXPECT_EQ(CountLines(id, "Fake launch of 'serve'"), 1);
  EXPECT_FALSE(manager().WaitUntilSettled(id, 100ms));

  manager().Stop(id);
  EXPECT_TRUE(manager().WaitUntilSettled(id, 1s));
  EXPECT_EQ(fake_->terminations.load(), 1);
}

TEST_F(LifecycleManagerTest, TerminationErrorIsLoggedNotThrown) {
  fake_->fail_termination = true;
  auto id = manager().Create("stuck", Fake()).id;
  manager().Start(id, "");
  ASSERT_TRUE(WaitForHandle(id));

  EXPECT_NO_THROW(manager().Stop(id));
  EXPECT_EQ(manager().Get(id).status, SandboxStatus::STOPPED);
  EXPECT_EQ(CountLines(id, "Error terminating process: handle is stuck"), 1);
}

TEST_F(LifecycleManagerTest, RestartOpensNewAttempt) {
  auto id = manager().Create("again", Restricted()).id;
  manager().Start(id, "echo first");
  ASSERT_TRUE(manager().WaitUntilSettled(id, 10s));
  auto first = manager().Get(id);

  manager().Start(id, "echo second");
  auto restarted = manager().Get(id);
  EXPECT_EQ(restarted.status, SandboxStatus::RUNNING);
  EXPECT_EQ(restarted.attempt, 2u);
  EXPECT_FALSE(restarted.stopped_at.has_value());
  EXPECT_FALSE(restarted.exit_code.has_value());
  EXPECT_GE(*restarted.started_at, *first.stopped_at);

  ASSERT_TRUE(manager().WaitUntilSettled(id, 10s));
  EXPECT_EQ(manager().Get(id).status, SandboxStatus::STOPPED);
  EXPECT_EQ(CountLines(id, "[stdout] first"), 1);
  EXPECT_EQ(CountLines(id, "[stdout] second"), 1);
  EXPECT_EQ(CountLines(id, "Sandbox starting..."), 2);
}

TEST_F(LifecycleManagerTest, StopIsIdempotentOnTerminalSandbox) {
  auto id = manager().Create("done", Restricted()).id;
  manager().Start(id, "true");
  ASSERT_TRUE(manager().WaitUntilSettled(id, 10s));
  auto stopped_at = manager().Get(id).stopped_at;

  manager().Stop(id);
  manager().Stop(id);
  EXPECT_EQ(manager().Get(id).stopped_at, stopped_at);
  EXPECT_EQ(manager().Get(id).status, SandboxStatus::STOPPED);
  EXPECT_EQ(CountLines(id, "Sandbox stopped"), 2);
}

TEST_F(LifecycleManagerTest, StopTwiceOnRunningSandbox) {
  auto id = manager().Create("twice", Restricted()).id;
  manager().Start(id, "sleep 30");
  ASSERT_TRUE(WaitForHandle(id));
  int pid = *manager().Get(id).pid;

  manager().Stop(id);
  auto first = manager().Get(id);
  ASSERT_EQ(first.status, SandboxStatus::STOPPED);
  ASSERT_TRUE(first.stopped_at.has_value());

  manager().Stop(id);
  auto second = manager().Get(id);
  EXPECT_EQ(second.status, SandboxStatus::STOPPED);
  EXPECT_EQ(second.stopped_at, first.stopped_at);
  EXPECT_EQ(CountLines(id, "Process " + std::to_string(pid) + " terminated"), 1);
  EXPECT_EQ(CountLines(id, "Sandbox stopped"), 2);
}

TEST_F(LifecycleManagerTest, WatchdogRacingStopTerminatesOnce) {
  std::vector<std::string> ids;
  for (int i = 0; i < 4; ++i) {
    Policy policy = Fake();
    policy.timeout_seconds = 1;
    ids.push_back(manager().Create("race-" + std::to_string(i), policy).id);
  }
  for (const auto& id : ids) {
    manager().Start(id, "serve");
  }
  for (const auto& id : ids) {
    ASSERT_TRUE(WaitForHandle(id));
  }

  // Land the explicit stops around the moment the watchdogs fire
  std::this_thread::sleep_for(980ms);
  for (const auto& id : ids) {
    manager().Stop(id);
    std::this_thread::sleep_for(10ms);
  }

  for (const auto& id : ids) {
    ASSERT_TRUE(manager().WaitUntilSettled(id, 5s));
    auto settled = manager().Get(id);
    EXPECT_EQ(settled.status, SandboxStatus::STOPPED);
    ASSERT_TRUE(settled.stopped_at.has_value());

    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(manager().Get(id).stopped_at, settled.stopped_at);
    EXPECT_EQ(CountLines(id, "Process 0 terminated"), 1);
    EXPECT_LE(CountLines(id, "timed out"), 1);
  }
  EXPECT_EQ(fake_->terminations.load(), static_cast<int>(ids.size()));
}

TEST_F(LifecycleManagerTest, WatchdogNotDelayedBySlowLaunches) {
  auto id = manager().Create("slow", Restricted(1)).id;
  auto start = std::chrono::steady_clock::now();
  manager().Start(id, "sleep 60");
  ASSERT_TRUE(WaitForHandle(id));

  // Occupy every launch worker well past the timeout
  fake_->launch_delay = 4s;
  for (std::size_t i = 0; i < config_.launch_workers; ++i) {
    manager().Start(manager().Create("busy-" + std::to_string(i), Fake()).id, "true");
  }

  ASSERT_TRUE(manager().WaitUntilSettled(id, 2500ms));
  EXPECT_LT(std::chrono::steady_clock::now() - start, 3s);
  EXPECT_EQ(manager().Get(id).status, SandboxStatus::STOPPED);
  EXPECT_EQ(CountLines(id, "Sandbox timed out after 1 seconds"), 1);
}

TEST_F(LifecycleManagerTest, ReadsDoNotWaitForTermination) {
  fake_->terminate_delay = 1500ms;
  auto slow = manager().Create("slow-stop", Fake()).id;
  auto other = manager().Create("bystander", Restricted()).id;
  manager().Start(slow, "serve");
  ASSERT_TRUE(WaitForHandle(slow));

  std::thread stopper([this, &slow] { manager().Stop(slow); });
  while (fake_->terminations.load() == 0) {
    std::this_thread::sleep_for(5ms);
  }

  auto before = std::chrono::steady_clock::now();
  EXPECT_EQ(manager().List().size(), 2u);
  EXPECT_EQ(manager().GetStats().total, 2u);
  EXPECT_EQ(manager().Get(slow).status, SandboxStatus::STOPPED);
  EXPECT_EQ(manager().Get(other).status, SandboxStatus::PENDING);
  EXPECT_LT(std::chrono::steady_clock::now() - before, 500ms);
  EXPECT_FALSE(manager().WaitUntilSettled(slow, 50ms));

  stopper.join();
  EXPECT_TRUE(manager().WaitUntilSettled(slow, 1s));
  EXPECT_EQ(CountLines(slow, "Process 0 terminated"), 1);
  EXPECT_EQ(CountLines(slow, "Sandbox stopped"), 1);
}

TEST_F(LifecycleManagerTest, StopPendingSandbox) {
  auto id = manager().Create("never-started", Restricted()).id;
  manager().Stop(id);
  auto stopped = manager().Get(id);
  EXPECT_EQ(stopped.status, SandboxStatus::STOPPED);
  EXPECT_TRUE(stopped.stopped_at.has_value());
  EXPECT_FALSE(stopped.started_at.has_value());
}

TEST_F(LifecycleManagerTest, DeleteRunningSandbox) {
  auto id = manager().Create("doomed", Restricted()).id;
  manager().Start(id, "sleep 30");
  ASSERT_TRUE(WaitForHandle(id));
  int pid = *manager().Get(id).pid;

  manager().Delete(id);
  EXPECT_THROW(manager().Get(id), SandboxError);
  EXPECT_THROW(manager().GetLogs(id), SandboxError);
  EXPECT_THROW(manager().GetLogsSince(id, 0), SandboxError);
  EXPECT_THROW(manager().Delete(id), SandboxError);
  EXPECT_TRUE(manager().List().empty());

  errno = 0;
  EXPECT_EQ(kill(pid, 0), -1);
  EXPECT_EQ(errno, ESRCH);
}

TEST_F(LifecycleManagerTest, DeleteDuringLaunchTerminatesLateHandle) {
  fake_->launch_delay = 300ms;
  auto id = manager().Create("short-lived", Fake()).id;
  manager().Start(id, "serve");
  manager().Delete(id);

  EXPECT_THROW(manager().Get(id), SandboxError);
  EXPECT_TRUE(manager().List().empty());

  auto deadline = std::chrono::steady_clock::now() + 5s;
  while (fake_->terminations.load() == 0 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(10ms);
  }
  EXPECT_EQ(fake_->launches.load(), 1);
  EXPECT_EQ(fake_->terminations.load(), 1);
  EXPECT_TRUE(manager().List().empty());
  EXPECT_EQ(manager().GetStats().total, 0u);
}

TEST_F(LifecycleManagerTest, ListFilterAndStats) {
  auto a = manager().Create("a", Restricted()).id;
  manager().Create("b", Restricted());
  manager().Create("c", Fake());

  manager().Start(a, "true");
  ASSERT_TRUE(manager().WaitUntilSettled(a, 10s));

  EXPECT_EQ(manager().List().size(), 3u);
  EXPECT_EQ(manager().List(SandboxStatus::PENDING).size(), 2u);
  auto stopped = manager().List(SandboxStatus::STOPPED);
  ASSERT_EQ(stopped.size(), 1u);
  EXPECT_EQ(stopped[0].id, a);

  auto stats = manager().GetStats();
  EXPECT_EQ(stats.total, 3u);
  EXPECT_EQ(stats.by_status.at(SandboxStatus::PENDING), 2u);
  EXPECT_EQ(stats.by_status.at(SandboxStatus::STOPPED), 1u);
  EXPECT_EQ(stats.by_status.at(SandboxStatus::RUNNING), 0u);
  EXPECT_EQ(stats.by_status.at(SandboxStatus::FAILED), 0u);
  EXPECT_EQ(stats.by_kind.at(IsolationKind::RESTRICTED_PROCESS), 2u);
  EXPECT_EQ(stats.by_kind.at(IsolationKind::CONTAINER), 1u);
  EXPECT_EQ(stats.by_kind.at(IsolationKind::NAMESPACE), 0u);
}

TEST_F(LifecycleManagerTest, UpdateNetworkPolicy) {
  auto id = manager().Create("net", Restricted()).id;

  auto policy = manager().UpdateNetworkPolicy(id, std::set<std::string>{"api.github.com"},
                                              std::nullopt);
  EXPECT_THAT(policy.allowed_networks, ElementsAre("api.github.com"));
  EXPECT_TRUE(policy.blocked_networks.empty());

  policy = manager().UpdateNetworkPolicy(id, std::nullopt, std::set<std::string>{"evil.com"});
  EXPECT_THAT(policy.allowed_networks, ElementsAre("api.github.com"));
  EXPECT_THAT(policy.blocked_networks, ElementsAre("evil.com"));

  EXPECT_EQ(manager().Get(id).policy, policy);
  EXPECT_EQ(CountLines(id, "Network policy updated"), 2);
}

TEST_F(LifecycleManagerTest, GetLogsReturnsSuffix) {
  auto id = manager().Create("chatty", Restricted()).id;
  manager().Start(id, "for i in 1 2 3 4 5 6 7 8 9 10 11 12; do echo line $i; done");
  ASSERT_TRUE(manager().WaitUntilSettled(id, 10s));

  auto all = manager().GetLogs(id, 100000);
  ASSERT_EQ(all.size(), manager().LogLineCount(id));
  ASSERT_GE(all.size(), 15u);
  for (std::size_t n = 1; n <= all.size(); ++n) {
    auto tail = manager().GetLogs(id, static_cast<int>(n));
    ASSERT_EQ(tail.size(), n);
    EXPECT_TRUE(std::equal(tail.begin(), tail.end(), all.end() - static_cast<std::ptrdiff_t>(n)));
  }
  EXPECT_EQ(manager().GetLogs(id, 0), all);
  EXPECT_EQ(manager().GetLogs(id, -1), all);
}

TEST_F(LifecycleManagerTest, LogCapacityBoundsBuffer) {
  config_.log_capacity = 5;
  auto id = manager().Create("bounded", Restricted()).id;
  manager().Start(id, "seq 1 50");
  ASSERT_TRUE(manager().WaitUntilSettled(id, 10s));

  EXPECT_EQ(manager().LogLineCount(id), 5u);
  EXPECT_EQ(manager().Get(id).log_lines, 5u);
  EXPECT_THAT(manager().GetLogs(id).back(), HasSubstr("Process exited with code: 0"));

  // A follower starting from the beginning learns how much was evicted
  auto chunk = manager().GetLogsSince(id, 0);
  ASSERT_EQ(chunk.lines.size(), 5u);
  EXPECT_GE(chunk.next, 53u);
  EXPECT_EQ(chunk.dropped, chunk.next - 5);
  EXPECT_TRUE(manager().GetLogsSince(id, chunk.next).lines.empty());
}

TEST_F(LifecycleManagerTest, ConcurrentSandboxesAreIndependent) {
  std::vector<std::string> ids;
  for (int i = 0; i < 6; ++i) {
    ids.push_back(manager().Create("job-" + std::to_string(i), Restricted()).id);
  }
  for (std::size_t i = 0; i < ids.size(); ++i) {
    manager().Start(ids[i], "echo job " + std::to_string(i) + "; exit " + std::to_string(i));
  }
  for (std::size_t i = 0; i < ids.size(); ++i) {
    ASSERT_TRUE(manager().WaitUntilSettled(ids[i], 10s));
    auto snapshot = manager().Get(ids[i]);
    EXPECT_THAT(snapshot.exit_code, Optional(static_cast<int>(i)));
    EXPECT_EQ(CountLines(ids[i], "[stdout] job " + std::to_string(i)), 1);
  }
}

TEST_F(LifecycleManagerTest, ShutdownTerminatesLiveProcesses) {
  auto id = manager().Create("orphan", Restricted()).id;
  manager().Start(id, "sleep 30");
  ASSERT_TRUE(WaitForHandle(id));
  int pid = *manager().Get(id).pid;

  manager_.reset();

  errno = 0;
  EXPECT_EQ(kill(pid, 0), -1);
  EXPECT_EQ(errno, ESRCH);
}

}  // namespace
