#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "warden/backends/container_backend.hpp"
#include "warden/core/errors.hpp"

#include "fake_command_runner.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>

#include <sys/stat.h>
#include <unistd.h>

namespace {

using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::MatchesRegex;
using ::testing::Not;
using ::testing::StartsWith;

using namespace warden::backends;
using warden::core::ContainerSettings;
using warden::core::ErrorKind;
using warden::core::Policy;
using warden::core::SandboxError;
using warden::testing::FakeCommandRunner;
using warden::testing::FakeResolver;
using warden::utils::EgressPlan;
using warden::utils::PlanEgress;

namespace fs = std::filesystem;

class ContainerBackendTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = fs::path(::testing::TempDir()) /
           ("warden-ct-" + std::to_string(::getpid()) + "-" +
            ::testing::UnitTest::GetInstance()->current_test_info()->name());
    fs::remove_all(dir_);
    fs::create_directories(dir_);
    runner_ = std::make_shared<FakeCommandRunner>();
  }

  void TearDown() override { fs::remove_all(dir_); }

  std::unique_ptr<ContainerBackend> MakeBackend() {
    return std::make_unique<ContainerBackend>(
        settings_, runner_,
        FakeResolver({{"api.github.com", {"140.82.112.5"}}, {"evil.com", {"6.6.6.6"}}}));
  }

  // Stand-in runtime binary: ignores its arguments and runs @p body
  void InstallFakeRuntime(const std::string& body) {
    fs::path script = dir_ / "runtime";
    std::ofstream(script) << "#!/bin/sh\n" << body << "\n";
    chmod(script.c_str(), 0755);
    settings_.runtime_binary = script.string();
  }

  static std::string Joined(const std::vector<std::string>& args) {
    return FakeCommandRunner::Key(args);
  }

  fs::path dir_;
  ContainerSettings settings_;
  std::shared_ptr<FakeCommandRunner> runner_;
};

TEST_F(ContainerBackendTest, ContainerName) {
  EXPECT_EQ(ContainerBackend::ContainerName("1a2b3c4d-5e6f-4000-8000-000000000000"),
            "warden-1a2b3c4d");
}

TEST_F(ContainerBackendTest, RunArgsWithoutNetwork) {
  auto backend = MakeBackend();
  Policy policy = Policy::Default();
  policy.max_cpu_cores = 1.5;
  auto args = backend->BuildRunArgs(policy, "uname -a", "warden-abc", std::nullopt, EgressPlan{});

  auto joined = Joined(args);
  EXPECT_THAT(joined, StartsWith("docker run --rm --name warden-abc --cap-drop ALL "
                                 "--security-opt no-new-privileges --pids-limit 256"));
  EXPECT_THAT(joined, HasSubstr("--memory 512m --memory-swap 512m"));
  EXPECT_THAT(joined, HasSubstr("--cpus 1.5"));
  EXPECT_THAT(joined, HasSubstr("--network none"));

  std::vector<std::string> tail(args.end() - 6, args.end());
  EXPECT_THAT(tail, ElementsAre("--tmpfs", "/tmp", "alpine:latest", "/bin/sh", "-c", "uname -a"));
}

TEST_F(ContainerBackendTest, RunArgsWithNetworkPinsHosts) {
  auto backend = MakeBackend();
  Policy policy;
  policy.allowed_networks = {"api.github.com"};
  auto plan = PlanEgress(policy, FakeResolver({{"api.github.com", {"140.82.112.5"}}}));
  auto args = backend->BuildRunArgs(policy, "", "warden-abc", std::string("warden-abc"), plan);

  auto joined = Joined(args);
  EXPECT_THAT(joined, HasSubstr("--network warden-abc"));
  EXPECT_THAT(joined, HasSubstr("--add-host api.github.com:140.82.112.5"));
  EXPECT_THAT(joined, Not(HasSubstr("--memory")));
  EXPECT_EQ(args.back(), "/bin/sh");
}

TEST_F(ContainerBackendTest, FileMountsAndMasks) {
  fs::create_directories(dir_ / "work" / "private");
  std::ofstream(dir_ / "work" / "key.pem") << "k";

  std::string work = (dir_ / "work").string();
  std::string priv = (dir_ / "work" / "private").string();
  std::string key = (dir_ / "work" / "key.pem").string();

  Policy policy;
  policy.allowed_files = {work};
  policy.blocked_files = {priv, key, "/etc/shadow"};

  auto backend = MakeBackend();
  auto joined = Joined(backend->BuildRunArgs(policy, "ls", "warden-x", std::nullopt, EgressPlan{}));

  EXPECT_THAT(joined, HasSubstr("-v " + work + ":" + work));
  EXPECT_THAT(joined, HasSubstr("--tmpfs " + priv));
  EXPECT_THAT(joined, HasSubstr("-v /dev/null:" + key + ":ro"));
  EXPECT_THAT(joined, Not(HasSubstr("/etc/shadow")));
}

TEST_F(ContainerBackendTest, LaunchCreatesNetworkAndRules) {
  InstallFakeRuntime("exit 0");
  auto backend = MakeBackend();

  Policy policy;
  policy.allowed_networks = {"api.github.com"};
  policy.blocked_networks = {"evil.com"};
  auto handle = backend->Launch(policy, "true", LaunchCallbacks{});
  ASSERT_TRUE(handle.IsValid());
  EXPECT_THAT(handle.reference, MatchesRegex("warden-[0-9a-f]{8}"));
  EXPECT_THAT(handle.notes, Contains(StartsWith("Container network " + handle.reference)));
  EXPECT_THAT(handle.notes, Contains("Container " + handle.reference + " from alpine:latest"));

  ASSERT_TRUE(handle.process->WaitForCompletion(std::chrono::seconds(5)));

  auto calls = runner_->joined_calls();
  ASSERT_GE(calls.size(), 4u);
  EXPECT_THAT(calls[0], StartsWith(settings_.runtime_binary + " network create --driver bridge"));
  EXPECT_THAT(calls[0], HasSubstr("com.docker.network.bridge.name=wdb" +
                                  handle.reference.substr(7)));
  EXPECT_THAT(calls[1], MatchesRegex("iptables -t filter -I DOCKER-USER -s [0-9./]+ -j DROP"));

  // Natural exit releases the container, the rules and the network
  EXPECT_THAT(calls, Contains(settings_.runtime_binary + " rm -f " + handle.reference));
  EXPECT_THAT(calls, Contains(StartsWith("iptables -t filter -D DOCKER-USER")));
  EXPECT_EQ(calls.back(), settings_.runtime_binary + " network rm " + handle.reference);
}

TEST_F(ContainerBackendTest, ContainerNamedAfterSandbox) {
  InstallFakeRuntime("exit 0");
  auto backend = MakeBackend();

  LaunchCallbacks callbacks;
  callbacks.sandbox_id = "3f2a9c1e-7b4d-4e8a-9f10-2c3d4e5f6a7b";
  auto handle = backend->Launch(Policy(), "true", std::move(callbacks));
  EXPECT_EQ(handle.reference, "warden-3f2a9c1e");
  EXPECT_THAT(handle.notes, Contains("Container warden-3f2a9c1e from alpine:latest"));
  ASSERT_TRUE(handle.process->WaitForCompletion(std::chrono::seconds(5)));
}

TEST_F(ContainerBackendTest, NetworkCreateFailure) {
  runner_->FailWhen("docker network create", 1, "permission denied");
  auto backend = MakeBackend();

  Policy policy;
  policy.blocked_networks = {"evil.com"};
  try {
    backend->Launch(policy, "true", LaunchCallbacks{});
    FAIL() << "launch should fail";
  } catch (const SandboxError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::LAUNCH_FAILURE);
    EXPECT_THAT(e.what(), HasSubstr("permission denied"));
  }

  auto calls = runner_->joined_calls();
  EXPECT_THAT(calls, Not(Contains(HasSubstr("network rm"))));
  EXPECT_THAT(calls, Not(Contains(StartsWith("iptables"))));
}

TEST_F(ContainerBackendTest, MissingRuntimeIsLaunchFailure) {
  settings_.runtime_binary = (dir_ / "no-such-runtime").string();
  auto backend = MakeBackend();
  try {
    backend->Launch(Policy(), "true", LaunchCallbacks{});
    FAIL() << "launch should fail";
  } catch (const SandboxError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::LAUNCH_FAILURE);
    EXPECT_THAT(e.what(), HasSubstr("container launch failed"));
  }
}

TEST_F(ContainerBackendTest, TerminateStopsContainer) {
  InstallFakeRuntime("exec sleep 30");
  auto backend = MakeBackend();

  auto handle = backend->Launch(Policy(), "", LaunchCallbacks{});
  ASSERT_TRUE(handle.process->IsRunning());

  TerminationOptions options;
  options.grace_period = std::chrono::milliseconds(1500);
  backend->Terminate(handle, options);

  EXPECT_FALSE(handle.process->IsRunning());
  auto calls = runner_->joined_calls();
  ASSERT_FALSE(calls.empty());
  EXPECT_EQ(calls.front(), settings_.runtime_binary + " stop --time 2 " + handle.reference);
  EXPECT_THAT(calls, Contains(settings_.runtime_binary + " rm -f " + handle.reference));
  EXPECT_THAT(calls, Not(Contains(HasSubstr(" kill "))));
}

TEST_F(ContainerBackendTest, TerminateFallsBackToKill) {
  InstallFakeRuntime("exec sleep 30");
  runner_->FailWhen(settings_.runtime_binary + " stop", 1, "daemon unreachable");
  auto backend = MakeBackend();

  auto handle = backend->Launch(Policy(), "", LaunchCallbacks{});
  backend->Terminate(handle, TerminationOptions{});

  EXPECT_FALSE(handle.process->IsRunning());
  EXPECT_THAT(runner_->joined_calls(),
              Contains(settings_.runtime_binary + " kill " + handle.reference));
}

}  // namespace
