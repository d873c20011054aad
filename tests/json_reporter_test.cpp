#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "warden/core/errors.hpp"
#include "warden/reporters/json_reporter.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>

#include <unistd.h>

namespace {

using namespace warden::core;
using warden::reporters::JsonReporter;
using warden::reporters::JsonReporterConfig;
using json = nlohmann::json;
namespace fs = std::filesystem;

SandboxSnapshot MakeSnapshot() {
  SandboxSnapshot snapshot;
  snapshot.id = "8c1f2a0e-0000-4000-8000-000000000001";
  snapshot.name = "build-job";
  snapshot.status = SandboxStatus::STOPPED;
  snapshot.policy = Policy::Default();
  snapshot.created_at = std::chrono::system_clock::time_point(std::chrono::milliseconds(1710408413589LL));
  snapshot.started_at = snapshot.created_at + std::chrono::milliseconds(12);
  snapshot.command = "make test";
  snapshot.handle = "pid 4242";
  snapshot.pid = 4242;
  snapshot.exit_code = 0;
  snapshot.attempt = 1;
  snapshot.log_lines = 3;
  return snapshot;
}

TEST(JsonReporterTest, SnapshotFields) {
  JsonReporter reporter;
  json j = reporter.SnapshotToJson(MakeSnapshot());

  EXPECT_EQ(j["id"], "8c1f2a0e-0000-4000-8000-000000000001");
  EXPECT_EQ(j["status"], "stopped");
  EXPECT_EQ(j["isolationKind"], "namespace");
  EXPECT_EQ(j["config"]["maxMemoryMb"], 512);
  EXPECT_EQ(j["createdAt"], "2024-03-14T09:26:53.589Z");
  EXPECT_EQ(j["startedAt"], "2024-03-14T09:26:53.601Z");
  EXPECT_TRUE(j["stoppedAt"].is_null());
  EXPECT_EQ(j["processId"], 4242);
  EXPECT_EQ(j["exitCode"], 0);
  EXPECT_EQ(j["logLines"], 3);
}

TEST(JsonReporterTest, AbsentValuesAreNull) {
  SandboxSnapshot snapshot;
  snapshot.id = "x";
  snapshot.name = "pending";
  JsonReporterConfig config;
  config.include_policy = false;
  json j = JsonReporter(config).SnapshotToJson(snapshot);

  EXPECT_EQ(j["status"], "pending");
  EXPECT_FALSE(j.contains("config"));
  EXPECT_TRUE(j["handle"].is_null());
  EXPECT_TRUE(j["processId"].is_null());
  EXPECT_TRUE(j["exitCode"].is_null());
  EXPECT_TRUE(j["startedAt"].is_null());
}

TEST(JsonReporterTest, ListLogsAndStats) {
  JsonReporter reporter;
  json list = reporter.ListToJson({MakeSnapshot(), MakeSnapshot()});
  EXPECT_EQ(list["total"], 2);
  EXPECT_EQ(list["sandboxes"].size(), 2u);

  json logs = reporter.LogsToJson("abc", {"[t] a", "[t] b"}, 7);
  EXPECT_EQ(logs["logs"], json::array({"[t] a", "[t] b"}));
  EXPECT_EQ(logs["totalLines"], 7);

  SandboxStats stats;
  stats.Add(SandboxStatus::RUNNING, IsolationKind::CONTAINER);
  json s = reporter.StatsToJson(stats);
  EXPECT_EQ(s["total"], 1);
  EXPECT_EQ(s["byStatus"]["running"], 1);
  EXPECT_EQ(s["byStatus"]["failed"], 0);
  EXPECT_EQ(s["byIsolation"]["container"], 1);
  EXPECT_EQ(s["byIsolation"]["restricted-process"], 0);
}

TEST(JsonReporterTest, RunReportParsesBack) {
  JsonReporterConfig config;
  config.pretty_print = false;
  JsonReporter reporter(config);

  std::string text = reporter.GenerateRunReport(MakeSnapshot(), {"[t] hello"}, 1);
  EXPECT_EQ(text.find('\n'), std::string::npos);

  json report = json::parse(text);
  EXPECT_EQ(report["name"], "build-job");
  EXPECT_EQ(report["logs"], json::array({"[t] hello"}));
  EXPECT_EQ(report["totalLines"], 1);
}

TEST(JsonReporterTest, SaveReportCreatesDirectories) {
  fs::path dir = fs::path(::testing::TempDir()) / ("warden-report-" + std::to_string(::getpid()));
  fs::path path = dir / "nested" / "report.json";

  JsonReporter reporter;
  ASSERT_TRUE(reporter.SaveReport("{}", path));
  std::ifstream in(path);
  std::stringstream content;
  content << in.rdbuf();
  EXPECT_EQ(content.str(), "{}\n");
  fs::remove_all(dir);
}

TEST(SandboxStatusTest, Names) {
  EXPECT_EQ(SandboxStatusToString(SandboxStatus::FAILED), "failed");
  EXPECT_EQ(ParseSandboxStatus("Running"), SandboxStatus::RUNNING);
  EXPECT_THROW(ParseSandboxStatus("paused"), SandboxError);
  EXPECT_TRUE(IsTerminal(SandboxStatus::STOPPED));
  EXPECT_TRUE(IsTerminal(SandboxStatus::FAILED));
  EXPECT_FALSE(IsTerminal(SandboxStatus::PENDING));
}

}  // namespace
