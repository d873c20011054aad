/**
 * @file json_reporter.cpp
 * @brief JSON rendering of sandbox state
 *
 * @date 2025
 */

#include "warden/reporters/json_reporter.hpp"
#include "warden/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <fstream>

using json = nlohmann::json;

namespace warden {
namespace reporters {

namespace {

json TimeOrNull(const std::optional<core::SandboxSnapshot::TimePoint>& tp) {
    if (!tp) {
        return nullptr;
    }
    return utils::StringUtils::FormatTimestamp(*tp);
}

} // anonymous namespace

JsonReporter::JsonReporter(const JsonReporterConfig& config)
    : config_(config) {
    spdlog::debug("JSON reporter initialized (pretty: {})", config_.pretty_print);
}

json JsonReporter::SnapshotToJson(const core::SandboxSnapshot& snapshot) const {
    json j;
    j["id"] = snapshot.id;
    j["name"] = snapshot.name;
    j["status"] = core::SandboxStatusToString(snapshot.status);
    j["isolationKind"] = core::IsolationKindToString(snapshot.policy.isolation_kind);

    if (config_.include_policy) {
        j["config"] = core::PolicyToJson(snapshot.policy);
    }

    j["createdAt"] = utils::StringUtils::FormatTimestamp(snapshot.created_at);
    j["startedAt"] = TimeOrNull(snapshot.started_at);
    j["stoppedAt"] = TimeOrNull(snapshot.stopped_at);

    j["command"] = snapshot.command;
    j["handle"] = snapshot.handle ? json(*snapshot.handle) : json(nullptr);
    j["processId"] = snapshot.pid ? json(*snapshot.pid) : json(nullptr);
    j["exitCode"] = snapshot.exit_code ? json(*snapshot.exit_code) : json(nullptr);
    j["attempt"] = snapshot.attempt;
    j["logLines"] = snapshot.log_lines;

    return j;
}

json JsonReporter::ListToJson(const std::vector<core::SandboxSnapshot>& snapshots) const {
    json list = json::array();
    for (const auto& snapshot : snapshots) {
        list.push_back(SnapshotToJson(snapshot));
    }
    return json{{"sandboxes", list}, {"total", snapshots.size()}};
}

json JsonReporter::LogsToJson(const std::string& id,
                              const std::vector<std::string>& lines,
                              std::size_t total_lines) const {
    return json{
        {"id", id},
        {"logs", lines},
        {"totalLines", total_lines}
    };
}

json JsonReporter::StatsToJson(const core::SandboxStats& stats) const {
    json by_status = json::object();
    for (const auto& [status, count] : stats.by_status) {
        by_status[core::SandboxStatusToString(status)] = count;
    }

    json by_kind = json::object();
    for (const auto& [kind, count] : stats.by_kind) {
        by_kind[core::IsolationKindToString(kind)] = count;
    }

    return json{
        {"total", stats.total},
        {"byStatus", by_status},
        {"byIsolation", by_kind}
    };
}

std::string JsonReporter::GenerateRunReport(const core::SandboxSnapshot& snapshot,
                                            const std::vector<std::string>& lines,
                                            std::size_t total_lines) const {
    json report = SnapshotToJson(snapshot);
    report["logs"] = lines;
    report["totalLines"] = total_lines;
    return Dump(report);
}

std::string JsonReporter::Dump(const json& document) const {
    return config_.pretty_print ? document.dump(config_.indent_size) : document.dump();
}

bool JsonReporter::SaveReport(const std::string& content, const std::filesystem::path& path) const {
    try {
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }

        std::ofstream file(path);
        if (!file) {
            spdlog::error("Failed to open file for writing: {}", path.string());
            return false;
        }
        file << content << "\n";

        spdlog::info("Report written: {}", path.string());
        return true;
    }
    catch (const std::exception& e) {
        spdlog::error("Failed to save report: {}", e.what());
        return false;
    }
}

} // namespace reporters
} // namespace warden
