/**
 * @file json_reporter.hpp
 * @brief JSON rendering of sandbox snapshots, logs and stats
 *
 * Produces the payloads an API surface or the CLI hands back to callers.
 * Field names are camelCase; absent timestamps and exit codes are null.
 *
 * **Snapshot Example**:
 * ```json
 * {
 *   "id": "8c1f2a0e-...",
 *   "name": "build-job",
 *   "status": "stopped",
 *   "config": { "isolationKind": "namespace", "maxMemoryMb": 512, ... },
 *   "createdAt": "2025-03-14T09:26:53.589Z",
 *   "startedAt": "2025-03-14T09:26:53.601Z",
 *   "stoppedAt": "2025-03-14T09:26:54.020Z",
 *   "processId": 4242,
 *   "exitCode": 0
 * }
 * ```
 *
 * @date 2025
 */

#pragma once

#include "warden/core/sandbox.hpp"

#include <nlohmann/json_fwd.hpp>

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace warden {
namespace reporters {

/**
 * @struct JsonReporterConfig
 * @brief Output shaping
 */
struct JsonReporterConfig {
    bool pretty_print{true};     ///< Indent output
    int indent_size{2};          ///< Spaces per level when pretty printing
    bool include_policy{true};   ///< Embed the policy under "config"
};

class JsonReporter {
public:
    explicit JsonReporter(const JsonReporterConfig& config = JsonReporterConfig{});

    nlohmann::json SnapshotToJson(const core::SandboxSnapshot& snapshot) const;

    /// {"sandboxes": [...], "total": N}
    nlohmann::json ListToJson(const std::vector<core::SandboxSnapshot>& snapshots) const;

    /// {"id": ..., "logs": [...], "totalLines": N}
    nlohmann::json LogsToJson(const std::string& id,
                              const std::vector<std::string>& lines,
                              std::size_t total_lines) const;

    /// {"total": N, "byStatus": {...}, "byIsolation": {...}}
    nlohmann::json StatsToJson(const core::SandboxStats& stats) const;

    /**
     * @brief Final report of a CLI run
     *
     * The snapshot fields plus "logs" and "totalLines".
     */
    std::string GenerateRunReport(const core::SandboxSnapshot& snapshot,
                                  const std::vector<std::string>& lines,
                                  std::size_t total_lines) const;

    std::string Dump(const nlohmann::json& document) const;

    /// @return false (and logs) if the file cannot be written
    bool SaveReport(const std::string& content, const std::filesystem::path& path) const;

private:
    JsonReporterConfig config_;
};

} // namespace reporters
} // namespace warden
