/**
 * @file json_reporter.hpp
 * @brief Machine-readable JSON output for execution and prune results
 *
 * Converts results into nlohmann::json documents for callers that drive the
 * sandbox programmatically (agents, tool servers, the `--json` CLI mode).
 *
 * **Execution document**:
 * ```json
 * {
 *   "success": false,
 *   "stdout": "",
 *   "stderr": "Traceback ...",
 *   "fuel_consumed": 2000000000,
 *   "duration": 1.52,
 *   "duration_ms": 1520,
 *   "memory_used_bytes": 33554432,
 *   "files_created": ["out/report.csv"],
 *   "files_modified": [],
 *   "exit_code": 1,
 *   "failure_kind": "OutOfFuel",
 *   "workspace_path": "/srv/wasmbox/workspace/3f2b...",
 *   "metadata": {
 *     "session_id": "3f2b...",
 *     "runtime": "python",
 *     "fuel_analysis": { "status": "exhausted", ... },
 *     "error_guidance": { "error_type": "OutOfFuel", ... }
 *   }
 * }
 * ```
 *
 * @date 2025
 */

#pragma once

#include "wasmbox/core/execution_result.hpp"
#include "wasmbox/core/session_manager.hpp"

#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace wasmbox {
namespace reporters {

/**
 * @struct JsonReporterConfig
 * @brief Formatting options
 */
struct JsonReporterConfig {
    bool pretty_print{true};     ///< Indent the output
    int indent_size{2};          ///< Spaces per level when pretty printing
    bool include_metadata{true}; ///< Emit the "metadata" object
};

/**
 * @class JsonReporter
 * @brief Serializes wasmbox results to JSON
 *
 * Invalid UTF-8 in guest output is replaced with U+FFFD on dump.
 *
 * **Usage Example**:
 * @code
 * JsonReporter reporter;
 * std::cout << reporter.GenerateJsonString(result) << std::endl;
 * @endcode
 */
class JsonReporter {
public:
    explicit JsonReporter(const JsonReporterConfig& config);
    explicit JsonReporter();

    /***************************************************************************
     * Document Builders
     ***************************************************************************/

    nlohmann::json ToJson(const core::ExecutionResult& result) const;
    nlohmann::json ToJson(const core::PruneResult& result) const;
    nlohmann::json ToJson(const core::SandboxSession& session) const;

    static nlohmann::json ToJson(const core::FuelAnalysis& analysis);
    static nlohmann::json ToJson(const core::ErrorGuidance& guidance);

    /***************************************************************************
     * Output
     ***************************************************************************/

    std::string GenerateJsonString(const core::ExecutionResult& result) const;
    std::string GenerateJsonString(const core::PruneResult& result) const;

    /**
     * @brief Dump any document with this reporter's formatting
     */
    std::string Dump(const nlohmann::json& document) const;

    /**
     * @brief Write an execution report to a file
     * @return true on success
     */
    bool SaveReport(const core::ExecutionResult& result, const std::filesystem::path& output_path) const;

    const JsonReporterConfig& GetConfig() const { return config_; }

private:
    JsonReporterConfig config_;
};

} // namespace reporters
} // namespace wasmbox
