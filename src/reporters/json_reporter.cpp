/**
 * @file json_reporter.cpp
 * @brief Implementation of JSON result serialization
 *
 * @date 2025
 */

#include "wasmbox/reporters/json_reporter.hpp"
#include "wasmbox/runtime/runtime_type.hpp"
#include "wasmbox/storage/workspace_store.hpp"
#include "wasmbox/utils/time_utils.hpp"

#include <spdlog/spdlog.h>

namespace wasmbox {
namespace reporters {

using json = nlohmann::json;

namespace {

json OptionalString(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

} // anonymous namespace

JsonReporter::JsonReporter(const JsonReporterConfig& config)
    : config_(config) {
}

JsonReporter::JsonReporter()
    : JsonReporter(JsonReporterConfig{}) {
}

// ============================================================================
// Document Builders
// ============================================================================

json JsonReporter::ToJson(const core::FuelAnalysis& analysis) {
    return {
        {"consumed", analysis.consumed},
        {"budget", analysis.budget},
        {"utilization_percent", analysis.utilization_percent},
        {"status", analysis.status},
        {"recommendation", analysis.recommendation},
        {"likely_causes", analysis.likely_causes},
    };
}

json JsonReporter::ToJson(const core::ErrorGuidance& guidance) {
    json examples = json::array();
    for (const auto& example : guidance.code_examples) {
        examples.push_back({
            {"before", example.before},
            {"after", example.after},
            {"explanation", example.explanation},
        });
    }

    json j = {
        {"error_type", guidance.error_type},
        {"actionable_guidance", guidance.actionable_guidance},
        {"code_examples", examples},
    };
    j["failing_line"] = guidance.failing_line ? json(*guidance.failing_line) : json(nullptr);
    return j;
}

json JsonReporter::ToJson(const core::ExecutionResult& result) const {
    double duration = result.DurationSeconds();

    json j = {
        {"success", result.success},
        {"stdout", result.stdout_output},
        {"stderr", result.stderr_output},
        {"fuel_consumed", result.fuel_consumed},
        {"duration", duration},
        {"duration_ms", static_cast<std::int64_t>(result.duration.count() / 1000)},
        {"memory_used_bytes", result.memory_used_bytes},
        {"files_created", result.files_created},
        {"files_modified", result.files_modified},
        {"exit_code", result.exit_code},
        {"failure_kind", core::FailureKindToString(result.failure_kind)},
        {"workspace_path", result.workspace_path.string()},
    };

    if (!config_.include_metadata) {
        return j;
    }

    const auto& metadata = result.metadata;
    json meta = {
        {"session_id", metadata.session_id},
        {"runtime", metadata.runtime},
        {"fuel_analysis", ToJson(metadata.fuel_analysis)},
        {"stdout_truncated", metadata.stdout_truncated},
        {"stderr_truncated", metadata.stderr_truncated},
        {"trapped", metadata.trapped},
        {"trap_reason", OptionalString(metadata.trap_reason)},
        {"trap_message", OptionalString(metadata.trap_message)},
        {"memory_pages", metadata.memory_pages},
        {"fuel_budget", metadata.fuel_budget},
        {"memory_limit_bytes", metadata.memory_limit_bytes},
    };
    if (metadata.error_guidance) {
        meta["error_guidance"] = ToJson(*metadata.error_guidance);
    }
    j["metadata"] = std::move(meta);
    return j;
}

json JsonReporter::ToJson(const core::PruneResult& result) const {
    return {
        {"deleted_sessions", result.deleted_sessions},
        {"skipped_sessions", result.skipped_sessions},
        {"reclaimed_bytes", result.reclaimed_bytes},
        {"errors", result.errors},
        {"dry_run", result.dry_run},
        {"summary", result.Summary()},
    };
}

json JsonReporter::ToJson(const core::SandboxSession& session) const {
    return {
        {"session_id", session.session_id},
        {"workspace_path", session.workspace_path.string()},
        {"language", runtime::RuntimeTypeToString(session.language)},
        {"auto_persist_globals", session.auto_persist_globals},
        {"created_at", utils::TimeUtils::ToIso8601(session.created_at)},
        {"last_used_at", utils::TimeUtils::ToIso8601(session.last_used_at)},
        {"execution_count", session.execution_count},
        {"busy", session.busy},
    };
}

// ============================================================================
// Output
// ============================================================================

std::string JsonReporter::Dump(const json& document) const {
    int indent = config_.pretty_print ? config_.indent_size : -1;
    return document.dump(indent, ' ', false, json::error_handler_t::replace);
}

std::string JsonReporter::GenerateJsonString(const core::ExecutionResult& result) const {
    return Dump(ToJson(result));
}

std::string JsonReporter::GenerateJsonString(const core::PruneResult& result) const {
    return Dump(ToJson(result));
}

bool JsonReporter::SaveReport(const core::ExecutionResult& result, const std::filesystem::path& output_path) const {
    try {
        storage::AtomicWriteFile(output_path, GenerateJsonString(result) + "\n");
        spdlog::info("✓ JSON report written: {}", output_path.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to write JSON report {}: {}", output_path.string(), e.what());
        return false;
    }
}

} // namespace reporters
} // namespace wasmbox
