/**
 * @file execution_result.hpp
 * @brief Uniform result model returned by every guest execution
 *
 * The same structures describe Python and JavaScript runs. Resource-limit
 * violations and guest errors are expressed through FailureKind and the
 * attached analysis, never through exceptions.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace wasmbox {
namespace core {

/**
 * @enum FailureKind
 * @brief Why a run did not succeed
 */
enum class FailureKind {
    NONE,                  ///< Run succeeded
    OUT_OF_FUEL,           ///< Instruction budget exhausted
    OUT_OF_MEMORY,         ///< Linear memory ceiling reached
    TIMEOUT,               ///< Wall-clock deadline passed
    GUEST_RUNTIME_ERROR    ///< Uncaught guest error, non-zero exit or host fault
};

/**
 * @brief Stable external name ("None", "OutOfFuel", ...)
 */
std::string FailureKindToString(FailureKind kind);

/**
 * @struct FuelAnalysis
 * @brief Fuel utilization summary with a budget recommendation
 */
struct FuelAnalysis {
    std::uint64_t consumed{0};
    std::uint64_t budget{0};
    double utilization_percent{0.0};         ///< Rounded to two decimals
    std::string status;                      ///< efficient|moderate|warning|critical|exhausted
    std::string recommendation;
    std::vector<std::string> likely_causes;
};

/**
 * @struct CodeExample
 * @brief Before/after snippet attached to error guidance
 */
struct CodeExample {
    std::string before;
    std::string after;
    std::string explanation;
};

/**
 * @struct ErrorGuidance
 * @brief Structured hints for fixing a failed run
 */
struct ErrorGuidance {
    std::string error_type;                       ///< e.g. "OutOfFuel", "PathRestriction"
    std::vector<std::string> actionable_guidance; ///< One hint per line
    std::vector<CodeExample> code_examples;
    std::optional<int> failing_line;              ///< Line in the user's code (1-based)
};

/**
 * @struct ExecutionMetadata
 * @brief Diagnostic details carried alongside a result
 */
struct ExecutionMetadata {
    std::string session_id;
    std::string runtime;                          ///< "python" or "javascript"
    FuelAnalysis fuel_analysis;
    std::optional<ErrorGuidance> error_guidance;  ///< Present on failure

    bool stdout_truncated{false};
    bool stderr_truncated{false};

    bool trapped{false};
    std::optional<std::string> trap_reason;       ///< out_of_fuel, timeout, memory_limit, trap, host_error
    std::optional<std::string> trap_message;

    std::uint32_t memory_pages{0};
    std::uint64_t fuel_budget{0};
    std::uint64_t memory_limit_bytes{0};
};

/**
 * @struct ExecutionResult
 * @brief Outcome of one guest execution
 */
struct ExecutionResult {
    bool success{false};
    std::string stdout_output;
    std::string stderr_output;
    std::uint64_t fuel_consumed{0};
    std::chrono::microseconds duration{0};
    std::uint64_t memory_used_bytes{0};
    std::vector<std::string> files_created;       ///< Sorted workspace-relative POSIX paths
    std::vector<std::string> files_modified;
    int exit_code{0};
    FailureKind failure_kind{FailureKind::NONE};
    std::filesystem::path workspace_path;
    ExecutionMetadata metadata;

    /**
     * @brief Duration in seconds
     */
    double DurationSeconds() const {
        return std::chrono::duration<double>(duration).count();
    }
};

} // namespace core
} // namespace wasmbox
