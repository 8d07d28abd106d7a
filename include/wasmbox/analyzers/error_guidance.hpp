/**
 * @file error_guidance.hpp
 * @brief Classification of failed runs into actionable guidance
 *
 * Signals are consulted in priority order:
 * 1. The failure kind (fuel, memory, timeout) - the most reliable signal
 * 2. Stderr patterns for the guest language
 *
 * Only the first 10 KB of stderr is scanned. Guest line numbers are shifted
 * back by the injected prologue so they point into the user's own code.
 *
 * @date 2025
 */

#pragma once

#include "wasmbox/core/execution_result.hpp"
#include "wasmbox/runtime/runtime_type.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace wasmbox {
namespace analyzers {

/**
 * @struct GuidanceInputs
 * @brief Everything the builder looks at
 */
struct GuidanceInputs {
    core::FailureKind failure_kind{core::FailureKind::NONE};
    runtime::RuntimeType language{runtime::RuntimeType::PYTHON};
    std::string stderr_output;
    std::uint64_t fuel_consumed{0};
    std::uint64_t fuel_budget{0};
    std::uint64_t memory_limit_bytes{0};
    double timeout_seconds{0.0};
    int prologue_lines{0};
    std::vector<std::string> heavy_packages;   ///< From FuelAnalyzer::DetectHeavyPackages
};

/**
 * @class ErrorGuidanceBuilder
 * @brief Builds ErrorGuidance for a failed run
 */
class ErrorGuidanceBuilder {
public:
    /// Bytes of stderr examined
    static constexpr std::size_t kMaxScanBytes = 10'000;

    /**
     * @brief Classify a failure
     * @return Guidance, or std::nullopt when nothing is recognized
     */
    std::optional<core::ErrorGuidance> Build(const GuidanceInputs& inputs) const;

    /**
     * @brief User-code line of the innermost frame, after removing the prologue
     */
    static std::optional<int> ExtractUserLine(const std::string& stderr_output,
                                              runtime::RuntimeType language, int prologue_lines);

    static const std::vector<std::string>& VendoredPythonPackages();
    static const std::vector<std::string>& VendoredJavaScriptPackages();

private:
    std::optional<core::ErrorGuidance> ClassifyPython(const std::string& sample, int prologue_lines) const;
    std::optional<core::ErrorGuidance> ClassifyJavaScript(const std::string& sample, int prologue_lines) const;
};

} // namespace analyzers
} // namespace wasmbox
