/**
 * @file fuel_analyzer.hpp
 * @brief Fuel utilization classification and budget recommendations
 *
 * Classifies how much of the instruction budget a run used and explains the
 * likely reason. Heavy guest packages are recognized from import lines in
 * stderr; very high consumption without one suggests large-dataset work.
 *
 * **Status thresholds** (utilization of the budget):
 * | Status    | Utilization |
 * |-----------|-------------|
 * | exhausted | >= 100%     |
 * | critical  | >= 90%      |
 * | warning   | >= 75%      |
 * | moderate  | >= 50%      |
 * | efficient | < 50%       |
 *
 * @date 2025
 */

#pragma once

#include "wasmbox/core/execution_result.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace wasmbox {
namespace analyzers {

/**
 * @struct PackageFuelRange
 * @brief First-import cost of a guest package, in billions of instructions
 */
struct PackageFuelRange {
    double min_billions{0.0};
    double max_billions{0.0};
};

/**
 * @class FuelAnalyzer
 * @brief Turns raw fuel numbers into a FuelAnalysis
 *
 * **Usage Example**:
 * @code
 * FuelAnalyzer analyzer;
 * auto analysis = analyzer.Analyze(result.fuel_consumed, policy.fuel_budget,
 *                                  result.stderr_output, false);
 * spdlog::info("Fuel: {} ({}%)", analysis.status, analysis.utilization_percent);
 * @endcode
 */
class FuelAnalyzer {
public:
    /**
     * @struct Config
     */
    struct Config {
        std::uint64_t large_dataset_threshold{3'000'000'000ULL};   ///< Above this with no heavy package
    };

    explicit FuelAnalyzer(const Config& config);
    explicit FuelAnalyzer();

    /**
     * @brief Analyze one run
     * @param consumed Fuel consumed
     * @param budget Fuel budget
     * @param stderr_output Guest stderr, scanned for heavy imports
     * @param cached_session True when imports are already warm in this session
     */
    core::FuelAnalysis Analyze(std::uint64_t consumed, std::uint64_t budget,
                               const std::string& stderr_output, bool cached_session) const;

    /**
     * @brief Heavy packages mentioned in import lines, in table order
     */
    std::vector<std::string> DetectHeavyPackages(const std::string& stderr_output) const;

    /**
     * @brief Status name for a utilization percentage
     */
    static std::string ClassifyStatus(double utilization_percent);

    /**
     * @brief Known heavy packages and their first-import cost
     */
    static const std::vector<std::pair<std::string, PackageFuelRange>>& HeavyPackages();

private:
    std::string BuildRecommendation(const std::string& status, std::uint64_t consumed, std::uint64_t budget,
                                    double utilization_percent, const std::vector<std::string>& packages,
                                    bool cached_session) const;

    Config config_;
};

} // namespace analyzers
} // namespace wasmbox
