/**
 * @file fuel_analyzer.cpp
 * @brief Implementation of fuel utilization analysis
 *
 * @date 2025
 */

#include "wasmbox/analyzers/fuel_analyzer.hpp"
#include "wasmbox/utils/string_utils.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <regex>
#include <sstream>

namespace wasmbox {
namespace analyzers {

namespace {

constexpr double kBillion = 1'000'000'000.0;

std::string FormatFixed(double value, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

// Package range as "5-7B"
std::string FormatRange(const PackageFuelRange& range) {
    auto compact = [](double v) {
        return v == std::floor(v) ? std::to_string(static_cast<long long>(v)) : FormatFixed(v, 1);
    };
    return compact(range.min_billions) + "-" + compact(range.max_billions) + "B";
}

std::string EscapeRegex(const std::string& text) {
    static const std::regex special(R"([.^$|()\[\]{}*+?\\-])");
    return std::regex_replace(text, special, R"(\$&)");
}

} // anonymous namespace

FuelAnalyzer::FuelAnalyzer(const Config& config)
    : config_(config) {
}

FuelAnalyzer::FuelAnalyzer()
    : FuelAnalyzer(Config{}) {
}

const std::vector<std::pair<std::string, PackageFuelRange>>& FuelAnalyzer::HeavyPackages() {
    static const std::vector<std::pair<std::string, PackageFuelRange>> packages = {
        {"openpyxl", {5, 7}},
        {"PyPDF2", {5, 6}},
        {"jinja2", {5, 10}},
        {"tabulate", {2, 2}},
        {"markdown", {2, 2}},
        {"python-dateutil", {2, 2}},
    };
    return packages;
}

std::string FuelAnalyzer::ClassifyStatus(double utilization_percent) {
    if (utilization_percent >= 100.0) return "exhausted";
    if (utilization_percent >= 90.0) return "critical";
    if (utilization_percent >= 75.0) return "warning";
    if (utilization_percent >= 50.0) return "moderate";
    return "efficient";
}

std::vector<std::string> FuelAnalyzer::DetectHeavyPackages(const std::string& stderr_output) const {
    std::vector<std::string> detected;
    if (stderr_output.empty()) {
        return detected;
    }

    for (const auto& [name, range] : HeavyPackages()) {
        std::string escaped = EscapeRegex(name);
        const std::regex patterns[] = {
            std::regex("\\bimport\\s+" + escaped + "\\b", std::regex::icase),
            std::regex("\\bfrom\\s+" + escaped + "\\b", std::regex::icase),
            std::regex("\\b" + escaped + "\\b.*imported", std::regex::icase),
        };

        for (const auto& pattern : patterns) {
            if (std::regex_search(stderr_output, pattern)) {
                detected.push_back(name);
                break;
            }
        }
    }
    return detected;
}

core::FuelAnalysis FuelAnalyzer::Analyze(std::uint64_t consumed, std::uint64_t budget,
                                         const std::string& stderr_output, bool cached_session) const {
    core::FuelAnalysis analysis;
    analysis.consumed = consumed;
    analysis.budget = budget;

    double utilization = budget > 0 ? static_cast<double>(consumed) / static_cast<double>(budget) * 100.0 : 0.0;
    analysis.utilization_percent = std::round(utilization * 100.0) / 100.0;
    analysis.status = ClassifyStatus(utilization);

    auto packages = DetectHeavyPackages(stderr_output);
    bool large_dataset = consumed > config_.large_dataset_threshold && packages.empty();

    if (!packages.empty()) {
        analysis.likely_causes.push_back("Heavy package imports detected: " +
                                         utils::StringUtils::Join(packages, ", "));
        if (cached_session) {
            analysis.likely_causes.push_back("Note: Subsequent imports in this session will be faster (cached)");
        }
    }
    if (large_dataset) {
        analysis.likely_causes.push_back(
            "High fuel usage suggests large dataset processing or complex computation");
    }

    analysis.recommendation = BuildRecommendation(analysis.status, consumed, budget, utilization,
                                                  packages, cached_session);
    return analysis;
}

std::string FuelAnalyzer::BuildRecommendation(const std::string& status, std::uint64_t consumed,
                                              std::uint64_t budget, double utilization_percent,
                                              const std::vector<std::string>& packages,
                                              bool cached_session) const {
    if (status == "efficient") {
        return "Fuel budget is appropriate for this workload";
    }
    if (status == "moderate") {
        return "Fuel usage is moderate (" + FormatFixed(utilization_percent, 1) +
               "%). Current budget is adequate, but consider increasing if similar tasks are planned";
    }

    double margin = status == "warning" ? 1.5 : 2.0;
    double suggested = static_cast<double>(consumed) * margin;
    long long suggested_b = std::max(1LL, static_cast<long long>(std::llround(suggested / kBillion)));

    std::string current_b = FormatFixed(static_cast<double>(budget) / kBillion, 0);
    std::vector<std::string> parts;

    if (status == "exhausted") {
        parts.push_back("Fuel budget exhausted! Increase to at least " + std::to_string(suggested_b) +
                        "B instructions (current: " + current_b + "B, consumed: " +
                        FormatFixed(static_cast<double>(consumed) / kBillion, 1) + "B)");
    } else if (status == "critical") {
        parts.push_back("Fuel usage is critical (" + FormatFixed(utilization_percent, 1) +
                        "%). Increase budget to " + std::to_string(suggested_b) +
                        "B instructions to avoid exhaustion (current: " + current_b + "B)");
    } else {
        parts.push_back("Fuel usage is high (" + FormatFixed(utilization_percent, 1) +
                        "%). Consider increasing budget to " + std::to_string(suggested_b) +
                        "B instructions for similar tasks (current: " + current_b + "B)");
    }

    if (!packages.empty()) {
        std::vector<std::string> requirements;
        for (const auto& name : packages) {
            for (const auto& [known, range] : HeavyPackages()) {
                if (known == name) {
                    requirements.push_back(name + " requires " + FormatRange(range) + " for first import");
                }
            }
        }
        if (!requirements.empty()) {
            parts.push_back("Package fuel requirements: " + utils::StringUtils::Join(requirements, "; "));
        }
        if (!cached_session) {
            parts.push_back("Note: Using a persistent session will cache imports, "
                            "reducing fuel needs for subsequent executions");
        }
    }

    return utils::StringUtils::Join(parts, ". ");
}

} // namespace analyzers
} // namespace wasmbox
