/**
 * @file analyzers_test.cpp
 * @brief Tests for fuel analysis and error guidance
 *
 * @date 2025
 */

#include "wasmbox/analyzers/error_guidance.hpp"
#include "wasmbox/analyzers/fuel_analyzer.hpp"

#include <gtest/gtest.h>

#include <algorithm>

using namespace wasmbox::analyzers;
using wasmbox::core::FailureKind;
using wasmbox::runtime::RuntimeType;

namespace {

bool AnyLineContains(const std::vector<std::string>& lines, const std::string& needle) {
    return std::any_of(lines.begin(), lines.end(), [&needle](const std::string& line) {
        return line.find(needle) != std::string::npos;
    });
}

} // anonymous namespace

// ============================================================================
// FuelAnalyzer
// ============================================================================

TEST(FuelAnalyzerTest, StatusThresholds) {
    EXPECT_EQ(FuelAnalyzer::ClassifyStatus(0.0), "efficient");
    EXPECT_EQ(FuelAnalyzer::ClassifyStatus(49.99), "efficient");
    EXPECT_EQ(FuelAnalyzer::ClassifyStatus(50.0), "moderate");
    EXPECT_EQ(FuelAnalyzer::ClassifyStatus(75.0), "warning");
    EXPECT_EQ(FuelAnalyzer::ClassifyStatus(90.0), "critical");
    EXPECT_EQ(FuelAnalyzer::ClassifyStatus(100.0), "exhausted");
    EXPECT_EQ(FuelAnalyzer::ClassifyStatus(140.0), "exhausted");
}

TEST(FuelAnalyzerTest, EfficientRun) {
    auto analysis = FuelAnalyzer().Analyze(100'000'000, 2'000'000'000, "", false);
    EXPECT_EQ(analysis.status, "efficient");
    EXPECT_DOUBLE_EQ(analysis.utilization_percent, 5.0);
    EXPECT_EQ(analysis.recommendation, "Fuel budget is appropriate for this workload");
    EXPECT_TRUE(analysis.likely_causes.empty());
}

TEST(FuelAnalyzerTest, WarningSuggestsHalfAgainConsumption) {
    auto analysis = FuelAnalyzer().Analyze(1'500'000'000, 2'000'000'000, "", false);
    EXPECT_EQ(analysis.status, "warning");
    EXPECT_NE(analysis.recommendation.find("Consider increasing budget to 2B"), std::string::npos);
    EXPECT_NE(analysis.recommendation.find("current: 2B"), std::string::npos);
}

TEST(FuelAnalyzerTest, ExhaustedDoublesConsumption) {
    auto analysis = FuelAnalyzer().Analyze(2'100'000'000, 2'000'000'000, "", false);
    EXPECT_EQ(analysis.status, "exhausted");
    EXPECT_NE(analysis.recommendation.find("at least 4B"), std::string::npos);
    EXPECT_NE(analysis.recommendation.find("consumed: 2.1B"), std::string::npos);
}

TEST(FuelAnalyzerTest, DetectsHeavyPackagesInTableOrder) {
    FuelAnalyzer analyzer;
    auto packages = analyzer.DetectHeavyPackages(
        "from jinja2 import Template\nimport openpyxl\npython-dateutil imported lazily\n");
    ASSERT_EQ(packages.size(), 3u);
    EXPECT_EQ(packages[0], "openpyxl");
    EXPECT_EQ(packages[1], "jinja2");
    EXPECT_EQ(packages[2], "python-dateutil");

    EXPECT_TRUE(analyzer.DetectHeavyPackages("import openpyxlfoo\n").empty());
    EXPECT_TRUE(analyzer.DetectHeavyPackages("").empty());
}

TEST(FuelAnalyzerTest, HeavyImportShapesRecommendation) {
    auto cold = FuelAnalyzer().Analyze(1'900'000'000, 2'000'000'000, "import openpyxl\n", false);
    EXPECT_EQ(cold.status, "critical");
    EXPECT_TRUE(AnyLineContains(cold.likely_causes, "openpyxl"));
    EXPECT_NE(cold.recommendation.find("openpyxl requires 5-7B for first import"), std::string::npos);
    EXPECT_NE(cold.recommendation.find("persistent session"), std::string::npos);

    auto warm = FuelAnalyzer().Analyze(1'900'000'000, 2'000'000'000, "import openpyxl\n", true);
    EXPECT_TRUE(AnyLineContains(warm.likely_causes, "cached"));
    EXPECT_EQ(warm.recommendation.find("persistent session"), std::string::npos);
}

TEST(FuelAnalyzerTest, LargeDatasetWithoutPackages) {
    auto analysis = FuelAnalyzer().Analyze(3'500'000'000, 10'000'000'000, "", false);
    EXPECT_TRUE(AnyLineContains(analysis.likely_causes, "large dataset"));
}

// ============================================================================
// ErrorGuidanceBuilder
// ============================================================================

TEST(ErrorGuidanceTest, FailureKindTakesPriority) {
    ErrorGuidanceBuilder builder;
    GuidanceInputs inputs;
    inputs.failure_kind = FailureKind::OUT_OF_FUEL;
    inputs.fuel_budget = 1'000'000;
    inputs.fuel_consumed = 1'000'001;
    inputs.stderr_output = "SyntaxError: invalid syntax\n";

    auto guidance = builder.Build(inputs);
    ASSERT_TRUE(guidance.has_value());
    EXPECT_EQ(guidance->error_type, "OutOfFuel");
    EXPECT_TRUE(AnyLineContains(guidance->actionable_guidance, "from 1,000,000 to 2,000,000"));

    inputs.failure_kind = FailureKind::OUT_OF_MEMORY;
    inputs.memory_limit_bytes = 64 * 1024 * 1024;
    EXPECT_EQ(builder.Build(inputs)->error_type, "MemoryExhausted");

    inputs.failure_kind = FailureKind::TIMEOUT;
    inputs.timeout_seconds = 2.5;
    auto timeout = builder.Build(inputs);
    EXPECT_EQ(timeout->error_type, "Timeout");
    EXPECT_TRUE(AnyLineContains(timeout->actionable_guidance, "2.5 s"));
}

TEST(ErrorGuidanceTest, PythonRuntimeErrorPointsAtUserLine) {
    GuidanceInputs inputs;
    inputs.failure_kind = FailureKind::GUEST_RUNTIME_ERROR;
    inputs.prologue_lines = 5;
    inputs.stderr_output =
        "Traceback (most recent call last):\n"
        "  File \"/app/user_code.py\", line 8, in <module>\n"
        "  File \"/app/user_code.py\", line 12, in compute\n"
        "ZeroDivisionError: division by zero\n";

    auto guidance = ErrorGuidanceBuilder().Build(inputs);
    ASSERT_TRUE(guidance.has_value());
    EXPECT_EQ(guidance->error_type, "RuntimeError");
    ASSERT_TRUE(guidance->failing_line.has_value());
    EXPECT_EQ(*guidance->failing_line, 7);
    EXPECT_TRUE(AnyLineContains(guidance->actionable_guidance, "ZeroDivisionError: division by zero"));
}

TEST(ErrorGuidanceTest, PythonPathRestriction) {
    GuidanceInputs inputs;
    inputs.failure_kind = FailureKind::GUEST_RUNTIME_ERROR;
    inputs.stderr_output =
        "Traceback (most recent call last):\n"
        "FileNotFoundError: [Errno 44] No such file or directory: '/etc/passwd'\n";

    auto guidance = ErrorGuidanceBuilder().Build(inputs);
    ASSERT_TRUE(guidance.has_value());
    EXPECT_EQ(guidance->error_type, "PathRestriction");
    EXPECT_TRUE(AnyLineContains(guidance->actionable_guidance, "/etc/passwd"));

    inputs.stderr_output = "FileNotFoundError: [Errno 44] No such file or directory: '/app/missing.csv'\n";
    EXPECT_NE(ErrorGuidanceBuilder().Build(inputs).value_or(wasmbox::core::ErrorGuidance{}).error_type,
              "PathRestriction");
}

TEST(ErrorGuidanceTest, PythonMissingVendoredPackage) {
    GuidanceInputs inputs;
    inputs.failure_kind = FailureKind::GUEST_RUNTIME_ERROR;
    inputs.stderr_output = "ModuleNotFoundError: No module named 'openpyxl'\n";

    auto guidance = ErrorGuidanceBuilder().Build(inputs);
    ASSERT_TRUE(guidance.has_value());
    EXPECT_EQ(guidance->error_type, "MissingVendoredPackage");
    EXPECT_TRUE(AnyLineContains(guidance->actionable_guidance, "5-10B fuel"));
    ASSERT_EQ(guidance->code_examples.size(), 1u);
}

TEST(ErrorGuidanceTest, PythonSyntaxError) {
    GuidanceInputs inputs;
    inputs.failure_kind = FailureKind::GUEST_RUNTIME_ERROR;
    inputs.prologue_lines = 2;
    inputs.stderr_output =
        "  File \"/app/user_code.py\", line 4\n"
        "    if x\n"
        "        ^\n"
        "SyntaxError: expected ':'\n";

    auto guidance = ErrorGuidanceBuilder().Build(inputs);
    ASSERT_TRUE(guidance.has_value());
    EXPECT_EQ(guidance->error_type, "ParseError");
    EXPECT_EQ(guidance->failing_line, 2);
}

TEST(ErrorGuidanceTest, JavaScriptTupleDestructuring) {
    GuidanceInputs inputs;
    inputs.failure_kind = FailureKind::GUEST_RUNTIME_ERROR;
    inputs.language = RuntimeType::JAVASCRIPT;
    inputs.prologue_lines = 10;
    inputs.stderr_output = "TypeError: value is not iterable\n    at <eval> (/app/user_code.js:13)\n";

    auto guidance = ErrorGuidanceBuilder().Build(inputs);
    ASSERT_TRUE(guidance.has_value());
    EXPECT_EQ(guidance->error_type, "QuickJSTupleDestructuring");
    EXPECT_EQ(guidance->failing_line, 3);
}

TEST(ErrorGuidanceTest, JavaScriptMissingRequireVendor) {
    GuidanceInputs inputs;
    inputs.failure_kind = FailureKind::GUEST_RUNTIME_ERROR;
    inputs.language = RuntimeType::JAVASCRIPT;
    inputs.stderr_output = "ReferenceError: could not load module 'csv-simple'\n";

    auto guidance = ErrorGuidanceBuilder().Build(inputs);
    ASSERT_TRUE(guidance.has_value());
    EXPECT_EQ(guidance->error_type, "MissingRequireVendor");
}

TEST(ErrorGuidanceTest, UnrecognizedStderrGivesNothing) {
    GuidanceInputs inputs;
    inputs.failure_kind = FailureKind::GUEST_RUNTIME_ERROR;
    inputs.stderr_output = "some log line\n";
    EXPECT_FALSE(ErrorGuidanceBuilder().Build(inputs).has_value());

    inputs.stderr_output.clear();
    EXPECT_FALSE(ErrorGuidanceBuilder().Build(inputs).has_value());
}

TEST(ErrorGuidanceTest, ExtractUserLineIgnoresPrologueFrames) {
    const std::string stderr_output = "  File \"/app/user_code.py\", line 3, in <module>\n";
    EXPECT_FALSE(ErrorGuidanceBuilder::ExtractUserLine(stderr_output, RuntimeType::PYTHON, 5).has_value());
    EXPECT_EQ(ErrorGuidanceBuilder::ExtractUserLine(stderr_output, RuntimeType::PYTHON, 0), 3);
    EXPECT_FALSE(ErrorGuidanceBuilder::ExtractUserLine("no frames", RuntimeType::JAVASCRIPT, 0).has_value());
}
