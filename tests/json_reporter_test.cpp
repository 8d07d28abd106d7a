/**
 * @file json_reporter_test.cpp
 * @brief Tests for JSON serialization of results
 *
 * @date 2025
 */

#include "wasmbox/reporters/json_reporter.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

using json = nlohmann::json;
using wasmbox::reporters::JsonReporter;
using wasmbox::reporters::JsonReporterConfig;

namespace core = wasmbox::core;
namespace runtime = wasmbox::runtime;

namespace {

core::ExecutionResult FailedResult() {
    core::ExecutionResult result;
    result.success = false;
    result.stdout_output = "partial\n";
    result.stderr_output = "Execution trapped: OutOfFuel\n";
    result.fuel_consumed = 2'000'000'001;
    result.duration = std::chrono::microseconds(1'520'000);
    result.exit_code = 1;
    result.failure_kind = core::FailureKind::OUT_OF_FUEL;
    result.files_created = {"out/report.csv"};
    result.workspace_path = "/srv/wasmbox/workspace/s1";

    result.metadata.session_id = "s1";
    result.metadata.runtime = "python";
    result.metadata.trapped = true;
    result.metadata.trap_reason = "out_of_fuel";
    result.metadata.fuel_analysis.status = "exhausted";

    core::ErrorGuidance guidance;
    guidance.error_type = "OutOfFuel";
    guidance.actionable_guidance = {"Increase fuel_budget"};
    guidance.code_examples.push_back({"{\"fuel_budget\": 1}", "{\"fuel_budget\": 2}", "More fuel"});
    result.metadata.error_guidance = guidance;
    return result;
}

} // anonymous namespace

TEST(JsonReporterTest, ExecutionDocumentShape) {
    json doc = JsonReporter().ToJson(FailedResult());

    EXPECT_FALSE(doc["success"].get<bool>());
    EXPECT_EQ(doc["failure_kind"], "OutOfFuel");
    EXPECT_EQ(doc["exit_code"], 1);
    EXPECT_EQ(doc["duration_ms"], 1520);
    EXPECT_DOUBLE_EQ(doc["duration"].get<double>(), 1.52);
    EXPECT_EQ(doc["files_created"][0], "out/report.csv");
    EXPECT_TRUE(doc["files_modified"].is_array());

    const auto& meta = doc["metadata"];
    EXPECT_EQ(meta["trap_reason"], "out_of_fuel");
    EXPECT_TRUE(meta["trap_message"].is_null());
    EXPECT_EQ(meta["fuel_analysis"]["status"], "exhausted");
    EXPECT_EQ(meta["error_guidance"]["error_type"], "OutOfFuel");
    EXPECT_TRUE(meta["error_guidance"]["failing_line"].is_null());
    EXPECT_EQ(meta["error_guidance"]["code_examples"][0]["explanation"], "More fuel");
}

TEST(JsonReporterTest, SuccessfulRunHasNoGuidance) {
    core::ExecutionResult result;
    result.success = true;
    json doc = JsonReporter().ToJson(result);
    EXPECT_EQ(doc["failure_kind"], "None");
    EXPECT_FALSE(doc["metadata"].contains("error_guidance"));
}

TEST(JsonReporterTest, MetadataCanBeOmitted) {
    JsonReporterConfig config;
    config.include_metadata = false;
    config.pretty_print = false;
    JsonReporter reporter(config);

    std::string text = reporter.GenerateJsonString(FailedResult());
    EXPECT_EQ(text.find('\n'), std::string::npos);
    EXPECT_FALSE(json::parse(text).contains("metadata"));
}

TEST(JsonReporterTest, InvalidUtf8IsReplacedNotThrown) {
    core::ExecutionResult result;
    result.stdout_output = "ok \xff\xfe end";
    std::string text;
    ASSERT_NO_THROW(text = JsonReporter().GenerateJsonString(result));
    EXPECT_NE(text.find("\xEF\xBF\xBD"), std::string::npos);
}

TEST(JsonReporterTest, PruneDocument) {
    core::PruneResult prune;
    prune.deleted_sessions = {"old"};
    prune.skipped_sessions = {"broken"};
    prune.reclaimed_bytes = 4096;
    prune.dry_run = true;

    json doc = JsonReporter().ToJson(prune);
    EXPECT_EQ(doc["deleted_sessions"][0], "old");
    EXPECT_EQ(doc["reclaimed_bytes"], 4096);
    EXPECT_TRUE(doc["dry_run"].get<bool>());
    EXPECT_EQ(doc["summary"].get<std::string>().rfind("Would prune 1 session", 0), 0u);
}

TEST(JsonReporterTest, SessionDocument) {
    core::SandboxSession session;
    session.session_id = "s1";
    session.language = runtime::RuntimeType::JAVASCRIPT;
    session.execution_count = 3;

    json doc = JsonReporter().ToJson(session);
    EXPECT_EQ(doc["language"], "javascript");
    EXPECT_EQ(doc["execution_count"], 3);
    EXPECT_FALSE(doc["busy"].get<bool>());
}

TEST(JsonReporterTest, SaveReportWritesParseableFile) {
    wasmbox::testing::TempDir dir;
    auto path = dir.Path() / "report.json";
    ASSERT_TRUE(JsonReporter().SaveReport(FailedResult(), path));
    EXPECT_EQ(json::parse(dir.Read("report.json"))["metadata"]["session_id"], "s1");

    EXPECT_FALSE(JsonReporter().SaveReport(FailedResult(), dir.Path() / "missing" / "report.json"));
}
