/**
 * @file end_to_end_test.cpp
 * @brief Real interpreter runs through Sandbox
 *
 * Needs the WASI interpreter builds, located by environment:
 * - WASMBOX_PYTHON_WASM: CPython for WASI
 * - WASMBOX_QUICKJS_WASM: QuickJS for WASI
 *
 * Each test skips when its artifact is not configured.
 *
 * @date 2025
 */

#include "wasmbox/core/sandbox.hpp"
#include "wasmbox/core/session_manager.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <memory>
#include <optional>

using wasmbox::core::FailureKind;
using wasmbox::core::SandboxBuilder;
using wasmbox::core::SessionManager;
using wasmbox::runtime::RuntimeType;

namespace {

std::optional<std::filesystem::path> ArtifactFromEnv(const char* name) {
    const char* value = std::getenv(name);
    if (!value || !*value || !std::filesystem::is_regular_file(value)) {
        return std::nullopt;
    }
    return std::filesystem::path(value);
}

class EndToEndTest : public ::testing::Test {
protected:
    void SetUp() override {
        SessionManager::Config config;
        config.workspace_root = root_.Path() / "workspace";
        sessions_ = std::make_unique<SessionManager>(config);

        if (auto python = ArtifactFromEnv("WASMBOX_PYTHON_WASM")) {
            artifacts_.python_wasm = *python;
            has_python_ = true;
        }
        if (auto quickjs = ArtifactFromEnv("WASMBOX_QUICKJS_WASM")) {
            artifacts_.quickjs_wasm = *quickjs;
            has_quickjs_ = true;
        }
    }

    SandboxBuilder Builder(RuntimeType language) {
        SandboxBuilder builder(*sessions_);
        builder.WithLanguage(language).WithArtifacts(artifacts_);
        return builder;
    }

    wasmbox::testing::TempDir root_;
    std::unique_ptr<SessionManager> sessions_;
    wasmbox::runtime::BackendArtifacts artifacts_;
    bool has_python_{false};
    bool has_quickjs_{false};
};

} // anonymous namespace

TEST_F(EndToEndTest, PythonPrint) {
    if (!has_python_) {
        GTEST_SKIP() << "WASMBOX_PYTHON_WASM not set";
    }
    auto sandbox = Builder(RuntimeType::PYTHON).WithFuelBudget(5'000'000'000).Build();
    auto result = sandbox.Execute("print('hello from python')");
    EXPECT_TRUE(result.success) << result.stderr_output;
    EXPECT_EQ(result.stdout_output, "hello from python\n");
    EXPECT_GT(result.fuel_consumed, 0u);
}

TEST_F(EndToEndTest, PythonStatePersistsAcrossRuns) {
    if (!has_python_) {
        GTEST_SKIP() << "WASMBOX_PYTHON_WASM not set";
    }
    auto sandbox = Builder(RuntimeType::PYTHON)
                       .WithSession("counter")
                       .WithAutoPersist(true)
                       .WithFuelBudget(5'000'000'000)
                       .Build();
    const std::string code = "_state['n'] = _state.get('n', 0) + 1\nprint(_state['n'])";
    EXPECT_EQ(sandbox.Execute(code).stdout_output, "1\n");
    EXPECT_EQ(sandbox.Execute(code).stdout_output, "2\n");
}

TEST_F(EndToEndTest, PythonRunsOutOfFuel) {
    if (!has_python_) {
        GTEST_SKIP() << "WASMBOX_PYTHON_WASM not set";
    }
    auto sandbox = Builder(RuntimeType::PYTHON).WithFuelBudget(2'000'000).Build();
    auto result = sandbox.Execute("while True:\n    pass");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.failure_kind, FailureKind::OUT_OF_FUEL);
    ASSERT_TRUE(result.metadata.error_guidance.has_value());
    EXPECT_EQ(result.metadata.error_guidance->error_type, "OutOfFuel");
}

TEST_F(EndToEndTest, PythonCannotReadOutsideMounts) {
    if (!has_python_) {
        GTEST_SKIP() << "WASMBOX_PYTHON_WASM not set";
    }
    auto sandbox = Builder(RuntimeType::PYTHON).WithFuelBudget(5'000'000'000).Build();
    auto result = sandbox.Execute("open('/etc/passwd').read()");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.failure_kind, FailureKind::GUEST_RUNTIME_ERROR);
    ASSERT_TRUE(result.metadata.error_guidance.has_value());
    EXPECT_EQ(result.metadata.error_guidance->error_type, "PathRestriction");
}

TEST_F(EndToEndTest, PythonWritesWorkspaceFile) {
    if (!has_python_) {
        GTEST_SKIP() << "WASMBOX_PYTHON_WASM not set";
    }
    auto sandbox = Builder(RuntimeType::PYTHON).WithFuelBudget(5'000'000'000).Build();
    auto result = sandbox.Execute("open('/app/out.txt', 'w').write('data')");
    EXPECT_TRUE(result.success) << result.stderr_output;
    ASSERT_EQ(result.files_created.size(), 1u);
    EXPECT_EQ(result.files_created[0], "out.txt");
}

TEST_F(EndToEndTest, JavaScriptPrintAndState) {
    if (!has_quickjs_) {
        GTEST_SKIP() << "WASMBOX_QUICKJS_WASM not set";
    }
    auto sandbox = Builder(RuntimeType::JAVASCRIPT).WithSession("js").WithAutoPersist(true).Build();
    const std::string code = "_state.count = (_state.count || 0) + 1;\nconsole.log('count', _state.count);";
    auto first = sandbox.Execute(code);
    EXPECT_TRUE(first.success) << first.stderr_output;
    EXPECT_EQ(first.stdout_output, "count 1\n");
    EXPECT_EQ(sandbox.Execute(code).stdout_output, "count 2\n");
}

TEST_F(EndToEndTest, JavaScriptRuntimeError) {
    if (!has_quickjs_) {
        GTEST_SKIP() << "WASMBOX_QUICKJS_WASM not set";
    }
    auto sandbox = Builder(RuntimeType::JAVASCRIPT).Build();
    auto result = sandbox.Execute("undefinedFunction();");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.failure_kind, FailureKind::GUEST_RUNTIME_ERROR);
}
