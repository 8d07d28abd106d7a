/**
 * @file backend_test.cpp
 * @brief Tests for language backends: program composition and failure markers
 *
 * @date 2025
 */

#include "wasmbox/runtime/javascript_backend.hpp"
#include "wasmbox/runtime/language_backend.hpp"
#include "wasmbox/runtime/python_backend.hpp"
#include "wasmbox/utils/string_utils.hpp"

#include <gtest/gtest.h>

using namespace wasmbox::runtime;
using wasmbox::utils::StringUtils;

TEST(RuntimeTypeTest, ParseAcceptsAliases) {
    EXPECT_EQ(ParseRuntimeType("Python"), RuntimeType::PYTHON);
    EXPECT_EQ(ParseRuntimeType(" py "), RuntimeType::PYTHON);
    EXPECT_EQ(ParseRuntimeType("js"), RuntimeType::JAVASCRIPT);
    EXPECT_EQ(ParseRuntimeType("JavaScript"), RuntimeType::JAVASCRIPT);
    EXPECT_FALSE(ParseRuntimeType("ruby").has_value());
    EXPECT_EQ(RuntimeTypeToString(RuntimeType::JAVASCRIPT), "javascript");
}

TEST(BackendFactoryTest, SelectsByTypeWithArtifacts) {
    BackendArtifacts artifacts;
    artifacts.python_wasm = "/opt/wasm/python.wasm";
    artifacts.quickjs_wasm = "/opt/wasm/qjs.wasm";

    auto python = CreateBackend(RuntimeType::PYTHON, artifacts);
    EXPECT_EQ(python->GetType(), RuntimeType::PYTHON);
    EXPECT_EQ(python->GetArtifactPath(), "/opt/wasm/python.wasm");
    EXPECT_EQ(python->GetCodeFilename(), "user_code.py");

    auto js = CreateBackend(RuntimeType::JAVASCRIPT, artifacts);
    EXPECT_EQ(js->GetName(), "javascript");
    EXPECT_EQ(js->GetArtifactPath(), "/opt/wasm/qjs.wasm");
    EXPECT_EQ(js->GetCodeFilename(), "user_code.js");
}

// ============================================================================
// Python
// ============================================================================

TEST(PythonBackendTest, ArgvRunsCodeFromMount) {
    PythonBackend backend("python.wasm");
    auto argv = backend.BuildArgv("/app");
    ASSERT_GE(argv.size(), 3u);
    EXPECT_EQ(argv[0], "python");
    EXPECT_EQ(argv[2], "/app/user_code.py");
}

TEST(PythonBackendTest, BareProgramIsUserCodeOnly) {
    PythonBackend backend("python.wasm");
    InjectionOptions options;
    options.inject_setup = false;

    auto program = backend.ComposeProgram("print(1)\n", options);
    EXPECT_EQ(program.source, "print(1)\n");
    EXPECT_EQ(program.prologue_lines, 0);
}

TEST(PythonBackendTest, SetupPrologueIsCountedAndSubstituted) {
    PythonBackend backend("python.wasm");
    InjectionOptions options;
    options.guest_mount = "/work";

    auto program = backend.ComposeProgram("print(1)", options);
    EXPECT_GT(program.prologue_lines, 0);
    EXPECT_TRUE(StringUtils::Contains(program.source, "/work/site-packages"));
    EXPECT_TRUE(StringUtils::Contains(program.source, "/data/site-packages"));
    EXPECT_FALSE(StringUtils::Contains(program.source, "{MOUNT}"));

    // The first user line sits right after the prologue
    std::size_t newlines = 0;
    std::size_t pos = 0;
    while (newlines < static_cast<std::size_t>(program.prologue_lines)) {
        pos = program.source.find('\n', pos) + 1;
        ++newlines;
    }
    EXPECT_EQ(program.source.compare(pos, 8, "print(1)"), 0);
}

TEST(PythonBackendTest, AutoPersistWrapsStateShim) {
    PythonBackend backend("python.wasm");
    InjectionOptions options;
    options.auto_persist = true;

    auto program = backend.ComposeProgram("_state['n'] = _state.get('n', 0) + 1", options);
    EXPECT_TRUE(StringUtils::Contains(program.source, "_state = _wasmbox_load_state()"));
    EXPECT_TRUE(StringUtils::Contains(program.source, "/app/.session_state.json"));
    EXPECT_TRUE(StringUtils::Contains(program.source, "/app/.session_state.pending.json"));

    std::size_t user = program.source.find("_state['n']");
    std::size_t save = program.source.find(".session_state.pending.json");
    ASSERT_NE(user, std::string::npos);
    EXPECT_LT(user, save);
}

TEST(PythonBackendTest, FailureMarkers) {
    PythonBackend backend("python.wasm");
    EXPECT_TRUE(backend.StderrIndicatesFailure(
        "Traceback (most recent call last):\n  File \"/app/user_code.py\", line 3\nZeroDivisionError: division by zero\n"));
    EXPECT_TRUE(backend.StderrIndicatesFailure("MemoryError\n"));
    EXPECT_FALSE(backend.StderrIndicatesFailure("DeprecationWarning: old api\n"));
    EXPECT_FALSE(backend.StderrIndicatesFailure(""));
}

// ============================================================================
// JavaScript
// ============================================================================

TEST(JavaScriptBackendTest, HelpersAndStateShim) {
    JavaScriptBackend backend("qjs.wasm");
    InjectionOptions options;
    options.auto_persist = true;

    auto program = backend.ComposeProgram("_state.count = (_state.count || 0) + 1;", options);
    EXPECT_TRUE(StringUtils::Contains(program.source, "function readText(path)"));
    EXPECT_TRUE(StringUtils::Contains(program.source, "function requireVendor(name)"));
    EXPECT_TRUE(StringUtils::Contains(program.source, "/data/vendor_js/"));
    EXPECT_TRUE(StringUtils::Contains(program.source, "var _state = "));
    EXPECT_EQ(StringUtils::CountLines(program.source.substr(0, program.source.find("_state.count"))),
              static_cast<std::size_t>(program.prologue_lines));
}

TEST(JavaScriptBackendTest, ArgvEnablesStdModule) {
    JavaScriptBackend backend("qjs.wasm");
    auto argv = backend.BuildArgv("/app");
    ASSERT_EQ(argv.size(), 3u);
    EXPECT_EQ(argv[1], "--std");
    EXPECT_EQ(argv[2], "/app/user_code.js");
}

TEST(JavaScriptBackendTest, FailureMarkers) {
    JavaScriptBackend backend("qjs.wasm");
    EXPECT_TRUE(backend.StderrIndicatesFailure("TypeError: not a function\n    at <eval> (/app/user_code.js:4)\n"));
    EXPECT_TRUE(backend.StderrIndicatesFailure("ReferenceError: x is not defined\n"));
    EXPECT_TRUE(backend.StderrIndicatesFailure("Uncaught 42\n"));
    EXPECT_TRUE(backend.StderrIndicatesFailure("InternalError: out of memory\n"));
    EXPECT_FALSE(backend.StderrIndicatesFailure("note: Error handling enabled\n"));
    EXPECT_FALSE(backend.StderrIndicatesFailure("warning: slow path\n"));
}
