/**
 * @file language_backend.cpp
 * @brief Backend factory
 *
 * @date 2025
 */

#include "wasmbox/runtime/language_backend.hpp"
#include "wasmbox/runtime/javascript_backend.hpp"
#include "wasmbox/runtime/python_backend.hpp"
#include "wasmbox/core/errors.hpp"

#include <algorithm>

namespace wasmbox {
namespace runtime {

std::unique_ptr<LanguageBackend> CreateBackend(RuntimeType type, const BackendArtifacts& artifacts) {
    switch (type) {
        case RuntimeType::PYTHON:
            return std::make_unique<PythonBackend>(artifacts.python_wasm);
        case RuntimeType::JAVASCRIPT:
            return std::make_unique<JavaScriptBackend>(artifacts.quickjs_wasm);
    }
    throw core::HostSetupError("Unsupported runtime type: " +
                               std::to_string(static_cast<int>(type)));
}

int CountPrologueLines(const std::string& prologue) {
    return static_cast<int>(std::count(prologue.begin(), prologue.end(), '\n'));
}

} // namespace runtime
} // namespace wasmbox
