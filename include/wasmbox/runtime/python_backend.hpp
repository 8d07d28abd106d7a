/**
 * @file python_backend.hpp
 * @brief CPython (WASI) guest backend
 *
 * **Composed program layout**:
 * @code
 * <sys.path setup>          (inject_setup)
 * <_state load shim>        (auto_persist)
 * <user code>
 * <_state save epilogue>    (auto_persist)
 * @endcode
 *
 * The user code is not wrapped, so guest tracebacks keep their natural shape
 * and line numbers only shift by the prologue length. The epilogue runs only
 * when the user code completes; a run that raises leaves the previous state.
 *
 * @date 2025
 */

#pragma once

#include "wasmbox/runtime/language_backend.hpp"

namespace wasmbox {
namespace runtime {

class PythonBackend : public LanguageBackend {
public:
    explicit PythonBackend(std::filesystem::path artifact);

    RuntimeType GetType() const override { return RuntimeType::PYTHON; }
    std::string GetName() const override { return "python"; }
    std::filesystem::path GetArtifactPath() const override { return artifact_; }
    std::string GetCodeFilename() const override { return "user_code.py"; }

    std::vector<std::string> BuildArgv(const std::string& guest_mount) const override;
    ComposedProgram ComposeProgram(const std::string& user_code,
                                   const InjectionOptions& options) const override;
    bool StderrIndicatesFailure(const std::string& stderr_output) const override;

private:
    std::filesystem::path artifact_;
};

} // namespace runtime
} // namespace wasmbox
