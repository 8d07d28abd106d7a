/**
 * @file javascript_backend.hpp
 * @brief QuickJS (WASI) guest backend
 *
 * QuickJS runs with `--std`, so the injected helpers are written against its
 * `std` and `os` modules. `requireVendor(name)` evaluates
 * `<data>/vendor_js/<name>.js` in a CommonJS-style wrapper and caches the
 * exports.
 *
 * @date 2025
 */

#pragma once

#include "wasmbox/runtime/language_backend.hpp"

namespace wasmbox {
namespace runtime {

class JavaScriptBackend : public LanguageBackend {
public:
    explicit JavaScriptBackend(std::filesystem::path artifact);

    RuntimeType GetType() const override { return RuntimeType::JAVASCRIPT; }
    std::string GetName() const override { return "javascript"; }
    std::filesystem::path GetArtifactPath() const override { return artifact_; }
    std::string GetCodeFilename() const override { return "user_code.js"; }

    std::vector<std::string> BuildArgv(const std::string& guest_mount) const override;
    ComposedProgram ComposeProgram(const std::string& user_code,
                                   const InjectionOptions& options) const override;
    bool StderrIndicatesFailure(const std::string& stderr_output) const override;

private:
    std::filesystem::path artifact_;
};

} // namespace runtime
} // namespace wasmbox
