/**
 * @file language_backend.hpp
 * @brief Per-language guest conventions for the sandbox engine
 *
 * A backend knows everything language-specific about a run: which WASI
 * interpreter to load, how to invoke it, what the user code file is called,
 * what setup and state shim to wrap around the user code, and how an
 * uncaught error shows up on stderr. The engine itself is language-agnostic.
 *
 * @date 2025
 */

#pragma once

#include "wasmbox/runtime/runtime_type.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace wasmbox {
namespace runtime {

/**
 * @struct BackendArtifacts
 * @brief Locations of the guest interpreters on the host
 */
struct BackendArtifacts {
    std::filesystem::path python_wasm{"bin/python.wasm"};     ///< CPython WASI build
    std::filesystem::path quickjs_wasm{"bin/quickjs.wasm"};   ///< QuickJS WASI build
    std::filesystem::path vendor_js_dir;                      ///< Host dir of vendored JS libraries (informational)
};

/**
 * @struct InjectionOptions
 * @brief What to wrap around the user code
 */
struct InjectionOptions {
    bool inject_setup{true};                 ///< Library paths / file helpers
    bool auto_persist{false};                ///< `_state` load and save shim
    std::string guest_mount{"/app"};         ///< Writable workspace mount
    std::string guest_data_path{"/data"};    ///< Read-only vendored mount
};

/**
 * @struct ComposedProgram
 * @brief Final guest source file
 */
struct ComposedProgram {
    std::string source;
    int prologue_lines{0};    ///< Lines injected before the first user line
};

/**
 * @class LanguageBackend
 * @brief Abstract guest language
 */
class LanguageBackend {
public:
    virtual ~LanguageBackend() = default;

    virtual RuntimeType GetType() const = 0;
    virtual std::string GetName() const = 0;

    /**
     * @brief Host path of the WASI interpreter module
     */
    virtual std::filesystem::path GetArtifactPath() const = 0;

    /**
     * @brief File name the composed program is written to, e.g. "user_code.py"
     */
    virtual std::string GetCodeFilename() const = 0;

    /**
     * @brief Interpreter argv for running the composed program
     * @param guest_mount Mount point of the workspace inside the guest
     */
    virtual std::vector<std::string> BuildArgv(const std::string& guest_mount) const = 0;

    /**
     * @brief Wrap user code with setup and the state shim
     */
    virtual ComposedProgram ComposeProgram(const std::string& user_code,
                                           const InjectionOptions& options) const = 0;

    /**
     * @brief True when stderr shows an uncaught guest error
     */
    virtual bool StderrIndicatesFailure(const std::string& stderr_output) const = 0;
};

/**
 * @brief Select a backend by explicit runtime type
 * @throws core::HostSetupError for an unsupported type
 */
std::unique_ptr<LanguageBackend> CreateBackend(RuntimeType type, const BackendArtifacts& artifacts);

/**
 * @brief Number of newline-terminated lines in a prologue
 */
int CountPrologueLines(const std::string& prologue);

} // namespace runtime
} // namespace wasmbox
