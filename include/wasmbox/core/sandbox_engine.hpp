/**
 * @file sandbox_engine.hpp
 * @brief Metered WebAssembly execution of untrusted guest code
 *
 * Runs a WASI guest (the CPython or QuickJS interpreter) inside the wasm3
 * interpreter with:
 * - an instruction budget enforced by bytecode instrumentation
 * - a linear memory ceiling enforced by rewriting the memory maximum
 * - capped stdout/stderr sinks
 * - a capability filesystem made of preopened directories only
 * - an optional wall-clock watchdog, which stops a spinning guest by
 *   writing a negative value into the fuel global from another thread
 *   (wasm3 exposes no synchronized way to do this)
 *
 * Each run gets its own wasm3 environment, runtime and module. The only
 * shared state is the cache of instrumented module bytes.
 *
 * **Execution flow** (Execute):
 * 1. Compose the program (setup + state shim + user code) into the workspace
 * 2. Snapshot the workspace
 * 3. Instrument (or fetch from cache) and run the interpreter module
 * 4. Diff the workspace, commit persisted state
 * 5. Classify the outcome and attach fuel analysis and error guidance
 *
 * @date 2025
 */

#pragma once

#include "wasmbox/analyzers/error_guidance.hpp"
#include "wasmbox/analyzers/fuel_analyzer.hpp"
#include "wasmbox/core/execution_policy.hpp"
#include "wasmbox/core/execution_result.hpp"
#include "wasmbox/runtime/language_backend.hpp"
#include "wasmbox/wasm/module_instrumenter.hpp"
#include "wasmbox/wasm/wasi_host.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace wasmbox {
namespace core {

/**
 * @struct GuestInvocation
 * @brief How to start a guest module
 */
struct GuestInvocation {
    std::vector<std::string> args;               ///< argv, argv[0] first
    std::vector<std::string> env;                ///< "KEY=VALUE"
    std::vector<wasm::Preopen> preopens;         ///< fds 3, 4, ...
    std::function<bool(const std::string&)> stderr_indicates_failure;   ///< Optional language check
};

/**
 * @struct GuestRunResult
 * @brief Raw outcome of one module run
 */
struct GuestRunResult {
    std::string stdout_output;
    std::string stderr_output;
    bool stdout_truncated{false};
    bool stderr_truncated{false};

    int exit_code{0};
    std::uint64_t fuel_consumed{0};
    std::uint64_t memory_used_bytes{0};
    std::uint32_t memory_pages{0};

    FailureKind failure_kind{FailureKind::NONE};
    bool trapped{false};
    std::optional<std::string> trap_reason;      ///< out_of_fuel, timeout, memory_limit, trap, host_error
    std::optional<std::string> trap_message;

    bool Succeeded() const { return failure_kind == FailureKind::NONE; }
};

/**
 * @struct ExecuteOptions
 * @brief Per-call settings of SandboxEngine::Execute
 */
struct ExecuteOptions {
    std::string session_id;
    bool auto_persist{false};      ///< Load `_state` before, save it after
    bool cached_session{false};    ///< Session already ran code (imports are warm)
};

/**
 * @class SandboxEngine
 * @brief Instruments and runs guest modules under an ExecutionPolicy
 *
 * Thread-safe: concurrent Execute calls share only the instrumentation cache.
 *
 * **Usage Example**:
 * @code
 * SandboxEngine engine;
 * auto backend = runtime::CreateBackend(runtime::RuntimeType::PYTHON, {});
 * auto result = engine.Execute("print('hi')", *backend, policy, workspace);
 * @endcode
 */
class SandboxEngine {
public:
    /**
     * @struct Config
     * @brief Engine configuration
     */
    struct Config {
        std::uint32_t stack_size_bytes{1024 * 1024};     ///< wasm3 value stack
        bool cache_instrumented_modules{true};           ///< Reuse rewritten bytes per artifact
        std::string entry_point{"_start"};               ///< WASI command entry
        wasm::ModuleInstrumenter::Config instrumenter;
    };

    explicit SandboxEngine(const Config& config);
    explicit SandboxEngine();

    SandboxEngine(const SandboxEngine&) = delete;
    SandboxEngine& operator=(const SandboxEngine&) = delete;

    /**
     * @brief Run user code in a workspace
     *
     * @param code User source code
     * @param backend Guest language
     * @param policy Resource limits and mounts
     * @param workspace Host directory mounted writable at policy.guest_mount_path
     * @param options Session id and persistence
     * @param timeout Overrides policy.timeout when set
     * @return Result; guest failures never throw
     * @throws HostSetupError for an invalid policy, missing artifact or unusable workspace
     */
    ExecutionResult Execute(const std::string& code,
                            const runtime::LanguageBackend& backend,
                            const ExecutionPolicy& policy,
                            const std::filesystem::path& workspace,
                            const ExecuteOptions& options = ExecuteOptions{},
                            std::optional<double> timeout = std::nullopt);

    /**
     * @brief Execute on a worker thread
     *
     * `backend` must outlive the returned future.
     */
    std::future<ExecutionResult> ExecuteAsync(std::string code,
                                              const runtime::LanguageBackend& backend,
                                              ExecutionPolicy policy,
                                              std::filesystem::path workspace,
                                              ExecuteOptions options = ExecuteOptions{},
                                              std::optional<double> timeout = std::nullopt);

    /**
     * @brief Run a raw WASI module
     *
     * Instruments the module, runs its entry point and classifies the outcome.
     * Only the resource limits and output caps of `policy` are used; mounts
     * come from the invocation.
     *
     * @throws HostSetupError if the module cannot be instrumented, parsed or loaded,
     *         or a preopen cannot be opened
     */
    GuestRunResult Run(const std::vector<std::uint8_t>& module,
                       const GuestInvocation& invocation,
                       const ExecutionPolicy& policy,
                       std::optional<double> timeout = std::nullopt);

    /**
     * @brief Number of cached instrumented modules
     */
    std::size_t GetCacheSize() const;

    void ClearCache();

    const Config& GetConfig() const { return config_; }

private:
    struct ArtifactDigest {
        std::uintmax_t size{0};
        std::filesystem::file_time_type mtime;
        std::string sha256;
    };

    std::shared_ptr<const wasm::InstrumentedModule> GetInstrumented(const std::string& digest,
                                                                   const std::vector<std::uint8_t>& module,
                                                                   std::uint32_t memory_pages);
    std::shared_ptr<const wasm::InstrumentedModule> LoadArtifact(const std::filesystem::path& artifact,
                                                               std::uint32_t memory_pages);
    GuestRunResult RunInstrumented(std::shared_ptr<const wasm::InstrumentedModule> module,
                                   const GuestInvocation& invocation,
                                   const ExecutionPolicy& policy,
                                   std::optional<double> timeout);

    GuestInvocation BuildInvocation(const runtime::LanguageBackend& backend,
                                    const ExecutionPolicy& policy,
                                    const std::filesystem::path& workspace) const;
    ExecutionResult BuildResult(const GuestRunResult& run,
                                const runtime::LanguageBackend& backend,
                                const ExecutionPolicy& policy,
                                const ExecuteOptions& options,
                                std::optional<double> timeout,
                                int prologue_lines) const;

    Config config_;
    wasm::ModuleInstrumenter instrumenter_;
    analyzers::FuelAnalyzer fuel_analyzer_;
    analyzers::ErrorGuidanceBuilder guidance_builder_;

    mutable std::mutex cache_mutex_;
    std::map<std::string, std::shared_ptr<const wasm::InstrumentedModule>> cache_;
    std::map<std::string, ArtifactDigest> digests_;   ///< Artifact path -> content hash
};

/**
 * @brief Workspace names the file diff never reports
 */
std::vector<std::string> DiffExcludedFiles(const std::string& code_filename);

} // namespace core
} // namespace wasmbox
