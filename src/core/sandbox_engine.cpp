/**
 * @file sandbox_engine.cpp
 * @brief Implementation of metered guest execution on wasm3
 *
 * **Run Architecture**:
 * ```
 * Caller thread                     Worker thread (std::async)
 * ─────────────                     ──────────────────────────
 * instrument / cache lookup
 * m3 environment + runtime
 * parse, load, link WASI
 * set __wasmbox_fuel = budget
 * launch ─────────────────────────► m3_FindFunction(_start)
 * wait_for(timeout)                 m3_CallV
 *   └─ deadline: Cancel() host,     (traps on the next metered
 *      poison the fuel counter       segment once poisoned)
 * collect ◄──────────────────────── M3Result
 * read fuel, memory, sinks
 * ```
 *
 * The runtime and every handle the watchdog touches live on the caller
 * thread and outlive the worker.
 *
 * **Fuel poisoning is unsynchronized**: wasm3 has no interrupt call and no
 * atomic access to globals, so the watchdog's m3_SetGlobal races with the
 * guest's own read-modify-write of the counter. The value is an aligned
 * 64-bit slot, and a poison the guest overwrites is rewritten every
 * kRepoisonInterval until the worker returns.
 *
 * @date 2025
 */

#include "wasmbox/core/sandbox_engine.hpp"
#include "wasmbox/core/errors.hpp"
#include "wasmbox/core/state_codec.hpp"
#include "wasmbox/runtime/runtime_type.hpp"
#include "wasmbox/storage/workspace_store.hpp"
#include "wasmbox/utils/hash_utils.hpp"
#include "wasmbox/utils/string_utils.hpp"
#include "wasmbox/wasm/wasi_bindings.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <fstream>
#include <iterator>
#include <set>

namespace fs = std::filesystem;

namespace wasmbox {
namespace core {

namespace {

// Any value below zero traps; this one leaves room for further charges
constexpr std::int64_t kFuelPoison = -(std::int64_t{1} << 62);
constexpr auto kRepoisonInterval = std::chrono::milliseconds(10);
constexpr double kMaxTimeoutSeconds = 7.0 * 24 * 3600;

struct EnvironmentDeleter {
    void operator()(M3Environment* env) const { m3_FreeEnvironment(env); }
};

struct RuntimeDeleter {
    void operator()(M3Runtime* runtime) const { m3_FreeRuntime(runtime); }
};

using EnvironmentPtr = std::unique_ptr<M3Environment, EnvironmentDeleter>;
using RuntimePtr = std::unique_ptr<M3Runtime, RuntimeDeleter>;

std::optional<std::int64_t> ReadFuel(IM3Global global) {
    M3TaggedValue value{};
    value.type = c_m3Type_i64;
    if (m3_GetGlobal(global, &value) != m3Err_none) {
        return std::nullopt;
    }
    return static_cast<std::int64_t>(value.value.i64);
}

bool WriteFuel(IM3Global global, std::int64_t fuel) {
    M3TaggedValue value{};
    value.type = c_m3Type_i64;
    value.value.i64 = static_cast<std::uint64_t>(fuel);
    return m3_SetGlobal(global, &value) == m3Err_none;
}

std::uint64_t ConsumedFrom(std::int64_t remaining, std::uint64_t budget) {
    if (remaining < 0) {
        return budget;
    }
    auto left = static_cast<std::uint64_t>(remaining);
    return left >= budget ? 0 : budget - left;
}

bool MentionsMemoryExhaustion(const std::string& stderr_output) {
    return utils::StringUtils::Contains(stderr_output, "MemoryError") ||
           utils::StringUtils::Contains(stderr_output, "out of memory");
}

std::optional<double> EffectiveTimeout(std::optional<double> override_timeout, const ExecutionPolicy& policy) {
    auto timeout = override_timeout ? override_timeout : policy.timeout;
    if (timeout && *timeout > kMaxTimeoutSeconds) {
        return kMaxTimeoutSeconds;
    }
    return timeout;
}

GuestRunResult HostErrorRun(const std::string& message) {
    GuestRunResult run;
    run.failure_kind = FailureKind::GUEST_RUNTIME_ERROR;
    run.exit_code = 1;
    run.trap_reason = "host_error";
    run.trap_message = message;
    run.stderr_output = "Host error: " + message + "\n";
    return run;
}

std::vector<std::uint8_t> ReadBinary(const fs::path& file_path) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file) {
        throw HostSetupError("Cannot open guest artifact: " + file_path.string());
    }
    std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw HostSetupError("Failed to read guest artifact: " + file_path.string());
    }
    return bytes;
}

} // anonymous namespace

std::vector<std::string> DiffExcludedFiles(const std::string& code_filename) {
    std::vector<std::string> names = {
        "user_code.py",
        "user_code.js",
        storage::WorkspaceStore::kMetadataFile,
        StateCodec::kStateFile,
        StateCodec::kPendingFile,
    };
    if (std::find(names.begin(), names.end(), code_filename) == names.end()) {
        names.push_back(code_filename);
    }
    return names;
}

SandboxEngine::SandboxEngine(const Config& config)
    : config_(config),
      instrumenter_(config.instrumenter) {
    spdlog::debug("Sandbox engine initialized (stack {} bytes, cache {})",
                  config_.stack_size_bytes, config_.cache_instrumented_modules ? "on" : "off");
}

SandboxEngine::SandboxEngine()
    : SandboxEngine(Config{}) {
}

// ============================================================================
// Instrumentation Cache
// ============================================================================

std::shared_ptr<const wasm::InstrumentedModule> SandboxEngine::GetInstrumented(
    const std::string& digest,
    const std::vector<std::uint8_t>& module,
    std::uint32_t memory_pages) {

    if (!config_.cache_instrumented_modules) {
        return std::make_shared<const wasm::InstrumentedModule>(instrumenter_.Instrument(module, memory_pages));
    }

    std::string key = digest + ":" + std::to_string(memory_pages);
    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        auto it = cache_.find(key);
        if (it != cache_.end()) {
            spdlog::debug("Instrumentation cache hit: {}", digest.substr(0, 12));
            return it->second;
        }
    }

    spdlog::debug("Instrumentation cache miss: {}", digest.substr(0, 12));
    auto instrumented = std::make_shared<const wasm::InstrumentedModule>(
        instrumenter_.Instrument(module, memory_pages));

    std::lock_guard<std::mutex> lock(cache_mutex_);
    auto [it, inserted] = cache_.emplace(key, instrumented);
    return it->second;
}

std::shared_ptr<const wasm::InstrumentedModule> SandboxEngine::LoadArtifact(const fs::path& artifact,
                                                                          std::uint32_t memory_pages) {
    std::error_code ec;
    if (!fs::is_regular_file(artifact, ec)) {
        throw HostSetupError("Guest artifact not found: " + artifact.string());
    }
    std::error_code size_ec;
    std::error_code time_ec;
    auto size = fs::file_size(artifact, size_ec);
    auto mtime = fs::last_write_time(artifact, time_ec);
    if (size_ec || time_ec) {
        throw HostSetupError("Cannot stat guest artifact " + artifact.string() + ": " +
                             (size_ec ? size_ec : time_ec).message());
    }

    std::string path_key = artifact.string();
    std::string digest;
    if (config_.cache_instrumented_modules) {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        auto it = digests_.find(path_key);
        if (it != digests_.end() && it->second.size == size && it->second.mtime == mtime) {
            digest = it->second.sha256;
            auto cached = cache_.find(digest + ":" + std::to_string(memory_pages));
            if (cached != cache_.end()) {
                spdlog::debug("Instrumentation cache hit: {}", artifact.filename().string());
                return cached->second;
            }
        }
    }

    auto bytes = ReadBinary(artifact);
    if (digest.empty()) {
        digest = utils::HashUtils::ComputeSHA256(bytes);
        if (config_.cache_instrumented_modules) {
            std::lock_guard<std::mutex> lock(cache_mutex_);
            digests_[path_key] = ArtifactDigest{size, mtime, digest};
        }
    }
    return GetInstrumented(digest, bytes, memory_pages);
}

std::size_t SandboxEngine::GetCacheSize() const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    return cache_.size();
}

void SandboxEngine::ClearCache() {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    cache_.clear();
    digests_.clear();
}

// ============================================================================
// Module Execution
// ============================================================================

GuestRunResult SandboxEngine::Run(const std::vector<std::uint8_t>& module,
                                  const GuestInvocation& invocation,
                                  const ExecutionPolicy& policy,
                                  std::optional<double> timeout) {
    policy.Validate();
    auto instrumented = GetInstrumented(utils::HashUtils::ComputeSHA256(module), module, policy.MemoryPages());
    return RunInstrumented(std::move(instrumented), invocation, policy, EffectiveTimeout(timeout, policy));
}

GuestRunResult SandboxEngine::RunInstrumented(std::shared_ptr<const wasm::InstrumentedModule> module,
                                              const GuestInvocation& invocation,
                                              const ExecutionPolicy& policy,
                                              std::optional<double> timeout) {
    GuestRunResult run;

    if (module->initial_exceeds_ceiling) {
        spdlog::warn("Initial memory of {} pages exceeds the ceiling of {} pages",
                     module->initial_memory_pages, policy.MemoryPages());
        run.failure_kind = FailureKind::OUT_OF_MEMORY;
        run.exit_code = 1;
        run.memory_pages = module->initial_memory_pages;
        run.trap_reason = "memory_limit";
        run.trap_message = "initial memory of " + std::to_string(module->initial_memory_pages) +
                           " pages exceeds the limit of " + std::to_string(policy.MemoryPages()) + " pages";
        run.stderr_output = "MemoryError: " + *run.trap_message + "\n";
        return run;
    }

    wasm::WasiHost::Config host_config;
    host_config.args = invocation.args;
    host_config.env = invocation.env;
    host_config.preopens = invocation.preopens;
    host_config.stdout_max_bytes = policy.stdout_max_bytes;
    host_config.stderr_max_bytes = policy.stderr_max_bytes;
    wasm::WasiHost host(host_config);

    EnvironmentPtr environment(m3_NewEnvironment());
    if (!environment) {
        throw HostSetupError("Failed to create wasm3 environment");
    }
    RuntimePtr runtime(m3_NewRuntime(environment.get(), config_.stack_size_bytes, &host));
    if (!runtime) {
        throw HostSetupError("Failed to create wasm3 runtime");
    }

    IM3Module m3_module = nullptr;
    M3Result result = m3_ParseModule(environment.get(), &m3_module, module->bytes.data(),
                                     static_cast<std::uint32_t>(module->bytes.size()));
    if (result) {
        throw HostSetupError(std::string("Failed to parse guest module: ") + result);
    }
    result = m3_LoadModule(runtime.get(), m3_module);
    if (result) {
        m3_FreeModule(m3_module);
        throw HostSetupError(std::string("Failed to load guest module: ") + result);
    }

    // The runtime owns the module from here on
    result = wasm::LinkWasi(m3_module);
    if (result) {
        spdlog::error("WASI link failed: {}", result);
        return HostErrorRun(std::string("WASI link failed: ") + result);
    }

    IM3Global fuel_global = m3_FindGlobal(m3_module, instrumenter_.GetConfig().fuel_export_name.c_str());
    if (!fuel_global || !WriteFuel(fuel_global, static_cast<std::int64_t>(policy.fuel_budget))) {
        return HostErrorRun("fuel counter is not accessible");
    }

    IM3Runtime raw_runtime = runtime.get();
    const std::string entry_point = config_.entry_point;
    auto worker = std::async(std::launch::async, [raw_runtime, entry_point]() -> M3Result {
        IM3Function function = nullptr;
        M3Result found = m3_FindFunction(&function, raw_runtime, entry_point.c_str());
        if (found) {
            return found;
        }
        return m3_CallV(function);
    });

    bool timed_out = false;
    std::optional<std::int64_t> fuel_at_deadline;
    if (timeout) {
        auto deadline = std::chrono::duration<double>(*timeout);
        if (worker.wait_for(deadline) == std::future_status::timeout) {
            timed_out = true;
            fuel_at_deadline = ReadFuel(fuel_global);
            spdlog::warn("Watchdog fired after {:.2f}s, interrupting guest", *timeout);
            host.Cancel();

            // Unsynchronized (see file header): the guest may store its own
            // pending charge over the poison, so keep rewriting it
            do {
                auto current = ReadFuel(fuel_global);
                if (current && *current >= 0 && !WriteFuel(fuel_global, kFuelPoison)) {
                    spdlog::warn("Failed to poison fuel counter");
                }
            } while (worker.wait_for(kRepoisonInterval) == std::future_status::timeout);
        }
    }
    M3Result outcome = worker.get();

    auto remaining = ReadFuel(fuel_global).value_or(0);
    run.fuel_consumed = ConsumedFrom(timed_out && fuel_at_deadline ? *fuel_at_deadline : remaining,
                                     policy.fuel_budget);

    std::uint32_t memory_size = 0;
    if (m3_GetMemory(runtime.get(), &memory_size, 0) != nullptr) {
        run.memory_used_bytes = memory_size;
        run.memory_pages = static_cast<std::uint32_t>(memory_size / kWasmPageSize);
    }

    auto exit_code = host.GetExitCode();
    bool exited = outcome == m3Err_trapExit && exit_code.has_value();
    std::string trap_message;
    if (outcome && !exited) {
        run.trapped = true;
        trap_message = outcome;
        M3ErrorInfo info{};
        m3_GetErrorInfo(runtime.get(), &info);
        if (info.message && *info.message) {
            trap_message += std::string(": ") + info.message;
        }
    }
    run.exit_code = exited ? *exit_code : (run.trapped ? 1 : 0);

    bool out_of_fuel = !timed_out && remaining < 0;
    if (timed_out) {
        run.failure_kind = FailureKind::TIMEOUT;
        run.trapped = true;
        run.trap_reason = "timeout";
        run.trap_message = fmt::format("wall-clock limit of {}s exceeded", *timeout);
        host.Stderr().AppendNotice("Execution trapped: Timeout");
    } else if (out_of_fuel) {
        run.failure_kind = FailureKind::OUT_OF_FUEL;
        run.trapped = true;
        run.trap_reason = "out_of_fuel";
        run.trap_message = "fuel budget of " + std::to_string(policy.fuel_budget) + " instructions exhausted";
        host.Stderr().AppendNotice("Execution trapped: OutOfFuel");
    } else {
        std::string stderr_output = host.Stderr().GetContents();
        bool marker = invocation.stderr_indicates_failure && invocation.stderr_indicates_failure(stderr_output);
        bool failed = run.trapped || run.exit_code != 0 || marker;
        bool memory_trap = outcome == m3Err_wasmMemoryOverflow;

        if (failed && (memory_trap || MentionsMemoryExhaustion(stderr_output))) {
            run.failure_kind = FailureKind::OUT_OF_MEMORY;
            run.trap_reason = "memory_limit";
        } else if (failed) {
            run.failure_kind = FailureKind::GUEST_RUNTIME_ERROR;
            if (run.trapped) {
                run.trap_reason = "trap";
            }
        }
        if (run.trapped) {
            run.trap_message = trap_message;
            host.Stderr().AppendNotice("Execution trapped: " + trap_message);
        }
    }

    run.stdout_output = host.Stdout().GetContents();
    run.stderr_output = host.Stderr().GetContents();
    run.stdout_truncated = host.Stdout().IsTruncated();
    run.stderr_truncated = host.Stderr().IsTruncated();
    if (run.stdout_truncated) {
        spdlog::warn("Guest stdout truncated: kept {} of {} bytes",
                     policy.stdout_max_bytes, host.Stdout().GetTotalBytes());
    }
    if (run.stderr_truncated) {
        spdlog::warn("Guest stderr truncated: kept {} of {} bytes",
                     policy.stderr_max_bytes, host.Stderr().GetTotalBytes());
    }
    return run;
}

// ============================================================================
// Code Execution
// ============================================================================

GuestInvocation SandboxEngine::BuildInvocation(const runtime::LanguageBackend& backend,
                                               const ExecutionPolicy& policy,
                                               const fs::path& workspace) const {
    GuestInvocation invocation;
    invocation.args = policy.argv.empty() ? backend.BuildArgv(policy.guest_mount_path) : policy.argv;
    for (const auto& [key, value] : policy.env) {
        invocation.env.push_back(key + "=" + value);
    }

    invocation.preopens.push_back(wasm::Preopen{policy.guest_mount_path, workspace, false});
    if (policy.mount_data_dir) {
        invocation.preopens.push_back(wasm::Preopen{policy.guest_data_path, *policy.mount_data_dir, true});
    }
    for (const auto& mount : policy.additional_readonly_mounts) {
        invocation.preopens.push_back(wasm::Preopen{mount.guest_path, mount.host_path, true});
    }

    invocation.stderr_indicates_failure = [&backend](const std::string& stderr_output) {
        return backend.StderrIndicatesFailure(stderr_output);
    };
    return invocation;
}

ExecutionResult SandboxEngine::BuildResult(const GuestRunResult& run,
                                           const runtime::LanguageBackend& backend,
                                           const ExecutionPolicy& policy,
                                           const ExecuteOptions& options,
                                           std::optional<double> timeout,
                                           int prologue_lines) const {
    ExecutionResult result;
    result.success = run.Succeeded();
    result.stdout_output = run.stdout_output;
    result.stderr_output = run.stderr_output;
    result.fuel_consumed = run.fuel_consumed;
    result.memory_used_bytes = run.memory_used_bytes;
    result.exit_code = run.exit_code;
    result.failure_kind = run.failure_kind;

    auto& metadata = result.metadata;
    metadata.session_id = options.session_id;
    metadata.runtime = runtime::RuntimeTypeToString(backend.GetType());
    metadata.stdout_truncated = run.stdout_truncated;
    metadata.stderr_truncated = run.stderr_truncated;
    metadata.trapped = run.trapped;
    metadata.trap_reason = run.trap_reason;
    metadata.trap_message = run.trap_message;
    metadata.memory_pages = run.memory_pages;
    metadata.fuel_budget = policy.fuel_budget;
    metadata.memory_limit_bytes = policy.memory_bytes;
    metadata.fuel_analysis = fuel_analyzer_.Analyze(run.fuel_consumed, policy.fuel_budget,
                                                    run.stderr_output, options.cached_session);

    if (!result.success) {
        analyzers::GuidanceInputs inputs;
        inputs.failure_kind = run.failure_kind;
        inputs.language = backend.GetType();
        inputs.stderr_output = run.stderr_output;
        inputs.fuel_consumed = run.fuel_consumed;
        inputs.fuel_budget = policy.fuel_budget;
        inputs.memory_limit_bytes = policy.memory_bytes;
        inputs.timeout_seconds = timeout.value_or(0.0);
        inputs.prologue_lines = prologue_lines;
        inputs.heavy_packages = fuel_analyzer_.DetectHeavyPackages(run.stderr_output);
        metadata.error_guidance = guidance_builder_.Build(inputs);
    }
    return result;
}

ExecutionResult SandboxEngine::Execute(const std::string& code,
                                       const runtime::LanguageBackend& backend,
                                       const ExecutionPolicy& policy,
                                       const fs::path& workspace,
                                       const ExecuteOptions& options,
                                       std::optional<double> timeout) {
    auto start_time = std::chrono::steady_clock::now();
    policy.Validate();
    auto effective_timeout = EffectiveTimeout(timeout, policy);

    std::error_code ec;
    if (!fs::is_directory(workspace, ec)) {
        throw HostSetupError("Workspace is not a directory: " + workspace.string());
    }

    spdlog::info("═══════════════════════════════════════════════════════════════");
    spdlog::info("SANDBOX EXECUTION");
    spdlog::info("═══════════════════════════════════════════════════════════════");
    spdlog::info("Runtime: {}", backend.GetName());
    if (!options.session_id.empty()) {
        spdlog::info("Session: {}", options.session_id);
    }
    spdlog::info("Fuel budget: {}", utils::StringUtils::FormatThousands(policy.fuel_budget));
    spdlog::info("Memory limit: {}", utils::StringUtils::FormatBytes(policy.memory_bytes));
    if (effective_timeout) {
        spdlog::info("Timeout: {}s", *effective_timeout);
    }

    auto module = LoadArtifact(backend.GetArtifactPath(), policy.MemoryPages());

    runtime::InjectionOptions injection;
    injection.inject_setup = policy.inject_setup;
    injection.auto_persist = options.auto_persist;
    injection.guest_mount = policy.guest_mount_path;
    injection.guest_data_path = policy.guest_data_path;
    auto program = backend.ComposeProgram(code, injection);

    try {
        storage::AtomicWriteFile(workspace / backend.GetCodeFilename(), program.source);
    } catch (const std::exception& e) {
        throw HostSetupError("Cannot write guest program: " + std::string(e.what()));
    }
    if (options.auto_persist) {
        StateCodec::DiscardPending(workspace);
    }

    auto excluded = DiffExcludedFiles(backend.GetCodeFilename());
    std::set<std::string> exclude_files(excluded.begin(), excluded.end());
    std::set<std::string> exclude_dirs = {storage::WorkspaceStore::kSitePackagesDir};

    GuestRunResult run;
    storage::WorkspaceSnapshot before;
    storage::WorkspaceSnapshot after;
    bool snapshot_ok = true;
    try {
        before = storage::WorkspaceStore::Snapshot(workspace, exclude_files, exclude_dirs);
    } catch (const fs::filesystem_error& e) {
        spdlog::error("Workspace snapshot failed: {}", e.what());
        run = HostErrorRun(std::string("workspace snapshot failed: ") + e.what());
        snapshot_ok = false;
    }

    if (snapshot_ok) {
        spdlog::info("Running guest...");
        run = RunInstrumented(module, BuildInvocation(backend, policy, workspace), policy, effective_timeout);

        try {
            after = storage::WorkspaceStore::Snapshot(workspace, exclude_files, exclude_dirs);
        } catch (const fs::filesystem_error& e) {
            spdlog::error("Workspace snapshot failed: {}", e.what());
            snapshot_ok = false;
        }
    }

    if (options.auto_persist) {
        if (!run.trapped && StateCodec::CommitPending(workspace)) {
            spdlog::debug("✓ Session state committed");
        } else {
            StateCodec::DiscardPending(workspace);
        }
    }

    auto result = BuildResult(run, backend, policy, options, effective_timeout, program.prologue_lines);
    result.workspace_path = workspace;

    if (snapshot_ok) {
        for (const auto& [path, stamp] : after) {
            auto it = before.find(path);
            if (it == before.end()) {
                result.files_created.push_back(path);
            } else if (it->second != stamp) {
                result.files_modified.push_back(path);
            }
        }
    }

    result.duration = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start_time);

    spdlog::info("═══════════════════════════════════════════════════════════════");
    spdlog::info("SANDBOX EXECUTION COMPLETE");
    spdlog::info("═══════════════════════════════════════════════════════════════");
    spdlog::info("Status: {}", result.success ? "✓ success" : FailureKindToString(result.failure_kind));
    spdlog::info("Exit code: {}", result.exit_code);
    spdlog::info("Fuel: {} ({}%)", utils::StringUtils::FormatThousands(result.fuel_consumed),
                 result.metadata.fuel_analysis.utilization_percent);
    spdlog::info("Duration: {} ms", result.duration.count() / 1000);
    if (!result.files_created.empty() || !result.files_modified.empty()) {
        spdlog::info("Files: {} created, {} modified", result.files_created.size(), result.files_modified.size());
    }
    spdlog::info("═══════════════════════════════════════════════════════════════");

    return result;
}

std::future<ExecutionResult> SandboxEngine::ExecuteAsync(std::string code,
                                                         const runtime::LanguageBackend& backend,
                                                         ExecutionPolicy policy,
                                                         fs::path workspace,
                                                         ExecuteOptions options,
                                                         std::optional<double> timeout) {
    return std::async(std::launch::async,
                      [this, code = std::move(code), &backend, policy = std::move(policy),
                       workspace = std::move(workspace), options = std::move(options), timeout]() {
        return Execute(code, backend, policy, workspace, options, timeout);
    });
}

} // namespace core
} // namespace wasmbox
