/**
 * @file sandbox.hpp
 * @brief Session-bound sandbox facade and its builder
 *
 * A Sandbox ties one session workspace, one guest language and one policy
 * to a shared SandboxEngine. Executions through it are recorded on the
 * session (busy flag, last-used time, metadata).
 *
 * **Usage Example**:
 * @code
 * SessionManager sessions;
 * auto sandbox = SandboxBuilder(sessions)
 *     .WithLanguage(runtime::RuntimeType::PYTHON)
 *     .WithFuelBudget(5'000'000'000ULL)
 *     .WithAutoPersist(true)
 *     .Build();
 *
 * auto result = sandbox.Execute("_state['n'] = _state.get('n', 0) + 1");
 * @endcode
 *
 * @date 2025
 */

#pragma once

#include "wasmbox/core/execution_policy.hpp"
#include "wasmbox/core/execution_result.hpp"
#include "wasmbox/core/sandbox_engine.hpp"
#include "wasmbox/core/session_manager.hpp"
#include "wasmbox/runtime/language_backend.hpp"

#include <cstdint>
#include <filesystem>
#include <future>
#include <memory>
#include <optional>
#include <string>

namespace wasmbox {
namespace core {

/**
 * @class Sandbox
 * @brief Executes code in one session's workspace
 *
 * The SessionManager must outlive the Sandbox and every future returned by
 * ExecuteAsync.
 */
class Sandbox {
public:
    Sandbox(SessionManager& sessions,
            SandboxSession session,
            std::shared_ptr<const runtime::LanguageBackend> backend,
            ExecutionPolicy policy,
            std::shared_ptr<SandboxEngine> engine);

    /**
     * @brief Run code under the current policy
     * @param timeout Overrides the policy timeout for this call
     */
    ExecutionResult Execute(const std::string& code, std::optional<double> timeout = std::nullopt);

    /**
     * @brief Execute() on a background thread
     *
     * The task runs on a copy of this sandbox taken at call time. Later
     * SetPolicy() calls do not affect it, and the returned future stays
     * valid after this Sandbox is moved or destroyed.
     */
    std::future<ExecutionResult> ExecuteAsync(std::string code, std::optional<double> timeout = std::nullopt);

    /**
     * @brief Replace the policy; applies from the next execution
     * @throws HostSetupError if the policy is invalid
     */
    void SetPolicy(const ExecutionPolicy& policy);

    const ExecutionPolicy& GetPolicy() const { return policy_; }
    const std::string& GetSessionId() const { return session_.session_id; }
    const std::filesystem::path& GetWorkspace() const { return session_.workspace_path; }
    runtime::RuntimeType GetLanguage() const { return backend_->GetType(); }
    bool IsAutoPersist() const { return session_.auto_persist_globals; }

private:
    SessionManager* sessions_;
    SandboxSession session_;
    std::shared_ptr<const runtime::LanguageBackend> backend_;
    ExecutionPolicy policy_;
    std::shared_ptr<SandboxEngine> engine_;
};

/**
 * @class SandboxBuilder
 * @brief Fluent construction of a Sandbox
 */
class SandboxBuilder {
public:
    explicit SandboxBuilder(SessionManager& sessions);

    SandboxBuilder& WithLanguage(runtime::RuntimeType language);
    SandboxBuilder& WithSession(const std::string& session_id);
    SandboxBuilder& WithAutoPersist(bool enabled);
    SandboxBuilder& WithPolicy(const ExecutionPolicy& policy);
    SandboxBuilder& WithFuelBudget(std::uint64_t fuel_budget);
    SandboxBuilder& WithMemoryBytes(std::uint64_t memory_bytes);
    SandboxBuilder& WithTimeout(double seconds);
    SandboxBuilder& WithDataDir(const std::filesystem::path& host_dir);
    SandboxBuilder& WithReadOnlyMount(const std::filesystem::path& host_dir, const std::string& guest_path);
    SandboxBuilder& WithInjectSetup(bool enabled);
    SandboxBuilder& WithArtifacts(const runtime::BackendArtifacts& artifacts);
    SandboxBuilder& WithEngine(std::shared_ptr<SandboxEngine> engine);

    /**
     * @brief Resolve or create the session and assemble the sandbox
     * @throws HostSetupError for an invalid policy
     * @throws PathTraversalError for an invalid session id
     */
    Sandbox Build();

private:
    SessionManager& sessions_;
    runtime::RuntimeType language_{runtime::RuntimeType::PYTHON};
    std::optional<std::string> session_id_;
    bool auto_persist_{false};
    ExecutionPolicy policy_;
    runtime::BackendArtifacts artifacts_;
    std::shared_ptr<SandboxEngine> engine_;
};

} // namespace core
} // namespace wasmbox
