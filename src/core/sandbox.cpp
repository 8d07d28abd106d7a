/**
 * @file sandbox.cpp
 * @brief Implementation of the Sandbox facade and SandboxBuilder
 *
 * @date 2025
 */

#include "wasmbox/core/sandbox.hpp"
#include "wasmbox/core/errors.hpp"

#include <spdlog/spdlog.h>

namespace wasmbox {
namespace core {

// ============================================================================
// Sandbox
// ============================================================================

Sandbox::Sandbox(SessionManager& sessions,
                 SandboxSession session,
                 std::shared_ptr<const runtime::LanguageBackend> backend,
                 ExecutionPolicy policy,
                 std::shared_ptr<SandboxEngine> engine)
    : sessions_(&sessions),
      session_(std::move(session)),
      backend_(std::move(backend)),
      policy_(std::move(policy)),
      engine_(std::move(engine)) {
    if (!backend_ || !engine_) {
        throw HostSetupError("Sandbox requires a backend and an engine");
    }
}

ExecutionResult Sandbox::Execute(const std::string& code, std::optional<double> timeout) {
    ExecuteOptions options;
    options.session_id = session_.session_id;
    options.auto_persist = session_.auto_persist_globals;

    auto registered = sessions_->Get(session_.session_id);
    options.cached_session = registered && registered->execution_count > 0;

    sessions_->MarkBusy(session_.session_id);
    ExecutionResult result;
    try {
        result = engine_->Execute(code, *backend_, policy_, session_.workspace_path, options, timeout);
    } catch (...) {
        sessions_->MarkIdle(session_.session_id);
        throw;
    }
    sessions_->MarkIdle(session_.session_id);
    sessions_->Touch(session_.session_id);
    return result;
}

std::future<ExecutionResult> Sandbox::ExecuteAsync(std::string code, std::optional<double> timeout) {
    // The task owns a copy, so this Sandbox may be moved or destroyed first
    return std::async(std::launch::async, [sandbox = *this, code = std::move(code), timeout]() mutable {
        return sandbox.Execute(code, timeout);
    });
}

void Sandbox::SetPolicy(const ExecutionPolicy& policy) {
    policy.Validate();
    policy_ = policy;
    spdlog::debug("Policy updated for session {}", session_.session_id);
}

// ============================================================================
// SandboxBuilder
// ============================================================================

SandboxBuilder::SandboxBuilder(SessionManager& sessions)
    : sessions_(sessions) {
}

SandboxBuilder& SandboxBuilder::WithLanguage(runtime::RuntimeType language) {
    language_ = language;
    return *this;
}

SandboxBuilder& SandboxBuilder::WithSession(const std::string& session_id) {
    session_id_ = session_id;
    return *this;
}

SandboxBuilder& SandboxBuilder::WithAutoPersist(bool enabled) {
    auto_persist_ = enabled;
    return *this;
}

SandboxBuilder& SandboxBuilder::WithPolicy(const ExecutionPolicy& policy) {
    policy_ = policy;
    return *this;
}

SandboxBuilder& SandboxBuilder::WithFuelBudget(std::uint64_t fuel_budget) {
    policy_.fuel_budget = fuel_budget;
    return *this;
}

SandboxBuilder& SandboxBuilder::WithMemoryBytes(std::uint64_t memory_bytes) {
    policy_.memory_bytes = memory_bytes;
    return *this;
}

SandboxBuilder& SandboxBuilder::WithTimeout(double seconds) {
    policy_.timeout = seconds;
    return *this;
}

SandboxBuilder& SandboxBuilder::WithDataDir(const std::filesystem::path& host_dir) {
    policy_.mount_data_dir = host_dir;
    return *this;
}

SandboxBuilder& SandboxBuilder::WithReadOnlyMount(const std::filesystem::path& host_dir,
                                                  const std::string& guest_path) {
    policy_.additional_readonly_mounts.push_back(ReadOnlyMount{host_dir, guest_path});
    return *this;
}

SandboxBuilder& SandboxBuilder::WithInjectSetup(bool enabled) {
    policy_.inject_setup = enabled;
    return *this;
}

SandboxBuilder& SandboxBuilder::WithArtifacts(const runtime::BackendArtifacts& artifacts) {
    artifacts_ = artifacts;
    return *this;
}

SandboxBuilder& SandboxBuilder::WithEngine(std::shared_ptr<SandboxEngine> engine) {
    engine_ = std::move(engine);
    return *this;
}

Sandbox SandboxBuilder::Build() {
    policy_.Validate();

    std::shared_ptr<const runtime::LanguageBackend> backend = runtime::CreateBackend(language_, artifacts_);
    auto session = session_id_ ? sessions_.Resolve(*session_id_, language_, auto_persist_)
                               : sessions_.Create(language_, auto_persist_);
    auto engine = engine_ ? engine_ : std::make_shared<SandboxEngine>();

    spdlog::debug("Sandbox ready: session {} ({})", session.session_id, backend->GetName());
    return Sandbox(sessions_, std::move(session), std::move(backend), policy_, std::move(engine));
}

} // namespace core
} // namespace wasmbox
