/**
 * @file session_manager.cpp
 * @brief Implementation of the session lifecycle and pruning
 *
 * **Prune Rules**:
 * - cutoff = now - older_than; a session is a candidate when updated_at < cutoff
 * - missing metadata: skipped ("missing_metadata") unless missing_metadata_grace
 *   is set and the directory mtime is past the grace period
 * - unparsable metadata or timestamp: skipped ("corrupted_metadata" /
 *   "corrupted_timestamp")
 * - sessions with an execution in flight are never candidates
 * - reclaimed bytes are measured before deletion, identically in dry runs
 *
 * @date 2025
 */

#include "wasmbox/core/session_manager.hpp"
#include "wasmbox/core/errors.hpp"
#include "wasmbox/utils/hash_utils.hpp"
#include "wasmbox/utils/string_utils.hpp"
#include "wasmbox/utils/time_utils.hpp"

#include <spdlog/spdlog.h>

#include <sstream>

namespace wasmbox {
namespace core {

namespace fs = std::filesystem;
using storage::MetadataStatus;
using storage::SessionMetadata;
using utils::TimeUtils;

std::string PruneResult::Summary() const {
    std::ostringstream oss;
    oss << (dry_run ? "Would prune " : "Pruned ")
        << deleted_sessions.size() << (deleted_sessions.size() == 1 ? " session" : " sessions")
        << " (" << skipped_sessions.size() << " skipped, " << errors.size() << " errors), "
        << (dry_run ? "would reclaim " : "reclaimed ")
        << utils::StringUtils::FormatBytes(reclaimed_bytes);
    return oss.str();
}

SessionManager::SessionManager(const Config& config)
    : config_(config)
    , store_(config.workspace_root) {
    spdlog::debug("Session manager initialized (root: {})", config_.workspace_root.string());
}

SessionManager::SessionManager()
    : SessionManager(Config{}) {
}

SessionManager::~SessionManager() {
    StopSweeper();
}

fs::path SessionManager::SharedSitePackages() const {
    if (config_.shared_site_packages) {
        return *config_.shared_site_packages;
    }
    return config_.workspace_root / storage::WorkspaceStore::kSitePackagesDir;
}

// ============================================================================
// LIFECYCLE
// ============================================================================

void SessionManager::InitializeWorkspace(const std::string& session_id) {
    store_.CreateWorkspace(session_id);

    std::string now = TimeUtils::NowIso8601();
    SessionMetadata metadata;
    metadata.session_id = session_id;
    metadata.created_at = now;
    metadata.updated_at = now;

    try {
        store_.WriteMetadata(session_id, metadata);
    } catch (const std::exception& e) {
        // The session is usable without metadata; prune will skip it
        spdlog::warn("Failed to write metadata for session {}: {}", session_id, e.what());
    }

    if (config_.hydrate_site_packages) {
        store_.HydrateSitePackages(session_id, SharedSitePackages());
    }
}

SandboxSession SessionManager::RegisterSession(const std::string& session_id, runtime::RuntimeType language,
                                               bool auto_persist, bool created) {
    auto now = std::chrono::system_clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it != sessions_.end()) {
        it->second.language = language;
        it->second.auto_persist_globals = auto_persist;
        return it->second;
    }

    SandboxSession session;
    session.session_id = session_id;
    session.workspace_path = store_.WorkspacePath(session_id);
    session.language = language;
    session.auto_persist_globals = auto_persist;
    session.created_at = now;
    session.last_used_at = now;

    if (!created) {
        auto lookup = store_.ReadMetadata(session_id);
        if (lookup.status == MetadataStatus::OK) {
            if (auto created_at = TimeUtils::ParseIso8601(lookup.metadata.created_at)) {
                session.created_at = *created_at;
            }
            if (auto updated_at = TimeUtils::ParseIso8601(lookup.metadata.updated_at)) {
                session.last_used_at = *updated_at;
            }
        }
    }

    sessions_[session_id] = session;
    return session;
}

SandboxSession SessionManager::Create(runtime::RuntimeType language, bool auto_persist) {
    std::string session_id = utils::HashUtils::GenerateSessionId();
    InitializeWorkspace(session_id);

    spdlog::info("✓ Created session {} ({})", session_id, runtime::RuntimeTypeToString(language));
    return RegisterSession(session_id, language, auto_persist, true);
}

SandboxSession SessionManager::Resolve(const std::string& session_id, runtime::RuntimeType language,
                                       bool auto_persist) {
    storage::WorkspaceStore::ValidateSessionId(session_id);

    bool created = false;
    if (!store_.Exists(session_id)) {
        InitializeWorkspace(session_id);
        created = true;
        spdlog::info("✓ Created session {} ({})", session_id, runtime::RuntimeTypeToString(language));
    } else {
        if (store_.ReadMetadata(session_id).status == MetadataStatus::MISSING) {
            // Workspace created outside the manager; adopt it
            std::string now = TimeUtils::NowIso8601();
            try {
                store_.WriteMetadata(session_id, SessionMetadata{session_id, now, now, 1});
            } catch (const std::exception& e) {
                spdlog::warn("Failed to write metadata for session {}: {}", session_id, e.what());
            }
        }
        spdlog::debug("Retrieved session {}", session_id);
    }

    return RegisterSession(session_id, language, auto_persist, created);
}

std::optional<SandboxSession> SessionManager::Get(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<SandboxSession> SessionManager::ListSessions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SandboxSession> result;
    result.reserve(sessions_.size());
    for (const auto& [id, session] : sessions_) {
        result.push_back(session);
    }
    return result;
}

std::vector<std::string> SessionManager::EnumerateWorkspaces() const {
    return store_.EnumerateSessions();
}

bool SessionManager::Delete(const std::string& session_id) {
    storage::WorkspaceStore::ValidateSessionId(session_id);

    bool removed = store_.DeleteWorkspace(session_id);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions_.erase(session_id);
    }

    if (removed) {
        spdlog::info("✓ Deleted session {}", session_id);
    } else {
        spdlog::debug("Delete of absent session {} ignored", session_id);
    }
    return removed;
}

void SessionManager::Touch(const std::string& session_id) {
    auto now = std::chrono::system_clock::now();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it != sessions_.end()) {
            it->second.last_used_at = now;
            it->second.execution_count++;
        }
    }

    try {
        auto lookup = store_.ReadMetadata(session_id);
        SessionMetadata metadata;
        if (lookup.status == MetadataStatus::OK) {
            metadata = lookup.metadata;
        } else {
            metadata.session_id = session_id;
            metadata.created_at = TimeUtils::ToIso8601(now);
        }
        metadata.updated_at = TimeUtils::ToIso8601(now);
        store_.WriteMetadata(session_id, metadata);
    } catch (const std::exception& e) {
        spdlog::warn("Failed to update metadata for session {}: {}", session_id, e.what());
    }
}

void SessionManager::MarkBusy(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it != sessions_.end()) {
        ++it->second.active_runs;
        it->second.busy = true;
    }
}

void SessionManager::MarkIdle(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it != sessions_.end()) {
        if (it->second.active_runs > 0) {
            --it->second.active_runs;
        }
        it->second.busy = it->second.active_runs > 0;
    }
}

bool SessionManager::IsBusy(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    return it != sessions_.end() && it->second.busy;
}

// ============================================================================
// FILES
// ============================================================================

std::vector<std::string> SessionManager::ListFiles(const std::string& session_id,
                                                   const std::string& pattern) const {
    return store_.ListFiles(session_id, pattern);
}

std::vector<std::uint8_t> SessionManager::ReadFile(const std::string& session_id,
                                                   const std::string& relative_path) const {
    return store_.ReadFile(session_id, relative_path);
}

std::string SessionManager::ReadText(const std::string& session_id, const std::string& relative_path) const {
    auto bytes = store_.ReadFile(session_id, relative_path);
    return std::string(bytes.begin(), bytes.end());
}

void SessionManager::WriteFile(const std::string& session_id, const std::string& relative_path,
                               const std::vector<std::uint8_t>& data, bool overwrite) {
    store_.WriteFile(session_id, relative_path, data, overwrite);
}

void SessionManager::WriteText(const std::string& session_id, const std::string& relative_path,
                               const std::string& text, bool overwrite) {
    store_.WriteFile(session_id, relative_path, std::vector<std::uint8_t>(text.begin(), text.end()), overwrite);
}

bool SessionManager::DeletePath(const std::string& session_id, const std::string& relative_path,
                                bool recursive) {
    return store_.DeletePath(session_id, relative_path, recursive);
}

std::uint64_t SessionManager::GetSessionSize(const std::string& session_id) const {
    return store_.GetWorkspaceSize(session_id);
}

// ============================================================================
// PRUNING
// ============================================================================

PruneResult SessionManager::Prune(std::chrono::seconds older_than, bool dry_run) {
    PruneResult result;
    result.dry_run = dry_run;

    auto now = std::chrono::system_clock::now();
    auto cutoff = now - older_than;

    spdlog::info("Prune started (older than {}s, cutoff {}{})",
                 older_than.count(), TimeUtils::ToIso8601(cutoff), dry_run ? ", dry run" : "");

    for (const auto& session_id : store_.EnumerateSessions()) {
        try {
            if (IsBusy(session_id)) {
                spdlog::debug("Prune skipping busy session {}", session_id);
                continue;
            }

            auto lookup = store_.ReadMetadata(session_id);
            bool eligible = false;

            if (lookup.status == MetadataStatus::MISSING) {
                auto mtime = store_.GetWorkspaceMtime(session_id);
                if (config_.missing_metadata_grace && mtime &&
                    fs::file_time_type::clock::now() - *mtime > *config_.missing_metadata_grace) {
                    eligible = true;
                } else {
                    result.skipped_sessions.push_back(session_id);
                    spdlog::debug("Prune skipped {} (missing_metadata)", session_id);
                    continue;
                }
            } else if (lookup.status == MetadataStatus::CORRUPT) {
                result.skipped_sessions.push_back(session_id);
                spdlog::warn("Prune skipped {} (corrupted_metadata: {})", session_id, lookup.detail);
                continue;
            } else {
                auto updated_at = TimeUtils::ParseIso8601(lookup.metadata.updated_at);
                if (!updated_at) {
                    result.skipped_sessions.push_back(session_id);
                    spdlog::warn("Prune skipped {} (corrupted_timestamp)", session_id);
                    continue;
                }
                eligible = *updated_at < cutoff;
                if (eligible) {
                    auto age = std::chrono::duration_cast<std::chrono::seconds>(now - *updated_at);
                    spdlog::debug("Prune candidate {} (updated {}, idle {}s)",
                                  session_id, lookup.metadata.updated_at, age.count());
                }
            }

            if (!eligible) {
                continue;
            }

            std::uint64_t size = store_.GetWorkspaceSize(session_id);
            if (!dry_run) {
                store_.DeleteWorkspace(session_id);
                std::lock_guard<std::mutex> lock(mutex_);
                sessions_.erase(session_id);
            }

            result.reclaimed_bytes += size;
            result.deleted_sessions.push_back(session_id);
            spdlog::info("{} session {} ({})", dry_run ? "Would delete" : "Deleted",
                         session_id, utils::StringUtils::FormatBytes(size));

        } catch (const std::exception& e) {
            result.errors.push_back(session_id + ": " + e.what());
            spdlog::error("Prune failed for session {}: {}", session_id, e.what());
        }
    }

    spdlog::info("✓ {}", result.Summary());
    return result;
}

void SessionManager::StartSweeper(std::chrono::seconds interval, std::chrono::seconds older_than) {
    if (sweeper_running_.exchange(true)) {
        spdlog::warn("Session sweeper already running");
        return;
    }

    {
        std::lock_guard<std::mutex> lock(sweeper_mutex_);
        sweeper_stop_ = false;
    }

    sweeper_thread_ = std::thread([this, interval, older_than]() {
        spdlog::debug("Session sweeper started (every {}s)", interval.count());
        std::unique_lock<std::mutex> lock(sweeper_mutex_);
        while (!sweeper_stop_) {
            if (sweeper_cv_.wait_for(lock, interval, [this]() { return sweeper_stop_; })) {
                break;
            }
            lock.unlock();
            try {
                Prune(older_than, false);
            } catch (const std::exception& e) {
                spdlog::error("Session sweep failed: {}", e.what());
            }
            lock.lock();
        }
        spdlog::debug("Session sweeper stopped");
    });
}

void SessionManager::StopSweeper() {
    if (!sweeper_running_.load()) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(sweeper_mutex_);
        sweeper_stop_ = true;
    }
    sweeper_cv_.notify_all();

    if (sweeper_thread_.joinable()) {
        sweeper_thread_.join();
    }
    sweeper_running_.store(false);
}

} // namespace core
} // namespace wasmbox
