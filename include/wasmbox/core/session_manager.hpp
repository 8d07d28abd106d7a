/**
 * @file session_manager.hpp
 * @brief Session lifecycle: create, resolve, delete, prune and file access
 *
 * A session is a workspace directory owned by one opaque id. The manager
 * keeps an in-memory registry of sessions it has handed out, maintains the
 * `.metadata.json` sidecar and prunes idle workspaces, optionally from a
 * background sweeper thread.
 *
 * **State Machine**:
 * @code
 * {absent} --Create/Resolve--> {active} --idle past threshold, Prune--> {absent}
 * {active} --Delete--> {absent}
 * @endcode
 *
 * **Thread Safety**:
 * The registry is guarded by a mutex. Filesystem operations on the same
 * session from several threads race like separate processes would.
 *
 * @date 2025
 */

#pragma once

#include "wasmbox/runtime/runtime_type.hpp"
#include "wasmbox/storage/workspace_store.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace wasmbox {
namespace core {

/**
 * @struct SandboxSession
 * @brief A live session handed out by the manager
 */
struct SandboxSession {
    std::string session_id;
    std::filesystem::path workspace_path;
    runtime::RuntimeType language{runtime::RuntimeType::PYTHON};
    bool auto_persist_globals{false};
    std::chrono::system_clock::time_point created_at;
    std::chrono::system_clock::time_point last_used_at;
    std::uint64_t execution_count{0};
    std::uint32_t active_runs{0};   ///< In-flight executions, one per MarkBusy()
    bool busy{false};               ///< active_runs > 0
};

/**
 * @struct PruneResult
 * @brief Report of one prune sweep
 */
struct PruneResult {
    std::vector<std::string> deleted_sessions;   ///< Deleted (or would be, when dry_run)
    std::vector<std::string> skipped_sessions;   ///< Missing or corrupt metadata
    std::uint64_t reclaimed_bytes{0};
    std::vector<std::string> errors;             ///< "<session_id>: <message>"
    bool dry_run{false};

    /**
     * @brief e.g. "Pruned 3 sessions (1 skipped, 0 errors), reclaimed 2.40 MB"
     */
    std::string Summary() const;
};

/**
 * @class SessionManager
 * @brief Owns the session registry and workspace lifecycle
 *
 * **Usage Example**:
 * @code
 * SessionManager sessions;
 * auto session = sessions.Create(runtime::RuntimeType::PYTHON);
 * sessions.WriteText(session.session_id, "input.csv", "a,b\n1,2\n");
 * auto report = sessions.Prune(std::chrono::hours(24), true);
 * @endcode
 */
class SessionManager {
public:
    /**
     * @struct Config
     * @brief Session manager configuration
     */
    struct Config {
        std::filesystem::path workspace_root{"workspace"};            ///< Parent of all workspaces
        std::optional<std::filesystem::path> shared_site_packages;    ///< Defaults to <root>/site-packages
        std::optional<std::chrono::seconds> missing_metadata_grace;   ///< Prune metadata-less dirs older than this
        bool hydrate_site_packages{true};                             ///< Copy shared packages on create
    };

    explicit SessionManager(const Config& config);
    explicit SessionManager();
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    /***************************************************************************
     * Lifecycle
     ***************************************************************************/

    /**
     * @brief Create a session with a fresh random id
     * @throws HostSetupError if the workspace cannot be created
     */
    SandboxSession Create(runtime::RuntimeType language, bool auto_persist = false);

    /**
     * @brief Get-or-create a session with a caller-chosen id
     *
     * Idempotent: resolving an existing id returns the same workspace with
     * its files intact.
     *
     * @throws PathTraversalError for an invalid id
     */
    SandboxSession Resolve(const std::string& session_id, runtime::RuntimeType language,
                           bool auto_persist = false);

    /**
     * @brief Registry entry for an id, if this manager handed it out
     */
    std::optional<SandboxSession> Get(const std::string& session_id) const;

    /**
     * @brief Registry snapshot, sorted by id
     */
    std::vector<SandboxSession> ListSessions() const;

    /**
     * @brief Session ids that have a workspace on disk
     */
    std::vector<std::string> EnumerateWorkspaces() const;

    /**
     * @brief Remove the workspace recursively
     *
     * Validates the id before touching the filesystem. Deleting an absent
     * session is a no-op.
     *
     * @return true if a workspace was removed
     * @throws PathTraversalError for an invalid id
     */
    bool Delete(const std::string& session_id);

    /**
     * @brief Refresh updated_at / last_used_at after an execution
     *
     * Failures to rewrite metadata are logged, not thrown.
     */
    void Touch(const std::string& session_id);

    /**
     * @brief Count one in-flight execution; MarkIdle() releases one
     *
     * A session stays busy until every MarkBusy() is matched, so concurrent
     * runs on one session keep it out of prune sweeps.
     */
    void MarkBusy(const std::string& session_id);
    void MarkIdle(const std::string& session_id);
    bool IsBusy(const std::string& session_id) const;

    /***************************************************************************
     * Files
     ***************************************************************************/

    std::vector<std::string> ListFiles(const std::string& session_id, const std::string& pattern = "") const;
    std::vector<std::uint8_t> ReadFile(const std::string& session_id, const std::string& relative_path) const;
    std::string ReadText(const std::string& session_id, const std::string& relative_path) const;
    void WriteFile(const std::string& session_id, const std::string& relative_path,
                   const std::vector<std::uint8_t>& data, bool overwrite = true);
    void WriteText(const std::string& session_id, const std::string& relative_path, const std::string& text,
                   bool overwrite = true);
    /// A non-empty directory needs recursive
    bool DeletePath(const std::string& session_id, const std::string& relative_path, bool recursive = false);
    std::uint64_t GetSessionSize(const std::string& session_id) const;

    /***************************************************************************
     * Pruning
     ***************************************************************************/

    /**
     * @brief Delete sessions idle for longer than older_than
     *
     * Metadata-less or corrupt sessions are skipped and reported. A dry run
     * reports the same sessions and bytes without deleting.
     */
    PruneResult Prune(std::chrono::seconds older_than, bool dry_run = false);

    /**
     * @brief Run Prune every interval on a background thread
     */
    void StartSweeper(std::chrono::seconds interval, std::chrono::seconds older_than);

    /**
     * @brief Stop and join the sweeper thread (no-op if not running)
     */
    void StopSweeper();

    bool IsSweeperRunning() const { return sweeper_running_.load(); }

    const storage::WorkspaceStore& GetStore() const { return store_; }
    const Config& GetConfig() const { return config_; }

private:
    SandboxSession RegisterSession(const std::string& session_id, runtime::RuntimeType language,
                                   bool auto_persist, bool created);
    void InitializeWorkspace(const std::string& session_id);
    std::filesystem::path SharedSitePackages() const;

    Config config_;
    storage::WorkspaceStore store_;

    mutable std::mutex mutex_;
    std::map<std::string, SandboxSession> sessions_;

    std::thread sweeper_thread_;
    std::mutex sweeper_mutex_;
    std::condition_variable sweeper_cv_;
    std::atomic<bool> sweeper_running_{false};
    bool sweeper_stop_{false};
};

} // namespace core
} // namespace wasmbox
