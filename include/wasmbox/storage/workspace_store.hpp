/**
 * @file workspace_store.hpp
 * @brief Filesystem adapter for per-session workspaces
 *
 * Owns every direct filesystem access under the workspace root: id and path
 * validation, metadata sidecars, file I/O, snapshots and size accounting.
 * Session lifecycle policy lives in core::SessionManager.
 *
 * **Layout**:
 * @code
 * <root>/
 *   site-packages/            shared packages (reserved, never a session)
 *   <session_id>/
 *     .metadata.json          {session_id, created_at, updated_at, version}
 *     .session_state.json     persisted _state
 *     user_code.py            last program written by the engine
 *     ...                     guest files
 * @endcode
 *
 * @date 2025
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace wasmbox {
namespace storage {

/**
 * @struct SessionMetadata
 * @brief Contents of the `.metadata.json` sidecar
 */
struct SessionMetadata {
    std::string session_id;
    std::string created_at;   ///< ISO-8601 UTC
    std::string updated_at;   ///< ISO-8601 UTC
    int version{1};
};

/**
 * @enum MetadataStatus
 * @brief Outcome of reading a metadata sidecar
 */
enum class MetadataStatus {
    OK,
    MISSING,
    CORRUPT
};

/**
 * @struct MetadataLookup
 */
struct MetadataLookup {
    MetadataStatus status{MetadataStatus::MISSING};
    SessionMetadata metadata;
    std::string detail;       ///< Reason when status is CORRUPT
};

/**
 * @struct FileStamp
 * @brief Size and modification time used to diff snapshots
 */
struct FileStamp {
    std::uintmax_t size{0};
    std::filesystem::file_time_type mtime;

    bool operator==(const FileStamp& other) const {
        return size == other.size && mtime == other.mtime;
    }
    bool operator!=(const FileStamp& other) const { return !(*this == other); }
};

/// Relative POSIX path -> stamp
using WorkspaceSnapshot = std::map<std::string, FileStamp>;

/**
 * @class WorkspaceStore
 * @brief Validated access to `<root>/<session_id>/...`
 *
 * Every method that takes a session id or relative path validates it before
 * any filesystem access and throws core::PathTraversalError on an escape.
 */
class WorkspaceStore {
public:
    static constexpr const char* kMetadataFile = ".metadata.json";
    static constexpr const char* kSitePackagesDir = "site-packages";

    explicit WorkspaceStore(std::filesystem::path root);

    const std::filesystem::path& GetRoot() const { return root_; }

    /***************************************************************************
     * Validation
     ***************************************************************************/

    /**
     * @brief Reject ids that are empty, ".", hidden, reserved, or contain
     *        '/', '\\', ".." or NUL
     * @throws core::PathTraversalError
     */
    static void ValidateSessionId(const std::string& session_id);

    /**
     * @brief Reject empty, absolute, NUL-containing and ".."-containing paths
     * @throws core::PathTraversalError
     */
    static void ValidateRelativePath(const std::string& relative_path);

    /**
     * @brief Workspace directory of a session (validated, need not exist)
     */
    std::filesystem::path WorkspacePath(const std::string& session_id) const;

    /**
     * @brief Resolve a relative path inside a session's workspace
     *
     * The result is canonicalized (existing symlinks resolved) and must stay
     * inside the canonical workspace.
     *
     * @throws core::PathTraversalError on any escape
     */
    std::filesystem::path ResolvePath(const std::string& session_id,
                                      const std::string& relative_path) const;

    /***************************************************************************
     * Workspace Lifecycle
     ***************************************************************************/

    bool Exists(const std::string& session_id) const;

    /**
     * @brief Create the workspace directory (and the root) if needed
     */
    void CreateWorkspace(const std::string& session_id);

    /**
     * @brief Remove a workspace recursively
     * @return true if something was removed
     */
    bool DeleteWorkspace(const std::string& session_id);

    /**
     * @brief Session directories under the root
     *
     * Hidden entries and the reserved site-packages directory are skipped.
     */
    std::vector<std::string> EnumerateSessions() const;

    /**
     * @brief Copy a shared site-packages tree into the workspace if absent
     * @return true if a copy was made
     */
    bool HydrateSitePackages(const std::string& session_id,
                             const std::filesystem::path& shared_site_packages);

    /***************************************************************************
     * Metadata
     ***************************************************************************/

    MetadataLookup ReadMetadata(const std::string& session_id) const;

    /**
     * @brief Write the sidecar atomically (temp file + rename)
     */
    void WriteMetadata(const std::string& session_id, const SessionMetadata& metadata);

    /***************************************************************************
     * Files
     ***************************************************************************/

    std::vector<std::uint8_t> ReadFile(const std::string& session_id,
                                       const std::string& relative_path) const;

    /**
     * @brief Write bytes, creating parent directories
     * @param overwrite When false an existing file is left alone
     * @throws std::runtime_error if the file exists and overwrite is false
     */
    void WriteFile(const std::string& session_id, const std::string& relative_path,
                   const std::vector<std::uint8_t>& data, bool overwrite = true);

    /**
     * @brief Remove a file, an empty directory, or (with recursive) a tree
     * @return true if something was removed
     * @throws std::runtime_error for a non-empty directory without recursive
     */
    bool DeletePath(const std::string& session_id, const std::string& relative_path, bool recursive = false);

    /**
     * @brief Sorted relative POSIX paths of regular files
     * @param pattern Optional glob; empty matches everything
     */
    std::vector<std::string> ListFiles(const std::string& session_id,
                                       const std::string& pattern = "") const;

    /**
     * @brief Total size of regular files in the workspace
     */
    std::uint64_t GetWorkspaceSize(const std::string& session_id) const;

    /**
     * @brief Stamp every regular file, skipping excluded names
     * @param exclude_files Top-level file names to skip
     * @param exclude_dirs Top-level directory names to skip
     */
    static WorkspaceSnapshot Snapshot(const std::filesystem::path& workspace,
                                      const std::set<std::string>& exclude_files,
                                      const std::set<std::string>& exclude_dirs);

    /**
     * @brief Directory mtime, used for metadata-less sessions
     */
    std::optional<std::filesystem::file_time_type> GetWorkspaceMtime(const std::string& session_id) const;

private:
    std::filesystem::path root_;
};

/**
 * @brief Write a file atomically via a sibling temp file and rename
 * @throws std::runtime_error on I/O failure
 */
void AtomicWriteFile(const std::filesystem::path& target, const std::string& contents);

} // namespace storage
} // namespace wasmbox
