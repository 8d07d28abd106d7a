/**
 * @file workspace_store.cpp
 * @brief Implementation of the workspace filesystem adapter
 *
 * **Path Safety**:
 * - Ids and relative paths are checked lexically before any filesystem call
 * - Resolved paths are canonicalized and compared component-wise against the
 *   canonical workspace, so symlinks pointing outside are caught as well
 *
 * @date 2025
 */

#include "wasmbox/storage/workspace_store.hpp"
#include "wasmbox/core/errors.hpp"
#include "wasmbox/utils/hash_utils.hpp"
#include "wasmbox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace wasmbox {
namespace storage {

namespace fs = std::filesystem;
using json = nlohmann::json;
using core::PathTraversalError;

namespace {

bool IsWithin(const fs::path& candidate, const fs::path& base) {
    auto base_it = base.begin();
    auto cand_it = candidate.begin();
    for (; base_it != base.end(); ++base_it, ++cand_it) {
        if (cand_it == candidate.end() || *cand_it != *base_it) {
            // A trailing empty component ("dir/") is not a mismatch
            if (base_it->empty()) {
                continue;
            }
            return false;
        }
    }
    return true;
}

std::vector<std::uint8_t> ReadAllBytes(const fs::path& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + path.string());
    }

    std::streamsize size = file.tellg();
    file.seekg(0, std::ios::beg);

    std::vector<std::uint8_t> buffer(static_cast<std::size_t>(size));
    if (size > 0 && !file.read(reinterpret_cast<char*>(buffer.data()), size)) {
        throw std::runtime_error("Failed to read file: " + path.string());
    }
    return buffer;
}

} // anonymous namespace

void AtomicWriteFile(const fs::path& target, const std::string& contents) {
    fs::path tmp = target;
    tmp += ".tmp-" + utils::HashUtils::GenerateRandomHex(6);

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw std::runtime_error("Failed to open temp file: " + tmp.string());
        }
        out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
        out.flush();
        if (!out) {
            out.close();
            std::error_code ec;
            fs::remove(tmp, ec);
            throw std::runtime_error("Failed to write temp file: " + tmp.string());
        }
    }

    std::error_code ec;
    fs::rename(tmp, target, ec);
    if (ec) {
        std::error_code cleanup_ec;
        fs::remove(tmp, cleanup_ec);
        if (cleanup_ec) {
            spdlog::warn("Failed to remove temp file {}: {}", tmp.string(), cleanup_ec.message());
        }
        throw std::runtime_error("Failed to replace " + target.string() + ": " + ec.message());
    }
}

WorkspaceStore::WorkspaceStore(fs::path root)
    : root_(std::move(root)) {
}

// ============================================================================
// VALIDATION
// ============================================================================

void WorkspaceStore::ValidateSessionId(const std::string& session_id) {
    if (session_id.empty()) {
        throw PathTraversalError("Session id cannot be empty");
    }
    if (session_id == "." || session_id == ".." ||
        session_id.find("..") != std::string::npos ||
        session_id.find('/') != std::string::npos ||
        session_id.find('\\') != std::string::npos ||
        session_id.find('\0') != std::string::npos) {
        throw PathTraversalError("Invalid session id: '" + session_id + "'");
    }
    if (session_id.front() == '.' || session_id == kSitePackagesDir) {
        throw PathTraversalError("Reserved session id: '" + session_id + "'");
    }
}

void WorkspaceStore::ValidateRelativePath(const std::string& relative_path) {
    if (relative_path.empty()) {
        throw PathTraversalError("Path cannot be empty");
    }
    if (relative_path.find('\0') != std::string::npos) {
        throw PathTraversalError("Path contains a NUL byte");
    }
    if (relative_path.front() == '/' || relative_path.front() == '\\') {
        throw PathTraversalError("Absolute paths are not allowed: '" + relative_path + "'");
    }

    std::string normalized = utils::StringUtils::ReplaceAll(relative_path, "\\", "/");
    for (const auto& part : utils::StringUtils::Split(normalized, '/')) {
        if (part == "..") {
            throw PathTraversalError("Path escapes the workspace: '" + relative_path + "'");
        }
    }
}

fs::path WorkspaceStore::WorkspacePath(const std::string& session_id) const {
    ValidateSessionId(session_id);
    return root_ / session_id;
}

fs::path WorkspaceStore::ResolvePath(const std::string& session_id,
                                     const std::string& relative_path) const {
    ValidateRelativePath(relative_path);
    fs::path workspace = WorkspacePath(session_id);

    std::error_code ec;
    fs::path canonical_workspace = fs::weakly_canonical(workspace, ec);
    if (ec) {
        throw PathTraversalError("Cannot resolve workspace for session " + session_id + ": " + ec.message());
    }

    fs::path resolved = fs::weakly_canonical(workspace / relative_path, ec);
    if (ec) {
        throw PathTraversalError("Cannot resolve path '" + relative_path + "': " + ec.message());
    }

    if (!IsWithin(resolved, canonical_workspace)) {
        throw PathTraversalError("Path escapes the workspace: '" + relative_path + "'");
    }
    return resolved;
}

// ============================================================================
// WORKSPACE LIFECYCLE
// ============================================================================

bool WorkspaceStore::Exists(const std::string& session_id) const {
    std::error_code ec;
    return fs::is_directory(WorkspacePath(session_id), ec);
}

void WorkspaceStore::CreateWorkspace(const std::string& session_id) {
    fs::path workspace = WorkspacePath(session_id);
    std::error_code ec;
    fs::create_directories(workspace, ec);
    if (ec) {
        throw core::HostSetupError("Failed to create workspace " + workspace.string() + ": " + ec.message());
    }
}

bool WorkspaceStore::DeleteWorkspace(const std::string& session_id) {
    fs::path workspace = WorkspacePath(session_id);
    if (!fs::exists(fs::symlink_status(workspace))) {
        return false;
    }
    return fs::remove_all(workspace) > 0;
}

std::vector<std::string> WorkspaceStore::EnumerateSessions() const {
    std::vector<std::string> sessions;

    std::error_code ec;
    if (!fs::is_directory(root_, ec)) {
        return sessions;
    }

    for (const auto& entry : fs::directory_iterator(root_, fs::directory_options::skip_permission_denied, ec)) {
        std::error_code status_ec;
        if (!entry.is_directory(status_ec) || entry.is_symlink(status_ec)) {
            continue;
        }
        std::string name = entry.path().filename().string();
        if (name.empty() || name.front() == '.' || name == kSitePackagesDir) {
            continue;
        }
        sessions.push_back(name);
    }

    if (ec) {
        spdlog::warn("Failed to enumerate workspace root {}: {}", root_.string(), ec.message());
    }

    std::sort(sessions.begin(), sessions.end());
    return sessions;
}

bool WorkspaceStore::HydrateSitePackages(const std::string& session_id,
                                         const fs::path& shared_site_packages) {
    std::error_code ec;
    if (!fs::is_directory(shared_site_packages, ec)) {
        return false;
    }

    fs::path target = WorkspacePath(session_id) / kSitePackagesDir;
    if (fs::exists(fs::symlink_status(target))) {
        return false;
    }

    fs::copy(shared_site_packages, target, fs::copy_options::recursive, ec);
    if (ec) {
        throw core::HostSetupError("Failed to copy site-packages into " + target.string() + ": " + ec.message());
    }

    spdlog::debug("Hydrated site-packages for session {}", session_id);
    return true;
}

// ============================================================================
// METADATA
// ============================================================================

MetadataLookup WorkspaceStore::ReadMetadata(const std::string& session_id) const {
    MetadataLookup lookup;
    fs::path metadata_path = WorkspacePath(session_id) / kMetadataFile;

    std::error_code ec;
    if (!fs::is_regular_file(metadata_path, ec)) {
        lookup.status = MetadataStatus::MISSING;
        return lookup;
    }

    std::ifstream file(metadata_path);
    if (!file.is_open()) {
        lookup.status = MetadataStatus::CORRUPT;
        lookup.detail = "unreadable";
        return lookup;
    }

    try {
        json j = json::parse(file);
        lookup.metadata.session_id = j.at("session_id").get<std::string>();
        lookup.metadata.created_at = j.at("created_at").get<std::string>();
        lookup.metadata.updated_at = j.at("updated_at").get<std::string>();
        lookup.metadata.version = j.value("version", 1);
        lookup.status = MetadataStatus::OK;
    } catch (const json::exception& e) {
        lookup.status = MetadataStatus::CORRUPT;
        lookup.detail = e.what();
    }

    return lookup;
}

void WorkspaceStore::WriteMetadata(const std::string& session_id, const SessionMetadata& metadata) {
    fs::path metadata_path = WorkspacePath(session_id) / kMetadataFile;

    json j = {
        {"session_id", metadata.session_id},
        {"created_at", metadata.created_at},
        {"updated_at", metadata.updated_at},
        {"version", metadata.version},
    };

    AtomicWriteFile(metadata_path, j.dump(2));
    spdlog::debug("Wrote metadata for session {}", session_id);
}

// ============================================================================
// FILES
// ============================================================================

std::vector<std::uint8_t> WorkspaceStore::ReadFile(const std::string& session_id,
                                                   const std::string& relative_path) const {
    fs::path path = ResolvePath(session_id, relative_path);
    return ReadAllBytes(path);
}

void WorkspaceStore::WriteFile(const std::string& session_id, const std::string& relative_path,
                               const std::vector<std::uint8_t>& data, bool overwrite) {
    fs::path path = ResolvePath(session_id, relative_path);
    if (!overwrite && fs::exists(fs::symlink_status(path))) {
        throw std::runtime_error("File already exists: " + relative_path);
    }
    fs::create_directories(path.parent_path());

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + path.string());
    }
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!out) {
        throw std::runtime_error("Failed to write file: " + path.string());
    }
}

bool WorkspaceStore::DeletePath(const std::string& session_id, const std::string& relative_path,
                                bool recursive) {
    fs::path path = ResolvePath(session_id, relative_path);
    auto status = fs::symlink_status(path);
    if (!fs::exists(status)) {
        return false;
    }
    if (fs::is_directory(status) && !fs::is_empty(path)) {
        if (!recursive) {
            throw std::runtime_error("Directory not empty (delete recursively): " + relative_path);
        }
        std::uintmax_t removed = fs::remove_all(path);
        spdlog::debug("Deleted {} ({} entries) from session {}", relative_path, removed, session_id);
        return removed > 0;
    }
    return fs::remove(path);
}

std::vector<std::string> WorkspaceStore::ListFiles(const std::string& session_id,
                                                   const std::string& pattern) const {
    std::vector<std::string> files;
    fs::path workspace = WorkspacePath(session_id);

    std::error_code ec;
    if (!fs::is_directory(workspace, ec)) {
        return files;
    }

    // A pattern without '/' matches the file name at any depth
    bool match_basename = !pattern.empty() && pattern.find('/') == std::string::npos;

    for (auto it = fs::recursive_directory_iterator(workspace, fs::directory_options::skip_permission_denied, ec);
         it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            spdlog::warn("Error while listing {}: {}", workspace.string(), ec.message());
            break;
        }
        std::error_code status_ec;
        if (!it->is_regular_file(status_ec) || it->is_symlink(status_ec)) {
            continue;
        }

        std::string relative = it->path().lexically_relative(workspace).generic_string();
        if (!pattern.empty()) {
            const std::string subject = match_basename ? it->path().filename().string() : relative;
            if (!utils::StringUtils::GlobMatch(pattern, subject)) {
                continue;
            }
        }
        files.push_back(relative);
    }

    std::sort(files.begin(), files.end());
    return files;
}

std::uint64_t WorkspaceStore::GetWorkspaceSize(const std::string& session_id) const {
    fs::path workspace = WorkspacePath(session_id);
    std::uint64_t total = 0;

    std::error_code ec;
    if (!fs::is_directory(workspace, ec)) {
        return 0;
    }

    for (auto it = fs::recursive_directory_iterator(workspace, fs::directory_options::skip_permission_denied, ec);
         it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            throw fs::filesystem_error("Failed to walk workspace", workspace, ec);
        }
        std::error_code status_ec;
        if (it->is_regular_file(status_ec) && !it->is_symlink(status_ec)) {
            auto size = it->file_size(status_ec);
            if (!status_ec) {
                total += size;
            }
        }
    }
    return total;
}

WorkspaceSnapshot WorkspaceStore::Snapshot(const fs::path& workspace,
                                           const std::set<std::string>& exclude_files,
                                           const std::set<std::string>& exclude_dirs) {
    WorkspaceSnapshot snapshot;

    std::error_code ec;
    if (!fs::is_directory(workspace, ec)) {
        return snapshot;
    }

    for (auto it = fs::recursive_directory_iterator(workspace, fs::directory_options::skip_permission_denied, ec);
         it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            throw fs::filesystem_error("Failed to snapshot workspace", workspace, ec);
        }

        std::string relative = it->path().lexically_relative(workspace).generic_string();
        bool top_level = relative.find('/') == std::string::npos;

        std::error_code status_ec;
        if (it->is_directory(status_ec)) {
            if (top_level && exclude_dirs.count(relative) > 0) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (!it->is_regular_file(status_ec) || it->is_symlink(status_ec)) {
            continue;
        }
        if (top_level && exclude_files.count(relative) > 0) {
            continue;
        }

        FileStamp stamp;
        stamp.size = it->file_size(status_ec);
        stamp.mtime = it->last_write_time(status_ec);
        if (!status_ec) {
            snapshot.emplace(relative, stamp);
        }
    }

    return snapshot;
}

std::optional<fs::file_time_type> WorkspaceStore::GetWorkspaceMtime(const std::string& session_id) const {
    std::error_code ec;
    auto mtime = fs::last_write_time(WorkspacePath(session_id), ec);
    if (ec) {
        return std::nullopt;
    }
    return mtime;
}

} // namespace storage
} // namespace wasmbox
