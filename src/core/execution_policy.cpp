/**
 * @file execution_policy.cpp
 * @brief Policy validation and JSON loading
 *
 * @date 2025
 */

#include "wasmbox/core/execution_policy.hpp"
#include "wasmbox/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <fstream>
#include <set>

namespace wasmbox {
namespace core {

using json = nlohmann::json;

namespace {

void ValidateGuestPath(const std::string& guest_path, const std::string& what) {
    if (guest_path.empty() || guest_path.front() != '/') {
        throw HostSetupError(what + " must be an absolute guest path: '" + guest_path + "'");
    }
    if (guest_path == "/") {
        throw HostSetupError(what + " cannot be the guest root");
    }
    if (guest_path.find("..") != std::string::npos) {
        throw HostSetupError(what + " cannot contain '..': '" + guest_path + "'");
    }
}

template <typename T>
T GetField(const json& j, const char* key) {
    try {
        return j.at(key).get<T>();
    } catch (const json::exception& e) {
        throw HostSetupError(std::string("Invalid policy field '") + key + "': " + e.what());
    }
}

/// Non-negative integer; a negative value would wrap in get<std::uint64_t>()
std::uint64_t GetLimit(const json& j, const char* key) {
    const auto& value = j.at(key);
    if (!value.is_number_integer()) {
        throw HostSetupError(std::string("Invalid policy field '") + key + "': expected an integer");
    }
    if (!value.is_number_unsigned() && value.get<std::int64_t>() < 0) {
        throw HostSetupError(std::string("Invalid policy field '") + key + "': must be positive, got " +
                             value.dump());
    }
    return value.get<std::uint64_t>();
}

} // anonymous namespace

// ============================================================================
// VALIDATION
// ============================================================================

void ExecutionPolicy::Validate() const {
    if (fuel_budget == 0) {
        throw HostSetupError("fuel_budget must be positive");
    }
    if (fuel_budget > kMaxFuelBudget) {
        throw HostSetupError("fuel_budget exceeds the maximum of " + std::to_string(kMaxFuelBudget));
    }
    if (memory_bytes == 0) {
        throw HostSetupError("memory_bytes must be positive");
    }
    if (memory_bytes % kWasmPageSize != 0) {
        throw HostSetupError("memory_bytes must be a multiple of 65536, got " + std::to_string(memory_bytes));
    }
    if (memory_bytes / kWasmPageSize > 65536) {
        throw HostSetupError("memory_bytes exceeds the 4 GiB wasm32 address space");
    }
    if (stdout_max_bytes == 0) {
        throw HostSetupError("stdout_max_bytes must be positive");
    }
    if (stderr_max_bytes == 0) {
        throw HostSetupError("stderr_max_bytes must be positive");
    }
    if (timeout && (!std::isfinite(*timeout) || *timeout < 0.0)) {
        throw HostSetupError("timeout must be a non-negative number of seconds");
    }

    ValidateGuestPath(guest_mount_path, "guest_mount_path");

    std::set<std::string> guest_paths{guest_mount_path};
    if (mount_data_dir) {
        ValidateGuestPath(guest_data_path, "guest_data_path");
        if (!guest_paths.insert(guest_data_path).second) {
            throw HostSetupError("guest_data_path collides with another mount: " + guest_data_path);
        }
    }
    for (const auto& mount : additional_readonly_mounts) {
        ValidateGuestPath(mount.guest_path, "read-only mount");
        if (mount.host_path.empty()) {
            throw HostSetupError("read-only mount " + mount.guest_path + " has no host path");
        }
        if (!guest_paths.insert(mount.guest_path).second) {
            throw HostSetupError("read-only mount collides with another mount: " + mount.guest_path);
        }
    }
}

std::uint32_t ExecutionPolicy::MemoryPages() const {
    return static_cast<std::uint32_t>(memory_bytes / kWasmPageSize);
}

// ============================================================================
// JSON
// ============================================================================

ExecutionPolicy ExecutionPolicy::FromJson(const json& j) {
    if (!j.is_object()) {
        throw HostSetupError("Policy JSON must be an object");
    }

    ExecutionPolicy policy;

    if (j.contains("fuel_budget")) policy.fuel_budget = GetLimit(j, "fuel_budget");
    if (j.contains("memory_bytes")) policy.memory_bytes = GetLimit(j, "memory_bytes");
    if (j.contains("stdout_max_bytes")) policy.stdout_max_bytes = GetLimit(j, "stdout_max_bytes");
    if (j.contains("stderr_max_bytes")) policy.stderr_max_bytes = GetLimit(j, "stderr_max_bytes");

    if (j.contains("timeout")) {
        if (j["timeout"].is_null()) {
            policy.timeout.reset();
        } else {
            policy.timeout = GetField<double>(j, "timeout");
        }
    }

    if (j.contains("guest_mount_path")) policy.guest_mount_path = GetField<std::string>(j, "guest_mount_path");
    if (j.contains("guest_data_path")) policy.guest_data_path = GetField<std::string>(j, "guest_data_path");
    if (j.contains("mount_data_dir") && !j["mount_data_dir"].is_null()) {
        policy.mount_data_dir = std::filesystem::path(GetField<std::string>(j, "mount_data_dir"));
    }

    if (j.contains("additional_readonly_mounts")) {
        const auto& mounts = j["additional_readonly_mounts"];
        if (!mounts.is_array()) {
            throw HostSetupError("additional_readonly_mounts must be an array");
        }
        for (const auto& entry : mounts) {
            if (!entry.is_object()) {
                throw HostSetupError("additional_readonly_mounts entries must be objects");
            }
            ReadOnlyMount mount;
            mount.host_path = GetField<std::string>(entry, "host_path");
            mount.guest_path = GetField<std::string>(entry, "guest_path");
            policy.additional_readonly_mounts.push_back(std::move(mount));
        }
    }

    if (j.contains("argv")) policy.argv = GetField<std::vector<std::string>>(j, "argv");
    if (j.contains("env")) policy.env = GetField<std::map<std::string, std::string>>(j, "env");
    if (j.contains("inject_setup")) policy.inject_setup = GetField<bool>(j, "inject_setup");

    policy.Validate();
    return policy;
}

ExecutionPolicy ExecutionPolicy::LoadFromFile(const std::filesystem::path& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw HostSetupError("Cannot open policy file: " + file_path.string());
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw HostSetupError("Malformed policy file " + file_path.string() + ": " + e.what());
    }

    spdlog::debug("Loaded policy from {}", file_path.string());
    return FromJson(j);
}

json ExecutionPolicy::ToJson() const {
    json j;
    j["fuel_budget"] = fuel_budget;
    j["memory_bytes"] = memory_bytes;
    j["stdout_max_bytes"] = stdout_max_bytes;
    j["stderr_max_bytes"] = stderr_max_bytes;
    j["timeout"] = timeout ? json(*timeout) : json(nullptr);
    j["guest_mount_path"] = guest_mount_path;
    j["mount_data_dir"] = mount_data_dir ? json(mount_data_dir->string()) : json(nullptr);
    j["guest_data_path"] = guest_data_path;

    j["additional_readonly_mounts"] = json::array();
    for (const auto& mount : additional_readonly_mounts) {
        j["additional_readonly_mounts"].push_back({
            {"host_path", mount.host_path.string()},
            {"guest_path", mount.guest_path},
        });
    }

    j["argv"] = argv;
    j["env"] = env;
    j["inject_setup"] = inject_setup;
    return j;
}

} // namespace core
} // namespace wasmbox
