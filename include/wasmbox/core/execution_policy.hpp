/**
 * @file execution_policy.hpp
 * @brief Resource limits and mount configuration applied to one execution
 *
 * A policy is plain data. It is validated on every execution, so callers may
 * change it between runs of the same sandbox.
 *
 * @date 2025
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace wasmbox {
namespace core {

/// WebAssembly linear memory page size
constexpr std::uint64_t kWasmPageSize = 65536;

/// Largest accepted fuel budget (the counter is a signed 64-bit global)
constexpr std::uint64_t kMaxFuelBudget = (std::uint64_t{1} << 62) - 1;

/**
 * @struct ReadOnlyMount
 * @brief Host directory exposed read-only at a fixed guest path
 */
struct ReadOnlyMount {
    std::filesystem::path host_path;   ///< Directory on the host
    std::string guest_path;            ///< Absolute guest path, e.g. "/external"
};

/**
 * @struct ExecutionPolicy
 * @brief Limits, mounts and invocation settings for a guest run
 *
 * **Defaults**:
 * - 2 billion instructions of fuel
 * - 128 MiB linear memory
 * - 2 MB stdout / 1 MB stderr
 * - no wall-clock timeout
 */
struct ExecutionPolicy {
    std::uint64_t fuel_budget{2'000'000'000};          ///< Instruction budget
    std::uint64_t memory_bytes{128ULL * 1024 * 1024};  ///< Linear memory ceiling (page aligned)
    std::uint64_t stdout_max_bytes{2'000'000};         ///< stdout capture cap
    std::uint64_t stderr_max_bytes{1'000'000};         ///< stderr capture cap
    std::optional<double> timeout;                     ///< Wall-clock limit in seconds

    std::string guest_mount_path{"/app"};              ///< Writable workspace mount
    std::optional<std::filesystem::path> mount_data_dir;  ///< Vendored data, read-only
    std::string guest_data_path{"/data"};              ///< Guest path of mount_data_dir
    std::vector<ReadOnlyMount> additional_readonly_mounts;

    std::vector<std::string> argv;                     ///< Overrides the backend argv when non-empty
    std::map<std::string, std::string> env{
        {"PYTHONUTF8", "1"},
        {"LC_ALL", "C.UTF-8"},
        {"PYTHONIOENCODING", "utf-8"},
        {"PYTHONHASHSEED", "0"},
    };
    bool inject_setup{true};                           ///< Prepend backend setup code

    /**
     * @brief Check every invariant
     * @throws HostSetupError describing the first violation
     */
    void Validate() const;

    /**
     * @brief Memory ceiling in wasm pages
     */
    std::uint32_t MemoryPages() const;

    /**
     * @brief Build a policy from JSON, starting from defaults
     *
     * Recognised keys: fuel_budget, memory_bytes, stdout_max_bytes,
     * stderr_max_bytes, timeout, guest_mount_path, mount_data_dir,
     * guest_data_path, additional_readonly_mounts ([{host_path, guest_path}]),
     * argv, env, inject_setup. Unknown keys are ignored.
     *
     * @throws HostSetupError on wrongly typed values or failed validation
     */
    static ExecutionPolicy FromJson(const nlohmann::json& j);

    /**
     * @brief Read a JSON policy file
     * @throws HostSetupError if the file is missing or malformed
     */
    static ExecutionPolicy LoadFromFile(const std::filesystem::path& file_path);

    /**
     * @brief Serialize to the same JSON shape FromJson accepts
     */
    nlohmann::json ToJson() const;
};

} // namespace core
} // namespace wasmbox
