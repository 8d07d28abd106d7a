/**
 * @file state_codec.hpp
 * @brief Session state persistence for the reserved `_state` container
 *
 * State is a JSON object stored in `.session_state.json` inside the
 * workspace. The guest reads it at startup and writes a pending copy at
 * teardown; the host filters the pending copy and commits it atomically.
 *
 * **Guarantees**:
 * - Absent or corrupt state loads as `{}` (logged, never thrown)
 * - The committed file is always complete JSON or absent
 * - Only JSON-representable values survive Sanitize
 *
 * @date 2025
 */

#pragma once

#include <filesystem>

#include <nlohmann/json.hpp>

namespace wasmbox {
namespace core {

class StateCodec {
public:
    static constexpr const char* kStateFile = ".session_state.json";
    static constexpr const char* kPendingFile = ".session_state.pending.json";
    static constexpr const char* kContainerName = "_state";

    /// Nesting deeper than this is dropped
    static constexpr int kMaxDepth = 64;

    /**
     * @brief Load persisted state
     * @return The stored object, or an empty object if absent or corrupt
     */
    static nlohmann::json Load(const std::filesystem::path& workspace);

    /**
     * @brief Sanitize and write state atomically
     * @throws std::runtime_error on I/O failure
     */
    static void Save(const std::filesystem::path& workspace, const nlohmann::json& state);

    /**
     * @brief Keep only JSON-representable values
     *
     * Drops non-finite numbers, binary values, discarded values and anything
     * nested deeper than kMaxDepth. A non-object top level becomes `{}`.
     */
    static nlohmann::json Sanitize(const nlohmann::json& value);

    /**
     * @brief Promote the guest's pending file to the committed state
     *
     * A missing pending file leaves state untouched. A pending file that is
     * not a JSON object is discarded with a warning. The pending file is
     * always removed.
     *
     * @return true if new state was committed
     */
    static bool CommitPending(const std::filesystem::path& workspace);

    /**
     * @brief Remove a leftover pending file from an earlier run
     */
    static void DiscardPending(const std::filesystem::path& workspace);
};

} // namespace core
} // namespace wasmbox
