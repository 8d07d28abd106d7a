/**
 * @file module_instrumenter.hpp
 * @brief WebAssembly bytecode rewriting for fuel metering and memory ceilings
 *
 * The interpreter has no built-in instruction budget, so the guest module is
 * rewritten before loading:
 *
 * - A mutable i64 global is appended and exported as `__wasmbox_fuel`.
 * - Every metered segment starts with a charge of the segment's instruction
 *   count. Segments begin at function entry and after every
 *   block/loop/if/else/end, br_if and other control transfer.
 * - When the counter drops below zero the guest executes `unreachable`.
 * - The memory section's maximum is clamped to the policy ceiling.
 *
 * **Injected charge** (g = fuel global, c = segment cost):
 * @code
 * global.get g  i64.const c  i64.sub  global.set g
 * global.get g  i64.const 0  i64.lt_s
 * if  unreachable  end
 * @endcode
 *
 * The rewrite is deterministic: identical input yields identical output,
 * and an identical program consumes identical fuel.
 *
 * @date 2025
 */

#pragma once

#include "wasmbox/core/errors.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace wasmbox {
namespace wasm {

/**
 * @class InstrumentationError
 * @brief The module is malformed or uses an unsupported encoding
 */
class InstrumentationError : public core::HostSetupError {
public:
    explicit InstrumentationError(const std::string& message)
        : core::HostSetupError("Module instrumentation failed: " + message) {}
};

/**
 * @struct InstrumentedModule
 * @brief Rewritten module bytes and what the rewrite found
 */
struct InstrumentedModule {
    std::vector<std::uint8_t> bytes;
    std::uint32_t fuel_global_index{0};
    bool has_memory{false};
    std::uint32_t initial_memory_pages{0};
    std::uint32_t max_memory_pages{0};         ///< After clamping
    bool initial_exceeds_ceiling{false};       ///< Module cannot run under the ceiling
    bool has_start_section{false};
    std::size_t function_count{0};
    std::size_t metered_segments{0};
};

/**
 * @class ModuleInstrumenter
 * @brief Rewrites a wasm binary for metering
 *
 * **Usage Example**:
 * @code
 * ModuleInstrumenter instrumenter;
 * auto result = instrumenter.Instrument(bytes, policy.MemoryPages());
 * // load result.bytes, then set the exported fuel global to the budget
 * @endcode
 */
class ModuleInstrumenter {
public:
    /**
     * @struct Config
     */
    struct Config {
        std::string fuel_export_name{"__wasmbox_fuel"};   ///< Export name of the counter
    };

    explicit ModuleInstrumenter(const Config& config);
    explicit ModuleInstrumenter();

    /**
     * @brief Instrument a module
     * @param module Original wasm binary
     * @param memory_max_pages Linear memory ceiling in pages
     * @throws InstrumentationError for malformed or unsupported input
     */
    InstrumentedModule Instrument(const std::vector<std::uint8_t>& module,
                                  std::uint32_t memory_max_pages) const;

    const Config& GetConfig() const { return config_; }

private:
    Config config_;
};

/***************************************************************************
 * LEB128 encoding (shared with tests that assemble modules)
 ***************************************************************************/

void WriteVarU32(std::vector<std::uint8_t>& out, std::uint32_t value);
void WriteVarS64(std::vector<std::uint8_t>& out, std::int64_t value);

} // namespace wasm
} // namespace wasmbox
