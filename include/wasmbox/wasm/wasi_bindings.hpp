/**
 * @file wasi_bindings.hpp
 * @brief Links WasiHost into a wasm3 module
 *
 * The runtime's user data must point at the WasiHost serving the run
 * (pass it as the last argument of m3_NewRuntime).
 *
 * @date 2025
 */

#pragma once

#include "wasm3.h"

namespace wasmbox {
namespace wasm {

/**
 * @brief Resolve WASI imports of a loaded module
 *
 * Links every preview1 function under both "wasi_snapshot_preview1" and
 * "wasi_unstable". Imports the module does not declare are skipped.
 *
 * @return m3Err_none on success, otherwise the wasm3 error
 */
M3Result LinkWasi(IM3Module module);

} // namespace wasm
} // namespace wasmbox
