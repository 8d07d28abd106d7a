/**
 * @file execution_result.cpp
 * @brief FailureKind naming
 *
 * @date 2025
 */

#include "wasmbox/core/execution_result.hpp"

namespace wasmbox {
namespace core {

std::string FailureKindToString(FailureKind kind) {
    switch (kind) {
        case FailureKind::NONE: return "None";
        case FailureKind::OUT_OF_FUEL: return "OutOfFuel";
        case FailureKind::OUT_OF_MEMORY: return "OutOfMemory";
        case FailureKind::TIMEOUT: return "Timeout";
        case FailureKind::GUEST_RUNTIME_ERROR: return "GuestRuntimeError";
    }
    return "Unknown";
}

} // namespace core
} // namespace wasmbox
