/**
 * @file errors.hpp
 * @brief Exception hierarchy for host-side failures
 *
 * Only host setup problems and path escapes are thrown. Everything a guest
 * does wrong (fuel, memory, timeout, uncaught errors) is reported inside an
 * ExecutionResult instead.
 *
 * @date 2025
 */

#pragma once

#include <stdexcept>
#include <string>

namespace wasmbox {
namespace core {

/**
 * @class WasmboxError
 * @brief Common base of every exception thrown by the library
 */
class WasmboxError : public std::runtime_error {
public:
    explicit WasmboxError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @class HostSetupError
 * @brief Invalid policy, missing artifact, unusable workspace or bad module
 *
 * Raised synchronously before the guest is instantiated.
 */
class HostSetupError : public WasmboxError {
public:
    explicit HostSetupError(const std::string& message)
        : WasmboxError(message) {}
};

/**
 * @class PathTraversalError
 * @brief A session id or relative path would leave its workspace
 */
class PathTraversalError : public WasmboxError {
public:
    explicit PathTraversalError(const std::string& message)
        : WasmboxError(message) {}
};

} // namespace core
} // namespace wasmbox
