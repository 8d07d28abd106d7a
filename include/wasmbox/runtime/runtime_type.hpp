/**
 * @file runtime_type.hpp
 * @brief Guest language selector
 *
 * @date 2025
 */

#pragma once

#include <optional>
#include <string>

namespace wasmbox {
namespace runtime {

/**
 * @enum RuntimeType
 * @brief Guest language of a sandbox
 */
enum class RuntimeType {
    PYTHON,       ///< CPython compiled to WASI
    JAVASCRIPT    ///< QuickJS compiled to WASI
};

/**
 * @brief "python" or "javascript"
 */
std::string RuntimeTypeToString(RuntimeType type);

/**
 * @brief Parse a language name (case-insensitive; "js" and "py" accepted)
 * @return std::nullopt for unknown names
 */
std::optional<RuntimeType> ParseRuntimeType(const std::string& name);

} // namespace runtime
} // namespace wasmbox
