/**
 * @file runtime_type.cpp
 * @date 2025
 */

#include "wasmbox/runtime/runtime_type.hpp"
#include "wasmbox/utils/string_utils.hpp"

namespace wasmbox {
namespace runtime {

std::string RuntimeTypeToString(RuntimeType type) {
    switch (type) {
        case RuntimeType::PYTHON: return "python";
        case RuntimeType::JAVASCRIPT: return "javascript";
        default: return "unknown";
    }
}

std::optional<RuntimeType> ParseRuntimeType(const std::string& name) {
    std::string lower = utils::StringUtils::ToLower(utils::StringUtils::Trim(name));

    if (lower == "python" || lower == "py") {
        return RuntimeType::PYTHON;
    }
    if (lower == "javascript" || lower == "js") {
        return RuntimeType::JAVASCRIPT;
    }
    return std::nullopt;
}

} // namespace runtime
} // namespace wasmbox
