/**
 * @file test_helpers.hpp
 * @brief Shared fixtures for the wasmbox test suites
 *
 * - TempDir: a scratch directory removed on destruction
 * - WasmModuleBuilder: assembles tiny WASI modules from raw opcodes so the
 *   engine can be tested without the CPython or QuickJS artifacts
 *
 * @date 2025
 */

#pragma once

#include "wasmbox/utils/hash_utils.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <iterator>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace wasmbox {
namespace testing {

/**
 * @class TempDir
 * @brief Unique directory under the system temp dir
 */
class TempDir {
public:
    TempDir()
        : path_(std::filesystem::temp_directory_path() /
                ("wasmbox-test-" + utils::HashUtils::GenerateRandomHex(8))) {
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& Path() const { return path_; }

    std::filesystem::path Write(const std::string& relative, const std::string& contents) const {
        auto target = path_ / relative;
        std::filesystem::create_directories(target.parent_path());
        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        out << contents;
        return target;
    }

    std::string Read(const std::string& relative) const {
        std::ifstream in(path_ / relative, std::ios::binary);
        return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    }

private:
    std::filesystem::path path_;
};

/// Value types
constexpr std::uint8_t kI32 = 0x7F;
constexpr std::uint8_t kI64 = 0x7E;

/**
 * @class WasmModuleBuilder
 * @brief Minimal WebAssembly 1.0 binary assembler
 *
 * Function indices count imports first, so import everything before adding
 * functions. Bodies are raw expression bytes ending in `end` (0x0B).
 */
class WasmModuleBuilder {
public:
    std::uint32_t AddType(const std::vector<std::uint8_t>& params, const std::vector<std::uint8_t>& results) {
        std::vector<std::uint8_t> entry{0x60};
        WriteU32(entry, static_cast<std::uint32_t>(params.size()));
        entry.insert(entry.end(), params.begin(), params.end());
        WriteU32(entry, static_cast<std::uint32_t>(results.size()));
        entry.insert(entry.end(), results.begin(), results.end());
        types_.push_back(entry);
        return static_cast<std::uint32_t>(types_.size() - 1);
    }

    std::uint32_t ImportWasi(const std::string& name, std::uint32_t type_index) {
        std::vector<std::uint8_t> entry;
        WriteName(entry, "wasi_snapshot_preview1");
        WriteName(entry, name);
        entry.push_back(0x00);
        WriteU32(entry, type_index);
        imports_.push_back(entry);
        return static_cast<std::uint32_t>(imports_.size() - 1);
    }

    /**
     * @param locals Local declarations as (count, type) pairs
     */
    std::uint32_t AddFunction(std::uint32_t type_index,
                              const std::vector<std::pair<std::uint32_t, std::uint8_t>>& locals,
                              const std::vector<std::uint8_t>& body) {
        function_types_.push_back(type_index);
        std::vector<std::uint8_t> code;
        WriteU32(code, static_cast<std::uint32_t>(locals.size()));
        for (const auto& [count, type] : locals) {
            WriteU32(code, count);
            code.push_back(type);
        }
        code.insert(code.end(), body.begin(), body.end());
        bodies_.push_back(code);
        return static_cast<std::uint32_t>(imports_.size() + bodies_.size() - 1);
    }

    void SetMemory(std::uint32_t min_pages, std::optional<std::uint32_t> max_pages = std::nullopt) {
        memory_min_ = min_pages;
        memory_max_ = max_pages;
        has_memory_ = true;
    }

    void ExportFunction(const std::string& name, std::uint32_t index) {
        std::vector<std::uint8_t> entry;
        WriteName(entry, name);
        entry.push_back(0x00);
        WriteU32(entry, index);
        exports_.push_back(entry);
    }

    void ExportMemory(const std::string& name) {
        std::vector<std::uint8_t> entry;
        WriteName(entry, name);
        entry.push_back(0x02);
        WriteU32(entry, 0);
        exports_.push_back(entry);
    }

    void AddData(std::uint32_t offset, const std::string& bytes) {
        std::vector<std::uint8_t> entry{0x00, 0x41};
        WriteS32(entry, static_cast<std::int32_t>(offset));
        entry.push_back(0x0B);
        WriteU32(entry, static_cast<std::uint32_t>(bytes.size()));
        entry.insert(entry.end(), bytes.begin(), bytes.end());
        data_.push_back(entry);
    }

    std::vector<std::uint8_t> Build() const {
        std::vector<std::uint8_t> out{0x00, 0x61, 0x73, 0x6D, 0x01, 0x00, 0x00, 0x00};
        AppendVectorSection(out, 1, types_);
        AppendVectorSection(out, 2, imports_);
        if (!function_types_.empty()) {
            std::vector<std::vector<std::uint8_t>> entries;
            for (auto type : function_types_) {
                std::vector<std::uint8_t> entry;
                WriteU32(entry, type);
                entries.push_back(entry);
            }
            AppendVectorSection(out, 3, entries);
        }
        if (has_memory_) {
            std::vector<std::uint8_t> limits{static_cast<std::uint8_t>(memory_max_ ? 0x01 : 0x00)};
            WriteU32(limits, memory_min_);
            if (memory_max_) {
                WriteU32(limits, *memory_max_);
            }
            AppendVectorSection(out, 5, {limits});
        }
        AppendVectorSection(out, 7, exports_);
        if (!bodies_.empty()) {
            std::vector<std::vector<std::uint8_t>> entries;
            for (const auto& body : bodies_) {
                std::vector<std::uint8_t> entry;
                WriteU32(entry, static_cast<std::uint32_t>(body.size()));
                entry.insert(entry.end(), body.begin(), body.end());
                entries.push_back(entry);
            }
            AppendVectorSection(out, 10, entries);
        }
        AppendVectorSection(out, 11, data_);
        return out;
    }

    static void WriteU32(std::vector<std::uint8_t>& out, std::uint32_t value) {
        do {
            std::uint8_t byte = value & 0x7F;
            value >>= 7;
            if (value != 0) {
                byte |= 0x80;
            }
            out.push_back(byte);
        } while (value != 0);
    }

    static void WriteS32(std::vector<std::uint8_t>& out, std::int32_t value) {
        bool more = true;
        while (more) {
            std::uint8_t byte = value & 0x7F;
            value >>= 7;
            bool sign_bit = (byte & 0x40) != 0;
            if ((value == 0 && !sign_bit) || (value == -1 && sign_bit)) {
                more = false;
            } else {
                byte |= 0x80;
            }
            out.push_back(byte);
        }
    }

    /// `i32.const value`
    static std::vector<std::uint8_t> I32Const(std::int32_t value) {
        std::vector<std::uint8_t> out{0x41};
        WriteS32(out, value);
        return out;
    }

private:
    static void WriteName(std::vector<std::uint8_t>& out, const std::string& name) {
        WriteU32(out, static_cast<std::uint32_t>(name.size()));
        out.insert(out.end(), name.begin(), name.end());
    }

    static void AppendVectorSection(std::vector<std::uint8_t>& out, std::uint8_t id,
                                    const std::vector<std::vector<std::uint8_t>>& entries) {
        if (entries.empty()) {
            return;
        }
        std::vector<std::uint8_t> payload;
        WriteU32(payload, static_cast<std::uint32_t>(entries.size()));
        for (const auto& entry : entries) {
            payload.insert(payload.end(), entry.begin(), entry.end());
        }
        out.push_back(id);
        WriteU32(out, static_cast<std::uint32_t>(payload.size()));
        out.insert(out.end(), payload.begin(), payload.end());
    }

    std::vector<std::vector<std::uint8_t>> types_;
    std::vector<std::vector<std::uint8_t>> imports_;
    std::vector<std::uint32_t> function_types_;
    std::vector<std::vector<std::uint8_t>> bodies_;
    std::vector<std::vector<std::uint8_t>> exports_;
    std::vector<std::vector<std::uint8_t>> data_;
    bool has_memory_{false};
    std::uint32_t memory_min_{0};
    std::optional<std::uint32_t> memory_max_;
};

/// Concatenate opcode fragments
inline std::vector<std::uint8_t> Concat(std::initializer_list<std::vector<std::uint8_t>> parts) {
    std::vector<std::uint8_t> out;
    for (const auto& part : parts) {
        out.insert(out.end(), part.begin(), part.end());
    }
    return out;
}

} // namespace testing
} // namespace wasmbox
