/**
 * @file output_sink.hpp
 * @brief Byte-capped capture buffer for guest stdout/stderr
 *
 * Keeps the first max_bytes bytes written (head truncation) and flags any
 * loss. Writes beyond the cap are counted but not stored, so the guest never
 * sees a short write. Host notices are kept apart from guest bytes: they are
 * not counted against the cap and never set the truncation flag.
 *
 * @date 2025
 */

#pragma once

#include <cstdint>
#include <mutex>
#include <string>

namespace wasmbox {
namespace wasm {

class OutputSink {
public:
    explicit OutputSink(std::uint64_t max_bytes);

    /**
     * @brief Append bytes, keeping at most max_bytes in total
     */
    void Write(const char* data, std::size_t length);

    /**
     * @brief Append a host notice (e.g. a trap message) on its own line
     *
     * Notices follow all guest output in GetContents().
     */
    void AppendNotice(const std::string& notice);

    /**
     * @brief Captured guest text, trailing partial UTF-8 removed, then notices
     */
    std::string GetContents() const;

    bool IsTruncated() const;
    std::uint64_t GetTotalBytes() const;
    std::uint64_t GetMaxBytes() const { return max_bytes_; }

private:
    const std::uint64_t max_bytes_;
    mutable std::mutex mutex_;
    std::string data_;
    std::string notices_;
    std::uint64_t total_bytes_{0};
    bool truncated_{false};
};

} // namespace wasm
} // namespace wasmbox
