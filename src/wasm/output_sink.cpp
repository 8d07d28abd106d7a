/**
 * @file output_sink.cpp
 * @brief Implementation of the capped output buffer
 *
 * @date 2025
 */

#include "wasmbox/wasm/output_sink.hpp"
#include "wasmbox/utils/string_utils.hpp"

#include <algorithm>

namespace wasmbox {
namespace wasm {

OutputSink::OutputSink(std::uint64_t max_bytes)
    : max_bytes_(max_bytes) {
}

void OutputSink::Write(const char* data, std::size_t length) {
    std::lock_guard<std::mutex> lock(mutex_);
    total_bytes_ += length;

    std::uint64_t room = max_bytes_ > data_.size() ? max_bytes_ - data_.size() : 0;
    std::size_t keep = static_cast<std::size_t>(std::min<std::uint64_t>(room, length));
    data_.append(data, keep);

    if (keep < length) {
        truncated_ = true;
    }
}

void OutputSink::AppendNotice(const std::string& notice) {
    std::lock_guard<std::mutex> lock(mutex_);
    notices_ += notice;
    notices_.push_back('\n');
}

std::string OutputSink::GetContents() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string contents = truncated_ ? utils::StringUtils::TrimIncompleteUtf8(data_) : data_;
    if (notices_.empty()) {
        return contents;
    }
    if (!contents.empty() && contents.back() != '\n') {
        contents.push_back('\n');
    }
    return contents + notices_;
}

bool OutputSink::IsTruncated() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return truncated_;
}

std::uint64_t OutputSink::GetTotalBytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_bytes_;
}

} // namespace wasm
} // namespace wasmbox
