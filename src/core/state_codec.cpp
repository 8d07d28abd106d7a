/**
 * @file state_codec.cpp
 * @brief Implementation of state load, sanitize and atomic commit
 *
 * @date 2025
 */

#include "wasmbox/core/state_codec.hpp"
#include "wasmbox/storage/workspace_store.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <fstream>
#include <optional>
#include <system_error>

namespace wasmbox {
namespace core {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

// Returns std::nullopt for values that must be dropped
std::optional<json> CleanValue(const json& value, int depth) {
    if (depth > StateCodec::kMaxDepth) {
        return std::nullopt;
    }

    switch (value.type()) {
        case json::value_t::null:
        case json::value_t::boolean:
        case json::value_t::string:
        case json::value_t::number_integer:
        case json::value_t::number_unsigned:
            return value;

        case json::value_t::number_float:
            if (!std::isfinite(value.get<double>())) {
                return std::nullopt;
            }
            return value;

        case json::value_t::array: {
            json out = json::array();
            for (const auto& item : value) {
                if (auto cleaned = CleanValue(item, depth + 1)) {
                    out.push_back(std::move(*cleaned));
                }
            }
            return out;
        }

        case json::value_t::object: {
            json out = json::object();
            for (auto it = value.begin(); it != value.end(); ++it) {
                if (auto cleaned = CleanValue(it.value(), depth + 1)) {
                    out[it.key()] = std::move(*cleaned);
                }
            }
            return out;
        }

        case json::value_t::binary:
        case json::value_t::discarded:
            return std::nullopt;
    }
    return std::nullopt;
}

std::optional<json> ParseFile(const fs::path& path, std::string& error) {
    std::ifstream file(path);
    if (!file.is_open()) {
        error = "unreadable";
        return std::nullopt;
    }

    json parsed = json::parse(file, nullptr, false);
    if (parsed.is_discarded()) {
        error = "invalid JSON";
        return std::nullopt;
    }
    return parsed;
}

} // anonymous namespace

json StateCodec::Sanitize(const json& value) {
    if (!value.is_object()) {
        return json::object();
    }
    auto cleaned = CleanValue(value, 0);
    return cleaned ? *cleaned : json::object();
}

json StateCodec::Load(const fs::path& workspace) {
    fs::path state_path = workspace / kStateFile;

    std::error_code ec;
    if (!fs::exists(state_path, ec)) {
        return json::object();
    }

    std::string error;
    auto parsed = ParseFile(state_path, error);
    if (!parsed) {
        spdlog::warn("StateCorruption: {} ({}), starting with empty state", state_path.string(), error);
        return json::object();
    }
    if (!parsed->is_object()) {
        spdlog::warn("StateCorruption: {} is not a JSON object, starting with empty state", state_path.string());
        return json::object();
    }

    return Sanitize(*parsed);
}

void StateCodec::Save(const fs::path& workspace, const json& state) {
    json sanitized = Sanitize(state);
    storage::AtomicWriteFile(workspace / kStateFile,
                             sanitized.dump(-1, ' ', false, json::error_handler_t::replace));
}

bool StateCodec::CommitPending(const fs::path& workspace) {
    fs::path pending_path = workspace / kPendingFile;

    std::error_code ec;
    if (!fs::exists(pending_path, ec)) {
        return false;
    }

    bool committed = false;
    std::string error;
    auto parsed = ParseFile(pending_path, error);

    if (!parsed) {
        spdlog::warn("Discarding pending state ({})", error);
    } else if (!parsed->is_object()) {
        spdlog::warn("Discarding pending state: top level is not an object");
    } else {
        Save(workspace, *parsed);
        committed = true;
        spdlog::debug("Committed session state ({} keys)", parsed->size());
    }

    DiscardPending(workspace);
    return committed;
}

void StateCodec::DiscardPending(const fs::path& workspace) {
    std::error_code ec;
    fs::remove(workspace / kPendingFile, ec);
    if (ec) {
        spdlog::warn("Failed to remove pending state file: {}", ec.message());
    }
}

} // namespace core
} // namespace wasmbox
