/**
 * @file python_backend.cpp
 * @brief CPython setup, state shim and failure detection
 *
 * @date 2025
 */

#include "wasmbox/runtime/python_backend.hpp"
#include "wasmbox/core/state_codec.hpp"
#include "wasmbox/utils/string_utils.hpp"

namespace wasmbox {
namespace runtime {

namespace {

using utils::StringUtils;

// {DATA} and {MOUNT} are substituted with the guest mount points
const char* const kPathSetup = R"PY(import sys as _wasmbox_sys
for _wasmbox_p in ('{DATA}/site-packages', '{MOUNT}/site-packages'):
    if _wasmbox_p not in _wasmbox_sys.path:
        _wasmbox_sys.path.insert(0, _wasmbox_p)
del _wasmbox_p
)PY";

const char* const kStateLoad = R"PY(import json as _wasmbox_json
class _WasmboxState(dict):
    def __getattr__(self, key):
        if key.startswith('__'):
            raise AttributeError(key)
        return self.get(key)
    def __setattr__(self, key, value):
        self[key] = value
    def __delattr__(self, key):
        self.pop(key, None)
def _wasmbox_load_state():
    try:
        with open('{MOUNT}/{STATE_FILE}', encoding='utf-8') as _f:
            _data = _wasmbox_json.load(_f)
    except Exception:
        return _WasmboxState()
    return _WasmboxState(_data) if isinstance(_data, dict) else _WasmboxState()
_state = _wasmbox_load_state()
)PY";

const char* const kStateSave = R"PY(
_WASMBOX_DROP = object()
def _wasmbox_clean(value, depth=0):
    if depth > {MAX_DEPTH}:
        return _WASMBOX_DROP
    if value is None or isinstance(value, (bool, int, str)):
        return value
    if isinstance(value, float):
        if value != value or value in (float('inf'), float('-inf')):
            return _WASMBOX_DROP
        return value
    if isinstance(value, (list, tuple)):
        out = []
        for item in value:
            cleaned = _wasmbox_clean(item, depth + 1)
            if cleaned is not _WASMBOX_DROP:
                out.append(cleaned)
        return out
    if isinstance(value, dict):
        out = {}
        for key, item in value.items():
            if not isinstance(key, str):
                continue
            cleaned = _wasmbox_clean(item, depth + 1)
            if cleaned is not _WASMBOX_DROP:
                out[key] = cleaned
        return out
    return _WASMBOX_DROP
_wasmbox_out = _wasmbox_clean(dict(_state)) if isinstance(_state, dict) else {}
with open('{MOUNT}/{PENDING_FILE}', 'w', encoding='utf-8') as _f:
    _wasmbox_json.dump(_wasmbox_out, _f)
)PY";

std::string Substitute(const std::string& text, const InjectionOptions& options) {
    std::string out = StringUtils::ReplaceAll(text, "{MOUNT}", options.guest_mount);
    out = StringUtils::ReplaceAll(out, "{DATA}", options.guest_data_path);
    out = StringUtils::ReplaceAll(out, "{STATE_FILE}", core::StateCodec::kStateFile);
    out = StringUtils::ReplaceAll(out, "{PENDING_FILE}", core::StateCodec::kPendingFile);
    out = StringUtils::ReplaceAll(out, "{MAX_DEPTH}", std::to_string(core::StateCodec::kMaxDepth));
    return out;
}

} // anonymous namespace

PythonBackend::PythonBackend(std::filesystem::path artifact)
    : artifact_(std::move(artifact)) {
}

std::vector<std::string> PythonBackend::BuildArgv(const std::string& guest_mount) const {
    return {"python", "-I", guest_mount + "/" + GetCodeFilename(), "-X", "utf8"};
}

ComposedProgram PythonBackend::ComposeProgram(const std::string& user_code,
                                              const InjectionOptions& options) const {
    std::string prologue;
    if (options.inject_setup) {
        prologue += Substitute(kPathSetup, options);
    }
    if (options.auto_persist) {
        prologue += Substitute(kStateLoad, options);
    }

    ComposedProgram program;
    program.prologue_lines = CountPrologueLines(prologue);
    program.source = prologue + user_code;

    if (options.auto_persist) {
        if (!program.source.empty() && program.source.back() != '\n') {
            program.source.push_back('\n');
        }
        program.source += Substitute(kStateSave, options);
    }
    return program;
}

bool PythonBackend::StderrIndicatesFailure(const std::string& stderr_output) const {
    return StringUtils::Contains(stderr_output, "Traceback (most recent call last)") ||
           StringUtils::Contains(stderr_output, "MemoryError");
}

} // namespace runtime
} // namespace wasmbox
