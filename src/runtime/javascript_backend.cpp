/**
 * @file javascript_backend.cpp
 * @brief QuickJS file helpers, state shim and failure detection
 *
 * @date 2025
 */

#include "wasmbox/runtime/javascript_backend.hpp"
#include "wasmbox/core/state_codec.hpp"
#include "wasmbox/utils/string_utils.hpp"

#include <cctype>
#include <sstream>

namespace wasmbox {
namespace runtime {

namespace {

using utils::StringUtils;

const char* const kFileHelpers = R"JS(var _wasmboxVendorCache = {};
function readText(path) { var t = std.loadFile(path); if (t === null) throw new Error('Cannot read file: ' + path); return t; }
function writeText(path, text) { var f = std.open(path, 'w'); if (!f) throw new Error('Cannot write file: ' + path); f.puts(String(text)); f.close(); }
function appendText(path, text) { var f = std.open(path, 'a'); if (!f) throw new Error('Cannot append to file: ' + path); f.puts(String(text)); f.close(); }
function readJson(path) { return JSON.parse(readText(path)); }
function writeJson(path, obj, indent) { writeText(path, JSON.stringify(obj, null, indent === undefined ? 2 : indent)); }
function fileExists(path) { return os.stat(path)[1] === 0; }
function listFiles(dir) { var d = dir === undefined ? '{MOUNT}' : dir; var r = os.readdir(d); if (r[1] !== 0) throw new Error('Cannot list directory: ' + d); return r[0].filter(function (n) { return n !== '.' && n !== '..'; }).sort(); }
function requireVendor(name) {
  if (Object.prototype.hasOwnProperty.call(_wasmboxVendorCache, name)) return _wasmboxVendorCache[name];
  var src = std.loadFile('{DATA}/vendor_js/' + name + '.js');
  if (src === null) throw new Error("Cannot find module '" + name + "' in {DATA}/vendor_js");
  var module = { exports: {} };
  (new Function('module', 'exports', src))(module, module.exports);
  _wasmboxVendorCache[name] = module.exports;
  return module.exports;
}
)JS";

const char* const kStateLoad = R"JS(var _state = (function () {
  var raw = std.loadFile('{MOUNT}/{STATE_FILE}');
  if (raw === null) return {};
  try {
    var v = JSON.parse(raw);
    return (v !== null && typeof v === 'object' && !Array.isArray(v)) ? v : {};
  } catch (e) { return {}; }
})();
)JS";

const char* const kStateSave = R"JS(
;(function () {
  function clean(value, depth) {
    if (depth > {MAX_DEPTH}) return undefined;
    if (value === null) return null;
    var t = typeof value;
    if (t === 'boolean' || t === 'string') return value;
    if (t === 'number') return isFinite(value) ? value : undefined;
    if (Array.isArray(value)) {
      var arr = [];
      for (var i = 0; i < value.length; i++) { var c = clean(value[i], depth + 1); if (c !== undefined) arr.push(c); }
      return arr;
    }
    if (t === 'object') {
      var proto = Object.getPrototypeOf(value);
      if (proto !== Object.prototype && proto !== null) return undefined;
      var out = {};
      Object.keys(value).forEach(function (k) { var c = clean(value[k], depth + 1); if (c !== undefined) out[k] = c; });
      return out;
    }
    return undefined;
  }
  var out = (typeof _state === 'object' && _state !== null && !Array.isArray(_state)) ? clean(_state, 0) : {};
  var f = std.open('{MOUNT}/{PENDING_FILE}', 'w');
  if (f) { f.puts(JSON.stringify(out === undefined ? {} : out)); f.close(); }
})();
)JS";

std::string Substitute(const std::string& text, const InjectionOptions& options) {
    std::string out = StringUtils::ReplaceAll(text, "{MOUNT}", options.guest_mount);
    out = StringUtils::ReplaceAll(out, "{DATA}", options.guest_data_path);
    out = StringUtils::ReplaceAll(out, "{STATE_FILE}", core::StateCodec::kStateFile);
    out = StringUtils::ReplaceAll(out, "{PENDING_FILE}", core::StateCodec::kPendingFile);
    out = StringUtils::ReplaceAll(out, "{MAX_DEPTH}", std::to_string(core::StateCodec::kMaxDepth));
    return out;
}

// "TypeError: ...", "InternalError: ..." at the start of a line
bool IsErrorHeadline(const std::string& line) {
    std::size_t colon = line.find(':');
    if (colon == std::string::npos || colon < 5) {
        return false;
    }
    std::string name = line.substr(0, colon);
    if (!StringUtils::EndsWith(name, "Error")) {
        return false;
    }
    for (char c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

} // anonymous namespace

JavaScriptBackend::JavaScriptBackend(std::filesystem::path artifact)
    : artifact_(std::move(artifact)) {
}

std::vector<std::string> JavaScriptBackend::BuildArgv(const std::string& guest_mount) const {
    return {"qjs", "--std", guest_mount + "/" + GetCodeFilename()};
}

ComposedProgram JavaScriptBackend::ComposeProgram(const std::string& user_code,
                                                  const InjectionOptions& options) const {
    std::string prologue;
    if (options.inject_setup) {
        prologue += Substitute(kFileHelpers, options);
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

bool JavaScriptBackend::StderrIndicatesFailure(const std::string& stderr_output) const {
    if (StringUtils::Contains(stderr_output, "at <eval>") ||
        StringUtils::Contains(stderr_output, "InternalError: out of memory")) {
        return true;
    }

    std::istringstream stream(stderr_output);
    std::string line;
    while (std::getline(stream, line)) {
        if (StringUtils::StartsWith(line, "Uncaught ") || IsErrorHeadline(line)) {
            return true;
        }
    }
    return false;
}

} // namespace runtime
} // namespace wasmbox
