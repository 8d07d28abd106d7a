/**
 * @file error_guidance.cpp
 * @brief Implementation of failure classification and guidance templates
 *
 * @date 2025
 */

#include "wasmbox/analyzers/error_guidance.hpp"
#include "wasmbox/utils/string_utils.hpp"

#include <algorithm>
#include <regex>
#include <sstream>

namespace wasmbox {
namespace analyzers {

using core::CodeExample;
using core::ErrorGuidance;
using utils::StringUtils;

namespace {

// ============================================================================
// TEMPLATES
// ============================================================================

ErrorGuidance OutOfFuelGuidance(std::uint64_t consumed, std::uint64_t budget,
                                const std::vector<std::string>& packages) {
    ErrorGuidance g;
    g.error_type = "OutOfFuel";
    g.actionable_guidance = {
        "Code execution exceeded the fuel budget (instruction limit).",
        "This typically occurs with:",
        "  - Heavy package imports (openpyxl: 5-7B, PyPDF2: 5-6B, jinja2: 5-10B fuel on first import)",
        "  - Large dataset processing (loops over big files/arrays)",
        "  - Infinite loops or very deep recursion",
    };

    if (!packages.empty()) {
        g.actionable_guidance.push_back("Detected heavy package(s): " + StringUtils::Join(packages, ", "));
        g.actionable_guidance.push_back("These packages require higher fuel budgets on first import (5-10B).");
        g.actionable_guidance.push_back(
            "Subsequent imports in the same session are cached and use minimal fuel (<100M).");
    }

    g.actionable_guidance.insert(g.actionable_guidance.end(), {
        "Solutions:",
        "1. Increase fuel_budget for the session or the call:",
        "   - For heavy packages: Use 10B+ for first import, 2B+ for subsequent executions",
        "   - For large datasets: Estimate ~1B fuel per 100K loop iterations",
        "2. Use a persistent session to cache imports across executions",
        "3. Optimize code: reduce loop iterations, use generators instead of loading full datasets",
    });

    if (budget > 0) {
        std::string line = consumed > 0
            ? "Concrete recommendation: Increase fuel_budget from " + StringUtils::FormatThousands(budget) +
              " to " + StringUtils::FormatThousands(budget * 2) + " instructions"
            : "Concrete recommendation: Increase fuel_budget to " + StringUtils::FormatThousands(budget * 2) +
              " instructions";
        g.actionable_guidance.push_back(line);
    }

    g.code_examples.push_back(CodeExample{
        "{\"fuel_budget\": 2000000000}",
        "{\"fuel_budget\": 10000000000}",
        "Increase fuel budget for package imports or large computations"});
    return g;
}

ErrorGuidance MemoryExhaustedGuidance(std::uint64_t memory_limit) {
    ErrorGuidance g;
    g.error_type = "MemoryExhausted";
    g.actionable_guidance = {
        "Code execution exceeded the memory limit (linear memory cap).",
        "This typically occurs with:",
        "  - Loading large files entirely into memory (multi-MB datasets)",
        "  - Creating large data structures (big arrays, nested objects)",
        "  - Memory leaks in long-running computations",
        "Solutions:",
        "1. Increase memory_bytes for the session or the call:",
        "   - Default: 128 MB (sufficient for most tasks)",
        "   - Large files: 256-512 MB",
        "   - Very large datasets: 1 GB+",
        "2. Process data in chunks instead of loading entire files",
        "3. Use generators/iterators to avoid materializing full datasets",
        "4. Clear large objects after use: del large_array",
    };

    if (memory_limit > 0) {
        g.actionable_guidance.push_back("Concrete recommendation: Increase memory_bytes from " +
                                        StringUtils::FormatThousands(memory_limit) + " to " +
                                        StringUtils::FormatThousands(memory_limit * 2) + " bytes");
    }

    g.code_examples.push_back(CodeExample{
        "data = open('/app/big.csv').read()",
        "with open('/app/big.csv') as f:\n    for line in f:\n        process(line)",
        "Stream large files instead of reading them whole"});
    return g;
}

ErrorGuidance TimeoutGuidance(double timeout_seconds) {
    ErrorGuidance g;
    g.error_type = "Timeout";
    g.actionable_guidance = {
        "Code execution exceeded the wall-clock timeout.",
        "This typically occurs with:",
        "  - Long sleeps or waits inside the guest",
        "  - Very large computations that stay within the fuel budget",
        "Solutions:",
        "1. Increase the timeout, or leave it unset and rely on the fuel budget",
        "2. Split the work across several executions in the same session",
    };
    if (timeout_seconds > 0.0) {
        std::ostringstream oss;
        oss << "Configured timeout: " << timeout_seconds << " s";
        g.actionable_guidance.push_back(oss.str());
    }
    return g;
}

ErrorGuidance PathRestrictionGuidance(const std::string& path) {
    ErrorGuidance g;
    g.error_type = "PathRestriction";
    g.actionable_guidance = {
        "File access failed due to WASI capability-based isolation.",
        "The sandbox only has access to files within the /app directory (workspace).",
        "Absolute paths and attempts to access parent directories (..) are blocked.",
        "Detected invalid path: " + path,
        "Solutions:",
        "1. Use relative paths within /app (e.g., 'data.txt' instead of '/etc/passwd')",
        "2. Place input files in the workspace directory before execution",
        "3. Use /app/ prefix for absolute paths: '/app/data.txt' (not '/data.txt')",
        "4. For secondary data mounts, use the configured guest_data_path (default: /data)",
    };
    g.code_examples.push_back(CodeExample{
        "with open('" + path + "', 'r') as f:",
        "with open('/app/data.txt', 'r') as f:",
        "Use /app prefix or relative paths within workspace"});
    return g;
}

ErrorGuidance MissingVendoredPackageGuidance(const std::string& package) {
    ErrorGuidance g;
    g.error_type = "MissingVendoredPackage";
    g.actionable_guidance = {
        "ModuleNotFoundError for a vendored package indicates sys.path is not configured.",
        "Vendored Python packages live in /data/site-packages and are added to sys.path",
        "only when setup injection is enabled.",
        "Missing package: " + package,
        "Solutions:",
        "1. Enable setup injection, or add sys.path configuration at the start of your code:",
        "   import sys",
        "   sys.path.insert(0, '/data/site-packages')",
        "2. Then import the package normally",
    };
    if (package == "openpyxl" || package == "PyPDF2" || package == "jinja2") {
        g.actionable_guidance.push_back("Note: " + package +
                                        " requires 5-10B fuel on first import. Increase fuel_budget if needed.");
    }
    g.code_examples.push_back(CodeExample{
        "import " + package,
        "import sys\nsys.path.insert(0, '/data/site-packages')\nimport " + package,
        "Add vendored packages to sys.path before importing"});
    return g;
}

ErrorGuidance QuickJsTupleGuidance(std::optional<int> line) {
    ErrorGuidance g;
    g.error_type = "QuickJSTupleDestructuring";
    g.actionable_guidance = {
        "QuickJS helper functions return arrays, not destructuring-compatible tuples.",
        "JavaScript array destructuring syntax works, but Python-style tuple unpacking does not.",
        "This is a known limitation of the QuickJS std/os modules.",
    };
    if (line) {
        g.actionable_guidance.push_back("Problematic code: line " + std::to_string(*line));
    }
    g.actionable_guidance.insert(g.actionable_guidance.end(), {
        "Solutions:",
        "1. Use array destructuring: const [entries, err] = os.readdir('/app');",
        "2. Use array indexing: const r = os.readdir('/app'); const entries = r[0];",
    });
    g.code_examples.push_back(CodeExample{
        "const (status, data) = os.stat('/app/file.txt');",
        "const [status, data] = os.stat('/app/file.txt');",
        "Use array destructuring syntax, not tuple syntax"});
    g.failing_line = line;
    return g;
}

ErrorGuidance MissingRequireVendorGuidance(const std::string& package) {
    ErrorGuidance g;
    g.error_type = "MissingRequireVendor";
    g.actionable_guidance = {
        "Vendored JavaScript packages must be loaded via requireVendor(), not require().",
        "They live in /data/vendor_js and are not on any module search path.",
        "Missing package: " + package,
        "Solutions:",
        "1. Use requireVendor() for vendored packages:",
        "   const pkg = requireVendor('" + package + "');",
        "2. Make sure setup injection is enabled so requireVendor is defined",
    };
    g.code_examples.push_back(CodeExample{
        "const pkg = require('" + package + "');",
        "const pkg = requireVendor('" + package + "');",
        "Use requireVendor() for vendored packages"});
    return g;
}

ErrorGuidance ParseErrorGuidance(runtime::RuntimeType language, std::optional<int> line,
                                 const std::string& message) {
    ErrorGuidance g;
    g.error_type = "ParseError";
    g.actionable_guidance.push_back(language == runtime::RuntimeType::PYTHON
                                        ? "The Python code could not be parsed."
                                        : "The JavaScript code could not be parsed.");
    if (!message.empty()) {
        g.actionable_guidance.push_back("Error: " + message);
    }
    if (line) {
        g.actionable_guidance.push_back("Check line " + std::to_string(*line) + " of your code.");
    }
    g.actionable_guidance.push_back(language == runtime::RuntimeType::PYTHON
                                        ? "Look for unbalanced brackets, missing colons and inconsistent indentation."
                                        : "Look for unbalanced brackets, missing commas and unsupported syntax.");
    g.failing_line = line;
    return g;
}

ErrorGuidance RuntimeErrorGuidance(std::optional<int> line, const std::string& message) {
    ErrorGuidance g;
    g.error_type = "RuntimeError";
    g.actionable_guidance.push_back("The code raised an uncaught error.");
    if (!message.empty()) {
        g.actionable_guidance.push_back("Error: " + message);
    }
    if (line) {
        g.actionable_guidance.push_back("The error was raised at line " + std::to_string(*line) + " of your code.");
    }
    g.actionable_guidance.push_back("Read the last line of stderr for the error type and message.");
    g.failing_line = line;
    return g;
}

// ============================================================================
// STDERR HELPERS
// ============================================================================

// Last "Name: message" line of a Python traceback
std::string LastErrorLine(const std::string& sample) {
    static const std::regex error_line(R"((?:^|\n)([A-Za-z_][A-Za-z0-9_.]*(?:Error|Exception|Exit|Interrupt)(?::[^\n]*)?))");
    std::string last;
    for (auto it = std::sregex_iterator(sample.begin(), sample.end(), error_line);
         it != std::sregex_iterator(); ++it) {
        last = (*it)[1].str();
    }
    return StringUtils::Trim(last);
}

// First "XxxError: message" line from QuickJS
std::string FirstErrorLine(const std::string& sample) {
    static const std::regex error_line(R"((?:^|\n)(?:Uncaught )?([A-Za-z]*Error(?::[^\n]*)?))");
    std::smatch match;
    if (std::regex_search(sample, match, error_line)) {
        return StringUtils::Trim(match[1].str());
    }
    return "";
}

} // anonymous namespace

// ============================================================================
// PUBLIC API
// ============================================================================

const std::vector<std::string>& ErrorGuidanceBuilder::VendoredPythonPackages() {
    static const std::vector<std::string> packages = {
        "openpyxl", "xlsxwriter", "pypdf2", "odfpy", "mammoth",
        "tabulate", "jinja2", "markdown", "dateutil", "attrs",
    };
    return packages;
}

const std::vector<std::string>& ErrorGuidanceBuilder::VendoredJavaScriptPackages() {
    static const std::vector<std::string> packages = {"csv-simple", "string-utils", "json-utils"};
    return packages;
}

std::optional<int> ErrorGuidanceBuilder::ExtractUserLine(const std::string& stderr_output,
                                                         runtime::RuntimeType language, int prologue_lines) {
    std::optional<int> guest_line;

    if (language == runtime::RuntimeType::PYTHON) {
        // Innermost user frame is the last one that names user_code.py
        static const std::regex frame(R"(File "[^"]*user_code\.py", line (\d+))");
        for (auto it = std::sregex_iterator(stderr_output.begin(), stderr_output.end(), frame);
             it != std::sregex_iterator(); ++it) {
            guest_line = std::stoi((*it)[1].str());
        }
    } else {
        static const std::regex frame(R"((?:<eval>|user_code\.js):(\d+))");
        std::smatch match;
        if (std::regex_search(stderr_output, match, frame)) {
            guest_line = std::stoi(match[1].str());
        }
    }

    if (!guest_line) {
        return std::nullopt;
    }
    int user_line = *guest_line - prologue_lines;
    if (user_line < 1) {
        return std::nullopt;
    }
    return user_line;
}

std::optional<ErrorGuidance> ErrorGuidanceBuilder::Build(const GuidanceInputs& inputs) const {
    switch (inputs.failure_kind) {
        case core::FailureKind::OUT_OF_FUEL:
            return OutOfFuelGuidance(inputs.fuel_consumed, inputs.fuel_budget, inputs.heavy_packages);
        case core::FailureKind::OUT_OF_MEMORY:
            return MemoryExhaustedGuidance(inputs.memory_limit_bytes);
        case core::FailureKind::TIMEOUT:
            return TimeoutGuidance(inputs.timeout_seconds);
        default:
            break;
    }

    if (inputs.stderr_output.empty()) {
        return std::nullopt;
    }

    std::string sample = inputs.stderr_output.substr(0, std::min(inputs.stderr_output.size(), kMaxScanBytes));
    if (inputs.language == runtime::RuntimeType::PYTHON) {
        return ClassifyPython(sample, inputs.prologue_lines);
    }
    return ClassifyJavaScript(sample, inputs.prologue_lines);
}

std::optional<ErrorGuidance> ErrorGuidanceBuilder::ClassifyPython(const std::string& sample,
                                                                  int prologue_lines) const {
    if (StringUtils::Contains(sample, "ModuleNotFoundError")) {
        static const std::regex missing(R"(No module named '([^']+)')");
        std::smatch match;
        if (std::regex_search(sample, match, missing)) {
            std::string package = match[1].str();
            std::string lower = StringUtils::ToLower(package);
            for (const auto& vendored : VendoredPythonPackages()) {
                if (StringUtils::Contains(lower, vendored)) {
                    return MissingVendoredPackageGuidance(package);
                }
            }
        }
    }

    if (StringUtils::Contains(sample, "FileNotFoundError") || StringUtils::Contains(sample, "PermissionError")) {
        static const std::regex quoted_path(R"(['"]([/\\][^'"]+)['"])");
        for (auto it = std::sregex_iterator(sample.begin(), sample.end(), quoted_path);
             it != std::sregex_iterator(); ++it) {
            std::string path = (*it)[1].str();
            if (!StringUtils::StartsWith(path, "/app") && !StringUtils::StartsWith(path, "/data")) {
                return PathRestrictionGuidance(path);
            }
        }
    }

    auto line = ExtractUserLine(sample, runtime::RuntimeType::PYTHON, prologue_lines);

    if (StringUtils::Contains(sample, "SyntaxError") || StringUtils::Contains(sample, "IndentationError")) {
        return ParseErrorGuidance(runtime::RuntimeType::PYTHON, line, LastErrorLine(sample));
    }
    if (StringUtils::Contains(sample, "Traceback (most recent call last)")) {
        return RuntimeErrorGuidance(line, LastErrorLine(sample));
    }
    return std::nullopt;
}

std::optional<ErrorGuidance> ErrorGuidanceBuilder::ClassifyJavaScript(const std::string& sample,
                                                                      int prologue_lines) const {
    auto line = ExtractUserLine(sample, runtime::RuntimeType::JAVASCRIPT, prologue_lines);

    if (StringUtils::Contains(sample, "TypeError") && StringUtils::Contains(sample, "not iterable")) {
        return QuickJsTupleGuidance(line);
    }

    if (StringUtils::Contains(sample, "ReferenceError") || StringUtils::Contains(sample, "Cannot find module")) {
        static const std::regex quoted(R"('([^']+)')");
        std::smatch match;
        if (std::regex_search(sample, match, quoted)) {
            std::string package = match[1].str();
            const auto& vendored = VendoredJavaScriptPackages();
            if (std::find(vendored.begin(), vendored.end(), package) != vendored.end()) {
                return MissingRequireVendorGuidance(package);
            }
        }
    }

    std::string message = FirstErrorLine(sample);
    if (StringUtils::Contains(sample, "SyntaxError")) {
        return ParseErrorGuidance(runtime::RuntimeType::JAVASCRIPT, line, message);
    }
    if (!message.empty() || StringUtils::Contains(sample, "at <eval>")) {
        return RuntimeErrorGuidance(line, message);
    }
    return std::nullopt;
}

} // namespace analyzers
} // namespace wasmbox
