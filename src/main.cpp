/**
 * @file main.cpp
 * @brief wasmbox - Command-line interface
 *
 * Entry point for the wasmbox sandbox. Runs untrusted Python or JavaScript
 * inside a metered WebAssembly interpreter, manages session workspaces and
 * prunes stale sessions.
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include "wasmbox/core/errors.hpp"
#include "wasmbox/core/sandbox.hpp"
#include "wasmbox/core/session_manager.hpp"
#include "wasmbox/reporters/json_reporter.hpp"
#include "wasmbox/runtime/runtime_type.hpp"
#include "wasmbox/utils/string_utils.hpp"

#include <chrono>
#include <fstream>
#include <iostream>
#include <sstream>

using json = nlohmann::json;
using wasmbox::utils::StringUtils;

/*******************************************************************************
 * UI and Display Functions
 ******************************************************************************/

void PrintBanner() {
    std::cerr << R"(
╔═══════════════════════════════════════════════════════════════╗
║                                                               ║
║   ██╗    ██╗ █████╗ ███████╗███╗   ███╗██████╗  ██████╗ ██╗  ██╗
║   ██║    ██║██╔══██╗██╔════╝████╗ ████║██╔══██╗██╔═══██╗╚██╗██╔╝
║   ██║ █╗ ██║███████║███████╗██╔████╔██║██████╔╝██║   ██║ ╚███╔╝
║   ██║███╗██║██╔══██║╚════██║██║╚██╔╝██║██╔══██╗██║   ██║ ██╔██╗
║   ╚███╔███╔╝██║  ██║███████║██║ ╚═╝ ██║██████╔╝╚██████╔╝██╔╝ ██╗
║    ╚══╝╚══╝ ╚═╝  ╚═╝╚══════╝╚═╝     ╚═╝╚═════╝  ╚═════╝ ╚═╝  ╚═╝
║                                                               ║
║          Metered WebAssembly sandbox for untrusted code       ║
║                              v1.0.0                           ║
║                                                               ║
╚═══════════════════════════════════════════════════════════════╝
)" << std::endl;
}

void PrintRow(const std::string& label, const std::string& value) {
    std::string text = StringUtils::Truncate(value, 50);
    std::string row = "  " + label + ": " + text;
    std::size_t padding = row.size() < 63 ? 63 - row.size() : 0;
    std::cout << "║" << row << std::string(padding, ' ') << "║\n";
}

void PrintConsoleSummary(const wasmbox::core::ExecutionResult& result) {
    const auto& metadata = result.metadata;

    if (!result.stdout_output.empty()) {
        std::cout << result.stdout_output;
        if (result.stdout_output.back() != '\n') {
            std::cout << "\n";
        }
    }
    if (!result.stderr_output.empty()) {
        std::cerr << result.stderr_output;
        if (result.stderr_output.back() != '\n') {
            std::cerr << "\n";
        }
    }

    std::cout << "\n";
    std::cout << "╔═══════════════════════════════════════════════════════════════╗\n";
    std::cout << "║                     EXECUTION SUMMARY                         ║\n";
    std::cout << "╚═══════════════════════════════════════════════════════════════╝\n";

    PrintRow("Session", metadata.session_id);
    PrintRow("Runtime", metadata.runtime);
    PrintRow("Status", result.success ? "[OK] Success" :
                       "[FAIL] " + wasmbox::core::FailureKindToString(result.failure_kind));
    PrintRow("Exit code", std::to_string(result.exit_code));
    PrintRow("Fuel", StringUtils::FormatThousands(result.fuel_consumed) + " / " +
                     StringUtils::FormatThousands(metadata.fuel_budget) + " (" +
                     metadata.fuel_analysis.status + ")");
    PrintRow("Memory", StringUtils::FormatBytes(result.memory_used_bytes) + " / " +
                       StringUtils::FormatBytes(metadata.memory_limit_bytes));

    std::ostringstream duration;
    duration << result.duration.count() / 1000 << " ms";
    PrintRow("Duration", duration.str());

    for (const auto& file : result.files_created) {
        PrintRow("Created", file);
    }
    for (const auto& file : result.files_modified) {
        PrintRow("Modified", file);
    }
    if (metadata.stdout_truncated || metadata.stderr_truncated) {
        PrintRow("Output", "[TRUNCATED]");
    }

    std::cout << "╚═══════════════════════════════════════════════════════════════╝\n";

    if (metadata.fuel_analysis.status != "efficient") {
        std::cout << "\n[i] " << metadata.fuel_analysis.recommendation << "\n";
    }
    if (metadata.error_guidance) {
        const auto& guidance = *metadata.error_guidance;
        std::cout << "\n[!] " << guidance.error_type;
        if (guidance.failing_line) {
            std::cout << " (line " << *guidance.failing_line << ")";
        }
        std::cout << "\n";
        for (const auto& hint : guidance.actionable_guidance) {
            std::cout << "    - " << hint << "\n";
        }
    }
}

std::string ReadSource(const std::string& file_path) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file) {
        throw wasmbox::core::HostSetupError("Cannot read code file: " + file_path);
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

wasmbox::runtime::RuntimeType RequireLanguage(const std::string& name) {
    auto language = wasmbox::runtime::ParseRuntimeType(name);
    if (!language) {
        throw wasmbox::core::HostSetupError("Unknown language: " + name);
    }
    return *language;
}

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    CLI::App app{"wasmbox - metered WebAssembly sandbox"};
    app.require_subcommand(1);

    // Global options
    std::string workspace_root = "workspace";
    std::string python_wasm = "bin/python.wasm";
    std::string quickjs_wasm = "bin/quickjs.wasm";
    std::string data_dir;
    std::vector<std::string> mounts;
    bool verbose = false;

    app.add_option("--workspace", workspace_root, "Root directory of session workspaces")
        ->default_val("workspace");
    app.add_option("--python-wasm", python_wasm, "CPython WASI module")->default_val("bin/python.wasm");
    app.add_option("--quickjs-wasm", quickjs_wasm, "QuickJS WASI module")->default_val("bin/quickjs.wasm");
    app.add_option("--data-dir", data_dir, "Vendored package directory, mounted read-only at /data");
    app.add_option("--mount", mounts, "Extra read-only mount HOST:GUEST (repeatable)");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    // run
    auto* run_cmd = app.add_subcommand("run", "Execute code in a sandbox");
    std::string language_name = "python";
    std::string code;
    std::string code_file;
    std::string session_id;
    bool persist = false;
    std::uint64_t fuel = 0;
    std::uint64_t memory = 0;
    double timeout = 0.0;
    std::string policy_file;
    bool no_setup = false;
    bool json_output = false;
    std::string report_file;

    run_cmd->add_option("-l,--language", language_name, "python or javascript")->default_val("python");
    auto* code_opt = run_cmd->add_option("-c,--code", code, "Source code to run");
    auto* file_opt = run_cmd->add_option("-f,--file", code_file, "File containing the source code")
        ->check(CLI::ExistingFile);
    code_opt->excludes(file_opt);
    run_cmd->add_option("-s,--session", session_id, "Reuse or create the named session");
    run_cmd->add_flag("--persist", persist, "Persist the `_state` dictionary between runs");
    run_cmd->add_option("--fuel", fuel, "Instruction budget");
    run_cmd->add_option("--memory", memory, "Linear memory limit in bytes");
    run_cmd->add_option("--timeout", timeout, "Wall-clock limit in seconds");
    run_cmd->add_option("--policy", policy_file, "ExecutionPolicy JSON file")->check(CLI::ExistingFile);
    run_cmd->add_flag("--no-setup", no_setup, "Do not inject the language setup prologue");
    run_cmd->add_flag("--json", json_output, "Print the result as JSON");
    run_cmd->add_option("-o,--output", report_file, "Also write the JSON result to this file");

    // session
    auto* session_cmd = app.add_subcommand("session", "Manage session workspaces");
    session_cmd->require_subcommand(1);
    std::string session_arg;
    std::string path_arg;
    std::string pattern_arg;
    std::string text_arg;
    std::string from_file;
    bool no_overwrite = false;
    bool recursive = false;

    auto* create_cmd = session_cmd->add_subcommand("create", "Create a session");
    create_cmd->add_option("-l,--language", language_name, "python or javascript")->default_val("python");
    create_cmd->add_option("--id", session_arg, "Session id (random when omitted)");
    create_cmd->add_flag("--persist", persist, "Persist `_state` between runs");

    auto* list_cmd = session_cmd->add_subcommand("list", "List session workspaces");

    auto* files_cmd = session_cmd->add_subcommand("files", "List files in a session");
    files_cmd->add_option("id", session_arg, "Session id")->required();
    files_cmd->add_option("pattern", pattern_arg, "Glob pattern");

    auto* read_cmd = session_cmd->add_subcommand("read", "Print a workspace file");
    read_cmd->add_option("id", session_arg, "Session id")->required();
    read_cmd->add_option("path", path_arg, "Relative path")->required();

    auto* write_cmd = session_cmd->add_subcommand("write", "Write a workspace file");
    write_cmd->add_option("id", session_arg, "Session id")->required();
    write_cmd->add_option("path", path_arg, "Relative path")->required();
    auto* text_opt = write_cmd->add_option("--text", text_arg, "File contents");
    auto* from_opt = write_cmd->add_option("--from", from_file, "Copy contents from a host file")
        ->check(CLI::ExistingFile);
    text_opt->excludes(from_opt);
    write_cmd->add_flag("--no-overwrite", no_overwrite, "Fail if the file already exists");

    auto* rm_cmd = session_cmd->add_subcommand("rm", "Delete a file or directory in a session");
    rm_cmd->add_option("id", session_arg, "Session id")->required();
    rm_cmd->add_option("path", path_arg, "Relative path")->required();
    rm_cmd->add_flag("-r,--recursive", recursive, "Delete a directory and its contents");

    auto* delete_cmd = session_cmd->add_subcommand("delete", "Delete a session workspace");
    delete_cmd->add_option("id", session_arg, "Session id")->required();

    // prune
    auto* prune_cmd = app.add_subcommand("prune", "Delete sessions idle longer than a threshold");
    double older_than_hours = 24.0;
    bool dry_run = false;
    prune_cmd->add_option("--older-than-hours", older_than_hours, "Idle threshold in hours")->default_val(24.0);
    prune_cmd->add_flag("--dry-run", dry_run, "Report without deleting");
    prune_cmd->add_flag("--json", json_output, "Print the report as JSON");

    CLI11_PARSE(app, argc, argv);

    // Logs go to stderr so stdout stays clean for guest output and JSON
    spdlog::set_default_logger(spdlog::stderr_color_mt("wasmbox"));
    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
        spdlog::debug("Verbose logging enabled");
    } else if (json_output) {
        spdlog::set_level(spdlog::level::warn);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    if (!json_output) {
        PrintBanner();
    }

    try {
        wasmbox::core::SessionManager::Config session_config;
        session_config.workspace_root = workspace_root;
        wasmbox::core::SessionManager sessions(session_config);
        wasmbox::reporters::JsonReporter reporter;

        if (*run_cmd) {
            if (code_file.empty() && code.empty() && !run_cmd->count("--code")) {
                spdlog::error("Either --code or --file is required");
                return 1;
            }
            std::string source = code_file.empty() ? code : ReadSource(code_file);

            wasmbox::core::ExecutionPolicy policy;
            if (!policy_file.empty()) {
                policy = wasmbox::core::ExecutionPolicy::LoadFromFile(policy_file);
                spdlog::info("✓ Loaded policy: {}", policy_file);
            }
            if (run_cmd->count("--fuel")) policy.fuel_budget = fuel;
            if (run_cmd->count("--memory")) policy.memory_bytes = memory;
            if (run_cmd->count("--timeout")) policy.timeout = timeout;
            if (no_setup) policy.inject_setup = false;
            if (!data_dir.empty()) policy.mount_data_dir = std::filesystem::path(data_dir);
            for (const auto& mount : mounts) {
                auto separator = mount.rfind(':');
                if (separator == std::string::npos || separator == 0 || separator + 1 == mount.size()) {
                    spdlog::error("Invalid --mount '{}', expected HOST:GUEST", mount);
                    return 1;
                }
                policy.additional_readonly_mounts.push_back(
                    {std::filesystem::path(mount.substr(0, separator)), mount.substr(separator + 1)});
            }

            wasmbox::runtime::BackendArtifacts artifacts;
            artifacts.python_wasm = python_wasm;
            artifacts.quickjs_wasm = quickjs_wasm;

            wasmbox::core::SandboxBuilder builder(sessions);
            builder.WithLanguage(RequireLanguage(language_name))
                   .WithAutoPersist(persist)
                   .WithPolicy(policy)
                   .WithArtifacts(artifacts);
            if (!session_id.empty()) {
                builder.WithSession(session_id);
            }
            auto sandbox = builder.Build();
            auto result = sandbox.Execute(source);

            if (!report_file.empty()) {
                reporter.SaveReport(result, report_file);
            }
            if (json_output) {
                std::cout << reporter.GenerateJsonString(result) << std::endl;
            } else {
                PrintConsoleSummary(result);
            }
            return result.success ? 0 : 1;
        }

        if (*session_cmd) {
            if (*create_cmd) {
                auto language = RequireLanguage(language_name);
                auto session = session_arg.empty() ? sessions.Create(language, persist)
                                                   : sessions.Resolve(session_arg, language, persist);
                std::cout << reporter.Dump(reporter.ToJson(session)) << std::endl;
            } else if (*list_cmd) {
                for (const auto& id : sessions.EnumerateWorkspaces()) {
                    std::cout << id << "\n";
                }
            } else if (*files_cmd) {
                for (const auto& file : sessions.ListFiles(session_arg, pattern_arg)) {
                    std::cout << file << "\n";
                }
            } else if (*read_cmd) {
                auto bytes = sessions.ReadFile(session_arg, path_arg);
                std::cout.write(reinterpret_cast<const char*>(bytes.data()),
                                static_cast<std::streamsize>(bytes.size()));
            } else if (*write_cmd) {
                std::string contents = from_file.empty() ? text_arg : ReadSource(from_file);
                sessions.WriteText(session_arg, path_arg, contents, !no_overwrite);
                spdlog::info("✓ Wrote {} ({})", path_arg, StringUtils::FormatBytes(contents.size()));
            } else if (*rm_cmd) {
                if (!sessions.DeletePath(session_arg, path_arg, recursive)) {
                    spdlog::warn("Nothing to delete at {}", path_arg);
                    return 1;
                }
                spdlog::info("✓ Deleted {}", path_arg);
            } else if (*delete_cmd) {
                if (!sessions.Delete(session_arg)) {
                    spdlog::warn("Session not found: {}", session_arg);
                    return 1;
                }
                spdlog::info("✓ Deleted session {}", session_arg);
            }
            return 0;
        }

        if (*prune_cmd) {
            auto older_than = std::chrono::seconds(static_cast<std::int64_t>(older_than_hours * 3600.0));
            auto result = sessions.Prune(older_than, dry_run);
            if (json_output) {
                std::cout << reporter.GenerateJsonString(result) << std::endl;
            } else {
                std::cout << result.Summary() << "\n";
                for (const auto& error : result.errors) {
                    std::cout << "[ERROR] " << error << "\n";
                }
            }
            return result.errors.empty() ? 0 : 1;
        }

        return 0;

    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    } catch (const wasmbox::core::WasmboxError& e) {
        spdlog::error("{}", e.what());
        return 1;
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("Filesystem error: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
