/// @file compiler.cpp
/// @brief CommandCompiler implementation

#include <devloop/reload/compiler.hpp>
#include <devloop/core/log.hpp>

#include "process.hpp"

#include <regex>
#include <sstream>

namespace devloop_reload {

namespace fs = std::filesystem;

using devloop_core::CompileDiagnostic;
using devloop_core::CompileError;
using devloop_core::Err;
using devloop_core::Error;
using devloop_core::Ok;
using devloop_core::Result;

CommandCompiler::CommandCompiler(CompilerConfig config)
    : m_config(std::move(config)) {}

std::vector<std::string> CommandCompiler::build_compile_command(const fs::path& source, const fs::path& output) const {
    std::vector<std::string> args;
    for (const auto& flag : m_config.flags) {
        args.push_back(flag);
    }
    for (const auto& inc : m_config.include_paths) {
        args.push_back("-I" + inc.string());
    }
    for (const auto& def : m_config.defines) {
        args.push_back("-D" + def);
    }
    args.push_back("-c");
    args.push_back(source.string());
    args.push_back("-o");
    args.push_back(output.string());
    return args;
}

Result<void> CommandCompiler::compile(const fs::path& source_root, const FilesByExtension& files) {
    auto root_it = m_config.output_roots.find(source_root);
    if (root_it == m_config.output_roots.end()) {
        return Err(Error(devloop_core::ErrorCode::InvalidArgument,
            "No output root configured for source root " + source_root.string()));
    }
    const fs::path& output_root = root_it->second;

    std::vector<std::string> inputs;
    std::vector<CompileDiagnostic> diagnostics;
    std::string failure_output;
    bool failed = false;

    for (const auto& [ext, sources] : files) {
        if (!m_config.extensions.count(ext)) {
            devloop_core::compiler_logger()->debug("Skipping {} file(s) with unhandled extension '{}'", sources.size(), ext);
            continue;
        }
        for (const auto& source : sources) {
            fs::path relative = source.lexically_relative(source_root);
            fs::path output = output_root / relative;
            output.replace_extension(m_config.unit_extension);

            std::error_code ec;
            fs::create_directories(output.parent_path(), ec);
            if (ec) {
                return Err(Error(CompileError::launch_failed(m_config.compiler_path.string(),
                    "cannot create " + output.parent_path().string() + ": " + ec.message())));
            }

            auto args = build_compile_command(source, output);
            devloop_core::compiler_logger()->debug("Compiling {}", source.string());
            auto result = detail::execute_process(m_config.compiler_path.string(), args);
            if (!result.launched) {
                return Err(Error(CompileError::launch_failed(m_config.compiler_path.string(),
                    "exit code " + std::to_string(result.exit_code))));
            }

            inputs.push_back(source.string());
            auto diags = parse_output(result.output);
            diagnostics.insert(diagnostics.end(), diags.begin(), diags.end());
            if (result.exit_code != 0) {
                failed = true;
                failure_output += result.output;
            }
        }
    }

    if (failed) {
        auto error = CompileError::failed(source_root.string(), std::move(inputs), std::move(diagnostics), failure_output);
        devloop_core::compiler_logger()->error("{} ({} error(s))", error.message,
            error.count(CompileDiagnostic::Severity::Error));
        return Err(Error(std::move(error)));
    }
    return Ok();
}

std::optional<fs::path> CommandCompiler::find_source_path(
    const fs::path& unit,
    const std::set<fs::path>& source_roots,
    const fs::path& output_root) const
{
    fs::path stem = unit.lexically_relative(output_root);
    if (stem.empty() || stem.native().rfind("..", 0) == 0) {
        return std::nullopt;
    }
    stem.replace_extension();

    for (const auto& root : source_roots) {
        for (const auto& ext : m_config.extensions) {
            fs::path candidate = root / stem;
            candidate += ext;
            std::error_code ec;
            if (fs::exists(candidate, ec)) {
                return candidate;
            }
        }
    }
    return std::nullopt;
}

std::vector<CompileDiagnostic> CommandCompiler::parse_output(const std::string& output) {
    std::vector<CompileDiagnostic> diagnostics;

    std::regex diag_regex(R"(([^:]+):(\d+):(\d+):\s*(fatal error|error|warning|note):\s*(.+))");

    std::istringstream stream(output);
    std::string line;

    while (std::getline(stream, line)) {
        std::smatch match;
        if (std::regex_search(line, match, diag_regex)) {
            CompileDiagnostic diag;
            diag.file = match[1].str();
            diag.line = std::stoi(match[2].str());
            diag.column = std::stoi(match[3].str());

            std::string severity = match[4].str();
            if (severity == "error" || severity == "fatal error") {
                diag.severity = CompileDiagnostic::Severity::Error;
            } else if (severity == "warning") {
                diag.severity = CompileDiagnostic::Severity::Warning;
            } else {
                diag.severity = CompileDiagnostic::Severity::Note;
            }

            diag.message = match[5].str();
            diagnostics.push_back(std::move(diag));
        }
    }

    return diagnostics;
}

} // namespace devloop_reload
