#pragma once

/// @file compiler.hpp
/// @brief Compiler collaborator interface and a command-line implementation

#include <devloop/core/error.hpp>

#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace devloop_reload {

/// Source files to compile, grouped by extension (".cpp" -> {files})
using FilesByExtension = std::map<std::string, std::set<std::filesystem::path>>;

// =============================================================================
// ICompiler
// =============================================================================

/// Compiles changed sources into compiled units
class ICompiler {
public:
    virtual ~ICompiler() = default;

    /// Compile files under one source root. Fails with a CompileError.
    [[nodiscard]] virtual devloop_core::Result<void> compile(
        const std::filesystem::path& source_root,
        const FilesByExtension& files) = 0;

    /// Source that produced a compiled unit, or nullopt when it cannot be determined
    [[nodiscard]] virtual std::optional<std::filesystem::path> find_source_path(
        const std::filesystem::path& unit,
        const std::set<std::filesystem::path>& source_roots,
        const std::filesystem::path& output_root) const = 0;

    /// Source extensions this compiler accepts, with leading dot
    [[nodiscard]] virtual std::set<std::string> handled_extensions() const = 0;

    /// Extension of compiled units, with leading dot
    [[nodiscard]] virtual std::string unit_extension() const { return ".o"; }

    virtual void close() {}
};

// =============================================================================
// CompilerConfig
// =============================================================================

struct CompilerConfig {
    std::filesystem::path compiler_path = "c++";
    std::vector<std::string> flags;
    std::vector<std::filesystem::path> include_paths;
    std::vector<std::string> defines;
    std::set<std::string> extensions = {".cpp", ".cc", ".cxx"};
    std::string unit_extension = ".o";

    /// Source root -> output root
    std::map<std::filesystem::path, std::filesystem::path> output_roots;

    class Builder;
};

class CompilerConfig::Builder {
public:
    Builder() = default;

    Builder& compiler_path(const std::filesystem::path& path) { m_config.compiler_path = path; return *this; }
    Builder& flag(const std::string& f) { m_config.flags.push_back(f); return *this; }
    Builder& include_path(const std::filesystem::path& path) { m_config.include_paths.push_back(path); return *this; }
    Builder& define(const std::string& def) { m_config.defines.push_back(def); return *this; }
    Builder& extensions(std::set<std::string> exts) { m_config.extensions = std::move(exts); return *this; }
    Builder& unit_extension(const std::string& ext) { m_config.unit_extension = ext; return *this; }
    Builder& output_root(const std::filesystem::path& source_root, const std::filesystem::path& output) {
        m_config.output_roots[source_root] = output;
        return *this;
    }

    CompilerConfig build() { return std::move(m_config); }

private:
    CompilerConfig m_config;
};

// =============================================================================
// CommandCompiler
// =============================================================================

/// Runs an external compiler once per changed source:
///   <compiler> <flags> -I.. -D.. -c <source> -o <output_root>/<relative stem><unit_extension>
class CommandCompiler : public ICompiler {
public:
    explicit CommandCompiler(CompilerConfig config);

    [[nodiscard]] devloop_core::Result<void> compile(
        const std::filesystem::path& source_root,
        const FilesByExtension& files) override;

    [[nodiscard]] std::optional<std::filesystem::path> find_source_path(
        const std::filesystem::path& unit,
        const std::set<std::filesystem::path>& source_roots,
        const std::filesystem::path& output_root) const override;

    [[nodiscard]] std::set<std::string> handled_extensions() const override { return m_config.extensions; }
    [[nodiscard]] std::string unit_extension() const override { return m_config.unit_extension; }

    /// Command line for one source
    [[nodiscard]] std::vector<std::string> build_compile_command(
        const std::filesystem::path& source,
        const std::filesystem::path& output) const;

    /// Parse "file:line:col: severity: message" lines
    [[nodiscard]] static std::vector<devloop_core::CompileDiagnostic> parse_output(const std::string& output);

    [[nodiscard]] const CompilerConfig& config() const { return m_config; }

private:
    CompilerConfig m_config;
};

} // namespace devloop_reload
