#pragma once

/// @file dev_context.hpp
/// @brief Project layout seen by the reload engine

#include <cstdint>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace devloop_reload {

/// Sources, compiled output and resources of one domain (main or test) of a module
struct CompilationUnit {
    std::set<std::filesystem::path> source_paths;
    std::filesystem::path output_path;
    std::set<std::filesystem::path> resource_paths;
    std::filesystem::path resources_output_path;

    /// Identity used for per-unit bookkeeping
    [[nodiscard]] std::string id() const { return output_path.generic_string() + "|" + resources_output_path.generic_string(); }
};

/// One project module
struct ModuleInfo {
    std::string name;
    std::filesystem::path project_directory;
    CompilationUnit main;
    std::optional<CompilationUnit> test;
};

/// Where this process sits in a (possibly remote) dev session
enum class DevModeType : std::uint8_t {
    Local,
    RemoteLocalSide,
    RemoteServerSide,
};

/// Reload domain
enum class ReloadDomain : std::uint8_t {
    Main,
    Test,
};

[[nodiscard]] inline const char* reload_domain_name(ReloadDomain domain) {
    return domain == ReloadDomain::Main ? "main" : "test";
}

/// The modules under development. The first module is the application module.
struct DevModeContext {
    std::vector<ModuleInfo> modules;

    [[nodiscard]] const ModuleInfo* application_module() const {
        return modules.empty() ? nullptr : &modules.front();
    }

    /// Compilation unit of a module for a domain, or nullptr when the module has none
    [[nodiscard]] static const CompilationUnit* unit_for(const ModuleInfo& module, ReloadDomain domain) {
        if (domain == ReloadDomain::Main) {
            return &module.main;
        }
        return module.test ? &*module.test : nullptr;
    }
};

} // namespace devloop_reload
