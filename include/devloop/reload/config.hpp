#pragma once

/// @file config.hpp
/// @brief Dev-mode configuration loaded from JSON

#include <devloop/core/error.hpp>
#include <devloop/core/log.hpp>
#include <devloop/layer/application_layers.hpp>
#include <devloop/layer/artifact.hpp>
#include <devloop/reload/scan_coordinator.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <set>
#include <string>

namespace devloop_reload {

/// Everything the reload engine reads from the project's dev-mode file.
///
/// ```json
/// {
///   "layers": {
///     "parent_first": ["org.acme:core"],
///     "lesser_priority": [],
///     "reloadable": ["org.acme:lib"],
///     "removed_artifacts": [],
///     "removed_resources": { "org.acme:core": ["META-INF/x.txt"] }
///   },
///   "watched_files": { "application.json": true },
///   "instrumentation": false,
///   "live_reload": true,
///   "scan_period_ms": 1000,
///   "coalesce_delay_ms": 500,
///   "compile_retry_limit": 0,
///   "unit_extension": ".o",
///   "log": { "level": "info", "console": true, "file": false, "directory": "logs" }
/// }
/// ```
struct DevModeConfig {
    devloop_layer::ClassLoadingConfig layers;

    /// Watched path -> restart required on change
    std::map<std::string, bool> watched_files;

    bool instrumentation = false;
    bool live_reload = true;

    std::chrono::milliseconds scan_period{1000};
    std::chrono::milliseconds coalesce_delay{500};

    /// 0 = recompile until sources stop changing
    std::size_t compile_retry_limit = 0;

    std::string unit_extension = ".o";

    devloop_core::LogConfig log;

    [[nodiscard]] static devloop_core::Result<DevModeConfig> load(const std::filesystem::path& path);
    [[nodiscard]] static devloop_core::Result<DevModeConfig> from_json_string(const std::string& json_str);
    [[nodiscard]] static devloop_core::Result<DevModeConfig> from_json(const nlohmann::json& j);

    [[nodiscard]] nlohmann::json to_json() const;

    /// Push the toggles into a session
    void apply_to(ReloadSession& session) const;

    /// Session toggles, compile retry limit, main watched files and test scan timing
    void apply_to(ScanCoordinator& coordinator) const;

    /// Unit extension used to ban application units from the base runtime layer
    void apply_to(devloop_layer::BootstrapOptions& options) const;

    /// Reconfigure every devloop logger
    void apply_logging() const;

    /// Timer and coalescing settings for the dev-mode scan
    [[nodiscard]] ScanOptions scan_options() const;
};

} // namespace devloop_reload
