/// @file config.cpp
/// @brief DevModeConfig JSON loading

#include <devloop/reload/config.hpp>
#include <devloop/reload/reload_session.hpp>

#include <fstream>
#include <sstream>

namespace devloop_reload {

using devloop_core::ConfigError;
using devloop_core::Err;
using devloop_core::Error;
using devloop_core::Ok;
using devloop_core::Result;
using devloop_layer::ArtifactKey;

namespace {

Result<std::set<ArtifactKey>> parse_key_list(const nlohmann::json& j, const std::string& field) {
    std::set<ArtifactKey> keys;
    if (!j.is_array()) {
        return Err<std::set<ArtifactKey>>(Error(ConfigError::invalid_value(field, "expected an array of artifact keys")));
    }
    for (const auto& item : j) {
        if (!item.is_string()) {
            return Err<std::set<ArtifactKey>>(Error(ConfigError::invalid_value(field, "artifact keys must be strings")));
        }
        auto key = ArtifactKey::parse(item.get<std::string>());
        if (!key) {
            return Err<std::set<ArtifactKey>>(Error(ConfigError::invalid_value(field, key.error().message())));
        }
        keys.insert(std::move(*key));
    }
    return Ok(std::move(keys));
}

nlohmann::json key_list_to_json(const std::set<ArtifactKey>& keys) {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& key : keys) {
        j.push_back(key.to_string());
    }
    return j;
}

Result<std::chrono::milliseconds> parse_millis(const nlohmann::json& j, const std::string& field) {
    if (!j.is_number_integer() || j.get<long long>() < 0) {
        return Err<std::chrono::milliseconds>(Error(ConfigError::invalid_value(field, "expected a non-negative integer")));
    }
    return Ok(std::chrono::milliseconds(j.get<long long>()));
}

Result<void> parse_layers(const nlohmann::json& j, DevModeConfig& config) {
    if (!j.is_object()) {
        return Err(Error(ConfigError::invalid_value("layers", "expected an object")));
    }

    struct KeyField {
        const char* name;
        std::set<ArtifactKey>* target;
    };
    const KeyField fields[] = {
        {"parent_first", &config.layers.parent_first},
        {"lesser_priority", &config.layers.lesser_priority},
        {"reloadable", &config.layers.reloadable},
        {"removed_artifacts", &config.layers.removed_artifacts},
    };
    for (const auto& field : fields) {
        if (!j.contains(field.name)) {
            continue;
        }
        auto keys = parse_key_list(j[field.name], std::string("layers.") + field.name);
        if (!keys) {
            return Err(keys.error());
        }
        *field.target = std::move(*keys);
    }

    if (j.contains("removed_resources")) {
        const auto& removed = j["removed_resources"];
        if (!removed.is_object()) {
            return Err(Error(ConfigError::invalid_value("layers.removed_resources", "expected an object")));
        }
        for (auto it = removed.begin(); it != removed.end(); ++it) {
            auto key = ArtifactKey::parse(it.key());
            if (!key) {
                return Err(Error(ConfigError::invalid_value("layers.removed_resources", key.error().message())));
            }
            if (!it.value().is_array()) {
                return Err(Error(ConfigError::invalid_value("layers.removed_resources." + it.key(),
                    "expected an array of resource names")));
            }
            auto& names = config.layers.removed_resources[*key];
            for (const auto& name : it.value()) {
                if (!name.is_string()) {
                    return Err(Error(ConfigError::invalid_value("layers.removed_resources." + it.key(),
                        "resource names must be strings")));
                }
                names.push_back(name.get<std::string>());
            }
        }
    }
    return Ok();
}

Result<void> parse_log(const nlohmann::json& j, devloop_core::LogConfig& log) {
    if (!j.is_object()) {
        return Err(Error(ConfigError::invalid_value("log", "expected an object")));
    }
    if (j.contains("level")) {
        if (!j["level"].is_string()) {
            return Err(Error(ConfigError::invalid_value("log.level", "expected a string")));
        }
        auto level = devloop_core::parse_log_level(j["level"].get<std::string>());
        if (!level) {
            return Err(Error(ConfigError::invalid_value("log.level", "unknown level '" + j["level"].get<std::string>() + "'")));
        }
        log.level = *level;
    }
    if (j.contains("console")) {
        if (!j["console"].is_boolean()) {
            return Err(Error(ConfigError::invalid_value("log.console", "expected a boolean")));
        }
        log.console_enabled = j["console"].get<bool>();
    }
    if (j.contains("file")) {
        if (!j["file"].is_boolean()) {
            return Err(Error(ConfigError::invalid_value("log.file", "expected a boolean")));
        }
        log.file_enabled = j["file"].get<bool>();
    }
    if (j.contains("directory")) {
        if (!j["directory"].is_string()) {
            return Err(Error(ConfigError::invalid_value("log.directory", "expected a string")));
        }
        log.log_directory = j["directory"].get<std::string>();
    }
    return Ok();
}

} // anonymous namespace

Result<DevModeConfig> DevModeConfig::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Err<DevModeConfig>(Error(ConfigError::file_not_found(path.string())));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto config = from_json_string(buffer.str());
    if (!config) {
        config.error().with_context("file", path.string());
    }
    return config;
}

Result<DevModeConfig> DevModeConfig::from_json_string(const std::string& json_str) {
    try {
        return from_json(nlohmann::json::parse(json_str));
    } catch (const nlohmann::json::exception& e) {
        return Err<DevModeConfig>(Error(ConfigError::parse_failed(e.what())));
    }
}

Result<DevModeConfig> DevModeConfig::from_json(const nlohmann::json& j) {
    DevModeConfig config;
    if (!j.is_object()) {
        return Err<DevModeConfig>(Error(ConfigError::invalid_value("<root>", "expected an object")));
    }

    if (j.contains("layers")) {
        auto layers = parse_layers(j["layers"], config);
        if (!layers) {
            return Err<DevModeConfig>(layers.error());
        }
    }

    if (j.contains("watched_files")) {
        const auto& watched = j["watched_files"];
        if (!watched.is_object()) {
            return Err<DevModeConfig>(Error(ConfigError::invalid_value("watched_files", "expected an object")));
        }
        for (auto it = watched.begin(); it != watched.end(); ++it) {
            if (!it.value().is_boolean()) {
                return Err<DevModeConfig>(Error(ConfigError::invalid_value("watched_files." + it.key(),
                    "expected a boolean restart flag")));
            }
            config.watched_files[it.key()] = it.value().get<bool>();
        }
    }

    if (j.contains("instrumentation")) {
        if (!j["instrumentation"].is_boolean()) {
            return Err<DevModeConfig>(Error(ConfigError::invalid_value("instrumentation", "expected a boolean")));
        }
        config.instrumentation = j["instrumentation"].get<bool>();
    }

    if (j.contains("live_reload")) {
        if (!j["live_reload"].is_boolean()) {
            return Err<DevModeConfig>(Error(ConfigError::invalid_value("live_reload", "expected a boolean")));
        }
        config.live_reload = j["live_reload"].get<bool>();
    }

    if (j.contains("scan_period_ms")) {
        auto period = parse_millis(j["scan_period_ms"], "scan_period_ms");
        if (!period) {
            return Err<DevModeConfig>(period.error());
        }
        if (period->count() == 0) {
            return Err<DevModeConfig>(Error(ConfigError::invalid_value("scan_period_ms", "must be positive")));
        }
        config.scan_period = *period;
    }

    if (j.contains("coalesce_delay_ms")) {
        auto delay = parse_millis(j["coalesce_delay_ms"], "coalesce_delay_ms");
        if (!delay) {
            return Err<DevModeConfig>(delay.error());
        }
        config.coalesce_delay = *delay;
    }

    if (j.contains("compile_retry_limit")) {
        const auto& limit = j["compile_retry_limit"];
        if (!limit.is_number_integer() || limit.get<long long>() < 0) {
            return Err<DevModeConfig>(Error(ConfigError::invalid_value("compile_retry_limit",
                "expected a non-negative integer")));
        }
        config.compile_retry_limit = limit.get<std::size_t>();
    }

    if (j.contains("unit_extension")) {
        const auto& ext = j["unit_extension"];
        if (!ext.is_string() || ext.get<std::string>().empty() || ext.get<std::string>().front() != '.') {
            return Err<DevModeConfig>(Error(ConfigError::invalid_value("unit_extension",
                "expected an extension starting with '.'")));
        }
        config.unit_extension = ext.get<std::string>();
    }

    if (j.contains("log")) {
        auto log = parse_log(j["log"], config.log);
        if (!log) {
            return Err<DevModeConfig>(log.error());
        }
    }

    return Ok(std::move(config));
}

nlohmann::json DevModeConfig::to_json() const {
    nlohmann::json j;

    nlohmann::json layers_json;
    layers_json["parent_first"] = key_list_to_json(layers.parent_first);
    layers_json["lesser_priority"] = key_list_to_json(layers.lesser_priority);
    layers_json["reloadable"] = key_list_to_json(layers.reloadable);
    layers_json["removed_artifacts"] = key_list_to_json(layers.removed_artifacts);
    nlohmann::json removed = nlohmann::json::object();
    for (const auto& [key, names] : layers.removed_resources) {
        removed[key.to_string()] = names;
    }
    layers_json["removed_resources"] = removed;
    j["layers"] = layers_json;

    nlohmann::json watched = nlohmann::json::object();
    for (const auto& [path, restart] : watched_files) {
        watched[path] = restart;
    }
    j["watched_files"] = watched;

    j["instrumentation"] = instrumentation;
    j["live_reload"] = live_reload;
    j["scan_period_ms"] = scan_period.count();
    j["coalesce_delay_ms"] = coalesce_delay.count();
    j["compile_retry_limit"] = compile_retry_limit;
    j["unit_extension"] = unit_extension;

    j["log"] = {
        {"level", devloop_core::log_level_name(log.level)},
        {"console", log.console_enabled},
        {"file", log.file_enabled},
        {"directory", log.log_directory},
    };

    return j;
}

void DevModeConfig::apply_to(ReloadSession& session) const {
    session.set_configured_instrumentation(instrumentation);
    session.set_live_reload_enabled(live_reload);
}

void DevModeConfig::apply_to(ScanCoordinator& coordinator) const {
    apply_to(coordinator.session());
    coordinator.change_detector().set_compile_retry_limit(compile_retry_limit);
    coordinator.set_watched_file_paths(watched_files, false);

    ScanOptions test_options = coordinator.test_scan_options();
    test_options.period = scan_period;
    test_options.coalesce_delay = coalesce_delay;
    coordinator.set_test_scan_options(test_options);
}

void DevModeConfig::apply_to(devloop_layer::BootstrapOptions& options) const {
    options.unit_extension = unit_extension;
}

void DevModeConfig::apply_logging() const {
    devloop_core::configure_logging(log);
}

ScanOptions DevModeConfig::scan_options() const {
    ScanOptions options;
    options.period = scan_period;
    options.coalesce_delay = coalesce_delay;
    return options;
}

} // namespace devloop_reload
