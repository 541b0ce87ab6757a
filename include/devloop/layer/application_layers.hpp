#pragma once

/// @file application_layers.hpp
/// @brief The four layers of a development-mode application
///
/// - augmentation: every non-reloadable dependency, used by build steps
/// - base runtime: stable runtime dependencies; application units banned
/// - deployment: augmentation plus application roots and reloadable deps
/// - runtime: rebuilt on every restart on top of the base runtime layer

#include <devloop/layer/artifact.hpp>
#include <devloop/layer/layer.hpp>

#include <atomic>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace devloop_layer {

/// Launch mode of the bootstrap
enum class LaunchMode : std::uint8_t {
    Normal,
    Dev,
    Test,
};

[[nodiscard]] const char* launch_mode_name(LaunchMode mode);

/// Inputs supplied by whoever bootstraps the application
struct BootstrapOptions {
    LaunchMode mode = LaunchMode::Dev;
    bool flat_classpath = false;
    bool isolate_deployment = false;
    std::vector<std::filesystem::path> application_roots;
    std::vector<std::filesystem::path> additional_deployment_archives;
    std::vector<AdditionalArchive> additional_application_archives;
    std::string unit_extension = ".o";
    LayerPtr base_layer;
};

/// Builds and owns the application's layers. Dependency elements are opened
/// once per artifact key and shared by every layer that uses them.
class ApplicationLayers {
public:
    ApplicationLayers(ApplicationModel model, ClassLoadingConfig config, BootstrapOptions options);
    ~ApplicationLayers();

    ApplicationLayers(const ApplicationLayers&) = delete;
    ApplicationLayers& operator=(const ApplicationLayers&) = delete;

    [[nodiscard]] devloop_core::Result<LayerPtr> augmentation_layer();
    [[nodiscard]] devloop_core::Result<LayerPtr> base_runtime_layer();
    [[nodiscard]] devloop_core::Result<LayerPtr> deployment_layer();

    /// Fresh layer on each call; never memoized
    [[nodiscard]] devloop_core::Result<LayerPtr> runtime_layer(
        std::map<std::string, Bytes> resources,
        std::map<std::string, Bytes> transformed_units);

    /// Number of runtime layers created so far
    [[nodiscard]] std::uint64_t restart_count() const { return m_restart_count.load(); }

    [[nodiscard]] const BootstrapOptions& options() const { return m_options; }
    [[nodiscard]] const ApplicationModel& model() const { return m_model; }

    /// Close memoized layers and every cached element
    void close();

private:
    using ElementSink = std::function<void(ElementPtr)>;

    devloop_core::Result<void> process_element(const Artifact& artifact, ElementSink sink);
    void add_classified(Layer::Builder& builder, const Artifact& artifact, ElementPtr element) const;
    devloop_core::Result<void> add_dependency(Layer::Builder& builder, const Artifact& artifact);
    devloop_core::Result<ElementPtr> open_root(const std::filesystem::path& path);
    [[nodiscard]] std::shared_ptr<MemoryElement> removed_resources_element() const;
    [[nodiscard]] bool is_hot_reloadable(const Artifact& artifact) const;
    devloop_core::Result<LayerPtr> build_base_runtime_layer();

    ApplicationModel m_model;
    ClassLoadingConfig m_config;
    BootstrapOptions m_options;

    std::recursive_mutex m_mutex;
    std::map<ArtifactKey, std::vector<ElementPtr>> m_element_cache;
    std::set<std::filesystem::path> m_hot_reload_paths;
    LayerPtr m_augmentation;
    LayerPtr m_base_runtime;
    LayerPtr m_deployment;
    std::atomic<std::uint64_t> m_restart_count{0};
    bool m_closed = false;
};

} // namespace devloop_layer
