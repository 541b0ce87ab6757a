/// @file application_layers.cpp
/// @brief Construction of the augmentation, base runtime, deployment and runtime layers

#include <devloop/layer/application_layers.hpp>
#include <devloop/core/log.hpp>

namespace devloop_layer {

using devloop_core::Err;
using devloop_core::Error;
using devloop_core::Ok;
using devloop_core::Result;

const char* launch_mode_name(LaunchMode mode) {
    switch (mode) {
        case LaunchMode::Normal: return "NORMAL";
        case LaunchMode::Dev: return "DEV";
        case LaunchMode::Test: return "TEST";
        default: return "UNKNOWN";
    }
}

ApplicationLayers::ApplicationLayers(ApplicationModel model, ClassLoadingConfig config, BootstrapOptions options)
    : m_model(std::move(model))
    , m_config(std::move(config))
    , m_options(std::move(options)) {}

ApplicationLayers::~ApplicationLayers() {
    close();
}

// =============================================================================
// Element helpers
// =============================================================================

Result<ElementPtr> ApplicationLayers::open_root(const std::filesystem::path& path) {
    return Element::from_path(path);
}

Result<void> ApplicationLayers::process_element(const Artifact& artifact, ElementSink sink) {
    if (!artifact.is_archive()) {
        sink(EmptyElement::instance());
        return Ok();
    }

    auto removed = m_config.removed_resources.find(artifact.key);
    if (removed != m_config.removed_resources.end()) {
        std::set<std::string> hidden(removed->second.begin(), removed->second.end());
        ElementSink inner = std::move(sink);
        sink = [inner, hidden](ElementPtr element) {
            inner(std::make_shared<FilteredElement>(std::move(element), hidden));
        };
    }

    auto cached = m_element_cache.find(artifact.key);
    if (cached != m_element_cache.end()) {
        for (const auto& element : cached->second) {
            sink(element);
        }
        return Ok();
    }

    std::vector<ElementPtr> elements;
    elements.reserve(artifact.paths.size());
    for (const auto& path : artifact.paths) {
        auto element = open_root(path);
        if (!element) {
            return Err(Error(element.error()).with_context("artifact", artifact.key.to_string()));
        }
        sink(*element);
        elements.push_back(std::move(element).value());
    }
    m_element_cache.emplace(artifact.key, std::move(elements));
    return Ok();
}

void ApplicationLayers::add_classified(Layer::Builder& builder, const Artifact& artifact, ElementPtr element) const {
    const auto& key = artifact.key;
    if (m_model.parent_first.count(key) || m_config.parent_first.count(key)) {
        // Served from the parent when available, bridging the running app and dev tooling
        builder.add_parent_first_element(element);
    } else if (m_model.lower_priority.count(key) || m_config.lesser_priority.count(key)) {
        builder.add_lesser_priority_element(element);
    }
    builder.add_element(std::move(element));
}

Result<void> ApplicationLayers::add_dependency(Layer::Builder& builder, const Artifact& artifact) {
    if (m_config.removed_artifacts.count(artifact.key)) {
        return process_element(artifact, [&builder](ElementPtr e) { builder.add_banned_element(std::move(e)); });
    }
    return process_element(artifact, [this, &builder, &artifact](ElementPtr e) {
        add_classified(builder, artifact, std::move(e));
    });
}

std::shared_ptr<MemoryElement> ApplicationLayers::removed_resources_element() const {
    std::map<std::string, Bytes> banned;
    for (const auto& name : m_config.all_removed_resources()) {
        banned.emplace(name, Bytes{});
    }
    return std::make_shared<MemoryElement>(std::move(banned));
}

bool ApplicationLayers::is_hot_reloadable(const Artifact& artifact) const {
    for (const auto& path : artifact.paths) {
        if (m_hot_reload_paths.count(path)) {
            return true;
        }
    }
    return false;
}

// =============================================================================
// Layers
// =============================================================================

Result<LayerPtr> ApplicationLayers::augmentation_layer() {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    if (m_augmentation) {
        return Ok(m_augmentation);
    }

    auto builder = Layer::builder(
        std::string("Augmentation Layer: ") + launch_mode_name(m_options.mode),
        m_options.base_layer, !m_options.isolate_deployment);

    for (const auto& dep : m_model.dependencies) {
        if (m_config.reloadable.count(dep.key)) {
            continue;
        }
        if (auto r = add_dependency(builder, dep); !r) {
            return Err<LayerPtr>(r.error());
        }
    }

    for (const auto& path : m_options.additional_deployment_archives) {
        auto element = open_root(path);
        if (!element) {
            return Err<LayerPtr>(element.error());
        }
        builder.add_element(std::move(element).value());
    }

    builder.add_banned_element(removed_resources_element());
    m_augmentation = builder.build();
    return Ok(m_augmentation);
}

Result<LayerPtr> ApplicationLayers::base_runtime_layer() {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    if (!m_base_runtime) {
        auto layer = build_base_runtime_layer();
        if (!layer) {
            return layer;
        }
        m_base_runtime = std::move(layer).value();
    }
    return Ok(m_base_runtime);
}

Result<LayerPtr> ApplicationLayers::build_base_runtime_layer() {
    auto builder = Layer::builder(
        std::string("Base Runtime Layer: ") + launch_mode_name(m_options.mode),
        m_options.base_layer, false);

    const bool flat = m_options.mode == LaunchMode::Test && m_options.flat_classpath;
    for (const auto& root : m_options.application_roots) {
        auto element = open_root(root);
        if (!element) {
            return Err<LayerPtr>(element.error());
        }
        if (flat) {
            // Flat test classpath: nothing restarts, so application code lives here
            builder.add_element(std::move(element).value());
        } else {
            builder.add_banned_element(
                std::make_shared<UnitFilteredElement>(std::move(element).value(), m_options.unit_extension));
        }
    }

    for (const auto& archive : m_options.additional_application_archives) {
        for (const auto& root : archive.paths) {
            auto element = open_root(root);
            if (!element) {
                return Err<LayerPtr>(element.error());
            }
            if (!archive.hot_reloadable) {
                builder.add_element(std::move(element).value());
            } else {
                m_hot_reload_paths.insert(root);
                builder.add_banned_element(
                    std::make_shared<UnitFilteredElement>(std::move(element).value(), m_options.unit_extension));
            }
        }
    }

    builder.set_resettable_element(std::make_shared<MemoryElement>());
    builder.add_banned_element(removed_resources_element());

    for (const auto* dep : m_model.runtime_dependencies()) {
        if (is_hot_reloadable(*dep) || m_config.reloadable.count(dep->key)) {
            continue;
        }
        if (auto r = add_dependency(builder, *dep); !r) {
            return Err<LayerPtr>(r.error());
        }
    }

    return Ok(builder.build());
}

Result<LayerPtr> ApplicationLayers::deployment_layer() {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    if (m_deployment) {
        return Ok(m_deployment);
    }

    auto augmentation = augmentation_layer();
    if (!augmentation) {
        return augmentation;
    }

    auto builder = Layer::builder(
        std::string("Deployment Layer: ") + launch_mode_name(m_options.mode),
        *augmentation, true);

    for (const auto& root : m_options.application_roots) {
        auto element = open_root(root);
        if (!element) {
            return Err<LayerPtr>(element.error());
        }
        builder.add_element(std::move(element).value());
    }

    builder.set_resettable_element(std::make_shared<MemoryElement>());

    for (const auto& archive : m_options.additional_application_archives) {
        for (const auto& root : archive.paths) {
            auto element = open_root(root);
            if (!element) {
                return Err<LayerPtr>(element.error());
            }
            builder.add_element(std::move(element).value());
        }
    }

    for (const auto* dep : m_model.runtime_dependencies()) {
        if (!m_config.reloadable.count(dep->key)) {
            continue;
        }
        if (auto r = process_element(*dep, [this, &builder, dep](ElementPtr e) {
                add_classified(builder, *dep, std::move(e));
            }); !r) {
            return Err<LayerPtr>(r.error());
        }
    }

    m_deployment = builder.build();
    return Ok(m_deployment);
}

Result<LayerPtr> ApplicationLayers::runtime_layer(
    std::map<std::string, Bytes> resources,
    std::map<std::string, Bytes> transformed_units)
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);

    auto base = base_runtime_layer();
    if (!base) {
        return base;
    }

    const std::uint64_t restart = m_restart_count.fetch_add(1);
    auto builder = Layer::builder(
        std::string("Runtime Layer: ") + launch_mode_name(m_options.mode) + " restart no:" + std::to_string(restart),
        *base, true);
    builder.set_transformed_units(std::move(transformed_units));
    builder.add_element(std::make_shared<MemoryElement>(std::move(resources)));

    for (const auto& root : m_options.application_roots) {
        auto element = open_root(root);
        if (!element) {
            return Err<LayerPtr>(element.error());
        }
        builder.add_element(std::move(element).value());
    }

    for (const auto& archive : m_options.additional_application_archives) {
        if (!archive.hot_reloadable) {
            continue;
        }
        for (const auto& root : archive.paths) {
            auto element = open_root(root);
            if (!element) {
                return Err<LayerPtr>(element.error());
            }
            builder.add_element(std::move(element).value());
        }
    }

    for (const auto* dep : m_model.runtime_dependencies()) {
        if (!m_config.reloadable.count(dep->key)) {
            continue;
        }
        if (auto r = process_element(*dep, [this, &builder, dep](ElementPtr e) {
                add_classified(builder, *dep, std::move(e));
            }); !r) {
            return Err<LayerPtr>(r.error());
        }
    }

    return Ok(builder.build());
}

void ApplicationLayers::close() {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    if (m_closed) {
        return;
    }
    m_closed = true;

    for (auto* layer : {&m_augmentation, &m_base_runtime, &m_deployment}) {
        if (*layer) {
            (*layer)->close();
        }
    }
    for (auto& [key, elements] : m_element_cache) {
        for (auto& element : elements) {
            element->close();
        }
    }
    m_element_cache.clear();
}

} // namespace devloop_layer
