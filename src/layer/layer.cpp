/// @file layer.cpp
/// @brief Layer resolution

#include <devloop/layer/layer.hpp>
#include <devloop/core/log.hpp>

#include <algorithm>
#include <mutex>

namespace devloop_layer {

// =============================================================================
// Layer::Builder
// =============================================================================

Layer::Builder Layer::builder(std::string name, LayerPtr parent, bool aggregate_parent_resources) {
    return Builder(std::move(name), std::move(parent), aggregate_parent_resources);
}

Layer::Builder::Builder(std::string name, LayerPtr parent, bool aggregate_parent_resources)
    : m_name(std::move(name))
    , m_parent(std::move(parent))
    , m_aggregate(aggregate_parent_resources) {}

Layer::Builder& Layer::Builder::add_element(ElementPtr element) {
    m_elements.push_back(std::move(element));
    return *this;
}

Layer::Builder& Layer::Builder::add_parent_first_element(ElementPtr element) {
    m_parent_first.push_back(std::move(element));
    return *this;
}

Layer::Builder& Layer::Builder::add_lesser_priority_element(ElementPtr element) {
    m_lesser_priority.push_back(std::move(element));
    return *this;
}

Layer::Builder& Layer::Builder::add_banned_element(ElementPtr element) {
    m_banned.push_back(std::move(element));
    return *this;
}

Layer::Builder& Layer::Builder::set_resettable_element(std::shared_ptr<MemoryElement> element) {
    m_resettable = std::move(element);
    return *this;
}

Layer::Builder& Layer::Builder::set_transformed_units(std::map<std::string, Bytes> units) {
    m_transformed = std::move(units);
    return *this;
}

LayerPtr Layer::Builder::build() {
    LayerPtr layer(new Layer());
    layer->m_name = std::move(m_name);
    layer->m_parent = std::move(m_parent);
    layer->m_aggregate = m_aggregate;
    layer->m_elements = std::move(m_elements);
    layer->m_parent_first = std::move(m_parent_first);
    layer->m_banned = std::move(m_banned);
    layer->m_resettable = std::move(m_resettable);
    layer->m_transformed = std::move(m_transformed);

    // An element that is also parent-first keeps parent-first precedence
    for (const auto& element : m_lesser_priority) {
        bool parent_first = std::any_of(layer->m_parent_first.begin(), layer->m_parent_first.end(),
            [&](const ElementPtr& pf) { return pf.get() == element.get(); });
        if (!parent_first) {
            layer->m_lesser_priority.insert(element.get());
        }
    }
    m_lesser_priority.clear();

    devloop_core::layer_logger()->debug("Built layer '{}' ({} elements, {} banned, parent: {})",
        layer->m_name, layer->m_elements.size(), layer->m_banned.size(),
        layer->m_parent ? layer->m_parent->name() : "<none>");
    return layer;
}

// =============================================================================
// Layer
// =============================================================================

Layer::~Layer() = default;

std::optional<Resource> Layer::tag(std::optional<Resource> res) const {
    if (res && res->layer.empty()) {
        res->layer = m_name;
    }
    return res;
}

bool Layer::is_banned(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return std::any_of(m_banned.begin(), m_banned.end(),
        [&](const ElementPtr& e) { return e->contains(name); });
}

bool Layer::is_parent_first(const std::string& name) const {
    return std::any_of(m_parent_first.begin(), m_parent_first.end(),
        [&](const ElementPtr& e) { return e->contains(name); });
}

std::vector<ElementPtr> Layer::ordered_elements() const {
    std::vector<ElementPtr> ordered;
    ordered.reserve(m_elements.size());
    for (const auto& e : m_elements) {
        if (!m_lesser_priority.count(e.get())) {
            ordered.push_back(e);
        }
    }
    for (const auto& e : m_elements) {
        if (m_lesser_priority.count(e.get())) {
            ordered.push_back(e);
        }
    }
    return ordered;
}

std::optional<Resource> Layer::resolve_own(const std::string& name) const {
    if (m_resettable) {
        if (auto res = m_resettable->resource(name)) {
            return tag(std::move(res));
        }
    }
    for (const auto& element : ordered_elements()) {
        auto res = element->resource(name);
        if (!res) {
            continue;
        }
        auto it = m_transformed.find(name);
        if (it != m_transformed.end()) {
            res->data = it->second;
        }
        return tag(std::move(res));
    }
    return std::nullopt;
}

std::optional<Resource> Layer::resource(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    if (m_closed) {
        return std::nullopt;
    }

    for (const auto& banned : m_banned) {
        if (banned->contains(name)) {
            return std::nullopt;
        }
    }

    for (const auto& element : m_parent_first) {
        if (!element->contains(name)) {
            continue;
        }
        if (m_parent) {
            if (auto res = m_parent->resource(name)) {
                return res;
            }
        }
        return tag(element->resource(name));
    }

    if (auto res = resolve_own(name)) {
        return res;
    }

    if (m_parent) {
        return m_parent->resource(name);
    }
    return std::nullopt;
}

std::vector<Resource> Layer::resources(const std::string& name) const {
    std::vector<Resource> result;
    LayerPtr parent;
    {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        if (m_closed) {
            return result;
        }
        for (const auto& banned : m_banned) {
            if (banned->contains(name)) {
                return result;
            }
        }

        if (m_parent && is_parent_first(name)) {
            result = m_parent->resources(name);
        }

        if (m_resettable) {
            if (auto res = m_resettable->resource(name)) {
                result.push_back(*tag(std::move(res)));
            }
        }
        for (const auto& element : ordered_elements()) {
            if (auto res = element->resource(name)) {
                auto it = m_transformed.find(name);
                if (it != m_transformed.end()) {
                    res->data = it->second;
                }
                result.push_back(*tag(std::move(res)));
            }
        }
        if (m_parent && !is_parent_first(name) && (m_aggregate || result.empty())) {
            parent = m_parent;
        }
    }

    if (parent) {
        auto inherited = parent->resources(name);
        result.insert(result.end(), std::make_move_iterator(inherited.begin()),
                      std::make_move_iterator(inherited.end()));
    }
    return result;
}

std::set<std::string> Layer::provided_resources() const {
    std::set<std::string> names;
    std::set<std::string> banned;
    LayerPtr parent;
    {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        if (m_closed) {
            return names;
        }
        if (m_resettable) {
            names = m_resettable->provided_resources();
        }
        for (const auto& element : m_elements) {
            auto provided = element->provided_resources();
            names.insert(provided.begin(), provided.end());
        }
        for (const auto& element : m_parent_first) {
            auto provided = element->provided_resources();
            names.insert(provided.begin(), provided.end());
        }
        for (const auto& element : m_banned) {
            auto provided = element->provided_resources();
            banned.insert(provided.begin(), provided.end());
        }
        if (m_aggregate) {
            parent = m_parent;
        }
    }

    if (parent) {
        auto inherited = parent->provided_resources();
        names.insert(inherited.begin(), inherited.end());
    }
    for (const auto& name : banned) {
        names.erase(name);
    }
    return names;
}

bool Layer::contains(const std::string& name) const {
    return resource(name).has_value();
}

void Layer::reset(std::map<std::string, Bytes> resources, std::map<std::string, Bytes> transformed_units) {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    if (!m_resettable) {
        m_resettable = std::make_shared<MemoryElement>();
    }
    m_resettable->reset(std::move(resources));
    m_transformed = std::move(transformed_units);
}

void Layer::close() {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    if (m_closed) {
        return;
    }
    m_closed = true;
    m_elements.clear();
    m_parent_first.clear();
    m_lesser_priority.clear();
    m_banned.clear();
    m_resettable.reset();
    m_transformed.clear();
    devloop_core::layer_logger()->debug("Closed layer '{}'", m_name);
}

bool Layer::is_closed() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_closed;
}

std::size_t Layer::element_count() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_elements.size();
}

} // namespace devloop_layer
