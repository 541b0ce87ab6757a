#pragma once

/// @file layer.hpp
/// @brief Layer: an ordered, filtered composition of Elements with a parent
///
/// Resolution of a resource name:
///   1. banned elements: a match makes the name unresolvable in this layer
///   2. parent-first elements: a match is served by the parent when the parent
///      has it, otherwise by the parent-first element itself
///   3. the resettable element
///   4. normal elements, then lesser-priority elements, in insertion order;
///      transformed-unit overrides replace bytes found here
///   5. the parent layer

#include <devloop/layer/element.hpp>

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>

namespace devloop_layer {

class Layer;
using LayerPtr = std::shared_ptr<Layer>;

class Layer {
public:
    class Builder;

    /// Start building a layer
    [[nodiscard]] static Builder builder(std::string name, LayerPtr parent, bool aggregate_parent_resources);

    ~Layer();

    Layer(const Layer&) = delete;
    Layer& operator=(const Layer&) = delete;

    [[nodiscard]] const std::string& name() const { return m_name; }
    [[nodiscard]] const LayerPtr& parent() const { return m_parent; }
    [[nodiscard]] bool aggregates_parent_resources() const { return m_aggregate; }

    /// Resolve one resource
    [[nodiscard]] std::optional<Resource> resource(const std::string& name) const;

    /// Every match: own elements first, then the parent's when aggregating
    /// (or when nothing local matched)
    [[nodiscard]] std::vector<Resource> resources(const std::string& name) const;

    /// Every name resolve() can serve
    [[nodiscard]] std::set<std::string> provided_resources() const;

    [[nodiscard]] bool contains(const std::string& name) const;

    /// True if a banned element of this layer provides the name
    [[nodiscard]] bool is_banned(const std::string& name) const;

    /// Replace the resettable element's contents and the transformed-unit overrides
    void reset(std::map<std::string, Bytes> resources, std::map<std::string, Bytes> transformed_units);

    /// Drop element references. Elements owned elsewhere stay open.
    void close();

    [[nodiscard]] bool is_closed() const;

    [[nodiscard]] std::size_t element_count() const;

private:
    Layer() = default;

    [[nodiscard]] std::optional<Resource> resolve_own(const std::string& name) const;
    [[nodiscard]] std::vector<ElementPtr> ordered_elements() const;
    [[nodiscard]] bool is_parent_first(const std::string& name) const;
    [[nodiscard]] std::optional<Resource> tag(std::optional<Resource> res) const;

    std::string m_name;
    LayerPtr m_parent;
    bool m_aggregate = false;

    mutable std::shared_mutex m_mutex;
    std::vector<ElementPtr> m_elements;
    std::vector<ElementPtr> m_parent_first;
    std::set<const Element*> m_lesser_priority;
    std::vector<ElementPtr> m_banned;
    std::shared_ptr<MemoryElement> m_resettable;
    std::map<std::string, Bytes> m_transformed;
    bool m_closed = false;
};

// =============================================================================
// Layer::Builder
// =============================================================================

class Layer::Builder {
public:
    Builder(std::string name, LayerPtr parent, bool aggregate_parent_resources);

    /// Normal bucket
    Builder& add_element(ElementPtr element);

    /// Served from the parent when the parent has the name. Callers also add
    /// the element to the normal bucket.
    Builder& add_parent_first_element(ElementPtr element);

    /// Consulted after every normal element. Callers also add the element to
    /// the normal bucket.
    Builder& add_lesser_priority_element(ElementPtr element);

    /// Names provided here are unresolvable in the built layer
    Builder& add_banned_element(ElementPtr element);

    Builder& set_resettable_element(std::shared_ptr<MemoryElement> element);

    Builder& set_transformed_units(std::map<std::string, Bytes> units);

    [[nodiscard]] LayerPtr build();

private:
    std::string m_name;
    LayerPtr m_parent;
    bool m_aggregate;
    std::vector<ElementPtr> m_elements;
    std::vector<ElementPtr> m_parent_first;
    std::vector<ElementPtr> m_lesser_priority;
    std::vector<ElementPtr> m_banned;
    std::shared_ptr<MemoryElement> m_resettable;
    std::map<std::string, Bytes> m_transformed;
};

} // namespace devloop_layer
