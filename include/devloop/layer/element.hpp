#pragma once

/// @file element.hpp
/// @brief Elements: immutable views over one code or resource root
///
/// An Element answers "do you have resource N, and what are its bytes".
/// Concrete elements wrap a directory, an uncompressed tar archive or an
/// in-memory map. Decorators hide names (FilteredElement) or restrict a
/// delegate to compiled units (UnitFilteredElement).

#include <devloop/core/error.hpp>

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>

namespace devloop_layer {

using Bytes = std::vector<std::uint8_t>;

/// Resource name of the optional per-element manifest
inline constexpr const char* k_manifest_name = "manifest.json";

/// A resolved resource
struct Resource {
    std::string name;
    Bytes data;
    std::filesystem::path root;  ///< Root of the element that supplied it (empty for memory elements)
    std::string layer;           ///< Name of the layer that resolved it (set by Layer)
};

/// Flat key/value attributes read from an element's manifest.json
struct Manifest {
    std::map<std::string, std::string> attributes;

    [[nodiscard]] const std::string* get(const std::string& key) const {
        auto it = attributes.find(key);
        return it != attributes.end() ? &it->second : nullptr;
    }
};

// =============================================================================
// Element
// =============================================================================

/// Interface for one code/resource root
class Element {
public:
    virtual ~Element() = default;

    /// Filesystem root, empty for synthetic elements
    [[nodiscard]] virtual const std::filesystem::path& root() const = 0;

    /// Resource bytes, or nullopt if this element does not provide the name
    [[nodiscard]] virtual std::optional<Resource> resource(const std::string& name) const = 0;

    /// Names this element provides
    [[nodiscard]] virtual std::set<std::string> provided_resources() const = 0;

    /// Cheaper than resource() for elements that keep an index
    [[nodiscard]] virtual bool contains(const std::string& name) const {
        return resource(name).has_value();
    }

    /// Manifest attributes, parsed from k_manifest_name when present
    [[nodiscard]] virtual std::optional<Manifest> manifest() const;

    /// Release I/O handles. Idempotent; a closed element provides nothing.
    virtual void close() {}

    /// Open a directory or archive path. Missing paths yield a directory
    /// element that serves whatever appears there later.
    [[nodiscard]] static devloop_core::Result<std::shared_ptr<Element>> from_path(const std::filesystem::path& path);
};

using ElementPtr = std::shared_ptr<Element>;

// =============================================================================
// Concrete Elements
// =============================================================================

/// Directory on disk, read live on every lookup
class DirectoryElement : public Element {
public:
    explicit DirectoryElement(std::filesystem::path root);

    [[nodiscard]] const std::filesystem::path& root() const override { return m_root; }
    [[nodiscard]] std::optional<Resource> resource(const std::string& name) const override;
    [[nodiscard]] std::set<std::string> provided_resources() const override;
    [[nodiscard]] bool contains(const std::string& name) const override;
    void close() override;

private:
    std::filesystem::path m_root;
    std::atomic<bool> m_closed{false};
};

/// Uncompressed tar archive (ustar, GNU long names and pax path records)
class ArchiveElement : public Element {
public:
    /// Read the archive index; fails for unreadable or malformed archives
    [[nodiscard]] static devloop_core::Result<std::shared_ptr<ArchiveElement>> open(const std::filesystem::path& path);

    ~ArchiveElement() override;

    [[nodiscard]] const std::filesystem::path& root() const override { return m_path; }
    [[nodiscard]] std::optional<Resource> resource(const std::string& name) const override;
    [[nodiscard]] std::set<std::string> provided_resources() const override;
    [[nodiscard]] bool contains(const std::string& name) const override;
    void close() override;

    [[nodiscard]] bool is_closed() const;

private:
    struct Entry {
        std::uint64_t offset = 0;
        std::uint64_t size = 0;
    };

    explicit ArchiveElement(std::filesystem::path path);

    std::filesystem::path m_path;
    std::map<std::string, Entry> m_entries;
    mutable std::mutex m_mutex;
    mutable std::ifstream m_stream;
    bool m_closed = false;
};

/// In-memory name to bytes map. Contents can be replaced wholesale.
class MemoryElement : public Element {
public:
    MemoryElement() = default;
    explicit MemoryElement(std::map<std::string, Bytes> resources);

    [[nodiscard]] const std::filesystem::path& root() const override { return m_root; }
    [[nodiscard]] std::optional<Resource> resource(const std::string& name) const override;
    [[nodiscard]] std::set<std::string> provided_resources() const override;
    [[nodiscard]] bool contains(const std::string& name) const override;

    /// Replace all contents
    void reset(std::map<std::string, Bytes> resources);

    [[nodiscard]] std::size_t size() const;

private:
    std::filesystem::path m_root;
    mutable std::shared_mutex m_mutex;
    std::map<std::string, Bytes> m_resources;
};

/// Element that provides nothing (non-archive artifacts)
class EmptyElement : public Element {
public:
    [[nodiscard]] const std::filesystem::path& root() const override { return m_root; }
    [[nodiscard]] std::optional<Resource> resource(const std::string&) const override { return std::nullopt; }
    [[nodiscard]] std::set<std::string> provided_resources() const override { return {}; }
    [[nodiscard]] bool contains(const std::string&) const override { return false; }

    /// Shared instance
    [[nodiscard]] static ElementPtr instance();

private:
    std::filesystem::path m_root;
};

// =============================================================================
// Decorators
// =============================================================================

/// Hides a fixed set of names from its delegate
class FilteredElement : public Element {
public:
    FilteredElement(ElementPtr delegate, std::set<std::string> hidden);

    [[nodiscard]] const std::filesystem::path& root() const override { return m_delegate->root(); }
    [[nodiscard]] std::optional<Resource> resource(const std::string& name) const override;
    [[nodiscard]] std::set<std::string> provided_resources() const override;
    [[nodiscard]] bool contains(const std::string& name) const override;
    [[nodiscard]] std::optional<Manifest> manifest() const override { return m_delegate->manifest(); }
    void close() override { m_delegate->close(); }

private:
    ElementPtr m_delegate;
    std::set<std::string> m_hidden;
};

/// Restricts a delegate to compiled units (names ending in the unit extension).
/// Used in banned buckets so that only the units of an application root are
/// banned while its plain resources stay visible through the parent.
class UnitFilteredElement : public Element {
public:
    UnitFilteredElement(ElementPtr delegate, std::string unit_extension);

    [[nodiscard]] const std::filesystem::path& root() const override { return m_delegate->root(); }
    [[nodiscard]] std::optional<Resource> resource(const std::string& name) const override;
    [[nodiscard]] std::set<std::string> provided_resources() const override;
    [[nodiscard]] bool contains(const std::string& name) const override;
    [[nodiscard]] std::optional<Manifest> manifest() const override { return m_delegate->manifest(); }
    void close() override { m_delegate->close(); }

    [[nodiscard]] bool is_unit(const std::string& name) const;

private:
    ElementPtr m_delegate;
    std::string m_extension;
};

} // namespace devloop_layer
