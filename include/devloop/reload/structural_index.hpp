#pragma once

/// @file structural_index.hpp
/// @brief Structural shape of the types defined by compiled units

#include <devloop/core/error.hpp>
#include <devloop/reload/dev_context.hpp>

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace devloop_reload {

using Bytes = std::vector<std::uint8_t>;

/// The externally visible members of one type. Two shapes are structurally
/// equal when their member signatures are identical; method bodies do not
/// participate.
struct TypeShape {
    std::string name;
    std::set<std::string> members;
    std::string unit;  ///< Name of the unit that defines the type

    [[nodiscard]] bool same_structure(const TypeShape& other) const {
        return name == other.name && members == other.members;
    }
};

/// (unit, type name) -> shape. Shapes are keyed per unit so that a type or
/// namespace spread over several units is compared unit by unit.
class StructuralIndex {
public:
    /// Add a shape; members of a repeated (unit, type) pair are unioned
    void add(const TypeShape& shape);

    [[nodiscard]] const TypeShape* find(const std::string& unit, const std::string& type_name) const;

    /// Shapes defined by one unit
    [[nodiscard]] std::vector<const TypeShape*> types_in_unit(const std::string& unit) const;

    /// Remember which file a unit name was indexed from
    void add_unit_path(const std::filesystem::path& path, const std::string& unit);

    /// Unit name recorded for a file, or nullptr when the file was not indexed
    [[nodiscard]] const std::string* unit_name_for(const std::filesystem::path& path) const;

    /// Copy every shape and unit path of another index, prefixing its unit
    /// names. Two modules that both emit "main.o" stay apart under distinct
    /// prefixes.
    void merge(const StructuralIndex& other, const std::string& unit_prefix = {});

    [[nodiscard]] std::size_t size() const { return m_types.size(); }
    [[nodiscard]] bool empty() const { return m_types.empty(); }

    [[nodiscard]] const std::map<std::pair<std::string, std::string>, TypeShape>& types() const { return m_types; }

private:
    std::map<std::pair<std::string, std::string>, TypeShape> m_types;
    std::map<std::filesystem::path, std::string> m_unit_paths;
};

// =============================================================================
// UnitIndexer
// =============================================================================

/// Extracts type shapes from compiled unit bytes
class UnitIndexer {
public:
    virtual ~UnitIndexer() = default;

    [[nodiscard]] virtual devloop_core::Result<std::vector<TypeShape>> index_unit(
        const std::string& unit_name, const Bytes& bytes) = 0;
};

/// Builds shapes from the defined symbols of an object file, as listed by
/// `nm -C --defined-only`. Members are grouped by their enclosing type;
/// free symbols are grouped under "<free:unit>".
class SymbolTableIndexer : public UnitIndexer {
public:
    explicit SymbolTableIndexer(std::string nm_path = "nm");

    [[nodiscard]] devloop_core::Result<std::vector<TypeShape>> index_unit(
        const std::string& unit_name, const Bytes& bytes) override;

    /// Group demangled `nm` output lines into shapes
    [[nodiscard]] static std::vector<TypeShape> parse_symbols(const std::string& unit_name, const std::string& nm_output);

private:
    std::string m_nm_path;
};

/// Index every compiled unit under output_root; unit names are relative to it
[[nodiscard]] devloop_core::Result<std::shared_ptr<StructuralIndex>> build_index(
    UnitIndexer& indexer,
    const std::filesystem::path& output_root,
    const std::string& unit_extension);

/// Index the units of every module in one reload domain. With more than one
/// module, unit names are qualified as "<module>:<relative name>".
[[nodiscard]] devloop_core::Result<std::shared_ptr<StructuralIndex>> build_index(
    UnitIndexer& indexer,
    const DevModeContext& context,
    ReloadDomain domain,
    const std::string& unit_extension);

} // namespace devloop_reload
