/// @file structural_index.cpp
/// @brief StructuralIndex and the nm-based unit indexer

#include <devloop/reload/structural_index.hpp>
#include <devloop/core/log.hpp>

#include "process.hpp"

#include <atomic>
#include <fstream>
#include <sstream>

#include <unistd.h>

namespace devloop_reload {

namespace fs = std::filesystem;

using devloop_core::Err;
using devloop_core::Error;
using devloop_core::HotSwapError;
using devloop_core::Ok;
using devloop_core::Result;

// =============================================================================
// StructuralIndex
// =============================================================================

void StructuralIndex::add(const TypeShape& shape) {
    auto key = std::make_pair(shape.unit, shape.name);
    auto it = m_types.find(key);
    if (it == m_types.end()) {
        m_types.emplace(std::move(key), shape);
    } else {
        it->second.members.insert(shape.members.begin(), shape.members.end());
    }
}

const TypeShape* StructuralIndex::find(const std::string& unit, const std::string& type_name) const {
    auto it = m_types.find(std::make_pair(unit, type_name));
    return it != m_types.end() ? &it->second : nullptr;
}

std::vector<const TypeShape*> StructuralIndex::types_in_unit(const std::string& unit) const {
    std::vector<const TypeShape*> shapes;
    for (auto it = m_types.lower_bound(std::make_pair(unit, std::string())); it != m_types.end(); ++it) {
        if (it->first.first != unit) {
            break;
        }
        shapes.push_back(&it->second);
    }
    return shapes;
}

void StructuralIndex::add_unit_path(const fs::path& path, const std::string& unit) {
    m_unit_paths[path.lexically_normal()] = unit;
}

const std::string* StructuralIndex::unit_name_for(const fs::path& path) const {
    auto it = m_unit_paths.find(path.lexically_normal());
    return it != m_unit_paths.end() ? &it->second : nullptr;
}

void StructuralIndex::merge(const StructuralIndex& other, const std::string& unit_prefix) {
    for (const auto& [key, shape] : other.m_types) {
        TypeShape copy = shape;
        copy.unit = unit_prefix + shape.unit;
        add(copy);
    }
    for (const auto& [path, unit] : other.m_unit_paths) {
        m_unit_paths[path] = unit_prefix + unit;
    }
}

// =============================================================================
// Symbol parsing
// =============================================================================

namespace {

/// Split a demangled symbol into (qualified name, parameter list and qualifiers)
std::pair<std::string, std::string> split_signature(const std::string& name) {
    int depth = 0;
    for (std::size_t i = 0; i < name.size(); ++i) {
        bool at_component_start = i == 0 || name[i - 1] == ':' || name[i - 1] == ' ';
        if (depth == 0 && at_component_start && name.compare(i, 8, "operator") == 0) {
            std::size_t j = i + 8;
            if (name.compare(j, 2, "()") == 0) {
                j += 2;
            }
            auto paren = name.find('(', j);
            if (paren == std::string::npos) {
                return {name, {}};
            }
            return {name.substr(0, paren), name.substr(paren)};
        }
        char c = name[i];
        if (c == '<') {
            ++depth;
        } else if (c == '>' && depth > 0) {
            --depth;
        } else if (c == '(' && depth == 0) {
            return {name.substr(0, i), name.substr(i)};
        }
    }
    return {name, {}};
}

/// Split on "::" outside template arguments
std::vector<std::string> split_scopes(const std::string& qualified) {
    std::vector<std::string> parts;
    int depth = 0;
    std::size_t start = 0;
    for (std::size_t i = 0; i < qualified.size(); ++i) {
        char c = qualified[i];
        if (c == '<') {
            ++depth;
        } else if (c == '>' && depth > 0) {
            --depth;
        } else if (depth == 0 && c == ':' && i + 1 < qualified.size() && qualified[i + 1] == ':') {
            parts.push_back(qualified.substr(start, i - start));
            start = i + 2;
            ++i;
        }
    }
    parts.push_back(qualified.substr(start));
    return parts;
}

/// Drop a leading return type ("void ns::f<int>" -> "ns::f<int>")
std::string strip_return_type(const std::string& qualified) {
    if (qualified.find("operator") != std::string::npos) {
        return qualified;
    }
    int depth = 0;
    std::size_t last_space = std::string::npos;
    for (std::size_t i = 0; i < qualified.size(); ++i) {
        char c = qualified[i];
        if (c == '<') {
            ++depth;
        } else if (c == '>' && depth > 0) {
            --depth;
        } else if (c == ' ' && depth == 0) {
            last_space = i;
        }
    }
    return last_space == std::string::npos ? qualified : qualified.substr(last_space + 1);
}

bool is_defined_symbol_type(char t) {
    switch (t) {
        case 'T': case 't': case 'W': case 'w':
        case 'D': case 'd': case 'B': case 'b':
        case 'R': case 'r': case 'V': case 'v':
            return true;
        default:
            return false;
    }
}

void replace_all(std::string& s, const std::string& from, const std::string& to) {
    for (std::size_t pos = s.find(from); pos != std::string::npos; pos = s.find(from, pos + to.size())) {
        s.replace(pos, from.size(), to);
    }
}

} // anonymous namespace

std::vector<TypeShape> SymbolTableIndexer::parse_symbols(const std::string& unit_name, const std::string& nm_output) {
    static const std::vector<std::string> type_info_prefixes = {
        "vtable for ", "typeinfo for ", "typeinfo name for ", "VTT for ",
    };
    static const std::vector<std::string> passthrough_prefixes = {
        "non-virtual thunk to ", "virtual thunk to ", "guard variable for ",
    };

    StructuralIndex grouped;
    std::istringstream stream(nm_output);
    std::string line;
    while (std::getline(stream, line)) {
        // "<address> <type> <name>"
        auto first_space = line.find(' ');
        if (first_space == std::string::npos || first_space + 3 > line.size() || line[first_space + 2] != ' ') {
            continue;
        }
        char type = line[first_space + 1];
        if (!is_defined_symbol_type(type)) {
            continue;
        }
        std::string name = line.substr(first_space + 3);
        replace_all(name, "(anonymous namespace)", "{anonymous}");

        for (const auto& prefix : passthrough_prefixes) {
            if (name.rfind(prefix, 0) == 0) {
                name.erase(0, prefix.size());
            }
        }

        TypeShape shape;
        shape.unit = unit_name;

        bool type_info = false;
        for (const auto& prefix : type_info_prefixes) {
            if (name.rfind(prefix, 0) == 0) {
                shape.name = name.substr(prefix.size());
                shape.members.insert(prefix.substr(0, prefix.size() - 5));
                type_info = true;
                break;
            }
        }

        if (!type_info) {
            auto [qualified, params] = split_signature(name);
            auto scopes = split_scopes(strip_return_type(qualified));
            std::string member = scopes.back() + params;
            scopes.pop_back();
            if (scopes.empty()) {
                shape.name = "<free:" + unit_name + ">";
            } else {
                std::string owner;
                for (const auto& scope : scopes) {
                    if (!owner.empty()) owner += "::";
                    owner += scope;
                }
                shape.name = owner;
            }
            shape.members.insert(member);
        }
        grouped.add(shape);
    }

    std::vector<TypeShape> shapes;
    shapes.reserve(grouped.size());
    for (const auto& [key, shape] : grouped.types()) {
        shapes.push_back(shape);
    }
    return shapes;
}

// =============================================================================
// SymbolTableIndexer
// =============================================================================

SymbolTableIndexer::SymbolTableIndexer(std::string nm_path)
    : m_nm_path(std::move(nm_path)) {}

Result<std::vector<TypeShape>> SymbolTableIndexer::index_unit(const std::string& unit_name, const Bytes& bytes) {
    static std::atomic<std::uint64_t> counter{0};

    std::error_code ec;
    fs::path scratch = fs::temp_directory_path(ec) /
        ("devloop-index-" + std::to_string(::getpid()) + "-" + std::to_string(counter.fetch_add(1)) + ".o");
    if (ec) {
        return Err<std::vector<TypeShape>>(Error(HotSwapError::index_failed(unit_name, ec.message())));
    }

    {
        std::ofstream out(scratch, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        if (!out) {
            return Err<std::vector<TypeShape>>(Error(HotSwapError::index_failed(unit_name, "cannot write scratch file")));
        }
    }

    auto result = detail::execute_process(m_nm_path, {"-C", "--defined-only", scratch.string()});
    fs::remove(scratch, ec);

    if (!result.launched || result.exit_code != 0) {
        return Err<std::vector<TypeShape>>(Error(HotSwapError::index_failed(unit_name,
            result.launched ? result.output : "cannot run " + m_nm_path)));
    }
    return Ok(parse_symbols(unit_name, result.output));
}

namespace {

/// Index every unit under output_root into index, naming units unit_prefix + relative path
Result<void> index_root(
    UnitIndexer& indexer,
    const fs::path& output_root,
    const std::string& unit_extension,
    const std::string& unit_prefix,
    StructuralIndex& index)
{
    std::error_code ec;
    if (!fs::is_directory(output_root, ec)) {
        return Ok();
    }

    std::error_code entry_ec;
    for (fs::recursive_directory_iterator it(output_root, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(entry_ec) || it->path().extension() != unit_extension) {
            continue;
        }
        std::ifstream in(it->path(), std::ios::binary);
        Bytes bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        std::string name = unit_prefix + it->path().lexically_relative(output_root).generic_string();

        auto shapes = indexer.index_unit(name, bytes);
        if (!shapes) {
            return Err(shapes.error());
        }
        for (const auto& shape : *shapes) {
            index.add(shape);
        }
        index.add_unit_path(it->path(), name);
    }
    if (ec) {
        return Err(Error(devloop_core::ErrorCode::IOError,
            "Error walking " + output_root.string() + ": " + ec.message()));
    }
    return Ok();
}

} // anonymous namespace

Result<std::shared_ptr<StructuralIndex>> build_index(
    UnitIndexer& indexer,
    const fs::path& output_root,
    const std::string& unit_extension)
{
    auto index = std::make_shared<StructuralIndex>();
    auto indexed = index_root(indexer, output_root, unit_extension, {}, *index);
    if (!indexed) {
        return Err<std::shared_ptr<StructuralIndex>>(indexed.error());
    }
    return Ok(std::move(index));
}

Result<std::shared_ptr<StructuralIndex>> build_index(
    UnitIndexer& indexer,
    const DevModeContext& context,
    ReloadDomain domain,
    const std::string& unit_extension)
{
    auto index = std::make_shared<StructuralIndex>();
    const bool qualify = context.modules.size() > 1;
    for (const auto& module : context.modules) {
        const CompilationUnit* unit = DevModeContext::unit_for(module, domain);
        if (!unit || unit->output_path.empty()) {
            continue;
        }
        // Units are indexed under their qualified name so that free symbol
        // groups ("<free:unit>") match what a later swap indexes
        auto indexed = index_root(indexer, unit->output_path, unit_extension,
            qualify ? module.name + ":" : std::string(), *index);
        if (!indexed) {
            return Err<std::shared_ptr<StructuralIndex>>(indexed.error());
        }
    }
    return Ok(std::move(index));
}

} // namespace devloop_reload
