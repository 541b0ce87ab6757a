#pragma once

/// @file scan_result.hpp
/// @brief Compiled units added, changed and deleted by one scan

#include <filesystem>
#include <set>
#include <string>

namespace devloop_reload {

struct ScanResult {
    std::set<std::filesystem::path> added_units;
    std::set<std::filesystem::path> changed_units;
    std::set<std::filesystem::path> deleted_units;

    /// Same units as names relative to their output root ("a/b/foo.o")
    std::set<std::string> added_names;
    std::set<std::string> changed_names;
    std::set<std::string> deleted_names;

    bool compilation_happened = false;

    void add_added(const std::filesystem::path& output_root, const std::filesystem::path& unit) {
        added_units.insert(unit);
        added_names.insert(unit.lexically_relative(output_root).generic_string());
    }

    void add_changed(const std::filesystem::path& output_root, const std::filesystem::path& unit) {
        changed_units.insert(unit);
        changed_names.insert(unit.lexically_relative(output_root).generic_string());
    }

    void add_deleted(const std::filesystem::path& output_root, const std::filesystem::path& unit) {
        deleted_units.insert(unit);
        deleted_names.insert(unit.lexically_relative(output_root).generic_string());
    }

    [[nodiscard]] bool is_changed() const {
        return !added_units.empty() || !changed_units.empty() || !deleted_units.empty();
    }

    /// Union of two results
    [[nodiscard]] static ScanResult merge(const ScanResult& a, const ScanResult& b) {
        ScanResult out = a;
        out.added_units.insert(b.added_units.begin(), b.added_units.end());
        out.changed_units.insert(b.changed_units.begin(), b.changed_units.end());
        out.deleted_units.insert(b.deleted_units.begin(), b.deleted_units.end());
        out.added_names.insert(b.added_names.begin(), b.added_names.end());
        out.changed_names.insert(b.changed_names.begin(), b.changed_names.end());
        out.deleted_names.insert(b.deleted_names.begin(), b.deleted_names.end());
        out.compilation_happened = a.compilation_happened || b.compilation_happened;
        return out;
    }
};

} // namespace devloop_reload
