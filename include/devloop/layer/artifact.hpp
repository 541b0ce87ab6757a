#pragma once

/// @file artifact.hpp
/// @brief Artifact identity and the application model consumed by layer composition

#include <devloop/core/error.hpp>

#include <compare>
#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace devloop_layer {

// =============================================================================
// ArtifactKey
// =============================================================================

/// Artifact coordinates: group:name[:classifier][:type]
struct ArtifactKey {
    std::string group;
    std::string name;
    std::string classifier;
    std::string type = "archive";

    /// Parse "group:name[:classifier[:type]]"
    [[nodiscard]] static devloop_core::Result<ArtifactKey> parse(const std::string& text);

    [[nodiscard]] std::string to_string() const;

    auto operator<=>(const ArtifactKey&) const = default;
    bool operator==(const ArtifactKey&) const = default;
};

// =============================================================================
// Artifact
// =============================================================================

/// A resolved dependency. Read-only to the layer engine.
struct Artifact {
    ArtifactKey key;
    std::vector<std::filesystem::path> paths;

    /// Part of the runtime classpath (deployment-only artifacts are not)
    bool runtime = true;

    /// Only archives contribute content; any other type yields an empty element
    [[nodiscard]] bool is_archive() const { return key.type == "archive"; }
};

/// An extra archive added by the bootstrap caller rather than the model
struct AdditionalArchive {
    std::vector<std::filesystem::path> paths;
    bool hot_reloadable = false;
};

// =============================================================================
// ApplicationModel
// =============================================================================

/// Dependency graph as produced by the resolver, plus the model's own
/// parent-first and lower-priority markers
struct ApplicationModel {
    std::vector<Artifact> dependencies;
    std::set<ArtifactKey> parent_first;
    std::set<ArtifactKey> lower_priority;

    /// Dependencies that belong on the runtime classpath
    [[nodiscard]] std::vector<const Artifact*> runtime_dependencies() const;
};

/// User-configured classification applied on top of the model
struct ClassLoadingConfig {
    std::set<ArtifactKey> parent_first;
    std::set<ArtifactKey> lesser_priority;
    std::set<ArtifactKey> reloadable;
    std::set<ArtifactKey> removed_artifacts;
    std::map<ArtifactKey, std::vector<std::string>> removed_resources;

    /// Union of every removed resource name
    [[nodiscard]] std::set<std::string> all_removed_resources() const;
};

} // namespace devloop_layer
