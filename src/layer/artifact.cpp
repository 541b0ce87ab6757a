/// @file artifact.cpp
/// @brief Artifact key parsing and application model helpers

#include <devloop/layer/artifact.hpp>

#include <sstream>

namespace devloop_layer {

using devloop_core::Err;
using devloop_core::Error;
using devloop_core::ErrorCode;
using devloop_core::Ok;
using devloop_core::Result;

Result<ArtifactKey> ArtifactKey::parse(const std::string& text) {
    std::vector<std::string> parts;
    std::istringstream iss(text);
    std::string part;
    while (std::getline(iss, part, ':')) {
        parts.push_back(part);
    }

    if (parts.size() < 2 || parts.size() > 4 || parts[0].empty() || parts[1].empty()) {
        return Err<ArtifactKey>(Error(ErrorCode::InvalidArgument,
            "Artifact key must be group:name[:classifier[:type]], got '" + text + "'"));
    }

    ArtifactKey key;
    key.group = parts[0];
    key.name = parts[1];
    if (parts.size() > 2) {
        key.classifier = parts[2];
    }
    if (parts.size() > 3 && !parts[3].empty()) {
        key.type = parts[3];
    }
    return Ok(std::move(key));
}

std::string ArtifactKey::to_string() const {
    std::string out = group + ":" + name;
    if (!classifier.empty() || type != "archive") {
        out += ":" + classifier;
    }
    if (type != "archive") {
        out += ":" + type;
    }
    return out;
}

std::vector<const Artifact*> ApplicationModel::runtime_dependencies() const {
    std::vector<const Artifact*> result;
    for (const auto& dep : dependencies) {
        if (dep.runtime) {
            result.push_back(&dep);
        }
    }
    return result;
}

std::set<std::string> ClassLoadingConfig::all_removed_resources() const {
    std::set<std::string> names;
    for (const auto& [key, list] : removed_resources) {
        names.insert(list.begin(), list.end());
    }
    return names;
}

} // namespace devloop_layer
