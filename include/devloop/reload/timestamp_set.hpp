#pragma once

/// @file timestamp_set.hpp
/// @brief Per-domain record of watched files, compiled units and unit to source mappings

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>

namespace devloop_reload {

using FileTime = std::filesystem::file_time_type;

/// Recorded time for a watched file that does not exist
inline constexpr FileTime k_absent_time = FileTime::min();

/// Modification time, or nullopt when the file cannot be stat'ed
[[nodiscard]] std::optional<FileTime> modification_time(const std::filesystem::path& path);

// =============================================================================
// ConcurrentMap
// =============================================================================

/// Map guarded by a shared mutex. Every operation is a short critical
/// section so that readers never wait behind a scan.
template<typename K, typename V>
class ConcurrentMap {
public:
    [[nodiscard]] std::optional<V> get(const K& key) const {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        auto it = m_map.find(key);
        if (it == m_map.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    [[nodiscard]] bool contains(const K& key) const {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        return m_map.count(key) > 0;
    }

    void put(const K& key, V value) {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        m_map[key] = std::move(value);
    }

    /// Insert only if absent; returns the previous value if there was one
    std::optional<V> put_if_absent(const K& key, V value) {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        auto [it, inserted] = m_map.emplace(key, std::move(value));
        if (inserted) {
            return std::nullopt;
        }
        return it->second;
    }

    void put_all(const std::map<K, V>& values) {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        for (const auto& [k, v] : values) {
            m_map[k] = v;
        }
    }

    bool erase(const K& key) {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        return m_map.erase(key) > 0;
    }

    void clear() {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        m_map.clear();
    }

    [[nodiscard]] std::size_t size() const {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        return m_map.size();
    }

    [[nodiscard]] std::map<K, V> snapshot() const {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        return m_map;
    }

private:
    mutable std::shared_mutex m_mutex;
    std::map<K, V> m_map;
};

// =============================================================================
// TimestampSet
// =============================================================================

/// Timestamps for one reload domain (main or test)
class TimestampSet {
public:
    using PathTimes = ConcurrentMap<std::filesystem::path, FileTime>;
    using UnitSources = ConcurrentMap<std::filesystem::path, std::filesystem::path>;

    /// Absolute watched file path -> last seen modification time (k_absent_time if missing)
    [[nodiscard]] PathTimes& watched_file_timestamps() { return m_watched_file_timestamps; }
    [[nodiscard]] const PathTimes& watched_file_timestamps() const { return m_watched_file_timestamps; }

    /// Compiled unit path -> last seen modification time
    [[nodiscard]] PathTimes& unit_timestamps() { return m_unit_timestamps; }
    [[nodiscard]] const PathTimes& unit_timestamps() const { return m_unit_timestamps; }

    /// Compiled unit path -> source path
    [[nodiscard]] UnitSources& unit_sources() { return m_unit_sources; }
    [[nodiscard]] const UnitSources& unit_sources() const { return m_unit_sources; }

    /// Watched paths (relative to resource roots, or absolute) -> restart required on change
    [[nodiscard]] std::map<std::string, bool> watched_paths() const;
    void set_watched_paths(std::map<std::string, bool> paths);

    /// Add all of other's entries; watched paths are unioned, other wins on conflicts
    void merge(const TimestampSet& other);

private:
    PathTimes m_watched_file_timestamps;
    PathTimes m_unit_timestamps;
    UnitSources m_unit_sources;

    mutable std::mutex m_paths_mutex;
    std::map<std::string, bool> m_watched_paths;
};

} // namespace devloop_reload
