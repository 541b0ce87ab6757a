/// @file timestamp_set.cpp
/// @brief TimestampSet implementation

#include <devloop/reload/timestamp_set.hpp>

namespace devloop_reload {

std::optional<FileTime> modification_time(const std::filesystem::path& path) {
    std::error_code ec;
    auto time = std::filesystem::last_write_time(path, ec);
    if (ec) {
        return std::nullopt;
    }
    return time;
}

std::map<std::string, bool> TimestampSet::watched_paths() const {
    std::lock_guard<std::mutex> lock(m_paths_mutex);
    return m_watched_paths;
}

void TimestampSet::set_watched_paths(std::map<std::string, bool> paths) {
    std::lock_guard<std::mutex> lock(m_paths_mutex);
    m_watched_paths = std::move(paths);
}

void TimestampSet::merge(const TimestampSet& other) {
    if (&other == this) {
        return;
    }
    m_watched_file_timestamps.put_all(other.m_watched_file_timestamps.snapshot());
    m_unit_timestamps.put_all(other.m_unit_timestamps.snapshot());
    m_unit_sources.put_all(other.m_unit_sources.snapshot());

    auto theirs = other.watched_paths();
    std::lock_guard<std::mutex> lock(m_paths_mutex);
    for (auto& [path, restart] : theirs) {
        m_watched_paths[path] = restart;
    }
}

} // namespace devloop_reload
