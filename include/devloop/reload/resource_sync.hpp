#pragma once

/// @file resource_sync.hpp
/// @brief Mirrors resource roots into output roots and tracks watched files

#include <devloop/reload/dev_context.hpp>
#include <devloop/reload/timestamp_set.hpp>

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <regex>
#include <set>
#include <string>
#include <vector>

namespace devloop_reload {

/// Called after a resource is copied (module, path relative to its root)
using CopyResourceNotification = std::function<void(const ModuleInfo&, const std::string&)>;

/// Translate a glob ("**", "*", "?", "{a,b}", "[...]") into an anchored regex
[[nodiscard]] std::regex glob_to_regex(const std::string& glob);

class ResourceSynchronizer {
public:
    explicit ResourceSynchronizer(const DevModeContext& context);

    void set_copy_resource_notification(CopyResourceNotification notification) {
        m_copy_notification = std::move(notification);
    }

    void set_partial_write_delay(std::chrono::milliseconds delay) { m_partial_write_delay = delay; }

    /// Mirror resources and check watched files for one domain. Returns the
    /// relative paths of copied resources and of changed watched files.
    std::set<std::string> check_for_file_change(ReloadDomain domain, TimestampSet& timestamps);

    /// Install the watched paths (path -> restart required) and record their
    /// current times. Main installs clear previously recorded watched times;
    /// test installs cover both the test and main resource roots. Glob
    /// entries are expanded into the concrete files they match.
    void set_watched_file_paths(const std::map<std::string, bool>& watched, TimestampSet& timestamps, bool is_test);

private:
    /// Resource roots and output root of a unit, or nothing when it has neither
    struct Roots {
        std::vector<std::filesystem::path> roots;
        std::filesystem::path output;
        bool copy = true;
    };

    [[nodiscard]] static std::optional<Roots> roots_for(const CompilationUnit& unit);

    void mirror_resources(const ModuleInfo& module, const CompilationUnit& unit, const Roots& roots,
                          TimestampSet& timestamps, std::set<std::string>& changed);

    void check_watched_in_roots(const Roots& roots, TimestampSet& timestamps, std::set<std::string>& changed);

    void check_absolute_watched(TimestampSet& timestamps, std::set<std::string>& changed);

    /// Re-read the time of a changed watched file, waiting once if it is empty
    FileTime settle(const std::filesystem::path& file);

    const DevModeContext& m_context;
    CopyResourceNotification m_copy_notification;
    std::chrono::milliseconds m_partial_write_delay{200};

    std::mutex m_mutex;
    std::map<std::string, std::set<std::filesystem::path>> m_corresponding_resources;
};

} // namespace devloop_reload
