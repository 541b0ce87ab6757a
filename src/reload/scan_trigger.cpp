/// @file scan_trigger.cpp
/// @brief ScanTrigger and FileSystemWatcher implementation

#include <devloop/reload/scan_trigger.hpp>
#include <devloop/core/log.hpp>

#include <exception>

namespace devloop_reload {

namespace fs = std::filesystem;

// =============================================================================
// ScanTrigger
// =============================================================================

ScanTrigger::ScanTrigger(std::string name, Action action,
                         std::chrono::milliseconds period,
                         std::chrono::milliseconds coalesce_delay)
    : m_name(std::move(name))
    , m_action(std::move(action))
    , m_period(period)
    , m_coalesce_delay(coalesce_delay) {}

ScanTrigger::~ScanTrigger() {
    stop();
}

void ScanTrigger::start(bool run_immediately) {
    if (m_running.exchange(true)) {
        return;
    }
    if (m_thread.joinable()) {
        m_thread.join();
    }
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stop = false;
        m_pending = run_immediately;
    }
    m_finished.store(false);
    m_thread = std::thread(&ScanTrigger::worker, this);
    devloop_core::scan_logger()->debug("{} started (period {}ms)", m_name, m_period.count());
}

void ScanTrigger::request_stop() {
    m_running.store(false);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stop = true;
    }
    m_cv.notify_all();
}

void ScanTrigger::stop() {
    request_stop();
    if (!m_thread.joinable()) {
        return;
    }
    if (m_thread.get_id() == std::this_thread::get_id()) {
        // Stopped from inside the action; the worker exits when it returns
        m_thread.detach();
        return;
    }
    m_thread.join();
    devloop_core::scan_logger()->debug("{} stopped", m_name);
}

void ScanTrigger::notify() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_pending = true;
    }
    m_cv.notify_all();
}

void ScanTrigger::invoke() {
    try {
        m_action();
    } catch (const std::exception& e) {
        devloop_core::scan_logger()->error("{}: scan failed: {}", m_name, e.what());
    }
    m_runs.fetch_add(1);
}

void ScanTrigger::worker() {
    std::unique_lock<std::mutex> lock(m_mutex);
    while (!m_stop) {
        m_cv.wait_for(lock, m_period, [this] { return m_stop || m_pending; });
        if (m_stop) {
            break;
        }

        if (m_pending && m_coalesce_delay.count() > 0) {
            // Split writes arrive as several events
            m_cv.wait_for(lock, m_coalesce_delay, [this] { return m_stop; });
            if (m_stop) {
                break;
            }
        }
        m_pending = false;

        lock.unlock();
        invoke();
        lock.lock();
    }
    m_finished.store(true);
}

// =============================================================================
// FileSystemWatcher
// =============================================================================

FileSystemWatcher::FileSystemWatcher() = default;

FileSystemWatcher::~FileSystemWatcher() {
    stop();
}

FileSystemWatcher::Snapshot FileSystemWatcher::take_snapshot(const fs::path& dir) {
    Snapshot files;
    std::error_code ec;
    std::error_code entry_ec;
    auto options = fs::directory_options::skip_permission_denied;
    for (fs::recursive_directory_iterator it(dir, options, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(entry_ec)) {
            auto time = it->last_write_time(entry_ec);
            if (!entry_ec) {
                files[it->path()] = time;
            }
        }
    }
    return files;
}

void FileSystemWatcher::watch_path(const fs::path& dir) {
    WatchEntry entry;
    entry.path = dir;
    std::error_code ec;
    entry.exists = fs::is_directory(dir, ec);
    if (entry.exists) {
        entry.files = take_snapshot(dir);
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& existing : m_watches) {
        if (existing.path == dir) {
            return;
        }
    }
    m_watches.push_back(std::move(entry));
}

void FileSystemWatcher::unwatch_all() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_watches.clear();
}

void FileSystemWatcher::set_callback(ChangeCallback callback) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_callback = std::move(callback);
}

std::size_t FileSystemWatcher::watched_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_watches.size();
}

std::size_t FileSystemWatcher::missing_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::size_t missing = 0;
    for (const auto& entry : m_watches) {
        if (!entry.exists) {
            ++missing;
        }
    }
    return missing;
}

std::vector<fs::path> FileSystemWatcher::poll() {
    std::vector<fs::path> changes;
    std::lock_guard<std::mutex> lock(m_mutex);

    for (auto& entry : m_watches) {
        std::error_code ec;
        bool exists = fs::is_directory(entry.path, ec);

        if (!exists) {
            if (entry.exists) {
                for (const auto& [path, time] : entry.files) {
                    changes.push_back(path);
                }
                entry.files.clear();
                entry.exists = false;
            }
            continue;
        }

        if (!entry.exists) {
            // Directory appeared since the last poll
            entry.exists = true;
            changes.push_back(entry.path);
        }

        Snapshot current = take_snapshot(entry.path);
        for (const auto& [path, time] : current) {
            auto it = entry.files.find(path);
            if (it == entry.files.end() || it->second != time) {
                changes.push_back(path);
            }
        }
        for (const auto& [path, time] : entry.files) {
            if (current.find(path) == current.end()) {
                changes.push_back(path);
            }
        }
        entry.files = std::move(current);
    }
    return changes;
}

void FileSystemWatcher::start(std::chrono::milliseconds poll_interval) {
    if (m_running.exchange(true)) {
        return;
    }
    m_poll_interval = poll_interval;
    m_thread = std::thread(&FileSystemWatcher::watch_thread, this);
}

void FileSystemWatcher::stop() {
    if (!m_running.exchange(false)) {
        return;
    }
    m_wait_cv.notify_all();
    if (m_thread.joinable()) {
        m_thread.join();
    }
}

void FileSystemWatcher::watch_thread() {
    while (m_running.load()) {
        auto changes = poll();

        if (!changes.empty()) {
            ChangeCallback callback;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                callback = m_callback;
            }
            if (callback) {
                try {
                    callback(changes);
                } catch (const std::exception& e) {
                    devloop_core::scan_logger()->error("File change callback failed: {}", e.what());
                }
            }
        }

        std::unique_lock<std::mutex> lock(m_wait_mutex);
        m_wait_cv.wait_for(lock, m_poll_interval, [this] { return !m_running.load(); });
    }
}

} // namespace devloop_reload
