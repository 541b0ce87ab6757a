#pragma once

/// @file scan_trigger.hpp
/// @brief Timer and file system event producers that drive scans

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace devloop_reload {

// =============================================================================
// ScanTrigger
// =============================================================================

/// One worker thread that runs a scan action on a fixed period and whenever
/// notify() is called. Requests never queue: any number of notifications
/// made before the worker wakes collapse into one run. Event wakeups wait a
/// coalescing delay first so that split writes produce a single scan.
class ScanTrigger {
public:
    using Action = std::function<void()>;

    ScanTrigger(std::string name, Action action,
                std::chrono::milliseconds period = std::chrono::milliseconds(1000),
                std::chrono::milliseconds coalesce_delay = std::chrono::milliseconds(0));
    ~ScanTrigger();

    ScanTrigger(const ScanTrigger&) = delete;
    ScanTrigger& operator=(const ScanTrigger&) = delete;

    /// Start the worker; optionally request a first run right away
    void start(bool run_immediately = false);

    /// Stop and join the worker. A run in progress completes first.
    void stop();

    /// Ask the worker to exit after any run in progress, without waiting
    void request_stop();

    /// Request a run
    void notify();

    [[nodiscard]] bool is_running() const { return m_running.load(); }

    /// True once the worker has returned (or was never started)
    [[nodiscard]] bool is_finished() const { return m_finished.load(); }

    [[nodiscard]] const std::string& name() const { return m_name; }

    /// Completed runs since construction
    [[nodiscard]] std::uint64_t run_count() const { return m_runs.load(); }

    [[nodiscard]] std::chrono::milliseconds period() const { return m_period; }
    [[nodiscard]] std::chrono::milliseconds coalesce_delay() const { return m_coalesce_delay; }

private:
    void worker();
    void invoke();

    std::string m_name;
    Action m_action;
    std::chrono::milliseconds m_period;
    std::chrono::milliseconds m_coalesce_delay;

    std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_pending = false;
    bool m_stop = false;

    std::thread m_thread;
    std::atomic<bool> m_running{false};
    std::atomic<bool> m_finished{true};
    std::atomic<std::uint64_t> m_runs{0};
};

// =============================================================================
// FileSystemWatcher
// =============================================================================

/// Polls watched directories for added, modified and removed files.
/// Directories that do not exist yet are checked on every poll and
/// reported (with their contents) once they appear.
class FileSystemWatcher {
public:
    using ChangeCallback = std::function<void(const std::vector<std::filesystem::path>&)>;

    FileSystemWatcher();
    ~FileSystemWatcher();

    FileSystemWatcher(const FileSystemWatcher&) = delete;
    FileSystemWatcher& operator=(const FileSystemWatcher&) = delete;

    /// Watch a directory recursively
    void watch_path(const std::filesystem::path& dir);
    void unwatch_all();

    void set_callback(ChangeCallback callback);

    /// Changed paths since the previous poll
    std::vector<std::filesystem::path> poll();

    void start(std::chrono::milliseconds poll_interval = std::chrono::milliseconds(100));
    void stop();
    [[nodiscard]] bool is_running() const { return m_running.load(); }

    [[nodiscard]] std::size_t watched_count() const;

    /// Watched directories that do not exist yet
    [[nodiscard]] std::size_t missing_count() const;

private:
    using Snapshot = std::map<std::filesystem::path, std::filesystem::file_time_type>;

    struct WatchEntry {
        std::filesystem::path path;
        bool exists = false;
        Snapshot files;
    };

    static Snapshot take_snapshot(const std::filesystem::path& dir);
    void watch_thread();

    mutable std::mutex m_mutex;
    std::vector<WatchEntry> m_watches;
    ChangeCallback m_callback;

    std::mutex m_wait_mutex;
    std::condition_variable m_wait_cv;
    std::thread m_thread;
    std::atomic<bool> m_running{false};
    std::chrono::milliseconds m_poll_interval{100};
};

} // namespace devloop_reload
