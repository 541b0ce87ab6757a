#pragma once

/// @file scan_coordinator.hpp
/// @brief Serialized dev-mode scans: detect, compile, sync, swap or restart

#include <devloop/core/error.hpp>
#include <devloop/reload/change_detector.hpp>
#include <devloop/reload/compiler.hpp>
#include <devloop/reload/dev_context.hpp>
#include <devloop/reload/hot_swap.hpp>
#include <devloop/reload/reload_session.hpp>
#include <devloop/reload/resource_sync.hpp>
#include <devloop/reload/scan_lock.hpp>
#include <devloop/reload/scan_result.hpp>
#include <devloop/reload/scan_trigger.hpp>
#include <devloop/reload/test_support.hpp>
#include <devloop/reload/timestamp_set.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace devloop_reload {

/// Scan lifecycle. Idle -> Scanning -> {Restarting, InstrumentedSwap, NoChange} -> Idle
enum class ScanState : std::uint8_t {
    Idle,
    Scanning,
    Restarting,
    InstrumentedSwap,
    NoChange,
};

[[nodiscard]] const char* scan_state_name(ScanState state);

/// Called to restart the application (changed watched files, scan result)
using RestartCallback = std::function<void(const std::set<std::string>&, const ScanResult&)>;

/// Called with changed watched files when no restart is needed
using NoRestartConsumer = std::function<void(const std::set<std::string>&)>;

/// Collaborators wired into a coordinator
struct ScanCollaborators {
    std::shared_ptr<ICompiler> compiler;
    RestartCallback restart_callback;

    /// Optional: live redefinition
    std::shared_ptr<HotSwapEngine> hot_swap;

    /// Optional: continuous testing
    std::shared_ptr<TestSupport> test_support;

    /// Optional: told about every copied resource
    CopyResourceNotification copy_resource_notification;

    /// Shared with the test subsystem; created when absent
    std::shared_ptr<ScanningLock> scanning_lock;
};

/// Timing knobs for a scan trigger and the watcher that feeds it
struct ScanOptions {
    std::chrono::milliseconds period{1000};
    std::chrono::milliseconds coalesce_delay{500};
    std::chrono::milliseconds poll_interval{100};
};

/// Runs scans one at a time and decides between hot swap, restart and a
/// no-restart notification. Drives the dev-mode scan from a timer and a
/// file system watcher, and the continuous test scan when a test subsystem
/// is present.
class ScanCoordinator {
public:
    ScanCoordinator(std::filesystem::path application_root,
                    DevModeContext context,
                    DevModeType dev_mode_type,
                    ScanCollaborators collaborators,
                    std::shared_ptr<ReloadSession> session);
    ~ScanCoordinator();

    ScanCoordinator(const ScanCoordinator&) = delete;
    ScanCoordinator& operator=(const ScanCoordinator&) = delete;

    // -------------------------------------------------------------------------
    // Scans
    // -------------------------------------------------------------------------

    /// One dev-mode scan. Returns true when a restart was triggered.
    bool do_scan(bool user_initiated, bool force_restart = false);

    /// Main-domain change detection. The first scan only records timestamps
    /// and seeds the test timestamps from the main ones.
    ScanResult check_for_changed_units(bool first_scan);

    /// Test-domain change detection; empty unless the test subsystem started
    ScanResult check_for_changed_test_units(bool first_scan);

    /// Main-domain resource sync
    std::set<std::string> check_for_file_change();

    /// Compile tests and main sources against the test timestamps and ask
    /// the test subsystem to run what changed
    void periodic_test_compile();

    /// Run do_scan(false) on the period and whenever a main source or
    /// resource root changes. Not to be called from inside a scan.
    void start_scanning(const ScanOptions& options);
    void stop_scanning();
    [[nodiscard]] bool scanning_active() const;

    // -------------------------------------------------------------------------
    // Test subsystem hooks
    // -------------------------------------------------------------------------

    void tests_enabled();
    void tests_disabled();
    [[nodiscard]] bool test_scanning_active() const;

    /// Stopped test triggers whose worker is still finishing a run
    [[nodiscard]] std::size_t retired_trigger_count() const;

    // -------------------------------------------------------------------------
    // Registration
    // -------------------------------------------------------------------------

    void add_pre_scan_step(std::function<void()> step);
    void consume_no_restart_changes(NoRestartConsumer consumer);
    void add_failed_start_handler(std::function<void()> handler);

    /// Install watched files for a domain
    void set_watched_file_paths(const std::map<std::string, bool>& watched, bool is_test);

    /// Failed application start: run handlers and drop the structural index
    void startup_failed(devloop_core::Error problem);

    // -------------------------------------------------------------------------
    // Status
    // -------------------------------------------------------------------------

    /// Current state; never blocks behind a scan
    [[nodiscard]] ScanState state() const { return m_state.load(); }

    /// Outcome of the last completed scan
    [[nodiscard]] ScanState last_outcome() const { return m_last_outcome.load(); }

    /// Compile problem if any, else the deployment problem
    [[nodiscard]] std::optional<devloop_core::Error> deployment_problem() const;

    [[nodiscard]] std::optional<std::string> compile_status() const;

    // -------------------------------------------------------------------------
    // Files and directories
    // -------------------------------------------------------------------------

    /// Write bytes below the application root, creating parent directories
    [[nodiscard]] devloop_core::Result<void> update_file(const std::string& file, const Bytes& data);

    /// Resource roots, or the resources output when a module has none.
    /// The application module comes last.
    [[nodiscard]] std::vector<std::filesystem::path> resources_dirs() const;

    [[nodiscard]] std::vector<std::filesystem::path> sources_dirs() const;

    [[nodiscard]] std::optional<std::filesystem::path> classes_dir() const;

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------

    [[nodiscard]] ReloadSession& session() { return *m_session; }
    [[nodiscard]] ChangeDetector& change_detector() { return m_change_detector; }
    [[nodiscard]] ResourceSynchronizer& resource_sync() { return m_resource_sync; }
    [[nodiscard]] TimestampSet& main_timestamps() { return m_main; }
    [[nodiscard]] TimestampSet& test_timestamps() { return m_test; }
    [[nodiscard]] ScanningLock& scanning_lock() { return *m_scanning_lock; }
    [[nodiscard]] const DevModeContext& context() const { return m_context; }
    [[nodiscard]] DevModeType dev_mode_type() const { return m_dev_mode_type; }
    [[nodiscard]] TestSupport* test_support() const { return m_collaborators.test_support.get(); }

    void set_test_scan_options(const ScanOptions& options) { m_test_scan_options = options; }
    [[nodiscard]] const ScanOptions& test_scan_options() const { return m_test_scan_options; }

    /// Scans at or above this duration without instrumentation log a hint once
    void set_slow_reload_threshold(std::chrono::milliseconds threshold) { m_slow_reload_threshold = threshold; }

    /// Stop both scans, close the compiler and flush the loggers
    void close();

private:
    ScanResult compile_test_units();
    void start_test_scanning();
    void prune_retired_triggers();
    void finish(ScanState outcome);
    void report_slow_reload(std::chrono::steady_clock::duration elapsed);

    std::filesystem::path m_application_root;
    DevModeContext m_context;
    DevModeType m_dev_mode_type;
    ScanCollaborators m_collaborators;
    std::shared_ptr<ReloadSession> m_session;
    std::shared_ptr<ScanningLock> m_scanning_lock;

    TimestampSet m_main;
    TimestampSet m_test;
    ChangeDetector m_change_detector;
    ResourceSynchronizer m_resource_sync;

    std::recursive_mutex m_scan_lock;
    std::atomic<ScanState> m_state{ScanState::Idle};
    std::atomic<ScanState> m_last_outcome{ScanState::Idle};

    mutable std::mutex m_hooks_mutex;
    std::vector<std::function<void()>> m_pre_scan_steps;
    std::vector<NoRestartConsumer> m_no_restart_consumers;

    mutable std::mutex m_status_mutex;
    std::optional<std::string> m_compile_status;

    mutable std::mutex m_dev_scan_mutex;
    std::unique_ptr<ScanTrigger> m_scan_trigger;
    std::unique_ptr<FileSystemWatcher> m_scan_watcher;

    mutable std::mutex m_test_scan_mutex;
    std::unique_ptr<ScanTrigger> m_test_trigger;
    std::unique_ptr<FileSystemWatcher> m_test_watcher;
    std::vector<std::unique_ptr<ScanTrigger>> m_retired_triggers;
    std::atomic<bool> m_first_test_scan_complete{false};
    ScanOptions m_test_scan_options;

    std::chrono::milliseconds m_slow_reload_threshold{4000};

    static std::atomic<bool> s_instrumentation_hint_printed;
};

} // namespace devloop_reload
