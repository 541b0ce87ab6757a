/// @file scan_coordinator.cpp
/// @brief ScanCoordinator implementation

#include <devloop/reload/scan_coordinator.hpp>
#include <devloop/core/log.hpp>

#include <algorithm>
#include <exception>
#include <fstream>

namespace devloop_reload {

namespace fs = std::filesystem;

using devloop_core::Err;
using devloop_core::Error;
using devloop_core::ErrorCode;
using devloop_core::Ok;
using devloop_core::Result;

std::atomic<bool> ScanCoordinator::s_instrumentation_hint_printed{false};

const char* scan_state_name(ScanState state) {
    switch (state) {
        case ScanState::Idle: return "Idle";
        case ScanState::Scanning: return "Scanning";
        case ScanState::Restarting: return "Restarting";
        case ScanState::InstrumentedSwap: return "InstrumentedSwap";
        case ScanState::NoChange: return "NoChange";
        default: return "Unknown";
    }
}

namespace {

double seconds_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

void watch_roots(FileSystemWatcher& watcher, const CompilationUnit& unit) {
    for (const auto& path : unit.source_paths) {
        watcher.watch_path(path);
    }
    for (const auto& path : unit.resource_paths) {
        watcher.watch_path(path);
    }
}

bool any_requires_restart(const std::set<std::string>& files, const std::map<std::string, bool>& watched) {
    return std::any_of(files.begin(), files.end(), [&](const std::string& file) {
        auto it = watched.find(file);
        return it != watched.end() && it->second;
    });
}

} // anonymous namespace

// =============================================================================
// Construction
// =============================================================================

ScanCoordinator::ScanCoordinator(fs::path application_root,
                                 DevModeContext context,
                                 DevModeType dev_mode_type,
                                 ScanCollaborators collaborators,
                                 std::shared_ptr<ReloadSession> session)
    : m_application_root(std::move(application_root))
    , m_context(std::move(context))
    , m_dev_mode_type(dev_mode_type)
    , m_collaborators(std::move(collaborators))
    , m_session(session ? std::move(session) : std::make_shared<ReloadSession>())
    , m_scanning_lock(m_collaborators.scanning_lock ? m_collaborators.scanning_lock : std::make_shared<ScanningLock>())
    , m_change_detector(m_context, *m_session)
    , m_resource_sync(m_context)
{
    m_change_detector.set_status_sink([this](const std::optional<std::string>& message) {
        std::lock_guard<std::mutex> lock(m_status_mutex);
        m_compile_status = message;
    });
    if (m_collaborators.copy_resource_notification) {
        m_resource_sync.set_copy_resource_notification(m_collaborators.copy_resource_notification);
    }
}

ScanCoordinator::~ScanCoordinator() {
    stop_scanning();
    tests_disabled();
    for (auto& trigger : m_retired_triggers) {
        trigger->stop();
    }
}

// =============================================================================
// Dev-mode scan
// =============================================================================

void ScanCoordinator::finish(ScanState outcome) {
    m_last_outcome.store(outcome);
    m_state.store(ScanState::Idle);
}

void ScanCoordinator::report_slow_reload(std::chrono::steady_clock::duration elapsed) {
    if (elapsed < m_slow_reload_threshold || m_session->instrumentation_enabled()) {
        return;
    }
    if (!s_instrumentation_hint_printed.exchange(true)) {
        devloop_core::scan_logger()->info(
            "Live reload took more than {} seconds, you may want to enable instrumentation based reload "
            "(\"instrumentation\": true). This allows small changes to take effect without a restart.",
            std::chrono::duration_cast<std::chrono::seconds>(m_slow_reload_threshold).count());
    }
}

bool ScanCoordinator::do_scan(bool user_initiated, bool force_restart) {
    if (!m_session->live_reload_enabled() && !force_restart) {
        return false;
    }

    std::lock_guard<std::recursive_mutex> scan_lock(m_scan_lock);
    std::lock_guard<ScanningLock> scanning_lock(*m_scanning_lock);

    const auto start = std::chrono::steady_clock::now();
    m_state.store(ScanState::Scanning);
    auto& log = *devloop_core::scan_logger();

    std::vector<std::function<void()>> steps;
    std::vector<NoRestartConsumer> consumers;
    {
        std::lock_guard<std::mutex> lock(m_hooks_mutex);
        steps = m_pre_scan_steps;
        consumers = m_no_restart_consumers;
    }

    for (auto& step : steps) {
        try {
            step();
        } catch (const std::exception& e) {
            log.error("Pre-scan step failed: {}", e.what());
        }
    }

    ScanResult changed = check_for_changed_units(false);
    std::set<std::string> files_changed = check_for_file_change();

    const auto watched = m_main.watched_paths();
    const bool config_restart_needed = force_restart || any_requires_restart(files_changed, watched);

    std::vector<std::string> restart_reasons;
    if (config_restart_needed) {
        for (const auto& file : files_changed) {
            auto it = watched.find(file);
            if (it != watched.end() && it->second) {
                restart_reasons.push_back(fs::path(file).filename().string());
            }
        }
    }
    for (const auto* units : {&changed.changed_units, &changed.added_units, &changed.deleted_units}) {
        for (const auto& unit : *units) {
            restart_reasons.push_back(unit.filename().string());
        }
    }

    bool swapped = false;
    if (m_collaborators.hot_swap) {
        HotSwapContext swap_context;
        swap_context.config_restart_needed = config_restart_needed;
        swap_context.dev_mode_type = m_dev_mode_type;
        swapped = m_collaborators.hot_swap->attempt(changed, *m_session, swap_context);
    }

    if (m_session->compile_problem()) {
        finish(ScanState::NoChange);
        return false;
    }

    // A failed deployment always restarts on a user scan: whatever was
    // broken may have been fixed in a file nobody watches
    const bool restart_needed = !swapped
        && (changed.is_changed()
            || (m_session->deployment_problem().has_value() && user_initiated)
            || config_restart_needed);

    if (restart_needed) {
        m_state.store(ScanState::Restarting);
        if (!restart_reasons.empty()) {
            std::string joined;
            for (const auto& reason : restart_reasons) {
                if (!joined.empty()) joined += ", ";
                joined += reason;
            }
            log.info("Restarting due to changes in {}.", joined);
        } else if (force_restart && user_initiated) {
            log.info("Restarting as requested by the user.");
        }

        if (m_collaborators.restart_callback) {
            try {
                m_collaborators.restart_callback(files_changed, changed);
            } catch (const std::exception& e) {
                log.error("Restart failed: {}", e.what());
                m_session->set_deployment_problem(Error(ErrorCode::InvalidState, std::string("Restart failed: ") + e.what()));
            }
        }

        auto elapsed = std::chrono::steady_clock::now() - start;
        log.info("Live reload total time: {:.3f}s", seconds_since(start));
        report_slow_reload(elapsed);
        finish(ScanState::Restarting);
        return true;
    }

    if (!files_changed.empty()) {
        for (auto& consumer : consumers) {
            try {
                consumer(files_changed);
            } catch (const std::exception& e) {
                log.error("Changed files consumer failed: {}", e.what());
            }
        }
        log.info("Files changed but restart not needed - notified consumers in: {:.3f}s", seconds_since(start));
    } else if (swapped) {
        log.info("Live reload performed via instrumentation, no restart needed, total time: {:.3f}s",
                 seconds_since(start));
    }

    finish(swapped ? ScanState::InstrumentedSwap : ScanState::NoChange);
    return false;
}

ScanResult ScanCoordinator::check_for_changed_units(bool first_scan) {
    std::lock_guard<std::recursive_mutex> scan_lock(m_scan_lock);
    ScanResult result = m_change_detector.check_for_changed_units(
        *m_collaborators.compiler, ReloadDomain::Main, first_scan, m_main, false);
    if (first_scan) {
        m_test.merge(m_main);
    }
    return result;
}

ScanResult ScanCoordinator::check_for_changed_test_units(bool first_scan) {
    auto* tests = m_collaborators.test_support.get();
    if (!tests || !tests->is_started()) {
        return {};
    }

    ScanResult result;
    {
        std::lock_guard<std::recursive_mutex> scan_lock(m_scan_lock);
        result = m_change_detector.check_for_changed_units(
            tests->compiler(), ReloadDomain::Test, first_scan, m_test, true);
    }
    if (first_scan) {
        start_test_scanning();
    }
    return result;
}

std::set<std::string> ScanCoordinator::check_for_file_change() {
    return m_resource_sync.check_for_file_change(ReloadDomain::Main, m_main);
}

// =============================================================================
// Continuous testing
// =============================================================================

ScanResult ScanCoordinator::compile_test_units() {
    auto& tests = *m_collaborators.test_support;
    ScanResult result;
    try {
        result = m_change_detector.check_for_changed_units(
            tests.compiler(), ReloadDomain::Test, false, m_test, true);
        if (auto problem = m_session->test_compile_problem()) {
            tests.test_compile_failed(*problem);
        } else if (result.is_changed()) {
            tests.test_compile_succeeded();
        }
    } catch (const std::exception& e) {
        tests.test_compile_failed(Error(ErrorCode::CompileError, e.what()));
    }
    return result;
}

void ScanCoordinator::periodic_test_compile() {
    auto* tests = m_collaborators.test_support.get();
    if (!tests) {
        return;
    }

    std::lock_guard<std::recursive_mutex> scan_lock(m_scan_lock);
    std::lock_guard<ScanningLock> scanning_lock(*m_scanning_lock);

    ScanResult changed_tests = compile_test_units();
    ScanResult changed_app = m_change_detector.check_for_changed_units(
        *m_collaborators.compiler, ReloadDomain::Main, false, m_test, true);
    if (changed_app.compilation_happened) {
        if (auto problem = m_session->test_compile_problem()) {
            tests->test_compile_failed(*problem);
        } else {
            tests->test_compile_succeeded();
        }
    }

    std::set<std::string> files_changed = m_resource_sync.check_for_file_change(ReloadDomain::Test, m_test);
    auto main_files = m_resource_sync.check_for_file_change(ReloadDomain::Main, m_test);
    files_changed.insert(main_files.begin(), main_files.end());
    const bool config_restart_needed = any_requires_restart(files_changed, m_test.watched_paths());

    ScanResult merged = ScanResult::merge(changed_tests, changed_app);
    if (m_session->test_compile_problem()) {
        return;
    }
    if (config_restart_needed) {
        tests->run_tests(nullptr);
    } else if (merged.is_changed()) {
        tests->run_tests(&merged);
    }
}

void ScanCoordinator::prune_retired_triggers() {
    // Only workers that already exited: joining a busy one could wait on a
    // scan lock held by the caller
    m_retired_triggers.erase(
        std::remove_if(m_retired_triggers.begin(), m_retired_triggers.end(),
            [](const std::unique_ptr<ScanTrigger>& trigger) { return trigger->is_finished(); }),
        m_retired_triggers.end());
}

void ScanCoordinator::start_test_scanning() {
    std::lock_guard<std::mutex> lock(m_test_scan_mutex);
    prune_retired_triggers();
    if (m_test_trigger) {
        return;
    }

    auto trigger = std::make_unique<ScanTrigger>("test-scan", [this] { periodic_test_compile(); },
        m_test_scan_options.period, m_test_scan_options.coalesce_delay);
    auto watcher = std::make_unique<FileSystemWatcher>();

    for (const auto& module : m_context.modules) {
        watch_roots(*watcher, module.main);
        if (module.test) {
            watch_roots(*watcher, *module.test);
        }
    }

    ScanTrigger* target = trigger.get();
    watcher->set_callback([target](const std::vector<fs::path>&) { target->notify(); });

    // The first run is scheduled on the worker: the caller may already hold the scan lock
    trigger->start(true);
    watcher->start(m_test_scan_options.poll_interval);

    m_test_trigger = std::move(trigger);
    m_test_watcher = std::move(watcher);
    devloop_core::scan_logger()->debug("Test scanning started");
}

void ScanCoordinator::tests_enabled() {
    if (!m_first_test_scan_complete.load()) {
        check_for_changed_test_units(true);
        m_first_test_scan_complete.store(true);
    }
    start_test_scanning();
}

void ScanCoordinator::tests_disabled() {
    std::unique_ptr<FileSystemWatcher> watcher;
    {
        std::lock_guard<std::mutex> lock(m_test_scan_mutex);
        watcher = std::move(m_test_watcher);
        if (m_test_trigger) {
            // Not joined here: the caller may hold the scan lock the worker is waiting for
            m_test_trigger->request_stop();
            m_retired_triggers.push_back(std::move(m_test_trigger));
        }
        prune_retired_triggers();
    }
    if (watcher) {
        watcher->stop();
    }
}

bool ScanCoordinator::test_scanning_active() const {
    std::lock_guard<std::mutex> lock(m_test_scan_mutex);
    return m_test_trigger != nullptr;
}

std::size_t ScanCoordinator::retired_trigger_count() const {
    std::lock_guard<std::mutex> lock(m_test_scan_mutex);
    return m_retired_triggers.size();
}

// =============================================================================
// Timed dev-mode scan
// =============================================================================

void ScanCoordinator::start_scanning(const ScanOptions& options) {
    std::lock_guard<std::mutex> lock(m_dev_scan_mutex);
    if (m_scan_trigger) {
        return;
    }

    auto trigger = std::make_unique<ScanTrigger>("dev-scan", [this] { do_scan(false); },
        options.period, options.coalesce_delay);
    auto watcher = std::make_unique<FileSystemWatcher>();
    for (const auto& module : m_context.modules) {
        watch_roots(*watcher, module.main);
    }

    ScanTrigger* target = trigger.get();
    watcher->set_callback([target](const std::vector<fs::path>&) { target->notify(); });

    trigger->start();
    watcher->start(options.poll_interval);

    m_scan_trigger = std::move(trigger);
    m_scan_watcher = std::move(watcher);
    devloop_core::scan_logger()->debug("Dev-mode scanning started (period {}ms)", options.period.count());
}

void ScanCoordinator::stop_scanning() {
    std::unique_ptr<ScanTrigger> trigger;
    std::unique_ptr<FileSystemWatcher> watcher;
    {
        std::lock_guard<std::mutex> lock(m_dev_scan_mutex);
        trigger = std::move(m_scan_trigger);
        watcher = std::move(m_scan_watcher);
    }
    if (watcher) {
        watcher->stop();
    }
    if (trigger) {
        trigger->stop();
    }
}

bool ScanCoordinator::scanning_active() const {
    std::lock_guard<std::mutex> lock(m_dev_scan_mutex);
    return m_scan_trigger != nullptr;
}

// =============================================================================
// Registration
// =============================================================================

void ScanCoordinator::add_pre_scan_step(std::function<void()> step) {
    std::lock_guard<std::mutex> lock(m_hooks_mutex);
    m_pre_scan_steps.push_back(std::move(step));
}

void ScanCoordinator::consume_no_restart_changes(NoRestartConsumer consumer) {
    std::lock_guard<std::mutex> lock(m_hooks_mutex);
    m_no_restart_consumers.push_back(std::move(consumer));
}

void ScanCoordinator::add_failed_start_handler(std::function<void()> handler) {
    m_session->add_failed_start_handler(std::move(handler));
}

void ScanCoordinator::set_watched_file_paths(const std::map<std::string, bool>& watched, bool is_test) {
    std::lock_guard<std::recursive_mutex> scan_lock(m_scan_lock);
    m_resource_sync.set_watched_file_paths(watched, is_test ? m_test : m_main, is_test);
}

void ScanCoordinator::startup_failed(Error problem) {
    devloop_core::scan_logger()->error("Application failed to start: {}", problem.message());
    m_session->startup_failed(std::move(problem));
}

// =============================================================================
// Status
// =============================================================================

std::optional<Error> ScanCoordinator::deployment_problem() const {
    if (auto problem = m_session->compile_problem()) {
        return problem;
    }
    return m_session->deployment_problem();
}

std::optional<std::string> ScanCoordinator::compile_status() const {
    std::lock_guard<std::mutex> lock(m_status_mutex);
    return m_compile_status;
}

// =============================================================================
// Files and directories
// =============================================================================

Result<void> ScanCoordinator::update_file(const std::string& file, const Bytes& data) {
    std::string relative = file;
    while (!relative.empty() && relative.front() == '/') {
        relative.erase(0, 1);
    }

    fs::path target = m_application_root / relative;
    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        return Err(Error(ErrorCode::IOError, "Failed to create " + target.parent_path().string() + ": " + ec.message()));
    }

    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Err(Error(ErrorCode::IOError, "Failed to open " + target.string()));
    }
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!out) {
        return Err(Error(ErrorCode::IOError, "Failed to write " + target.string()));
    }
    return Ok();
}

std::vector<fs::path> ScanCoordinator::resources_dirs() const {
    std::vector<fs::path> dirs;
    for (const auto& module : m_context.modules) {
        if (!module.main.resource_paths.empty()) {
            dirs.insert(dirs.end(), module.main.resource_paths.begin(), module.main.resource_paths.end());
        } else if (!module.main.resources_output_path.empty()) {
            dirs.push_back(module.main.resources_output_path);
        }
    }
    std::reverse(dirs.begin(), dirs.end());
    return dirs;
}

std::vector<fs::path> ScanCoordinator::sources_dirs() const {
    std::vector<fs::path> dirs;
    for (const auto& module : m_context.modules) {
        dirs.insert(dirs.end(), module.main.source_paths.begin(), module.main.source_paths.end());
    }
    return dirs;
}

std::optional<fs::path> ScanCoordinator::classes_dir() const {
    const ModuleInfo* app = m_context.application_module();
    if (!app || app->main.output_path.empty()) {
        return std::nullopt;
    }
    return app->main.output_path;
}

void ScanCoordinator::close() {
    stop_scanning();
    tests_disabled();
    std::vector<std::unique_ptr<ScanTrigger>> retired;
    {
        std::lock_guard<std::mutex> lock(m_test_scan_mutex);
        retired = std::move(m_retired_triggers);
        m_retired_triggers.clear();
    }
    for (auto& trigger : retired) {
        trigger->stop();
    }
    if (m_collaborators.compiler) {
        m_collaborators.compiler->close();
    }
    devloop_core::flush_all_loggers();
}

} // namespace devloop_reload
