#pragma once

/// @file change_detector.hpp
/// @brief Source change detection, compilation and compiled unit diffing

#include <devloop/core/error.hpp>
#include <devloop/reload/compiler.hpp>
#include <devloop/reload/dev_context.hpp>
#include <devloop/reload/reload_session.hpp>
#include <devloop/reload/scan_result.hpp>
#include <devloop/reload/timestamp_set.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace devloop_reload {

/// Receives the current compile error message, or nullopt once it is cleared
using StatusSink = std::function<void(const std::optional<std::string>&)>;

/// Walks source roots, compiles what changed, and diffs the compiled output
/// against the recorded unit timestamps.
///
/// Source timestamps are shared by both domains: a source compiled by the
/// main scan is not recompiled by the test scan. Unit timestamps live in the
/// TimestampSet handed to each call.
class ChangeDetector {
public:
    ChangeDetector(const DevModeContext& context, ReloadSession& session);

    /// Stop recompiling after this many drift passes; 0 means unbounded
    void set_compile_retry_limit(std::size_t limit) { m_compile_retry_limit = limit; }
    [[nodiscard]] std::size_t compile_retry_limit() const { return m_compile_retry_limit; }

    void set_status_sink(StatusSink sink) { m_status_sink = std::move(sink); }

    /// Wait applied once when a changed file is empty (partial write)
    void set_partial_write_delay(std::chrono::milliseconds delay) { m_partial_write_delay = delay; }

    /// Detect, compile and diff one domain of every module.
    ///
    /// On a first scan nothing is reported as changed or added, and only the
    /// timestamps are recorded. A compile failure records the problem in the
    /// session for the domain and returns the partial result.
    ScanResult check_for_changed_units(
        ICompiler& compiler,
        ReloadDomain domain,
        bool first_scan,
        TimestampSet& timestamps,
        bool compiling_tests);

    [[nodiscard]] TimestampSet::PathTimes& source_timestamps() { return m_source_timestamps; }

private:
    /// Changed files under one source root
    std::vector<std::filesystem::path> find_changed_sources(
        const std::filesystem::path& source_root,
        const std::set<std::string>& extensions,
        bool first_scan);

    /// Compile until the inputs stop changing. Returns false on a compile failure.
    bool compile_until_stable(
        ICompiler& compiler,
        const std::filesystem::path& source_root,
        const std::vector<std::filesystem::path>& changed,
        bool compiling_tests);

    void check_units_in_module(
        ICompiler& compiler,
        const CompilationUnit& unit,
        const std::set<std::filesystem::path>& changed_sources,
        bool initial_run,
        ScanResult& result,
        TimestampSet& timestamps);

    std::optional<std::filesystem::path> source_for_unit(
        ICompiler& compiler,
        const CompilationUnit& unit,
        const std::filesystem::path& unit_path,
        const std::set<std::filesystem::path>& changed_sources,
        TimestampSet& timestamps);

    void publish_status(const std::optional<std::string>& message);

    const DevModeContext& m_context;
    ReloadSession& m_session;
    TimestampSet::PathTimes m_source_timestamps;
    std::size_t m_compile_retry_limit = 0;
    std::chrono::milliseconds m_partial_write_delay{200};
    StatusSink m_status_sink;
};

// =============================================================================
// Timestamp helpers
// =============================================================================

/// True when the file's time differs from the recorded one, or when it was
/// never recorded and ignore_first is false. Records the new time only when
/// update is set.
bool check_if_file_modified(
    const std::filesystem::path& path,
    TimestampSet::PathTimes& times,
    bool ignore_first,
    bool update);

/// Record a never seen unit. True when it was unseen and this is not an initial run.
bool unit_was_added(const std::filesystem::path& path, TimestampSet::PathTimes& times, bool initial_run);

} // namespace devloop_reload
