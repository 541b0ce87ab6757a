/// @file change_detector.cpp
/// @brief ChangeDetector implementation

#include <devloop/reload/change_detector.hpp>
#include <devloop/core/log.hpp>

#include <algorithm>
#include <future>
#include <map>
#include <thread>

namespace devloop_reload {

namespace fs = std::filesystem;

// =============================================================================
// Timestamp helpers
// =============================================================================

bool check_if_file_modified(
    const fs::path& path,
    TimestampSet::PathTimes& times,
    bool ignore_first,
    bool update)
{
    auto current = modification_time(path);
    if (!current) {
        return false;
    }

    auto recorded = times.get(path);
    if (!recorded) {
        if (update) {
            times.put(path, *current);
        }
        return !ignore_first;
    }

    if (*recorded != *current) {
        if (update) {
            times.put(path, *current);
        }
        return true;
    }
    return false;
}

bool unit_was_added(const fs::path& path, TimestampSet::PathTimes& times, bool initial_run) {
    if (times.contains(path)) {
        return false;
    }
    auto current = modification_time(path);
    if (!current) {
        return false;
    }
    bool unseen = !times.put_if_absent(path, *current).has_value();
    return unseen && !initial_run;
}

namespace {

enum class CompileOutcome {
    Stable,
    Unsettled,
};

std::string extension_of(const fs::path& path) {
    return path.extension().string();
}

bool has_handled_extension(const fs::path& path, const std::set<std::string>& extensions) {
    const std::string name = path.filename().string();
    return std::any_of(extensions.begin(), extensions.end(), [&](const std::string& ext) {
        return name.size() >= ext.size() && name.compare(name.size() - ext.size(), ext.size(), ext) == 0;
    });
}

FileTime time_or_absent(const fs::path& path) {
    return modification_time(path).value_or(k_absent_time);
}

} // anonymous namespace

// =============================================================================
// ChangeDetector
// =============================================================================

ChangeDetector::ChangeDetector(const DevModeContext& context, ReloadSession& session)
    : m_context(context)
    , m_session(session) {}

void ChangeDetector::publish_status(const std::optional<std::string>& message) {
    if (m_status_sink) {
        m_status_sink(message);
    }
}

std::vector<fs::path> ChangeDetector::find_changed_sources(
    const fs::path& source_root,
    const std::set<std::string>& extensions,
    bool first_scan)
{
    std::vector<fs::path> candidates;
    std::error_code ec;
    std::error_code entry_ec;
    for (fs::recursive_directory_iterator it(source_root, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(entry_ec) && has_handled_extension(it->path(), extensions)) {
            candidates.push_back(it->path());
        }
    }
    if (ec) {
        devloop_core::scan_logger()->warn("Error walking {}: {}", source_root.string(), ec.message());
    }
    if (candidates.empty()) {
        return {};
    }

    // Timestamp checks run per file across worker tasks
    std::size_t workers = std::max<std::size_t>(1, std::thread::hardware_concurrency());
    std::size_t chunk = (candidates.size() + workers - 1) / workers;

    std::vector<std::future<std::vector<fs::path>>> tasks;
    for (std::size_t begin = 0; begin < candidates.size(); begin += chunk) {
        std::size_t finish = std::min(begin + chunk, candidates.size());
        tasks.push_back(std::async(std::launch::async, [this, &candidates, begin, finish, first_scan]() {
            std::vector<fs::path> changed;
            for (std::size_t i = begin; i < finish; ++i) {
                if (check_if_file_modified(candidates[i], m_source_timestamps, first_scan, first_scan)) {
                    changed.push_back(candidates[i]);
                }
            }
            return changed;
        }));
    }

    std::vector<fs::path> changed;
    for (auto& task : tasks) {
        auto part = task.get();
        changed.insert(changed.end(), part.begin(), part.end());
    }
    std::sort(changed.begin(), changed.end());
    return changed;
}

bool ChangeDetector::compile_until_stable(
    ICompiler& compiler,
    const fs::path& source_root,
    const std::vector<fs::path>& changed,
    bool compiling_tests)
{
    // A write is often a truncate followed by a write; give it a moment to land
    for (const auto& file : changed) {
        std::error_code ec;
        if (fs::file_size(file, ec) == 0 && !ec) {
            std::this_thread::sleep_for(m_partial_write_delay);
            break;
        }
    }

    std::map<fs::path, FileTime> snapshot;
    for (const auto& file : changed) {
        snapshot[file] = time_or_absent(file);
    }

    FilesByExtension grouped;
    for (const auto& file : changed) {
        grouped[extension_of(file)].insert(file);
    }

    CompileOutcome outcome = CompileOutcome::Stable;
    for (std::size_t pass = 1;; ++pass) {
        auto compiled = compiler.compile(source_root, grouped);
        if (!compiled) {
            devloop_core::compiler_logger()->error("Compilation failed in {}", source_root.string());
            std::string message = compiled.error().message();
            if (compiling_tests) {
                m_session.set_test_compile_problem(compiled.error());
            } else {
                m_session.set_compile_problem(compiled.error());
            }
            publish_status(message);
            return false;
        }
        m_session.set_compile_problem(std::nullopt);
        if (compiling_tests) {
            m_session.set_test_compile_problem(std::nullopt);
        }
        publish_status(std::nullopt);

        // The compiler may have seen either version of a file edited meanwhile
        bool drifted = false;
        for (auto& [file, time] : snapshot) {
            FileTime now = time_or_absent(file);
            if (now != time) {
                drifted = true;
                time = now;
            }
        }
        if (!drifted) {
            break;
        }
        if (m_compile_retry_limit > 0 && pass >= m_compile_retry_limit) {
            devloop_core::compiler_logger()->warn(
                "Sources in {} kept changing during compilation, retrying on the next scan", source_root.string());
            outcome = CompileOutcome::Unsettled;
            break;
        }
    }

    // Failing or unsettled inputs keep their old times and are compiled again next scan
    if (outcome == CompileOutcome::Stable) {
        for (const auto& [file, time] : snapshot) {
            m_source_timestamps.put(file, time);
        }
    }
    return true;
}

ScanResult ChangeDetector::check_for_changed_units(
    ICompiler& compiler,
    ReloadDomain domain,
    bool first_scan,
    TimestampSet& timestamps,
    bool compiling_tests)
{
    ScanResult result;
    const auto extensions = compiler.handled_extensions();

    for (const auto& module : m_context.modules) {
        const CompilationUnit* unit = DevModeContext::unit_for(module, domain);
        if (!unit) {
            continue;
        }

        std::set<fs::path> module_changed_sources;
        for (const auto& source_root : unit->source_paths) {
            std::error_code ec;
            if (!fs::exists(source_root, ec)) {
                continue;
            }

            auto changed = find_changed_sources(source_root, extensions, first_scan);
            if (changed.empty()) {
                continue;
            }

            result.compilation_happened = true;
            module_changed_sources.insert(changed.begin(), changed.end());
            devloop_core::scan_logger()->debug("{} changed {} source(s) in {}",
                reload_domain_name(domain), changed.size(), source_root.string());

            if (!compile_until_stable(compiler, source_root, changed, compiling_tests)) {
                return result;
            }
        }

        check_units_in_module(compiler, *unit, module_changed_sources, first_scan, result, timestamps);
    }
    return result;
}

std::optional<fs::path> ChangeDetector::source_for_unit(
    ICompiler& compiler,
    const CompilationUnit& unit,
    const fs::path& unit_path,
    const std::set<fs::path>& changed_sources,
    TimestampSet& timestamps)
{
    auto recorded = timestamps.unit_sources().get(unit_path);
    if (!recorded || changed_sources.count(*recorded) > 0) {
        return compiler.find_source_path(unit_path, unit.source_paths, unit.output_path);
    }
    return recorded;
}

void ChangeDetector::check_units_in_module(
    ICompiler& compiler,
    const CompilationUnit& unit,
    const std::set<fs::path>& changed_sources,
    bool initial_run,
    ScanResult& result,
    TimestampSet& timestamps)
{
    const fs::path& output_root = unit.output_path;
    std::error_code ec;
    if (output_root.empty() || !fs::exists(output_root, ec)) {
        return;
    }

    const std::string unit_extension = compiler.unit_extension();
    std::vector<fs::path> unit_paths;
    std::error_code entry_ec;
    for (fs::recursive_directory_iterator it(output_root, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(entry_ec) && it->path().extension() == unit_extension) {
            unit_paths.push_back(it->path());
        }
    }
    if (ec) {
        devloop_core::scan_logger()->warn("Error walking {}: {}", output_root.string(), ec.message());
    }

    auto clean_up = [&](const fs::path& unit_path) {
        std::error_code remove_ec;
        fs::remove(unit_path, remove_ec);
        if (remove_ec) {
            devloop_core::scan_logger()->error("Failed to delete {}: {}", unit_path.string(), remove_ec.message());
        }
        timestamps.unit_timestamps().erase(unit_path);
        timestamps.unit_sources().erase(unit_path);
    };

    for (const auto& unit_path : unit_paths) {
        auto source = source_for_unit(compiler, unit, unit_path, changed_sources, timestamps);

        if (source) {
            std::error_code exists_ec;
            if (!fs::exists(*source, exists_ec)) {
                // Source deleted: drop the unit and restart
                clean_up(unit_path);
                m_source_timestamps.erase(*source);
                result.add_deleted(output_root, unit_path);
                continue;
            }

            timestamps.unit_sources().put(unit_path, *source);
            if (unit_was_added(unit_path, timestamps.unit_timestamps(), initial_run)) {
                result.add_added(output_root, unit_path);
            } else if (check_if_file_modified(unit_path, timestamps.unit_timestamps(), initial_run, true)) {
                result.add_changed(output_root, unit_path);
            } else if (changed_sources.count(*source) > 0) {
                // Source recompiled without producing this unit any more
                clean_up(unit_path);
                result.add_deleted(output_root, unit_path);
            }
        } else if (unit_was_added(unit_path, timestamps.unit_timestamps(), initial_run)) {
            result.add_added(output_root, unit_path);
        } else if (check_if_file_modified(unit_path, timestamps.unit_timestamps(), initial_run, true)) {
            result.add_changed(output_root, unit_path);
        }
    }
}

} // namespace devloop_reload
