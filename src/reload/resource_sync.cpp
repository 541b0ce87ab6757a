/// @file resource_sync.cpp
/// @brief ResourceSynchronizer implementation

#include <devloop/reload/resource_sync.hpp>
#include <devloop/core/log.hpp>

#include <fstream>
#include <iterator>
#include <thread>

namespace devloop_reload {

namespace fs = std::filesystem;

namespace {

bool copy_bytes(const fs::path& from, const fs::path& to, std::error_code& ec) {
    std::ifstream in(from, std::ios::binary);
    if (!in) {
        ec = std::make_error_code(std::errc::io_error);
        return false;
    }
    std::ofstream out(to, std::ios::binary | std::ios::trunc);
    if (!out) {
        ec = std::make_error_code(std::errc::permission_denied);
        return false;
    }
    out << in.rdbuf();
    if (!out) {
        ec = std::make_error_code(std::errc::io_error);
        return false;
    }
    return true;
}

bool has_glob_chars(const std::string& path) {
    return path.find_first_of("*?[{") != std::string::npos;
}

/// Files under root whose full path matches root/pattern
std::map<fs::path, FileTime> expand_glob(const fs::path& root, const fs::path& pattern) {
    std::map<fs::path, FileTime> files;
    std::regex matcher;
    try {
        matcher = glob_to_regex(pattern.generic_string());
    } catch (const std::regex_error& e) {
        devloop_core::scan_logger()->warn("Invalid watched file pattern {}: {}", pattern.string(), e.what());
        return files;
    }

    std::error_code ec;
    auto options = fs::directory_options::skip_permission_denied;
    std::error_code entry_ec;
    for (fs::recursive_directory_iterator it(root, options, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(entry_ec)) {
            continue;
        }
        if (std::regex_match(it->path().generic_string(), matcher)) {
            if (auto time = modification_time(it->path())) {
                files[it->path()] = *time;
            }
        }
    }
    return files;
}

} // anonymous namespace

std::regex glob_to_regex(const std::string& glob) {
    std::string out;
    out.reserve(glob.size() * 2);
    int braces = 0;
    bool in_class = false;

    for (std::size_t i = 0; i < glob.size(); ++i) {
        char c = glob[i];
        if (in_class) {
            if (c == ']') {
                in_class = false;
            }
            if (c == '\\') {
                out += "\\\\";
            } else {
                out += c;
            }
            continue;
        }
        switch (c) {
            case '*':
                if (i + 1 < glob.size() && glob[i + 1] == '*') {
                    out += ".*";
                    ++i;
                } else {
                    out += "[^/]*";
                }
                break;
            case '?':
                out += "[^/]";
                break;
            case '[':
                in_class = true;
                out += '[';
                if (i + 1 < glob.size() && glob[i + 1] == '!') {
                    out += '^';
                    ++i;
                }
                break;
            case '{':
                ++braces;
                out += "(?:";
                break;
            case '}':
                if (braces > 0) {
                    --braces;
                    out += ')';
                } else {
                    out += "\\}";
                }
                break;
            case ',':
                out += braces > 0 ? "|" : ",";
                break;
            case '.': case '(': case ')': case '+': case '|':
            case '^': case '$': case '\\': case ']':
                out += '\\';
                out += c;
                break;
            default:
                out += c;
                break;
        }
    }
    return std::regex(out, std::regex::ECMAScript);
}

// =============================================================================
// ResourceSynchronizer
// =============================================================================

ResourceSynchronizer::ResourceSynchronizer(const DevModeContext& context)
    : m_context(context) {}

std::optional<ResourceSynchronizer::Roots> ResourceSynchronizer::roots_for(const CompilationUnit& unit) {
    Roots roots;
    fs::path output = unit.resources_output_path;
    std::vector<fs::path> candidates(unit.resource_paths.begin(), unit.resource_paths.end());

    if (candidates.empty()) {
        // Watched files may live in the compiled output itself
        if (unit.output_path.empty()) {
            return std::nullopt;
        }
        candidates.push_back(unit.output_path);
        output = unit.output_path;
        roots.copy = false;
    }
    if (output.empty()) {
        return std::nullopt;
    }

    for (const auto& root : candidates) {
        std::error_code ec;
        if (fs::exists(root, ec)) {
            roots.roots.push_back(root);
        }
    }
    roots.output = output;
    return roots;
}

FileTime ResourceSynchronizer::settle(const fs::path& file) {
    std::error_code ec;
    if (fs::is_regular_file(file, ec) && fs::file_size(file, ec) == 0 && !ec) {
        std::this_thread::sleep_for(m_partial_write_delay);
    }
    return modification_time(file).value_or(k_absent_time);
}

void ResourceSynchronizer::mirror_resources(
    const ModuleInfo& module,
    const CompilationUnit& unit,
    const Roots& roots,
    TimestampSet& timestamps,
    std::set<std::string>& changed)
{
    std::set<fs::path> known;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        known = m_corresponding_resources[unit.id()];
    }
    std::set<fs::path> seen = known;

    for (const auto& root : roots.roots) {
        std::error_code ec;
        for (fs::recursive_directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
            const fs::path& path = it->path();
            fs::path relative = path.lexically_relative(root);
            fs::path target = roots.output / relative;
            seen.erase(target);

            if (timestamps.watched_file_timestamps().contains(path)) {
                continue;
            }
            known.insert(target);

            std::error_code io;
            auto source_time = modification_time(path);
            auto target_time = modification_time(target);
            if (target_time && source_time && *target_time >= *source_time) {
                continue;
            }

            if (it->is_directory(io)) {
                fs::create_directories(target, io);
                if (io) {
                    devloop_core::scan_logger()->error("Failed to copy resources: {}: {}", target.string(), io.message());
                }
                continue;
            }

            fs::create_directories(target.parent_path(), io);
            std::string name = relative.generic_string();
            changed.insert(name);
            if (io || !copy_bytes(path, target, io)) {
                devloop_core::scan_logger()->error("Failed to copy resources: {}: {}", path.string(), io.message());
                continue;
            }
            if (m_copy_notification) {
                try {
                    m_copy_notification(module, name);
                } catch (const std::exception& e) {
                    devloop_core::scan_logger()->error("Copy notification failed for {}: {}", name, e.what());
                }
            }
        }
        if (ec) {
            devloop_core::scan_logger()->error("Failed to copy resources from {}: {}", root.string(), ec.message());
        }
    }

    // Mirrored files whose source went away
    for (const auto& stale : seen) {
        known.erase(stale);
        std::error_code ec;
        if (!fs::is_directory(stale, ec)) {
            fs::remove(stale, ec);
            if (ec) {
                devloop_core::scan_logger()->error("Failed to delete {}: {}", stale.string(), ec.message());
            }
        }
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_corresponding_resources[unit.id()] = std::move(known);
}

void ResourceSynchronizer::check_watched_in_roots(
    const Roots& roots,
    TimestampSet& timestamps,
    std::set<std::string>& changed)
{
    const auto watched = timestamps.watched_paths();
    auto& times = timestamps.watched_file_timestamps();

    for (const auto& root : roots.roots) {
        for (const auto& [path, restart] : watched) {
            if (fs::path(path).is_absolute()) {
                continue;
            }
            fs::path file = root / path;
            auto now = modification_time(file);

            if (!now) {
                times.put(file, k_absent_time);
                std::error_code ec;
                fs::remove_all(roots.output / path, ec);
                if (ec) {
                    devloop_core::scan_logger()->error("Failed to delete {}: {}", (roots.output / path).string(), ec.message());
                }
                continue;
            }

            // Unrecorded files belong to the other domain's roots
            auto existing = times.get(file);
            if (!existing || *now <= *existing) {
                continue;
            }

            changed.insert(path);
            FileTime settled = settle(file);
            devloop_core::scan_logger()->info("File change detected: {}", file.string());

            std::error_code ec;
            if (roots.copy && !fs::is_directory(file, ec)) {
                fs::path target = roots.output / path;
                fs::create_directories(target.parent_path(), ec);
                if (ec || !copy_bytes(file, target, ec)) {
                    devloop_core::scan_logger()->error("Failed to copy {}: {}", file.string(), ec.message());
                }
            }
            times.put(file, settled);
        }
    }
}

void ResourceSynchronizer::check_absolute_watched(TimestampSet& timestamps, std::set<std::string>& changed) {
    auto& times = timestamps.watched_file_timestamps();
    for (const auto& [path, restart] : timestamps.watched_paths()) {
        fs::path file(path);
        if (!file.is_absolute()) {
            continue;
        }
        auto now = modification_time(file);
        if (!now) {
            times.put(file, k_absent_time);
            continue;
        }
        auto existing = times.get(file);
        if (existing && *now > *existing) {
            changed.insert(path);
            FileTime settled = settle(file);
            devloop_core::scan_logger()->info("File change detected: {}", file.string());
            times.put(file, settled);
        }
    }
}

std::set<std::string> ResourceSynchronizer::check_for_file_change(ReloadDomain domain, TimestampSet& timestamps) {
    std::set<std::string> changed;
    for (const auto& module : m_context.modules) {
        const CompilationUnit* unit = DevModeContext::unit_for(module, domain);
        if (!unit) {
            continue;
        }
        auto roots = roots_for(*unit);
        if (!roots) {
            continue;
        }

        if (roots->copy) {
            mirror_resources(module, *unit, *roots, timestamps, changed);
        }
        check_watched_in_roots(*roots, timestamps, changed);
        check_absolute_watched(timestamps, changed);
    }
    return changed;
}

void ResourceSynchronizer::set_watched_file_paths(
    const std::map<std::string, bool>& watched,
    TimestampSet& timestamps,
    bool is_test)
{
    if (!is_test) {
        timestamps.watched_file_timestamps().clear();
    }

    std::map<std::string, bool> all = watched;
    auto& times = timestamps.watched_file_timestamps();

    for (const auto& module : m_context.modules) {
        std::vector<const CompilationUnit*> units;
        if (is_test && module.test) {
            units.push_back(&*module.test);
        }
        units.push_back(&module.main);

        for (const CompilationUnit* unit : units) {
            std::vector<fs::path> roots(unit->resource_paths.begin(), unit->resource_paths.end());
            if (roots.empty()) {
                if (unit->output_path.empty()) {
                    continue;
                }
                roots.push_back(unit->output_path);
            }

            for (const auto& root : roots) {
                for (const auto& [path, restart] : watched) {
                    fs::path file = root / path;
                    if (auto time = modification_time(file)) {
                        times.put(file, *time);
                        continue;
                    }
                    times.put(file, k_absent_time);
                    if (!has_glob_chars(path)) {
                        continue;
                    }
                    for (const auto& [match, time] : expand_glob(root, file)) {
                        times.put(match, time);
                        all[match.lexically_relative(root).generic_string()] = restart;
                    }
                }
            }
        }
    }

    timestamps.set_watched_paths(std::move(all));
}

} // namespace devloop_reload
