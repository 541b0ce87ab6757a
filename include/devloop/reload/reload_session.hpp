#pragma once

/// @file reload_session.hpp
/// @brief Process-wide reload state shared by the scan coordinator and the hot swap engine

#include <devloop/core/error.hpp>
#include <devloop/reload/structural_index.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace devloop_reload {

/// Holds the structural index of the last successful start, the
/// instrumentation and live reload toggles, and the outstanding compile and
/// deployment problems. All accessors are short critical sections.
class ReloadSession {
public:
    ReloadSession() = default;

    ReloadSession(const ReloadSession&) = delete;
    ReloadSession& operator=(const ReloadSession&) = delete;

    // -------------------------------------------------------------------------
    // Application start
    // -------------------------------------------------------------------------

    /// Record the index of a successful start and clear any deployment problem
    void startup_succeeded(std::shared_ptr<const StructuralIndex> index);

    /// Run failed-start handlers, clear the index and record the problem
    void startup_failed(devloop_core::Error problem);

    void add_failed_start_handler(std::function<void()> handler);

    [[nodiscard]] std::shared_ptr<const StructuralIndex> last_start_index() const;

    // -------------------------------------------------------------------------
    // Toggles
    // -------------------------------------------------------------------------

    void set_configured_instrumentation(bool enabled) { m_configured_instrumentation.store(enabled); }

    /// Effective value: the runtime override if set, else the configured value
    [[nodiscard]] bool instrumentation_enabled() const;

    /// Flip the effective value; returns the new value
    bool toggle_instrumentation();

    [[nodiscard]] bool live_reload_enabled() const { return m_live_reload.load(); }
    void set_live_reload_enabled(bool enabled) { m_live_reload.store(enabled); }
    bool toggle_live_reload();

    // -------------------------------------------------------------------------
    // Problems
    // -------------------------------------------------------------------------

    [[nodiscard]] std::optional<devloop_core::Error> compile_problem() const;
    [[nodiscard]] std::optional<devloop_core::Error> test_compile_problem() const;
    [[nodiscard]] std::optional<devloop_core::Error> deployment_problem() const;

    void set_compile_problem(std::optional<devloop_core::Error> problem);
    void set_test_compile_problem(std::optional<devloop_core::Error> problem);
    void set_deployment_problem(std::optional<devloop_core::Error> problem);

private:
    mutable std::mutex m_mutex;
    std::shared_ptr<const StructuralIndex> m_last_start_index;
    std::vector<std::function<void()>> m_failed_start_handlers;
    std::optional<devloop_core::Error> m_compile_problem;
    std::optional<devloop_core::Error> m_test_compile_problem;
    std::optional<devloop_core::Error> m_deployment_problem;
    std::optional<bool> m_instrumentation_override;

    std::atomic<bool> m_configured_instrumentation{false};
    std::atomic<bool> m_live_reload{true};
};

} // namespace devloop_reload
