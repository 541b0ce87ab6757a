/// @file reload_session.cpp
/// @brief ReloadSession implementation

#include <devloop/reload/reload_session.hpp>
#include <devloop/core/log.hpp>

#include <exception>

namespace devloop_reload {

void ReloadSession::startup_succeeded(std::shared_ptr<const StructuralIndex> index) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_last_start_index = std::move(index);
    m_deployment_problem.reset();
}

void ReloadSession::startup_failed(devloop_core::Error problem) {
    std::vector<std::function<void()>> handlers;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        handlers = m_failed_start_handlers;
        m_last_start_index.reset();
        m_deployment_problem = std::move(problem);
    }

    for (auto& handler : handlers) {
        try {
            handler();
        } catch (const std::exception& e) {
            devloop_core::scan_logger()->error("Failed-start handler threw: {}", e.what());
        }
    }
}

void ReloadSession::add_failed_start_handler(std::function<void()> handler) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_failed_start_handlers.push_back(std::move(handler));
}

std::shared_ptr<const StructuralIndex> ReloadSession::last_start_index() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_last_start_index;
}

bool ReloadSession::instrumentation_enabled() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_instrumentation_override) {
        return *m_instrumentation_override;
    }
    return m_configured_instrumentation.load();
}

bool ReloadSession::toggle_instrumentation() {
    std::lock_guard<std::mutex> lock(m_mutex);
    bool current = m_instrumentation_override ? *m_instrumentation_override : m_configured_instrumentation.load();
    m_instrumentation_override = !current;
    devloop_core::scan_logger()->info("Instrumentation based reload {}", !current ? "enabled" : "disabled");
    return !current;
}

bool ReloadSession::toggle_live_reload() {
    bool enabled = !m_live_reload.load();
    m_live_reload.store(enabled);
    devloop_core::scan_logger()->info("Live reload {}", enabled ? "enabled" : "disabled");
    return enabled;
}

std::optional<devloop_core::Error> ReloadSession::compile_problem() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_compile_problem;
}

std::optional<devloop_core::Error> ReloadSession::test_compile_problem() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_test_compile_problem;
}

std::optional<devloop_core::Error> ReloadSession::deployment_problem() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_deployment_problem;
}

void ReloadSession::set_compile_problem(std::optional<devloop_core::Error> problem) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_compile_problem = std::move(problem);
}

void ReloadSession::set_test_compile_problem(std::optional<devloop_core::Error> problem) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_test_compile_problem = std::move(problem);
}

void ReloadSession::set_deployment_problem(std::optional<devloop_core::Error> problem) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_deployment_problem = std::move(problem);
}

} // namespace devloop_reload
