/// @file log.cpp
/// @brief devloop logger registry
///
/// Every subsystem logger is created through one registry, so a single
/// configure_logging() call reaches the layer, scan, hot swap and compiler
/// loggers, including the ones cached before the call.

#include <devloop/core/log.hpp>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <filesystem>
#include <map>
#include <mutex>
#include <vector>

namespace devloop_core {

namespace {

class LoggerRegistry {
public:
    static LoggerRegistry& instance() {
        static LoggerRegistry registry;
        return registry;
    }

    void configure(const LogConfig& config) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config = config;
        for (auto& [name, logger] : m_loggers) {
            logger->sinks() = make_sinks(name);
            logger->set_level(m_config.level);
        }
    }

    std::shared_ptr<spdlog::logger> get(const std::string& name) {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_loggers.find(name);
        if (it != m_loggers.end()) {
            return it->second;
        }

        auto sinks = make_sinks(name);
        auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(m_config.level);
        m_loggers.emplace(name, logger);
        return logger;
    }

    void flush() {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto& [name, logger] : m_loggers) {
            logger->flush();
        }
    }

private:
    /// Called with m_mutex held
    std::vector<spdlog::sink_ptr> make_sinks(const std::string& name) {
        std::vector<spdlog::sink_ptr> sinks;

        if (m_config.console_enabled) {
            if (!m_console) {
                m_console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
                m_console->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%n] %v");
            }
            sinks.push_back(m_console);
        }

        if (m_config.file_enabled && !m_config.log_directory.empty()) {
            std::filesystem::path file = std::filesystem::path(m_config.log_directory) / (name + ".log");
            try {
                auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    file.string(), m_config.max_file_size, m_config.max_files);
                sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
                sinks.push_back(std::move(sink));
            } catch (const spdlog::spdlog_ex& e) {
                spdlog::warn("devloop: cannot open log file {}: {}", file.string(), e.what());
            }
        }

        return sinks;
    }

    std::mutex m_mutex;
    LogConfig m_config;
    spdlog::sink_ptr m_console;
    std::map<std::string, std::shared_ptr<spdlog::logger>> m_loggers;
};

} // anonymous namespace

void configure_logging(const LogConfig& config) {
    LoggerRegistry::instance().configure(config);
}

std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
    return LoggerRegistry::instance().get(name);
}

std::shared_ptr<spdlog::logger> layer_logger() {
    static auto logger = get_logger("layer");
    return logger;
}

std::shared_ptr<spdlog::logger> scan_logger() {
    static auto logger = get_logger("scan");
    return logger;
}

std::shared_ptr<spdlog::logger> hot_swap_logger() {
    static auto logger = get_logger("hot_swap");
    return logger;
}

std::shared_ptr<spdlog::logger> compiler_logger() {
    static auto logger = get_logger("compiler");
    return logger;
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str) {
    static const std::map<std::string, spdlog::level::level_enum> levels = {
        {"trace", spdlog::level::trace},
        {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},
        {"warn", spdlog::level::warn},
        {"warning", spdlog::level::warn},
        {"error", spdlog::level::err},
        {"err", spdlog::level::err},
        {"critical", spdlog::level::critical},
        {"fatal", spdlog::level::critical},
        {"off", spdlog::level::off},
    };
    auto it = levels.find(str);
    if (it == levels.end()) {
        return std::nullopt;
    }
    return it->second;
}

const char* log_level_name(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::trace: return "trace";
        case spdlog::level::debug: return "debug";
        case spdlog::level::info: return "info";
        case spdlog::level::warn: return "warn";
        case spdlog::level::err: return "error";
        case spdlog::level::critical: return "critical";
        case spdlog::level::off: return "off";
        default: return "unknown";
    }
}

void flush_all_loggers() {
    LoggerRegistry::instance().flush();
}

} // namespace devloop_core
