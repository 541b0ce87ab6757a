/// @file error.cpp
/// @brief Error handling implementation for devloop_core
///
/// Result and Error are header-only; this file holds formatting of the
/// domain error kinds and explicit instantiations.

#include <devloop/core/error.hpp>
#include <filesystem>
#include <set>
#include <sstream>
#include <vector>

namespace devloop_core {

// =============================================================================
// Error Message Formatting
// =============================================================================

namespace detail {

const char* severity_name(CompileDiagnostic::Severity severity) {
    switch (severity) {
        case CompileDiagnostic::Severity::Note: return "note";
        case CompileDiagnostic::Severity::Warning: return "warning";
        case CompileDiagnostic::Severity::Error: return "error";
        default: return "unknown";
    }
}

std::string format_layer_error(const LayerError& err) {
    std::ostringstream oss;
    oss << "[LayerError] " << err.message;
    return oss.str();
}

std::string format_compile_error(const CompileError& err) {
    std::ostringstream oss;
    oss << "[CompileError] " << err.message;

    if (!err.files.empty()) {
        oss << " (" << err.files.size() << " file" << (err.files.size() == 1 ? "" : "s") << ")";
    }
    for (const auto& d : err.diagnostics) {
        oss << "\n  " << d.file << ":" << d.line << ":" << d.column << ": "
            << severity_name(d.severity) << ": " << d.message;
    }

    return oss.str();
}

std::string format_hot_swap_error(const HotSwapError& err) {
    std::ostringstream oss;
    oss << "[HotSwapError] " << err.message;
    return oss.str();
}

std::string format_config_error(const ConfigError& err) {
    std::ostringstream oss;
    oss << "[ConfigError] " << err.message;
    if (!err.field.empty()) {
        oss << " (field: " << err.field << ")";
    }
    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, LayerError>) {
            oss << detail::format_layer_error(err);
        } else if constexpr (std::is_same_v<T, CompileError>) {
            oss << detail::format_compile_error(err);
        } else if constexpr (std::is_same_v<T, HotSwapError>) {
            oss << detail::format_hot_swap_error(err);
        } else if constexpr (std::is_same_v<T, ConfigError>) {
            oss << detail::format_config_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << "\n  " << key << ": " << value;
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<std::string, Error>;
template class Result<std::vector<std::uint8_t>, Error>;
template class Result<std::set<std::string>, Error>;
template class Result<std::filesystem::path, Error>;

} // namespace devloop_core
