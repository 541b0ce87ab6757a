#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for devloop_core module

#include <cstdint>

namespace devloop_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct LayerError;
struct CompileDiagnostic;
struct CompileError;
struct HotSwapError;
struct ConfigError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;

} // namespace devloop_core
