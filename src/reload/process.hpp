#pragma once

/// @file process.hpp
/// @brief Child process execution shared by the compiler and the symbol indexer

#include <string>
#include <vector>

namespace devloop_reload::detail {

struct ProcessResult {
    int exit_code = -1;
    bool launched = false;
    std::string output;  ///< stdout and stderr, interleaved
};

/// Run a program found on PATH and wait for it
ProcessResult execute_process(const std::string& command, const std::vector<std::string>& args);

} // namespace devloop_reload::detail
