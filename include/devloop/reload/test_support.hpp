#pragma once

/// @file test_support.hpp
/// @brief Continuous testing collaborator seen by the scan coordinator

#include <devloop/core/error.hpp>
#include <devloop/reload/compiler.hpp>
#include <devloop/reload/scan_result.hpp>

namespace devloop_reload {

/// The test subsystem. The coordinator compiles test sources with its
/// compiler and reports outcomes back; it never runs tests itself.
class TestSupport {
public:
    virtual ~TestSupport() = default;

    [[nodiscard]] virtual bool is_started() const = 0;

    /// Compiler for the test domain
    [[nodiscard]] virtual ICompiler& compiler() = 0;

    /// Run the affected tests; nullptr means run everything
    virtual void run_tests(const ScanResult* changed) = 0;

    virtual void test_compile_failed(const devloop_core::Error& problem) = 0;
    virtual void test_compile_succeeded() = 0;
};

} // namespace devloop_reload
