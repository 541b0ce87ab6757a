// devloop_reload ChangeDetector tests

#include <catch2/catch.hpp>
#include <devloop/reload/change_detector.hpp>

#include "fakes.hpp"
#include "test_files.hpp"

using namespace devloop_reload;
using namespace devloop_core;
using devloop_test::FakeCompiler;
using devloop_test::TempDir;
using devloop_test::bump_mtime;
using devloop_test::rewrite_file;
using devloop_test::write_file;

namespace fs = std::filesystem;

// =============================================================================
// Test Utilities
// =============================================================================

namespace {

/// One module with a main and a test domain, already built once
struct Fixture {
    TempDir dir{"devloop-detect"};
    DevModeContext context;
    FakeCompiler compiler;
    ReloadSession session;
    ChangeDetector detector{context, session};
    TimestampSet timestamps;
    std::vector<std::optional<std::string>> statuses;

    Fixture()
        : compiler({{dir / "src", dir / "out"}, {dir / "test-src", dir / "test-out"}})
    {
        ModuleInfo module;
        module.name = "app";
        module.project_directory = dir.path();
        module.main.source_paths = {dir / "src"};
        module.main.output_path = dir / "out";
        CompilationUnit test;
        test.source_paths = {dir / "test-src"};
        test.output_path = dir / "test-out";
        module.test = test;
        context.modules.push_back(module);

        write_file(dir / "src/app/A.cpp", "demo::A run()");
        write_file(dir / "out/app/A.o", "demo::A run()");
        write_file(dir / "test-src/app/ATest.cpp", "demo::ATest check()");
        write_file(dir / "test-out/app/ATest.o", "demo::ATest check()");

        detector.set_partial_write_delay(std::chrono::milliseconds(0));
        detector.set_status_sink([this](const std::optional<std::string>& message) {
            statuses.push_back(message);
        });
    }

    ScanResult scan(bool first = false) {
        return detector.check_for_changed_units(compiler, ReloadDomain::Main, first, timestamps, false);
    }
};

} // anonymous namespace

// =============================================================================
// Timestamp Helpers
// =============================================================================

TEST_CASE("check_if_file_modified", "[reload][detector]") {
    TempDir dir;
    write_file(dir / "a.cpp", "a");
    TimestampSet::PathTimes times;

    SECTION("unseen files") {
        REQUIRE_FALSE(check_if_file_modified(dir / "a.cpp", times, true, false));
        REQUIRE_FALSE(times.contains(dir / "a.cpp"));
        REQUIRE(check_if_file_modified(dir / "a.cpp", times, false, true));
        REQUIRE(times.contains(dir / "a.cpp"));
    }

    SECTION("recorded files") {
        check_if_file_modified(dir / "a.cpp", times, true, true);
        REQUIRE_FALSE(check_if_file_modified(dir / "a.cpp", times, false, true));

        bump_mtime(dir / "a.cpp");
        REQUIRE(check_if_file_modified(dir / "a.cpp", times, false, false));
        REQUIRE(check_if_file_modified(dir / "a.cpp", times, false, true));
        REQUIRE_FALSE(check_if_file_modified(dir / "a.cpp", times, false, true));
    }

    SECTION("missing files are never modified") {
        REQUIRE_FALSE(check_if_file_modified(dir / "missing.cpp", times, false, true));
    }
}

TEST_CASE("unit_was_added", "[reload][detector]") {
    TempDir dir;
    write_file(dir / "A.o", "a");
    write_file(dir / "B.o", "b");
    TimestampSet::PathTimes times;

    REQUIRE_FALSE(unit_was_added(dir / "A.o", times, true));
    REQUIRE(times.contains(dir / "A.o"));
    REQUIRE_FALSE(unit_was_added(dir / "A.o", times, false));

    REQUIRE(unit_was_added(dir / "B.o", times, false));
    REQUIRE_FALSE(unit_was_added(dir / "B.o", times, false));
}

// =============================================================================
// Main Domain Scans
// =============================================================================

TEST_CASE("ChangeDetector first scan records without reporting", "[reload][detector]") {
    Fixture f;
    auto first = f.scan(true);

    REQUIRE_FALSE(first.is_changed());
    REQUIRE_FALSE(first.compilation_happened);
    REQUIRE(f.compiler.compile_calls.load() == 0);
    REQUIRE(f.timestamps.unit_timestamps().contains(f.dir / "out/app/A.o"));
    REQUIRE(f.timestamps.unit_sources().get(f.dir / "out/app/A.o") == f.dir / "src/app/A.cpp");
    REQUIRE(f.detector.source_timestamps().contains(f.dir / "src/app/A.cpp"));

    SECTION("nothing changed") {
        auto result = f.scan();
        REQUIRE_FALSE(result.is_changed());
        REQUIRE_FALSE(result.compilation_happened);
        REQUIRE(f.compiler.compile_calls.load() == 0);
    }

    SECTION("test domain untouched") {
        REQUIRE_FALSE(f.timestamps.unit_timestamps().contains(f.dir / "test-out/app/ATest.o"));
    }
}

TEST_CASE("ChangeDetector reports changed, added and deleted units", "[reload][detector]") {
    Fixture f;
    f.scan(true);

    SECTION("modified source") {
        rewrite_file(f.dir / "src/app/A.cpp", "demo::A run() demo::A stop()");
        auto result = f.scan();

        REQUIRE(result.compilation_happened);
        REQUIRE(f.compiler.compile_calls.load() == 1);
        REQUIRE(result.changed_units == std::set<fs::path>{f.dir / "out/app/A.o"});
        REQUIRE(result.changed_names == std::set<std::string>{"app/A.o"});
        REQUIRE(result.added_units.empty());
        REQUIRE(result.deleted_units.empty());

        auto again = f.scan();
        REQUIRE_FALSE(again.is_changed());
        REQUIRE(f.compiler.compile_calls.load() == 1);
    }

    SECTION("new source") {
        write_file(f.dir / "src/app/B.cpp", "demo::B run()");
        auto result = f.scan();

        REQUIRE(result.added_units == std::set<fs::path>{f.dir / "out/app/B.o"});
        REQUIRE(result.added_names == std::set<std::string>{"app/B.o"});
        REQUIRE(result.changed_units.empty());
        REQUIRE(f.timestamps.unit_sources().get(f.dir / "out/app/B.o") == f.dir / "src/app/B.cpp");
    }

    SECTION("deleted source") {
        fs::remove(f.dir / "src/app/A.cpp");
        auto result = f.scan();

        REQUIRE_FALSE(result.compilation_happened);
        REQUIRE(result.deleted_units == std::set<fs::path>{f.dir / "out/app/A.o"});
        REQUIRE(result.deleted_names == std::set<std::string>{"app/A.o"});
        REQUIRE_FALSE(fs::exists(f.dir / "out/app/A.o"));
        REQUIRE_FALSE(f.timestamps.unit_timestamps().contains(f.dir / "out/app/A.o"));
        REQUIRE_FALSE(f.detector.source_timestamps().contains(f.dir / "src/app/A.cpp"));
    }

    SECTION("unit rebuilt outside a scan") {
        bump_mtime(f.dir / "out/app/A.o");
        auto result = f.scan();
        REQUIRE_FALSE(result.compilation_happened);
        REQUIRE(result.changed_units == std::set<fs::path>{f.dir / "out/app/A.o"});
    }

    SECTION("missing source roots are skipped") {
        fs::remove_all(f.dir / "src");
        auto result = f.scan();
        REQUIRE(f.compiler.compile_calls.load() == 0);
        REQUIRE(result.deleted_units.size() == 1);
    }
}

TEST_CASE("ChangeDetector deletes units a recompile no longer produces", "[reload][detector]") {
    Fixture f;
    write_file(f.dir / "out/app/A$Inner.o", "demo::A::Inner call()");
    f.scan(true);
    REQUIRE(f.timestamps.unit_sources().get(f.dir / "out/app/A$Inner.o") == f.dir / "src/app/A.cpp");

    // The inner type was removed from A.cpp: only A.o is written again
    rewrite_file(f.dir / "src/app/A.cpp", "demo::A run() demo::A stop()");
    auto result = f.scan();

    REQUIRE(result.compilation_happened);
    REQUIRE(result.changed_units == std::set<fs::path>{f.dir / "out/app/A.o"});
    REQUIRE(result.deleted_units == std::set<fs::path>{f.dir / "out/app/A$Inner.o"});
    REQUIRE(result.deleted_names == std::set<std::string>{"app/A$Inner.o"});
    REQUIRE_FALSE(fs::exists(f.dir / "out/app/A$Inner.o"));
    REQUIRE_FALSE(f.timestamps.unit_timestamps().contains(f.dir / "out/app/A$Inner.o"));
    REQUIRE_FALSE(f.timestamps.unit_sources().contains(f.dir / "out/app/A$Inner.o"));

    auto again = f.scan();
    REQUIRE_FALSE(again.is_changed());
}

// =============================================================================
// Compile Problems
// =============================================================================

TEST_CASE("ChangeDetector records compile problems until fixed", "[reload][detector]") {
    Fixture f;
    f.scan(true);

    rewrite_file(f.dir / "src/app/A.cpp", "#error broken");
    auto failed = f.scan();

    REQUIRE(failed.compilation_happened);
    REQUIRE_FALSE(failed.is_changed());
    REQUIRE(f.session.compile_problem().has_value());
    REQUIRE(f.session.compile_problem()->code() == ErrorCode::CompileError);
    REQUIRE_FALSE(f.session.test_compile_problem().has_value());
    REQUIRE(f.statuses.size() == 1);
    REQUIRE(f.statuses.back().has_value());

    SECTION("the failing source is compiled again on the next scan") {
        f.scan();
        REQUIRE(f.compiler.compile_calls.load() == 2);
        REQUIRE(f.session.compile_problem().has_value());
    }

    SECTION("fixing the source clears the problem") {
        rewrite_file(f.dir / "src/app/A.cpp", "demo::A run()");
        auto fixed = f.scan();

        REQUIRE_FALSE(f.session.compile_problem().has_value());
        REQUIRE_FALSE(f.statuses.back().has_value());
        REQUIRE(fixed.changed_units == std::set<fs::path>{f.dir / "out/app/A.o"});
    }
}

TEST_CASE("ChangeDetector test domain problems stay separate", "[reload][detector]") {
    Fixture f;
    TimestampSet test_timestamps;
    f.detector.check_for_changed_units(f.compiler, ReloadDomain::Test, true, test_timestamps, true);
    REQUIRE(test_timestamps.unit_timestamps().contains(f.dir / "test-out/app/ATest.o"));

    rewrite_file(f.dir / "test-src/app/ATest.cpp", "#error broken test");
    f.detector.check_for_changed_units(f.compiler, ReloadDomain::Test, false, test_timestamps, true);

    REQUIRE(f.session.test_compile_problem().has_value());
    REQUIRE_FALSE(f.session.compile_problem().has_value());

    rewrite_file(f.dir / "test-src/app/ATest.cpp", "demo::ATest check() demo::ATest more()");
    auto fixed = f.detector.check_for_changed_units(f.compiler, ReloadDomain::Test, false, test_timestamps, true);
    REQUIRE_FALSE(f.session.test_compile_problem().has_value());
    REQUIRE(fixed.changed_names == std::set<std::string>{"app/ATest.o"});
}

// =============================================================================
// Convergence
// =============================================================================

TEST_CASE("ChangeDetector recompiles sources edited during compilation", "[reload][detector]") {
    Fixture f;
    f.scan(true);
    rewrite_file(f.dir / "src/app/A.cpp", "demo::A run() demo::A stop()");

    int edits = 0;
    f.compiler.during_compile = [&] {
        if (edits++ == 0) {
            bump_mtime(f.dir / "src/app/A.cpp");
        }
    };

    SECTION("until the inputs settle") {
        auto result = f.scan();
        REQUIRE(f.compiler.compile_calls.load() == 2);
        REQUIRE(result.changed_names == std::set<std::string>{"app/A.o"});

        f.compiler.during_compile = nullptr;
        f.scan();
        REQUIRE(f.compiler.compile_calls.load() == 2);
    }

    SECTION("bounded retries leave the source for the next scan") {
        f.detector.set_compile_retry_limit(1);
        REQUIRE(f.detector.compile_retry_limit() == 1);
        f.scan();
        REQUIRE(f.compiler.compile_calls.load() == 1);

        f.compiler.during_compile = nullptr;
        f.scan();
        REQUIRE(f.compiler.compile_calls.load() == 2);
    }
}
