// devloop_reload CommandCompiler tests

#include <catch2/catch.hpp>
#include <devloop/reload/compiler.hpp>

#include "test_files.hpp"

using namespace devloop_reload;
using namespace devloop_core;
using devloop_test::TempDir;
using devloop_test::write_file;

namespace fs = std::filesystem;

// =============================================================================
// Test Utilities
// =============================================================================

namespace {

/// Executable shell script standing in for a compiler
fs::path write_script(const fs::path& path, const std::string& body) {
    write_file(path, "#!/bin/sh\n" + body);
    fs::permissions(path, fs::perms::owner_all, fs::perm_options::add);
    return path;
}

} // anonymous namespace

// =============================================================================
// Command Line
// =============================================================================

TEST_CASE("CommandCompiler command line", "[reload][compiler]") {
    auto config = CompilerConfig::Builder()
        .compiler_path("g++")
        .flag("-std=c++20")
        .include_path("/opt/include")
        .define("DEV=1")
        .build();
    CommandCompiler compiler(config);

    auto args = compiler.build_compile_command("src/a.cpp", "out/a.o");
    REQUIRE(args == std::vector<std::string>{
        "-std=c++20", "-I/opt/include", "-DDEV=1", "-c", "src/a.cpp", "-o", "out/a.o"});
    REQUIRE(compiler.handled_extensions().count(".cpp") == 1);
    REQUIRE(compiler.unit_extension() == ".o");
}

TEST_CASE("CommandCompiler diagnostics parsing", "[reload][compiler]") {
    std::string output =
        "In file included from src/b.hpp:1:\n"
        "src/a.cpp:12:5: error: expected ';' after expression\n"
        "src/a.cpp:20:1: warning: unused variable 'x'\n"
        "src/a.hpp:3:9: note: declared here\n"
        "src/c.cpp:1:10: fatal error: missing.hpp: No such file or directory\n";

    auto diags = CommandCompiler::parse_output(output);
    REQUIRE(diags.size() == 4);

    REQUIRE(diags[0].file == "src/a.cpp");
    REQUIRE(diags[0].line == 12);
    REQUIRE(diags[0].column == 5);
    REQUIRE(diags[0].severity == CompileDiagnostic::Severity::Error);
    REQUIRE(diags[0].message == "expected ';' after expression");

    REQUIRE(diags[1].severity == CompileDiagnostic::Severity::Warning);
    REQUIRE(diags[2].severity == CompileDiagnostic::Severity::Note);
    REQUIRE(diags[3].severity == CompileDiagnostic::Severity::Error);
}

// =============================================================================
// Source Mapping
// =============================================================================

TEST_CASE("CommandCompiler maps units back to sources", "[reload][compiler]") {
    TempDir dir;
    write_file(dir / "src/app/Main.cpp", "int main() {}");
    write_file(dir / "gen/app/Gen.cc", "");

    CommandCompiler compiler(CompilerConfig{});
    std::set<fs::path> roots = {dir / "src", dir / "gen"};

    auto main = compiler.find_source_path(dir / "out/app/Main.o", roots, dir / "out");
    REQUIRE(main.has_value());
    REQUIRE(*main == dir / "src/app/Main.cpp");

    auto gen = compiler.find_source_path(dir / "out/app/Gen.o", roots, dir / "out");
    REQUIRE(gen.has_value());
    REQUIRE(*gen == dir / "gen/app/Gen.cc");

    REQUIRE_FALSE(compiler.find_source_path(dir / "out/app/Gone.o", roots, dir / "out").has_value());
    REQUIRE_FALSE(compiler.find_source_path(dir / "elsewhere/Main.o", roots, dir / "out").has_value());
}

// =============================================================================
// Compilation
// =============================================================================

TEST_CASE("CommandCompiler compiles into the output root", "[reload][compiler]") {
    TempDir dir;
    write_file(dir / "src/app/Main.cpp", "");
    write_file(dir / "src/notes.txt", "");

    // Touches the file after -o
    auto script = write_script(dir / "fake-cc",
        "while [ $# -gt 0 ]; do\n"
        "  if [ \"$1\" = \"-o\" ]; then shift; touch \"$1\"; fi\n"
        "  shift\n"
        "done\n");

    CommandCompiler compiler(CompilerConfig::Builder()
        .compiler_path(script)
        .output_root(dir / "src", dir / "out")
        .build());

    FilesByExtension files;
    files[".cpp"] = {dir / "src/app/Main.cpp"};
    files[".txt"] = {dir / "src/notes.txt"};

    auto result = compiler.compile(dir / "src", files);
    REQUIRE(result.is_ok());
    REQUIRE(fs::exists(dir / "out/app/Main.o"));
    REQUIRE_FALSE(fs::exists(dir / "out/notes.o"));
}

TEST_CASE("CommandCompiler failures", "[reload][compiler]") {
    TempDir dir;
    write_file(dir / "src/a.cpp", "");
    FilesByExtension files;
    files[".cpp"] = {dir / "src/a.cpp"};

    SECTION("compiler reports errors") {
        auto script = write_script(dir / "failing-cc",
            "echo \"src/a.cpp:3:5: error: boom\"\n"
            "exit 1\n");
        CommandCompiler compiler(CompilerConfig::Builder()
            .compiler_path(script)
            .output_root(dir / "src", dir / "out")
            .build());

        auto result = compiler.compile(dir / "src", files);
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::CompileError);
        const auto* compile = result.error().as<CompileError>();
        REQUIRE(compile != nullptr);
        REQUIRE(compile->diagnostics.size() == 1);
        REQUIRE(compile->diagnostics[0].message == "boom");
        REQUIRE(compile->files.size() == 1);
    }

    SECTION("compiler cannot be launched") {
        CommandCompiler compiler(CompilerConfig::Builder()
            .compiler_path(dir / "no-such-compiler")
            .output_root(dir / "src", dir / "out")
            .build());

        auto result = compiler.compile(dir / "src", files);
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::IOError);
    }

    SECTION("source root without an output root") {
        CommandCompiler compiler(CompilerConfig{});
        auto result = compiler.compile(dir / "src", files);
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::InvalidArgument);
    }
}
