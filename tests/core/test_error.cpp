// devloop_core Error and Result tests

#include <catch2/catch.hpp>
#include <devloop/core/error.hpp>
#include <string>
#include <vector>

using namespace devloop_core;

// =============================================================================
// Error Tests
// =============================================================================

TEST_CASE("Error construction", "[core][error]") {
    SECTION("from string") {
        Error err("Test error");
        REQUIRE(err.message() == "Test error");
        REQUIRE(err.code() == ErrorCode::Unknown);
    }

    SECTION("from code and message") {
        Error err(ErrorCode::InvalidArgument, "Bad argument");
        REQUIRE(err.code() == ErrorCode::InvalidArgument);
        REQUIRE(err.message() == "Bad argument");
    }

    SECTION("with context") {
        Error err = Error("Base error").with_context("key", "value");
        auto* ctx = err.get_context("key");
        REQUIRE(ctx != nullptr);
        REQUIRE(*ctx == "value");
        REQUIRE(err.get_context("missing") == nullptr);
    }
}

TEST_CASE("Error kinds map to codes", "[core][error]") {
    SECTION("LayerError") {
        REQUIRE(Error(LayerError::open_failed("a.tar", "missing")).code() == ErrorCode::IOError);
        REQUIRE(Error(LayerError::malformed_archive("a.tar", "short")).code() == ErrorCode::ParseError);
    }

    SECTION("CompileError") {
        REQUIRE(Error(CompileError::failed("src", {"a.cpp"}, {}, "")).code() == ErrorCode::CompileError);
        REQUIRE(Error(CompileError::launch_failed("c++", "no such file")).code() == ErrorCode::IOError);
    }

    SECTION("HotSwapError") {
        REQUIRE(Error(HotSwapError::no_baseline()).code() == ErrorCode::InvalidState);
        REQUIRE(Error(HotSwapError::structure_changed("Foo")).code() == ErrorCode::Rejected);
        REQUIRE(Error(HotSwapError::vetoed("Foo")).code() == ErrorCode::Rejected);
        REQUIRE(Error(HotSwapError::index_failed("a.o", "bad")).code() == ErrorCode::ParseError);
        REQUIRE(Error(HotSwapError::redefine_failed("nope")).code() == ErrorCode::NotSupported);
    }

    SECTION("ConfigError") {
        REQUIRE(Error(ConfigError::file_not_found("x.json")).code() == ErrorCode::NotFound);
        REQUIRE(Error(ConfigError::parse_failed("eof")).code() == ErrorCode::ParseError);
        REQUIRE(Error(ConfigError::invalid_value("f", "bad")).code() == ErrorCode::ValidationError);
    }
}

TEST_CASE("Error kind access", "[core][error]") {
    Error err(HotSwapError::structure_changed("demo::Widget"));

    REQUIRE(err.is<HotSwapError>());
    REQUIRE_FALSE(err.is<LayerError>());
    REQUIRE(err.as<LayerError>() == nullptr);

    const auto* swap = err.as<HotSwapError>();
    REQUIRE(swap != nullptr);
    REQUIRE(swap->kind == HotSwapError::Kind::StructureChanged);
    REQUIRE(swap->type_name == "demo::Widget");
    REQUIRE(err.message().find("demo::Widget") != std::string::npos);
}

TEST_CASE("CompileError diagnostics", "[core][error]") {
    std::vector<CompileDiagnostic> diags = {
        {CompileDiagnostic::Severity::Error, "a.cpp", 3, 7, "expected ';'"},
        {CompileDiagnostic::Severity::Warning, "a.cpp", 9, 1, "unused variable"},
        {CompileDiagnostic::Severity::Error, "b.cpp", 1, 1, "unknown type"},
    };
    auto compile = CompileError::failed("src", {"a.cpp", "b.cpp"}, diags, "");

    REQUIRE(compile.count(CompileDiagnostic::Severity::Error) == 2);
    REQUIRE(compile.count(CompileDiagnostic::Severity::Warning) == 1);
    REQUIRE(compile.count(CompileDiagnostic::Severity::Note) == 0);

    SECTION("chain lists each diagnostic") {
        std::string chain = build_error_chain(Error(compile));
        REQUIRE(chain.find("[CompileError]") != std::string::npos);
        REQUIRE(chain.find("(2 files)") != std::string::npos);
        REQUIRE(chain.find("a.cpp:3:7: error: expected ';'") != std::string::npos);
        REQUIRE(chain.find("b.cpp:1:1: error: unknown type") != std::string::npos);
    }
}

TEST_CASE("Error chain includes context", "[core][error]") {
    Error err(ConfigError::invalid_value("scan_period_ms", "must be positive"));
    err.with_context("file", "devloop.json");

    std::string chain = build_error_chain(err);
    REQUIRE(chain.find("[ValidationError]") != std::string::npos);
    REQUIRE(chain.find("(field: scan_period_ms)") != std::string::npos);
    REQUIRE(chain.find("file: devloop.json") != std::string::npos);
}

// =============================================================================
// Result<T> Tests
// =============================================================================

TEST_CASE("Result construction", "[core][result]") {
    SECTION("Ok with value") {
        Result<int> r = Ok(42);
        REQUIRE(r.is_ok());
        REQUIRE_FALSE(r.is_err());
        REQUIRE(r.value() == 42);
    }

    SECTION("Ok void") {
        Result<void> r = Ok();
        REQUIRE(r.is_ok());
        REQUIRE_FALSE(r.is_err());
    }

    SECTION("Err with message") {
        Result<int> r = Err<int>(std::string("Something failed"));
        REQUIRE(r.is_err());
        REQUIRE(r.error().message() == "Something failed");
    }

    SECTION("Err void with kind") {
        Result<void> r = Err(Error(CompileError::launch_failed("c++", "not found")));
        REQUIRE(r.is_err());
        REQUIRE(r.error().is<CompileError>());
        REQUIRE_THROWS(r.unwrap());
    }
}

TEST_CASE("Result value access", "[core][result]") {
    SECTION("value_or on Err") {
        Result<int> r = Err<int>(Error("error"));
        REQUIRE(r.value_or(7) == 7);
    }

    SECTION("unwrap on Err throws") {
        Result<int> r = Err<int>(Error("error"));
        REQUIRE_THROWS(r.unwrap());
    }

    SECTION("arrow on struct") {
        struct Data {
            int x;
        };
        Result<Data> r = Ok(Data{5});
        REQUIRE(r->x == 5);
    }
}

TEST_CASE("Result map operations", "[core][result]") {
    SECTION("map on Ok") {
        Result<int> r = Ok(21);
        auto r2 = r.map([](int x) { return x * 2; });
        REQUIRE(r2.is_ok());
        REQUIRE(r2.value() == 42);
    }

    SECTION("map keeps the error") {
        Result<int> r = Err<int>(Error(ErrorCode::NotFound, "gone"));
        auto r2 = r.map([](int x) { return x * 2; });
        REQUIRE(r2.is_err());
        REQUIRE(r2.error().code() == ErrorCode::NotFound);
    }

    SECTION("and_then on Ok") {
        Result<int> r = Ok(42);
        auto r2 = r.and_then([](int x) -> Result<std::string> {
            return Ok(std::to_string(x));
        });
        REQUIRE(r2.is_ok());
        REQUIRE(r2.value() == "42");
    }
}
