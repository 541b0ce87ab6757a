// devloop_reload DevModeConfig tests

#include <catch2/catch.hpp>
#include <devloop/reload/config.hpp>
#include <devloop/reload/reload_session.hpp>
#include <devloop/layer/application_layers.hpp>
#include <devloop/core/log.hpp>

#include "fakes.hpp"
#include "test_files.hpp"

#include <chrono>

using namespace devloop_reload;
using namespace devloop_core;
using namespace std::chrono_literals;
using devloop_layer::ArtifactKey;
using devloop_test::FakeCompiler;
using devloop_test::TempDir;
using devloop_test::read_file;
using devloop_test::text;
using devloop_test::write_file;

namespace {

ArtifactKey key(const std::string& text) {
    return *ArtifactKey::parse(text);
}

const char* k_full_config = R"({
    "layers": {
        "parent_first": ["org.acme:core"],
        "lesser_priority": ["org.acme:fallback"],
        "reloadable": ["org.acme:lib", "org.acme:ext"],
        "removed_artifacts": ["org.acme:legacy"],
        "removed_resources": { "org.acme:core": ["META-INF/x.txt", "y.txt"] }
    },
    "watched_files": { "application.json": true, "static/*.css": false },
    "instrumentation": true,
    "live_reload": false,
    "scan_period_ms": 250,
    "coalesce_delay_ms": 50,
    "compile_retry_limit": 3,
    "unit_extension": ".obj",
    "log": { "level": "debug", "console": false, "file": true, "directory": "build/logs" }
})";

} // anonymous namespace

// =============================================================================
// Parsing
// =============================================================================

TEST_CASE("DevModeConfig defaults", "[reload][config]") {
    auto config = DevModeConfig::from_json_string("{}");
    REQUIRE(config.is_ok());

    REQUIRE(config->layers.parent_first.empty());
    REQUIRE(config->watched_files.empty());
    REQUIRE_FALSE(config->instrumentation);
    REQUIRE(config->live_reload);
    REQUIRE(config->scan_period == std::chrono::milliseconds(1000));
    REQUIRE(config->coalesce_delay == std::chrono::milliseconds(500));
    REQUIRE(config->compile_retry_limit == 0);
    REQUIRE(config->unit_extension == ".o");
    REQUIRE(config->log.level == spdlog::level::info);
}

TEST_CASE("DevModeConfig full document", "[reload][config]") {
    auto config = DevModeConfig::from_json_string(k_full_config);
    REQUIRE(config.is_ok());

    REQUIRE(config->layers.parent_first == std::set<ArtifactKey>{key("org.acme:core")});
    REQUIRE(config->layers.lesser_priority == std::set<ArtifactKey>{key("org.acme:fallback")});
    REQUIRE(config->layers.reloadable.size() == 2);
    REQUIRE(config->layers.removed_artifacts.count(key("org.acme:legacy")) == 1);
    REQUIRE(config->layers.removed_resources.at(key("org.acme:core")) ==
            std::vector<std::string>{"META-INF/x.txt", "y.txt"});

    REQUIRE(config->watched_files.at("application.json"));
    REQUIRE_FALSE(config->watched_files.at("static/*.css"));

    REQUIRE(config->instrumentation);
    REQUIRE_FALSE(config->live_reload);
    REQUIRE(config->scan_period == std::chrono::milliseconds(250));
    REQUIRE(config->coalesce_delay == std::chrono::milliseconds(50));
    REQUIRE(config->compile_retry_limit == 3);
    REQUIRE(config->unit_extension == ".obj");

    REQUIRE(config->log.level == spdlog::level::debug);
    REQUIRE_FALSE(config->log.console_enabled);
    REQUIRE(config->log.file_enabled);
    REQUIRE(config->log.log_directory == "build/logs");

    SECTION("to_json round trip") {
        auto again = DevModeConfig::from_json(config->to_json());
        REQUIRE(again.is_ok());
        REQUIRE(again->layers.parent_first == config->layers.parent_first);
        REQUIRE(again->layers.lesser_priority == config->layers.lesser_priority);
        REQUIRE(again->layers.reloadable == config->layers.reloadable);
        REQUIRE(again->layers.removed_resources == config->layers.removed_resources);
        REQUIRE(again->watched_files == config->watched_files);
        REQUIRE(again->scan_period == config->scan_period);
        REQUIRE(again->compile_retry_limit == config->compile_retry_limit);
        REQUIRE(again->log.level == config->log.level);
    }
}

TEST_CASE("DevModeConfig rejects invalid values", "[reload][config]") {
    struct Case {
        const char* json;
        const char* field;
    };
    const Case cases[] = {
        {R"({"instrumentation": "yes"})", "instrumentation"},
        {R"({"live_reload": 1})", "live_reload"},
        {R"({"scan_period_ms": 0})", "scan_period_ms"},
        {R"({"scan_period_ms": -5})", "scan_period_ms"},
        {R"({"coalesce_delay_ms": "fast"})", "coalesce_delay_ms"},
        {R"({"compile_retry_limit": -1})", "compile_retry_limit"},
        {R"({"unit_extension": "o"})", "unit_extension"},
        {R"({"watched_files": {"a.json": "restart"}})", "watched_files.a.json"},
        {R"({"layers": {"reloadable": "org.acme:lib"}})", "layers.reloadable"},
        {R"({"layers": {"parent_first": [42]}})", "layers.parent_first"},
        {R"({"log": {"level": "chatty"}})", "log.level"},
        {R"([1, 2])", "<root>"},
    };

    for (const auto& c : cases) {
        INFO(c.json);
        auto config = DevModeConfig::from_json_string(c.json);
        REQUIRE(config.is_err());
        REQUIRE(config.error().code() == ErrorCode::ValidationError);
        const auto* detail = config.error().as<ConfigError>();
        REQUIRE(detail != nullptr);
        REQUIRE(detail->kind == ConfigError::Kind::InvalidValue);
        REQUIRE(detail->field == c.field);
    }
}

TEST_CASE("DevModeConfig parse errors", "[reload][config]") {
    auto config = DevModeConfig::from_json_string("{ not json");
    REQUIRE(config.is_err());
    REQUIRE(config.error().code() == ErrorCode::ParseError);
}

// =============================================================================
// Loading
// =============================================================================

TEST_CASE("DevModeConfig load from file", "[reload][config]") {
    TempDir dir;

    SECTION("valid file") {
        write_file(dir / "devmode.json", k_full_config);
        auto config = DevModeConfig::load(dir / "devmode.json");
        REQUIRE(config.is_ok());
        REQUIRE(config->compile_retry_limit == 3);
    }

    SECTION("missing file") {
        auto config = DevModeConfig::load(dir / "missing.json");
        REQUIRE(config.is_err());
        REQUIRE(config.error().code() == ErrorCode::NotFound);
    }

    SECTION("invalid file names the file") {
        write_file(dir / "devmode.json", R"({"scan_period_ms": "soon"})");
        auto config = DevModeConfig::load(dir / "devmode.json");
        REQUIRE(config.is_err());
        const auto* file = config.error().get_context("file");
        REQUIRE(file != nullptr);
        REQUIRE(*file == (dir / "devmode.json").string());
    }
}

TEST_CASE("DevModeConfig applies toggles to a session", "[reload][config]") {
    auto config = *DevModeConfig::from_json_string(R"({"instrumentation": true, "live_reload": false})");
    ReloadSession session;
    config.apply_to(session);

    REQUIRE(session.instrumentation_enabled());
    REQUIRE_FALSE(session.live_reload_enabled());
}

TEST_CASE("DevModeConfig lesser priority reaches the layers", "[reload][config]") {
    TempDir dir;
    write_file(dir / "deps/b/x.txt", "B");
    write_file(dir / "deps/a/x.txt", "A");

    devloop_layer::ApplicationModel model;
    model.dependencies = {
        devloop_layer::Artifact{key("g:b"), {dir / "deps/b"}, true},
        devloop_layer::Artifact{key("g:a"), {dir / "deps/a"}, true},
    };

    SECTION("declared dependency order wins without config") {
        devloop_layer::ApplicationLayers layers(model, devloop_layer::ClassLoadingConfig{}, devloop_layer::BootstrapOptions{});
        auto layer = layers.augmentation_layer();
        REQUIRE(layer.is_ok());
        REQUIRE(text((*layer)->resource("x.txt")->data) == "B");
    }

    SECTION("a lesser priority artifact yields to the others") {
        auto config = DevModeConfig::from_json_string(R"({"layers": {"lesser_priority": ["g:b"]}})");
        REQUIRE(config.is_ok());
        devloop_layer::ApplicationLayers layers(model, config->layers, devloop_layer::BootstrapOptions{});
        auto layer = layers.augmentation_layer();
        REQUIRE(layer.is_ok());
        REQUIRE(text((*layer)->resource("x.txt")->data) == "A");
    }
}

TEST_CASE("DevModeConfig applies scanning settings", "[reload][config]") {
    auto config = *DevModeConfig::from_json_string(k_full_config);

    SECTION("scan options") {
        ScanOptions options = config.scan_options();
        REQUIRE(options.period == 250ms);
        REQUIRE(options.coalesce_delay == 50ms);
    }

    SECTION("bootstrap options") {
        devloop_layer::BootstrapOptions options;
        config.apply_to(options);
        REQUIRE(options.unit_extension == ".obj");
    }

    SECTION("coordinator") {
        TempDir dir;
        auto compiler = std::make_shared<FakeCompiler>(std::map<std::filesystem::path, std::filesystem::path>{
            {dir / "src", dir / "out"}});
        ScanCollaborators collaborators;
        collaborators.compiler = compiler;
        collaborators.restart_callback = [](const std::set<std::string>&, const ScanResult&) {};
        ScanCoordinator coordinator(dir / "app-root", DevModeContext{}, DevModeType::Local,
                                    collaborators, std::make_shared<ReloadSession>());

        config.apply_to(coordinator);

        REQUIRE(coordinator.change_detector().compile_retry_limit() == 3);
        REQUIRE(coordinator.session().instrumentation_enabled());
        REQUIRE_FALSE(coordinator.session().live_reload_enabled());
        REQUIRE(coordinator.main_timestamps().watched_paths() == config.watched_files);
        REQUIRE(coordinator.test_scan_options().period == 250ms);
        REQUIRE(coordinator.test_scan_options().coalesce_delay == 50ms);
        coordinator.close();
    }
}

TEST_CASE("DevModeConfig applies its log section", "[reload][config]") {
    TempDir dir{"devloop-config-logs"};
    nlohmann::json j = {
        {"log", {{"level", "warn"}, {"console", false}, {"file", true}, {"directory", dir.path().string()}}},
    };
    auto config = DevModeConfig::from_json(j);
    REQUIRE(config.is_ok());

    config->apply_logging();
    REQUIRE(compiler_logger()->level() == spdlog::level::warn);

    compiler_logger()->warn("compiler output kept");
    flush_all_loggers();
    REQUIRE(read_file(dir / "compiler.log").find("compiler output kept") != std::string::npos);

    configure_logging(LogConfig{});
    REQUIRE(compiler_logger()->level() == LogConfig{}.level);
}
