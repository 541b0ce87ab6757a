// devloop_reload ResourceSynchronizer tests

#include <catch2/catch.hpp>
#include <devloop/reload/resource_sync.hpp>

#include "test_files.hpp"

#include <thread>

using namespace devloop_reload;
using devloop_test::TempDir;
using devloop_test::read_file;
using devloop_test::rewrite_file;
using devloop_test::write_file;

namespace fs = std::filesystem;

// =============================================================================
// Test Utilities
// =============================================================================

namespace {

struct Fixture {
    TempDir dir{"devloop-resources"};
    DevModeContext context;
    ResourceSynchronizer sync{context};
    TimestampSet timestamps;

    Fixture() {
        ModuleInfo module;
        module.name = "app";
        module.main.resource_paths = {dir / "res"};
        module.main.resources_output_path = dir / "out-res";
        module.main.output_path = dir / "out";
        context.modules.push_back(module);

        write_file(dir / "res/a.txt", "a");
        write_file(dir / "res/sub/b.txt", "b");
        sync.set_partial_write_delay(std::chrono::milliseconds(0));
    }

    std::set<std::string> check() {
        return sync.check_for_file_change(ReloadDomain::Main, timestamps);
    }
};

/// Filesystem timestamps are coarse; make the next write land in a later tick
void next_tick() {
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
}

bool matches(const std::string& glob, const std::string& path) {
    return std::regex_match(path, glob_to_regex(glob));
}

} // anonymous namespace

// =============================================================================
// Glob Translation
// =============================================================================

TEST_CASE("glob_to_regex", "[reload][resources]") {
    SECTION("single star stays within a directory") {
        REQUIRE(matches("*.txt", "a.txt"));
        REQUIRE_FALSE(matches("*.txt", "dir/a.txt"));
        REQUIRE_FALSE(matches("*.txt", "a.txt.bak"));
    }

    SECTION("double star crosses directories") {
        REQUIRE(matches("**/*.yaml", "a/b/c.yaml"));
        REQUIRE(matches("conf/**", "conf/x/y.json"));
    }

    SECTION("question mark, braces and classes") {
        REQUIRE(matches("?.md", "a.md"));
        REQUIRE_FALSE(matches("?.md", "ab.md"));
        REQUIRE(matches("app.{json,yaml}", "app.yaml"));
        REQUIRE_FALSE(matches("app.{json,yaml}", "app.toml"));
        REQUIRE(matches("log[0-9].txt", "log3.txt"));
        REQUIRE(matches("log[!0-9].txt", "logx.txt"));
        REQUIRE_FALSE(matches("log[!0-9].txt", "log3.txt"));
    }

    SECTION("regex metacharacters are literal") {
        REQUIRE(matches("a+b(1).txt", "a+b(1).txt"));
        REQUIRE_FALSE(matches("a.txt", "abtxt"));
    }
}

// =============================================================================
// Mirroring
// =============================================================================

TEST_CASE("ResourceSynchronizer mirrors resource roots", "[reload][resources]") {
    Fixture f;
    std::vector<std::string> copied;
    f.sync.set_copy_resource_notification([&copied](const ModuleInfo& module, const std::string& name) {
        REQUIRE(module.name == "app");
        copied.push_back(name);
    });

    auto first = f.check();
    REQUIRE(first == std::set<std::string>{"a.txt", "sub/b.txt"});
    REQUIRE(read_file(f.dir / "out-res/a.txt") == "a");
    REQUIRE(read_file(f.dir / "out-res/sub/b.txt") == "b");
    REQUIRE(copied.size() == 2);

    SECTION("unchanged resources are not copied again") {
        REQUIRE(f.check().empty());
        REQUIRE(copied.size() == 2);
    }

    SECTION("modified resources are copied") {
        next_tick();
        rewrite_file(f.dir / "res/a.txt", "a2");
        auto changed = f.check();
        REQUIRE(changed == std::set<std::string>{"a.txt"});
        REQUIRE(read_file(f.dir / "out-res/a.txt") == "a2");
    }

    SECTION("resources removed from the source are deleted") {
        fs::remove(f.dir / "res/a.txt");
        f.check();
        REQUIRE_FALSE(fs::exists(f.dir / "out-res/a.txt"));
        REQUIRE(fs::exists(f.dir / "out-res/sub/b.txt"));
    }
}

TEST_CASE("ResourceSynchronizer tolerates throwing notifications", "[reload][resources]") {
    Fixture f;
    f.sync.set_copy_resource_notification([](const ModuleInfo&, const std::string&) {
        throw std::runtime_error("listener failed");
    });
    REQUIRE(f.check().size() == 2);
    REQUIRE(fs::exists(f.dir / "out-res/sub/b.txt"));
}

// =============================================================================
// Watched Files
// =============================================================================

TEST_CASE("ResourceSynchronizer watched files", "[reload][resources]") {
    Fixture f;
    write_file(f.dir / "res/app.json", "{}");
    f.sync.set_watched_file_paths({{"app.json", true}, {"late.json", false}}, f.timestamps, false);

    REQUIRE(f.timestamps.watched_file_timestamps().contains(f.dir / "res/app.json"));
    REQUIRE(f.timestamps.watched_file_timestamps().get(f.dir / "res/late.json") == k_absent_time);

    auto first = f.check();
    REQUIRE(first == std::set<std::string>{"a.txt", "sub/b.txt"});
    REQUIRE_FALSE(fs::exists(f.dir / "out-res/app.json"));

    SECTION("a changed watched file is reported and copied") {
        next_tick();
        rewrite_file(f.dir / "res/app.json", "{\"x\": 1}");
        auto changed = f.check();
        REQUIRE(changed == std::set<std::string>{"app.json"});
        REQUIRE(read_file(f.dir / "out-res/app.json") == "{\"x\": 1}");
        REQUIRE(f.check().empty());
    }

    SECTION("a watched file that appears is reported") {
        write_file(f.dir / "res/late.json", "late");
        REQUIRE(f.check() == std::set<std::string>{"late.json"});
    }

    SECTION("a deleted watched file is removed from the output") {
        next_tick();
        rewrite_file(f.dir / "res/app.json", "{}");
        f.check();
        REQUIRE(fs::exists(f.dir / "out-res/app.json"));

        fs::remove(f.dir / "res/app.json");
        f.check();
        REQUIRE_FALSE(fs::exists(f.dir / "out-res/app.json"));
        REQUIRE(f.timestamps.watched_file_timestamps().get(f.dir / "res/app.json") == k_absent_time);
    }

    SECTION("installing main watched paths resets recorded times") {
        f.sync.set_watched_file_paths({{"other.json", false}}, f.timestamps, false);
        REQUIRE_FALSE(f.timestamps.watched_file_timestamps().contains(f.dir / "res/app.json"));
        REQUIRE(f.timestamps.watched_paths() == std::map<std::string, bool>{{"other.json", false}});
    }
}

TEST_CASE("ResourceSynchronizer expands watched globs", "[reload][resources]") {
    Fixture f;
    write_file(f.dir / "res/conf/a.yaml", "a: 1");
    write_file(f.dir / "res/conf/b.yaml", "b: 1");
    write_file(f.dir / "res/conf/c.json", "{}");

    f.sync.set_watched_file_paths({{"conf/*.yaml", true}}, f.timestamps, false);

    auto watched = f.timestamps.watched_paths();
    REQUIRE(watched.count("conf/*.yaml") == 1);
    REQUIRE(watched["conf/a.yaml"]);
    REQUIRE(watched["conf/b.yaml"]);
    REQUIRE(watched.count("conf/c.json") == 0);

    f.check();
    next_tick();
    rewrite_file(f.dir / "res/conf/b.yaml", "b: 2");
    REQUIRE(f.check() == std::set<std::string>{"conf/b.yaml"});
}

TEST_CASE("ResourceSynchronizer absolute watched paths", "[reload][resources]") {
    Fixture f;
    TempDir outside{"devloop-outside"};
    write_file(outside / "settings.json", "{}");
    const std::string absolute = (outside / "settings.json").string();

    f.sync.set_watched_file_paths({{absolute, true}}, f.timestamps, false);
    f.check();

    next_tick();
    rewrite_file(outside / "settings.json", "{\"y\": 2}");
    REQUIRE(f.check() == std::set<std::string>{absolute});
    REQUIRE(read_file(outside / "settings.json") == "{\"y\": 2}");
}
