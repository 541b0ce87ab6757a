// devloop_layer artifact model tests

#include <catch2/catch.hpp>
#include <devloop/layer/artifact.hpp>

using namespace devloop_layer;
using namespace devloop_core;

TEST_CASE("ArtifactKey parsing", "[layer][artifact]") {
    SECTION("group and name") {
        auto key = ArtifactKey::parse("org.acme:widgets");
        REQUIRE(key.is_ok());
        REQUIRE(key->group == "org.acme");
        REQUIRE(key->name == "widgets");
        REQUIRE(key->classifier.empty());
        REQUIRE(key->type == "archive");
        REQUIRE(key->to_string() == "org.acme:widgets");
    }

    SECTION("classifier and type") {
        auto key = ArtifactKey::parse("org.acme:widgets:tests:pom");
        REQUIRE(key.is_ok());
        REQUIRE(key->classifier == "tests");
        REQUIRE(key->type == "pom");
        REQUIRE(key->to_string() == "org.acme:widgets:tests:pom");
    }

    SECTION("empty classifier keeps its slot") {
        auto key = ArtifactKey::parse("g:n::pom");
        REQUIRE(key.is_ok());
        REQUIRE(key->to_string() == "g:n::pom");
    }

    SECTION("invalid") {
        REQUIRE(ArtifactKey::parse("just-a-name").is_err());
        REQUIRE(ArtifactKey::parse(":name").is_err());
        REQUIRE(ArtifactKey::parse("a:b:c:d:e").error().code() == ErrorCode::InvalidArgument);
    }
}

TEST_CASE("ArtifactKey ordering", "[layer][artifact]") {
    auto a = *ArtifactKey::parse("g:a");
    auto b = *ArtifactKey::parse("g:b");
    REQUIRE(a < b);
    REQUIRE(a == *ArtifactKey::parse("g:a:"));
    REQUIRE_FALSE(a == *ArtifactKey::parse("g:a::pom"));
}

TEST_CASE("ApplicationModel runtime dependencies", "[layer][artifact]") {
    ApplicationModel model;
    model.dependencies.push_back(Artifact{*ArtifactKey::parse("g:runtime"), {}, true});
    model.dependencies.push_back(Artifact{*ArtifactKey::parse("g:deployment"), {}, false});

    auto runtime = model.runtime_dependencies();
    REQUIRE(runtime.size() == 1);
    REQUIRE(runtime[0]->key.name == "runtime");
    REQUIRE(runtime[0]->is_archive());
}

TEST_CASE("ClassLoadingConfig removed resources", "[layer][artifact]") {
    ClassLoadingConfig config;
    config.removed_resources[*ArtifactKey::parse("g:a")] = {"x.txt", "y.txt"};
    config.removed_resources[*ArtifactKey::parse("g:b")] = {"y.txt", "z.txt"};

    REQUIRE(config.all_removed_resources() == std::set<std::string>{"x.txt", "y.txt", "z.txt"});
}
