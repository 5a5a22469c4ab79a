#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "analysis_config.hpp"
#include <fstream>
#include <stdexcept>

namespace {

class ConfigDir {
public:
    ConfigDir() {
        dir_ = fs::temp_directory_path() / "codegauge_config_test";
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }
    ~ConfigDir() { fs::remove_all(dir_); }

    fs::path write(const std::string& content, const std::string& name = CONFIG_FILE_NAME) {
        fs::path path = dir_ / name;
        std::ofstream file(path);
        file << content;
        return path;
    }

    const fs::path& path() const { return dir_; }

private:
    fs::path dir_;
};

} // namespace

TEST_CASE("Config file overrides defaults", "[Config]") {
    ConfigDir dir;
    auto path = dir.write(R"({
        "concurrency": 8,
        "verbose": true,
        "include": ["src/**"],
        "exclude": ["*.test.js", "fixtures/"],
        "grammarDir": "/opt/grammars",
        "maxFileSizeKB": 64,
        "output": { "top": 3 },
        "metrics": { "weights": { "complexity": 0.5, "naming": 0.0 } }
    })");

    RuntimeConfig config = loadRuntimeConfig(path);

    REQUIRE(config.concurrency == 8);
    REQUIRE(config.verbose);
    REQUIRE(config.include == std::vector<std::string>{"src/**"});
    REQUIRE(config.exclude.size() == 2);
    REQUIRE(config.grammarDir == fs::path("/opt/grammars"));
    REQUIRE(config.maxFileSizeKB == 64);
    REQUIRE(config.summaryTop == 3);
    REQUIRE(config.weights.complexity == Catch::Approx(0.5));
    REQUIRE(config.weights.naming == 0.0);
    REQUIRE(config.weights.duplication == Catch::Approx(0.20));
}

TEST_CASE("Missing keys keep the base values", "[Config]") {
    ConfigDir dir;
    auto path = dir.write("{}");

    RuntimeConfig base;
    base.projectPath = "/work/project";
    base.concurrency = 4;

    RuntimeConfig config = loadRuntimeConfig(path, base);
    REQUIRE(config.projectPath == fs::path("/work/project"));
    REQUIRE(config.concurrency == 4);
    REQUIRE(config.maxFileSizeKB == 500);
    REQUIRE(config.summaryTop == 10);
}

TEST_CASE("Invalid config files are rejected", "[Config]") {
    ConfigDir dir;

    SECTION("Unreadable file") {
        REQUIRE_THROWS_AS(loadRuntimeConfig(dir.path() / "missing.json"), std::runtime_error);
    }

    SECTION("Malformed JSON") {
        REQUIRE_THROWS_AS(loadRuntimeConfig(dir.write("{ concurrency: ")), std::runtime_error);
    }

    SECTION("Not an object") {
        REQUIRE_THROWS_AS(loadRuntimeConfig(dir.write("[1, 2]")), std::runtime_error);
    }

    SECTION("Concurrency out of range") {
        REQUIRE_THROWS_AS(loadRuntimeConfig(dir.write(R"({"concurrency": 0})")), std::invalid_argument);
        REQUIRE_THROWS_AS(loadRuntimeConfig(dir.write(R"({"concurrency": 64})")), std::invalid_argument);
    }

    SECTION("Wrong value type") {
        REQUIRE_THROWS_AS(loadRuntimeConfig(dir.write(R"({"verbose": "yes"})")), std::invalid_argument);
        REQUIRE_THROWS_AS(loadRuntimeConfig(dir.write(R"({"exclude": "dist"})")), std::invalid_argument);
        REQUIRE_THROWS_AS(loadRuntimeConfig(dir.write(R"({"metrics": {"weights": {"size": "big"}}})")),
                          std::invalid_argument);
    }

    SECTION("Weight out of range") {
        REQUIRE_THROWS_AS(loadRuntimeConfig(dir.write(R"({"metrics": {"weights": {"error": 1.5}}})")),
                          std::invalid_argument);
    }

    SECTION("Non-positive sizes") {
        REQUIRE_THROWS_AS(loadRuntimeConfig(dir.write(R"({"maxFileSizeKB": 0})")), std::invalid_argument);
        REQUIRE_THROWS_AS(loadRuntimeConfig(dir.write(R"({"output": {"top": 0}})")), std::invalid_argument);
    }
}

TEST_CASE("Runtime config validation", "[Config]") {
    RuntimeConfig config;
    REQUIRE_NOTHROW(validateRuntimeConfig(config));

    config.concurrency = 33;
    REQUIRE_THROWS_AS(validateRuntimeConfig(config), std::invalid_argument);

    config.concurrency = 1;
    config.weights.structure = -0.1;
    REQUIRE_THROWS_AS(validateRuntimeConfig(config), std::invalid_argument);
}

TEST_CASE("Config file lookup", "[Config]") {
    ConfigDir dir;
    REQUIRE(findConfigFile(dir.path()).empty());

    auto path = dir.write("{}");
    REQUIRE(findConfigFile(dir.path()) == path);
}

TEST_CASE("Pattern lists are split on commas", "[Config]") {
    REQUIRE(splitPatternList("a, b,c") == std::vector<std::string>{"a", "b", "c"});
    REQUIRE(splitPatternList(" *.js ,, \t,dist/ ") == std::vector<std::string>{"*.js", "dist/"});
    REQUIRE(splitPatternList("").empty());
}
