#include <catch2/catch_test_macros.hpp>
#include "codegauge.hpp"
#include <fstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace {

std::shared_ptr<ParserSelector> patternSelector() {
    return std::make_shared<ParserSelector>(
        [](Language, const LanguageGrammarConfig&) { return std::shared_ptr<CodeParser>(); });
}

void writeFile(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream file(path);
    file << content;
}

class ProjectDir {
public:
    ProjectDir() {
        root_ = fs::temp_directory_path() / "codegauge_project_test";
        fs::remove_all(root_);

        writeFile(root_ / ".gitignore", "generated/\n");
        writeFile(root_ / "src/app.js",
                  "// Entry point\nfunction start(port) {\n  if (port > 0) {\n    return port;\n  }\n  return 80;\n}\n");
        writeFile(root_ / "src/util.py", "def clamp(value, low, high):\n    return max(low, min(value, high))\n");
        writeFile(root_ / "generated/out.js", "function generated() {}\n");
        writeFile(root_ / "node_modules/pkg/index.js", "module.exports = {};\n");
        writeFile(root_ / "notes.txt", "not source\n");
        writeFile(root_ / "web/.gitignore", "*.local.js\n");
        writeFile(root_ / "web/config.local.js", "const secret = 1;\n");
        writeFile(root_ / "web/main.js", "function main() {\n  return 0;\n}\n");
    }
    ~ProjectDir() { fs::remove_all(root_); }

    const fs::path& root() const { return root_; }

private:
    fs::path root_;
};

} // namespace

TEST_CASE("Discovery honors ignore files and languages", "[Codegauge]") {
    ProjectDir project;
    RuntimeConfig config;
    config.projectPath = project.root();

    Codegauge gauge(config, patternSelector());
    auto files = gauge.discoverFiles();

    REQUIRE(files.size() == 3);
    REQUIRE(files[0].relativePath == "src/app.js");
    REQUIRE(files[0].language == Language::JavaScript);
    REQUIRE(files[1].relativePath == "src/util.py");
    REQUIRE(files[1].language == Language::Python);
    REQUIRE(files[2].relativePath == "web/main.js");
}

TEST_CASE("Exclude and include patterns narrow discovery", "[Codegauge]") {
    ProjectDir project;
    RuntimeConfig config;
    config.projectPath = project.root();

    SECTION("Exclude") {
        config.exclude = {"*.py"};
        Codegauge gauge(config, patternSelector());
        auto files = gauge.discoverFiles();
        REQUIRE(files.size() == 2);
        REQUIRE(files[0].relativePath == "src/app.js");
    }

    SECTION("Include") {
        config.include = {"src/**"};
        Codegauge gauge(config, patternSelector());
        REQUIRE(gauge.run());
        REQUIRE(gauge.getResult().totalFiles == 2);
        REQUIRE(gauge.getResult().analyzedFiles == 2);
        REQUIRE(gauge.getResult().skippedFiles == 0);
    }
}

TEST_CASE("Running a project analysis", "[Codegauge]") {
    ProjectDir project;
    RuntimeConfig config;
    config.projectPath = project.root();

    Codegauge gauge(config, patternSelector());
    REQUIRE(gauge.run());

    const auto& result = gauge.getResult();
    // notes.txt and both .gitignore files are scanned but have no language
    REQUIRE(result.totalFiles == 6);
    REQUIRE(result.analyzedFiles == 3);
    REQUIRE(result.skippedFiles == 3);
    REQUIRE(result.failedFiles == 0);
    REQUIRE(result.projectPath == project.root().string());
    REQUIRE(result.overallScore > 0.0);
    REQUIRE(result.overallScore <= 100.0);

    SECTION("JSON report") {
        auto report = nlohmann::json::parse(gauge.getJsonReport());
        REQUIRE(report["projectPath"] == project.root().string());
        REQUIRE(report["summary"]["totalFiles"] == 6);
        REQUIRE(report["summary"]["analyzedFiles"] == 3);
        REQUIRE(report["aggregatedMetrics"].size() == 11);
        REQUIRE(report["files"].size() == 3);
        REQUIRE(report["files"][0]["path"] == "src/app.js");
        REQUIRE(report["files"][0]["parseResult"]["language"] == "javascript");
        REQUIRE(report["files"][0]["parseResult"]["functionCount"] == 1);
        REQUIRE(report["files"][0]["metrics"].size() == 11);
    }

    SECTION("Summary text") {
        auto summary = gauge.getSummary();
        REQUIRE(summary.find("Code quality summary for") != std::string::npos);
        REQUIRE(summary.find("Files analyzed: 3 of 6") != std::string::npos);
        REQUIRE(summary.find("Files skipped: 3") != std::string::npos);
        REQUIRE(summary.find("Lowest scoring files:") != std::string::npos);
        REQUIRE(summary.find("Most complex functions:") == std::string::npos);
    }

    SECTION("Report file") {
        fs::path output = project.root() / "report.json";
        gauge.writeJsonReport(output);
        std::ifstream file(output);
        auto report = nlohmann::json::parse(file);
        REQUIRE(report["files"].size() == 3);

        REQUIRE_THROWS_AS(gauge.writeJsonReport(project.root() / "missing/dir/report.json"), std::runtime_error);
    }
}

TEST_CASE("Missing project directory fails the run", "[Codegauge]") {
    RuntimeConfig config;
    config.projectPath = fs::temp_directory_path() / "codegauge_no_such_project";
    fs::remove_all(config.projectPath);

    Codegauge gauge(config, patternSelector());
    REQUIRE_FALSE(gauge.run());
}
