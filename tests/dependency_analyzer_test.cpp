#include <gtest/gtest.h>
#include "code_sentinel/analyzer/dependency_analyzer.hpp"
#include "code_sentinel/core/errors.hpp"
#include "test_helpers.hpp"

using namespace code_sentinel;
using analyzer::DependencyAnalyzer;
using test_support::countRule;
using test_support::findRule;
using test_support::makeFile;
using test_support::runFirstTier;

TEST(DependencyAnalyzerTest, RequirementsFile) {
    DependencyAnalyzer analyzer;
    auto file = makeFile("requirements.txt",
                         "flask\n"
                         "requests==2.31.0\n"
                         "django>=4.0\n"
                         "pycrypto==2.6.1\n"
                         "--index-url http://pypi.internal/simple\n"
                         "git+https://github.com/org/lib.git#egg=lib\n",
                         "requirements");

    auto output = runFirstTier(analyzer, file);
    const auto& findings = output.findings;

    auto* unpinned = findRule(findings, "DEP001");
    ASSERT_NE(unpinned, nullptr);
    EXPECT_EQ(unpinned->title, "Unpinned dependency version: flask");
    EXPECT_EQ(unpinned->severity, common::Severity::MEDIUM);
    EXPECT_EQ(unpinned->line, 1);
    EXPECT_EQ(countRule(findings, "DEP001"), 1u);

    auto* deprecated = findRule(findings, "DEP003");
    ASSERT_NE(deprecated, nullptr);
    EXPECT_EQ(deprecated->line, 4);

    auto* http = findRule(findings, "DEP004");
    ASSERT_NE(http, nullptr);
    EXPECT_EQ(http->severity, common::Severity::HIGH);
    EXPECT_EQ(http->line, 5);

    auto* url = findRule(findings, "DEP002");
    ASSERT_NE(url, nullptr);
    EXPECT_EQ(url->line, 6);

    EXPECT_EQ(findings.size(), 4u);
    EXPECT_DOUBLE_EQ(output.metrics.at("dependencies"), 5.0);
}

TEST(DependencyAnalyzerTest, PackageJson) {
    DependencyAnalyzer analyzer;
    auto file = makeFile("web/package.json", R"({
  "name": "web",
  "dependencies": {
    "express": "^4.18.0",
    "left-pad": "*",
    "tiny": "^0.3.1",
    "request": "2.88.0",
    "mylib": "git+https://github.com/me/mylib.git"
  }
})", "json");

    auto findings = runFirstTier(analyzer, file).findings;

    EXPECT_EQ(countRule(findings, "DEP001"), 1u);
    EXPECT_EQ(countRule(findings, "DEP002"), 1u);
    EXPECT_EQ(countRule(findings, "DEP003"), 1u);
    auto* prerelease = findRule(findings, "DEP005");
    ASSERT_NE(prerelease, nullptr);
    EXPECT_EQ(prerelease->severity, common::Severity::LOW);
    EXPECT_EQ(prerelease->line, 6);
    EXPECT_EQ(findings.size(), 4u);
}

TEST(DependencyAnalyzerTest, InvalidJsonManifestIsMalformedInput) {
    DependencyAnalyzer analyzer;
    try {
        runFirstTier(analyzer, makeFile("package.json", "{ \"dependencies\": ", "json"));
        FAIL() << "expected AnalyzerError";
    } catch (const core::AnalyzerError& e) {
        EXPECT_EQ(e.code(), core::CoreErrorCode::ANALYZER_MALFORMED_INPUT);
    }
}

TEST(DependencyAnalyzerTest, UnknownManifestIsRejected) {
    EXPECT_THROW(DependencyAnalyzer::parseManifest(makeFile("setup.py", "", "python")), core::AnalyzerError);
}

TEST(DependencyAnalyzerTest, LargeDependencySet) {
    DependencyAnalyzer analyzer;
    std::string content;
    for (int i = 0; i < 51; ++i) {
        content += "pkg" + std::to_string(i) + "==1.0." + std::to_string(i) + "\n";
    }

    auto findings = runFirstTier(analyzer, makeFile("requirements.txt", content, "requirements")).findings;

    ASSERT_EQ(findings.size(), 1u);
    EXPECT_EQ(findings[0].rule_id, "DEP006");
    EXPECT_FALSE(findings[0].line.has_value());
}

TEST(DependencyAnalyzerTest, ParsesGoModules) {
    auto deps = DependencyAnalyzer::parseManifest(makeFile("go.mod",
        "module example.com/app\n"
        "\n"
        "go 1.21\n"
        "\n"
        "require (\n"
        "\tgithub.com/pkg/errors v0.9.1\n"
        "\tgithub.com/x/y\n"
        ")\n"
        "require golang.org/x/sync v0.5.0 // indirect\n", "go"));

    ASSERT_EQ(deps.size(), 3u);
    EXPECT_EQ(deps[0].name, "github.com/pkg/errors");
    EXPECT_EQ(deps[0].version, "v0.9.1");
    EXPECT_EQ(deps[0].line, 6);
    EXPECT_EQ(deps[1].version, "");
    EXPECT_EQ(deps[2].name, "golang.org/x/sync");
}

TEST(DependencyAnalyzerTest, ParsesGemfile) {
    auto deps = DependencyAnalyzer::parseManifest(makeFile("Gemfile",
        "source 'https://rubygems.org'\n"
        "gem 'rails', '7.0.4'\n"
        "gem 'pry'\n"
        "gem 'mylib', git: 'https://github.com/me/mylib'\n", "ruby"));

    ASSERT_EQ(deps.size(), 3u);
    EXPECT_EQ(deps[0].name, "rails");
    EXPECT_EQ(deps[0].version, "7.0.4");
    EXPECT_TRUE(deps[1].version.empty());
    EXPECT_EQ(deps[2].source, "https://github.com/me/mylib");
}

TEST(DependencyAnalyzerTest, ParsesCargoManifest) {
    DependencyAnalyzer analyzer;
    auto file = makeFile("Cargo.toml",
                         "[package]\n"
                         "name = \"app\"\n"
                         "\n"
                         "[dependencies]\n"
                         "serde = \"1.0\"\n"
                         "rand = \"*\"\n"
                         "local = { path = \"../local\" }\n",
                         "toml");

    auto deps = DependencyAnalyzer::parseManifest(file);
    ASSERT_EQ(deps.size(), 3u);

    auto findings = runFirstTier(analyzer, file).findings;
    auto* unpinned = findRule(findings, "DEP001");
    ASSERT_NE(unpinned, nullptr);
    EXPECT_EQ(unpinned->title, "Unpinned dependency version: rand");
    EXPECT_EQ(unpinned->line, 6);
    EXPECT_EQ(countRule(findings, "DEP002"), 1u);
}

TEST(DependencyAnalyzerTest, MatchesManifestsByFileName) {
    DependencyAnalyzer analyzer;
    EXPECT_TRUE(analyzer.canAnalyze(makeFile("services/api/requirements.txt", "", "requirements")));
    EXPECT_TRUE(analyzer.canAnalyze(makeFile("Cargo.toml", "", "toml")));
    EXPECT_FALSE(analyzer.canAnalyze(makeFile("app.py", "", "python")));
}

TEST(DependencyAnalyzerTest, PomBlocksStopAtUnterminatedDependency) {
    auto deps = DependencyAnalyzer::parseManifest(makeFile("pom.xml",
        "<project>\n"
        "<dependencies>\n"
        "<dependency>\n"
        "<groupId>junit</groupId>\n"
        "<artifactId>junit</artifactId>\n"
        "<version>4.13</version>\n"
        "</dependency>\n"
        "<dependency>\n"
        "<artifactId>guava</artifactId>\n"
        "</dependency>\n"
        "<dependency>" + std::string(200000, 'x'), "xml"));

    ASSERT_EQ(deps.size(), 2u);
    EXPECT_EQ(deps[0].name, "junit");
    EXPECT_EQ(deps[0].version, "4.13");
    EXPECT_EQ(deps[0].line, 3);
    EXPECT_EQ(deps[1].name, "guava");
    EXPECT_EQ(deps[1].version, "managed");
    EXPECT_EQ(deps[1].line, 8);
}
