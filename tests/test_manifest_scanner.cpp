#include <gtest/gtest.h>
#include "../src/scanners/ManifestScanner.h"
#include "../src/core/Config.h"
#include "../src/core/Report.h"
#include "../src/core/RuleCatalog.h"
#include "../src/core/ScanContext.h"
#include <string>

namespace skill_scan {

TEST(ManifestScannerTest, FileRecognition) {
    EXPECT_TRUE(ManifestScanner::is_npm_manifest("package.json"));
    EXPECT_TRUE(ManifestScanner::is_npm_manifest("web/PACKAGE.JSON"));
    EXPECT_FALSE(ManifestScanner::is_npm_manifest("package-lock.json"));
    EXPECT_TRUE(ManifestScanner::is_requirements_file("requirements.txt"));
    EXPECT_TRUE(ManifestScanner::is_requirements_file("deps/Requirements-Dev.TXT"));
    EXPECT_FALSE(ManifestScanner::is_requirements_file("requirements.in"));
    EXPECT_FALSE(ManifestScanner::is_requirements_file("notes.txt"));
}

TEST(ManifestScannerTest, UnpinnedVersionForms) {
    EXPECT_TRUE(ManifestScanner::is_unpinned_npm_version("*"));
    EXPECT_TRUE(ManifestScanner::is_unpinned_npm_version("latest"));
    EXPECT_TRUE(ManifestScanner::is_unpinned_npm_version("^1.2.3"));
    EXPECT_TRUE(ManifestScanner::is_unpinned_npm_version("  ^1.2.3"));
    EXPECT_FALSE(ManifestScanner::is_unpinned_npm_version("1.2.3"));
    EXPECT_FALSE(ManifestScanner::is_unpinned_npm_version("~1.2.3"));
    EXPECT_FALSE(ManifestScanner::is_unpinned_npm_version(" * "));
    EXPECT_FALSE(ManifestScanner::is_unpinned_npm_version("Latest"));
}

TEST(ManifestScannerTest, NpmUnpinnedDependencies) {
    ScannedFile file{"package.json", R"({
  "name": "demo",
  "dependencies": {"left-pad": "^1.0.0", "exact": "1.0.0"},
  "devDependencies": {"jest": "*"},
  "optionalDependencies": {"fsevents": "latest"}
})"};
    auto findings = ManifestScanner::check_npm_manifest(file);
    ASSERT_EQ(findings.size(), 3u);
    EXPECT_EQ(findings[0].evidence, "\"left-pad\": \"^1.0.0\"");
    EXPECT_EQ(findings[1].evidence, "\"jest\": \"*\"");
    EXPECT_EQ(findings[2].evidence, "\"fsevents\": \"latest\"");
    for (const auto& f : findings) {
        EXPECT_EQ(f.id.rfind("SEC_DEP_UNPINNED_NPM_001_", 0), 0u);
        EXPECT_EQ(f.severity, Severity::Low);
        EXPECT_EQ(f.category, Category::Deps);
        EXPECT_EQ(f.confidence, Confidence::Medium);
        EXPECT_EQ(f.title, "Unpinned NPM dependency version detected.");
        EXPECT_FALSE(f.line_start.has_value());
        EXPECT_FALSE(f.line_end.has_value());
    }
}

TEST(ManifestScannerTest, LaterBlocksOverwriteKeepingFirstPosition) {
    ScannedFile file{"package.json", R"({
  "dependencies": {"a": "^1.0.0", "b": "^2.0.0"},
  "devDependencies": {"a": "1.0.0", "c": "*"},
  "optionalDependencies": {"b": "latest"}
})"};
    auto findings = ManifestScanner::check_npm_manifest(file);
    ASSERT_EQ(findings.size(), 2u);
    EXPECT_EQ(findings[0].evidence, "\"b\": \"latest\"");
    EXPECT_EQ(findings[1].evidence, "\"c\": \"*\"");
}

TEST(ManifestScannerTest, MalformedOrNonObjectManifest) {
    bool parsed = true;
    EXPECT_TRUE(ManifestScanner::check_npm_manifest(ScannedFile{"package.json", "{ not json"}, &parsed).empty());
    EXPECT_FALSE(parsed);
    EXPECT_TRUE(ManifestScanner::check_npm_manifest(ScannedFile{"package.json", "[1,2]"}, &parsed).empty());
    EXPECT_TRUE(parsed);
    EXPECT_TRUE(ManifestScanner::check_npm_manifest(ScannedFile{"package.json", R"({"dependencies": []})"}).empty());
}

TEST(ManifestScannerTest, RequirementsLines) {
    ScannedFile file{"requirements.txt",
                     "# tools\nrequests\r\nflask==2.0.1\n\n  numpy>=1.0  \n-e ./local\ngit+https://host/pkg.git\n"};
    auto findings = ManifestScanner::check_requirements(file);
    ASSERT_EQ(findings.size(), 2u);
    EXPECT_EQ(findings[0].evidence, "requests");
    EXPECT_EQ(findings[0].line_start, 2);
    EXPECT_EQ(findings[0].line_end, 2);
    EXPECT_EQ(findings[1].evidence, "numpy>=1.0");
    EXPECT_EQ(findings[1].line_start, 5);
    for (const auto& f : findings) {
        EXPECT_EQ(f.id.rfind("SEC_DEP_UNPINNED_PY_001_", 0), 0u);
        EXPECT_EQ(f.severity, Severity::Low);
        EXPECT_EQ(f.confidence, Confidence::Low);
        EXPECT_EQ(f.title, "Unpinned Python dependency detected.");
    }
}

TEST(ManifestScannerTest, ScanRecordsWarningForUnparseableManifest) {
    Config config;
    RuleCatalog catalog(builtin_rule_definitions());
    Report report;
    ScanContext ctx(config, catalog, report);
    ManifestScanner scanner;
    scanner.scan(ScannedFile{"package.json", "{"}, ctx);
    EXPECT_TRUE(report.findings().empty());
    ASSERT_EQ(report.warnings().size(), 1u);
    EXPECT_EQ(report.warnings()[0].code, WarnCode::ManifestUnparseable);
    EXPECT_EQ(report.warnings()[0].scanner, "manifests");
}

TEST(ManifestScannerTest, ScanIgnoresOtherFiles) {
    Config config;
    RuleCatalog catalog(builtin_rule_definitions());
    Report report;
    ScanContext ctx(config, catalog, report);
    ManifestScanner scanner;
    scanner.scan(ScannedFile{"notes.txt", "requests\n"}, ctx);
    scanner.scan(ScannedFile{"requirements.txt", ""}, ctx);
    EXPECT_TRUE(report.findings().empty());
    EXPECT_TRUE(report.warnings().empty());
}

} // namespace skill_scan
