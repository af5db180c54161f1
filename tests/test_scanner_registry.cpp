#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/core/ScannerRegistry.h"
#include "../src/core/Config.h"
#include "../src/core/Report.h"
#include "../src/core/RuleCatalog.h"
#include "../src/core/ScanContext.h"
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace skill_scan {

class MockScanner : public Scanner {
public:
    MOCK_METHOD(std::string, name, (), (const, override));
    MOCK_METHOD(std::string, description, (), (const, override));
    MOCK_METHOD(void, scan, (const ScannedFile& file, ScanContext& context), (override));
};

class ScannerRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        report = std::make_unique<Report>();
        context = std::make_unique<ScanContext>(config, catalog, *report);
    }

    std::unique_ptr<MockScanner> make_mock(const std::string& name) {
        auto mock = std::make_unique<MockScanner>();
        EXPECT_CALL(*mock, name()).WillRepeatedly(testing::Return(name));
        EXPECT_CALL(*mock, description()).WillRepeatedly(testing::Return("Mock " + name));
        return mock;
    }

    Config config;
    RuleCatalog catalog{builtin_rule_definitions()};
    std::unique_ptr<Report> report;
    std::unique_ptr<ScanContext> context;
};

MATCHER_P(FileAt, path, "") { return arg.path == path; }

TEST_F(ScannerRegistryTest, DefaultRegistration) {
    ScannerRegistry registry;
    registry.register_all_default();
    EXPECT_EQ(registry.size(), 3u);
    EXPECT_EQ(default_scanner_names(), (std::vector<std::string>{"patterns", "manifests", "capabilities"}));
}

TEST_F(ScannerRegistryTest, FilesOuterScannersInner) {
    ScannerRegistry registry;
    auto first = make_mock("first");
    auto second = make_mock("second");
    {
        testing::InSequence seq;
        EXPECT_CALL(*first, scan(FileAt("a.py"), testing::_));
        EXPECT_CALL(*second, scan(FileAt("a.py"), testing::_));
        EXPECT_CALL(*first, scan(FileAt("b.py"), testing::_));
        EXPECT_CALL(*second, scan(FileAt("b.py"), testing::_));
    }
    registry.register_scanner(std::move(first));
    registry.register_scanner(std::move(second));

    std::vector<ScannedFile> files{{"a.py", "x"}, {"b.py", "y"}};
    registry.run_all(files, *context);
}

TEST_F(ScannerRegistryTest, EmptyFilesAreSkipped) {
    ScannerRegistry registry;
    auto mock = make_mock("only");
    EXPECT_CALL(*mock, scan(FileAt("full.py"), testing::_)).Times(1);
    EXPECT_CALL(*mock, scan(FileAt("empty.py"), testing::_)).Times(0);
    registry.register_scanner(std::move(mock));

    std::vector<ScannedFile> files{{"empty.py", ""}, {"full.py", "x"}};
    registry.run_all(files, *context);
}

TEST_F(ScannerRegistryTest, EnableListRestrictsScanners) {
    ScannerRegistry registry;
    config.enable_scanners = {"keep"};
    auto keep = make_mock("keep");
    auto drop = make_mock("drop");
    EXPECT_CALL(*keep, scan(testing::_, testing::_)).Times(1);
    EXPECT_CALL(*drop, scan(testing::_, testing::_)).Times(0);
    registry.register_scanner(std::move(keep));
    registry.register_scanner(std::move(drop));

    std::vector<ScannedFile> files{{"a.py", "x"}};
    registry.run_all(files, *context);
}

TEST_F(ScannerRegistryTest, DisableListRemovesScanners) {
    ScannerRegistry registry;
    config.disable_scanners = {"drop"};
    auto keep = make_mock("keep");
    auto drop = make_mock("drop");
    EXPECT_CALL(*keep, scan(testing::_, testing::_)).Times(2);
    EXPECT_CALL(*drop, scan(testing::_, testing::_)).Times(0);
    registry.register_scanner(std::move(keep));
    registry.register_scanner(std::move(drop));

    std::vector<ScannedFile> files{{"a.py", "x"}, {"b.py", "y"}};
    registry.run_all(files, *context);
}

TEST_F(ScannerRegistryTest, ScannerExceptionBecomesWarning) {
    ScannerRegistry registry;
    auto failing = make_mock("failing");
    auto healthy = make_mock("healthy");
    EXPECT_CALL(*failing, scan(testing::_, testing::_)).WillOnce(testing::Throw(std::runtime_error("boom")));
    EXPECT_CALL(*healthy, scan(testing::_, testing::_)).Times(1);
    registry.register_scanner(std::move(failing));
    registry.register_scanner(std::move(healthy));

    std::vector<ScannedFile> files{{"a.py", "x"}};
    EXPECT_NO_THROW(registry.run_all(files, *context));
    ASSERT_EQ(report->warnings().size(), 1u);
    EXPECT_EQ(report->warnings()[0].scanner, "failing");
    EXPECT_EQ(report->warnings()[0].code, WarnCode::ScannerError);
    EXPECT_EQ(report->warnings()[0].detail, "a.py:boom");
}

TEST_F(ScannerRegistryTest, DefaultScannersProduceOrderedFindings) {
    ScannerRegistry registry;
    registry.register_all_default();
    std::vector<ScannedFile> files{
        {"requirements.txt", "git+https://h/p.git\nrequests\n"},
        {"fetch.py", "requests.get(u)"},
    };
    registry.run_all(files, *context);
    const auto& findings = report->findings();
    ASSERT_EQ(findings.size(), 2u);
    // pattern hits come before manifest hits for the same file
    EXPECT_EQ(findings[0].id.rfind("SEC_DEP_PY_GIT_URL_001_", 0), 0u);
    EXPECT_EQ(findings[0].line_start, 1);
    EXPECT_EQ(findings[1].id.rfind("SEC_DEP_UNPINNED_PY_001_", 0), 0u);
    EXPECT_EQ(findings[1].evidence, "requests");
    EXPECT_EQ(findings[1].line_start, 2);
    EXPECT_TRUE(report->capabilities().has(Capability::Network));
}

TEST_F(ScannerRegistryTest, DisablingCapabilitiesKeepsFlagsClear) {
    ScannerRegistry registry;
    registry.register_all_default();
    config.disable_scanners = {"capabilities"};
    std::vector<ScannedFile> files{{"a.py", "requests.get(u)"}};
    registry.run_all(files, *context);
    EXPECT_FALSE(report->capabilities().has(Capability::Network));
}

} // namespace skill_scan
