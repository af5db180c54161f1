#include <gtest/gtest.h>
#include "../src/core/RuleCatalog.h"
#include <iterator>
#include <string>

namespace skill_scan {

namespace {
RuleDefinition simple_rule(const std::string& id) {
    return RuleDefinition{id, Category::Exec, Severity::High, "Title", Confidence::High, "eval\\(", {}, ""};
}

size_t build(const std::vector<RuleDefinition>& defs) {
    RuleCatalog catalog(defs);
    return catalog.size();
}
}

TEST(RuleCatalogTest, BuiltinCatalogCompiles) {
    RuleCatalog catalog(builtin_rule_definitions());
    EXPECT_EQ(catalog.size(), 18u);
}

TEST(RuleCatalogTest, BuiltinIdsAndSeveritiesAreFixed) {
    RuleCatalog catalog(builtin_rule_definitions());
    struct Expect { const char* id; Category cat; Severity sev; Confidence conf; };
    const Expect expected[] = {
        {"SEC_PY_EVAL_001", Category::Exec, Severity::Critical, Confidence::High},
        {"SEC_PY_SHELL_TRUE_001", Category::Exec, Severity::High, Confidence::High},
        {"SEC_PY_OS_SYSTEM_001", Category::Exec, Severity::High, Confidence::High},
        {"SEC_JS_EVAL_001", Category::Exec, Severity::Critical, Confidence::High},
        {"SEC_JS_CHILD_PROCESS_001", Category::Exec, Severity::High, Confidence::High},
        {"SEC_SH_PIPE_EXEC_001", Category::Exec, Severity::Critical, Confidence::High},
        {"SEC_FS_RM_RF_001", Category::Filesystem, Severity::Critical, Confidence::High},
        {"SEC_FS_SENSITIVE_WRITE_001", Category::Filesystem, Severity::High, Confidence::Medium},
        {"SEC_FS_PATH_TRAVERSAL_001", Category::Filesystem, Severity::Medium, Confidence::Medium},
        {"SEC_NET_USER_URL_001", Category::Network, Severity::Medium, Confidence::Medium},
        {"SEC_NET_RAW_SOCKET_001", Category::Network, Severity::High, Confidence::Medium},
        {"SEC_NET_METADATA_001", Category::Network, Severity::High, Confidence::High},
        {"SEC_SECRET_ENV_EXFIL_001", Category::Secrets, Severity::High, Confidence::Medium},
        {"SEC_SECRET_TOKEN_LOG_001", Category::Secrets, Severity::Medium, Confidence::Medium},
        {"SEC_DEP_POSTINSTALL_001", Category::Deps, Severity::High, Confidence::High},
        {"SEC_DEP_NPM_GIT_HTTP_001", Category::Deps, Severity::Medium, Confidence::Medium},
        {"SEC_DEP_PY_GIT_URL_001", Category::Deps, Severity::Low, Confidence::Medium},
        {"SEC_SKILL_PROMPT_INJ_001", Category::PromptInjection, Severity::High, Confidence::Medium},
    };
    ASSERT_EQ(catalog.size(), std::size(expected));
    for (size_t i = 0; i < catalog.size(); ++i) {
        const Rule& r = catalog.rules()[i];
        EXPECT_EQ(r.id, expected[i].id);
        EXPECT_EQ(r.category, expected[i].cat) << r.id;
        EXPECT_EQ(r.severity, expected[i].sev) << r.id;
        EXPECT_EQ(r.confidence, expected[i].conf) << r.id;
        EXPECT_FALSE(r.title.empty());
    }
}

TEST(RuleCatalogTest, ExtensionApplicability) {
    RuleCatalog catalog(builtin_rule_definitions());
    const Rule* py_eval = catalog.find("SEC_PY_EVAL_001");
    ASSERT_NE(py_eval, nullptr);
    EXPECT_TRUE(py_eval->applies_to("tool.py"));
    EXPECT_TRUE(py_eval->applies_to("src/TOOL.PY"));
    EXPECT_FALSE(py_eval->applies_to("tool.js"));
    EXPECT_FALSE(py_eval->applies_to("tool.pyc"));

    const Rule* pipe = catalog.find("SEC_SH_PIPE_EXEC_001");
    ASSERT_NE(pipe, nullptr);
    EXPECT_TRUE(pipe->applies_to("SKILL.md"));
    EXPECT_TRUE(pipe->applies_to("install.sh"));
    EXPECT_FALSE(pipe->applies_to("install.py"));
}

TEST(RuleCatalogTest, FileNameApplicability) {
    RuleCatalog catalog(builtin_rule_definitions());
    const Rule* post = catalog.find("SEC_DEP_POSTINSTALL_001");
    ASSERT_NE(post, nullptr);
    EXPECT_TRUE(post->applies_to("package.json"));
    EXPECT_TRUE(post->applies_to("web/Package.JSON"));
    EXPECT_FALSE(post->applies_to("package.json.bak"));

    const Rule* req = catalog.find("SEC_DEP_PY_GIT_URL_001");
    ASSERT_NE(req, nullptr);
    EXPECT_TRUE(req->applies_to("requirements-dev.txt"));
    EXPECT_FALSE(req->applies_to("requirements.in"));

    const Rule* inj = catalog.find("SEC_SKILL_PROMPT_INJ_001");
    ASSERT_NE(inj, nullptr);
    EXPECT_TRUE(inj->applies_to("SKILL.md"));
    EXPECT_TRUE(inj->applies_to("docs/skill.md"));
    EXPECT_FALSE(inj->applies_to("README.md"));
}

TEST(RuleCatalogTest, UnconstrainedRulesApplyEverywhere) {
    RuleCatalog catalog(builtin_rule_definitions());
    const Rule* meta = catalog.find("SEC_NET_METADATA_001");
    ASSERT_NE(meta, nullptr);
    EXPECT_TRUE(meta->applies_to("anything"));
    EXPECT_TRUE(meta->applies_to("Dockerfile"));
}

TEST(RuleCatalogTest, FindUnknownReturnsNull) {
    RuleCatalog catalog(builtin_rule_definitions());
    EXPECT_EQ(catalog.find("SEC_NOPE_001"), nullptr);
}

TEST(RuleCatalogTest, RejectsEmptyId) {
    EXPECT_THROW(build({simple_rule("")}), CatalogError);
}

TEST(RuleCatalogTest, RejectsDuplicateId) {
    EXPECT_THROW(build({simple_rule("A"), simple_rule("A")}), CatalogError);
}

TEST(RuleCatalogTest, RejectsEmptyTitle) {
    auto d = simple_rule("A");
    d.title.clear();
    EXPECT_THROW(build({d}), CatalogError);
}

TEST(RuleCatalogTest, RejectsBadPattern) {
    auto d = simple_rule("A");
    d.pattern = "(unclosed";
    EXPECT_THROW(build({d}), CatalogError);
    auto e = simple_rule("B");
    e.file_name_pattern = "[bad";
    EXPECT_THROW(build({e}), CatalogError);
}

TEST(RuleCatalogTest, RejectsMalformedExtensions) {
    auto d = simple_rule("A");
    d.file_extensions = {"py"};
    EXPECT_THROW(build({d}), CatalogError);
    d.file_extensions = {".PY"};
    EXPECT_THROW(build({d}), CatalogError);
    d.file_extensions = {"."};
    EXPECT_THROW(build({d}), CatalogError);
}

TEST(RuleCatalogTest, CatalogErrorIsLogicError) {
    try {
        RuleCatalog catalog({simple_rule("A"), simple_rule("A")});
        FAIL() << "expected CatalogError";
    } catch (const std::logic_error& e) {
        EXPECT_NE(std::string(e.what()).find("duplicate"), std::string::npos);
    }
}

} // namespace skill_scan
