#include "test_support.hpp"

#include "pmd_report.hpp"

TEST(PmdReportTest, ViolationsAreKeyedByRelativePath) {
    Str text = R"({
        "formatVersion": 0,
        "pmdVersion": "7.0.0",
        "files": [
            {
                "filename": "/work/wt_0/src/Main.java",
                "violations": [
                    {
                        "beginline": 3,
                        "description": "Avoid unused imports",
                        "rule": "UnusedImports",
                        "ruleset": "Best Practices",
                        "priority": 4
                    },
                    {
                        "beginline": 10,
                        "rule": "EmptyCatchBlock",
                        "priority": 3
                    }
                ]
            },
            {
                "filename": "src/util/Util.java",
                "violations": [{"rule": "UnusedImports"}]
            }
        ],
        "suppressedViolations": [],
        "processingErrors": [],
        "configurationErrors": []
    })";

    auto report = parse_pmd_report(text, "/work/wt_0");
    ASSERT_EQ(report.findings.size(), 2u);

    CR<Vec<ir::Violation>> main = report.findings.at("src/Main.java");
    ASSERT_EQ(main.size(), 2u);
    EXPECT_EQ(main[0].rule, "UnusedImports");
    EXPECT_EQ(main[0].ruleset, "Best Practices");
    EXPECT_EQ(main[0].priority, 4);
    EXPECT_EQ(main[0].line, 3);
    EXPECT_EQ(main[0].message, "Avoid unused imports");
    EXPECT_EQ(main[1].rule, "EmptyCatchBlock");
    EXPECT_EQ(main[1].message, "");

    EXPECT_EQ(report.findings.at("src/util/Util.java").size(), 1u);
    EXPECT_TRUE(report.processing_errors.empty());
}

TEST(PmdReportTest, ProcessingErrorsAreCollected) {
    Str text = R"({
        "files": [],
        "processingErrors": [
            {"filename": "/work/wt_1/Broken.java", "message": "ParseException"}
        ]
    })";

    auto report = parse_pmd_report(text, "/work/wt_1");
    EXPECT_TRUE(report.findings.empty());
    ASSERT_EQ(report.processing_errors.size(), 1u);
    EXPECT_EQ(report.processing_errors[0].first, "Broken.java");
    EXPECT_EQ(report.processing_errors[0].second, "ParseException");
}

TEST(PmdReportTest, MalformedReportIsAnalysisError) {
    auto expect_malformed = [](CR<Str> text) {
        try {
            parse_pmd_report(text, "/work");
            FAIL() << "no exception for " << text;
        } catch (analysis_error& err) {
            EXPECT_EQ(err.cause, ir::FailureCause::MalformedReport);
            EXPECT_FALSE(err.retryable());
        }
    };

    expect_malformed("");
    expect_malformed("{\"files\": [");
    expect_malformed("{\"pmdVersion\": \"7.0.0\"}");
    expect_malformed(R"({"files": [{"filename": "A.java"}]})");
    expect_malformed(
        R"({"files": [{"filename": "A.java", "violations": [{}]}]})");
}

TEST(PmdReportTest, RelativePaths) {
    EXPECT_EQ(relative_report_path("/a/b/C.java", "/a"), "b/C.java");
    EXPECT_EQ(relative_report_path("b/./C.java", "/a"), "b/C.java");
    // Outside of the root is kept as reported
    EXPECT_EQ(relative_report_path("/other/C.java", "/a"), "/other/C.java");
}
