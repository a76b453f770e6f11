//
// Created by gregorian-rayne on 10/13/26.
//

#include "sts/types.hpp"

#include <gtest/gtest.h>

namespace sts
{
    namespace {
        FileVerdict verdict_for(const std::string& path, const bool failed) {
            FileVerdict verdict;
            verdict.metrics.path = path;
            verdict.metrics.max_cc = 3;
            verdict.is_failed = failed;
            return verdict;
        }
    }

    TEST(TechnicalLagTest, ToString) {
        EXPECT_STREQ(to_string(TechnicalLag::Low), "LOW");
        EXPECT_STREQ(to_string(TechnicalLag::High), "HIGH");
    }

    TEST(AuditModeTest, ToString) {
        EXPECT_STREQ(to_string(AuditMode::SingleFile), "file");
        EXPECT_STREQ(to_string(AuditMode::Directory), "directory");
    }

    TEST(FileMetricsTest, DefaultIsUnparsed) {
        const FileMetrics metrics;

        EXPECT_FALSE(metrics.parsed());
        EXPECT_FALSE(metrics.ccr.has_value());
        EXPECT_EQ(metrics.technical_lag, TechnicalLag::Low);
        EXPECT_DOUBLE_EQ(metrics.adf, 0.0);
    }

    TEST(FileMetricsTest, ParsedWhenComplexityKnown) {
        FileMetrics metrics;
        metrics.max_cc = 0;

        EXPECT_TRUE(metrics.parsed());
    }

    TEST(AuditReportTest, SingleFileFollowsFileVerdict) {
        AuditReport report;
        report.mode = AuditMode::SingleFile;
        report.files.push_back(verdict_for("a.py", false));

        EXPECT_FALSE(report.is_failed());
        EXPECT_EQ(report.exit_code(), exit_codes::Pass);

        report.files.front().is_failed = true;
        EXPECT_TRUE(report.is_failed());
        EXPECT_EQ(report.exit_code(), exit_codes::Fail);
    }

    TEST(AuditReportTest, DirectoryFollowsProjectVerdict) {
        AuditReport report;
        report.mode = AuditMode::Directory;
        report.files.push_back(verdict_for("a.py", false));
        report.files.push_back(verdict_for("b.py", false));

        ProjectVerdict project;
        project.is_failed = true;
        report.project = project;

        // Project fails even though every file passes
        EXPECT_TRUE(report.is_failed());
        EXPECT_EQ(report.exit_code(), exit_codes::Fail);

        report.project->is_failed = false;
        EXPECT_EQ(report.exit_code(), exit_codes::Pass);
    }

    TEST(ExitCodesTest, Values) {
        EXPECT_EQ(exit_codes::Pass, 0);
        EXPECT_EQ(exit_codes::Fail, 1);
        EXPECT_EQ(exit_codes::OperationalError, 2);
        EXPECT_EQ(exit_codes::Interrupted, 130);
    }

}  // namespace sts
