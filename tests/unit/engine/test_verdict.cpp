//
// Created by gregorian-rayne on 10/15/26.
//

#include "sts/engine/verdict.hpp"

#include <gtest/gtest.h>

#include <algorithm>

namespace sts::engine
{
    namespace {
        FileMetrics make_metrics(const std::string& path,
                                 std::optional<int> max_cc,
                                 const double adf = 0.0,
                                 std::optional<double> ccr = 0.0) {
            FileMetrics m;
            m.path = path;
            m.max_cc = max_cc;
            if (max_cc) {
                m.mean_cc = static_cast<double>(*max_cc);
            } else {
                m.analysis_error = "unterminated string literal (line 1)";
            }
            m.adf = adf;
            m.ccr = ccr;
            if (!ccr) {
                m.churn_note = "not a git repository";
            }
            return m;
        }

        bool has_reason(const std::vector<std::string>& reasons, const std::string& reason) {
            return std::ranges::find(reasons, reason) != reasons.end();
        }
    }

    class VerdictTest : public ::testing::Test {
    protected:
        void SetUp() override {
            policy_ = policy::PolicyConfig::defaults();
        }

        [[nodiscard]] FileVerdict judge(FileMetrics m) const {
            return judge_file(std::move(m), policy_);
        }

        [[nodiscard]] ProjectVerdict project_of(const std::vector<FileMetrics>& metrics) const {
            std::vector<FileVerdict> files;
            for (const auto& m : metrics) {
                files.push_back(judge(m));
            }
            return judge_project(files, policy_);
        }

        policy::PolicyConfig policy_;
    };

    // =============================================================================
    // File Verdict Tests
    // =============================================================================

    TEST_F(VerdictTest, CleanFilePasses) {
        const auto v = judge(make_metrics("clean.py", 3));

        EXPECT_FALSE(v.is_failed);
        EXPECT_FALSE(v.degraded);
        EXPECT_TRUE(v.reasons.empty());
        EXPECT_EQ(v.metrics.path, "clean.py");
    }

    TEST_F(VerdictTest, MaxCcBoundaryIsStrict) {
        EXPECT_FALSE(judge(make_metrics("at.py", 20)).is_failed);

        const auto over = judge(make_metrics("over.py", 21));
        EXPECT_TRUE(over.is_failed);
        EXPECT_EQ(over.reasons, std::vector<std::string>{reasons::MAX_CC_EXCEEDED});
    }

    TEST_F(VerdictTest, ComplexitySpikeFailsRegardlessOfAdf) {
        const auto v = judge(make_metrics("spike.py", 26, 0.0));

        EXPECT_TRUE(v.is_failed);
        EXPECT_TRUE(has_reason(v.reasons, reasons::MAX_CC_EXCEEDED));
    }

    TEST_F(VerdictTest, AdfBoundaryIsStrict) {
        EXPECT_FALSE(judge(make_metrics("at.py", 1, 0.05)).is_failed);

        const auto drift = judge(make_metrics("drift.py", 1, 0.10));
        EXPECT_TRUE(drift.is_failed);
        EXPECT_EQ(drift.reasons, std::vector<std::string>{reasons::ADF_EXCEEDED});
    }

    TEST_F(VerdictTest, CcrBoundaryIsStrict) {
        EXPECT_FALSE(judge(make_metrics("at.py", 1, 0.0, 0.3)).is_failed);

        const auto hot = judge(make_metrics("hot.py", 1, 0.0, 0.4));
        EXPECT_TRUE(hot.is_failed);
        EXPECT_EQ(hot.reasons, std::vector<std::string>{reasons::CCR_EXCEEDED});
    }

    TEST_F(VerdictTest, UnknownCcrIsNeutral) {
        const auto v = judge(make_metrics("untracked.py", 5, 0.0, std::nullopt));

        EXPECT_FALSE(v.is_failed);
        EXPECT_TRUE(v.degraded);
        EXPECT_EQ(v.reasons, std::vector<std::string>{reasons::CCR_UNKNOWN});
    }

    TEST_F(VerdictTest, UnknownCcrDoesNotHideOtherFailures) {
        const auto v = judge(make_metrics("bad.py", 30, 0.2, std::nullopt));

        EXPECT_TRUE(v.is_failed);
        EXPECT_TRUE(v.degraded);
        const std::vector<std::string> expected = {
            reasons::MAX_CC_EXCEEDED, reasons::ADF_EXCEEDED, reasons::CCR_UNKNOWN
        };
        EXPECT_EQ(v.reasons, expected);
    }

    TEST_F(VerdictTest, UnparseableFileFails) {
        const auto v = judge(make_metrics("broken.py", std::nullopt, 0.1, 0.9));

        EXPECT_TRUE(v.is_failed);
        const std::vector<std::string> expected = {
            reasons::UNPARSEABLE, reasons::ADF_EXCEEDED, reasons::CCR_EXCEEDED
        };
        EXPECT_EQ(v.reasons, expected);
    }

    TEST_F(VerdictTest, CustomThresholds) {
        policy_.thresholds.max_cc = 10;
        policy_.thresholds.project_max_cc = 8;

        EXPECT_TRUE(judge(make_metrics("f.py", 11)).is_failed);
        EXPECT_FALSE(judge(make_metrics("f.py", 10)).is_failed);
    }

    // =============================================================================
    // Project Verdict Tests
    // =============================================================================

    TEST_F(VerdictTest, ProjectIsStricterThanFiles) {
        const auto project = project_of({
            make_metrics("a.py", 8),
            make_metrics("b.py", 12),
            make_metrics("c.py", 18),
        });

        EXPECT_TRUE(project.is_failed);
        EXPECT_EQ(project.max_cc_overall, 18);
        EXPECT_DOUBLE_EQ(project.mean_cc, 38.0 / 3.0);
        EXPECT_EQ(project.reasons, std::vector<std::string>{reasons::PROJECT_MAX_CC_REACHED});
    }

    TEST_F(VerdictTest, ProjectMaxCcBoundaryIsInclusive) {
        EXPECT_TRUE(project_of({make_metrics("a.py", 15)}).is_failed);
        EXPECT_FALSE(project_of({make_metrics("a.py", 14)}).is_failed);
    }

    TEST_F(VerdictTest, ProjectAdfBoundaryIsInclusive) {
        const auto at = project_of({make_metrics("a.py", 2, 0.05), make_metrics("b.py", 2)});

        EXPECT_TRUE(at.is_failed);
        EXPECT_DOUBLE_EQ(at.max_adf_overall, 0.05);
        EXPECT_EQ(at.polluted_files, std::vector<fs::path>{"a.py"});
        EXPECT_TRUE(has_reason(at.reasons, reasons::PROJECT_ADF_REACHED));

        const auto below = project_of({make_metrics("a.py", 2, 0.04)});
        EXPECT_FALSE(below.is_failed);
    }

    TEST_F(VerdictTest, TechnicalLagFailsOnlyTheProject) {
        auto legacy = make_metrics("legacy.py", 2);
        legacy.technical_lag = TechnicalLag::High;
        legacy.tl_lines = {3, 7};

        const auto file = judge(legacy);
        EXPECT_FALSE(file.is_failed);

        const auto project = project_of({legacy, make_metrics("modern.py", 2)});
        EXPECT_TRUE(project.is_failed);
        EXPECT_EQ(project.global_technical_lag, TechnicalLag::High);
        EXPECT_EQ(project.tl_instances, (std::vector<std::string>{"legacy.py:3", "legacy.py:7"}));
        EXPECT_EQ(project.reasons, std::vector<std::string>{reasons::PROJECT_TECHNICAL_LAG});
    }

    TEST_F(VerdictTest, ProjectChurnStatistics) {
        const auto project = project_of({
            make_metrics("a.py", 2, 0.0, 0.1),
            make_metrics("b.py", 2, 0.0, std::nullopt),
            make_metrics("c.py", 2, 0.0, 0.2),
        });

        EXPECT_FALSE(project.is_failed);
        EXPECT_EQ(project.unknown_ccr_files, 1u);
        ASSERT_TRUE(project.mean_ccr.has_value());
        EXPECT_NEAR(*project.mean_ccr, 0.15, 1e-12);
        EXPECT_DOUBLE_EQ(project.max_ccr.value(), 0.2);
    }

    TEST_F(VerdictTest, ProjectWithNoKnownChurn) {
        const auto project = project_of({make_metrics("a.py", 2, 0.0, std::nullopt)});

        EXPECT_FALSE(project.is_failed);
        EXPECT_FALSE(project.mean_ccr.has_value());
        EXPECT_FALSE(project.max_ccr.has_value());
    }

    TEST_F(VerdictTest, UnparseableFileFailsProject) {
        const auto project = project_of({make_metrics("a.py", 2), make_metrics("b.py", std::nullopt)});

        EXPECT_TRUE(project.is_failed);
        EXPECT_EQ(project.unparseable_files, 1u);
        EXPECT_EQ(project.max_cc_overall, 2);
        EXPECT_DOUBLE_EQ(project.mean_cc, 2.0);
        EXPECT_TRUE(has_reason(project.reasons, reasons::PROJECT_UNPARSEABLE));
    }

    TEST_F(VerdictTest, AnyFailingFileFailsProject) {
        const std::vector<FileMetrics> failing = {
            make_metrics("cc.py", 21),
            make_metrics("adf.py", 1, 0.5),
            make_metrics("ccr.py", 1, 0.0, 0.9),
            make_metrics("parse.py", std::nullopt),
        };

        for (const auto& bad : failing) {
            ASSERT_TRUE(judge(bad).is_failed) << bad.path;
            EXPECT_TRUE(project_of({make_metrics("ok.py", 1), bad}).is_failed) << bad.path;
        }
    }

    TEST_F(VerdictTest, ProjectVerdictIsDeterministic) {
        const std::vector<FileMetrics> metrics = {
            make_metrics("a.py", 8, 0.01, 0.1),
            make_metrics("b.py", 17, 0.0, std::nullopt),
        };

        const auto first = project_of(metrics);
        const auto second = project_of(metrics);

        EXPECT_EQ(first.is_failed, second.is_failed);
        EXPECT_EQ(first.reasons, second.reasons);
        EXPECT_EQ(first.max_cc_overall, second.max_cc_overall);
        EXPECT_DOUBLE_EQ(first.mean_ccr.value(), second.mean_ccr.value());
    }

    TEST(VerdictLabelTest, Labels) {
        EXPECT_STREQ(verdict_label(false), "Z-TIER (PASSED)");
        EXPECT_STREQ(verdict_label(true), "H-TIER (FAILED)");
    }

}  // namespace sts::engine
