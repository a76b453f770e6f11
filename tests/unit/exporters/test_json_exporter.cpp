//
// Created by gregorian-rayne on 10/15/26.
//

#include "sts/exporters/json_exporter.hpp"
#include "sts/version.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <sstream>

namespace sts::exporters
{
    namespace {
        FileVerdict sample_file() {
            FileVerdict v;
            v.metrics.path = "src/service.py";
            v.metrics.max_cc = 7;
            v.metrics.mean_cc = 10.0 / 3.0;
            v.metrics.units = {
                {"Service.run", 4, 20, 7},
                {"helper", 22, 25, 2},
            };
            v.metrics.adf = 0.1;
            v.metrics.drift_lines = 2;
            v.metrics.counted_lines = 20;
            v.metrics.ccr = 1.0 / 3.0;
            v.metrics.churn_touches = 3;
            v.metrics.technical_lag = TechnicalLag::High;
            v.metrics.tl_lines = {12};
            v.metrics.halstead_effort = 1234.5678;
            v.metrics.halstead_difficulty = 9.87654;
            v.metrics.maintainability_index = 61.2345;
            v.is_failed = true;
            v.reasons = {"adf exceeded"};
            return v;
        }

        FileVerdict unparseable_file() {
            FileVerdict v;
            v.metrics.path = "src/broken.py";
            v.metrics.analysis_error = "unterminated string literal (line 3)";
            v.metrics.churn_note = "not a git repository";
            v.is_failed = true;
            v.degraded = true;
            v.reasons = {"unparseable", "ccr unknown (excluded from verdict)"};
            return v;
        }

        AuditReport directory_report() {
            AuditReport report;
            report.target = "src";
            report.mode = AuditMode::Directory;
            report.config_source = "built-in defaults";
            report.generated_at = Timestamp{};
            report.analysis_duration = std::chrono::microseconds(12345);
            report.files = {unparseable_file(), sample_file()};

            ProjectVerdict project;
            project.total_files = 2;
            project.unparseable_files = 1;
            project.unknown_ccr_files = 1;
            project.max_cc_overall = 7;
            project.mean_cc = 7.0;
            project.max_adf_overall = 0.1;
            project.polluted_files = {"src/service.py"};
            project.mean_ccr = 1.0 / 3.0;
            project.max_ccr = 1.0 / 3.0;
            project.global_technical_lag = TechnicalLag::High;
            project.tl_instances = {"src/service.py:12"};
            project.is_failed = true;
            project.reasons = {"adf threshold reached", "technical lag HIGH", "unparseable files present"};
            report.project = project;
            return report;
        }
    }

    // =============================================================================
    // Document Tests
    // =============================================================================

    TEST(JsonExporterTest, TopLevelFields) {
        const JsonExporter exporter;
        const auto doc = exporter.to_json(directory_report());

        EXPECT_EQ(doc["tool"], PROJECT_SHORT_NAME);
        EXPECT_EQ(doc["version"], VERSION_STRING);
        EXPECT_EQ(doc["target"], "src");
        EXPECT_EQ(doc["mode"], "directory");
        EXPECT_EQ(doc["config_source"], "built-in defaults");
        EXPECT_EQ(doc["generated_at"], "1970-01-01T00:00:00Z");
        EXPECT_DOUBLE_EQ(doc["analysis_duration_ms"].get<double>(), 12.345);
        EXPECT_EQ(doc["exit_code"], exit_codes::Fail);
        ASSERT_TRUE(doc["files"].is_array());
        EXPECT_EQ(doc["files"].size(), 2u);
    }

    TEST(JsonExporterTest, FileEntry) {
        const JsonExporter exporter;
        const auto doc = exporter.to_json(directory_report());
        const auto& file = doc["files"][1];

        EXPECT_EQ(file["path"], "src/service.py");
        EXPECT_EQ(file["max_cc"], 7);
        EXPECT_DOUBLE_EQ(file["mean_cc"].get<double>(), 3.33);
        EXPECT_DOUBLE_EQ(file["adf"].get<double>(), 0.1);
        EXPECT_EQ(file["drift_lines"], 2);
        EXPECT_DOUBLE_EQ(file["ccr"].get<double>(), 0.3333);
        EXPECT_EQ(file["churn_touches"], 3);
        EXPECT_EQ(file["technical_lag"], "HIGH");
        EXPECT_EQ(file["tl_instances"], nlohmann::json::array({"src/service.py:12"}));
        EXPECT_DOUBLE_EQ(file["halstead_effort"].get<double>(), 1234.57);
        EXPECT_DOUBLE_EQ(file["maintainability_index"].get<double>(), 61.23);
        EXPECT_EQ(file["failed"], true);
        EXPECT_EQ(file["degraded"], false);
        EXPECT_EQ(file["verdict"], "H-TIER (FAILED)");
        EXPECT_EQ(file["reasons"], nlohmann::json::array({"adf exceeded"}));
        EXPECT_TRUE(file["error"].is_null());

        ASSERT_EQ(file["units"].size(), 2u);
        EXPECT_EQ(file["units"][0]["name"], "Service.run");
        EXPECT_EQ(file["units"][0]["start_line"], 4);
        EXPECT_EQ(file["units"][0]["end_line"], 20);
        EXPECT_EQ(file["units"][0]["complexity"], 7);
    }

    TEST(JsonExporterTest, UnknownValuesAreNull) {
        const JsonExporter exporter;
        const auto doc = exporter.to_json(directory_report());
        const auto& file = doc["files"][0];

        EXPECT_TRUE(file["max_cc"].is_null());
        EXPECT_TRUE(file["mean_cc"].is_null());
        EXPECT_TRUE(file["ccr"].is_null());
        EXPECT_TRUE(file["churn_touches"].is_null());
        EXPECT_EQ(file["error"], "unterminated string literal (line 3)");
        EXPECT_EQ(file["degraded"], true);
        EXPECT_TRUE(file["units"].is_array());
        EXPECT_TRUE(file["units"].empty());
    }

    TEST(JsonExporterTest, ProjectEntry) {
        const JsonExporter exporter;
        const auto doc = exporter.to_json(directory_report());
        const auto& project = doc["project"];

        EXPECT_EQ(project["total_files"], 2);
        EXPECT_EQ(project["unparseable_files"], 1);
        EXPECT_EQ(project["max_cc"], 7);
        EXPECT_DOUBLE_EQ(project["max_adf"].get<double>(), 0.1);
        EXPECT_EQ(project["polluted_files"], nlohmann::json::array({"src/service.py"}));
        EXPECT_DOUBLE_EQ(project["mean_ccr"].get<double>(), 0.3333);
        EXPECT_EQ(project["unknown_ccr_files"], 1);
        EXPECT_EQ(project["global_tl"], "HIGH");
        EXPECT_EQ(project["failed"], true);
        EXPECT_EQ(project["verdict"], "H-TIER (FAILED)");
        EXPECT_EQ(project["reasons"].size(), 3u);
    }

    TEST(JsonExporterTest, SingleFileReportHasNullProject) {
        AuditReport report;
        report.target = "src/service.py";
        report.mode = AuditMode::SingleFile;
        auto file = sample_file();
        file.is_failed = false;
        file.reasons.clear();
        report.files = {file};

        const JsonExporter exporter;
        const auto doc = exporter.to_json(report);

        EXPECT_EQ(doc["mode"], "file");
        EXPECT_TRUE(doc["project"].is_null());
        EXPECT_EQ(doc["exit_code"], exit_codes::Pass);
        EXPECT_EQ(doc["files"][0]["verdict"], "Z-TIER (PASSED)");
    }

    TEST(JsonExporterTest, StringIsValidJson) {
        const JsonExporter exporter;

        auto pretty = exporter.export_to_string(directory_report());
        ASSERT_TRUE(pretty.is_ok());
        EXPECT_NE(pretty.value().find("\n  \"config_source\""), std::string::npos);

        ExportOptions compact;
        compact.pretty_print = false;
        auto text = exporter.export_to_string(directory_report(), compact);
        ASSERT_TRUE(text.is_ok());
        EXPECT_EQ(text.value().find('\n'), std::string::npos);

        const auto parsed = nlohmann::json::parse(text.value());
        EXPECT_EQ(parsed["files"].size(), 2u);
    }

    TEST(JsonExporterTest, StreamOutput) {
        const JsonExporter exporter;
        std::ostringstream out;

        ASSERT_TRUE(exporter.export_to_stream(out, directory_report()).is_ok());
        EXPECT_EQ(nlohmann::json::parse(out.str())["mode"], "directory");
    }

    TEST(JsonExporterTest, TimestampFormat) {
        const Timestamp ts = std::chrono::system_clock::from_time_t(86400 + 3661);
        EXPECT_EQ(format_timestamp(ts), "1970-01-02T01:01:01Z");
    }

    // =============================================================================
    // Output Path Tests
    // =============================================================================

    class OutputPathTest : public ::testing::Test {
    protected:
        void SetUp() override {
            root_ = fs::temp_directory_path() / "sts_output_path_test";
            fs::remove_all(root_);
            fs::create_directories(root_ / "project" / "pkg");
            std::ofstream(root_ / "project" / "pkg" / "mod.py") << "x = 1\n";
        }

        void TearDown() override {
            std::error_code ec;
            fs::remove_all(root_, ec);
        }

        [[nodiscard]] AuditReport report_for(const fs::path& target, const AuditMode mode) const {
            AuditReport report;
            report.target = target;
            report.mode = mode;
            return report;
        }

        fs::path root_;
    };

    TEST_F(OutputPathTest, OutsideTreeIsAccepted) {
        const auto report = report_for(root_ / "project", AuditMode::Directory);
        EXPECT_TRUE(validate_output_path(root_ / "report.json", report).is_ok());
    }

    TEST_F(OutputPathTest, InsideTreeIsRejected) {
        const auto report = report_for(root_ / "project", AuditMode::Directory);

        auto nested = validate_output_path(root_ / "project" / "pkg" / "report.json", report);
        ASSERT_TRUE(nested.is_err());
        EXPECT_EQ(nested.error().code(), ErrorCode::InvalidArgument);
        EXPECT_EQ(nested.error().message(), "Output path is inside the scanned tree");

        auto dotted = validate_output_path(root_ / "project" / ".." / "project" / "r.json", report);
        EXPECT_TRUE(dotted.is_err());
    }

    TEST_F(OutputPathTest, SiblingWithSharedPrefixIsAccepted) {
        const auto report = report_for(root_ / "project", AuditMode::Directory);
        EXPECT_TRUE(validate_output_path(root_ / "project-reports" / "r.json", report).is_ok());
    }

    TEST_F(OutputPathTest, DirectoryIsRejected) {
        const auto report = report_for(root_ / "project", AuditMode::Directory);

        auto result = validate_output_path(root_, report);
        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().message(), "Output path is a directory");
    }

    TEST_F(OutputPathTest, SingleFileMode) {
        const auto target = root_ / "project" / "pkg" / "mod.py";
        const auto report = report_for(target, AuditMode::SingleFile);

        EXPECT_TRUE(validate_output_path(root_ / "project" / "pkg" / "mod.json", report).is_ok());

        auto clobber = validate_output_path(root_ / "project" / "pkg" / ".." / "pkg" / "mod.py", report);
        ASSERT_TRUE(clobber.is_err());
        EXPECT_EQ(clobber.error().message(), "Output path would overwrite the audited file");
    }

    TEST_F(OutputPathTest, EmptyPathIsRejected) {
        const auto report = report_for(root_ / "project", AuditMode::Directory);
        EXPECT_TRUE(validate_output_path(fs::path{}, report).is_err());
    }

    TEST_F(OutputPathTest, WritesFile) {
        const JsonExporter exporter;
        const auto output = root_ / "out" / "report.json";

        ASSERT_TRUE(exporter.export_to_file(output, directory_report()).is_ok());

        std::ifstream in(output);
        const auto doc = nlohmann::json::parse(in);
        EXPECT_EQ(doc["tool"], PROJECT_SHORT_NAME);
    }

}  // namespace sts::exporters
