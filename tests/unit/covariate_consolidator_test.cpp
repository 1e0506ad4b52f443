#include "services/export/covariate_consolidator.hpp"

#include "../test_utils/log_capture.hpp"
#include "../test_utils/volume_generator.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

namespace ibis::services {
namespace {

std::string readFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

void writeFile(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream(path, std::ios::binary) << content;
}

core::CsvTable table(const std::string& content) {
    auto parsed = core::parseCsvTable(content);
    EXPECT_TRUE(parsed.has_value());
    return parsed.value_or(core::CsvTable{});
}

using Cells = std::vector<std::string>;

// =============================================================================
// Single tables
// =============================================================================

TEST(CovariateConsolidatorStaticTest, LoadCovariateTruncatesAndRounds) {
    auto covariate = CovariateConsolidator::loadCovariate(
        table("X,Y,Z,label,Value\n3.9,-2.5,70000,a,1.23456\n0,0,0,b,\n"), "dist");
    ASSERT_TRUE(covariate.has_value()) << covariate.error().toString();

    EXPECT_EQ(covariate->header, (Cells{"i", "j", "k", "dist"}));
    ASSERT_EQ(covariate->rows.size(), 2u);
    EXPECT_EQ(covariate->rows[0], (Cells{"3", "-2", "4464", "1.235"}));
    EXPECT_EQ(covariate->rows[1], (Cells{"0", "0", "0", ""}));
}

TEST(CovariateConsolidatorStaticTest, LoadCovariateAcceptsLowercaseColumns) {
    auto covariate = CovariateConsolidator::loadCovariate(table("z,y,x,v\n3,2,1,0.5\n"), "v");
    ASSERT_TRUE(covariate.has_value());
    EXPECT_EQ(covariate->rows[0], (Cells{"1", "2", "3", "0.5"}));
}

TEST(CovariateConsolidatorStaticTest, LoadCovariateRejectsMissingCoordinates) {
    auto csv = table("X,Y,value\n1,2,3\n");
    EXPECT_FALSE(CovariateConsolidator::hasCoordinateColumns(csv));

    auto covariate = CovariateConsolidator::loadCovariate(csv, "v", "flat.csv");
    ASSERT_FALSE(covariate.has_value());
    EXPECT_EQ(covariate.error().code, PipelineError::Code::InputFormatError);
    EXPECT_NE(covariate.error().message.find("flat.csv"), std::string::npos);
}

TEST(CovariateConsolidatorStaticTest, LoadCovariateRejectsUnparsableCell) {
    auto covariate = CovariateConsolidator::loadCovariate(table("X,Y,Z,V\n1,2,3,oops\n"), "v");
    ASSERT_FALSE(covariate.has_value());
    EXPECT_EQ(covariate.error().code, PipelineError::Code::InputFormatError);
    EXPECT_NE(covariate.error().message.find("oops"), std::string::npos);

    covariate = CovariateConsolidator::loadCovariate(table("X,Y,Z,V\n1,,3,4\n"), "v");
    ASSERT_FALSE(covariate.has_value());
}

// =============================================================================
// Joining
// =============================================================================

TEST(CovariateConsolidatorJoinTest, PadsShortTablesAndDropsRepeatedColumns) {
    test_utils::LogCapture capture{"CovariateConsolidatorJoinTest"};
    CovariateConsolidator consolidator({}, capture.logger());

    auto joined = consolidator.concatenateColumns({
        table("i,j,k,a\n1,2,3,7\n"),
        table("i,j,k,b\n1,2,3,0.5\n4,5,6,0.25\n"),
    });

    EXPECT_EQ(joined.header, (Cells{"i", "j", "k", "a", "b"}));
    ASSERT_EQ(joined.rows.size(), 2u);
    EXPECT_EQ(joined.rows[0], (Cells{"1", "2", "3", "7", "0.5"}));
    EXPECT_EQ(joined.rows[1], (Cells{"", "", "", "", "0.25"}));
}

TEST(CovariateConsolidatorJoinTest, KeepsRepeatedColumnsWhenDisabled) {
    test_utils::LogCapture capture{"CovariateConsolidatorJoinTest"};
    core::ConsolidationSettings settings;
    settings.removeDuplicates = false;
    CovariateConsolidator consolidator(settings, capture.logger());

    auto joined = consolidator.concatenateColumns({table("i,a\n1,2\n"), table("i,b\n1,3\n")});
    EXPECT_EQ(joined.header, (Cells{"i", "a", "i", "b"}));
    EXPECT_EQ(joined.rows[0], (Cells{"1", "2", "1", "3"}));
}

TEST(CovariateConsolidatorJoinTest, DropPolicyRemovesIncompleteRows) {
    test_utils::LogCapture capture{"CovariateConsolidatorJoinTest"};
    CovariateConsolidator consolidator({}, capture.logger());

    auto joined = table("i,a\n1,2\n2,\n3,4\n");
    consolidator.applyMissingPolicy(joined);
    ASSERT_EQ(joined.rows.size(), 2u);
    EXPECT_EQ(joined.rows[1], (Cells{"3", "4"}));
    EXPECT_TRUE(capture.contains("Dropped 1 rows"));
}

TEST(CovariateConsolidatorJoinTest, FillPolicyReplacesEmptyCells) {
    test_utils::LogCapture capture{"CovariateConsolidatorJoinTest"};
    core::ConsolidationSettings settings;
    settings.handleMissing = core::MissingValuePolicy::Fill;
    settings.fillValue = -1.5;
    CovariateConsolidator consolidator(settings, capture.logger());

    auto joined = table("i,a\n1,2\n,\n");
    consolidator.applyMissingPolicy(joined);
    ASSERT_EQ(joined.rows.size(), 2u);
    EXPECT_EQ(joined.rows[1], (Cells{"-1.5", "-1.5"}));
}

// =============================================================================
// Directory runs
// =============================================================================

class CovariateConsolidatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = test_utils::makeTempDir("covariate_consolidator_test");
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }

    CovariateConsolidator makeConsolidator(core::ConsolidationSettings settings = {}) {
        return CovariateConsolidator(settings, capture_.logger());
    }

    std::filesystem::path input() const { return dir_ / "input"; }
    std::filesystem::path output() const { return dir_ / "output"; }
    std::filesystem::path consolidated() const { return output() / "consolidated"; }

    std::filesystem::path dir_;
    test_utils::LogCapture capture_{"CovariateConsolidatorTest"};
};

TEST_F(CovariateConsolidatorTest, RunJoinsEverySourceAndMerges) {
    // Top-level step output must not be read as a covariate
    writeFile(output() / "buffer_zone" / "buffer_zone_metrics.csv",
              "seed_id,x,y,z,radius_mm,subject_id\n0,1,2,3,5,6966\n");
    writeFile(output() / "buffer_zone" / "6966" / "bz_r5.csv", "X,Y,Z,bz\n1,2,3,0.5\n");
    // Found through the input directory fallback
    writeFile(input() / "variables" / "edt" / "6966" / "v1_edt_dist.csv",
              "X,Y,Z,Value\n1,2,3,2.25\n");

    auto summary = makeConsolidator().run(input(), output());
    ASSERT_TRUE(summary.has_value()) << summary.error().toString();
    EXPECT_EQ(summary->filesWritten, 3u);
    EXPECT_TRUE(summary->failures.empty());

    EXPECT_EQ(readFile(consolidated() / CovariateConsolidator::kBufferZoneFile),
              "i,j,k,bz_r5\n1,2,3,0.5\n");
    EXPECT_EQ(readFile(consolidated() / CovariateConsolidator::kEdtFile),
              "i,j,k,dist\n1,2,3,2.25\n");
    EXPECT_FALSE(std::filesystem::exists(consolidated() / CovariateConsolidator::kVarFile));
    EXPECT_EQ(readFile(consolidated() / CovariateConsolidator::kAllFile),
              "i,j,k,bz_r5,dist\n1,2,3,0.5,2.25\n");
    EXPECT_TRUE(capture_.contains("No variables/var directory"));
}

TEST_F(CovariateConsolidatorTest, OutputDirectoryWinsOverInput) {
    writeFile(output() / "variables" / "var" / "s" / "var_a.csv", "X,Y,Z,V\n1,1,1,1\n");
    writeFile(input() / "variables" / "var" / "s" / "var_b.csv", "X,Y,Z,V\n2,2,2,2\n");

    auto summary = makeConsolidator().run(input(), output());
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(readFile(consolidated() / CovariateConsolidator::kVarFile),
              "i,j,k,var_a\n1,1,1,1\n");
}

TEST_F(CovariateConsolidatorTest, BadFileIsRecordedAndSkipped) {
    writeFile(output() / "variables" / "var" / "s" / "var_a.csv", "X,Y,Z,V\n1,2,3,4\n");
    writeFile(output() / "variables" / "var" / "s" / "var_b.csv", "X,Y,Z,V\n1,2,3,oops\n");
    writeFile(output() / "variables" / "var" / "s" / "notes.csv", "comment\nhello\n");

    auto summary = makeConsolidator().run(input(), output());
    ASSERT_TRUE(summary.has_value());
    ASSERT_EQ(summary->failures.size(), 1u);
    EXPECT_EQ(summary->failures[0].file.filename().string(), "var_b.csv");
    EXPECT_EQ(summary->failures[0].error.code, PipelineError::Code::InputFormatError);
    EXPECT_EQ(readFile(consolidated() / CovariateConsolidator::kVarFile),
              "i,j,k,var_a\n1,2,3,4\n");
    EXPECT_TRUE(capture_.contains("Error processing"));
}

TEST_F(CovariateConsolidatorTest, MergeFillsUnevenTables) {
    writeFile(consolidated() / CovariateConsolidator::kBufferZoneFile,
              "i,j,k,bz\n1,2,3,0.5\n4,5,6,0.75\n");
    writeFile(consolidated() / CovariateConsolidator::kVarFile, "i,j,k,var\n1,2,3,9\n");

    core::ConsolidationSettings settings;
    settings.handleMissing = core::MissingValuePolicy::Fill;
    settings.fillValue = 0.0;

    ExportSummary summary;
    auto merged = makeConsolidator(settings).mergeAll(consolidated(), summary);
    ASSERT_TRUE(merged.has_value());
    EXPECT_TRUE(*merged);
    EXPECT_EQ(readFile(consolidated() / CovariateConsolidator::kAllFile),
              "i,j,k,bz,var\n1,2,3,0.5,9\n4,5,6,0.75,0\n");
}

TEST_F(CovariateConsolidatorTest, MergeDropsIncompleteRowsByDefault) {
    writeFile(consolidated() / CovariateConsolidator::kBufferZoneFile,
              "i,j,k,bz\n1,2,3,0.5\n4,5,6,0.75\n");
    writeFile(consolidated() / CovariateConsolidator::kEdtFile, "i,j,k,edt\n1,2,3,9\n");

    ExportSummary summary;
    auto merged = makeConsolidator().mergeAll(consolidated(), summary);
    ASSERT_TRUE(merged.has_value());
    EXPECT_EQ(readFile(consolidated() / CovariateConsolidator::kAllFile),
              "i,j,k,bz,edt\n1,2,3,0.5,9\n");
}

TEST_F(CovariateConsolidatorTest, NothingToConsolidateWritesNothing) {
    std::filesystem::create_directories(output());

    auto summary = makeConsolidator().run(input(), output());
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary->filesWritten, 0u);
    EXPECT_FALSE(std::filesystem::exists(consolidated()));
    EXPECT_TRUE(capture_.contains("No consolidated tables"));
}

}  // anonymous namespace
}  // namespace ibis::services
