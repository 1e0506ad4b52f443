#include "services/pipeline_runner.hpp"

#include "services/export/covariate_consolidator.hpp"

#include "../test_utils/log_capture.hpp"
#include "../test_utils/volume_generator.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

namespace ibis::services {
namespace {

class PipelineRunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = test_utils::makeTempDir("pipeline_runner_test");
        config_.paths.inputDir = dir_ / "input";
        config_.paths.outputDir = dir_ / "output";
        config_.paths.logsDir = dir_ / "logs";
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }

    std::filesystem::path dir_;
    core::PipelineConfig config_;
    test_utils::LogCapture capture_{"PipelineRunnerTest"};
};

TEST(PipelineStepTest, NamesRoundTrip) {
    for (auto step : PipelineRunner::allSteps()) {
        EXPECT_EQ(parsePipelineStep(toString(step)), step);
    }
    EXPECT_EQ(toString(PipelineStep::BufferZone), "buffer_zone");
    EXPECT_EQ(parsePipelineStep("consolidation"), PipelineStep::Consolidation);
    EXPECT_FALSE(parsePipelineStep("data_consolidation").has_value());
}

TEST(PipelineStepTest, ParseStepsSortsAndDeduplicates) {
    auto steps = PipelineRunner::parseSteps(
        {"consolidation", "variable_extraction", "buffer_zone", "roi_extraction", "buffer_zone"});
    ASSERT_TRUE(steps.has_value());
    EXPECT_EQ(*steps, (std::vector<PipelineStep>{PipelineStep::RoiExtraction,
                                                 PipelineStep::BufferZone,
                                                 PipelineStep::VariableExtraction,
                                                 PipelineStep::Consolidation}));
}

TEST(PipelineStepTest, ParseStepsRejectsUnknown) {
    auto steps = PipelineRunner::parseSteps({"buffer_zone", "bogus"});
    ASSERT_FALSE(steps.has_value());
    EXPECT_EQ(steps.error().code, PipelineError::Code::ConfigurationError);
    EXPECT_NE(steps.error().message.find("bogus"), std::string::npos);
}

TEST(RunReportTest, ExitCodes) {
    RunReport report;
    EXPECT_EQ(report.exitCode(), 0);

    report.steps.push_back({PipelineStep::RoiExtraction, StepStatus::Succeeded, 0, ""});
    EXPECT_EQ(report.exitCode(), 0);

    report.steps.push_back({PipelineStep::BufferZone, StepStatus::SucceededWithFailures, 1, ""});
    EXPECT_EQ(report.exitCode(), 2);

    report.steps.push_back({PipelineStep::VariableExtraction, StepStatus::Failed, 0, ""});
    EXPECT_EQ(report.exitCode(), 1);
}

TEST_F(PipelineRunnerTest, PrepareDirectoriesCreatesMissing) {
    PipelineRunner runner(config_, capture_.logger());
    ASSERT_TRUE(runner.prepareDirectories().has_value());
    EXPECT_TRUE(std::filesystem::is_directory(dir_ / "input"));
    EXPECT_TRUE(std::filesystem::is_directory(dir_ / "output"));
    EXPECT_TRUE(std::filesystem::is_directory(dir_ / "logs"));
    EXPECT_EQ(capture_.count("Creating"), 3u);

    ASSERT_TRUE(runner.prepareDirectories().has_value());
    EXPECT_EQ(capture_.count("Creating"), 3u);
}

TEST_F(PipelineRunnerTest, OutputLayout) {
    PipelineRunner runner(config_, capture_.logger());
    EXPECT_EQ(runner.bufferZoneOutputPath(),
              dir_ / "output" / "buffer_zone" / "buffer_zone_metrics.csv");
    EXPECT_EQ(runner.roiOutputPath(), dir_ / "output" / "roi" / "extracted_coordinates.csv");
    EXPECT_EQ(runner.combinedRoiOutputPath(), dir_ / "output" / "roi" / "combined_coordinates.csv");
    EXPECT_EQ(runner.variablesOutputDir(), dir_ / "output" / "variables");
    EXPECT_EQ(runner.consolidatedOutputDir(), dir_ / "output" / "consolidated");
}

TEST_F(PipelineRunnerTest, EmptyInputWritesNothing) {
    PipelineRunner runner(config_, capture_.logger());
    ASSERT_TRUE(runner.prepareDirectories().has_value());

    auto report = runner.run();
    ASSERT_EQ(report.steps.size(), 4u);
    EXPECT_EQ(report.exitCode(), 0);
    EXPECT_FALSE(std::filesystem::exists(runner.bufferZoneOutputPath()));
    EXPECT_FALSE(std::filesystem::exists(runner.roiOutputPath()));
    EXPECT_FALSE(std::filesystem::exists(runner.combinedRoiOutputPath()));
    EXPECT_FALSE(std::filesystem::exists(runner.consolidatedOutputDir()));
    EXPECT_TRUE(capture_.contains("No coordinate files"));
    EXPECT_TRUE(capture_.contains("nothing written"));
    EXPECT_TRUE(capture_.contains("buffer_zone start memory:"));
}

TEST_F(PipelineRunnerTest, RunsOnlySelectedSteps) {
    PipelineRunner runner(config_, capture_.logger());
    auto report = runner.run({PipelineStep::BufferZone, PipelineStep::BufferZone});
    ASSERT_EQ(report.steps.size(), 1u);
    EXPECT_EQ(report.steps[0].step, PipelineStep::BufferZone);
    EXPECT_FALSE(capture_.contains("Step roi_extraction started"));
}

TEST_F(PipelineRunnerTest, ConsolidationStepReportsBadFiles) {
    const auto subjectDir = config_.paths.inputDir / "variables" / "var" / "6966";
    std::filesystem::create_directories(subjectDir);
    std::ofstream(subjectDir / "var_a.csv") << "X,Y,Z,Value\n1,2,3,4\n";
    std::ofstream(subjectDir / "var_b.csv") << "X,Y,Z,Value\n1,2,3,bad\n";

    PipelineRunner runner(config_, capture_.logger());
    auto report = runner.run({PipelineStep::Consolidation});
    ASSERT_EQ(report.steps.size(), 1u);
    EXPECT_EQ(report.steps[0].status, StepStatus::SucceededWithFailures);
    EXPECT_EQ(report.steps[0].failedFiles, 1u);
    EXPECT_EQ(report.exitCode(), 2);
    EXPECT_TRUE(std::filesystem::exists(
        runner.consolidatedOutputDir() / CovariateConsolidator::kAllFile));
}

TEST_F(PipelineRunnerTest, RoiStepCombinesCsvInput) {
    const auto tables = config_.paths.inputDir / "QNP_vox_coords";
    std::filesystem::create_directories(tables);
    std::ofstream(tables / "6966.csv") << "X,Y,Z,Intensity\n1,2,3,4\n";

    PipelineRunner runner(config_, capture_.logger());
    auto report = runner.run({PipelineStep::RoiExtraction});
    ASSERT_EQ(report.steps.size(), 1u);
    EXPECT_EQ(report.exitCode(), 0);
    EXPECT_EQ(report.steps[0].message, "1 rows");
    EXPECT_TRUE(std::filesystem::exists(runner.combinedRoiOutputPath()));
    EXPECT_FALSE(std::filesystem::exists(runner.roiOutputPath()));
}

TEST_F(PipelineRunnerTest, UnwritableOutputFailsBufferZoneStep) {
    std::filesystem::create_directories(config_.paths.coordinatesDir());
    std::filesystem::create_directories(config_.paths.imagesDir());
    {
        std::ofstream csv(config_.paths.coordinatesDir() / "6966.csv");
        csv << "X,Y,Z\n-1,-1,1\n";
    }
    test_utils::writeImage<test_utils::FloatImageType>(
        test_utils::createIndexRampVolume({4, 4, 4}), config_.paths.imagesDir() / "6966.nii.gz");

    // A file where the output directory should be
    {
        std::ofstream blocker(dir_ / "output");
        blocker << "x";
    }

    PipelineRunner runner(config_, capture_.logger());
    auto report = runner.run({PipelineStep::BufferZone});
    ASSERT_EQ(report.steps.size(), 1u);
    EXPECT_EQ(report.steps[0].status, StepStatus::Failed);
    EXPECT_EQ(report.exitCode(), 1);
    EXPECT_TRUE(capture_.contains("Step buffer_zone failed"));
}

}  // anonymous namespace
}  // namespace ibis::services
