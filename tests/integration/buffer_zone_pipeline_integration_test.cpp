#include "core/pipeline_config.hpp"
#include "core/seed_table.hpp"
#include "services/export/covariate_consolidator.hpp"
#include "services/pipeline_runner.hpp"

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

std::vector<std::string> readLines(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

/**
 * @brief End-to-end runs over a small on-disk study
 *
 * Two subjects share a 10x10x10 index-ramp image layout (value = i + 100j +
 * 10000k, 1 mm voxels at the origin) so RAS world (-i, -j, k) maps straight to
 * known intensities. Subject 6966 has a full mask, subject 7001 a sphere mask.
 */
class BufferZonePipelineIntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = test_utils::makeTempDir("buffer_zone_pipeline_integration");

        config_.paths.inputDir = dir_ / "input";
        config_.paths.outputDir = dir_ / "output";
        config_.paths.logsDir = dir_ / "logs";
        config_.bufferZone.radiusOptions = {1.0, 2.0};
        config_.bufferZone.maxParallelJobs = 2;
        config_.bufferZone.queryThreads = 2;

        std::filesystem::create_directories(config_.paths.coordinatesDir());
        std::filesystem::create_directories(config_.paths.imagesDir());
        std::filesystem::create_directories(config_.paths.masksDir());

        auto ramp = test_utils::createIndexRampVolume({10, 10, 10});
        test_utils::writeImage<test_utils::FloatImageType>(
            ramp, config_.paths.imagesDir() / "6966_T1.nii.gz");
        test_utils::writeImage<test_utils::FloatImageType>(
            ramp, config_.paths.imagesDir() / "7001_T1.nii.gz");

        test_utils::writeImage<test_utils::UCharImageType>(
            test_utils::createMask({10, 10, 10}), config_.paths.masksDir() / "6966_mask.nii.gz");
        test_utils::writeImage<test_utils::UCharImageType>(
            test_utils::createSphereMask({10, 10, 10}, {5.0, 5.0, 5.0}, 3.0),
            config_.paths.masksDir() / "7001_mask.nii.gz");

        writeCoordinates("6966_coords.csv", "X,Y,Z\n-5,-5,5\n-2,-3,4\n");
        writeCoordinates("7001_coords.csv", "X,Y,Z\n-5,-5,5\n-50,-50,50\n");
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }

    void writeCoordinates(const std::string& name, const std::string& content) {
        std::ofstream out(config_.paths.coordinatesDir() / name, std::ios::binary);
        out << content;
    }

    RunReport runBufferZone() {
        PipelineRunner runner(config_, capture_.logger());
        EXPECT_TRUE(runner.prepareDirectories().has_value());
        return runner.run({PipelineStep::BufferZone});
    }

    std::filesystem::path outputPath() const {
        return config_.paths.outputDir / "buffer_zone" / "buffer_zone_metrics.csv";
    }

    std::filesystem::path dir_;
    core::PipelineConfig config_;
    test_utils::LogCapture capture_{"BufferZonePipelineIntegrationTest", 1024};
};

TEST_F(BufferZonePipelineIntegrationTest, WritesMetricsForAllSubjects) {
    auto report = runBufferZone();
    EXPECT_EQ(report.exitCode(), 0);

    auto lines = readLines(outputPath());
    ASSERT_FALSE(lines.empty());
    EXPECT_EQ(lines[0],
              "seed_id,x,y,z,radius_mm,voxel_count,mean_value,std_value,max_value,min_value,subject_id");

    // 6966: two seeds at two radii; 7001: one seed at two radii (the far one is empty)
    ASSERT_EQ(lines.size(), 1u + 4u + 2u);

    auto first = core::splitCsvLine(lines[1]);
    ASSERT_EQ(first.size(), 11u);
    EXPECT_EQ(first[0], "0");
    EXPECT_EQ(first[4], "1");
    EXPECT_EQ(first[5], "7");
    EXPECT_EQ(first[6], "50505");
    EXPECT_EQ(first[8], "60505");
    EXPECT_EQ(first[9], "40505");
    EXPECT_EQ(first[10], "6966");

    // Radius 1 rows come before radius 2 rows within a subject
    EXPECT_EQ(core::splitCsvLine(lines[2])[0], "1");
    EXPECT_EQ(core::splitCsvLine(lines[2])[4], "1");
    EXPECT_EQ(core::splitCsvLine(lines[3])[4], "2");
    EXPECT_EQ(core::splitCsvLine(lines[3])[5], "33");

    auto sphere = core::splitCsvLine(lines[5]);
    EXPECT_EQ(sphere[10], "7001");
    EXPECT_EQ(sphere[0], "0");
    EXPECT_EQ(sphere[5], "7");
}

TEST_F(BufferZonePipelineIntegrationTest, RepeatedRunsAreByteIdentical) {
    ASSERT_EQ(runBufferZone().exitCode(), 0);
    const auto first = readFile(outputPath());

    config_.bufferZone.maxParallelJobs = 1;
    config_.bufferZone.queryThreads = 1;
    ASSERT_EQ(runBufferZone().exitCode(), 0);
    EXPECT_EQ(readFile(outputPath()), first);
}

TEST_F(BufferZonePipelineIntegrationTest, CorruptCoordinateFileIsReported) {
    writeCoordinates("8000_coords.csv", "A,B\n1,2\n");

    auto report = runBufferZone();
    EXPECT_EQ(report.exitCode(), 2);
    ASSERT_EQ(report.steps.size(), 1u);
    EXPECT_EQ(report.steps[0].failedFiles, 1u);
    EXPECT_TRUE(capture_.contains("Failed to process 8000_coords.csv"));
    EXPECT_EQ(readLines(outputPath()).size(), 7u);
}

TEST_F(BufferZonePipelineIntegrationTest, FullPipelineWritesEveryOutput) {
    std::filesystem::create_directories(config_.paths.inputDir / "edt");
    test_utils::writeImage<test_utils::FloatImageType>(
        test_utils::createIndexRampVolume({10, 10, 10}),
        config_.paths.inputDir / "edt" / "dist_masked.nii.gz");
    std::filesystem::create_directories(config_.paths.inputDir / "QNP_vox_coords");
    std::ofstream(config_.paths.inputDir / "QNP_vox_coords" / "7001.csv")
        << "X,Y,Z,Intensity\n1,2,3,4\n";
    std::filesystem::create_directories(config_.paths.inputDir / "variables" / "var" / "6966");
    std::ofstream(config_.paths.inputDir / "variables" / "var" / "6966" / "var_mean.csv")
        << "X,Y,Z,Value\n1,2,3,0.5\n";

    PipelineRunner runner(config_, capture_.logger());
    ASSERT_TRUE(runner.prepareDirectories().has_value());
    auto report = runner.run();

    ASSERT_EQ(report.steps.size(), 4u);
    EXPECT_EQ(report.exitCode(), 0);
    EXPECT_TRUE(std::filesystem::exists(runner.bufferZoneOutputPath()));

    // The first mask (6966, full) applies to every image
    auto roi = readLines(runner.roiOutputPath());
    EXPECT_EQ(roi.size(), 1u + 2u * 1000u);
    EXPECT_EQ(roi[0], "X,Y,Z,Intensity,sub.id");

    auto edt = readLines(runner.variablesOutputDir() / "edt" / "v1_edt_dist_6966.csv");
    EXPECT_EQ(edt.size(), 1u + 1000u);

    EXPECT_EQ(readLines(runner.combinedRoiOutputPath()).size(), 2u);
    auto merged = readLines(runner.consolidatedOutputDir() / CovariateConsolidator::kAllFile);
    ASSERT_EQ(merged.size(), 2u);
    EXPECT_EQ(merged[0], "i,j,k,var_mean");
    EXPECT_EQ(merged[1], "1,2,3,0.5");
}

}  // anonymous namespace
}  // namespace ibis::services
