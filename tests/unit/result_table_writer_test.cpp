#include "services/export/result_table_writer.hpp"

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

class ResultTableWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = test_utils::makeTempDir("result_table_writer_test");
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }

    std::filesystem::path dir_;
};

TEST(EscapeCsvTest, PlainValueUnchanged) {
    EXPECT_EQ(escapeCsv("6966"), "6966");
    EXPECT_EQ(escapeCsv(""), "");
}

TEST(EscapeCsvTest, QuotesWhenNeeded) {
    EXPECT_EQ(escapeCsv("a,b"), "\"a,b\"");
    EXPECT_EQ(escapeCsv("say \"hi\""), "\"say \"\"hi\"\"\"");
    EXPECT_EQ(escapeCsv("two\nlines"), "\"two\nlines\"");
}

TEST(EscapeCsvTest, DelimiterAware) {
    EXPECT_EQ(escapeCsv("a,b", ';'), "a,b");
    EXPECT_EQ(escapeCsv("a;b", ';'), "\"a;b\"");
}

TEST_F(ResultTableWriterTest, WritesHeaderAndRows) {
    auto path = dir_ / "nested" / "out.csv";
    auto result = ResultTableWriter::writeCsv(path, {"a", "b"}, {{"1", "x,y"}, {"2", ""}});
    ASSERT_TRUE(result.has_value()) << result.error().toString();

    EXPECT_EQ(readFile(path), "a,b\n1,\"x,y\"\n2,\n");
    EXPECT_FALSE(std::filesystem::exists(dir_ / "nested" / "out.csv.tmp"));
}

TEST_F(ResultTableWriterTest, OverwritesExistingFile) {
    auto path = dir_ / "out.csv";
    ASSERT_TRUE(ResultTableWriter::writeCsv(path, {"h"}, {{"old"}, {"rows"}}).has_value());
    ASSERT_TRUE(ResultTableWriter::writeCsv(path, {"h"}, {{"new"}}).has_value());
    EXPECT_EQ(readFile(path), "h\nnew\n");
}

TEST_F(ResultTableWriterTest, HeaderOnlyForNoRows) {
    auto path = dir_ / "empty.csv";
    ASSERT_TRUE(ResultTableWriter::writeCsv(path, {"h1", "h2"}, {}).has_value());
    EXPECT_EQ(readFile(path), "h1,h2\n");
}

TEST_F(ResultTableWriterTest, ParentIsAFileIsOutputFailed) {
    auto blocker = dir_ / "blocker";
    {
        std::ofstream out(blocker);
        out << "x";
    }
    auto result = ResultTableWriter::writeCsv(blocker / "out.csv", {"h"}, {});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, PipelineError::Code::OutputFailed);
}

TEST_F(ResultTableWriterTest, WritesBufferZoneTable) {
    BufferZoneRecord full;
    full.subjectId = "6966";
    full.seedId = 0;
    full.x = -5.0;
    full.y = 2.5;
    full.z = 10.0;
    full.radiusMm = 5.0;
    full.voxelCount = 3;
    full.meanValue = 2.0;
    full.stdValue = 0.5;
    full.maxValue = 3.0;
    full.minValue = 1.0;

    BufferZoneRecord coordsOnly = full;
    coordsOnly.seedId = 1;
    coordsOnly.meanValue.reset();
    coordsOnly.stdValue.reset();
    coordsOnly.maxValue.reset();
    coordsOnly.minValue.reset();

    auto path = dir_ / "buffer_zone_metrics.csv";
    ASSERT_TRUE(ResultTableWriter().write({full, coordsOnly}, path).has_value());

    EXPECT_EQ(readFile(path),
              "seed_id,x,y,z,radius_mm,voxel_count,mean_value,std_value,max_value,min_value,subject_id\n"
              "0,-5,2.5,10,5,3,2,0.5,3,1,6966\n"
              "1,-5,2.5,10,5,3,,,,,6966\n");
}

}  // anonymous namespace
}  // namespace ibis::services
