#include "core/volume_loader.hpp"

#include "../test_utils/volume_generator.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <filesystem>
#include <fstream>
#include <limits>

namespace ibis::core {
namespace {

class VolumeLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = test_utils::makeTempDir("volume_loader_test");
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }

    std::filesystem::path dir_;
    VolumeLoader loader_;
};

TEST_F(VolumeLoaderTest, Loads3DNifti) {
    auto image = test_utils::createIndexRampVolume({5, 6, 7}, {0.8, 1.0, 2.5});
    auto path = dir_ / "ramp.nii.gz";
    test_utils::writeImage<test_utils::FloatImageType>(image, path);

    auto loaded = loader_.loadImage(path);
    ASSERT_TRUE(loaded.has_value()) << loaded.error().toString();

    auto size = loaded.value()->GetLargestPossibleRegion().GetSize();
    EXPECT_EQ(size[0], 5u);
    EXPECT_EQ(size[1], 6u);
    EXPECT_EQ(size[2], 7u);
    EXPECT_NEAR(loaded.value()->GetSpacing()[2], 2.5, 1e-6);

    IntensityImageType::IndexType idx = {{4, 5, 6}};
    EXPECT_FLOAT_EQ(loaded.value()->GetPixel(idx), 60504.0f);
}

TEST_F(VolumeLoaderTest, Loads4DNiftiFirstVolume) {
    using Image4D = itk::Image<float, 4>;
    auto image = Image4D::New();
    Image4D::SizeType size = {{3, 3, 3, 2}};
    Image4D::IndexType start = {{0, 0, 0, 0}};
    image->SetRegions(Image4D::RegionType(start, size));
    image->Allocate();
    image->FillBuffer(7.0f);
    Image4D::IndexType second = {{1, 1, 1, 1}};
    image->SetPixel(second, 99.0f);

    auto path = dir_ / "series.nii";
    test_utils::writeImage<Image4D>(image, path);

    auto loaded = loader_.loadImage(path);
    ASSERT_TRUE(loaded.has_value()) << loaded.error().toString();
    auto loadedSize = loaded.value()->GetLargestPossibleRegion().GetSize();
    EXPECT_EQ(loadedSize[0], 3u);
    EXPECT_EQ(loadedSize[2], 3u);

    IntensityImageType::IndexType center = {{1, 1, 1}};
    EXPECT_FLOAT_EQ(loaded.value()->GetPixel(center), 7.0f);
}

TEST_F(VolumeLoaderTest, MissingFileIsVolumeReadFailed) {
    auto loaded = loader_.loadImage(dir_ / "nope.nii");
    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().code, PipelineError::Code::VolumeReadFailed);
}

TEST_F(VolumeLoaderTest, GarbageFileIsVolumeReadFailed) {
    auto path = dir_ / "garbage.nii";
    {
        std::ofstream out(path, std::ios::binary);
        out << "this is not a nifti header";
    }
    auto loaded = loader_.loadImage(path);
    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().code, PipelineError::Code::VolumeReadFailed);
}

TEST_F(VolumeLoaderTest, LoadMaskBinarizesNonzero) {
    auto image = test_utils::createFloatVolume({4, 4, 4});
    IntensityImageType::IndexType a = {{1, 1, 1}};
    IntensityImageType::IndexType b = {{2, 2, 2}};
    image->SetPixel(a, 3.0f);
    image->SetPixel(b, -0.5f);
    auto path = dir_ / "mask.nii.gz";
    test_utils::writeImage<test_utils::FloatImageType>(image, path);

    auto mask = loader_.loadMask(path);
    ASSERT_TRUE(mask.has_value()) << mask.error().toString();
    EXPECT_EQ(mask.value()->GetPixel(a), 1);
    EXPECT_EQ(mask.value()->GetPixel(b), 1);
    EXPECT_EQ(VolumeLoader::countActive(mask.value().GetPointer()), 2u);
}

TEST(VolumeLoaderBinarizeTest, NaNIsOutside) {
    auto image = test_utils::createFloatVolume({2, 2, 2}, {1.0, 1.0, 1.0}, 1.0f);
    IntensityImageType::IndexType idx = {{0, 0, 0}};
    image->SetPixel(idx, std::numeric_limits<float>::quiet_NaN());

    auto mask = VolumeLoader::binarize(image.GetPointer());
    ASSERT_TRUE(mask);
    EXPECT_EQ(mask->GetPixel(idx), 0);
    EXPECT_EQ(VolumeLoader::countActive(mask.GetPointer()), 7u);
    EXPECT_EQ(mask->GetSpacing(), image->GetSpacing());
}

TEST(VolumeLoaderBinarizeTest, NullImageGivesNullMask) {
    EXPECT_FALSE(VolumeLoader::binarize(nullptr));
}

}  // anonymous namespace
}  // namespace ibis::core
