#include "core/volume_loader.hpp"

#include <cmath>
#include <string>

#include <itkExtractImageFilter.h>
#include <itkImageFileReader.h>
#include <itkImageIOBase.h>
#include <itkImageIOFactory.h>
#include <itkImageRegionConstIterator.h>
#include <itkImageRegionIterator.h>

namespace ibis::core {

namespace {

using Volume4DType = itk::Image<float, 4>;

PipelineError readError(const std::filesystem::path& path, const std::string& reason) {
    return PipelineError{
        PipelineError::Code::VolumeReadFailed,
        path.string() + ": " + reason
    };
}

IntensityImageType::Pointer readFirstVolume(const std::filesystem::path& path) {
    using ReaderType = itk::ImageFileReader<Volume4DType>;
    auto reader = ReaderType::New();
    reader->SetFileName(path.string());
    reader->Update();

    auto region = reader->GetOutput()->GetLargestPossibleRegion();
    auto size = region.GetSize();
    auto start = region.GetIndex();
    size[3] = 0;  // collapse the time axis
    start[3] = 0;

    Volume4DType::RegionType extractRegion;
    extractRegion.SetSize(size);
    extractRegion.SetIndex(start);

    using ExtractFilterType = itk::ExtractImageFilter<Volume4DType, IntensityImageType>;
    auto extractor = ExtractFilterType::New();
    extractor->SetInput(reader->GetOutput());
    extractor->SetExtractionRegion(extractRegion);
    extractor->SetDirectionCollapseToSubmatrix();
    extractor->Update();

    IntensityImageType::Pointer volume = extractor->GetOutput();
    volume->DisconnectPipeline();
    return volume;
}

}  // anonymous namespace

std::expected<IntensityImageType::Pointer, PipelineError>
VolumeLoader::loadImage(const std::filesystem::path& path) const {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return std::unexpected(readError(path, "file not found"));
    }

    try {
        auto imageIO = itk::ImageIOFactory::CreateImageIO(
            path.string().c_str(), itk::ImageIOFactory::IOFileModeEnum::ReadMode);
        if (!imageIO) {
            return std::unexpected(readError(path, "unsupported image format"));
        }
        imageIO->SetFileName(path.string());
        imageIO->ReadImageInformation();

        const auto dimensions = imageIO->GetNumberOfDimensions();
        if (dimensions == 4) {
            return readFirstVolume(path);
        }
        if (dimensions != 3) {
            return std::unexpected(readError(
                path, "expected a 3-D or 4-D volume, got " +
                      std::to_string(dimensions) + "-D"));
        }

        using ReaderType = itk::ImageFileReader<IntensityImageType>;
        auto reader = ReaderType::New();
        reader->SetImageIO(imageIO);
        reader->SetFileName(path.string());
        reader->Update();

        IntensityImageType::Pointer image = reader->GetOutput();
        image->DisconnectPipeline();
        return image;
    }
    catch (const itk::ExceptionObject& e) {
        return std::unexpected(readError(path, std::string("ITK exception: ") + e.GetDescription()));
    }
    catch (const std::exception& e) {
        return std::unexpected(readError(path, std::string("Standard exception: ") + e.what()));
    }
}

std::expected<MaskImageType::Pointer, PipelineError>
VolumeLoader::loadMask(const std::filesystem::path& path) const {
    auto image = loadImage(path);
    if (!image) {
        return std::unexpected(image.error());
    }
    return binarize(image.value().GetPointer());
}

MaskImageType::Pointer VolumeLoader::binarize(const IntensityImageType* image) {
    if (!image) {
        return nullptr;
    }

    auto mask = MaskImageType::New();
    mask->SetRegions(image->GetLargestPossibleRegion());
    mask->SetSpacing(image->GetSpacing());
    mask->SetOrigin(image->GetOrigin());
    mask->SetDirection(image->GetDirection());
    mask->Allocate();

    itk::ImageRegionConstIterator<IntensityImageType> inIt(
        image, image->GetLargestPossibleRegion());
    itk::ImageRegionIterator<MaskImageType> outIt(
        mask, mask->GetLargestPossibleRegion());

    for (inIt.GoToBegin(), outIt.GoToBegin(); !inIt.IsAtEnd(); ++inIt, ++outIt) {
        const float v = inIt.Get();
        outIt.Set((v != 0.0f && !std::isnan(v)) ? 1 : 0);
    }

    return mask;
}

size_t VolumeLoader::countActive(const MaskImageType* mask) {
    if (!mask) {
        return 0;
    }

    size_t count = 0;
    itk::ImageRegionConstIterator<MaskImageType> it(mask, mask->GetLargestPossibleRegion());
    for (it.GoToBegin(); !it.IsAtEnd(); ++it) {
        if (it.Get() != 0) {
            ++count;
        }
    }
    return count;
}

}  // namespace ibis::core
