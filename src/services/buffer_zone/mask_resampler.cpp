#include "services/buffer_zone/mask_resampler.hpp"

#include <string>

#include <itkIdentityTransform.h>
#include <itkNearestNeighborInterpolateImageFunction.h>
#include <itkResampleImageFilter.h>

namespace ibis::services {

bool MaskResampler::needsResampling(const MaskImageType* mask,
                                    const core::GridGeometry& target) {
    if (!mask) {
        return false;
    }
    auto geometry = core::GridGeometry::fromImage(mask, target.convention());
    return !geometry || !geometry->sameGrid(target);
}

std::expected<MaskResampler::MaskImageType::Pointer, PipelineError>
MaskResampler::resample(MaskImageType::Pointer mask,
                        const std::optional<core::GridGeometry>& target) const {
    if (!mask) {
        return std::unexpected(PipelineError{
            PipelineError::Code::InvalidInput,
            "Mask is null"
        });
    }

    if (!target || target->isEmpty()) {
        return std::unexpected(PipelineError{
            PipelineError::Code::ShapeMismatch,
            "Target grid (affine and shape) is required to align the mask"
        });
    }

    if (!needsResampling(mask.GetPointer(), *target)) {
        return mask;
    }

    try {
        const auto frame = target->toItkFrame();

        using TransformType = itk::IdentityTransform<double, 3>;
        using InterpolatorType =
            itk::NearestNeighborInterpolateImageFunction<MaskImageType, double>;
        using ResampleFilterType =
            itk::ResampleImageFilter<MaskImageType, MaskImageType>;

        auto resampleFilter = ResampleFilterType::New();
        resampleFilter->SetInput(mask);
        resampleFilter->SetSize(frame.size);
        resampleFilter->SetOutputSpacing(frame.spacing);
        resampleFilter->SetOutputOrigin(frame.origin);
        resampleFilter->SetOutputDirection(frame.direction);
        resampleFilter->SetTransform(TransformType::New());
        resampleFilter->SetInterpolator(InterpolatorType::New());
        resampleFilter->SetDefaultPixelValue(0);  // Outside the domain

        resampleFilter->Update();

        MaskImageType::Pointer aligned = resampleFilter->GetOutput();
        aligned->DisconnectPipeline();
        return aligned;
    }
    catch (const itk::ExceptionObject& e) {
        return std::unexpected(PipelineError{
            PipelineError::Code::ShapeMismatch,
            std::string("ITK exception: ") + e.GetDescription()
        });
    }
    catch (const std::exception& e) {
        return std::unexpected(PipelineError{
            PipelineError::Code::InternalError,
            std::string("Standard exception: ") + e.what()
        });
    }
}

}  // namespace ibis::services
