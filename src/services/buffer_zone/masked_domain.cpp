// BSD 3-Clause License
//
// Copyright (c) 2021-2025, 🍀☀🌕🌥 🌊
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice, this
//    list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
//    this list of conditions and the following disclaimer in the documentation
//    and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
//    contributors may be used to endorse or promote products derived from
//    this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
// FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
// DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
// SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
// CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
// OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

#include "services/buffer_zone/masked_domain.hpp"

#include <itkImageRegionConstIterator.h>
#include <itkImageRegionConstIteratorWithIndex.h>

namespace ibis::services {

DomainBuilder::DomainBuilder(core::WorldConvention convention)
    : convention_(convention) {}

std::expected<std::shared_ptr<const MaskedDomain>, PipelineError>
DomainBuilder::build(IntensityImageType::Pointer image, MaskImageType::Pointer mask) const {
    auto domain = collect(std::move(image), std::move(mask));
    if (!domain) {
        return std::unexpected(domain.error());
    }

    auto shared = std::make_shared<MaskedDomain>(std::move(domain.value()));
    shared->index = SpatialIndex::build(shared->worldPoints);
    return std::shared_ptr<const MaskedDomain>(std::move(shared));
}

std::expected<MaskedDomain, PipelineError>
DomainBuilder::collect(IntensityImageType::Pointer image, MaskImageType::Pointer mask) const {
    if (!image && !mask) {
        return std::unexpected(PipelineError{
            PipelineError::Code::ConfigurationError,
            "Neither an image nor a mask was provided"
        });
    }

    const itk::ImageBase<3>* gridSource = image
        ? static_cast<const itk::ImageBase<3>*>(image.GetPointer())
        : static_cast<const itk::ImageBase<3>*>(mask.GetPointer());

    auto geometry = core::GridGeometry::fromImage(gridSource, convention_);
    if (!geometry) {
        return std::unexpected(geometry.error());
    }

    MaskImageType::Pointer active;
    if (!mask) {
        active = core::VolumeLoader::binarize(image.GetPointer());
    } else if (image) {
        auto aligned = resampler_.resample(mask, geometry.value());
        if (!aligned) {
            return std::unexpected(aligned.error());
        }
        active = aligned.value();
    } else {
        active = mask;
    }

    MaskedDomain domain;
    domain.geometry = geometry.value();

    const auto region = active->GetLargestPossibleRegion();
    const auto start = region.GetIndex();
    const size_t activeCount = core::VolumeLoader::countActive(active.GetPointer());
    domain.voxels.reserve(activeCount);

    if (image) {
        domain.intensities.emplace();
        domain.intensities->reserve(activeCount);

        // The aligned mask and the image share size and buffer order
        itk::ImageRegionConstIteratorWithIndex<MaskImageType> maskIt(active, region);
        itk::ImageRegionConstIterator<IntensityImageType> imageIt(
            image, image->GetLargestPossibleRegion());
        for (maskIt.GoToBegin(), imageIt.GoToBegin(); !maskIt.IsAtEnd(); ++maskIt, ++imageIt) {
            if (maskIt.Get() == 0) {
                continue;
            }
            const auto idx = maskIt.GetIndex();
            domain.voxels.push_back({idx[0] - start[0], idx[1] - start[1], idx[2] - start[2]});
            domain.intensities->push_back(imageIt.Get());
        }
    } else {
        itk::ImageRegionConstIteratorWithIndex<MaskImageType> maskIt(active, region);
        for (maskIt.GoToBegin(); !maskIt.IsAtEnd(); ++maskIt) {
            if (maskIt.Get() == 0) {
                continue;
            }
            const auto idx = maskIt.GetIndex();
            domain.voxels.push_back({idx[0] - start[0], idx[1] - start[1], idx[2] - start[2]});
        }
    }

    domain.worldPoints = domain.geometry.toWorld(domain.voxels);
    return domain;
}

}  // namespace ibis::services
