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

/**
 * @file masked_domain.hpp
 * @brief Active voxels of an image/mask pair, ready for radius queries
 * @details A MaskedDomain is built once per distinct (image, mask) pair and
 *          then only read. It holds the active voxels in ITK buffer order,
 *          their world coordinates, the intensities at those voxels (absent in
 *          coordinate-only mode) and the spatial index over the coordinates.
 *
 * ## Domain rules
 * | Image | Mask | Grid          | Active voxels                | Intensities |
 * |-------|------|---------------|------------------------------|-------------|
 * | yes   | yes  | image         | mask resampled onto image    | yes         |
 * | yes   | no   | image         | nonzero image voxels         | yes         |
 * | no    | yes  | mask          | mask voxels                  | no          |
 */

#pragma once

#include "core/coordinate_types.hpp"
#include "core/grid_geometry.hpp"
#include "core/pipeline_error.hpp"
#include "core/volume_loader.hpp"
#include "services/buffer_zone/mask_resampler.hpp"
#include "services/buffer_zone/spatial_index.hpp"

#include <expected>
#include <memory>
#include <optional>
#include <vector>

namespace ibis::services {

struct MaskedDomain {
    core::GridGeometry geometry;

    /// Active voxels in ITK buffer order (x fastest)
    std::vector<core::VoxelIndex> voxels;

    /// World coordinates of voxels, same order
    std::vector<core::WorldCoordinate> worldPoints;

    /// Intensity per active voxel; std::nullopt in coordinate-only mode
    std::optional<std::vector<float>> intensities;

    std::shared_ptr<const SpatialIndex> index;

    [[nodiscard]] size_t activeCount() const noexcept { return voxels.size(); }
    [[nodiscard]] bool hasIntensities() const noexcept { return intensities.has_value(); }
};

class DomainBuilder {
public:
    using IntensityImageType = core::IntensityImageType;
    using MaskImageType = core::MaskImageType;

    explicit DomainBuilder(core::WorldConvention convention = core::WorldConvention::RAS);

    /**
     * @brief Build a domain from an image, a mask, or both
     * @param image Intensity volume, may be null (coordinate-only mode)
     * @param mask Binary mask, may be null (image nonzero voxels are used)
     * @return Domain, ConfigurationError when both are null or the grid
     *         affine is invalid, ShapeMismatch when resampling fails
     */
    [[nodiscard]] std::expected<std::shared_ptr<const MaskedDomain>, PipelineError>
    build(IntensityImageType::Pointer image, MaskImageType::Pointer mask) const;

    /**
     * @brief Same as build() without the spatial index
     *
     * Used where only the active voxel listing is needed.
     */
    [[nodiscard]] std::expected<MaskedDomain, PipelineError>
    collect(IntensityImageType::Pointer image, MaskImageType::Pointer mask) const;

private:
    core::WorldConvention convention_;
    MaskResampler resampler_;
};

}  // namespace ibis::services
