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
 * @file mask_resampler.hpp
 * @brief Nearest-neighbour alignment of a mask onto an image grid
 * @details A mask may be stored on a different (often coarser) grid than
 *          the image it restricts. Before indexing, the mask is resampled
 *          onto the image grid with nearest-neighbour interpolation only:
 *          the mask is categorical, so every output voxel takes the value of
 *          the nearest source voxel and no fractional membership can appear.
 *
 * ## Thread Safety
 * resample() is const and may be called concurrently; input masks are
 * never modified.
 */

#pragma once

#include "core/grid_geometry.hpp"
#include "core/pipeline_error.hpp"
#include "core/volume_loader.hpp"

#include <expected>
#include <optional>

namespace ibis::services {

/**
 * @brief Mask resampler restricted to nearest-neighbour interpolation
 *
 * @example
 * @code
 * MaskResampler resampler;
 * auto target = core::GridGeometry::fromImage(image.GetPointer());
 * auto aligned = resampler.resample(mask, *target);
 * if (!aligned) {
 *     logger->error(aligned.error().toString());
 * }
 * @endcode
 */
class MaskResampler {
public:
    using MaskImageType = core::MaskImageType;

    /**
     * @brief Align @p mask with @p target
     *
     * Returns the input mask itself when its grid already equals the target
     * grid. Otherwise returns a new mask on the target grid; voxels outside
     * the source field are 0.
     *
     * @param mask Binary mask (0/1)
     * @param target Target grid; required whenever resampling is needed
     * @return Aligned mask, ShapeMismatch if the target is absent or empty,
     *         InvalidInput for a null mask
     */
    [[nodiscard]] std::expected<MaskImageType::Pointer, PipelineError>
    resample(MaskImageType::Pointer mask,
             const std::optional<core::GridGeometry>& target) const;

    /// True when @p mask is not already on @p target's grid
    [[nodiscard]] static bool needsResampling(const MaskImageType* mask,
                                              const core::GridGeometry& target);
};

}  // namespace ibis::services
