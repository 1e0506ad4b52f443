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
 * @file volume_loader.hpp
 * @brief NIfTI volume and mask loading through ITK
 * @details Reads 3-D volumes directly and 4-D volumes by extracting the
 *          first time point. Masks are binarized on load: every nonzero,
 *          non-NaN voxel becomes 1.
 *
 * ## Thread Safety
 * Loading distinct files from different threads is safe; the loader holds
 * no mutable state.
 */

#pragma once

#include "core/pipeline_error.hpp"

#include <expected>
#include <filesystem>

#include <itkImage.h>
#include <itkSmartPointer.h>

namespace ibis::core {

/// Scalar intensity field
using IntensityImageType = itk::Image<float, 3>;

/// Binary domain (0 = outside, 1 = inside)
using MaskImageType = itk::Image<unsigned char, 3>;

class VolumeLoader {
public:
    /**
     * @brief Load a scalar volume
     * @return VolumeReadFailed when the file is missing, unreadable, or not
     *         3-D/4-D
     */
    [[nodiscard]] std::expected<IntensityImageType::Pointer, PipelineError>
    loadImage(const std::filesystem::path& path) const;

    /**
     * @brief Load a mask volume and binarize it (nonzero is inside)
     */
    [[nodiscard]] std::expected<MaskImageType::Pointer, PipelineError>
    loadMask(const std::filesystem::path& path) const;

    /// Binarize a scalar volume on its own grid
    [[nodiscard]] static MaskImageType::Pointer binarize(const IntensityImageType* image);

    /// Number of active voxels in a binary mask
    [[nodiscard]] static size_t countActive(const MaskImageType* mask);
};

}  // namespace ibis::core
