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
 * @file grid_geometry.hpp
 * @brief Voxel grid shape and voxel-to-world affine of a volume
 * @details The affine maps voxel indices (i, j, k, 1) to world millimetres
 *          (x, y, z, 1). ITK stores geometry as origin/spacing/direction in
 *          LPS physical space; GridGeometry converts between that
 *          representation and a 4x4 affine in the configured world
 *          convention (RAS by default, matching NIfTI/scanner coordinates).
 *
 * ## Thread Safety
 * GridGeometry is an immutable value type; all member functions are const.
 */

#pragma once

#include "core/coordinate_types.hpp"
#include "core/pipeline_error.hpp"

#include <array>
#include <cstddef>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <itkImageBase.h>

namespace ibis::core {

/// Row-major 4x4 affine, voxel index -> world mm
using Affine = std::array<std::array<double, 4>, 4>;

/// Voxel grid dimensions (nx, ny, nz)
using GridShape = std::array<size_t, 3>;

/**
 * @brief Orientation convention of world coordinates
 */
enum class WorldConvention {
    RAS,  ///< +x right, +y anterior (NIfTI, nibabel, scanner mm)
    LPS   ///< +x left, +y posterior (ITK, DICOM patient space)
};

[[nodiscard]] std::string toString(WorldConvention convention);
[[nodiscard]] std::optional<WorldConvention> parseWorldConvention(const std::string& name);

[[nodiscard]] Affine identityAffine() noexcept;

/**
 * @brief Build an affine from 16 row-major values
 * @return ConfigurationError unless there are 16 finite values and the last
 *         row is (0, 0, 0, 1)
 */
[[nodiscard]] std::expected<Affine, PipelineError>
affineFromValues(std::span<const double> values);

/**
 * @brief Invert a voxel-to-world affine
 * @return ConfigurationError if the 3x3 linear part is singular
 */
[[nodiscard]] std::expected<Affine, PipelineError> invertAffine(const Affine& affine);

/// Map one voxel index to world millimetres
[[nodiscard]] WorldCoordinate toWorld(const VoxelIndex& index, const Affine& affine) noexcept;

/// Map a batch of voxel indices to world millimetres
[[nodiscard]] std::vector<WorldCoordinate>
toWorld(const std::vector<VoxelIndex>& indices, const Affine& affine);

/**
 * @brief Shape plus affine of one voxel grid
 */
class GridGeometry {
public:
    /// ITK representation of the grid (physical space is always LPS)
    struct ItkFrame {
        itk::ImageBase<3>::PointType origin;
        itk::ImageBase<3>::SpacingType spacing;
        itk::ImageBase<3>::DirectionType direction;
        itk::ImageBase<3>::SizeType size;
    };

    GridGeometry() = default;

    /**
     * @brief Validate and build a geometry
     * @return ConfigurationError for an empty shape or a non-invertible affine
     */
    [[nodiscard]] static std::expected<GridGeometry, PipelineError>
    create(const GridShape& shape, const Affine& affine,
           WorldConvention convention = WorldConvention::RAS);

    /// Derive the geometry of an ITK image in the given world convention
    [[nodiscard]] static std::expected<GridGeometry, PipelineError>
    fromImage(const itk::ImageBase<3>* image,
              WorldConvention convention = WorldConvention::RAS);

    [[nodiscard]] const GridShape& shape() const noexcept { return shape_; }
    [[nodiscard]] const Affine& affine() const noexcept { return affine_; }
    [[nodiscard]] WorldConvention convention() const noexcept { return convention_; }
    [[nodiscard]] size_t voxelCount() const noexcept {
        return shape_[0] * shape_[1] * shape_[2];
    }
    [[nodiscard]] bool isEmpty() const noexcept { return voxelCount() == 0; }

    /// Voxel spacing in mm (column norms of the linear part)
    [[nodiscard]] std::array<double, 3> spacing() const noexcept;

    [[nodiscard]] WorldCoordinate toWorld(const VoxelIndex& index) const noexcept;
    [[nodiscard]] std::vector<WorldCoordinate> toWorld(const std::vector<VoxelIndex>& indices) const;

    /// Continuous voxel index of a world point
    [[nodiscard]] std::array<double, 3> toContinuousIndex(const WorldCoordinate& point) const noexcept;

    /// Nearest voxel index of a world point (may lie outside the grid)
    [[nodiscard]] VoxelIndex toNearestVoxel(const WorldCoordinate& point) const noexcept;

    /**
     * @brief Check whether two geometries describe the same voxel grid
     * @param tolerance Absolute tolerance on every affine element
     */
    [[nodiscard]] bool sameGrid(const GridGeometry& other, double tolerance = 1e-4) const noexcept;

    /// Origin/spacing/direction/size as ITK expects them for resampling
    [[nodiscard]] ItkFrame toItkFrame() const;

private:
    GridShape shape_{0, 0, 0};
    Affine affine_ = identityAffine();
    Affine inverse_ = identityAffine();
    WorldConvention convention_ = WorldConvention::RAS;
};

}  // namespace ibis::core
