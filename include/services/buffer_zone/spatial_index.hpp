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
 * @file spatial_index.hpp
 * @brief Radius search over the world coordinates of mask voxels
 * @details Wraps a VTK static point locator built once over a fixed point
 *          set. Distances are Euclidean in millimetres; a point belongs to a
 *          query's result when its distance to the seed is <= radius.
 *
 * ## Thread Safety
 * The index is immutable after build(). query() may be called from any
 * number of threads at once.
 */

#pragma once

#include "core/coordinate_types.hpp"

#include <cstddef>
#include <memory>
#include <vector>

#include <vtkSmartPointer.h>

class vtkPolyData;
class vtkStaticPointLocator;

namespace ibis::services {

class SpatialIndex {
    struct PrivateTag {};

public:
    /// Point indices (positions in the build() input) within a radius, ascending
    using Neighborhood = std::vector<size_t>;

    /// Use build(); the tag keeps construction inside the class
    explicit SpatialIndex(PrivateTag) {}
    ~SpatialIndex();

    SpatialIndex(const SpatialIndex&) = delete;
    SpatialIndex& operator=(const SpatialIndex&) = delete;

    /**
     * @brief Build the index over @p points
     *
     * An empty point set is valid: every query on it returns nothing.
     */
    [[nodiscard]] static std::shared_ptr<const SpatialIndex>
    build(const std::vector<core::WorldCoordinate>& points);

    [[nodiscard]] size_t size() const noexcept { return pointCount_; }
    [[nodiscard]] bool empty() const noexcept { return pointCount_ == 0; }

    /**
     * @brief Indices of all points within @p radiusMm of @p seed
     *
     * Returns an empty neighbourhood for a non-positive or non-finite radius.
     */
    [[nodiscard]] Neighborhood query(const core::WorldCoordinate& seed, double radiusMm) const;

    /**
     * @brief Answer one radius query per seed
     * @param seeds Query points; duplicates are answered independently
     * @param radiusMm Search radius in mm
     * @param threads Number of concurrent tasks the seeds are split across
     * @return One neighbourhood per seed, in seed order
     */
    [[nodiscard]] std::vector<Neighborhood>
    query(const std::vector<core::WorldCoordinate>& seeds, double radiusMm,
          unsigned int threads = 1) const;

private:
    size_t pointCount_ = 0;
    vtkSmartPointer<vtkPolyData> dataSet_;
    vtkSmartPointer<vtkStaticPointLocator> locator_;
};

}  // namespace ibis::services
