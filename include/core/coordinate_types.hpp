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
 * @file coordinate_types.hpp
 * @brief Value types for physical and voxel-grid positions
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace ibis::core {

/**
 * @brief 3D world coordinates (in mm, physical space)
 */
struct WorldCoordinate {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;

    WorldCoordinate() = default;
    WorldCoordinate(double px, double py, double pz) : x(px), y(py), z(pz) {}

    [[nodiscard]] double distanceSquaredTo(const WorldCoordinate& other) const noexcept {
        const double dx = x - other.x;
        const double dy = y - other.y;
        const double dz = z - other.z;
        return dx * dx + dy * dy + dz * dz;
    }

    [[nodiscard]] bool operator==(const WorldCoordinate& other) const noexcept {
        return x == other.x && y == other.y && z == other.z;
    }
};

/**
 * @brief 3D voxel indices (integer indices into image volume)
 */
struct VoxelIndex {
    int64_t i = 0;
    int64_t j = 0;
    int64_t k = 0;

    VoxelIndex() = default;
    VoxelIndex(int64_t pi, int64_t pj, int64_t pk) : i(pi), j(pj), k(pk) {}

    [[nodiscard]] bool isValid(const std::array<size_t, 3>& shape) const noexcept {
        return i >= 0 && static_cast<size_t>(i) < shape[0] &&
               j >= 0 && static_cast<size_t>(j) < shape[1] &&
               k >= 0 && static_cast<size_t>(k) < shape[2];
    }

    [[nodiscard]] bool operator==(const VoxelIndex& other) const noexcept {
        return i == other.i && j == other.j && k == other.k;
    }
};

}  // namespace ibis::core
