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
 * @file buffer_zone_aggregator.hpp
 * @brief Summary statistics over one seed's buffer zone
 * @details Turns the set of mask voxels matched by a radius query into a
 *          BufferZoneRecord: voxel count plus mean, population standard
 *          deviation, maximum and minimum of the intensities at those voxels.
 */

#pragma once

#include "core/seed_table.hpp"
#include "services/buffer_zone/buffer_zone_types.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace ibis::services {

class BufferZoneAggregator {
public:
    struct Options {
        /// Accepted for configuration compatibility; buffer zones of
        /// different seeds are always evaluated independently.
        bool allowOverlap = false;
    };

    BufferZoneAggregator() = default;
    explicit BufferZoneAggregator(Options options);

    [[nodiscard]] bool allowOverlap() const noexcept { return options_.allowOverlap; }

    /**
     * @brief Aggregate one buffer zone
     * @param seed Query seed
     * @param radiusMm Radius the match was computed with
     * @param matched Indices into the domain's active voxel list
     * @param intensities Intensity per active voxel, or nullptr in
     *        coordinate-only mode (statistics are then absent)
     * @return Record, or std::nullopt when nothing matched
     * @throws std::out_of_range if a matched index is outside @p intensities
     */
    [[nodiscard]] std::optional<BufferZoneRecord>
    aggregate(const core::Seed& seed, double radiusMm,
              const std::vector<size_t>& matched,
              const std::vector<float>* intensities) const;

private:
    Options options_;
};

}  // namespace ibis::services
