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

#pragma once

#include "core/pipeline_error.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ibis::services {

/**
 * @brief Aggregated intensities of one seed's buffer zone at one radius
 *
 * Only produced for buffer zones containing at least one voxel. The
 * statistics are std::nullopt in coordinate-only mode (no intensity field),
 * where voxelCount is still meaningful.
 */
struct BufferZoneRecord {
    /// Subject the seed belongs to
    std::string subjectId;

    /// Row position of the seed in its coordinate file
    int64_t seedId = 0;

    /// Seed position in world coordinates (mm)
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;

    /// Query radius (mm)
    double radiusMm = 0.0;

    /// Number of mask voxels within the radius
    int64_t voxelCount = 0;

    std::optional<double> meanValue;

    /// Population standard deviation (divides by N)
    std::optional<double> stdValue;

    std::optional<double> maxValue;
    std::optional<double> minValue;

    /// Output column names, in output order
    [[nodiscard]] static std::vector<std::string> getCsvHeader();

    /// Values formatted for output; missing statistics are empty fields
    [[nodiscard]] std::vector<std::string> getCsvRow() const;
};

/// Ordered concatenation of records: subject file, then radius, then seed
using ResultTable = std::vector<BufferZoneRecord>;

/**
 * @brief A coordinate file that could not be processed
 */
struct FileFailure {
    std::filesystem::path file;
    ibis::PipelineError error;
};

/// Shortest decimal text that reads back to the same double
[[nodiscard]] std::string formatNumber(double value);

/// Shortest decimal text that reads back to the same float
[[nodiscard]] std::string formatNumber(float value);

}  // namespace ibis::services
