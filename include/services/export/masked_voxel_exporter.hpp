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
 * @file masked_voxel_exporter.hpp
 * @brief Tabular export of every active mask voxel with its value
 * @details Produces the voxel-level tables of the ROI and variable extraction
 *          steps. A row is `X, Y, Z, value` where X, Y, Z are voxel indices on
 *          the image grid; the mask is resampled onto that grid first when
 *          the two grids differ.
 *
 * Output layout:
 * @code
 * output_dir/
 * ├── roi/extracted_coordinates.csv          // X,Y,Z,Intensity,sub.id
 * ├── roi/combined_coordinates.csv           // same columns, from QNP_vox_coords/*.csv
 * └── variables/
 *     ├── edt/v1_edt_<name>_<roi>.csv        // X,Y,Z,Value
 *     └── var/var_<name>_<roi>.csv           // X,Y,Z,Value
 * @endcode
 */

#pragma once

#include "core/grid_geometry.hpp"
#include "core/pipeline_config.hpp"
#include "core/pipeline_error.hpp"
#include "services/buffer_zone/buffer_zone_types.hpp"
#include "services/buffer_zone/masked_domain.hpp"
#include "services/export/result_table_writer.hpp"

#include <expected>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/logger.h>

namespace ibis::services {

class MaskedVoxelExporter {
public:
    using Row = ResultTableWriter::Row;

    explicit MaskedVoxelExporter(core::WorldConvention convention = core::WorldConvention::RAS,
                                 std::shared_ptr<spdlog::logger> logger = nullptr);

    /**
     * @brief Rows `i, j, k, value` for every active voxel of @p domain
     * @param extraColumns Appended to every row (e.g. the subject id)
     */
    [[nodiscard]] static std::vector<Row> voxelRows(const MaskedDomain& domain,
                                                    const Row& extraColumns = {});

    /**
     * @brief Load an image and a mask and list the masked voxels
     * @return Domain without spatial index, or the load/resample error
     */
    [[nodiscard]] std::expected<MaskedDomain, PipelineError>
    loadMasked(const std::filesystem::path& imagePath,
               const std::filesystem::path& maskPath) const;

    /**
     * @brief ROI extraction over every subject image
     *
     * Each image with a subject id in its name is masked with the first mask
     * in @p masksDir; all rows go to one table at @p outputFile. Nothing is
     * written when there are no images, no masks or no rows.
     *
     * @return Summary, or OutputFailed when the table cannot be written
     */
    [[nodiscard]] std::expected<ExportSummary, PipelineError>
    extractRoi(const std::filesystem::path& imagesDir,
               const std::filesystem::path& masksDir,
               const std::filesystem::path& outputFile,
               const core::RoiExtractionSettings& settings) const;

    /**
     * @brief Combine precomputed voxel tables into one ROI table
     *
     * Reads every CSV in `inputDir/QNP_vox_coords` whose name carries a
     * subject id. A file with an `Intensity` column but no configured
     * intensity column has it renamed. Rows keep the coordinate and
     * intensity columns plus `sub.id`; repeated rows are written once.
     * A file without those columns is recorded as InputFormatError.
     * Nothing is written when the directory is absent or no rows remain.
     *
     * @return Summary, or OutputFailed when the table cannot be written
     */
    [[nodiscard]] std::expected<ExportSummary, PipelineError>
    combineRoiTables(const std::filesystem::path& inputDir,
                     const std::filesystem::path& outputFile,
                     const core::RoiExtractionSettings& settings) const;

    /**
     * @brief EDT and variance extraction
     *
     * EDT maps are the `*_masked.nii.gz` files of the first existing
     * directory among `4_edt_m`, `EDT`, `edt` under @p inputDir; variance maps
     * are the NIfTI files of the first existing directory among `Var`, `var`,
     * `variables`. Both are masked with the first mask in @p masksDir.
     *
     * @return Summary, or OutputFailed when a table cannot be written
     */
    [[nodiscard]] std::expected<ExportSummary, PipelineError>
    extractVariables(const std::filesystem::path& inputDir,
                     const std::filesystem::path& masksDir,
                     const std::filesystem::path& outputDir,
                     const core::VariableExtractionSettings& settings) const;

    /// ROI label of a mask: first `_`-separated token of its file name
    [[nodiscard]] static std::string roiName(const std::filesystem::path& maskPath);

private:
    [[nodiscard]] std::expected<void, PipelineError>
    exportVariableSet(const std::vector<std::filesystem::path>& files,
                      const std::filesystem::path& maskPath,
                      const std::filesystem::path& outputDir,
                      const std::string& prefix, const std::string& suffix,
                      ExportSummary& summary) const;

    core::WorldConvention convention_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace ibis::services
