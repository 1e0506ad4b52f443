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
 * @file covariate_consolidator.hpp
 * @brief Joins per-file covariate tables into one table per source
 * @details Every CSV with `X,Y,Z` (or `x,y,z`) coordinate columns becomes
 *          three index columns `i,j,k` plus one covariate column named
 *          after the file. Tables are joined side by side by row position;
 *          a shorter table leaves empty cells.
 *
 * Layout:
 * @code
 * output_dir/consolidated/
 * ├── bz_consolidated_MFG_v1.csv       // from buffer_zone/
 * ├── edt_consolidated_MFG_v1.csv      // from variables/edt/, "v1_edt_" dropped
 * ├── var_consolidated_MFG_v1.csv      // from variables/var/
 * └── Cov_all_consolidated_MFG_v1.csv  // the three above joined
 * @endcode
 *
 * Each source directory is looked up under the output directory first and
 * under the input directory second. Only CSV files inside its immediate
 * subfolders are read, in path order; files at its top level (such as
 * buffer_zone_metrics.csv) are left alone.
 */

#pragma once

#include "core/pipeline_config.hpp"
#include "core/pipeline_error.hpp"
#include "core/seed_table.hpp"
#include "services/export/result_table_writer.hpp"

#include <expected>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/logger.h>

namespace ibis::services {

class CovariateConsolidator {
public:
    static constexpr const char* kBufferZoneFile = "bz_consolidated_MFG_v1.csv";
    static constexpr const char* kEdtFile = "edt_consolidated_MFG_v1.csv";
    static constexpr const char* kVarFile = "var_consolidated_MFG_v1.csv";
    static constexpr const char* kAllFile = "Cov_all_consolidated_MFG_v1.csv";

    explicit CovariateConsolidator(core::ConsolidationSettings settings = {},
                                   std::shared_ptr<spdlog::logger> logger = nullptr);

    /**
     * @brief Consolidate every source and merge the results
     * @param inputDir Fallback root for the source directories
     * @param outputDir Preferred root; results go to `outputDir/consolidated`
     * @return Summary, or OutputFailed when a table cannot be written
     */
    [[nodiscard]] std::expected<ExportSummary, PipelineError>
    run(const std::filesystem::path& inputDir, const std::filesystem::path& outputDir) const;

    /**
     * @brief Join the covariate CSVs under @p baseDir into @p outputFile
     * @param prefix Removed from the start of each covariate label
     * @return true when a table was written, false when nothing was usable
     */
    [[nodiscard]] std::expected<bool, PipelineError>
    consolidateDirectory(const std::filesystem::path& baseDir,
                         const std::filesystem::path& outputFile,
                         const std::string& prefix, ExportSummary& summary) const;

    /**
     * @brief Join the per-source tables present in @p consolidatedDir
     *
     * The configured missing-value policy applies to the joined table.
     */
    [[nodiscard]] std::expected<bool, PipelineError>
    mergeAll(const std::filesystem::path& consolidatedDir, ExportSummary& summary) const;

    /**
     * @brief Reduce one CSV to `i, j, k, <label>`
     *
     * Coordinates are truncated to 16-bit integers. The covariate is the
     * last column, rounded to three decimals in single precision; empty
     * cells stay empty.
     *
     * @return InputFormatError when coordinate columns are missing or a
     *         cell cannot be parsed
     */
    [[nodiscard]] static std::expected<core::CsvTable, PipelineError>
    loadCovariate(const core::CsvTable& csv, const std::string& label,
                  const std::string& sourceName = "<memory>");

    /// True when @p csv has `X,Y,Z` or `x,y,z` columns
    [[nodiscard]] static bool hasCoordinateColumns(const core::CsvTable& csv);

    /// Join tables side by side, padding short ones with empty cells
    [[nodiscard]] core::CsvTable
    concatenateColumns(const std::vector<core::CsvTable>& tables) const;

    /// Drop or fill rows with empty cells according to the settings
    void applyMissingPolicy(core::CsvTable& table) const;

private:
    [[nodiscard]] std::vector<std::filesystem::path>
    collectCsvFiles(const std::filesystem::path& baseDir) const;

    core::ConsolidationSettings settings_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace ibis::services
