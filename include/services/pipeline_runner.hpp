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
 * @file pipeline_runner.hpp
 * @brief Runs the configured extraction steps over the input tree
 * @details Maps a PipelineConfig onto directories and drives the steps:
 *
 * | Step                | Reads                                   | Writes                                   |
 * |---------------------|-----------------------------------------|------------------------------------------|
 * | roi_extraction      | images/, masks/                         | roi/extracted_coordinates.csv            |
 * |                     | QNP_vox_coords/*.csv                    | roi/combined_coordinates.csv             |
 * | buffer_zone         | coordinates/, images/, masks/           | buffer_zone/buffer_zone_metrics.csv      |
 * | variable_extraction | 4_edt_m/ or EDT/ or edt/, Var/ or var/  | variables/edt/*.csv, variables/var/*.csv |
 * | consolidation       | buffer_zone/, variables/edt/, .../var/  | consolidated/*_consolidated_MFG_v1.csv   |
 *
 * Input paths are relative to `paths.input_dir`, output paths to
 * `paths.output_dir`. Steps always run in the order of the table.
 */

#pragma once

#include "core/pipeline_config.hpp"
#include "core/pipeline_error.hpp"
#include "services/buffer_zone/batch_orchestrator.hpp"

#include <cstddef>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/logger.h>

namespace ibis::services {

enum class PipelineStep {
    RoiExtraction,
    BufferZone,
    VariableExtraction,
    Consolidation
};

[[nodiscard]] std::string toString(PipelineStep step);
[[nodiscard]] std::optional<PipelineStep> parsePipelineStep(const std::string& name);

enum class StepStatus {
    Succeeded,
    SucceededWithFailures,  ///< Output written, some input files failed
    Failed                  ///< Fatal: no usable output
};

struct StepReport {
    PipelineStep step = PipelineStep::BufferZone;
    StepStatus status = StepStatus::Succeeded;
    size_t failedFiles = 0;
    std::string message;
};

struct RunReport {
    std::vector<StepReport> steps;

    /// 0 on success, 2 when any input file failed, 1 when any step failed
    [[nodiscard]] int exitCode() const noexcept;
};

class PipelineRunner {
public:
    explicit PipelineRunner(core::PipelineConfig config,
                            std::shared_ptr<spdlog::logger> logger = nullptr);

    [[nodiscard]] const core::PipelineConfig& config() const noexcept { return config_; }

    /// Create the input, output and log directories when missing
    [[nodiscard]] std::expected<void, PipelineError> prepareDirectories() const;

    /// Run @p steps in canonical order; an empty list runs every step
    [[nodiscard]] RunReport run(const std::vector<PipelineStep>& steps = {});

    [[nodiscard]] StepReport runRoiExtraction();
    [[nodiscard]] StepReport runBufferZone();
    [[nodiscard]] StepReport runVariableExtraction();
    [[nodiscard]] StepReport runConsolidation();

    [[nodiscard]] static std::vector<PipelineStep> allSteps();

    /**
     * @brief Parse step names, dropping duplicates and sorting canonically
     * @return ConfigurationError naming the first unknown step
     */
    [[nodiscard]] static std::expected<std::vector<PipelineStep>, PipelineError>
    parseSteps(const std::vector<std::string>& names);

    [[nodiscard]] std::filesystem::path bufferZoneOutputPath() const;
    [[nodiscard]] std::filesystem::path roiOutputPath() const;
    [[nodiscard]] std::filesystem::path combinedRoiOutputPath() const;
    [[nodiscard]] std::filesystem::path variablesOutputDir() const;
    [[nodiscard]] std::filesystem::path consolidatedOutputDir() const;

private:
    core::PipelineConfig config_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace ibis::services
