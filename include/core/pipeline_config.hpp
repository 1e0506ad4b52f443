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
 * @file pipeline_config.hpp
 * @brief Pipeline configuration loaded from JSON
 * @details Mirrors the sections of the pipeline configuration file:
 *          paths, logging, buffer_zone, roi_extraction, variable_extraction
 *          and consolidation. Values are validated once at load time so the
 *          extraction services can rely on them.
 */

#pragma once

#include "core/grid_geometry.hpp"
#include "core/logging.hpp"
#include "core/pipeline_error.hpp"

#include <array>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ibis::core {

struct PathSettings {
    std::filesystem::path inputDir;
    std::filesystem::path outputDir;
    std::filesystem::path logsDir;

    [[nodiscard]] std::filesystem::path coordinatesDir() const { return inputDir / "coordinates"; }
    [[nodiscard]] std::filesystem::path imagesDir() const { return inputDir / "images"; }
    [[nodiscard]] std::filesystem::path masksDir() const { return inputDir / "masks"; }
};

struct LoggingSettings {
    std::string level = "INFO";
    std::string file = "pipeline.log";
    bool console = true;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";

    /// Translate into the logger factory configuration
    [[nodiscard]] logging::LogConfig toLogConfig(const std::filesystem::path& logsDir) const;
};

struct BufferZoneSettings {
    /// Radius used when no sweep is configured (mm)
    double defaultRadius = 5.0;

    /// Reserved for a future mutual-exclusion policy; currently has no effect
    bool allowOverlap = false;

    /// Radii swept per subject, in output order (mm)
    std::vector<double> radiusOptions;

    std::string subjectIdPattern = "(\\d{4})";
    WorldConvention worldConvention = WorldConvention::RAS;

    /// Concurrent coordinate files; 0 = hardware concurrency
    unsigned int maxParallelJobs = 0;

    /// Threads used for the seed queries of one file
    unsigned int queryThreads = 1;
};

struct RoiExtractionSettings {
    std::array<std::string, 3> coordinateColumns{"X", "Y", "Z"};
    std::string intensityColumn = "Intensity";
    std::string subjectIdPattern = "(\\d{4})";
};

struct VariableExtractionSettings {
    bool edtEnabled = true;
    bool varEnabled = true;
};

/// What the all-covariates merge does with rows that have empty cells
enum class MissingValuePolicy {
    Drop,  ///< Remove the row
    Fill   ///< Replace every empty cell with the fill value
};

[[nodiscard]] std::optional<MissingValuePolicy> parseMissingValuePolicy(const std::string& name);

struct ConsolidationSettings {
    /// Keep only the first column of each name when tables are joined
    bool removeDuplicates = true;
    MissingValuePolicy handleMissing = MissingValuePolicy::Drop;
    double fillValue = 0.0;
};

struct PipelineConfig {
    std::string name = "IBIS";
    std::string version = "1.0";
    PathSettings paths;
    LoggingSettings logging;
    BufferZoneSettings bufferZone;
    RoiExtractionSettings roiExtraction;
    VariableExtractionSettings variableExtraction;
    ConsolidationSettings consolidation;

    /**
     * @brief Load and validate a configuration file
     * @return ConfigurationError when the file cannot be read, is not valid
     *         JSON, or violates a constraint
     */
    [[nodiscard]] static std::expected<PipelineConfig, PipelineError>
    load(const std::filesystem::path& path);

    /// Parse and validate configuration text
    [[nodiscard]] static std::expected<PipelineConfig, PipelineError>
    parse(const std::string& text);

    /// Check value constraints (radii, level names, required paths)
    [[nodiscard]] std::expected<void, PipelineError> validate() const;
};

}  // namespace ibis::core
