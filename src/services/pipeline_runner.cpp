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

#include "services/pipeline_runner.hpp"

#include "core/logging.hpp"
#include "services/export/covariate_consolidator.hpp"
#include "services/export/masked_voxel_exporter.hpp"
#include "services/export/result_table_writer.hpp"

#include <algorithm>
#include <chrono>
#include <exception>

namespace ibis::services {

namespace {

StepStatus statusFor(size_t failedFiles) {
    return failedFiles > 0 ? StepStatus::SucceededWithFailures : StepStatus::Succeeded;
}

}  // namespace

std::string toString(PipelineStep step) {
    switch (step) {
        case PipelineStep::RoiExtraction: return "roi_extraction";
        case PipelineStep::BufferZone: return "buffer_zone";
        case PipelineStep::VariableExtraction: return "variable_extraction";
        case PipelineStep::Consolidation: return "consolidation";
    }
    return "unknown";
}

std::optional<PipelineStep> parsePipelineStep(const std::string& name) {
    for (auto step : PipelineRunner::allSteps()) {
        if (toString(step) == name) {
            return step;
        }
    }
    return std::nullopt;
}

int RunReport::exitCode() const noexcept {
    bool anyFailures = false;
    for (const auto& report : steps) {
        if (report.status == StepStatus::Failed) {
            return 1;
        }
        anyFailures = anyFailures || report.status == StepStatus::SucceededWithFailures;
    }
    return anyFailures ? 2 : 0;
}

PipelineRunner::PipelineRunner(core::PipelineConfig config, std::shared_ptr<spdlog::logger> logger)
    : config_(std::move(config))
    , logger_(logger ? std::move(logger) : logging::LoggerFactory::create("Pipeline")) {}

std::vector<PipelineStep> PipelineRunner::allSteps() {
    return {PipelineStep::RoiExtraction, PipelineStep::BufferZone,
            PipelineStep::VariableExtraction, PipelineStep::Consolidation};
}

std::expected<std::vector<PipelineStep>, PipelineError>
PipelineRunner::parseSteps(const std::vector<std::string>& names) {
    std::vector<PipelineStep> steps;
    for (const auto& name : names) {
        auto step = parsePipelineStep(name);
        if (!step) {
            return std::unexpected(PipelineError{
                PipelineError::Code::ConfigurationError,
                "Invalid step: " + name
            });
        }
        steps.push_back(*step);
    }
    std::sort(steps.begin(), steps.end());
    steps.erase(std::unique(steps.begin(), steps.end()), steps.end());
    return steps;
}

std::filesystem::path PipelineRunner::bufferZoneOutputPath() const {
    return config_.paths.outputDir / "buffer_zone" / "buffer_zone_metrics.csv";
}

std::filesystem::path PipelineRunner::roiOutputPath() const {
    return config_.paths.outputDir / "roi" / "extracted_coordinates.csv";
}

std::filesystem::path PipelineRunner::combinedRoiOutputPath() const {
    return config_.paths.outputDir / "roi" / "combined_coordinates.csv";
}

std::filesystem::path PipelineRunner::variablesOutputDir() const {
    return config_.paths.outputDir / "variables";
}

std::filesystem::path PipelineRunner::consolidatedOutputDir() const {
    return config_.paths.outputDir / "consolidated";
}

std::expected<void, PipelineError> PipelineRunner::prepareDirectories() const {
    for (const auto& dir : {config_.paths.inputDir, config_.paths.outputDir, config_.paths.logsDir}) {
        std::error_code ec;
        if (std::filesystem::exists(dir, ec)) {
            continue;
        }
        logger_->warn("Creating {}", dir.string());
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            return std::unexpected(PipelineError{
                PipelineError::Code::OutputFailed,
                "Cannot create directory " + dir.string() + ": " + ec.message()
            });
        }
    }
    return {};
}

RunReport PipelineRunner::run(const std::vector<PipelineStep>& steps) {
    auto selected = steps.empty() ? allSteps() : steps;
    std::sort(selected.begin(), selected.end());
    selected.erase(std::unique(selected.begin(), selected.end()), selected.end());

    const auto start = std::chrono::steady_clock::now();
    logger_->info("Starting {} {}", config_.name, config_.version);

    RunReport report;
    for (auto step : selected) {
        logger_->info("Step {} started", toString(step));
        logging::logMemoryUsage(logger_, toString(step) + " start");

        StepReport stepReport;
        try {
            switch (step) {
                case PipelineStep::RoiExtraction: stepReport = runRoiExtraction(); break;
                case PipelineStep::BufferZone: stepReport = runBufferZone(); break;
                case PipelineStep::VariableExtraction: stepReport = runVariableExtraction(); break;
                case PipelineStep::Consolidation: stepReport = runConsolidation(); break;
            }
        } catch (const std::exception& e) {
            stepReport = StepReport{step, StepStatus::Failed, 0, e.what()};
        }

        logging::logMemoryUsage(logger_, toString(step) + " end");
        if (stepReport.status == StepStatus::Failed) {
            logger_->error("Step {} failed: {}", toString(step), stepReport.message);
        } else {
            logger_->info("Step {} finished ({} failed files)", toString(step), stepReport.failedFiles);
        }
        report.steps.push_back(std::move(stepReport));
    }

    const auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start);
    const auto succeeded = std::count_if(report.steps.begin(), report.steps.end(),
        [](const StepReport& r) { return r.status != StepStatus::Failed; });
    logger_->info("Completed {}/{} steps in {:.2f} s", succeeded, report.steps.size(), elapsed.count());
    return report;
}

StepReport PipelineRunner::runRoiExtraction() {
    MaskedVoxelExporter exporter(config_.bufferZone.worldConvention, logger_);
    auto summary = exporter.extractRoi(config_.paths.imagesDir(), config_.paths.masksDir(),
                                       roiOutputPath(), config_.roiExtraction);
    if (!summary) {
        return {PipelineStep::RoiExtraction, StepStatus::Failed, 0, summary.error().toString()};
    }
    auto combined = exporter.combineRoiTables(config_.paths.inputDir, combinedRoiOutputPath(),
                                              config_.roiExtraction);
    if (!combined) {
        return {PipelineStep::RoiExtraction, StepStatus::Failed, summary->failures.size(),
                combined.error().toString()};
    }
    const size_t failed = summary->failures.size() + combined->failures.size();
    return {PipelineStep::RoiExtraction, statusFor(failed), failed,
            std::to_string(summary->rowsWritten + combined->rowsWritten) + " rows"};
}

StepReport PipelineRunner::runBufferZone() {
    const auto& settings = config_.bufferZone;

    BatchOptions options;
    options.radii = settings.radiusOptions.empty()
        ? std::vector<double>{settings.defaultRadius}
        : settings.radiusOptions;
    options.allowOverlap = settings.allowOverlap;
    options.maxParallelJobs = settings.maxParallelJobs;
    options.queryThreads = settings.queryThreads;
    options.convention = settings.worldConvention;

    auto plan = BatchOrchestrator::planJobs(config_.paths.coordinatesDir(),
                                            config_.paths.imagesDir(),
                                            config_.paths.masksDir(),
                                            settings.subjectIdPattern);
    if (plan.jobs.empty() && plan.skipped.empty()) {
        logger_->warn("No coordinate files in {}", config_.paths.coordinatesDir().string());
    }

    BatchOrchestrator orchestrator(options, logger_);
    auto outcome = orchestrator.run(plan);
    const size_t failed = outcome.failures.size();

    if (outcome.status == BatchStatus::NoOutput) {
        logger_->warn("Buffer zone analysis produced no records; nothing written");
        return {PipelineStep::BufferZone, statusFor(failed), failed, "no output"};
    }

    ResultTableWriter writer;
    auto written = writer.write(outcome.table, bufferZoneOutputPath());
    if (!written) {
        return {PipelineStep::BufferZone, StepStatus::Failed, failed, written.error().toString()};
    }

    logger_->info("Wrote {} records to {}", outcome.table.size(), bufferZoneOutputPath().string());
    return {PipelineStep::BufferZone, statusFor(failed), failed,
            std::to_string(outcome.table.size()) + " records"};
}

StepReport PipelineRunner::runVariableExtraction() {
    MaskedVoxelExporter exporter(config_.bufferZone.worldConvention, logger_);
    auto summary = exporter.extractVariables(config_.paths.inputDir, config_.paths.masksDir(),
                                             variablesOutputDir(), config_.variableExtraction);
    if (!summary) {
        return {PipelineStep::VariableExtraction, StepStatus::Failed, 0, summary.error().toString()};
    }
    const size_t failed = summary->failures.size();
    return {PipelineStep::VariableExtraction, statusFor(failed), failed,
            std::to_string(summary->filesWritten) + " files"};
}

StepReport PipelineRunner::runConsolidation() {
    CovariateConsolidator consolidator(config_.consolidation, logger_);
    auto summary = consolidator.run(config_.paths.inputDir, config_.paths.outputDir);
    if (!summary) {
        return {PipelineStep::Consolidation, StepStatus::Failed, 0, summary.error().toString()};
    }
    const size_t failed = summary->failures.size();
    return {PipelineStep::Consolidation, statusFor(failed), failed,
            std::to_string(summary->filesWritten) + " files"};
}

}  // namespace ibis::services
