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
 * @file batch_orchestrator.hpp
 * @brief Buffer-zone extraction over many seed files and radii
 * @details Runs one job per coordinate file. Each job reads its seeds, takes
 *          its MaskedDomain from the shared IndexCache, then queries and
 *          aggregates every configured radius. Jobs run concurrently up to a
 *          configured limit; results are concatenated in job order, then
 *          radius order, then seed order, so output never depends on
 *          scheduling.
 *
 * A failing file is logged with its name and recorded as a FileFailure; the
 * remaining files are unaffected.
 *
 * ## Thread Safety
 * run() must not be called concurrently on the same instance.
 */

#pragma once

#include "core/grid_geometry.hpp"
#include "core/pipeline_error.hpp"
#include "core/seed_table.hpp"
#include "services/buffer_zone/buffer_zone_types.hpp"
#include "services/buffer_zone/index_cache.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/logger.h>

namespace ibis::services {

struct BatchJob {
    std::filesystem::path coordinatesFile;
    std::string subjectId;
    std::optional<std::filesystem::path> imagePath;
    std::optional<std::filesystem::path> maskPath;

    [[nodiscard]] DomainKey domainKey() const { return DomainKey{imagePath, maskPath}; }
};

/// Jobs found in the input directories plus the files that could not be planned
struct JobPlan {
    std::vector<BatchJob> jobs;
    std::vector<FileFailure> skipped;
};

struct BatchOptions {
    /// Radii evaluated for every seed, in output order
    std::vector<double> radii{5.0};

    /// Forwarded to the aggregator; currently has no effect
    bool allowOverlap = false;

    /// Concurrent jobs (0 = hardware concurrency)
    unsigned int maxParallelJobs = 0;

    /// Concurrent seed queries inside one job
    unsigned int queryThreads = 1;

    core::WorldConvention convention = core::WorldConvention::RAS;

    core::SeedTableReader::Columns columns;
};

enum class BatchStatus {
    Completed,              ///< Records produced, no failed file
    CompletedWithFailures,  ///< Records produced, at least one failed file
    NoOutput                ///< No record at all
};

[[nodiscard]] std::string toString(BatchStatus status);

struct BatchOutcome {
    ResultTable table;
    std::vector<FileFailure> failures;
    size_t filesProcessed = 0;
    BatchStatus status = BatchStatus::NoOutput;
};

class BatchOrchestrator {
public:
    /// Produces the domain for a key; called at most once per key per run
    using DomainProvider = IndexCache::Builder;

    explicit BatchOrchestrator(BatchOptions options,
                               std::shared_ptr<spdlog::logger> logger = nullptr);
    ~BatchOrchestrator();

    // Non-copyable, movable
    BatchOrchestrator(const BatchOrchestrator&) = delete;
    BatchOrchestrator& operator=(const BatchOrchestrator&) = delete;
    BatchOrchestrator(BatchOrchestrator&&) noexcept;
    BatchOrchestrator& operator=(BatchOrchestrator&&) noexcept;

    /// Replace the default file-based provider (tests use in-memory domains)
    void setDomainProvider(DomainProvider provider);

    [[nodiscard]] const BatchOptions& options() const noexcept;

    /// Cache shared by all jobs of this orchestrator
    [[nodiscard]] const IndexCache& cache() const noexcept;

    /**
     * @brief Run all jobs
     * @return Ordered result table, per-file failures and the batch status
     */
    [[nodiscard]] BatchOutcome run(const std::vector<BatchJob>& jobs);

    /// Run a plan; its skipped files are reported as failures
    [[nodiscard]] BatchOutcome run(const JobPlan& plan);

    /**
     * @brief Pair every coordinate file with its subject's image and mask
     *
     * Coordinate files are `*.csv` in @p coordinatesDir, images and masks are
     * `*.nii` / `*.nii.gz`, all taken in name order. The image for a subject
     * is the first whose name contains the subject id, else the first image;
     * masks follow the same rule and may be absent.
     */
    [[nodiscard]] static JobPlan planJobs(const std::filesystem::path& coordinatesDir,
                                          const std::filesystem::path& imagesDir,
                                          const std::filesystem::path& masksDir,
                                          const std::string& subjectIdPattern = "(\\d{4})");

    /// Provider that loads the key's files from disk and builds the domain
    [[nodiscard]] static DomainProvider
    fileDomainProvider(core::WorldConvention convention = core::WorldConvention::RAS);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace ibis::services
