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

#include "services/buffer_zone/batch_orchestrator.hpp"

#include "core/logging.hpp"
#include "core/volume_loader.hpp"
#include "services/buffer_zone/buffer_zone_aggregator.hpp"
#include "services/buffer_zone/masked_domain.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <future>
#include <map>
#include <mutex>
#include <thread>

namespace ibis::services {

namespace {

const std::vector<std::string> kVolumeSuffixes{".nii", ".nii.gz"};

std::optional<std::filesystem::path>
matchSubjectFile(const std::vector<std::filesystem::path>& files, const std::string& subjectId) {
    if (files.empty()) {
        return std::nullopt;
    }
    auto it = std::find_if(files.begin(), files.end(), [&subjectId](const auto& file) {
        return file.filename().string().find(subjectId) != std::string::npos;
    });
    return it != files.end() ? *it : files.front();
}

struct JobResult {
    ResultTable records;
    std::optional<FileFailure> failure;
};

}  // anonymous namespace

std::string toString(BatchStatus status) {
    switch (status) {
        case BatchStatus::Completed: return "Completed";
        case BatchStatus::CompletedWithFailures: return "CompletedWithFailures";
        case BatchStatus::NoOutput: return "NoOutput";
    }
    return "Unknown";
}

class BatchOrchestrator::Impl {
public:
    BatchOptions options;
    std::shared_ptr<spdlog::logger> logger;
    DomainProvider provider;
    IndexCache cache;
    BufferZoneAggregator aggregator;
    core::SeedTableReader reader;

    // Jobs still pending per domain; the domain is released at zero
    std::map<DomainKey, size_t> pendingUses;
    std::mutex usesMutex;

    Impl(BatchOptions opts, std::shared_ptr<spdlog::logger> log)
        : options(std::move(opts))
        , logger(log ? std::move(log) : logging::LoggerFactory::create("BatchOrchestrator"))
        , provider(fileDomainProvider(options.convention))
        , aggregator(BufferZoneAggregator::Options{options.allowOverlap})
        , reader(options.columns) {}

    JobResult runJob(const BatchJob& job) {
        JobResult result;
        const auto fileName = job.coordinatesFile.filename().string();

        auto fail = [&](PipelineError error) {
            logger->error("Failed to process {}: {}", fileName, error.toString());
            result.records.clear();
            result.failure = FileFailure{job.coordinatesFile, std::move(error)};
        };

        try {
            auto seeds = reader.read(job.coordinatesFile, job.subjectId);
            if (!seeds) {
                fail(seeds.error());
                return result;
            }

            auto domain = cache.getOrBuild(job.domainKey(), provider);
            if (!domain) {
                fail(domain.error());
                return result;
            }
            const MaskedDomain& dom = *domain.value();

            std::vector<core::WorldCoordinate> positions;
            positions.reserve(seeds->size());
            for (const auto& seed : *seeds) {
                positions.push_back(seed.position);
            }

            const std::vector<float>* intensities =
                dom.intensities ? &dom.intensities.value() : nullptr;

            for (double radius : options.radii) {
                auto neighborhoods = dom.index->query(positions, radius, options.queryThreads);
                for (size_t s = 0; s < seeds->size(); ++s) {
                    auto record = aggregator.aggregate((*seeds)[s], radius, neighborhoods[s], intensities);
                    if (record) {
                        result.records.push_back(std::move(*record));
                    }
                }
            }

            logger->info("Processed {}: {} seeds, {} active voxels, {} records",
                         fileName, seeds->size(), dom.activeCount(), result.records.size());
        } catch (const std::exception& e) {
            fail(PipelineError{PipelineError::Code::InternalError, e.what()});
        }

        return result;
    }

    void finishJob(const DomainKey& key) {
        std::lock_guard lock(usesMutex);
        auto it = pendingUses.find(key);
        if (it == pendingUses.end()) {
            return;
        }
        if (--it->second == 0) {
            pendingUses.erase(it);
            cache.release(key);
            logger->debug("Released domain {}", key.toString());
        }
    }
};

BatchOrchestrator::BatchOrchestrator(BatchOptions options, std::shared_ptr<spdlog::logger> logger)
    : impl_(std::make_unique<Impl>(std::move(options), std::move(logger))) {}

BatchOrchestrator::~BatchOrchestrator() = default;
BatchOrchestrator::BatchOrchestrator(BatchOrchestrator&&) noexcept = default;
BatchOrchestrator& BatchOrchestrator::operator=(BatchOrchestrator&&) noexcept = default;

void BatchOrchestrator::setDomainProvider(DomainProvider provider) {
    impl_->provider = std::move(provider);
}

const BatchOptions& BatchOrchestrator::options() const noexcept {
    return impl_->options;
}

const IndexCache& BatchOrchestrator::cache() const noexcept {
    return impl_->cache;
}

BatchOutcome BatchOrchestrator::run(const std::vector<BatchJob>& jobs) {
    BatchOutcome outcome;
    std::vector<JobResult> results(jobs.size());

    {
        std::lock_guard lock(impl_->usesMutex);
        impl_->pendingUses.clear();
        for (const auto& job : jobs) {
            ++impl_->pendingUses[job.domainKey()];
        }
    }

    unsigned int workers = impl_->options.maxParallelJobs;
    if (workers == 0) {
        workers = std::max(1u, std::thread::hardware_concurrency());
    }
    workers = static_cast<unsigned int>(std::min<size_t>(workers, std::max<size_t>(jobs.size(), 1)));

    impl_->logger->info("Running {} jobs x {} radii on {} workers",
                        jobs.size(), impl_->options.radii.size(), workers);

    // Workers pull the next job index; results land in their job's slot
    std::atomic<size_t> next{0};
    auto worker = [this, &jobs, &results, &next] {
        for (size_t i = next++; i < jobs.size(); i = next++) {
            results[i] = impl_->runJob(jobs[i]);
            impl_->finishJob(jobs[i].domainKey());
        }
    };

    if (workers <= 1) {
        worker();
    } else {
        std::vector<std::future<void>> tasks;
        tasks.reserve(workers);
        for (unsigned int w = 0; w < workers; ++w) {
            tasks.push_back(std::async(std::launch::async, worker));
        }
        for (auto& task : tasks) {
            task.get();
        }
    }

    for (auto& result : results) {
        if (result.failure) {
            outcome.failures.push_back(std::move(*result.failure));
            continue;
        }
        ++outcome.filesProcessed;
        outcome.table.insert(outcome.table.end(),
                             std::make_move_iterator(result.records.begin()),
                             std::make_move_iterator(result.records.end()));
    }

    if (outcome.table.empty()) {
        outcome.status = BatchStatus::NoOutput;
    } else if (!outcome.failures.empty()) {
        outcome.status = BatchStatus::CompletedWithFailures;
    } else {
        outcome.status = BatchStatus::Completed;
    }

    impl_->logger->info("Batch {}: {} records, {} files processed, {} failed",
                        toString(outcome.status), outcome.table.size(),
                        outcome.filesProcessed, outcome.failures.size());
    return outcome;
}

BatchOutcome BatchOrchestrator::run(const JobPlan& plan) {
    auto outcome = run(plan.jobs);
    if (plan.skipped.empty()) {
        return outcome;
    }

    for (const auto& skipped : plan.skipped) {
        impl_->logger->warn("Skipped {}: {}", skipped.file.filename().string(),
                            skipped.error.toString());
    }
    outcome.failures.insert(outcome.failures.begin(), plan.skipped.begin(), plan.skipped.end());
    if (outcome.status == BatchStatus::Completed) {
        outcome.status = BatchStatus::CompletedWithFailures;
    }
    return outcome;
}

JobPlan BatchOrchestrator::planJobs(const std::filesystem::path& coordinatesDir,
                                    const std::filesystem::path& imagesDir,
                                    const std::filesystem::path& masksDir,
                                    const std::string& subjectIdPattern) {
    JobPlan plan;
    const auto coordinateFiles = core::listFiles(coordinatesDir, {".csv"});
    const auto images = core::listFiles(imagesDir, kVolumeSuffixes);
    const auto masks = core::listFiles(masksDir, kVolumeSuffixes);

    for (const auto& file : coordinateFiles) {
        auto subjectId = core::extractSubjectId(file.filename().string(), subjectIdPattern);
        if (!subjectId) {
            plan.skipped.push_back(FileFailure{file, PipelineError{
                PipelineError::Code::InputFormatError,
                "No subject id in file name " + file.filename().string()
            }});
            continue;
        }

        BatchJob job;
        job.coordinatesFile = file;
        job.subjectId = *subjectId;
        job.imagePath = matchSubjectFile(images, *subjectId);
        job.maskPath = matchSubjectFile(masks, *subjectId);
        plan.jobs.push_back(std::move(job));
    }

    return plan;
}

BatchOrchestrator::DomainProvider
BatchOrchestrator::fileDomainProvider(core::WorldConvention convention) {
    return [convention](const DomainKey& key) -> DomainResult {
        core::VolumeLoader loader;

        core::IntensityImageType::Pointer image;
        if (key.imagePath) {
            auto loaded = loader.loadImage(*key.imagePath);
            if (!loaded) {
                return std::unexpected(loaded.error());
            }
            image = loaded.value();
        }

        core::MaskImageType::Pointer mask;
        if (key.maskPath) {
            auto loaded = loader.loadMask(*key.maskPath);
            if (!loaded) {
                return std::unexpected(loaded.error());
            }
            mask = loaded.value();
        }

        return DomainBuilder(convention).build(image, mask);
    };
}

}  // namespace ibis::services
