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

#include "services/export/masked_voxel_exporter.hpp"

#include "core/logging.hpp"
#include "core/seed_table.hpp"
#include "core/volume_loader.hpp"

#include <algorithm>
#include <array>
#include <numeric>
#include <set>
#include <tuple>

namespace ibis::services {

namespace {

const std::vector<std::string> kVolumeSuffixes{".nii", ".nii.gz"};
const std::array<const char*, 3> kEdtDirectories{"4_edt_m", "EDT", "edt"};
const std::array<const char*, 3> kVarDirectories{"Var", "var", "variables"};

template <size_t N>
std::optional<std::filesystem::path>
firstExistingDirectory(const std::filesystem::path& root, const std::array<const char*, N>& names) {
    for (const char* name : names) {
        std::error_code ec;
        auto candidate = root / name;
        if (std::filesystem::is_directory(candidate, ec)) {
            return candidate;
        }
    }
    return std::nullopt;
}

}  // namespace

MaskedVoxelExporter::MaskedVoxelExporter(core::WorldConvention convention,
                                         std::shared_ptr<spdlog::logger> logger)
    : convention_(convention)
    , logger_(logger ? std::move(logger) : logging::LoggerFactory::create("MaskedVoxelExporter")) {}

std::vector<MaskedVoxelExporter::Row>
MaskedVoxelExporter::voxelRows(const MaskedDomain& domain, const Row& extraColumns) {
    // Rows go out in C order (i slowest, k fastest); the domain holds ITK buffer order
    std::vector<size_t> order(domain.voxels.size());
    std::iota(order.begin(), order.end(), size_t{0});
    std::sort(order.begin(), order.end(), [&domain](size_t a, size_t b) {
        const auto& va = domain.voxels[a];
        const auto& vb = domain.voxels[b];
        return std::tie(va.i, va.j, va.k) < std::tie(vb.i, vb.j, vb.k);
    });

    std::vector<Row> rows;
    rows.reserve(domain.voxels.size());
    for (size_t v : order) {
        const auto& voxel = domain.voxels[v];
        Row row{std::to_string(voxel.i), std::to_string(voxel.j), std::to_string(voxel.k)};
        row.push_back(domain.intensities ? formatNumber((*domain.intensities)[v]) : std::string{});
        row.insert(row.end(), extraColumns.begin(), extraColumns.end());
        rows.push_back(std::move(row));
    }
    return rows;
}

std::expected<MaskedDomain, PipelineError>
MaskedVoxelExporter::loadMasked(const std::filesystem::path& imagePath,
                                const std::filesystem::path& maskPath) const {
    core::VolumeLoader loader;
    auto image = loader.loadImage(imagePath);
    if (!image) {
        return std::unexpected(image.error());
    }
    auto mask = loader.loadMask(maskPath);
    if (!mask) {
        return std::unexpected(mask.error());
    }
    return DomainBuilder(convention_).collect(image.value(), mask.value());
}

std::expected<ExportSummary, PipelineError>
MaskedVoxelExporter::extractRoi(const std::filesystem::path& imagesDir,
                                const std::filesystem::path& masksDir,
                                const std::filesystem::path& outputFile,
                                const core::RoiExtractionSettings& settings) const {
    ExportSummary summary;

    const auto images = core::listFiles(imagesDir, kVolumeSuffixes);
    if (images.empty()) {
        logger_->warn("No images found in {}", imagesDir.string());
        return summary;
    }
    const auto masks = core::listFiles(masksDir, kVolumeSuffixes);
    if (masks.empty()) {
        logger_->warn("No masks found in {}", masksDir.string());
        return summary;
    }
    const auto& defaultMask = masks.front();

    std::vector<Row> rows;
    for (const auto& imagePath : images) {
        const auto fileName = imagePath.filename().string();
        auto subjectId = core::extractSubjectId(fileName, settings.subjectIdPattern);
        if (!subjectId) {
            logger_->warn("No subject id in {}, skipping", fileName);
            continue;
        }

        auto domain = loadMasked(imagePath, defaultMask);
        if (!domain) {
            logger_->error("Error extracting from {}: {}", fileName, domain.error().toString());
            summary.failures.push_back(FileFailure{imagePath, domain.error()});
            continue;
        }

        auto subjectRows = voxelRows(domain.value(), Row{*subjectId});
        logger_->debug("{}: {} voxels", fileName, subjectRows.size());
        rows.insert(rows.end(), std::make_move_iterator(subjectRows.begin()),
                    std::make_move_iterator(subjectRows.end()));
    }

    if (rows.empty()) {
        logger_->warn("ROI extraction produced no rows");
        return summary;
    }

    const auto& columns = settings.coordinateColumns;
    Row header{columns[0], columns[1], columns[2], settings.intensityColumn, "sub.id"};
    auto written = ResultTableWriter::writeCsv(outputFile, header, rows);
    if (!written) {
        return std::unexpected(written.error());
    }

    summary.filesWritten = 1;
    summary.rowsWritten = rows.size();
    logger_->info("Wrote {} ROI voxels to {}", rows.size(), outputFile.string());
    return summary;
}

std::expected<ExportSummary, PipelineError>
MaskedVoxelExporter::combineRoiTables(const std::filesystem::path& inputDir,
                                      const std::filesystem::path& outputFile,
                                      const core::RoiExtractionSettings& settings) const {
    ExportSummary summary;
    const auto tablesDir = inputDir / "QNP_vox_coords";
    std::error_code ec;
    if (!std::filesystem::is_directory(tablesDir, ec)) {
        logger_->debug("No {} directory, skipping CSV input", tablesDir.string());
        return summary;
    }

    const auto& columns = settings.coordinateColumns;
    const Row required{columns[0], columns[1], columns[2], settings.intensityColumn};

    std::vector<Row> rows;
    std::set<Row> seen;
    for (const auto& file : core::listFiles(tablesDir, {".csv"})) {
        const auto fileName = file.filename().string();
        auto subjectId = core::extractSubjectId(fileName, settings.subjectIdPattern);
        if (!subjectId) {
            logger_->warn("No subject id in {}, skipping", fileName);
            continue;
        }

        auto table = core::readCsvTable(file);
        if (!table) {
            logger_->error("Error processing {}: {}", fileName, table.error().toString());
            summary.failures.push_back(FileFailure{file, table.error()});
            continue;
        }
        if (!table->columnIndex(settings.intensityColumn)) {
            if (auto intensity = table->columnIndex("Intensity")) {
                table->header[*intensity] = settings.intensityColumn;
            }
        }

        std::vector<size_t> indices;
        std::string missing;
        for (const auto& name : required) {
            if (auto index = table->columnIndex(name)) {
                indices.push_back(*index);
            } else {
                missing += (missing.empty() ? "" : ", ") + name;
            }
        }
        if (!missing.empty()) {
            PipelineError error{PipelineError::Code::InputFormatError,
                                file.string() + ": missing required columns: " + missing};
            logger_->warn("Missing columns in {}: {}", fileName, missing);
            summary.failures.push_back(FileFailure{file, std::move(error)});
            continue;
        }

        size_t added = 0;
        for (const auto& fields : table->rows) {
            Row row;
            row.reserve(required.size() + 1);
            for (size_t index : indices) {
                row.push_back(fields[index]);
            }
            row.push_back(*subjectId);
            if (seen.insert(row).second) {
                rows.push_back(std::move(row));
                ++added;
            }
        }
        logger_->debug("{}: {} rows", fileName, added);
    }

    if (rows.empty()) {
        logger_->warn("No rows combined from {}", tablesDir.string());
        return summary;
    }

    Row header = required;
    header.push_back("sub.id");
    auto written = ResultTableWriter::writeCsv(outputFile, header, rows);
    if (!written) {
        return std::unexpected(written.error());
    }

    summary.filesWritten = 1;
    summary.rowsWritten = rows.size();
    logger_->info("Wrote {} combined ROI rows to {}", rows.size(), outputFile.string());
    return summary;
}

std::expected<void, PipelineError>
MaskedVoxelExporter::exportVariableSet(const std::vector<std::filesystem::path>& files,
                                       const std::filesystem::path& maskPath,
                                       const std::filesystem::path& outputDir,
                                       const std::string& prefix, const std::string& suffix,
                                       ExportSummary& summary) const {
    const auto roi = roiName(maskPath);
    const Row header{"X", "Y", "Z", "Value"};

    for (const auto& file : files) {
        const auto fileName = file.filename().string();
        const auto name = fileName.substr(0, fileName.find(suffix));

        auto domain = loadMasked(file, maskPath);
        if (!domain) {
            logger_->error("Variable extraction failed for {}: {}", fileName,
                           domain.error().toString());
            summary.failures.push_back(FileFailure{file, domain.error()});
            continue;
        }

        const auto rows = voxelRows(domain.value());
        const auto outputFile = outputDir / (prefix + name + "_" + roi + ".csv");
        auto written = ResultTableWriter::writeCsv(outputFile, header, rows);
        if (!written) {
            return std::unexpected(written.error());
        }

        ++summary.filesWritten;
        summary.rowsWritten += rows.size();
        logger_->info("Wrote {} ({} voxels)", outputFile.filename().string(), rows.size());
    }
    return {};
}

std::expected<ExportSummary, PipelineError>
MaskedVoxelExporter::extractVariables(const std::filesystem::path& inputDir,
                                      const std::filesystem::path& masksDir,
                                      const std::filesystem::path& outputDir,
                                      const core::VariableExtractionSettings& settings) const {
    ExportSummary summary;

    const auto masks = core::listFiles(masksDir, kVolumeSuffixes);
    if (masks.empty()) {
        logger_->warn("No masks found in {}", masksDir.string());
        return summary;
    }
    const auto& mask = masks.front();

    if (settings.edtEnabled) {
        if (auto edtDir = firstExistingDirectory(inputDir, kEdtDirectories)) {
            auto files = core::listFiles(*edtDir, {"_masked.nii.gz"});
            if (files.empty()) {
                logger_->warn("No *_masked.nii.gz files in {}", edtDir->string());
            }
            auto done = exportVariableSet(files, mask, outputDir / "edt", "v1_edt_",
                                          "_masked.nii.gz", summary);
            if (!done) {
                return std::unexpected(done.error());
            }
        } else {
            logger_->warn("No EDT directory under {}", inputDir.string());
        }
    }

    if (settings.varEnabled) {
        if (auto varDir = firstExistingDirectory(inputDir, kVarDirectories)) {
            auto files = core::listFiles(*varDir, kVolumeSuffixes);
            auto done = exportVariableSet(files, mask, outputDir / "var", "var_", ".nii", summary);
            if (!done) {
                return std::unexpected(done.error());
            }
        } else {
            logger_->warn("No variance directory under {}", inputDir.string());
        }
    }

    return summary;
}

std::string MaskedVoxelExporter::roiName(const std::filesystem::path& maskPath) {
    auto name = maskPath.filename().string();
    if (auto pos = name.find('_'); pos != std::string::npos) {
        return name.substr(0, pos);
    }
    if (auto pos = name.find(".nii"); pos != std::string::npos) {
        return name.substr(0, pos);
    }
    return name;
}

}  // namespace ibis::services
