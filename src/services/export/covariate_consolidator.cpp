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

#include "services/export/covariate_consolidator.hpp"

#include "core/logging.hpp"
#include "services/buffer_zone/buffer_zone_types.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <optional>
#include <set>
#include <utility>

namespace ibis::services {

namespace {

struct CovariateSource {
    const char* directory;
    const char* outputFile;
    const char* prefix;
};

const std::array<CovariateSource, 3> kSources{{
    {"buffer_zone", CovariateConsolidator::kBufferZoneFile, ""},
    {"variables/edt", CovariateConsolidator::kEdtFile, "v1_edt_"},
    {"variables/var", CovariateConsolidator::kVarFile, ""},
}};

std::optional<std::array<size_t, 3>> coordinateColumns(const core::CsvTable& csv) {
    for (const auto& names : {std::array<const char*, 3>{"X", "Y", "Z"},
                              std::array<const char*, 3>{"x", "y", "z"}}) {
        auto x = csv.columnIndex(names[0]);
        auto y = csv.columnIndex(names[1]);
        auto z = csv.columnIndex(names[2]);
        if (x && y && z) {
            return std::array<size_t, 3>{*x, *y, *z};
        }
    }
    return std::nullopt;
}

PipelineError cellError(const std::string& source, size_t row, const std::string& column,
                        const std::string& value) {
    return PipelineError{
        PipelineError::Code::InputFormatError,
        source + ": row " + std::to_string(row + 1) + ": cannot parse '" + value +
            "' in column " + column
    };
}

}  // namespace

CovariateConsolidator::CovariateConsolidator(core::ConsolidationSettings settings,
                                             std::shared_ptr<spdlog::logger> logger)
    : settings_(settings)
    , logger_(logger ? std::move(logger) : logging::LoggerFactory::create("CovariateConsolidator")) {}

bool CovariateConsolidator::hasCoordinateColumns(const core::CsvTable& csv) {
    return coordinateColumns(csv).has_value();
}

std::expected<core::CsvTable, PipelineError>
CovariateConsolidator::loadCovariate(const core::CsvTable& csv, const std::string& label,
                                     const std::string& sourceName) {
    const auto coords = coordinateColumns(csv);
    if (!coords) {
        return std::unexpected(PipelineError{
            PipelineError::Code::InputFormatError,
            sourceName + ": no X,Y,Z or x,y,z columns"
        });
    }
    const size_t valueColumn = csv.header.size() - 1;

    core::CsvTable result;
    result.header = {"i", "j", "k", label};
    result.rows.reserve(csv.rows.size());
    for (size_t r = 0; r < csv.rows.size(); ++r) {
        const auto& fields = csv.rows[r];
        std::vector<std::string> row;
        row.reserve(4);

        for (size_t axis = 0; axis < 3; ++axis) {
            const auto& cell = fields[(*coords)[axis]];
            auto value = core::parseNumber(cell);
            if (!value) {
                return std::unexpected(cellError(sourceName, r, csv.header[(*coords)[axis]], cell));
            }
            // Truncate toward zero, then wrap into 16 bits
            const auto index = static_cast<int16_t>(static_cast<long long>(std::trunc(*value)));
            row.push_back(std::to_string(index));
        }

        const auto& cell = fields[valueColumn];
        if (cell.empty()) {
            row.emplace_back();
        } else {
            auto value = core::parseNumber(cell);
            if (!value) {
                return std::unexpected(cellError(sourceName, r, csv.header[valueColumn], cell));
            }
            const float single = static_cast<float>(*value);
            const float rounded = std::nearbyint(single * 1000.0f) / 1000.0f;
            row.push_back(formatNumber(rounded));
        }
        result.rows.push_back(std::move(row));
    }
    return result;
}

core::CsvTable
CovariateConsolidator::concatenateColumns(const std::vector<core::CsvTable>& tables) const {
    size_t rowCount = 0;
    for (const auto& table : tables) {
        rowCount = std::max(rowCount, table.rows.size());
    }

    // (table, column) pairs that survive, in output order
    std::vector<std::pair<size_t, size_t>> kept;
    std::set<std::string> seen;
    core::CsvTable result;
    for (size_t t = 0; t < tables.size(); ++t) {
        for (size_t c = 0; c < tables[t].header.size(); ++c) {
            const auto& name = tables[t].header[c];
            if (settings_.removeDuplicates && !seen.insert(name).second) {
                continue;
            }
            kept.emplace_back(t, c);
            result.header.push_back(name);
        }
    }

    result.rows.assign(rowCount, std::vector<std::string>(kept.size()));
    for (size_t r = 0; r < rowCount; ++r) {
        for (size_t out = 0; out < kept.size(); ++out) {
            const auto& source = tables[kept[out].first];
            if (r < source.rows.size()) {
                result.rows[r][out] = source.rows[r][kept[out].second];
            }
        }
    }
    return result;
}

void CovariateConsolidator::applyMissingPolicy(core::CsvTable& table) const {
    if (settings_.handleMissing == core::MissingValuePolicy::Fill) {
        const auto fill = formatNumber(settings_.fillValue);
        for (auto& row : table.rows) {
            std::replace(row.begin(), row.end(), std::string{}, fill);
        }
        return;
    }

    const auto before = table.rows.size();
    std::erase_if(table.rows, [](const std::vector<std::string>& row) {
        return std::any_of(row.begin(), row.end(),
                           [](const std::string& cell) { return cell.empty(); });
    });
    if (table.rows.size() != before) {
        logger_->info("Dropped {} rows with missing values", before - table.rows.size());
    }
}

std::vector<std::filesystem::path>
CovariateConsolidator::collectCsvFiles(const std::filesystem::path& baseDir) const {
    // Files directly in baseDir are step outputs, not covariates
    std::vector<std::filesystem::path> subfolders;
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(baseDir, ec)) {
        if (entry.is_directory(ec)) {
            subfolders.push_back(entry.path());
        }
    }
    if (ec) {
        logger_->warn("Cannot list {}: {}", baseDir.string(), ec.message());
    }
    std::sort(subfolders.begin(), subfolders.end());

    std::vector<std::filesystem::path> files;
    for (const auto& subfolder : subfolders) {
        auto nested = core::listFiles(subfolder, {".csv"});
        files.insert(files.end(), nested.begin(), nested.end());
    }
    return files;
}

std::expected<bool, PipelineError>
CovariateConsolidator::consolidateDirectory(const std::filesystem::path& baseDir,
                                            const std::filesystem::path& outputFile,
                                            const std::string& prefix,
                                            ExportSummary& summary) const {
    std::vector<core::CsvTable> covariates;
    for (const auto& file : collectCsvFiles(baseDir)) {
        auto csv = core::readCsvTable(file);
        if (!csv) {
            logger_->error("Error processing {}: {}", file.string(), csv.error().toString());
            summary.failures.push_back(FileFailure{file, csv.error()});
            continue;
        }
        if (!hasCoordinateColumns(*csv)) {
            logger_->debug("{} has no coordinate columns, skipping", file.filename().string());
            continue;
        }

        auto label = file.stem().string();
        if (!prefix.empty() && label.starts_with(prefix)) {
            label = label.substr(prefix.size());
        }

        auto covariate = loadCovariate(*csv, label, file.string());
        if (!covariate) {
            logger_->error("Error processing {}: {}", file.string(), covariate.error().toString());
            summary.failures.push_back(FileFailure{file, covariate.error()});
            continue;
        }
        covariates.push_back(std::move(*covariate));
    }

    if (covariates.empty()) {
        logger_->warn("No covariate tables under {}", baseDir.string());
        return false;
    }

    const auto table = concatenateColumns(covariates);
    auto written = ResultTableWriter::writeCsv(outputFile, table.header, table.rows);
    if (!written) {
        return std::unexpected(written.error());
    }

    ++summary.filesWritten;
    summary.rowsWritten += table.rows.size();
    logger_->info("Wrote {} ({} covariates, {} rows)", outputFile.filename().string(),
                  covariates.size(), table.rows.size());
    return true;
}

std::expected<bool, PipelineError>
CovariateConsolidator::mergeAll(const std::filesystem::path& consolidatedDir,
                                ExportSummary& summary) const {
    std::vector<core::CsvTable> tables;
    for (const char* name : {kBufferZoneFile, kEdtFile, kVarFile}) {
        const auto path = consolidatedDir / name;
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            continue;
        }
        auto csv = core::readCsvTable(path);
        if (!csv) {
            logger_->error("Error loading {}: {}", path.string(), csv.error().toString());
            summary.failures.push_back(FileFailure{path, csv.error()});
            continue;
        }
        tables.push_back(std::move(*csv));
    }

    if (tables.empty()) {
        logger_->warn("No consolidated tables in {}", consolidatedDir.string());
        return false;
    }

    auto merged = concatenateColumns(tables);
    applyMissingPolicy(merged);

    const auto outputFile = consolidatedDir / kAllFile;
    auto written = ResultTableWriter::writeCsv(outputFile, merged.header, merged.rows);
    if (!written) {
        return std::unexpected(written.error());
    }

    ++summary.filesWritten;
    summary.rowsWritten += merged.rows.size();
    logger_->info("Wrote {} ({} columns, {} rows)", outputFile.filename().string(),
                  merged.header.size(), merged.rows.size());
    return true;
}

std::expected<ExportSummary, PipelineError>
CovariateConsolidator::run(const std::filesystem::path& inputDir,
                           const std::filesystem::path& outputDir) const {
    ExportSummary summary;
    const auto consolidatedDir = outputDir / "consolidated";

    for (const auto& source : kSources) {
        std::error_code ec;
        auto baseDir = outputDir / source.directory;
        if (!std::filesystem::is_directory(baseDir, ec)) {
            baseDir = inputDir / source.directory;
        }
        if (!std::filesystem::is_directory(baseDir, ec)) {
            logger_->warn("No {} directory to consolidate", source.directory);
            continue;
        }

        auto done = consolidateDirectory(baseDir, consolidatedDir / source.outputFile,
                                         source.prefix, summary);
        if (!done) {
            return std::unexpected(done.error());
        }
    }

    auto merged = mergeAll(consolidatedDir, summary);
    if (!merged) {
        return std::unexpected(merged.error());
    }
    return summary;
}

}  // namespace ibis::services
