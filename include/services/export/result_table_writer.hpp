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
 * @file result_table_writer.hpp
 * @brief Atomic CSV output for result tables
 * @details Tables are written in full to `<path>.tmp` and renamed onto the
 *          final path, so a reader never observes a partially written file.
 *          Parent directories are created as needed.
 *
 * Usage:
 * @code
 * ResultTableWriter writer;
 * auto written = writer.write(outcome.table, outputDir / "buffer_zone_metrics.csv");
 * if (!written) {
 *     logger->error("{}", written.error().toString());
 * }
 * @endcode
 */

#pragma once

#include "core/pipeline_error.hpp"
#include "services/buffer_zone/buffer_zone_types.hpp"

#include <cstddef>
#include <expected>
#include <filesystem>
#include <string>
#include <vector>

namespace ibis::services {

/// Files written by one export step and the inputs that failed
struct ExportSummary {
    size_t filesWritten = 0;
    size_t rowsWritten = 0;
    std::vector<FileFailure> failures;
};

class ResultTableWriter {
public:
    using Row = std::vector<std::string>;

    /**
     * @brief Write a buffer-zone result table
     * @return OutputFailed when the directory or file cannot be written
     */
    [[nodiscard]] std::expected<void, PipelineError>
    write(const ResultTable& table, const std::filesystem::path& path) const;

    /**
     * @brief Write any header plus rows as CSV
     *
     * Cells containing the delimiter, quotes or line breaks are quoted.
     */
    [[nodiscard]] static std::expected<void, PipelineError>
    writeCsv(const std::filesystem::path& path, const Row& header,
             const std::vector<Row>& rows, char delimiter = ',');
};

/// Quote a CSV cell when it needs it, doubling embedded quotes
[[nodiscard]] std::string escapeCsv(const std::string& value, char delimiter = ',');

}  // namespace ibis::services
