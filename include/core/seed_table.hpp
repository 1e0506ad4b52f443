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
 * @file seed_table.hpp
 * @brief Typed reading of seed coordinate tables
 * @details A seed table is a CSV file with a header row containing at least
 *          the columns X, Y and Z (physical mm). Rows become Seed records
 *          whose seed_id is the 0-based row position. Any violation of that
 *          contract is reported as InputFormatError before the table reaches
 *          the extraction core.
 */

#pragma once

#include "core/coordinate_types.hpp"
#include "core/pipeline_error.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ibis::core {

/**
 * @brief Physical-space point of interest read from a seed table
 */
struct Seed {
    /// Row position in the source file
    int64_t seedId = 0;

    /// Subject the source file belongs to
    std::string subjectId;

    /// Position in world coordinates (mm)
    WorldCoordinate position;
};

class SeedTableReader {
public:
    /// Columns the reader requires, in the order x, y, z
    struct Columns {
        std::string x = "X";
        std::string y = "Y";
        std::string z = "Z";
    };

    SeedTableReader() = default;
    explicit SeedTableReader(Columns columns);

    /**
     * @brief Read a seed table from disk
     * @param path CSV file
     * @param subjectId Subject attached to every seed
     * @return Seeds in row order, or InputFormatError
     */
    [[nodiscard]] std::expected<std::vector<Seed>, PipelineError>
    read(const std::filesystem::path& path, const std::string& subjectId) const;

    /**
     * @brief Parse seed table content already held in memory
     * @param content Full CSV text, header included
     * @param subjectId Subject attached to every seed
     * @param sourceName Name used in error messages
     */
    [[nodiscard]] std::expected<std::vector<Seed>, PipelineError>
    parse(const std::string& content, const std::string& subjectId,
          const std::string& sourceName = "<memory>") const;

private:
    Columns columns_;
};

/**
 * @brief Generic CSV table held as text cells
 *
 * Rows shorter than the header are padded with empty cells.
 */
struct CsvTable {
    std::vector<std::string> header;
    std::vector<std::vector<std::string>> rows;

    /// Position of the first header cell equal to @p name
    [[nodiscard]] std::optional<size_t> columnIndex(const std::string& name) const;
};

/**
 * @brief Parse CSV text into a CsvTable
 *
 * The first non-empty line is the header; blank lines are skipped. A row
 * with more fields than the header is an InputFormatError.
 */
[[nodiscard]] std::expected<CsvTable, PipelineError>
parseCsvTable(const std::string& content, const std::string& sourceName = "<memory>");

/// Read and parse a CSV file, see parseCsvTable()
[[nodiscard]] std::expected<CsvTable, PipelineError>
readCsvTable(const std::filesystem::path& path);

/// Parse a finite decimal number; a leading '+' is accepted
[[nodiscard]] std::optional<double> parseNumber(const std::string& text);

/// Split one CSV line, trimming whitespace and surrounding double quotes
[[nodiscard]] std::vector<std::string> splitCsvLine(const std::string& line, char delimiter = ',');

/**
 * @brief Extract a subject identifier from a file name
 *
 * Searches @p fileName with the regular expression @p pattern and returns
 * its first capture group, or the whole match when the pattern has no
 * group. Returns std::nullopt when nothing matches or the pattern is invalid.
 *
 * @code
 * extractSubjectId("6966_coords.csv", "(\\d{4})");  // "6966"
 * @endcode
 */
[[nodiscard]] std::optional<std::string>
extractSubjectId(const std::string& fileName, const std::string& pattern = "(\\d{4})");

/**
 * @brief List regular files in @p directory whose names end with one of
 *        @p suffixes, sorted by path
 *
 * A missing directory yields an empty list.
 */
[[nodiscard]] std::vector<std::filesystem::path>
listFiles(const std::filesystem::path& directory, const std::vector<std::string>& suffixes);

}  // namespace ibis::core
