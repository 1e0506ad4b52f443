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

#include "services/export/result_table_writer.hpp"

#include <fstream>
#include <system_error>

namespace ibis::services {

namespace {

void writeLine(std::ofstream& out, const ResultTableWriter::Row& cells, char delimiter) {
    for (size_t i = 0; i < cells.size(); ++i) {
        if (i > 0) {
            out << delimiter;
        }
        out << escapeCsv(cells[i], delimiter);
    }
    out << '\n';
}

PipelineError outputFailed(const std::string& message) {
    return PipelineError{PipelineError::Code::OutputFailed, message};
}

}  // namespace

std::string escapeCsv(const std::string& value, char delimiter) {
    const bool needsQuotes = value.find(delimiter) != std::string::npos ||
                             value.find_first_of("\"\r\n") != std::string::npos;
    if (!needsQuotes) {
        return value;
    }

    std::string escaped = "\"";
    for (char c : value) {
        if (c == '"') {
            escaped += '"';
        }
        escaped += c;
    }
    escaped += '"';
    return escaped;
}

std::expected<void, PipelineError>
ResultTableWriter::write(const ResultTable& table, const std::filesystem::path& path) const {
    std::vector<Row> rows;
    rows.reserve(table.size());
    for (const auto& record : table) {
        rows.push_back(record.getCsvRow());
    }
    return writeCsv(path, BufferZoneRecord::getCsvHeader(), rows);
}

std::expected<void, PipelineError>
ResultTableWriter::writeCsv(const std::filesystem::path& path, const Row& header,
                            const std::vector<Row>& rows, char delimiter) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return std::unexpected(outputFailed(
                "Cannot create directory " + path.parent_path().string() + ": " + ec.message()));
        }
    }

    auto tmpPath = path;
    tmpPath += ".tmp";

    {
        std::ofstream out(tmpPath, std::ios::out | std::ios::trunc);
        if (!out.is_open()) {
            return std::unexpected(outputFailed("Cannot open file: " + tmpPath.string()));
        }

        writeLine(out, header, delimiter);
        for (const auto& row : rows) {
            writeLine(out, row, delimiter);
        }

        out.flush();
        if (!out) {
            out.close();
            std::filesystem::remove(tmpPath, ec);
            return std::unexpected(outputFailed("Write failed: " + tmpPath.string()));
        }
    }

    std::filesystem::rename(tmpPath, path, ec);
    if (ec) {
        std::error_code removeEc;
        std::filesystem::remove(tmpPath, removeEc);
        return std::unexpected(outputFailed(
            "Cannot move " + tmpPath.string() + " to " + path.string() + ": " + ec.message()));
    }

    return {};
}

}  // namespace ibis::services
