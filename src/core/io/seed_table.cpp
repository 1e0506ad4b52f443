#include "core/seed_table.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <cmath>
#include <fstream>
#include <regex>
#include <sstream>

namespace ibis::core {

namespace {

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

PipelineError formatError(const std::string& source, const std::string& reason) {
    return PipelineError{
        PipelineError::Code::InputFormatError,
        source + ": " + reason
    };
}

std::expected<std::string, PipelineError> readText(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::unexpected(formatError(path.string(), "cannot open file"));
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return std::unexpected(formatError(path.string(), "read failed"));
    }
    return buffer.str();
}

void stripByteOrderMark(std::vector<std::string>& header) {
    // UTF-8 BOM written by spreadsheet tools
    if (!header.empty() && header[0].rfind("\xEF\xBB\xBF", 0) == 0) {
        header[0] = header[0].substr(3);
    }
}

}  // anonymous namespace

std::optional<double> parseNumber(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    double value = 0.0;
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    if (*begin == '+') {
        ++begin;
    }
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc{} || ptr != end || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

std::optional<size_t> CsvTable::columnIndex(const std::string& name) const {
    auto it = std::find(header.begin(), header.end(), name);
    if (it == header.end()) {
        return std::nullopt;
    }
    return static_cast<size_t>(std::distance(header.begin(), it));
}

std::expected<CsvTable, PipelineError>
parseCsvTable(const std::string& content, const std::string& sourceName) {
    std::istringstream in(content);
    std::string line;
    CsvTable table;

    while (std::getline(in, line)) {
        if (!trim(line).empty()) {
            table.header = splitCsvLine(line);
            break;
        }
    }
    if (table.header.empty()) {
        return std::unexpected(formatError(sourceName, "empty table"));
    }
    stripByteOrderMark(table.header);

    size_t lineNumber = 1;
    while (std::getline(in, line)) {
        ++lineNumber;
        if (trim(line).empty()) {
            continue;
        }
        auto fields = splitCsvLine(line);
        if (fields.size() > table.header.size()) {
            return std::unexpected(formatError(
                sourceName, "line " + std::to_string(lineNumber) + " has too many fields"));
        }
        fields.resize(table.header.size());
        table.rows.push_back(std::move(fields));
    }
    return table;
}

std::expected<CsvTable, PipelineError> readCsvTable(const std::filesystem::path& path) {
    auto text = readText(path);
    if (!text) {
        return std::unexpected(text.error());
    }
    return parseCsvTable(*text, path.string());
}

SeedTableReader::SeedTableReader(Columns columns)
    : columns_(std::move(columns)) {}

std::expected<std::vector<Seed>, PipelineError>
SeedTableReader::read(const std::filesystem::path& path, const std::string& subjectId) const {
    auto text = readText(path);
    if (!text) {
        return std::unexpected(text.error());
    }
    return parse(*text, subjectId, path.string());
}

std::expected<std::vector<Seed>, PipelineError>
SeedTableReader::parse(const std::string& content, const std::string& subjectId,
                       const std::string& sourceName) const {
    std::istringstream in(content);
    std::string line;

    // Header: first non-empty line
    std::vector<std::string> header;
    while (std::getline(in, line)) {
        if (!trim(line).empty()) {
            header = splitCsvLine(line);
            break;
        }
    }
    if (header.empty()) {
        return std::unexpected(formatError(sourceName, "empty table"));
    }
    stripByteOrderMark(header);

    std::array<size_t, 3> columnIndex{};
    const std::array<const std::string*, 3> required{&columns_.x, &columns_.y, &columns_.z};
    std::string missing;
    for (size_t c = 0; c < 3; ++c) {
        auto it = std::find(header.begin(), header.end(), *required[c]);
        if (it == header.end()) {
            missing += (missing.empty() ? "" : ", ") + *required[c];
        } else {
            columnIndex[c] = static_cast<size_t>(std::distance(header.begin(), it));
        }
    }
    if (!missing.empty()) {
        return std::unexpected(formatError(sourceName, "missing required columns: " + missing));
    }

    std::vector<Seed> seeds;
    size_t lineNumber = 1;
    while (std::getline(in, line)) {
        ++lineNumber;
        if (trim(line).empty()) {
            continue;
        }

        auto fields = splitCsvLine(line);
        std::array<double, 3> xyz{};
        for (size_t c = 0; c < 3; ++c) {
            if (columnIndex[c] >= fields.size()) {
                return std::unexpected(formatError(
                    sourceName, "line " + std::to_string(lineNumber) + " has too few fields"));
            }
            auto value = parseNumber(fields[columnIndex[c]]);
            if (!value) {
                return std::unexpected(formatError(
                    sourceName, "line " + std::to_string(lineNumber) + ": cannot parse '" +
                                fields[columnIndex[c]] + "' in column " + *required[c]));
            }
            xyz[c] = *value;
        }

        Seed seed;
        seed.seedId = static_cast<int64_t>(seeds.size());
        seed.subjectId = subjectId;
        seed.position = WorldCoordinate(xyz[0], xyz[1], xyz[2]);
        seeds.push_back(std::move(seed));
    }

    return seeds;
}

std::vector<std::string> splitCsvLine(const std::string& line, char delimiter) {
    std::vector<std::string> fields;
    std::string current;
    bool inQuotes = false;

    for (size_t i = 0; i < line.size(); ++i) {
        const char ch = line[i];
        if (ch == '"') {
            if (inQuotes && i + 1 < line.size() && line[i + 1] == '"') {
                current += '"';
                ++i;
            } else {
                inQuotes = !inQuotes;
            }
        } else if (ch == delimiter && !inQuotes) {
            fields.push_back(trim(current));
            current.clear();
        } else {
            current += ch;
        }
    }
    fields.push_back(trim(current));
    return fields;
}

std::optional<std::string>
extractSubjectId(const std::string& fileName, const std::string& pattern) {
    try {
        const std::regex re(pattern);
        std::smatch match;
        if (!std::regex_search(fileName, match, re)) {
            return std::nullopt;
        }
        if (match.size() > 1 && match[1].matched) {
            return match[1].str();
        }
        return match[0].str();
    } catch (const std::regex_error&) {
        return std::nullopt;
    }
}

std::vector<std::filesystem::path>
listFiles(const std::filesystem::path& directory, const std::vector<std::string>& suffixes) {
    std::vector<std::filesystem::path> files;
    std::error_code ec;
    if (!std::filesystem::is_directory(directory, ec)) {
        return files;
    }

    for (const auto& entry : std::filesystem::directory_iterator(directory, ec)) {
        if (!entry.is_regular_file(ec)) {
            continue;
        }
        const auto name = entry.path().filename().string();
        const bool matches = suffixes.empty() ||
            std::any_of(suffixes.begin(), suffixes.end(), [&name](const std::string& suffix) {
                return name.size() >= suffix.size() &&
                       name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
            });
        if (matches) {
            files.push_back(entry.path());
        }
    }

    std::sort(files.begin(), files.end());
    return files;
}

}  // namespace ibis::core
