#include "core/pipeline_config.hpp"

#include <cmath>
#include <fstream>
#include <regex>
#include <sstream>

#include <nlohmann/json.hpp>

namespace ibis::core {

namespace {

PipelineError configError(const std::string& message) {
    return PipelineError{PipelineError::Code::ConfigurationError, message};
}

std::expected<PathSettings, PipelineError> pathsFromJson(const nlohmann::json& j) {
    for (const char* key : {"input_dir", "output_dir", "logs_dir"}) {
        if (!j.contains(key)) {
            return std::unexpected(configError(
                std::string("Missing required path configuration: ") + key));
        }
    }
    PathSettings paths;
    paths.inputDir = j.at("input_dir").get<std::string>();
    paths.outputDir = j.at("output_dir").get<std::string>();
    paths.logsDir = j.at("logs_dir").get<std::string>();
    return paths;
}

LoggingSettings loggingFromJson(const nlohmann::json& j) {
    LoggingSettings s;
    s.level = j.value("level", s.level);
    s.file = j.value("file", s.file);
    s.console = j.value("console", s.console);
    s.pattern = j.value("pattern", s.pattern);
    return s;
}

std::expected<BufferZoneSettings, PipelineError> bufferZoneFromJson(const nlohmann::json& j) {
    BufferZoneSettings s;
    s.defaultRadius = j.value("default_radius", s.defaultRadius);
    s.allowOverlap = j.value("allow_overlap", s.allowOverlap);
    s.subjectIdPattern = j.value("subject_id_pattern", s.subjectIdPattern);
    s.maxParallelJobs = j.value("max_parallel_jobs", s.maxParallelJobs);
    s.queryThreads = j.value("query_threads", s.queryThreads);

    if (j.contains("radius_options")) {
        s.radiusOptions = j.at("radius_options").get<std::vector<double>>();
    }
    if (s.radiusOptions.empty()) {
        s.radiusOptions.push_back(s.defaultRadius);
    }

    const auto conventionName = j.value("world_convention", std::string("RAS"));
    auto convention = parseWorldConvention(conventionName);
    if (!convention) {
        return std::unexpected(configError(
            "Invalid world_convention '" + conventionName + "' (expected RAS or LPS)"));
    }
    s.worldConvention = *convention;
    return s;
}

std::expected<RoiExtractionSettings, PipelineError> roiFromJson(const nlohmann::json& j) {
    RoiExtractionSettings s;
    if (j.contains("coordinate_columns")) {
        auto columns = j.at("coordinate_columns").get<std::vector<std::string>>();
        if (columns.size() != 3) {
            return std::unexpected(configError(
                "roi_extraction.coordinate_columns must name exactly three columns"));
        }
        s.coordinateColumns = {columns[0], columns[1], columns[2]};
    }
    s.intensityColumn = j.value("intensity_column", s.intensityColumn);
    s.subjectIdPattern = j.value("subject_id_pattern", s.subjectIdPattern);
    return s;
}

VariableExtractionSettings variablesFromJson(const nlohmann::json& j) {
    VariableExtractionSettings s;
    if (j.contains("edt")) {
        s.edtEnabled = j.at("edt").value("enabled", s.edtEnabled);
    }
    if (j.contains("var")) {
        s.varEnabled = j.at("var").value("enabled", s.varEnabled);
    }
    return s;
}

std::expected<ConsolidationSettings, PipelineError> consolidationFromJson(const nlohmann::json& j) {
    ConsolidationSettings s;
    s.removeDuplicates = j.value("remove_duplicates", s.removeDuplicates);
    s.fillValue = j.value("fill_value", s.fillValue);

    const auto policyName = j.value("handle_missing", std::string("drop"));
    auto policy = parseMissingValuePolicy(policyName);
    if (!policy) {
        return std::unexpected(configError(
            "Invalid consolidation.handle_missing '" + policyName + "' (expected drop or fill)"));
    }
    s.handleMissing = *policy;
    return s;
}

}  // anonymous namespace

std::optional<MissingValuePolicy> parseMissingValuePolicy(const std::string& name) {
    if (name == "drop") return MissingValuePolicy::Drop;
    if (name == "fill") return MissingValuePolicy::Fill;
    return std::nullopt;
}

logging::LogConfig LoggingSettings::toLogConfig(const std::filesystem::path& logsDir) const {
    logging::LogConfig config;
    config.level = logging::parseLogLevel(level).value_or(logging::LogLevel::Info);
    config.enableConsole = console;
    config.enableFileLogging = !logsDir.empty() && !file.empty();
    config.logDirectory = logsDir;
    config.fileName = file;
    config.pattern = pattern;
    return config;
}

std::expected<PipelineConfig, PipelineError>
PipelineConfig::load(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return std::unexpected(configError("Cannot open configuration file " + path.string()));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    auto config = parse(buffer.str());
    if (!config) {
        return std::unexpected(configError(
            "Error loading configuration file " + path.string() + ": " + config.error().message));
    }
    return config;
}

std::expected<PipelineConfig, PipelineError> PipelineConfig::parse(const std::string& text) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        return std::unexpected(configError(std::string("Invalid JSON: ") + e.what()));
    }

    if (!root.is_object()) {
        return std::unexpected(configError("Configuration root must be an object"));
    }
    for (const char* section : {"pipeline", "paths", "logging"}) {
        if (!root.contains(section)) {
            return std::unexpected(configError(
                std::string("Missing required configuration section: ") + section));
        }
    }

    PipelineConfig config;
    try {
        const auto& pipeline = root.at("pipeline");
        config.name = pipeline.value("name", config.name);
        config.version = pipeline.value("version", config.version);

        auto paths = pathsFromJson(root.at("paths"));
        if (!paths) {
            return std::unexpected(paths.error());
        }
        config.paths = paths.value();

        config.logging = loggingFromJson(root.at("logging"));

        if (root.contains("buffer_zone")) {
            auto bufferZone = bufferZoneFromJson(root.at("buffer_zone"));
            if (!bufferZone) {
                return std::unexpected(bufferZone.error());
            }
            config.bufferZone = bufferZone.value();
        } else {
            config.bufferZone.radiusOptions = {config.bufferZone.defaultRadius};
        }

        if (root.contains("roi_extraction")) {
            auto roi = roiFromJson(root.at("roi_extraction"));
            if (!roi) {
                return std::unexpected(roi.error());
            }
            config.roiExtraction = roi.value();
        }

        if (root.contains("variable_extraction")) {
            config.variableExtraction = variablesFromJson(root.at("variable_extraction"));
        }

        if (root.contains("consolidation")) {
            auto consolidation = consolidationFromJson(root.at("consolidation"));
            if (!consolidation) {
                return std::unexpected(consolidation.error());
            }
            config.consolidation = consolidation.value();
        }
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(configError(std::string("Invalid value: ") + e.what()));
    }

    auto valid = config.validate();
    if (!valid) {
        return std::unexpected(valid.error());
    }
    return config;
}

std::expected<void, PipelineError> PipelineConfig::validate() const {
    if (paths.inputDir.empty() || paths.outputDir.empty() || paths.logsDir.empty()) {
        return std::unexpected(configError("input_dir, output_dir and logs_dir must not be empty"));
    }

    if (!logging::parseLogLevel(logging.level)) {
        return std::unexpected(configError("Invalid logging level: " + logging.level));
    }

    const auto isPositive = [](double r) { return std::isfinite(r) && r > 0.0; };
    if (!isPositive(bufferZone.defaultRadius)) {
        return std::unexpected(configError("buffer_zone.default_radius must be > 0"));
    }
    if (bufferZone.radiusOptions.empty()) {
        return std::unexpected(configError("buffer_zone.radius_options must not be empty"));
    }
    for (double r : bufferZone.radiusOptions) {
        if (!isPositive(r)) {
            return std::unexpected(configError(
                "buffer_zone.radius_options must contain radii > 0, got " + std::to_string(r)));
        }
    }
    if (bufferZone.queryThreads == 0) {
        return std::unexpected(configError("buffer_zone.query_threads must be >= 1"));
    }

    if (!std::isfinite(consolidation.fillValue)) {
        return std::unexpected(configError("consolidation.fill_value must be finite"));
    }

    for (const auto* pattern : {&bufferZone.subjectIdPattern, &roiExtraction.subjectIdPattern}) {
        try {
            std::regex compiled(*pattern);
        } catch (const std::regex_error& e) {
            return std::unexpected(configError(
                "Invalid subject_id_pattern '" + *pattern + "': " + e.what()));
        }
    }

    return {};
}

}  // namespace ibis::core
