#include "core/logging.hpp"
#include "core/pipeline_config.hpp"
#include "services/pipeline_runner.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

namespace po = boost::program_options;

/**
 * @brief Command-line entry point
 *
 * Exit codes: 0 success, 1 fatal error, 2 completed with failed input files.
 */
int main(int argc, char* argv[])
{
    po::options_description desc("IBIS buffer-zone covariate extraction");
    desc.add_options()
        ("help,h", "Print help")
        ("config,c", po::value<std::string>()->default_value("config/pipeline_config.json"),
         "Configuration file")
        ("steps,s", po::value<std::vector<std::string>>()->multitoken(),
         "Steps to run: roi_extraction buffer_zone variable_extraction consolidation (default: all)")
        ("validate-only", "Validate configuration, create missing directories and exit");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        if (vm.count("help")) {
            std::cout << desc << std::endl;
            return 0;
        }
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << desc << std::endl;
        return 1;
    }

    const std::filesystem::path configPath(vm["config"].as<std::string>());
    if (!std::filesystem::exists(configPath)) {
        std::cerr << "Config not found: " << configPath.string() << std::endl;
        return 1;
    }

    auto config = ibis::core::PipelineConfig::load(configPath);
    if (!config) {
        std::cerr << config.error().toString() << std::endl;
        return 1;
    }

    std::vector<ibis::services::PipelineStep> steps;
    if (vm.count("steps")) {
        auto parsed = ibis::services::PipelineRunner::parseSteps(
            vm["steps"].as<std::vector<std::string>>());
        if (!parsed) {
            std::cerr << parsed.error().toString() << std::endl;
            return 1;
        }
        steps = std::move(parsed.value());
    }

    ibis::logging::LoggerFactory::configure(
        config->logging.toLogConfig(config->paths.logsDir));

    int exitCode = 0;
    {
        ibis::services::PipelineRunner runner(std::move(config.value()));

        auto prepared = runner.prepareDirectories();
        if (!prepared) {
            std::cerr << prepared.error().toString() << std::endl;
            exitCode = 1;
        } else if (vm.count("validate-only")) {
            std::cout << "Validation OK." << std::endl;
        } else {
            exitCode = runner.run(steps).exitCode();
        }
    }

    ibis::logging::LoggerFactory::shutdown();
    return exitCode;
}
