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

#include "core/logging.hpp"

#include <algorithm>
#include <cctype>
#include <mutex>
#include <vector>

#include <sys/resource.h>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace ibis::logging {

LogConfig LoggerFactory::config_ = {};
bool LoggerFactory::configured_ = false;

namespace {

std::mutex& sinkMutex() {
    static std::mutex mutex;
    return mutex;
}

std::vector<spdlog::sink_ptr>& sharedSinks() {
    static std::vector<spdlog::sink_ptr> sinks;
    return sinks;
}

std::vector<spdlog::sink_ptr> buildSinks(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    const auto level = static_cast<spdlog::level::level_enum>(config.level);

    if (config.enableConsole) {
        auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        consoleSink->set_level(level);
        sinks.push_back(consoleSink);
    }

    if (config.enableFileLogging && !config.logDirectory.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(config.logDirectory, ec);
        if (!ec) {
            auto logFile = config.logDirectory / config.fileName;
            auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logFile.string(),
                config.maxFileSize,
                config.maxFiles
            );
            fileSink->set_level(level);
            sinks.push_back(fileSink);
        }
    }

    return sinks;
}

}  // anonymous namespace

std::shared_ptr<spdlog::logger> LoggerFactory::create(const std::string& name) {
    auto existingLogger = spdlog::get(name);
    if (existingLogger) {
        return existingLogger;
    }

    std::vector<spdlog::sink_ptr> sinks;
    {
        std::lock_guard lock(sinkMutex());
        if (sharedSinks().empty()) {
            sharedSinks() = buildSinks(config_);
        }
        sinks = sharedSinks();
    }

    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(static_cast<spdlog::level::level_enum>(config_.level));
    logger->set_pattern(config_.pattern);

    // Another thread may have registered the same name in the meantime
    try {
        spdlog::register_logger(logger);
    } catch (const spdlog::spdlog_ex&) {
        if (auto registered = spdlog::get(name)) {
            return registered;
        }
    }

    return logger;
}

void LoggerFactory::configure(const LogConfig& config) {
    {
        std::lock_guard lock(sinkMutex());
        config_ = config;
        configured_ = true;
        sharedSinks() = buildSinks(config);
    }

    // Loggers created before configuration keep their old sinks otherwise
    spdlog::drop_all();
    spdlog::set_level(static_cast<spdlog::level::level_enum>(config.level));
    spdlog::set_pattern(config.pattern);
}

void LoggerFactory::setGlobalLevel(LogLevel level) {
    config_.level = level;
    spdlog::set_level(static_cast<spdlog::level::level_enum>(level));

    spdlog::apply_all([level](std::shared_ptr<spdlog::logger> logger) {
        logger->set_level(static_cast<spdlog::level::level_enum>(level));
    });
}

LogLevel LoggerFactory::getGlobalLevel() {
    return config_.level;
}

void LoggerFactory::shutdown() {
    spdlog::shutdown();
    std::lock_guard lock(sinkMutex());
    sharedSinks().clear();
    configured_ = false;
}

std::optional<LogLevel> parseLogLevel(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "DEBUG") return LogLevel::Debug;
    if (upper == "INFO") return LogLevel::Info;
    if (upper == "WARNING") return LogLevel::Warning;
    if (upper == "ERROR") return LogLevel::Error;
    return std::nullopt;
}

void logMemoryUsage(const std::shared_ptr<spdlog::logger>& logger,
                    const std::string& description) {
    if (!logger) return;

    rusage usage{};
    if (getrusage(RUSAGE_SELF, &usage) != 0) {
        logger->debug("{} memory: unavailable", description);
        return;
    }

    // ru_maxrss is reported in kilobytes on Linux
    const double megabytes = static_cast<double>(usage.ru_maxrss) / 1024.0;
    logger->info("{} memory: {:.1f} MB peak RSS", description, megabytes);
}

}  // namespace ibis::logging
