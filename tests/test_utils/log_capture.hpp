#pragma once

/// @file log_capture.hpp
/// @brief In-memory spdlog logger for asserting on log output

#include <algorithm>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/sinks/ringbuffer_sink.h>
#include <spdlog/spdlog.h>

namespace ibis::test_utils {

/// Logger writing only to a ring buffer; not registered globally
class LogCapture {
public:
    explicit LogCapture(const std::string& name = "test", size_t capacity = 256)
        : sink_(std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(capacity))
        , logger_(std::make_shared<spdlog::logger>(name, sink_)) {
        sink_->set_pattern("[%l] %v");
        logger_->set_level(spdlog::level::trace);
    }

    [[nodiscard]] std::shared_ptr<spdlog::logger> logger() const { return logger_; }

    [[nodiscard]] std::vector<std::string> lines() const {
        return sink_->last_formatted();
    }

    [[nodiscard]] bool contains(const std::string& text) const {
        auto all = lines();
        return std::any_of(all.begin(), all.end(), [&text](const std::string& line) {
            return line.find(text) != std::string::npos;
        });
    }

    [[nodiscard]] size_t count(const std::string& text) const {
        auto all = lines();
        return static_cast<size_t>(std::count_if(all.begin(), all.end(), [&text](const std::string& line) {
            return line.find(text) != std::string::npos;
        }));
    }

private:
    std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> sink_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace ibis::test_utils
