#include "services/buffer_zone/buffer_zone_types.hpp"

#include <array>
#include <charconv>
#include <cmath>

namespace ibis::services {

namespace {

template <typename T>
std::string shortestDecimal(T value) {
    if (std::isnan(value)) {
        return {};
    }
    std::array<char, 64> buffer{};
    auto [ptr, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
    if (ec != std::errc{}) {
        return std::to_string(value);
    }
    return std::string(buffer.data(), ptr);
}

}  // namespace

std::string formatNumber(double value) {
    return shortestDecimal(value);
}

std::string formatNumber(float value) {
    return shortestDecimal(value);
}

std::vector<std::string> BufferZoneRecord::getCsvHeader() {
    return {
        "seed_id", "x", "y", "z", "radius_mm", "voxel_count",
        "mean_value", "std_value", "max_value", "min_value", "subject_id"
    };
}

std::vector<std::string> BufferZoneRecord::getCsvRow() const {
    auto optional = [](const std::optional<double>& v) {
        return v ? formatNumber(*v) : std::string{};
    };

    return {
        std::to_string(seedId),
        formatNumber(x),
        formatNumber(y),
        formatNumber(z),
        formatNumber(radiusMm),
        std::to_string(voxelCount),
        optional(meanValue),
        optional(stdValue),
        optional(maxValue),
        optional(minValue),
        subjectId
    };
}

}  // namespace ibis::services
