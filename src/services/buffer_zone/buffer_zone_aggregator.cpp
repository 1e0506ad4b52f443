#include "services/buffer_zone/buffer_zone_aggregator.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace ibis::services {

BufferZoneAggregator::BufferZoneAggregator(Options options)
    : options_(options) {}

std::optional<BufferZoneRecord>
BufferZoneAggregator::aggregate(const core::Seed& seed, double radiusMm,
                                const std::vector<size_t>& matched,
                                const std::vector<float>* intensities) const {
    if (matched.empty()) {
        return std::nullopt;
    }

    BufferZoneRecord record;
    record.subjectId = seed.subjectId;
    record.seedId = seed.seedId;
    record.x = seed.position.x;
    record.y = seed.position.y;
    record.z = seed.position.z;
    record.radiusMm = radiusMm;
    record.voxelCount = static_cast<int64_t>(matched.size());

    if (intensities == nullptr) {
        return record;
    }

    double sum = 0.0;
    double minVal = std::numeric_limits<double>::max();
    double maxVal = std::numeric_limits<double>::lowest();
    for (size_t idx : matched) {
        double value = intensities->at(idx);
        sum += value;
        minVal = std::min(minVal, value);
        maxVal = std::max(maxVal, value);
    }

    double count = static_cast<double>(matched.size());
    double mean = sum / count;

    // Second pass keeps the variance stable for large offsets
    double sumSqDiff = 0.0;
    for (size_t idx : matched) {
        double diff = (*intensities)[idx] - mean;
        sumSqDiff += diff * diff;
    }

    record.meanValue = mean;
    record.stdValue = std::sqrt(sumSqDiff / count);
    record.minValue = minVal;
    record.maxValue = maxVal;
    return record;
}

}  // namespace ibis::services
