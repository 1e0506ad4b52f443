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

#include "services/buffer_zone/spatial_index.hpp"

#include <algorithm>
#include <cmath>
#include <future>

#include <vtkIdList.h>
#include <vtkNew.h>
#include <vtkPoints.h>
#include <vtkPolyData.h>
#include <vtkStaticPointLocator.h>

namespace ibis::services {

SpatialIndex::~SpatialIndex() = default;

std::shared_ptr<const SpatialIndex>
SpatialIndex::build(const std::vector<core::WorldCoordinate>& points) {
    auto index = std::make_shared<SpatialIndex>(PrivateTag{});
    index->pointCount_ = points.size();

    if (points.empty()) {
        return index;
    }

    auto vtkPts = vtkSmartPointer<vtkPoints>::New();
    vtkPts->SetDataTypeToDouble();
    vtkPts->SetNumberOfPoints(static_cast<vtkIdType>(points.size()));
    for (size_t i = 0; i < points.size(); ++i) {
        vtkPts->SetPoint(static_cast<vtkIdType>(i), points[i].x, points[i].y, points[i].z);
    }

    index->dataSet_ = vtkSmartPointer<vtkPolyData>::New();
    index->dataSet_->SetPoints(vtkPts);

    index->locator_ = vtkSmartPointer<vtkStaticPointLocator>::New();
    index->locator_->SetDataSet(index->dataSet_);
    index->locator_->BuildLocator();

    return index;
}

SpatialIndex::Neighborhood
SpatialIndex::query(const core::WorldCoordinate& seed, double radiusMm) const {
    Neighborhood result;
    if (empty() || !std::isfinite(radiusMm) || radiusMm <= 0.0) {
        return result;
    }

    double x[3] = {seed.x, seed.y, seed.z};
    vtkNew<vtkIdList> ids;
    locator_->FindPointsWithinRadius(radiusMm, x, ids);

    const vtkIdType count = ids->GetNumberOfIds();
    result.reserve(static_cast<size_t>(count));
    for (vtkIdType i = 0; i < count; ++i) {
        result.push_back(static_cast<size_t>(ids->GetId(i)));
    }

    // Bucket order is an implementation detail of the locator
    std::sort(result.begin(), result.end());
    return result;
}

std::vector<SpatialIndex::Neighborhood>
SpatialIndex::query(const std::vector<core::WorldCoordinate>& seeds, double radiusMm,
                    unsigned int threads) const {
    std::vector<Neighborhood> results(seeds.size());
    if (seeds.empty()) {
        return results;
    }

    const size_t taskCount = std::clamp<size_t>(threads, 1, seeds.size());
    if (taskCount == 1) {
        for (size_t s = 0; s < seeds.size(); ++s) {
            results[s] = query(seeds[s], radiusMm);
        }
        return results;
    }

    // Each task writes a disjoint slice of results
    const size_t chunk = (seeds.size() + taskCount - 1) / taskCount;
    std::vector<std::future<void>> tasks;
    tasks.reserve(taskCount);
    for (size_t begin = 0; begin < seeds.size(); begin += chunk) {
        const size_t end = std::min(begin + chunk, seeds.size());
        tasks.push_back(std::async(std::launch::async, [this, &seeds, &results, radiusMm, begin, end] {
            for (size_t s = begin; s < end; ++s) {
                results[s] = query(seeds[s], radiusMm);
            }
        }));
    }
    for (auto& task : tasks) {
        task.get();
    }

    return results;
}

}  // namespace ibis::services
