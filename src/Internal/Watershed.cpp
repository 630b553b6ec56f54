/**
 * @file Watershed.cpp
 * @brief Marker-controlled priority-flood watershed
 */

#include <CellDeclump/Internal/Watershed.h>
#include <CellDeclump/Internal/Neighborhood.h>
#include <CellDeclump/Core/Validate.h>

#include <functional>
#include <queue>
#include <vector>

namespace Cell::Declump::Internal {

namespace {

// Priority queue element for watershed
struct WatershedVoxel {
    float value;    // Elevation
    uint64_t age;   // Push order
    size_t index;

    bool operator>(const WatershedVoxel& other) const {
        // Min-heap on (value, age)
        if (value != other.value) return value > other.value;
        return age > other.age;
    }
};

} // anonymous namespace

LabelImage WatershedFlood(const QVolume<float>& elevation,
                          const LabelImage& markers,
                          const QVolume<uint8_t>& mask,
                          int32_t connectivity,
                          int32_t unlabeled) {
    Validate::RequireSameShape(elevation, markers, "elevation", "markers", "WatershedFlood");
    if (!mask.Empty()) {
        Validate::RequireSameShape(elevation, mask, "elevation", "mask", "WatershedFlood");
    }
    CELLDECLUMP_REQUIRE_VOLUME(elevation);
    Validate::RequireConnectivity(connectivity, elevation.NDim(), "WatershedFlood");

    std::vector<Point3i> offsets = NeighborOffsets(elevation.NDim(), connectivity);
    auto inMask = [&](size_t idx) { return mask.Empty() || mask[idx] != 0; };

    LabelImage labels = LabelImage::Like(markers);
    std::vector<uint8_t> claimed(markers.NumVoxels(), 0);

    std::priority_queue<WatershedVoxel, std::vector<WatershedVoxel>,
                        std::greater<WatershedVoxel>> pq;
    uint64_t age = 0;

    // Seed queue with markers
    for (size_t idx = 0; idx < markers.NumVoxels(); ++idx) {
        if (markers[idx] == 0 || !inMask(idx)) continue;
        labels[idx] = markers[idx];
        claimed[idx] = 1;
        pq.push({elevation[idx], age++, idx});
    }

    // Flood
    while (!pq.empty()) {
        WatershedVoxel v = pq.top();
        pq.pop();

        int32_t label = labels[v.index];
        ForEachNeighbor(elevation, v.index, offsets, [&](size_t n) {
            if (claimed[n] || !inMask(n)) return;
            claimed[n] = 1;
            labels[n] = label;
            pq.push({elevation[n], age++, n});
        });
    }

    // Mask voxels cut off from every marker
    for (size_t idx = 0; idx < labels.NumVoxels(); ++idx) {
        if (!claimed[idx] && inMask(idx)) {
            labels[idx] = unlabeled;
        }
    }
    return labels;
}

} // namespace Cell::Declump::Internal
