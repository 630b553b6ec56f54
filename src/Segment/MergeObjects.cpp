/**
 * @file MergeObjects.cpp
 * @brief Small-object merging implementation
 */

#include <CellDeclump/Segment/MergeObjects.h>
#include <CellDeclump/Core/Validate.h>
#include <CellDeclump/Internal/ConnectedComponent.h>
#include <CellDeclump/Internal/MorphBinary.h>
#include <CellDeclump/Internal/Neighborhood.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <map>

namespace Cell::Declump::Segment {

namespace {

// Label counts on the face-connected outer boundary of object n
std::map<int32_t, int64_t> CountBoundaryLabels(const LabelImage& labels, int32_t n,
                                               const std::vector<Point3i>& offsets) {
    QVolume<uint8_t> visited = QVolume<uint8_t>::Like(labels);
    std::map<int32_t, int64_t> counts;

    for (size_t idx = 0; idx < labels.NumVoxels(); ++idx) {
        if (labels[idx] != n) continue;
        Internal::ForEachNeighbor(labels, idx, offsets, [&](size_t q) {
            if (labels[q] == n || visited[q]) return;
            visited[q] = 1;
            counts[labels[q]]++;
        });
    }
    return counts;
}

// Single greedy pass over one 2D plane or one volume
LabelImage MergeNeighbors(const LabelImage& labels, double minObjectSize,
                          const MergeObjectsParams& params) {
    std::vector<int64_t> sizes = Internal::LabelHistogram(labels);
    sizes[BACKGROUND_LABEL] = 0;

    std::vector<int64_t> surfaceAreas;
    if (params.useContactArea && params.contactAreaMethod == ContactAreaMethod::Relative) {
        QVolume<uint8_t> border = Internal::FindBoundaries(labels, Internal::BoundaryMode::Inner);
        surfaceAreas.assign(sizes.size(), 0);
        for (size_t idx = 0; idx < labels.NumVoxels(); ++idx) {
            if (border[idx]) surfaceAreas[labels[idx]]++;
        }
    }

    std::vector<Point3i> offsets = Internal::NeighborOffsets(labels.NDim(), 1);
    LabelImage merged = labels;
    int32_t mergedCount = 0;
    int32_t removedCount = 0;

    for (size_t n = 1; n < sizes.size(); ++n) {
        if (sizes[n] == 0 || static_cast<double>(sizes[n]) >= minObjectSize) continue;

        int32_t label = static_cast<int32_t>(n);
        std::map<int32_t, int64_t> neighbors = CountBoundaryLabels(labels, label, offsets);

        bool onlyBackground = neighbors.empty() ||
                              (neighbors.size() == 1 && neighbors.count(BACKGROUND_LABEL) == 1);

        int32_t target = BACKGROUND_LABEL;
        if (onlyBackground) {
            if (!params.removeBelowThreshold) continue;
        } else {
            // Most frequent object neighbour, lowest label on ties
            int64_t best = 0;
            for (const auto& [neighbor, count] : neighbors) {
                if (neighbor == BACKGROUND_LABEL) continue;
                if (count > best) {
                    best = count;
                    target = neighbor;
                }
            }
        }

        if (params.useContactArea) {
            int64_t contact = neighbors.count(target) ? neighbors[target] : 0;
            bool passes = false;
            if (params.contactAreaMethod == ContactAreaMethod::Absolute) {
                passes = params.absoluteNeighborSize == 0 || contact > params.absoluteNeighborSize;
            } else if (params.relativeNeighborSize == 0.0 ||
                       (params.removeBelowThreshold && target == BACKGROUND_LABEL)) {
                passes = true;
            } else if (surfaceAreas[n] > 0) {
                double fraction = static_cast<double>(contact) / static_cast<double>(surfaceAreas[n]);
                passes = fraction > params.relativeNeighborSize;
            }
            if (!passes) continue;
        }

        std::replace(merged.Values().begin(), merged.Values().end(), label, target);
        if (target == BACKGROUND_LABEL) {
            ++removedCount;
        } else {
            ++mergedCount;
        }
    }

    spdlog::debug("MergeObjects: threshold {:.2f}, {} merged, {} removed",
                  minObjectSize, mergedCount, removedCount);
    return merged;
}

} // anonymous namespace

// =============================================================================
// Merge
// =============================================================================

double MinimumObjectSize(double diameter, bool volumetric) {
    double radius = diameter / 2.0;
    if (volumetric) {
        return PI * (4.0 / 3.0) * radius * radius * radius;
    }
    return PI * radius * radius;
}

LabelImage MergeObjects(const LabelImage& labels, const MergeObjectsParams& params) {
    Validate::RequireNonNegative(params.diameter, "diameter", "MergeObjects");
    Validate::RequireNonNegative(params.absoluteNeighborSize, "absoluteNeighborSize",
                                 "MergeObjects");
    Validate::RequireRange(params.relativeNeighborSize, 0.0, 1.0, "relativeNeighborSize",
                           "MergeObjects");
    CELLDECLUMP_REQUIRE_VOLUME(labels);
    if (labels.Min() < 0) {
        throw InvalidArgumentException("MergeObjects: labels must be non-negative");
    }

    bool perPlane = params.planewise && labels.NDim() == 3;
    double minObjectSize = MinimumObjectSize(params.diameter,
                                             labels.NDim() == 3 && !params.planewise);

    LabelImage merged;
    if (perPlane) {
        merged = labels;
        for (int32_t z = 0; z < labels.Depth(); ++z) {
            merged.SetSlice(z, MergeNeighbors(labels.Slice(z), minObjectSize, params));
        }
    } else {
        merged = MergeNeighbors(labels, minObjectSize, params);
    }

    int32_t numLabels = 0;
    LabelImage result = Internal::RelabelSequential(merged, numLabels);
    spdlog::debug("MergeObjects: {} objects remain", numLabels);
    return result;
}

} // namespace Cell::Declump::Segment
