/**
 * @file SeedFinder.cpp
 * @brief Peak search, seed capping and seed generation
 */

#include <CellDeclump/Segment/SeedFinder.h>
#include <CellDeclump/Segment/DistanceField.h>
#include <CellDeclump/Core/Validate.h>
#include <CellDeclump/Internal/ConnectedComponent.h>
#include <CellDeclump/Internal/MorphBinary.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdlib>
#include <map>
#include <set>

namespace Cell::Declump::Segment {

namespace {

void ValidateFinderParams(const SeedFinderParams& params, const char* funcName) {
    Validate::RequireNonNegativeOr(params.minDistance, NO_MIN_DISTANCE, "minDistance", funcName);
    Validate::RequireNonNegative(params.excludeBorder, "excludeBorder", funcName);
    Validate::RequireNonNegativeOr(params.maxSeeds, UNLIMITED_SEEDS, "maxSeeds", funcName);
    if (params.thresholdMode == ThresholdMode::Relative) {
        Validate::RequireRange(params.threshold, 0.0, 1.0, "threshold", funcName);
    }
}

// True if value equals the maximum of the cube of half-size radius around p
bool IsWindowMaximum(const ScalarField& field, const Point3i& p, int32_t radius) {
    float value = field.At(p);
    int32_t zRadius = field.NDim() == 3 ? radius : 0;
    for (int32_t dz = -zRadius; dz <= zRadius; ++dz) {
        int32_t z = p.z + dz;
        if (z < 0 || z >= field.Depth()) continue;
        for (int32_t dy = -radius; dy <= radius; ++dy) {
            int32_t y = p.y + dy;
            if (y < 0 || y >= field.Height()) continue;
            for (int32_t dx = -radius; dx <= radius; ++dx) {
                int32_t x = p.x + dx;
                if (x < 0 || x >= field.Width()) continue;
                if (field.At(z, y, x) > value) return false;
            }
        }
    }
    return true;
}

bool InsideBorder(const ScalarField& field, const Point3i& p, int32_t border) {
    if (border == 0) return true;
    if (p.y < border || p.y >= field.Height() - border) return false;
    if (p.x < border || p.x >= field.Width() - border) return false;
    if (field.NDim() == 3 && (p.z < border || p.z >= field.Depth() - border)) return false;
    return true;
}

int32_t ChebyshevDistance(const Point3i& a, const Point3i& b) {
    return std::max({std::abs(a.z - b.z), std::abs(a.y - b.y), std::abs(a.x - b.x)});
}

} // anonymous namespace

// =============================================================================
// Peak Search
// =============================================================================

std::vector<Point3i> FindSeedPoints(const ScalarField& field, const SeedFinderParams& params) {
    ValidateFinderParams(params, "FindSeedPoints");
    CELLDECLUMP_REQUIRE_VOLUME(field);

    float minVal = field.Min();
    float maxVal = field.Max();
    if (minVal == maxVal) {
        spdlog::debug("FindSeedPoints: flat field, no peaks");
        return {};
    }

    double threshold = params.threshold;
    if (params.thresholdMode == ThresholdMode::Relative) {
        threshold = minVal + params.threshold * (static_cast<double>(maxVal) - minVal);
    }

    int32_t radius = std::max(params.minDistance, 0);

    // Candidates in raster order
    std::vector<size_t> candidates;
    for (size_t idx = 0; idx < field.NumVoxels(); ++idx) {
        if (static_cast<double>(field[idx]) <= threshold) continue;
        Point3i p = field.Coord(idx);
        if (!InsideBorder(field, p, params.excludeBorder)) continue;
        if (!IsWindowMaximum(field, p, radius)) continue;
        candidates.push_back(idx);
    }

    // Rank: value descending, raster index ascending
    std::stable_sort(candidates.begin(), candidates.end(), [&](size_t a, size_t b) {
        return field[a] > field[b];
    });

    size_t limit = params.maxSeeds == UNLIMITED_SEEDS
                       ? candidates.size()
                       : static_cast<size_t>(params.maxSeeds);

    std::vector<Point3i> accepted;
    for (size_t idx : candidates) {
        if (accepted.size() >= limit) break;
        Point3i p = field.Coord(idx);
        if (params.minDistance >= 1) {
            bool tooClose = std::any_of(accepted.begin(), accepted.end(), [&](const Point3i& q) {
                return ChebyshevDistance(p, q) <= params.minDistance;
            });
            if (tooClose) continue;
        }
        accepted.push_back(p);
    }

    spdlog::debug("FindSeedPoints: threshold {:.4f}, {} candidates, {} accepted",
                  threshold, candidates.size(), accepted.size());
    return accepted;
}

SeedMask FindSeeds(const ScalarField& field, const SeedFinderParams& params) {
    std::vector<Point3i> points = FindSeedPoints(field, params);
    SeedMask seeds = SeedMask::Like(field);
    for (const auto& p : points) {
        seeds.At(p) = 1;
    }
    return seeds;
}

// =============================================================================
// Per-Object Capping
// =============================================================================

SeedMask EnforceMaximumSeedsPerObject(const LabelImage& labels, const SeedMask& seeds,
                                      int32_t maxSeedsPerObject, Platform::Random& rng) {
    Validate::RequireSameShape(labels, seeds, "labels", "seeds", "EnforceMaximumSeedsPerObject");
    Validate::RequirePositive(maxSeedsPerObject, "maxSeedsPerObject",
                              "EnforceMaximumSeedsPerObject");
    CELLDECLUMP_REQUIRE_VOLUME(seeds);

    int32_t numBlobs = 0;
    LabelImage blobs = Internal::LabelConnectedComponents(seeds, 1, numBlobs);

    // Blobs touching each object, by ascending object label
    std::map<int32_t, std::set<int32_t>> objectBlobs;
    for (size_t idx = 0; idx < labels.NumVoxels(); ++idx) {
        if (labels[idx] != BACKGROUND_LABEL && blobs[idx] != 0) {
            objectBlobs[labels[idx]].insert(blobs[idx]);
        }
    }

    std::vector<uint8_t> removed(static_cast<size_t>(numBlobs) + 1, 0);
    int32_t removedCount = 0;

    for (const auto& [object, blobSet] : objectBlobs) {
        std::vector<int32_t> alive;
        for (int32_t blob : blobSet) {
            if (!removed[blob]) alive.push_back(blob);
        }
        if (static_cast<int32_t>(alive.size()) <= maxSeedsPerObject) continue;

        size_t excess = alive.size() - static_cast<size_t>(maxSeedsPerObject);
        for (size_t i : rng.SampleIndices(alive.size(), excess)) {
            removed[alive[i]] = 1;
            ++removedCount;
        }
        spdlog::debug("EnforceMaximumSeedsPerObject: object {} had {} seeds, removed {}",
                      object, alive.size(), excess);
    }

    SeedMask result = seeds;
    for (size_t idx = 0; idx < result.NumVoxels(); ++idx) {
        if (blobs[idx] != 0 && removed[blobs[idx]]) {
            result[idx] = 0;
        } else if (result[idx] != 0) {
            result[idx] = 1;
        }
    }

    spdlog::debug("EnforceMaximumSeedsPerObject: {} of {} seed blobs removed",
                  removedCount, numBlobs);
    return result;
}

// =============================================================================
// Seed Generation
// =============================================================================

SeedMask GenerateSeeds(const LabelImage& labels, const SeedObjectsParams& params,
                       Platform::Random& rng) {
    Validate::RequireNonNegative(params.sigma, "sigma", "GenerateSeeds");
    Validate::RequireNonNegative(params.maxSeedsPerObject, "maxSeedsPerObject", "GenerateSeeds");
    ValidateFinderParams(params.finder, "GenerateSeeds");
    if (!labels.Empty()) {
        Validate::RequireMatchingNDim(params.structElement.NDim(), labels.NDim(),
                                      "structuring element", "labels", "GenerateSeeds");
    }
    CELLDECLUMP_REQUIRE_VOLUME(labels);

    DistanceFieldParams distParams;
    distParams.sigma = params.sigma;
    distParams.pad = params.padDistance;
    ScalarField field = ComputeDistanceField(labels, distParams);

    SeedMask seeds = FindSeeds(field, params.finder);
    seeds = Internal::Dilate(seeds, params.structElement);

    if (params.maxSeedsPerObject > 0) {
        seeds = EnforceMaximumSeedsPerObject(labels, seeds, params.maxSeedsPerObject, rng);
    }

    spdlog::debug("GenerateSeeds: {} seed voxels after dilation with {}",
                  seeds.CountNonZero(), params.structElement.ToString());
    return seeds;
}

} // namespace Cell::Declump::Segment
