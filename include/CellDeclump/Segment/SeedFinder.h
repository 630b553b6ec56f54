#pragma once

#include <CellDeclump/Core/Export.h>

/**
 * @file SeedFinder.h
 * @brief Constrained local-maximum search and seed generation
 *
 * Provides:
 * - Peak search with spacing, threshold, border and count constraints
 * - Per-object seed capping with an injectable random source
 * - Complete seed generation from a label image (distance, smoothing,
 *   peaks, dilation, capping)
 *
 * Peak search is deterministic: candidates are ranked by value (descending)
 * and then by raster index (ascending).
 *
 * API Style: SeedMask Func(const ScalarField& field, const Params& params)
 */

#include <CellDeclump/Core/QVolume.h>
#include <CellDeclump/Core/Types.h>
#include <CellDeclump/Morphology/StructElement.h>
#include <CellDeclump/Platform/Random.h>

#include <cstdint>
#include <vector>

namespace Cell::Declump::Segment {

// =============================================================================
// Enums
// =============================================================================

/**
 * @brief Interpretation of the peak threshold
 */
enum class ThresholdMode {
    Relative,       ///< min + threshold * (max - min), threshold in [0, 1]
    Absolute        ///< threshold used as given
};

// =============================================================================
// Peak Search
// =============================================================================

/**
 * @brief Peak search parameters
 */
struct CELLDECLUMP_API SeedFinderParams {
    int32_t minDistance = 1;                            ///< Peak window half-size, NO_MIN_DISTANCE disables
    ThresholdMode thresholdMode = ThresholdMode::Relative;
    double threshold = 0.0;                             ///< Peaks must exceed this value
    int32_t excludeBorder = 0;                          ///< Voxels dropped at every volume face
    int32_t maxSeeds = UNLIMITED_SEEDS;                 ///< Global cap, UNLIMITED_SEEDS disables

    static SeedFinderParams Default() {
        return SeedFinderParams();
    }

    static SeedFinderParams Relative(double threshold, int32_t minDistance = 1) {
        SeedFinderParams p;
        p.threshold = threshold;
        p.minDistance = minDistance;
        return p;
    }

    static SeedFinderParams Absolute(double threshold, int32_t minDistance = 1) {
        SeedFinderParams p;
        p.thresholdMode = ThresholdMode::Absolute;
        p.threshold = threshold;
        p.minDistance = minDistance;
        return p;
    }
};

/**
 * @brief Accepted peak coordinates in rank order
 *
 * A voxel is a candidate when it equals the maximum of the
 * (2 * minDistance + 1) hypercube around it and its value exceeds the
 * threshold. Candidates closer than excludeBorder to a face are dropped.
 * The remaining candidates are visited in rank order and accepted unless
 * an already accepted peak lies within Chebyshev distance minDistance.
 * At most maxSeeds peaks are returned.
 *
 * A field whose values are all equal has no peaks.
 *
 * @throws InvalidArgumentException on negative minDistance (other than
 *         NO_MIN_DISTANCE), negative excludeBorder, negative maxSeeds
 *         (other than UNLIMITED_SEEDS) or relative threshold outside [0, 1]
 */
CELLDECLUMP_API std::vector<Point3i> FindSeedPoints(const ScalarField& field,
                                                    const SeedFinderParams& params = {});

/**
 * @brief Peak mask: 1 exactly at the points of FindSeedPoints
 */
CELLDECLUMP_API SeedMask FindSeeds(const ScalarField& field,
                                   const SeedFinderParams& params = {});

// =============================================================================
// Per-Object Capping
// =============================================================================

/**
 * @brief Limit the number of seeds inside each object
 *
 * Seeds are grouped into face-connected blobs. Objects are visited in
 * ascending label order; an object that intersects more than
 * maxSeedsPerObject surviving blobs loses the excess, chosen uniformly at
 * random from rng. Whole blobs are removed.
 *
 * @param labels Object label image
 * @param seeds Seed mask of the same shape
 * @param maxSeedsPerObject Cap (> 0)
 * @param rng Random source; pass a seeded instance for reproducible output
 * @return New seed mask (inputs are not modified)
 * @throws DimensionMismatchException if shapes differ
 */
CELLDECLUMP_API SeedMask EnforceMaximumSeedsPerObject(const LabelImage& labels,
                                                      const SeedMask& seeds,
                                                      int32_t maxSeedsPerObject,
                                                      Platform::Random& rng =
                                                          Platform::Random::Instance());

// =============================================================================
// Seed Generation
// =============================================================================

/**
 * @brief Seed generation parameters
 */
struct CELLDECLUMP_API SeedObjectsParams {
    double sigma = 1.0;                                 ///< Gaussian sigma on the distance field
    bool padDistance = true;                            ///< Treat the volume edge as background
    SeedFinderParams finder;                            ///< Peak search
    StructElement structElement = StructElement::Disk(1); ///< Seed dilation
    int32_t maxSeedsPerObject = 0;                      ///< 0 = no per-object limit

    static SeedObjectsParams Default() {
        return SeedObjectsParams();
    }

    /// Default parameters with a 3D dilation element
    static SeedObjectsParams Volumetric() {
        SeedObjectsParams p;
        p.structElement = StructElement::Ball(1);
        return p;
    }
};

/**
 * @brief Seeds for a label image
 *
 * Pipeline: distance field of the foreground (padded if requested),
 * Gaussian smoothing, peak search, dilation with the structuring element,
 * per-object cap when maxSeedsPerObject > 0.
 *
 * @throws DimensionMismatchException if the structuring element's
 *         dimensionality differs from the label image's
 */
CELLDECLUMP_API SeedMask GenerateSeeds(const LabelImage& labels,
                                       const SeedObjectsParams& params = {},
                                       Platform::Random& rng = Platform::Random::Instance());

} // namespace Cell::Declump::Segment
