/**
 * @file Declump.cpp
 * @brief Seeded watershed declumping implementation
 *
 * Seeds come from Segment/SeedFinder; flooding is Internal/Watershed.h.
 */

#include <CellDeclump/Segment/Declump.h>
#include <CellDeclump/Segment/DistanceField.h>
#include <CellDeclump/Core/Validate.h>
#include <CellDeclump/Internal/ConnectedComponent.h>
#include <CellDeclump/Internal/Gaussian.h>
#include <CellDeclump/Internal/MorphBinary.h>
#include <CellDeclump/Internal/Watershed.h>

#include <spdlog/spdlog.h>

#include <cstdlib>

namespace Cell::Declump::Segment {

// =============================================================================
// Basins
// =============================================================================

ScalarField ShapeBasin(const ScalarField& distance) {
    CELLDECLUMP_REQUIRE_VOLUME(distance);

    float maxVal = distance.Max();
    ScalarField basin = ScalarField::Like(distance);
    for (size_t i = 0; i < distance.NumVoxels(); ++i) {
        // -d - min(-d) == max(d) - d
        basin[i] = maxVal - distance[i];
    }
    return basin;
}

ScalarField IntensityBasin(const ScalarField& reference) {
    CELLDECLUMP_REQUIRE_VOLUME(reference);

    float minVal = reference.Min();
    float range = reference.Max() - minVal;
    ScalarField basin = ScalarField::Like(reference, 1.0f);
    if (range <= 0.0f) return basin;

    for (size_t i = 0; i < reference.NumVoxels(); ++i) {
        basin[i] = 1.0f - (reference[i] - minVal) / range;
    }
    return basin;
}

// =============================================================================
// Watershed
// =============================================================================

LabelImage WatershedDeclump(const LabelImage& labels, const SeedMask& seeds,
                            const StructElement& se, const ScalarField& basin,
                            int32_t connectivity) {
    if (se.Empty()) {
        throw InvalidArgumentException("WatershedDeclump: structuring element is empty");
    }
    Validate::RequireMatchingNDim(se.NDim(), labels.NDim(), "structuring element", "labels",
                                  "WatershedDeclump");
    Validate::RequireSameShape(labels, seeds, "labels", "seeds", "WatershedDeclump");
    Validate::RequireSameShape(labels, basin, "labels", "basin", "WatershedDeclump");
    CELLDECLUMP_REQUIRE_VOLUME(labels);
    Validate::RequireConnectivity(connectivity, labels.NDim(), "WatershedDeclump");

    int32_t numBlobs = 0;
    LabelImage blobs = Internal::LabelConnectedComponents(Internal::Dilate(seeds, se), 1,
                                                          numBlobs);

    LabelImage markers = LabelImage::Like(blobs);
    for (size_t i = 0; i < blobs.NumVoxels(); ++i) {
        if (blobs[i] != 0) markers[i] = -blobs[i];
    }

    QVolume<uint8_t> foreground = ForegroundMask(labels);
    LabelImage flooded = Internal::WatershedFlood(basin, markers, foreground, connectivity);

    // Shift into the positive range; unflooded voxels (outside the mask or
    // cut off from every marker) become background
    int32_t shift = std::abs(flooded.Min()) + 1;
    for (size_t i = 0; i < flooded.NumVoxels(); ++i) {
        flooded[i] = flooded[i] != 0 ? flooded[i] + shift : BACKGROUND_LABEL;
    }

    int32_t numLabels = 0;
    LabelImage result = Internal::RelabelSequential(flooded, numLabels);
    spdlog::debug("WatershedDeclump: {} seed blobs, {} objects", numBlobs, numLabels);
    return result;
}

LabelImage DeclumpObjects(const LabelImage& labels, const DeclumpParams& params,
                          const ScalarField& reference) {
    Validate::RequireNonNegative(params.sigma, "sigma", "DeclumpObjects");
    if (params.structElement.Empty()) {
        throw InvalidArgumentException("DeclumpObjects: structuring element is empty");
    }
    Validate::RequireMatchingNDim(params.structElement.NDim(), labels.NDim(),
                                  "structuring element", "labels", "DeclumpObjects");
    CELLDECLUMP_REQUIRE_VOLUME(labels);
    Validate::RequireConnectivity(params.connectivity, labels.NDim(), "DeclumpObjects");
    if (params.method == DeclumpMethod::Intensity) {
        if (reference.Empty()) {
            throw InvalidArgumentException(
                "DeclumpObjects: intensity method requires a reference image");
        }
        Validate::RequireSameShape(labels, reference, "labels", "reference", "DeclumpObjects");
    }

    DistanceFieldParams distParams;
    distParams.pad = params.padDistance;
    ScalarField distance = ComputeDistanceField(labels, distParams);

    ScalarField basin = params.method == DeclumpMethod::Shape ? ShapeBasin(distance)
                                                               : IntensityBasin(reference);
    basin = Internal::GaussianSmooth(basin, params.sigma);

    SeedMask seeds = FindSeeds(distance, params.finder);

    LabelImage result = WatershedDeclump(labels, seeds, params.structElement, basin,
                                         params.connectivity);
    spdlog::debug("DeclumpObjects: {} method, {} seeds, {} objects",
                  params.method == DeclumpMethod::Shape ? "shape" : "intensity",
                  seeds.CountNonZero(), result.Max());
    return result;
}

} // namespace Cell::Declump::Segment
