#pragma once

#include <CellDeclump/Core/Export.h>

/**
 * @file Declump.h
 * @brief Seeded watershed splitting of clumped objects
 *
 * Provides:
 * - Basin construction from shape (distance) or intensity cues
 * - Marker-controlled watershed of a seed mask, restricted to the foreground
 * - Complete declumping of a label image
 *
 * Markers are numbered negatively (blob i -> -i) so that competing markers
 * flood in first-in-first-out order. Foreground that no marker reaches
 * becomes background; the output is relabelled to 1..K.
 *
 * API Style: LabelImage Func(const LabelImage& labels, const Params& params)
 */

#include <CellDeclump/Core/QVolume.h>
#include <CellDeclump/Core/Types.h>
#include <CellDeclump/Morphology/StructElement.h>
#include <CellDeclump/Segment/SeedFinder.h>

#include <cstdint>

namespace Cell::Declump::Segment {

// =============================================================================
// Enums
// =============================================================================

/**
 * @brief Cue used to build the watershed basin
 */
enum class DeclumpMethod {
    Shape,          ///< Inverted distance field (splits at indentations)
    Intensity       ///< Inverted reference intensity (splits at dim seams)
};

// =============================================================================
// Parameters
// =============================================================================

/**
 * @brief Declumping parameters
 */
struct CELLDECLUMP_API DeclumpParams {
    DeclumpMethod method = DeclumpMethod::Shape;
    double sigma = 1.0;                                 ///< Gaussian sigma on the basin
    SeedFinderParams finder;                            ///< Peak search on the distance field
    StructElement structElement = StructElement::Disk(1); ///< Seed dilation
    int32_t connectivity = 1;                           ///< Watershed connectivity, 1..ndim
    bool padDistance = false;                           ///< Treat the volume edge as background

    static DeclumpParams Default() {
        return DeclumpParams();
    }

    static DeclumpParams Shape(double sigma = 1.0) {
        DeclumpParams p;
        p.sigma = sigma;
        return p;
    }

    static DeclumpParams Intensity(double sigma = 1.0) {
        DeclumpParams p;
        p.method = DeclumpMethod::Intensity;
        p.sigma = sigma;
        return p;
    }

    /// Default parameters with a 3D dilation element
    static DeclumpParams Volumetric(DeclumpMethod method = DeclumpMethod::Shape) {
        DeclumpParams p;
        p.method = method;
        p.structElement = StructElement::Ball(1);
        return p;
    }
};

// =============================================================================
// Basins
// =============================================================================

/**
 * @brief Shape basin: negated distance field shifted so its minimum is 0
 */
CELLDECLUMP_API ScalarField ShapeBasin(const ScalarField& distance);

/**
 * @brief Intensity basin: 1 - (reference - min) / (max - min)
 *
 * A constant reference yields a basin of all ones.
 */
CELLDECLUMP_API ScalarField IntensityBasin(const ScalarField& reference);

// =============================================================================
// Watershed
// =============================================================================

/**
 * @brief Split objects by flooding basin from dilated seeds
 *
 * Steps:
 * 1. Dilate seeds with se and label the blobs 1..K (face connectivity)
 * 2. Markers: blob i -> -i
 * 3. Flood basin from markers inside labels != 0
 * 4. Shift labels by |min| + 1, set unflooded voxels to background,
 *    relabel to 1..K'
 *
 * @param labels Object label image (defines the foreground)
 * @param seeds Seed mask, same shape as labels
 * @param se Dilation element, same dimensionality as labels
 * @param basin Elevation, same shape as labels
 * @param connectivity Watershed connectivity, 1..ndim
 * @return Contiguous label image; background of labels stays 0, and
 *         objects without a seed are removed
 * @throws DimensionMismatchException on shape or dimensionality mismatch
 * @throws InvalidArgumentException if connectivity is out of range
 */
CELLDECLUMP_API LabelImage WatershedDeclump(const LabelImage& labels,
                                            const SeedMask& seeds,
                                            const StructElement& se,
                                            const ScalarField& basin,
                                            int32_t connectivity = 1);

/**
 * @brief Split clumped objects of a label image
 *
 * Seeds are peaks of the unsmoothed distance field of the foreground. The
 * basin (shape or intensity) is smoothed with params.sigma before flooding.
 *
 * @param labels Object label image
 * @param params Declumping parameters
 * @param reference Intensity image, required for DeclumpMethod::Intensity
 * @return Contiguous label image
 *
 * @code
 * auto split = DeclumpObjects(labels, DeclumpParams::Shape(1.0));
 * @endcode
 */
CELLDECLUMP_API LabelImage DeclumpObjects(const LabelImage& labels,
                                          const DeclumpParams& params = {},
                                          const ScalarField& reference = {});

} // namespace Cell::Declump::Segment
