#pragma once

#include <CellDeclump/Core/Export.h>

/**
 * @file DistanceField.h
 * @brief Distance-to-background fields of foreground masks
 *
 * Provides:
 * - Euclidean distance transform of a mask or label image
 * - Optional 1-voxel background pad before transforming
 * - Optional Gaussian smoothing and rescaling to [0, 1]
 * - Anisotropic voxel spacing
 *
 * API Style: ScalarField Func(const Mask& mask, const Params& params)
 */

#include <CellDeclump/Core/QVolume.h>
#include <CellDeclump/Core/Types.h>

#include <vector>

namespace Cell::Declump::Segment {

/**
 * @brief Distance field parameters
 */
struct CELLDECLUMP_API DistanceFieldParams {
    double sigma = 0.0;             ///< Gaussian sigma applied after the transform (0 = none)
    bool pad = false;               ///< Pad mask with background by 1 voxel before transforming
    bool rescale = false;           ///< Divide by the maximum so values lie in [0, 1]
    std::vector<double> spacing;    ///< Voxel size per axis, (z,) y, x order (empty = unit)

    static DistanceFieldParams Default() {
        return DistanceFieldParams();
    }

    /// Padded and smoothed, as used for seed generation
    static DistanceFieldParams Smoothed(double sigma) {
        DistanceFieldParams p;
        p.sigma = sigma;
        p.pad = true;
        return p;
    }
};

/**
 * @brief Distance of every foreground voxel to the nearest background voxel
 *
 * With pad = true, the volume edge counts as background: the mask is
 * padded with one background voxel on every axis, transformed and cropped
 * back to its original extents.
 *
 * @param mask Foreground mask (non-zero = foreground)
 * @param params Distance field parameters
 * @return Field of the same extents, values >= 0 (empty for empty input)
 * @throws InvalidArgumentException if sigma < 0 or spacing is invalid
 *
 * @code
 * auto field = ComputeDistanceField(mask, DistanceFieldParams::Smoothed(1.0));
 * @endcode
 */
CELLDECLUMP_API ScalarField ComputeDistanceField(const QVolume<uint8_t>& mask,
                                                 const DistanceFieldParams& params = {});

/**
 * @brief Distance field of the foreground (label != 0) of a label image
 */
CELLDECLUMP_API ScalarField ComputeDistanceField(const LabelImage& labels,
                                                 const DistanceFieldParams& params = {});

} // namespace Cell::Declump::Segment
