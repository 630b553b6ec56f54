#pragma once

/**
 * @file DistanceTransform.h
 * @brief Euclidean distance transform for 2D/3D binary masks
 *
 * Computes the distance from each foreground voxel to the nearest
 * background voxel. Background voxels have distance 0.
 *
 * Algorithm:
 * - Separable exact Euclidean transform (lower envelope of parabolas,
 *   Felzenszwalb & Huttenlocher), one 1D pass per axis
 * - Optional per-axis voxel spacing for anisotropic stacks
 *
 * Reference scipy operator:
 * - scipy.ndimage.distance_transform_edt
 */

#include <CellDeclump/Core/QVolume.h>

#include <vector>

namespace Cell::Declump::Internal {

/**
 * @brief Exact Euclidean distance transform
 *
 * If the mask contains no background voxel, the exterior of the volume is
 * treated as background.
 *
 * @param binary Input mask (non-zero = foreground)
 * @param spacing Voxel size per axis in (z,) y, x order; empty = unit spacing
 * @return Distance volume of same extents
 * @throws InvalidArgumentException if spacing has wrong length or non-positive entries
 */
QVolume<float> DistanceTransformEDT(const QVolume<uint8_t>& binary,
                                    const std::vector<double>& spacing = {});

/**
 * @brief Squared-distance 1D transform along one line
 *
 * @param f Input squared distances (infinity = no source), overwritten with result
 * @param spacing Distance between consecutive samples
 */
void DistanceTransform1D(std::vector<double>& f, double spacing);

/**
 * @brief Pad a mask with background on every active axis
 */
QVolume<uint8_t> PadBinary(const QVolume<uint8_t>& binary, int32_t pad);

/**
 * @brief Remove a border of width pad on every active axis
 */
QVolume<float> CropField(const QVolume<float>& field, int32_t pad);

} // namespace Cell::Declump::Internal
