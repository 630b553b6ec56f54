#pragma once

/**
 * @file Watershed.h
 * @brief Marker-controlled watershed flooding on 2D/3D volumes
 *
 * Flooding order:
 * - All marker voxels enter the queue first, in raster order
 * - The queue pops the lowest elevation; equal elevations pop in push order
 * - A voxel takes the label of the voxel that first reaches it
 *
 * No watershed lines are produced: every reachable voxel inside the mask
 * is assigned to exactly one marker.
 *
 * Reference skimage operator:
 * - skimage.segmentation.watershed(image, markers, connectivity, mask)
 */

#include <CellDeclump/Core/QVolume.h>

#include <cstdint>

namespace Cell::Declump::Internal {

/**
 * @brief Flood elevation from markers
 *
 * @param elevation Landscape to flood (lower floods first)
 * @param markers Non-zero voxels are markers; any non-zero value is a label
 * @param mask Voxels that may be flooded (empty = whole volume). Markers
 *             outside the mask are ignored.
 * @param connectivity 1..ndim
 * @param unlabeled Value for mask voxels no marker can reach
 * @return Label image; voxels outside the mask are 0
 * @throws DimensionMismatchException if shapes differ
 */
LabelImage WatershedFlood(const QVolume<float>& elevation,
                          const LabelImage& markers,
                          const QVolume<uint8_t>& mask,
                          int32_t connectivity,
                          int32_t unlabeled = 0);

} // namespace Cell::Declump::Internal
