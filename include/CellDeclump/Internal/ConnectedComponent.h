#pragma once

/**
 * @file ConnectedComponent.h
 * @brief Connected component labeling and label bookkeeping
 *
 * This module provides:
 * - Two-pass union-find labeling of 2D/3D binary masks
 * - Sequential relabeling of arbitrary label images
 * - Per-label voxel counts
 *
 * Labels are numbered in raster order of each component's first voxel.
 */

#include <CellDeclump/Core/QVolume.h>

#include <cstdint>
#include <vector>

namespace Cell::Declump::Internal {

/**
 * @brief Label connected components of a binary mask
 *
 * @param binary Input mask (non-zero = foreground)
 * @param connectivity 1..ndim (see Neighborhood.h)
 * @param[out] numLabels Number of components found
 * @return Label image (0 = background, 1..numLabels = components)
 */
LabelImage LabelConnectedComponents(const QVolume<uint8_t>& binary,
                                    int32_t connectivity,
                                    int32_t& numLabels);

/**
 * @brief Label connected components with face connectivity
 */
LabelImage LabelConnectedComponents(const QVolume<uint8_t>& binary, int32_t& numLabels);

/**
 * @brief Map the distinct non-zero labels to 1..K, preserving their order
 *
 * Label 0 stays 0. Negative labels are treated like any other non-zero
 * value and sorted below the positive ones.
 *
 * @param[out] numLabels K
 */
LabelImage RelabelSequential(const LabelImage& labels, int32_t& numLabels);

/**
 * @brief Voxel count per label value
 *
 * @return Histogram of size max(label) + 1 (index 0 = background)
 * @throws InvalidArgumentException if a label is negative
 */
std::vector<int64_t> LabelHistogram(const LabelImage& labels);

} // namespace Cell::Declump::Internal
