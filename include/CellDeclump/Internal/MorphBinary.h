#pragma once

/**
 * @file MorphBinary.h
 * @brief Binary morphology and label boundaries on 2D/3D volumes
 *
 * This module provides:
 * - Dilation of a binary mask with a structuring element
 * - Inner and outer boundaries of a label image
 *
 * Reference skimage operators:
 * - skimage.morphology.binary_dilation
 * - skimage.segmentation.find_boundaries(mode="inner" / "outer")
 */

#include <CellDeclump/Core/QVolume.h>
#include <CellDeclump/Morphology/StructElement.h>

namespace Cell::Declump::Internal {

// =============================================================================
// Dilation
// =============================================================================

/**
 * @brief Dilate mask with structuring element
 *
 * Result = union of all translations of the element anchored at a
 * foreground voxel, clipped to the volume.
 *
 * @param mask Input mask (non-zero = foreground)
 * @param se Structuring element of the same dimensionality
 * @return Dilated mask (0 / 1)
 * @throws DimensionMismatchException if se.NDim() != mask.NDim()
 * @throws InvalidArgumentException if se is empty
 */
QVolume<uint8_t> Dilate(const QVolume<uint8_t>& mask, const StructElement& se);

// =============================================================================
// Boundaries
// =============================================================================

enum class BoundaryMode {
    Inner,      ///< Object voxels touching a different label
    Outer       ///< Voxels just outside an object
};

/**
 * @brief Boundary mask of a label image
 *
 * Inner: a labelled voxel with at least one neighbour of another value.
 * Outer: a background voxel with a labelled neighbour, or a labelled voxel
 * that also touches a different non-zero label.
 *
 * The volume edge does not count as a boundary.
 *
 * @param labels Label image (0 = background)
 * @param mode Inner or Outer
 * @param connectivity 1..ndim
 * @return Boundary mask (0 / 1)
 */
QVolume<uint8_t> FindBoundaries(const LabelImage& labels, BoundaryMode mode,
                                int32_t connectivity = 1);

} // namespace Cell::Declump::Internal
