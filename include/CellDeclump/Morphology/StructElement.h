#pragma once

/**
 * @file StructElement.h
 * @brief Structuring elements for seed dilation
 *
 * This module provides:
 * - Planar elements (disk, square, rectangle, diamond)
 * - Volumetric elements (ball, cube, octahedron)
 * - Custom elements from a binary mask
 * - Parsing of the host's "shape,size" setting text
 *
 * An element carries its dimensionality. A 2D element can only be applied
 * to 2D label images and a 3D element to 3D ones; mixing them raises
 * DimensionMismatchException.
 */

#include <CellDeclump/Core/Export.h>
#include <CellDeclump/Core/QVolume.h>
#include <CellDeclump/Core/Types.h>

#include <string>
#include <vector>

namespace Cell::Declump {

// =============================================================================
// Types
// =============================================================================

/// Structuring element shape type
enum class StructElementShape {
    Disk,           ///< x^2 + y^2 <= r^2
    Square,         ///< Square of odd side length
    Rectangle,      ///< Rectangle of odd side lengths
    Diamond,        ///< |x| + |y| <= r
    Ball,           ///< x^2 + y^2 + z^2 <= r^2
    Cube,           ///< Cube of odd side length
    Octahedron,     ///< |x| + |y| + |z| <= r
    Custom          ///< User-defined mask
};

/**
 * @brief Binary structuring element with a centred anchor
 *
 * Extents are always odd so the anchor sits at the centre voxel.
 */
class CELLDECLUMP_API StructElement {
public:
    /// Default constructor (empty structuring element)
    StructElement() = default;

    // =========================================================================
    // Factory Methods - 2D
    // =========================================================================

    /**
     * @brief Create disk-shaped element
     * @param radius Disk radius (>= 0, 0 = single pixel)
     */
    static StructElement Disk(int32_t radius);

    /**
     * @brief Create square element
     * @param width Side length (odd)
     */
    static StructElement Square(int32_t width);

    /**
     * @brief Create rectangular element
     * @param height Height (odd)
     * @param width Width (odd)
     */
    static StructElement Rectangle(int32_t height, int32_t width);

    /**
     * @brief Create diamond-shaped element
     * @param radius Distance from centre to vertex (>= 0)
     */
    static StructElement Diamond(int32_t radius);

    // =========================================================================
    // Factory Methods - 3D
    // =========================================================================

    /// Ball of given radius (>= 0)
    static StructElement Ball(int32_t radius);

    /// Cube of given odd side length
    static StructElement Cube(int32_t width);

    /// Octahedron of given radius (>= 0)
    static StructElement Octahedron(int32_t radius);

    // =========================================================================
    // Factory Methods - From Data
    // =========================================================================

    /**
     * @brief Create structuring element from binary mask
     *
     * The element takes the mask's dimensionality. Every extent must be odd.
     *
     * @param mask Binary volume (non-zero = part of element)
     */
    static StructElement FromMask(const QVolume<uint8_t>& mask);

    /**
     * @brief Parse "shape,size" text, e.g. "disk,1" or "ball,2"
     *
     * Accepted shapes: disk, square, diamond, ball, cube, octahedron.
     *
     * @throws InvalidArgumentException on malformed text or unknown shape
     */
    static StructElement Parse(const std::string& text);

    // =========================================================================
    // Properties
    // =========================================================================

    bool Empty() const { return mask_.Empty(); }

    /// Number of dimensions (2 or 3, 0 if empty)
    int32_t NDim() const { return mask_.Empty() ? 0 : mask_.NDim(); }

    const Size3i& Size() const { return mask_.Size(); }

    /// Anchor (centre) coordinate within the mask
    Point3i Anchor() const;

    StructElementShape Shape() const { return shape_; }

    /// Number of voxels in element
    size_t PixelCount() const { return offsets_.size(); }

    /// Check offset relative to anchor (2D)
    bool Contains(int32_t dy, int32_t dx) const { return Contains(0, dy, dx); }

    /// Check offset relative to anchor (3D)
    bool Contains(int32_t dz, int32_t dy, int32_t dx) const;

    /// Offsets of all element voxels relative to the anchor, raster order
    const std::vector<Point3i>& Offsets() const { return offsets_; }

    const QVolume<uint8_t>& Mask() const { return mask_; }

    /// Text form, e.g. "disk,2" ("custom" for mask-based elements)
    std::string ToString() const;

private:
    StructElement(StructElementShape shape, int32_t parameter, QVolume<uint8_t> mask);

    StructElementShape shape_ = StructElementShape::Custom;
    int32_t parameter_ = 0;
    QVolume<uint8_t> mask_;
    std::vector<Point3i> offsets_;
};

} // namespace Cell::Declump
