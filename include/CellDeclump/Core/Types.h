#pragma once

/**
 * @file Types.h
 * @brief Core type definitions for CellDeclump
 */

#include <CellDeclump/Core/Export.h>

#include <cstdint>
#include <cstddef>

namespace Cell::Declump {

// =============================================================================
// Constants
// =============================================================================

/// Label value reserved for background
constexpr int32_t BACKGROUND_LABEL = 0;

/// Sentinel: disable the minimum-distance window of the seed search
constexpr int32_t NO_MIN_DISTANCE = -1;

/// Sentinel: no global cap on the number of seeds
constexpr int32_t UNLIMITED_SEEDS = -1;

/// Default Gaussian truncation (kernel radius in standard deviations)
constexpr double DEFAULT_GAUSSIAN_TRUNCATE = 4.0;

/// Mathematical constant pi
constexpr double PI = 3.14159265358979323846;

// =============================================================================
// Voxel Coordinates
// =============================================================================

/**
 * @brief Integer voxel coordinate (z is 0 for 2D data)
 */
struct CELLDECLUMP_API Point3i {
    int32_t z = 0;
    int32_t y = 0;
    int32_t x = 0;

    Point3i() = default;
    Point3i(int32_t z_, int32_t y_, int32_t x_) : z(z_), y(y_), x(x_) {}

    Point3i operator+(const Point3i& other) const {
        return {z + other.z, y + other.y, x + other.x};
    }

    Point3i operator-(const Point3i& other) const {
        return {z - other.z, y - other.y, x - other.x};
    }

    bool operator==(const Point3i& other) const {
        return z == other.z && y == other.y && x == other.x;
    }

    bool operator!=(const Point3i& other) const {
        return !(*this == other);
    }
};

// =============================================================================
// Volume Extents
// =============================================================================

/**
 * @brief Extents of a 2D or 3D volume
 *
 * A 2D extent has ndim == 2 and depth == 1.
 */
struct CELLDECLUMP_API Size3i {
    int32_t depth = 1;
    int32_t height = 0;
    int32_t width = 0;
    int32_t ndim = 2;

    Size3i() = default;

    /// 2D extent
    static Size3i Plane(int32_t height, int32_t width) {
        Size3i s;
        s.depth = 1;
        s.height = height;
        s.width = width;
        s.ndim = 2;
        return s;
    }

    /// 3D extent
    static Size3i Stack(int32_t depth, int32_t height, int32_t width) {
        Size3i s;
        s.depth = depth;
        s.height = height;
        s.width = width;
        s.ndim = 3;
        return s;
    }

    size_t Count() const {
        return static_cast<size_t>(depth) * static_cast<size_t>(height) *
               static_cast<size_t>(width);
    }

    /// Extent along axis (0 = z, 1 = y, 2 = x)
    int32_t Axis(int axis) const {
        switch (axis) {
            case 0: return depth;
            case 1: return height;
            default: return width;
        }
    }

    bool operator==(const Size3i& other) const {
        return ndim == other.ndim && depth == other.depth &&
               height == other.height && width == other.width;
    }

    bool operator!=(const Size3i& other) const {
        return !(*this == other);
    }
};

} // namespace Cell::Declump
