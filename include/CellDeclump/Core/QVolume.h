#pragma once

/**
 * @file QVolume.h
 * @brief Dense 2D/3D voxel array
 *
 * Key features:
 * - One container for planar images and volumetric stacks
 * - Value semantics (copies are deep, inputs are never aliased)
 * - Raster (z, y, x) linear indexing shared by all algorithms
 */

#include <CellDeclump/Core/Types.h>
#include <CellDeclump/Core/Exception.h>

#include <algorithm>
#include <string>
#include <vector>

namespace Cell::Declump {

/**
 * @brief Dense 2D or 3D array of voxels
 *
 * 2D volumes have depth 1 and NDim() == 2. The element at (z, y, x) is
 * stored at index (z * height + y) * width + x.
 */
template<typename T>
class QVolume {
public:
    using value_type = T;

    // =========================================================================
    // Constructors
    // =========================================================================

    /// Default constructor (empty volume)
    QVolume() = default;

    /// Create volume with given extents, filled with value
    explicit QVolume(const Size3i& size, T value = T{}) : size_(size) {
        if (size.ndim != 2 && size.ndim != 3) {
            throw InvalidArgumentException("QVolume: ndim must be 2 or 3, got " +
                                           std::to_string(size.ndim));
        }
        if (size.depth <= 0 || size.height <= 0 || size.width <= 0) {
            throw InvalidArgumentException("QVolume: dimensions must be positive");
        }
        if (size.ndim == 2 && size.depth != 1) {
            throw InvalidArgumentException("QVolume: 2D volume must have depth 1");
        }
        data_.assign(size.Count(), value);
    }

    // =========================================================================
    // Factory Methods
    // =========================================================================

    /// Create 2D volume
    static QVolume Create2D(int32_t height, int32_t width, T value = T{}) {
        return QVolume(Size3i::Plane(height, width), value);
    }

    /// Create 3D volume
    static QVolume Create3D(int32_t depth, int32_t height, int32_t width, T value = T{}) {
        return QVolume(Size3i::Stack(depth, height, width), value);
    }

    /// Create volume of another volume's extents
    template<typename U>
    static QVolume Like(const QVolume<U>& other, T value = T{}) {
        if (other.Empty()) return QVolume();
        return QVolume(other.Size(), value);
    }

    // =========================================================================
    // Basic Properties
    // =========================================================================

    int32_t NDim() const { return size_.ndim; }
    int32_t Depth() const { return size_.depth; }
    int32_t Height() const { return size_.height; }
    int32_t Width() const { return size_.width; }
    const Size3i& Size() const { return size_; }
    size_t NumVoxels() const { return data_.size(); }
    bool Empty() const { return data_.empty(); }

    template<typename U>
    bool SameShape(const QVolume<U>& other) const {
        return size_ == other.Size();
    }

    // =========================================================================
    // Data Access
    // =========================================================================

    T* Data() { return data_.data(); }
    const T* Data() const { return data_.data(); }

    std::vector<T>& Values() { return data_; }
    const std::vector<T>& Values() const { return data_; }

    T& operator[](size_t index) { return data_[index]; }
    const T& operator[](size_t index) const { return data_[index]; }

    /// Linear index of (z, y, x)
    size_t Index(int32_t z, int32_t y, int32_t x) const {
        return (static_cast<size_t>(z) * size_.height + static_cast<size_t>(y)) *
               size_.width + static_cast<size_t>(x);
    }

    size_t Index(const Point3i& p) const { return Index(p.z, p.y, p.x); }

    /// Coordinate of linear index
    Point3i Coord(size_t index) const {
        size_t plane = static_cast<size_t>(size_.height) * size_.width;
        int32_t z = static_cast<int32_t>(index / plane);
        size_t rem = index % plane;
        return {z, static_cast<int32_t>(rem / size_.width),
                static_cast<int32_t>(rem % size_.width)};
    }

    bool Contains(const Point3i& p) const {
        return p.z >= 0 && p.z < size_.depth && p.y >= 0 && p.y < size_.height &&
               p.x >= 0 && p.x < size_.width;
    }

    /// 2D access
    T& At(int32_t y, int32_t x) { return data_[Index(0, y, x)]; }
    const T& At(int32_t y, int32_t x) const { return data_[Index(0, y, x)]; }

    /// 3D access
    T& At(int32_t z, int32_t y, int32_t x) { return data_[Index(z, y, x)]; }
    const T& At(int32_t z, int32_t y, int32_t x) const { return data_[Index(z, y, x)]; }

    T& At(const Point3i& p) { return data_[Index(p)]; }
    const T& At(const Point3i& p) const { return data_[Index(p)]; }

    // =========================================================================
    // Operations
    // =========================================================================

    void Fill(T value) { std::fill(data_.begin(), data_.end(), value); }

    /// Minimum value (T{} for empty volume)
    T Min() const {
        if (data_.empty()) return T{};
        return *std::min_element(data_.begin(), data_.end());
    }

    /// Maximum value (T{} for empty volume)
    T Max() const {
        if (data_.empty()) return T{};
        return *std::max_element(data_.begin(), data_.end());
    }

    /// Number of voxels different from T{}
    size_t CountNonZero() const {
        return static_cast<size_t>(std::count_if(data_.begin(), data_.end(),
                                                 [](const T& v) { return v != T{}; }));
    }

    /// Copy of plane z as a 2D volume
    QVolume Slice(int32_t z) const {
        if (z < 0 || z >= size_.depth) {
            throw OutOfRangeException("QVolume::Slice: z=" + std::to_string(z) +
                                      " outside [0, " + std::to_string(size_.depth) + ")");
        }
        QVolume plane = Create2D(size_.height, size_.width);
        size_t planeSize = static_cast<size_t>(size_.height) * size_.width;
        std::copy(data_.begin() + z * planeSize, data_.begin() + (z + 1) * planeSize,
                  plane.data_.begin());
        return plane;
    }

    /// Overwrite plane z with a 2D volume of matching height/width
    void SetSlice(int32_t z, const QVolume& plane) {
        if (z < 0 || z >= size_.depth) {
            throw OutOfRangeException("QVolume::SetSlice: z=" + std::to_string(z));
        }
        if (plane.NDim() != 2 || plane.Height() != size_.height ||
            plane.Width() != size_.width) {
            throw DimensionMismatchException("QVolume::SetSlice: plane extents differ");
        }
        size_t planeSize = static_cast<size_t>(size_.height) * size_.width;
        std::copy(plane.data_.begin(), plane.data_.end(), data_.begin() + z * planeSize);
    }

    /// Element-wise conversion to another value type
    template<typename U>
    QVolume<U> ConvertTo() const {
        QVolume<U> result = QVolume<U>::Like(*this);
        for (size_t i = 0; i < data_.size(); ++i) {
            result[i] = static_cast<U>(data_[i]);
        }
        return result;
    }

    bool operator==(const QVolume& other) const {
        return size_ == other.size_ && data_ == other.data_;
    }

    bool operator!=(const QVolume& other) const { return !(*this == other); }

private:
    Size3i size_;
    std::vector<T> data_;
};

// =============================================================================
// Domain Aliases
// =============================================================================

/// Integer object labels, 0 = background
using LabelImage = QVolume<int32_t>;

/// Floating point field (distance or intensity)
using ScalarField = QVolume<float>;

/// Boolean mask stored as 0 / 1
using SeedMask = QVolume<uint8_t>;

/// Foreground mask (label != 0) of a label image
inline QVolume<uint8_t> ForegroundMask(const LabelImage& labels) {
    QVolume<uint8_t> mask = QVolume<uint8_t>::Like(labels);
    for (size_t i = 0; i < labels.NumVoxels(); ++i) {
        mask[i] = labels[i] != BACKGROUND_LABEL ? 1 : 0;
    }
    return mask;
}

} // namespace Cell::Declump
