#pragma once

/**
 * @file Validate.h
 * @brief Unified validation utilities for CellDeclump
 *
 * Design principles:
 * - Parameters are validated before any voxel is touched
 * - Empty volume returns false (not an error), invalid throws
 * - Consistent error message format: "<func>: <param> must be ..."
 *
 * Layered API:
 * - RequireVolume(): only checks empty (no-op signal)
 * - RequireSameShape(), RequireMatchingNDim(): cross-input checks
 * - RequireRange(), RequireNonNegative(), ...: scalar parameters
 */

#include <CellDeclump/Core/Export.h>
#include <CellDeclump/Core/Exception.h>
#include <CellDeclump/Core/QVolume.h>

#include <cstdio>
#include <string>

namespace Cell::Declump::Validate {

// =============================================================================
// Internal Formatting
// =============================================================================

namespace Detail {

// Format double with limited precision (avoid long tails)
inline std::string FormatValue(double val) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.4g", val);
    return buf;
}

inline std::string FormatValue(float val) {
    return FormatValue(static_cast<double>(val));
}

inline std::string FormatValue(int32_t val) {
    return std::to_string(val);
}

inline std::string FormatValue(int64_t val) {
    return std::to_string(val);
}

inline std::string FormatSize(const Size3i& s) {
    if (s.ndim == 2) {
        return "(" + std::to_string(s.height) + ", " + std::to_string(s.width) + ")";
    }
    return "(" + std::to_string(s.depth) + ", " + std::to_string(s.height) + ", " +
           std::to_string(s.width) + ")";
}

} // namespace Detail

// =============================================================================
// Volume Validation
// =============================================================================

/**
 * @brief Check volume is allocated
 *
 * Use this when an empty volume should be a silent no-op.
 *
 * @return false if empty (caller should return empty result)
 */
template<typename T>
inline bool RequireVolume(const QVolume<T>& volume, const char* funcName) {
    (void)funcName;
    return !volume.Empty();
}

/**
 * @brief Check two volumes have identical extents and dimensionality
 * @throws DimensionMismatchException on mismatch
 */
template<typename T, typename U>
inline void RequireSameShape(const QVolume<T>& a, const QVolume<U>& b,
                             const char* nameA, const char* nameB, const char* funcName) {
    if (!a.SameShape(b)) {
        throw DimensionMismatchException(
            std::string(funcName) + ": " + nameA + " " + Detail::FormatSize(a.Size()) +
            " and " + nameB + " " + Detail::FormatSize(b.Size()) + " differ");
    }
}

/**
 * @brief Check two objects have the same number of dimensions
 * @throws DimensionMismatchException on mismatch
 */
inline void RequireMatchingNDim(int32_t ndimA, int32_t ndimB,
                                const char* nameA, const char* nameB, const char* funcName) {
    if (ndimA != ndimB) {
        throw DimensionMismatchException(
            std::string(funcName) + ": " + nameA + " is " + std::to_string(ndimA) + "D but " +
            nameB + " is " + std::to_string(ndimB) + "D");
    }
}

/**
 * @brief Check connectivity is in [1, ndim]
 */
inline void RequireConnectivity(int32_t connectivity, int32_t ndim, const char* funcName) {
    if (connectivity < 1 || connectivity > ndim) {
        throw InvalidArgumentException(
            std::string(funcName) + ": connectivity must be in [1, " + std::to_string(ndim) +
            "], got " + std::to_string(connectivity));
    }
}

// =============================================================================
// Value Range Validation
// =============================================================================

/**
 * @brief Validate value is in range [min, max]
 */
template<typename T>
inline void RequireRange(T value, T minVal, T maxVal,
                         const char* paramName, const char* funcName) {
    if (value < minVal || value > maxVal) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName + " must be in [" +
            Detail::FormatValue(minVal) + ", " + Detail::FormatValue(maxVal) +
            "], got " + Detail::FormatValue(value));
    }
}

/**
 * @brief Validate value is positive (> 0)
 */
template<typename T>
inline void RequirePositive(T value, const char* paramName, const char* funcName) {
    if (value <= T(0)) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName + " must be > 0, got " +
            Detail::FormatValue(value));
    }
}

/**
 * @brief Validate value is non-negative (>= 0)
 */
template<typename T>
inline void RequireNonNegative(T value, const char* paramName, const char* funcName) {
    if (value < T(0)) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName + " must be >= 0, got " +
            Detail::FormatValue(value));
    }
}

/**
 * @brief Validate value is non-negative or equal to a "disabled" sentinel
 */
inline void RequireNonNegativeOr(int32_t value, int32_t sentinel,
                                 const char* paramName, const char* funcName) {
    if (value < 0 && value != sentinel) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName + " must be >= 0 or " +
            std::to_string(sentinel) + ", got " + std::to_string(value));
    }
}

// =============================================================================
// Convenience Macros
// =============================================================================

/**
 * Early return {} for empty volume input
 */
#define CELLDECLUMP_REQUIRE_VOLUME(vol) \
    if (!::Cell::Declump::Validate::RequireVolume(vol, __func__)) return {}

#define CELLDECLUMP_REQUIRE_RANGE(val, min, max) \
    ::Cell::Declump::Validate::RequireRange(val, min, max, #val, __func__)

#define CELLDECLUMP_REQUIRE_POSITIVE(val) \
    ::Cell::Declump::Validate::RequirePositive(val, #val, __func__)

#define CELLDECLUMP_REQUIRE_NON_NEGATIVE(val) \
    ::Cell::Declump::Validate::RequireNonNegative(val, #val, __func__)

} // namespace Cell::Declump::Validate
