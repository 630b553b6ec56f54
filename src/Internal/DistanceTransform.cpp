/**
 * @file DistanceTransform.cpp
 * @brief Exact Euclidean distance transform (separable lower envelope)
 */

#include <CellDeclump/Internal/DistanceTransform.h>
#include <CellDeclump/Core/Validate.h>

#include <algorithm>
#include <cmath>
#include <limits>

namespace Cell::Declump::Internal {

// =============================================================================
// Constants
// =============================================================================

constexpr double INF_DIST = std::numeric_limits<double>::infinity();

namespace {

// First axis taking part in the transform (z is skipped for 2D volumes)
int FirstAxis(const QVolume<uint8_t>& volume) {
    return volume.NDim() == 3 ? 0 : 1;
}

std::vector<double> ResolveSpacing(const QVolume<uint8_t>& binary,
                                   const std::vector<double>& spacing) {
    std::vector<double> perAxis(3, 1.0);
    if (spacing.empty()) return perAxis;

    if (static_cast<int32_t>(spacing.size()) != binary.NDim()) {
        throw InvalidArgumentException(
            "DistanceTransformEDT: spacing must have " + std::to_string(binary.NDim()) +
            " entries, got " + std::to_string(spacing.size()));
    }
    for (double s : spacing) {
        Validate::RequirePositive(s, "spacing", "DistanceTransformEDT");
    }

    int first = FirstAxis(binary);
    for (size_t i = 0; i < spacing.size(); ++i) {
        perAxis[first + i] = spacing[i];
    }
    return perAxis;
}

// Run the 1D transform over every line parallel to axis
void TransformAxis(std::vector<double>& dist2, const Size3i& size, int axis, double spacing) {
    int32_t n = size.Axis(axis);
    if (n <= 1) {
        return;
    }

    size_t stride = 1;
    if (axis == 0) stride = static_cast<size_t>(size.height) * size.width;
    if (axis == 1) stride = static_cast<size_t>(size.width);

    std::vector<double> line(n);

    for (int32_t z = 0; z < (axis == 0 ? 1 : size.depth); ++z) {
        for (int32_t y = 0; y < (axis == 1 ? 1 : size.height); ++y) {
            for (int32_t x = 0; x < (axis == 2 ? 1 : size.width); ++x) {
                size_t start = (static_cast<size_t>(z) * size.height + y) * size.width + x;
                for (int32_t i = 0; i < n; ++i) {
                    line[i] = dist2[start + i * stride];
                }
                DistanceTransform1D(line, spacing);
                for (int32_t i = 0; i < n; ++i) {
                    dist2[start + i * stride] = line[i];
                }
            }
        }
    }
}

} // anonymous namespace

// =============================================================================
// 1D Transform (lower envelope of parabolas)
// =============================================================================

void DistanceTransform1D(std::vector<double>& f, double spacing) {
    const int32_t n = static_cast<int32_t>(f.size());
    if (n == 0) return;

    const double s2 = spacing * spacing;
    std::vector<int32_t> v(n);       // Parabola positions
    std::vector<double> z(n + 1);    // Envelope boundaries
    int32_t k = -1;

    // Intersection of parabolas rooted at q and p
    auto intersect = [&](int32_t p, int32_t q) {
        double fp = f[p] + s2 * static_cast<double>(p) * p;
        double fq = f[q] + s2 * static_cast<double>(q) * q;
        return (fq - fp) / (2.0 * s2 * (q - p));
    };

    for (int32_t q = 0; q < n; ++q) {
        if (f[q] == INF_DIST) continue;

        if (k < 0) {
            k = 0;
            v[0] = q;
            z[0] = -INF_DIST;
            z[1] = INF_DIST;
            continue;
        }

        double s = intersect(v[k], q);
        while (s <= z[k]) {
            --k;
            s = intersect(v[k], q);
        }
        ++k;
        v[k] = q;
        z[k] = s;
        z[k + 1] = INF_DIST;
    }

    if (k < 0) {
        // No source on this line
        return;
    }

    std::vector<double> d(n);
    k = 0;
    for (int32_t p = 0; p < n; ++p) {
        while (z[k + 1] < p) {
            ++k;
        }
        double dp = static_cast<double>(p - v[k]);
        d[p] = s2 * dp * dp + f[v[k]];
    }
    f.swap(d);
}

// =============================================================================
// Distance Transform
// =============================================================================

QVolume<float> DistanceTransformEDT(const QVolume<uint8_t>& binary,
                                    const std::vector<double>& spacing) {
    if (binary.Empty()) return {};

    std::vector<double> perAxis = ResolveSpacing(binary, spacing);

    bool hasBackground = std::any_of(binary.Values().begin(), binary.Values().end(),
                                     [](uint8_t v) { return v == 0; });
    if (!hasBackground) {
        // Measure against the exterior instead
        QVolume<float> padded = DistanceTransformEDT(PadBinary(binary, 1), spacing);
        return CropField(padded, 1);
    }

    std::vector<double> dist2(binary.NumVoxels());
    for (size_t i = 0; i < dist2.size(); ++i) {
        dist2[i] = binary[i] != 0 ? INF_DIST : 0.0;
    }

    for (int axis = FirstAxis(binary); axis < 3; ++axis) {
        TransformAxis(dist2, binary.Size(), axis, perAxis[axis]);
    }

    QVolume<float> result = QVolume<float>::Like(binary);
    for (size_t i = 0; i < dist2.size(); ++i) {
        result[i] = static_cast<float>(std::sqrt(dist2[i]));
    }
    return result;
}

// =============================================================================
// Padding
// =============================================================================

QVolume<uint8_t> PadBinary(const QVolume<uint8_t>& binary, int32_t pad) {
    CELLDECLUMP_REQUIRE_NON_NEGATIVE(pad);
    if (binary.Empty() || pad == 0) return binary;

    Size3i size = binary.Size();
    Size3i padded = size;
    padded.height += 2 * pad;
    padded.width += 2 * pad;
    int32_t zPad = 0;
    if (size.ndim == 3) {
        padded.depth += 2 * pad;
        zPad = pad;
    }

    QVolume<uint8_t> result(padded, 0);
    for (int32_t z = 0; z < size.depth; ++z) {
        for (int32_t y = 0; y < size.height; ++y) {
            for (int32_t x = 0; x < size.width; ++x) {
                result.At(z + zPad, y + pad, x + pad) = binary.At(z, y, x);
            }
        }
    }
    return result;
}

QVolume<float> CropField(const QVolume<float>& field, int32_t pad) {
    CELLDECLUMP_REQUIRE_NON_NEGATIVE(pad);
    if (field.Empty() || pad == 0) return field;

    Size3i size = field.Size();
    Size3i cropped = size;
    cropped.height -= 2 * pad;
    cropped.width -= 2 * pad;
    int32_t zPad = 0;
    if (size.ndim == 3) {
        cropped.depth -= 2 * pad;
        zPad = pad;
    }
    if (cropped.depth <= 0 || cropped.height <= 0 || cropped.width <= 0) {
        throw InvalidArgumentException("CropField: pad " + std::to_string(pad) +
                                       " removes the whole volume");
    }

    QVolume<float> result(cropped);
    for (int32_t z = 0; z < cropped.depth; ++z) {
        for (int32_t y = 0; y < cropped.height; ++y) {
            for (int32_t x = 0; x < cropped.width; ++x) {
                result.At(z, y, x) = field.At(z + zPad, y + pad, x + pad);
            }
        }
    }
    return result;
}

} // namespace Cell::Declump::Internal
