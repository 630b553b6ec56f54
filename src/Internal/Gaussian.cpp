/**
 * @file Gaussian.cpp
 * @brief Gaussian kernel and smoothing implementation
 */

#include <CellDeclump/Internal/Gaussian.h>
#include <CellDeclump/Core/Validate.h>

#include <algorithm>
#include <cmath>
#include <numeric>

namespace Cell::Declump::Internal {

// ============================================================================
// Kernels
// ============================================================================

int32_t Gaussian::ComputeRadius(double sigma, double truncate) {
    if (sigma <= 0.0) {
        return 0;
    }
    return static_cast<int32_t>(truncate * sigma + 0.5);
}

std::vector<double> Gaussian::Kernel1D(double sigma, double truncate) {
    int32_t radius = ComputeRadius(sigma, truncate);
    if (radius == 0) {
        // Delta function
        return {1.0};
    }

    std::vector<double> kernel(2 * radius + 1);
    double twoSigmaSq = 2.0 * sigma * sigma;
    for (int32_t i = -radius; i <= radius; ++i) {
        kernel[i + radius] = std::exp(-static_cast<double>(i) * i / twoSigmaSq);
    }

    double sum = std::accumulate(kernel.begin(), kernel.end(), 0.0);
    for (double& k : kernel) {
        k /= sum;
    }
    return kernel;
}

// ============================================================================
// Separable Smoothing
// ============================================================================

namespace {

void ConvolveAxis(std::vector<double>& data, const Size3i& size, int axis,
                  const std::vector<double>& kernel) {
    int32_t n = size.Axis(axis);
    int32_t radius = static_cast<int32_t>(kernel.size() / 2);
    if (n <= 0) return;

    size_t stride = 1;
    if (axis == 0) stride = static_cast<size_t>(size.height) * size.width;
    if (axis == 1) stride = static_cast<size_t>(size.width);

    std::vector<double> line(n);

    for (int32_t z = 0; z < (axis == 0 ? 1 : size.depth); ++z) {
        for (int32_t y = 0; y < (axis == 1 ? 1 : size.height); ++y) {
            for (int32_t x = 0; x < (axis == 2 ? 1 : size.width); ++x) {
                size_t start = (static_cast<size_t>(z) * size.height + y) * size.width + x;
                for (int32_t i = 0; i < n; ++i) {
                    line[i] = data[start + i * stride];
                }
                for (int32_t i = 0; i < n; ++i) {
                    double acc = 0.0;
                    for (int32_t k = -radius; k <= radius; ++k) {
                        // Edge replicate
                        int32_t j = std::clamp(i + k, 0, n - 1);
                        acc += kernel[k + radius] * line[j];
                    }
                    data[start + i * stride] = acc;
                }
            }
        }
    }
}

} // anonymous namespace

QVolume<float> GaussianSmooth(const QVolume<float>& field, double sigma, double truncate) {
    Validate::RequireNonNegative(sigma, "sigma", "GaussianSmooth");
    CELLDECLUMP_REQUIRE_VOLUME(field);

    std::vector<double> kernel = Gaussian::Kernel1D(sigma, truncate);
    if (kernel.size() == 1) {
        return field;
    }

    std::vector<double> data(field.Values().begin(), field.Values().end());
    int firstAxis = field.NDim() == 3 ? 0 : 1;
    for (int axis = firstAxis; axis < 3; ++axis) {
        ConvolveAxis(data, field.Size(), axis, kernel);
    }

    QVolume<float> result = QVolume<float>::Like(field);
    for (size_t i = 0; i < data.size(); ++i) {
        result[i] = static_cast<float>(data[i]);
    }
    return result;
}

} // namespace Cell::Declump::Internal
