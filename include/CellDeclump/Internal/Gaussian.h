#pragma once

/**
 * @file Gaussian.h
 * @brief Gaussian kernels and separable smoothing for 2D/3D fields
 *
 * This module provides:
 * - Kernel radius computation from sigma and truncation
 * - Normalised 1D Gaussian kernels
 * - Isotropic separable smoothing with edge-replicate boundaries
 *
 * Used by:
 * - DistanceField (smoothing of the distance transform)
 * - Declump (smoothing of the watershed basin)
 *
 * Matches scipy.ndimage.gaussian_filter(mode="nearest", truncate=4.0).
 */

#include <CellDeclump/Core/QVolume.h>
#include <CellDeclump/Core/Types.h>

#include <cstdint>
#include <vector>

namespace Cell::Declump::Internal {

/**
 * @brief Gaussian kernel generator
 */
class Gaussian {
public:
    /**
     * @brief Kernel radius for given sigma
     *
     * Returns int(truncate * sigma + 0.5); 0 for sigma <= 0.
     */
    static int32_t ComputeRadius(double sigma, double truncate = DEFAULT_GAUSSIAN_TRUNCATE);

    /**
     * @brief Generate normalised 1D Gaussian kernel
     * @param sigma Standard deviation (<= 0 gives the delta kernel {1})
     * @param truncate Radius in standard deviations
     * @return Kernel of size 2 * radius + 1, sums to 1
     *
     * G(x) = exp(-x^2 / (2 sigma^2))
     */
    static std::vector<double> Kernel1D(double sigma,
                                        double truncate = DEFAULT_GAUSSIAN_TRUNCATE);
};

/**
 * @brief Isotropic Gaussian smoothing of a field
 *
 * Filters separably along every axis of the volume (x, y and z for 3D).
 * Samples beyond the edge repeat the edge value.
 *
 * @param field Input field
 * @param sigma Standard deviation in voxels (0 = unmodified copy)
 * @param truncate Radius in standard deviations
 * @throws InvalidArgumentException if sigma < 0
 */
QVolume<float> GaussianSmooth(const QVolume<float>& field, double sigma,
                              double truncate = DEFAULT_GAUSSIAN_TRUNCATE);

} // namespace Cell::Declump::Internal
