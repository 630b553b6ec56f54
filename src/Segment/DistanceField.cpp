/**
 * @file DistanceField.cpp
 * @brief Distance-to-background field implementation
 */

#include <CellDeclump/Segment/DistanceField.h>
#include <CellDeclump/Core/Validate.h>
#include <CellDeclump/Internal/DistanceTransform.h>
#include <CellDeclump/Internal/Gaussian.h>

#include <spdlog/spdlog.h>

namespace Cell::Declump::Segment {

ScalarField ComputeDistanceField(const QVolume<uint8_t>& mask,
                                 const DistanceFieldParams& params) {
    Validate::RequireNonNegative(params.sigma, "sigma", "ComputeDistanceField");
    CELLDECLUMP_REQUIRE_VOLUME(mask);

    ScalarField field;
    if (params.pad) {
        field = Internal::CropField(
            Internal::DistanceTransformEDT(Internal::PadBinary(mask, 1), params.spacing), 1);
    } else {
        field = Internal::DistanceTransformEDT(mask, params.spacing);
    }

    if (params.sigma > 0.0) {
        field = Internal::GaussianSmooth(field, params.sigma);
    }

    if (params.rescale) {
        float maxVal = field.Max();
        if (maxVal > 0.0f) {
            for (float& v : field.Values()) {
                v /= maxVal;
            }
        }
    }

    spdlog::debug("ComputeDistanceField: {}D, max distance {:.3f}", field.NDim(), field.Max());
    return field;
}

ScalarField ComputeDistanceField(const LabelImage& labels, const DistanceFieldParams& params) {
    return ComputeDistanceField(ForegroundMask(labels), params);
}

} // namespace Cell::Declump::Segment
