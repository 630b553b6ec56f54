/**
 * @file MorphBinary.cpp
 * @brief Binary dilation and label boundaries
 */

#include <CellDeclump/Internal/MorphBinary.h>
#include <CellDeclump/Internal/Neighborhood.h>
#include <CellDeclump/Core/Validate.h>

namespace Cell::Declump::Internal {

// =============================================================================
// Dilation
// =============================================================================

QVolume<uint8_t> Dilate(const QVolume<uint8_t>& mask, const StructElement& se) {
    if (se.Empty()) {
        throw InvalidArgumentException("Dilate: structuring element is empty");
    }
    Validate::RequireMatchingNDim(se.NDim(), mask.NDim(), "structuring element", "mask",
                                  "Dilate");
    CELLDECLUMP_REQUIRE_VOLUME(mask);

    QVolume<uint8_t> result = QVolume<uint8_t>::Like(mask);
    const auto& offsets = se.Offsets();

    for (size_t idx = 0; idx < mask.NumVoxels(); ++idx) {
        if (mask[idx] == 0) continue;
        ForEachNeighbor(mask, idx, offsets, [&](size_t n) { result[n] = 1; });
    }
    return result;
}

// =============================================================================
// Boundaries
// =============================================================================

QVolume<uint8_t> FindBoundaries(const LabelImage& labels, BoundaryMode mode,
                                int32_t connectivity) {
    CELLDECLUMP_REQUIRE_VOLUME(labels);
    Validate::RequireConnectivity(connectivity, labels.NDim(), "FindBoundaries");

    std::vector<Point3i> offsets = NeighborOffsets(labels.NDim(), connectivity);
    std::vector<Point3i> fullOffsets = NeighborOffsets(labels.NDim(), labels.NDim());

    QVolume<uint8_t> result = QVolume<uint8_t>::Like(labels);

    for (size_t idx = 0; idx < labels.NumVoxels(); ++idx) {
        int32_t v = labels[idx];

        bool differs = false;
        ForEachNeighbor(labels, idx, offsets, [&](size_t n) {
            if (labels[n] != v) differs = true;
        });
        if (!differs) continue;

        if (mode == BoundaryMode::Inner) {
            result[idx] = v != BACKGROUND_LABEL ? 1 : 0;
            continue;
        }

        if (v == BACKGROUND_LABEL) {
            result[idx] = 1;
            continue;
        }

        // Labelled voxel: outer only where two objects meet
        bool adjacentObject = false;
        ForEachNeighbor(labels, idx, fullOffsets, [&](size_t n) {
            if (labels[n] != BACKGROUND_LABEL && labels[n] != v) adjacentObject = true;
        });
        result[idx] = adjacentObject ? 1 : 0;
    }
    return result;
}

} // namespace Cell::Declump::Internal
