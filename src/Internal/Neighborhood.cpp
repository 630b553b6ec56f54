/**
 * @file Neighborhood.cpp
 * @brief Connectivity offset tables
 */

#include <CellDeclump/Internal/Neighborhood.h>
#include <CellDeclump/Core/Validate.h>

namespace Cell::Declump::Internal {

std::vector<Point3i> NeighborOffsets(int32_t ndim, int32_t connectivity) {
    Validate::RequireRange(ndim, 2, 3, "ndim", "NeighborOffsets");
    Validate::RequireConnectivity(connectivity, ndim, "NeighborOffsets");

    std::vector<Point3i> offsets;
    int32_t zRange = (ndim == 3) ? 1 : 0;
    for (int32_t dz = -zRange; dz <= zRange; ++dz) {
        for (int32_t dy = -1; dy <= 1; ++dy) {
            for (int32_t dx = -1; dx <= 1; ++dx) {
                int32_t nonZero = (dz != 0) + (dy != 0) + (dx != 0);
                if (nonZero == 0 || nonZero > connectivity) continue;
                offsets.emplace_back(dz, dy, dx);
            }
        }
    }
    return offsets;
}

std::vector<Point3i> PrecedingNeighborOffsets(int32_t ndim, int32_t connectivity) {
    std::vector<Point3i> preceding;
    for (const auto& o : NeighborOffsets(ndim, connectivity)) {
        bool before = o.z < 0 || (o.z == 0 && (o.y < 0 || (o.y == 0 && o.x < 0)));
        if (before) {
            preceding.push_back(o);
        }
    }
    return preceding;
}

} // namespace Cell::Declump::Internal
