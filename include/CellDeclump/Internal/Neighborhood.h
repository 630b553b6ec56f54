#pragma once

/**
 * @file Neighborhood.h
 * @brief Neighbour offset tables for 2D/3D connectivity
 *
 * Connectivity follows the scipy.ndimage convention: an offset belongs to
 * the neighbourhood when its number of non-zero components is at most the
 * connectivity. In 2D, 1 gives the 4-neighbourhood and 2 the
 * 8-neighbourhood; in 3D, 1 gives 6, 2 gives 18 and 3 gives 26.
 */

#include <CellDeclump/Core/QVolume.h>
#include <CellDeclump/Core/Types.h>

#include <vector>

namespace Cell::Declump::Internal {

/**
 * @brief All neighbour offsets (centre excluded), raster order
 *
 * @param ndim 2 or 3 (2D offsets have dz == 0)
 * @param connectivity 1..ndim
 */
std::vector<Point3i> NeighborOffsets(int32_t ndim, int32_t connectivity);

/**
 * @brief Neighbour offsets that precede the centre in raster order
 *
 * Used by single-sweep algorithms (labelling first pass).
 */
std::vector<Point3i> PrecedingNeighborOffsets(int32_t ndim, int32_t connectivity);

/**
 * @brief Visit in-bounds neighbours of a voxel
 *
 * @param fn Called with the neighbour's linear index
 */
template<typename T, typename Fn>
inline void ForEachNeighbor(const QVolume<T>& volume, size_t index,
                            const std::vector<Point3i>& offsets, Fn&& fn) {
    Point3i p = volume.Coord(index);
    for (const auto& o : offsets) {
        Point3i q = p + o;
        if (volume.Contains(q)) {
            fn(volume.Index(q));
        }
    }
}

} // namespace Cell::Declump::Internal
