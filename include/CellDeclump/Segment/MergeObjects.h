#pragma once

#include <CellDeclump/Core/Export.h>

/**
 * @file MergeObjects.h
 * @brief Merging of undersized objects into their dominant neighbour
 *
 * Provides:
 * - Minimum object size from an equivalent diameter
 * - Single greedy pass merging each small object into the neighbour it
 *   shares the longest outer boundary with
 * - Optional contact-area gating (absolute voxel count or fraction of the
 *   small object's surface)
 * - Plane-by-plane operation for volumes
 *
 * Small objects are visited in ascending label order. Neighbour contacts
 * are always measured on the input labels, so a merge does not change the
 * contacts seen by objects visited later.
 */

#include <CellDeclump/Core/QVolume.h>
#include <CellDeclump/Core/Types.h>

#include <cstdint>

namespace Cell::Declump::Segment {

// =============================================================================
// Enums
// =============================================================================

/**
 * @brief Contact-area gate applied to the dominant neighbour
 */
enum class ContactAreaMethod {
    Absolute,       ///< Contact voxel count must exceed absoluteNeighborSize
    Relative        ///< Contact / own surface must exceed relativeNeighborSize
};

// =============================================================================
// Parameters
// =============================================================================

/**
 * @brief Merge parameters
 */
struct CELLDECLUMP_API MergeObjectsParams {
    double diameter = 64.0;                     ///< Objects smaller than this diameter are merged
    bool planewise = false;                     ///< Merge each z-plane of a volume separately
    bool removeBelowThreshold = false;          ///< Delete small objects with no object neighbour
    bool useContactArea = false;                ///< Gate merges on contact area
    ContactAreaMethod contactAreaMethod = ContactAreaMethod::Absolute;
    int32_t absoluteNeighborSize = 0;           ///< Minimum contact voxels (0 = any)
    double relativeNeighborSize = 0.0;          ///< Minimum contact fraction in [0, 1] (0 = any)

    static MergeObjectsParams Default(double diameter = 64.0) {
        MergeObjectsParams p;
        p.diameter = diameter;
        return p;
    }

    static MergeObjectsParams AbsoluteContact(double diameter, int32_t minContact) {
        MergeObjectsParams p;
        p.diameter = diameter;
        p.useContactArea = true;
        p.contactAreaMethod = ContactAreaMethod::Absolute;
        p.absoluteNeighborSize = minContact;
        return p;
    }

    static MergeObjectsParams RelativeContact(double diameter, double minFraction) {
        MergeObjectsParams p;
        p.diameter = diameter;
        p.useContactArea = true;
        p.contactAreaMethod = ContactAreaMethod::Relative;
        p.relativeNeighborSize = minFraction;
        return p;
    }
};

// =============================================================================
// Merge
// =============================================================================

/**
 * @brief Size threshold of an object with the given equivalent diameter
 *
 * pi * r^2 for areas, 4/3 * pi * r^3 for volumes, with r = diameter / 2.
 */
CELLDECLUMP_API double MinimumObjectSize(double diameter, bool volumetric);

/**
 * @brief Merge objects below the size threshold into their dominant neighbour
 *
 * For each object with 0 < size < threshold:
 * - Count the labels found on its outer (face-connected) boundary
 * - With only background around it, delete it if removeBelowThreshold,
 *   otherwise keep it
 * - Else merge it into the most frequent object label (lowest label on ties),
 *   provided the contact-area gate passes
 *
 * The result is relabelled to 1..K.
 *
 * @throws InvalidArgumentException on negative diameter or contact sizes,
 *         or a relative contact size outside [0, 1]
 * @throws InvalidArgumentException if labels contain negative values
 */
CELLDECLUMP_API LabelImage MergeObjects(const LabelImage& labels,
                                        const MergeObjectsParams& params = {});

} // namespace Cell::Declump::Segment
