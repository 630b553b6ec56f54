#pragma once

/**
 * @file CellDeclump.h
 * @brief Main header file for CellDeclump library
 *
 * CellDeclump splits and cleans up object label images from microscopy
 * segmentation: distance fields, seed search, seeded watershed declumping
 * and merging of undersized objects, for 2D images and 3D stacks.
 *
 * @version 0.1.0
 */

// Configuration and export macros
#include <CellDeclump/CellDeclumpConfig.h>
#include <CellDeclump/Core/Export.h>

// Core types and utilities
#include <CellDeclump/Core/Types.h>
#include <CellDeclump/Core/Exception.h>
#include <CellDeclump/Core/QVolume.h>

// Platform abstraction
#include <CellDeclump/Platform/Random.h>

// Feature modules
#include <CellDeclump/Morphology/StructElement.h>
#include <CellDeclump/Segment/DistanceField.h>
#include <CellDeclump/Segment/SeedFinder.h>
#include <CellDeclump/Segment/Declump.h>
#include <CellDeclump/Segment/MergeObjects.h>

namespace Cell::Declump {

/**
 * @brief Get library version string
 * @return Version string in format "major.minor.patch"
 */
inline const char* GetVersion() {
    return CELLDECLUMP_VERSION_STRING;
}

/**
 * @brief Get library version as integers
 */
inline void GetVersion(int& major, int& minor, int& patch) {
    major = CELLDECLUMP_VERSION_MAJOR;
    minor = CELLDECLUMP_VERSION_MINOR;
    patch = CELLDECLUMP_VERSION_PATCH;
}

} // namespace Cell::Declump
