#pragma once

/**
 * @file HypDisk.h
 * @brief Main header file for HypDisk library
 *
 * HypDisk solves hyperbolic triangles from partial measurements and draws
 * triangles, polygons, geodesics and circle families in the Poincare disk.
 *
 * @version 0.1.0
 */

// Configuration and export macros
#include <HypDisk/HypDiskConfig.h>
#include <HypDisk/Core/Export.h>

// Core types and utilities
#include <HypDisk/Core/Types.h>
#include <HypDisk/Core/Constants.h>
#include <HypDisk/Core/Exception.h>
#include <HypDisk/Core/Log.h>
#include <HypDisk/Core/Triangle.h>
#include <HypDisk/Core/Image.h>

// Solver
#include <HypDisk/Solver/TriangleSolver.h>

// Projection
#include <HypDisk/Projection/DiskFrame.h>
#include <HypDisk/Projection/DiskProjection.h>
#include <HypDisk/Projection/Patterns.h>

// Display
#include <HypDisk/Display/Surface.h>
#include <HypDisk/Display/RecordingSurface.h>
#include <HypDisk/Display/RasterSurface.h>
#include <HypDisk/Display/DiskDrawer.h>

namespace Hyp::Disk {

/**
 * @brief Get library version string
 * @return Version string in format "major.minor.patch"
 */
inline const char* GetVersion() {
    return HYPDISK_VERSION_STRING;
}

/**
 * @brief Get library version as integers
 */
inline void GetVersion(int& major, int& minor, int& patch) {
    major = HYPDISK_VERSION_MAJOR;
    minor = HYPDISK_VERSION_MINOR;
    patch = HYPDISK_VERSION_PATCH;
}

} // namespace Hyp::Disk
