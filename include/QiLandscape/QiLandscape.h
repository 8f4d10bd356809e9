#pragma once

/**
 * @file QiLandscape.h
 * @brief Main header file for QiLandscape library
 *
 * QiLandscape turns a clustered opinion snapshot into drawable group
 * regions and a pairwise coalition table.
 *
 * @version 0.1.0
 */

// Configuration and export macros
#include <QiLandscape/QiLandscapeConfig.h>
#include <QiLandscape/Core/Export.h>

// Core types and utilities
#include <QiLandscape/Core/Types.h>
#include <QiLandscape/Core/Exception.h>
#include <QiLandscape/Core/QCurve.h>

// Platform abstraction
#include <QiLandscape/Platform/Timer.h>

// Feature modules
#include <QiLandscape/Boundary/Boundary.h>
#include <QiLandscape/Coalition/Coalition.h>
#include <QiLandscape/OpinionMap/OpinionMap.h>

namespace Qi::Landscape {

/**
 * @brief Get library version string
 * @return Version string in format "major.minor.patch"
 */
inline const char* GetVersion() {
    return QILANDSCAPE_VERSION_STRING;
}

/**
 * @brief Get library version as integers
 */
inline void GetVersion(int& major, int& minor, int& patch) {
    major = QILANDSCAPE_VERSION_MAJOR;
    minor = QILANDSCAPE_VERSION_MINOR;
    patch = QILANDSCAPE_VERSION_PATCH;
}

} // namespace Qi::Landscape
