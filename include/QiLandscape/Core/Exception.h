#pragma once

#include <QiLandscape/Core/Export.h>

/**
 * @file Exception.h
 * @brief Exception classes for QiLandscape
 *
 * Only input-contract violations are reported by exception. Degenerate
 * geometry and missing scores are normal results, never errors.
 */

#include <stdexcept>
#include <string>

namespace Qi::Landscape {

/**
 * @brief Base exception class for QiLandscape
 */
class QILANDSCAPE_API Exception : public std::runtime_error {
public:
    explicit Exception(const std::string& message)
        : std::runtime_error(message) {}

    explicit Exception(const char* message)
        : std::runtime_error(message) {}
};

/**
 * @brief Invalid argument exception
 */
class QILANDSCAPE_API InvalidArgumentException : public Exception {
public:
    explicit InvalidArgumentException(const std::string& message)
        : Exception("Invalid argument: " + message) {}
};

} // namespace Qi::Landscape
