#pragma once

#include <CellDeclump/Core/Export.h>

/**
 * @file Exception.h
 * @brief Exception classes for CellDeclump
 */

#include <stdexcept>
#include <string>

namespace Cell::Declump {

/**
 * @brief Base exception class for CellDeclump
 */
class CELLDECLUMP_API Exception : public std::runtime_error {
public:
    explicit Exception(const std::string& message)
        : std::runtime_error(message) {}

    explicit Exception(const char* message)
        : std::runtime_error(message) {}
};

/**
 * @brief Invalid argument exception
 */
class CELLDECLUMP_API InvalidArgumentException : public Exception {
public:
    explicit InvalidArgumentException(const std::string& message)
        : Exception("Invalid argument: " + message) {}
};

/**
 * @brief Dimensionality or shape of two inputs does not agree
 *
 * Raised before any computation, e.g. a 2D structuring element applied to
 * a 3D label image, or a reference image of a different shape.
 */
class CELLDECLUMP_API DimensionMismatchException : public Exception {
public:
    explicit DimensionMismatchException(const std::string& message)
        : Exception("Dimension mismatch: " + message) {}
};

/**
 * @brief Out of range exception
 */
class CELLDECLUMP_API OutOfRangeException : public Exception {
public:
    explicit OutOfRangeException(const std::string& message)
        : Exception("Out of range: " + message) {}
};

/**
 * @brief File I/O exception
 */
class CELLDECLUMP_API IOException : public Exception {
public:
    explicit IOException(const std::string& message)
        : Exception("I/O error: " + message) {}
};

/**
 * @brief Unsupported operation or format
 */
class CELLDECLUMP_API UnsupportedException : public Exception {
public:
    explicit UnsupportedException(const std::string& message)
        : Exception("Unsupported: " + message) {}
};

} // namespace Cell::Declump
