#pragma once

#include <HypDisk/Core/Export.h>

/**
 * @file Exception.h
 * @brief Exception classes for HypDisk
 *
 * Every failure is a deterministic function of the inputs, so nothing in the
 * library retries or catches: errors propagate to the immediate caller.
 */

#include <stdexcept>
#include <string>

namespace Hyp::Disk {

/**
 * @brief Base exception class for HypDisk
 */
class HYPDISK_API Exception : public std::runtime_error {
public:
    explicit Exception(const std::string& message)
        : std::runtime_error(message) {}

    explicit Exception(const char* message)
        : std::runtime_error(message) {}
};

/**
 * @brief Invalid argument exception (bad counts, bad angle ranges)
 */
class HYPDISK_API InvalidArgumentException : public Exception {
public:
    explicit InvalidArgumentException(const std::string& message)
        : Exception("Invalid argument: " + message) {}
};

/**
 * @brief Polygon with fewer than three sides
 */
class HYPDISK_API InvalidSidesException : public InvalidArgumentException {
public:
    explicit InvalidSidesException(const std::string& message)
        : InvalidArgumentException("sides: " + message) {}
};

/**
 * @brief Angle pair that must differ but does not
 */
class HYPDISK_API InvalidAnglesException : public InvalidArgumentException {
public:
    explicit InvalidAnglesException(const std::string& message)
        : InvalidArgumentException("angles: " + message) {}
};

/**
 * @brief Fewer than two known measurements, or completion cannot close
 */
class HYPDISK_API InsufficientDataException : public Exception {
public:
    explicit InsufficientDataException(const std::string& message)
        : Exception("Insufficient data: " + message) {}
};

/**
 * @brief More than three known measurements
 */
class HYPDISK_API TooManyInputsException : public Exception {
public:
    explicit TooManyInputsException(const std::string& message)
        : Exception("Too many inputs: " + message) {}
};

/**
 * @brief Degenerate or inconsistent triangle, or a law solver domain guard
 */
class HYPDISK_API InvalidTriangleException : public Exception {
public:
    explicit InvalidTriangleException(const std::string& message)
        : Exception("Invalid triangle: " + message) {}
};

/**
 * @brief Two mutually exclusive parameters given together (or neither)
 */
class HYPDISK_API AmbiguousInputException : public Exception {
public:
    explicit AmbiguousInputException(const std::string& message)
        : Exception("Ambiguous input: " + message) {}
};

/**
 * @brief Configuration that cannot exist in the hyperbolic plane
 */
class HYPDISK_API ImpossibleGeometryException : public Exception {
public:
    explicit ImpossibleGeometryException(const std::string& message)
        : Exception("Impossible in hyperbolic geometry: " + message) {}
};

/**
 * @brief Value outside the disk or too large to render
 */
class HYPDISK_API OutOfDomainException : public Exception {
public:
    explicit OutOfDomainException(const std::string& message)
        : Exception("Out of domain: " + message) {}
};

/**
 * @brief Drawing requested without a rendering surface
 */
class HYPDISK_API UninitializedSurfaceException : public Exception {
public:
    explicit UninitializedSurfaceException(const std::string& message)
        : Exception("Uninitialized surface: " + message) {}
};

} // namespace Hyp::Disk
