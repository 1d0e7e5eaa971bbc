#pragma once

/**
 * @file Validate.h
 * @brief Parameter validation utilities for HypDisk
 *
 * Consistent error message format: "<function>: <param> must be ..., got ...".
 * Geometry-specific rejections (ambiguous input, impossible polygon, ...)
 * are thrown directly by the modules with their own exception types.
 */

#include <HypDisk/Core/Exception.h>

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <string>

namespace Hyp::Disk::Validate {

// =============================================================================
// Internal Formatting
// =============================================================================

namespace Detail {

// Format double with limited precision (avoid long tails)
inline std::string FormatValue(double val) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.6g", val);
    return buf;
}

inline std::string FormatValue(int val) {
    return std::to_string(val);
}

inline std::string FormatValue(int64_t val) {
    return std::to_string(val);
}

inline std::string FormatValue(size_t val) {
    return std::to_string(val);
}

} // namespace Detail

// =============================================================================
// Value Range Validation
// =============================================================================

/**
 * @brief Validate value is finite (not NaN, not infinite)
 */
inline void RequireFinite(double value, const char* paramName, const char* funcName) {
    if (!std::isfinite(value)) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName + " must be finite, got " +
            Detail::FormatValue(value));
    }
}

/**
 * @brief Validate value is in range [min, max]
 */
template<typename T>
inline void RequireRange(T value, T minVal, T maxVal,
                         const char* paramName, const char* funcName) {
    if (value < minVal || value > maxVal) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName + " must be in [" +
            Detail::FormatValue(minVal) + ", " + Detail::FormatValue(maxVal) +
            "], got " + Detail::FormatValue(value));
    }
}

/**
 * @brief Validate value is positive (> 0)
 */
template<typename T>
inline void RequirePositive(T value, const char* paramName, const char* funcName) {
    if (value <= T(0)) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName + " must be > 0, got " +
            Detail::FormatValue(value));
    }
}

/**
 * @brief Validate value is non-negative (>= 0)
 */
template<typename T>
inline void RequireNonNegative(T value, const char* paramName, const char* funcName) {
    if (value < T(0)) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName + " must be >= 0, got " +
            Detail::FormatValue(value));
    }
}

/**
 * @brief Validate value is at least minimum (>= min)
 */
template<typename T>
inline void RequireMin(T value, T minVal, const char* paramName, const char* funcName) {
    if (value < minVal) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName + " must be >= " +
            Detail::FormatValue(minVal) + ", got " + Detail::FormatValue(value));
    }
}

/**
 * @brief Validate value does not exceed maximum (<= max)
 */
template<typename T>
inline void RequireMax(T value, T maxVal, const char* paramName, const char* funcName) {
    if (value > maxVal) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName + " must be <= " +
            Detail::FormatValue(maxVal) + ", got " + Detail::FormatValue(value));
    }
}

// =============================================================================
// Convenience Macros
// =============================================================================

#define HYPDISK_REQUIRE_FINITE(val) \
    ::Hyp::Disk::Validate::RequireFinite(val, #val, __func__)

#define HYPDISK_REQUIRE_RANGE(val, min, max) \
    ::Hyp::Disk::Validate::RequireRange(val, min, max, #val, __func__)

#define HYPDISK_REQUIRE_POSITIVE(val) \
    ::Hyp::Disk::Validate::RequirePositive(val, #val, __func__)

#define HYPDISK_REQUIRE_NON_NEGATIVE(val) \
    ::Hyp::Disk::Validate::RequireNonNegative(val, #val, __func__)

#define HYPDISK_REQUIRE_MIN(val, min) \
    ::Hyp::Disk::Validate::RequireMin(val, min, #val, __func__)

#define HYPDISK_REQUIRE_MAX(val, max) \
    ::Hyp::Disk::Validate::RequireMax(val, max, #val, __func__)

} // namespace Hyp::Disk::Validate
