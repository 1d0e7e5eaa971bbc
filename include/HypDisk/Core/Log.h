#pragma once

/**
 * @file Log.h
 * @brief Library logger (spdlog)
 *
 * All modules log through the "hypdisk" logger. Default level is warn, so
 * the library is silent unless an input is rejected.
 *
 * Usage:
 * @code
 * Hyp::Disk::Log::SetLevel(spdlog::level::debug);
 * Hyp::Disk::Log::Get()->debug("solved {} slots", count);
 * @endcode
 */

#include <HypDisk/Core/Export.h>

#include <spdlog/spdlog.h>

#include <memory>

namespace Hyp::Disk::Log {

/// Name of the library logger in the spdlog registry
constexpr const char* LOGGER_NAME = "hypdisk";

/**
 * @brief Get the library logger, creating it on first use
 */
HYPDISK_API std::shared_ptr<spdlog::logger> Get();

/**
 * @brief Set the library logger level
 */
HYPDISK_API void SetLevel(spdlog::level::level_enum level);

/**
 * @brief Apply levels from the SPDLOG_LEVEL environment variable
 *
 * e.g. SPDLOG_LEVEL=debug or SPDLOG_LEVEL=hypdisk=trace
 */
HYPDISK_API void LoadEnvLevels();

} // namespace Hyp::Disk::Log
