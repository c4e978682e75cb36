#pragma once

/// @file config.hpp
/// @brief Engine-wide settings with defaults and environment overrides.

#include "core/types.hpp"

#include <spdlog/common.h>

#include <cstddef>
#include <filesystem>

namespace helioport::core
{
    /// @brief Runtime configuration for the engine and command-line tool.
    /// Use designated initializers: EngineConfig cfg{.cache_capacity = 16};
    struct EngineConfig
    {
        std::size_t cache_capacity = 64;        ///< Result cache entries before LRU eviction
        std::size_t max_buildings = 5000;       ///< Output cap applied by presentation helpers
        spdlog::level::level_enum log_level = spdlog::level::info;
        std::filesystem::path log_file = "helioport.log";
        std::filesystem::path data_dir = "data";

        /// @brief Defaults overridden by HELIOPORT_* environment variables.
        ///
        /// Recognized: HELIOPORT_CACHE_CAPACITY, HELIOPORT_MAX_BUILDINGS,
        /// HELIOPORT_LOG_LEVEL, HELIOPORT_LOG_FILE, HELIOPORT_DATA_DIR.
        /// Malformed values keep the default and log a warning.
        [[nodiscard]] static EngineConfig from_environment();
    };

} // namespace helioport::core
