// ==============================================================================
// Layer 0: Core Utility - Logging
// ==============================================================================
// Library-wide spdlog logger. The engine logs operation entry at debug level
// and numerically suspicious configurations at warn level; nothing is logged
// per sample.
// ==============================================================================

#pragma once

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>

namespace Patchwork {
namespace DSP {

inline constexpr const char* kLoggerName = "patchwork";

/// @brief The shared "patchwork" logger (stderr, colour, thread-safe)
///
/// Created on first use with level warn. If the application registered a
/// logger under the same name beforehand, that one is used instead.
[[nodiscard]] inline const std::shared_ptr<spdlog::logger>& logger() {
    static const std::shared_ptr<spdlog::logger> instance = [] {
        if (auto existing = spdlog::get(kLoggerName)) {
            return existing;
        }
        auto created = spdlog::stderr_color_mt(kLoggerName);
        created->set_level(spdlog::level::warn);
        return created;
    }();
    return instance;
}

/// @brief Change the verbosity of the library logger
inline void setLogLevel(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

} // namespace DSP
} // namespace Patchwork
