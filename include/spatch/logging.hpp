/// @file logging.hpp
/// @brief The shared "spatch" spdlog logger.

#pragma once

#include <spdlog/spdlog.h>

#include <memory>

namespace spatch {

/// Name under which the library logger is registered with spdlog.
inline constexpr auto logger_name = "spatch";

/// The process-wide library logger.
///
/// Created on first use as a colour stderr logger at level `warn`, and
/// registered with spdlog so `spdlog::get("spatch")` returns the same
/// instance. Applications that register their own "spatch" logger before
/// first use get theirs instead.
auto logger() -> std::shared_ptr<spdlog::logger>;

/// Set the level of the library logger.
void set_log_level(spdlog::level::level_enum level);

}  // namespace spatch
