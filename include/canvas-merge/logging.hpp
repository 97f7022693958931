/// @file logging.hpp
/// @brief The library's spdlog logger.

#pragma once

#include <spdlog/spdlog.h>

#include <memory>

namespace canvas_merge {

/// The "canvas_merge" logger. Created on first use with a stderr sink at
/// warn level; hosts may change its level or sinks.
auto logger() -> std::shared_ptr<spdlog::logger>;

}  // namespace canvas_merge
