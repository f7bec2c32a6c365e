#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace HWENC {

/**
 * @brief Builds and registers a logger named @p name writing to stdout and to logs/<name>.log.
 *
 * @param log_level spdlog level name; nullptr selects "warn" in release builds and "debug" otherwise.
 */
std::shared_ptr<spdlog::logger> spdlogger(const std::string& name, const char* log_level);

/**
 * @brief Registers the "hwenc" logger from HWENC_LOG_LEVEL unless it already exists, and returns it.
 */
std::shared_ptr<spdlog::logger> init_logging();

} // namespace HWENC
