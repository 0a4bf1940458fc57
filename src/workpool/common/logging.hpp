/**
 * @file logging.hpp
 * @brief Shared spdlog logger for the workpool library.
 */
#pragma once
#include "workpool/common/common.hpp"
#include <spdlog/spdlog.h>

namespace workpool
{

/**
 * @brief Name under which the library logger is registered with spdlog.
 */
inline constexpr const char* k_logger_name = "workpool";

/**
 * @brief Get the library logger.
 *
 * @details
 * Created on first use with a colored stderr sink and `info` level. If a
 * logger named `workpool` was already registered with spdlog (for example by
 * an application that wants a file sink), that one is returned instead.
 *
 * @par Thread Safety
 * - Safe to call from any thread.
 * - Must not be used from a forked worker process.
 */
std::shared_ptr<spdlog::logger> logger();

/**
 * @brief Raise the logger to debug level when @p verbose is set.
 * @details Never lowers the level; one verbose component is enough to make
 * the shared logger verbose.
 */
void enable_verbose_logging(bool verbose);

} // namespace workpool
