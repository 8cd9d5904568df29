// === Logging =================================================================
//
// Builds the process-wide spdlog logger and derives per-reconcile scoped
// handles from it. Controllers receive their logger through ReconcileContext
// and never call get_logger() themselves.

#pragma once

#include <memory>
#include <string>

#include <spdlog/formatter.h>
#include <spdlog/logger.h>

namespace kit_operator {

std::shared_ptr<spdlog::logger> initialize_logger(const std::string& log_directory);

std::shared_ptr<spdlog::logger> get_logger();

void set_log_level(const std::string& str_level);

/** @brief One JSON object per line; message and logger name are escaped. */
std::unique_ptr<spdlog::formatter> make_json_line_formatter();

/**
 * @brief Clone @p base under the name @p scope, sharing its sinks and level.
 *
 * The clone is not registered with spdlog, so one can be created for every
 * reconcile invocation and dropped afterwards.
 */
std::shared_ptr<spdlog::logger> make_scoped_logger(const std::shared_ptr<spdlog::logger>& base, const std::string& scope);

}  // namespace kit_operator
