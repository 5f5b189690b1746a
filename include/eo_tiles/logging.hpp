// === Logging =================================================================
//
// Process-wide spdlog logger shared by registries, the KML reader and the
// command-line tool. initialize_logger() must run before any registry is
// constructed.

#pragma once

#include <memory>
#include <string>

#include <spdlog/formatter.h>
#include <spdlog/logger.h>

namespace eo_tiles {

/** @brief Name under which the shared logger is registered with spdlog. */
inline constexpr char k_logger_name[] = "eo_tiles";

/**
 * @brief Formatter for the JSON lines written to the log file; the message
 *        payload is escaped so quotes, backslashes and control characters
 *        keep each line valid JSON.
 */
std::unique_ptr<spdlog::formatter> make_json_file_formatter();

std::shared_ptr<spdlog::logger> initialize_logger(const std::string& log_directory);

std::shared_ptr<spdlog::logger> get_logger();

void set_log_level(const std::string& str_level);

}  // namespace eo_tiles
