#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <spdlog/logger.h>

namespace radnote {

/**
 * @brief Create the shared `radnote` logger (console + rotating JSON file sink).
 *
 * Only the first call configures sinks; later calls return the same logger
 * regardless of @p log_directory.
 */
std::shared_ptr<spdlog::logger> initialize_logger(const std::string& log_directory);

std::shared_ptr<spdlog::logger> get_logger();

void set_log_level(const std::string& str_level);

/** @brief Quote and escape @p message as a JSON string; invalid UTF-8 is replaced. */
std::string json_escape_message(std::string_view message);

}  // namespace radnote
