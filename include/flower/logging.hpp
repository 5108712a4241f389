// === Logging =================================================================
//
// Process-wide spdlog setup. The application creates the logger once and hands
// it to the planner components, which never look it up on their own.
//
// Every message is a single-line JSON object; the file sink embeds it verbatim
// under "msg" so each line of `flower.log` parses as JSON.

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/common.h>
#include <spdlog/logger.h>

namespace flower {

/**
 * @brief Create the shared "flower" logger on first call; later calls return it unchanged.
 *
 * @throws std::runtime_error if @p log_directory cannot be created.
 */
std::shared_ptr<spdlog::logger> initialize_logger(const std::string& log_directory);

/** @throws std::runtime_error before initialize_logger has run. */
std::shared_ptr<spdlog::logger> get_logger();

/** @brief spdlog level for @p str_level, or nullopt for a name spdlog does not know. */
[[nodiscard]] std::optional<spdlog::level::level_enum> parse_log_level(std::string_view str_level);

/** @brief Apply @p str_level to the shared logger; unknown names select info. */
void set_log_level(const std::string& str_level);

}  // namespace flower
