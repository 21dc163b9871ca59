#pragma once

#include <spdlog/spdlog.h>

#include <memory>

namespace screenqa {

/// @brief Retrieves the current logger.
/// @return A reference to the logger object.
spdlog::logger& logger();

/// @brief Setup a logger object to be used by ScreenQA.
///
/// Calling this function with other ScreenQA function is not thread-safe.
///
/// @param logger New logger object to be used by ScreenQA. Ownership is shared with ScreenQA.
void set_logger(std::shared_ptr<spdlog::logger> logger);

} // namespace screenqa
