#pragma once

#include <memory>

#include <spdlog/spdlog.h>

namespace http_retry {

constexpr const char* LOGGER_NAME = "http_retry";

/**
 * Library logger, looked up in the spdlog registry under LOGGER_NAME on every
 * call. A stderr logger at level info is created and registered when none is
 * present. To redirect output at any time, spdlog::drop(LOGGER_NAME) and
 * register a replacement under the same name.
 */
std::shared_ptr<spdlog::logger> logger();

void setLogLevel(spdlog::level::level_enum level);

} // namespace http_retry
