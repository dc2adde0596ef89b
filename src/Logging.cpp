#include "Logging.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace http_retry {

std::shared_ptr<spdlog::logger> logger() {
	if (auto registered = spdlog::get(LOGGER_NAME))
		return registered;

	static std::mutex mutex;
	std::lock_guard<std::mutex> lock(mutex);
	if (auto registered = spdlog::get(LOGGER_NAME))
		return registered;

	auto created = spdlog::stderr_color_mt(LOGGER_NAME);
	created->set_level(spdlog::level::info);
	return created;
}

void setLogLevel(spdlog::level::level_enum level) {
	logger()->set_level(level);
}

} // namespace http_retry
