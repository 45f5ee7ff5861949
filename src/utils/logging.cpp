#include "tabstat/utils/logging.hpp"

#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace tabstat::utils {

namespace {
std::mutex logger_mutex;
}

std::shared_ptr<spdlog::logger> Logging::logger_;

void Logging::init(spdlog::level::level_enum level) {
	std::lock_guard<std::mutex> lock(logger_mutex);
	if (!logger_) {
		// A host may already have registered a logger under our name.
		logger_ = spdlog::get("tabstat");
		if (!logger_) {
			logger_ = spdlog::stdout_color_mt("tabstat");
		}
	}
	logger_->set_level(level);
	logger_->flush_on(level);
}

std::shared_ptr<spdlog::logger> &Logging::getLogger() {
	static std::once_flag default_init;
	std::call_once(default_init, [] {
		if (!logger_) {
			init();
		}
	});
	return logger_;
}

} // namespace tabstat::utils
