#include "logger.hpp"

#include <filesystem>
#include <system_error>

#include <log4cplus/configurator.h>
#include <log4cplus/helpers/loglog.h>

log4cplus::Logger& core_logger() {
	static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("rpcstdio"));
	return logger;
}

log4cplus::Logger& client_logger() {
	static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("rpcstdio.client"));
	return logger;
}

log4cplus::Logger& process_logger() {
	static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("rpcstdio.process"));
	return logger;
}

// Receives whatever the child writes to its stderr.
log4cplus::Logger& peer_logger() {
	static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("rpcstdio.peer"));
	return logger;
}

static std::filesystem::path resolve_config_path(const std::string& config_path) {
	std::filesystem::path path(config_path);
	if (path.is_absolute()) {
		return path;
	}

	return std::filesystem::current_path() / path;
}

void init_logging(const std::string& config_path) {
	if (!config_path.empty()) {
		try {
			auto resolved = resolve_config_path(config_path);
			if (std::filesystem::exists(resolved)) {
				std::filesystem::create_directories("logs");
				log4cplus::PropertyConfigurator::doConfigure(LOG4CPLUS_STRING_TO_TSTRING(resolved.string()));
				return;
			}
		} catch (const std::filesystem::filesystem_error& e) {
			log4cplus::helpers::LogLog::getLogLog()->error(
				LOG4CPLUS_TEXT("Failed to load logging config: ") + LOG4CPLUS_STRING_TO_TSTRING(std::string(e.what())));
		}
	}

	// stdout may carry protocol traffic, keep the fallback on stderr
	log4cplus::BasicConfigurator fallback(log4cplus::Logger::getDefaultHierarchy(), true);
	fallback.configure();
	log4cplus::Logger::getRoot().setLogLevel(log4cplus::INFO_LOG_LEVEL);
}
