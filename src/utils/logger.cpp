#include "zkemu/utils/logger.hpp"

#include <cstdio>
#include <vector>

namespace zkemu::utils {

std::shared_ptr<spdlog::logger> Logger::s_logger;

void Logger::init(const LogOptions& options) {
    try {
        std::vector<spdlog::sink_ptr> sinks;

        if (options.console) {
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
            sinks.push_back(console_sink);
        }

        if (!options.file.empty()) {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                options.file, 1024 * 1024 * 5, 3); // 5MB, 3 files
            file_sink->set_level(spdlog::level::trace);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
            sinks.push_back(file_sink);
        }

        if (s_logger) {
            spdlog::drop(s_logger->name());
        }

        s_logger = std::make_shared<spdlog::logger>("zkemu", sinks.begin(), sinks.end());
        s_logger->set_level(spdlog::level::from_str(options.level));
        s_logger->flush_on(spdlog::level::warn);

        spdlog::register_logger(s_logger);
        spdlog::set_default_logger(s_logger);

        s_logger->debug("Logger initialized (level {})", options.level);
    }
    catch (const spdlog::spdlog_ex& ex) {
        fprintf(stderr, "Logger init failed: %s\n", ex.what());
    }
}

void Logger::setLevel(const std::string& level) {
    if (s_logger) {
        s_logger->set_level(spdlog::level::from_str(level));
    }
}

void Logger::shutdown() {
    if (s_logger) {
        s_logger->flush();
        s_logger.reset();
    }
    spdlog::shutdown();
}

} // namespace zkemu::utils
