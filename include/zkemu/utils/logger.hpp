#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <memory>
#include <string>

namespace zkemu::utils {

struct LogOptions {
    std::string level = "info";   // trace, debug, info, warn, error, critical, off
    std::string file;             // empty disables the file sink
    bool console = true;
};

/**
 * Logger utility
 *
 * Process-wide spdlog logger shared by the client library, the simulator
 * and the tools. Calls made before init() are dropped.
 */
class Logger {
public:
    static void init(const LogOptions& options = LogOptions{});
    static void shutdown();

    static void setLevel(const std::string& level);

    static std::shared_ptr<spdlog::logger> get() { return s_logger; }

    template<typename... Args>
    static void trace(fmt::format_string<Args...> fmt, Args&&... args) {
        if (s_logger) s_logger->trace(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void debug(fmt::format_string<Args...> fmt, Args&&... args) {
        if (s_logger) s_logger->debug(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void info(fmt::format_string<Args...> fmt, Args&&... args) {
        if (s_logger) s_logger->info(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void warn(fmt::format_string<Args...> fmt, Args&&... args) {
        if (s_logger) s_logger->warn(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void error(fmt::format_string<Args...> fmt, Args&&... args) {
        if (s_logger) s_logger->error(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void critical(fmt::format_string<Args...> fmt, Args&&... args) {
        if (s_logger) s_logger->critical(fmt, std::forward<Args>(args)...);
    }

private:
    static std::shared_ptr<spdlog::logger> s_logger;
};

#define LOG_TRACE(...) zkemu::utils::Logger::trace(__VA_ARGS__)
#define LOG_DEBUG(...) zkemu::utils::Logger::debug(__VA_ARGS__)
#define LOG_INFO(...)  zkemu::utils::Logger::info(__VA_ARGS__)
#define LOG_WARN(...)  zkemu::utils::Logger::warn(__VA_ARGS__)
#define LOG_ERROR(...) zkemu::utils::Logger::error(__VA_ARGS__)
#define LOG_CRITICAL(...) zkemu::utils::Logger::critical(__VA_ARGS__)

} // namespace zkemu::utils
