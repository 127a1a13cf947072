#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace vendcore {

// Process-wide spdlog setup. Components log through the default logger via
// the VENDCORE_LOG_* macros, or through a named clone via
// VENDCORE_LOG_COMPONENT.
class Logger {
public:
    static constexpr std::size_t kMaxFileSize = 10 * 1024 * 1024;
    static constexpr std::size_t kMaxFiles = 3;

    static void initialize(const std::string& name = "vendcore",
                           spdlog::level::level_enum level = spdlog::level::info,
                           bool console = true,
                           const std::string& file_path = "") {
        std::vector<spdlog::sink_ptr> sinks;

        if (console) {
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_level(level);
            console_sink->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
            sinks.push_back(console_sink);
        }

        if (!file_path.empty()) {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                file_path, kMaxFileSize, kMaxFiles);
            file_sink->set_level(level);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] [thread %t] %v");
            sinks.push_back(file_sink);
        }

        auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(level);
        logger->flush_on(spdlog::level::warn);

        // Component clones of a previous default logger would keep its sinks.
        spdlog::drop_all();
        spdlog::register_logger(logger);
        spdlog::set_default_logger(logger);
    }

    static std::shared_ptr<spdlog::logger> get(const std::string& component) {
        auto logger = spdlog::get(component);
        if (!logger) {
            logger = spdlog::default_logger()->clone(component);
            spdlog::register_logger(logger);
        }
        return logger;
    }

    // Accepts spdlog's level names ("trace" ... "critical", "off").
    static std::optional<spdlog::level::level_enum> parse_level(const std::string& name) {
        auto level = spdlog::level::from_str(name);
        if (level == spdlog::level::off && name != "off") {
            return std::nullopt;
        }
        return level;
    }

    static void set_level(spdlog::level::level_enum level) {
        spdlog::set_level(level);
    }

    static void flush() {
        spdlog::default_logger()->flush();
    }

    static void shutdown() {
        spdlog::shutdown();
    }
};

#define VENDCORE_LOG_TRACE(...) SPDLOG_TRACE(__VA_ARGS__)
#define VENDCORE_LOG_DEBUG(...) SPDLOG_DEBUG(__VA_ARGS__)
#define VENDCORE_LOG_INFO(...) SPDLOG_INFO(__VA_ARGS__)
#define VENDCORE_LOG_WARN(...) SPDLOG_WARN(__VA_ARGS__)
#define VENDCORE_LOG_ERROR(...) SPDLOG_ERROR(__VA_ARGS__)
#define VENDCORE_LOG_CRITICAL(...) SPDLOG_CRITICAL(__VA_ARGS__)

// e.g. VENDCORE_LOG_COMPONENT("inventory", warn, "slot {} jammed", id)
#define VENDCORE_LOG_COMPONENT(component, level, ...) \
    vendcore::Logger::get(component)->level(__VA_ARGS__)

} // namespace vendcore
