/// @file log.cpp
/// @brief Named spdlog loggers with console and rotating file sinks

#include <navkit/core/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <filesystem>
#include <map>
#include <mutex>
#include <vector>

namespace navkit_core {

namespace {

struct LoggingState {
    std::mutex mutex;
    LogConfig config;
    std::map<std::string, std::shared_ptr<spdlog::logger>> loggers;
};

LoggingState& state() {
    static LoggingState instance;
    return instance;
}

std::vector<spdlog::sink_ptr> make_sinks(const LogConfig& config, const std::string& name) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.console_enabled) {
        auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%n] %v");
        sinks.push_back(console);
    }

    if (config.file_enabled && !config.log_directory.empty()) {
        const auto path = std::filesystem::path(config.log_directory) / (name + ".log");
        try {
            auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                path.string(), config.max_file_size, config.max_files);
            file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
            sinks.push_back(file);
        } catch (const spdlog::spdlog_ex& e) {
            spdlog::warn("Logger '{}' writes to console only, cannot open {}: {}",
                         name, path.string(), e.what());
        }
    }

    return sinks;
}

} // anonymous namespace

void configure_logging(const LogConfig& config) {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);

    s.config = config;
    for (auto& [name, logger] : s.loggers) {
        logger->set_level(config.level);
    }
    spdlog::set_level(config.level);
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str) {
    if (str == "trace") return spdlog::level::trace;
    if (str == "debug") return spdlog::level::debug;
    if (str == "info") return spdlog::level::info;
    if (str == "warn" || str == "warning") return spdlog::level::warn;
    if (str == "error") return spdlog::level::err;
    if (str == "critical") return spdlog::level::critical;
    if (str == "off") return spdlog::level::off;
    return std::nullopt;
}

const char* log_level_name(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::trace: return "trace";
        case spdlog::level::debug: return "debug";
        case spdlog::level::info: return "info";
        case spdlog::level::warn: return "warn";
        case spdlog::level::err: return "error";
        case spdlog::level::critical: return "critical";
        case spdlog::level::off: return "off";
        default: return "unknown";
    }
}

std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);

    if (auto it = s.loggers.find(name); it != s.loggers.end()) {
        return it->second;
    }

    // Registered with spdlog by someone else
    std::shared_ptr<spdlog::logger> logger = spdlog::get(name);
    if (!logger) {
        auto sinks = make_sinks(s.config, name);
        logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        spdlog::register_logger(logger);
    }
    logger->set_level(s.config.level);
    s.loggers[name] = logger;
    return logger;
}

std::shared_ptr<spdlog::logger> nav_logger() {
    return get_logger("navkit.nav");
}

void shutdown_logging() {
    auto& s = state();
    {
        std::lock_guard<std::mutex> lock(s.mutex);
        for (auto& [name, logger] : s.loggers) {
            logger->flush();
            spdlog::drop(name);
        }
        s.loggers.clear();
    }
    spdlog::shutdown();
}

} // namespace navkit_core
