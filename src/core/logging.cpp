#include "core/logging.h"

#include <filesystem>
#include <mutex>
#include <vector>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace easel {

namespace {

constexpr const char* LOG_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v";

std::mutex& logger_mutex() {
    static std::mutex m;
    return m;
}

}

void init_logging(const LoggingConfig& config) {
    std::lock_guard<std::mutex> lock(logger_mutex());

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (!config.file.empty()) {
        try {
            std::error_code ec;
            std::filesystem::create_directories(std::filesystem::path(config.file).parent_path(), ec);
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.file, false));
        } catch (const spdlog::spdlog_ex& e) {
            spdlog::warn("Cannot open log file {}: {}", config.file, e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("easel", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::from_str(config.level));
    logger->set_pattern(LOG_PATTERN);
    logger->flush_on(spdlog::level::warn);

    spdlog::drop_all();
    spdlog::set_default_logger(logger);
}

namespace log {

std::shared_ptr<spdlog::logger> get(const std::string& name) {
    std::lock_guard<std::mutex> lock(logger_mutex());

    if (auto existing = spdlog::get(name)) {
        return existing;
    }

    auto parent = spdlog::default_logger();
    auto logger = std::make_shared<spdlog::logger>(name, parent->sinks().begin(), parent->sinks().end());
    logger->set_level(parent->level());
    logger->set_pattern(LOG_PATTERN);
    try {
        spdlog::register_logger(logger);
    } catch (const spdlog::spdlog_ex&) {
        return spdlog::get(name) ? spdlog::get(name) : parent;
    }
    return logger;
}

}

}
