#include "cachet/core/logging/Logging.hpp"
#include <algorithm>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <vector>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace cachet {
namespace core {
namespace logging {

void initializeLogging(const LoggingConfig& config) {
    if (!config.validate()) {
        throw std::invalid_argument("initializeLogging: неверная конфигурация журнала");
    }
    try {
        std::vector<spdlog::sink_ptr> sinks;

        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(config.consoleLevel);
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
        sinks.push_back(console_sink);

        if (config.enableFile) {
            std::filesystem::create_directories(config.logDirectory);
            const std::filesystem::path logPath = std::filesystem::path(config.logDirectory) / config.fileName;
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logPath.string(), config.maxFileSize, config.maxFiles);
            file_sink->set_level(config.fileLevel);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
            sinks.push_back(file_sink);
        }

        auto logger = std::make_shared<spdlog::logger>(config.loggerName, sinks.begin(), sinks.end());
        logger->set_level(std::min(config.consoleLevel, config.fileLevel));
        spdlog::set_default_logger(logger);

        spdlog::debug("Журнал инициализирован ({})", config.enableFile ? "консоль и файл" : "консоль");
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
        throw;
    }
}

} // namespace logging
} // namespace core
} // namespace cachet
