#pragma once

#include <cstddef>
#include <string>
#include <spdlog/spdlog.h>

namespace cachet {
namespace core {
namespace logging {

struct LoggingConfig {
    std::string loggerName = "cachet";
    std::string logDirectory = "logs";
    std::string fileName = "cachet.log";
    size_t maxFileSize = 1024 * 1024 * 5; // 5MB
    size_t maxFiles = 3;
    bool enableFile = true;
    spdlog::level::level_enum consoleLevel = spdlog::level::info;
    spdlog::level::level_enum fileLevel = spdlog::level::debug;

    bool validate() const {
        if (loggerName.empty()) return false;
        if (enableFile && (fileName.empty() || maxFileSize == 0 || maxFiles == 0)) return false;
        return true;
    }
};

/**
 * @brief Установить логгер по умолчанию: цветная консоль и ротируемый файл.
 * @throws std::invalid_argument при неверной конфигурации
 * @throws spdlog::spdlog_ex если файл журнала не удалось открыть
 */
void initializeLogging(const LoggingConfig& config = LoggingConfig{});

} // namespace logging
} // namespace core
} // namespace cachet
