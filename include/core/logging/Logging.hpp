#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include "core/config/PerformanceConfig.hpp"

namespace tasker {
namespace core {
namespace logging {

// Установка логгера по умолчанию: консоль + (опционально) ротируемый файл
void initializeLogging(const config::LoggingConfig& config);

/**
 * @brief Именованный логгер компонента.
 * @details Создаётся при первом обращении и пишет в те же приёмники, что и
 * логгер по умолчанию, поэтому вызывающему коду не нужно проверять результат
 * spdlog::get() на nullptr.
 */
std::shared_ptr<spdlog::logger> getLogger(const std::string& name);

} // namespace logging
} // namespace core
} // namespace tasker
