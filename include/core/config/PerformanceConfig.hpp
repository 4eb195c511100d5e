#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace tasker {
namespace core {
namespace config {

// Конфигурация кэша результатов
struct ResultCacheConfig {
    size_t maxSize = 1000;                            // Максимальное количество записей
    std::chrono::seconds ttl{60};                     // Время жизни записи
    std::chrono::seconds keyGranularity{60};          // Шаг округления ключа (по умолчанию минута)

    bool validate() const {
        if (maxSize == 0) return false;
        if (ttl.count() <= 0) return false;
        if (keyGranularity.count() <= 0) return false;
        return true;
    }
};

// Конфигурация пакетной записи
struct BatchConfig {
    size_t batchSize = 50;                            // Порог немедленного сброса
    std::chrono::milliseconds flushInterval{500};     // Пауза до отложенного сброса

    bool validate() const {
        return batchSize > 0 && flushInterval.count() > 0;
    }
};

// Конфигурация ограничителя обновлений
struct ThrottleConfig {
    std::chrono::milliseconds updateInterval{1000};   // Длительность цикла обновления
    double maxUpdatesPerSecond = 30.0;                // Потолок вызовов на компонент

    // Не реже одного вызова в 1000 секунд, иначе интервал не помещается в nanoseconds
    static constexpr double kMinUpdatesPerSecond = 0.001;

    bool validate() const {
        return updateInterval.count() > 0 && maxUpdatesPerSecond >= kMinUpdatesPerSecond;
    }

    std::chrono::nanoseconds minInvocationGap() const {
        return std::chrono::nanoseconds(
            static_cast<std::chrono::nanoseconds::rep>(1e9 / maxUpdatesPerSecond));
    }
};

// Конфигурация монитора ресурсов
struct MonitorConfig {
    double warningThreshold = 0.8;                    // Доля занятой памяти для уровня warning
    double criticalThreshold = 0.9;                   // Доля занятой памяти для уровня critical
    std::chrono::milliseconds pollInterval{5000};     // Период опроса
    std::chrono::milliseconds stopTimeout{1000};      // Ожидание остановки цикла

    bool validate() const {
        if (warningThreshold <= 0.0) return false;
        if (warningThreshold >= criticalThreshold) return false;
        if (criticalThreshold > 1.0) return false;
        if (pollInterval.count() <= 0) return false;
        return stopTimeout.count() > 0;
    }
};

// Конфигурация логирования
struct LoggingConfig {
    spdlog::level::level_enum level = spdlog::level::info;
    bool logToFile = false;
    std::string directory = "logs";
    size_t maxFileSize = 1024 * 1024 * 5;             // 5MB
    size_t maxFiles = 3;

    bool validate() const {
        if (!logToFile) return true;
        return !directory.empty() && maxFileSize > 0 && maxFiles > 0;
    }
};

/**
 * @brief Сводная конфигурация подсистемы производительности.
 * @details Все параметры задаются до создания компонентов; динамическая
 * переконфигурация не поддерживается.
 */
struct PerformanceConfig {
    ResultCacheConfig cache;
    BatchConfig batch;
    ThrottleConfig throttle;
    MonitorConfig monitor;
    LoggingConfig logging;

    bool validate() const {
        return cache.validate() && batch.validate() && throttle.validate() &&
               monitor.validate() && logging.validate();
    }

    // Сериализация в JSON
    nlohmann::json toJson() const;

    // Десериализация из JSON; отсутствующие ключи сохраняют значения по умолчанию
    static PerformanceConfig fromJson(const nlohmann::json& j);

    // Работа с файлами конфигурации
    static PerformanceConfig loadFromFile(const std::string& path);
    void saveToFile(const std::string& path) const;
};

} // namespace config
} // namespace core
} // namespace tasker
