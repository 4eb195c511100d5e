#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include "core/config/PerformanceConfig.hpp"
#include "core/monitor/MemorySample.hpp"

namespace tasker {
namespace core {
namespace monitor {

using LevelCallback = std::function<void(const MemorySample&)>;
using MemorySampler = std::function<MemorySample()>;

/**
 * @brief Фоновый монитор памяти.
 * @details Колбэк уровня вызывается только при смене уровня между опросами.
 */
class ResourceMonitor {
public:
    // Пустой sampler заменяется на sampleSystemMemory()
    explicit ResourceMonitor(const config::MonitorConfig& config = config::MonitorConfig{},
                             MemorySampler sampler = MemorySampler{});
    ~ResourceMonitor();

    ResourceMonitor(const ResourceMonitor&) = delete;
    ResourceMonitor& operator=(const ResourceMonitor&) = delete;

    // Последняя регистрация для уровня побеждает
    void registerCallback(MemoryLevel level, LevelCallback callback);

    // Повторный запуск работающего цикла ничего не делает
    void startMonitoring();
    void startMonitoring(std::chrono::milliseconds interval);

    // Ожидание цикла ограничено stopTimeout; после возврата колбэки уровня не вызываются
    void stopMonitoring();

    bool isMonitoring() const;

    MemorySample getMemoryInfo() const;
    ReclaimResult forceReclaim() const;

    MemoryLevel classify(double usedRatio) const;

    // Классификация снимка и вызов колбэка при смене уровня
    MemoryLevel evaluate(const MemorySample& sample);

    MemoryLevel currentLevel() const;

private:
    struct Impl;
    std::shared_ptr<Impl> pImpl;
};

} // namespace monitor
} // namespace core
} // namespace tasker
