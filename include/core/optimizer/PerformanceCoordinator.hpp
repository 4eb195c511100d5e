#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "core/batch/BatchCoalescer.hpp"
#include "core/cache/ResultCache.hpp"
#include "core/config/PerformanceConfig.hpp"
#include "core/monitor/ResourceMonitor.hpp"
#include "core/throttle/UpdateThrottler.hpp"

namespace tasker {
namespace core {
namespace optimizer {

// Состояние координатора
enum class CoordinatorState {
    Uninitialized,
    Running,
    ShutDown
};

inline const char* toString(CoordinatorState state) {
    switch (state) {
        case CoordinatorState::Uninitialized: return "uninitialized";
        case CoordinatorState::Running: return "running";
        case CoordinatorState::ShutDown: return "shutdown";
    }
    return "unknown";
}

// Сводный снимок состояния подсистемы
struct PerformanceStats {
    cache::CacheStats cache;
    monitor::MemorySample memory;
    size_t batchPending = 0;
    size_t throttlePending = 0;
    batch::BatchStats batch;
    throttle::ThrottleStats throttle;

    nlohmann::json toJson() const {
        return {
            {"cache", cache.toJson()},
            {"memory", memory.toJson()},
            {"batchPending", batchPending},
            {"throttlePending", throttlePending},
            {"batch", batch.toJson()},
            {"throttle", throttle.toJson()}
        };
    }
};

/**
 * @brief Координатор подсистемы производительности.
 * @details Владеет кэшем результатов, пакетной записью, ограничителем
 * обновлений и монитором памяти. При initialize() связывает уровни памяти с
 * реакцией компонентов:
 *  - warning: очистка кэша, сброс пакетов, возврат памяти кучи;
 *  - critical: то же и остановка ограничителя до resume().
 * После shutdown() повторная инициализация невозможна.
 */
class PerformanceCoordinator {
public:
    explicit PerformanceCoordinator(const config::PerformanceConfig& config = config::PerformanceConfig{},
                                    monitor::MemorySampler sampler = monitor::MemorySampler{});
    ~PerformanceCoordinator();

    PerformanceCoordinator(const PerformanceCoordinator&) = delete;
    PerformanceCoordinator& operator=(const PerformanceCoordinator&) = delete;

    // Идемпотентна; false после shutdown()
    bool initialize();

    // Идемпотентна; состояние ShutDown окончательное
    void shutdown();

    CoordinatorState state() const;
    bool isRunning() const;

    PerformanceStats getPerformanceStats() const;
    void logStats() const;

    cache::ResultCache& cache() { return cache_; }
    batch::BatchCoalescer& batches() { return batches_; }
    throttle::UpdateThrottler& updates() { return updates_; }
    monitor::ResourceMonitor& monitor() { return monitor_; }

    const config::PerformanceConfig& config() const { return config_; }

private:
    void onMemoryWarning(const monitor::MemorySample& sample);
    void onMemoryCritical(const monitor::MemorySample& sample);
    void relievePressure();

    config::PerformanceConfig config_;
    cache::ResultCache cache_;
    batch::BatchCoalescer batches_;
    throttle::UpdateThrottler updates_;
    monitor::ResourceMonitor monitor_;

    CoordinatorState state_ = CoordinatorState::Uninitialized;
    mutable std::mutex mutex_;
    std::shared_ptr<spdlog::logger> logger_;
};

// Общий экземпляр: создаётся и инициализируется при первом обращении.
// config учитывается только при создании.
std::shared_ptr<PerformanceCoordinator> getPerformanceCoordinator(
    const config::PerformanceConfig& config = config::PerformanceConfig{});

// Остановка и сброс общего экземпляра
void resetPerformanceCoordinator();

} // namespace optimizer
} // namespace core
} // namespace tasker
