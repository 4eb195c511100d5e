#include "core/monitor/ResourceMonitor.hpp"
#include <condition_variable>
#include <future>
#include <map>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>
#include <spdlog/spdlog.h>
#include "core/logging/Logging.hpp"
#include "core/monitor/SystemMemory.hpp"
#include "core/util/GuardedInvoke.hpp"

namespace tasker {
namespace core {
namespace monitor {

namespace {

// Управление одним запуском цикла
struct LoopControl {
    std::mutex mutex;
    std::condition_variable condition;
    bool stop = false;
};

} // namespace

struct ResourceMonitor::Impl {
    config::MonitorConfig config;
    MemorySampler sampler;
    std::map<MemoryLevel, LevelCallback> callbacks;
    MemoryLevel lastLevel = MemoryLevel::Normal;
    mutable std::mutex stateMutex;      // callbacks, lastLevel
    std::recursive_mutex dispatchMutex; // Классификация и вызов колбэков уровня

    std::mutex controlMutex;            // control, worker, loopDone
    std::shared_ptr<LoopControl> control;
    std::thread worker;
    std::future<void> loopDone;

    std::shared_ptr<spdlog::logger> logger;

    Impl(const config::MonitorConfig& cfg, MemorySampler memorySampler)
        : config(cfg)
        , sampler(std::move(memorySampler))
        , logger(logging::getLogger("monitor")) {
        if (!sampler) {
            sampler = sampleSystemMemory;
        }
    }

    MemoryLevel classify(double usedRatio) const {
        if (usedRatio >= config.criticalThreshold) return MemoryLevel::Critical;
        if (usedRatio >= config.warningThreshold) return MemoryLevel::Warning;
        return MemoryLevel::Normal;
    }

    MemorySample sample() const {
        try {
            return sampler();
        } catch (const std::exception& e) {
            logger->warn("Memory sampler failed: {}", e.what());
        } catch (...) {
            logger->warn("Memory sampler failed: unknown exception");
        }
        MemorySample empty;
        empty.sampledAt = std::chrono::system_clock::now();
        return empty;
    }

    // Шаг цикла: снимок, полученный после остановки, не обрабатывается
    void dispatchTick(const MemorySample& sample, LoopControl& control) {
        std::lock_guard<std::recursive_mutex> dispatch(dispatchMutex);
        {
            std::lock_guard<std::mutex> lock(control.mutex);
            if (control.stop) {
                return;
            }
        }
        evaluate(sample);
    }

    MemoryLevel evaluate(const MemorySample& sample) {
        std::lock_guard<std::recursive_mutex> dispatch(dispatchMutex);
        const MemoryLevel level = classify(sample.usedRatio);
        MemoryLevel previous;
        LevelCallback callback;
        {
            std::lock_guard<std::mutex> lock(stateMutex);
            previous = lastLevel;
            if (level == previous) {
                return level;
            }
            lastLevel = level;
            auto it = callbacks.find(level);
            if (it != callbacks.end()) {
                callback = it->second;
            }
        }

        if (level == MemoryLevel::Normal) {
            logger->info("Memory level {} -> {} ({:.1f}%)", toString(previous), toString(level),
                         sample.usedRatio * 100.0);
        } else {
            logger->warn("Memory level {} -> {} ({:.1f}%)", toString(previous), toString(level),
                         sample.usedRatio * 100.0);
        }

        if (callback) {
            util::invokeGuarded(logger, std::string("Memory ") + toString(level) + " callback",
                                [&] { callback(sample); });
        }
        return level;
    }
};

ResourceMonitor::ResourceMonitor(const config::MonitorConfig& config, MemorySampler sampler) {
    if (!config.validate()) {
        throw std::invalid_argument("Invalid monitor configuration: thresholds must satisfy "
                                    "0 < warning < critical <= 1");
    }
    pImpl = std::make_shared<Impl>(config, std::move(sampler));
}

ResourceMonitor::~ResourceMonitor() {
    stopMonitoring();
}

void ResourceMonitor::registerCallback(MemoryLevel level, LevelCallback callback) {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    pImpl->callbacks[level] = std::move(callback);
}

void ResourceMonitor::startMonitoring() {
    startMonitoring(pImpl->config.pollInterval);
}

void ResourceMonitor::startMonitoring(std::chrono::milliseconds interval) {
    if (interval.count() <= 0) {
        throw std::invalid_argument("Monitoring interval must be positive");
    }

    std::lock_guard<std::mutex> lock(pImpl->controlMutex);
    if (pImpl->control) {
        return;
    }

    auto control = std::make_shared<LoopControl>();
    std::promise<void> done;
    pImpl->loopDone = done.get_future();
    pImpl->control = control;

    // Цикл держит собственные ссылки на состояние и на свой сигнал остановки
    auto state = pImpl;
    pImpl->worker = std::thread([state, control, interval, done = std::move(done)]() mutable {
        state->logger->info("Memory monitoring started (interval={}ms)", interval.count());
        std::unique_lock<std::mutex> lock(control->mutex);
        while (!control->condition.wait_for(lock, interval, [&control] { return control->stop; })) {
            lock.unlock();
            try {
                state->dispatchTick(state->sample(), *control);
            } catch (const std::exception& e) {
                state->logger->error("Memory monitoring tick failed: {}", e.what());
            }
            lock.lock();
        }
        state->logger->info("Memory monitoring stopped");
        done.set_value();
    });
}

void ResourceMonitor::stopMonitoring() {
    std::shared_ptr<LoopControl> control;
    std::thread worker;
    std::future<void> loopDone;
    {
        std::lock_guard<std::mutex> lock(pImpl->controlMutex);
        if (!pImpl->control) {
            return;
        }
        control = std::move(pImpl->control);
        worker = std::move(pImpl->worker);
        loopDone = std::move(pImpl->loopDone);
    }

    {
        std::lock_guard<std::mutex> lock(control->mutex);
        control->stop = true;
    }
    control->condition.notify_all();

    if (worker.get_id() == std::this_thread::get_id()) {
        // Остановка из колбэка уровня: цикл завершится после возврата из него
        worker.detach();
        return;
    }

    if (loopDone.wait_for(pImpl->config.stopTimeout) == std::future_status::ready) {
        worker.join();
    } else {
        pImpl->logger->warn("Memory monitoring loop did not stop within {}ms, detaching",
                            pImpl->config.stopTimeout.count());
        worker.detach();
    }

    // Ожидание колбэка, начатого до остановки; новые уже не начнутся
    std::lock_guard<std::recursive_mutex> barrier(pImpl->dispatchMutex);
}

bool ResourceMonitor::isMonitoring() const {
    std::lock_guard<std::mutex> lock(pImpl->controlMutex);
    return pImpl->control != nullptr;
}

MemorySample ResourceMonitor::getMemoryInfo() const {
    return pImpl->sample();
}

ReclaimResult ResourceMonitor::forceReclaim() const {
    auto result = reclaimHeapMemory();
    pImpl->logger->info("Heap reclamation: rss {} -> {} bytes (released {}, trimmed={})",
                        result.rssBefore, result.rssAfter, result.releasedBytes, result.trimmed);
    return result;
}

MemoryLevel ResourceMonitor::classify(double usedRatio) const {
    return pImpl->classify(usedRatio);
}

MemoryLevel ResourceMonitor::evaluate(const MemorySample& sample) {
    return pImpl->evaluate(sample);
}

MemoryLevel ResourceMonitor::currentLevel() const {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    return pImpl->lastLevel;
}

} // namespace monitor
} // namespace core
} // namespace tasker
