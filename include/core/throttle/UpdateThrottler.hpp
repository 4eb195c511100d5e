#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "core/config/PerformanceConfig.hpp"
#include "core/thread/TimerQueue.hpp"

namespace tasker {
namespace core {
namespace throttle {

// Колбэк обновления компонента; должен быть идемпотентным
using UpdateCallback = std::function<void()>;

// Статистика ограничителя
struct ThrottleStats {
    size_t pending = 0;              // Компоненты, ожидающие цикла
    size_t invocations = 0;          // Выполненные вызовы колбэков
    size_t droppedByRateLimit = 0;   // Запросы, отброшенные по частоте
    size_t droppedWhilePaused = 0;   // Запросы, отброшенные во время паузы
    size_t failedCallbacks = 0;      // Колбэки, завершившиеся исключением
    bool cycleScheduled = false;
    bool paused = false;

    nlohmann::json toJson() const {
        return {
            {"pending", pending},
            {"invocations", invocations},
            {"droppedByRateLimit", droppedByRateLimit},
            {"droppedWhilePaused", droppedWhilePaused},
            {"failedCallbacks", failedCallbacks},
            {"cycleScheduled", cycleScheduled},
            {"paused", paused}
        };
    }
};

/**
 * @brief Ограничитель частоты обновлений компонентов.
 * @details Повторные запросы одного компонента до ближайшего цикла
 * схлопываются в один вызов; вызовы чаще 1/maxUpdatesPerSecond отбрасываются.
 * Цикл планируется только при наличии запросов.
 */
class UpdateThrottler {
public:
    using Clock = std::chrono::steady_clock;

    explicit UpdateThrottler(const config::ThrottleConfig& config = config::ThrottleConfig{});
    ~UpdateThrottler();

    // Запрет копирования
    UpdateThrottler(const UpdateThrottler&) = delete;
    UpdateThrottler& operator=(const UpdateThrottler&) = delete;

    // Регистрация колбэка; повторная регистрация заменяет предыдущий
    void registerUpdateCallback(const std::string& componentId, UpdateCallback callback);

    // Запрос обновления; false если запрос отброшен (частота или пауза)
    bool requestUpdate(const std::string& componentId);

    // Остановка: отмена цикла, очистка ожидающих, пауза до resume()
    void stop();

    // Снятие паузы после stop()
    void resume();

    size_t pendingCount() const;
    bool isCycleScheduled() const;
    bool isPaused() const;
    ThrottleStats stats() const;

    // Регистрация колбэка и получение функции-запроса для компонента
    std::function<bool()> makeThrottledRefresher(const std::string& componentId, UpdateCallback callback);

private:
    void processCycle(std::uint64_t generation);
    void scheduleCycle();

    config::ThrottleConfig config_;
    std::unordered_set<std::string> pending_;
    std::unordered_map<std::string, UpdateCallback> callbacks_;
    std::unordered_map<std::string, Clock::time_point> lastInvocation_;
    bool cycleScheduled_ = false;
    bool paused_ = false;
    std::uint64_t generation_ = 0;           // Меняется при stop(); устаревший цикл не перепланируется
    thread::TimerQueue::TaskId timerId_ = 0;
    size_t invocations_ = 0;
    size_t droppedByRateLimit_ = 0;
    size_t droppedWhilePaused_ = 0;
    size_t failedCallbacks_ = 0;
    mutable std::mutex mutex_;
    std::shared_ptr<spdlog::logger> logger_;
    thread::TimerQueue timer_;
};

} // namespace throttle
} // namespace core
} // namespace tasker
