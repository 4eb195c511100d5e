#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace tasker {
namespace core {
namespace thread {

// Метрики очереди отложенных задач
struct TimerQueueMetrics {
    size_t pendingTasks;     // Задачи, ожидающие срока
    size_t executedTasks;    // Выполненные задачи
    size_t cancelledTasks;   // Отменённые задачи
    size_t failedTasks;      // Задачи, завершившиеся исключением
};

/**
 * @brief Очередь однократных отложенных задач с одним рабочим потоком.
 * @details Задача выполняется не раньше заданного срока и может быть отменена
 * по идентификатору, пока не началась. Задачи выполняются в рабочем потоке
 * последовательно, в порядке сроков.
 */
class TimerQueue {
public:
    using TaskId = std::uint64_t;
    using Task = std::function<void()>;
    using Clock = std::chrono::steady_clock;

    explicit TimerQueue(const std::string& name = "timer");
    ~TimerQueue();

    // Запрет копирования
    TimerQueue(const TimerQueue&) = delete;
    TimerQueue& operator=(const TimerQueue&) = delete;

    // Постановка задачи; 0 если очередь остановлена или задача пуста
    TaskId schedule(std::chrono::milliseconds delay, Task task);

    // Отмена задачи; false если задача уже запущена, выполнена или неизвестна
    bool cancel(TaskId id);

    // Количество задач в ожидании
    size_t pendingCount() const;

    // Проверка, вызван ли из рабочего потока очереди
    bool isWorkerThread() const;

    bool isStopped() const;

    // Остановка: ожидающие задачи отбрасываются, рабочий поток завершается
    void stop();

    TimerQueueMetrics getMetrics() const;

private:
    // Реализация PIMPL; разделяется с рабочим потоком
    struct Impl;
    std::shared_ptr<Impl> pImpl;
};

} // namespace thread
} // namespace core
} // namespace tasker
