#include "core/thread/TimerQueue.hpp"
#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <utility>
#include "core/logging/Logging.hpp"
#include "core/util/GuardedInvoke.hpp"

namespace tasker {
namespace core {
namespace thread {

// Реализация PIMPL
struct TimerQueue::Impl {
    using Deadline = std::pair<Clock::time_point, TaskId>;

    std::string name;                                   // Имя очереди для логов
    std::map<Deadline, Task> tasks;                     // Задачи, упорядоченные по сроку
    std::unordered_map<TaskId, Clock::time_point> index; // Срок по идентификатору
    mutable std::mutex queueMutex;                      // Мьютекс для очереди
    std::condition_variable condition;                  // Условная переменная
    std::mutex joinMutex;                               // Сериализация join()
    std::thread worker;                                 // Рабочий поток
    std::thread::id workerId;
    bool stop = false;                                  // Флаг остановки
    TaskId nextId = 1;
    std::atomic<size_t> executed{0};
    std::atomic<size_t> cancelled{0};
    std::atomic<size_t> failed{0};
    std::shared_ptr<spdlog::logger> logger;

    explicit Impl(const std::string& queueName)
        : name(queueName)
        , logger(logging::getLogger("timer")) {}

    void processTasks() {
        std::unique_lock<std::mutex> lock(queueMutex);
        while (true) {
            if (stop) {
                return;
            }
            if (tasks.empty()) {
                condition.wait(lock, [this] { return stop || !tasks.empty(); });
                continue;
            }

            auto next = tasks.begin();
            const auto deadline = next->first.first;
            if (Clock::now() < deadline) {
                condition.wait_until(lock, deadline);
                continue;
            }

            const TaskId id = next->first.second;
            Task task = std::move(next->second);
            tasks.erase(next);
            index.erase(id);

            // Задача выполняется без удержания мьютекса очереди
            lock.unlock();
            auto result = util::invokeGuarded(logger, "Timer task #" + std::to_string(id) + " in '" + name + "'", task);
            if (result) {
                ++executed;
            } else {
                ++failed;
            }
            lock.lock();
        }
    }
};

TimerQueue::TimerQueue(const std::string& name)
    : pImpl(std::make_shared<Impl>(name)) {
    // Рабочий поток держит собственную ссылку на состояние
    auto state = pImpl;
    pImpl->worker = std::thread([state] {
        state->processTasks();
    });
    pImpl->workerId = pImpl->worker.get_id();
    pImpl->logger->debug("Timer queue '{}' started", name);
}

TimerQueue::~TimerQueue() {
    stop();
}

TimerQueue::TaskId TimerQueue::schedule(std::chrono::milliseconds delay, Task task) {
    if (!task) return 0;

    TaskId id = 0;
    {
        std::lock_guard<std::mutex> lock(pImpl->queueMutex);
        if (pImpl->stop) {
            pImpl->logger->debug("Timer queue '{}' is stopped, task rejected", pImpl->name);
            return 0;
        }
        id = pImpl->nextId++;
        const auto deadline = Clock::now() + delay;
        pImpl->tasks.emplace(Impl::Deadline{deadline, id}, std::move(task));
        pImpl->index.emplace(id, deadline);
    }
    pImpl->condition.notify_one();
    return id;
}

bool TimerQueue::cancel(TaskId id) {
    if (id == 0) return false;

    std::lock_guard<std::mutex> lock(pImpl->queueMutex);
    auto it = pImpl->index.find(id);
    if (it == pImpl->index.end()) {
        return false;
    }
    pImpl->tasks.erase(Impl::Deadline{it->second, id});
    pImpl->index.erase(it);
    ++pImpl->cancelled;
    return true;
}

size_t TimerQueue::pendingCount() const {
    std::lock_guard<std::mutex> lock(pImpl->queueMutex);
    return pImpl->tasks.size();
}

bool TimerQueue::isWorkerThread() const {
    return std::this_thread::get_id() == pImpl->workerId;
}

bool TimerQueue::isStopped() const {
    std::lock_guard<std::mutex> lock(pImpl->queueMutex);
    return pImpl->stop;
}

void TimerQueue::stop() {
    size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(pImpl->queueMutex);
        if (!pImpl->stop) {
            pImpl->stop = true;
            dropped = pImpl->tasks.size();
            pImpl->tasks.clear();
            pImpl->index.clear();
        }
    }
    pImpl->condition.notify_all();

    std::lock_guard<std::mutex> joinLock(pImpl->joinMutex);
    if (!pImpl->worker.joinable()) {
        return;
    }
    if (isWorkerThread()) {
        // Остановка изнутри задачи: поток завершится сам после возврата из неё
        pImpl->worker.detach();
    } else {
        pImpl->worker.join();
    }
    pImpl->logger->debug("Timer queue '{}' stopped, {} pending tasks dropped", pImpl->name, dropped);
}

TimerQueueMetrics TimerQueue::getMetrics() const {
    TimerQueueMetrics metrics;
    metrics.pendingTasks = pendingCount();
    metrics.executedTasks = pImpl->executed.load();
    metrics.cancelledTasks = pImpl->cancelled.load();
    metrics.failedTasks = pImpl->failed.load();
    return metrics;
}

} // namespace thread
} // namespace core
} // namespace tasker
