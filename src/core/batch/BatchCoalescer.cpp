#include "core/batch/BatchCoalescer.hpp"
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <unordered_map>
#include <utility>
#include <spdlog/spdlog.h>
#include "core/logging/Logging.hpp"
#include "core/thread/TimerQueue.hpp"
#include "core/util/GuardedInvoke.hpp"

namespace tasker {
namespace core {
namespace batch {

// Реализация PIMPL
struct BatchCoalescer::Impl {
    config::BatchConfig config;                              // Конфигурация
    std::vector<PendingUpdate> pending;                      // Общая очередь всех видов
    std::unordered_map<std::string, FlushHandler> handlers;  // Обработчики по видам
    mutable std::mutex queueMutex;                           // Мьютекс очереди, реестра и доставки
    std::unordered_map<std::string, std::thread::id> delivering; // Виды, пакет которых сейчас у обработчика
    std::condition_variable drained;                         // delivering опустел
    std::unordered_map<std::string, std::deque<std::vector<PendingUpdate>>> backlog; // Пакеты, ждущие своей очереди
    size_t backlogSize = 0;                                  // Обновлений в backlog
    thread::TimerQueue timer;                                // Таймер отложенного сброса
    thread::TimerQueue::TaskId timerId = 0;                  // Текущая отложенная задача
    bool stopped = false;
    std::atomic<size_t> flushes{0};
    std::atomic<size_t> delivered{0};
    std::atomic<size_t> failed{0};
    std::atomic<size_t> dropped{0};
    std::shared_ptr<spdlog::logger> logger;

    explicit Impl(const config::BatchConfig& cfg)
        : config(cfg)
        , timer("batch")
        , logger(logging::getLogger("batch")) {}
};

// Конструктор
BatchCoalescer::BatchCoalescer(const config::BatchConfig& config) {
    if (!config.validate()) {
        throw std::invalid_argument("Некорректная конфигурация пакетной записи");
    }
    pImpl = std::make_unique<Impl>(config);
    pImpl->logger->debug("BatchCoalescer создан: batchSize={}, flushInterval={}ms",
                         config.batchSize, config.flushInterval.count());
}

// Деструктор
BatchCoalescer::~BatchCoalescer() {
    try {
        shutdown();
    } catch (const std::exception& e) {
        pImpl->logger->error("Ошибка остановки BatchCoalescer: {}", e.what());
    }
    // Ожидание задачи таймера, которая могла начаться до отмены
    pImpl->timer.stop();
}

// Регистрация обработчика вида
void BatchCoalescer::registerFlushHandler(const std::string& kind, FlushHandler handler) {
    if (kind.empty()) {
        throw std::invalid_argument("Вид обновления не может быть пустым");
    }
    if (!handler) {
        throw std::invalid_argument("Обработчик пакета не задан для вида '" + kind + "'");
    }

    std::lock_guard<std::mutex> lock(pImpl->queueMutex);
    auto [it, inserted] = pImpl->handlers.insert_or_assign(kind, std::move(handler));
    if (inserted) {
        pImpl->logger->debug("Обработчик пакета зарегистрирован: '{}'", kind);
    } else {
        pImpl->logger->info("Обработчик пакета заменён: '{}'", it->first);
    }
}

// Постановка обновления в очередь
bool BatchCoalescer::queueUpdate(const std::string& kind, const std::string& itemId,
                                 nlohmann::json payload) {
    bool flushNow = false;
    {
        std::lock_guard<std::mutex> lock(pImpl->queueMutex);
        if (pImpl->stopped) {
            pImpl->logger->warn("BatchCoalescer остановлен, обновление '{}' для {} отклонено", kind, itemId);
            return false;
        }

        pImpl->pending.push_back(PendingUpdate{
            kind,
            itemId,
            std::move(payload),
            std::chrono::steady_clock::now()
        });

        if (pImpl->pending.size() >= pImpl->config.batchSize) {
            flushNow = true;
        } else {
            rescheduleFlush();
        }
    }

    // Сброс по размеру выполняется синхронно, но вне блокировки очереди
    if (flushNow) {
        flush();
    }
    return true;
}

void BatchCoalescer::forceFlush() {
    flush();
}

// Остановка
void BatchCoalescer::shutdown() {
    {
        std::lock_guard<std::mutex> lock(pImpl->queueMutex);
        if (!pImpl->stopped) {
            pImpl->stopped = true;
            pImpl->logger->info("BatchCoalescer: завершение работы, в очереди {} обновлений",
                                pImpl->pending.size());
        }
    }

    flush();

    std::unique_lock<std::mutex> lock(pImpl->queueMutex);
    // Ожидание пакетов, переданных потокам, которые их сейчас доставляют.
    // Поток, сам владеющий доставкой (вызов из обработчика), не ждёт
    const auto self = std::this_thread::get_id();
    const bool ownsDelivery = std::any_of(pImpl->delivering.begin(), pImpl->delivering.end(),
        [&self](const auto& entry) { return entry.second == self; });
    if (!ownsDelivery) {
        pImpl->drained.wait(lock, [this] { return pImpl->delivering.empty(); });
    }
    pImpl->timer.cancel(pImpl->timerId);
    pImpl->timerId = 0;
}

size_t BatchCoalescer::pendingCount() const {
    std::lock_guard<std::mutex> lock(pImpl->queueMutex);
    return pImpl->pending.size() + pImpl->backlogSize;
}

bool BatchCoalescer::isShutdown() const {
    std::lock_guard<std::mutex> lock(pImpl->queueMutex);
    return pImpl->stopped;
}

BatchStats BatchCoalescer::stats() const {
    BatchStats stats;
    stats.pending = pendingCount();
    stats.flushes = pImpl->flushes.load();
    stats.deliveredUpdates = pImpl->delivered.load();
    stats.failedHandlers = pImpl->failed.load();
    stats.droppedUpdates = pImpl->dropped.load();
    return stats;
}

BatchedWriter BatchCoalescer::makeBatchedWriter(const std::string& kind, FlushHandler handler) {
    registerFlushHandler(kind, std::move(handler));
    return [this, kind](const std::string& itemId, nlohmann::json payload) {
        return queueUpdate(kind, itemId, std::move(payload));
    };
}

// Сброс очереди
void BatchCoalescer::flush() {
    std::unordered_map<std::string, FlushHandler> handlers;
    std::unordered_map<std::string, std::vector<PendingUpdate>> byKind;
    std::vector<std::string> owned;
    {
        std::lock_guard<std::mutex> lock(pImpl->queueMutex);
        pImpl->timer.cancel(pImpl->timerId);
        pImpl->timerId = 0;

        if (pImpl->pending.empty()) {
            return;
        }
        std::vector<PendingUpdate> batch;
        batch.swap(pImpl->pending);
        handlers = pImpl->handlers;

        // Группировка по видам с сохранением порядка постановки
        std::vector<std::string> kinds;
        for (auto& update : batch) {
            auto [it, inserted] = byKind.try_emplace(update.kind);
            if (inserted) {
                kinds.push_back(update.kind);
            }
            it->second.push_back(std::move(update));
        }
        pImpl->logger->debug("Сброс пакета: {} обновлений, {} видов", batch.size(), kinds.size());

        // Вид, который уже доставляется другим сбросом, уходит в его backlog,
        // чтобы пакеты одного вида не обгоняли друг друга
        for (const auto& kind : kinds) {
            if (pImpl->delivering.count(kind)) {
                pImpl->backlogSize += byKind[kind].size();
                pImpl->backlog[kind].push_back(std::move(byKind[kind]));
            } else {
                pImpl->delivering.emplace(kind, std::this_thread::get_id());
                owned.push_back(kind);
            }
        }
    }
    ++pImpl->flushes;

    for (const auto& kind : owned) {
        auto found = handlers.find(kind);
        FlushHandler handler = found != handlers.end() ? found->second : FlushHandler{};
        std::vector<PendingUpdate> updates = std::move(byKind[kind]);
        while (true) {
            deliver(kind, handler, updates);

            std::lock_guard<std::mutex> lock(pImpl->queueMutex);
            auto queued = pImpl->backlog.find(kind);
            if (queued == pImpl->backlog.end() || queued->second.empty()) {
                pImpl->backlog.erase(kind);
                pImpl->delivering.erase(kind);
                if (pImpl->delivering.empty()) {
                    pImpl->drained.notify_all();
                }
                break;
            }
            updates = std::move(queued->second.front());
            queued->second.pop_front();
            pImpl->backlogSize -= updates.size();
            // Обработчик мог быть заменён, пока шла доставка
            auto current = pImpl->handlers.find(kind);
            handler = current != pImpl->handlers.end() ? current->second : FlushHandler{};
        }
    }
}

// Передача пакета одного вида обработчику, без удержания блокировок
void BatchCoalescer::deliver(const std::string& kind, const FlushHandler& handler,
                             const std::vector<PendingUpdate>& updates) {
    if (!handler) {
        pImpl->dropped += updates.size();
        pImpl->logger->warn("Нет обработчика для вида '{}', отброшено {} обновлений",
                            kind, updates.size());
        return;
    }

    auto result = util::invokeGuarded(pImpl->logger, "Flush handler '" + kind + "'",
                                      [&] { handler(updates); });
    if (result) {
        pImpl->delivered += updates.size();
    } else {
        ++pImpl->failed;
    }
}

// Перенос таймера отложенного сброса
void BatchCoalescer::rescheduleFlush() {
    pImpl->timer.cancel(pImpl->timerId);
    pImpl->timerId = pImpl->timer.schedule(pImpl->config.flushInterval, [this] {
        flush();
    });
}

} // namespace batch
} // namespace core
} // namespace tasker
