#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/config/PerformanceConfig.hpp"

namespace tasker {
namespace core {
namespace batch {

/**
 * @brief Отложенное обновление
 *
 * Существует только в очереди BatchCoalescer; передаётся обработчику своего
 * вида при сбросе и после этого отбрасывается.
 */
struct PendingUpdate {
    std::string kind; ///< Вид обновления (ключ обработчика)
    std::string itemId; ///< Идентификатор изменяемого элемента
    nlohmann::json payload; ///< Изменённые поля: имя -> значение
    std::chrono::steady_clock::time_point enqueuedAt; ///< Время постановки в очередь
};

/**
 * @brief Обработчик пакета
 *
 * Получает все обновления своего вида, накопленные с прошлого сброса, в
 * порядке постановки. Может бросать исключение: оно перехватывается и
 * записывается в лог, сброс остальных видов продолжается.
 */
using FlushHandler = std::function<void(const std::vector<PendingUpdate>&)>;

/**
 * @brief Функция записи одного вида, возвращаемая makeBatchedWriter()
 */
using BatchedWriter = std::function<bool(const std::string& itemId, nlohmann::json payload)>;

/**
 * @brief Статистика пакетной записи
 */
struct BatchStats {
    size_t pending = 0; ///< Обновлений в очереди
    size_t flushes = 0; ///< Непустых сбросов
    size_t deliveredUpdates = 0; ///< Обновлений, переданных обработчикам
    size_t failedHandlers = 0; ///< Вызовов обработчиков, завершившихся ошибкой
    size_t droppedUpdates = 0; ///< Обновлений без зарегистрированного обработчика

    nlohmann::json toJson() const {
        return {
            {"pending", pending},
            {"flushes", flushes},
            {"deliveredUpdates", deliveredUpdates},
            {"failedHandlers", failedHandlers},
            {"droppedUpdates", droppedUpdates}
        };
    }
};

/**
 * @brief Объединение мелких записей в пакеты
 *
 * Накапливает обновления в одной общей очереди и сбрасывает их пакетами по
 * видам: немедленно при достижении batchSize или по таймеру через
 * flushInterval после последней постановки (debounce: каждая постановка
 * переносит таймер).
 *
 * @note Потокобезопасен
 * @note Обработчики вызываются без удержания блокировок: медленный
 * обработчик не задерживает производителей и сбросы других видов
 * @note Обновления одного вида доставляются в порядке постановки, в том
 * числе при конкурентных сбросах: пакет вида, который уже доставляется,
 * передаётся тому же потоку и доставляется после текущего
 */
class BatchCoalescer {
public:
    /**
     * @brief Конструктор
     *
     * @param config Конфигурация пакетной записи
     * @throws std::invalid_argument при некорректной конфигурации
     */
    explicit BatchCoalescer(const config::BatchConfig& config = config::BatchConfig{});

    /**
     * @brief Деструктор
     *
     * Выполняет shutdown(): оставшиеся обновления сбрасываются.
     */
    ~BatchCoalescer();

    BatchCoalescer(const BatchCoalescer&) = delete;
    BatchCoalescer& operator=(const BatchCoalescer&) = delete;

    /**
     * @brief Регистрация обработчика вида
     *
     * Один обработчик на вид; повторная регистрация заменяет предыдущий.
     *
     * @param kind Вид обновления
     * @param handler Обработчик пакета
     * @throws std::invalid_argument если kind пуст или handler пуст
     */
    void registerFlushHandler(const std::string& kind, FlushHandler handler);

    /**
     * @brief Постановка обновления в очередь
     *
     * При достижении batchSize пакет сбрасывается синхронно в вызывающем
     * потоке, иначе таймер сброса переносится на flushInterval.
     *
     * @param kind Вид обновления
     * @param itemId Идентификатор элемента
     * @param payload Изменённые поля
     * @return false если BatchCoalescer уже остановлен
     */
    bool queueUpdate(const std::string& kind, const std::string& itemId,
                     nlohmann::json payload = nlohmann::json::object());

    /**
     * @brief Немедленный сброс всех накопленных обновлений
     *
     * Для пустой очереди вызов ничего не делает. Пакет вида, который в этот
     * момент доставляется другим потоком, передаётся этому потоку, и вызов
     * возвращается без ожидания.
     */
    void forceFlush();

    /**
     * @brief Остановка
     *
     * Сбрасывает очередь, отменяет таймер и отклоняет дальнейшие постановки.
     * Возвращается после доставки всех пакетов, в том числе переданных
     * другим потокам. Вызов из обработчика их не ждёт.
     * Повторный вызов безопасен, в том числе из обработчика.
     */
    void shutdown();

    /**
     * @brief Количество обновлений в очереди
     */
    size_t pendingCount() const;

    bool isShutdown() const;

    BatchStats stats() const;

    /**
     * @brief Регистрация обработчика и получение функции записи для вида
     *
     * Возвращаемая функция ссылается на этот объект и не должна вызываться
     * после его уничтожения.
     *
     * @param kind Вид обновления
     * @param handler Обработчик пакета
     * @return Функция, ставящая обновление вида kind в очередь (результат как у queueUpdate)
     */
    BatchedWriter makeBatchedWriter(const std::string& kind, FlushHandler handler);

private:
    // Реализация PIMPL
    struct Impl;
    std::unique_ptr<Impl> pImpl;

    /**
     * @brief Сброс очереди: разбиение по видам и вызов обработчиков
     */
    void flush();

    /**
     * @brief Вызов обработчика одного вида с учётом статистики
     */
    void deliver(const std::string& kind, const FlushHandler& handler,
                 const std::vector<PendingUpdate>& updates);

    /**
     * @brief Перенос таймера отложенного сброса (вызывается под блокировкой очереди)
     */
    void rescheduleFlush();
};

} // namespace batch
} // namespace core
} // namespace tasker
