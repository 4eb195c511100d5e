#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "core/config/PerformanceConfig.hpp"

namespace tasker {
namespace core {
namespace cache {

// Запись кэша результатов
struct CacheEntry {
    std::string key;
    std::string value;                                   // Непрозрачный результат вычисления
    std::chrono::steady_clock::time_point storedAt;      // Время сохранения
};

// Снимок состояния кэша
struct CacheStats {
    size_t size = 0;
    size_t maxSize = 0;
    long long ttlSeconds = 0;
    size_t hits = 0;
    size_t misses = 0;
    size_t evictions = 0;

    double hitRate() const {
        const size_t total = hits + misses;
        return total == 0 ? 0.0 : static_cast<double>(hits) / total;
    }

    nlohmann::json toJson() const {
        return {
            {"size", size},
            {"maxSize", maxSize},
            {"ttlSeconds", ttlSeconds},
            {"hits", hits},
            {"misses", misses},
            {"evictions", evictions},
            {"hitRate", hitRate()}
        };
    }
};

/**
 * @brief Кэш результатов чистых вычислений по загрублённой метке времени.
 * @details Ключ строится из основной метки времени, округлённой вниз до шага
 * keyGranularity, и необязательной вторичной метки. Размер ограничен maxSize
 * (вытеснение LRU), записи устаревают через ttl. Промах не считается ошибкой.
 */
class ResultCache {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = std::chrono::system_clock::time_point;
    using ComputeFn = std::function<std::string()>;

    // Результат для отсутствующей основной метки; хранилище не затрагивается
    static constexpr const char* kDefaultResult = "normal";

    explicit ResultCache(const config::ResultCacheConfig& config = config::ResultCacheConfig{});

    ResultCache(const ResultCache&) = delete;
    ResultCache& operator=(const ResultCache&) = delete;

    // Получение результата; std::nullopt при промахе или истёкшем TTL
    std::optional<std::string> get(const std::optional<TimePoint>& primary,
                                   const std::optional<TimePoint>& secondary = std::nullopt);

    // Сохранение результата
    void set(const std::optional<TimePoint>& primary, const std::string& result,
             const std::optional<TimePoint>& secondary = std::nullopt);

    // Мемоизация: при промахе вызывает compute() вне блокировки и сохраняет результат
    std::string getOrCompute(const std::optional<TimePoint>& primary,
                             const std::optional<TimePoint>& secondary,
                             const ComputeFn& compute);

    // Очистка кэша
    void clear();

    size_t size() const;
    CacheStats stats() const;

    // Построение ключа по меткам времени
    std::string makeKey(const TimePoint& primary,
                        const std::optional<TimePoint>& secondary = std::nullopt) const;

private:
    void evictLRU();
    void touch(const std::string& key);

    config::ResultCacheConfig config_;
    std::unordered_map<std::string, CacheEntry> cache_;
    std::unordered_map<std::string, std::uint64_t> accessTimes_;  // Логическое время последнего доступа
    std::uint64_t accessClock_ = 0;
    size_t hits_ = 0;
    size_t misses_ = 0;
    size_t evictions_ = 0;
    mutable std::recursive_mutex mutex_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace cache
} // namespace core
} // namespace tasker
