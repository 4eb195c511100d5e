#include "core/cache/ResultCache.hpp"
#include <algorithm>
#include <stdexcept>
#include "core/logging/Logging.hpp"

namespace tasker {
namespace core {
namespace cache {

ResultCache::ResultCache(const config::ResultCacheConfig& config)
    : config_(config)
    , logger_(logging::getLogger("cache")) {
    if (!config_.validate()) {
        throw std::invalid_argument("Некорректная конфигурация кэша результатов");
    }
    cache_.reserve(config_.maxSize);
}

std::string ResultCache::makeKey(const TimePoint& primary,
                                 const std::optional<TimePoint>& secondary) const {
    using std::chrono::duration_cast;
    using std::chrono::milliseconds;
    using std::chrono::seconds;

    // Округление вниз до шага, в том числе для меток до эпохи
    const auto step = config_.keyGranularity.count();
    const auto epochSeconds = duration_cast<seconds>(primary.time_since_epoch()).count();
    auto bucket = epochSeconds / step;
    if (epochSeconds % step != 0 && epochSeconds < 0) {
        --bucket;
    }

    std::string key = "due_" + std::to_string(bucket * step);
    if (secondary) {
        key += "_completed_" + std::to_string(
            duration_cast<milliseconds>(secondary->time_since_epoch()).count());
    }
    return key;
}

std::optional<std::string> ResultCache::get(const std::optional<TimePoint>& primary,
                                            const std::optional<TimePoint>& secondary) {
    if (!primary) {
        return std::string(kDefaultResult);
    }

    const std::string key = makeKey(*primary, secondary);
    const auto now = Clock::now();

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = cache_.find(key);
    if (it == cache_.end()) {
        ++misses_;
        logger_->debug("Кэш-промах: {}", key);
        return std::nullopt;
    }

    // Проверка TTL
    if (now - it->second.storedAt >= config_.ttl) {
        cache_.erase(it);
        accessTimes_.erase(key);
        ++misses_;
        logger_->debug("Запись устарела и удалена: {}", key);
        return std::nullopt;
    }

    ++hits_;
    touch(key);
    return it->second.value;
}

void ResultCache::set(const std::optional<TimePoint>& primary, const std::string& result,
                      const std::optional<TimePoint>& secondary) {
    if (!primary) return;

    const std::string key = makeKey(*primary, secondary);

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    // Перед любой вставкой, в том числе перезаписью, при заполненном кэше
    if (cache_.size() >= config_.maxSize) {
        evictLRU();
    }

    cache_[key] = CacheEntry{key, result, Clock::now()};
    touch(key);
    logger_->debug("Результат сохранён в кэш: key={}, value={}", key, result);
}

std::string ResultCache::getOrCompute(const std::optional<TimePoint>& primary,
                                      const std::optional<TimePoint>& secondary,
                                      const ComputeFn& compute) {
    if (auto cached = get(primary, secondary)) {
        return *cached;
    }

    // Вычисление выполняется без блокировки кэша
    std::string result = compute();
    set(primary, result, secondary);
    return result;
}

void ResultCache::clear() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const size_t removed = cache_.size();
    cache_.clear();
    accessTimes_.clear();
    logger_->debug("Кэш очищен: удалено {} записей", removed);
}

size_t ResultCache::size() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return cache_.size();
}

CacheStats ResultCache::stats() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    CacheStats stats;
    stats.size = cache_.size();
    stats.maxSize = config_.maxSize;
    stats.ttlSeconds = config_.ttl.count();
    stats.hits = hits_;
    stats.misses = misses_;
    stats.evictions = evictions_;
    return stats;
}

void ResultCache::evictLRU() {
    if (accessTimes_.empty()) return;

    auto oldest = std::min_element(
        accessTimes_.begin(),
        accessTimes_.end(),
        [](const auto& a, const auto& b) {
            return a.second < b.second;
        }
    );

    const std::string key = oldest->first;
    accessTimes_.erase(oldest);
    cache_.erase(key);
    ++evictions_;
    logger_->debug("LRU-вытеснение: {}", key);
}

void ResultCache::touch(const std::string& key) {
    accessTimes_[key] = ++accessClock_;
}

} // namespace cache
} // namespace core
} // namespace tasker
