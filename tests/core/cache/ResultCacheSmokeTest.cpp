#include <cassert>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include "core/cache/ResultCache.hpp"

using namespace std::chrono_literals;
using tasker::core::cache::ResultCache;
using tasker::core::config::ResultCacheConfig;
using Clock = std::chrono::system_clock;

// Начало минуты, чтобы смещения в пределах минуты не пересекали границу
Clock::time_point minuteStart(std::int64_t minutes) {
    return Clock::time_point(std::chrono::minutes(minutes));
}

void smokeTestAbsentPrimary() {
    ResultCache cache;
    auto result = cache.get(std::nullopt);
    assert(result && *result == "normal");
    cache.set(std::nullopt, "overdue");
    assert(cache.size() == 0);
    std::cout << "[OK] ResultCache absent primary test\n";
}

void smokeTestMinuteCoalescing() {
    ResultCache cache;
    const auto t = minuteStart(29000000) + 10s;

    assert(!cache.get(t));
    cache.set(t, "overdue");
    auto hit = cache.get(t + 30s);
    assert(hit && *hit == "overdue");
    assert(!cache.get(t + 60s));

    // Вторичная метка входит в ключ
    const auto completed = t + 5s;
    assert(!cache.get(t, completed));
    cache.set(t, "completed", completed);
    auto withSecondary = cache.get(t, completed);
    assert(withSecondary && *withSecondary == "completed");
    assert(cache.size() == 2);
    std::cout << "[OK] ResultCache minute coalescing test\n";
}

void smokeTestMakeKey() {
    ResultCache cache;
    assert(cache.makeKey(Clock::time_point(125s)) == "due_120");
    assert(cache.makeKey(Clock::time_point(125s), Clock::time_point(1500ms)) ==
           "due_120_completed_1500");
    assert(cache.makeKey(Clock::time_point(-5s)) == "due_-60");
    std::cout << "[OK] ResultCache key test\n";
}

void smokeTestLruEviction() {
    ResultCacheConfig config;
    config.maxSize = 2;
    ResultCache cache(config);

    const auto t1 = minuteStart(1);
    const auto t2 = minuteStart(2);
    const auto t3 = minuteStart(3);

    cache.set(t1, "a");
    cache.set(t2, "b");
    cache.set(t3, "c");

    assert(cache.size() == 2);
    assert(!cache.get(t1));
    assert(cache.get(t2));
    assert(cache.get(t3));

    // Обращение к t2 делает t3 самой старой записью
    assert(cache.get(t2));
    cache.set(t1, "a");
    assert(!cache.get(t3));
    assert(cache.get(t2));

    // Перезапись при заполненном кэше тоже вытесняет самую старую запись (t1)
    cache.set(t2, "b2");
    assert(cache.size() == 1);
    assert(!cache.get(t1));
    assert(*cache.get(t2) == "b2");
    assert(cache.stats().evictions == 3);
    std::cout << "[OK] ResultCache LRU eviction test\n";
}

void smokeTestTtlExpiry() {
    ResultCacheConfig config;
    config.ttl = 1s;
    ResultCache cache(config);

    const auto t = minuteStart(42);
    cache.set(t, "due_soon");
    assert(cache.get(t));

    std::this_thread::sleep_for(1100ms);
    assert(!cache.get(t));
    assert(cache.size() == 0);
    std::cout << "[OK] ResultCache TTL expiry test\n";
}

void smokeTestGetOrCompute() {
    ResultCache cache;
    int computations = 0;
    auto compute = [&] { ++computations; return std::string("overdue"); };

    const auto t = minuteStart(7);
    assert(cache.getOrCompute(t, std::nullopt, compute) == "overdue");
    assert(cache.getOrCompute(t + 15s, std::nullopt, compute) == "overdue");
    assert(computations == 1);

    assert(cache.getOrCompute(std::nullopt, std::nullopt, compute) == "normal");
    assert(computations == 1);

    auto stats = cache.stats();
    assert(stats.hits == 1);
    assert(stats.misses == 1);
    assert(stats.hitRate() > 0.49 && stats.hitRate() < 0.51);
    assert(stats.toJson()["size"] == 1);
    std::cout << "[OK] ResultCache getOrCompute test\n";
}

void stressTestResultCache() {
    ResultCacheConfig config;
    config.maxSize = 64;
    ResultCache cache(config);

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&cache, t] {
            for (int i = 0; i < 2000; ++i) {
                const auto due = minuteStart(t * 10000 + i % 200);
                if (!cache.get(due)) {
                    cache.set(due, "normal");
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    assert(cache.size() <= 64);
    cache.clear();
    assert(cache.size() == 0);
    std::cout << "[OK] ResultCache stress test\n";
}

int main() {
    smokeTestAbsentPrimary();
    smokeTestMinuteCoalescing();
    smokeTestMakeKey();
    smokeTestLruEviction();
    smokeTestTtlExpiry();
    smokeTestGetOrCompute();
    stressTestResultCache();
    std::cout << "All ResultCache tests passed!\n";
    return 0;
}
