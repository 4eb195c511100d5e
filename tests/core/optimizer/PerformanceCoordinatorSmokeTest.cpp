#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>
#include "core/optimizer/PerformanceCoordinator.hpp"

using namespace std::chrono_literals;
using namespace tasker::core;

monitor::MemorySample sampleAt(double ratio) {
    monitor::MemorySample sample;
    sample.usedRatio = ratio;
    sample.sampledAt = std::chrono::system_clock::now();
    return sample;
}

// Координатор с управляемым значением занятой памяти
struct Fixture {
    std::shared_ptr<std::atomic<double>> ratio = std::make_shared<std::atomic<double>>(0.3);
    std::atomic<size_t> persisted{0};
    std::atomic<int> renders{0};
    std::unique_ptr<optimizer::PerformanceCoordinator> coordinator;

    explicit Fixture(config::PerformanceConfig config = config::PerformanceConfig{}) {
        auto shared = ratio;
        coordinator = std::make_unique<optimizer::PerformanceCoordinator>(
            config, [shared] { return sampleAt(shared->load()); });
        coordinator->batches().registerFlushHandler("todo",
            [this](const std::vector<batch::PendingUpdate>& updates) { persisted += updates.size(); });
        coordinator->updates().registerUpdateCallback("todo-list", [this] { ++renders; });
    }

    void fill() {
        const auto now = std::chrono::system_clock::now();
        coordinator->cache().set(now, "overdue");
        coordinator->cache().set(now + 2h, "due_soon");
        coordinator->batches().queueUpdate("todo", "1", {{"done", true}});
        coordinator->batches().queueUpdate("todo", "2", {{"done", false}});
        coordinator->updates().requestUpdate("todo-list");
    }
};

void smokeTestLifecycle() {
    Fixture fixture;
    auto& coordinator = *fixture.coordinator;
    assert(coordinator.state() == optimizer::CoordinatorState::Uninitialized);

    assert(coordinator.initialize());
    assert(coordinator.initialize());
    assert(coordinator.isRunning());
    assert(coordinator.monitor().isMonitoring());

    coordinator.shutdown();
    coordinator.shutdown();
    assert(coordinator.state() == optimizer::CoordinatorState::ShutDown);
    assert(!coordinator.monitor().isMonitoring());
    assert(!coordinator.initialize());
    assert(!coordinator.batches().queueUpdate("todo", "3"));
    std::cout << "[OK] PerformanceCoordinator lifecycle test\n";
}

void smokeTestShutdownFlushes() {
    Fixture fixture;
    auto& coordinator = *fixture.coordinator;
    coordinator.initialize();
    fixture.fill();

    coordinator.shutdown();
    assert(fixture.persisted == 2);
    assert(coordinator.cache().size() == 0);
    assert(coordinator.updates().pendingCount() == 0);
    std::cout << "[OK] PerformanceCoordinator shutdown flush test\n";
}

void smokeTestWarningPressure() {
    Fixture fixture;
    auto& coordinator = *fixture.coordinator;
    coordinator.initialize();
    fixture.fill();

    coordinator.monitor().evaluate(sampleAt(0.85));

    assert(coordinator.cache().size() == 0);
    assert(coordinator.batches().pendingCount() == 0);
    assert(fixture.persisted == 2);
    // Ограничитель продолжает работать
    assert(!coordinator.updates().isPaused());
    assert(coordinator.updates().pendingCount() == 1);
    std::cout << "[OK] PerformanceCoordinator warning pressure test\n";
}

void smokeTestCriticalPressure() {
    Fixture fixture;
    auto& coordinator = *fixture.coordinator;
    coordinator.initialize();
    fixture.fill();

    coordinator.monitor().evaluate(sampleAt(0.95));

    auto stats = coordinator.getPerformanceStats();
    assert(stats.cache.size == 0);
    assert(stats.batchPending == 0);
    assert(stats.throttlePending == 0);
    assert(fixture.persisted == 2);
    assert(coordinator.updates().isPaused());
    assert(!coordinator.updates().requestUpdate("todo-list"));

    // Обновления возобновляются только явно
    coordinator.monitor().evaluate(sampleAt(0.3));
    assert(coordinator.updates().isPaused());
    coordinator.updates().resume();
    assert(coordinator.updates().requestUpdate("todo-list"));
    std::cout << "[OK] PerformanceCoordinator critical pressure test\n";
}

void smokeTestPressureFromLoop() {
    config::PerformanceConfig config;
    config.monitor.pollInterval = 20ms;
    Fixture fixture(config);
    auto& coordinator = *fixture.coordinator;
    coordinator.initialize();
    fixture.fill();

    fixture.ratio->store(0.95);
    std::this_thread::sleep_for(200ms);

    assert(coordinator.cache().size() == 0);
    assert(coordinator.batches().pendingCount() == 0);
    assert(coordinator.updates().pendingCount() == 0);
    assert(coordinator.monitor().currentLevel() == monitor::MemoryLevel::Critical);
    coordinator.shutdown();
    std::cout << "[OK] PerformanceCoordinator monitoring loop test\n";
}

void smokeTestDestroyWhileSampling() {
    config::PerformanceConfig config;
    config.monitor.pollInterval = 10ms;
    config.monitor.stopTimeout = 50ms;

    auto persisted = std::make_shared<std::atomic<size_t>>(0);
    auto renders = std::make_shared<std::atomic<int>>(0);
    auto coordinator = std::make_unique<optimizer::PerformanceCoordinator>(config, [] {
        std::this_thread::sleep_for(300ms);
        return sampleAt(0.95);
    });
    coordinator->batches().registerFlushHandler("todo",
        [persisted](const std::vector<batch::PendingUpdate>& updates) { *persisted += updates.size(); });
    coordinator->updates().registerUpdateCallback("todo-list", [renders] { ++*renders; });
    coordinator->initialize();
    coordinator->batches().queueUpdate("todo", "1");

    // Цикл мониторинга занят снимком, когда координатор уничтожается
    std::this_thread::sleep_for(30ms);
    const auto start = std::chrono::steady_clock::now();
    coordinator.reset();
    assert(std::chrono::steady_clock::now() - start < 200ms);
    assert(*persisted == 1);

    // Реакция на critical после уничтожения не выполняется
    const int rendersAfterReset = renders->load();
    std::this_thread::sleep_for(400ms);
    assert(*persisted == 1);
    assert(*renders == rendersAfterReset);
    std::cout << "[OK] PerformanceCoordinator destroy while sampling test\n";
}

void smokeTestStats() {
    Fixture fixture;
    auto& coordinator = *fixture.coordinator;
    coordinator.initialize();
    fixture.fill();

    auto stats = coordinator.getPerformanceStats();
    assert(stats.cache.size == 2);
    assert(stats.cache.maxSize == 1000);
    assert(stats.batchPending == 2);
    assert(stats.throttlePending == 1);
    assert(stats.memory.usedRatio > 0.29 && stats.memory.usedRatio < 0.31);

    auto json = stats.toJson();
    assert(json.contains("cache"));
    assert(json.contains("memory"));
    assert(json["batchPending"] == 2);
    assert(json["throttlePending"] == 1);
    coordinator.logStats();
    std::cout << "[OK] PerformanceCoordinator stats test\n";
}

void smokeTestSharedInstance() {
    auto first = optimizer::getPerformanceCoordinator();
    auto second = optimizer::getPerformanceCoordinator();
    assert(first == second);
    assert(first->isRunning());

    optimizer::resetPerformanceCoordinator();
    assert(first->state() == optimizer::CoordinatorState::ShutDown);

    auto third = optimizer::getPerformanceCoordinator();
    assert(third != first);
    assert(third->isRunning());
    optimizer::resetPerformanceCoordinator();
    optimizer::resetPerformanceCoordinator();
    std::cout << "[OK] PerformanceCoordinator shared instance test\n";
}

int main() {
    smokeTestLifecycle();
    smokeTestShutdownFlushes();
    smokeTestWarningPressure();
    smokeTestCriticalPressure();
    smokeTestPressureFromLoop();
    smokeTestDestroyWhileSampling();
    smokeTestStats();
    smokeTestSharedInstance();
    std::cout << "All PerformanceCoordinator tests passed!\n";
    return 0;
}
