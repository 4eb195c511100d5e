#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <signal.h>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "core/config/PerformanceConfig.hpp"
#include "core/logging/Logging.hpp"
#include "core/optimizer/PerformanceCoordinator.hpp"

using namespace tasker::core;

// Флаг для корректной остановки
std::atomic<bool> g_running{true};

void signalHandler(int signal) {
    (void)signal;
    g_running = false;
}

// Загрузка конфигурации: файл из аргумента командной строки или значения по умолчанию
config::PerformanceConfig loadConfiguration(int argc, char* argv[]) {
    if (argc > 1) {
        auto cfg = config::PerformanceConfig::loadFromFile(argv[1]);
        std::cout << "Configuration loaded from " << argv[1] << std::endl;
        return cfg;
    }
    return config::PerformanceConfig{};
}

// Производный статус задачи по сроку и времени выполнения
std::string deriveStatus(const std::chrono::system_clock::time_point& due,
                         const std::chrono::system_clock::time_point* completed) {
    const auto now = std::chrono::system_clock::now();
    if (completed) {
        return *completed <= due ? "completed" : "completed_late";
    }
    if (now > due) {
        return "overdue";
    }
    if (due - now < std::chrono::hours(24)) {
        return "due_soon";
    }
    return "normal";
}

void runWorkload(optimizer::PerformanceCoordinator& coordinator) {
    auto log = logging::getLogger("demo");

    // Сохранение пакетов задач
    auto saveTodo = coordinator.batches().makeBatchedWriter("todo",
        [log](const std::vector<batch::PendingUpdate>& updates) {
            log->info("Persisting {} todo updates (first: {})", updates.size(),
                      updates.empty() ? std::string() : updates.front().itemId);
        });

    // Перерисовка списка; счётчиком владеет колбэк, зарегистрированный в координаторе
    auto renders = std::make_shared<std::atomic<size_t>>(0);
    auto refreshList = coordinator.updates().makeThrottledRefresher("todo-list",
        [renders]() { ++*renders; });

    const auto base = std::chrono::system_clock::now();
    for (int i = 0; i < 200 && g_running; ++i) {
        const auto due = base + std::chrono::hours(i % 48);
        const std::string itemId = "todo-" + std::to_string(i % 25);

        const std::string status = coordinator.cache().getOrCompute(due, std::nullopt,
            [&due]() { return deriveStatus(due, nullptr); });

        if (!saveTodo(itemId, {{"status", status}, {"order", i}})) {
            log->warn("Update for {} rejected", itemId);
        }
        if (!refreshList()) {
            log->debug("Refresh of todo-list dropped");
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    coordinator.batches().forceFlush();
    log->info("Workload finished: {} list renders", renders->load());
}

int main(int argc, char* argv[]) {
    try {
        signal(SIGINT, signalHandler);
        signal(SIGTERM, signalHandler);

        auto cfg = loadConfiguration(argc, argv);
        logging::initializeLogging(cfg.logging);
        spdlog::info("=== Tasker performance demo starting ===");

        optimizer::PerformanceCoordinator coordinator(cfg);
        if (!coordinator.initialize()) {
            throw std::runtime_error("Failed to initialize performance coordinator");
        }

        runWorkload(coordinator);

        coordinator.logStats();
        std::cout << coordinator.getPerformanceStats().toJson().dump(2) << std::endl;

        coordinator.shutdown();
        spdlog::info("=== Tasker performance demo finished ===");
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
