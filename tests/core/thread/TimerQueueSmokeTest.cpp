#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>
#include "core/thread/TimerQueue.hpp"

using namespace std::chrono_literals;
using tasker::core::thread::TimerQueue;

void smokeTestTimerOrder() {
    TimerQueue timer("test");
    std::mutex mutex;
    std::vector<int> order;

    auto record = [&](int value) {
        return [&, value] {
            std::lock_guard<std::mutex> lock(mutex);
            order.push_back(value);
        };
    };

    assert(timer.schedule(120ms, record(3)) != 0);
    assert(timer.schedule(20ms, record(1)) != 0);
    assert(timer.schedule(60ms, record(2)) != 0);

    std::this_thread::sleep_for(300ms);
    std::lock_guard<std::mutex> lock(mutex);
    assert((order == std::vector<int>{1, 2, 3}));
    assert(timer.getMetrics().executedTasks == 3);
    std::cout << "[OK] TimerQueue deadline order test\n";
}

void smokeTestTimerCancel() {
    TimerQueue timer("test");
    std::atomic<int> runs{0};

    auto id = timer.schedule(100ms, [&] { ++runs; });
    assert(timer.pendingCount() == 1);
    assert(timer.cancel(id));
    assert(!timer.cancel(id));
    assert(timer.pendingCount() == 0);

    std::this_thread::sleep_for(200ms);
    assert(runs == 0);
    assert(timer.getMetrics().cancelledTasks == 1);
    std::cout << "[OK] TimerQueue cancel test\n";
}

void smokeTestTimerFailureIsolation() {
    TimerQueue timer("test");
    std::atomic<int> runs{0};

    timer.schedule(10ms, [] { throw std::runtime_error("boom"); });
    timer.schedule(30ms, [&] { ++runs; });

    std::this_thread::sleep_for(150ms);
    assert(runs == 1);
    auto metrics = timer.getMetrics();
    assert(metrics.failedTasks == 1);
    assert(metrics.executedTasks == 1);
    std::cout << "[OK] TimerQueue failing task test\n";
}

void smokeTestTimerStop() {
    TimerQueue timer("test");
    std::atomic<int> runs{0};

    timer.schedule(200ms, [&] { ++runs; });
    timer.stop();
    timer.stop();
    assert(timer.isStopped());
    assert(timer.pendingCount() == 0);
    assert(timer.schedule(1ms, [&] { ++runs; }) == 0);

    std::this_thread::sleep_for(250ms);
    assert(runs == 0);
    std::cout << "[OK] TimerQueue stop test\n";
}

void smokeTestTimerStopFromTask() {
    auto timer = std::make_unique<TimerQueue>("test");
    std::atomic<bool> done{false};
    TimerQueue* raw = timer.get();

    timer->schedule(10ms, [raw, &done] {
        assert(raw->isWorkerThread());
        raw->stop();
        done = true;
    });

    std::this_thread::sleep_for(100ms);
    assert(done);
    assert(timer->isStopped());
    timer.reset();
    std::cout << "[OK] TimerQueue stop from task test\n";
}

int main() {
    smokeTestTimerOrder();
    smokeTestTimerCancel();
    smokeTestTimerFailureIsolation();
    smokeTestTimerStop();
    smokeTestTimerStopFromTask();
    std::cout << "All TimerQueue tests passed!\n";
    return 0;
}
