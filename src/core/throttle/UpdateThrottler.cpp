#include "core/throttle/UpdateThrottler.hpp"
#include <stdexcept>
#include <utility>
#include <vector>
#include "core/logging/Logging.hpp"
#include "core/util/GuardedInvoke.hpp"

namespace tasker {
namespace core {
namespace throttle {

UpdateThrottler::UpdateThrottler(const config::ThrottleConfig& config)
    : config_(config)
    , logger_(logging::getLogger("throttle"))
    , timer_("throttle") {
    if (!config_.validate()) {
        throw std::invalid_argument("Invalid throttle configuration");
    }
}

UpdateThrottler::~UpdateThrottler() {
    stop();
    timer_.stop();
}

void UpdateThrottler::registerUpdateCallback(const std::string& componentId, UpdateCallback callback) {
    if (componentId.empty()) {
        throw std::invalid_argument("Component id must not be empty");
    }
    if (!callback) {
        throw std::invalid_argument("Update callback for '" + componentId + "' is empty");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (callbacks_.count(componentId)) {
        logger_->info("Update callback for '{}' replaced", componentId);
    }
    callbacks_[componentId] = std::move(callback);
}

bool UpdateThrottler::requestUpdate(const std::string& componentId) {
    const auto now = Clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    if (paused_) {
        ++droppedWhilePaused_;
        logger_->debug("Throttler paused, update of '{}' dropped", componentId);
        return false;
    }

    // Ограничение частоты по времени последнего фактического вызова
    auto last = lastInvocation_.find(componentId);
    if (last != lastInvocation_.end() && now - last->second < config_.minInvocationGap()) {
        ++droppedByRateLimit_;
        return false;
    }

    pending_.insert(componentId);
    if (!cycleScheduled_) {
        scheduleCycle();
    }
    return true;
}

void UpdateThrottler::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++generation_;
    timer_.cancel(timerId_);
    timerId_ = 0;
    cycleScheduled_ = false;
    const size_t dropped = pending_.size();
    pending_.clear();
    if (!paused_) {
        paused_ = true;
        logger_->info("Update throttler stopped, {} pending updates dropped", dropped);
    }
}

void UpdateThrottler::resume() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (paused_) {
        paused_ = false;
        logger_->info("Update throttler resumed");
    }
}

size_t UpdateThrottler::pendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

bool UpdateThrottler::isCycleScheduled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cycleScheduled_;
}

bool UpdateThrottler::isPaused() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return paused_;
}

ThrottleStats UpdateThrottler::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    ThrottleStats stats;
    stats.pending = pending_.size();
    stats.invocations = invocations_;
    stats.droppedByRateLimit = droppedByRateLimit_;
    stats.droppedWhilePaused = droppedWhilePaused_;
    stats.failedCallbacks = failedCallbacks_;
    stats.cycleScheduled = cycleScheduled_;
    stats.paused = paused_;
    return stats;
}

std::function<bool()> UpdateThrottler::makeThrottledRefresher(const std::string& componentId,
                                                              UpdateCallback callback) {
    registerUpdateCallback(componentId, std::move(callback));
    return [this, componentId] {
        return requestUpdate(componentId);
    };
}

// Цикл обновления: забрать ожидающие компоненты и вызвать каждый один раз
void UpdateThrottler::processCycle(std::uint64_t generation) {
    std::unordered_set<std::string> batch;
    std::vector<std::pair<std::string, UpdateCallback>> work;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_) {
            return;
        }
        timerId_ = 0;
        batch.swap(pending_);
        if (batch.empty()) {
            cycleScheduled_ = false;
            return;
        }
        for (const auto& id : batch) {
            auto it = callbacks_.find(id);
            if (it == callbacks_.end()) {
                logger_->debug("No update callback registered for '{}'", id);
                continue;
            }
            work.emplace_back(id, it->second);
        }
    }

    for (const auto& [id, callback] : work) {
        const auto invokedAt = Clock::now();
        auto result = util::invokeGuarded(logger_, "Update callback '" + id + "'", callback);

        std::lock_guard<std::mutex> lock(mutex_);
        lastInvocation_[id] = invokedAt;
        ++invocations_;
        if (!result) {
            ++failedCallbacks_;
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (generation != generation_) {
        return;
    }
    // Запросы, пришедшие во время цикла, обрабатываются следующим циклом
    if (!pending_.empty()) {
        scheduleCycle();
    } else {
        cycleScheduled_ = false;
    }
}

void UpdateThrottler::scheduleCycle() {
    const auto generation = generation_;
    timerId_ = timer_.schedule(config_.updateInterval, [this, generation] {
        processCycle(generation);
    });
    cycleScheduled_ = timerId_ != 0;
}

} // namespace throttle
} // namespace core
} // namespace tasker
