#include "core/optimizer/PerformanceCoordinator.hpp"
#include <stdexcept>
#include <utility>
#include "core/logging/Logging.hpp"

namespace tasker {
namespace core {
namespace optimizer {

namespace {

const config::PerformanceConfig& validated(const config::PerformanceConfig& config) {
    if (!config.validate()) {
        throw std::invalid_argument("Invalid performance configuration");
    }
    return config;
}

std::mutex& sharedCoordinatorMutex() {
    static std::mutex mutex;
    return mutex;
}

std::shared_ptr<PerformanceCoordinator>& sharedCoordinator() {
    static std::shared_ptr<PerformanceCoordinator> instance;
    return instance;
}

} // namespace

PerformanceCoordinator::PerformanceCoordinator(const config::PerformanceConfig& config,
                                               monitor::MemorySampler sampler)
    : config_(validated(config))
    , cache_(config_.cache)
    , batches_(config_.batch)
    , updates_(config_.throttle)
    , monitor_(config_.monitor, std::move(sampler))
    , logger_(logging::getLogger("optimizer")) {
}

PerformanceCoordinator::~PerformanceCoordinator() {
    shutdown();
}

bool PerformanceCoordinator::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == CoordinatorState::Running) {
        return true;
    }
    if (state_ == CoordinatorState::ShutDown) {
        logger_->warn("Координатор уже остановлен, повторная инициализация невозможна");
        return false;
    }

    monitor_.registerCallback(monitor::MemoryLevel::Warning,
        [this](const monitor::MemorySample& sample) { onMemoryWarning(sample); });
    monitor_.registerCallback(monitor::MemoryLevel::Critical,
        [this](const monitor::MemorySample& sample) { onMemoryCritical(sample); });
    monitor_.startMonitoring();

    state_ = CoordinatorState::Running;
    logger_->info("Performance coordinator initialized (cache maxSize={}, batchSize={}, poll={}ms)",
                  config_.cache.maxSize, config_.batch.batchSize,
                  config_.monitor.pollInterval.count());
    return true;
}

void PerformanceCoordinator::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == CoordinatorState::ShutDown) {
            return;
        }
        state_ = CoordinatorState::ShutDown;
    }

    logger_->info("Остановка координатора производительности...");

    // Монитор первым: его колбэки обращаются к остальным компонентам
    monitor_.stopMonitoring();
    batches_.shutdown();
    updates_.stop();
    cache_.clear();

    logger_->info("Координатор производительности остановлен");
}

CoordinatorState PerformanceCoordinator::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool PerformanceCoordinator::isRunning() const {
    return state() == CoordinatorState::Running;
}

PerformanceStats PerformanceCoordinator::getPerformanceStats() const {
    PerformanceStats stats;
    stats.cache = cache_.stats();
    stats.memory = monitor_.getMemoryInfo();
    stats.batch = batches_.stats();
    stats.throttle = updates_.stats();
    stats.batchPending = stats.batch.pending;
    stats.throttlePending = stats.throttle.pending;
    return stats;
}

void PerformanceCoordinator::logStats() const {
    const auto stats = getPerformanceStats();
    logger_->info("Performance stats: cache {}/{} (hit rate {:.2f}), memory {:.1f}%, "
                  "batch pending {}, throttle pending {}",
                  stats.cache.size, stats.cache.maxSize, stats.cache.hitRate(),
                  stats.memory.usedRatio * 100.0, stats.batchPending, stats.throttlePending);
    logger_->debug("Performance stats JSON: {}", stats.toJson().dump());
}

void PerformanceCoordinator::onMemoryWarning(const monitor::MemorySample& sample) {
    logger_->warn("Высокое потребление памяти ({:.1f}%), освобождение ресурсов",
                  sample.usedRatio * 100.0);
    relievePressure();
}

void PerformanceCoordinator::onMemoryCritical(const monitor::MemorySample& sample) {
    logger_->error("Критическое потребление памяти ({:.1f}%), обновления приостановлены",
                   sample.usedRatio * 100.0);
    relievePressure();
    updates_.stop();
}

void PerformanceCoordinator::relievePressure() {
    cache_.clear();
    batches_.forceFlush();
    const auto reclaimed = monitor_.forceReclaim();
    logger_->debug("Reclaimed {} bytes", reclaimed.releasedBytes);
}

std::shared_ptr<PerformanceCoordinator> getPerformanceCoordinator(const config::PerformanceConfig& config) {
    std::lock_guard<std::mutex> lock(sharedCoordinatorMutex());
    auto& instance = sharedCoordinator();
    if (!instance) {
        instance = std::make_shared<PerformanceCoordinator>(config);
        if (!instance->initialize()) {
            instance.reset();
            throw std::runtime_error("Failed to initialize performance coordinator");
        }
    }
    return instance;
}

void resetPerformanceCoordinator() {
    std::shared_ptr<PerformanceCoordinator> instance;
    {
        std::lock_guard<std::mutex> lock(sharedCoordinatorMutex());
        instance = std::move(sharedCoordinator());
    }
    if (instance) {
        instance->shutdown();
    }
}

} // namespace optimizer
} // namespace core
} // namespace tasker
