#include "core/config/PerformanceConfig.hpp"
#include <fstream>
#include <stdexcept>

namespace tasker {
namespace core {
namespace config {

namespace {

template<typename T>
void readIfPresent(const nlohmann::json& j, const char* key, T& target) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        target = it->get<T>();
    }
}

template<typename Duration>
void readDurationIfPresent(const nlohmann::json& j, const char* key, Duration& target) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        target = Duration(it->get<typename Duration::rep>());
    }
}

} // namespace

nlohmann::json PerformanceConfig::toJson() const {
    return {
        {"cache", {
            {"maxSize", cache.maxSize},
            {"ttlSeconds", cache.ttl.count()},
            {"keyGranularitySeconds", cache.keyGranularity.count()}
        }},
        {"batch", {
            {"batchSize", batch.batchSize},
            {"flushIntervalMs", batch.flushInterval.count()}
        }},
        {"throttle", {
            {"updateIntervalMs", throttle.updateInterval.count()},
            {"maxUpdatesPerSecond", throttle.maxUpdatesPerSecond}
        }},
        {"monitor", {
            {"warningThreshold", monitor.warningThreshold},
            {"criticalThreshold", monitor.criticalThreshold},
            {"pollIntervalMs", monitor.pollInterval.count()},
            {"stopTimeoutMs", monitor.stopTimeout.count()}
        }},
        {"logging", {
            {"level", spdlog::level::to_string_view(logging.level).data()},
            {"logToFile", logging.logToFile},
            {"directory", logging.directory},
            {"maxFileSize", logging.maxFileSize},
            {"maxFiles", logging.maxFiles}
        }}
    };
}

PerformanceConfig PerformanceConfig::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("Performance configuration must be a JSON object");
    }

    PerformanceConfig config;
    try {
        if (auto it = j.find("cache"); it != j.end()) {
            readIfPresent(*it, "maxSize", config.cache.maxSize);
            readDurationIfPresent(*it, "ttlSeconds", config.cache.ttl);
            readDurationIfPresent(*it, "keyGranularitySeconds", config.cache.keyGranularity);
        }
        if (auto it = j.find("batch"); it != j.end()) {
            readIfPresent(*it, "batchSize", config.batch.batchSize);
            readDurationIfPresent(*it, "flushIntervalMs", config.batch.flushInterval);
        }
        if (auto it = j.find("throttle"); it != j.end()) {
            readDurationIfPresent(*it, "updateIntervalMs", config.throttle.updateInterval);
            readIfPresent(*it, "maxUpdatesPerSecond", config.throttle.maxUpdatesPerSecond);
        }
        if (auto it = j.find("monitor"); it != j.end()) {
            readIfPresent(*it, "warningThreshold", config.monitor.warningThreshold);
            readIfPresent(*it, "criticalThreshold", config.monitor.criticalThreshold);
            readDurationIfPresent(*it, "pollIntervalMs", config.monitor.pollInterval);
            readDurationIfPresent(*it, "stopTimeoutMs", config.monitor.stopTimeout);
        }
        if (auto it = j.find("logging"); it != j.end()) {
            std::string level;
            readIfPresent(*it, "level", level);
            if (!level.empty()) {
                config.logging.level = spdlog::level::from_str(level);
            }
            readIfPresent(*it, "logToFile", config.logging.logToFile);
            readIfPresent(*it, "directory", config.logging.directory);
            readIfPresent(*it, "maxFileSize", config.logging.maxFileSize);
            readIfPresent(*it, "maxFiles", config.logging.maxFiles);
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument(std::string("Malformed performance configuration: ") + e.what());
    }

    if (!config.validate()) {
        throw std::invalid_argument("Invalid performance configuration");
    }
    return config;
}

PerformanceConfig PerformanceConfig::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open configuration file: " + path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Cannot parse configuration file " + path + ": " + e.what());
    }
    return fromJson(j);
}

void PerformanceConfig::saveToFile(const std::string& path) const {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot write configuration file: " + path);
    }
    file << toJson().dump(4);
}

} // namespace config
} // namespace core
} // namespace tasker
