#include <cassert>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>
#include "core/config/PerformanceConfig.hpp"

using namespace std::chrono_literals;
using tasker::core::config::PerformanceConfig;

void smokeTestDefaults() {
    PerformanceConfig config;
    assert(config.validate());
    assert(config.cache.maxSize == 1000);
    assert(config.cache.ttl == 60s);
    assert(config.cache.keyGranularity == 60s);
    assert(config.batch.batchSize == 50);
    assert(config.batch.flushInterval == 500ms);
    assert(config.throttle.updateInterval == 1000ms);
    assert(config.throttle.maxUpdatesPerSecond == 30.0);
    assert(config.monitor.warningThreshold == 0.8);
    assert(config.monitor.criticalThreshold == 0.9);
    assert(config.monitor.pollInterval == 5000ms);
    assert(config.monitor.stopTimeout == 1000ms);
    std::cout << "[OK] PerformanceConfig defaults test\n";
}

void smokeTestFromJson() {
    auto j = nlohmann::json::parse(R"({
        "cache": {"maxSize": 2, "ttlSeconds": 5},
        "batch": {"batchSize": 3},
        "throttle": {"maxUpdatesPerSecond": 10.5},
        "monitor": {"pollIntervalMs": 250},
        "logging": {"level": "debug"}
    })");
    auto config = PerformanceConfig::fromJson(j);
    assert(config.cache.maxSize == 2);
    assert(config.cache.ttl == 5s);
    assert(config.cache.keyGranularity == 60s);
    assert(config.batch.batchSize == 3);
    assert(config.batch.flushInterval == 500ms);
    assert(config.throttle.maxUpdatesPerSecond == 10.5);
    assert(config.monitor.pollInterval == 250ms);
    assert(config.logging.level == spdlog::level::debug);

    auto back = config.toJson();
    assert(back["cache"]["maxSize"] == 2);
    assert(back["monitor"]["pollIntervalMs"] == 250);
    assert(back["logging"]["level"] == "debug");
    std::cout << "[OK] PerformanceConfig fromJson test\n";
}

void smokeTestInvalid() {
    auto expectInvalid = [](const nlohmann::json& j) {
        bool thrown = false;
        try {
            PerformanceConfig::fromJson(j);
        } catch (const std::invalid_argument&) {
            thrown = true;
        }
        assert(thrown);
    };

    expectInvalid(nlohmann::json::array());
    expectInvalid({{"cache", {{"maxSize", 0}}}});
    expectInvalid({{"monitor", {{"warningThreshold", 0.95}, {"criticalThreshold", 0.9}}}});
    expectInvalid({{"batch", {{"batchSize", "many"}}}});
    expectInvalid({{"throttle", {{"maxUpdatesPerSecond", 1e-12}}}});
    expectInvalid({{"throttle", {{"maxUpdatesPerSecond", 0.0}}}});
    std::cout << "[OK] PerformanceConfig validation test\n";
}

void smokeTestFiles() {
    const std::string path = "tasker_config_smoke_test.json";

    PerformanceConfig config;
    config.cache.maxSize = 7;
    config.batch.flushInterval = 250ms;
    config.saveToFile(path);

    auto loaded = PerformanceConfig::loadFromFile(path);
    assert(loaded.cache.maxSize == 7);
    assert(loaded.batch.flushInterval == 250ms);
    std::remove(path.c_str());

    bool thrown = false;
    try {
        PerformanceConfig::loadFromFile("missing_tasker_config.json");
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    assert(thrown);

    {
        std::ofstream broken(path);
        broken << "{ not json";
    }
    thrown = false;
    try {
        PerformanceConfig::loadFromFile(path);
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    assert(thrown);
    std::remove(path.c_str());
    std::cout << "[OK] PerformanceConfig file test\n";
}

int main() {
    smokeTestDefaults();
    smokeTestFromJson();
    smokeTestInvalid();
    smokeTestFiles();
    std::cout << "All PerformanceConfig tests passed!\n";
    return 0;
}
