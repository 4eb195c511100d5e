#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace tasker {
namespace core {
namespace monitor {

// Уровень нагрузки на память
enum class MemoryLevel {
    Normal,
    Warning,
    Critical
};

inline const char* toString(MemoryLevel level) {
    switch (level) {
        case MemoryLevel::Normal: return "normal";
        case MemoryLevel::Warning: return "warning";
        case MemoryLevel::Critical: return "critical";
    }
    return "unknown";
}

// Снимок памяти; при ошибке опроса все поля нулевые
struct MemorySample {
    double usedRatio = 0.0;                   // Доля занятой системной памяти [0, 1]
    std::uint64_t processBytes = 0;           // RSS процесса
    std::uint64_t processVirtualBytes = 0;    // Виртуальная память процесса
    std::uint64_t systemTotalBytes = 0;
    std::uint64_t systemAvailableBytes = 0;
    std::uint64_t systemUsedBytes = 0;
    std::chrono::system_clock::time_point sampledAt{};

    nlohmann::json toJson() const {
        return {
            {"usedRatio", usedRatio},
            {"processBytes", processBytes},
            {"processVirtualBytes", processVirtualBytes},
            {"systemTotalBytes", systemTotalBytes},
            {"systemAvailableBytes", systemAvailableBytes},
            {"systemUsedBytes", systemUsedBytes},
            {"sampledAt", std::chrono::duration_cast<std::chrono::milliseconds>(
                sampledAt.time_since_epoch()).count()}
        };
    }
};

// Результат принудительного возврата памяти системе
struct ReclaimResult {
    std::uint64_t rssBefore = 0;
    std::uint64_t rssAfter = 0;
    std::int64_t releasedBytes = 0;           // rssBefore - rssAfter, может быть отрицательным
    bool trimmed = false;                     // Аллокатор вернул память системе

    nlohmann::json toJson() const {
        return {
            {"rssBefore", rssBefore},
            {"rssAfter", rssAfter},
            {"releasedBytes", releasedBytes},
            {"trimmed", trimmed}
        };
    }
};

} // namespace monitor
} // namespace core
} // namespace tasker
