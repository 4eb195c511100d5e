#include "core/monitor/SystemMemory.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>
#include <string>
#include "core/logging/Logging.hpp"

#if defined(__linux__)
    #include <sys/sysinfo.h>
    #include <unistd.h>
#endif
#if defined(__GLIBC__)
    #include <malloc.h>
#endif

namespace tasker {
namespace core {
namespace monitor {

namespace {

#if defined(__linux__)
// MemAvailable из /proc/meminfo, в байтах
std::uint64_t readMemAvailableBytes() {
    std::ifstream memFile("/proc/meminfo");
    std::string line;
    while (std::getline(memFile, line)) {
        std::istringstream iss(line);
        std::string key;
        std::uint64_t valueKb = 0;
        iss >> key >> valueKb;
        if (key == "MemAvailable:") {
            return valueKb * 1024ull;
        }
    }
    return 0;
}

// Размер и RSS процесса из /proc/self/statm, в байтах
bool readProcessStatm(std::uint64_t& virtualBytes, std::uint64_t& residentBytes) {
    std::ifstream statmFile("/proc/self/statm");
    std::uint64_t sizePages = 0;
    std::uint64_t residentPages = 0;
    if (!(statmFile >> sizePages >> residentPages)) {
        return false;
    }
    const long pageSize = sysconf(_SC_PAGESIZE);
    if (pageSize <= 0) {
        return false;
    }
    virtualBytes = sizePages * static_cast<std::uint64_t>(pageSize);
    residentBytes = residentPages * static_cast<std::uint64_t>(pageSize);
    return true;
}
#endif

} // namespace

MemorySample sampleSystemMemory() {
    MemorySample sample;
    sample.sampledAt = std::chrono::system_clock::now();

#if defined(__linux__)
    try {
        struct sysinfo si;
        if (sysinfo(&si) != 0) {
            logging::getLogger("monitor")->warn("sysinfo() failed, using empty memory sample");
            return sample;
        }

        const std::uint64_t unit = si.mem_unit ? si.mem_unit : 1;
        const std::uint64_t total = static_cast<std::uint64_t>(si.totalram) * unit;
        if (total == 0) {
            return sample;
        }

        std::uint64_t available = readMemAvailableBytes();
        if (available == 0) {
            // Приближение, если /proc/meminfo недоступен
            available = (static_cast<std::uint64_t>(si.freeram) +
                         static_cast<std::uint64_t>(si.bufferram)) * unit;
        }
        available = std::min(available, total);

        sample.systemTotalBytes = total;
        sample.systemAvailableBytes = available;
        sample.systemUsedBytes = total - available;
        sample.usedRatio = static_cast<double>(sample.systemUsedBytes) / static_cast<double>(total);

        if (!readProcessStatm(sample.processVirtualBytes, sample.processBytes)) {
            logging::getLogger("monitor")->debug("/proc/self/statm unavailable");
        }
    } catch (const std::exception& e) {
        logging::getLogger("monitor")->warn("Memory query failed: {}", e.what());
        MemorySample empty;
        empty.sampledAt = sample.sampledAt;
        return empty;
    }
#else
    logging::getLogger("monitor")->debug("Memory query is not supported on this platform");
#endif

    return sample;
}

std::uint64_t readProcessResidentBytes() {
#if defined(__linux__)
    std::uint64_t virtualBytes = 0;
    std::uint64_t residentBytes = 0;
    if (readProcessStatm(virtualBytes, residentBytes)) {
        return residentBytes;
    }
#endif
    return 0;
}

ReclaimResult reclaimHeapMemory() {
    ReclaimResult result;
    result.rssBefore = readProcessResidentBytes();
#if defined(__GLIBC__)
    result.trimmed = malloc_trim(0) == 1;
#endif
    result.rssAfter = readProcessResidentBytes();
    result.releasedBytes = static_cast<std::int64_t>(result.rssBefore) -
                           static_cast<std::int64_t>(result.rssAfter);
    return result;
}

} // namespace monitor
} // namespace core
} // namespace tasker
