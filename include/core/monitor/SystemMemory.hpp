#pragma once

#include <cstdint>
#include "core/monitor/MemorySample.hpp"

namespace tasker {
namespace core {
namespace monitor {

// Опрос системной памяти и памяти процесса; нулевой снимок при ошибке
MemorySample sampleSystemMemory();

// RSS текущего процесса в байтах; 0 если недоступно
std::uint64_t readProcessResidentBytes();

// Возврат свободной памяти кучи системе
ReclaimResult reclaimHeapMemory();

} // namespace monitor
} // namespace core
} // namespace tasker
