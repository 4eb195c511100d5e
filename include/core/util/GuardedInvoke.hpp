#pragma once

#include <exception>
#include <memory>
#include <string>
#include <utility>
#include <spdlog/spdlog.h>

namespace tasker {
namespace core {
namespace util {

// Результат вызова пользовательского обработчика
struct DispatchResult {
    bool ok = true;
    std::string error;

    explicit operator bool() const { return ok; }

    static DispatchResult success() { return {}; }
    static DispatchResult failure(std::string message) { return {false, std::move(message)}; }
};

/**
 * @brief Вызов пользовательского кода с перехватом исключений.
 * @details Ошибка записывается в лог и возвращается вызывающему как
 * DispatchResult; исключение дальше не пробрасывается.
 * @param logger Логгер компонента
 * @param what Описание вызова для лога (например, "flush handler 'todo'")
 */
template<typename Fn>
DispatchResult invokeGuarded(const std::shared_ptr<spdlog::logger>& logger,
                             const std::string& what, Fn&& fn) {
    try {
        std::forward<Fn>(fn)();
        return DispatchResult::success();
    } catch (const std::exception& e) {
        logger->error("{} failed: {}", what, e.what());
        return DispatchResult::failure(e.what());
    } catch (...) {
        logger->error("{} failed: unknown exception", what);
        return DispatchResult::failure("unknown exception");
    }
}

} // namespace util
} // namespace core
} // namespace tasker
