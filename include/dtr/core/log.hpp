#pragma once

#include <memory>
#include <utility>

#include <spdlog/spdlog.h>

namespace dtr::core {

namespace detail {

inline std::shared_ptr<spdlog::logger>& loggerSlot() noexcept {
    static std::shared_ptr<spdlog::logger> slot;
    return slot;
}

}  // namespace detail

/**
 * @brief Установить логгер библиотеки.
 *
 * По умолчанию dtr пишет в `spdlog::default_logger()`. Передача nullptr
 * возвращает это поведение.
 *
 * @note Вызывать до начала работы с прогрессиями: сам слот не синхронизирован.
 */
inline void setLogger(std::shared_ptr<spdlog::logger> l) noexcept { detail::loggerSlot() = std::move(l); }

/// @brief Текущий логгер библиотеки (никогда не nullptr).
[[nodiscard]] inline spdlog::logger& logger() {
    if (const auto& l = detail::loggerSlot()) return *l;
    return *spdlog::default_logger_raw();
}

}  // namespace dtr::core

#ifndef DTR_DISABLE_LOGGING
#define DTR_LOG_DEBUG(...) ::dtr::core::logger().debug(__VA_ARGS__)
#define DTR_LOG_WARN(...) ::dtr::core::logger().warn(__VA_ARGS__)
#define DTR_LOG_ERROR(...) ::dtr::core::logger().error(__VA_ARGS__)
#else
#define DTR_LOG_DEBUG(...) (void)0
#define DTR_LOG_WARN(...) (void)0
#define DTR_LOG_ERROR(...) (void)0
#endif
