#pragma once

// 库内部使用的日志入口（不安装、不出现在 public headers 中）。

#include <spdlog/logger.h>

#include <functional>
#include <memory>

namespace binform::core::detail {

/**
 * @brief 库内统一的 "binform" logger。
 *
 * - 首次调用时创建（彩色 stdout sink），之后复用同一实例；
 * - 若业务侧已用同名注册了自己的 logger，则直接沿用业务侧配置。
 */
[[nodiscard]] spdlog::logger& logger() noexcept;

using LoggerFactory = std::function<std::shared_ptr<spdlog::logger>()>;

/**
 * @brief 取已注册的 "binform" logger，没有则用 create 创建。
 *
 * create 抛出任何 std::exception 时退回 spdlog::default_logger()。
 */
[[nodiscard]] std::shared_ptr<spdlog::logger> acquire_logger(const LoggerFactory& create) noexcept;

}  // namespace binform::core::detail
