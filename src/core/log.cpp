#include "binform/core/log.hpp"

#include "logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <array>
#include <exception>
#include <memory>
#include <utility>

namespace binform::core {
namespace {

constexpr const char* kLoggerName = "binform";

// LogLevel 与 spdlog 级别一一对应（按枚举值下标查表）。
constexpr std::array<std::pair<LogLevel, spdlog::level::level_enum>, 7> kLevelTable{{
    {LogLevel::trace, spdlog::level::trace},
    {LogLevel::debug, spdlog::level::debug},
    {LogLevel::info, spdlog::level::info},
    {LogLevel::warn, spdlog::level::warn},
    {LogLevel::error, spdlog::level::err},
    {LogLevel::critical, spdlog::level::critical},
    {LogLevel::off, spdlog::level::off},
}};

[[nodiscard]] spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept {
    for (const auto& [ours, theirs] : kLevelTable) {
        if (ours == level) {
            return theirs;
        }
    }
    return spdlog::level::off;
}

[[nodiscard]] LogLevel from_spdlog_level(spdlog::level::level_enum level) noexcept {
    for (const auto& [ours, theirs] : kLevelTable) {
        if (theirs == level) {
            return ours;
        }
    }
    return LogLevel::off;
}

} // namespace

namespace detail {

std::shared_ptr<spdlog::logger> acquire_logger(const LoggerFactory& create) noexcept {
    for (int attempt = 0; attempt < 2; ++attempt) {
        try {
            if (auto existing = spdlog::get(kLoggerName)) {
                return existing;
            }
            if (attempt == 0 && create) {
                if (auto created = create()) {
                    created->set_level(spdlog::get_level());
                    return created;
                }
            }
            break;
        } catch (const spdlog::spdlog_ex&) {
            // 并发注册时名字已被另一方占用：下一轮取回其实例。
            continue;
        } catch (const std::exception&) {
            // 内存不足等：退回默认 logger。
            break;
        }
    }
    return spdlog::default_logger();
}

spdlog::logger& logger() noexcept {
    static const std::shared_ptr<spdlog::logger> instance =
        acquire_logger([] { return spdlog::stdout_color_mt(kLoggerName); });
    return *instance;
}

} // namespace detail

void set_log_level(LogLevel level) noexcept {
    // 同时调整全局级别与库内 logger（后者可能在 set_level 之前就已创建）。
    const auto spd_level = to_spdlog_level(level);
    spdlog::set_level(spd_level);
    detail::logger().set_level(spd_level);
}

LogLevel log_level() noexcept { return from_spdlog_level(detail::logger().level()); }

} // namespace binform::core
