#include "binform/core/log.hpp"

#include "core/logger.hpp"

#include "test_main.hpp"

#include <spdlog/spdlog.h>

#include <memory>
#include <new>

namespace {

using binform::core::LogLevel;
using binform::core::log_level;
using binform::core::set_log_level;

// 必须在任何代码注册 "binform" logger 之前运行。
void test_failed_creation_falls_back_to_default() {
  using binform::core::detail::acquire_logger;
  const auto throwing = acquire_logger([]() -> std::shared_ptr<spdlog::logger> { throw std::bad_alloc(); });
  TEST_EXPECT(throwing == spdlog::default_logger());

  const auto empty = acquire_logger([]() -> std::shared_ptr<spdlog::logger> { return nullptr; });
  TEST_EXPECT(empty == spdlog::default_logger());
}

void test_registered_logger_is_reused() {
  auto& lib = binform::core::detail::logger();
  TEST_EXPECT_EQ(lib.name(), "binform");
  const auto again =
    binform::core::detail::acquire_logger([]() -> std::shared_ptr<spdlog::logger> { throw std::bad_alloc(); });
  TEST_EXPECT(again.get() == &lib);
}

void test_log_level_roundtrip() {
  for (const auto level : {LogLevel::trace, LogLevel::debug, LogLevel::info, LogLevel::warn, LogLevel::error,
                           LogLevel::critical, LogLevel::off}) {
    set_log_level(level);
    TEST_EXPECT_EQ(log_level(), level);
  }
}

void test_last_setting_wins() {
  set_log_level(LogLevel::debug);
  set_log_level(LogLevel::warn);
  TEST_EXPECT_EQ(log_level(), LogLevel::warn);
  set_log_level(LogLevel::info);
}

}  // namespace

int main() {
  test_failed_creation_falls_back_to_default();
  test_registered_logger_is_reused();
  test_log_level_roundtrip();
  test_last_setting_wins();
  return ::binform::tests::run_and_report();
}
