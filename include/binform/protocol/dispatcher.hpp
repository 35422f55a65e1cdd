#pragma once

#include "binform/core/common.hpp"
#include "binform/protocol/frame.hpp"
#include "binform/protocol/registry.hpp"

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <system_error>
#include <unordered_map>
#include <utility>
#include <vector>

namespace binform::protocol {

// handler 返回错误码与可选的回复帧（std::nullopt 表示无需回复）。
using HandlerResult = std::pair<std::error_code, std::optional<Frame>>;
using Handler = std::function<HandlerResult(const Frame&)>;

/**
 * @brief 基于 msg_id 的消息分发器。
 *
 * 说明：
 * - set/erase/clear/find 内部用互斥锁保护；find 返回 Handler 的拷贝，handler 在锁外执行；
 * - registry 由调用方持有，生命周期必须覆盖 Dispatcher。
 */
class Dispatcher final {
 public:
  explicit Dispatcher(const Registry& registry) : registry_(registry) {}

  void set(std::uint8_t msg_id, Handler handler);
  void erase(std::uint8_t msg_id) noexcept;
  void clear() noexcept;

  [[nodiscard]] std::optional<Handler> find(std::uint8_t msg_id) const;
  [[nodiscard]] const Registry& registry() const noexcept { return registry_; }

  /**
   * @brief 解码一帧 -> 调用 handler -> 编码回复帧（追加到 reply_out）。
   *
   * 错误处理：
   * - 帧解码失败：传播 decode_frame 的错误码
   * - 没有对应 handler：返回 codec::errc::unknown_variant
   * - handler 返回错误：原样传播，reply_out 不变
   * - handler 不需要回复：返回成功，reply_out 不变
   */
  std::error_code dispatch(core::bytes_view frame, std::vector<core::byte>& reply_out) const;

 private:
  const Registry& registry_;
  mutable std::mutex mu_{};
  std::unordered_map<std::uint8_t, Handler> handlers_{};
};

}  // namespace binform::protocol
