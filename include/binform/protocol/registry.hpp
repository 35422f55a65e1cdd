#pragma once

#include "binform/codec/node.hpp"
#include "binform/protocol/message.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <system_error>
#include <unordered_map>
#include <utility>

namespace binform::protocol {

struct MessageKind final {
  std::uint8_t msg_id{0};
  std::string name{};
  codec::Node schema{};
};

/**
 * @brief msg_id -> 消息 schema 的查找表。
 *
 * 说明：
 * - 进程启动阶段（开始收发之前）一次性填充，之后只读，可在多线程间共享；
 * - 重复注册同一 id 返回 codec::errc::duplicate_variant，不会覆盖已有条目；
 * - schema 必须是 Struct（消息体总是一层具名字段）。
 */
class Registry final {
 public:
  Registry() = default;

  std::error_code add(std::uint8_t msg_id, std::string name, codec::Node schema);

  template <Message T>
  std::error_code add() {
    codec::Node schema;
    auto ec = T::build_schema(schema);
    if (ec) {
      return ec;
    }
    return add(static_cast<std::uint8_t>(T::kMsgId), std::string(T::kName), std::move(schema));
  }

  [[nodiscard]] const MessageKind* find(std::uint8_t msg_id) const noexcept;
  [[nodiscard]] bool contains(std::uint8_t msg_id) const noexcept { return find(msg_id) != nullptr; }
  [[nodiscard]] std::size_t size() const noexcept { return kinds_.size(); }

 private:
  std::unordered_map<std::uint8_t, MessageKind> kinds_{};
};

}  // namespace binform::protocol
