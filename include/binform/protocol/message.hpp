#pragma once

#include "binform/codec/node.hpp"
#include "binform/codec/value.hpp"

#include <concepts>
#include <cstdint>
#include <optional>
#include <string_view>
#include <system_error>

namespace binform::protocol {

/**
 * @brief Concept 约束：具备 msg_id、schema 与值树适配函数的消息类型。
 *
 * - kMsgId / kName：注册表中的 id 与可读名称；
 * - build_schema()：构造该消息的 Struct schema；
 * - from_value() / to_value()：值树 <-> 强类型结构体。
 *
 * 满足此约束的类型可以直接用于 Registry::add<T>() 与 TypedHandler。
 */
template <typename T>
concept Message = requires(const codec::Mapping& value, const T& msg, codec::Node& schema) {
  { T::kMsgId } -> std::convertible_to<std::uint8_t>;
  { T::kName } -> std::convertible_to<std::string_view>;
  { T::build_schema(schema) } -> std::same_as<std::error_code>;
  { T::from_value(value) } -> std::same_as<std::optional<T>>;
  { msg.to_value() } -> std::same_as<codec::Mapping>;
};

}  // namespace binform::protocol
