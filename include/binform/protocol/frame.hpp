#pragma once

#include "binform/codec/node.hpp"
#include "binform/codec/value.hpp"
#include "binform/core/common.hpp"
#include "binform/protocol/registry.hpp"

#include <cstddef>
#include <cstdint>
#include <system_error>
#include <vector>

namespace binform::protocol {

/*
 * 帧格式：
 *
 *   +--------+-----------+----------------------+
 *   | msg_id | length    | payload              |
 *   | u8     | u16 (BE)  | length 字节          |
 *   +--------+-----------+----------------------+
 *
 * payload 按 msg_id 在 Registry 中对应的 Struct schema 编解码。
 */
inline constexpr std::size_t kHeaderSize = 3;
inline constexpr std::size_t kMaxPayloadSize = 0xFFFF;

struct Header final {
  std::uint8_t msg_id{0};
  std::uint16_t length{0};
};

struct Frame final {
  std::uint8_t msg_id{0};
  codec::Mapping body{};
};

/**
 * @brief 帧头 schema（Struct{msg_id: u8, length: u16}），进程内只构造一次。
 */
std::error_code header_schema(const codec::Node*& out) noexcept;

/**
 * @brief 解码输入头部的 kHeaderSize 字节（不足时返回 codec::errc::insufficient_data）。
 */
std::error_code decode_header(core::bytes_view in, Header& out) noexcept;

/**
 * @brief 先编码 payload 并测长，再编码 header，输出 header + payload（追加到 out）。
 *
 * payload 超过 kMaxPayloadSize 时返回 core::errc::buffer_overflow。
 * body 可能被修改（dynamic 长度字段写回）。
 */
std::error_code encode_frame(std::uint8_t msg_id, const codec::Node& schema, codec::Mapping& body,
                             std::vector<core::byte>& out) noexcept;

/**
 * @brief 按 frame.msg_id 在 registry 中查找 schema 后编码（未注册返回 codec::errc::unknown_variant）。
 */
std::error_code encode_frame(const Registry& registry, Frame& frame, std::vector<core::byte>& out) noexcept;

/**
 * @brief 两阶段解码完整的一帧。
 *
 * - 先解码 header；header 之后的字节数必须恰好等于 length（否则 codec::errc::length_mismatch）；
 * - msg_id 未注册返回 codec::errc::unknown_variant；
 * - payload 必须被 schema 恰好消耗完。
 */
std::error_code decode_frame(const Registry& registry, core::bytes_view in, Frame& out) noexcept;

}  // namespace binform::protocol
