#pragma once

#include "binform/core/common.hpp"

#include <cstddef>
#include <cstdint>
#include <limits>

namespace binform::codec {

using byte = binform::core::byte;
using bytes_view = binform::core::bytes_view;
using mutable_bytes_view = binform::core::mutable_bytes_view;

/**
 * @brief 数值字段的字节序。
 *
 * - big：网络字节序（默认）
 * - little：小端
 * - native：与当前主机一致（跨主机传输时慎用）
 */
enum class ByteOrder : std::uint8_t {
  big = 0,
  little = 1,
  native = 2,
};

inline constexpr ByteOrder kNetworkOrder = ByteOrder::big;

// 长度策略为 consume 时传给序列编解码的“元素个数”：表示吃掉剩余全部字节。
inline constexpr std::size_t kConsumeAll = std::numeric_limits<std::size_t>::max();

// 解码时单个序列允许的最大元素数：长度字段来自输入，需要上限避免恶意长度触发巨量分配。
inline constexpr std::size_t kDefaultMaxElements = std::size_t{1} << 24;

}  // namespace binform::codec
