#pragma once

#include "binform/codec/error.hpp"
#include "binform/codec/node.hpp"
#include "binform/codec/types.hpp"
#include "binform/codec/value.hpp"

#include <cstddef>
#include <system_error>
#include <vector>

namespace binform::codec {

struct CodecOptions final {
  // 解码时单个序列的元素数上限（dynamic 计数超过上限返回 errc::length_mismatch）。
  std::size_t max_elements{kDefaultMaxElements};
};

/*
 * 根节点约定：
 * - 根为 Struct：scope 本身就是该 Struct 的 Mapping（根 Struct 的名字不参与查找）；
 * - 根为其它节点：在 scope 中按根节点名字读写。
 *
 * 所有接口失败时都不产生部分结果：encode 会回滚 out 中已追加的字节，decode 不修改 out。
 * CountFn / ChecksumFn 回调不应抛出异常。
 */

/**
 * @brief 编码并追加到 out。
 *
 * scope 可能被修改：dynamic 长度字段会被写回真实元素个数，Checksum 节点会写入计算出的校验码。
 */
std::error_code encode(const Node& root, Mapping& scope, std::vector<byte>& out,
                       const CodecOptions& options = {}) noexcept;

/**
 * @brief 从输入缓冲区头部解码（流式 API）。
 *
 * 成功时 consumed 为消耗的字节数，剩余字节留给调用方处理。
 */
std::error_code decode_one(const Node& root, bytes_view in, Mapping& out, std::size_t& consumed,
                           const CodecOptions& options = {}) noexcept;

/**
 * @brief 解码完整缓冲区：要求恰好消耗全部输入，否则返回 errc::length_mismatch。
 */
std::error_code decode(const Node& root, bytes_view in, Mapping& out, const CodecOptions& options = {}) noexcept;

/**
 * @brief 编码侧测长：不实际编码，按 scope 中的值计算将产生的字节数。
 */
std::error_code measured_length(const Node& root, const Mapping& scope, std::size_t& out_size) noexcept;

/**
 * @brief 解码侧测长：不构造值树，计算 root 将从 in 头部消耗的字节数。
 *
 * dynamic 序列所依赖的长度字段会被读取（必要时解码其所在的子节点）。
 */
std::error_code measured_length(const Node& root, bytes_view in, std::size_t& out_size,
                                const CodecOptions& options = {}) noexcept;

}  // namespace binform::codec
