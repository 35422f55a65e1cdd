#pragma once

#include "binform/codec/node.hpp"

#include <cstdint>
#include <system_error>

namespace binform::codec {

/*
 * 常用校验算法（返回 ChecksumFn，交给 checksum() 节点使用）。
 *
 * 引擎只认 ChecksumFn，这里的算法与编解码逻辑相互独立，调用方也可以传入自定义实现。
 */

/**
 * @brief XOR 折叠。
 *
 * 以 width 字节的全 1 为初值，把输入按 width 字节分块，逐块把“块内字节之和”异或进去，
 * 结果截断到 width 字节。无参版本 width 为 1。
 */
[[nodiscard]] ChecksumFn xor_fold();

// width 取 1..8，否则返回 errc::invalid_schema（out 不变）。
std::error_code xor_fold(std::uint8_t width, ChecksumFn& out);

// 逐字节求和取低 16 位。
[[nodiscard]] ChecksumFn sum16();

// CRC-16/CCITT-FALSE：poly 0x1021，init 0xFFFF，不反射，无最终异或。
[[nodiscard]] ChecksumFn crc16_ccitt();

// CRC-32（IEEE 802.3，反射实现）：poly 0xEDB88320，init/xorout 0xFFFFFFFF。
[[nodiscard]] ChecksumFn crc32();

}  // namespace binform::codec
