#pragma once

#include "binform/core/common.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace binform::utils {

/**
 * @brief 16 进制格式化/解析工具（排查编码结果、从抓包文本构造输入）。
 */
struct HexDumpOptions final {
  // 每行字节数（0 按 16 处理）。
  std::size_t bytes_per_line{16};

  // 输出的最大字节数（0 表示不限制）。超出部分打印截断提示。
  std::size_t max_bytes{256};

  // 行首偏移（0000:）。
  bool show_offset{true};

  // ASCII 侧栏（不可打印字符显示为 '.'）。
  bool show_ascii{false};
};

/**
 * @brief 多行 hexdump。
 */
[[nodiscard]] std::string hex_dump(core::bytes_view bytes, HexDumpOptions options = {});

/**
 * @brief 单行紧凑形式（"12 34 ab"），用于日志。
 */
[[nodiscard]] std::string to_hex(core::bytes_view bytes);

/**
 * @brief 解析 16 进制文本。
 *
 * 支持大小写、常见分隔符（空白 , ; : - _ | 及各类括号引号）与可选 0x 前缀。
 * 非法字符或奇数个 nibble 返回 core::errc::invalid_argument，out 被清空。
 */
std::error_code parse_hex(std::string_view text, std::vector<core::byte>& out) noexcept;

}  // namespace binform::utils
