#pragma once

#include "binform/codec/value.hpp"

#include <cstddef>
#include <string>

namespace binform::utils {

/**
 * @brief 值树的可读化输出（调试/日志用途，不是可解析的格式）。
 *
 * 默认对超长内容截断，避免日志被大 payload 淹没。
 */
struct ValueDumpOptions final {
  // 递归最大深度（0 表示只输出根节点）。
  std::size_t max_depth{16};

  // Mapping / Sequence 最大输出元素数（0 表示不限制）。
  std::size_t max_items{64};

  // Bytes 最大输出字节数（0 表示不限制）。
  std::size_t max_bytes{64};

  // 多行缩进格式；false 时输出单行。
  bool multiline{true};

  std::size_t indent_spaces{2};
};

/**
 * @brief 格式化单个 Value。
 *
 * - 整数：i64 / u64 前缀区分有无符号；
 * - Bytes：全部可打印时按字符串输出，否则按 hex 输出；
 * - Mapping：保持字段插入顺序。
 */
[[nodiscard]] std::string dump_value(const codec::Value& value, ValueDumpOptions options = {});

[[nodiscard]] std::string dump_value(const codec::Mapping& mapping, ValueDumpOptions options = {});

}  // namespace binform::utils
