#pragma once

#include <system_error>

namespace binform::codec {

/**
 * @brief 编解码与 schema 构造错误码。
 *
 * 分两类：
 * - 构造期（schema 组装时返回）：duplicate_field / schema_order / invalid_schema / duplicate_variant
 * - 运行期（encode/decode 时返回）：其余错误码
 *
 * 任何错误都会让当前 encode/decode 立即失败，不返回“部分结果”。
 */
enum class errc : int {
  ok = 0,
  missing_field = 1,
  insufficient_data = 2,
  length_mismatch = 3,
  checksum_mismatch = 4,
  duplicate_field = 5,
  schema_order = 6,
  unknown_variant = 7,
  type_mismatch = 8,
  invalid_schema = 9,
  padding_mismatch = 10,
  duplicate_variant = 11,
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

}  // namespace binform::codec

namespace std {
template <>
struct is_error_code_enum<binform::codec::errc> : true_type {};
}  // namespace std
