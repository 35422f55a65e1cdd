#pragma once

#include <system_error>

namespace binform::core {

/**
 * @brief 本库通用错误码（跨模块复用）。
 *
 * 约定：
 * - 所有编解码接口返回 std::error_code，避免异常路径；
 * - 与 schema/数据相关的错误见 binform::codec::errc，这里只放与具体格式无关的错误。
 */
enum class errc : int {
  ok = 0,
  buffer_overflow = 1,
  invalid_argument = 2,
  out_of_memory = 3,
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

}  // namespace binform::core

namespace std {
template <>
struct is_error_code_enum<binform::core::errc> : true_type {};
}  // namespace std
