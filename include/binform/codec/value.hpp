#pragma once

#include "binform/codec/types.hpp"

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace binform::codec {

class Value;
struct Field;

using Sequence = std::vector<Value>;

struct Bytes final {
  std::vector<byte> value;
  friend bool operator==(const Bytes&, const Bytes&) = default;
};

/**
 * @brief 值树中的映射节点（字段名 -> Value）。
 *
 * 说明：
 * - 按插入顺序保存；解码结果的字段顺序与 schema 声明顺序一致；
 * - 字段名只要求在同一层内唯一（嵌套 Struct 拥有自己的 Mapping）；
 * - 比较时忽略字段顺序。
 */
class Mapping final {
 public:
  Mapping() = default;
  Mapping(std::initializer_list<Field> fields);

  [[nodiscard]] const Value* find(std::string_view name) const noexcept;
  [[nodiscard]] Value* find(std::string_view name) noexcept;
  [[nodiscard]] bool contains(std::string_view name) const noexcept;

  // 已存在则覆盖（保持原位置），否则追加到末尾。
  Value& set(std::string name, Value value);
  bool erase(std::string_view name) noexcept;
  void clear() noexcept;

  [[nodiscard]] std::size_t size() const noexcept;
  [[nodiscard]] bool empty() const noexcept;
  [[nodiscard]] const std::vector<Field>& fields() const noexcept { return fields_; }

  friend bool operator==(const Mapping& lhs, const Mapping& rhs) noexcept;
  friend bool operator!=(const Mapping& lhs, const Mapping& rhs) noexcept { return !(lhs == rhs); }

 private:
  std::vector<Field> fields_;
};

/**
 * @brief 编解码使用的值（带标签的变体）。
 *
 * 约定：
 * - 有符号整数节点解码为 std::int64_t，无符号整数节点解码为 std::uint64_t；
 * - 浮点统一用 double 承载（f32 节点编码时收窄为 float）；
 * - Bytes 对应 bytes 序列，Sequence 对应 array 序列，Mapping 对应 Struct。
 */
class Value final {
 public:
  using storage_type = std::variant<std::int64_t, std::uint64_t, double, Bytes, Sequence, Mapping>;

  // 默认构造为空 Mapping（便于作为解码输出的占位）。
  Value();

  explicit Value(std::int64_t v);
  explicit Value(std::uint64_t v);
  explicit Value(double v);
  explicit Value(Bytes v);
  explicit Value(Sequence v);
  explicit Value(Mapping v);

  [[nodiscard]] const storage_type& storage() const noexcept { return storage_; }
  [[nodiscard]] storage_type& storage() noexcept { return storage_; }

  template <class T>
  [[nodiscard]] const T* get_if() const noexcept {
    return std::get_if<T>(&storage_);
  }

  template <class T>
  [[nodiscard]] T* get_if() noexcept {
    return std::get_if<T>(&storage_);
  }

  [[nodiscard]] bool is_integer() const noexcept {
    return std::holds_alternative<std::int64_t>(storage_) || std::holds_alternative<std::uint64_t>(storage_);
  }
  [[nodiscard]] bool is_mapping() const noexcept { return std::holds_alternative<Mapping>(storage_); }
  [[nodiscard]] bool is_sequence() const noexcept { return std::holds_alternative<Sequence>(storage_); }

  static Value integer(std::int64_t v);
  static Value unsigned_integer(std::uint64_t v);
  static Value floating(double v);
  static Value bytes(std::vector<byte> v);
  static Value string(std::string_view text);
  static Value sequence(Sequence values);
  static Value mapping(Mapping fields);

  friend bool operator==(const Value& lhs, const Value& rhs) noexcept;
  friend bool operator!=(const Value& lhs, const Value& rhs) noexcept { return !(lhs == rhs); }

 private:
  storage_type storage_;
};

struct Field final {
  std::string name;
  Value value;
};

/**
 * @brief 以 string 视角读取 Bytes 值（不存在或类型不符时返回空串）。
 */
[[nodiscard]] std::string as_string(const Value& value);

}  // namespace binform::codec
