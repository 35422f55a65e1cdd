#include "binform/codec/value.hpp"

#include <algorithm>
#include <bit>
#include <type_traits>
#include <utility>

namespace binform::codec {
namespace {

// 浮点比较采用“按位相等”：编解码关注位模式，NaN、-0/+0 都能得到确定结果。
bool double_bits_equal(double a, double b) noexcept {
  return std::bit_cast<std::uint64_t>(a) == std::bit_cast<std::uint64_t>(b);
}

}  // namespace

Mapping::Mapping(std::initializer_list<Field> fields) {
  fields_.reserve(fields.size());
  for (const auto& f : fields) {
    set(f.name, f.value);
  }
}

const Value* Mapping::find(std::string_view name) const noexcept {
  const auto it = std::find_if(fields_.begin(), fields_.end(), [&](const Field& f) { return f.name == name; });
  return it == fields_.end() ? nullptr : &it->value;
}

Value* Mapping::find(std::string_view name) noexcept {
  const auto it = std::find_if(fields_.begin(), fields_.end(), [&](const Field& f) { return f.name == name; });
  return it == fields_.end() ? nullptr : &it->value;
}

bool Mapping::contains(std::string_view name) const noexcept { return find(name) != nullptr; }

Value& Mapping::set(std::string name, Value value) {
  if (auto* existing = find(name)) {
    *existing = std::move(value);
    return *existing;
  }
  fields_.push_back(Field{std::move(name), std::move(value)});
  return fields_.back().value;
}

bool Mapping::erase(std::string_view name) noexcept {
  const auto it = std::find_if(fields_.begin(), fields_.end(), [&](const Field& f) { return f.name == name; });
  if (it == fields_.end()) {
    return false;
  }
  fields_.erase(it);
  return true;
}

void Mapping::clear() noexcept { fields_.clear(); }

std::size_t Mapping::size() const noexcept { return fields_.size(); }

bool Mapping::empty() const noexcept { return fields_.empty(); }

bool operator==(const Mapping& lhs, const Mapping& rhs) noexcept {
  if (lhs.fields_.size() != rhs.fields_.size()) {
    return false;
  }
  // 字段名在同一层内唯一，因此“数量相同 + 每个字段都能在对方找到且相等”即为相等。
  for (const auto& f : lhs.fields_) {
    const auto* other = rhs.find(f.name);
    if (!other || !(f.value == *other)) {
      return false;
    }
  }
  return true;
}

Value::Value() : storage_(Mapping{}) {}

Value::Value(std::int64_t v) : storage_(v) {}
Value::Value(std::uint64_t v) : storage_(v) {}
Value::Value(double v) : storage_(v) {}
Value::Value(Bytes v) : storage_(std::move(v)) {}
Value::Value(Sequence v) : storage_(std::move(v)) {}
Value::Value(Mapping v) : storage_(std::move(v)) {}

Value Value::integer(std::int64_t v) { return Value(v); }
Value Value::unsigned_integer(std::uint64_t v) { return Value(v); }
Value Value::floating(double v) { return Value(v); }
Value Value::bytes(std::vector<byte> v) { return Value(Bytes{std::move(v)}); }

Value Value::string(std::string_view text) {
  std::vector<byte> out(text.size());
  std::transform(text.begin(), text.end(), out.begin(), [](char c) { return static_cast<byte>(c); });
  return Value(Bytes{std::move(out)});
}

Value Value::sequence(Sequence values) { return Value(std::move(values)); }
Value Value::mapping(Mapping fields) { return Value(std::move(fields)); }

bool operator==(const Value& lhs, const Value& rhs) noexcept {
  if (lhs.storage_.index() != rhs.storage_.index()) {
    return false;
  }
  return std::visit(
    [&](const auto& a) -> bool {
      using T = std::decay_t<decltype(a)>;
      const auto* b = std::get_if<T>(&rhs.storage_);
      if (!b) {
        return false;
      }
      if constexpr (std::is_same_v<T, double>) {
        return double_bits_equal(a, *b);
      } else {
        return a == *b;
      }
    },
    lhs.storage_);
}

std::string as_string(const Value& value) {
  const auto* b = value.get_if<Bytes>();
  if (!b) {
    return {};
  }
  return std::string(b->value.begin(), b->value.end());
}

}  // namespace binform::codec
