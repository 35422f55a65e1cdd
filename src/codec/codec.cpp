#include "binform/codec/codec.hpp"

#include "core/logger.hpp"

#include "binform/core/error.hpp"

#include <algorithm>
#include <bit>
#include <cmath>
#include <cstdint>
#include <limits>
#include <new>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace binform::codec {
namespace {

/*
 * 编解码引擎：对 Node::body() 做 std::visit 分派，按声明顺序递归遍历。
 *
 * - encode：从根到叶把字节追加到同一个 out 末尾；Checksum 先把 child 编到独立的临时缓冲区；
 * - decode：SpanReader 从输入头部逐段消费，每个节点只取自己拥有的字节；
 * - measure：与 encode/decode 同构的遍历，只累加长度。
 *
 * 三种遍历都区分“字段”（在作用域 Mapping 中按名字读写）与“元素”（数组元素，直接对应 Value）。
 */

constexpr bool checked_add(std::size_t a, std::size_t b, std::size_t& out) noexcept {
  if (b > (std::numeric_limits<std::size_t>::max() - a)) {
    return false;
  }
  out = a + b;
  return true;
}

constexpr bool checked_mul(std::size_t a, std::size_t b, std::size_t& out) noexcept {
  if (a == 0 || b == 0) {
    out = 0;
    return true;
  }
  if (a > (std::numeric_limits<std::size_t>::max() / b)) {
    return false;
  }
  out = a * b;
  return true;
}

[[nodiscard]] bool is_little(ByteOrder order) noexcept {
  if (order == ByteOrder::native) {
    return std::endian::native == std::endian::little;
  }
  return order == ByteOrder::little;
}

[[nodiscard]] std::uint64_t width_mask(std::uint8_t width) noexcept {
  return width >= 8 ? ~std::uint64_t{0} : ((std::uint64_t{1} << (8u * width)) - 1u);
}

class SpanReader final {
 public:
  explicit SpanReader(bytes_view in) : in_(in) {}

  [[nodiscard]] std::size_t remaining() const noexcept { return in_.size() - pos_; }
  [[nodiscard]] std::size_t consumed() const noexcept { return pos_; }
  [[nodiscard]] bytes_view rest() const noexcept { return in_.subspan(pos_); }

  std::error_code read(std::size_t n, bytes_view& out) noexcept {
    if (remaining() < n) {
      return make_error_code(errc::insufficient_data);
    }
    out = in_.subspan(pos_, n);
    pos_ += n;
    return {};
  }

  std::error_code skip(std::size_t n) noexcept {
    bytes_view ignored;
    return read(n, ignored);
  }

 private:
  bytes_view in_{};
  std::size_t pos_{0};
};

// ---- 数值 ----

void write_uint(std::uint64_t bits, std::uint8_t width, ByteOrder order, std::vector<byte>& out) {
  const bool little = is_little(order);
  for (std::uint8_t i = 0; i < width; ++i) {
    const auto shift = static_cast<unsigned>(8u * (little ? i : (width - 1u - i)));
    out.push_back(static_cast<byte>((bits >> shift) & 0xFFu));
  }
}

[[nodiscard]] std::uint64_t read_uint(bytes_view in, ByteOrder order) noexcept {
  const bool little = is_little(order);
  std::uint64_t v = 0;
  for (std::size_t i = 0; i < in.size(); ++i) {
    const auto b = static_cast<std::uint64_t>(in[little ? (in.size() - 1u - i) : i]);
    v = (v << 8) | b;
  }
  return v;
}

// 超出 float 表示范围的有限值饱和为同号无穷大（直接 static_cast 属于未定义行为）。
[[nodiscard]] float narrow_to_float(double d) noexcept {
  constexpr double kMax = std::numeric_limits<float>::max();
  if (std::isfinite(d) && (d > kMax || d < -kMax)) {
    return d > 0 ? std::numeric_limits<float>::infinity() : -std::numeric_limits<float>::infinity();
  }
  return static_cast<float>(d);
}

std::error_code encode_numeric(const Numeric& n, const Value& v, std::vector<byte>& out) {
  if (n.kind == NumericKind::integer) {
    std::uint64_t bits = 0;
    if (const auto* s = v.get_if<std::int64_t>()) {
      bits = static_cast<std::uint64_t>(*s);
    } else if (const auto* u = v.get_if<std::uint64_t>()) {
      bits = *u;
    } else {
      return make_error_code(errc::type_mismatch);
    }
    // 超出宽度的高位直接丢弃（二进制补码截断）。
    write_uint(bits & width_mask(n.width), n.width, n.order, out);
    return {};
  }

  double d = 0.0;
  if (const auto* f = v.get_if<double>()) {
    d = *f;
  } else if (const auto* s = v.get_if<std::int64_t>()) {
    d = static_cast<double>(*s);
  } else if (const auto* u = v.get_if<std::uint64_t>()) {
    d = static_cast<double>(*u);
  } else {
    return make_error_code(errc::type_mismatch);
  }
  if (n.width == 4) {
    write_uint(std::bit_cast<std::uint32_t>(narrow_to_float(d)), 4, n.order, out);
  } else {
    write_uint(std::bit_cast<std::uint64_t>(d), 8, n.order, out);
  }
  return {};
}

std::error_code decode_numeric(const Numeric& n, SpanReader& r, Value& out) noexcept {
  bytes_view raw;
  auto ec = r.read(n.width, raw);
  if (ec) {
    return ec;
  }
  const auto bits = read_uint(raw, n.order);
  if (n.kind == NumericKind::floating) {
    if (n.width == 4) {
      out = Value(static_cast<double>(std::bit_cast<float>(static_cast<std::uint32_t>(bits))));
    } else {
      out = Value(std::bit_cast<double>(bits));
    }
    return {};
  }
  if (!n.is_signed) {
    out = Value(bits);
    return {};
  }
  auto extended = bits;
  if (n.width < 8) {
    const auto sign = std::uint64_t{1} << (8u * n.width - 1u);
    if ((bits & sign) != 0) {
      extended |= ~width_mask(n.width);
    }
  }
  out = Value(static_cast<std::int64_t>(extended));
  return {};
}

// ---- 长度 ----

// 把元素个数转换为长度字段的值；长度字段放不下该计数时返回 length_mismatch。
std::error_code length_value(const Numeric& codec, std::size_t count, Value& out) noexcept {
  const std::uint64_t max = codec.is_signed ? (width_mask(codec.width) >> 1) : width_mask(codec.width);
  if (static_cast<std::uint64_t>(count) > max) {
    return make_error_code(errc::length_mismatch);
  }
  if (codec.is_signed) {
    out = Value(static_cast<std::int64_t>(count));
  } else {
    out = Value(static_cast<std::uint64_t>(count));
  }
  return {};
}

std::error_code count_from_value(const Value& v, const CodecOptions& options, std::size_t& out) noexcept {
  std::uint64_t count = 0;
  if (const auto* s = v.get_if<std::int64_t>()) {
    if (*s < 0) {
      return make_error_code(errc::length_mismatch);
    }
    count = static_cast<std::uint64_t>(*s);
  } else if (const auto* u = v.get_if<std::uint64_t>()) {
    count = *u;
  } else {
    return make_error_code(errc::type_mismatch);
  }
  if (count > options.max_elements) {
    return make_error_code(errc::length_mismatch);
  }
  out = static_cast<std::size_t>(count);
  return {};
}

[[nodiscard]] std::size_t encode_count(const LengthPolicy& policy, const Value& v) {
  switch (policy.kind) {
    case LengthKind::fixed:
      return policy.count;
    case LengthKind::dynamic:
      return policy.count_fn ? policy.count_fn(v) : count_elements(v);
    case LengthKind::consume:
      return kConsumeAll;
  }
  return kConsumeAll;
}

// 解码侧：scope 为当前层已解码（或测长时已读取）的字段。
std::error_code decode_count(const LengthPolicy& policy, const Mapping& scope, const CodecOptions& options,
                             std::size_t& out) noexcept {
  switch (policy.kind) {
    case LengthKind::fixed:
      out = policy.count;
      return {};
    case LengthKind::dynamic: {
      const auto* len = scope.find(policy.length_field);
      if (!len) {
        return make_error_code(errc::missing_field);
      }
      return count_from_value(*len, options, out);
    }
    case LengthKind::consume:
      out = kConsumeAll;
      return {};
  }
  return make_error_code(errc::invalid_schema);
}

// ---- encode ----

std::error_code encode_field(const Node& node, Mapping& scope, std::vector<byte>& out, const CodecOptions& options);
std::error_code encode_element(const Node& element, Value& v, std::vector<byte>& out, const CodecOptions& options);

std::error_code encode_struct_body(const Struct& st, Mapping& scope, std::vector<byte>& out,
                                   const CodecOptions& options) {
  // 先写回 dynamic 长度：长度字段在声明顺序上位于序列之前，必须在它编码前拿到真实计数。
  for (const auto& b : st.bindings) {
    const auto* data = scope.find(b.data_field);
    if (!data) {
      return make_error_code(errc::missing_field);
    }
    const auto count = b.count_fn ? b.count_fn(*data) : count_elements(*data);
    Value len;
    auto ec = length_value(b.length_codec, count, len);
    if (ec) {
      return ec;
    }
    scope.set(b.length_field, std::move(len));
  }
  for (const auto& child : st.children) {
    auto ec = encode_field(child, scope, out, options);
    if (ec) {
      return ec;
    }
  }
  return {};
}

std::error_code encode_sequence(const SequenceCodec& seq, std::size_t count, Value& v, std::vector<byte>& out,
                                const CodecOptions& options) {
  if (seq.kind == SequenceKind::array) {
    auto* items = v.get_if<Sequence>();
    if (!items) {
      return make_error_code(errc::type_mismatch);
    }
    if (count != kConsumeAll && items->size() != count) {
      return make_error_code(errc::length_mismatch);
    }
    const auto n = items->size();
    for (std::size_t i = 0; i < n; ++i) {
      auto& item = (*items)[seq.reverse ? (n - 1u - i) : i];
      auto ec = encode_element(*seq.element, item, out, options);
      if (ec) {
        return ec;
      }
    }
    return {};
  }

  const auto* b = v.get_if<Bytes>();
  if (!b) {
    return make_error_code(errc::type_mismatch);
  }
  std::vector<byte> data = b->value;
  if (count != kConsumeAll && data.size() > count) {
    data.resize(count);
  }
  if (seq.reverse) {
    std::reverse(data.begin(), data.end());
  }
  out.insert(out.end(), data.begin(), data.end());
  if (count != kConsumeAll && data.size() < count) {
    out.insert(out.end(), count - data.size(), byte{0});
  }
  return {};
}

std::error_code encode_element(const Node& element, Value& v, std::vector<byte>& out, const CodecOptions& options) {
  if (const auto* n = element.get_if<Numeric>()) {
    return encode_numeric(*n, v, out);
  }
  if (const auto* st = element.get_if<Struct>()) {
    auto* m = v.get_if<Mapping>();
    if (!m) {
      return make_error_code(errc::type_mismatch);
    }
    return encode_struct_body(*st, *m, out, options);
  }
  if (const auto* s = element.get_if<Sized>()) {
    if (s->policy.kind != LengthKind::fixed) {
      return make_error_code(errc::invalid_schema);
    }
    return encode_sequence(s->sequence, s->policy.count, v, out, options);
  }
  return make_error_code(errc::invalid_schema);
}

std::error_code encode_checksum(const Node& node, const Checksum& ck, Mapping& scope, std::vector<byte>& out,
                                const CodecOptions& options) {
  // child 独立编码到临时缓冲区，校验码总是基于 child 实际产生的字节计算。
  std::vector<byte> child_bytes;
  auto ec = encode_field(*ck.child, scope, child_bytes, options);
  if (ec) {
    return ec;
  }
  const auto code = ck.fn(bytes_view{child_bytes.data(), child_bytes.size()}) & width_mask(ck.code.width);
  scope.set(node.name(), Value(code));

  if (ck.placement == ChecksumPlacement::leading) {
    write_uint(code, ck.code.width, ck.code.order, out);
    out.insert(out.end(), child_bytes.begin(), child_bytes.end());
  } else {
    out.insert(out.end(), child_bytes.begin(), child_bytes.end());
    write_uint(code, ck.code.width, ck.code.order, out);
  }
  return {};
}

std::error_code encode_field(const Node& node, Mapping& scope, std::vector<byte>& out, const CodecOptions& options) {
  return std::visit(
    [&](const auto& body) -> std::error_code {
      using T = std::decay_t<decltype(body)>;
      if constexpr (std::is_same_v<T, Padding>) {
        out.insert(out.end(), body.pattern.begin(), body.pattern.end());
        return {};
      } else if constexpr (std::is_same_v<T, Checksum>) {
        return encode_checksum(node, body, scope, out, options);
      } else {
        auto* v = scope.find(node.name());
        if (!v) {
          return make_error_code(errc::missing_field);
        }
        if constexpr (std::is_same_v<T, Numeric>) {
          return encode_numeric(body, *v, out);
        } else if constexpr (std::is_same_v<T, Sized>) {
          return encode_sequence(body.sequence, encode_count(body.policy, *v), *v, out, options);
        } else {
          auto* m = v->template get_if<Mapping>();
          if (!m) {
            return make_error_code(errc::type_mismatch);
          }
          return encode_struct_body(body, *m, out, options);
        }
      }
    },
    node.body());
}

// ---- decode ----

std::error_code decode_field(const Node& node, SpanReader& r, Mapping& out, const CodecOptions& options);
std::error_code decode_element(const Node& element, SpanReader& r, Value& out, const CodecOptions& options);
std::error_code measure_field(const Node& node, bytes_view in, const Mapping& scope, const CodecOptions& options,
                              std::size_t& out_size);

std::error_code decode_struct_body(const Struct& st, SpanReader& r, Mapping& out, const CodecOptions& options) {
  for (const auto& child : st.children) {
    auto ec = decode_field(child, r, out, options);
    if (ec) {
      return ec;
    }
  }
  return {};
}

std::error_code decode_sequence(const SequenceCodec& seq, std::size_t count, SpanReader& r, Value& out,
                                const CodecOptions& options) {
  if (seq.kind == SequenceKind::array) {
    Sequence items;
    if (count == kConsumeAll) {
      while (r.remaining() > 0) {
        if (items.size() >= options.max_elements) {
          return make_error_code(errc::length_mismatch);
        }
        const auto before = r.consumed();
        Value item;
        auto ec = decode_element(*seq.element, r, item, options);
        if (ec) {
          return ec;
        }
        // 零宽元素永远吃不完输入。
        if (r.consumed() == before) {
          return make_error_code(errc::invalid_schema);
        }
        items.push_back(std::move(item));
      }
    } else {
      // fixed 计数来自 schema；dynamic 计数已在 decode_count 中按 max_elements 检查。
      items.reserve(std::min(count, r.remaining()));
      for (std::size_t i = 0; i < count; ++i) {
        Value item;
        auto ec = decode_element(*seq.element, r, item, options);
        if (ec) {
          return ec;
        }
        items.push_back(std::move(item));
      }
    }
    if (seq.reverse) {
      std::reverse(items.begin(), items.end());
    }
    out = Value(std::move(items));
    return {};
  }

  bytes_view raw;
  auto ec = r.read(count == kConsumeAll ? r.remaining() : count, raw);
  if (ec) {
    return ec;
  }
  std::vector<byte> data(raw.begin(), raw.end());
  if (count != kConsumeAll) {
    // 定长字段去掉尾部 NUL 填充。
    while (!data.empty() && data.back() == 0) {
      data.pop_back();
    }
  }
  if (seq.reverse) {
    std::reverse(data.begin(), data.end());
  }
  out = Value(Bytes{std::move(data)});
  return {};
}

std::error_code decode_element(const Node& element, SpanReader& r, Value& out, const CodecOptions& options) {
  if (const auto* n = element.get_if<Numeric>()) {
    return decode_numeric(*n, r, out);
  }
  if (const auto* st = element.get_if<Struct>()) {
    Mapping m;
    auto ec = decode_struct_body(*st, r, m, options);
    if (ec) {
      return ec;
    }
    out = Value(std::move(m));
    return {};
  }
  if (const auto* s = element.get_if<Sized>()) {
    if (s->policy.kind != LengthKind::fixed) {
      return make_error_code(errc::invalid_schema);
    }
    return decode_sequence(s->sequence, s->policy.count, r, out, options);
  }
  return make_error_code(errc::invalid_schema);
}

std::error_code decode_checksum(const Node& node, const Checksum& ck, SpanReader& r, Mapping& out,
                                const CodecOptions& options) {
  const std::size_t width = ck.code.width;
  const auto rest = r.rest();
  if (rest.size() < width) {
    return make_error_code(errc::insufficient_data);
  }

  // 1) 用 child 的测长结果切出 child 字节与校验码字节。
  const bool leading = ck.placement == ChecksumPlacement::leading;
  const auto child_region = leading ? rest.subspan(width) : rest;
  std::size_t child_len = 0;
  auto ec = measure_field(*ck.child, child_region, out, options, child_len);
  if (ec) {
    return ec;
  }
  std::size_t total = 0;
  if (!checked_add(child_len, width, total) || total > rest.size()) {
    return make_error_code(errc::insufficient_data);
  }
  const auto child_bytes = child_region.first(child_len);
  const auto code_bytes = leading ? rest.first(width) : rest.subspan(child_len, width);

  // 2) 比对校验码，通过后才解码 child。
  SpanReader code_reader(code_bytes);
  Value stored;
  ec = decode_numeric(ck.code, code_reader, stored);
  if (ec) {
    return ec;
  }
  const auto expected = *stored.get_if<std::uint64_t>();
  const auto actual = ck.fn(child_bytes) & width_mask(ck.code.width);
  if (expected != actual) {
    core::detail::logger().debug("checksum '{}' mismatch: stored={:#x} computed={:#x} over {} bytes", node.name(),
                                 expected, actual, child_bytes.size());
    return make_error_code(errc::checksum_mismatch);
  }

  SpanReader child_reader(child_bytes);
  ec = decode_field(*ck.child, child_reader, out, options);
  if (ec) {
    return ec;
  }
  if (child_reader.remaining() != 0) {
    return make_error_code(errc::length_mismatch);
  }
  out.set(node.name(), std::move(stored));
  return r.skip(total);
}

std::error_code decode_field(const Node& node, SpanReader& r, Mapping& out, const CodecOptions& options) {
  return std::visit(
    [&](const auto& body) -> std::error_code {
      using T = std::decay_t<decltype(body)>;
      if constexpr (std::is_same_v<T, Numeric>) {
        Value v;
        auto ec = decode_numeric(body, r, v);
        if (ec) {
          return ec;
        }
        out.set(node.name(), std::move(v));
        return {};
      } else if constexpr (std::is_same_v<T, Sized>) {
        std::size_t count = 0;
        auto ec = decode_count(body.policy, out, options, count);
        if (ec) {
          return ec;
        }
        Value v;
        ec = decode_sequence(body.sequence, count, r, v, options);
        if (ec) {
          return ec;
        }
        out.set(node.name(), std::move(v));
        return {};
      } else if constexpr (std::is_same_v<T, Struct>) {
        Mapping m;
        auto ec = decode_struct_body(body, r, m, options);
        if (ec) {
          return ec;
        }
        out.set(node.name(), Value(std::move(m)));
        return {};
      } else if constexpr (std::is_same_v<T, Checksum>) {
        return decode_checksum(node, body, r, out, options);
      } else {
        bytes_view raw;
        auto ec = r.read(body.pattern.size(), raw);
        if (ec) {
          return ec;
        }
        if (!std::equal(raw.begin(), raw.end(), body.pattern.begin(), body.pattern.end())) {
          return make_error_code(errc::padding_mismatch);
        }
        return {};
      }
    },
    node.body());
}

// ---- measure（解码侧）----

std::error_code measure_element(const Node& element, bytes_view in, const CodecOptions& options,
                                std::size_t& out_size);

// child（含任意层 Checksum 包裹）是否在本层声明了某个 dynamic 长度字段（需要真正读取其值）。
[[nodiscard]] bool declares_length(const Struct& st, const Node& child) noexcept {
  return std::any_of(st.bindings.begin(), st.bindings.end(), [&](const LengthBinding& b) {
    return find_scope_numeric(child, b.length_field) != nullptr;
  });
}

std::error_code measure_struct_body(const Struct& st, bytes_view in, const CodecOptions& options,
                                    std::size_t& out_size) {
  Mapping locals;
  std::size_t offset = 0;
  for (const auto& child : st.children) {
    const auto region = in.subspan(offset);
    std::size_t len = 0;
    if (declares_length(st, child)) {
      SpanReader sub(region);
      auto ec = decode_field(child, sub, locals, options);
      if (ec) {
        return ec;
      }
      len = sub.consumed();
    } else {
      auto ec = measure_field(child, region, locals, options, len);
      if (ec) {
        return ec;
      }
    }
    offset += len;
  }
  out_size = offset;
  return {};
}

std::error_code measure_sequence(const SequenceCodec& seq, std::size_t count, bytes_view in, const CodecOptions& options,
                                 std::size_t& out_size) {
  if (count == kConsumeAll) {
    out_size = in.size();
    return {};
  }
  if (seq.kind == SequenceKind::bytes) {
    if (in.size() < count) {
      return make_error_code(errc::insufficient_data);
    }
    out_size = count;
    return {};
  }
  if (const auto* n = seq.element->get_if<Numeric>()) {
    std::size_t total = 0;
    if (!checked_mul(count, n->width, total) || total > in.size()) {
      return make_error_code(errc::insufficient_data);
    }
    out_size = total;
    return {};
  }
  std::size_t offset = 0;
  for (std::size_t i = 0; i < count; ++i) {
    std::size_t len = 0;
    auto ec = measure_element(*seq.element, in.subspan(offset), options, len);
    if (ec) {
      return ec;
    }
    offset += len;
  }
  out_size = offset;
  return {};
}

std::error_code measure_element(const Node& element, bytes_view in, const CodecOptions& options,
                                std::size_t& out_size) {
  if (const auto* n = element.get_if<Numeric>()) {
    if (in.size() < n->width) {
      return make_error_code(errc::insufficient_data);
    }
    out_size = n->width;
    return {};
  }
  if (const auto* st = element.get_if<Struct>()) {
    return measure_struct_body(*st, in, options, out_size);
  }
  if (const auto* s = element.get_if<Sized>()) {
    return measure_sequence(s->sequence, s->policy.count, in, options, out_size);
  }
  return make_error_code(errc::invalid_schema);
}

std::error_code measure_field(const Node& node, bytes_view in, const Mapping& scope, const CodecOptions& options,
                              std::size_t& out_size) {
  return std::visit(
    [&](const auto& body) -> std::error_code {
      using T = std::decay_t<decltype(body)>;
      if constexpr (std::is_same_v<T, Numeric>) {
        return measure_element(node, in, options, out_size);
      } else if constexpr (std::is_same_v<T, Sized>) {
        std::size_t count = 0;
        auto ec = decode_count(body.policy, scope, options, count);
        if (ec) {
          return ec;
        }
        return measure_sequence(body.sequence, count, in, options, out_size);
      } else if constexpr (std::is_same_v<T, Struct>) {
        return measure_struct_body(body, in, options, out_size);
      } else if constexpr (std::is_same_v<T, Checksum>) {
        const std::size_t width = body.code.width;
        if (in.size() < width) {
          return make_error_code(errc::insufficient_data);
        }
        const bool leading = body.placement == ChecksumPlacement::leading;
        std::size_t child_len = 0;
        auto ec = measure_field(*body.child, leading ? in.subspan(width) : in, scope, options, child_len);
        if (ec) {
          return ec;
        }
        if (child_len + width > in.size()) {
          return make_error_code(errc::insufficient_data);
        }
        out_size = child_len + width;
        return {};
      } else {
        if (in.size() < body.pattern.size()) {
          return make_error_code(errc::insufficient_data);
        }
        out_size = body.pattern.size();
        return {};
      }
    },
    node.body());
}

// ---- measure（编码侧）----

std::error_code measure_value(const Node& element, const Value& v, std::size_t& out_size);

std::error_code measure_struct_value(const Struct& st, const Mapping& scope, std::size_t& out_size);

std::error_code measure_sequence_value(const SequenceCodec& seq, std::size_t count, const Value& v, std::size_t& out_size) {
  if (seq.kind == SequenceKind::bytes) {
    const auto* b = v.get_if<Bytes>();
    if (!b) {
      return make_error_code(errc::type_mismatch);
    }
    out_size = count == kConsumeAll ? b->value.size() : count;
    return {};
  }
  const auto* items = v.get_if<Sequence>();
  if (!items) {
    return make_error_code(errc::type_mismatch);
  }
  const auto n = count == kConsumeAll ? items->size() : count;
  if (items->size() != n) {
    return make_error_code(errc::length_mismatch);
  }
  std::size_t total = 0;
  for (std::size_t i = 0; i < n; ++i) {
    std::size_t len = 0;
    auto ec = measure_value(*seq.element, (*items)[i], len);
    if (ec) {
      return ec;
    }
    if (!checked_add(total, len, total)) {
      return make_error_code(errc::length_mismatch);
    }
  }
  out_size = total;
  return {};
}

std::error_code measure_value(const Node& element, const Value& v, std::size_t& out_size) {
  if (const auto* n = element.get_if<Numeric>()) {
    out_size = n->width;
    return {};
  }
  if (const auto* st = element.get_if<Struct>()) {
    const auto* m = v.get_if<Mapping>();
    if (!m) {
      return make_error_code(errc::type_mismatch);
    }
    return measure_struct_value(*st, *m, out_size);
  }
  if (const auto* s = element.get_if<Sized>()) {
    return measure_sequence_value(s->sequence, s->policy.count, v, out_size);
  }
  return make_error_code(errc::invalid_schema);
}

// owner 为所在 Struct：其 dynamic 长度字段由编码时写回，测长时不要求 scope 中已有值。
std::error_code measure_scope_field(const Node& node, const Mapping& scope, const Struct* owner,
                                    std::size_t& out_size) {
  if (const auto* p = node.get_if<Padding>()) {
    out_size = p->pattern.size();
    return {};
  }
  if (const auto* ck = node.get_if<Checksum>()) {
    std::size_t child_len = 0;
    auto ec = measure_scope_field(*ck->child, scope, owner, child_len);
    if (ec) {
      return ec;
    }
    out_size = child_len + ck->code.width;
    return {};
  }
  if (const auto* n = node.get_if<Numeric>()) {
    if (owner && std::any_of(owner->bindings.begin(), owner->bindings.end(),
                             [&](const LengthBinding& b) { return b.length_field == node.name(); })) {
      out_size = n->width;
      return {};
    }
  }
  const auto* v = scope.find(node.name());
  if (!v) {
    return make_error_code(errc::missing_field);
  }
  if (const auto* s = node.get_if<Sized>()) {
    return measure_sequence_value(s->sequence, encode_count(s->policy, *v), *v, out_size);
  }
  return measure_value(node, *v, out_size);
}

std::error_code measure_struct_value(const Struct& st, const Mapping& scope, std::size_t& out_size) {
  std::size_t total = 0;
  for (const auto& child : st.children) {
    std::size_t len = 0;
    auto ec = measure_scope_field(child, scope, &st, len);
    if (ec) {
      return ec;
    }
    if (!checked_add(total, len, total)) {
      return make_error_code(errc::length_mismatch);
    }
  }
  out_size = total;
  return {};
}

}  // namespace

std::error_code encode(const Node& root, Mapping& scope, std::vector<byte>& out, const CodecOptions& options) noexcept {
  const auto mark = out.size();
  std::error_code ec;
  try {
    if (const auto* st = root.get_if<Struct>()) {
      ec = encode_struct_body(*st, scope, out, options);
    } else {
      ec = encode_field(root, scope, out, options);
    }
  } catch (const std::bad_alloc&) {
    ec = core::make_error_code(core::errc::out_of_memory);
  } catch (const std::length_error&) {
    ec = core::make_error_code(core::errc::buffer_overflow);
  }
  if (ec) {
    // 失败时不留下半截字节。
    out.resize(mark);
  }
  return ec;
}

std::error_code decode_one(const Node& root, bytes_view in, Mapping& out, std::size_t& consumed,
                           const CodecOptions& options) noexcept {
  try {
    SpanReader r(in);
    Mapping result;
    std::error_code ec;
    if (const auto* st = root.get_if<Struct>()) {
      ec = decode_struct_body(*st, r, result, options);
    } else {
      ec = decode_field(root, r, result, options);
    }
    if (ec) {
      return ec;
    }
    out = std::move(result);
    consumed = r.consumed();
    return {};
  } catch (const std::bad_alloc&) {
    return core::make_error_code(core::errc::out_of_memory);
  } catch (const std::length_error&) {
    return core::make_error_code(core::errc::buffer_overflow);
  }
}

std::error_code decode(const Node& root, bytes_view in, Mapping& out, const CodecOptions& options) noexcept {
  Mapping result;
  std::size_t consumed = 0;
  auto ec = decode_one(root, in, result, consumed, options);
  if (ec) {
    return ec;
  }
  if (consumed != in.size()) {
    core::detail::logger().debug("decode left {} trailing bytes of {}", in.size() - consumed, in.size());
    return make_error_code(errc::length_mismatch);
  }
  out = std::move(result);
  return {};
}

std::error_code measured_length(const Node& root, const Mapping& scope, std::size_t& out_size) noexcept {
  try {
    if (const auto* st = root.get_if<Struct>()) {
      return measure_struct_value(*st, scope, out_size);
    }
    return measure_scope_field(root, scope, nullptr, out_size);
  } catch (const std::bad_alloc&) {
    return core::make_error_code(core::errc::out_of_memory);
  }
}

std::error_code measured_length(const Node& root, bytes_view in, std::size_t& out_size,
                                const CodecOptions& options) noexcept {
  try {
    if (const auto* st = root.get_if<Struct>()) {
      return measure_struct_body(*st, in, options, out_size);
    }
    const Mapping empty;
    return measure_field(root, in, empty, options, out_size);
  } catch (const std::bad_alloc&) {
    return core::make_error_code(core::errc::out_of_memory);
  }
}

}  // namespace binform::codec
