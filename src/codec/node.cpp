#include "binform/codec/node.hpp"

#include "core/logger.hpp"

#include <algorithm>
#include <type_traits>
#include <unordered_map>
#include <utility>

namespace binform::codec {
namespace {

/*
 * schema 构造期校验：
 *
 * - “作用域名字”：一个子节点在所在 Struct 的 Mapping 里占用的名字。
 *   Numeric / Sized / Struct 占用自身名字；Checksum 占用自身名字 + child 的作用域名字
 *   （child 与 Checksum 共享作用域）；Padding 不占用名字。
 * - dynamic 绑定同样穿透 Checksum：被校验包裹的 dynamic 序列仍然引用同层长度字段。
 */

[[nodiscard]] bool valid_integer_width(std::uint8_t width) noexcept {
  return width == 1 || width == 2 || width == 4 || width == 8;
}

[[nodiscard]] bool valid_float_width(std::uint8_t width) noexcept { return width == 4 || width == 8; }

Node make_numeric(std::string name, NumericKind kind, bool is_signed, std::uint8_t width, ByteOrder order) {
  return Node(std::move(name), Numeric{kind, is_signed, width, order});
}

std::error_code reject(errc e, std::string_view what, std::string_view name) {
  core::detail::logger().warn("schema rejected: {} ('{}')", what, name);
  return make_error_code(e);
}

// 数组元素：Numeric、不吃尾部的 Struct、fixed 序列；其余形态没有独立的作用域或长度来源。
[[nodiscard]] bool valid_element(const Node& element) noexcept {
  return std::visit(
    [&](const auto& body) -> bool {
      using T = std::decay_t<decltype(body)>;
      if constexpr (std::is_same_v<T, Numeric>) {
        return true;
      } else if constexpr (std::is_same_v<T, Struct>) {
        return !consumes_rest(element);
      } else if constexpr (std::is_same_v<T, Sized>) {
        return body.policy.kind == LengthKind::fixed;
      } else {
        return false;
      }
    },
    element.body());
}

std::error_code wrap(SequenceSpec seq, LengthPolicy policy, Node& out) {
  if (seq.name.empty()) {
    return reject(errc::invalid_schema, "sequence without a name", seq.name);
  }
  if (seq.sequence.kind == SequenceKind::array) {
    if (!seq.sequence.element) {
      return reject(errc::invalid_schema, "array without element type", seq.name);
    }
    if (!valid_element(*seq.sequence.element)) {
      return reject(errc::invalid_schema, "unsupported array element", seq.name);
    }
  }
  out = Node(std::move(seq.name), Sized{std::move(seq.sequence), std::move(policy)});
  return {};
}

void collect_scope_names(const Node& node, std::vector<std::string>& out) {
  if (node.get_if<Padding>()) {
    return;
  }
  out.push_back(node.name());
  if (const auto* c = node.get_if<Checksum>()) {
    collect_scope_names(*c->child, out);
  }
}

void collect_dynamics(const Node& node, std::vector<const Node*>& out) {
  if (const auto* s = node.get_if<Sized>()) {
    if (s->policy.kind == LengthKind::dynamic) {
      out.push_back(&node);
    }
  } else if (const auto* c = node.get_if<Checksum>()) {
    collect_dynamics(*c->child, out);
  }
}

}  // namespace

const Numeric* find_scope_numeric(const Node& node, std::string_view name) noexcept {
  if (const auto* n = node.get_if<Numeric>()) {
    return node.name() == name ? n : nullptr;
  }
  if (const auto* c = node.get_if<Checksum>()) {
    return find_scope_numeric(*c->child, name);
  }
  return nullptr;
}

const LengthBinding* Struct::binding_for(std::string_view data_field) const noexcept {
  const auto it = std::find_if(bindings.begin(), bindings.end(),
                               [&](const LengthBinding& b) { return b.data_field == data_field; });
  return it == bindings.end() ? nullptr : &*it;
}

Node::Node() : body_(Numeric{}) {}

Node::Node(std::string name, body_type body) : name_(std::move(name)), body_(std::move(body)) {}

Node u8(std::string name, ByteOrder order) { return make_numeric(std::move(name), NumericKind::integer, false, 1, order); }
Node u16(std::string name, ByteOrder order) { return make_numeric(std::move(name), NumericKind::integer, false, 2, order); }
Node u32(std::string name, ByteOrder order) { return make_numeric(std::move(name), NumericKind::integer, false, 4, order); }
Node u64(std::string name, ByteOrder order) { return make_numeric(std::move(name), NumericKind::integer, false, 8, order); }
Node i8(std::string name, ByteOrder order) { return make_numeric(std::move(name), NumericKind::integer, true, 1, order); }
Node i16(std::string name, ByteOrder order) { return make_numeric(std::move(name), NumericKind::integer, true, 2, order); }
Node i32(std::string name, ByteOrder order) { return make_numeric(std::move(name), NumericKind::integer, true, 4, order); }
Node i64(std::string name, ByteOrder order) { return make_numeric(std::move(name), NumericKind::integer, true, 8, order); }
Node f32(std::string name, ByteOrder order) { return make_numeric(std::move(name), NumericKind::floating, true, 4, order); }
Node f64(std::string name, ByteOrder order) { return make_numeric(std::move(name), NumericKind::floating, true, 8, order); }

std::error_code integer(std::string name, bool is_signed, std::uint8_t width, ByteOrder order, Node& out) {
  if (!valid_integer_width(width)) {
    return reject(errc::invalid_schema, "integer width must be 1/2/4/8", name);
  }
  out = make_numeric(std::move(name), NumericKind::integer, is_signed, width, order);
  return {};
}

std::error_code floating(std::string name, std::uint8_t width, ByteOrder order, Node& out) {
  if (!valid_float_width(width)) {
    return reject(errc::invalid_schema, "float width must be 4/8", name);
  }
  out = make_numeric(std::move(name), NumericKind::floating, true, width, order);
  return {};
}

SequenceSpec array(std::string name, Node element, bool reverse) {
  SequenceCodec seq;
  seq.kind = SequenceKind::array;
  seq.element = std::make_shared<const Node>(std::move(element));
  seq.reverse = reverse;
  return SequenceSpec{std::move(name), std::move(seq)};
}

SequenceSpec bytes(std::string name, bool reverse) {
  SequenceCodec seq;
  seq.kind = SequenceKind::bytes;
  seq.reverse = reverse;
  return SequenceSpec{std::move(name), std::move(seq)};
}

std::error_code fixed(std::size_t count, SequenceSpec seq, Node& out) {
  LengthPolicy policy;
  policy.kind = LengthKind::fixed;
  policy.count = count;
  return wrap(std::move(seq), std::move(policy), out);
}

std::error_code dynamic(std::string length_field, SequenceSpec seq, Node& out, CountFn count_fn) {
  if (length_field.empty()) {
    return reject(errc::invalid_schema, "dynamic sequence without a length field", seq.name);
  }
  LengthPolicy policy;
  policy.kind = LengthKind::dynamic;
  policy.length_field = std::move(length_field);
  policy.count_fn = std::move(count_fn);
  return wrap(std::move(seq), std::move(policy), out);
}

std::error_code consume(SequenceSpec seq, Node& out) {
  LengthPolicy policy;
  policy.kind = LengthKind::consume;
  return wrap(std::move(seq), std::move(policy), out);
}

std::error_code checksum(std::string name, std::uint8_t width, ChecksumFn fn, Node child, Node& out,
                         ChecksumOptions options) {
  if (name.empty()) {
    return reject(errc::invalid_schema, "checksum without a name", name);
  }
  if (!valid_integer_width(width)) {
    return reject(errc::invalid_schema, "checksum width must be 1/2/4/8", name);
  }
  if (!fn) {
    return reject(errc::invalid_schema, "checksum without an algorithm", name);
  }
  if (child.name().empty() && !child.get_if<Padding>()) {
    return reject(errc::invalid_schema, "checksum child without a name", name);
  }
  // 子节点吃掉剩余字节时无法确定校验码所在位置（没有显式尾部长度约定）。
  if (consumes_rest(child)) {
    return reject(errc::schema_order, "checksum around a consuming child", name);
  }
  Checksum body;
  body.code = Numeric{NumericKind::integer, false, width, options.order};
  body.fn = std::move(fn);
  body.child = std::make_shared<const Node>(std::move(child));
  body.placement = options.placement;
  out = Node(std::move(name), std::move(body));
  return {};
}

Node padding(std::vector<byte> pattern) { return Node(std::string{}, Padding{std::move(pattern)}); }

StructBuilder::StructBuilder(std::string name) : name_(std::move(name)) {}

StructBuilder& StructBuilder::add(Node child) {
  children_.push_back(std::move(child));
  return *this;
}

StructBuilder& StructBuilder::add(std::error_code ec, Node child) {
  if (ec) {
    if (!deferred_) {
      deferred_ = ec;
    }
    return *this;
  }
  return add(std::move(child));
}

StructBuilder& StructBuilder::fixed(std::size_t count, SequenceSpec seq) {
  Node node;
  auto ec = codec::fixed(count, std::move(seq), node);
  return add(ec, std::move(node));
}

StructBuilder& StructBuilder::dynamic(std::string length_field, SequenceSpec seq, CountFn count_fn) {
  Node node;
  auto ec = codec::dynamic(std::move(length_field), std::move(seq), node, std::move(count_fn));
  return add(ec, std::move(node));
}

StructBuilder& StructBuilder::consume(SequenceSpec seq) {
  Node node;
  auto ec = codec::consume(std::move(seq), node);
  return add(ec, std::move(node));
}

StructBuilder& StructBuilder::padding(std::vector<byte> pattern) { return add(codec::padding(std::move(pattern))); }

std::error_code StructBuilder::build(Node& out) const {
  if (deferred_) {
    return deferred_;
  }

  // 1) 同层名字唯一；记录每个名字所属的子节点下标（用于 dynamic 顺序检查）。
  std::unordered_map<std::string, std::size_t> owner_of;
  for (std::size_t i = 0; i < children_.size(); ++i) {
    const auto& child = children_[i];
    if (child.name().empty() && !child.get_if<Padding>()) {
      return reject(errc::invalid_schema, "struct member without a name", name_);
    }
    std::vector<std::string> names;
    collect_scope_names(child, names);
    for (auto& n : names) {
      if (!owner_of.emplace(n, i).second) {
        return reject(errc::duplicate_field, "duplicate field", n);
      }
    }
  }

  // 2) 吃尾部的字段必须是最后一个子节点（嵌套 Struct 以其结尾也算）。
  for (std::size_t i = 0; i + 1 < children_.size(); ++i) {
    if (consumes_rest(children_[i])) {
      return reject(errc::schema_order, "consuming field is not the last member", children_[i].name());
    }
  }

  // 3) 解析 dynamic 绑定：长度字段必须是同层、位于其前的整数字段，且只被一个序列引用。
  std::vector<LengthBinding> bindings;
  for (std::size_t i = 0; i < children_.size(); ++i) {
    std::vector<const Node*> dynamics;
    collect_dynamics(children_[i], dynamics);
    for (const auto* d : dynamics) {
      const auto& policy = d->get_if<Sized>()->policy;
      const auto it = owner_of.find(policy.length_field);
      if (it == owner_of.end()) {
        return reject(errc::schema_order, "length field is not declared", policy.length_field);
      }
      if (it->second >= i) {
        return reject(errc::schema_order, "length field must precede its sequence", policy.length_field);
      }
      const auto* codec = find_scope_numeric(children_[it->second], policy.length_field);
      if (!codec || codec->kind != NumericKind::integer) {
        return reject(errc::schema_order, "length field must be an integer", policy.length_field);
      }
      const bool taken = std::any_of(bindings.begin(), bindings.end(), [&](const LengthBinding& b) {
        return b.length_field == policy.length_field;
      });
      if (taken) {
        return reject(errc::schema_order, "length field bound twice", policy.length_field);
      }
      bindings.push_back(LengthBinding{policy.length_field, d->name(), *codec, policy.count_fn});
    }
  }

  out = Node(name_, Struct{children_, std::move(bindings)});
  return {};
}

bool consumes_rest(const Node& node) noexcept {
  if (const auto* s = node.get_if<Sized>()) {
    return s->policy.kind == LengthKind::consume;
  }
  if (const auto* st = node.get_if<Struct>()) {
    return !st->children.empty() && consumes_rest(st->children.back());
  }
  return false;
}

std::size_t count_elements(const Value& value) noexcept {
  if (const auto* seq = value.get_if<Sequence>()) {
    return seq->size();
  }
  if (const auto* b = value.get_if<Bytes>()) {
    return b->value.size();
  }
  return 0;
}

}  // namespace binform::codec
