#include "binform/codec/codec.hpp"

#include "test_main.hpp"

#include <atomic>
#include <cstdint>
#include <thread>
#include <vector>

namespace {

using binform::codec::byte;
using binform::codec::bytes_view;
using binform::codec::decode;
using binform::codec::decode_one;
using binform::codec::encode;
using binform::codec::errc;
using binform::codec::Mapping;
using binform::codec::Node;
using binform::codec::Sequence;
using binform::codec::StructBuilder;
using binform::codec::Value;

namespace bc = binform::codec;

Node build(StructBuilder& b) {
  Node node;
  TEST_EXPECT_OK(b.build(node));
  return node;
}

Node nested_schema() {
  StructBuilder inner("inner");
  inner.add(bc::u8("a")).add(bc::u8("b"));
  Node inner_node;
  TEST_EXPECT_OK(inner.build(inner_node));

  StructBuilder outer("outer");
  outer.add(inner_node).add(bc::u8("b"));
  return build(outer);
}

void test_nested_scoping_round_trip() {
  const auto schema = nested_schema();
  // inner 与 outer 都有名为 b 的字段，各自在自己的作用域内。
  Mapping scope{
    {"inner", Value::mapping(Mapping{{"a", Value::unsigned_integer(5)}, {"b", Value::unsigned_integer(6)}})},
    {"b", Value::unsigned_integer(9)},
  };
  const Mapping original = scope;
  std::vector<byte> out;
  TEST_EXPECT_OK(encode(schema, scope, out));
  TEST_EXPECT_EQ(out, (std::vector<byte>{5, 6, 9}));

  Mapping decoded;
  TEST_EXPECT_OK(decode(schema, bytes_view{out.data(), out.size()}, decoded));
  TEST_EXPECT(decoded == original);
}

void test_nested_value_errors() {
  const auto schema = nested_schema();
  std::vector<byte> out;

  Mapping missing_inner_field{
    {"inner", Value::mapping(Mapping{{"a", Value::unsigned_integer(5)}})},
    {"b", Value::unsigned_integer(9)},
  };
  TEST_EXPECT_EC(encode(schema, missing_inner_field, out), errc::missing_field);
  TEST_EXPECT(out.empty());

  Mapping inner_not_mapping{{"inner", Value::unsigned_integer(1)}, {"b", Value::unsigned_integer(9)}};
  TEST_EXPECT_EC(encode(schema, inner_not_mapping, out), errc::type_mismatch);
  TEST_EXPECT(out.empty());
}

void test_duplicate_field_rejected() {
  StructBuilder b("s");
  b.add(bc::u8("a")).add(bc::u16("a"));
  Node node;
  TEST_EXPECT_EC(b.build(node), errc::duplicate_field);
}

void test_consumer_must_be_last() {
  StructBuilder b("s");
  b.consume(bc::bytes("rest")).add(bc::u8("after"));
  Node node;
  TEST_EXPECT_EC(b.build(node), errc::schema_order);
}

void test_nested_consumer_must_be_last() {
  StructBuilder inner("inner");
  inner.add(bc::u8("a")).consume(bc::bytes("rest"));
  Node inner_node;
  TEST_EXPECT_OK(inner.build(inner_node));

  StructBuilder bad("outer");
  bad.add(inner_node).add(bc::u8("b"));
  Node node;
  TEST_EXPECT_EC(bad.build(node), errc::schema_order);

  // 作为最后一个字段则合法。
  StructBuilder good("outer");
  good.add(bc::u8("b")).add(inner_node);
  const auto schema = build(good);
  Mapping scope{
    {"b", Value::unsigned_integer(1)},
    {"inner", Value::mapping(Mapping{{"a", Value::unsigned_integer(2)}, {"rest", Value::string("xyz")}})},
  };
  std::vector<byte> out;
  TEST_EXPECT_OK(encode(schema, scope, out));
  TEST_EXPECT_EQ(out, (std::vector<byte>{1, 2, 'x', 'y', 'z'}));
  Mapping decoded;
  TEST_EXPECT_OK(decode(schema, bytes_view{out.data(), out.size()}, decoded));
  TEST_EXPECT(decoded == scope);
}

void test_dynamic_binding_rules() {
  Node node;
  {
    StructBuilder b("undeclared");
    b.dynamic("len", bc::bytes("data"));
    TEST_EXPECT_EC(b.build(node), errc::schema_order);
  }
  {
    StructBuilder b("after");
    b.dynamic("len", bc::bytes("data")).add(bc::u8("len"));
    TEST_EXPECT_EC(b.build(node), errc::schema_order);
  }
  {
    StructBuilder b("float_length");
    b.add(bc::f32("len")).dynamic("len", bc::bytes("data"));
    TEST_EXPECT_EC(b.build(node), errc::schema_order);
  }
  {
    StructBuilder b("bytes_length");
    b.fixed(1, bc::bytes("len")).dynamic("len", bc::bytes("data"));
    TEST_EXPECT_EC(b.build(node), errc::schema_order);
  }
  {
    StructBuilder b("bound_twice");
    b.add(bc::u8("len")).dynamic("len", bc::bytes("x")).dynamic("len", bc::bytes("y"));
    TEST_EXPECT_EC(b.build(node), errc::schema_order);
  }
  {
    // 长度字段在嵌套 Struct 里不算同层字段。
    StructBuilder inner("inner");
    inner.add(bc::u8("len"));
    Node inner_node;
    TEST_EXPECT_OK(inner.build(inner_node));
    StructBuilder b("nested_length");
    b.add(inner_node).dynamic("len", bc::bytes("data"));
    TEST_EXPECT_EC(b.build(node), errc::schema_order);
  }
}

void test_deferred_and_invalid_children() {
  Node node;
  StructBuilder deferred("s");
  deferred.add(bc::u8("a")).fixed(4, bc::bytes(""));
  TEST_EXPECT_EC(deferred.build(node), errc::invalid_schema);

  StructBuilder unnamed("s");
  unnamed.add(bc::u8(""));
  TEST_EXPECT_EC(unnamed.build(node), errc::invalid_schema);

  Node bad_width;
  const auto ec = bc::integer("w", false, 5, bc::ByteOrder::big, bad_width);
  StructBuilder chained("s");
  chained.add(ec, bad_width).add(bc::u8("ok"));
  TEST_EXPECT_EC(chained.build(node), errc::invalid_schema);
}

void test_padding() {
  StructBuilder b("s");
  b.add(bc::u8("a")).padding({0xAA, 0xBB}).add(bc::u8("b"));
  const auto schema = build(b);

  Mapping scope{{"a", Value::unsigned_integer(1)}, {"b", Value::unsigned_integer(2)}};
  std::vector<byte> out;
  TEST_EXPECT_OK(encode(schema, scope, out));
  TEST_EXPECT_EQ(out, (std::vector<byte>{1, 0xAA, 0xBB, 2}));

  Mapping decoded;
  TEST_EXPECT_OK(decode(schema, bytes_view{out.data(), out.size()}, decoded));
  TEST_EXPECT_EQ(decoded.size(), 2u);
  TEST_EXPECT(decoded == scope);

  out[2] = 0x00;
  TEST_EXPECT_EC(decode(schema, bytes_view{out.data(), out.size()}, decoded), errc::padding_mismatch);
}

void test_exact_consumption() {
  StructBuilder b("s");
  b.add(bc::u8("a")).add(bc::u16("b"));
  const auto schema = build(b);

  const std::vector<byte> in{1, 0, 2, 0xEE, 0xFF};
  Mapping out;
  TEST_EXPECT_EC(decode(schema, bytes_view{in.data(), in.size()}, out), errc::length_mismatch);

  std::size_t consumed = 0;
  TEST_EXPECT_OK(decode_one(schema, bytes_view{in.data(), in.size()}, out, consumed));
  TEST_EXPECT_EQ(consumed, 3u);
  TEST_EXPECT(*out.find("b") == Value::unsigned_integer(2));
}

void test_encode_appends() {
  StructBuilder b("s");
  b.add(bc::u8("a"));
  const auto schema = build(b);

  std::vector<byte> out{0x10};
  Mapping scope{{"a", Value::unsigned_integer(0x20)}};
  TEST_EXPECT_OK(encode(schema, scope, out));
  TEST_EXPECT_OK(encode(schema, scope, out));
  TEST_EXPECT_EQ(out, (std::vector<byte>{0x10, 0x20, 0x20}));
}

void test_non_struct_root() {
  Node root;
  TEST_EXPECT_OK(bc::fixed(3, bc::bytes("tag"), root));
  Mapping scope{{"tag", Value::string("ok")}};
  std::vector<byte> out;
  TEST_EXPECT_OK(encode(root, scope, out));
  TEST_EXPECT_EQ(out, (std::vector<byte>{'o', 'k', 0}));

  Mapping decoded;
  TEST_EXPECT_OK(decode(root, bytes_view{out.data(), out.size()}, decoded));
  TEST_EXPECT_EQ(bc::as_string(*decoded.find("tag")), "ok");
}

void test_composite_round_trip() {
  Node point;
  StructBuilder pb("point");
  pb.add(bc::i32("x", bc::ByteOrder::little)).add(bc::f64("w"));
  TEST_EXPECT_OK(pb.build(point));

  StructBuilder b("record");
  b.add(bc::u16("id"))
    .add(bc::u8("nlen"))
    .dynamic("nlen", bc::bytes("name"))
    .padding({0})
    .add(bc::u8("count"))
    .dynamic("count", bc::array("points", point))
    .fixed(2, bc::array("flags", bc::u8("f")))
    .consume(bc::bytes("blob"));
  const auto schema = build(b);

  Mapping scope{
    {"id", Value::unsigned_integer(0xBEEF)},
    {"nlen", Value::unsigned_integer(5)},
    {"name", Value::string("probe")},
    {"count", Value::unsigned_integer(2)},
    {"points", Value::sequence(Sequence{
      Value::mapping(Mapping{{"x", Value::integer(-7)}, {"w", Value::floating(0.5)}}),
      Value::mapping(Mapping{{"x", Value::integer(1 << 20)}, {"w", Value::floating(-2.25)}}),
    })},
    {"flags", Value::sequence(Sequence{Value::unsigned_integer(1), Value::unsigned_integer(0)})},
    {"blob", Value::bytes({0xDE, 0xAD, 0x00})},
  };
  const Mapping original = scope;

  std::vector<byte> out;
  TEST_EXPECT_OK(encode(schema, scope, out));
  TEST_EXPECT(scope == original);

  Mapping decoded;
  TEST_EXPECT_OK(decode(schema, bytes_view{out.data(), out.size()}, decoded));
  TEST_EXPECT(decoded == original);

  std::size_t measured = 0;
  TEST_EXPECT_OK(bc::measured_length(schema, bytes_view{out.data(), out.size()}, measured));
  TEST_EXPECT_EQ(measured, out.size());
}

void test_schema_shared_across_threads() {
  const auto schema = nested_schema();
  std::atomic<int> failures{0};
  std::vector<std::thread> workers;
  for (int t = 0; t < 4; ++t) {
    workers.emplace_back([&schema, &failures, t] {
      for (int i = 0; i < 200; ++i) {
        const auto a = static_cast<std::uint64_t>((t * 31 + i) & 0xFF);
        Mapping scope{
          {"inner", Value::mapping(Mapping{{"a", Value::unsigned_integer(a)}, {"b", Value::unsigned_integer(1)}})},
          {"b", Value::unsigned_integer(2)},
        };
        const Mapping original = scope;
        std::vector<byte> out;
        Mapping decoded;
        if (encode(schema, scope, out) || decode(schema, bytes_view{out.data(), out.size()}, decoded) ||
            !(decoded == original)) {
          ++failures;
        }
      }
    });
  }
  for (auto& w : workers) {
    w.join();
  }
  TEST_EXPECT_EQ(failures.load(), 0);
}

}  // namespace

int main() {
  test_nested_scoping_round_trip();
  test_nested_value_errors();
  test_duplicate_field_rejected();
  test_consumer_must_be_last();
  test_nested_consumer_must_be_last();
  test_dynamic_binding_rules();
  test_deferred_and_invalid_children();
  test_padding();
  test_exact_consumption();
  test_encode_appends();
  test_non_struct_root();
  test_composite_round_trip();
  test_schema_shared_across_threads();
  return ::binform::tests::run_and_report();
}
