#include "binform/codec/checksum.hpp"
#include "binform/codec/codec.hpp"
#include "binform/codec/node.hpp"

#include "test_main.hpp"

#include <cstdint>
#include <string_view>
#include <vector>

namespace {

using binform::codec::byte;
using binform::codec::bytes_view;
using binform::codec::ChecksumOptions;
using binform::codec::ChecksumPlacement;
using binform::codec::decode;
using binform::codec::encode;
using binform::codec::errc;
using binform::codec::Mapping;
using binform::codec::Node;
using binform::codec::Sequence;
using binform::codec::StructBuilder;
using binform::codec::Value;

namespace bc = binform::codec;

std::vector<byte> ascii(std::string_view s) { return std::vector<byte>(s.begin(), s.end()); }

std::uint64_t run(const bc::ChecksumFn& fn, const std::vector<byte>& data) {
  return fn(bytes_view{data.data(), data.size()});
}

Value u8s(std::initializer_list<std::uint64_t> items) {
  Sequence seq;
  for (const auto v : items) {
    seq.push_back(Value::unsigned_integer(v));
  }
  return Value::sequence(std::move(seq));
}

void test_algorithms() {
  TEST_EXPECT_EQ(run(bc::xor_fold(), {}), 0xFFu);
  TEST_EXPECT_EQ(run(bc::xor_fold(), {1, 2, 4}), 0xF8u);

  // 每块异或的是块内字节之和：0xFFFF ^ (0x12 + 0x34) ^ 0x56。
  bc::ChecksumFn fold2;
  TEST_EXPECT_OK(bc::xor_fold(2, fold2));
  TEST_EXPECT_EQ(run(fold2, {0x12, 0x34, 0x56}), 0xFFEFu);
  // 块内和超过一个字节时不截断：0xFFFF ^ (0xFF + 0xFF)。
  TEST_EXPECT_EQ(run(fold2, {0xFF, 0xFF}), 0xFE01u);

  bc::ChecksumFn fold3;
  TEST_EXPECT_OK(bc::xor_fold(3, fold3));
  TEST_EXPECT_EQ(run(fold3, {1, 2, 4}), 0xFFFFF8u);

  bc::ChecksumFn untouched;
  TEST_EXPECT_EC(bc::xor_fold(0, untouched), errc::invalid_schema);
  TEST_EXPECT_EC(bc::xor_fold(9, untouched), errc::invalid_schema);
  TEST_EXPECT(!untouched);

  TEST_EXPECT_EQ(run(bc::sum16(), {0xFF, 0xFF, 0x02}), 0x0200u);
  TEST_EXPECT_EQ(run(bc::sum16(), std::vector<byte>(300, 0xFF)), (300u * 0xFFu) & 0xFFFFu);

  TEST_EXPECT_EQ(run(bc::crc16_ccitt(), ascii("123456789")), 0x29B1u);
  TEST_EXPECT_EQ(run(bc::crc32(), ascii("123456789")), 0xCBF43926u);
  TEST_EXPECT_EQ(run(bc::crc32(), {}), 0u);
}

Node xor_over_three_bytes(ChecksumOptions options = {}) {
  Node data;
  TEST_EXPECT_OK(bc::fixed(3, bc::array("data", bc::u8("d")), data));
  Node node;
  TEST_EXPECT_OK(bc::checksum("cs", 1, bc::xor_fold(), data, node, options));
  return node;
}

void test_single_byte_corruption_detected() {
  const auto schema = xor_over_three_bytes();
  Mapping scope{{"data", u8s({1, 2, 4})}};
  std::vector<byte> out;
  TEST_EXPECT_OK(encode(schema, scope, out));
  TEST_EXPECT_EQ(out, (std::vector<byte>{1, 2, 4, 0xF8}));
  TEST_EXPECT(*scope.find("cs") == Value::unsigned_integer(0xF8));

  Mapping decoded;
  TEST_EXPECT_OK(decode(schema, bytes_view{out.data(), out.size()}, decoded));
  TEST_EXPECT(*decoded.find("data") == u8s({1, 2, 4}));
  TEST_EXPECT(*decoded.find("cs") == Value::unsigned_integer(0xF8));

  for (std::size_t i = 0; i < out.size(); ++i) {
    for (const byte flip : {byte{0x01}, byte{0x80}, byte{0xFF}}) {
      auto corrupted = out;
      corrupted[i] ^= flip;
      Mapping ignored;
      TEST_EXPECT_EC(decode(schema, bytes_view{corrupted.data(), corrupted.size()}, ignored),
                     errc::checksum_mismatch);
    }
  }
}

void test_caller_checksum_is_recomputed() {
  const auto schema = xor_over_three_bytes();
  Mapping scope{{"data", u8s({0, 0, 0})}, {"cs", Value::unsigned_integer(0x12)}};
  std::vector<byte> out;
  TEST_EXPECT_OK(encode(schema, scope, out));
  TEST_EXPECT_EQ(out, (std::vector<byte>{0, 0, 0, 0xFF}));
  TEST_EXPECT(*scope.find("cs") == Value::unsigned_integer(0xFF));
}

void test_leading_placement() {
  ChecksumOptions options;
  options.placement = ChecksumPlacement::leading;
  const auto schema = xor_over_three_bytes(options);
  Mapping scope{{"data", u8s({1, 2, 4})}};
  std::vector<byte> out;
  TEST_EXPECT_OK(encode(schema, scope, out));
  TEST_EXPECT_EQ(out, (std::vector<byte>{0xF8, 1, 2, 4}));

  Mapping decoded;
  TEST_EXPECT_OK(decode(schema, bytes_view{out.data(), out.size()}, decoded));
  TEST_EXPECT(*decoded.find("data") == u8s({1, 2, 4}));

  out[0] ^= 0x01;
  TEST_EXPECT_EC(decode(schema, bytes_view{out.data(), out.size()}, decoded), errc::checksum_mismatch);
}

void test_wide_little_endian_code() {
  Node data;
  TEST_EXPECT_OK(bc::fixed(9, bc::bytes("text"), data));
  ChecksumOptions options;
  options.order = bc::ByteOrder::little;
  Node schema;
  TEST_EXPECT_OK(bc::checksum("crc", 2, bc::crc16_ccitt(), data, schema, options));

  Mapping scope{{"text", Value::string("123456789")}};
  std::vector<byte> out;
  TEST_EXPECT_OK(encode(schema, scope, out));
  TEST_EXPECT_EQ(out.size(), 11u);
  TEST_EXPECT_EQ(out[9], 0xB1);
  TEST_EXPECT_EQ(out[10], 0x29);
}

void test_checksum_over_struct_in_outer_scope() {
  StructBuilder inner("body");
  inner.add(bc::u8("a")).add(bc::u16("b"));
  Node body;
  TEST_EXPECT_OK(inner.build(body));
  Node cs;
  TEST_EXPECT_OK(bc::checksum("crc", 4, bc::crc32(), body, cs));

  StructBuilder outer("frame");
  outer.add(bc::u8("kind")).add(cs).add(bc::u8("end"));
  Node schema;
  TEST_EXPECT_OK(outer.build(schema));

  Mapping scope{
    {"kind", Value::unsigned_integer(1)},
    {"body", Value::mapping(Mapping{{"a", Value::unsigned_integer(2)}, {"b", Value::unsigned_integer(3)}})},
    {"end", Value::unsigned_integer(0xEE)},
  };
  std::vector<byte> out;
  TEST_EXPECT_OK(encode(schema, scope, out));
  TEST_EXPECT_EQ(out.size(), 1u + 3u + 4u + 1u);

  const std::vector<byte> child{2, 0, 3};
  const auto crc = run(bc::crc32(), child);
  TEST_EXPECT_EQ(out[4], static_cast<byte>(crc >> 24));
  TEST_EXPECT_EQ(out[7], static_cast<byte>(crc & 0xFF));

  Mapping decoded;
  TEST_EXPECT_OK(decode(schema, bytes_view{out.data(), out.size()}, decoded));
  TEST_EXPECT(decoded == scope);
}

void test_checksum_around_dynamic_sequence() {
  Node data;
  TEST_EXPECT_OK(bc::dynamic("len", bc::bytes("data"), data));
  Node cs;
  TEST_EXPECT_OK(bc::checksum("cs", 1, bc::xor_fold(), data, cs));

  StructBuilder b("msg");
  b.add(bc::u8("len")).add(cs);
  Node schema;
  TEST_EXPECT_OK(b.build(schema));

  Mapping scope{{"data", Value::string("abc")}};
  std::vector<byte> out;
  TEST_EXPECT_OK(encode(schema, scope, out));
  const byte expected = static_cast<byte>(0xFF ^ 'a' ^ 'b' ^ 'c');
  TEST_EXPECT_EQ(out, (std::vector<byte>{3, 'a', 'b', 'c', expected}));

  Mapping decoded;
  TEST_EXPECT_OK(decode(schema, bytes_view{out.data(), out.size()}, decoded));
  TEST_EXPECT_EQ(bc::as_string(*decoded.find("data")), "abc");
  TEST_EXPECT(*decoded.find("len") == Value::unsigned_integer(3));

  // 长度字段被篡改：校验码位置随之变化，无法通过校验。
  out[0] = 2;
  TEST_EXPECT_EC(decode(schema, bytes_view{out.data(), out.size()}, decoded), errc::checksum_mismatch);
}

void test_construction_errors() {
  Node out;
  Node consuming;
  TEST_EXPECT_OK(bc::consume(bc::bytes("rest"), consuming));
  TEST_EXPECT_EC(bc::checksum("cs", 1, bc::xor_fold(), consuming, out), errc::schema_order);

  StructBuilder tail("tail");
  tail.add(bc::u8("a")).consume(bc::bytes("rest"));
  Node tail_struct;
  TEST_EXPECT_OK(tail.build(tail_struct));
  TEST_EXPECT_EC(bc::checksum("cs", 1, bc::xor_fold(), tail_struct, out), errc::schema_order);

  TEST_EXPECT_EC(bc::checksum("cs", 3, bc::xor_fold(), bc::u8("a"), out), errc::invalid_schema);
  TEST_EXPECT_EC(bc::checksum("cs", 1, bc::ChecksumFn{}, bc::u8("a"), out), errc::invalid_schema);
  TEST_EXPECT_EC(bc::checksum("", 1, bc::xor_fold(), bc::u8("a"), out), errc::invalid_schema);
  TEST_EXPECT_EC(bc::checksum("cs", 1, bc::xor_fold(), bc::u8(""), out), errc::invalid_schema);

  // Checksum 与 child 共享作用域，名字不能重复。
  Node same_name;
  TEST_EXPECT_OK(bc::checksum("x", 1, bc::xor_fold(), bc::u8("x"), same_name));
  StructBuilder b("s");
  b.add(same_name);
  TEST_EXPECT_EC(b.build(out), errc::duplicate_field);
}

void test_length_field_under_nested_checksums() {
  // 长度字段被两层 Checksum 包裹，整个 Struct 又处在外层 Checksum 内（解码时先测长）。
  Node inner;
  TEST_EXPECT_OK(bc::checksum("c2", 1, bc::xor_fold(), bc::u8("len"), inner));
  Node outer;
  TEST_EXPECT_OK(bc::checksum("c1", 1, bc::xor_fold(), inner, outer));

  StructBuilder b("body");
  b.add(outer).dynamic("len", bc::bytes("data"));
  Node body;
  TEST_EXPECT_OK(b.build(body));
  Node top;
  TEST_EXPECT_OK(bc::checksum("top", 1, bc::xor_fold(), body, top));

  Mapping scope{{"body", Value::mapping(Mapping{{"data", Value::string("abc")}})}};
  std::vector<byte> out;
  TEST_EXPECT_OK(encode(top, scope, out));
  TEST_EXPECT_EQ(out.size(), 7u);
  TEST_EXPECT_EQ(out[0], 3);

  std::size_t measured = 0;
  TEST_EXPECT_OK(bc::measured_length(top, bytes_view{out.data(), out.size()}, measured));
  TEST_EXPECT_EQ(measured, 7u);

  Mapping decoded;
  TEST_EXPECT_OK(decode(top, bytes_view{out.data(), out.size()}, decoded));
  const auto* decoded_body = decoded.find("body");
  TEST_EXPECT(decoded_body != nullptr);
  if (decoded_body) {
    const auto* m = decoded_body->get_if<Mapping>();
    TEST_EXPECT(m != nullptr);
    if (m) {
      TEST_EXPECT_EQ(bc::as_string(*m->find("data")), "abc");
      TEST_EXPECT(*m->find("len") == Value::unsigned_integer(3));
    }
  }
  TEST_EXPECT(decoded.contains("top"));

  // 同一结构作为数组元素（数组外再包一层 Checksum）。
  Node items;
  TEST_EXPECT_OK(bc::fixed(2, bc::array("items", body), items));
  Node wrapped;
  TEST_EXPECT_OK(bc::checksum("sum", 2, bc::sum16(), items, wrapped));
  Mapping list_scope{{"items", Value::sequence(Sequence{
                                 Value::mapping(Mapping{{"data", Value::string("x")}}),
                                 Value::mapping(Mapping{{"data", Value::string("yz")}}),
                               })}};
  std::vector<byte> list_out;
  TEST_EXPECT_OK(encode(wrapped, list_scope, list_out));
  Mapping list_decoded;
  TEST_EXPECT_OK(decode(wrapped, bytes_view{list_out.data(), list_out.size()}, list_decoded));
  const auto* decoded_items = list_decoded.find("items");
  TEST_EXPECT(decoded_items != nullptr);
  if (decoded_items) {
    const auto* seq = decoded_items->get_if<Sequence>();
    TEST_EXPECT(seq != nullptr && seq->size() == 2u);
  }
}

void test_truncated_input() {
  const auto schema = xor_over_three_bytes();
  const std::vector<byte> in{1, 2, 4};
  Mapping out;
  TEST_EXPECT_EC(decode(schema, bytes_view{in.data(), in.size()}, out), errc::insufficient_data);
}

}  // namespace

int main() {
  test_algorithms();
  test_single_byte_corruption_detected();
  test_caller_checksum_is_recomputed();
  test_leading_placement();
  test_wide_little_endian_code();
  test_checksum_over_struct_in_outer_scope();
  test_checksum_around_dynamic_sequence();
  test_construction_errors();
  test_length_field_under_nested_checksums();
  test_truncated_input();
  return ::binform::tests::run_and_report();
}
