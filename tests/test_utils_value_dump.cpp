#include "binform/utils/value_dump.hpp"

#include "test_main.hpp"

#include <string>
#include <vector>

namespace {

using binform::codec::Mapping;
using binform::codec::Sequence;
using binform::codec::Value;
using binform::utils::dump_value;
using binform::utils::ValueDumpOptions;

ValueDumpOptions single_line() {
  ValueDumpOptions options;
  options.multiline = false;
  return options;
}

void test_scalars() {
  TEST_EXPECT_EQ(dump_value(Value::integer(-5)), "i64 -5");
  TEST_EXPECT_EQ(dump_value(Value::unsigned_integer(7)), "u64 7");
  TEST_EXPECT_EQ(dump_value(Value::floating(1.5)), "f64 1.5");
  TEST_EXPECT_EQ(dump_value(Value::string("hi")), "bytes[2] \"hi\"");
  TEST_EXPECT_EQ(dump_value(Value::bytes({0x00, 0xFF})), "bytes[2] 00 ff");
  TEST_EXPECT_EQ(dump_value(Value::bytes({})), "bytes[0]");
}

void test_single_line_mapping() {
  const Mapping m{
    {"a", Value::unsigned_integer(1)},
    {"xs", Value::sequence(Sequence{Value::integer(1), Value::integer(2)})},
    {"inner", Value::mapping(Mapping{{"b", Value::string("q")}})},
  };
  TEST_EXPECT_EQ(dump_value(m, single_line()),
                 "{a: u64 1, xs: seq[2] [i64 1, i64 2], inner: {b: bytes[1] \"q\"}}");
  TEST_EXPECT_EQ(dump_value(Value::mapping(m), single_line()), dump_value(m, single_line()));
}

void test_multiline_mapping() {
  const Mapping m{{"a", Value::unsigned_integer(1)}, {"b", Value::mapping(Mapping{{"c", Value::integer(2)}})}};
  TEST_EXPECT_EQ(dump_value(m), "{\n  a: u64 1\n  b: {\n    c: i64 2\n  }\n}");
}

void test_truncation() {
  auto options = single_line();
  options.max_items = 2;
  options.max_bytes = 3;
  const auto seq = Value::sequence(Sequence{Value::integer(1), Value::integer(2), Value::integer(3)});
  TEST_EXPECT_EQ(dump_value(seq, options), "seq[3] [i64 1, i64 2, ... (1 more)]");
  TEST_EXPECT_EQ(dump_value(Value::string("abcdef"), options), "bytes[6] \"abc...\"");

  options.max_depth = 1;
  const Mapping nested{{"inner", Value::mapping(Mapping{{"x", Value::integer(1)}})}};
  TEST_EXPECT_EQ(dump_value(nested, options), "{inner: {...}}");
}

void test_empty_containers() {
  TEST_EXPECT_EQ(dump_value(Mapping{}), "{}");
  TEST_EXPECT_EQ(dump_value(Value::sequence(Sequence{})), "seq[0] []");
}

}  // namespace

int main() {
  test_scalars();
  test_single_line_mapping();
  test_multiline_mapping();
  test_truncation();
  test_empty_containers();
  return ::binform::tests::run_and_report();
}
