/**
 * @file basic_usage.cpp
 * @brief 声明 schema -> 编码 -> hexdump -> 解码 -> 打印值树
 *
 * 报文格式（示例）：
 *   {version: u8, flags: u16, nlen: u8, name: bytes[nlen],
 *    samples: i16[3] (小端), crc: CRC-16 覆盖 {count: u8, readings: u32[count]}}
 */

#include <binform/codec/checksum.hpp>
#include <binform/codec/codec.hpp>
#include <binform/codec/node.hpp>
#include <binform/core/log.hpp>
#include <binform/utils/hex.hpp>
#include <binform/utils/value_dump.hpp>

#include <iostream>
#include <vector>

using namespace binform;
using namespace binform::codec;

namespace {

std::error_code build_schema(Node& out) {
  Node readings;
  auto ec = StructBuilder("readings")
              .add(u8("count"))
              .dynamic("count", array("values", u32("v")))
              .build(readings);
  if (ec) {
    return ec;
  }
  Node crc;
  ec = checksum("crc", 2, crc16_ccitt(), readings, crc);
  if (ec) {
    return ec;
  }

  Node samples;
  ec = fixed(3, array("samples", i16("s", ByteOrder::little)), samples);
  if (ec) {
    return ec;
  }

  return StructBuilder("telemetry")
    .add(u8("version"))
    .add(u16("flags"))
    .add(u8("nlen"))
    .dynamic("nlen", bytes("name"))
    .padding({0xAA, 0x55})
    .add(samples)
    .add(crc)
    .build(out);
}

}  // namespace

int main() {
  std::cout << "=== binform 基本用法 ===\n\n";
  core::set_log_level(core::LogLevel::debug);

  Node schema;
  if (auto ec = build_schema(schema)) {
    std::cerr << "schema 构造失败: " << ec.message() << "\n";
    return 1;
  }

  Mapping scope{
    {"version", Value::unsigned_integer(2)},
    {"flags", Value::unsigned_integer(0x8001)},
    {"nlen", Value::unsigned_integer(0)},  // 编码时写回
    {"name", Value::string("probe-7")},
    {"samples", Value::sequence(Sequence{Value::integer(-1), Value::integer(0), Value::integer(300)})},
    {"readings",
     Value::mapping(Mapping{
       {"count", Value::unsigned_integer(0)},
       {"values", Value::sequence(Sequence{Value::unsigned_integer(10), Value::unsigned_integer(20)})},
     })},
  };

  std::size_t expected = 0;
  if (auto ec = measured_length(schema, scope, expected)) {
    std::cerr << "测长失败: " << ec.message() << "\n";
    return 1;
  }

  std::vector<byte> encoded;
  if (auto ec = encode(schema, scope, encoded)) {
    std::cerr << "编码失败: " << ec.message() << "\n";
    return 1;
  }
  std::cout << "编码成功: " << encoded.size() << " 字节（预计 " << expected << "）\n";
  utils::HexDumpOptions hex_opt;
  hex_opt.show_ascii = true;
  std::cout << utils::hex_dump(bytes_view{encoded.data(), encoded.size()}, hex_opt) << "\n";

  Mapping decoded;
  if (auto ec = decode(schema, bytes_view{encoded.data(), encoded.size()}, decoded)) {
    std::cerr << "解码失败: " << ec.message() << "\n";
    return 1;
  }
  std::cout << "解码结果:\n" << utils::dump_value(decoded) << "\n\n";
  std::cout << "与编码后的 scope 一致: " << (decoded == scope ? "是" : "否") << "\n";

  // 篡改 readings 中的一个字节，校验应失败（debug 日志给出细节）。
  encoded[encoded.size() - 4] ^= 0xFF;
  Mapping tampered;
  const auto ec = decode(schema, bytes_view{encoded.data(), encoded.size()}, tampered);
  std::cout << "篡改后解码: " << ec.message() << "\n";
  return 0;
}
