#include "bench_main.hpp"

#include "binform/codec/checksum.hpp"
#include "binform/codec/codec.hpp"
#include "binform/codec/node.hpp"
#include "binform/messages/store.hpp"
#include "binform/protocol/frame.hpp"
#include "binform/protocol/registry.hpp"

#include <cstdint>
#include <string>
#include <vector>

using namespace binform;
using namespace binform::codec;

static void bench_numeric_array() {
  // u32 数组（dynamic 长度）
  constexpr std::size_t count = 10000;

  Node root;
  auto ec = StructBuilder("samples")
              .add(u32("count"))
              .dynamic("count", array("values", u32("v")))
              .build(root);
  if (ec) {
    std::cerr << "Schema build failed: " << ec.message() << "\n";
    return;
  }

  Sequence values;
  values.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    values.push_back(Value::unsigned_integer(i));
  }
  Mapping scope{{"count", Value::unsigned_integer(0)}, {"values", Value::sequence(std::move(values))}};

  std::vector<byte> encoded;
  BENCH_RUN("codec: u32 array encode (10000 items)", count * 4 + 4, 20, {
    encoded.clear();
    auto e = encode(root, scope, encoded);
    if (e) {
      std::cerr << "Encode failed: " << e.message() << "\n";
    }
  });

  BENCH_RUN("codec: u32 array decode (10000 items)", encoded.size(), 20, {
    Mapping decoded;
    auto e = decode(root, bytes_view{encoded.data(), encoded.size()}, decoded);
    if (e) {
      std::cerr << "Decode failed: " << e.message() << "\n";
    }
  });

  BENCH_RUN("codec: u32 array measure (decode side)", encoded.size(), 20, {
    std::size_t n = 0;
    auto e = measured_length(root, bytes_view{encoded.data(), encoded.size()}, n);
    if (e) {
      std::cerr << "Measure failed: " << e.message() << "\n";
    }
  });
}

static void bench_struct_array() {
  // 结构体数组：每个元素 {id: u16, x: f64, y: f64, tag: bytes[8]}
  constexpr std::size_t count = 2000;

  Node point;
  auto ec = StructBuilder("point")
              .add(u16("id"))
              .add(f64("x"))
              .add(f64("y"))
              .fixed(8, bytes("tag"))
              .build(point);
  Node root;
  if (!ec) {
    ec = StructBuilder("track").consume(array("points", point)).build(root);
  }
  if (ec) {
    std::cerr << "Schema build failed: " << ec.message() << "\n";
    return;
  }

  Sequence points;
  points.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    points.push_back(Value::mapping(Mapping{
      {"id", Value::unsigned_integer(i)},
      {"x", Value::floating(static_cast<double>(i) * 0.5)},
      {"y", Value::floating(static_cast<double>(i) * -0.25)},
      {"tag", Value::string("pt" + std::to_string(i % 100))},
    }));
  }
  Mapping scope{{"points", Value::sequence(std::move(points))}};

  std::vector<byte> encoded;
  BENCH_RUN("codec: struct array encode (2000 items)", count * 26, 10, {
    encoded.clear();
    auto e = encode(root, scope, encoded);
    if (e) {
      std::cerr << "Encode failed: " << e.message() << "\n";
    }
  });

  BENCH_RUN("codec: struct array decode (2000 items)", encoded.size(), 10, {
    Mapping decoded;
    auto e = decode(root, bytes_view{encoded.data(), encoded.size()}, decoded);
    if (e) {
      std::cerr << "Decode failed: " << e.message() << "\n";
    }
  });
}

static void bench_checksum() {
  // 64KB 负载 + CRC-32
  constexpr std::size_t payload_size = 64 * 1024;

  Node payload;
  auto ec = fixed(payload_size, bytes("payload"), payload);
  Node crc;
  if (!ec) {
    ec = checksum("crc", 4, crc32(), payload, crc);
  }
  Node root;
  if (!ec) {
    ec = StructBuilder("blob").add(crc).build(root);
  }
  if (ec) {
    std::cerr << "Schema build failed: " << ec.message() << "\n";
    return;
  }

  Mapping scope{{"payload", Value::bytes(std::vector<byte>(payload_size, 0x5A))}};
  std::vector<byte> encoded;
  BENCH_RUN("codec: 64KB bytes + crc32 encode", payload_size, 20, {
    encoded.clear();
    auto e = encode(root, scope, encoded);
    if (e) {
      std::cerr << "Encode failed: " << e.message() << "\n";
    }
  });

  BENCH_RUN("codec: 64KB bytes + crc32 decode", encoded.size(), 20, {
    Mapping decoded;
    auto e = decode(root, bytes_view{encoded.data(), encoded.size()}, decoded);
    if (e) {
      std::cerr << "Decode failed: " << e.message() << "\n";
    }
  });
}

static void bench_store_frame() {
  // 完整帧：StoreRequest，4KB data
  protocol::Registry registry;
  if (auto ec = messages::register_store_messages(registry)) {
    std::cerr << "Register failed: " << ec.message() << "\n";
    return;
  }

  messages::StoreRequest request{1, "bench/key", std::vector<byte>(4096, 0x11)};
  protocol::Frame frame{messages::StoreRequest::kMsgId, request.to_value()};
  std::vector<byte> encoded;

  BENCH_RUN("protocol: StoreRequest frame encode (4KB)", 4096, 100, {
    encoded.clear();
    auto e = protocol::encode_frame(registry, frame, encoded);
    if (e) {
      std::cerr << "Frame encode failed: " << e.message() << "\n";
    }
  });

  BENCH_RUN("protocol: StoreRequest frame decode (4KB)", encoded.size(), 100, {
    protocol::Frame decoded;
    auto e = protocol::decode_frame(registry, bytes_view{encoded.data(), encoded.size()}, decoded);
    if (e) {
      std::cerr << "Frame decode failed: " << e.message() << "\n";
    }
  });
}

int main() {
  std::cout << "Running binform codec benchmarks...\n";

  bench_numeric_array();
  bench_struct_array();
  bench_checksum();
  bench_store_frame();

  ::binform::benchmarks::print_results();
  return 0;
}
