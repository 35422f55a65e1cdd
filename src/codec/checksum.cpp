#include "binform/codec/checksum.hpp"

#include <algorithm>
#include <array>
#include <cstddef>

namespace binform::codec {
namespace {

constexpr std::array<std::uint32_t, 256> make_crc32_table() noexcept {
  std::array<std::uint32_t, 256> table{};
  for (std::uint32_t i = 0; i < 256; ++i) {
    std::uint32_t c = i;
    for (int k = 0; k < 8; ++k) {
      c = (c & 1u) ? (0xEDB88320u ^ (c >> 1)) : (c >> 1);
    }
    table[i] = c;
  }
  return table;
}

constexpr auto kCrc32Table = make_crc32_table();

}  // namespace

namespace {

ChecksumFn make_xor_fold(std::uint8_t width) {
  return [width](bytes_view bytes) -> std::uint64_t {
    const std::uint64_t mask = width >= 8 ? ~std::uint64_t{0} : ((std::uint64_t{1} << (8u * width)) - 1u);
    std::uint64_t acc = mask;
    for (std::size_t off = 0; off < bytes.size(); off += width) {
      const auto end = std::min(bytes.size(), off + width);
      std::uint64_t chunk_sum = 0;
      for (std::size_t i = off; i < end; ++i) {
        chunk_sum += bytes[i];
      }
      acc ^= chunk_sum;
    }
    return acc & mask;
  };
}

}  // namespace

ChecksumFn xor_fold() { return make_xor_fold(1); }

std::error_code xor_fold(std::uint8_t width, ChecksumFn& out) {
  if (width == 0 || width > 8) {
    return make_error_code(errc::invalid_schema);
  }
  out = make_xor_fold(width);
  return {};
}

ChecksumFn sum16() {
  return [](bytes_view bytes) -> std::uint64_t {
    std::uint32_t sum = 0;
    for (const auto b : bytes) {
      sum += b;
    }
    return sum & 0xFFFFu;
  };
}

ChecksumFn crc16_ccitt() {
  return [](bytes_view bytes) -> std::uint64_t {
    std::uint16_t crc = 0xFFFF;
    for (const auto b : bytes) {
      crc = static_cast<std::uint16_t>(crc ^ (static_cast<std::uint16_t>(b) << 8));
      for (int k = 0; k < 8; ++k) {
        crc = (crc & 0x8000u) ? static_cast<std::uint16_t>((crc << 1) ^ 0x1021u) : static_cast<std::uint16_t>(crc << 1);
      }
    }
    return crc;
  };
}

ChecksumFn crc32() {
  return [](bytes_view bytes) -> std::uint64_t {
    std::uint32_t crc = 0xFFFFFFFFu;
    for (const auto b : bytes) {
      crc = kCrc32Table[(crc ^ b) & 0xFFu] ^ (crc >> 8);
    }
    return crc ^ 0xFFFFFFFFu;
  };
}

}  // namespace binform::codec
