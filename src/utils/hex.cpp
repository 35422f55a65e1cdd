#include "binform/utils/hex.hpp"

#include "binform/core/error.hpp"

#include <algorithm>
#include <new>
#include <string_view>

namespace binform::utils {
namespace {

constexpr std::string_view kDigits = "0123456789abcdef";
constexpr std::string_view kSeparators = ",;:-_|/\\[](){}<>'\"";

[[nodiscard]] int nibble(char c) noexcept {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

[[nodiscard]] bool is_separator(char c) noexcept {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f' ||
         kSeparators.find(c) != std::string_view::npos;
}

void append_byte(std::string& out, core::byte b) {
  out.push_back(kDigits[(b >> 4) & 0x0F]);
  out.push_back(kDigits[b & 0x0F]);
}

void append_offset(std::string& out, std::size_t offset) {
  // 至少 4 位，超过 0xFFFF 时自然加宽。
  std::string digits;
  do {
    digits.push_back(kDigits[offset & 0x0F]);
    offset >>= 4;
  } while (offset != 0);
  if (digits.size() < 4) {
    digits.append(4 - digits.size(), '0');
  }
  out.append(digits.rbegin(), digits.rend());
  out.append(": ");
}

}  // namespace

std::string hex_dump(core::bytes_view bytes, HexDumpOptions options) {
  const std::size_t total = bytes.size();
  const std::size_t shown = options.max_bytes == 0 ? total : std::min(total, options.max_bytes);
  const std::size_t per_line = options.bytes_per_line == 0 ? 16 : options.bytes_per_line;

  std::string out;
  for (std::size_t offset = 0; offset < shown; offset += per_line) {
    const auto line = bytes.subspan(offset, std::min(per_line, shown - offset));
    if (options.show_offset) {
      append_offset(out, offset);
    }
    for (std::size_t i = 0; i < line.size(); ++i) {
      if (i != 0) {
        out.push_back(' ');
      }
      append_byte(out, line[i]);
    }
    if (options.show_ascii) {
      // 短行补齐到整行宽度，保证 ASCII 列对齐。
      out.append((per_line - line.size()) * 3 + 3, ' ');
      for (const auto b : line) {
        out.push_back(b >= 0x20 && b <= 0x7E ? static_cast<char>(b) : '.');
      }
    }
    out.push_back('\n');
  }
  if (shown < total) {
    out.append("... (truncated, total=").append(std::to_string(total)).append(" bytes)\n");
  }
  return out;
}

std::string to_hex(core::bytes_view bytes) {
  std::string out;
  out.reserve(bytes.size() * 3);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    if (i != 0) {
      out.push_back(' ');
    }
    append_byte(out, bytes[i]);
  }
  return out;
}

std::error_code parse_hex(std::string_view text, std::vector<core::byte>& out) noexcept {
  out.clear();
  int high = -1;
  try {
    for (std::size_t i = 0; i < text.size(); ++i) {
      const char c = text[i];
      if (is_separator(c)) {
        continue;
      }
      // 0x/0X 前缀只在一个字节的起始位置识别。
      if (high < 0 && c == '0' && i + 1 < text.size() && (text[i + 1] == 'x' || text[i + 1] == 'X')) {
        ++i;
        continue;
      }
      const int v = nibble(c);
      if (v < 0) {
        out.clear();
        return core::make_error_code(core::errc::invalid_argument);
      }
      if (high < 0) {
        high = v;
        continue;
      }
      out.push_back(static_cast<core::byte>((high << 4) | v));
      high = -1;
    }
  } catch (const std::bad_alloc&) {
    out.clear();
    return core::make_error_code(core::errc::out_of_memory);
  }
  if (high >= 0) {
    out.clear();
    return core::make_error_code(core::errc::invalid_argument);
  }
  return {};
}

}  // namespace binform::utils
